#include "cogmod/config.hpp"
#include "cogmod/platform.hpp"

#include <algorithm>
#include <cctype>

#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace cogmod {

namespace {

constexpr const char* CONFIG_FILENAME = "config.json";

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

// Helper to safely get a string from JSON
std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

void read_u64(const nlohmann::json& j, const std::string& key, uint64_t& out) {
    if (j.contains(key) && j[key].is_number_unsigned()) out = j[key].get<uint64_t>();
}

void read_ms(const nlohmann::json& j, const std::string& key, long& out) {
    if (j.contains(key) && j[key].is_number_unsigned()) out = j[key].get<long>();
}

bool apply_config_file(const std::string& path, Config& config, Error& error) {
    auto content = read_file(path);
    if (!content) {
        error = make_path_error(ErrorKind::IoError, "failed to read config", path);
        return false;
    }

    try {
        auto j = nlohmann::json::parse(*content);
        if (!j.is_object()) {
            error = make_path_error(ErrorKind::IoError, "config must be a JSON object", path);
            return false;
        }

        if (auto url = get_string(j, "registry_url")) config.registry_url = *url;
        if (auto base = get_string(j, "repository_archive_base")) {
            config.repository_archive_base = *base;
        }
        if (auto profile = get_string(j, "profile")) {
            auto parsed = parse_profile(*profile);
            if (!parsed) {
                error = make_path_error(ErrorKind::IoError,
                                        "unknown profile '" + *profile + "'", path);
                return false;
            }
            config.profile = *parsed;
        }

        read_ms(j, "index_timeout_ms", config.index_limits.timeout_ms);
        read_u64(j, "index_max_bytes", config.index_limits.max_bytes);
        read_ms(j, "tarball_timeout_ms", config.tarball_limits.timeout_ms);
        read_u64(j, "tarball_max_bytes", config.tarball_limits.max_bytes);

        if (j.contains("limits") && j["limits"].is_object()) {
            const auto& l = j["limits"];
            read_u64(l, "max_files", config.extract_limits.max_files);
            read_u64(l, "max_total_bytes", config.extract_limits.max_total_bytes);
            read_u64(l, "max_single_file_bytes", config.extract_limits.max_single_file_bytes);
            read_u64(l, "max_tar_bytes", config.extract_limits.max_tar_bytes);
        }
    } catch (const nlohmann::json::exception& e) {
        error = make_path_error(ErrorKind::IoError, std::string("invalid config: ") + e.what(), path);
        return false;
    }
    return true;
}

} // namespace

std::string resolve_home(const std::optional<std::string>& override_root) {
    if (override_root && !override_root->empty()) return *override_root;

    auto env_home = get_env("COGMOD_HOME");
    if (env_home && !env_home->empty()) return *env_home;

    auto home = get_env("HOME");
    if (!home || home->empty()) home = get_env("USERPROFILE");
    if (home && !home->empty()) return join_path(*home, ".cognitive");

    return ".cognitive";
}

ConfigResult load_config(const ConfigOverrides& overrides) {
    ConfigResult result;
    Config& config = result.config;

    config.home = resolve_home(overrides.root);
    config.modules_dir = join_path(config.home, "modules");
    config.manifest_path = join_path(config.home, "installed.json");
    config.cache_dir = join_path(config.home, "cache");
    config.registry_url = DEFAULT_REGISTRY_URL;
    config.repository_archive_base = DEFAULT_REPOSITORY_ARCHIVE_BASE;
    config.index_limits = {DEFAULT_INDEX_TIMEOUT_MS, DEFAULT_INDEX_MAX_BYTES};
    config.tarball_limits = InstallerOptions{}.tarball_limits;

    std::string config_path = join_path(config.home, CONFIG_FILENAME);
    if (is_regular_file(config_path)) {
        if (!apply_config_file(config_path, config, result.error)) return result;
        spdlog::debug("loaded config from {}", config_path);
    }

    if (auto url = get_env("COGMOD_REGISTRY_URL"); url && !url->empty()) {
        config.registry_url = *url;
    }

    if (overrides.registry_url && !overrides.registry_url->empty()) {
        config.registry_url = *overrides.registry_url;
    }
    if (overrides.profile) config.profile = *overrides.profile;

    result.ok = true;
    return result;
}

InstallerOptions installer_options(const Config& config) {
    InstallerOptions options;
    options.modules_dir = config.modules_dir;
    options.repository_archive_base = config.repository_archive_base;
    options.profile = config.profile;
    options.tarball_limits = config.tarball_limits;
    options.extract_limits = config.extract_limits;
    return options;
}

RegistryClientOptions registry_options(const Config& config) {
    RegistryClientOptions options;
    options.registry_url = config.registry_url;
    options.cache_dir = config.cache_dir;
    options.limits = config.index_limits;
    return options;
}

// ============================================================================
// Logging
// ============================================================================

void init_logging(bool verbose, bool quiet) {
    auto logger = spdlog::get("cogmod");
    if (!logger) {
        logger = spdlog::stderr_color_mt("cogmod");
    }
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("%^[%l]%$ %v");

    auto level = spdlog::level::info;
    if (verbose) level = spdlog::level::debug;
    if (quiet) level = spdlog::level::err;

    if (auto env = get_env("COGMOD_LOG_LEVEL"); env && !env->empty()) {
        std::string name = to_lower(*env);
        auto parsed = spdlog::level::from_str(name);
        if (parsed != spdlog::level::off || name == "off") {
            level = parsed;
        } else {
            spdlog::warn("ignoring unknown COGMOD_LOG_LEVEL '{}'", *env);
        }
    }
    spdlog::set_level(level);
}

} // namespace cogmod
