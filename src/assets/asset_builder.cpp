#include "cogmod/assets.hpp"
#include "cogmod/integrity.hpp"
#include "cogmod/module_descriptor.hpp"
#include "cogmod/path_utils.hpp"
#include "cogmod/platform.hpp"

#include <algorithm>
#include <set>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace cogmod {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return {};
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

struct LegacyRegistry {
    nlohmann::json modules = nlohmann::json::object();
    nlohmann::json categories = nlohmann::json::object();
};

bool load_legacy_registry(const std::string& path, LegacyRegistry& legacy, Error& error) {
    auto content = read_file(path);
    if (!content) {
        error = make_path_error(ErrorKind::IoError, "failed to read legacy registry", path);
        return false;
    }
    try {
        auto j = nlohmann::json::parse(*content);
        if (!j.is_object()) {
            error = make_path_error(ErrorKind::MalformedIndex,
                                    "legacy registry must be a JSON object", path);
            return false;
        }
        if (j.contains("modules") && j["modules"].is_object()) legacy.modules = j["modules"];
        if (j.contains("categories") && j["categories"].is_object()) {
            legacy.categories = j["categories"];
        }
    } catch (const nlohmann::json::exception& e) {
        error = make_path_error(ErrorKind::MalformedIndex,
                                std::string("invalid legacy registry: ") + e.what(), path);
        return false;
    }
    return true;
}

// Base for tarball URLs; empty means bare filenames
std::string tarball_base_url(const BuildOptions& options) {
    if (options.tarball_base_url && !options.tarball_base_url->empty()) {
        std::string base = *options.tarball_base_url;
        while (!base.empty() && base.back() == '/') base.pop_back();
        return base;
    }
    std::string tag = trim(options.tag.value_or(""));
    if (tag.empty()) return {};
    std::string repo = options.repository;
    while (!repo.empty() && repo.back() == '/') repo.pop_back();
    return repo + "/releases/download/" + tag;
}

std::vector<std::string> find_module_dirs(const std::string& modules_dir) {
    std::vector<std::string> dirs;
    for (const auto& name : list_directory(modules_dir)) {
        std::string dir = join_path(modules_dir, name);
        if (is_directory(dir) && is_regular_file(join_path(dir, MODULE_YAML))) {
            dirs.push_back(dir);
        }
    }
    std::sort(dirs.begin(), dirs.end());
    return dirs;
}

nlohmann::json string_or(const nlohmann::json& j, const char* key, const std::string& fallback) {
    if (j.is_object() && j.contains(key) && j[key].is_string()) return j[key];
    return fallback;
}

} // namespace

// ============================================================================
// Registry Assets
// ============================================================================

BuildResult build_registry_assets(const BuildOptions& options) {
    BuildResult result;

    if (!is_directory(options.modules_dir)) {
        result.error = make_path_error(ErrorKind::IoError, "modules directory not found",
                                       options.modules_dir);
        return result;
    }

    LegacyRegistry legacy;
    if (options.legacy_registry_path &&
        !load_legacy_registry(*options.legacy_registry_path, legacy, result.error)) {
        return result;
    }

    std::set<std::string> only;
    for (const auto& name : options.only) {
        std::string t = trim(name);
        if (!t.empty()) only.insert(t);
    }

    result.updated = trim(options.timestamp);
    if (result.updated.empty()) result.updated = get_current_timestamp();
    const std::string base_url = tarball_base_url(options);

    if (!create_directories(options.out_dir)) {
        result.error = make_path_error(ErrorKind::IoError, "failed to create directory",
                                       options.out_dir);
        return result;
    }

    nlohmann::json modules = nlohmann::json::object();
    nlohmann::json featured = nlohmann::json::array();

    for (const auto& module_dir : find_module_dirs(options.modules_dir)) {
        auto meta = read_module_yaml(join_path(module_dir, MODULE_YAML));
        if (!meta.ok) {
            result.error = meta.error;
            return result;
        }
        const auto& desc = meta.descriptor;
        if (!only.empty() && only.count(desc.name) == 0) continue;

        if (!is_safe_module_name(desc.name)) {
            result.error = make_path_error(ErrorKind::InvalidModule,
                                           "module name is not a safe directory name: " +
                                           desc.name, module_dir);
            return result;
        }
        // The version becomes part of the tarball file name
        if (!is_safe_module_name(desc.version)) {
            result.error = make_path_error(ErrorKind::InvalidModule,
                                           "module version is not usable in a file name: " +
                                           desc.version, module_dir);
            return result;
        }

        auto collected = collect_directory_entries(module_dir, desc.name);
        if (!collected.ok) {
            result.error = collected.error;
            return result;
        }
        auto packed = create_deterministic_archive(collected.entries);
        if (!packed.ok) {
            result.error = packed.error;
            return result;
        }

        BuiltTarball built;
        built.name = desc.name;
        built.version = desc.version;
        built.file = desc.name + "-" + desc.version + ".tar.gz";
        built.path = join_path(options.out_dir, built.file);
        built.size_bytes = packed.archive_data.size();

        auto digest = compute_sha256(packed.archive_data);
        if (!digest.ok) {
            result.error = make_error(ErrorKind::IoError, "failed to hash tarball: " + digest.error);
            return result;
        }
        built.sha256 = digest.hex_digest;

        auto written = atomic_write_file(built.path, packed.archive_data);
        if (!written.ok) {
            result.error = make_path_error(ErrorKind::IoError, written.error, built.path);
            return result;
        }
        spdlog::info("built {} ({} bytes, sha256 {})", built.file, built.size_bytes, built.sha256);

        const nlohmann::json legacy_info = legacy.modules.contains(desc.name)
            ? legacy.modules[desc.name] : nlohmann::json::object();
        nlohmann::json description = string_or(legacy_info, "description", desc.responsibility);
        nlohmann::json keywords = nlohmann::json::array();
        if (legacy_info.is_object() && legacy_info.contains("tags") &&
            legacy_info["tags"].is_array()) {
            for (const auto& tag : legacy_info["tags"]) {
                if (tag.is_string()) keywords.push_back(tag);
            }
        }

        nlohmann::json entry;
        entry["$schema"] = REGISTRY_ENTRY_SCHEMA_URL;
        entry["identity"] = {
            {"name", desc.name},
            {"namespace", options.namespace_},
            {"version", desc.version},
            {"spec_version", MODULE_SPEC_VERSION},
        };
        entry["metadata"] = {
            {"description", description},
            {"description_zh", description},
            {"author", string_or(legacy_info, "author", "unknown")},
            {"tier", desc.tier},
            {"license", options.license},
            {"repository", options.repository},
            {"homepage", options.homepage},
            {"keywords", keywords},
        };
        entry["dependencies"] = {
            {"runtime_min", options.runtime_min},
            {"modules", nlohmann::json::array()},
        };
        entry["distribution"] = {
            {"tarball", base_url.empty() ? built.file : base_url + "/" + built.file},
            {"checksum", format_checksum(built.sha256)},
            {"size_bytes", built.size_bytes},
            {"files", collected.files},
        };
        entry["timestamps"] = {
            {"created_at", result.updated},
            {"updated_at", result.updated},
            {"deprecated_at", nullptr},
        };

        modules[desc.name] = std::move(entry);
        featured.push_back(desc.name);
        result.tarballs.push_back(std::move(built));
    }

    nlohmann::json registry;
    registry["$schema"] = REGISTRY_SCHEMA_URL;
    registry["version"] = REGISTRY_DOCUMENT_VERSION;
    registry["updated"] = result.updated;
    registry["modules"] = modules;
    registry["categories"] = legacy.categories;
    registry["featured"] = featured;
    registry["stats"] = {
        {"total_modules", modules.size()},
        {"total_downloads", 0},
        {"last_updated", result.updated},
    };

    result.index_json = registry.dump(2, ' ', true) + "\n";

    if (!options.registry_out.empty()) {
        std::string parent = get_parent_directory(options.registry_out);
        if (!parent.empty() && !create_directories(parent)) {
            result.error = make_path_error(ErrorKind::IoError, "failed to create directory", parent);
            return result;
        }
        auto written = atomic_write_file(options.registry_out, result.index_json);
        if (!written.ok) {
            result.error = make_path_error(ErrorKind::IoError, written.error, options.registry_out);
            return result;
        }
        spdlog::info("wrote registry index {} ({} modules)", options.registry_out, modules.size());
    }

    result.ok = true;
    return result;
}

} // namespace cogmod
