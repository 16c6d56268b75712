#pragma once

#include "cogmod/archive.hpp"
#include "cogmod/errors.hpp"
#include "cogmod/fetch.hpp"
#include "cogmod/installer.hpp"

#include <optional>
#include <string>

namespace cogmod {

// ============================================================================
// Configuration
// ============================================================================

struct Config {
    std::string home;            // --root > COGMOD_HOME > ~/.cognitive
    std::string modules_dir;     // <home>/modules
    std::string manifest_path;   // <home>/installed.json
    std::string cache_dir;       // <home>/cache
    std::string registry_url;
    std::string repository_archive_base;
    Profile profile = Profile::Standard;
    FetchLimits index_limits;
    FetchLimits tarball_limits;
    ExtractLimits extract_limits;
};

struct ConfigOverrides {
    std::optional<std::string> root;
    std::optional<std::string> registry_url;
    std::optional<Profile> profile;
};

struct ConfigResult {
    bool ok = false;
    Error error;
    Config config;
};

// Resolve the home directory: override > COGMOD_HOME > $HOME/.cognitive
std::string resolve_home(const std::optional<std::string>& override_root);

// Defaults, then <home>/config.json, then environment, then overrides
ConfigResult load_config(const ConfigOverrides& overrides = {});

InstallerOptions installer_options(const Config& config);
RegistryClientOptions registry_options(const Config& config);

// ============================================================================
// Logging
// ============================================================================

// Route spdlog to stderr; verbose = debug, quiet = errors only.
// COGMOD_LOG_LEVEL (trace/debug/info/warn/error/off) wins over both.
void init_logging(bool verbose, bool quiet);

} // namespace cogmod
