#pragma once

#include "cogmod/archive.hpp"
#include "cogmod/errors.hpp"
#include "cogmod/fetch.hpp"
#include "cogmod/install_manifest.hpp"
#include "cogmod/module_ref.hpp"
#include "cogmod/registry.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cogmod {

// ============================================================================
// Policy
// ============================================================================

enum class Profile {
    Standard,
    Certified,  // registry tarballs only, provenance mandatory
};

const char* profile_name(Profile profile);
std::optional<Profile> parse_profile(const std::string& value);

// What to do when a tarball's root directory is not named after the module
enum class RootNamePolicy {
    TrustInstallName,  // install under the requested name, record the archive root
    RequireMatch,      // fail with AmbiguousArchiveLayout
};

constexpr const char* DEFAULT_REPOSITORY_ARCHIVE_BASE = "https://github.com";
constexpr const char* DEFAULT_BRANCH = "main";

// Commit work directories inside the modules directory
constexpr const char* STAGING_DIR_PREFIX = ".staging-";
constexpr int64_t STALE_WORK_DIR_SECONDS = 3600;

struct InstallerOptions {
    std::string modules_dir;
    std::string repository_archive_base = DEFAULT_REPOSITORY_ARCHIVE_BASE;
    Profile profile = Profile::Standard;
    RootNamePolicy root_name_policy = RootNamePolicy::TrustInstallName;
    FetchLimits tarball_limits{10000, 20ull * 1024 * 1024};
    FetchLimits repository_limits{60000, 100ull * 1024 * 1024};
    ExtractLimits extract_limits;
};

// ============================================================================
// Operations
// ============================================================================

struct InstallOptions {
    std::optional<std::string> rename_to;
    std::optional<std::string> pinned_ref;
    RefType ref_type = RefType::Auto;
};

struct InstallResult {
    bool success = false;
    Error error;
    std::string module_name;
    std::optional<std::string> version;
    std::string location;
    std::string source;
    std::vector<std::string> warnings;
};

struct UpdateOptions {
    std::optional<std::string> pinned_ref;  // tag for registry modules, ref otherwise
    RefType ref_type = RefType::Auto;
};

struct UpdateResult {
    bool success = false;
    Error error;
    std::string module_name;
    std::optional<std::string> old_version;
    std::optional<std::string> new_version;
    std::vector<std::string> warnings;

    bool changed() const { return old_version != new_version; }
};

struct RemoveResult {
    bool success = false;
    Error error;
    std::string module_name;
    std::string location;
};

// Drives reference -> download -> verify -> extract -> materialize -> record.
// The manifest handle is owned by the caller; each successful operation
// persists it exactly once.
class Installer {
public:
    Installer(InstallerOptions options, InstallManifest& manifest, RegistryClient& registry);

    InstallResult install(const std::string& reference, const InstallOptions& options = {});
    UpdateResult update(const std::string& name, const UpdateOptions& options = {});
    RemoveResult remove(const std::string& name);

    const InstallerOptions& options() const { return options_; }

private:
    struct Staged;

    // Where a repository install came from when a registry entry delegated to it
    struct RegistryOrigin {
        std::string module;
        std::string url;
    };

    InstallResult install_from_registry(RegistryClient& registry,
                                        const std::string& name,
                                        const std::optional<std::string>& requested_version,
                                        const InstallOptions& options);
    InstallResult install_from_repository(const RepositoryLocation& location,
                                          const InstallOptions& options,
                                          const std::optional<RegistryOrigin>& origin);
    InstallResult commit(Staged& staged, InstallResult result);

    std::string repository_archive_url(const RepositoryLocation& location, RefType ref_type) const;

    InstallerOptions options_;
    InstallManifest& manifest_;
    RegistryClient& registry_;
};

} // namespace cogmod
