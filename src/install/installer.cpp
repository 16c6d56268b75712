#include "cogmod/installer.hpp"
#include "cogmod/integrity.hpp"
#include "cogmod/module_descriptor.hpp"
#include "cogmod/path_utils.hpp"
#include "cogmod/platform.hpp"
#include "cogmod/provenance.hpp"

#include <spdlog/spdlog.h>

namespace cogmod {

namespace {

// Removes its directory on destruction unless released
class ScopedDirectory {
public:
    ScopedDirectory() = default;
    explicit ScopedDirectory(std::string path) : path_(std::move(path)) {}
    ~ScopedDirectory() {
        if (!path_.empty() && path_exists(path_) && !remove_directory(path_)) {
            spdlog::debug("failed to clean up {}", path_);
        }
    }

    ScopedDirectory(const ScopedDirectory&) = delete;
    ScopedDirectory& operator=(const ScopedDirectory&) = delete;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

struct RootListing {
    std::vector<std::string> dirs;
    std::vector<std::string> files;
};

RootListing list_archive_roots(const std::string& extracted) {
    RootListing listing;
    for (const auto& name : list_directory(extracted)) {
        if (name == "__MACOSX" || name == ".DS_Store") continue;
        if (is_directory(join_path(extracted, name))) {
            listing.dirs.push_back(name);
        } else {
            listing.files.push_back(name);
        }
    }
    return listing;
}

std::string join_names(const std::vector<std::string>& names) {
    if (names.empty()) return "(none)";
    std::string out;
    for (const auto& n : names) {
        if (!out.empty()) out += ",";
        out += n;
    }
    return out;
}

// Exactly one top-level directory and nothing beside it
bool single_root(const std::string& extracted, std::string& root, Error& error) {
    auto listing = list_archive_roots(extracted);
    if (listing.dirs.size() != 1 || !listing.files.empty()) {
        error = make_error(ErrorKind::AmbiguousArchiveLayout,
                           "archive must contain exactly one root directory and no other "
                           "top-level entries (dirs=" + join_names(listing.dirs) +
                           " files=" + join_names(listing.files) + ")");
        return false;
    }
    root = listing.dirs.front();
    return true;
}

// Interrupted commits leave these behind; young ones may still be in use
void sweep_stale_work_dirs(const std::string& modules_dir) {
    for (const auto& name : list_directory(modules_dir)) {
        if (name.rfind(STAGING_DIR_PREFIX, 0) != 0 && name.rfind(REPLACED_DIR_PREFIX, 0) != 0) {
            continue;
        }
        std::string path = join_path(modules_dir, name);
        auto age = seconds_since_modified(path);
        if (!age || *age < STALE_WORK_DIR_SECONDS) continue;
        if (remove_directory(path)) {
            spdlog::info("removed stale {}", path);
        } else {
            spdlog::warn("failed to remove stale {}", path);
        }
    }
}

// Undo a placement the manifest could not record
void roll_back_placement(const std::string& target, const std::string& previous) {
    if (!remove_directory(target)) {
        spdlog::error("failed to roll back {}", target);
        return;
    }
    if (previous.empty()) return;
    auto restored = place_directory(previous, target);
    if (restored.status != PlaceStatus::Placed) {
        spdlog::error("failed to restore {} from {}: {}", target, previous, restored.error);
    }
}

InstallResult failed(Error error) {
    InstallResult result;
    result.error = std::move(error);
    return result;
}

} // namespace

// ============================================================================
// Policy
// ============================================================================

const char* profile_name(Profile profile) {
    switch (profile) {
        case Profile::Standard: return "standard";
        case Profile::Certified: return "certified";
    }
    return "standard";
}

std::optional<Profile> parse_profile(const std::string& value) {
    if (value == "standard") return Profile::Standard;
    if (value == "certified") return Profile::Certified;
    return std::nullopt;
}

// ============================================================================
// Installer
// ============================================================================

struct Installer::Staged {
    std::string module_root;   // validated module directory inside scratch
    std::string install_name;
    std::optional<std::string> version;
    ManifestEntry entry;
    ProvenanceRecord provenance;
    bool provenance_required = false;
};

Installer::Installer(InstallerOptions options, InstallManifest& manifest, RegistryClient& registry)
    : options_(std::move(options)), manifest_(manifest), registry_(registry) {
    if (options_.profile == Profile::Certified) {
        options_.root_name_policy = RootNamePolicy::RequireMatch;
    }
}

std::string Installer::repository_archive_url(const RepositoryLocation& location,
                                              RefType ref_type) const {
    std::string base = options_.repository_archive_base;
    while (!base.empty() && base.back() == '/') base.pop_back();

    std::string prefix = base + "/" + location.owner + "/" + location.repo + "/archive/";
    switch (ref_type) {
        case RefType::Tag: return prefix + "refs/tags/" + location.ref + ".tar.gz";
        case RefType::Branch: return prefix + "refs/heads/" + location.ref + ".tar.gz";
        case RefType::Auto: break;
    }
    return prefix + location.ref + ".tar.gz";
}

InstallResult Installer::install(const std::string& reference, const InstallOptions& options) {
    auto parsed = classify_reference(reference);
    if (!parsed.ok) {
        return failed(parsed.error);
    }
    if (options.rename_to && !is_safe_module_name(*options.rename_to)) {
        return failed(make_error(ErrorKind::InvalidReference,
                                 "invalid install name '" + *options.rename_to + "'"));
    }

    const auto& ref = parsed.reference;
    spdlog::debug("installing {} ({})", ref.raw, reference_kind_name(ref.kind));

    if (ref.kind == ReferenceKind::RegistryName) {
        std::optional<std::string> version;
        if (!ref.version.empty()) {
            version = ref.version;
        } else if (options.pinned_ref) {
            version = options.pinned_ref;
        }
        return install_from_registry(registry_, ref.name, version, options);
    }

    RepositoryLocation location = ref.repository;
    if (options.pinned_ref) {
        location.ref = *options.pinned_ref;
    }
    return install_from_repository(location, options, std::nullopt);
}

InstallResult Installer::install_from_registry(RegistryClient& registry,
                                               const std::string& name,
                                               const std::optional<std::string>& requested_version,
                                               const InstallOptions& options) {
    auto lookup = registry.get_module(name);
    if (!lookup.ok) {
        return failed(lookup.error);
    }
    const ModuleInfo& info = lookup.info;

    if (requested_version && *requested_version != info.version) {
        return failed(make_error(ErrorKind::ModuleNotFound,
                                 "version " + *requested_version + " of '" + name +
                                 "' is not available (registry has " + info.version + ")"));
    }

    std::vector<std::string> warnings;
    if (info.deprecated.value_or(false)) {
        spdlog::warn("module '{}' is deprecated", name);
        warnings.push_back("module '" + name + "' is deprecated");
    }

    if (!info.tarball && is_repository_source(info.source)) {
        if (options_.profile == Profile::Certified) {
            return failed(make_error(ErrorKind::PolicyViolation,
                                     "certified profile requires registry tarball provenance; '" +
                                     name + "' resolves to a repository source"));
        }
        auto source = parse_repository_source(info.source);
        if (!source.ok) {
            return failed(source.error);
        }

        RepositoryLocation location = source.reference.repository;
        if (requested_version) location.ref = *requested_version;

        InstallOptions delegated = options;
        if (!delegated.rename_to) delegated.rename_to = name;
        delegated.ref_type = RefType::Auto;

        auto result = install_from_repository(location, delegated,
                                              RegistryOrigin{name, registry.registry_url()});
        result.warnings.insert(result.warnings.begin(), warnings.begin(), warnings.end());
        return result;
    }

    std::string tarball = info.tarball.value_or(info.source);
    if (tarball.empty()) {
        return failed(make_error(ErrorKind::ModuleNotFound,
                                 "registry entry for '" + name + "' has no distribution"));
    }
    if (!info.checksum) {
        return failed(make_error(ErrorKind::MissingChecksum,
                                 "registry tarball for '" + name +
                                 "' has no checksum (required for safe install)"));
    }
    auto checksum = parse_checksum(*info.checksum);
    if (!checksum.ok) {
        return failed(checksum.error);
    }

    std::string url = resolve_url(registry.registry_url(), tarball);
    if (url.empty() || !is_fetchable_url(url)) {
        return failed(make_error(ErrorKind::DownloadFailed,
                                 "unsupported tarball URL '" + tarball + "'"));
    }

    auto scratch_path = make_temp_directory("cogmod-install-");
    if (!scratch_path) {
        return failed(make_error(ErrorKind::IoError, "failed to create scratch directory"));
    }
    ScopedDirectory scratch(*scratch_path);

    std::string archive = join_path(scratch.path(), "module.tar.gz");
    spdlog::info("downloading {}", url);
    auto download = download_to_file(url, archive, options_.tarball_limits);
    if (!download.ok) {
        return failed(download.error);
    }

    if (info.size_bytes && *info.size_bytes != download.size_bytes) {
        return failed(make_digest_error(ErrorKind::SizeMismatch,
                                        "tarball size differs from size_bytes",
                                        std::to_string(*info.size_bytes),
                                        std::to_string(download.size_bytes)));
    }
    if (download.sha256 != checksum.hex_digest) {
        return failed(make_digest_error(ErrorKind::ChecksumMismatch,
                                        "checksum mismatch for " + name,
                                        checksum.hex_digest, download.sha256));
    }

    std::string extracted = join_path(scratch.path(), "pkg");
    auto extract = extract_tar_gz_file(archive, extracted, options_.extract_limits);
    if (!extract.ok) {
        return failed(extract.error);
    }

    std::string root_name;
    Error layout_error;
    if (!single_root(extracted, root_name, layout_error)) {
        return failed(layout_error);
    }
    std::string module_root = join_path(extracted, root_name);
    if (!is_module_directory(module_root)) {
        return failed(make_path_error(ErrorKind::ModuleNotFound,
                                      "archive root is not a module", root_name));
    }

    std::optional<std::string> archive_root;
    if (root_name != name) {
        if (options_.root_name_policy == RootNamePolicy::RequireMatch) {
            return failed(make_path_error(ErrorKind::AmbiguousArchiveLayout,
                                          "archive root does not match module name '" + name + "'",
                                          root_name));
        }
        spdlog::warn("archive root '{}' differs from module name '{}'", root_name, name);
        warnings.push_back("archive root '" + root_name + "' differs from module name '" +
                           name + "'");
        archive_root = root_name;
    }

    Staged staged;
    staged.module_root = module_root;
    staged.install_name = options.rename_to.value_or(name);
    staged.version = read_module_version(module_root);
    if (!staged.version && !info.version.empty()) staged.version = info.version;
    staged.provenance_required = options_.profile == Profile::Certified;

    staged.entry.source = url;
    staged.entry.requested_ref = requested_version;
    staged.entry.resolved_version = staged.version;
    staged.entry.registry_module = name;
    staged.entry.registry_url = registry.registry_url();

    RegistryProvenance prov;
    prov.registry_url = registry.registry_url();
    prov.module_name = name;
    prov.requested_version = requested_version;
    prov.resolved_version = staged.version.value_or("");
    prov.tarball_url = url;
    prov.checksum = *info.checksum;
    prov.sha256 = download.sha256;
    prov.quality.verified = info.verified;
    prov.quality.conformance_level = info.conformance_level;
    prov.quality.spec_version = info.spec_version;
    prov.archive_root = archive_root;
    staged.provenance.source = prov;

    InstallResult result;
    result.source = "registry";
    result.warnings = std::move(warnings);
    return commit(staged, std::move(result));
}

InstallResult Installer::install_from_repository(const RepositoryLocation& requested,
                                                 const InstallOptions& options,
                                                 const std::optional<RegistryOrigin>& origin) {
    if (options_.profile == Profile::Certified) {
        return failed(make_error(ErrorKind::PolicyViolation,
                                 "certified profile requires registry tarball provenance; "
                                 "repository installs are not allowed"));
    }

    RepositoryLocation location = requested;
    RefType ref_type = options.ref_type;
    if (location.ref.empty()) {
        location.ref = DEFAULT_BRANCH;
        ref_type = RefType::Branch;
    }

    auto scratch_path = make_temp_directory("cogmod-repo-");
    if (!scratch_path) {
        return failed(make_error(ErrorKind::IoError, "failed to create scratch directory"));
    }
    ScopedDirectory scratch(*scratch_path);

    std::string url = repository_archive_url(location, ref_type);
    std::string archive = join_path(scratch.path(), "repo.tar.gz");
    spdlog::info("downloading {}", url);
    auto download = download_to_file(url, archive, options_.repository_limits);
    if (!download.ok) {
        return failed(download.error);
    }

    // Repository archives carry no checksum; every member is vetted before any is written
    auto scanned = scan_tar_gz_file(archive, options_.extract_limits);
    if (!scanned.ok) {
        return failed(scanned.error);
    }

    std::string extracted = join_path(scratch.path(), "src");
    auto extract = extract_tar_gz_file(archive, extracted, options_.extract_limits);
    if (!extract.ok) {
        return failed(extract.error);
    }

    std::string top;
    Error layout_error;
    if (!single_root(extracted, top, layout_error)) {
        return failed(layout_error);
    }
    std::string repo_root = join_path(extracted, top);

    std::string module_root;
    if (location.subpath.empty()) {
        if (!is_module_directory(repo_root)) {
            return failed(make_error(ErrorKind::ModuleNotFound,
                                     "repository root is not a module; specify a module path"));
        }
        module_root = repo_root;
    } else {
        std::vector<std::string> searched;
        for (const std::string& prefix : {std::string(), std::string("cognitive/modules/"),
                                          std::string("modules/")}) {
            auto candidate = normalize_under_root(repo_root, prefix + location.subpath);
            if (!candidate.ok) continue;
            searched.push_back(prefix + location.subpath);
            if (is_directory(candidate.path) && is_module_directory(candidate.path)) {
                module_root = candidate.path;
                break;
            }
        }
        if (module_root.empty()) {
            std::string where;
            for (const auto& s : searched) {
                if (!where.empty()) where += ", ";
                where += s;
            }
            return failed(make_path_error(ErrorKind::ModuleNotFound,
                                          "module not found in repository (searched: " +
                                          where + ")",
                                          location.subpath));
        }
    }

    std::string install_name;
    if (options.rename_to) {
        install_name = *options.rename_to;
    } else if (!location.subpath.empty()) {
        install_name = get_filename(location.subpath);
    } else {
        install_name = location.repo;
    }
    if (!is_safe_module_name(install_name)) {
        return failed(make_error(ErrorKind::InvalidReference,
                                 "invalid install name '" + install_name + "'"));
    }

    Staged staged;
    staged.module_root = module_root;
    staged.install_name = install_name;
    staged.version = read_module_version(module_root);

    staged.entry.source = location.url();
    staged.entry.requested_ref = location.ref;
    staged.entry.ref_type = ref_type;
    if (!location.subpath.empty()) staged.entry.module_path = location.subpath;
    staged.entry.resolved_version = staged.version;
    if (origin) {
        staged.entry.registry_module = origin->module;
        staged.entry.registry_url = origin->url;
    }

    RepositoryProvenance prov;
    prov.repo_url = location.url();
    prov.ref = location.ref;
    prov.module_path = location.subpath;
    prov.sha256 = download.sha256;
    staged.provenance.source = prov;

    InstallResult result;
    result.source = origin ? "registry" : "github";
    return commit(staged, std::move(result));
}

InstallResult Installer::commit(Staged& staged, InstallResult result) {
    std::string target = join_path(options_.modules_dir, staged.install_name);
    if (!is_lexically_within(options_.modules_dir, target)) {
        return failed(make_path_error(ErrorKind::PathTraversal,
                                      "install target escapes the modules directory",
                                      staged.install_name));
    }
    if (!create_directories(options_.modules_dir)) {
        return failed(make_path_error(ErrorKind::IoError, "failed to create modules directory",
                                      options_.modules_dir));
    }

    sweep_stale_work_dirs(options_.modules_dir);

    // Staged beside the target so the final move is a rename on one filesystem
    ScopedDirectory staging(join_path(options_.modules_dir, STAGING_DIR_PREFIX + generate_uuid()));
    std::string copy_error;
    if (!copy_tree(staged.module_root, staging.path(), &copy_error)) {
        return failed(make_path_error(ErrorKind::IoError, copy_error, staged.module_root));
    }

    // Only provenance written here is trusted
    std::string shipped = join_path(staging.path(), PROVENANCE_FILENAME);
    if (path_exists(shipped) && !remove_file(shipped)) {
        return failed(make_path_error(ErrorKind::IoError, "failed to remove shipped provenance",
                                      shipped));
    }

    auto integrity = compute_module_integrity(staging.path(), options_.extract_limits);
    Error provenance_error;
    if (integrity.ok) {
        staged.provenance.created_at = get_current_timestamp();
        staged.provenance.integrity = integrity.integrity;
        auto written = write_provenance(staging.path(), staged.provenance);
        if (!written.ok) provenance_error = written.error;
    } else {
        provenance_error = integrity.error;
    }
    if (provenance_error) {
        if (staged.provenance_required) {
            Error err = provenance_error;
            err.message = "provenance is required: " + err.message;
            return failed(err);
        }
        spdlog::warn("failed to write provenance for {}: {}", staged.install_name,
                     provenance_error.describe());
        result.warnings.push_back("provenance not written: " + provenance_error.message);
    }

    // The previous tree stays aside until the manifest records the new one
    std::string previous;
    auto placed = place_directory(staging.path(), target);
    if (placed.status == PlaceStatus::AlreadyExists) {
        spdlog::debug("replacing existing module at {}", target);
        placed = replace_directory(staging.path(), target, &previous);
    }
    if (placed.status != PlaceStatus::Placed) {
        return failed(make_path_error(ErrorKind::IoError, placed.error, target));
    }

    std::optional<ManifestEntry> prior_entry;
    if (const ManifestEntry* existing = manifest_.find(staged.install_name)) {
        prior_entry = *existing;
    }

    staged.entry.location = target;
    staged.entry.installed_at = get_current_timestamp();
    manifest_.put(staged.install_name, staged.entry);
    auto saved = manifest_.save();
    if (!saved.ok) {
        if (prior_entry) {
            manifest_.put(staged.install_name, *prior_entry);
        } else {
            manifest_.erase(staged.install_name);
        }
        roll_back_placement(target, previous);
        return failed(saved.error);
    }
    if (!previous.empty() && !remove_directory(previous)) {
        spdlog::warn("failed to remove replaced module at {}", previous);
    }

    result.success = true;
    result.module_name = staged.install_name;
    result.version = staged.version;
    result.location = target;
    spdlog::info("installed {}{} at {}", staged.install_name,
                 staged.version ? " v" + *staged.version : std::string(), target);
    return result;
}

UpdateResult Installer::update(const std::string& name, const UpdateOptions& options) {
    UpdateResult result;
    result.module_name = name;

    if (!is_safe_module_name(name)) {
        result.error = make_error(ErrorKind::InvalidReference, "invalid module name '" + name + "'");
        return result;
    }
    const ManifestEntry* found = manifest_.find(name);
    if (!found) {
        result.error = make_error(ErrorKind::ManifestNotFound,
                                  "module '" + name + "' was not installed by cogmod");
        return result;
    }
    // install() rewrites the manifest entry; keep a copy
    ManifestEntry entry = *found;

    result.old_version = read_module_version(entry.location);
    if (!result.old_version) result.old_version = entry.resolved_version;

    InstallOptions install_options;
    install_options.rename_to = name;

    InstallResult installed;
    if (entry.registry_module) {
        std::optional<std::string> version = options.pinned_ref;
        if (entry.registry_url && *entry.registry_url != registry_.registry_url()) {
            RegistryClientOptions client_options = registry_.options();
            client_options.registry_url = *entry.registry_url;
            RegistryClient origin(client_options);
            installed = install_from_registry(origin, *entry.registry_module, version,
                                              install_options);
        } else {
            installed = install_from_registry(registry_, *entry.registry_module, version,
                                              install_options);
        }
    } else {
        auto parsed = classify_reference(entry.source);
        if (!parsed.ok || parsed.reference.kind == ReferenceKind::RegistryName) {
            result.error = make_error(ErrorKind::InvalidReference,
                                      "cannot re-resolve source '" + entry.source + "'");
            return result;
        }
        RepositoryLocation location = parsed.reference.repository;
        location.subpath = entry.module_path.value_or("");
        if (options.pinned_ref) {
            location.ref = *options.pinned_ref;
            install_options.ref_type = options.ref_type;
        } else {
            location.ref = entry.requested_ref.value_or("");
            install_options.ref_type = entry.ref_type;
        }
        installed = install_from_repository(location, install_options, std::nullopt);
    }

    if (!installed.success) {
        result.error = installed.error;
        return result;
    }

    result.success = true;
    result.new_version = installed.version;
    result.warnings = installed.warnings;
    return result;
}

RemoveResult Installer::remove(const std::string& name) {
    RemoveResult result;
    result.module_name = name;

    if (!is_safe_module_name(name)) {
        result.error = make_error(ErrorKind::InvalidReference, "invalid module name '" + name + "'");
        return result;
    }
    if (!manifest_.find(name)) {
        result.error = make_error(ErrorKind::ManifestNotFound,
                                  "module '" + name + "' is not installed");
        return result;
    }

    // Never trust the recorded location for deletion
    std::string target = join_path(options_.modules_dir, name);
    if (path_exists(target) && !remove_directory(target)) {
        result.error = make_path_error(ErrorKind::IoError, "failed to remove module directory",
                                       target);
        return result;
    }

    manifest_.erase(name);
    auto saved = manifest_.save();
    if (!saved.ok) {
        result.error = saved.error;
        return result;
    }

    result.success = true;
    result.location = target;
    spdlog::info("removed {}", name);
    return result;
}

} // namespace cogmod
