#pragma once

#include "cogmod/errors.hpp"

#include <map>
#include <optional>
#include <string>
#include <utility>

namespace cogmod {

// ============================================================================
// Install Manifest Entry
// ============================================================================

enum class RefType {
    Auto,    // let the archive host resolve the ref
    Tag,
    Branch,
};

const char* ref_type_name(RefType type);

struct ManifestEntry {
    std::string source;                           // original reference or repository URL
    std::string location;                         // module directory on disk
    std::optional<std::string> requested_ref;
    RefType ref_type = RefType::Auto;
    std::optional<std::string> module_path;       // repository sub-path
    std::optional<std::string> resolved_version;
    std::optional<std::string> registry_module;
    std::optional<std::string> registry_url;
    std::string installed_at;                     // RFC3339
};

// ============================================================================
// Install Manifest (installed.json)
// ============================================================================

struct ManifestLoadResult;

struct ManifestSaveResult {
    bool ok = false;
    Error error;
};

// Explicit handle over the manifest document. Loaded once, mutated in memory,
// persisted with save().
class InstallManifest {
public:
    InstallManifest() = default;
    explicit InstallManifest(std::string path) : path_(std::move(path)) {}

    // A missing file yields an empty manifest
    static ManifestLoadResult load(const std::string& path);

    const ManifestEntry* find(const std::string& name) const;
    void put(const std::string& name, ManifestEntry entry);
    bool erase(const std::string& name);

    const std::map<std::string, ManifestEntry>& entries() const { return entries_; }
    const std::string& path() const { return path_; }

    std::string serialize() const;
    ManifestSaveResult save() const;

private:
    std::string path_;
    std::map<std::string, ManifestEntry> entries_;
};

struct ManifestLoadResult {
    bool ok = false;
    Error error;
    InstallManifest manifest;
};

} // namespace cogmod
