#pragma once

#include "cogmod/errors.hpp"
#include "cogmod/fetch.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace cogmod {

constexpr const char* DEFAULT_REGISTRY_URL =
    "https://raw.githubusercontent.com/Cognary/cognitive/main/cognitive-registry.v2.json";

constexpr long DEFAULT_INDEX_TIMEOUT_MS = 10000;
constexpr uint64_t DEFAULT_INDEX_MAX_BYTES = 1024 * 1024;
constexpr std::chrono::seconds DEFAULT_INDEX_CACHE_TTL{300};

// ============================================================================
// Wire Formats
// ============================================================================

// { description, version, source, tags, author }
struct LegacyEntry {
    std::string description;
    std::string version;
    std::string source;  // github:owner/repo[/path][@ref] or absolute tarball URL
    std::vector<std::string> tags;
    std::string author;
};

// { identity, metadata, quality?, dependencies, distribution }
struct CurrentEntry {
    struct {
        std::string name;
        std::string namespace_;
        std::string version;
        std::string spec_version;
    } identity;

    struct {
        std::string description;
        std::string author;
        std::string license;
        std::string repository;
        std::string homepage;
        std::string tier;
        std::vector<std::string> keywords;
    } metadata;

    struct Quality {
        std::optional<int> conformance_level;
        bool verified = false;
        bool deprecated = false;
    };
    std::optional<Quality> quality;

    struct {
        std::string runtime_min;
        std::vector<std::string> modules;
    } dependencies;

    struct {
        std::string tarball;
        std::string checksum;
        std::optional<uint64_t> size_bytes;
        std::vector<std::string> files;
    } distribution;
};

using RegistryEntry = std::variant<LegacyEntry, CurrentEntry>;

// ============================================================================
// Module Info (format-independent)
// ============================================================================

struct ModuleInfo {
    std::string name;
    std::string version;
    std::string description;
    std::string author;
    std::string source;
    std::optional<std::string> tarball;
    std::optional<std::string> checksum;
    std::vector<std::string> keywords;
    std::optional<std::string> tier;
    std::optional<bool> deprecated;

    // Only the current format expresses these
    std::optional<uint64_t> size_bytes;
    std::vector<std::string> files;
    std::optional<std::string> namespace_;
    std::optional<std::string> spec_version;
    std::optional<bool> verified;
    std::optional<int> conformance_level;
};

// The one place where the two wire formats are told apart
ModuleInfo normalize_entry(const std::string& name, const RegistryEntry& entry);

struct RegistryCategory {
    std::string name;
    std::string description;
    std::vector<std::string> modules;
};

struct RegistryIndex {
    std::string version;
    std::string updated;
    std::string source_url;
    std::map<std::string, ModuleInfo> modules;
    std::map<std::string, RegistryCategory> categories;  // optional in both formats
};

struct IndexResult {
    bool ok = false;
    Error error;
    RegistryIndex index;
};

// Parse and normalize an index document (MalformedIndex on failure)
IndexResult parse_registry_index(const std::string& json_text, const std::string& source_url);

// ============================================================================
// Search
// ============================================================================

struct SearchHit {
    std::string name;
    int score = 0;
    ModuleInfo info;
};

// Score: name contains query +10 (exact +5 more), description term +3,
// keyword/term overlap +2. Sorted by score desc, then name asc.
// Empty query lists everything by name with score 1.
std::vector<SearchHit> search_modules(const RegistryIndex& index, const std::string& query);

// ============================================================================
// Registry Client
// ============================================================================

struct RegistryClientOptions {
    std::string registry_url = DEFAULT_REGISTRY_URL;
    std::string cache_dir;  // empty disables the disk cache
    FetchLimits limits{DEFAULT_INDEX_TIMEOUT_MS, DEFAULT_INDEX_MAX_BYTES};
    std::chrono::seconds cache_ttl = DEFAULT_INDEX_CACHE_TTL;
};

struct ModuleLookupResult {
    bool ok = false;
    Error error;
    ModuleInfo info;
};

// Fetches the index once per client, backed by an on-disk cache file
// "<cache_dir>/registry-<hash>.json" that is fresh for cache_ttl.
class RegistryClient {
public:
    explicit RegistryClient(RegistryClientOptions options);

    IndexResult fetch_index(bool force_refresh = false);
    ModuleLookupResult get_module(const std::string& name);
    std::vector<ModuleInfo> list_modules(Error* error = nullptr);
    std::vector<SearchHit> search(const std::string& query, Error* error = nullptr);
    std::map<std::string, RegistryCategory> categories(Error* error = nullptr);

    const std::string& registry_url() const { return options_.registry_url; }
    const RegistryClientOptions& options() const { return options_; }
    std::string cache_path() const;

private:
    RegistryClientOptions options_;
    std::optional<RegistryIndex> index_;
};

} // namespace cogmod
