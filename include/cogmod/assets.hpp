#pragma once

#include "cogmod/archive.hpp"
#include "cogmod/errors.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cogmod {

// ============================================================================
// Asset Builder
// ============================================================================

constexpr const char* REGISTRY_SCHEMA_URL = "https://cognitive-modules.dev/schema/registry-v2.json";
constexpr const char* REGISTRY_ENTRY_SCHEMA_URL =
    "https://cognitive-modules.dev/schema/registry-entry-v1.json";
constexpr const char* REGISTRY_DOCUMENT_VERSION = "2.0.0";
constexpr const char* MODULE_SPEC_VERSION = "2.2";

struct BuildOptions {
    std::string modules_dir;
    std::string out_dir;                          // tarballs land here
    std::string registry_out;                     // index file; empty = do not write
    std::optional<std::string> tag;
    std::optional<std::string> tarball_base_url;  // unset + no tag = dry-run (bare filenames)
    std::string timestamp;                        // empty = now
    std::string namespace_ = "official";
    std::string runtime_min = "2.2.0";
    std::string repository = "https://github.com/Cognary/cognitive";
    std::string homepage = "https://cognitive-modules.dev";
    std::string license = "MIT";
    std::optional<std::string> legacy_registry_path;  // description/author/tags/categories
    std::vector<std::string> only;                    // restrict to these module names
};

struct BuiltTarball {
    std::string name;
    std::string version;
    std::string file;   // "<name>-<version>.tar.gz"
    std::string path;
    std::string sha256;
    uint64_t size_bytes = 0;
};

struct BuildResult {
    bool ok = false;
    Error error;
    std::string index_json;  // the registry document as written
    std::vector<BuiltTarball> tarballs;
    std::string updated;
};

BuildResult build_registry_assets(const BuildOptions& options);

// ============================================================================
// Asset Verifier
// ============================================================================

enum class VerifyPhase {
    Download,
    Checksum,
    Extract,
};

const char* verify_phase_name(VerifyPhase phase);

struct VerifyFailure {
    std::string module;
    VerifyPhase phase = VerifyPhase::Download;
    std::string tarball_ref;
    std::string tarball_resolved;
    ErrorKind kind = ErrorKind::None;
    std::string message;
};

constexpr size_t DEFAULT_REMOTE_VERIFY_CONCURRENCY = 4;
constexpr size_t MAX_VERIFY_CONCURRENCY = 8;

struct VerifyOptions {
    std::string index;                       // path or URL
    std::optional<std::string> assets_dir;   // local mode
    bool remote = false;                     // implied by a URL index
    std::optional<size_t> concurrency;       // default 4 remote / 1 local, capped at 8
    uint64_t max_index_bytes = 2ull * 1024 * 1024;
    long timeout_ms = 15000;
    uint64_t max_tarball_bytes = 25ull * 1024 * 1024;
    ExtractLimits limits;
    std::optional<std::string> scratch_dir;  // default: fresh temp dir, removed afterwards
};

struct VerifyReport {
    bool ok = false;
    Error error;  // set when the index itself could not be read
    size_t checked = 0;
    size_t passed = 0;
    size_t failed = 0;
    std::vector<VerifyFailure> failures;  // index order
};

VerifyReport verify_registry_assets(const VerifyOptions& options);

} // namespace cogmod
