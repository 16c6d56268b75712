#pragma once

#include "cogmod/archive.hpp"
#include "cogmod/errors.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace cogmod {

constexpr const char* PROVENANCE_FILENAME = "provenance.json";
constexpr const char* PROVENANCE_SPEC = "cognitive.module.provenance/v1";

// ============================================================================
// Provenance Record
// ============================================================================

struct RegistryProvenance {
    std::string registry_url;
    std::string module_name;
    std::optional<std::string> requested_version;
    std::string resolved_version;
    std::string tarball_url;
    std::string checksum;  // "sha256:<hex>" as declared by the index
    std::string sha256;    // digest observed while downloading
    struct {
        std::optional<bool> verified;
        std::optional<int> conformance_level;
        std::optional<std::string> spec_version;
    } quality;
    std::optional<std::string> archive_root;  // set when it differs from module_name
};

struct RepositoryProvenance {
    std::string repo_url;
    std::string ref;
    std::string module_path;
    std::string sha256;  // digest of the downloaded repository archive
};

struct ModuleIntegrity {
    std::string algorithm = "sha256";
    std::map<std::string, std::string> files;  // relative path -> hex digest
    uint64_t total_bytes = 0;
    ExtractLimits limits;
};

struct ProvenanceRecord {
    std::string spec = PROVENANCE_SPEC;
    std::string created_at;
    std::variant<RegistryProvenance, RepositoryProvenance> source;
    ModuleIntegrity integrity;
};

struct IntegrityResult {
    bool ok = false;
    Error error;
    ModuleIntegrity integrity;
};

// Per-file digests over content + "\nsize:<n>\n". provenance.json is excluded.
IntegrityResult compute_module_integrity(const std::string& module_dir,
                                         const ExtractLimits& limits);

struct ProvenanceWriteResult {
    bool ok = false;
    Error error;
    std::string path;
};

ProvenanceWriteResult write_provenance(const std::string& module_dir,
                                       const ProvenanceRecord& record);

struct ProvenanceReadResult {
    bool ok = false;
    Error error;
    ProvenanceRecord record;
};

ProvenanceReadResult read_provenance(const std::string& module_dir);

struct IntegrityCheckResult {
    bool ok = false;
    Error error;
    std::vector<std::string> missing;
    std::vector<std::string> extra;
    std::vector<std::string> changed;
};

// Recompute digests and compare with the recorded provenance
IntegrityCheckResult verify_module_integrity(const std::string& module_dir);

} // namespace cogmod
