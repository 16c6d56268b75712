#include "cogmod/provenance.hpp"
#include "cogmod/integrity.hpp"
#include "cogmod/platform.hpp"

#include <fstream>

#include <nlohmann/json.hpp>

namespace cogmod {

namespace {

// Helper to safely get a string from JSON
std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

uint64_t get_u64(const nlohmann::json& j, const std::string& key, uint64_t fallback) {
    if (j.contains(key) && j[key].is_number_unsigned()) {
        return j[key].get<uint64_t>();
    }
    return fallback;
}

nlohmann::json optional_string(const std::optional<std::string>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

// sha256(content || "\nsize:<n>\n")
bool hash_file_with_size(const std::string& path, uint64_t size, std::string& hex) {
    std::ifstream file(path, std::ios::binary);
    if (!file) return false;

    Sha256Hasher hasher;
    char buffer[8192];
    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
        if (!hasher.update(buffer, static_cast<size_t>(file.gcount()))) return false;
    }
    if (file.bad()) return false;

    std::string suffix = "\nsize:" + std::to_string(size) + "\n";
    if (!hasher.update(suffix.data(), suffix.size())) return false;

    hex = hasher.finish();
    return !hex.empty();
}

nlohmann::json source_to_json(const RegistryProvenance& s) {
    nlohmann::json j;
    j["type"] = "registry";
    j["registryUrl"] = s.registry_url;
    j["moduleName"] = s.module_name;
    j["requestedVersion"] = optional_string(s.requested_version);
    j["resolvedVersion"] = s.resolved_version.empty() ? nlohmann::json(nullptr)
                                                      : nlohmann::json(s.resolved_version);
    j["tarballUrl"] = s.tarball_url;
    j["checksum"] = s.checksum;
    j["sha256"] = s.sha256;

    nlohmann::json quality = nlohmann::json::object();
    if (s.quality.verified) quality["verified"] = *s.quality.verified;
    if (s.quality.conformance_level) quality["conformance_level"] = *s.quality.conformance_level;
    if (s.quality.spec_version) quality["spec_version"] = *s.quality.spec_version;
    j["quality"] = quality;

    if (s.archive_root) j["archiveRoot"] = *s.archive_root;
    return j;
}

nlohmann::json source_to_json(const RepositoryProvenance& s) {
    nlohmann::json j;
    j["type"] = "github";
    j["repoUrl"] = s.repo_url;
    j["ref"] = s.ref;
    j["modulePath"] = s.module_path.empty() ? nlohmann::json(nullptr)
                                            : nlohmann::json(s.module_path);
    j["sha256"] = s.sha256;
    return j;
}

} // namespace

// ============================================================================
// Integrity
// ============================================================================

IntegrityResult compute_module_integrity(const std::string& module_dir,
                                         const ExtractLimits& limits) {
    IntegrityResult result;
    result.integrity.limits = limits;

    auto listed = list_module_files(module_dir);
    if (!listed.ok) {
        result.error = listed.error;
        return result;
    }

    std::vector<std::string> files;
    for (const auto& rel : listed.files) {
        if (rel != PROVENANCE_FILENAME) files.push_back(rel);
    }
    if (files.size() > limits.max_files) {
        result.error = make_path_error(ErrorKind::ArchiveQuotaExceeded,
                                       "module has more than " + std::to_string(limits.max_files) +
                                       " files", module_dir);
        return result;
    }

    for (const auto& rel : files) {
        std::string full = join_path(module_dir, rel);
        auto size = file_size(full);
        if (!size) {
            result.error = make_path_error(ErrorKind::IoError, "failed to stat file", rel);
            return result;
        }
        if (*size > limits.max_single_file_bytes) {
            result.error = make_path_error(ErrorKind::ArchiveQuotaExceeded,
                                           "file too large for integrity hashing", rel);
            return result;
        }
        result.integrity.total_bytes += *size;
        if (result.integrity.total_bytes > limits.max_total_bytes) {
            result.error = make_path_error(ErrorKind::ArchiveQuotaExceeded,
                                           "module too large for integrity hashing", rel);
            return result;
        }

        std::string hex;
        if (!hash_file_with_size(full, *size, hex)) {
            result.error = make_path_error(ErrorKind::IoError, "failed to hash file", rel);
            return result;
        }
        result.integrity.files[rel] = hex;
    }

    result.ok = true;
    return result;
}

// ============================================================================
// Provenance File
// ============================================================================

ProvenanceWriteResult write_provenance(const std::string& module_dir,
                                       const ProvenanceRecord& record) {
    ProvenanceWriteResult result;
    result.path = join_path(module_dir, PROVENANCE_FILENAME);

    nlohmann::json j;
    j["spec"] = record.spec;
    j["createdAt"] = record.created_at;
    j["source"] = std::visit([](const auto& s) { return source_to_json(s); }, record.source);

    nlohmann::json integrity;
    integrity["algorithm"] = record.integrity.algorithm;
    integrity["files"] = record.integrity.files;
    integrity["totalBytes"] = record.integrity.total_bytes;
    integrity["limits"] = {
        {"maxFiles", record.integrity.limits.max_files},
        {"maxTotalBytes", record.integrity.limits.max_total_bytes},
        {"maxSingleFileBytes", record.integrity.limits.max_single_file_bytes},
    };
    j["integrity"] = integrity;

    auto written = atomic_write_file(result.path, j.dump(2) + "\n");
    if (!written.ok) {
        result.error = make_path_error(ErrorKind::IoError, written.error, result.path);
        return result;
    }

    result.ok = true;
    return result;
}

ProvenanceReadResult read_provenance(const std::string& module_dir) {
    ProvenanceReadResult result;
    std::string path = join_path(module_dir, PROVENANCE_FILENAME);

    auto content = read_file(path);
    if (!content) {
        result.error = make_path_error(ErrorKind::IoError, "no provenance record", path);
        return result;
    }

    try {
        auto j = nlohmann::json::parse(*content);
        if (!j.is_object() || get_string(j, "spec").value_or("") != PROVENANCE_SPEC) {
            result.error = make_path_error(ErrorKind::IoError,
                                           std::string("provenance spec must be ") + PROVENANCE_SPEC,
                                           path);
            return result;
        }
        result.record.created_at = get_string(j, "createdAt").value_or("");

        const auto& src = j.contains("source") ? j["source"] : nlohmann::json::object();
        std::string type = get_string(src, "type").value_or("");
        if (type == "registry") {
            RegistryProvenance s;
            s.registry_url = get_string(src, "registryUrl").value_or("");
            s.module_name = get_string(src, "moduleName").value_or("");
            s.requested_version = get_string(src, "requestedVersion");
            s.resolved_version = get_string(src, "resolvedVersion").value_or("");
            s.tarball_url = get_string(src, "tarballUrl").value_or("");
            s.checksum = get_string(src, "checksum").value_or("");
            s.sha256 = get_string(src, "sha256").value_or("");
            if (src.contains("quality") && src["quality"].is_object()) {
                const auto& q = src["quality"];
                if (q.contains("verified") && q["verified"].is_boolean()) {
                    s.quality.verified = q["verified"].get<bool>();
                }
                if (q.contains("conformance_level") && q["conformance_level"].is_number_integer()) {
                    s.quality.conformance_level = q["conformance_level"].get<int>();
                }
                s.quality.spec_version = get_string(q, "spec_version");
            }
            s.archive_root = get_string(src, "archiveRoot");
            result.record.source = s;
        } else if (type == "github") {
            RepositoryProvenance s;
            s.repo_url = get_string(src, "repoUrl").value_or("");
            s.ref = get_string(src, "ref").value_or("");
            s.module_path = get_string(src, "modulePath").value_or("");
            s.sha256 = get_string(src, "sha256").value_or("");
            result.record.source = s;
        } else {
            result.error = make_path_error(ErrorKind::IoError,
                                           "unknown provenance source type '" + type + "'", path);
            return result;
        }

        if (!j.contains("integrity") || !j["integrity"].is_object()) {
            result.error = make_path_error(ErrorKind::IoError, "provenance has no integrity", path);
            return result;
        }
        const auto& integ = j["integrity"];
        result.record.integrity.algorithm = get_string(integ, "algorithm").value_or("sha256");
        result.record.integrity.total_bytes = get_u64(integ, "totalBytes", 0);
        if (integ.contains("files") && integ["files"].is_object()) {
            for (auto it = integ["files"].begin(); it != integ["files"].end(); ++it) {
                if (it.value().is_string()) {
                    result.record.integrity.files[it.key()] = it.value().get<std::string>();
                }
            }
        }
        if (integ.contains("limits") && integ["limits"].is_object()) {
            const auto& l = integ["limits"];
            auto& limits = result.record.integrity.limits;
            limits.max_files = get_u64(l, "maxFiles", limits.max_files);
            limits.max_total_bytes = get_u64(l, "maxTotalBytes", limits.max_total_bytes);
            limits.max_single_file_bytes =
                get_u64(l, "maxSingleFileBytes", limits.max_single_file_bytes);
        }
    } catch (const nlohmann::json::exception& e) {
        result.error = make_path_error(ErrorKind::IoError,
                                       std::string("invalid provenance: ") + e.what(), path);
        return result;
    }

    result.ok = true;
    return result;
}

IntegrityCheckResult verify_module_integrity(const std::string& module_dir) {
    IntegrityCheckResult result;

    auto prov = read_provenance(module_dir);
    if (!prov.ok) {
        result.error = prov.error;
        return result;
    }

    const auto& recorded = prov.record.integrity;
    if (recorded.algorithm != "sha256") {
        result.error = make_error(ErrorKind::InvalidChecksumFormat,
                                  "unsupported integrity algorithm: " + recorded.algorithm);
        return result;
    }

    auto current = compute_module_integrity(module_dir, recorded.limits);
    if (!current.ok) {
        result.error = current.error;
        return result;
    }

    for (const auto& [rel, digest] : recorded.files) {
        auto it = current.integrity.files.find(rel);
        if (it == current.integrity.files.end()) {
            result.missing.push_back(rel);
        } else if (it->second != digest) {
            result.changed.push_back(rel);
        }
    }
    for (const auto& [rel, digest] : current.integrity.files) {
        if (recorded.files.find(rel) == recorded.files.end()) {
            result.extra.push_back(rel);
        }
    }

    if (!result.missing.empty() || !result.changed.empty() || !result.extra.empty()) {
        std::string first = !result.changed.empty() ? result.changed.front()
                          : !result.missing.empty() ? result.missing.front()
                                                    : result.extra.front();
        result.error = make_path_error(
            ErrorKind::ChecksumMismatch,
            std::to_string(result.changed.size()) + " changed, " +
            std::to_string(result.missing.size()) + " missing, " +
            std::to_string(result.extra.size()) + " extra",
            first);
        return result;
    }

    result.ok = true;
    return result;
}

} // namespace cogmod
