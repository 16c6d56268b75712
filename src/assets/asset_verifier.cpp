#include "cogmod/archive.hpp"
#include "cogmod/assets.hpp"
#include "cogmod/fetch.hpp"
#include "cogmod/integrity.hpp"
#include "cogmod/module_descriptor.hpp"
#include "cogmod/path_utils.hpp"
#include "cogmod/platform.hpp"
#include "cogmod/registry.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace cogmod {

namespace {

// One module's trip through download, checksum and extract
struct Job {
    std::string name;
    const ModuleInfo* info = nullptr;
    std::string work_dir;   // "<scratch>/<ordinal>-<name>"
    std::string tar_path;
    std::string resolved;
    bool done = false;      // failed in an earlier phase
};

void record_failure(VerifyReport& report, Job& job, VerifyPhase phase, const Error& error) {
    VerifyFailure failure;
    failure.module = job.name;
    failure.phase = phase;
    failure.tarball_ref = job.info->tarball.value_or("");
    failure.tarball_resolved = job.resolved;
    failure.kind = error.kind;
    failure.message = error.describe();
    spdlog::warn("verify {}: {} failed: {}", job.name, verify_phase_name(phase), failure.message);
    report.failures.push_back(std::move(failure));
    job.done = true;
}

// Scratch file name for a tarball; never a path component that could escape work_dir
std::string scratch_file_name(const std::string& ref) {
    std::string base = url_basename(ref);
    return is_safe_module_name(base) ? base : "module.tar.gz";
}

// Declared size first, then the presence of a checksum
bool check_declared(const Job& job, uint64_t size, Error& error) {
    const ModuleInfo& info = *job.info;
    if (info.size_bytes && *info.size_bytes != size) {
        error = make_digest_error(ErrorKind::SizeMismatch, "tarball size differs from size_bytes",
                                  std::to_string(*info.size_bytes), std::to_string(size));
        error.path = job.resolved;
        return false;
    }
    if (!info.checksum || info.checksum->empty()) {
        error = make_error(ErrorKind::MissingChecksum, "entry has no distribution.checksum");
        return false;
    }
    return true;
}

// Compare a digest observed while downloading with the declared checksum
bool check_digest(const Job& job, const std::string& sha256, Error& error) {
    auto parsed = parse_checksum(*job.info->checksum);
    if (!parsed.ok) {
        error = parsed.error;
        return false;
    }
    if (parsed.hex_digest != sha256) {
        error = make_digest_error(ErrorKind::ChecksumMismatch, "tarball digest differs from checksum",
                                  parsed.hex_digest, sha256);
        error.path = job.resolved;
        return false;
    }
    return true;
}

bool check_contents(const Job& job, const ExtractLimits& limits, Error& error) {
    const ModuleInfo& info = *job.info;
    std::string extracted = join_path(job.work_dir, "pkg");

    auto unpacked = extract_tar_gz_file(job.tar_path, extracted, limits);
    if (!unpacked.ok) {
        error = unpacked.error;
        return false;
    }

    std::vector<std::string> dirs;
    std::vector<std::string> files;
    for (const auto& name : list_directory(extracted)) {
        if (name == "__MACOSX" || name == ".DS_Store") continue;
        (is_directory(join_path(extracted, name)) ? dirs : files).push_back(name);
    }
    if (dirs.size() != 1 || !files.empty()) {
        error = make_error(ErrorKind::AmbiguousArchiveLayout,
                           "tarball must contain exactly one root directory and no other "
                           "top-level entries");
        return false;
    }

    std::string module_dir = join_path(extracted, dirs.front());
    if (!is_module_directory(module_dir)) {
        error = make_path_error(ErrorKind::ModuleNotFound, "root directory is not a module",
                                dirs.front());
        return false;
    }

    if (!info.files.empty()) {
        auto listed = list_module_files(module_dir);
        if (!listed.ok) {
            error = listed.error;
            return false;
        }
        std::vector<std::string> expected = info.files;
        std::sort(expected.begin(), expected.end());
        const auto& actual = listed.files;
        if (expected.size() != actual.size()) {
            error = make_digest_error(ErrorKind::InvalidModule, "file list differs from distribution.files",
                                      std::to_string(expected.size()) + " files",
                                      std::to_string(actual.size()) + " files");
            return false;
        }
        for (size_t i = 0; i < expected.size(); ++i) {
            if (expected[i] != actual[i]) {
                error = make_digest_error(ErrorKind::InvalidModule,
                                          "file list differs from distribution.files at index " +
                                          std::to_string(i), expected[i], actual[i]);
                return false;
            }
        }
    }

    std::string yaml_path = join_path(module_dir, MODULE_YAML);
    if (is_regular_file(yaml_path)) {
        auto meta = read_module_yaml(yaml_path);
        if (!meta.ok) {
            spdlog::debug("verify {}: skipping identity check: {}", job.name,
                          meta.error.describe());
            return true;
        }
        if (!info.version.empty() && meta.descriptor.version != info.version) {
            error = make_digest_error(ErrorKind::InvalidModule,
                                      "module.yaml version differs from identity.version",
                                      info.version, meta.descriptor.version);
            return false;
        }
        if (!info.name.empty() && meta.descriptor.name != info.name) {
            error = make_digest_error(ErrorKind::InvalidModule,
                                      "module.yaml name differs from identity.name",
                                      info.name, meta.descriptor.name);
            return false;
        }
    }
    return true;
}

void release_work_dir(const Job& job) {
    if (path_exists(job.work_dir) && !remove_directory(job.work_dir)) {
        spdlog::debug("failed to clean up {}", job.work_dir);
    }
}

void check_extract_phase(VerifyReport& report, Job& job, const ExtractLimits& limits) {
    Error error;
    if (!check_contents(job, limits, error)) {
        record_failure(report, job, VerifyPhase::Extract, error);
        return;
    }
    report.passed++;
    spdlog::debug("verify {}: ok", job.name);
}

// Local tarballs are hashed in place
void verify_local_job(VerifyReport& report, Job& job, const ExtractLimits& limits) {
    Error error;
    auto size = file_size(job.tar_path);
    if (!size) {
        record_failure(report, job, VerifyPhase::Checksum,
                       make_path_error(ErrorKind::IoError, "failed to stat tarball", job.tar_path));
        return;
    }
    if (!check_declared(job, *size, error)) {
        record_failure(report, job, VerifyPhase::Checksum, error);
        return;
    }
    auto verified = verify_file_checksum(job.tar_path, *job.info->checksum);
    if (!verified.ok) {
        error = verified.error;
        if (error.path.empty()) error.path = job.resolved;
        record_failure(report, job, VerifyPhase::Checksum, error);
        return;
    }
    check_extract_phase(report, job, limits);
}

// Downloaded tarballs were hashed while they streamed in
void verify_downloaded_job(VerifyReport& report, Job& job, const DownloadResult& download,
                           const ExtractLimits& limits) {
    if (!download.ok) {
        record_failure(report, job, VerifyPhase::Download, download.error);
        return;
    }
    Error error;
    if (!check_declared(job, download.size_bytes, error) ||
        !check_digest(job, download.sha256, error)) {
        record_failure(report, job, VerifyPhase::Checksum, error);
        return;
    }
    check_extract_phase(report, job, limits);
}

} // namespace

const char* verify_phase_name(VerifyPhase phase) {
    switch (phase) {
        case VerifyPhase::Download: return "download";
        case VerifyPhase::Checksum: return "checksum";
        case VerifyPhase::Extract: return "extract";
    }
    return "unknown";
}

// ============================================================================
// Registry Asset Verification
// ============================================================================

VerifyReport verify_registry_assets(const VerifyOptions& options) {
    VerifyReport report;

    const bool remote = options.remote || is_fetchable_url(options.index);
    if (remote && !is_fetchable_url(options.index)) {
        report.error = make_error(ErrorKind::InvalidReference,
                                  "remote verification requires an index URL, got: " +
                                  options.index);
        return report;
    }
    if (!remote && (!options.assets_dir || options.assets_dir->empty())) {
        report.error = make_error(ErrorKind::InvalidReference,
                                  "local verification requires an assets directory");
        return report;
    }

    std::string raw;
    if (remote) {
        auto fetched = fetch_text(options.index, {options.timeout_ms, options.max_index_bytes});
        if (!fetched.ok) {
            report.error = fetched.error;
            return report;
        }
        raw = std::move(fetched.body);
    } else {
        auto content = read_file(options.index);
        if (!content) {
            report.error = make_path_error(ErrorKind::IoError, "failed to read registry index",
                                           options.index);
            return report;
        }
        raw = std::move(*content);
    }

    auto parsed = parse_registry_index(raw, options.index);
    if (!parsed.ok) {
        report.error = parsed.error;
        return report;
    }
    const RegistryIndex& index = parsed.index;

    // Scratch space: one directory per module, prefixed with its ordinal so
    // two modules never share a download path
    std::string scratch;
    bool own_scratch = false;
    if (options.scratch_dir) {
        scratch = *options.scratch_dir;
        if (!create_directories(scratch)) {
            report.error = make_path_error(ErrorKind::IoError, "failed to create directory", scratch);
            return report;
        }
    } else {
        auto tmp = make_temp_directory("cogmod-verify-");
        if (!tmp) {
            report.error = make_error(ErrorKind::IoError, "failed to create scratch directory");
            return report;
        }
        scratch = *tmp;
        own_scratch = true;
    }

    std::vector<Job> jobs;
    jobs.reserve(index.modules.size());
    size_t ordinal = 0;
    for (const auto& [name, info] : index.modules) {
        Job job;
        job.name = name;
        job.info = &info;
        job.work_dir = join_path(scratch, std::to_string(ordinal++) + "-" +
                                          (is_safe_module_name(name) ? name : "module"));
        jobs.push_back(std::move(job));
    }
    report.checked = jobs.size();

    // Locate (local) or queue for download (remote)
    std::vector<DownloadRequest> requests;
    std::vector<size_t> request_jobs;
    for (size_t i = 0; i < jobs.size(); ++i) {
        Job& job = jobs[i];
        std::string ref = job.info->tarball.value_or("");
        if (ref.empty()) {
            record_failure(report, job, VerifyPhase::Download,
                           make_error(ErrorKind::MalformedIndex, "entry has no distribution.tarball"));
            continue;
        }

        if (!remote) {
            job.resolved = join_path(*options.assets_dir, scratch_file_name(ref));
            job.tar_path = job.resolved;
            if (!is_regular_file(job.tar_path)) {
                record_failure(report, job, VerifyPhase::Download,
                               make_path_error(ErrorKind::IoError, "tarball not found", job.tar_path));
            }
            continue;
        }

        job.resolved = resolve_url(options.index, ref);
        if (job.resolved.empty() || !is_fetchable_url(job.resolved)) {
            record_failure(report, job, VerifyPhase::Download,
                           make_error(ErrorKind::InvalidReference,
                                      "tarball reference does not resolve to a URL: " + ref));
            continue;
        }
        if (!create_directories(job.work_dir)) {
            record_failure(report, job, VerifyPhase::Download,
                           make_path_error(ErrorKind::IoError, "failed to create directory",
                                           job.work_dir));
            continue;
        }
        job.tar_path = join_path(job.work_dir, scratch_file_name(job.resolved));
        requests.push_back({job.resolved, job.tar_path,
                            {options.timeout_ms, options.max_tarball_bytes}});
        request_jobs.push_back(i);
    }

    if (!remote) {
        for (auto& job : jobs) {
            if (job.done) continue;
            verify_local_job(report, job, options.limits);
            release_work_dir(job);
        }
    } else if (!requests.empty()) {
        size_t concurrency = options.concurrency.value_or(DEFAULT_REMOTE_VERIFY_CONCURRENCY);
        concurrency = std::max<size_t>(1, std::min(concurrency, MAX_VERIFY_CONCURRENCY));
        spdlog::info("downloading {} tarballs ({} at a time)", requests.size(), concurrency);

        // Each module is checked and its tarball deleted as soon as its transfer
        // completes, before the next transfer starts; at most `concurrency`
        // tarballs are on disk at once
        auto on_complete = [&](size_t r, const DownloadResult& download) {
            Job& job = jobs[request_jobs[r]];
            verify_downloaded_job(report, job, download, options.limits);
            release_work_dir(job);
        };
        download_all(requests, concurrency, on_complete);
    }

    for (const auto& job : jobs) {
        release_work_dir(job);
    }

    if (own_scratch && !remove_directory(scratch)) {
        spdlog::debug("failed to clean up {}", scratch);
    }

    // Failures were recorded phase by phase; the index is keyed by name
    std::stable_sort(report.failures.begin(), report.failures.end(),
                     [](const VerifyFailure& a, const VerifyFailure& b) {
                         return a.module < b.module;
                     });

    report.failed = report.failures.size();
    report.ok = report.failed == 0;
    if (!report.ok) {
        spdlog::warn("{} of {} modules failed verification", report.failed, report.checked);
    }
    return report;
}

} // namespace cogmod
