#pragma once

#include "cogmod/errors.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace cogmod {

// ============================================================================
// Extraction Limits
// ============================================================================

struct ExtractLimits {
    uint64_t max_files = 5000;
    uint64_t max_total_bytes = 50ull * 1024 * 1024;
    uint64_t max_single_file_bytes = 20ull * 1024 * 1024;
    uint64_t max_tar_bytes = 100ull * 1024 * 1024;  // decompressed stream size
};

// PAX / GNU longname payloads are buffered; anything bigger is rejected
constexpr uint64_t MAX_ARCHIVE_METADATA_BYTES = 1024 * 1024;

struct ExtractResult {
    bool ok = false;
    Error error;
    std::vector<std::string> entries;  // member paths in archive order
    uint64_t total_bytes = 0;
};

// ============================================================================
// Streaming Tar Extractor
// ============================================================================

// Push parser over a decompressed ustar stream. Every header is validated
// (checksum, magic, typeflag, name, quotas) before any byte of its entry is
// written under dest_root. On failure every file and directory this extractor
// created is removed again.
//
// In scan-only mode nothing is written; the same checks run.
class TarExtractor {
public:
    TarExtractor(std::string dest_root, ExtractLimits limits, bool scan_only = false);
    ~TarExtractor();

    TarExtractor(const TarExtractor&) = delete;
    TarExtractor& operator=(const TarExtractor&) = delete;

    // Returns false once an error has been recorded
    bool feed(const uint8_t* data, size_t len);

    // Signal end of stream. Fails if it ends inside an entry.
    bool finish();

    bool failed() const;
    const Error& error() const;
    const std::vector<std::string>& entries() const;
    uint64_t total_bytes() const;

private:
    struct State;
    std::unique_ptr<State> state_;
};

// Inflate a .tar.gz file chunk by chunk straight into a TarExtractor
ExtractResult extract_tar_gz_file(const std::string& archive_path,
                                  const std::string& dest_root,
                                  const ExtractLimits& limits);

// Validate every member of a .tar.gz without writing anything
ExtractResult scan_tar_gz_file(const std::string& archive_path,
                               const ExtractLimits& limits);

// ============================================================================
// Deterministic Packaging
// ============================================================================

enum class TarEntryType {
    RegularFile,
    Directory,
};

// A tar entry for deterministic packing
struct TarEntry {
    std::string path;           // Relative path within archive
    TarEntryType type = TarEntryType::RegularFile;
    std::vector<uint8_t> data;  // File content (empty for directories)
    bool executable = false;    // True if file should be 0755
};

struct PackResult {
    bool ok = false;
    Error error;
    std::vector<uint8_t> archive_data;  // The complete .tar.gz archive
};

// Create a deterministic gzip-compressed tar archive from entries
//   - Entry ordering: lexicographic by full path, directories before files
//   - Metadata: uid=0, gid=0, uname="", gname="", mtime=0
//   - Permissions: dirs=0755, files=0644 (or 0755 if executable)
//   - Names over 100 bytes use the ustar prefix field, then a PAX path record
//   - Gzip: mtime=0, no filename, OS=255
PackResult create_deterministic_archive(const std::vector<TarEntry>& entries);

struct CollectResult {
    bool ok = false;
    Error error;
    std::vector<TarEntry> entries;
    std::vector<std::string> files;  // regular files, relative to dir_path, sorted
};

// Collect a module directory as entries rooted at "<root_name>/".
// Fails on symlinks; skips .DS_Store.
CollectResult collect_directory_entries(const std::string& dir_path,
                                        const std::string& root_name);

// Relative paths of the regular files under dir_path, sorted bytewise.
// Fails on symlinks; skips .DS_Store.
CollectResult list_module_files(const std::string& dir_path);

// Gzip with a fixed header (mtime 0, OS 255)
std::vector<uint8_t> gzip_compress(const std::vector<uint8_t>& data);

} // namespace cogmod
