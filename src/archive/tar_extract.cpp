#include "cogmod/archive.hpp"
#include "cogmod/path_utils.hpp"
#include "cogmod/platform.hpp"

#include "tar_format.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <optional>

#include <zlib.h>

namespace fs = std::filesystem;

namespace cogmod {

namespace {

constexpr size_t CHUNK_SIZE = 64 * 1024;

bool is_zero_block(const uint8_t* block) {
    for (size_t i = 0; i < tar::BLOCK_SIZE; ++i) {
        if (block[i] != 0) return false;
    }
    return true;
}

// Parse "<len> <key>=<value>\n" records and return the "path" value, if any
bool parse_pax_path(const std::string& data, std::optional<std::string>& path) {
    size_t pos = 0;
    while (pos < data.size()) {
        // Trailing NUL padding from some writers
        if (data[pos] == '\0') break;

        size_t space = data.find(' ', pos);
        if (space == std::string::npos || space == pos) return false;

        uint64_t len = 0;
        for (size_t i = pos; i < space; ++i) {
            char c = data[i];
            if (c < '0' || c > '9') return false;
            len = len * 10 + static_cast<uint64_t>(c - '0');
            if (len > data.size()) return false;
        }
        if (len <= space - pos + 1 || pos + len > data.size()) return false;
        if (data[pos + len - 1] != '\n') return false;

        std::string record = data.substr(space + 1, pos + len - space - 2);
        size_t eq = record.find('=');
        if (eq == std::string::npos) return false;

        if (record.compare(0, eq, "path") == 0 && eq == 4) {
            path = record.substr(eq + 1);
        }
        pos += len;
    }
    return true;
}

} // namespace

// ============================================================================
// Extractor State
// ============================================================================

struct TarExtractor::State {
    enum class Phase {
        Header,
        FileData,
        Metadata,
        Skip,
        Padding,
        End,
    };

    std::string dest_root;
    ExtractLimits limits;
    bool scan_only = false;

    Phase phase = Phase::Header;
    Error error;
    bool failed = false;
    bool finished = false;

    uint8_t header[tar::BLOCK_SIZE] = {};
    size_t header_fill = 0;
    size_t zero_blocks = 0;

    uint64_t remaining = 0;   // data bytes left in the current entry
    uint64_t padding = 0;     // padding bytes after the current entry
    uint64_t stream_bytes = 0;
    uint64_t member_count = 0;
    uint64_t total_bytes = 0;

    // Current regular file
    std::FILE* out = nullptr;
    std::string out_path;
    bool out_executable = false;

    // Current metadata block
    char meta_type = 0;
    std::string meta_buffer;
    std::optional<std::string> pending_path;

    std::vector<std::string> entries;
    std::vector<std::string> created_files;
    std::vector<std::string> created_dirs;

    bool fail(Error err) {
        if (failed) return false;
        failed = true;
        error = std::move(err);
        phase = Phase::End;
        close_output();
        rollback();
        return false;
    }

    void close_output() {
        if (out) {
            std::fclose(out);
            out = nullptr;
        }
    }

    void rollback() {
        if (scan_only) return;
        std::error_code ec;
        for (auto it = created_files.rbegin(); it != created_files.rend(); ++it) {
            fs::remove(*it, ec);
        }
        // Deepest first; a directory we did not create a child in stays empty
        for (auto it = created_dirs.rbegin(); it != created_dirs.rend(); ++it) {
            fs::remove(*it, ec);
        }
        created_files.clear();
        created_dirs.clear();
    }

    // Create every missing directory between dest_root and dir, recording each
    bool make_dirs(const std::string& dir) {
        std::vector<std::string> missing;
        fs::path p(dir);
        std::error_code ec;
        while (!p.empty() && !fs::exists(fs::symlink_status(p, ec))) {
            missing.push_back(p.string());
            auto parent = p.parent_path();
            if (parent == p) break;
            p = parent;
        }
        for (auto it = missing.rbegin(); it != missing.rend(); ++it) {
            if (!fs::create_directory(*it, ec) && ec) {
                return false;
            }
            created_dirs.push_back(*it);
        }
        return is_directory(dir);
    }

    // No component between dest_root and target may be an existing symlink
    bool crosses_symlink(const std::string& relative) const {
        fs::path current(dest_root);
        std::error_code ec;
        for (const auto& part : fs::path(relative)) {
            current /= part;
            auto st = fs::symlink_status(current, ec);
            if (ec) return false;
            if (fs::is_symlink(st)) return true;
        }
        return false;
    }

    bool consume(const uint8_t* data, size_t len);
    bool process_header();
    bool begin_metadata(char type, uint64_t size);
    bool finish_metadata();
    bool begin_entry(char type, const std::string& raw_name, uint64_t size, uint64_t mode);
    void end_entry_data();
};

bool TarExtractor::State::consume(const uint8_t* data, size_t len) {
    size_t pos = 0;
    while (pos < len && !failed) {
        size_t avail = len - pos;
        switch (phase) {
            case Phase::Header: {
                size_t n = std::min(avail, tar::BLOCK_SIZE - header_fill);
                std::memcpy(header + header_fill, data + pos, n);
                header_fill += n;
                pos += n;
                if (header_fill == tar::BLOCK_SIZE) {
                    header_fill = 0;
                    if (!process_header()) return false;
                }
                break;
            }
            case Phase::FileData: {
                size_t n = static_cast<size_t>(std::min<uint64_t>(avail, remaining));
                if (out && std::fwrite(data + pos, 1, n, out) != n) {
                    return fail(make_path_error(ErrorKind::IoError,
                                                std::string("write failed: ") + std::strerror(errno),
                                                out_path));
                }
                remaining -= n;
                pos += n;
                if (remaining == 0) end_entry_data();
                break;
            }
            case Phase::Metadata: {
                size_t n = static_cast<size_t>(std::min<uint64_t>(avail, remaining));
                meta_buffer.append(reinterpret_cast<const char*>(data + pos), n);
                remaining -= n;
                pos += n;
                if (remaining == 0 && !finish_metadata()) return false;
                break;
            }
            case Phase::Skip: {
                size_t n = static_cast<size_t>(std::min<uint64_t>(avail, remaining));
                remaining -= n;
                pos += n;
                if (remaining == 0) phase = padding > 0 ? Phase::Padding : Phase::Header;
                break;
            }
            case Phase::Padding: {
                size_t n = static_cast<size_t>(std::min<uint64_t>(avail, padding));
                padding -= n;
                pos += n;
                if (padding == 0) phase = Phase::Header;
                break;
            }
            case Phase::End:
                // Anything after the end-of-archive marker is ignored
                return true;
        }
    }
    return !failed;
}

bool TarExtractor::State::process_header() {
    if (is_zero_block(header)) {
        if (pending_path) {
            return fail(make_error(ErrorKind::MalformedArchive,
                                   "extended header not followed by an entry"));
        }
        if (++zero_blocks >= 2) phase = Phase::End;
        return true;
    }
    zero_blocks = 0;

    const auto* h = reinterpret_cast<const tar::Header*>(header);

    auto stored = tar::parse_octal(h->chksum, tar::CHKSUM_SIZE);
    if (!stored) {
        return fail(make_error(ErrorKind::MalformedArchive, "invalid header checksum field"));
    }
    bool checksum_ok = *stored == tar::unsigned_checksum(header) ||
                       static_cast<int64_t>(*stored) == tar::signed_checksum(header);
    if (!checksum_ok) {
        return fail(make_error(ErrorKind::MalformedArchive, "tar header checksum mismatch"));
    }

    if (std::memcmp(h->magic, "ustar", 5) != 0) {
        return fail(make_error(ErrorKind::MalformedArchive, "not a ustar archive"));
    }

    // Base-256 sizes (high bit set) fail the strict octal parse
    auto size = tar::parse_octal(h->size, tar::SIZE_SIZE);
    if (!size) {
        return fail(make_error(ErrorKind::MalformedArchive, "invalid entry size field"));
    }
    uint64_t mode = tar::parse_octal(h->mode, tar::MODE_SIZE).value_or(0644);

    std::string name;
    std::string prefix = tar::field_string(h->prefix, tar::PREFIX_SIZE);
    if (!prefix.empty()) {
        name = prefix + "/";
    }
    name += tar::field_string(h->name, tar::NAME_SIZE);

    char type = h->typeflag;
    switch (type) {
        case tar::PAX_EXTENDED:
        case tar::GNU_LONGNAME:
        case tar::PAX_GLOBAL:
            return begin_metadata(type, *size);
        case tar::LNKTYPE:
            return fail(make_path_error(ErrorKind::UnsafeArchiveEntry,
                                        "hard link entries are not allowed", name));
        case tar::SYMTYPE:
            return fail(make_path_error(ErrorKind::UnsafeArchiveEntry,
                                        "symbolic link entries are not allowed", name));
        case tar::REGTYPE:
        case tar::AREGTYPE:
        case tar::DIRTYPE:
            break;
        default:
            return fail(make_path_error(ErrorKind::UnsafeArchiveEntry,
                                        std::string("unsupported entry type '") + type + "'",
                                        name));
    }

    if (pending_path) {
        name = *pending_path;
        pending_path.reset();
    }
    return begin_entry(type, name, *size, mode);
}

bool TarExtractor::State::begin_metadata(char type, uint64_t size) {
    if (size > MAX_ARCHIVE_METADATA_BYTES) {
        return fail(make_error(ErrorKind::ArchiveQuotaExceeded,
                               "extended header exceeds " +
                               std::to_string(MAX_ARCHIVE_METADATA_BYTES) + " bytes"));
    }
    meta_type = type;
    meta_buffer.clear();
    remaining = size;
    padding = tar::padded_size(size) - size;

    if (type == tar::PAX_GLOBAL) {
        // Global records carry nothing we honor
        phase = size > 0 ? Phase::Skip : Phase::Header;
        return true;
    }
    if (size == 0) return finish_metadata();
    phase = Phase::Metadata;
    return true;
}

bool TarExtractor::State::finish_metadata() {
    if (meta_type == tar::GNU_LONGNAME) {
        pending_path = std::string(meta_buffer.c_str());
    } else if (!parse_pax_path(meta_buffer, pending_path)) {
        return fail(make_error(ErrorKind::MalformedArchive, "malformed pax extended header"));
    }
    meta_buffer.clear();
    phase = padding > 0 ? Phase::Padding : Phase::Header;
    return true;
}

bool TarExtractor::State::begin_entry(char type, const std::string& raw_name,
                                      uint64_t size, uint64_t mode) {
    bool is_dir = type == tar::DIRTYPE;

    auto normalized = normalize_member_name(raw_name);
    if (!normalized.ok) {
        switch (normalized.error) {
            case PathError::Empty:
                if (is_dir) {
                    // "./" style root entries carry no content
                    remaining = size;
                    padding = tar::padded_size(size) - size;
                    phase = size > 0 ? Phase::Skip : Phase::Header;
                    return true;
                }
                return fail(make_path_error(ErrorKind::UnsafeArchiveEntry,
                                            "entry has an empty name", raw_name));
            case PathError::ContainsNul:
                return fail(make_path_error(ErrorKind::UnsafeArchiveEntry,
                                            path_error_message(normalized.error), raw_name));
            default:
                return fail(make_path_error(ErrorKind::PathTraversal,
                                            path_error_message(normalized.error), raw_name));
        }
    }
    const std::string& rel = normalized.path;

    std::string full = join_path(dest_root, rel);
    if (!is_lexically_within(dest_root, full)) {
        return fail(make_path_error(ErrorKind::PathTraversal,
                                    "entry resolves outside the destination", raw_name));
    }

    if (++member_count > limits.max_files) {
        return fail(make_path_error(ErrorKind::ArchiveQuotaExceeded,
                                    "archive has more than " + std::to_string(limits.max_files) +
                                    " entries", rel));
    }

    if (!is_dir) {
        if (size > limits.max_single_file_bytes) {
            return fail(make_path_error(ErrorKind::ArchiveQuotaExceeded,
                                        "entry size " + std::to_string(size) +
                                        " exceeds per-file limit of " +
                                        std::to_string(limits.max_single_file_bytes),
                                        rel));
        }
        if (total_bytes + size > limits.max_total_bytes) {
            return fail(make_path_error(ErrorKind::ArchiveQuotaExceeded,
                                        "archive content exceeds total limit of " +
                                        std::to_string(limits.max_total_bytes) + " bytes",
                                        rel));
        }
        total_bytes += size;
    }

    if (!scan_only) {
        if (crosses_symlink(rel)) {
            return fail(make_path_error(ErrorKind::UnsafeArchiveEntry,
                                        "entry path crosses a symbolic link", rel));
        }

        std::string dir = is_dir ? full : get_parent_directory(full);
        if (!make_dirs(dir)) {
            return fail(make_path_error(ErrorKind::IoError, "failed to create directory", dir));
        }

        if (!is_dir) {
            if (is_directory(full)) {
                return fail(make_path_error(ErrorKind::MalformedArchive,
                                            "file entry collides with a directory", rel));
            }
            bool existed = path_exists(full);
            out = std::fopen(full.c_str(), "wb");
            if (!out) {
                return fail(make_path_error(ErrorKind::IoError,
                                            std::string("failed to create file: ") +
                                            std::strerror(errno),
                                            full));
            }
            if (!existed) created_files.push_back(full);
            out_path = full;
            out_executable = (mode & 0111) != 0;
        }
    }

    entries.push_back(rel);

    remaining = size;
    padding = tar::padded_size(size) - size;
    if (is_dir) {
        phase = size > 0 ? Phase::Skip : Phase::Header;
    } else if (size == 0) {
        end_entry_data();
    } else {
        phase = Phase::FileData;
    }
    return true;
}

void TarExtractor::State::end_entry_data() {
    if (out) {
        bool closed = std::fclose(out) == 0;
        out = nullptr;
        if (!closed) {
            fail(make_path_error(ErrorKind::IoError, "failed to close file", out_path));
            return;
        }
        std::error_code ec;
        if (out_executable) {
            fs::permissions(out_path,
                            fs::perms::owner_all | fs::perms::group_read |
                            fs::perms::group_exec | fs::perms::others_read |
                            fs::perms::others_exec, ec);
        } else {
            fs::permissions(out_path,
                            fs::perms::owner_read | fs::perms::owner_write |
                            fs::perms::group_read | fs::perms::others_read, ec);
        }
    }
    phase = padding > 0 ? Phase::Padding : Phase::Header;
}

// ============================================================================
// TarExtractor
// ============================================================================

TarExtractor::TarExtractor(std::string dest_root, ExtractLimits limits, bool scan_only)
    : state_(std::make_unique<State>()) {
    state_->dest_root = fs::path(dest_root).lexically_normal().string();
    state_->limits = limits;
    state_->scan_only = scan_only;

    if (!scan_only && !state_->make_dirs(state_->dest_root)) {
        state_->fail(make_path_error(ErrorKind::IoError,
                                     "failed to create destination directory",
                                     state_->dest_root));
    }
}

TarExtractor::~TarExtractor() {
    // An extraction that never finished leaves nothing behind
    if (!state_->finished && !state_->failed) {
        state_->close_output();
        state_->rollback();
    }
}

bool TarExtractor::feed(const uint8_t* data, size_t len) {
    if (state_->failed) return false;
    if (state_->finished) return true;

    state_->stream_bytes += len;
    if (state_->stream_bytes > state_->limits.max_tar_bytes) {
        return state_->fail(make_error(ErrorKind::ArchiveQuotaExceeded,
                                       "decompressed archive exceeds " +
                                       std::to_string(state_->limits.max_tar_bytes) + " bytes"));
    }
    return state_->consume(data, len);
}

bool TarExtractor::finish() {
    if (state_->failed) return false;
    if (state_->finished) return true;

    using Phase = State::Phase;
    bool at_boundary = state_->phase == Phase::End ||
                       (state_->phase == Phase::Header && state_->header_fill == 0);
    if (!at_boundary || state_->pending_path) {
        return state_->fail(make_error(ErrorKind::MalformedArchive,
                                       "archive ends in the middle of an entry"));
    }
    state_->finished = true;
    return true;
}

bool TarExtractor::failed() const {
    return state_->failed;
}

const Error& TarExtractor::error() const {
    return state_->error;
}

const std::vector<std::string>& TarExtractor::entries() const {
    return state_->entries;
}

uint64_t TarExtractor::total_bytes() const {
    return state_->total_bytes;
}

// ============================================================================
// Gzip Streaming
// ============================================================================

namespace {

// RAII wrapper for an inflate stream; accepts concatenated gzip members
class GzipInflater {
public:
    GzipInflater() {
        std::memset(&strm_, 0, sizeof(strm_));
        ok_ = inflateInit2(&strm_, 16 + MAX_WBITS) == Z_OK;
    }
    ~GzipInflater() {
        if (ok_) inflateEnd(&strm_);
    }

    GzipInflater(const GzipInflater&) = delete;
    GzipInflater& operator=(const GzipInflater&) = delete;

    bool ok() const { return ok_; }
    bool at_member_end() const { return member_done_; }

    // Inflate one input chunk, handing every output block to sink
    template <typename Sink>
    bool inflate_chunk(const uint8_t* data, size_t len, Sink&& sink, std::string& error) {
        strm_.next_in = const_cast<Bytef*>(data);
        strm_.avail_in = static_cast<uInt>(len);

        while (strm_.avail_in > 0) {
            if (member_done_) {
                if (inflateReset(&strm_) != Z_OK) {
                    error = "failed to reset gzip stream";
                    return false;
                }
                member_done_ = false;
            }

            strm_.next_out = out_;
            strm_.avail_out = sizeof(out_);
            int ret = inflate(&strm_, Z_NO_FLUSH);
            if (ret != Z_OK && ret != Z_STREAM_END && ret != Z_BUF_ERROR) {
                error = strm_.msg ? strm_.msg : "corrupt gzip stream";
                return false;
            }

            size_t produced = sizeof(out_) - strm_.avail_out;
            if (produced > 0 && !sink(out_, produced)) return false;

            if (ret == Z_STREAM_END) {
                member_done_ = true;
            } else if (ret == Z_BUF_ERROR && produced == 0) {
                break;
            }
        }
        return true;
    }

private:
    z_stream strm_;
    bool ok_ = false;
    bool member_done_ = false;
    uint8_t out_[CHUNK_SIZE];
};

// Pull compressed chunks from reader and stream them through extractor
template <typename Reader>
ExtractResult run_gzip_extraction(Reader&& reader, TarExtractor& extractor) {
    ExtractResult result;

    auto gz = std::make_unique<GzipInflater>();
    if (!gz->ok()) {
        result.error = make_error(ErrorKind::IoError, "failed to initialize zlib");
        return result;
    }

    auto sink = [&extractor](const uint8_t* data, size_t len) {
        return extractor.feed(data, len);
    };

    std::vector<uint8_t> in(CHUNK_SIZE);
    bool saw_input = false;
    for (;;) {
        size_t n = 0;
        if (!reader(in.data(), in.size(), n, result.error)) {
            return result;
        }
        if (n == 0) break;
        saw_input = true;

        std::string zerror;
        if (!gz->inflate_chunk(in.data(), n, sink, zerror)) {
            if (extractor.failed()) {
                result.error = extractor.error();
            } else {
                result.error = make_error(ErrorKind::MalformedArchive,
                                          "invalid gzip data: " + zerror);
            }
            // The extractor rolls back when the caller drops it unfinished
            return result;
        }
    }

    if (!saw_input || !gz->at_member_end()) {
        result.error = make_error(ErrorKind::MalformedArchive,
                                  saw_input ? "truncated gzip stream" : "empty archive");
        return result;
    }

    if (!extractor.finish()) {
        result.error = extractor.error();
        return result;
    }

    result.ok = true;
    result.entries = extractor.entries();
    result.total_bytes = extractor.total_bytes();
    return result;
}

ExtractResult extract_gz_from_file(const std::string& archive_path,
                                   const std::string& dest_root,
                                   const ExtractLimits& limits,
                                   bool scan_only) {
    std::ifstream file(archive_path, std::ios::binary);
    if (!file) {
        ExtractResult result;
        result.error = make_path_error(ErrorKind::IoError, "failed to open archive", archive_path);
        return result;
    }

    TarExtractor extractor(dest_root, limits, scan_only);
    if (extractor.failed()) {
        ExtractResult result;
        result.error = extractor.error();
        return result;
    }

    auto reader = [&file, &archive_path](uint8_t* buf, size_t cap, size_t& n, Error& error) {
        file.read(reinterpret_cast<char*>(buf), static_cast<std::streamsize>(cap));
        if (file.bad()) {
            error = make_path_error(ErrorKind::IoError, "failed to read archive", archive_path);
            return false;
        }
        n = static_cast<size_t>(file.gcount());
        return true;
    };
    return run_gzip_extraction(reader, extractor);
}

} // namespace

// ============================================================================
// Public API
// ============================================================================

ExtractResult extract_tar_gz_file(const std::string& archive_path,
                                  const std::string& dest_root,
                                  const ExtractLimits& limits) {
    return extract_gz_from_file(archive_path, dest_root, limits, false);
}

ExtractResult scan_tar_gz_file(const std::string& archive_path,
                               const ExtractLimits& limits) {
    // Root only anchors the lexical containment check; nothing is written
    return extract_gz_from_file(archive_path, "/nonexistent-scan-root", limits, true);
}

} // namespace cogmod
