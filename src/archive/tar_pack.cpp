#include "cogmod/archive.hpp"
#include "cogmod/path_utils.hpp"
#include "cogmod/platform.hpp"

#include "tar_format.hpp"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <tuple>

#include <zlib.h>

namespace fs = std::filesystem;

namespace cogmod {

namespace {

// ============================================================================
// Header Construction
// ============================================================================

void finalize_checksum(tar::Header& header) {
    uint32_t checksum = tar::unsigned_checksum(reinterpret_cast<const uint8_t*>(&header));

    // 6 octal digits + NUL + space
    char chksum_str[8];
    std::snprintf(chksum_str, sizeof(chksum_str), "%06o", checksum);
    std::memcpy(header.chksum, chksum_str, 6);
    header.chksum[6] = '\0';
    header.chksum[7] = ' ';
}

tar::Header blank_header(char typeflag, uint32_t mode, uint64_t size) {
    tar::Header header;
    std::memset(&header, 0, sizeof(header));

    tar::write_octal(header.mode, tar::MODE_SIZE, mode);
    tar::write_octal(header.uid, tar::UID_SIZE, 0);
    tar::write_octal(header.gid, tar::GID_SIZE, 0);
    tar::write_octal(header.size, tar::SIZE_SIZE, size);
    tar::write_octal(header.mtime, tar::MTIME_SIZE, 0);
    header.typeflag = typeflag;

    std::memcpy(header.magic, "ustar", 5);
    header.magic[5] = '\0';
    header.version[0] = '0';
    header.version[1] = '0';
    // uname/gname stay empty
    return header;
}

// Split path into ustar prefix/name; false when no split fits
bool split_ustar_path(const std::string& path, std::string& prefix, std::string& name) {
    if (path.size() <= tar::NAME_SIZE) {
        prefix.clear();
        name = path;
        return true;
    }
    for (size_t pos = path.find('/'); pos != std::string::npos; pos = path.find('/', pos + 1)) {
        if (pos > tar::PREFIX_SIZE) break;
        if (path.size() - pos - 1 <= tar::NAME_SIZE && pos > 0) {
            prefix = path.substr(0, pos);
            name = path.substr(pos + 1);
            return !name.empty();
        }
    }
    return false;
}

std::string pax_record(const std::string& key, const std::string& value) {
    // The length prefix counts itself
    std::string body = " " + key + "=" + value + "\n";
    size_t len = body.size() + 1;
    while (std::to_string(len).size() + body.size() != len) {
        len = std::to_string(len).size() + body.size();
    }
    return std::to_string(len) + body;
}

void append_block(std::vector<uint8_t>& out, const tar::Header& header) {
    const uint8_t* bytes = reinterpret_cast<const uint8_t*>(&header);
    out.insert(out.end(), bytes, bytes + tar::BLOCK_SIZE);
}

void append_padded(std::vector<uint8_t>& out, const uint8_t* data, size_t len) {
    out.insert(out.end(), data, data + len);
    out.insert(out.end(), tar::padded_size(len) - len, 0);
}

void append_entry(std::vector<uint8_t>& out, const TarEntry& entry, size_t& pax_counter) {
    bool is_dir = entry.type == TarEntryType::Directory;

    std::string path = entry.path;
    if (is_dir && !path.empty() && path.back() != '/') {
        path += '/';
    }

    uint32_t mode = is_dir ? 0755 : (entry.executable ? 0755 : 0644);
    uint64_t size = is_dir ? 0 : entry.data.size();
    tar::Header header = blank_header(is_dir ? tar::DIRTYPE : tar::REGTYPE, mode, size);

    std::string prefix;
    std::string name;
    if (split_ustar_path(path, prefix, name)) {
        std::memcpy(header.name, name.data(), name.size());
        std::memcpy(header.prefix, prefix.data(), prefix.size());
    } else {
        // PAX 'x' record carries the real path; the ustar name is a stand-in
        std::string record = pax_record("path", path);
        char pax_name[32];
        std::snprintf(pax_name, sizeof(pax_name), "PaxHeaders/%06zu", pax_counter++);

        tar::Header pax = blank_header(tar::PAX_EXTENDED, 0644, record.size());
        std::memcpy(pax.name, pax_name, std::strlen(pax_name));
        finalize_checksum(pax);
        append_block(out, pax);
        append_padded(out, reinterpret_cast<const uint8_t*>(record.data()), record.size());

        std::string stand_in = fs::path(entry.path).filename().string();
        stand_in = stand_in.substr(0, tar::NAME_SIZE - 1);
        std::memcpy(header.name, stand_in.data(), stand_in.size());
    }

    finalize_checksum(header);
    append_block(out, header);

    if (!is_dir && !entry.data.empty()) {
        append_padded(out, entry.data.data(), entry.data.size());
    }
}

// ============================================================================
// Entry Sorting for Deterministic Output
// ============================================================================

// Ordered by parent prefix, then directories before files, then full path
bool compare_entries(const TarEntry& a, const TarEntry& b) {
    auto key = [](const TarEntry& e) {
        std::string path = e.path;
        while (!path.empty() && path.back() == '/') path.pop_back();
        size_t slash = path.rfind('/');
        std::string prefix = (slash != std::string::npos) ? path.substr(0, slash + 1) : "";
        int rank = e.type == TarEntryType::Directory ? 0 : 1;
        return std::make_tuple(prefix, rank, path);
    };
    return key(a) < key(b);
}

bool read_binary(const fs::path& path, std::vector<uint8_t>& data) {
    std::ifstream file(path, std::ios::binary);
    if (!file) return false;
    data.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    return !file.bad();
}

bool is_ignored(const fs::path& path) {
    return path.filename() == ".DS_Store";
}

// Walk dir_path; directories and regular files are reported relative to it
template <typename Visitor>
bool walk_module_tree(const std::string& dir_path, Error& error, Visitor&& visit) {
    std::error_code ec;
    if (!fs::is_directory(fs::symlink_status(dir_path, ec))) {
        error = make_path_error(ErrorKind::IoError, "directory not found", dir_path);
        return false;
    }

    fs::recursive_directory_iterator it(dir_path, ec);
    if (ec) {
        error = make_path_error(ErrorKind::IoError, "failed to read directory: " + ec.message(),
                                dir_path);
        return false;
    }

    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            error = make_path_error(ErrorKind::IoError, "failed to read directory: " + ec.message(),
                                    dir_path);
            return false;
        }
        const fs::path& entry_path = it->path();
        if (is_ignored(entry_path)) continue;

        fs::path rel = entry_path.lexically_relative(dir_path);
        std::string rel_str = to_portable_path(rel.string());

        auto st = it->symlink_status(ec);
        if (ec) {
            error = make_path_error(ErrorKind::IoError, "failed to stat file", rel_str);
            return false;
        }
        if (fs::is_symlink(st)) {
            error = make_path_error(ErrorKind::UnsafeArchiveEntry,
                                    "symbolic links are not permitted", rel_str);
            return false;
        }
        if (fs::is_directory(st)) {
            if (!visit(entry_path, rel_str, true, st)) return false;
        } else if (fs::is_regular_file(st)) {
            if (!visit(entry_path, rel_str, false, st)) return false;
        } else {
            error = make_path_error(ErrorKind::UnsafeArchiveEntry,
                                    "unsupported file type", rel_str);
            return false;
        }
    }
    return true;
}

} // namespace

// ============================================================================
// Gzip Compression
// ============================================================================

std::vector<uint8_t> gzip_compress(const std::vector<uint8_t>& data) {
    std::vector<uint8_t> result;

    // Fixed gzip header: no name, mtime 0, OS 255
    result.push_back(0x1f);  // Magic 1
    result.push_back(0x8b);  // Magic 2
    result.push_back(0x08);  // Compression method: deflate
    result.push_back(0x00);  // Flags
    result.push_back(0x00);  // mtime[0]
    result.push_back(0x00);  // mtime[1]
    result.push_back(0x00);  // mtime[2]
    result.push_back(0x00);  // mtime[3]
    result.push_back(0x00);  // Extra flags
    result.push_back(0xff);  // OS = 255 (unknown)

    z_stream strm;
    std::memset(&strm, 0, sizeof(strm));

    // Raw deflate (negative window bits)
    if (deflateInit2(&strm, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -15, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        return {};
    }

    strm.next_in = const_cast<Bytef*>(data.data());
    strm.avail_in = static_cast<uInt>(data.size());

    std::vector<uint8_t> compressed;
    compressed.resize(deflateBound(&strm, static_cast<uLong>(data.size())));

    strm.next_out = compressed.data();
    strm.avail_out = static_cast<uInt>(compressed.size());

    int ret = deflate(&strm, Z_FINISH);
    deflateEnd(&strm);

    if (ret != Z_STREAM_END) {
        return {};
    }

    compressed.resize(strm.total_out);
    result.insert(result.end(), compressed.begin(), compressed.end());

    // Trailer: CRC32 + original size
    uint32_t crc = static_cast<uint32_t>(crc32(0, data.data(), static_cast<uInt>(data.size())));
    result.push_back(crc & 0xff);
    result.push_back((crc >> 8) & 0xff);
    result.push_back((crc >> 16) & 0xff);
    result.push_back((crc >> 24) & 0xff);

    uint32_t size = static_cast<uint32_t>(data.size());
    result.push_back(size & 0xff);
    result.push_back((size >> 8) & 0xff);
    result.push_back((size >> 16) & 0xff);
    result.push_back((size >> 24) & 0xff);

    return result;
}

// ============================================================================
// Public API Implementation
// ============================================================================

PackResult create_deterministic_archive(const std::vector<TarEntry>& entries) {
    PackResult result;

    for (const auto& entry : entries) {
        if (!normalize_member_name(entry.path).ok) {
            result.error = make_path_error(ErrorKind::UnsafeArchiveEntry,
                                           "invalid archive member name", entry.path);
            return result;
        }
    }

    std::vector<TarEntry> sorted_entries = entries;
    std::sort(sorted_entries.begin(), sorted_entries.end(), compare_entries);

    std::vector<uint8_t> tar_data;
    size_t pax_counter = 0;
    for (const auto& entry : sorted_entries) {
        append_entry(tar_data, entry, pax_counter);
    }

    // Two empty blocks mark end of archive
    tar_data.insert(tar_data.end(), tar::BLOCK_SIZE * 2, 0);

    result.archive_data = gzip_compress(tar_data);
    if (result.archive_data.empty()) {
        result.error = make_error(ErrorKind::IoError, "gzip compression failed");
        return result;
    }

    result.ok = true;
    return result;
}

CollectResult collect_directory_entries(const std::string& dir_path,
                                        const std::string& root_name) {
    CollectResult result;

    TarEntry root;
    root.path = root_name;
    root.type = TarEntryType::Directory;
    result.entries.push_back(std::move(root));

    bool ok = walk_module_tree(dir_path, result.error,
        [&](const fs::path& full, const std::string& rel, bool is_dir, const fs::file_status& st) {
            TarEntry entry;
            entry.path = root_name + "/" + rel;
            if (is_dir) {
                entry.type = TarEntryType::Directory;
            } else {
                entry.type = TarEntryType::RegularFile;
                if (!read_binary(full, entry.data)) {
                    result.error = make_path_error(ErrorKind::IoError, "failed to read file", rel);
                    return false;
                }
                auto perms = st.permissions();
                entry.executable = (perms & fs::perms::owner_exec) != fs::perms::none ||
                                   (perms & fs::perms::group_exec) != fs::perms::none ||
                                   (perms & fs::perms::others_exec) != fs::perms::none;
                result.files.push_back(rel);
            }
            result.entries.push_back(std::move(entry));
            return true;
        });
    if (!ok) {
        result.entries.clear();
        result.files.clear();
        return result;
    }

    std::sort(result.files.begin(), result.files.end());
    result.ok = true;
    return result;
}

CollectResult list_module_files(const std::string& dir_path) {
    CollectResult result;

    bool ok = walk_module_tree(dir_path, result.error,
        [&](const fs::path&, const std::string& rel, bool is_dir, const fs::file_status&) {
            if (!is_dir) result.files.push_back(rel);
            return true;
        });
    if (!ok) {
        result.files.clear();
        return result;
    }

    std::sort(result.files.begin(), result.files.end());
    result.ok = true;
    return result;
}

} // namespace cogmod
