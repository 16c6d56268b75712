#include "cogmod/platform.hpp"

#include <algorithm>
#include <chrono>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <random>
#include <system_error>

#ifdef _WIN32
#include <windows.h>
#else
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#endif

namespace cogmod {

namespace fs = std::filesystem;

namespace {

#ifndef _WIN32
bool fsync_fd(int fd) {
#ifdef __APPLE__
    return fcntl(fd, F_FULLFSYNC, 0) == 0;
#else
    return fsync(fd) == 0;
#endif
}

bool fsync_directory(const std::string& dir_path) {
    int dir_fd = open(dir_path.c_str(), O_RDONLY);
    if (dir_fd < 0) return false;

    bool result = fsync_fd(dir_fd);
    close(dir_fd);
    return result;
}
#endif

std::string random_suffix() {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    static const char hex_chars[] = "0123456789abcdef";
    std::string suffix;
    for (int i = 0; i < 8; ++i) {
        suffix += hex_chars[dis(gen)];
    }
    return suffix;
}

} // namespace

AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content) {
    return atomic_write_file(path, std::vector<uint8_t>(content.begin(), content.end()));
}

AtomicWriteResult atomic_write_file(const std::string& path, const std::vector<uint8_t>& content) {
    AtomicWriteResult result;

    std::string dir_path = get_parent_directory(path);
    if (!dir_path.empty() && !create_directories(dir_path)) {
        result.error = "failed to create directory: " + dir_path;
        return result;
    }

    std::string temp_path = path + ".tmp." + random_suffix();

#ifdef _WIN32
    std::ofstream temp_file(temp_path, std::ios::binary);
    if (!temp_file) {
        result.error = "failed to create temp file";
        return result;
    }
    temp_file.write(reinterpret_cast<const char*>(content.data()),
                    static_cast<std::streamsize>(content.size()));
    temp_file.close();
    if (!temp_file) {
        DeleteFileA(temp_path.c_str());
        result.error = "failed to write content";
        return result;
    }
    if (!MoveFileExA(temp_path.c_str(), path.c_str(),
                     MOVEFILE_REPLACE_EXISTING | MOVEFILE_WRITE_THROUGH)) {
        DeleteFileA(temp_path.c_str());
        result.error = "failed to rename temp file";
        return result;
    }
#else
    int fd = open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        result.error = "failed to create temp file: " + std::string(strerror(errno));
        return result;
    }

    size_t offset = 0;
    while (offset < content.size()) {
        ssize_t written = write(fd, content.data() + offset, content.size() - offset);
        if (written < 0) {
            if (errno == EINTR) continue;
            close(fd);
            unlink(temp_path.c_str());
            result.error = "failed to write content: " + std::string(strerror(errno));
            return result;
        }
        offset += static_cast<size_t>(written);
    }

    if (!fsync_fd(fd)) {
        close(fd);
        unlink(temp_path.c_str());
        result.error = "failed to fsync temp file";
        return result;
    }
    close(fd);

    if (rename(temp_path.c_str(), path.c_str()) != 0) {
        unlink(temp_path.c_str());
        result.error = "failed to rename temp file: " + std::string(strerror(errno));
        return result;
    }

    if (!dir_path.empty()) {
        fsync_directory(dir_path);
    }
#endif

    result.ok = true;
    return result;
}

// ============================================================================
// Directory Placement
// ============================================================================

PlaceResult place_directory(const std::string& staged_dir, const std::string& target_dir) {
    PlaceResult result;
    std::error_code ec;

    if (fs::exists(fs::symlink_status(target_dir, ec))) {
        result.status = PlaceStatus::AlreadyExists;
        return result;
    }

    std::string parent = get_parent_directory(target_dir);
    if (!parent.empty() && !create_directories(parent)) {
        result.error = "failed to create directory: " + parent;
        return result;
    }

    fs::rename(staged_dir, target_dir, ec);
    if (ec) {
        result.error = "failed to move " + staged_dir + " to " + target_dir + ": " + ec.message();
        return result;
    }

#ifndef _WIN32
    if (!parent.empty()) {
        fsync_directory(parent);
    }
#endif

    result.status = PlaceStatus::Placed;
    return result;
}

PlaceResult replace_directory(const std::string& staged_dir, const std::string& target_dir,
                              std::string* kept_aside) {
    PlaceResult result;
    std::error_code ec;
    if (kept_aside) kept_aside->clear();

    std::string aside = join_path(get_parent_directory(target_dir),
                                  std::string(REPLACED_DIR_PREFIX) + get_filename(target_dir) +
                                  "-" + random_suffix());
    bool had_target = fs::exists(fs::symlink_status(target_dir, ec));
    if (had_target) {
        fs::rename(target_dir, aside, ec);
        if (ec) {
            result.error = "failed to move existing " + target_dir + " aside: " + ec.message();
            return result;
        }
    }

    auto placed = place_directory(staged_dir, target_dir);
    if (placed.status != PlaceStatus::Placed) {
        if (had_target) {
            std::error_code restore_ec;
            fs::rename(aside, target_dir, restore_ec);
        }
        result.error = placed.status == PlaceStatus::AlreadyExists
            ? "target reappeared while replacing: " + target_dir
            : placed.error;
        return result;
    }

    if (had_target) {
        if (kept_aside) {
            *kept_aside = aside;
        } else {
            fs::remove_all(aside, ec);
        }
    }

    result.status = PlaceStatus::Placed;
    return result;
}

// ============================================================================
// Path Utilities
// ============================================================================

std::string to_portable_path(const std::string& path) {
    std::string result = path;
    std::replace(result.begin(), result.end(), '\\', '/');
    return result;
}

std::string get_parent_directory(const std::string& path) {
    return fs::path(path).parent_path().string();
}

std::string get_filename(const std::string& path) {
    return fs::path(path).filename().string();
}

std::string join_path(const std::string& base, const std::string& rel) {
    fs::path p(base);
    p /= rel;
    return to_portable_path(p.string());
}

bool path_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool is_directory(const std::string& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

bool is_regular_file(const std::string& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

bool is_symlink(const std::string& path) {
    std::error_code ec;
    return fs::is_symlink(path, ec);
}

std::vector<std::string> list_directory(const std::string& path) {
    std::vector<std::string> entries;
    std::error_code ec;
    if (!fs::is_directory(path, ec)) return entries;

    for (fs::directory_iterator it(path, ec), end; !ec && it != end; it.increment(ec)) {
        entries.push_back(it->path().filename().string());
    }
    std::sort(entries.begin(), entries.end());
    return entries;
}

bool create_directories(const std::string& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    return !ec || fs::is_directory(path);
}

bool remove_directory(const std::string& path) {
    std::error_code ec;
    fs::remove_all(path, ec);
    return !ec;
}

bool remove_file(const std::string& path) {
    std::error_code ec;
    return fs::remove(path, ec);
}

bool copy_tree(const std::string& src, const std::string& dst, std::string* error) {
    std::error_code ec;
    if (!fs::is_directory(src, ec)) {
        if (error) *error = "not a directory: " + src;
        return false;
    }
    if (!create_directories(dst)) {
        if (error) *error = "failed to create directory: " + dst;
        return false;
    }

    fs::recursive_directory_iterator it(src, ec), end;
    for (; !ec && it != end; it.increment(ec)) {
        const fs::path& from = it->path();
        fs::path rel = fs::relative(from, src, ec);
        if (ec) break;
        fs::path to = fs::path(dst) / rel;
        auto status = fs::symlink_status(from, ec);
        if (ec) break;
        if (fs::is_symlink(status)) {
            if (error) *error = "refusing to copy symlink: " + from.string();
            return false;
        }
        if (fs::is_directory(status)) {
            fs::create_directories(to, ec);
        } else if (fs::is_regular_file(status)) {
            fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
        } else {
            if (error) *error = "unsupported file type: " + from.string();
            return false;
        }
        if (ec) {
            if (error) *error = "failed to copy " + from.string() + ": " + ec.message();
            return false;
        }
    }
    if (ec) {
        if (error) *error = "failed to walk " + src + ": " + ec.message();
        return false;
    }
    return true;
}

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) return std::nullopt;
    return std::string((std::istreambuf_iterator<char>(file)),
                       std::istreambuf_iterator<char>());
}

std::optional<uint64_t> file_size(const std::string& path) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    if (ec) return std::nullopt;
    return static_cast<uint64_t>(size);
}

std::optional<int64_t> seconds_since_modified(const std::string& path) {
    std::error_code ec;
    auto mtime = fs::last_write_time(path, ec);
    if (ec) return std::nullopt;
    auto age = fs::file_time_type::clock::now() - mtime;
    return std::chrono::duration_cast<std::chrono::seconds>(age).count();
}

std::optional<std::string> make_temp_directory(const std::string& prefix) {
    std::error_code ec;
    fs::path base = fs::temp_directory_path(ec);
    if (ec) return std::nullopt;

    for (int attempt = 0; attempt < 8; ++attempt) {
        fs::path candidate = base / (prefix + generate_uuid());
        if (fs::create_directory(candidate, ec) && !ec) {
            return to_portable_path(candidate.string());
        }
    }
    return std::nullopt;
}

// ============================================================================
// Environment
// ============================================================================

std::optional<std::string> get_env(const std::string& name) {
#ifdef _MSC_VER
    char* val = nullptr;
    size_t len = 0;
    if (_dupenv_s(&val, &len, name.c_str()) == 0 && val != nullptr) {
        std::string result(val);
        free(val);
        return result;
    }
    return std::nullopt;
#else
    const char* val = std::getenv(name.c_str());
    if (val) {
        return std::string(val);
    }
    return std::nullopt;
#endif
}

std::string get_current_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);

    std::tm tm_buf;
#ifdef _WIN32
    gmtime_s(&tm_buf, &time_t_now);
#else
    gmtime_r(&time_t_now, &tm_buf);
#endif

    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_buf);
    return buf;
}

std::string generate_uuid() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dis;

    uint64_t a = dis(gen);
    uint64_t b = dis(gen);

    a = (a & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;  // Version 4
    b = (b & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;  // Variant 1

    char buf[37];
    snprintf(buf, sizeof(buf),
             "%08x-%04x-%04x-%04x-%012llx",
             static_cast<uint32_t>(a >> 32),
             static_cast<uint16_t>((a >> 16) & 0xFFFF),
             static_cast<uint16_t>(a & 0xFFFF),
             static_cast<uint16_t>(b >> 48),
             static_cast<unsigned long long>(b & 0xFFFFFFFFFFFFULL));

    return buf;
}

} // namespace cogmod
