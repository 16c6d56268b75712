#pragma once

#include <optional>
#include <string>
#include <vector>
#include <cstdint>

namespace cogmod {

// ============================================================================
// Atomic File Operations
// ============================================================================

struct AtomicWriteResult {
    bool ok = false;
    std::string error;
};

// Write content atomically using temp file + fsync + rename + fsync(dir)
AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content);
AtomicWriteResult atomic_write_file(const std::string& path, const std::vector<uint8_t>& content);

// ============================================================================
// Directory Placement
// ============================================================================

enum class PlaceStatus {
    Placed,
    AlreadyExists,  // target exists; nothing was moved
    Failed,
};

struct PlaceResult {
    PlaceStatus status = PlaceStatus::Failed;
    std::string error;
};

// Move a fully prepared directory to target. Never overwrites.
PlaceResult place_directory(const std::string& staged_dir, const std::string& target_dir);

// Prefix of the sibling an existing tree is renamed to while it is replaced
constexpr const char* REPLACED_DIR_PREFIX = ".old-";

// Swap staged_dir in for an existing target_dir. The old tree is renamed aside
// to "<parent>/.old-<name>-<suffix>" first. It is deleted once the new one is
// in place, unless kept_aside is given: then the caller owns it and receives
// its path (empty when there was no old tree).
PlaceResult replace_directory(const std::string& staged_dir, const std::string& target_dir,
                              std::string* kept_aside = nullptr);

// ============================================================================
// Path Utilities
// ============================================================================

// Convert a path to use forward slashes
std::string to_portable_path(const std::string& path);

std::string get_parent_directory(const std::string& path);
std::string get_filename(const std::string& path);
std::string join_path(const std::string& base, const std::string& rel);

bool path_exists(const std::string& path);
bool is_directory(const std::string& path);
bool is_regular_file(const std::string& path);
bool is_symlink(const std::string& path);

// Entry names (not full paths), sorted
std::vector<std::string> list_directory(const std::string& path);

bool create_directories(const std::string& path);
bool remove_directory(const std::string& path);
bool remove_file(const std::string& path);

// Recursive copy of regular files and directories; symlinks are refused
bool copy_tree(const std::string& src, const std::string& dst, std::string* error = nullptr);

std::optional<std::string> read_file(const std::string& path);
std::optional<uint64_t> file_size(const std::string& path);

// Seconds since the last modification; nullopt if the path cannot be read
std::optional<int64_t> seconds_since_modified(const std::string& path);

// Create a unique directory under the system temp dir
std::optional<std::string> make_temp_directory(const std::string& prefix);

// ============================================================================
// Environment
// ============================================================================

std::optional<std::string> get_env(const std::string& name);

// Get current timestamp as RFC3339 string
std::string get_current_timestamp();

// Generate a UUID string
std::string generate_uuid();

} // namespace cogmod
