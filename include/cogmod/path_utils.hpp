#pragma once

#include <string>

namespace cogmod {

enum class PathError {
    None,
    Empty,
    ContainsNul,
    AbsoluteNotAllowed,
    ParentSegment,
    EscapesRoot,
};

struct PathResult {
    bool ok;
    std::string path;  // normalized path when ok
    PathError error;
};

// Normalize an archive member name into a relative, slash-separated path.
// - Rejects empty names and NUL bytes
// - Rejects absolute names ("/x", "\x", "C:x")
// - Rejects any ".." segment, even one that would stay inside the root
// - Drops "." and empty segments
PathResult normalize_member_name(const std::string& name);

// Normalize a path relative to a root without following symlinks (string-based).
// - Rejects NUL bytes
// - Rejects absolute relative_path when allow_absolute is false
// - Collapses "." and ".." segments
// - Fails if resulting path would escape root
PathResult normalize_under_root(const std::string& root,
                                const std::string& relative_path,
                                bool allow_absolute = false);

// Lexical containment check on already-joined paths
bool is_lexically_within(const std::string& root, const std::string& candidate);

// Install names are single path components
bool is_safe_module_name(const std::string& name);

const char* path_error_message(PathError error);

} // namespace cogmod
