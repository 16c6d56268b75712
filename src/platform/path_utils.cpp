#include "cogmod/path_utils.hpp"
#include "cogmod/platform.hpp"

#include <cctype>
#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

namespace cogmod {

namespace {

bool contains_nul(const std::string& s) {
    return s.find('\0') != std::string::npos;
}

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> parts;
    std::string current;
    std::istringstream ss(s);
    while (std::getline(ss, current, delim)) {
        parts.push_back(current);
    }
    return parts;
}

std::string join_components(const std::string& root, const std::vector<std::string>& comps) {
    std::filesystem::path p(root);
    for (const auto& c : comps) {
        p /= c;
    }
    return to_portable_path(p.lexically_normal().string());
}

bool has_drive_prefix(const std::string& s) {
    return s.size() >= 2 && std::isalpha(static_cast<unsigned char>(s[0])) && s[1] == ':';
}

} // namespace

PathResult normalize_member_name(const std::string& name) {
    if (name.empty()) {
        return {false, {}, PathError::Empty};
    }
    if (contains_nul(name)) {
        return {false, {}, PathError::ContainsNul};
    }

    std::string portable = to_portable_path(name);
    if (portable[0] == '/' || has_drive_prefix(portable)) {
        return {false, {}, PathError::AbsoluteNotAllowed};
    }

    std::vector<std::string> normalized;
    for (const auto& part : split(portable, '/')) {
        if (part.empty() || part == ".") {
            continue;
        }
        if (part == "..") {
            return {false, {}, PathError::ParentSegment};
        }
        normalized.push_back(part);
    }

    if (normalized.empty()) {
        return {false, {}, PathError::Empty};
    }

    std::string out;
    for (const auto& part : normalized) {
        if (!out.empty()) out += '/';
        out += part;
    }
    return {true, out, PathError::None};
}

PathResult normalize_under_root(const std::string& root,
                                const std::string& relative_path,
                                bool allow_absolute) {
    if (contains_nul(root) || contains_nul(relative_path)) {
        return {false, {}, PathError::ContainsNul};
    }

    std::vector<std::string> components;

    if (!relative_path.empty() && (relative_path[0] == '/' || relative_path[0] == '\\')) {
        if (!allow_absolute) {
            return {false, {}, PathError::AbsoluteNotAllowed};
        }
        auto trimmed = relative_path;
        while (!trimmed.empty() && (trimmed[0] == '/' || trimmed[0] == '\\')) {
            trimmed.erase(trimmed.begin());
        }
        components = split(to_portable_path(trimmed), '/');
    } else {
        components = split(to_portable_path(relative_path), '/');
    }

    std::vector<std::string> normalized;
    for (const auto& part : components) {
        if (part.empty() || part == ".") {
            continue;
        }
        if (part == "..") {
            if (normalized.empty()) {
                return {false, {}, PathError::EscapesRoot};
            }
            normalized.pop_back();
        } else {
            normalized.push_back(part);
        }
    }

    std::string out = join_components(root, normalized);
    if (!is_lexically_within(root, out)) {
        return {false, {}, PathError::EscapesRoot};
    }

    return {true, out, PathError::None};
}

bool is_lexically_within(const std::string& root, const std::string& candidate) {
    auto lex_root = std::filesystem::path(root).lexically_normal();
    auto lex_out = std::filesystem::path(candidate).lexically_normal();

    auto root_it = lex_root.begin();
    auto out_it = lex_out.begin();
    for (; root_it != lex_root.end() && out_it != lex_out.end(); ++root_it, ++out_it) {
        // A trailing separator shows up as an empty final element
        if (root_it->empty()) break;
        if (*root_it != *out_it) {
            return false;
        }
    }
    if (root_it != lex_root.end() && !root_it->empty()) {
        return false;
    }
    for (; out_it != lex_out.end(); ++out_it) {
        if (*out_it == "..") return false;
    }
    return true;
}

bool is_safe_module_name(const std::string& name) {
    if (name.empty() || name == "." || name == "..") return false;
    if (name.find('/') != std::string::npos || name.find('\\') != std::string::npos) return false;
    if (name.find("..") != std::string::npos) return false;
    if (contains_nul(name) || has_drive_prefix(name)) return false;
    return true;
}

const char* path_error_message(PathError error) {
    switch (error) {
        case PathError::None: return "ok";
        case PathError::Empty: return "empty path";
        case PathError::ContainsNul: return "path contains NUL byte";
        case PathError::AbsoluteNotAllowed: return "absolute path not allowed";
        case PathError::ParentSegment: return "path contains '..' segment";
        case PathError::EscapesRoot: return "path escapes destination root";
    }
    return "invalid path";
}

} // namespace cogmod
