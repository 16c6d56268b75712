#include "cogmod/module_ref.hpp"

#include <cctype>
#include <vector>

namespace cogmod {

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.rfind(prefix, 0) == 0;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> parts;
    size_t start = 0;
    for (;;) {
        size_t pos = s.find(delim, start);
        parts.push_back(s.substr(start, pos - start));
        if (pos == std::string::npos) break;
        start = pos + 1;
    }
    return parts;
}

// owner, repo and registry names: [A-Za-z0-9_.-]+, not "." or ".."
bool is_name_token(const std::string& s) {
    if (s.empty() || s == "." || s == "..") return false;
    for (char c : s) {
        bool ok = std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.' || c == '-';
        if (!ok) return false;
    }
    return true;
}

// Git refs and versions: no whitespace, no "..", no leading '/' or '-'
bool is_ref_token(const std::string& s) {
    if (s.empty() || s.find("..") != std::string::npos) return false;
    if (s.front() == '/' || s.front() == '-' || s.back() == '/') return false;
    for (char c : s) {
        bool ok = std::isalnum(static_cast<unsigned char>(c)) ||
                  c == '_' || c == '.' || c == '-' || c == '/' || c == '+';
        if (!ok) return false;
    }
    return true;
}

bool is_subpath(const std::vector<std::string>& segments) {
    for (const auto& seg : segments) {
        if (seg.empty() || seg == "." || seg == "..") return false;
        for (char c : seg) {
            if (c == '\\' || c == '\0' || c == ':' ||
                std::isspace(static_cast<unsigned char>(c))) {
                return false;
            }
        }
    }
    return true;
}

std::string join(const std::vector<std::string>& parts, size_t from) {
    std::string out;
    for (size_t i = from; i < parts.size(); ++i) {
        if (!out.empty()) out += '/';
        out += parts[i];
    }
    return out;
}

std::string strip_git_suffix(const std::string& repo) {
    return ends_with(repo, ".git") ? repo.substr(0, repo.size() - 4) : repo;
}

ReferenceParseResult invalid(const std::string& input, const std::string& why) {
    ReferenceParseResult result;
    result.error = make_error(ErrorKind::InvalidReference,
                              "invalid module reference '" + input + "': " + why);
    return result;
}

// owner/repo[/path][@ref]
ReferenceParseResult parse_shorthand(const std::string& raw, const std::string& body) {
    std::string path_part = body;
    std::string ref;
    size_t at = body.find('@');
    if (at != std::string::npos) {
        path_part = body.substr(0, at);
        ref = body.substr(at + 1);
        if (!is_ref_token(ref)) return invalid(raw, "malformed ref");
    }

    auto parts = split(path_part, '/');
    if (parts.size() < 2) return invalid(raw, "expected owner/repo");
    std::string owner = parts[0];
    std::string repo = strip_git_suffix(parts[1]);
    if (!is_name_token(owner) || !is_name_token(repo)) {
        return invalid(raw, "malformed owner/repo");
    }
    std::vector<std::string> sub(parts.begin() + 2, parts.end());
    if (!is_subpath(sub)) return invalid(raw, "malformed module path");

    ReferenceParseResult result;
    result.reference.kind = ReferenceKind::RepositoryShorthand;
    result.reference.raw = raw;
    result.reference.repository.owner = owner;
    result.reference.repository.repo = repo;
    result.reference.repository.subpath = join(parts, 2);
    result.reference.repository.ref = ref;
    result.ok = true;
    return result;
}

// [http(s)://][www.]github.com/owner/repo[.git][/tree/<ref>[/path]]
ReferenceParseResult parse_repository_url(const std::string& raw) {
    std::string rest = raw;
    for (const char* scheme : {"https://", "http://"}) {
        if (starts_with(rest, scheme)) {
            rest = rest.substr(std::string(scheme).size());
            break;
        }
    }
    if (starts_with(rest, "www.")) rest = rest.substr(4);

    // Drop query and fragment
    size_t cut = rest.find_first_of("?#");
    if (cut != std::string::npos) rest = rest.substr(0, cut);
    while (!rest.empty() && rest.back() == '/') rest.pop_back();

    auto parts = split(rest, '/');
    if (parts.empty() || parts[0] != "github.com") {
        return invalid(raw, "only github.com repository URLs are supported");
    }
    if (parts.size() < 3) return invalid(raw, "expected github.com/owner/repo");

    std::string owner = parts[1];
    std::string repo = strip_git_suffix(parts[2]);
    if (!is_name_token(owner) || !is_name_token(repo)) {
        return invalid(raw, "malformed owner/repo");
    }

    ReferenceParseResult result;
    result.reference.kind = ReferenceKind::RepositoryUrl;
    result.reference.raw = raw;
    result.reference.repository.owner = owner;
    result.reference.repository.repo = repo;

    if (parts.size() > 3) {
        if ((parts[3] != "tree" && parts[3] != "blob") || parts.size() < 5) {
            return invalid(raw, "unsupported repository URL layout");
        }
        if (!is_ref_token(parts[4])) return invalid(raw, "malformed ref");
        std::vector<std::string> sub(parts.begin() + 5, parts.end());
        if (!is_subpath(sub)) return invalid(raw, "malformed module path");
        result.reference.repository.ref = parts[4];
        result.reference.repository.subpath = join(parts, 5);
    }

    result.ok = true;
    return result;
}

// name[@version]
ReferenceParseResult parse_registry_name(const std::string& raw) {
    std::string name = raw;
    std::string version;
    size_t at = raw.find('@');
    if (at != std::string::npos) {
        name = raw.substr(0, at);
        version = raw.substr(at + 1);
        if (!is_ref_token(version) || version.find('/') != std::string::npos) {
            return invalid(raw, "malformed version");
        }
    }
    if (!is_name_token(name) || name.front() == '.' || name.find("..") != std::string::npos) {
        return invalid(raw, "malformed module name");
    }

    ReferenceParseResult result;
    result.reference.kind = ReferenceKind::RegistryName;
    result.reference.raw = raw;
    result.reference.name = name;
    result.reference.version = version;
    result.ok = true;
    return result;
}

} // namespace

std::string RepositoryLocation::url() const {
    return "https://github.com/" + owner + "/" + repo;
}

ReferenceParseResult classify_reference(const std::string& input) {
    std::string raw = trim(input);
    if (raw.empty()) return invalid(input, "empty");

    for (char c : raw) {
        if (std::isspace(static_cast<unsigned char>(c)) || std::iscntrl(static_cast<unsigned char>(c))) {
            return invalid(raw, "contains whitespace or control characters");
        }
    }

    if (starts_with(raw, "http://") || starts_with(raw, "https://") ||
        raw.find("github.com") != std::string::npos) {
        return parse_repository_url(raw);
    }
    if (starts_with(raw, "github:")) {
        return parse_shorthand(raw, raw.substr(7));
    }
    if (raw.find('/') != std::string::npos) {
        return parse_shorthand(raw, raw);
    }
    return parse_registry_name(raw);
}

bool is_repository_source(const std::string& source) {
    if (starts_with(source, "github:")) return true;
    if (source.find("github.com") == std::string::npos) return false;
    // Release assets on github.com are tarball downloads, not repositories
    return !ends_with(source, ".tar.gz") && !ends_with(source, ".tgz") &&
           source.find("/releases/download/") == std::string::npos;
}

ReferenceParseResult parse_repository_source(const std::string& source) {
    if (!is_repository_source(source)) {
        return invalid(source, "not a repository source");
    }
    auto parsed = classify_reference(source);
    if (parsed.ok && parsed.reference.kind == ReferenceKind::RegistryName) {
        return invalid(source, "not a repository source");
    }
    return parsed;
}

const char* reference_kind_name(ReferenceKind kind) {
    switch (kind) {
        case ReferenceKind::RepositoryShorthand: return "repository";
        case ReferenceKind::RepositoryUrl: return "repository-url";
        case ReferenceKind::RegistryName: return "registry";
    }
    return "unknown";
}

} // namespace cogmod
