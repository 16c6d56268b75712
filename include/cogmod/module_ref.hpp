#pragma once

#include "cogmod/errors.hpp"

#include <string>

namespace cogmod {

// ============================================================================
// Module References
// ============================================================================

enum class ReferenceKind {
    RepositoryShorthand,  // owner/repo[/path][@ref], optionally "github:"-prefixed
    RepositoryUrl,        // https://github.com/owner/repo[/tree/<ref>/<path>]
    RegistryName,         // name[@version]
};

struct RepositoryLocation {
    std::string owner;
    std::string repo;
    std::string subpath;  // empty for the repository root
    std::string ref;      // empty when unspecified

    std::string url() const;  // https://github.com/<owner>/<repo>
};

struct ModuleReference {
    ReferenceKind kind = ReferenceKind::RegistryName;
    std::string raw;
    RepositoryLocation repository;  // repository kinds
    std::string name;               // registry kind
    std::string version;            // registry kind, may be empty
};

struct ReferenceParseResult {
    bool ok = false;
    Error error;  // InvalidReference
    ModuleReference reference;
};

// Total classification of user input
ReferenceParseResult classify_reference(const std::string& input);

// Parse a registry entry "source" that points at a repository
// ("github:owner/repo[/path][@ref]")
ReferenceParseResult parse_repository_source(const std::string& source);

bool is_repository_source(const std::string& source);

const char* reference_kind_name(ReferenceKind kind);

} // namespace cogmod
