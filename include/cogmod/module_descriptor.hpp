#pragma once

#include "cogmod/errors.hpp"

#include <optional>
#include <string>

namespace cogmod {

// A directory is a module when it holds one of these
constexpr const char* MODULE_YAML = "module.yaml";
constexpr const char* MODULE_MD = "MODULE.md";
constexpr const char* MODULE_MD_LOWER = "module.md";

bool is_module_directory(const std::string& dir);

struct ModuleDescriptor {
    std::string name;
    std::string version;
    std::string tier;
    std::string responsibility;
};

struct DescriptorResult {
    bool ok = false;
    Error error;  // InvalidModule
    ModuleDescriptor descriptor;
};

// Read module.yaml; name, version, tier and responsibility are all required
DescriptorResult read_module_yaml(const std::string& path);

// Version from module.yaml, else from MODULE.md / module.md front matter
std::optional<std::string> read_module_version(const std::string& dir);

} // namespace cogmod
