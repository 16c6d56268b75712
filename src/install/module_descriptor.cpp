#include "cogmod/module_descriptor.hpp"
#include "cogmod/platform.hpp"

#include <yaml-cpp/yaml.h>

namespace cogmod {

namespace {

std::optional<std::string> scalar(const YAML::Node& node, const char* key) {
    const YAML::Node value = node[key];
    if (!value || !value.IsScalar()) return std::nullopt;
    return value.as<std::string>();
}

// YAML between a leading "---" line and the next "---" line
std::optional<std::string> front_matter(const std::string& content) {
    if (content.rfind("---", 0) != 0) return std::nullopt;
    size_t body = content.find('\n');
    if (body == std::string::npos) return std::nullopt;
    size_t end = content.find("\n---", body);
    if (end == std::string::npos) return std::nullopt;
    return content.substr(body + 1, end - body);
}

} // namespace

bool is_module_directory(const std::string& dir) {
    for (const char* name : {MODULE_YAML, MODULE_MD, MODULE_MD_LOWER}) {
        if (is_regular_file(join_path(dir, name))) return true;
    }
    return false;
}

DescriptorResult read_module_yaml(const std::string& path) {
    DescriptorResult result;

    auto content = read_file(path);
    if (!content) {
        result.error = make_path_error(ErrorKind::InvalidModule, "module.yaml not readable", path);
        return result;
    }

    try {
        YAML::Node root = YAML::Load(*content);
        if (!root.IsMap()) {
            result.error = make_path_error(ErrorKind::InvalidModule,
                                           "module.yaml must be a mapping", path);
            return result;
        }

        auto name = scalar(root, "name");
        auto version = scalar(root, "version");
        auto tier = scalar(root, "tier");
        auto responsibility = scalar(root, "responsibility");

        std::string missing;
        if (!name || name->empty()) missing += " name";
        if (!version || version->empty()) missing += " version";
        if (!tier || tier->empty()) missing += " tier";
        if (!responsibility || responsibility->empty()) missing += " responsibility";
        if (!missing.empty()) {
            result.error = make_path_error(ErrorKind::InvalidModule,
                                           "module.yaml missing required fields:" + missing, path);
            return result;
        }

        result.descriptor.name = *name;
        result.descriptor.version = *version;
        result.descriptor.tier = *tier;
        result.descriptor.responsibility = *responsibility;
    } catch (const YAML::Exception& e) {
        result.error = make_path_error(ErrorKind::InvalidModule,
                                       std::string("invalid module.yaml: ") + e.what(), path);
        return result;
    }

    result.ok = true;
    return result;
}

std::optional<std::string> read_module_version(const std::string& dir) {
    try {
        std::string yaml_path = join_path(dir, MODULE_YAML);
        if (is_regular_file(yaml_path)) {
            auto content = read_file(yaml_path);
            if (!content) return std::nullopt;
            YAML::Node root = YAML::Load(*content);
            if (!root.IsMap()) return std::nullopt;
            return scalar(root, "version");
        }

        std::string md_path = join_path(dir, MODULE_MD);
        if (!is_regular_file(md_path)) md_path = join_path(dir, MODULE_MD_LOWER);
        if (!is_regular_file(md_path)) return std::nullopt;

        auto content = read_file(md_path);
        if (!content) return std::nullopt;
        auto meta = front_matter(*content);
        if (!meta) return std::nullopt;

        YAML::Node root = YAML::Load(*meta);
        if (!root.IsMap()) return std::nullopt;
        return scalar(root, "version");
    } catch (const YAML::Exception&) {
        // An unparseable descriptor has no version; validity is checked elsewhere
        return std::nullopt;
    }
}

} // namespace cogmod
