#include "cogmod/registry.hpp"

#include <nlohmann/json.hpp>

namespace cogmod {

namespace {

// Helper to safely get a string from JSON
std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

// Helper to safely get a string array from JSON
std::vector<std::string> get_string_array(const nlohmann::json& j, const std::string& key) {
    std::vector<std::string> result;
    if (j.contains(key) && j[key].is_array()) {
        for (const auto& elem : j[key]) {
            if (elem.is_string()) {
                result.push_back(elem.get<std::string>());
            }
        }
    }
    return result;
}

std::optional<bool> get_bool(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_boolean()) {
        return j[key].get<bool>();
    }
    return std::nullopt;
}

std::optional<int> get_int(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_number_integer()) {
        return j[key].get<int>();
    }
    return std::nullopt;
}

// A present field of the wrong type makes the entry malformed
bool wrong_type(const nlohmann::json& j, const std::string& key, nlohmann::json::value_t type) {
    if (!j.contains(key) || j[key].is_null()) return false;
    if (type == nlohmann::json::value_t::number_unsigned) return !j[key].is_number_unsigned();
    return j[key].type() != type;
}

bool parse_legacy(const std::string& name, const nlohmann::json& j,
                  LegacyEntry& out, std::string& error) {
    using vt = nlohmann::json::value_t;
    for (const char* key : {"description", "version", "source", "author"}) {
        if (wrong_type(j, key, vt::string)) {
            error = "module '" + name + "': field '" + key + "' must be a string";
            return false;
        }
    }
    if (wrong_type(j, "tags", vt::array)) {
        error = "module '" + name + "': field 'tags' must be an array";
        return false;
    }

    out.description = get_string(j, "description").value_or("");
    out.version = get_string(j, "version").value_or("");
    out.source = get_string(j, "source").value_or("");
    out.author = get_string(j, "author").value_or("");
    out.tags = get_string_array(j, "tags");
    return true;
}

bool parse_current(const std::string& name, const nlohmann::json& j,
                   CurrentEntry& out, std::string& error) {
    using vt = nlohmann::json::value_t;
    auto fail = [&](const std::string& what) {
        error = "module '" + name + "': " + what;
        return false;
    };

    const auto& identity = j["identity"];
    if (!identity.is_object()) return fail("'identity' must be an object");
    auto id_name = get_string(identity, "name");
    auto id_version = get_string(identity, "version");
    if (!id_name || id_name->empty()) return fail("identity.name is required");
    if (!id_version || id_version->empty()) return fail("identity.version is required");
    out.identity.name = *id_name;
    out.identity.version = *id_version;
    out.identity.namespace_ = get_string(identity, "namespace").value_or("");
    out.identity.spec_version = get_string(identity, "spec_version").value_or("");

    for (const char* section : {"metadata", "quality", "dependencies", "distribution"}) {
        if (wrong_type(j, section, vt::object)) {
            return fail(std::string("'") + section + "' must be an object");
        }
    }

    if (j.contains("metadata") && j["metadata"].is_object()) {
        const auto& m = j["metadata"];
        if (wrong_type(m, "keywords", vt::array)) return fail("metadata.keywords must be an array");
        out.metadata.description = get_string(m, "description").value_or("");
        out.metadata.author = get_string(m, "author").value_or("");
        out.metadata.license = get_string(m, "license").value_or("");
        out.metadata.repository = get_string(m, "repository").value_or("");
        out.metadata.homepage = get_string(m, "homepage").value_or("");
        out.metadata.tier = get_string(m, "tier").value_or("");
        out.metadata.keywords = get_string_array(m, "keywords");
    }

    if (j.contains("quality") && j["quality"].is_object()) {
        const auto& q = j["quality"];
        CurrentEntry::Quality quality;
        quality.conformance_level = get_int(q, "conformance_level");
        quality.verified = get_bool(q, "verified").value_or(false);
        quality.deprecated = get_bool(q, "deprecated").value_or(false);
        out.quality = quality;
    }

    if (j.contains("dependencies") && j["dependencies"].is_object()) {
        const auto& d = j["dependencies"];
        out.dependencies.runtime_min = get_string(d, "runtime_min").value_or("");
        out.dependencies.modules = get_string_array(d, "modules");
    }

    if (j.contains("distribution") && j["distribution"].is_object()) {
        const auto& d = j["distribution"];
        if (wrong_type(d, "tarball", vt::string)) return fail("distribution.tarball must be a string");
        if (wrong_type(d, "checksum", vt::string)) return fail("distribution.checksum must be a string");
        if (wrong_type(d, "size_bytes", vt::number_unsigned)) {
            return fail("distribution.size_bytes must be a non-negative integer");
        }
        out.distribution.tarball = get_string(d, "tarball").value_or("");
        out.distribution.checksum = get_string(d, "checksum").value_or("");
        if (d.contains("size_bytes") && d["size_bytes"].is_number_unsigned()) {
            out.distribution.size_bytes = d["size_bytes"].get<uint64_t>();
        }
        out.distribution.files = get_string_array(d, "files");
    }
    return true;
}

// Categories are informational; entries of the wrong shape are skipped
std::map<std::string, RegistryCategory> parse_categories(const nlohmann::json& j) {
    std::map<std::string, RegistryCategory> categories;
    if (!j.is_object()) return categories;
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (!it.value().is_object()) continue;
        RegistryCategory category;
        category.name = get_string(it.value(), "name").value_or(it.key());
        category.description = get_string(it.value(), "description").value_or("");
        category.modules = get_string_array(it.value(), "modules");
        categories[it.key()] = std::move(category);
    }
    return categories;
}

std::optional<std::string> non_empty(const std::string& s) {
    if (s.empty()) return std::nullopt;
    return s;
}

} // namespace

// ============================================================================
// Normalization
// ============================================================================

ModuleInfo normalize_entry(const std::string& name, const RegistryEntry& entry) {
    ModuleInfo info;

    if (const auto* legacy = std::get_if<LegacyEntry>(&entry)) {
        info.name = name;
        info.version = legacy->version;
        info.description = legacy->description;
        info.author = legacy->author;
        info.source = legacy->source;
        info.keywords = legacy->tags;
        return info;
    }

    const auto& current = std::get<CurrentEntry>(entry);
    info.name = current.identity.name;
    info.version = current.identity.version;
    info.description = current.metadata.description;
    info.author = current.metadata.author;
    info.source = current.distribution.tarball;
    info.tarball = non_empty(current.distribution.tarball);
    info.checksum = non_empty(current.distribution.checksum);
    info.keywords = current.metadata.keywords;
    info.tier = non_empty(current.metadata.tier);
    info.size_bytes = current.distribution.size_bytes;
    info.files = current.distribution.files;
    info.namespace_ = non_empty(current.identity.namespace_);
    info.spec_version = non_empty(current.identity.spec_version);
    if (current.quality) {
        info.deprecated = current.quality->deprecated;
        info.verified = current.quality->verified;
        info.conformance_level = current.quality->conformance_level;
    }
    return info;
}

// ============================================================================
// Index Parsing
// ============================================================================

IndexResult parse_registry_index(const std::string& json_text, const std::string& source_url) {
    IndexResult result;
    result.index.source_url = source_url;

    try {
        auto j = nlohmann::json::parse(json_text);

        if (!j.is_object()) {
            result.error = make_error(ErrorKind::MalformedIndex, "registry index must be a JSON object");
            return result;
        }
        if (!j.contains("modules") || !j["modules"].is_object()) {
            result.error = make_error(ErrorKind::MalformedIndex,
                                      "registry index has no 'modules' object");
            return result;
        }

        result.index.version = get_string(j, "version").value_or("");
        result.index.updated = get_string(j, "updated").value_or("");
        if (j.contains("categories")) {
            result.index.categories = parse_categories(j["categories"]);
        }

        for (auto it = j["modules"].begin(); it != j["modules"].end(); ++it) {
            const std::string& name = it.key();
            const auto& value = it.value();
            if (!value.is_object()) {
                result.error = make_error(ErrorKind::MalformedIndex,
                                          "module '" + name + "' must be an object");
                return result;
            }

            // The current format always carries identity
            std::string error;
            RegistryEntry entry;
            if (value.contains("identity")) {
                CurrentEntry current;
                if (!parse_current(name, value, current, error)) {
                    result.error = make_error(ErrorKind::MalformedIndex, error);
                    return result;
                }
                entry = std::move(current);
            } else {
                LegacyEntry legacy;
                if (!parse_legacy(name, value, legacy, error)) {
                    result.error = make_error(ErrorKind::MalformedIndex, error);
                    return result;
                }
                entry = std::move(legacy);
            }
            result.index.modules[name] = normalize_entry(name, entry);
        }
    } catch (const nlohmann::json::parse_error& e) {
        result.error = make_error(ErrorKind::MalformedIndex,
                                  std::string("invalid registry JSON: ") + e.what());
        return result;
    } catch (const nlohmann::json::exception& e) {
        result.error = make_error(ErrorKind::MalformedIndex,
                                  std::string("invalid registry index: ") + e.what());
        return result;
    }

    result.ok = true;
    return result;
}

} // namespace cogmod
