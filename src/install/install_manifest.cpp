#include "cogmod/install_manifest.hpp"
#include "cogmod/platform.hpp"

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

RefType parse_ref_type(const std::string& s) {
    if (s == "tag") return RefType::Tag;
    if (s == "branch") return RefType::Branch;
    return RefType::Auto;
}

void set_optional(nlohmann::json& j, const char* key, const std::optional<std::string>& value) {
    if (value) j[key] = *value;
}

} // namespace

const char* ref_type_name(RefType type) {
    switch (type) {
        case RefType::Auto: return "auto";
        case RefType::Tag: return "tag";
        case RefType::Branch: return "branch";
    }
    return "auto";
}

ManifestLoadResult InstallManifest::load(const std::string& path) {
    ManifestLoadResult result;
    result.manifest = InstallManifest(path);

    if (!path_exists(path)) {
        result.ok = true;
        return result;
    }

    auto content = read_file(path);
    if (!content) {
        result.error = make_path_error(ErrorKind::IoError, "failed to read install manifest", path);
        return result;
    }

    try {
        auto j = nlohmann::json::parse(*content);
        if (!j.is_object()) {
            result.error = make_path_error(ErrorKind::IoError,
                                           "install manifest must be a JSON object", path);
            return result;
        }

        for (auto it = j.begin(); it != j.end(); ++it) {
            const auto& v = it.value();
            if (!v.is_object()) {
                result.error = make_path_error(ErrorKind::IoError,
                                               "install manifest entry '" + it.key() +
                                               "' must be an object", path);
                return result;
            }

            ManifestEntry entry;
            entry.source = get_string(v, "source").value_or("");
            entry.location = get_string(v, "location").value_or("");
            entry.requested_ref = get_string(v, "requestedRef");
            entry.ref_type = parse_ref_type(get_string(v, "refType").value_or("auto"));
            entry.module_path = get_string(v, "modulePath");
            entry.resolved_version = get_string(v, "version");
            entry.registry_module = get_string(v, "registryModule");
            entry.registry_url = get_string(v, "registryUrl");
            entry.installed_at = get_string(v, "installedAt").value_or("");
            result.manifest.entries_[it.key()] = std::move(entry);
        }
    } catch (const nlohmann::json::exception& e) {
        result.error = make_path_error(ErrorKind::IoError,
                                       std::string("invalid install manifest: ") + e.what(), path);
        return result;
    }

    result.ok = true;
    return result;
}

const ManifestEntry* InstallManifest::find(const std::string& name) const {
    auto it = entries_.find(name);
    return it == entries_.end() ? nullptr : &it->second;
}

void InstallManifest::put(const std::string& name, ManifestEntry entry) {
    entries_[name] = std::move(entry);
}

bool InstallManifest::erase(const std::string& name) {
    return entries_.erase(name) > 0;
}

std::string InstallManifest::serialize() const {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [name, entry] : entries_) {
        nlohmann::json e;
        e["source"] = entry.source;
        e["location"] = entry.location;
        set_optional(e, "requestedRef", entry.requested_ref);
        e["refType"] = ref_type_name(entry.ref_type);
        set_optional(e, "modulePath", entry.module_path);
        set_optional(e, "version", entry.resolved_version);
        set_optional(e, "registryModule", entry.registry_module);
        set_optional(e, "registryUrl", entry.registry_url);
        e["installedAt"] = entry.installed_at;
        j[name] = std::move(e);
    }
    return j.dump(2) + "\n";
}

ManifestSaveResult InstallManifest::save() const {
    ManifestSaveResult result;

    if (path_.empty()) {
        result.error = make_error(ErrorKind::IoError, "install manifest has no path");
        return result;
    }

    std::string parent = get_parent_directory(path_);
    if (!parent.empty() && !create_directories(parent)) {
        result.error = make_path_error(ErrorKind::IoError, "failed to create directory", parent);
        return result;
    }

    auto written = atomic_write_file(path_, serialize());
    if (!written.ok) {
        result.error = make_path_error(ErrorKind::IoError, written.error, path_);
        return result;
    }

    result.ok = true;
    return result;
}

} // namespace cogmod
