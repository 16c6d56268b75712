#include "cogmod/registry.hpp"
#include "cogmod/integrity.hpp"
#include "cogmod/platform.hpp"

#include <filesystem>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace cogmod {

RegistryClient::RegistryClient(RegistryClientOptions options)
    : options_(std::move(options)) {}

std::string RegistryClient::cache_path() const {
    if (options_.cache_dir.empty()) return {};
    auto hash = compute_sha256_string(options_.registry_url);
    std::string key = hash.ok ? hash.hex_digest.substr(0, 16) : "default";
    return join_path(options_.cache_dir, "registry-" + key + ".json");
}

namespace {

bool is_fresh(const std::string& path, std::chrono::seconds ttl) {
    std::error_code ec;
    auto mtime = fs::last_write_time(path, ec);
    if (ec) return false;
    auto age = fs::file_time_type::clock::now() - mtime;
    return age >= fs::file_time_type::duration::zero() && age < ttl;
}

} // namespace

IndexResult RegistryClient::fetch_index(bool force_refresh) {
    if (!force_refresh && index_) {
        IndexResult result;
        result.ok = true;
        result.index = *index_;
        return result;
    }

    std::string cache_file = cache_path();
    if (!force_refresh && !cache_file.empty() && is_fresh(cache_file, options_.cache_ttl)) {
        if (auto cached = read_file(cache_file)) {
            auto parsed = parse_registry_index(*cached, options_.registry_url);
            if (parsed.ok) {
                spdlog::debug("using cached registry index {}", cache_file);
                index_ = parsed.index;
                return parsed;
            }
            spdlog::warn("ignoring unreadable registry cache {}: {}", cache_file,
                         parsed.error.message);
        }
    }

    auto fetched = fetch_text(options_.registry_url, options_.limits);
    if (!fetched.ok) {
        IndexResult result;
        result.error = fetched.error;
        return result;
    }

    auto parsed = parse_registry_index(fetched.body, options_.registry_url);
    if (!parsed.ok) {
        return parsed;
    }
    index_ = parsed.index;

    if (!cache_file.empty()) {
        create_directories(options_.cache_dir);
        auto written = atomic_write_file(cache_file, fetched.body);
        if (!written.ok) {
            spdlog::warn("failed to write registry cache {}: {}", cache_file, written.error);
        }
    }
    return parsed;
}

ModuleLookupResult RegistryClient::get_module(const std::string& name) {
    ModuleLookupResult result;

    auto index = fetch_index();
    if (!index.ok) {
        result.error = index.error;
        return result;
    }

    auto it = index.index.modules.find(name);
    if (it == index.index.modules.end()) {
        result.error = make_error(ErrorKind::ModuleNotFound,
                                  "module '" + name + "' not found in registry " +
                                  options_.registry_url);
        return result;
    }

    result.info = it->second;
    result.ok = true;
    return result;
}

std::vector<ModuleInfo> RegistryClient::list_modules(Error* error) {
    auto index = fetch_index();
    if (!index.ok) {
        if (error) *error = index.error;
        return {};
    }

    std::vector<ModuleInfo> modules;
    modules.reserve(index.index.modules.size());
    for (const auto& [name, info] : index.index.modules) {
        modules.push_back(info);
    }
    return modules;
}

std::map<std::string, RegistryCategory> RegistryClient::categories(Error* error) {
    auto index = fetch_index();
    if (!index.ok) {
        if (error) *error = index.error;
        return {};
    }
    return index.index.categories;
}

std::vector<SearchHit> RegistryClient::search(const std::string& query, Error* error) {
    auto index = fetch_index();
    if (!index.ok) {
        if (error) *error = index.error;
        return {};
    }
    return search_modules(index.index, query);
}

} // namespace cogmod
