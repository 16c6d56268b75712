#include "cogmod/registry.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace cogmod {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

std::vector<std::string> split_terms(const std::string& s) {
    std::vector<std::string> terms;
    std::istringstream ss(s);
    std::string term;
    while (ss >> term) {
        terms.push_back(term);
    }
    return terms;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

int score_module(const ModuleInfo& info, const std::string& query,
                 const std::vector<std::string>& terms) {
    int score = 0;

    std::string name = to_lower(info.name);
    if (contains(name, query)) {
        score += 10;
        if (name == query) score += 5;
    }

    std::string description = to_lower(info.description);
    for (const auto& term : terms) {
        if (contains(description, term)) score += 3;
    }

    for (const auto& keyword : info.keywords) {
        std::string kw = to_lower(keyword);
        if (kw.empty()) continue;
        for (const auto& term : terms) {
            if (contains(kw, term) || contains(term, kw)) score += 2;
        }
    }
    return score;
}

} // namespace

std::vector<SearchHit> search_modules(const RegistryIndex& index, const std::string& query) {
    std::vector<SearchHit> hits;

    std::string q = to_lower(trim(query));
    if (q.empty()) {
        for (const auto& [name, info] : index.modules) {
            hits.push_back({info.name, 1, info});
        }
    } else {
        auto terms = split_terms(q);
        for (const auto& [name, info] : index.modules) {
            int score = score_module(info, q, terms);
            if (score > 0) {
                hits.push_back({info.name, score, info});
            }
        }
    }

    std::sort(hits.begin(), hits.end(), [](const SearchHit& a, const SearchHit& b) {
        if (a.score != b.score) return a.score > b.score;
        return a.name < b.name;
    });
    return hits;
}

} // namespace cogmod
