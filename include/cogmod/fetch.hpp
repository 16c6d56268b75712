#pragma once

#include "cogmod/errors.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace cogmod {

// ============================================================================
// HTTP Fetching (libcurl)
// ============================================================================
//
// Every transfer carries a timeout and a byte ceiling. The ceiling is checked
// against the declared Content-Length and again against the bytes actually
// received, so a server that lies about its length is cut off mid-stream.
// Accepted schemes: https, http, file.

struct FetchLimits {
    long timeout_ms = 10000;
    uint64_t max_bytes = 1024 * 1024;
};

struct FetchResult {
    bool ok = false;
    Error error;
    std::string body;
    long http_status = 0;
};

// Fetch a small text document (registry index) into memory
FetchResult fetch_text(const std::string& url, const FetchLimits& limits);

struct DownloadResult {
    bool ok = false;
    Error error;
    std::string path;        // destination file (removed on failure)
    std::string sha256;      // hex digest of exactly the bytes written
    uint64_t size_bytes = 0;
    long http_status = 0;
};

// Stream url into dest_path, hashing each chunk as it is written
DownloadResult download_to_file(const std::string& url,
                                const std::string& dest_path,
                                const FetchLimits& limits);

struct DownloadRequest {
    std::string url;
    std::string dest_path;
    FetchLimits limits;
};

using DownloadCallback = std::function<void(size_t index, const DownloadResult& result)>;

// Run all requests on one thread with at most `concurrency` transfers in
// flight. Results are returned in request order; on_complete (if set) fires in
// completion order.
std::vector<DownloadResult> download_all(const std::vector<DownloadRequest>& requests,
                                         size_t concurrency,
                                         const DownloadCallback& on_complete = {});

// ============================================================================
// URL Helpers
// ============================================================================

// True for http://, https:// and file:// URLs
bool is_fetchable_url(const std::string& value);

// Resolve ref against base the way a browser would (RFC 3986).
// Absolute refs are returned unchanged. Empty on failure.
std::string resolve_url(const std::string& base, const std::string& ref);

// Last path segment of a URL or path, without query or fragment
std::string url_basename(const std::string& url);

// file:// URL for a local absolute path
std::string file_url(const std::string& absolute_path);

} // namespace cogmod
