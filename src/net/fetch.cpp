#include "cogmod/fetch.hpp"
#include "cogmod/integrity.hpp"
#include "cogmod/platform.hpp"

#include <algorithm>
#include <memory>
#include <utility>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

namespace cogmod {

namespace {

constexpr const char* USER_AGENT = "cogmod/1.0";

// RAII wrapper for CURL handle
class CurlHandle {
public:
    CurlHandle() : handle_(curl_easy_init()) {}
    ~CurlHandle() { if (handle_) curl_easy_cleanup(handle_); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;

    CURL* get() { return handle_; }
    explicit operator bool() const { return handle_ != nullptr; }

private:
    CURL* handle_;
};

class CurlMultiHandle {
public:
    CurlMultiHandle() : handle_(curl_multi_init()) {}
    ~CurlMultiHandle() { if (handle_) curl_multi_cleanup(handle_); }

    CurlMultiHandle(const CurlMultiHandle&) = delete;
    CurlMultiHandle& operator=(const CurlMultiHandle&) = delete;

    CURLM* get() { return handle_; }
    explicit operator bool() const { return handle_ != nullptr; }

private:
    CURLM* handle_;
};

class CurlUrl {
public:
    CurlUrl() : handle_(curl_url()) {}
    ~CurlUrl() { if (handle_) curl_url_cleanup(handle_); }

    CurlUrl(const CurlUrl&) = delete;
    CurlUrl& operator=(const CurlUrl&) = delete;

    CURLU* get() { return handle_; }
    explicit operator bool() const { return handle_ != nullptr; }

private:
    CURLU* handle_;
};

// Global curl initialization (thread-safe in modern libcurl)
class CurlGlobalInit {
public:
    CurlGlobalInit() { curl_global_init(CURL_GLOBAL_DEFAULT); }
    ~CurlGlobalInit() { curl_global_cleanup(); }
};

CurlGlobalInit& get_curl_init() {
    static CurlGlobalInit init;
    return init;
}

bool starts_with(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

bool is_http_url(const std::string& url) {
    return starts_with(url, "http://") || starts_with(url, "https://");
}

// One in-flight request. The sink is either a memory buffer or a hashing file
// writer; every received chunk is counted against the ceiling before it is
// handed to the sink.
struct Transfer {
    size_t index = 0;
    std::string url;
    FetchLimits limits;
    CurlHandle curl;
    char error_buffer[CURL_ERROR_SIZE] = {0};

    bool to_file = false;
    std::string dest_path;
    std::string memory;
    HashingFileWriter file;

    uint64_t received = 0;
    bool length_checked = false;
    bool too_large = false;
    bool write_failed = false;
};

size_t transfer_write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* t = static_cast<Transfer*>(userdata);
    size_t total = size * nmemb;

    if (!t->length_checked) {
        t->length_checked = true;
        curl_off_t declared = -1;
        if (curl_easy_getinfo(t->curl.get(), CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &declared) == CURLE_OK &&
            declared > 0 && static_cast<uint64_t>(declared) > t->limits.max_bytes) {
            t->too_large = true;
            return 0;
        }
    }

    if (t->received + total > t->limits.max_bytes) {
        t->too_large = true;
        return 0;  // aborts the transfer
    }

    if (t->to_file) {
        if (!t->file.write(ptr, total)) {
            t->write_failed = true;
            return 0;
        }
    } else {
        t->memory.append(ptr, total);
    }

    t->received += total;
    return total;
}

Error setup_transfer(Transfer& t) {
    if (!t.curl) {
        return make_error(ErrorKind::DownloadFailed, "failed to initialize CURL");
    }
    if (!is_fetchable_url(t.url)) {
        return make_error(ErrorKind::DownloadFailed, "unsupported URL scheme: " + t.url);
    }

    CURL* c = t.curl.get();
    curl_easy_setopt(c, CURLOPT_URL, t.url.c_str());
    curl_easy_setopt(c, CURLOPT_WRITEFUNCTION, transfer_write_callback);
    curl_easy_setopt(c, CURLOPT_WRITEDATA, &t);
    curl_easy_setopt(c, CURLOPT_ERRORBUFFER, t.error_buffer);
    curl_easy_setopt(c, CURLOPT_PRIVATE, &t);
    curl_easy_setopt(c, CURLOPT_NOSIGNAL, 1L);

    // Follow redirects
    curl_easy_setopt(c, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(c, CURLOPT_MAXREDIRS, 10L);
#if LIBCURL_VERSION_NUM >= 0x075500
    curl_easy_setopt(c, CURLOPT_PROTOCOLS_STR, "http,https,file");
    curl_easy_setopt(c, CURLOPT_REDIR_PROTOCOLS_STR, "http,https");
#else
    curl_easy_setopt(c, CURLOPT_PROTOCOLS, CURLPROTO_HTTP | CURLPROTO_HTTPS | CURLPROTO_FILE);
    curl_easy_setopt(c, CURLOPT_REDIR_PROTOCOLS, CURLPROTO_HTTP | CURLPROTO_HTTPS);
#endif

    // TLS verification
    curl_easy_setopt(c, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(c, CURLOPT_SSL_VERIFYHOST, 2L);

    // Timeouts cover the whole transfer, not just the connect
    long connect_ms = std::min<long>(t.limits.timeout_ms, 30000L);
    curl_easy_setopt(c, CURLOPT_CONNECTTIMEOUT_MS, connect_ms);
    curl_easy_setopt(c, CURLOPT_TIMEOUT_MS, t.limits.timeout_ms);

    // Declared-length ceiling; the write callback enforces the observed one
    curl_easy_setopt(c, CURLOPT_MAXFILESIZE_LARGE, static_cast<curl_off_t>(t.limits.max_bytes));

    curl_easy_setopt(c, CURLOPT_USERAGENT, USER_AGENT);

    if (t.to_file) {
        std::string open_error;
        if (!t.file.open(t.dest_path, &open_error)) {
            return make_error(ErrorKind::IoError, open_error);
        }
    }
    return {};
}

std::string describe_curl_error(const Transfer& t, CURLcode code) {
    std::string detail = t.error_buffer[0] ? t.error_buffer : curl_easy_strerror(code);
    return "request to " + t.url + " failed: " + detail;
}

// Map the finished transfer to a result; removes partial files on failure
DownloadResult finalize_transfer(Transfer& t, CURLcode code) {
    DownloadResult result;
    result.path = t.dest_path;
    curl_easy_getinfo(t.curl.get(), CURLINFO_RESPONSE_CODE, &result.http_status);

    auto fail = [&](Error error) {
        if (t.to_file) t.file.abort();
        result.error = std::move(error);
        spdlog::debug("fetch {}: {}", t.url, result.error.describe());
        return result;
    };

    if (t.too_large || code == CURLE_FILESIZE_EXCEEDED) {
        return fail(make_error(ErrorKind::PayloadTooLarge,
                               "response from " + t.url + " exceeds " +
                               std::to_string(t.limits.max_bytes) + " bytes"));
    }
    if (code == CURLE_OPERATION_TIMEDOUT) {
        return fail(make_error(ErrorKind::Timeout,
                               "request to " + t.url + " timed out after " +
                               std::to_string(t.limits.timeout_ms) + " ms"));
    }
    if (t.write_failed) {
        return fail(make_path_error(ErrorKind::IoError, "failed to write download", result.path));
    }
    if (code != CURLE_OK) {
        return fail(make_error(ErrorKind::DownloadFailed, describe_curl_error(t, code)));
    }
    if (is_http_url(t.url) && (result.http_status < 200 || result.http_status >= 300)) {
        return fail(make_error(ErrorKind::DownloadFailed,
                               "HTTP " + std::to_string(result.http_status) + " from " + t.url));
    }

    result.size_bytes = t.received;
    if (t.to_file) {
        std::string commit_error;
        if (!t.file.commit(&result.sha256, &commit_error)) {
            result.error = make_path_error(ErrorKind::IoError, commit_error, result.path);
            return result;
        }
    }

    result.ok = true;
    return result;
}

std::unique_ptr<Transfer> make_file_transfer(size_t index, const DownloadRequest& request) {
    auto t = std::make_unique<Transfer>();
    t->index = index;
    t->url = request.url;
    t->limits = request.limits;
    t->to_file = true;
    t->dest_path = request.dest_path;
    return t;
}

} // namespace

// ============================================================================
// Single Transfers
// ============================================================================

FetchResult fetch_text(const std::string& url, const FetchLimits& limits) {
    FetchResult result;
    get_curl_init();

    Transfer t;
    t.url = url;
    t.limits = limits;

    if (auto error = setup_transfer(t)) {
        result.error = error;
        return result;
    }

    spdlog::debug("fetching {} (limit {} bytes, timeout {} ms)", url, limits.max_bytes,
                  limits.timeout_ms);
    CURLcode code = curl_easy_perform(t.curl.get());
    auto finished = finalize_transfer(t, code);
    result.http_status = finished.http_status;
    if (!finished.ok) {
        result.error = finished.error;
        return result;
    }

    result.body = std::move(t.memory);
    result.ok = true;
    return result;
}

DownloadResult download_to_file(const std::string& url,
                                const std::string& dest_path,
                                const FetchLimits& limits) {
    auto results = download_all({DownloadRequest{url, dest_path, limits}}, 1);
    return results.front();
}

// ============================================================================
// Bounded Concurrent Transfers
// ============================================================================

std::vector<DownloadResult> download_all(const std::vector<DownloadRequest>& requests,
                                         size_t concurrency,
                                         const DownloadCallback& on_complete) {
    std::vector<DownloadResult> results(requests.size());
    if (requests.empty()) return results;
    get_curl_init();

    concurrency = std::max<size_t>(1, concurrency);

    auto complete = [&](size_t index, DownloadResult result) {
        results[index] = std::move(result);
        if (on_complete) on_complete(index, results[index]);
    };

    CurlMultiHandle multi;
    if (!multi) {
        for (size_t i = 0; i < requests.size(); ++i) {
            DownloadResult failed;
            failed.path = requests[i].dest_path;
            failed.error = make_error(ErrorKind::DownloadFailed, "failed to initialize CURL multi");
            complete(i, std::move(failed));
        }
        return results;
    }

    std::vector<std::unique_ptr<Transfer>> active(requests.size());
    size_t next = 0;
    size_t running_count = 0;

    auto start_more = [&]() {
        while (running_count < concurrency && next < requests.size()) {
            size_t index = next++;
            auto t = make_file_transfer(index, requests[index]);
            if (auto error = setup_transfer(*t)) {
                DownloadResult failed;
                failed.path = requests[index].dest_path;
                failed.error = error;
                t->file.abort();
                complete(index, std::move(failed));
                continue;
            }
            spdlog::debug("download [{}] {} -> {}", index, t->url, requests[index].dest_path);
            if (curl_multi_add_handle(multi.get(), t->curl.get()) != CURLM_OK) {
                DownloadResult failed;
                failed.path = requests[index].dest_path;
                failed.error = make_error(ErrorKind::DownloadFailed, "failed to queue " + t->url);
                t->file.abort();
                complete(index, std::move(failed));
                continue;
            }
            active[index] = std::move(t);
            ++running_count;
        }
    };

    start_more();

    while (running_count > 0) {
        int still_running = 0;
        CURLMcode mc = curl_multi_perform(multi.get(), &still_running);
        if (mc != CURLM_OK) {
            std::string message = std::string("transfer loop failed: ") + curl_multi_strerror(mc);
            for (auto& t : active) {
                if (!t) continue;
                curl_multi_remove_handle(multi.get(), t->curl.get());
                t->file.abort();
                DownloadResult failed;
                failed.path = t->dest_path;
                failed.error = make_error(ErrorKind::DownloadFailed, message);
                size_t index = t->index;
                t.reset();
                complete(index, std::move(failed));
            }
            running_count = 0;
            break;
        }

        int queued = 0;
        while (CURLMsg* msg = curl_multi_info_read(multi.get(), &queued)) {
            if (msg->msg != CURLMSG_DONE) continue;

            char* priv = nullptr;
            curl_easy_getinfo(msg->easy_handle, CURLINFO_PRIVATE, &priv);
            auto* raw = reinterpret_cast<Transfer*>(priv);
            CURLcode code = msg->data.result;
            curl_multi_remove_handle(multi.get(), msg->easy_handle);
            if (!raw) continue;

            size_t index = raw->index;
            DownloadResult done = finalize_transfer(*raw, code);
            active[index].reset();
            --running_count;
            complete(index, std::move(done));
        }

        start_more();

        if (running_count > 0) {
            curl_multi_poll(multi.get(), nullptr, 0, 1000, nullptr);
        }
    }

    return results;
}

// ============================================================================
// URL Helpers
// ============================================================================

bool is_fetchable_url(const std::string& value) {
    return is_http_url(value) || starts_with(value, "file://");
}

std::string resolve_url(const std::string& base, const std::string& ref) {
    get_curl_init();
    CurlUrl url;
    if (!url) return {};

    if (curl_url_set(url.get(), CURLUPART_URL, base.c_str(), 0) != CURLUE_OK) {
        return {};
    }
    if (curl_url_set(url.get(), CURLUPART_URL, ref.c_str(), 0) != CURLUE_OK) {
        return {};
    }

    char* out = nullptr;
    if (curl_url_get(url.get(), CURLUPART_URL, &out, 0) != CURLUE_OK || !out) {
        return {};
    }
    std::string resolved(out);
    curl_free(out);
    return resolved;
}

std::string url_basename(const std::string& url) {
    std::string path = url;
    auto cut = path.find_first_of("?#");
    if (cut != std::string::npos) path.erase(cut);
    while (!path.empty() && path.back() == '/') path.pop_back();
    auto slash = path.rfind('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

std::string file_url(const std::string& absolute_path) {
    std::string portable = to_portable_path(absolute_path);
    if (portable.empty() || portable[0] != '/') portable = "/" + portable;
    return "file://" + portable;
}

} // namespace cogmod
