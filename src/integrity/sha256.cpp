#include "cogmod/integrity.hpp"
#include "cogmod/platform.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>

#include <openssl/evp.h>

namespace cogmod {

// ============================================================================
// SHA-256 Implementation (using OpenSSL 3.0+ EVP API)
// ============================================================================

namespace {

// RAII wrapper for EVP_MD_CTX
class EvpMdCtx {
public:
    EvpMdCtx() : ctx_(EVP_MD_CTX_new()) {}
    ~EvpMdCtx() { if (ctx_) EVP_MD_CTX_free(ctx_); }

    EvpMdCtx(const EvpMdCtx&) = delete;
    EvpMdCtx& operator=(const EvpMdCtx&) = delete;

    EVP_MD_CTX* get() { return ctx_; }
    explicit operator bool() const { return ctx_ != nullptr; }

private:
    EVP_MD_CTX* ctx_;
};

std::string bytes_to_hex(const unsigned char* data, size_t len) {
    static const char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        result.push_back(hex_chars[(data[i] >> 4) & 0x0F]);
        result.push_back(hex_chars[data[i] & 0x0F]);
    }
    return result;
}

bool is_lower_hex(const std::string& s) {
    for (char c : s) {
        bool digit = c >= '0' && c <= '9';
        bool lower = c >= 'a' && c <= 'f';
        if (!digit && !lower) return false;
    }
    return true;
}

} // namespace

struct Sha256Hasher::Impl {
    EvpMdCtx ctx;
};

Sha256Hasher::Sha256Hasher() : impl_(std::make_unique<Impl>()) {
    if (!impl_->ctx || EVP_DigestInit_ex(impl_->ctx.get(), EVP_sha256(), nullptr) != 1) {
        ok_ = false;
    }
}

Sha256Hasher::~Sha256Hasher() = default;

bool Sha256Hasher::update(const void* data, size_t len) {
    if (!ok_ || finished_) return false;
    if (len == 0) return true;
    if (EVP_DigestUpdate(impl_->ctx.get(), data, len) != 1) {
        ok_ = false;
    }
    return ok_;
}

std::string Sha256Hasher::finish() {
    if (!ok_ || finished_) return {};
    finished_ = true;

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_DigestFinal_ex(impl_->ctx.get(), hash, &hash_len) != 1) {
        ok_ = false;
        return {};
    }
    return bytes_to_hex(hash, hash_len);
}

HashResult compute_sha256(const std::vector<uint8_t>& data) {
    HashResult result;

    Sha256Hasher hasher;
    hasher.update(data.data(), data.size());
    result.hex_digest = hasher.finish();
    if (result.hex_digest.empty()) {
        result.error = "SHA-256 computation failed";
        return result;
    }

    result.ok = true;
    return result;
}

HashResult compute_sha256_string(const std::string& data) {
    HashResult result;

    Sha256Hasher hasher;
    hasher.update(data.data(), data.size());
    result.hex_digest = hasher.finish();
    if (result.hex_digest.empty()) {
        result.error = "SHA-256 computation failed";
        return result;
    }

    result.ok = true;
    return result;
}

HashResult compute_sha256_file(const std::string& file_path) {
    HashResult result;

    std::ifstream file(file_path, std::ios::binary);
    if (!file) {
        result.error = "failed to open file: " + file_path;
        return result;
    }

    Sha256Hasher hasher;
    char buffer[8192];
    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
        if (!hasher.update(buffer, static_cast<size_t>(file.gcount()))) {
            result.error = "EVP_DigestUpdate failed";
            return result;
        }
    }
    if (file.bad()) {
        result.error = "failed to read file: " + file_path;
        return result;
    }

    result.hex_digest = hasher.finish();
    if (result.hex_digest.empty()) {
        result.error = "EVP_DigestFinal_ex failed";
        return result;
    }

    result.ok = true;
    return result;
}

// ============================================================================
// Checksum Strings
// ============================================================================

ChecksumParseResult parse_checksum(const std::string& checksum) {
    ChecksumParseResult result;
    static const std::string prefix = "sha256:";

    if (checksum.rfind(prefix, 0) != 0) {
        result.error = make_error(ErrorKind::InvalidChecksumFormat,
                                  "unsupported checksum format (expected sha256:<64 hex>): " +
                                  checksum);
        return result;
    }

    std::string hex = checksum.substr(prefix.size());
    if (hex.size() != 64 || !is_lower_hex(hex)) {
        result.error = make_error(ErrorKind::InvalidChecksumFormat,
                                  "sha256 digest must be 64 lowercase hex characters: " + checksum);
        return result;
    }

    result.hex_digest = hex;
    result.ok = true;
    return result;
}

std::string format_checksum(const std::string& hex_digest) {
    return "sha256:" + hex_digest;
}

Sha256VerifyResult verify_file_checksum(const std::string& file_path,
                                        const std::string& checksum) {
    Sha256VerifyResult result;

    auto parsed = parse_checksum(checksum);
    if (!parsed.ok) {
        result.error = parsed.error;
        return result;
    }
    result.expected_digest = parsed.hex_digest;

    auto hash_result = compute_sha256_file(file_path);
    if (!hash_result.ok) {
        result.error = make_path_error(ErrorKind::IoError, hash_result.error, file_path);
        return result;
    }
    result.actual_digest = hash_result.hex_digest;

    if (result.actual_digest != result.expected_digest) {
        result.error = make_digest_error(ErrorKind::ChecksumMismatch, "checksum mismatch",
                                         result.expected_digest, result.actual_digest);
        return result;
    }

    result.ok = true;
    return result;
}

// ============================================================================
// Hashing Writer
// ============================================================================

HashingFileWriter::~HashingFileWriter() {
    abort();
}

bool HashingFileWriter::open(const std::string& path, std::string* error) {
    abort();
    path_ = path;
    bytes_ = 0;
    hasher_ = std::make_unique<Sha256Hasher>();

    std::string parent = get_parent_directory(path);
    if (!parent.empty() && !create_directories(parent)) {
        if (error) *error = "failed to create directory: " + parent;
        return false;
    }

    file_ = std::fopen(path.c_str(), "wb");
    if (!file_) {
        if (error) *error = "failed to open " + path + ": " + std::strerror(errno);
        return false;
    }
    return true;
}

bool HashingFileWriter::write(const void* data, size_t len) {
    if (!file_) return false;
    if (len == 0) return true;
    if (std::fwrite(data, 1, len, file_) != len) return false;
    if (!hasher_->update(data, len)) return false;
    bytes_ += len;
    return true;
}

bool HashingFileWriter::commit(std::string* hex_digest, std::string* error) {
    if (!file_) {
        if (error) *error = "writer is not open";
        return false;
    }

    bool flushed = std::fflush(file_) == 0;
    bool closed = std::fclose(file_) == 0;
    file_ = nullptr;
    if (!flushed || !closed) {
        remove_file(path_);
        if (error) *error = "failed to close " + path_;
        return false;
    }

    std::string digest = hasher_->finish();
    if (digest.empty()) {
        remove_file(path_);
        if (error) *error = "SHA-256 computation failed";
        return false;
    }
    if (hex_digest) *hex_digest = digest;
    return true;
}

void HashingFileWriter::abort() {
    if (file_) {
        std::fclose(file_);
        file_ = nullptr;
        remove_file(path_);
    }
}

} // namespace cogmod
