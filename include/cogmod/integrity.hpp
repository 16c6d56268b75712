#pragma once

#include "cogmod/errors.hpp"

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <string>
#include <vector>

namespace cogmod {

// ============================================================================
// SHA-256 Hashing
// ============================================================================

struct HashResult {
    bool ok = false;
    std::string error;
    std::string hex_digest;     // Lowercase hex string (64 chars)
};

// Compute SHA-256 hash of data
HashResult compute_sha256(const std::vector<uint8_t>& data);
HashResult compute_sha256_string(const std::string& data);
HashResult compute_sha256_file(const std::string& file_path);

// Incremental SHA-256 over a byte stream
class Sha256Hasher {
public:
    Sha256Hasher();
    ~Sha256Hasher();

    Sha256Hasher(const Sha256Hasher&) = delete;
    Sha256Hasher& operator=(const Sha256Hasher&) = delete;

    bool update(const void* data, size_t len);

    // Finalize and return the lowercase hex digest; empty on failure.
    // The hasher cannot be updated afterwards.
    std::string finish();

    bool ok() const { return ok_; }

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    bool ok_ = true;
    bool finished_ = false;
};

// ============================================================================
// Checksum Strings ("sha256:<64 lowercase hex>")
// ============================================================================

struct ChecksumParseResult {
    bool ok = false;
    Error error;            // InvalidChecksumFormat
    std::string hex_digest;
};

ChecksumParseResult parse_checksum(const std::string& checksum);
std::string format_checksum(const std::string& hex_digest);

struct Sha256VerifyResult {
    bool ok = false;
    Error error;
    std::string actual_digest;
    std::string expected_digest;
};

// Hash a file and compare against "sha256:<hex>"
Sha256VerifyResult verify_file_checksum(const std::string& file_path,
                                        const std::string& checksum);

// ============================================================================
// Hashing Writer
// ============================================================================

// Byte sink that feeds every chunk to a SHA-256 accumulator and a file exactly
// once. Closing (or destroying) an uncommitted writer removes the partial file.
class HashingFileWriter {
public:
    HashingFileWriter() = default;
    ~HashingFileWriter();

    HashingFileWriter(const HashingFileWriter&) = delete;
    HashingFileWriter& operator=(const HashingFileWriter&) = delete;

    bool open(const std::string& path, std::string* error = nullptr);
    bool write(const void* data, size_t len);

    // Flush and close; returns digest. The file is kept.
    bool commit(std::string* hex_digest, std::string* error = nullptr);

    // Close and delete the partial file
    void abort();

    uint64_t bytes_written() const { return bytes_; }
    const std::string& path() const { return path_; }
    bool is_open() const { return file_ != nullptr; }

private:
    std::string path_;
    std::FILE* file_ = nullptr;
    std::unique_ptr<Sha256Hasher> hasher_;
    uint64_t bytes_ = 0;
};

} // namespace cogmod
