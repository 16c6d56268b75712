#pragma once

#include <string>

namespace cogmod {

// ============================================================================
// Error Taxonomy
// ============================================================================

enum class ErrorKind {
    None,
    InvalidReference,
    ModuleNotFound,
    Timeout,
    PayloadTooLarge,
    MalformedIndex,
    MissingChecksum,
    InvalidChecksumFormat,  // configuration error, not a verification failure
    ChecksumMismatch,
    SizeMismatch,
    UnsafeArchiveEntry,
    PathTraversal,
    ArchiveQuotaExceeded,
    MalformedArchive,
    AmbiguousArchiveLayout,
    ManifestNotFound,
    InvalidModule,
    DownloadFailed,
    PolicyViolation,
    IoError,
};

// Stable taxonomy name, e.g. "ChecksumMismatch"
const char* error_kind_name(ErrorKind kind);

struct Error {
    ErrorKind kind = ErrorKind::None;
    std::string message;
    std::string path;      // offending archive member or file, when relevant
    std::string expected;  // expected digest/size, when relevant
    std::string actual;

    explicit operator bool() const { return kind != ErrorKind::None; }

    // "<Kind>: <message>" plus path / expected-vs-actual details
    std::string describe() const;
};

Error make_error(ErrorKind kind, std::string message);
Error make_path_error(ErrorKind kind, std::string message, std::string path);
Error make_digest_error(ErrorKind kind, std::string message,
                        std::string expected, std::string actual);

} // namespace cogmod
