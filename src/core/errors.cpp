#include "cogmod/errors.hpp"

#include <utility>

namespace cogmod {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "None";
        case ErrorKind::InvalidReference: return "InvalidReference";
        case ErrorKind::ModuleNotFound: return "ModuleNotFound";
        case ErrorKind::Timeout: return "Timeout";
        case ErrorKind::PayloadTooLarge: return "PayloadTooLarge";
        case ErrorKind::MalformedIndex: return "MalformedIndex";
        case ErrorKind::MissingChecksum: return "MissingChecksum";
        case ErrorKind::InvalidChecksumFormat: return "InvalidChecksumFormat";
        case ErrorKind::ChecksumMismatch: return "ChecksumMismatch";
        case ErrorKind::SizeMismatch: return "SizeMismatch";
        case ErrorKind::UnsafeArchiveEntry: return "UnsafeArchiveEntry";
        case ErrorKind::PathTraversal: return "PathTraversal";
        case ErrorKind::ArchiveQuotaExceeded: return "ArchiveQuotaExceeded";
        case ErrorKind::MalformedArchive: return "MalformedArchive";
        case ErrorKind::AmbiguousArchiveLayout: return "AmbiguousArchiveLayout";
        case ErrorKind::ManifestNotFound: return "ManifestNotFound";
        case ErrorKind::InvalidModule: return "InvalidModule";
        case ErrorKind::DownloadFailed: return "DownloadFailed";
        case ErrorKind::PolicyViolation: return "PolicyViolation";
        case ErrorKind::IoError: return "IoError";
    }
    return "Unknown";
}

std::string Error::describe() const {
    std::string out = error_kind_name(kind);
    out += ": ";
    out += message;
    if (!path.empty()) {
        out += " (path: " + path + ")";
    }
    if (!expected.empty() || !actual.empty()) {
        out += " (expected " + expected + ", got " + actual + ")";
    }
    return out;
}

Error make_error(ErrorKind kind, std::string message) {
    Error e;
    e.kind = kind;
    e.message = std::move(message);
    return e;
}

Error make_path_error(ErrorKind kind, std::string message, std::string path) {
    Error e = make_error(kind, std::move(message));
    e.path = std::move(path);
    return e;
}

Error make_digest_error(ErrorKind kind, std::string message,
                        std::string expected, std::string actual) {
    Error e = make_error(kind, std::move(message));
    e.expected = std::move(expected);
    e.actual = std::move(actual);
    return e;
}

} // namespace cogmod
