#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <string>

namespace cogmod::tar {

// ============================================================================
// Tar Format Constants (POSIX ustar)
// ============================================================================

constexpr size_t BLOCK_SIZE = 512;
constexpr size_t NAME_SIZE = 100;
constexpr size_t MODE_SIZE = 8;
constexpr size_t UID_SIZE = 8;
constexpr size_t GID_SIZE = 8;
constexpr size_t SIZE_SIZE = 12;
constexpr size_t MTIME_SIZE = 12;
constexpr size_t CHKSUM_SIZE = 8;
constexpr size_t LINKNAME_SIZE = 100;
constexpr size_t MAGIC_SIZE = 6;
constexpr size_t VERSION_SIZE = 2;
constexpr size_t UNAME_SIZE = 32;
constexpr size_t GNAME_SIZE = 32;
constexpr size_t PREFIX_SIZE = 155;

constexpr size_t CHKSUM_OFFSET = 148;

// Type flags
constexpr char REGTYPE = '0';
constexpr char AREGTYPE = '\0';
constexpr char LNKTYPE = '1';
constexpr char SYMTYPE = '2';
constexpr char DIRTYPE = '5';
constexpr char PAX_EXTENDED = 'x';
constexpr char PAX_GLOBAL = 'g';
constexpr char GNU_LONGNAME = 'L';

#pragma pack(push, 1)
struct Header {
    char name[NAME_SIZE];         // 0
    char mode[MODE_SIZE];         // 100
    char uid[UID_SIZE];           // 108
    char gid[GID_SIZE];           // 116
    char size[SIZE_SIZE];         // 124
    char mtime[MTIME_SIZE];       // 136
    char chksum[CHKSUM_SIZE];     // 148
    char typeflag;                // 156
    char linkname[LINKNAME_SIZE]; // 157
    char magic[MAGIC_SIZE];       // 257
    char version[VERSION_SIZE];   // 263
    char uname[UNAME_SIZE];       // 265
    char gname[GNAME_SIZE];       // 297
    char devmajor[8];             // 329
    char devminor[8];             // 337
    char prefix[PREFIX_SIZE];     // 345
    char padding[12];             // 500
};
#pragma pack(pop)

static_assert(sizeof(Header) == BLOCK_SIZE, "tar header must be 512 bytes");

// Sum of the header bytes with the checksum field read as spaces
inline uint32_t unsigned_checksum(const uint8_t* block) {
    uint32_t sum = 0;
    for (size_t i = 0; i < BLOCK_SIZE; ++i) {
        sum += (i >= CHKSUM_OFFSET && i < CHKSUM_OFFSET + CHKSUM_SIZE) ? ' ' : block[i];
    }
    return sum;
}

// Some historic writers summed signed chars
inline int32_t signed_checksum(const uint8_t* block) {
    int32_t sum = 0;
    for (size_t i = 0; i < BLOCK_SIZE; ++i) {
        sum += (i >= CHKSUM_OFFSET && i < CHKSUM_OFFSET + CHKSUM_SIZE)
            ? ' '
            : static_cast<int8_t>(block[i]);
    }
    return sum;
}

// Write an octal value with leading zeros into a fixed-size field
inline void write_octal(char* dest, size_t size, uint64_t value) {
    size_t digits = size - 1;
    dest[digits] = '\0';
    for (size_t i = digits; i > 0; --i) {
        dest[i - 1] = static_cast<char>('0' + (value & 7));
        value >>= 3;
    }
}

// Strict octal parse: optional leading spaces, digits, then NUL/space padding
inline std::optional<uint64_t> parse_octal(const char* data, size_t size) {
    size_t i = 0;
    while (i < size && data[i] == ' ') ++i;

    uint64_t result = 0;
    size_t digits = 0;
    for (; i < size && data[i] >= '0' && data[i] <= '7'; ++i, ++digits) {
        if (result > (UINT64_MAX >> 3)) return std::nullopt;
        result = (result << 3) | static_cast<uint64_t>(data[i] - '0');
    }
    for (; i < size; ++i) {
        if (data[i] != '\0' && data[i] != ' ') return std::nullopt;
    }
    if (digits == 0) return std::nullopt;
    return result;
}

inline std::string field_string(const char* data, size_t size) {
    return std::string(data, strnlen(data, size));
}

inline uint64_t padded_size(uint64_t size) {
    return (size + BLOCK_SIZE - 1) / BLOCK_SIZE * BLOCK_SIZE;
}

} // namespace cogmod::tar
