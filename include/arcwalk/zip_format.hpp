#pragma once

#include <cstddef>
#include <cstdint>
#include <ctime>
#include <string>

// PKWARE APPNOTE constants shared by the writer and the reader.
namespace arcwalk::zip::format {

inline constexpr std::uint32_t kLocalHeaderSig = 0x04034b50;
inline constexpr std::uint32_t kDataDescriptorSig = 0x08074b50;
inline constexpr std::uint32_t kCentralHeaderSig = 0x02014b50;
inline constexpr std::uint32_t kEndOfCentralSig = 0x06054b50;
inline constexpr std::uint32_t kZip64EndOfCentralSig = 0x06064b50;
inline constexpr std::uint32_t kZip64LocatorSig = 0x07064b50;

inline constexpr std::uint16_t kZip64ExtraId = 0x0001;

inline constexpr std::uint16_t kMethodStored = 0;
inline constexpr std::uint16_t kMethodDeflated = 8;

inline constexpr std::uint16_t kFlagDataDescriptor = 1u << 3;
inline constexpr std::uint16_t kFlagUtf8 = 1u << 11;

inline constexpr std::uint16_t kVersionDefault = 20;
inline constexpr std::uint16_t kVersionZip64 = 45;
inline constexpr std::uint16_t kHostUnix = 3;

inline constexpr std::uint32_t kMax32 = 0xFFFFFFFFu;
inline constexpr std::uint16_t kMax16 = 0xFFFFu;

inline constexpr std::size_t kLocalHeaderSize = 30;
inline constexpr std::size_t kCentralHeaderSize = 46;
inline constexpr std::size_t kEndOfCentralSize = 22;
inline constexpr std::size_t kZip64EndOfCentralSize = 56;
inline constexpr std::size_t kZip64LocatorSize = 20;

inline constexpr std::uint32_t kUnixDirMode = 040775;
inline constexpr std::uint32_t kUnixFileType = 0100000;
inline constexpr std::uint32_t kDosDirAttr = 0x10;

inline void PutU16(std::string& out, std::uint16_t value) {
    out.push_back(static_cast<char>(value & 0xFF));
    out.push_back(static_cast<char>((value >> 8) & 0xFF));
}

inline void PutU32(std::string& out, std::uint32_t value) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<char>((value >> (8 * i)) & 0xFF));
    }
}

inline void PutU64(std::string& out, std::uint64_t value) {
    for (int i = 0; i < 8; ++i) {
        out.push_back(static_cast<char>((value >> (8 * i)) & 0xFF));
    }
}

inline std::uint16_t GetU16(const unsigned char* data) {
    return static_cast<std::uint16_t>(data[0] | (data[1] << 8));
}

inline std::uint32_t GetU32(const unsigned char* data) {
    return static_cast<std::uint32_t>(data[0])
           | (static_cast<std::uint32_t>(data[1]) << 8)
           | (static_cast<std::uint32_t>(data[2]) << 16)
           | (static_cast<std::uint32_t>(data[3]) << 24);
}

inline std::uint64_t GetU64(const unsigned char* data) {
    return static_cast<std::uint64_t>(GetU32(data))
           | (static_cast<std::uint64_t>(GetU32(data + 4)) << 32);
}

// MS-DOS date/time pair (date in the high word). Clamped to 1980-01-01.
std::uint32_t DosDateTime(std::time_t when);

}  // namespace arcwalk::zip::format
