#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace arcwalk::zip {

struct ZipEntry {
    std::string name;
    std::uint16_t method = 0;
    std::uint16_t flags = 0;
    std::uint32_t crc = 0;
    std::uint64_t compressed_size = 0;
    std::uint64_t uncompressed_size = 0;
    std::uint64_t local_offset = 0;
    std::uint32_t external_attr = 0;

    bool IsDirectory() const noexcept { return !name.empty() && name.back() == '/'; }
};

struct VerifyReport {
    std::uint64_t directories = 0;
    std::uint64_t files = 0;
    std::uint64_t bytes = 0;
    std::vector<std::string> failures;

    bool Ok() const noexcept { return failures.empty(); }
};

// Central directory listing, ZIP64 aware. Throws ArchiveError on malformed input.
std::vector<ZipEntry> ReadIndex(const std::filesystem::path& archive);

// Inflates every member and checks CRC-32 and size.
VerifyReport Verify(const std::filesystem::path& archive);

// Unpacks every member under `dest_dir`. Rejects absolute names and "..".
void ExtractAll(const std::filesystem::path& archive, const std::filesystem::path& dest_dir);

}  // namespace arcwalk::zip
