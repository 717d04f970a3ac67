#pragma once

#include <cstdint>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <istream>
#include <string>
#include <vector>

#include "arcwalk/errors.hpp"

namespace arcwalk::zip {

// A single member could not be archived; the writer has already rolled it back.
class EntryError : public ArchiveError {
public:
    using ArchiveError::ArchiveError;
    const char* Kind() const noexcept override { return "zip-entry"; }
};

// Streaming ZIP writer: members are Deflate-compressed through zlib as they are
// read, sizes go into data descriptors, ZIP64 records appear only when needed.
// Only the central-directory records are kept in memory.
class Writer {
public:
    Writer(const std::filesystem::path& path, int level);
    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    void AddDirectory(const std::string& name, std::time_t mtime);

    // `size_hint` is the stat size; it only decides whether ZIP64 headers are
    // used. Throws EntryError for source read failures, ArchiveError for output
    // failures.
    void AddFile(const std::string& name,
                 std::istream& input,
                 std::uint64_t size_hint,
                 std::time_t mtime,
                 std::uint32_t unix_mode);

    // Writes the central directory and closes the file.
    void Finish();

    std::uint64_t EntryCount() const noexcept { return records_.size(); }
    std::uint64_t BytesWritten() const noexcept { return offset_; }

private:
    struct CentralRecord {
        std::string name;
        std::uint16_t flags = 0;
        std::uint16_t method = 0;
        std::uint32_t dos_time = 0;
        std::uint32_t crc = 0;
        std::uint64_t compressed = 0;
        std::uint64_t uncompressed = 0;
        std::uint64_t offset = 0;
        std::uint32_t external_attr = 0;
        bool zip64 = false;
    };

    void WriteRaw(const char* data, std::size_t size);
    void WriteRaw(const std::string& data) { WriteRaw(data.data(), data.size()); }
    void Rewind(std::uint64_t offset);
    void WriteCentralDirectory();

    std::filesystem::path path_;
    std::ofstream out_;
    int level_;
    std::uint64_t offset_ = 0;
    std::vector<CentralRecord> records_;
    bool finished_ = false;
};

}  // namespace arcwalk::zip
