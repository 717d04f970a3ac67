#include "arcwalk/zip_reader.hpp"

#include "arcwalk/constants.hpp"
#include "arcwalk/errors.hpp"
#include "arcwalk/zip_format.hpp"

#include <algorithm>
#include <array>
#include <fstream>
#include <functional>
#include <system_error>
#include <zlib.h>

namespace arcwalk::zip {

namespace {

using namespace format;

using Sink = std::function<void(const char*, std::size_t)>;

struct InflateStream {
    z_stream strm{};

    InflateStream() {
        if (inflateInit2(&strm, -MAX_WBITS) != Z_OK) {
            throw ArchiveError("Failed to initialize inflate stream");
        }
    }
    ~InflateStream() { inflateEnd(&strm); }

    InflateStream(const InflateStream&) = delete;
    InflateStream& operator=(const InflateStream&) = delete;
};

std::vector<unsigned char> ReadAt(std::ifstream& in, std::uint64_t offset, std::size_t size) {
    std::vector<unsigned char> buffer(size);
    in.clear();
    in.seekg(static_cast<std::streamoff>(offset));
    in.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(size));
    if (in.gcount() != static_cast<std::streamsize>(size)) {
        throw ArchiveError("Truncated zip archive");
    }
    return buffer;
}

struct DirectoryLocation {
    std::uint64_t count = 0;
    std::uint64_t size = 0;
    std::uint64_t offset = 0;
};

DirectoryLocation LocateDirectory(std::ifstream& in, std::uint64_t file_size) {
    if (file_size < kEndOfCentralSize) {
        throw ArchiveError("Not a zip archive (too small)");
    }
    const std::uint64_t window = std::min<std::uint64_t>(file_size, kEndOfCentralSize + kMax16);
    std::vector<unsigned char> tail = ReadAt(in, file_size - window, static_cast<std::size_t>(window));
    std::size_t pos = tail.size() - kEndOfCentralSize + 1;
    while (pos-- > 0) {
        if (GetU32(tail.data() + pos) == kEndOfCentralSig) {
            break;
        }
        if (pos == 0) {
            throw ArchiveError("Not a zip archive (no end of central directory)");
        }
    }
    const unsigned char* eocd = tail.data() + pos;
    DirectoryLocation loc;
    loc.count = GetU16(eocd + 10);
    loc.size = GetU32(eocd + 12);
    loc.offset = GetU32(eocd + 16);

    const std::uint64_t eocd_offset = file_size - window + pos;
    if ((loc.count == kMax16 || loc.size == kMax32 || loc.offset == kMax32)
        && eocd_offset >= kZip64LocatorSize) {
        std::vector<unsigned char> locator = ReadAt(in, eocd_offset - kZip64LocatorSize, kZip64LocatorSize);
        if (GetU32(locator.data()) == kZip64LocatorSig) {
            std::vector<unsigned char> record = ReadAt(in, GetU64(locator.data() + 8), kZip64EndOfCentralSize);
            if (GetU32(record.data()) != kZip64EndOfCentralSig) {
                throw ArchiveError("Corrupt zip64 end of central directory");
            }
            loc.count = GetU64(record.data() + 32);
            loc.size = GetU64(record.data() + 40);
            loc.offset = GetU64(record.data() + 48);
        }
    }
    if (loc.size > file_size || loc.offset > file_size - loc.size) {
        throw ArchiveError("Central directory lies outside the archive");
    }
    return loc;
}

void ApplyZip64Extra(ZipEntry& entry, const unsigned char* extra, std::size_t len) {
    std::size_t pos = 0;
    while (pos + 4 <= len) {
        std::uint16_t id = GetU16(extra + pos);
        std::uint16_t size = GetU16(extra + pos + 2);
        pos += 4;
        if (pos + size > len) {
            break;
        }
        if (id == kZip64ExtraId) {
            std::size_t field = pos;
            const std::size_t end = pos + size;
            if (entry.uncompressed_size == kMax32 && field + 8 <= end) {
                entry.uncompressed_size = GetU64(extra + field);
                field += 8;
            }
            if (entry.compressed_size == kMax32 && field + 8 <= end) {
                entry.compressed_size = GetU64(extra + field);
                field += 8;
            }
            if (entry.local_offset == kMax32 && field + 8 <= end) {
                entry.local_offset = GetU64(extra + field);
            }
        }
        pos += size;
    }
}

std::uint64_t DataOffset(std::ifstream& in, const ZipEntry& entry) {
    std::vector<unsigned char> header = ReadAt(in, entry.local_offset, kLocalHeaderSize);
    if (GetU32(header.data()) != kLocalHeaderSig) {
        throw ArchiveError("Bad local header for " + entry.name);
    }
    return entry.local_offset + kLocalHeaderSize + GetU16(header.data() + 26) + GetU16(header.data() + 28);
}

// Streams the member's decoded bytes into `sink`; returns the CRC-32 of them.
std::uint32_t DecodeMember(std::ifstream& in, const ZipEntry& entry, const Sink& sink) {
    const std::uint64_t data_offset = DataOffset(in, entry);
    in.clear();
    in.seekg(static_cast<std::streamoff>(data_offset));

    std::array<char, constants::kStreamChunkSize> in_buf{};
    std::array<char, constants::kStreamChunkSize> out_buf{};
    uLong crc = crc32(0L, Z_NULL, 0);
    std::uint64_t remaining = entry.compressed_size;

    if (entry.method == kMethodStored) {
        while (remaining > 0) {
            std::size_t chunk = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, in_buf.size()));
            in.read(in_buf.data(), static_cast<std::streamsize>(chunk));
            if (in.gcount() != static_cast<std::streamsize>(chunk)) {
                throw ArchiveError("Truncated member " + entry.name);
            }
            crc = crc32(crc, reinterpret_cast<const Bytef*>(in_buf.data()), static_cast<uInt>(chunk));
            sink(in_buf.data(), chunk);
            remaining -= chunk;
        }
        return static_cast<std::uint32_t>(crc);
    }
    if (entry.method != kMethodDeflated) {
        throw ArchiveError("Unsupported compression method " + std::to_string(entry.method) + " for " + entry.name);
    }

    InflateStream inflate;
    int ret = Z_OK;
    while (ret != Z_STREAM_END) {
        if (inflate.strm.avail_in == 0) {
            if (remaining == 0) {
                throw ArchiveError("Truncated deflate stream in " + entry.name);
            }
            std::size_t chunk = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, in_buf.size()));
            in.read(in_buf.data(), static_cast<std::streamsize>(chunk));
            if (in.gcount() != static_cast<std::streamsize>(chunk)) {
                throw ArchiveError("Truncated member " + entry.name);
            }
            remaining -= chunk;
            inflate.strm.next_in = reinterpret_cast<Bytef*>(in_buf.data());
            inflate.strm.avail_in = static_cast<uInt>(chunk);
        }
        inflate.strm.next_out = reinterpret_cast<Bytef*>(out_buf.data());
        inflate.strm.avail_out = static_cast<uInt>(out_buf.size());
        ret = ::inflate(&inflate.strm, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            throw ArchiveError("Corrupt deflate stream in " + entry.name);
        }
        std::size_t produced = out_buf.size() - inflate.strm.avail_out;
        if (produced > 0) {
            crc = crc32(crc, reinterpret_cast<const Bytef*>(out_buf.data()), static_cast<uInt>(produced));
            sink(out_buf.data(), produced);
        }
    }
    return static_cast<std::uint32_t>(crc);
}

bool IsSafePath(const std::filesystem::path& dest_dir, const std::string& name) {
    std::filesystem::path rel(name);
    if (rel.is_absolute() || rel.has_root_name()) {
        return false;
    }
    for (const auto& part : rel) {
        if (part == "..") {
            return false;
        }
    }
    auto base = dest_dir.lexically_normal();
    auto full = (dest_dir / rel).lexically_normal();
    auto mismatch = std::mismatch(base.begin(), base.end(), full.begin(), full.end());
    return mismatch.first == base.end() || mismatch.first->empty();
}

std::ifstream OpenArchive(const std::filesystem::path& archive, std::uint64_t& file_size) {
    std::error_code ec;
    file_size = static_cast<std::uint64_t>(std::filesystem::file_size(archive, ec));
    if (ec) {
        throw ArchiveError("Cannot stat zip archive " + archive.string() + ": " + ec.message());
    }
    std::ifstream in(archive, std::ios::binary);
    if (!in) {
        throw ArchiveError("Failed to open zip archive: " + archive.string());
    }
    return in;
}

}  // namespace

std::vector<ZipEntry> ReadIndex(const std::filesystem::path& archive) {
    std::uint64_t file_size = 0;
    std::ifstream in = OpenArchive(archive, file_size);
    DirectoryLocation loc = LocateDirectory(in, file_size);

    std::vector<unsigned char> directory = ReadAt(in, loc.offset, static_cast<std::size_t>(loc.size));
    std::vector<ZipEntry> entries;
    entries.reserve(static_cast<std::size_t>(std::min<std::uint64_t>(loc.count, 1u << 20)));
    std::size_t pos = 0;
    for (std::uint64_t i = 0; i < loc.count; ++i) {
        if (pos + kCentralHeaderSize > directory.size()
            || GetU32(directory.data() + pos) != kCentralHeaderSig) {
            throw ArchiveError("Corrupt central directory entry #" + std::to_string(i));
        }
        const unsigned char* h = directory.data() + pos;
        ZipEntry entry;
        entry.flags = GetU16(h + 8);
        entry.method = GetU16(h + 10);
        entry.crc = GetU32(h + 16);
        entry.compressed_size = GetU32(h + 20);
        entry.uncompressed_size = GetU32(h + 24);
        const std::uint16_t name_len = GetU16(h + 28);
        const std::uint16_t extra_len = GetU16(h + 30);
        const std::uint16_t comment_len = GetU16(h + 32);
        entry.external_attr = GetU32(h + 38);
        entry.local_offset = GetU32(h + 42);
        const std::size_t record_size = kCentralHeaderSize + name_len + extra_len + comment_len;
        if (pos + record_size > directory.size()) {
            throw ArchiveError("Truncated central directory entry #" + std::to_string(i));
        }
        entry.name.assign(reinterpret_cast<const char*>(h + kCentralHeaderSize), name_len);
        ApplyZip64Extra(entry, h + kCentralHeaderSize + name_len, extra_len);
        entries.push_back(std::move(entry));
        pos += record_size;
    }
    return entries;
}

VerifyReport Verify(const std::filesystem::path& archive) {
    std::vector<ZipEntry> entries = ReadIndex(archive);
    std::uint64_t file_size = 0;
    std::ifstream in = OpenArchive(archive, file_size);
    VerifyReport report;
    for (const auto& entry : entries) {
        if (entry.IsDirectory()) {
            report.directories += 1;
            continue;
        }
        try {
            std::uint64_t produced = 0;
            std::uint32_t crc = DecodeMember(in, entry, [&](const char*, std::size_t n) { produced += n; });
            if (crc != entry.crc) {
                report.failures.push_back(entry.name + ": CRC mismatch");
            } else if (produced != entry.uncompressed_size) {
                report.failures.push_back(entry.name + ": size mismatch");
            }
            report.files += 1;
            report.bytes += produced;
        } catch (const ArchiveError& exc) {
            report.failures.push_back(entry.name + ": " + exc.what());
        }
    }
    return report;
}

void ExtractAll(const std::filesystem::path& archive, const std::filesystem::path& dest_dir) {
    std::vector<ZipEntry> entries = ReadIndex(archive);
    std::uint64_t file_size = 0;
    std::ifstream in = OpenArchive(archive, file_size);
    for (const auto& entry : entries) {
        if (!IsSafePath(dest_dir, entry.name)) {
            throw ArchiveError("Unsafe zip entry detected: " + entry.name);
        }
        std::filesystem::path out_path = dest_dir / std::filesystem::path(entry.name);
        std::error_code ec;
        if (entry.IsDirectory()) {
            std::filesystem::create_directories(out_path, ec);
            if (ec) {
                throw ArchiveError("Failed to create directory " + out_path.string() + ": " + ec.message());
            }
            continue;
        }
        std::filesystem::create_directories(out_path.parent_path(), ec);
        std::ofstream output(out_path, std::ios::binary | std::ios::trunc);
        if (!output) {
            throw ArchiveError("Failed to write output: " + out_path.string());
        }
        std::uint32_t crc = DecodeMember(in, entry, [&](const char* data, std::size_t n) {
            output.write(data, static_cast<std::streamsize>(n));
        });
        if (!output) {
            throw ArchiveError("Failed to write output: " + out_path.string());
        }
        if (crc != entry.crc) {
            throw ArchiveError("CRC mismatch for " + entry.name);
        }
    }
}

}  // namespace arcwalk::zip
