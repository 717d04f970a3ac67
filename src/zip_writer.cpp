#include "arcwalk/zip_writer.hpp"

#include "arcwalk/constants.hpp"
#include "arcwalk/zip_format.hpp"

#include <algorithm>
#include <system_error>
#include <zlib.h>

namespace arcwalk::zip {

namespace format {

std::uint32_t DosDateTime(std::time_t when) {
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &when);
#else
    localtime_r(&when, &tm);
#endif
    if (tm.tm_year < 80) {
        return (static_cast<std::uint32_t>((1 << 5) | 1) << 16);
    }
    std::uint32_t date = (static_cast<std::uint32_t>(tm.tm_year - 80) << 9)
                         | (static_cast<std::uint32_t>(tm.tm_mon + 1) << 5)
                         | static_cast<std::uint32_t>(tm.tm_mday);
    std::uint32_t time = (static_cast<std::uint32_t>(tm.tm_hour) << 11)
                         | (static_cast<std::uint32_t>(tm.tm_min) << 5)
                         | static_cast<std::uint32_t>(tm.tm_sec / 2);
    return (date << 16) | time;
}

}  // namespace format

namespace {

using namespace format;

// Stat sizes at or above this get ZIP64 local headers; leaves room for
// Deflate's worst-case expansion below the 32-bit limit.
constexpr std::uint64_t kZip64Threshold = 0xF0000000ull;

struct DeflateStream {
    z_stream strm{};

    explicit DeflateStream(int level) {
        if (deflateInit2(&strm, level, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
            throw ArchiveError("Failed to initialize deflate stream");
        }
    }
    ~DeflateStream() { deflateEnd(&strm); }

    DeflateStream(const DeflateStream&) = delete;
    DeflateStream& operator=(const DeflateStream&) = delete;
};

std::string MemberName(const std::string& name) {
    std::string out = name;
    std::replace(out.begin(), out.end(), '\\', '/');
    while (!out.empty() && out.front() == '/') {
        out.erase(out.begin());
    }
    return out;
}

void PutLocalHeader(std::string& out,
                    std::uint16_t version,
                    std::uint16_t flags,
                    std::uint16_t method,
                    std::uint32_t dos_time,
                    std::uint32_t size_field,
                    const std::string& name,
                    const std::string& extra) {
    PutU32(out, kLocalHeaderSig);
    PutU16(out, version);
    PutU16(out, flags);
    PutU16(out, method);
    PutU32(out, dos_time);
    PutU32(out, 0);  // crc, in the data descriptor
    PutU32(out, size_field);
    PutU32(out, size_field);
    PutU16(out, static_cast<std::uint16_t>(name.size()));
    PutU16(out, static_cast<std::uint16_t>(extra.size()));
    out += name;
    out += extra;
}

}  // namespace

Writer::Writer(const std::filesystem::path& path, int level)
    : path_(path), out_(path, std::ios::binary | std::ios::trunc), level_(std::min(std::max(level, 0), 9)) {
    if (!out_) {
        throw ArchiveError("Failed to open zip output: " + path.string());
    }
}

Writer::~Writer() {
    if (out_.is_open()) {
        out_.close();
    }
}

void Writer::WriteRaw(const char* data, std::size_t size) {
    if (size == 0) {
        return;
    }
    out_.write(data, static_cast<std::streamsize>(size));
    if (!out_) {
        throw ArchiveError("Failed to write zip output: " + path_.string());
    }
    offset_ += size;
}

void Writer::Rewind(std::uint64_t offset) {
    out_.seekp(static_cast<std::streamoff>(offset));
    if (!out_) {
        throw ArchiveError("Failed to rewind zip output: " + path_.string());
    }
    offset_ = offset;
}

void Writer::AddDirectory(const std::string& name, std::time_t mtime) {
    CentralRecord rec;
    rec.name = MemberName(name);
    if (rec.name.empty() || rec.name.back() != '/') {
        rec.name.push_back('/');
    }
    if (rec.name.size() > kMax16) {
        throw EntryError("Member name too long: " + rec.name);
    }
    rec.flags = kFlagUtf8;
    rec.method = kMethodStored;
    rec.dos_time = DosDateTime(mtime);
    rec.offset = offset_;
    rec.external_attr = (kUnixDirMode << 16) | kDosDirAttr;

    std::string header;
    PutLocalHeader(header, kVersionDefault, rec.flags, rec.method, rec.dos_time, 0, rec.name, {});
    WriteRaw(header);
    records_.push_back(std::move(rec));
}

void Writer::AddFile(const std::string& name,
                     std::istream& input,
                     std::uint64_t size_hint,
                     std::time_t mtime,
                     std::uint32_t unix_mode) {
    CentralRecord rec;
    rec.name = MemberName(name);
    if (rec.name.empty() || rec.name.size() > kMax16) {
        throw EntryError("Invalid member name: '" + rec.name + "'");
    }
    rec.flags = kFlagUtf8 | kFlagDataDescriptor;
    rec.method = kMethodDeflated;
    rec.dos_time = DosDateTime(mtime);
    rec.offset = offset_;
    rec.external_attr = (kUnixFileType | (unix_mode & 07777)) << 16;
    rec.zip64 = size_hint >= kZip64Threshold;

    std::string extra;
    if (rec.zip64) {
        PutU16(extra, kZip64ExtraId);
        PutU16(extra, 16);
        PutU64(extra, 0);
        PutU64(extra, 0);
    }
    std::string header;
    PutLocalHeader(header,
                   rec.zip64 ? kVersionZip64 : kVersionDefault,
                   rec.flags,
                   rec.method,
                   rec.dos_time,
                   rec.zip64 ? kMax32 : 0,
                   rec.name,
                   extra);
    WriteRaw(header);

    DeflateStream deflate(level_);
    std::vector<char> in_buf(constants::kStreamChunkSize);
    std::vector<char> out_buf(constants::kStreamChunkSize);
    uLong crc = crc32(0L, Z_NULL, 0);
    bool eof = false;
    while (!eof) {
        input.read(in_buf.data(), static_cast<std::streamsize>(in_buf.size()));
        if (input.bad()) {
            Rewind(rec.offset);
            throw EntryError("Read failed while archiving " + rec.name);
        }
        std::streamsize got = input.gcount();
        eof = input.eof() || got < static_cast<std::streamsize>(in_buf.size());
        crc = crc32(crc, reinterpret_cast<const Bytef*>(in_buf.data()), static_cast<uInt>(got));
        rec.uncompressed += static_cast<std::uint64_t>(got);

        deflate.strm.next_in = reinterpret_cast<Bytef*>(in_buf.data());
        deflate.strm.avail_in = static_cast<uInt>(got);
        const int flush = eof ? Z_FINISH : Z_NO_FLUSH;
        do {
            deflate.strm.next_out = reinterpret_cast<Bytef*>(out_buf.data());
            deflate.strm.avail_out = static_cast<uInt>(out_buf.size());
            int ret = ::deflate(&deflate.strm, flush);
            if (ret == Z_STREAM_ERROR) {
                throw ArchiveError("Deflate failed while archiving " + rec.name);
            }
            std::size_t produced = out_buf.size() - deflate.strm.avail_out;
            WriteRaw(out_buf.data(), produced);
            rec.compressed += produced;
        } while (deflate.strm.avail_out == 0);
    }
    rec.crc = static_cast<std::uint32_t>(crc);

    if (!rec.zip64 && (rec.uncompressed >= kMax32 || rec.compressed >= kMax32)) {
        Rewind(rec.offset);
        throw EntryError(rec.name + " grew past 4 GiB while being archived");
    }

    std::string descriptor;
    PutU32(descriptor, kDataDescriptorSig);
    PutU32(descriptor, rec.crc);
    if (rec.zip64) {
        PutU64(descriptor, rec.compressed);
        PutU64(descriptor, rec.uncompressed);
    } else {
        PutU32(descriptor, static_cast<std::uint32_t>(rec.compressed));
        PutU32(descriptor, static_cast<std::uint32_t>(rec.uncompressed));
    }
    WriteRaw(descriptor);
    records_.push_back(std::move(rec));
}

void Writer::WriteCentralDirectory() {
    const std::uint64_t cd_start = offset_;
    for (const auto& rec : records_) {
        const bool z_uncompressed = rec.zip64 || rec.uncompressed >= kMax32;
        const bool z_compressed = rec.zip64 || rec.compressed >= kMax32;
        const bool z_offset = rec.offset >= kMax32;

        std::string extra;
        if (z_uncompressed || z_compressed || z_offset) {
            std::string body;
            if (z_uncompressed) {
                PutU64(body, rec.uncompressed);
            }
            if (z_compressed) {
                PutU64(body, rec.compressed);
            }
            if (z_offset) {
                PutU64(body, rec.offset);
            }
            PutU16(extra, kZip64ExtraId);
            PutU16(extra, static_cast<std::uint16_t>(body.size()));
            extra += body;
        }
        const std::uint16_t needed = extra.empty() ? kVersionDefault : kVersionZip64;

        std::string header;
        PutU32(header, kCentralHeaderSig);
        PutU16(header, static_cast<std::uint16_t>((kHostUnix << 8) | needed));
        PutU16(header, needed);
        PutU16(header, rec.flags);
        PutU16(header, rec.method);
        PutU32(header, rec.dos_time);
        PutU32(header, rec.crc);
        PutU32(header, z_compressed ? kMax32 : static_cast<std::uint32_t>(rec.compressed));
        PutU32(header, z_uncompressed ? kMax32 : static_cast<std::uint32_t>(rec.uncompressed));
        PutU16(header, static_cast<std::uint16_t>(rec.name.size()));
        PutU16(header, static_cast<std::uint16_t>(extra.size()));
        PutU16(header, 0);  // comment
        PutU16(header, 0);  // disk number
        PutU16(header, 0);  // internal attributes
        PutU32(header, rec.external_attr);
        PutU32(header, z_offset ? kMax32 : static_cast<std::uint32_t>(rec.offset));
        header += rec.name;
        header += extra;
        WriteRaw(header);
    }
    const std::uint64_t cd_size = offset_ - cd_start;
    const std::uint64_t count = records_.size();

    std::string tail;
    if (count >= kMax16 || cd_size >= kMax32 || cd_start >= kMax32) {
        const std::uint64_t zip64_eocd = offset_;
        PutU32(tail, kZip64EndOfCentralSig);
        PutU64(tail, kZip64EndOfCentralSize - 12);
        PutU16(tail, static_cast<std::uint16_t>((kHostUnix << 8) | kVersionZip64));
        PutU16(tail, kVersionZip64);
        PutU32(tail, 0);
        PutU32(tail, 0);
        PutU64(tail, count);
        PutU64(tail, count);
        PutU64(tail, cd_size);
        PutU64(tail, cd_start);

        PutU32(tail, kZip64LocatorSig);
        PutU32(tail, 0);
        PutU64(tail, zip64_eocd);
        PutU32(tail, 1);
    }
    PutU32(tail, kEndOfCentralSig);
    PutU16(tail, 0);
    PutU16(tail, 0);
    PutU16(tail, static_cast<std::uint16_t>(std::min<std::uint64_t>(count, kMax16)));
    PutU16(tail, static_cast<std::uint16_t>(std::min<std::uint64_t>(count, kMax16)));
    PutU32(tail, static_cast<std::uint32_t>(std::min<std::uint64_t>(cd_size, kMax32)));
    PutU32(tail, static_cast<std::uint32_t>(std::min<std::uint64_t>(cd_start, kMax32)));
    PutU16(tail, 0);
    WriteRaw(tail);
}

void Writer::Finish() {
    if (finished_) {
        return;
    }
    WriteCentralDirectory();
    out_.flush();
    out_.close();
    if (!out_) {
        throw ArchiveError("Failed to close zip output: " + path_.string());
    }
    // A rolled-back member may have left bytes past the end of the directory.
    std::error_code ec;
    std::filesystem::resize_file(path_, offset_, ec);
    if (ec) {
        throw ArchiveError("Failed to trim zip output " + path_.string() + ": " + ec.message());
    }
    finished_ = true;
}

}  // namespace arcwalk::zip
