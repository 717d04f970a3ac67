#include "arcwalk/list_file.hpp"

#include "arcwalk/errors.hpp"
#include "arcwalk/log.hpp"

#include <cstdint>
#include <fstream>
#include <system_error>

namespace arcwalk::strategy {

namespace fs = std::filesystem;

namespace {

constexpr std::uint32_t kReplacementChar = 0xFFFD;

void PutUnit(std::string& out, std::uint16_t unit) {
    out.push_back(static_cast<char>(unit & 0xFF));
    out.push_back(static_cast<char>((unit >> 8) & 0xFF));
}

void PutCodePoint(std::string& out, std::uint32_t cp) {
    if (cp >= 0x10000) {
        cp -= 0x10000;
        PutUnit(out, static_cast<std::uint16_t>(0xD800 + (cp >> 10)));
        PutUnit(out, static_cast<std::uint16_t>(0xDC00 + (cp & 0x3FF)));
        return;
    }
    PutUnit(out, static_cast<std::uint16_t>(cp));
}

// Decodes one sequence at `pos`; advances `pos` past it (or one byte if malformed).
std::uint32_t DecodeOne(const std::string& text, std::size_t& pos) {
    const auto lead = static_cast<unsigned char>(text[pos]);
    std::size_t extra = 0;
    std::uint32_t cp = 0;
    std::uint32_t min_cp = 0;
    if (lead < 0x80) {
        ++pos;
        return lead;
    } else if ((lead & 0xE0) == 0xC0) {
        extra = 1;
        cp = lead & 0x1F;
        min_cp = 0x80;
    } else if ((lead & 0xF0) == 0xE0) {
        extra = 2;
        cp = lead & 0x0F;
        min_cp = 0x800;
    } else if ((lead & 0xF8) == 0xF0) {
        extra = 3;
        cp = lead & 0x07;
        min_cp = 0x10000;
    } else {
        ++pos;
        return kReplacementChar;
    }
    if (pos + extra >= text.size()) {
        ++pos;
        return kReplacementChar;
    }
    for (std::size_t i = 1; i <= extra; ++i) {
        const auto next = static_cast<unsigned char>(text[pos + i]);
        if ((next & 0xC0) != 0x80) {
            ++pos;
            return kReplacementChar;
        }
        cp = (cp << 6) | (next & 0x3F);
    }
    if (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        ++pos;
        return kReplacementChar;
    }
    pos += extra + 1;
    return cp;
}

}  // namespace

std::string CharsetFlag(ListFileEncoding encoding) {
    return encoding == ListFileEncoding::Utf8 ? "-scsUTF-8" : "-scsUTF-16LE";
}

std::string Utf8ToUtf16Le(const std::string& utf8) {
    std::string out;
    out.reserve(utf8.size() * 2);
    std::size_t pos = 0;
    while (pos < utf8.size()) {
        PutCodePoint(out, DecodeOne(utf8, pos));
    }
    return out;
}

fs::path ListFilePath(const fs::path& output, int attempt) {
    fs::path path = output;
    path += ".list-" + std::to_string(attempt) + ".txt";
    return path;
}

ScopedListFile::ScopedListFile(const fs::path& path,
                               walk::WalkCursor cursor,
                               ListFileEncoding encoding)
    : path_(path), encoding_(encoding) {
    std::ofstream out(path_, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw ArchiveError("Failed to create list file: " + path_.string());
    }
    try {
        walk::WalkEntry entry;
        while (cursor.Next(entry)) {
            std::string line = entry.path.u8string();
            line.push_back('\n');
            if (encoding_ == ListFileEncoding::Utf16Le) {
                line = Utf8ToUtf16Le(line);
            }
            out.write(line.data(), static_cast<std::streamsize>(line.size()));
        }
        out.close();
        if (!out) {
            throw ArchiveError("Failed to write list file: " + path_.string());
        }
    } catch (const std::exception&) {
        out.close();
        std::error_code ec;
        fs::remove(path_, ec);
        throw;
    }
}

ScopedListFile::~ScopedListFile() {
    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) {
        log::Warn("Could not delete list file " + path_.string() + ": " + ec.message());
    }
}

}  // namespace arcwalk::strategy
