#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

#include "arcwalk/tree_walker.hpp"

namespace arcwalk::strategy {

enum class ListFileEncoding {
    Utf8,
    Utf16Le
};

// "-scsUTF-8" / "-scsUTF-16LE"
std::string CharsetFlag(ListFileEncoding encoding);

// UTF-16LE without BOM. Malformed input sequences become U+FFFD.
std::string Utf8ToUtf16Le(const std::string& utf8);

// `<archive>.list-<attempt>.txt`, beside the archive.
std::filesystem::path ListFilePath(const std::filesystem::path& output, int attempt);

// A list-file on disk, one walked path per line. Removed when the object dies,
// whatever the outcome of the tool run.
class ScopedListFile {
public:
    ScopedListFile(const std::filesystem::path& path,
                   walk::WalkCursor cursor,
                   ListFileEncoding encoding);
    ~ScopedListFile();

    ScopedListFile(const ScopedListFile&) = delete;
    ScopedListFile& operator=(const ScopedListFile&) = delete;

    const std::filesystem::path& Path() const noexcept { return path_; }
    ListFileEncoding Encoding() const noexcept { return encoding_; }

private:
    std::filesystem::path path_;
    ListFileEncoding encoding_;
};

}  // namespace arcwalk::strategy
