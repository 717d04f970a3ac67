#pragma once

#include <filesystem>
#include <string>

namespace arcwalk::digest {

// Lower-case hex SHA-256 of the file contents, streamed in fixed-size chunks.
std::string Sha256File(const std::filesystem::path& path);

}  // namespace arcwalk::digest
