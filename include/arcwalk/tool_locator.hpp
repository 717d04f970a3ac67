#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace arcwalk::tool {

// Returns the compressor executable, or nullopt when none is installed.
using Locator = std::function<std::optional<std::filesystem::path>()>;

// ARCWALK_7Z_BIN, then the usual install locations, then PATH.
std::optional<std::filesystem::path> LocateCompressor();

// PATH lookup for the first of `names`.
std::optional<std::filesystem::path> SearchPath(const std::vector<std::string>& names,
                                                const std::string& path_value);

Locator DefaultLocator();

// Always returns `path` (or nothing); used when the tool is given explicitly.
Locator FixedLocator(std::optional<std::filesystem::path> path);

}  // namespace arcwalk::tool
