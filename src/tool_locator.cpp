#include "arcwalk/tool_locator.hpp"

#include "arcwalk/constants.hpp"
#include "arcwalk/env.hpp"

#include <system_error>
#include <utility>

#if !defined(_WIN32)
#include <unistd.h>
#endif

namespace arcwalk::tool {

namespace fs = std::filesystem;

namespace {

bool IsExecutableFile(const fs::path& candidate) {
    std::error_code ec;
    if (!fs::is_regular_file(candidate, ec)) {
        return false;
    }
#if defined(_WIN32)
    return true;
#else
    return ::access(candidate.c_str(), X_OK) == 0;
#endif
}

const std::vector<std::string>& InstallCandidates() {
    static const std::vector<std::string> kCandidates = {
#if defined(_WIN32)
        "C:\\Program Files\\7-Zip\\7z.exe",
        "C:\\Program Files (x86)\\7-Zip\\7z.exe",
        "C:\\Windows\\7z.exe",
#else
        "/usr/bin/7z",
        "/usr/bin/7zz",
        "/usr/bin/7za",
        "/usr/local/bin/7z",
        "/usr/local/bin/7zz",
        "/opt/homebrew/bin/7zz",
        "/opt/homebrew/bin/7z",
#endif
    };
    return kCandidates;
}

const std::vector<std::string>& ExecutableNames() {
    static const std::vector<std::string> kNames = {
#if defined(_WIN32)
        "7z.exe", "7za.exe"
#else
        "7z", "7zz", "7za"
#endif
    };
    return kNames;
}

}  // namespace

std::optional<fs::path> SearchPath(const std::vector<std::string>& names, const std::string& path_value) {
    const std::vector<std::string> dirs = env::SplitList(path_value);
    for (const auto& name : names) {
        for (const auto& dir : dirs) {
            fs::path candidate = fs::path(dir) / name;
            if (IsExecutableFile(candidate)) {
                return candidate;
            }
        }
    }
    return std::nullopt;
}

std::optional<fs::path> LocateCompressor() {
    std::string override_bin = env::Get(constants::kEnv7zBin);
    if (!override_bin.empty() && IsExecutableFile(override_bin)) {
        return fs::path(override_bin);
    }
    for (const auto& candidate : InstallCandidates()) {
        if (IsExecutableFile(candidate)) {
            return fs::path(candidate);
        }
    }
    return SearchPath(ExecutableNames(), env::Get("PATH"));
}

Locator DefaultLocator() {
    return [] { return LocateCompressor(); };
}

Locator FixedLocator(std::optional<fs::path> path) {
    return [path = std::move(path)] { return path; };
}

}  // namespace arcwalk::tool
