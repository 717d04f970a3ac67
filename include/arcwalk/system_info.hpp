#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace arcwalk::system {

struct CpuInfo {
    std::uint32_t logical_cores = 0;
    std::string os_name;
    std::string arch;
};

CpuInfo DetectCpuInfo();

// Logical cores minus one, never below one; leaves a core for the caller.
int ThreadsHint(const CpuInfo& cpu);

// Bytes available to an unprivileged writer at `path`. Throws std::filesystem::filesystem_error.
std::uint64_t FreeSpace(const std::filesystem::path& path);

// "30 B", "1.5 KB", "2 GB"
std::string FormatBytes(std::uint64_t bytes);

// "0m 1.5s", "12m 3.0s"
std::string FormatDuration(double seconds);

}  // namespace arcwalk::system
