#include "arcwalk/system_info.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <thread>

namespace arcwalk::system {

CpuInfo DetectCpuInfo() {
    CpuInfo info;

    // Logical cores (threads)
    info.logical_cores = std::thread::hardware_concurrency();
    if (info.logical_cores == 0) {
        info.logical_cores = 4;  // Unknown; assume a small desktop
    }

#if defined(_WIN32) || defined(_WIN64)
    info.os_name = "Windows";
#elif defined(__APPLE__) && defined(__MACH__)
    info.os_name = "macOS";
#elif defined(__linux__)
    info.os_name = "Linux";
#else
    info.os_name = "Unknown";
#endif

#if defined(__x86_64__) || defined(_M_X64)
    info.arch = "x86_64";
#elif defined(__i386__) || defined(_M_IX86)
    info.arch = "x86";
#elif defined(__aarch64__) || defined(_M_ARM64)
    info.arch = "arm64";
#elif defined(__arm__) || defined(_M_ARM)
    info.arch = "arm";
#else
    info.arch = "unknown";
#endif

    return info;
}

int ThreadsHint(const CpuInfo& cpu) {
    int cores = static_cast<int>(cpu.logical_cores);
    return std::max(1, cores - 1);
}

std::uint64_t FreeSpace(const std::filesystem::path& path) {
    std::filesystem::space_info info = std::filesystem::space(path);
    return static_cast<std::uint64_t>(info.available);
}

std::string FormatBytes(std::uint64_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    if (bytes < 1024) {
        return std::to_string(bytes) + " B";
    }
    std::size_t unit = 0;
    double value = static_cast<double>(bytes);

    while (value >= 1024.0 && unit < 4) {
        value /= 1024.0;
        unit++;
    }

    std::ostringstream oss;
    oss.precision(2);
    oss << std::fixed << value;
    std::string text = oss.str();
    text.erase(text.find_last_not_of('0') + 1);
    if (text.back() == '.') {
        text.pop_back();
    }
    return text + " " + units[unit];
}

std::string FormatDuration(double seconds) {
    if (seconds < 0.0) {
        seconds = 0.0;
    }
    auto minutes = static_cast<long long>(std::floor(seconds / 60.0));
    double rest = seconds - static_cast<double>(minutes) * 60.0;
    std::ostringstream oss;
    oss.precision(1);
    oss << minutes << "m " << std::fixed << rest << "s";
    return oss.str();
}

}  // namespace arcwalk::system
