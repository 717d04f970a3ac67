#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace arcwalk::constants {

inline constexpr std::string_view kVersion = "1.0.0";

inline constexpr std::string_view kDefaultPrefix = "Backup";
inline constexpr std::string_view kManifestSuffix = ".manifest.json";
inline constexpr std::string_view kFormatZip = "zip";
inline constexpr std::string_view kFormat7z = "7z";

inline constexpr int kDefaultZipLevel = 6;
inline constexpr int kDefault7zLevel = 7;
inline constexpr int kMinLevel = 0;
inline constexpr int kMaxLevel = 9;
inline constexpr double kDefaultSafetyFactor = 1.05;

inline constexpr std::size_t kNormalizeCacheSize = 4096;
inline constexpr std::size_t kProgressInterval = 1000;
inline constexpr std::size_t kStreamChunkSize = 1u << 16;

// Printed by 7-Zip when it cannot decode a list-file line.
inline constexpr std::string_view kListFileRejectSignal = "Incorrect item in listfile";

inline constexpr std::string_view kEnvSources = "ARCWALK_SOURCES";
inline constexpr std::string_view kEnvExclude = "ARCWALK_EXCLUDE";
inline constexpr std::string_view kEnvOutputDir = "ARCWALK_OUTPUT_DIR";
inline constexpr std::string_view kEnvFormat = "ARCWALK_FORMAT";
inline constexpr std::string_view kEnvZipLevel = "ARCWALK_ZIP_LEVEL";
inline constexpr std::string_view kEnv7zLevel = "ARCWALK_7Z_LEVEL";
inline constexpr std::string_view kEnvPrefix = "ARCWALK_PREFIX";
inline constexpr std::string_view kEnvForceNative = "ARCWALK_FORCE_NATIVE";
inline constexpr std::string_view kEnv7zBin = "ARCWALK_7Z_BIN";
inline constexpr std::string_view kEnvNoColor = "ARCWALK_NO_COLOR";
inline constexpr std::string_view kEnvLogLevel = "ARCWALK_LOG_LEVEL";

}  // namespace arcwalk::constants
