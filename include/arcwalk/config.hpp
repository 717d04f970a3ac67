#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "arcwalk/constants.hpp"

namespace arcwalk {

enum class ArchiveFormat {
    Zip,
    SevenZip
};

// Raw, unvalidated input gathered from flags and the environment.
struct ConfigOptions {
    std::vector<std::string> sources;
    std::string output_dir;
    std::vector<std::string> excluded;
    std::string preferred_format = std::string(constants::kFormatZip);
    int zip_level = constants::kDefaultZipLevel;
    int seven_z_level = constants::kDefault7zLevel;
    std::string prefix = std::string(constants::kDefaultPrefix);
    bool force_native = false;
    std::string tool_path;
    double safety_factor = constants::kDefaultSafetyFactor;
};

// Validated run configuration. Built once by config::Load and shared by const
// reference; nothing downstream mutates it.
struct Config {
    std::vector<std::filesystem::path> sources;
    std::filesystem::path output_dir;
    std::vector<std::filesystem::path> excluded;
    ArchiveFormat preferred_format = ArchiveFormat::Zip;
    int zip_level = constants::kDefaultZipLevel;
    int seven_z_level = constants::kDefault7zLevel;
    int threads = 1;
    std::string prefix = std::string(constants::kDefaultPrefix);
    bool force_native = false;
    std::filesystem::path tool_path;
    double safety_factor = constants::kDefaultSafetyFactor;
};

namespace config {

// Validates and resolves `options`; creates the output directory.
// Throws ConfigurationError.
Config Load(const ConfigOptions& options);

// Defaults overlaid with ARCWALK_* environment variables.
ConfigOptions FromEnvironment();

int ClampLevel(int level);
std::string FormatName(ArchiveFormat format);
bool ParseFormat(const std::string& text, ArchiveFormat& out);

}  // namespace config
}  // namespace arcwalk
