#include "arcwalk/config.hpp"

#include "arcwalk/env.hpp"
#include "arcwalk/errors.hpp"
#include "arcwalk/log.hpp"
#include "arcwalk/path_matcher.hpp"
#include "arcwalk/system_info.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <set>
#include <system_error>

namespace arcwalk::config {

namespace fs = std::filesystem;

namespace {

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

fs::path ResolveLoose(const std::string& raw) {
    std::error_code ec;
    fs::path absolute = fs::absolute(fs::path(raw), ec);
    if (ec) {
        throw ConfigurationError("Cannot resolve path '" + raw + "': " + ec.message());
    }
    fs::path resolved = fs::weakly_canonical(absolute, ec);
    if (ec) {
        return absolute.lexically_normal();
    }
    return resolved;
}

std::vector<fs::path> ResolveSources(const std::vector<std::string>& raw_sources) {
    if (raw_sources.empty()) {
        throw ConfigurationError("No source directories configured");
    }
    std::vector<fs::path> sources;
    std::set<std::string> seen;
    for (const auto& raw : raw_sources) {
        std::error_code ec;
        if (raw.empty() || !fs::exists(fs::path(raw), ec)) {
            throw ConfigurationError("Source path does not exist: " + raw);
        }
        fs::path resolved = fs::canonical(fs::path(raw), ec);
        if (ec) {
            throw ConfigurationError("Cannot resolve source path '" + raw + "': " + ec.message());
        }
        if (!seen.insert(path::NormalizeUncached(resolved.string())).second) {
            throw ConfigurationError("Source path listed twice: " + resolved.string());
        }
        sources.push_back(resolved);
    }

    path::Matcher matcher;
    for (std::size_t i = 0; i < sources.size(); ++i) {
        for (std::size_t j = 0; j < sources.size(); ++j) {
            if (i != j && matcher.IsUnder(sources[i].string(), sources[j].string())) {
                log::Warn("Source " + sources[i].string() + " is nested inside " + sources[j].string()
                          + "; its contents will be archived twice");
            }
        }
    }
    return sources;
}

}  // namespace

int ClampLevel(int level) {
    return std::min(std::max(level, constants::kMinLevel), constants::kMaxLevel);
}

std::string FormatName(ArchiveFormat format) {
    return format == ArchiveFormat::SevenZip ? std::string(constants::kFormat7z)
                                             : std::string(constants::kFormatZip);
}

bool ParseFormat(const std::string& text, ArchiveFormat& out) {
    std::string lower = ToLower(text);
    if (lower == constants::kFormatZip) {
        out = ArchiveFormat::Zip;
        return true;
    }
    if (lower == constants::kFormat7z) {
        out = ArchiveFormat::SevenZip;
        return true;
    }
    return false;
}

Config Load(const ConfigOptions& options) {
    Config cfg;
    cfg.sources = ResolveSources(options.sources);

    if (options.output_dir.empty()) {
        throw ConfigurationError("No output directory configured");
    }
    std::error_code ec;
    fs::create_directories(fs::path(options.output_dir), ec);
    if (ec) {
        throw ConfigurationError("Cannot create output directory '" + options.output_dir + "': " + ec.message());
    }
    if (!fs::is_directory(fs::path(options.output_dir), ec)) {
        throw ConfigurationError("Output path is not a directory: " + options.output_dir);
    }
    cfg.output_dir = ResolveLoose(options.output_dir);

    for (const auto& raw : options.excluded) {
        if (raw.empty()) {
            continue;
        }
        cfg.excluded.push_back(ResolveLoose(raw));
    }

    if (!ParseFormat(options.preferred_format, cfg.preferred_format)) {
        throw ConfigurationError("Unknown archive format '" + options.preferred_format + "' (expected zip or 7z)");
    }
    cfg.zip_level = ClampLevel(options.zip_level);
    cfg.seven_z_level = ClampLevel(options.seven_z_level);
    cfg.threads = system::ThreadsHint(system::DetectCpuInfo());

    cfg.prefix = options.prefix.empty() ? std::string(constants::kDefaultPrefix) : options.prefix;
    if (cfg.prefix.find_first_of("/\\:") != std::string::npos) {
        throw ConfigurationError("Archive prefix must not contain path separators: " + cfg.prefix);
    }

    if (!std::isfinite(options.safety_factor) || options.safety_factor < 1.0) {
        throw ConfigurationError("Safety factor must be a number >= 1.0");
    }
    cfg.safety_factor = options.safety_factor;
    cfg.force_native = options.force_native;
    if (!options.tool_path.empty()) {
        cfg.tool_path = ResolveLoose(options.tool_path);
    }
    return cfg;
}

ConfigOptions FromEnvironment() {
    ConfigOptions options;
    options.sources = env::GetList(constants::kEnvSources);
    options.excluded = env::GetList(constants::kEnvExclude);
    options.output_dir = env::Get(constants::kEnvOutputDir);
    std::string format = env::Get(constants::kEnvFormat);
    if (!format.empty()) {
        options.preferred_format = format;
    }
    if (auto level = env::GetInt(constants::kEnvZipLevel)) {
        options.zip_level = *level;
    }
    if (auto level = env::GetInt(constants::kEnv7zLevel)) {
        options.seven_z_level = *level;
    }
    std::string prefix = env::Get(constants::kEnvPrefix);
    if (!prefix.empty()) {
        options.prefix = prefix;
    }
    options.force_native = env::IsEnabled(constants::kEnvForceNative, false);
    options.tool_path = env::Get(constants::kEnv7zBin);
    return options;
}

}  // namespace arcwalk::config
