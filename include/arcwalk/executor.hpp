#pragma once

#include <cstdint>
#include <ctime>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

#include "arcwalk/config.hpp"
#include "arcwalk/process.hpp"
#include "arcwalk/progress.hpp"
#include "arcwalk/strategy.hpp"
#include "arcwalk/tool_locator.hpp"
#include "arcwalk/tree_walker.hpp"

namespace arcwalk {

using FreeSpaceProbe = std::function<std::uint64_t(const std::filesystem::path&)>;

struct RunResult {
    std::filesystem::path archive;
    std::filesystem::path manifest;
    ArchiveFormat used_format = ArchiveFormat::Zip;
    std::string strategy;
    walk::Totals totals;
    double elapsed_seconds = 0.0;
    std::uint64_t output_size = 0;
    std::string output_sha256;
};

// True iff `free_bytes >= floor(needed_bytes * safety_factor)`.
bool HasEnoughSpace(std::uint64_t free_bytes, std::uint64_t needed_bytes, double safety_factor);

// Local time as "YYYY-MM-DDTHH-MM-SS" (no ':' so it is valid in file names).
std::string SafeTimestamp(std::time_t when);

// `<dir>/<prefix>_<timestamp>.<ext>`, or `..._<n>.<ext>` if that name is taken.
std::filesystem::path UniqueOutputPath(const std::filesystem::path& dir,
                                       const std::string& prefix,
                                       const std::string& timestamp,
                                       const std::string& extension);

// Runs one backup job end to end: scan, space check, strategy choice,
// manifest, archive creation and cleanup of a partial archive on failure.
class Executor {
public:
    struct Hooks {
        tool::Locator locator;       // defaults to config.tool_path or tool::DefaultLocator()
        process::Runner runner;      // defaults to process::DefaultRunner()
        FreeSpaceProbe free_space;   // defaults to system::FreeSpace
    };

    Executor(const Config& config, progress::ObserverList observers);
    Executor(const Config& config, progress::ObserverList observers, Hooks hooks);

    // Throws EmptyInputError, InsufficientSpaceError, ArchiveError, ManifestError.
    RunResult Run();

    std::unique_ptr<strategy::ArchiveStrategy> PickStrategy() const;

private:
    void CreateArchive(strategy::ArchiveStrategy& chosen, const std::filesystem::path& output);
    void Report(const std::string& message) const;

    const Config& config_;
    progress::ObserverList observers_;
    Hooks hooks_;
    walk::TreeWalker walker_;
};

}  // namespace arcwalk
