#include "arcwalk/executor.hpp"

#include "arcwalk/digest.hpp"
#include "arcwalk/errors.hpp"
#include "arcwalk/external_tool.hpp"
#include "arcwalk/list_file.hpp"
#include "arcwalk/log.hpp"
#include "arcwalk/manifest.hpp"
#include "arcwalk/native_zip.hpp"
#include "arcwalk/system_info.hpp"

#include <chrono>
#include <cmath>
#include <optional>
#include <system_error>
#include <utility>

namespace arcwalk {

namespace fs = std::filesystem;

namespace {

void RemovePartial(const fs::path& output) {
    std::error_code ec;
    if (!fs::exists(output, ec)) {
        return;
    }
    fs::remove(output, ec);
    if (ec) {
        log::Warn("Could not remove partial archive " + output.string() + ": " + ec.message());
    } else {
        log::Warn("Removed partial archive " + output.string());
    }
}

Executor::Hooks WithDefaults(Executor::Hooks hooks, const Config& config) {
    if (!hooks.locator) {
        hooks.locator = config.tool_path.empty() ? tool::DefaultLocator()
                                                 : tool::FixedLocator(config.tool_path);
    }
    if (!hooks.runner) {
        hooks.runner = process::DefaultRunner();
    }
    if (!hooks.free_space) {
        hooks.free_space = [](const fs::path& path) { return system::FreeSpace(path); };
    }
    return hooks;
}

// The run's own archive, manifest and list files must never be walked, even
// when the output directory lies inside a source.
Config ExcludingRunFiles(const Config& config, const fs::path& output) {
    Config run = config;
    run.excluded.push_back(output);
    run.excluded.push_back(manifest::ManifestPath(output));
    run.excluded.push_back(strategy::ListFilePath(output, 1));
    run.excluded.push_back(strategy::ListFilePath(output, 2));
    return run;
}

}  // namespace

bool HasEnoughSpace(std::uint64_t free_bytes, std::uint64_t needed_bytes, double safety_factor) {
    const long double required = std::floor(static_cast<long double>(needed_bytes) * safety_factor);
    return static_cast<long double>(free_bytes) >= required;
}

std::string SafeTimestamp(std::time_t when) {
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &when);
#else
    localtime_r(&when, &tm);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H-%M-%S", &tm);
    return buf;
}

fs::path UniqueOutputPath(const fs::path& dir,
                          const std::string& prefix,
                          const std::string& timestamp,
                          const std::string& extension) {
    const std::string stem = prefix + "_" + timestamp;
    fs::path candidate = dir / (stem + "." + extension);
    for (int n = 1; ; ++n) {
        std::error_code ec;
        if (!fs::exists(candidate, ec) && !fs::exists(manifest::ManifestPath(candidate), ec)) {
            return candidate;
        }
        candidate = dir / (stem + "_" + std::to_string(n) + "." + extension);
    }
}

Executor::Executor(const Config& config, progress::ObserverList observers)
    : Executor(config, std::move(observers), Hooks{}) {}

Executor::Executor(const Config& config, progress::ObserverList observers, Hooks hooks)
    : config_(config),
      observers_(std::move(observers)),
      hooks_(WithDefaults(std::move(hooks), config)),
      walker_(observers_) {}

void Executor::Report(const std::string& message) const {
    progress::Notify(observers_, message);
}

std::unique_ptr<strategy::ArchiveStrategy> Executor::PickStrategy() const {
    if (config_.force_native) {
        return std::make_unique<strategy::NativeZipStrategy>();
    }
    std::optional<fs::path> tool = hooks_.locator();
    if (!tool) {
        if (config_.preferred_format == ArchiveFormat::SevenZip) {
            log::Warn("7-Zip not found; writing a zip archive instead of 7z");
        }
        return std::make_unique<strategy::NativeZipStrategy>();
    }
    if (config_.preferred_format == ArchiveFormat::SevenZip) {
        return std::make_unique<strategy::External7zStrategy>(*tool, hooks_.runner);
    }
    return std::make_unique<strategy::ExternalZipStrategy>(*tool, hooks_.runner);
}

void Executor::CreateArchive(strategy::ArchiveStrategy& chosen, const fs::path& output) {
    try {
        const Config run = ExcludingRunFiles(config_, output);
        chosen.Create(walker_, run, output);
    } catch (...) {
        RemovePartial(output);
        throw;
    }
}

RunResult Executor::Run() {
    Report("Starting backup (" + config::FormatName(config_.preferred_format) + " preferred)...");

    const walk::Totals totals = walker_.ScanTotals(config_.sources, config_.excluded);
    if (totals.files == 0 || totals.bytes == 0) {
        throw EmptyInputError("Nothing to back up; check the source paths");
    }
    Report("Found " + std::to_string(totals.files) + " files, " + system::FormatBytes(totals.bytes));

    std::uint64_t available = 0;
    try {
        available = hooks_.free_space(config_.output_dir);
    } catch (const fs::filesystem_error& exc) {
        throw ArchiveError("Cannot query free space of " + config_.output_dir.string() + ": " + exc.what());
    }
    if (!HasEnoughSpace(available, totals.bytes, config_.safety_factor)) {
        throw InsufficientSpaceError("Insufficient space in " + config_.output_dir.string() + ": need ~"
                                         + system::FormatBytes(totals.bytes) + ", "
                                         + system::FormatBytes(available) + " available",
                                     totals.bytes,
                                     available);
    }

    std::unique_ptr<strategy::ArchiveStrategy> chosen = PickStrategy();
    const std::string timestamp = SafeTimestamp(std::time(nullptr));
    fs::path output = UniqueOutputPath(config_.output_dir, config_.prefix, timestamp, chosen->Extension());

    manifest::Record record;
    record.output = output;
    record.created_at = manifest::LocalTimestamp(std::time(nullptr));
    record.preferred_format = config::FormatName(config_.preferred_format);
    record.used_format = chosen->FormatName();
    record.strategy = chosen->Name();
    record.sources = config_.sources;
    record.excluded = config_.excluded;
    record.totals = totals;
    record.zip_level = config_.zip_level;
    record.seven_z_level = config_.seven_z_level;
    record.threads_hint = config_.threads;
    manifest::Recorder recorder;
    recorder.Begin(std::move(record));

    log::Info("Writing " + output.string() + " (" + chosen->Name() + ")");
    const auto start = std::chrono::steady_clock::now();
    try {
        CreateArchive(*chosen, output);
    } catch (const ToolNotFoundError& exc) {
        log::Warn(std::string(exc.what()) + "; falling back to native zip");
        chosen = std::make_unique<strategy::NativeZipStrategy>();
        output = UniqueOutputPath(config_.output_dir, config_.prefix, timestamp, chosen->Extension());
        recorder.UpdateFormat(output, chosen->FormatName(), chosen->Name());
        CreateArchive(*chosen, output);
    }
    const double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    RunResult result;
    result.archive = output;
    result.used_format = chosen->Format();
    result.strategy = chosen->Name();
    result.totals = totals;
    result.elapsed_seconds = elapsed;
    try {
        result.output_size = static_cast<std::uint64_t>(fs::file_size(output));
        result.output_sha256 = digest::Sha256File(output);

        Report(std::string(60, '='));
        Report("Archive: " + output.string());
        Report("Final size: " + system::FormatBytes(result.output_size) + " (source ~"
               + system::FormatBytes(totals.bytes) + ")");
        Report("Duration: " + system::FormatDuration(elapsed));
        Report(std::string(60, '='));

        recorder.Finish({elapsed, result.output_size, result.output_sha256});
    } catch (...) {
        RemovePartial(output);
        throw;
    }
    result.manifest = recorder.Path();
    return result;
}

}  // namespace arcwalk
