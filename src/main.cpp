#include "arcwalk/arcwalk.hpp"

#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

// Bad command line; reported with the usage text and exit code 2.
class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

void PrintUsage() {
    std::cout << "Usage:\n";
    std::cout << "  arcwalk backup [--source <dir>]... [--output <dir>] [--exclude <dir>]... [--format zip|7z]\n"
                 "                 [--zip-level <0-9>] [--7z-level <0-9>] [--prefix <name>] [--native]\n"
                 "                 [--7z-bin <path>] [--safety-factor <f>] [--quiet] [--no-color]\n";
    std::cout << "  arcwalk scan [--source <dir>]... [--exclude <dir>]... [--quiet] [--no-color]\n";
    std::cout << "  arcwalk verify <archive.zip> [--quiet] [--no-color]\n";
    std::cout << "  arcwalk --version\n";
    std::cout << "Environment fallbacks: ARCWALK_SOURCES, ARCWALK_EXCLUDE, ARCWALK_OUTPUT_DIR, ARCWALK_FORMAT,\n"
                 "  ARCWALK_ZIP_LEVEL, ARCWALK_7Z_LEVEL, ARCWALK_PREFIX, ARCWALK_FORCE_NATIVE, ARCWALK_7Z_BIN,\n"
                 "  ARCWALK_NO_COLOR, ARCWALK_LOG_LEVEL\n";
}

struct CliArgs {
    arcwalk::ConfigOptions options;
    std::vector<std::string> positional;
};

std::string NextValue(int argc, char** argv, int& idx, const std::string& flag) {
    if (idx + 1 >= argc) {
        throw UsageError("Missing value for " + flag);
    }
    idx += 1;
    return argv[idx];
}

int ParseIntFlag(const std::string& flag, const std::string& value) {
    try {
        std::size_t used = 0;
        int parsed = std::stoi(value, &used);
        if (used != value.size()) {
            throw UsageError("Invalid integer for " + flag + ": " + value);
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw UsageError("Invalid integer for " + flag + ": " + value);
    }
}

double ParseDoubleFlag(const std::string& flag, const std::string& value) {
    try {
        std::size_t used = 0;
        double parsed = std::stod(value, &used);
        if (used != value.size()) {
            throw UsageError("Invalid number for " + flag + ": " + value);
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw UsageError("Invalid number for " + flag + ": " + value);
    }
}

CliArgs ParseArgs(int argc, char** argv, int start_index) {
    CliArgs args;
    args.options = arcwalk::config::FromEnvironment();
    std::vector<std::string> sources;
    std::vector<std::string> excluded;
    int idx = start_index;
    while (idx < argc) {
        std::string flag(argv[idx]);
        if (flag == "--source" || flag == "-s") {
            sources.push_back(NextValue(argc, argv, idx, flag));
        } else if (flag == "--exclude" || flag == "-x") {
            excluded.push_back(NextValue(argc, argv, idx, flag));
        } else if (flag == "--output" || flag == "-o") {
            args.options.output_dir = NextValue(argc, argv, idx, flag);
        } else if (flag == "--format") {
            args.options.preferred_format = NextValue(argc, argv, idx, flag);
        } else if (flag == "--zip-level") {
            args.options.zip_level = ParseIntFlag(flag, NextValue(argc, argv, idx, flag));
        } else if (flag == "--7z-level") {
            args.options.seven_z_level = ParseIntFlag(flag, NextValue(argc, argv, idx, flag));
        } else if (flag == "--prefix") {
            args.options.prefix = NextValue(argc, argv, idx, flag);
        } else if (flag == "--native") {
            args.options.force_native = true;
        } else if (flag == "--7z-bin") {
            args.options.tool_path = NextValue(argc, argv, idx, flag);
        } else if (flag == "--safety-factor") {
            args.options.safety_factor = ParseDoubleFlag(flag, NextValue(argc, argv, idx, flag));
        } else if (flag == "--quiet" || flag == "-q") {
            arcwalk::log::SetMinLevel(arcwalk::log::Level::Warn);
        } else if (flag == "--no-color") {
            arcwalk::log::SetColorsEnabled(false);
        } else if (!flag.empty() && flag[0] == '-') {
            throw UsageError("Unknown flag: " + flag);
        } else {
            args.positional.push_back(flag);
        }
        idx += 1;
    }
    if (!sources.empty()) {
        args.options.sources = sources;
    }
    if (!excluded.empty()) {
        args.options.excluded = excluded;
    }
    return args;
}

void ApplyLoggingEnvironment() {
    if (arcwalk::env::IsEnabled(arcwalk::constants::kEnvNoColor)) {
        arcwalk::log::SetColorsEnabled(false);
    }
    std::string level = arcwalk::env::Get(arcwalk::constants::kEnvLogLevel);
    arcwalk::log::Level parsed = arcwalk::log::Level::Info;
    if (!level.empty()) {
        if (arcwalk::log::ParseLevel(level, parsed)) {
            arcwalk::log::SetMinLevel(parsed);
        } else {
            arcwalk::log::Warn("Ignoring unknown log level '" + level + "'");
        }
    }
}

int RunBackup(const CliArgs& args) {
    if (!args.positional.empty()) {
        throw UsageError("Unexpected argument: " + args.positional.front());
    }
    if (args.options.output_dir.empty()) {
        throw UsageError("An output directory is required (--output or ARCWALK_OUTPUT_DIR)");
    }
    arcwalk::Config config = arcwalk::config::Load(args.options);
    arcwalk::system::CpuInfo cpu = arcwalk::system::DetectCpuInfo();
    arcwalk::log::Info("arcwalk " + std::string(arcwalk::constants::kVersion) + " on " + cpu.os_name + "/"
                       + cpu.arch + ", " + std::to_string(cpu.logical_cores) + " logical cores");
    arcwalk::progress::ObserverList observers{std::make_shared<arcwalk::progress::ConsoleObserver>()};
    arcwalk::Executor executor(config, observers);
    arcwalk::RunResult result = executor.Run();
    arcwalk::log::Info("Backup completed: " + result.archive.string() + " [" + result.strategy + "]");
    arcwalk::log::Info("Manifest: " + result.manifest.string());
    return 0;
}

int RunScan(const CliArgs& args) {
    if (!args.positional.empty()) {
        throw UsageError("Unexpected argument: " + args.positional.front());
    }
    arcwalk::ConfigOptions options = args.options;
    if (options.output_dir.empty()) {
        // scan writes nothing; any existing directory satisfies the loader
        options.output_dir = std::filesystem::temp_directory_path().string();
    }
    arcwalk::Config config = arcwalk::config::Load(options);
    arcwalk::walk::TreeWalker walker;
    arcwalk::walk::Totals totals = walker.ScanTotals(config.sources, config.excluded);
    std::cout << "files: " << totals.files << "\n";
    std::cout << "bytes: " << totals.bytes << " (" << arcwalk::system::FormatBytes(totals.bytes) << ")\n";
    return 0;
}

int RunVerify(const CliArgs& args) {
    if (args.positional.size() != 1) {
        throw UsageError("verify expects exactly one archive path");
    }
    arcwalk::zip::VerifyReport report = arcwalk::zip::Verify(args.positional.front());
    for (const auto& failure : report.failures) {
        arcwalk::log::Error(failure);
    }
    std::cout << "directories: " << report.directories << "\n";
    std::cout << "files: " << report.files << "\n";
    std::cout << "bytes: " << report.bytes << "\n";
    if (!report.Ok()) {
        arcwalk::log::Error(std::to_string(report.failures.size()) + " member(s) failed verification");
        return 1;
    }
    arcwalk::log::Info("All members verified");
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return 2;
    }
    std::string command(argv[1]);
    if (command == "--help" || command == "-h" || command == "help") {
        PrintUsage();
        return 0;
    }
    if (command == "--version") {
        std::cout << "arcwalk " << arcwalk::constants::kVersion << "\n";
        return 0;
    }
    try {
        ApplyLoggingEnvironment();
        CliArgs args = ParseArgs(argc, argv, 2);
        if (command == "backup") {
            return RunBackup(args);
        }
        if (command == "scan") {
            return RunScan(args);
        }
        if (command == "verify") {
            return RunVerify(args);
        }
        PrintUsage();
        return 2;
    } catch (const UsageError& exc) {
        std::cerr << "Error: " << exc.what() << "\n";
        PrintUsage();
        return 2;
    } catch (const arcwalk::Error& exc) {
        arcwalk::log::Error(std::string("Fatal error (") + exc.Kind() + "): " + exc.what());
        return 1;
    } catch (const std::exception& exc) {
        arcwalk::log::Error(std::string("Fatal error: ") + exc.what());
        return 1;
    }
}
