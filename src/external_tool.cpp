#include "arcwalk/external_tool.hpp"

#include "arcwalk/constants.hpp"
#include "arcwalk/errors.hpp"
#include "arcwalk/log.hpp"

#include <system_error>
#include <utility>

namespace arcwalk::strategy {

namespace fs = std::filesystem;

namespace {

bool IsListFileRejection(const process::Result& result) {
    return result.output.find(constants::kListFileRejectSignal) != std::string::npos;
}

std::string Tail(const std::string& output) {
    constexpr std::size_t kMaxTail = 2000;
    if (output.size() <= kMaxTail) {
        return output;
    }
    return "..." + output.substr(output.size() - kMaxTail);
}

[[noreturn]] void ThrowToolFailure(const process::Result& result) {
    throw ExternalProcessError("7-Zip failed (exit " + std::to_string(result.exit_code) + "): "
                                   + Tail(result.output),
                               result.exit_code,
                               result.output);
}

}  // namespace

std::vector<std::string> ExclusionArgs(const std::vector<fs::path>& excluded) {
    std::vector<std::string> args;
    args.reserve(excluded.size() * 2);
    for (const auto& dir : excluded) {
        args.push_back("-xr!" + dir.string());
        fs::path name = dir.filename();
        if (name.empty()) {
            name = dir.parent_path().filename();
        }
        if (!name.empty()) {
            args.push_back("-xr!*" + name.string() + "*");
        }
    }
    return args;
}

std::vector<std::string> BuildCommand(const fs::path& tool,
                                      const std::vector<std::string>& format_args,
                                      ListFileEncoding encoding,
                                      const fs::path& output,
                                      const fs::path& list_file,
                                      const std::vector<std::string>& exclusions) {
    std::vector<std::string> args;
    args.push_back(tool.string());
    args.push_back("a");
    args.insert(args.end(), format_args.begin(), format_args.end());
    args.push_back(CharsetFlag(encoding));
    args.push_back("-spf2");
    args.push_back(output.string());
    args.push_back("@" + list_file.string());
    args.insert(args.end(), exclusions.begin(), exclusions.end());
    return args;
}

void RunWithListFile(const process::Runner& runner,
                     const fs::path& tool,
                     const std::vector<std::string>& format_args,
                     const walk::TreeWalker& walker,
                     const Config& config,
                     const fs::path& output) {
    const std::vector<std::string> exclusions = ExclusionArgs(config.excluded);
    process::Result first;
    {
        ScopedListFile list(ListFilePath(output, 1),
                            walker.Walk(config.sources, config.excluded),
                            ListFileEncoding::Utf8);
        first = runner(BuildCommand(tool, format_args, list.Encoding(), output, list.Path(), exclusions));
    }
    if (first.exit_code == 0) {
        return;
    }
    if (!IsListFileRejection(first)) {
        ThrowToolFailure(first);
    }

    log::Warn("7-Zip rejected the UTF-8 list file; retrying with UTF-16LE...");
    // 7-Zip may leave a partial archive behind; "a" would append to it
    std::error_code ec;
    fs::remove(output, ec);
    ScopedListFile list(ListFilePath(output, 2),
                        walker.Walk(config.sources, config.excluded),
                        ListFileEncoding::Utf16Le);
    process::Result second = runner(BuildCommand(tool, format_args, list.Encoding(), output, list.Path(), exclusions));
    if (second.exit_code != 0) {
        ThrowToolFailure(second);
    }
}

ExternalToolStrategy::ExternalToolStrategy(fs::path tool, process::Runner runner)
    : tool_(std::move(tool)), runner_(std::move(runner)) {
    if (!runner_) {
        runner_ = process::DefaultRunner();
    }
}

void ExternalToolStrategy::Create(const walk::TreeWalker& walker,
                                  const Config& config,
                                  const fs::path& output) {
    std::error_code ec;
    if (tool_.empty() || !fs::exists(tool_, ec)) {
        throw ToolNotFoundError("7-Zip executable not found: " + tool_.string());
    }
    log::Info("Creating " + FormatName() + " archive with " + tool_.string());
    RunWithListFile(runner_, tool_, FormatArgs(config), walker, config, output);
}

std::vector<std::string> ExternalZipStrategy::FormatArgs(const Config& config) const {
    return {"-tzip", "-mx=" + std::to_string(config.zip_level), "-mm=Deflate", "-mmt=on"};
}

std::vector<std::string> External7zStrategy::FormatArgs(const Config& config) const {
    return {"-t7z", "-m0=LZMA2", "-mx=" + std::to_string(config.seven_z_level), "-mmt=on", "-ms=on"};
}

}  // namespace arcwalk::strategy
