#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "arcwalk/list_file.hpp"
#include "arcwalk/process.hpp"
#include "arcwalk/strategy.hpp"

namespace arcwalk::strategy {

// `-xr!<absolute>` and `-xr!*<name>*` for every excluded root.
std::vector<std::string> ExclusionArgs(const std::vector<std::filesystem::path>& excluded);

std::vector<std::string> BuildCommand(const std::filesystem::path& tool,
                                      const std::vector<std::string>& format_args,
                                      ListFileEncoding encoding,
                                      const std::filesystem::path& output,
                                      const std::filesystem::path& list_file,
                                      const std::vector<std::string>& exclusions);

// Writes the walk to a UTF-8 list-file and runs the tool on it. If the tool
// rejects a list-file line, retries once with a fresh UTF-16LE list-file.
// Every list-file is removed before returning. Throws ExternalProcessError.
void RunWithListFile(const process::Runner& runner,
                     const std::filesystem::path& tool,
                     const std::vector<std::string>& format_args,
                     const walk::TreeWalker& walker,
                     const Config& config,
                     const std::filesystem::path& output);

class ExternalToolStrategy : public ArchiveStrategy {
public:
    ExternalToolStrategy(std::filesystem::path tool, process::Runner runner);

    // Throws ToolNotFoundError before touching the output if the tool is gone.
    void Create(const walk::TreeWalker& walker,
                const Config& config,
                const std::filesystem::path& output) override;

protected:
    virtual std::vector<std::string> FormatArgs(const Config& config) const = 0;

private:
    std::filesystem::path tool_;
    process::Runner runner_;
};

// -tzip -mx=<zip level> -mm=Deflate
class ExternalZipStrategy : public ExternalToolStrategy {
public:
    using ExternalToolStrategy::ExternalToolStrategy;

    ArchiveFormat Format() const override { return ArchiveFormat::Zip; }
    std::string Name() const override { return "7z-zip"; }

protected:
    std::vector<std::string> FormatArgs(const Config& config) const override;
};

// -t7z -m0=LZMA2 -mx=<7z level> -ms=on
class External7zStrategy : public ExternalToolStrategy {
public:
    using ExternalToolStrategy::ExternalToolStrategy;

    ArchiveFormat Format() const override { return ArchiveFormat::SevenZip; }
    std::string Name() const override { return "7z-7z"; }

protected:
    std::vector<std::string> FormatArgs(const Config& config) const override;
};

}  // namespace arcwalk::strategy
