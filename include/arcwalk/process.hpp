#pragma once

#include <functional>
#include <string>
#include <vector>

namespace arcwalk::process {

struct Result {
    int exit_code = 0;
    std::string output;  // stdout and stderr, merged
};

// Runs argv[0] with the remaining arguments and waits for it to exit.
using Runner = std::function<Result(const std::vector<std::string>& args)>;

std::string QuoteShellArg(const std::string& value);
std::string JoinArgs(const std::vector<std::string>& args);

// Shell-quotes `args`, detaches stdin and captures both output streams.
// Throws ExternalProcessError if the process cannot be started.
Result RunCapture(const std::vector<std::string>& args);

Runner DefaultRunner();

}  // namespace arcwalk::process
