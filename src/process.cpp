#include "arcwalk/process.hpp"

#include "arcwalk/errors.hpp"

#include <array>
#include <cstdio>
#include <sstream>

#if !defined(_WIN32)
#include <sys/wait.h>
#endif

namespace arcwalk::process {

namespace {

#if defined(_WIN32)
FILE* OpenPipe(const std::string& command) {
    return _popen(command.c_str(), "r");
}

int ClosePipe(FILE* pipe) {
    return _pclose(pipe);
}

int DecodeStatus(int status) {
    return status;
}
#else
FILE* OpenPipe(const std::string& command) {
    return popen(command.c_str(), "r");
}

int ClosePipe(FILE* pipe) {
    return pclose(pipe);
}

int DecodeStatus(int status) {
    if (status == -1) {
        return -1;
    }
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return status;
}
#endif

}  // namespace

std::string QuoteShellArg(const std::string& value) {
#ifdef _WIN32
    std::string out = "\"";
    for (char ch : value) {
        if (ch == '"') {
            out += "\\\"";
        } else {
            out.push_back(ch);
        }
    }
    out += "\"";
    return out;
#else
    std::string out = "'";
    for (char ch : value) {
        if (ch == '\'') {
            out += "'\\''";
        } else {
            out.push_back(ch);
        }
    }
    out += "'";
    return out;
#endif
}

std::string JoinArgs(const std::vector<std::string>& args) {
    std::ostringstream oss;
    bool first = true;
    for (const auto& arg : args) {
        if (!first) {
            oss << ' ';
        }
        first = false;
        oss << QuoteShellArg(arg);
    }
    return oss.str();
}

Result RunCapture(const std::vector<std::string>& args) {
    if (args.empty()) {
        throw ExternalProcessError("Empty command line", -1, {});
    }
    std::string cmd = JoinArgs(args);
#ifdef _WIN32
    cmd += " <NUL 2>&1";
#else
    cmd += " </dev/null 2>&1";
#endif
    FILE* pipe = OpenPipe(cmd);
    if (!pipe) {
        throw ExternalProcessError("Failed to start command: " + JoinArgs(args), -1, {});
    }
    Result result;
    std::array<char, 4096> buffer{};
    std::size_t got = 0;
    while ((got = std::fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
        result.output.append(buffer.data(), got);
    }
    result.exit_code = DecodeStatus(ClosePipe(pipe));
    return result;
}

Runner DefaultRunner() {
    return [](const std::vector<std::string>& args) { return RunCapture(args); };
}

}  // namespace arcwalk::process
