#include "arcwalk/config.hpp"
#include "arcwalk/errors.hpp"
#include "arcwalk/external_tool.hpp"
#include "arcwalk/list_file.hpp"
#include "arcwalk/process.hpp"

#include "test_support.hpp"

#include <algorithm>
#include <utility>
#include <string>
#include <vector>

using arcwalk::testing::Fail;
using arcwalk::testing::ReadFile;
using arcwalk::testing::TempDir;
using arcwalk::testing::WriteFile;

namespace fs = std::filesystem;

namespace {

struct Call {
    std::vector<std::string> args;
    fs::path list_file;
    std::string list_bytes;
};

std::string CharsetOf(const std::vector<std::string>& args) {
    for (const auto& arg : args) {
        if (arg.rfind("-scs", 0) == 0) {
            return arg;
        }
    }
    return {};
}

// Fake 7-Zip: records each call and answers with the next scripted result.
class FakeTool {
public:
    explicit FakeTool(std::vector<arcwalk::process::Result> script) : script_(std::move(script)) {}

    arcwalk::process::Runner Runner() {
        return [this](const std::vector<std::string>& args) {
            Call call;
            call.args = args;
            for (const auto& arg : args) {
                if (!arg.empty() && arg[0] == '@') {
                    call.list_file = arg.substr(1);
                }
            }
            if (!call.list_file.empty() && fs::exists(call.list_file)) {
                call.list_bytes = ReadFile(call.list_file);
            }
            calls.push_back(call);
            arcwalk::process::Result result = script_.at(calls.size() - 1);
            if (result.exit_code == 0) {
                // output path precedes the list-file argument
                auto it = std::find(args.begin(), args.end(), "@" + call.list_file.string());
                if (it != args.begin()) {
                    WriteFile(fs::path(*(it - 1)), "PK-fake");
                }
            }
            return result;
        };
    }

    std::vector<Call> calls;

private:
    std::vector<arcwalk::process::Result> script_;
};

}  // namespace

int main() {
    TempDir tmp("arcwalk-external");
    const fs::path docs = tmp.Path() / "docs";
    WriteFile(docs / "a.txt", std::string(10, 'a'));
    WriteFile(docs / "b.txt", std::string(20, 'b'));
    WriteFile(docs / "cache" / "tmp.bin", "cache");
    const fs::path tool = tmp.Path() / "bin" / "7z";
    WriteFile(tool, "#!/bin/sh\n");

    arcwalk::ConfigOptions options;
    options.sources = {docs.string()};
    options.excluded = {(docs / "cache").string()};
    options.output_dir = (tmp.Path() / "out").string();
    const arcwalk::Config config = arcwalk::config::Load(options);
    arcwalk::walk::TreeWalker walker;

    // UTF-8 to UTF-16LE conversion
    if (arcwalk::strategy::Utf8ToUtf16Le("a\xC3\xA9") != std::string("a\0\xE9\0", 4)) {
        return Fail("BMP conversion to UTF-16LE wrong");
    }
    if (arcwalk::strategy::Utf8ToUtf16Le("\xF0\x9F\x98\x80") != std::string("\x3D\xD8\x00\xDE", 4)) {
        return Fail("Supplementary plane conversion must produce a surrogate pair");
    }
    if (arcwalk::strategy::Utf8ToUtf16Le("\xFF") != std::string("\xFD\xFF", 2)) {
        return Fail("Malformed UTF-8 must map to U+FFFD");
    }

    // Exclusion arguments
    {
        auto args = arcwalk::strategy::ExclusionArgs(config.excluded);
        std::vector<std::string> expected = {"-xr!" + config.excluded.front().string(), "-xr!*cache*"};
        if (args != expected) {
            return Fail("Unexpected exclusion arguments");
        }
    }

    // Retry scenario: list-file rejected, UTF-16LE retry succeeds
    {
        const fs::path output = config.output_dir / "retry.zip";
        FakeTool fake({{2, "ERROR: Incorrect item in listfile.\nCheck the charset"}, {0, "Everything is Ok"}});
        arcwalk::strategy::ExternalZipStrategy zip(tool, fake.Runner());
        zip.Create(walker, config, output);

        if (fake.calls.size() != 2) {
            return Fail("Expected exactly two tool invocations, got " + std::to_string(fake.calls.size()));
        }
        if (CharsetOf(fake.calls[0].args) != "-scsUTF-8" || CharsetOf(fake.calls[1].args) != "-scsUTF-16LE") {
            return Fail("Charset flags must go UTF-8 then UTF-16LE");
        }
        if (fake.calls[0].list_file == fake.calls[1].list_file) {
            return Fail("Retry must use a distinct list file");
        }
        for (const auto& call : fake.calls) {
            if (fs::exists(call.list_file)) {
                return Fail("List file left behind: " + call.list_file.string());
            }
        }
        const std::string expected_first = docs.u8string() + "\n";
        if (fake.calls[0].list_bytes.compare(0, expected_first.size(), expected_first) != 0) {
            return Fail("UTF-8 list file must start with the root path");
        }
        if (fake.calls[0].list_bytes.find("cache") != std::string::npos) {
            return Fail("Excluded paths must not reach the list file");
        }
        const std::string& wide = fake.calls[1].list_bytes;
        if (wide.size() != fake.calls[0].list_bytes.size() * 2 || wide.size() < 2 || wide[1] != '\0') {
            return Fail("Retry list file is not UTF-16LE without BOM");
        }
        const std::vector<std::string> expected_head = {
            tool.string(), "a", "-tzip", "-mx=6", "-mm=Deflate", "-mmt=on", "-scsUTF-8", "-spf2",
            output.string(), "@" + fake.calls[0].list_file.string()};
        if (!std::equal(expected_head.begin(), expected_head.end(), fake.calls[0].args.begin())) {
            return Fail("Unexpected zip command line: " + arcwalk::process::JoinArgs(fake.calls[0].args));
        }
        if (fake.calls[0].args.back() != "-xr!*cache*") {
            return Fail("Exclusions must close the command line");
        }
    }

    // 7z flags
    {
        const fs::path output = config.output_dir / "plain.7z";
        FakeTool fake({{0, "Everything is Ok"}});
        arcwalk::strategy::External7zStrategy seven(tool, fake.Runner());
        seven.Create(walker, config, output);
        const std::vector<std::string> expected_head = {
            tool.string(), "a", "-t7z", "-m0=LZMA2", "-mx=7", "-mmt=on", "-ms=on", "-scsUTF-8", "-spf2"};
        if (fake.calls.size() != 1
            || !std::equal(expected_head.begin(), expected_head.end(), fake.calls[0].args.begin())) {
            return Fail("Unexpected 7z command line");
        }
        if (seven.Extension() != "7z") {
            return Fail("7z strategy must produce .7z");
        }
    }

    // Failure without the retry signal
    {
        FakeTool fake({{2, "ERROR: disk full"}});
        arcwalk::strategy::ExternalZipStrategy zip(tool, fake.Runner());
        bool threw = false;
        try {
            zip.Create(walker, config, config.output_dir / "fail.zip");
        } catch (const arcwalk::ExternalProcessError& exc) {
            threw = exc.ExitCode() == 2 && exc.Output().find("disk full") != std::string::npos;
        }
        if (!threw || fake.calls.size() != 1) {
            return Fail("Non-signal failure must raise ExternalProcessError without retry");
        }
        if (fs::exists(fake.calls[0].list_file)) {
            return Fail("List file must be deleted after a failure");
        }
    }

    // Failure after the retry
    {
        FakeTool fake({{2, "Incorrect item in listfile"}, {7, "Incorrect item in listfile"}});
        arcwalk::strategy::ExternalZipStrategy zip(tool, fake.Runner());
        bool threw = false;
        try {
            zip.Create(walker, config, config.output_dir / "fail2.zip");
        } catch (const arcwalk::ExternalProcessError& exc) {
            threw = exc.ExitCode() == 7;
        }
        if (!threw || fake.calls.size() != 2) {
            return Fail("Second failure must raise ExternalProcessError");
        }
        for (const auto& call : fake.calls) {
            if (fs::exists(call.list_file)) {
                return Fail("List file left behind after double failure");
            }
        }
    }

    // Missing tool
    {
        FakeTool fake(std::vector<arcwalk::process::Result>{});
        arcwalk::strategy::ExternalZipStrategy zip(tmp.Path() / "missing" / "7z", fake.Runner());
        const fs::path output = config.output_dir / "missing.zip";
        bool threw = false;
        try {
            zip.Create(walker, config, output);
        } catch (const arcwalk::ToolNotFoundError&) {
            threw = true;
        }
        if (!threw || !fake.calls.empty() || fs::exists(arcwalk::strategy::ListFilePath(output, 1))) {
            return Fail("Missing tool must raise ToolNotFoundError before any work");
        }
    }

#if !defined(_WIN32)
    // Real process capture
    {
        auto result = arcwalk::process::RunCapture({"sh", "-c", "echo out; echo err 1>&2; exit 3"});
        if (result.exit_code != 3 || result.output.find("out") == std::string::npos
            || result.output.find("err") == std::string::npos) {
            return Fail("RunCapture must merge both streams and report the exit code");
        }
        if (arcwalk::process::QuoteShellArg("it's") != "'it'\\''s'") {
            return Fail("Unexpected shell quoting");
        }
    }
#endif

    std::cout << "external_tool tests passed" << std::endl;
    return 0;
}
