#include "arcwalk/digest.hpp"
#include "arcwalk/env.hpp"
#include "arcwalk/errors.hpp"
#include "arcwalk/executor.hpp"
#include "arcwalk/manifest.hpp"
#include "arcwalk/system_info.hpp"
#include "arcwalk/zip_reader.hpp"

#include "test_support.hpp"

#include <algorithm>
#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

using arcwalk::testing::Fail;
using arcwalk::testing::ReadFile;
using arcwalk::testing::TempDir;
using arcwalk::testing::WriteFile;

namespace fs = std::filesystem;

namespace {

class RecordingObserver : public arcwalk::progress::Observer {
public:
    void Update(const std::string& message) override { messages.push_back(message); }
    std::vector<std::string> messages;
};

arcwalk::Config MakeConfig(const fs::path& source, const fs::path& out, const std::string& format = "zip") {
    arcwalk::ConfigOptions options;
    options.sources = {source.string()};
    options.output_dir = out.string();
    options.preferred_format = format;
    return arcwalk::config::Load(options);
}

arcwalk::Executor::Hooks NoTool() {
    arcwalk::Executor::Hooks hooks;
    hooks.locator = arcwalk::tool::FixedLocator(std::nullopt);
    hooks.runner = [](const std::vector<std::string>&) -> arcwalk::process::Result {
        throw std::runtime_error("runner must not be called");
    };
    hooks.free_space = [](const fs::path&) { return std::uint64_t{1} << 40; };
    return hooks;
}

std::size_t CountFiles(const fs::path& dir) {
    std::error_code ec;
    if (!fs::exists(dir, ec)) {
        return 0;
    }
    return static_cast<std::size_t>(std::distance(fs::directory_iterator(dir), fs::directory_iterator()));
}

bool Contains(const std::string& text, const std::string& needle) {
    return text.find(needle) != std::string::npos;
}

// Writes the archive named before "@<list>" and answers with `result`.
arcwalk::process::Runner ScriptedRunner(arcwalk::process::Result result, int* calls) {
    return [result, calls](const std::vector<std::string>& args) {
        ++*calls;
        for (std::size_t i = 1; i < args.size(); ++i) {
            if (!args[i].empty() && args[i][0] == '@') {
                WriteFile(fs::path(args[i - 1]), "partial-archive");
            }
        }
        return result;
    };
}

}  // namespace

int main() {
    TempDir tmp("arcwalk-executor");
    const fs::path docs = tmp.Path() / "docs";
    WriteFile(docs / "a.txt", std::string(10, 'a'));
    WriteFile(docs / "b.txt", std::string(20, 'b'));
    const fs::path fake_tool = tmp.Path() / "bin" / "7z";
    WriteFile(fake_tool, "#!/bin/sh\n");

    if (!arcwalk::HasEnoughSpace(1050, 1000, 1.05) || arcwalk::HasEnoughSpace(1049, 1000, 1.05)) {
        return Fail("Space check boundary must be floor(needed * factor)");
    }
    if (!arcwalk::HasEnoughSpace(30, 30, 1.0)) {
        return Fail("Equal free space with factor 1.0 must pass");
    }

    const std::string stamp = arcwalk::SafeTimestamp(0);
    if (stamp.size() != 19 || stamp[10] != 'T' || stamp[13] != '-' || stamp[16] != '-'
        || stamp.find(':') != std::string::npos) {
        return Fail("Unexpected timestamp format: " + stamp);
    }

    {
        const fs::path dir = tmp.Path() / "collide";
        fs::create_directories(dir);
        WriteFile(dir / "Backup_T.zip", "x");
        fs::path next = arcwalk::UniqueOutputPath(dir, "Backup", "T", "zip");
        if (next.filename() != "Backup_T_1.zip") {
            return Fail("Collision suffix expected, got " + next.filename().string());
        }
    }

    if (arcwalk::manifest::EscapeJson("a\"b\\c\n\x01") != "a\\\"b\\\\c\\n\\u0001") {
        return Fail("JSON escaping incomplete");
    }

    if (arcwalk::system::FormatBytes(30) != "30 B" || arcwalk::system::FormatBytes(1536) != "1.5 KB"
        || arcwalk::system::FormatBytes(2048) != "2 KB" || arcwalk::system::FormatBytes(std::uint64_t{2} << 30) != "2 GB"
        || arcwalk::system::FormatBytes(1024 + 10) != "1.01 KB") {
        return Fail("Sizes must print with trailing zeros trimmed");
    }

    // Successful native run
    {
        const fs::path out = tmp.Path() / "out-ok";
        arcwalk::Config config = MakeConfig(docs, out);
        auto observer = std::make_shared<RecordingObserver>();
        arcwalk::Executor executor(config, {observer}, NoTool());
        arcwalk::RunResult result = executor.Run();

        if (result.strategy != "native-zip" || result.used_format != arcwalk::ArchiveFormat::Zip) {
            return Fail("Native strategy expected without a tool");
        }
        const std::string name = result.archive.filename().string();
        if (name.rfind("Backup_", 0) != 0 || result.archive.extension() != ".zip") {
            return Fail("Unexpected archive name " + name);
        }
        if (result.totals.files != 2 || result.totals.bytes != 30) {
            return Fail("Unexpected totals in result");
        }
        if (result.manifest != arcwalk::manifest::ManifestPath(result.archive)) {
            return Fail("Manifest must sit beside the archive");
        }
        const std::string json = ReadFile(result.manifest);
        const auto size = static_cast<std::uint64_t>(fs::file_size(result.archive));
        if (!Contains(json, "\"status\": \"ok\"")
            || !Contains(json, "\"output_size_bytes\": " + std::to_string(size))
            || !Contains(json, "\"output_sha256\": \"" + arcwalk::digest::Sha256File(result.archive) + "\"")
            || !Contains(json, "\"files\": 2") || !Contains(json, "\"bytes\": 30")
            || !Contains(json, "\"used_format\": \"zip\"") || !Contains(json, "\"elapsed_seconds\": ")) {
            return Fail("Manifest incomplete:\n" + json);
        }
        if (!arcwalk::zip::Verify(result.archive).Ok()) {
            return Fail("Executor archive failed verification");
        }
        bool announced = std::any_of(observer->messages.begin(), observer->messages.end(),
                                     [&](const std::string& m) { return Contains(m, result.archive.string()); });
        if (!announced) {
            return Fail("Observers must receive the archive path");
        }
    }

    // Nothing to archive
    {
        const fs::path empty = tmp.Path() / "empty-src";
        WriteFile(empty / "zero.txt", "");
        const fs::path out = tmp.Path() / "out-empty";
        arcwalk::Config config = MakeConfig(empty, out);
        arcwalk::Executor executor(config, {}, NoTool());
        bool threw = false;
        try {
            executor.Run();
        } catch (const arcwalk::EmptyInputError&) {
            threw = true;
        }
        if (!threw || CountFiles(out) != 0) {
            return Fail("Empty input must fail without creating files");
        }
    }

    // Not enough space
    {
        const fs::path out = tmp.Path() / "out-space";
        arcwalk::Config config = MakeConfig(docs, out);
        auto hooks = NoTool();
        hooks.free_space = [](const fs::path&) { return std::uint64_t{31}; };
        arcwalk::Executor executor(config, {}, hooks);
        bool threw = false;
        try {
            executor.Run();
        } catch (const arcwalk::InsufficientSpaceError& exc) {
            threw = exc.Needed() == 30 && exc.Available() == 31;
        }
        if (!threw || CountFiles(out) != 0) {
            return Fail("Insufficient space must fail before writing anything");
        }
    }

    // Strategy failure removes the partial archive, manifest stays running
    {
        const fs::path out = tmp.Path() / "out-fail";
        arcwalk::Config config = MakeConfig(docs, out);
        int calls = 0;
        auto hooks = NoTool();
        hooks.locator = arcwalk::tool::FixedLocator(fake_tool);
        hooks.runner = ScriptedRunner({2, "ERROR: disk full"}, &calls);
        arcwalk::Executor executor(config, {}, hooks);
        bool threw = false;
        try {
            executor.Run();
        } catch (const arcwalk::ExternalProcessError&) {
            threw = true;
        }
        if (!threw || calls != 1) {
            return Fail("Tool failure must propagate");
        }
        std::vector<fs::path> left(fs::directory_iterator(out), fs::directory_iterator{});
        if (left.size() != 1 || !Contains(left.front().filename().string(), ".manifest.json")) {
            return Fail("Only the manifest may remain after a failed run");
        }
        if (!Contains(ReadFile(left.front()), "\"status\": \"running\"")) {
            return Fail("Manifest of a failed run must stay running");
        }
    }

    // External 7z strategy
    {
        const fs::path out = tmp.Path() / "out-7z";
        arcwalk::Config config = MakeConfig(docs, out, "7z");
        int calls = 0;
        auto hooks = NoTool();
        hooks.locator = arcwalk::tool::FixedLocator(fake_tool);
        hooks.runner = ScriptedRunner({0, "Everything is Ok"}, &calls);
        arcwalk::Executor executor(config, {}, hooks);
        arcwalk::RunResult result = executor.Run();
        if (calls != 1 || result.used_format != arcwalk::ArchiveFormat::SevenZip
            || result.archive.extension() != ".7z" || result.strategy != "7z-7z") {
            return Fail("7z run did not use the external 7z strategy");
        }
        const std::string json = ReadFile(result.manifest);
        if (!Contains(json, "\"used_format\": \"7z\"") || !Contains(json, "\"preferred_format\": \"7z\"")
            || !Contains(json, "\"output_size_bytes\": 15")) {
            return Fail("7z manifest wrong:\n" + json);
        }
    }

    // Tool vanished between lookup and use: native fallback
    {
        const fs::path out = tmp.Path() / "out-fallback";
        arcwalk::Config config = MakeConfig(docs, out, "7z");
        auto hooks = NoTool();
        hooks.locator = arcwalk::tool::FixedLocator(tmp.Path() / "gone" / "7z");
        arcwalk::Executor executor(config, {}, hooks);
        arcwalk::RunResult result = executor.Run();
        if (result.strategy != "native-zip" || result.archive.extension() != ".zip") {
            return Fail("Missing tool must fall back to native zip");
        }
        if (CountFiles(out) != 2) {
            return Fail("Fallback must leave exactly the archive and its manifest");
        }
        const std::string json = ReadFile(result.manifest);
        if (!Contains(json, "\"used_format\": \"zip\"") || !Contains(json, "\"strategy\": \"native-zip\"")) {
            return Fail("Manifest not updated after fallback:\n" + json);
        }
    }

    // Output directory inside the source: the run never archives its own files
    {
        const fs::path home = tmp.Path() / "home";
        WriteFile(home / "a.txt", std::string(100 * 1024, 'h'));
        arcwalk::Config config = MakeConfig(home, home / "Backups");
        arcwalk::Executor executor(config, {}, NoTool());
        arcwalk::RunResult result = executor.Run();
        if (result.totals.files != 1) {
            return Fail("Only a.txt should be counted");
        }
        std::vector<arcwalk::zip::ZipEntry> entries = arcwalk::zip::ReadIndex(result.archive);
        bool found_source = false;
        for (const auto& entry : entries) {
            if (Contains(entry.name, "Backups/Backup_")) {
                return Fail("Archive contains its own output: " + entry.name);
            }
            found_source = found_source || Contains(entry.name, "a.txt");
        }
        if (!found_source || !arcwalk::zip::Verify(result.archive).Ok()) {
            return Fail("Nested output run lost the source file");
        }
    }

    // Same layout through the external tool: the list file names neither itself nor the manifest
    {
        const fs::path home = tmp.Path() / "home-ext";
        WriteFile(home / "a.txt", "external");
        arcwalk::Config config = MakeConfig(home, home / "Backups", "7z");
        std::string listed;
        auto hooks = NoTool();
        hooks.locator = arcwalk::tool::FixedLocator(fake_tool);
        hooks.runner = [&listed](const std::vector<std::string>& args) {
            for (std::size_t i = 1; i < args.size(); ++i) {
                if (!args[i].empty() && args[i][0] == '@') {
                    listed = ReadFile(fs::path(args[i].substr(1)));
                    WriteFile(fs::path(args[i - 1]), "archive");
                }
            }
            return arcwalk::process::Result{0, "Everything is Ok"};
        };
        arcwalk::Executor executor(config, {}, hooks);
        executor.Run();
        if (!Contains(listed, "a.txt")) {
            return Fail("List file must name the source file:\n" + listed);
        }
        if (Contains(listed, ".list-") || Contains(listed, ".manifest.json") || Contains(listed, "Backup_")) {
            return Fail("List file names the run's own files:\n" + listed);
        }
    }

    // Forced native ignores an available tool
    {
        arcwalk::ConfigOptions options;
        options.sources = {docs.string()};
        options.output_dir = (tmp.Path() / "out-forced").string();
        options.force_native = true;
        arcwalk::Config config = arcwalk::config::Load(options);
        auto hooks = NoTool();
        hooks.locator = arcwalk::tool::FixedLocator(fake_tool);
        arcwalk::Executor executor(config, {}, hooks);
        if (executor.PickStrategy()->Name() != "native-zip") {
            return Fail("Forced native must not use the external tool");
        }
    }

    // Configuration errors
    {
        arcwalk::ConfigOptions options;
        options.sources = {docs.string(), (docs / ".").string()};
        options.output_dir = (tmp.Path() / "out-config").string();
        bool threw = false;
        try {
            arcwalk::config::Load(options);
        } catch (const arcwalk::ConfigurationError&) {
            threw = true;
        }
        if (!threw) {
            return Fail("Duplicate source roots must be rejected");
        }
        options.sources = {(tmp.Path() / "nope").string()};
        threw = false;
        try {
            arcwalk::config::Load(options);
        } catch (const arcwalk::ConfigurationError&) {
            threw = true;
        }
        if (!threw) {
            return Fail("Missing source must be rejected");
        }
        options.sources = {docs.string()};
        options.preferred_format = "ZIP";
        options.zip_level = 42;
        arcwalk::Config config = arcwalk::config::Load(options);
        if (config.preferred_format != arcwalk::ArchiveFormat::Zip || config.zip_level != 9 || config.threads < 1) {
            return Fail("Format must be case-insensitive and levels clamped");
        }
    }

#if !defined(_WIN32)
    // Environment fallbacks
    {
        ::setenv("ARCWALK_SOURCES", "/srv/a::/srv/b", 1);
        ::setenv("ARCWALK_ZIP_LEVEL", "3", 1);
        ::setenv("ARCWALK_FORCE_NATIVE", "yes", 1);
        ::setenv("ARCWALK_FORMAT", "7z", 1);
        arcwalk::ConfigOptions options = arcwalk::config::FromEnvironment();
        ::unsetenv("ARCWALK_SOURCES");
        ::unsetenv("ARCWALK_ZIP_LEVEL");
        ::unsetenv("ARCWALK_FORCE_NATIVE");
        ::unsetenv("ARCWALK_FORMAT");
        if (options.sources != std::vector<std::string>{"/srv/a", "/srv/b"} || options.zip_level != 3
            || !options.force_native || options.preferred_format != "7z") {
            return Fail("Environment fallbacks not applied");
        }
        ::setenv("ARCWALK_ZIP_LEVEL", "fast", 1);
        bool ignored = !arcwalk::env::GetInt("ARCWALK_ZIP_LEVEL").has_value();
        ::unsetenv("ARCWALK_ZIP_LEVEL");
        if (!ignored) {
            return Fail("Non-numeric level must be ignored");
        }
    }
#endif

    std::cout << "executor tests passed" << std::endl;
    return 0;
}
