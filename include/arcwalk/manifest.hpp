#pragma once

#include <cstdint>
#include <ctime>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "arcwalk/tree_walker.hpp"

namespace arcwalk::manifest {

struct Record {
    std::filesystem::path output;
    std::string created_at;
    std::string preferred_format;
    std::string used_format;
    std::string strategy;
    std::vector<std::filesystem::path> sources;
    std::vector<std::filesystem::path> excluded;
    walk::Totals totals;
    int zip_level = 0;
    int seven_z_level = 0;
    int threads_hint = 1;
};

struct Completion {
    double elapsed_seconds = 0.0;
    std::uint64_t output_size = 0;
    std::string output_sha256;
};

// `<archive>.manifest.json`
std::filesystem::path ManifestPath(const std::filesystem::path& archive);

// Local time, "YYYY-MM-DDTHH:MM:SS".
std::string LocalTimestamp(std::time_t when);

std::string EscapeJson(const std::string& input);

// Pretty-printed document (2-space indent, trailing newline).
std::string Render(const Record& record, const std::optional<Completion>& completion);

// Side-file tracking one run: "running" once the archive is about to be
// written, "ok" with size and digest once it is finished. Each write replaces
// the whole file. Throws ManifestError.
class Recorder {
public:
    void Begin(Record record);

    // The run switched to another strategy; moves the record to the new output.
    void UpdateFormat(const std::filesystem::path& output,
                      const std::string& used_format,
                      const std::string& strategy);

    void Finish(const Completion& completion);

    const std::filesystem::path& Path() const noexcept { return path_; }

private:
    void Write(const std::optional<Completion>& completion) const;

    Record record_;
    std::filesystem::path path_;
    bool started_ = false;
};

}  // namespace arcwalk::manifest
