#include "arcwalk/manifest.hpp"

#include "arcwalk/constants.hpp"
#include "arcwalk/errors.hpp"
#include "arcwalk/log.hpp"

#include <cstdio>
#include <fstream>
#include <system_error>
#include <utility>

namespace arcwalk::manifest {

namespace fs = std::filesystem;

namespace {

std::string Quote(const std::string& value) {
    return "\"" + EscapeJson(value) + "\"";
}

std::string FormatSeconds(double seconds) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.2f", seconds);
    return buf;
}

void AppendPathArray(std::string& json, const char* key, const std::vector<fs::path>& paths) {
    json += "  \"";
    json += key;
    json += "\": [";
    if (paths.empty()) {
        json += "],\n";
        return;
    }
    json += "\n";
    for (std::size_t i = 0; i < paths.size(); ++i) {
        json += "    " + Quote(paths[i].u8string());
        json += (i + 1 < paths.size()) ? ",\n" : "\n";
    }
    json += "  ],\n";
}

}  // namespace

fs::path ManifestPath(const fs::path& archive) {
    fs::path path = archive;
    path += std::string(constants::kManifestSuffix);
    return path;
}

std::string LocalTimestamp(std::time_t when) {
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &when);
#else
    localtime_r(&when, &tm);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    return buf;
}

std::string EscapeJson(const std::string& input) {
    std::string out;
    out.reserve(input.size());
    for (char ch : input) {
        switch (ch) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(ch) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(ch)));
                    out += buf;
                } else {
                    out.push_back(ch);
                }
        }
    }
    return out;
}

std::string Render(const Record& record, const std::optional<Completion>& completion) {
    std::string json = "{\n";
    json += "  \"output\": " + Quote(record.output.u8string()) + ",\n";
    json += "  \"created_at\": " + Quote(record.created_at) + ",\n";
    json += "  \"preferred_format\": " + Quote(record.preferred_format) + ",\n";
    json += "  \"used_format\": " + Quote(record.used_format) + ",\n";
    json += "  \"strategy\": " + Quote(record.strategy) + ",\n";
    AppendPathArray(json, "sources", record.sources);
    AppendPathArray(json, "excluded", record.excluded);
    json += "  \"totals\": {\n";
    json += "    \"files\": " + std::to_string(record.totals.files) + ",\n";
    json += "    \"bytes\": " + std::to_string(record.totals.bytes) + "\n";
    json += "  },\n";
    json += "  \"zip\": {\n    \"level\": " + std::to_string(record.zip_level) + "\n  },\n";
    json += "  \"7z\": {\n    \"level\": " + std::to_string(record.seven_z_level) + "\n  },\n";
    json += "  \"threads_hint\": " + std::to_string(record.threads_hint) + ",\n";
    if (completion) {
        json += "  \"status\": \"ok\",\n";
        json += "  \"elapsed_seconds\": " + FormatSeconds(completion->elapsed_seconds) + ",\n";
        json += "  \"output_size_bytes\": " + std::to_string(completion->output_size) + ",\n";
        json += "  \"output_sha256\": " + Quote(completion->output_sha256) + "\n";
    } else {
        json += "  \"status\": \"running\"\n";
    }
    json += "}\n";
    return json;
}

void Recorder::Begin(Record record) {
    record_ = std::move(record);
    path_ = ManifestPath(record_.output);
    Write(std::nullopt);
    started_ = true;
}

void Recorder::UpdateFormat(const fs::path& output,
                            const std::string& used_format,
                            const std::string& strategy) {
    if (!started_) {
        throw ManifestError("Manifest updated before it was started");
    }
    fs::path previous = path_;
    record_.output = output;
    record_.used_format = used_format;
    record_.strategy = strategy;
    path_ = ManifestPath(output);
    Write(std::nullopt);
    if (previous != path_) {
        std::error_code ec;
        fs::remove(previous, ec);
        if (ec) {
            log::Warn("Could not remove stale manifest " + previous.string() + ": " + ec.message());
        }
    }
}

void Recorder::Finish(const Completion& completion) {
    if (!started_) {
        throw ManifestError("Manifest finished before it was started");
    }
    Write(completion);
}

void Recorder::Write(const std::optional<Completion>& completion) const {
    const std::string json = Render(record_, completion);
    std::ofstream out(path_, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw ManifestError("Failed to open manifest: " + path_.string());
    }
    out.write(json.data(), static_cast<std::streamsize>(json.size()));
    out.close();
    if (!out) {
        throw ManifestError("Failed to write manifest: " + path_.string());
    }
}

}  // namespace arcwalk::manifest
