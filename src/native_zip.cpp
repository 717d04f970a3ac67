#include "arcwalk/native_zip.hpp"

#include "arcwalk/log.hpp"
#include "arcwalk/zip_writer.hpp"

#include <chrono>
#include <ctime>
#include <fstream>
#include <system_error>

namespace arcwalk::strategy {

namespace fs = std::filesystem;

namespace {

std::time_t ModifiedTime(const fs::path& path) {
    std::error_code ec;
    auto ftime = fs::last_write_time(path, ec);
    if (ec) {
        return std::time(nullptr);
    }
    auto sys = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        ftime - fs::file_time_type::clock::now() + std::chrono::system_clock::now());
    return std::chrono::system_clock::to_time_t(sys);
}

std::uint32_t UnixMode(const fs::path& path) {
    std::error_code ec;
    fs::file_status status = fs::status(path, ec);
    if (ec) {
        return 0644;
    }
    return static_cast<std::uint32_t>(status.permissions()) & 07777u;
}

}  // namespace

void NativeZipStrategy::Create(const walk::TreeWalker& walker,
                               const Config& config,
                               const fs::path& output) {
    log::Info("Creating zip archive natively (level " + std::to_string(config.zip_level) + ")");
    zip::Writer writer(output, config.zip_level);
    std::uint64_t skipped = 0;

    auto cursor = walker.Walk(config.sources, config.excluded);
    walk::WalkEntry entry;
    while (cursor.Next(entry)) {
        const std::string name = MemberName(entry.path, config.sources);
        if (entry.IsDirectory()) {
            writer.AddDirectory(name, ModifiedTime(entry.path));
            continue;
        }
        std::error_code ec;
        if (!fs::is_regular_file(entry.path, ec)) {
            log::Warn("Skipping " + entry.path.string() + ": "
                      + (ec ? ec.message() : std::string("not a regular file")));
            ++skipped;
            continue;
        }
        std::uintmax_t size = fs::file_size(entry.path, ec);
        if (ec) {
            log::Warn("Skipping " + entry.path.string() + ": " + ec.message());
            ++skipped;
            continue;
        }
        std::ifstream input(entry.path, std::ios::binary);
        if (!input) {
            log::Warn("Skipping " + entry.path.string() + ": cannot open for reading");
            ++skipped;
            continue;
        }
        try {
            writer.AddFile(name, input, static_cast<std::uint64_t>(size),
                           ModifiedTime(entry.path), UnixMode(entry.path));
        } catch (const zip::EntryError& exc) {
            log::Warn("Skipping " + entry.path.string() + ": " + exc.what());
            ++skipped;
        }
    }
    writer.Finish();
    if (skipped > 0) {
        log::Warn(std::to_string(skipped) + " entries could not be archived");
    }
}

}  // namespace arcwalk::strategy
