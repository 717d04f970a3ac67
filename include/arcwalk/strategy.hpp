#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "arcwalk/config.hpp"
#include "arcwalk/tree_walker.hpp"

namespace arcwalk::strategy {

// One way of turning the walk into an archive file. Implementations re-walk the
// tree in a single streaming pass and throw ArchiveError (or a subclass) on
// failure; the caller owns cleanup of a partial output.
class ArchiveStrategy {
public:
    virtual ~ArchiveStrategy() = default;

    virtual void Create(const walk::TreeWalker& walker,
                        const Config& config,
                        const std::filesystem::path& output) = 0;

    virtual ArchiveFormat Format() const = 0;
    virtual std::string Name() const = 0;

    std::string Extension() const { return config::FormatName(Format()); }
    std::string FormatName() const { return config::FormatName(Format()); }
};

// Archive member name for `entry`: relative to the parent of the longest root
// containing it, with '/' separators. Falls back to the bare file name.
std::string MemberName(const std::filesystem::path& entry,
                       const std::vector<std::filesystem::path>& roots);

}  // namespace arcwalk::strategy
