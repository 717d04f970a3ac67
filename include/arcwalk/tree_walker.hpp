#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <memory>
#include <vector>

#include "arcwalk/constants.hpp"
#include "arcwalk/path_matcher.hpp"
#include "arcwalk/progress.hpp"

namespace arcwalk::walk {

enum class EntryKind {
    Directory,
    File
};

struct WalkEntry {
    std::filesystem::path path;
    EntryKind kind = EntryKind::File;

    bool IsDirectory() const noexcept { return kind == EntryKind::Directory; }
};

struct Totals {
    std::uint64_t files = 0;
    std::uint64_t bytes = 0;
};

// Pull-based pre-order traversal. Holds at most one directory listing plus the
// stack of directories still to visit; never the whole tree.
class WalkCursor {
public:
    WalkCursor(WalkCursor&&) = default;
    WalkCursor& operator=(WalkCursor&&) = default;
    WalkCursor(const WalkCursor&) = delete;
    WalkCursor& operator=(const WalkCursor&) = delete;

    // Returns false once every root is exhausted.
    bool Next(WalkEntry& out);

    std::uint64_t FilesYielded() const noexcept { return files_yielded_; }

private:
    friend class TreeWalker;

    WalkCursor(std::vector<std::filesystem::path> roots,
               std::vector<std::filesystem::path> excluded,
               std::shared_ptr<path::Matcher> matcher,
               progress::ObserverList observers,
               std::size_t progress_interval,
               bool report_errors);

    void StartRoot(const std::filesystem::path& root);
    void ExpandDirectory(const std::filesystem::path& dir);
    bool IsExcluded(const std::filesystem::path& candidate);

    std::vector<std::filesystem::path> roots_;
    std::vector<std::filesystem::path> excluded_;
    std::shared_ptr<path::Matcher> matcher_;
    progress::ObserverList observers_;
    std::size_t progress_interval_ = 0;
    bool report_errors_ = true;

    std::size_t next_root_ = 0;
    std::deque<WalkEntry> ready_;
    std::vector<std::filesystem::path> pending_dirs_;
    std::uint64_t files_yielded_ = 0;
};

class TreeWalker {
public:
    explicit TreeWalker(progress::ObserverList observers = {},
                        std::size_t progress_interval = constants::kProgressInterval);

    // Counts files and bytes under `roots`, pruning excluded subtrees. Unreadable
    // entries are skipped silently.
    Totals ScanTotals(const std::vector<std::filesystem::path>& roots,
                      const std::vector<std::filesystem::path>& excluded) const;

    // Each call returns an independent cursor over the same traversal.
    WalkCursor Walk(const std::vector<std::filesystem::path>& roots,
                    const std::vector<std::filesystem::path>& excluded) const;

private:
    progress::ObserverList observers_;
    std::size_t progress_interval_;
    std::shared_ptr<path::Matcher> matcher_;
};

}  // namespace arcwalk::walk
