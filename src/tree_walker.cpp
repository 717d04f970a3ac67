#include "arcwalk/tree_walker.hpp"

#include "arcwalk/log.hpp"

#include <algorithm>
#include <string>
#include <system_error>
#include <utility>

namespace arcwalk::walk {

namespace fs = std::filesystem;

namespace {

// lstat-style size: a symlink counts as the length of its target string.
bool EntrySize(const fs::path& file, std::uint64_t& size) {
    std::error_code ec;
    fs::file_status status = fs::symlink_status(file, ec);
    if (ec || !fs::exists(status)) {
        return false;
    }
    if (fs::is_symlink(status)) {
        fs::path target = fs::read_symlink(file, ec);
        if (ec) {
            return false;
        }
        size = static_cast<std::uint64_t>(target.native().size());
        return true;
    }
    if (!fs::is_regular_file(status)) {
        size = 0;
        return true;
    }
    std::uintmax_t raw = fs::file_size(file, ec);
    if (ec) {
        return false;
    }
    size = static_cast<std::uint64_t>(raw);
    return true;
}

}  // namespace

WalkCursor::WalkCursor(std::vector<fs::path> roots,
                       std::vector<fs::path> excluded,
                       std::shared_ptr<path::Matcher> matcher,
                       progress::ObserverList observers,
                       std::size_t progress_interval,
                       bool report_errors)
    : roots_(std::move(roots)),
      excluded_(std::move(excluded)),
      matcher_(std::move(matcher)),
      observers_(std::move(observers)),
      progress_interval_(progress_interval),
      report_errors_(report_errors) {}

bool WalkCursor::Next(WalkEntry& out) {
    while (true) {
        if (!ready_.empty()) {
            out = std::move(ready_.front());
            ready_.pop_front();
            if (out.kind == EntryKind::File) {
                ++files_yielded_;
                if (progress_interval_ > 0 && files_yielded_ % progress_interval_ == 0) {
                    progress::Notify(observers_, std::to_string(files_yielded_) + " files queued...");
                }
            }
            return true;
        }
        if (!pending_dirs_.empty()) {
            fs::path dir = std::move(pending_dirs_.back());
            pending_dirs_.pop_back();
            ExpandDirectory(dir);
            continue;
        }
        if (next_root_ < roots_.size()) {
            StartRoot(roots_[next_root_++]);
            continue;
        }
        return false;
    }
}

bool WalkCursor::IsExcluded(const fs::path& candidate) {
    return !excluded_.empty() && matcher_->IsUnderAny(candidate.string(), excluded_);
}

void WalkCursor::StartRoot(const fs::path& root) {
    if (IsExcluded(root)) {
        if (report_errors_) {
            log::Warn("Source root lies inside an excluded directory, skipping: " + root.string());
        }
        return;
    }
    std::error_code ec;
    bool is_dir = fs::is_directory(root, ec);
    ready_.push_back({root, is_dir ? EntryKind::Directory : EntryKind::File});
    if (is_dir) {
        pending_dirs_.push_back(root);
    }
}

void WalkCursor::ExpandDirectory(const fs::path& dir) {
    std::error_code ec;
    fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        if (report_errors_) {
            log::Warn("Cannot read directory " + dir.string() + ": " + ec.message());
        }
        return;
    }

    std::vector<fs::path> dirs;
    std::vector<fs::path> files;
    std::vector<fs::path> descend;
    const fs::directory_iterator end;
    while (it != end) {
        const fs::directory_entry& entry = *it;
        std::error_code kind_ec;
        bool is_dir = entry.is_directory(kind_ec);
        if (is_dir) {
            if (!IsExcluded(entry.path())) {
                dirs.push_back(entry.path());
                std::error_code link_ec;
                if (!entry.is_symlink(link_ec)) {
                    descend.push_back(entry.path());
                }
            }
        } else if (!IsExcluded(entry.path())) {
            files.push_back(entry.path());
        }
        it.increment(ec);
        if (ec) {
            if (report_errors_) {
                log::Warn("Listing of " + dir.string() + " interrupted: " + ec.message());
            }
            break;
        }
    }

    for (auto& child : dirs) {
        ready_.push_back({std::move(child), EntryKind::Directory});
    }
    for (auto& child : files) {
        ready_.push_back({std::move(child), EntryKind::File});
    }
    // Reverse so the first child directory is expanded next (pre-order).
    for (auto rit = descend.rbegin(); rit != descend.rend(); ++rit) {
        pending_dirs_.push_back(std::move(*rit));
    }
}

TreeWalker::TreeWalker(progress::ObserverList observers, std::size_t progress_interval)
    : observers_(std::move(observers)),
      progress_interval_(progress_interval),
      matcher_(std::make_shared<path::Matcher>()) {}

Totals TreeWalker::ScanTotals(const std::vector<fs::path>& roots,
                              const std::vector<fs::path>& excluded) const {
    Totals totals;
    WalkCursor cursor(roots, excluded, matcher_, {}, 0, false);
    WalkEntry entry;
    while (cursor.Next(entry)) {
        if (entry.IsDirectory()) {
            continue;
        }
        std::uint64_t size = 0;
        if (!EntrySize(entry.path, size)) {
            continue;
        }
        totals.files += 1;
        totals.bytes += size;
    }
    return totals;
}

WalkCursor TreeWalker::Walk(const std::vector<fs::path>& roots,
                            const std::vector<fs::path>& excluded) const {
    return WalkCursor(roots, excluded, matcher_, observers_, progress_interval_, true);
}

}  // namespace arcwalk::walk
