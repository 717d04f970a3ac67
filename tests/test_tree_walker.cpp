#include "arcwalk/tree_walker.hpp"

#include "test_support.hpp"

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

using arcwalk::testing::Fail;
using arcwalk::testing::TempDir;
using arcwalk::testing::WriteFile;

namespace fs = std::filesystem;

namespace {

class CountingObserver : public arcwalk::progress::Observer {
public:
    void Update(const std::string& message) override { messages.push_back(message); }
    std::vector<std::string> messages;
};

class ThrowingObserver : public arcwalk::progress::Observer {
public:
    void Update(const std::string&) override { throw std::runtime_error("observer failure"); }
};

std::vector<arcwalk::walk::WalkEntry> Collect(const arcwalk::walk::TreeWalker& walker,
                                              const std::vector<fs::path>& roots,
                                              const std::vector<fs::path>& excluded) {
    std::vector<arcwalk::walk::WalkEntry> entries;
    auto cursor = walker.Walk(roots, excluded);
    arcwalk::walk::WalkEntry entry;
    while (cursor.Next(entry)) {
        entries.push_back(entry);
    }
    return entries;
}

bool Contains(const std::vector<arcwalk::walk::WalkEntry>& entries, const fs::path& path) {
    return std::any_of(entries.begin(), entries.end(), [&](const auto& e) { return e.path == path; });
}

std::ptrdiff_t IndexOf(const std::vector<arcwalk::walk::WalkEntry>& entries, const fs::path& path) {
    auto it = std::find_if(entries.begin(), entries.end(), [&](const auto& e) { return e.path == path; });
    return it == entries.end() ? -1 : std::distance(entries.begin(), it);
}

}  // namespace

int main() {
    TempDir tmp("arcwalk-walker");
    const fs::path docs = tmp.Path() / "docs";
    WriteFile(docs / "a.txt", std::string(10, 'a'));
    WriteFile(docs / "b.txt", std::string(20, 'b'));
    WriteFile(docs / "sub" / "c.txt", "ccc");
    WriteFile(docs / "cache" / "big.bin", std::string(1000, 'x'));
    WriteFile(docs / "cache" / "nested" / "deep.bin", std::string(500, 'y'));

    arcwalk::walk::TreeWalker walker;

    auto totals = walker.ScanTotals({docs}, {});
    if (totals.files != 5 || totals.bytes != 10 + 20 + 3 + 1000 + 500) {
        return Fail("Unexpected totals without exclusions: " + std::to_string(totals.files) + " files, "
                    + std::to_string(totals.bytes) + " bytes");
    }

    auto pruned = walker.ScanTotals({docs}, {docs / "cache"});
    if (pruned.files != 3 || pruned.bytes != 33) {
        return Fail("Excluded subtree still counted");
    }

    auto entries = Collect(walker, {docs}, {docs / "cache"});
    if (entries.empty() || entries.front().path != docs || !entries.front().IsDirectory()) {
        return Fail("Walk must start with the root directory");
    }
    for (const auto& entry : entries) {
        std::string text = entry.path.string();
        if (text.find((docs / "cache").string()) == 0) {
            return Fail("Walk yielded an excluded path: " + text);
        }
    }
    if (!Contains(entries, docs / "a.txt") || !Contains(entries, docs / "b.txt")
        || !Contains(entries, docs / "sub") || !Contains(entries, docs / "sub" / "c.txt")) {
        return Fail("Walk missed a non-excluded entry");
    }
    if (entries.size() != 5) {
        return Fail("Expected 5 entries (root, sub, a, b, sub/c), got " + std::to_string(entries.size()));
    }
    // Child directories and files of a directory precede anything deeper.
    if (IndexOf(entries, docs / "sub") > IndexOf(entries, docs / "a.txt")
        || IndexOf(entries, docs / "sub" / "c.txt") < IndexOf(entries, docs / "b.txt")) {
        return Fail("Walk order is not directories, files, then descent");
    }

    auto again = Collect(walker, {docs}, {docs / "cache"});
    if (again.size() != entries.size()) {
        return Fail("A second walk must be independent and complete");
    }

    auto excluded_root = Collect(walker, {docs / "cache"}, {docs / "cache"});
    if (!excluded_root.empty()) {
        return Fail("A root inside an excluded directory must be skipped");
    }

    auto missing = Collect(walker, {tmp.Path() / "does-not-exist"}, {});
    if (missing.size() > 1) {
        return Fail("A missing root must not produce children");
    }

#if !defined(_WIN32)
    std::error_code ec;
    fs::create_directory_symlink(docs / "sub", docs / "link-to-sub", ec);
    if (!ec) {
        auto linked = Collect(walker, {docs}, {docs / "cache"});
        if (!Contains(linked, docs / "link-to-sub")) {
            return Fail("Symlinked directory must be yielded");
        }
        if (Contains(linked, docs / "link-to-sub" / "c.txt")) {
            return Fail("Symlinked directory must not be descended into");
        }
        fs::remove(docs / "link-to-sub", ec);
    }
#endif

    const fs::path many = tmp.Path() / "many";
    for (int i = 0; i < 2500; ++i) {
        WriteFile(many / ("f" + std::to_string(i)), "z");
    }
    auto counter = std::make_shared<CountingObserver>();
    arcwalk::walk::TreeWalker reporting({counter, std::make_shared<ThrowingObserver>()});
    auto cursor = reporting.Walk({many}, {});
    arcwalk::walk::WalkEntry entry;
    while (cursor.Next(entry)) {
    }
    if (cursor.FilesYielded() != 2500) {
        return Fail("Cursor counted " + std::to_string(cursor.FilesYielded()) + " files");
    }
    if (counter->messages.size() != 2 || counter->messages[0] != "1000 files queued..."
        || counter->messages[1] != "2000 files queued...") {
        return Fail("Unexpected progress notifications");
    }
    reporting.ScanTotals({many}, {});
    if (counter->messages.size() != 2) {
        return Fail("ScanTotals must not report progress");
    }

    std::cout << "tree_walker tests passed" << std::endl;
    return 0;
}
