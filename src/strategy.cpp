#include "arcwalk/strategy.hpp"

#include <algorithm>
#include <iterator>

namespace arcwalk::strategy {

namespace fs = std::filesystem;

namespace {

bool IsAncestor(const fs::path& root, const fs::path& candidate) {
    auto mismatch = std::mismatch(root.begin(), root.end(), candidate.begin(), candidate.end());
    if (mismatch.first == root.end()) {
        return true;
    }
    // "/data/" normalizes to a trailing empty component
    return mismatch.first->empty() && std::next(mismatch.first) == root.end();
}

std::size_t Depth(const fs::path& value) {
    return static_cast<std::size_t>(std::distance(value.begin(), value.end()));
}

}  // namespace

std::string MemberName(const fs::path& entry, const std::vector<fs::path>& roots) {
    const fs::path normal = fs::absolute(entry).lexically_normal();
    const fs::path* best = nullptr;
    std::size_t best_depth = 0;
    for (const auto& root : roots) {
        fs::path root_normal = fs::absolute(root).lexically_normal();
        if (!IsAncestor(root_normal, normal)) {
            continue;
        }
        std::size_t depth = Depth(root_normal);
        if (!best || depth > best_depth) {
            best = &root;
            best_depth = depth;
        }
    }
    if (best) {
        fs::path base = fs::absolute(*best).lexically_normal();
        if (!base.has_filename()) {
            base = base.parent_path();
        }
        fs::path rel = normal.lexically_relative(base.parent_path());
        if (!rel.empty() && rel != ".") {
            return rel.generic_string();
        }
    }
    return normal.filename().generic_string();
}

}  // namespace arcwalk::strategy
