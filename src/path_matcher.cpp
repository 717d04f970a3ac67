#include "arcwalk/path_matcher.hpp"

#include <algorithm>
#include <cctype>
#include <exception>

namespace arcwalk::path {

namespace {

#if defined(_WIN32)
std::string FoldCase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}
#endif

}  // namespace

std::string NormalizeUncached(const std::string& path) {
    if (path.empty()) {
        return {};
    }
    std::filesystem::path normal = std::filesystem::path(path).lexically_normal();
    std::string out = normal.make_preferred().string();
    // "a/b/" -> "a/b", but keep "/" and "C:\" intact.
    const std::string root = normal.root_path().string();
    while (out.size() > root.size() && !out.empty()
           && (out.back() == '/' || out.back() == static_cast<char>(std::filesystem::path::preferred_separator))) {
        out.pop_back();
    }
    if (out.empty()) {
        out = ".";
    }
#if defined(_WIN32)
    out = FoldCase(out);
#endif
    return out;
}

Matcher::Matcher(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

const std::string& Matcher::Normalize(const std::string& path) {
    auto it = cache_.find(path);
    if (it != cache_.end()) {
        return it->second;
    }
    if (cache_.size() >= capacity_) {
        cache_.erase(order_.front());
        order_.pop_front();
    }
    order_.push_back(path);
    auto inserted = cache_.emplace(path, NormalizeUncached(path));
    return inserted.first->second;
}

bool Matcher::IsUnder(const std::string& child, const std::string& parent) noexcept {
    try {
        std::filesystem::path c(Normalize(child));
        std::filesystem::path p(Normalize(parent));
        if (c.is_absolute() != p.is_absolute()) {
            return false;
        }
        if (c.root_name() != p.root_name()) {
            return false;
        }
        auto mismatch = std::mismatch(p.begin(), p.end(), c.begin(), c.end());
        return mismatch.first == p.end();
    } catch (const std::exception&) {
        return false;
    }
}

bool Matcher::IsUnderAny(const std::string& child, const std::vector<std::filesystem::path>& parents) noexcept {
    for (const auto& parent : parents) {
        if (IsUnder(child, parent.string())) {
            return true;
        }
    }
    return false;
}

}  // namespace arcwalk::path
