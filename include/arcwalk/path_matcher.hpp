#pragma once

#include <cstddef>
#include <deque>
#include <filesystem>
#include <string>
#include <unordered_map>
#include <vector>

#include "arcwalk/constants.hpp"

namespace arcwalk::path {

// Normalization cache plus containment test used for exclusion decisions.
// Not thread-safe; one matcher per walker.
class Matcher {
public:
    explicit Matcher(std::size_t capacity = constants::kNormalizeCacheSize);

    // Lexically normalized, trailing separator dropped (except the root).
    // Case-folded with '\' separators on Windows. Idempotent.
    const std::string& Normalize(const std::string& path);

    // True iff `child` equals `parent` or lies beneath it. Never throws.
    bool IsUnder(const std::string& child, const std::string& parent) noexcept;
    bool IsUnderAny(const std::string& child, const std::vector<std::filesystem::path>& parents) noexcept;

    std::size_t CacheSize() const noexcept { return cache_.size(); }
    std::size_t Capacity() const noexcept { return capacity_; }

private:
    std::size_t capacity_;
    std::unordered_map<std::string, std::string> cache_;
    std::deque<std::string> order_;
};

// Uncached normalization, exposed for callers that only need it once.
std::string NormalizeUncached(const std::string& path);

}  // namespace arcwalk::path
