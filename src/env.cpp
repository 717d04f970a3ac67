#include "arcwalk/env.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace arcwalk::env {

namespace {

#if defined(_WIN32)
constexpr char kListSeparator = ';';
#else
constexpr char kListSeparator = ':';
#endif

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

}  // namespace

std::string Get(std::string_view name) {
    std::string key(name);
    const char* value = std::getenv(key.c_str());
    if (!value) {
        return {};
    }
    return std::string(value);
}

bool IsEnabled(std::string_view name, bool default_value) {
    std::string value = Get(name);
    if (value.empty()) {
        return default_value;
    }
    value = ToLower(value);
    if (value == "1" || value == "true" || value == "yes" || value == "on") {
        return true;
    }
    if (value == "0" || value == "false" || value == "no" || value == "off") {
        return false;
    }
    return default_value;
}

std::optional<int> GetInt(std::string_view name) {
    std::string raw = Get(name);
    if (raw.empty()) {
        return std::nullopt;
    }
    try {
        std::size_t used = 0;
        int parsed = std::stoi(raw, &used);
        if (used != raw.size()) {
            return std::nullopt;
        }
        return parsed;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::vector<std::string> SplitList(const std::string& value) {
    std::vector<std::string> items;
    std::size_t start = 0;
    while (start <= value.size()) {
        std::size_t pos = value.find(kListSeparator, start);
        if (pos == std::string::npos) {
            pos = value.size();
        }
        if (pos > start) {
            items.push_back(value.substr(start, pos - start));
        }
        start = pos + 1;
    }
    return items;
}

std::vector<std::string> GetList(std::string_view name) {
    return SplitList(Get(name));
}

}  // namespace arcwalk::env
