#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace arcwalk::env {

std::string Get(std::string_view name);
bool IsEnabled(std::string_view name, bool default_value = false);
std::optional<int> GetInt(std::string_view name);

// Splits a PATH-style list (':' on POSIX, ';' on Windows); empty items dropped.
std::vector<std::string> GetList(std::string_view name);
std::vector<std::string> SplitList(const std::string& value);

}  // namespace arcwalk::env
