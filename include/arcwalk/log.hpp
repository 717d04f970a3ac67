#pragma once

#include <iostream>
#include <ostream>
#include <string>

namespace arcwalk::log {

enum class Level {
    Info,
    Warn,
    Error
};

// ANSI color codes
namespace color {
    constexpr const char* RESET = "\033[0m";
    constexpr const char* GREEN = "\033[0;32m";
    constexpr const char* YELLOW = "\033[0;33m";
    constexpr const char* BOLD_RED = "\033[1;31m";
}

// Check if colors should be enabled for the given stream
bool ColorsEnabled(std::ostream& os = std::cout);

// Set whether colors are enabled (can be disabled via --no-color)
void SetColorsEnabled(bool enabled);

std::string Colorize(const std::string& text, const char* color, std::ostream& os = std::cout);

void SetMinLevel(Level level);
Level MinLevel();
bool ParseLevel(const std::string& text, Level& out);

// "YYYY-MM-DD HH:MM:SS - [LEVEL] - message"; Info goes to stdout, the rest to stderr.
void Write(Level level, const std::string& message);

inline void Info(const std::string& message) { Write(Level::Info, message); }
inline void Warn(const std::string& message) { Write(Level::Warn, message); }
inline void Error(const std::string& message) { Write(Level::Error, message); }

}  // namespace arcwalk::log
