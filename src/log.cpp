#include "arcwalk/log.hpp"

#include <chrono>
#include <ctime>

#if defined(_WIN32) || defined(_WIN64)
    #include <io.h>
    #include <windows.h>
    #define isatty _isatty
    #define fileno _fileno

    #ifndef ENABLE_VIRTUAL_TERMINAL_PROCESSING
        #define ENABLE_VIRTUAL_TERMINAL_PROCESSING 0x0004
    #endif
#else
    #include <unistd.h>
#endif

namespace arcwalk::log {

namespace {
    bool g_colors_enabled = true;
    bool g_colors_checked = false;
    Level g_min_level = Level::Info;

#if defined(_WIN32) || defined(_WIN64)
    bool EnableWindowsAnsiColors() {
        HANDLE hOut = GetStdHandle(STD_OUTPUT_HANDLE);
        if (hOut == INVALID_HANDLE_VALUE) {
            return false;
        }

        DWORD mode = 0;
        if (!GetConsoleMode(hOut, &mode)) {
            return false;
        }

        mode |= ENABLE_VIRTUAL_TERMINAL_PROCESSING;
        return SetConsoleMode(hOut, mode) != 0;
    }
#endif

    std::string LocalTimestamp() {
        auto now = std::chrono::system_clock::now();
        std::time_t tt = std::chrono::system_clock::to_time_t(now);
        std::tm tm{};
#if defined(_WIN32)
        localtime_s(&tm, &tt);
#else
        localtime_r(&tt, &tm);
#endif
        char buffer[32];
        if (std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &tm) == 0) {
            return {};
        }
        return std::string(buffer);
    }

    const char* LevelTag(Level level) {
        switch (level) {
            case Level::Info: return "INFO";
            case Level::Warn: return "WARNING";
            case Level::Error: return "ERROR";
        }
        return "INFO";
    }

    const char* LevelColor(Level level) {
        switch (level) {
            case Level::Info: return color::GREEN;
            case Level::Warn: return color::YELLOW;
            case Level::Error: return color::BOLD_RED;
        }
        return color::RESET;
    }
}

bool ColorsEnabled(std::ostream& os) {
    if (!g_colors_checked) {
        // Auto-detect: check if output is a TTY
        bool is_tty = false;
        if (&os == &std::cout) {
            is_tty = isatty(fileno(stdout)) != 0;
        } else if (&os == &std::cerr) {
            is_tty = isatty(fileno(stderr)) != 0;
        }

        g_colors_enabled = is_tty;

#if defined(_WIN32) || defined(_WIN64)
        if (is_tty) {
            g_colors_enabled = EnableWindowsAnsiColors();
        }
#endif

        g_colors_checked = true;
    }
    return g_colors_enabled;
}

void SetColorsEnabled(bool enabled) {
    g_colors_enabled = enabled;
    g_colors_checked = true;
}

std::string Colorize(const std::string& text, const char* color, std::ostream& os) {
    if (!ColorsEnabled(os)) {
        return text;
    }
    return std::string(color) + text + color::RESET;
}

void SetMinLevel(Level level) {
    g_min_level = level;
}

Level MinLevel() {
    return g_min_level;
}

bool ParseLevel(const std::string& text, Level& out) {
    if (text == "info") {
        out = Level::Info;
        return true;
    }
    if (text == "warn" || text == "warning") {
        out = Level::Warn;
        return true;
    }
    if (text == "error") {
        out = Level::Error;
        return true;
    }
    return false;
}

void Write(Level level, const std::string& message) {
    if (static_cast<int>(level) < static_cast<int>(g_min_level)) {
        return;
    }
    std::ostream& os = (level == Level::Info) ? std::cout : std::cerr;
    os << LocalTimestamp() << " - ["
       << Colorize(LevelTag(level), LevelColor(level), os)
       << "] - " << message << '\n';
    if (level != Level::Info) {
        os.flush();
    }
}

}  // namespace arcwalk::log
