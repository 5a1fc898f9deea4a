#include "Log.hpp"
#include <iostream>
#include <algorithm>
#include <cctype>

namespace {
    Log::Level g_level = Log::Level::Warn;
}

namespace Log {

void set_level(Level level) {
    g_level = level;
}

Level level() {
    return g_level;
}

bool enabled(Level level) {
    return static_cast<int>(level) >= static_cast<int>(g_level);
}

bool parse_level(const std::string& text, Level& out) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") out = Level::Debug;
    else if (lower == "info") out = Level::Info;
    else if (lower == "warn" || lower == "warning") out = Level::Warn;
    else if (lower == "error") out = Level::Error;
    else return false;
    return true;
}

std::string level_name(Level level) {
    switch (level) {
        case Level::Debug: return "DEBUG";
        case Level::Info: return "INFO";
        case Level::Warn: return "WARN";
        case Level::Error: return "ERROR";
    }
    return "?";
}

void write(Level level, const std::string& tag, const std::string& message) {
    if (!enabled(level)) return;
    std::cerr << "[" << level_name(level) << "] " << tag << ": " << message << "\n";
}

} // namespace Log
