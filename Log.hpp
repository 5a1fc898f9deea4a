#ifndef LOG_HPP
#define LOG_HPP

#include <string>

// Leveled diagnostics on stderr. The threshold is process wide and set once
// by the front end (--loglevel).
namespace Log {
    enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3 };

    void set_level(Level level);
    Level level();
    bool enabled(Level level);

    // accepts debug, info, warn/warning, error (case insensitive)
    bool parse_level(const std::string& text, Level& out);
    std::string level_name(Level level);

    void write(Level level, const std::string& tag, const std::string& message);

    inline void debug(const std::string& tag, const std::string& message) { write(Level::Debug, tag, message); }
    inline void info(const std::string& tag, const std::string& message) { write(Level::Info, tag, message); }
    inline void warn(const std::string& tag, const std::string& message) { write(Level::Warn, tag, message); }
    inline void error(const std::string& tag, const std::string& message) { write(Level::Error, tag, message); }
}

#endif // LOG_HPP
