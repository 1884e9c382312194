#pragma once

#include <sstream>
#include <string>

namespace Tabula {

enum class LogLevel { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

/**
 * @brief Process-wide line logger writing `[Tabula][Component] ...` to stderr.
 * @details Lines are assembled off-lock and written under a mutex so that
 * concurrent queries never interleave partial lines.
 */
class Log {
public:
    static void setLevel(LogLevel level) noexcept;
    static LogLevel level() noexcept;
    static bool enabled(LogLevel level) noexcept;

    /**
     * @brief Parses debug|info|warn|warning|error (case-insensitive).
     * @throws Tabula::ConfigurationException on unknown names.
     */
    static LogLevel parseLevel(const std::string& name);
    static const char* levelName(LogLevel level) noexcept;

    static void write(LogLevel level, const std::string& component, const std::string& message);

    static void debug(const std::string& component, const std::string& message) { write(LogLevel::DEBUG, component, message); }
    static void info(const std::string& component, const std::string& message) { write(LogLevel::INFO, component, message); }
    static void warn(const std::string& component, const std::string& message) { write(LogLevel::WARN, component, message); }
    static void error(const std::string& component, const std::string& message) { write(LogLevel::ERROR, component, message); }
};

// Builds `key=value` suffixes: LogFields().add("rows", n).str()
class LogFields {
public:
    template <typename T>
    LogFields& add(const char* key, const T& value) {
        out_ << ' ' << key << '=' << value;
        return *this;
    }
    std::string str() const { return out_.str(); }

private:
    std::ostringstream out_;
};

} // namespace Tabula
