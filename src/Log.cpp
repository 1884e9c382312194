#include "Log.h"

#include "CommonUtils.h"
#include "TabulaExceptions.h"

#include <atomic>
#include <iostream>
#include <mutex>

namespace Tabula {

namespace {
std::atomic<int> gMinLevel{static_cast<int>(LogLevel::WARN)};

std::mutex& logMutex() {
    static std::mutex m;
    return m;
}
} // namespace

void Log::setLevel(LogLevel level) noexcept {
    gMinLevel.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel Log::level() noexcept {
    return static_cast<LogLevel>(gMinLevel.load(std::memory_order_relaxed));
}

bool Log::enabled(LogLevel level) noexcept {
    return static_cast<int>(level) >= gMinLevel.load(std::memory_order_relaxed);
}

LogLevel Log::parseLevel(const std::string& name) {
    const std::string v = CommonUtils::toLower(CommonUtils::trim(name));
    if (v == "debug") return LogLevel::DEBUG;
    if (v == "info") return LogLevel::INFO;
    if (v == "warn" || v == "warning") return LogLevel::WARN;
    if (v == "error") return LogLevel::ERROR;
    throw ConfigurationException("log_level must be one of: debug, info, warn, error");
}

const char* Log::levelName(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::DEBUG: return "debug";
        case LogLevel::INFO: return "info";
        case LogLevel::WARN: return "warn";
        case LogLevel::ERROR: return "error";
    }
    return "warn";
}

void Log::write(LogLevel level, const std::string& component, const std::string& message) {
    if (!enabled(level)) return;

    std::string line;
    switch (level) {
        case LogLevel::WARN: line = "[Tabula Warning]"; break;
        case LogLevel::ERROR: line = "[Tabula Error]"; break;
        default: line = "[Tabula]"; break;
    }
    if (!component.empty()) line += "[" + component + "]";
    line += " ";
    line += message;
    line += "\n";

    std::lock_guard<std::mutex> lock(logMutex());
    std::cerr << line;
    std::cerr.flush();
}

} // namespace Tabula
