#include "core/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace core {

std::mutex Logger::mutex_;
std::atomic<LogLevel> Logger::minLevel_{LogLevel::INFO};

LogLevel Logger::parseLevel(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    throw std::invalid_argument("Unknown log level '" + name + "'");
}

const char* Logger::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "debug";
        case LogLevel::INFO:  return "info";
        case LogLevel::WARN:  return "warn";
        case LogLevel::ERROR: return "error";
    }
    return "info";
}

} // namespace core
