#include "optcb/utils/logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace optcb::utils {

namespace {
std::string timestamp() {
    using clock = std::chrono::system_clock;
    auto now = clock::now();
    auto time = clock::to_time_t(now);
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &time);
#else
    localtime_r(&time, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

void log_line(std::ostream& stream, const std::string& level, const std::string& message) {
    stream << "[" << timestamp() << "] [" << level << "] " << message << std::endl;
}

}  // namespace

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

LogLevel log_level_from_string(const std::string& name) {
    const auto lower = to_lower(name);
    if (lower == "debug") {
        return LogLevel::kDebug;
    }
    if (lower == "info") {
        return LogLevel::kInfo;
    }
    if (lower == "warn" || lower == "warning") {
        return LogLevel::kWarn;
    }
    if (lower == "error") {
        return LogLevel::kError;
    }
    throw std::invalid_argument{"Unsupported log level: " + name};
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock{mutex_};
    level_ = level;
}

LogLevel Logger::level() const {
    std::lock_guard<std::mutex> lock{mutex_};
    return level_;
}

bool Logger::enabled(LogLevel level) const {
    return static_cast<int>(level) >= static_cast<int>(level_);
}

void Logger::debug(const std::string& message) {
    std::lock_guard<std::mutex> lock{mutex_};
    if (enabled(LogLevel::kDebug)) {
        log_line(std::cout, "DEBUG", message);
    }
}

void Logger::info(const std::string& message) {
    std::lock_guard<std::mutex> lock{mutex_};
    if (enabled(LogLevel::kInfo)) {
        log_line(std::cout, "INFO", message);
    }
}

void Logger::warn(const std::string& message) {
    std::lock_guard<std::mutex> lock{mutex_};
    if (enabled(LogLevel::kWarn)) {
        log_line(std::cout, "WARN", message);
    }
}

void Logger::error(const std::string& message) {
    std::lock_guard<std::mutex> lock{mutex_};
    if (enabled(LogLevel::kError)) {
        log_line(std::cerr, "ERROR", message);
    }
}

}  // namespace optcb::utils
