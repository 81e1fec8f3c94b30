#pragma once

#include <iostream>
#include <mutex>
#include <string>

namespace optcb::utils {

enum class LogLevel {
    kDebug,
    kInfo,
    kWarn,
    kError
};

// ASCII lower-casing for case-insensitive name lookups.
std::string to_lower(std::string value);

LogLevel log_level_from_string(const std::string& name);

class Logger {
  public:
    static Logger& instance();

    void set_level(LogLevel level);
    LogLevel level() const;

    void debug(const std::string& message);
    void info(const std::string& message);
    void warn(const std::string& message);
    void error(const std::string& message);

  private:
    Logger() = default;
    bool enabled(LogLevel level) const;

    mutable std::mutex mutex_;
    LogLevel level_{LogLevel::kInfo};
};

}  // namespace optcb::utils
