#pragma once

#include <fmt/core.h>

#include <functional>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace speedline
{

enum class LogLevel
{
    Debug,
    Info,
    Warning,
    Error
};

inline const char* level_prefix(LogLevel level)
{
    switch (level)
    {
        case LogLevel::Debug:
            return "[DEBUG] ";
        case LogLevel::Info:
            return "[INFO] ";
        case LogLevel::Warning:
            return "[WARN] ";
        case LogLevel::Error:
            return "[ERROR] ";
    }
    return "";
}

// Accepts "debug", "info", "warn"/"warning" and "error".
inline std::optional<LogLevel> parse_log_level(std::string_view name)
{
    if (name == "debug")
        return LogLevel::Debug;
    if (name == "info")
        return LogLevel::Info;
    if (name == "warn" || name == "warning")
        return LogLevel::Warning;
    if (name == "error")
        return LogLevel::Error;
    return std::nullopt;
}

class Logger
{
  public:
    using sink_type = std::function<void(LogLevel, std::string_view)>;

    static Logger& instance()
    {
        static Logger inst;
        return inst;
    }

    void set_level(LogLevel level)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        level_ = level;
    }

    LogLevel level() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return level_;
    }

    bool enabled(LogLevel level) const
    {
        return level >= this->level();
    }

    // Replaces stdout output, an empty sink restores it.
    void set_sink(sink_type sink)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sink_ = std::move(sink);
    }

    void log(LogLevel level, std::string_view message)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < level_)
            return;

        if (sink_)
        {
            sink_(level, message);
            return;
        }
        std::cout << level_prefix(level) << message << std::endl;
    }

    template<typename... Args>
    void debug(fmt::format_string<Args...> format, Args&&... args)
    {
        write(LogLevel::Debug, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(fmt::format_string<Args...> format, Args&&... args)
    {
        write(LogLevel::Info, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(fmt::format_string<Args...> format, Args&&... args)
    {
        write(LogLevel::Warning, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(fmt::format_string<Args...> format, Args&&... args)
    {
        write(LogLevel::Error, format, std::forward<Args>(args)...);
    }

  private:
    Logger() = default;

    template<typename... Args>
    void write(LogLevel level, fmt::format_string<Args...> format, Args&&... args)
    {
        if (!enabled(level))
            return;
        log(level, fmt::format(format, std::forward<Args>(args)...));
    }

    mutable std::mutex mutex_;
    LogLevel level_{LogLevel::Info};
    sink_type sink_;
};

inline Logger& logger()
{
    return Logger::instance();
}

}  // namespace speedline
