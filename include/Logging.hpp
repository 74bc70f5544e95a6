#pragma once

#include <atomic>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>
#include "utils.hpp"

enum class LogLevel
{
    Debug,
    Info,
    Warn,
    Error
};

inline const char *to_string(LogLevel level)
{
    switch (level)
    {
    case LogLevel::Debug:
        return "debug";
    case LogLevel::Info:
        return "info";
    case LogLevel::Warn:
        return "warn";
    case LogLevel::Error:
        return "error";
    }
    return "unknown";
}

// Parses "debug", "info", "warn" or "error".
inline std::optional<LogLevel> parse_log_level(const std::string &name)
{
    if (name == "debug")
        return LogLevel::Debug;
    if (name == "info")
        return LogLevel::Info;
    if (name == "warn")
        return LogLevel::Warn;
    if (name == "error")
        return LogLevel::Error;
    return std::nullopt;
}

// Thread-safe structured logger that prints one JSON object per line.
class Logger
{
public:
    // Emits a structured log event as a single JSON line.
    static void log_event(LogLevel level, const std::string &action, const std::string &message, const nlohmann::json &extra = nlohmann::json::object())
    {
        if (!enabled(level))
            return;

        nlohmann::json j = extra;
        j["ts"] = current_timestamp();
        j["level"] = to_string(level);
        j["action"] = action;
        j["message"] = message;

        // Serialize output to avoid interleaved JSON lines.
        std::lock_guard<std::mutex> lock(mutex());
        std::cout << j.dump() << std::endl;
    }

    // Events below this level are dropped.
    static void set_level(LogLevel level) { min_level().store(level, std::memory_order_relaxed); }
    static LogLevel level() { return min_level().load(std::memory_order_relaxed); }

    static bool enabled(LogLevel level)
    {
        return static_cast<int>(level) >= static_cast<int>(min_level().load(std::memory_order_relaxed));
    }

private:
    static std::mutex &mutex()
    {
        static std::mutex m;
        return m;
    }

    static std::atomic<LogLevel> &min_level()
    {
        static std::atomic<LogLevel> l{LogLevel::Info};
        return l;
    }
};
