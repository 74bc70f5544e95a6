#include "Config.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace
{
    std::int64_t read_int(const json &j, const char *key, std::int64_t fallback, std::int64_t min, std::int64_t max)
    {
        if (!j.contains(key))
            return fallback;
        const auto &v = j.at(key);
        if (!v.is_number_integer())
            throw std::runtime_error(std::string("config: '") + key + "' must be an integer");
        auto value = v.get<std::int64_t>();
        if (value < min || value > max)
        {
            throw std::runtime_error(std::string("config: '") + key + "' out of range [" +
                                     std::to_string(min) + ", " + std::to_string(max) + "]");
        }
        return value;
    }

    std::string read_string(const json &j, const char *key, const std::string &fallback)
    {
        if (!j.contains(key))
            return fallback;
        const auto &v = j.at(key);
        if (!v.is_string())
            throw std::runtime_error(std::string("config: '") + key + "' must be a string");
        return v.get<std::string>();
    }

    const json &read_object(const json &j, const char *key)
    {
        static const json empty = json::object();
        if (!j.contains(key))
            return empty;
        const auto &v = j.at(key);
        if (!v.is_object())
            throw std::runtime_error(std::string("config: '") + key + "' must be an object");
        return v;
    }
}

GatewayConfig parse_config(const json &j)
{
    if (!j.is_object())
        throw std::runtime_error("config: top level must be an object");

    GatewayConfig cfg;
    cfg.port = static_cast<int>(read_int(j, "port", cfg.port, 1, 65535));
    cfg.workerThreads = static_cast<std::size_t>(read_int(j, "worker_threads", 0, 0, 1024));
    cfg.maxQueuedRequests = static_cast<std::size_t>(read_int(j, "max_queued_requests", 1024, 1, 1 << 20));
    cfg.certPath = read_string(j, "cert_path", cfg.certPath);
    cfg.keyPath = read_string(j, "key_path", cfg.keyPath);
    cfg.maxBodyBytes = static_cast<std::size_t>(read_int(j, "max_body_bytes", 65536, 1, 1 << 20));
    cfg.metricsInterval = std::chrono::seconds(read_int(j, "metrics_interval_seconds", 10, 1, 86400));

    auto level_name = read_string(j, "log_level", "info");
    auto level = parse_log_level(level_name);
    if (!level)
        throw std::runtime_error("config: unknown log_level '" + level_name + "'");
    cfg.logLevel = *level;

    const json &limits = read_object(j, "limits");
    cfg.limits.requestsPerWindow = static_cast<std::size_t>(
        read_int(limits, "requests_per_window", 60, 1, 1'000'000));
    cfg.limits.tokensPerWindow = read_int(limits, "tokens_per_window", 10000, 1, 1'000'000'000'000);
    cfg.limits.window = std::chrono::seconds(read_int(limits, "window_seconds", 60, 1, 86400));

    const json &model = read_object(j, "model");
    cfg.modelName = read_string(model, "name", cfg.modelName);
    cfg.modelLatency = std::chrono::milliseconds(read_int(model, "latency_ms", 0, 0, 60000));
    return cfg;
}

GatewayConfig load_config(const std::string &filename)
{
    if (!std::filesystem::exists(filename))
    {
        Logger::log_event(LogLevel::Warn, "config", "Config file not found, using defaults", {{"path", filename}});
        return GatewayConfig{};
    }

    std::ifstream in(filename);
    if (!in)
        throw std::runtime_error("config: cannot open " + filename);

    json j = json::object();
    if (in.peek() != std::ifstream::traits_type::eof())
    {
        try
        {
            in >> j;
        }
        catch (const json::parse_error &e)
        {
            throw std::runtime_error("config: " + filename + ": " + e.what());
        }
    }
    return parse_config(j);
}
