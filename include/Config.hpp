#pragma once
#include <chrono>
#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>
#include "Logging.hpp"
#include "SlidingWindow.hpp"

struct GatewayConfig
{
    int port = 8443;
    std::size_t workerThreads = 0; // 0 means hardware concurrency.
    std::size_t maxQueuedRequests = 1024;
    std::string certPath = "config/cert.pem";
    std::string keyPath = "config/key.pem";
    std::size_t maxBodyBytes = 65536;
    std::chrono::seconds metricsInterval{10};
    LogLevel logLevel = LogLevel::Info;
    RateLimits limits;
    std::string modelName = "sim-model";
    std::chrono::milliseconds modelLatency{0};
};

// Builds a config from a JSON object; absent keys keep their defaults.
// Throws std::runtime_error on wrong types or out-of-range values.
GatewayConfig parse_config(const nlohmann::json &j);

// Loads a config file. A missing file yields the defaults; an unreadable or
// malformed one throws std::runtime_error.
GatewayConfig load_config(const std::string &filename);
