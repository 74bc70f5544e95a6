#pragma once
#include <chrono>
#include <cstdint>
#include <string>

// Stand-in for a downstream model endpoint.
class SimulatedModel
{
public:
    SimulatedModel(std::string name, std::chrono::milliseconds latency);

    // Sleeps for the configured latency and returns a canned completion of at
    // most `tokens` words built from the prompt.
    std::string complete(const std::string &prompt, std::int64_t tokens) const;

    const std::string &name() const { return name_; }

private:
    std::string name_;
    std::chrono::milliseconds latency_;
};
