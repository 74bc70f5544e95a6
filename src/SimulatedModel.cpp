#include "SimulatedModel.hpp"

#include <sstream>
#include <thread>

SimulatedModel::SimulatedModel(std::string name, std::chrono::milliseconds latency)
    : name_(std::move(name)), latency_(latency)
{
}

std::string SimulatedModel::complete(const std::string &prompt, std::int64_t tokens) const
{
    if (latency_.count() > 0)
        std::this_thread::sleep_for(latency_);

    std::ostringstream out;
    out << "[" << name_ << "]";

    // Echo the prompt back word by word, one word per token.
    std::istringstream words(prompt);
    std::string word;
    std::int64_t emitted = 0;
    while (emitted < tokens && words >> word)
    {
        out << ' ' << word;
        ++emitted;
    }
    if (words >> word)
        out << " ...";
    return out.str();
}
