#include "SlidingWindow.hpp"

#include <limits>
#include <stdexcept>
#include <string>

namespace
{
    // Saturates instead of overflowing on records installed through replace().
    std::int64_t sum_tokens(const std::deque<UsageRecord> &records)
    {
        constexpr std::int64_t MAX_TOKENS = std::numeric_limits<std::int64_t>::max();
        std::int64_t total = 0;
        for (const auto &r : records)
        {
            if (r.tokens > MAX_TOKENS - total)
                return MAX_TOKENS;
            total += r.tokens;
        }
        return total;
    }
}

CheckResult evaluate(std::deque<UsageRecord> &records, std::int64_t tokensRequested,
                     Clock::time_point now, const RateLimits &limits)
{
    if (tokensRequested < 0)
    {
        throw std::invalid_argument("negative token count: " + std::to_string(tokensRequested));
    }

    // Age equal to the window is still inside it.
    while (!records.empty() && now - records.front().timestamp > limits.window)
    {
        records.pop_front();
    }

    CheckResult result;
    result.requests = records.size();
    result.tokens = sum_tokens(records);

    if (records.size() + 1 > limits.requestsPerWindow)
    {
        result.decision = Decision::Reject;
        result.reason = RejectReason::RequestLimit;
        return result;
    }

    // Checked against the remaining budget; sum + request is never formed.
    if (result.tokens > limits.tokensPerWindow || tokensRequested > limits.tokensPerWindow - result.tokens)
    {
        result.decision = Decision::Reject;
        result.reason = RejectReason::TokenLimit;
        return result;
    }

    records.push_back({now, tokensRequested});
    result.requests += 1;
    result.tokens += tokensRequested;
    return result;
}

CheckResult SessionLedger::check(std::int64_t tokensRequested, Clock::time_point now, const RateLimits &limits)
{
    std::lock_guard<std::mutex> lock(mutex_);
    return evaluate(records_, tokensRequested, now, limits);
}

std::optional<CheckResult> SessionLedger::checkLive(std::int64_t tokensRequested, Clock::time_point now,
                                                    const RateLimits &limits)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (retired_)
        return std::nullopt;
    return evaluate(records_, tokensRequested, now, limits);
}

bool SessionLedger::retireIfIdle(Clock::time_point now, std::chrono::seconds window)
{
    std::lock_guard<std::mutex> lock(mutex_);
    // The newest record decides; older ones expire no later than it does.
    if (!records_.empty() && now - records_.back().timestamp <= window)
        return false;
    retired_ = true;
    return true;
}

void SessionLedger::retire()
{
    std::lock_guard<std::mutex> lock(mutex_);
    retired_ = true;
}

std::vector<UsageRecord> SessionLedger::snapshot() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<UsageRecord>(records_.begin(), records_.end());
}

void SessionLedger::replace(std::vector<UsageRecord> records)
{
    std::lock_guard<std::mutex> lock(mutex_);
    records_.assign(records.begin(), records.end());
}
