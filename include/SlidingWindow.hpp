#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

using Clock = std::chrono::steady_clock;

// Process-wide admission limits, measured over a trailing window.
struct RateLimits
{
    std::size_t requestsPerWindow = 60;
    std::int64_t tokensPerWindow = 10000;
    std::chrono::seconds window{60};
};

// One admitted call.
struct UsageRecord
{
    Clock::time_point timestamp;
    std::int64_t tokens = 0;

    bool operator==(const UsageRecord &other) const
    {
        return timestamp == other.timestamp && tokens == other.tokens;
    }
};

enum class Decision
{
    Admit,
    Reject
};

enum class RejectReason
{
    None,
    RequestLimit,
    TokenLimit
};

inline const char *to_string(RejectReason reason)
{
    switch (reason)
    {
    case RejectReason::None:
        return "none";
    case RejectReason::RequestLimit:
        return "request_limit";
    case RejectReason::TokenLimit:
        return "token_limit";
    }
    return "unknown";
}

// Outcome of one evaluation, with the window usage left after it.
struct CheckResult
{
    Decision decision = Decision::Admit;
    RejectReason reason = RejectReason::None;
    std::size_t requests = 0;
    std::int64_t tokens = 0;

    bool admitted() const { return decision == Decision::Admit; }
};

// Admitted-call history of a single session, oldest first.
class SessionLedger
{
public:
    SessionLedger() = default;
    SessionLedger(const SessionLedger &) = delete;
    SessionLedger &operator=(const SessionLedger &) = delete;

    // Evicts expired records, then admits the call if both limits hold.
    // Throws std::invalid_argument on a negative token count.
    CheckResult check(std::int64_t tokensRequested, Clock::time_point now, const RateLimits &limits);
    // Same as check(), but returns nullopt once the ledger was retired from
    // its store. The caller then looks the session up again.
    std::optional<CheckResult> checkLive(std::int64_t tokensRequested, Clock::time_point now,
                                         const RateLimits &limits);

    // Retires the ledger when no record is still inside the window at now.
    bool retireIfIdle(Clock::time_point now, std::chrono::seconds window);
    void retire();

    // Returns a copy of the current records.
    std::vector<UsageRecord> snapshot() const;
    // Replaces all records.
    void replace(std::vector<UsageRecord> records);

private:
    mutable std::mutex mutex_;
    std::deque<UsageRecord> records_;
    bool retired_ = false;
};

// Sliding-window step over a bare record list. The caller owns locking.
CheckResult evaluate(std::deque<UsageRecord> &records, std::int64_t tokensRequested,
                     Clock::time_point now, const RateLimits &limits);
