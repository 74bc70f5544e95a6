#include "AdmissionController.hpp"

#include <optional>
#include <stdexcept>

#include "Logging.hpp"
#include "Metrics.hpp"

AdmissionController::AdmissionController(RateLimits limits, ClockFn clock, Metrics *metrics)
    : limits_(limits), clock_(std::move(clock)), metrics_(metrics)
{
    if (limits_.requestsPerWindow == 0 || limits_.tokensPerWindow <= 0 || limits_.window.count() <= 0)
    {
        throw std::invalid_argument("rate limits must be positive");
    }
    if (!clock_)
    {
        clock_ = []()
        { return Clock::now(); };
    }
}

CheckResult AdmissionController::check(const std::string &session, std::int64_t tokensRequested)
{
    return check(session, tokensRequested, clock_());
}

CheckResult AdmissionController::check(const std::string &session, std::int64_t tokensRequested, Clock::time_point now)
{
    // A retired ledger was swept or removed after the lookup; look again.
    std::optional<CheckResult> outcome;
    while (!outcome)
        outcome = store_.getOrCreate(session)->checkLive(tokensRequested, now, limits_);
    CheckResult result = *outcome;

    if (metrics_)
        metrics_->record_admission(result, tokensRequested);

    if (!result.admitted())
    {
        nlohmann::json extra = {
            {"session", session},
            {"reason", to_string(result.reason)},
            {"tokens_requested", tokensRequested},
            {"window_requests", result.requests},
            {"window_tokens", result.tokens}};
        Logger::log_event(LogLevel::Warn, "rate_limit", "Admission rejected", extra);
    }
    else if (Logger::enabled(LogLevel::Debug))
    {
        nlohmann::json extra = {
            {"session", session},
            {"tokens_requested", tokensRequested},
            {"window_requests", result.requests},
            {"window_tokens", result.tokens}};
        Logger::log_event(LogLevel::Debug, "admit", "Admission granted", extra);
    }
    return result;
}

bool AdmissionController::endSession(const std::string &session)
{
    return store_.remove(session);
}

std::size_t AdmissionController::sweepIdle()
{
    return sweepIdle(clock_());
}

std::size_t AdmissionController::sweepIdle(Clock::time_point now)
{
    std::size_t dropped = store_.sweepIdle(now, limits_.window);
    if (dropped > 0)
    {
        nlohmann::json extra = {{"dropped", dropped}, {"remaining", store_.size()}};
        Logger::log_event(LogLevel::Debug, "session_sweep", "Reclaimed idle sessions", extra);
    }
    return dropped;
}
