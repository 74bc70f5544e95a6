#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

#include "SessionStore.hpp"
#include "SlidingWindow.hpp"

class Metrics;

// Gates downstream calls per session under the request and token limits.
class AdmissionController
{
public:
    using ClockFn = std::function<Clock::time_point()>;

    // The clock defaults to steady_clock::now; tests inject their own.
    explicit AdmissionController(RateLimits limits, ClockFn clock = nullptr, Metrics *metrics = nullptr);

    // Evaluates a call for the session using the injected clock.
    CheckResult check(const std::string &session, std::int64_t tokensRequested);
    // Evaluates a call at an explicit instant.
    CheckResult check(const std::string &session, std::int64_t tokensRequested, Clock::time_point now);

    // Drops the session's ledger; returns false when it did not exist.
    bool endSession(const std::string &session);

    // Reclaims sessions with no usage left in the window.
    std::size_t sweepIdle();
    std::size_t sweepIdle(Clock::time_point now);

    const RateLimits &limits() const { return limits_; }
    SessionStore &store() { return store_; }
    const SessionStore &store() const { return store_; }

private:
    const RateLimits limits_;
    ClockFn clock_;
    Metrics *metrics_;
    SessionStore store_;
};
