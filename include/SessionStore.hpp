#pragma once
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "SlidingWindow.hpp"

// Registry of per-session ledgers. The map lock only covers lookups;
// each ledger serializes its own checks.
class SessionStore
{
public:
    // Returns the ledger bound to the key, creating an empty one on first use.
    std::shared_ptr<SessionLedger> getOrCreate(const std::string &key);
    // Returns the ledger bound to the key, or nullptr.
    std::shared_ptr<SessionLedger> find(const std::string &key) const;
    // Replaces the records held for the key.
    void put(const std::string &key, std::vector<UsageRecord> records);
    // Ends the session; returns false when the key was unknown.
    bool remove(const std::string &key);
    // Drops every ledger whose records have all left the window at now.
    // Returns how many were dropped.
    std::size_t sweepIdle(Clock::time_point now, std::chrono::seconds window);
    std::size_t size() const;

private:
    std::unordered_map<std::string, std::shared_ptr<SessionLedger>> ledgers_;
    mutable std::mutex mutex_;
};
