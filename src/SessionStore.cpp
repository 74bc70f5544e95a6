#include "SessionStore.hpp"

std::shared_ptr<SessionLedger> SessionStore::getOrCreate(const std::string &key)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto &ledger = ledgers_[key];
    if (!ledger)
    {
        ledger = std::make_shared<SessionLedger>();
    }
    return ledger;
}

std::shared_ptr<SessionLedger> SessionStore::find(const std::string &key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = ledgers_.find(key);
    if (it != ledgers_.end())
    {
        return it->second;
    }
    return nullptr;
}

void SessionStore::put(const std::string &key, std::vector<UsageRecord> records)
{
    getOrCreate(key)->replace(std::move(records));
}

bool SessionStore::remove(const std::string &key)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = ledgers_.find(key);
    if (it == ledgers_.end())
    {
        return false;
    }
    it->second->retire();
    ledgers_.erase(it);
    return true;
}

std::size_t SessionStore::sweepIdle(Clock::time_point now, std::chrono::seconds window)
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t dropped = 0;
    for (auto it = ledgers_.begin(); it != ledgers_.end();)
    {
        if (it->second->retireIfIdle(now, window))
        {
            it = ledgers_.erase(it);
            ++dropped;
        }
        else
        {
            ++it;
        }
    }
    return dropped;
}

std::size_t SessionStore::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return ledgers_.size();
}
