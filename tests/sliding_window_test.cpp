#include <gtest/gtest.h>
#include <chrono>
#include <cstdint>
#include <limits>
#include <stdexcept>

#include "SlidingWindow.hpp"

using namespace std::chrono_literals;

namespace
{
    RateLimits default_limits()
    {
        RateLimits limits;
        limits.requestsPerWindow = 60;
        limits.tokensPerWindow = 10000;
        limits.window = std::chrono::seconds(60);
        return limits;
    }

    std::int64_t total_tokens(const std::vector<UsageRecord> &records)
    {
        std::int64_t total = 0;
        for (const auto &r : records)
            total += r.tokens;
        return total;
    }
}

class SlidingWindowTest : public ::testing::Test
{
protected:
    RateLimits limits = default_limits();
    Clock::time_point t0 = Clock::time_point(std::chrono::hours(1));
    SessionLedger ledger;
};

TEST_F(SlidingWindowTest, SingleCallIsAdmittedAndRecorded)
{
    // A fresh ledger admits a small call and stores exactly one record for it.
    auto result = ledger.check(100, t0, limits);
    EXPECT_TRUE(result.admitted());
    EXPECT_EQ(result.reason, RejectReason::None);

    auto records = ledger.snapshot();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].tokens, 100);
    EXPECT_EQ(records[0].timestamp, t0);
    EXPECT_EQ(result.requests, 1u);
    EXPECT_EQ(result.tokens, 100);
}

TEST_F(SlidingWindowTest, MultipleCallsWithinLimitsAccumulate)
{
    // Several calls under both limits are all kept in admission order.
    for (int i = 0; i < 5; ++i)
    {
        EXPECT_TRUE(ledger.check(1000, t0 + std::chrono::seconds(i), limits).admitted());
    }
    auto records = ledger.snapshot();
    ASSERT_EQ(records.size(), 5u);
    EXPECT_EQ(total_tokens(records), 5000);
    for (std::size_t i = 1; i < records.size(); ++i)
    {
        EXPECT_LT(records[i - 1].timestamp, records[i].timestamp);
    }
}

TEST_F(SlidingWindowTest, TokenLimitRejectsOverflowAndAdmitsExactFit)
{
    // 9900 tokens leave room for exactly 100 more; 101 is refused, 100 fits.
    ASSERT_TRUE(ledger.check(9900, t0, limits).admitted());

    auto rejected = ledger.check(101, t0 + 1s, limits);
    EXPECT_FALSE(rejected.admitted());
    EXPECT_EQ(rejected.reason, RejectReason::TokenLimit);

    EXPECT_TRUE(ledger.check(100, t0 + 2s, limits).admitted());
    EXPECT_EQ(total_tokens(ledger.snapshot()), 10000);
}

TEST_F(SlidingWindowTest, RequestLimitIsBoundaryExact)
{
    // Exactly sixty calls fit in one window; the sixty-first is refused.
    for (int i = 0; i < 60; ++i)
    {
        ASSERT_TRUE(ledger.check(10, t0 + std::chrono::milliseconds(i * 100), limits).admitted()) << "call " << i;
    }
    EXPECT_EQ(ledger.snapshot().size(), 60u);

    auto rejected = ledger.check(10, t0 + 10s, limits);
    EXPECT_FALSE(rejected.admitted());
    EXPECT_EQ(rejected.reason, RejectReason::RequestLimit);
    EXPECT_EQ(ledger.snapshot().size(), 60u);
}

TEST_F(SlidingWindowTest, RequestLimitIsCheckedBeforeTokenLimit)
{
    // When both limits would be broken the count limit is reported.
    RateLimits tight = limits;
    tight.requestsPerWindow = 1;
    ASSERT_TRUE(ledger.check(10000, t0, tight).admitted());
    EXPECT_EQ(ledger.check(1, t0 + 1s, tight).reason, RejectReason::RequestLimit);
}

TEST_F(SlidingWindowTest, AgedRecordIsEvictedOnNextCall)
{
    // A record older than the window is dropped and no longer counts.
    ledger.replace({{t0 - 65s, 10}});
    ASSERT_TRUE(ledger.check(20, t0, limits).admitted());

    auto records = ledger.snapshot();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].tokens, 20);
    EXPECT_EQ(records[0].timestamp, t0);
}

TEST_F(SlidingWindowTest, ExpiredRecordsCountTowardNeitherLimit)
{
    // A window that filled up long ago behaves like an empty ledger.
    RateLimits tight = limits;
    tight.requestsPerWindow = 2;
    ledger.replace({{t0 - 120s, 9000}, {t0 - 61s, 1000}});

    auto result = ledger.check(10000, t0, tight);
    EXPECT_TRUE(result.admitted());
    EXPECT_EQ(result.requests, 1u);
    EXPECT_EQ(result.tokens, 10000);
}

TEST_F(SlidingWindowTest, RecordExactlyAtWindowBoundaryIsRetained)
{
    // Age equal to the window still counts; one tick older does not.
    ledger.replace({{t0 - 60s, 9950}});
    EXPECT_FALSE(ledger.check(100, t0, limits).admitted());
    EXPECT_EQ(ledger.snapshot().size(), 1u);

    EXPECT_TRUE(ledger.check(100, t0 + Clock::duration(1), limits).admitted());
    auto records = ledger.snapshot();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].tokens, 100);
}

TEST_F(SlidingWindowTest, RejectionLeavesLiveRecordsUntouched)
{
    // A refused call neither appends nor alters records that are still live.
    ledger.replace({{t0 - 30s, 5000}, {t0 - 10s, 4000}});
    auto before = ledger.snapshot();

    EXPECT_FALSE(ledger.check(1001, t0, limits).admitted());
    EXPECT_EQ(ledger.snapshot(), before);
}

TEST_F(SlidingWindowTest, RejectionStillEvictsExpiredRecords)
{
    // Eviction happens on every evaluation, including one that rejects.
    ledger.replace({{t0 - 90s, 100}, {t0 - 10s, 9900}});

    EXPECT_FALSE(ledger.check(200, t0, limits).admitted());
    auto records = ledger.snapshot();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].tokens, 9900);
}

TEST_F(SlidingWindowTest, ZeroTokenCallPassesTokenCheck)
{
    // A zero-cost call is admitted even when the token budget is spent.
    ASSERT_TRUE(ledger.check(10000, t0, limits).admitted());
    EXPECT_TRUE(ledger.check(0, t0 + 1s, limits).admitted());
    EXPECT_EQ(ledger.snapshot().size(), 2u);
}

TEST_F(SlidingWindowTest, SingleCallAboveTokenLimitIsRejected)
{
    // One call larger than the whole budget can never be admitted.
    auto result = ledger.check(10001, t0, limits);
    EXPECT_FALSE(result.admitted());
    EXPECT_EQ(result.reason, RejectReason::TokenLimit);
    EXPECT_TRUE(ledger.snapshot().empty());
}

TEST_F(SlidingWindowTest, HugeTokenCountAfterAdmitIsRejected)
{
    // A cost near the integer maximum cannot wrap the window sum past the limit.
    ASSERT_TRUE(ledger.check(100, t0, limits).admitted());

    auto result = ledger.check(std::numeric_limits<std::int64_t>::max(), t0 + 1s, limits);
    EXPECT_FALSE(result.admitted());
    EXPECT_EQ(result.reason, RejectReason::TokenLimit);
    EXPECT_EQ(result.tokens, 100);
    EXPECT_EQ(ledger.snapshot().size(), 1u);

    EXPECT_TRUE(ledger.check(5, t0 + 2s, limits).admitted());
    EXPECT_EQ(total_tokens(ledger.snapshot()), 105);
}

TEST_F(SlidingWindowTest, OversizedInstalledRecordsSaturateTheSum)
{
    // Records installed directly cannot overflow the running total.
    std::int64_t big = std::numeric_limits<std::int64_t>::max() - 10;
    ledger.replace({{t0, big}, {t0, big}});
    auto result = ledger.check(0, t0 + 1s, limits);
    EXPECT_FALSE(result.admitted());
    EXPECT_EQ(result.reason, RejectReason::TokenLimit);
    EXPECT_EQ(result.tokens, std::numeric_limits<std::int64_t>::max());
}

TEST_F(SlidingWindowTest, NegativeTokensThrowWithoutTouchingLedger)
{
    // Negative costs are a caller bug, not a rate-limit outcome.
    ledger.replace({{t0 - 90s, 100}});
    EXPECT_THROW(ledger.check(-1, t0, limits), std::invalid_argument);
    EXPECT_EQ(ledger.snapshot().size(), 1u);
}

TEST_F(SlidingWindowTest, SeparateLedgersDoNotInteract)
{
    // Two sessions near their budgets are judged only on their own usage.
    SessionLedger a;
    SessionLedger b;
    ASSERT_TRUE(a.check(9900, t0, limits).admitted());
    ASSERT_TRUE(b.check(9950, t0, limits).admitted());

    EXPECT_FALSE(a.check(150, t0 + 1s, limits).admitted());
    EXPECT_TRUE(b.check(50, t0 + 1s, limits).admitted());
    EXPECT_EQ(total_tokens(a.snapshot()), 9900);
    EXPECT_EQ(total_tokens(b.snapshot()), 10000);
}

TEST(EvaluateTest, WorksOnBareRecordList)
{
    // The free evaluator applies the same rules to a caller-locked deque.
    RateLimits limits;
    limits.requestsPerWindow = 2;
    limits.tokensPerWindow = 50;
    limits.window = std::chrono::seconds(10);
    auto now = Clock::time_point(std::chrono::hours(2));

    std::deque<UsageRecord> records{{now - 11s, 40}, {now - 5s, 20}};
    auto result = evaluate(records, 30, now, limits);
    EXPECT_TRUE(result.admitted());
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records.back().tokens, 30);

    EXPECT_EQ(evaluate(records, 0, now, limits).reason, RejectReason::RequestLimit);
}
