#include <gtest/gtest.h>
#include <chrono>

#include "Metrics.hpp"

TEST(HistogramTest, PercentilesFollowBuckets)
{
    // Observations land in the first bucket whose bound covers them.
    Histogram hist;
    for (int i = 0; i < 98; ++i)
        hist.observe(500);
    hist.observe(40000);
    hist.observe(3000000);

    auto snap = hist.snapshot();
    EXPECT_EQ(snap.count, 100u);
    EXPECT_DOUBLE_EQ(snap.p50_ms, 1.0);
    EXPECT_DOUBLE_EQ(snap.p95_ms, 1.0);
    EXPECT_DOUBLE_EQ(snap.p99_ms, 50.0);
}

TEST(MetricsTest, RecordsRoutesAndErrors)
{
    // Per-route counts separate error statuses from successes.
    Metrics metrics;
    metrics.record_request("generate", 200, std::chrono::microseconds(800));
    metrics.record_request("generate", 429, std::chrono::microseconds(200));
    metrics.record_request("health", 200, std::chrono::microseconds(50));
    metrics.inc_connections();

    auto snap = metrics.snapshot(3);
    EXPECT_EQ(snap["total_requests"], 3);
    EXPECT_EQ(snap["connections"], 1);
    EXPECT_EQ(snap["sessions"], 3);
    EXPECT_EQ(snap["routes"]["generate"]["count"], 2);
    EXPECT_EQ(snap["routes"]["generate"]["errors"], 1);
    EXPECT_EQ(snap["routes"]["health"]["errors"], 0);
}

TEST(MetricsTest, WindowResetsOnlyWhenAsked)
{
    // Plain snapshots leave the QPS window running; the periodic dump restarts it.
    Metrics metrics;
    metrics.record_request("health", 200, std::chrono::microseconds(10));
    EXPECT_EQ(metrics.snapshot(0)["window_requests"], 1);
    EXPECT_EQ(metrics.snapshot_and_reset_window(0)["window_requests"], 1);
    EXPECT_EQ(metrics.snapshot(0)["window_requests"], 0);
    EXPECT_EQ(metrics.snapshot(0)["total_requests"], 1);
}

TEST(MetricsTest, AdmissionOutcomesBySource)
{
    // Request-limit and token-limit rejections are tallied separately.
    Metrics metrics;
    CheckResult admit;
    CheckResult byCount;
    byCount.decision = Decision::Reject;
    byCount.reason = RejectReason::RequestLimit;
    CheckResult byTokens;
    byTokens.decision = Decision::Reject;
    byTokens.reason = RejectReason::TokenLimit;

    metrics.record_admission(admit, 40);
    metrics.record_admission(admit, 2);
    metrics.record_admission(byCount, 5);
    metrics.record_admission(byTokens, 5);
    metrics.record_admission(byTokens, 5);

    auto snap = metrics.snapshot(0);
    EXPECT_EQ(snap["admission"]["admitted"], 2);
    EXPECT_EQ(snap["admission"]["tokens_admitted"], 42);
    EXPECT_EQ(snap["admission"]["rejected_request_limit"], 1);
    EXPECT_EQ(snap["admission"]["rejected_token_limit"], 2);
    EXPECT_EQ(metrics.rejected(), 3u);
}
