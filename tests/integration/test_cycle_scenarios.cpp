#include <gtest/gtest.h>
#include <quotatrack/quotatrack.hpp>

#include <memory>
#include <random>
#include <vector>

using namespace quotatrack;
using namespace std::chrono_literals;

namespace {

const Timestamp T0 = Clock::from_time_t(1700000000);

} // anonymous namespace

// ===========================================================================
// Fixture: one increasing-usage quota without a known limit
// ===========================================================================

class CycleScenarioTest : public ::testing::Test {
protected:
    void SetUp() override {
        store = std::make_shared<InMemoryCycleStore>();
        tracker = std::make_unique<QuotaTracker>(store);
        tracker->register_quota(providers::RequestCounter::descriptor("acme", "requests"));
    }

    std::vector<IngestResult> feed_minutes(const std::vector<double>& values) {
        std::vector<IngestResult> results;
        for (std::size_t i = 0; i < values.size(); ++i) {
            results.push_back(tracker->ingest(providers::RequestCounter::sample(
                key, T0 + std::chrono::minutes(i),
                providers::RequestCounterReading{values[i], std::nullopt, std::nullopt})));
        }
        return results;
    }

    std::size_t active_count() const {
        std::size_t n = 0;
        for (const auto& c : store->all_cycles(key)) {
            if (c.is_active()) n++;
        }
        return n;
    }

    QuotaKey key{"acme", "requests"};
    std::shared_ptr<InMemoryCycleStore> store;
    std::unique_ptr<QuotaTracker> tracker;
};

// ===========================================================================
// Reset scenario: the sample holding 5 drops below half of 95
// ===========================================================================

TEST_F(CycleScenarioTest, DropAfterPeakSplitsCycles) {
    auto results = feed_minutes({10, 40, 90, 95, 5, 30});

    EXPECT_EQ(results[0].outcome, IngestOutcome::Created);
    EXPECT_EQ(results[3].outcome, IngestOutcome::Continued);
    EXPECT_EQ(results[4].outcome, IngestOutcome::Reset);
    EXPECT_EQ(results[5].outcome, IngestOutcome::Continued);

    auto cycles = store->all_cycles(key);
    ASSERT_EQ(cycles.size(), 2u);

    const Cycle& closed = cycles[0];
    EXPECT_EQ(closed.start, T0);
    ASSERT_TRUE(closed.end.has_value());
    EXPECT_EQ(*closed.end, T0 + 3min);
    EXPECT_DOUBLE_EQ(closed.peak, 95.0);
    EXPECT_DOUBLE_EQ(closed.total_delta, 85.0);

    const Cycle& active = cycles[1];
    EXPECT_TRUE(active.is_active());
    EXPECT_EQ(active.start, T0 + 4min);
    EXPECT_DOUBLE_EQ(active.peak, 30.0);
    EXPECT_DOUBLE_EQ(active.total_delta, 25.0);
}

TEST_F(CycleScenarioTest, DropToFortyResetsButSixtyDoesNot) {
    auto results = feed_minutes({100, 60});
    EXPECT_EQ(results[1].outcome, IngestOutcome::Continued);
    EXPECT_DOUBLE_EQ(tracker->active_cycle(key)->peak, 100.0);

    auto more = tracker->ingest(providers::RequestCounter::sample(
        key, T0 + 5min, providers::RequestCounterReading{40, std::nullopt, std::nullopt}));
    EXPECT_EQ(more.outcome, IngestOutcome::Reset);
    EXPECT_DOUBLE_EQ(more.closed_cycle->peak, 100.0);
}

TEST_F(CycleScenarioTest, JitterCyclesGroupIntoTwoPeriods) {
    // Six detected cycles with peaks 20, 22, 21, 3, 18, 19
    feed_minutes({1, 20, 2, 22, 1, 21, 0, 3, 1, 18, 2, 19});

    auto cycles = store->all_cycles(key);
    ASSERT_EQ(cycles.size(), 6u);

    auto periods = tracker->billing_periods(key, T0 + 12min);
    ASSERT_EQ(periods.size(), 2u);
    EXPECT_DOUBLE_EQ(periods[0].max_peak, 22.0);
    EXPECT_DOUBLE_EQ(periods[1].max_peak, 19.0);
}

// ===========================================================================
// Invariants under arbitrary input
// ===========================================================================

TEST_F(CycleScenarioTest, SingleActiveCycleAlways) {
    std::mt19937 rng(1234);
    std::uniform_real_distribution<double> dist(0.0, 500.0);

    for (int i = 0; i < 300; ++i) {
        tracker->ingest(providers::RequestCounter::sample(
            key, T0 + std::chrono::seconds(30 * i),
            providers::RequestCounterReading{dist(rng), std::nullopt, std::nullopt}));
        ASSERT_EQ(active_count(), 1u) << "after sample " << i;
    }

    // Closed cycles never overlap and are in start order
    auto cycles = store->all_cycles(key);
    for (std::size_t i = 1; i < cycles.size(); ++i) {
        ASSERT_TRUE(cycles[i - 1].end.has_value());
        EXPECT_LT(*cycles[i - 1].end, cycles[i].start);
        EXPECT_GE(cycles[i - 1].peak, 0.0);
    }
}

TEST_F(CycleScenarioTest, PeakIsMonotonicForNonDecreasingInput) {
    double previous_peak = 0.0;
    double value = 0.0;
    for (int i = 0; i < 50; ++i) {
        value += (i % 3 == 0) ? 0.0 : 7.5;
        auto r = tracker->ingest(providers::RequestCounter::sample(
            key, T0 + std::chrono::minutes(i),
            providers::RequestCounterReading{value, std::nullopt, std::nullopt}));

        ASSERT_NE(r.outcome, IngestOutcome::Reset);
        EXPECT_GE(r.active_cycle->peak, previous_peak);
        previous_peak = r.active_cycle->peak;
    }
    EXPECT_EQ(store->cycle_count(), 1u);
}

TEST_F(CycleScenarioTest, GroupingIsStableAcrossQueries) {
    feed_minutes({10, 80, 5, 60, 2, 70, 1, 4});

    auto first = tracker->billing_periods(key, T0 + 8min);
    auto second = tracker->billing_periods(key, T0 + 8min);
    ASSERT_EQ(first.size(), second.size());
    for (std::size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(first[i].start, second[i].start);
        EXPECT_DOUBLE_EQ(first[i].max_peak, second[i].max_peak);
        EXPECT_EQ(first[i].cycle_count, second[i].cycle_count);
    }
}

TEST_F(CycleScenarioTest, DecreasingWindowRateIsZero) {
    // Pairs stay above half of the running peak, so no reset fires
    feed_minutes({100, 95, 90, 85, 80, 75, 70});

    auto r = tracker->rate(key, T0 + 6min);
    ASSERT_TRUE(r.has_rate());
    EXPECT_DOUBLE_EQ(*r.per_hour, 0.0);
    EXPECT_TRUE(r.is_idle());

    auto in = tracker->insights(key, T0 + 6min);
    EXPECT_EQ(in.forecast.state, ForecastState::Idle);
}

// ===========================================================================
// Restart: a fresh tracker over the same store continues the active cycle
// ===========================================================================

TEST_F(CycleScenarioTest, StateSurvivesTrackerRestart) {
    feed_minutes({10, 40, 90});

    QuotaTracker restarted(store);
    restarted.register_quota(providers::RequestCounter::descriptor("acme", "requests"));

    auto stale = restarted.ingest(providers::RequestCounter::sample(
        key, T0 + 1min, providers::RequestCounterReading{5, std::nullopt, std::nullopt}));
    EXPECT_EQ(stale.outcome, IngestOutcome::OutOfOrder);

    auto r = restarted.ingest(providers::RequestCounter::sample(
        key, T0 + 10min, providers::RequestCounterReading{20, std::nullopt, std::nullopt}));
    EXPECT_EQ(r.outcome, IngestOutcome::Reset);
    EXPECT_DOUBLE_EQ(r.closed_cycle->peak, 90.0);
    EXPECT_EQ(*r.closed_cycle->end, T0 + 2min);
}
