#include <gtest/gtest.h>
#include <quotatrack/quotatrack.hpp>

#include <memory>
#include <mutex>
#include <vector>

using namespace quotatrack;
using namespace std::chrono_literals;

namespace {

const Timestamp T0 = Clock::from_time_t(1700000000);

} // anonymous namespace

// ===========================================================================
// TestMonitor: captures events for assertion
// ===========================================================================

class TestMonitor : public Monitor {
public:
    void on_event(const MonitorEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(event);
    }
    void on_snapshot(const TrackerSnapshot& snapshot) override {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshots_.push_back(snapshot);
    }
    std::vector<MonitorEvent> get_events() {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }
    std::vector<EventType> event_types() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<EventType> types;
        for (auto& e : events_) types.push_back(e.type);
        return types;
    }
    std::vector<TrackerSnapshot> get_snapshots() {
        std::lock_guard<std::mutex> lock(mutex_);
        return snapshots_;
    }
    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.clear();
    }
private:
    std::mutex mutex_;
    std::vector<MonitorEvent> events_;
    std::vector<TrackerSnapshot> snapshots_;
};

// ===========================================================================
// Fixture
// ===========================================================================

class QuotaTrackerTest : public ::testing::Test {
protected:
    void SetUp() override {
        store = std::make_shared<InMemoryCycleStore>();
        tracker = std::make_unique<QuotaTracker>(store);
        monitor = std::make_shared<TestMonitor>();
        tracker->set_monitor(monitor);

        tracker->register_quota(providers::RequestCounter::descriptor(
            "synthetic", "subscription", 1000.0));
    }

    IngestResult feed(Timestamp at, double requests) {
        return tracker->ingest(providers::RequestCounter::sample(
            key, at, providers::RequestCounterReading{requests, std::nullopt, std::nullopt}));
    }

    QuotaKey key{"synthetic", "subscription"};
    std::shared_ptr<InMemoryCycleStore> store;
    std::unique_ptr<QuotaTracker> tracker;
    std::shared_ptr<TestMonitor> monitor;
};

// ===========================================================================
// Registration
// ===========================================================================

TEST_F(QuotaTrackerTest, RegistrationIsRecorded) {
    EXPECT_TRUE(tracker->is_registered(key));
    EXPECT_EQ(tracker->quota_count(), 1u);

    auto d = tracker->get_descriptor(key);
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->kind, CounterKind::IncreasingUsage);

    auto events = monitor->get_events();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].type, EventType::QuotaRegistered);
    EXPECT_EQ(events[0].quota_key->to_string(), "synthetic/subscription");
}

TEST_F(QuotaTrackerTest, DuplicateRegistrationRejected) {
    EXPECT_THROW(tracker->register_quota(
                     providers::RequestCounter::descriptor("synthetic", "subscription")),
                 QuotaAlreadyRegisteredException);
}

TEST_F(QuotaTrackerTest, InvalidDescriptorRejected) {
    QuotaDescriptor d;
    d.key = QuotaKey{"synthetic", "search"};
    EXPECT_THROW(tracker->register_quota(d), InvalidConfigException);

    d.value_field = "requests";
    d.drop_ratio = 1.5;
    EXPECT_THROW(tracker->register_quota(d), InvalidConfigException);
    EXPECT_FALSE(tracker->is_registered(d.key));
}

TEST_F(QuotaTrackerTest, KeysAreSorted) {
    tracker->register_quota(providers::UtilizationWindow::descriptor("anthropic", "seven_day"));
    tracker->register_quota(providers::UtilizationWindow::descriptor("anthropic", "five_hour"));

    auto keys = tracker->quota_keys();
    ASSERT_EQ(keys.size(), 3u);
    EXPECT_EQ(keys[0].to_string(), "anthropic/five_hour");
    EXPECT_EQ(keys[2].to_string(), "synthetic/subscription");
}

TEST_F(QuotaTrackerTest, UnknownKeyThrows) {
    QuotaKey unknown{"nobody", "nothing"};
    QuotaSample s;
    s.key = unknown;
    s.timestamp = T0;

    EXPECT_THROW(tracker->ingest(s), QuotaNotFoundException);
    EXPECT_THROW(tracker->active_cycle(unknown), QuotaNotFoundException);
    EXPECT_THROW(tracker->rate(unknown, T0), QuotaNotFoundException);
    EXPECT_THROW(tracker->billing_summary(unknown, T0), QuotaNotFoundException);
    EXPECT_THROW(tracker->insights(unknown, T0), QuotaNotFoundException);
}

// ===========================================================================
// Ingestion events
// ===========================================================================

TEST_F(QuotaTrackerTest, IngestEmitsLifecycleEvents) {
    monitor->clear();

    feed(T0, 100.0);
    feed(T0 + 1min, 400.0);
    feed(T0 + 2min, 50.0);

    std::vector<EventType> expected = {
        EventType::CycleCreated,
        EventType::CycleUpdated,
        EventType::CycleClosed,
        EventType::ResetDetected,
        EventType::CycleCreated,
    };
    EXPECT_EQ(monitor->event_types(), expected);

    auto events = monitor->get_events();
    EXPECT_EQ(*events[3].reset_reason, ResetReason::DropBelowRatio);
    EXPECT_DOUBLE_EQ(*events[3].peak, 400.0);
    EXPECT_EQ(*events[3].sample_time, T0 + 2min);
}

TEST_F(QuotaTrackerTest, OutOfOrderAndMalformedAreReported) {
    feed(T0 + 5min, 100.0);
    monitor->clear();

    EXPECT_EQ(feed(T0, 200.0).outcome, IngestOutcome::OutOfOrder);

    QuotaSample bad;
    bad.key = key;
    bad.timestamp = T0 + 6min;
    bad.fields["requests"] = -3.0;
    auto r = tracker->ingest(bad);
    EXPECT_EQ(r.outcome, IngestOutcome::Discarded);
    EXPECT_FALSE(r.active_cycle.has_value());

    std::vector<EventType> expected = {EventType::SampleOutOfOrder, EventType::SampleDiscarded};
    EXPECT_EQ(monitor->event_types(), expected);
    EXPECT_EQ(store->cycle_count(), 1u);
    EXPECT_DOUBLE_EQ(tracker->active_cycle(key)->peak, 100.0);
}

TEST_F(QuotaTrackerTest, IngestAllKeepsOrder) {
    std::vector<QuotaSample> batch;
    for (int i = 0; i < 3; ++i) {
        batch.push_back(providers::RequestCounter::sample(
            key, T0 + std::chrono::minutes(i),
            providers::RequestCounterReading{10.0 * (i + 1), std::nullopt, std::nullopt}));
    }
    auto results = tracker->ingest_all(batch);

    ASSERT_EQ(results.size(), 3u);
    EXPECT_EQ(results[0].outcome, IngestOutcome::Created);
    EXPECT_EQ(results[1].outcome, IngestOutcome::Continued);
    EXPECT_EQ(results[2].outcome, IngestOutcome::Continued);
}

// ===========================================================================
// Rate and projection
// ===========================================================================

TEST_F(QuotaTrackerTest, BurnRateAndExhaustion) {
    feed(T0, 100.0);
    feed(T0 + 10min, 150.0);

    auto r = tracker->rate(key, T0 + 10min);
    ASSERT_TRUE(r.has_rate());
    EXPECT_EQ(r.source, RateSource::Window);
    EXPECT_NEAR(*r.per_hour, 300.0, 1e-9);

    auto p = tracker->projection(key, T0 + 10min);
    EXPECT_DOUBLE_EQ(p.current, 150.0);
    EXPECT_DOUBLE_EQ(*p.limit, 1000.0);
    ASSERT_TRUE(p.hours_to_exhaustion.has_value());
    EXPECT_NEAR(*p.hours_to_exhaustion, 2.8333, 1e-3);
}

TEST_F(QuotaTrackerTest, StalledPollingDropsWindowRate) {
    feed(T0, 100.0);
    feed(T0 + 10min, 150.0);

    // Both points are older than the window at query time
    auto r = tracker->rate(key, T0 + 2h);
    EXPECT_NE(r.source, RateSource::Window);
    ASSERT_TRUE(r.has_rate());
    EXPECT_EQ(r.source, RateSource::CycleAverage);
    EXPECT_NEAR(*r.per_hour, 50.0 / 2.0, 1e-9);

    // Three days on, the forecast runs on the cycle average
    auto p = tracker->projection(key, T0 + 72h);
    ASSERT_TRUE(p.rate_per_hour.has_value());
    EXPECT_NEAR(*p.rate_per_hour, 50.0 / 72.0, 1e-9);
    ASSERT_TRUE(p.hours_to_exhaustion.has_value());
    EXPECT_NEAR(*p.hours_to_exhaustion, 850.0 / (50.0 / 72.0), 1e-6);
}

TEST_F(QuotaTrackerTest, RateBeforeEnoughDataIsAnalyzing) {
    feed(T0, 100.0);
    feed(T0 + 2min, 150.0);

    auto r = tracker->rate(key, T0 + 2min);
    EXPECT_FALSE(r.has_rate());

    auto insights = tracker->insights(key, T0 + 2min);
    EXPECT_EQ(insights.forecast.state, ForecastState::Analyzing);
}

TEST_F(QuotaTrackerTest, ResetRestartsTheWindow) {
    feed(T0, 100.0);
    feed(T0 + 10min, 400.0);
    feed(T0 + 20min, 10.0);

    // Only the post-reset sample is in the window
    auto r = tracker->rate(key, T0 + 20min);
    EXPECT_NE(r.source, RateSource::Window);
}

TEST_F(QuotaTrackerTest, ProjectionUsesReportedReset) {
    tracker->register_quota(providers::UtilizationWindow::descriptor("anthropic", "five_hour"));
    QuotaKey five{"anthropic", "five_hour"};

    for (int i = 0; i <= 2; ++i) {
        tracker->ingest(providers::UtilizationWindow::sample(
            five, T0 + std::chrono::minutes(10 * i),
            providers::UtilizationReading{20.0 + 10.0 * i, T0 + 3h}));
    }

    auto p = tracker->projection(five, T0 + 20min);
    EXPECT_NEAR(*p.rate_per_hour, 60.0, 1e-9);
    EXPECT_NEAR(*p.hours_until_reset, 2.6667, 1e-3);
    EXPECT_DOUBLE_EQ(*p.projected, 100.0);
    EXPECT_NEAR(*p.hours_to_exhaustion, 1.0, 1e-9);
    EXPECT_TRUE(p.exhausts_first);

    auto insights = tracker->insights(five, T0 + 20min);
    EXPECT_EQ(insights.forecast.state, ForecastState::ExhaustsFirst);
    EXPECT_EQ(insights.forecast.severity, Severity::Negative);
}

// ===========================================================================
// History analytics
// ===========================================================================

class QuotaHistoryTest : public QuotaTrackerTest {
protected:
    void SetUp() override {
        QuotaTrackerTest::SetUp();
        tracker->register_quota(providers::UtilizationWindow::descriptor("anthropic", "seven_day"));

        // Four cycles peaking at 80, 30, 10 and 4
        const double values[] = {10, 80, 5, 30, 2, 10, 1, 4};
        for (int i = 0; i < 8; ++i) {
            tracker->ingest(providers::UtilizationWindow::sample(
                week, T0 + std::chrono::hours(i),
                providers::UtilizationReading{values[i], std::nullopt}));
        }
    }

    QuotaKey week{"anthropic", "seven_day"};
    Timestamp now = T0 + 7h;
};

TEST_F(QuotaHistoryTest, BillingPeriodsFromCycles) {
    auto periods = tracker->billing_periods(week, now);
    ASSERT_EQ(periods.size(), 4u);
    EXPECT_DOUBLE_EQ(periods[0].max_peak, 80.0);
    EXPECT_DOUBLE_EQ(periods[3].max_peak, 4.0);
    EXPECT_FALSE(periods[3].end.has_value());
}

TEST_F(QuotaHistoryTest, UsageSummary) {
    auto s = tracker->usage_summary(week, now);

    EXPECT_EQ(s.completed_cycles, 3u);
    EXPECT_NEAR(s.average_per_cycle, (70.0 + 25.0 + 8.0) / 3.0, 1e-9);
    EXPECT_DOUBLE_EQ(s.peak_cycle, 80.0);
    EXPECT_DOUBLE_EQ(s.total_tracked, 106.0);
    EXPECT_EQ(*s.tracking_since, T0);
    EXPECT_DOUBLE_EQ(s.current, 4.0);
    EXPECT_DOUBLE_EQ(*s.usage_percent, 4.0);
    ASSERT_TRUE(s.active_cycle.has_value());
    EXPECT_EQ(s.active_cycle->start, T0 + 6h);
}

TEST_F(QuotaHistoryTest, RateFallsBackToCycleAverage) {
    // Hourly samples leave a single point in the 30 minute window
    auto r = tracker->rate(week, now);
    ASSERT_TRUE(r.has_rate());
    EXPECT_EQ(r.source, RateSource::CycleAverage);
    EXPECT_NEAR(*r.per_hour, 106.0 / 7.0, 1e-9);
}

TEST_F(QuotaHistoryTest, Insights) {
    auto in = tracker->insights(week, now);

    ASSERT_TRUE(in.usage.has_value());
    EXPECT_EQ(in.usage->level, UsageLevel::Healthy);

    EXPECT_EQ(in.billing.count(), 4u);
    ASSERT_TRUE(in.trend.has_value());
    EXPECT_EQ(in.trend->direction, TrendDirection::Falling);

    ASSERT_TRUE(in.variance.has_value());
    EXPECT_EQ(in.variance->level, VarianceLevel::High);

    ASSERT_TRUE(in.cycle_utilization.has_value());
    EXPECT_EQ(in.cycle_utilization->fit, UtilizationFit::Headroom);

    ASSERT_TRUE(in.weekly_pace.has_value());
    EXPECT_DOUBLE_EQ(in.weekly_pace->week_total, 124.0);
    EXPECT_NEAR(*in.weekly_pace->share_percent, 100.0, 1e-9);
}

// ===========================================================================
// Snapshots
// ===========================================================================

TEST_F(QuotaTrackerTest, SnapshotReflectsActiveCycles) {
    tracker->register_quota(providers::UtilizationWindow::descriptor("anthropic", "five_hour"));
    feed(T0, 870.0);

    auto snap = tracker->get_snapshot();
    ASSERT_EQ(snap.quotas.size(), 2u);

    const auto& idle = snap.quotas[0];
    EXPECT_EQ(idle.key.to_string(), "anthropic/five_hour");
    EXPECT_FALSE(idle.has_active_cycle);

    const auto& busy = snap.quotas[1];
    EXPECT_TRUE(busy.has_active_cycle);
    EXPECT_DOUBLE_EQ(busy.current, 870.0);
    EXPECT_NEAR(*busy.usage_percent, 87.0, 1e-9);
}

TEST_F(QuotaTrackerTest, PublishSnapshotFeedsMetrics) {
    auto metrics = std::make_shared<MetricsMonitor>();
    auto composite = std::make_shared<CompositeMonitor>();
    composite->add_monitor(monitor);
    composite->add_monitor(metrics);
    tracker->set_monitor(composite);

    std::vector<std::string> alerts;
    metrics->set_usage_alert_threshold(80.0, [&](const std::string& msg) {
        alerts.push_back(msg);
    });

    feed(T0, 500.0);
    feed(T0 + 1min, 900.0);
    tracker->publish_snapshot();

    auto m = metrics->get_metrics();
    EXPECT_EQ(m.samples_ingested, 2u);
    EXPECT_EQ(m.cycles_created, 1u);
    EXPECT_EQ(m.tracked_quotas, 1u);
    EXPECT_NEAR(m.highest_usage_percent, 90.0, 1e-9);
    EXPECT_EQ(alerts.size(), 1u);
    EXPECT_EQ(monitor->get_snapshots().size(), 1u);
}
