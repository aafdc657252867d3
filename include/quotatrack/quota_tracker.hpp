#pragma once

#include "quotatrack/types.hpp"
#include "quotatrack/config.hpp"
#include "quotatrack/quota_descriptor.hpp"
#include "quotatrack/cycle_store.hpp"
#include "quotatrack/cycle_detector.hpp"
#include "quotatrack/tracker_window.hpp"
#include "quotatrack/billing_period.hpp"
#include "quotatrack/rate_engine.hpp"
#include "quotatrack/insight.hpp"
#include "quotatrack/monitor.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace quotatrack {

// Long-run statistics for one quota
struct UsageSummary {
    QuotaKey key;
    double current{0.0};
    std::optional<double> limit;
    std::optional<double> usage_percent;
    std::optional<Timestamp> resets_at;
    std::optional<double> hours_until_reset;

    std::size_t completed_cycles{0};
    double average_per_cycle{0.0};   // mean total_delta of completed cycles
    double peak_cycle{0.0};          // highest cycle peak, active included
    double total_tracked{0.0};       // total_delta summed, active included
    std::optional<Timestamp> tracking_since;

    std::optional<Cycle> active_cycle;
};

// Everything presentation needs for one quota card
struct QuotaInsights {
    QuotaKey key;
    std::optional<UsageClassification> usage;
    RateEstimate rate;
    Projection projection;
    ForecastClassification forecast;
    BillingSummary billing;
    std::optional<VarianceClassification> variance;
    std::optional<TrendClassification> trend;
    std::optional<CycleUtilizationClassification> cycle_utilization;
    std::optional<WeeklyPaceClassification> weekly_pace;
};

// Coordinating service: owns the registry of tracked quotas, serializes
// ingestion per quota key and answers analytics queries.
//
// The store must tolerate concurrent calls for different keys.
class QuotaTracker {
public:
    explicit QuotaTracker(std::shared_ptr<CycleStore> store, TrackerConfig config = TrackerConfig{});

    QuotaTracker(const QuotaTracker&) = delete;
    QuotaTracker& operator=(const QuotaTracker&) = delete;

    // ==================== Registration ====================

    void register_quota(QuotaDescriptor descriptor);
    bool is_registered(const QuotaKey& key) const;
    std::optional<QuotaDescriptor> get_descriptor(const QuotaKey& key) const;
    std::vector<QuotaKey> quota_keys() const;
    std::size_t quota_count() const;

    // ==================== Ingestion ====================

    // Malformed samples come back as Discarded and out-of-order ones as
    // OutOfOrder; neither mutates state. Store failures propagate.
    IngestResult ingest(const QuotaSample& sample);

    // One provider poll: every quota of the snapshot, in order
    std::vector<IngestResult> ingest_all(const std::vector<QuotaSample>& samples);

    // ==================== Queries ====================

    std::optional<Cycle> active_cycle(const QuotaKey& key) const;
    RateEstimate rate(const QuotaKey& key, Timestamp now = Clock::now()) const;
    Projection projection(const QuotaKey& key, Timestamp now = Clock::now()) const;
    std::vector<BillingPeriod> billing_periods(const QuotaKey& key, Timestamp now = Clock::now()) const;
    BillingSummary billing_summary(const QuotaKey& key, Timestamp now = Clock::now()) const;
    UsageSummary usage_summary(const QuotaKey& key, Timestamp now = Clock::now()) const;
    QuotaInsights insights(const QuotaKey& key, Timestamp now = Clock::now()) const;

    TrackerSnapshot get_snapshot() const;

    // ==================== Configuration ====================

    void set_monitor(std::shared_ptr<Monitor> monitor);
    void publish_snapshot();

    const TrackerConfig& config() const noexcept;

private:
    struct QuotaState {
        QuotaState(QuotaDescriptor d, Duration window_span)
            : descriptor(std::move(d)), window(window_span) {}

        const QuotaDescriptor descriptor;
        std::mutex mutex;      // ingest read-decide-write + window
        TrackerWindow window;  // guarded by mutex
    };

    TrackerConfig config_;
    std::shared_ptr<CycleStore> store_;
    CycleDetector detector_;
    RateEngine rate_engine_;

    mutable std::shared_mutex registry_mutex_;
    std::unordered_map<QuotaKey, std::unique_ptr<QuotaState>> quotas_;

    std::shared_ptr<Monitor> monitor_;

    // Caller holds registry_mutex_ (shared or exclusive)
    QuotaState& state_for(const QuotaKey& key) const;

    std::vector<WindowPoint> window_points(const QuotaKey& key, Timestamp now) const;
    std::vector<Cycle> rate_history(const QuotaKey& key, const std::optional<Cycle>& active) const;
    RateEstimate rate_for(const QuotaKey& key, const std::optional<Cycle>& active, Timestamp now) const;
    Projection projection_for(const std::optional<Cycle>& active,
                              const RateEstimate& rate, Timestamp now) const;
    std::optional<Cycle> load_active(const QuotaKey& key) const;

    // Runs a store call, reporting StoreFailure before rethrowing
    template <typename Fn>
    auto guard_store(const QuotaKey& key, const char* operation, Fn&& fn) const -> decltype(fn());

    void emit_ingest_events(const QuotaSample& sample, const IngestResult& result);
    void emit_event(EventType type, const std::string& message,
                    std::optional<QuotaKey> quota_key = std::nullopt,
                    std::optional<CycleId> cycle_id = std::nullopt,
                    std::optional<double> consumed = std::nullopt,
                    std::optional<double> peak = std::nullopt,
                    std::optional<ResetReason> reset_reason = std::nullopt,
                    std::optional<Timestamp> sample_time = std::nullopt) const;
};

} // namespace quotatrack
