#pragma once

#include "quotatrack/types.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace quotatrack {

enum class EventType {
    QuotaRegistered,
    CycleCreated,
    CycleUpdated,
    ResetDetected,
    CycleClosed,
    SampleOutOfOrder,
    SampleDiscarded,
    StoreFailure
};

struct MonitorEvent {
    EventType type;
    Timestamp timestamp;
    std::string message;

    std::optional<QuotaKey> quota_key;
    std::optional<CycleId> cycle_id;
    std::optional<double> consumed;
    std::optional<double> peak;
    std::optional<ResetReason> reset_reason;

    // Capture time of the sample that triggered the event
    std::optional<Timestamp> sample_time;
};

// Abstract monitor interface
class Monitor {
public:
    virtual ~Monitor() = default;
    virtual void on_event(const MonitorEvent& event) = 0;
    virtual void on_snapshot(const TrackerSnapshot& snapshot) = 0;
};

// Console logger
class ConsoleMonitor : public Monitor {
public:
    enum class Verbosity { Quiet, Normal, Verbose, Debug };

    explicit ConsoleMonitor(Verbosity v = Verbosity::Normal);

    void on_event(const MonitorEvent& event) override;
    void on_snapshot(const TrackerSnapshot& snapshot) override;

private:
    Verbosity verbosity_;
    mutable std::mutex output_mutex_;
};

// Metrics collector
class MetricsMonitor : public Monitor {
public:
    struct Metrics {
        std::uint64_t samples_ingested{0};
        std::uint64_t cycles_created{0};
        std::uint64_t resets_detected{0};
        std::uint64_t samples_out_of_order{0};
        std::uint64_t samples_discarded{0};
        std::uint64_t store_failures{0};
        std::size_t tracked_quotas{0};
        double highest_usage_percent{0.0};
    };

    MetricsMonitor();

    void on_event(const MonitorEvent& event) override;
    void on_snapshot(const TrackerSnapshot& snapshot) override;

    Metrics get_metrics() const;
    void reset_metrics();

    using AlertCallback = std::function<void(const std::string&)>;

    // Fires once per snapshot for every quota above `percent`
    void set_usage_alert_threshold(double percent, AlertCallback cb);

private:
    mutable std::mutex metrics_mutex_;
    Metrics metrics_;

    double usage_threshold_{101.0};  // > 100 means disabled
    AlertCallback usage_cb_;
};

// Fan-out to multiple monitors
class CompositeMonitor : public Monitor {
public:
    void add_monitor(std::shared_ptr<Monitor> monitor);

    void on_event(const MonitorEvent& event) override;
    void on_snapshot(const TrackerSnapshot& snapshot) override;

private:
    std::vector<std::shared_ptr<Monitor>> monitors_;
};

const char* to_string(EventType t);

} // namespace quotatrack
