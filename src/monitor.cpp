#include "quotatrack/monitor.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>

namespace quotatrack {

const char* to_string(EventType t) {
    switch (t) {
        case EventType::QuotaRegistered:  return "QuotaRegistered";
        case EventType::CycleCreated:     return "CycleCreated";
        case EventType::CycleUpdated:     return "CycleUpdated";
        case EventType::ResetDetected:    return "ResetDetected";
        case EventType::CycleClosed:      return "CycleClosed";
        case EventType::SampleOutOfOrder: return "SampleOutOfOrder";
        case EventType::SampleDiscarded:  return "SampleDiscarded";
        case EventType::StoreFailure:     return "StoreFailure";
    }
    return "Unknown";
}

namespace {

bool is_important_event(EventType t) {
    switch (t) {
        case EventType::QuotaRegistered:
        case EventType::ResetDetected:
        case EventType::CycleClosed:
        case EventType::SampleOutOfOrder:
        case EventType::SampleDiscarded:
        case EventType::StoreFailure:
            return true;
        default:
            return false;
    }
}

} // anonymous namespace

// ========== ConsoleMonitor ==========

ConsoleMonitor::ConsoleMonitor(Verbosity v) : verbosity_(v) {}

void ConsoleMonitor::on_event(const MonitorEvent& event) {
    if (verbosity_ == Verbosity::Quiet) return;
    if (verbosity_ == Verbosity::Normal && !is_important_event(event.type)) return;
    if (verbosity_ == Verbosity::Verbose && event.type == EventType::CycleUpdated) return;

    std::lock_guard<std::mutex> lock(output_mutex_);

    std::cout << "[QuotaTrack] " << to_string(event.type);

    if (event.quota_key.has_value()) {
        std::cout << " quota=" << event.quota_key->to_string();
    }
    if (event.cycle_id.has_value()) {
        std::cout << " cycle=" << event.cycle_id.value();
    }
    if (event.consumed.has_value()) {
        std::cout << " consumed=" << event.consumed.value();
    }
    if (event.peak.has_value()) {
        std::cout << " peak=" << event.peak.value();
    }
    if (event.reset_reason.has_value()) {
        std::cout << " reason=" << to_string(event.reset_reason.value());
    }

    if (!event.message.empty()) {
        std::cout << " | " << event.message;
    }

    std::cout << "\n";
}

void ConsoleMonitor::on_snapshot(const TrackerSnapshot& snapshot) {
    if (verbosity_ < Verbosity::Verbose) return;

    std::lock_guard<std::mutex> lock(output_mutex_);

    std::cout << "\n[QuotaTrack] === Tracker Snapshot ===\n";
    std::cout << "  Quotas: " << snapshot.quotas.size() << "\n";

    for (const auto& q : snapshot.quotas) {
        std::cout << "    [" << q.key.to_string() << "] ";
        if (!q.has_active_cycle) {
            std::cout << "no active cycle\n";
            continue;
        }
        std::cout << "current=" << q.current << " peak=" << q.peak;
        if (q.limit.has_value()) {
            std::cout << " limit=" << q.limit.value();
        }
        if (q.usage_percent.has_value()) {
            std::cout << " util=" << std::fixed << std::setprecision(1)
                      << q.usage_percent.value() << "%" << std::defaultfloat;
        }
        std::cout << "\n";
    }
    std::cout << "  ==========================\n\n";
}

// ========== MetricsMonitor ==========

MetricsMonitor::MetricsMonitor() = default;

void MetricsMonitor::on_event(const MonitorEvent& event) {
    std::lock_guard<std::mutex> lock(metrics_mutex_);

    // Every accepted sample yields exactly one CycleCreated or CycleUpdated
    switch (event.type) {
        case EventType::CycleCreated:
            metrics_.samples_ingested++;
            metrics_.cycles_created++;
            break;
        case EventType::CycleUpdated:
            metrics_.samples_ingested++;
            break;
        case EventType::ResetDetected:
            metrics_.resets_detected++;
            break;
        case EventType::SampleOutOfOrder:
            metrics_.samples_out_of_order++;
            break;
        case EventType::SampleDiscarded:
            metrics_.samples_discarded++;
            break;
        case EventType::StoreFailure:
            metrics_.store_failures++;
            break;
        default:
            break;
    }
}

void MetricsMonitor::on_snapshot(const TrackerSnapshot& snapshot) {
    std::vector<std::string> alerts;
    AlertCallback cb;

    {
        std::lock_guard<std::mutex> lock(metrics_mutex_);

        metrics_.tracked_quotas = snapshot.quotas.size();
        double highest = 0.0;
        for (const auto& q : snapshot.quotas) {
            if (!q.usage_percent.has_value()) continue;
            highest = std::max(highest, q.usage_percent.value());
            if (usage_cb_ && q.usage_percent.value() > usage_threshold_) {
                alerts.push_back("Quota " + q.key.to_string() + " at " +
                                 std::to_string(q.usage_percent.value()) +
                                 "% exceeds threshold");
            }
        }
        metrics_.highest_usage_percent = highest;
        cb = usage_cb_;
    }

    // Outside the lock: the callback may query metrics
    for (const auto& msg : alerts) {
        cb(msg);
    }
}

MetricsMonitor::Metrics MetricsMonitor::get_metrics() const {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    return metrics_;
}

void MetricsMonitor::reset_metrics() {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    metrics_ = Metrics{};
}

void MetricsMonitor::set_usage_alert_threshold(double percent, AlertCallback cb) {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    usage_threshold_ = percent;
    usage_cb_ = std::move(cb);
}

// ========== CompositeMonitor ==========

void CompositeMonitor::add_monitor(std::shared_ptr<Monitor> monitor) {
    monitors_.push_back(std::move(monitor));
}

void CompositeMonitor::on_event(const MonitorEvent& event) {
    for (auto& m : monitors_) {
        m->on_event(event);
    }
}

void CompositeMonitor::on_snapshot(const TrackerSnapshot& snapshot) {
    for (auto& m : monitors_) {
        m->on_snapshot(snapshot);
    }
}

} // namespace quotatrack
