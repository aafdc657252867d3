#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace quotatrack {

// Identifiers
using CycleId = std::uint64_t;

// Time types (wall clock: samples carry provider capture times)
using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;
using Duration = Clock::duration;

// Provider + quota dimension, e.g. "synthetic/subscription"
struct QuotaKey {
    std::string provider;
    std::string quota;

    std::string to_string() const { return provider + "/" + quota; }

    bool operator==(const QuotaKey& other) const {
        return provider == other.provider && quota == other.quota;
    }
    bool operator!=(const QuotaKey& other) const { return !(*this == other); }
};

// How a provider reports a quota counter
enum class CounterKind {
    IncreasingUsage,     // requests/tokens used so far
    RemainingBudget,     // balance left out of a known limit
    UtilizationPercent   // 0-100 utilization
};

// One polled observation, as delivered by the poller
struct QuotaSample {
    QuotaKey key;
    Timestamp timestamp{};
    std::unordered_map<std::string, double> fields;
    std::optional<double> limit;
    std::optional<Timestamp> resets_at;  // advisory, jitters across polls
};

struct NormalizedConsumption {
    double consumed{0.0};
    std::optional<double> limit;  // nullopt = unknown
};

// One detected accounting period for a quota key
struct Cycle {
    CycleId id{0};
    QuotaKey key;
    Timestamp start{};
    std::optional<Timestamp> end;  // nullopt = active
    double peak{0.0};
    double total_delta{0.0};
    double start_consumed{0.0};
    Timestamp last_sample_at{};
    double last_consumed{0.0};
    std::optional<double> limit;
    std::optional<Timestamp> resets_at;

    bool is_active() const noexcept { return !end.has_value(); }
};

// Fields written on every continuation
struct CycleUpdate {
    double peak{0.0};
    double total_delta{0.0};
    Timestamp last_sample_at{};
    double last_consumed{0.0};
    std::optional<double> limit;
    std::optional<Timestamp> resets_at;
};

// Result of feeding one sample through the detector
enum class IngestOutcome {
    Created,
    Continued,
    Reset,
    OutOfOrder,
    Discarded
};

enum class ResetReason {
    None,
    DropBelowRatio,
    ReportedResetPassed
};

struct IngestResult {
    IngestOutcome outcome{IngestOutcome::Discarded};
    std::optional<Cycle> active_cycle;
    std::optional<Cycle> closed_cycle;
    std::optional<NormalizedConsumption> normalized;
    ResetReason reset_reason{ResetReason::None};
};

// Severity vocabulary shared by all classifications
enum class Severity {
    Positive,
    Info,
    Warning,
    Negative
};

// Snapshot of one tracked quota for monitoring
struct QuotaSnapshot {
    QuotaKey key;
    CounterKind kind{CounterKind::IncreasingUsage};
    bool has_active_cycle{false};
    Timestamp cycle_start{};
    double current{0.0};
    double peak{0.0};
    std::optional<double> limit;
    std::optional<double> usage_percent;
    std::optional<Timestamp> resets_at;
};

// System-wide snapshot for monitoring
struct TrackerSnapshot {
    Timestamp timestamp{};
    std::vector<QuotaSnapshot> quotas;
};

inline double to_hours(Duration d) {
    return std::chrono::duration_cast<std::chrono::duration<double, std::ratio<3600>>>(d).count();
}

inline Duration from_hours(double hours) {
    return std::chrono::duration_cast<Duration>(
        std::chrono::duration<double, std::ratio<3600>>(hours));
}

inline const char* to_string(CounterKind k) {
    switch (k) {
        case CounterKind::IncreasingUsage:    return "IncreasingUsage";
        case CounterKind::RemainingBudget:    return "RemainingBudget";
        case CounterKind::UtilizationPercent: return "UtilizationPercent";
    }
    return "Unknown";
}

inline const char* to_string(IngestOutcome o) {
    switch (o) {
        case IngestOutcome::Created:    return "Created";
        case IngestOutcome::Continued:  return "Continued";
        case IngestOutcome::Reset:      return "Reset";
        case IngestOutcome::OutOfOrder: return "OutOfOrder";
        case IngestOutcome::Discarded:  return "Discarded";
    }
    return "Unknown";
}

inline const char* to_string(ResetReason r) {
    switch (r) {
        case ResetReason::None:                return "None";
        case ResetReason::DropBelowRatio:      return "DropBelowRatio";
        case ResetReason::ReportedResetPassed: return "ReportedResetPassed";
    }
    return "Unknown";
}

inline const char* to_string(Severity s) {
    switch (s) {
        case Severity::Positive: return "positive";
        case Severity::Info:     return "info";
        case Severity::Warning:  return "warning";
        case Severity::Negative: return "negative";
    }
    return "unknown";
}

} // namespace quotatrack

namespace std {

template <>
struct hash<quotatrack::QuotaKey> {
    std::size_t operator()(const quotatrack::QuotaKey& k) const noexcept {
        std::size_t h1 = std::hash<std::string>{}(k.provider);
        std::size_t h2 = std::hash<std::string>{}(k.quota);
        return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
    }
};

} // namespace std
