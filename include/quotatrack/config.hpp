#pragma once

#include "quotatrack/types.hpp"
#include <cstddef>

namespace quotatrack {

// Sample-level reset detection
struct DetectorConfig {
    // A reset is inferred when consumption falls below peak * drop_ratio
    double drop_ratio = 0.5;

    // Peaks at or below this floor never trigger a reset (near-zero noise)
    double min_signal = 1.0;

    // Also close a cycle once its provider-reported reset time has passed.
    // Off by default: reported reset times are advisory.
    bool honor_reported_reset = false;
    Duration reset_grace = std::chrono::minutes(2);
};

// Rate estimation
struct RateConfig {
    // Span of samples retained in each quota's tracker window
    Duration window_span = std::chrono::minutes(30);

    // Minimum elapsed time between oldest and newest window sample
    Duration min_window_span = std::chrono::minutes(5);

    // Minimum tracked history before the cycle-averaged fallback applies
    Duration min_fallback_span = std::chrono::minutes(30);
};

// Historical analytics
struct AnalyticsConfig {
    // Cycles older than this are ignored by billing-period rollups
    Duration lookback = std::chrono::hours(24 * 30);

    // Span of the "recent" windowed rollup
    Duration weekly_span = std::chrono::hours(24 * 7);

    // Completed cycles considered for usage summaries (0 = unbounded)
    std::size_t history_limit = 200;

    // Running periods at or below this peak are never split
    double period_min_signal = 0.0;
};

struct TrackerConfig {
    DetectorConfig detector;
    RateConfig rate;
    AnalyticsConfig analytics;
};

// Throws InvalidConfigException when a value is out of range
void validate(const TrackerConfig& config);

} // namespace quotatrack
