#pragma once

#include "quotatrack/types.hpp"
#include "quotatrack/config.hpp"
#include "quotatrack/tracker_window.hpp"

#include <optional>
#include <vector>

namespace quotatrack {

enum class RateSource {
    None,          // not enough data yet
    Window,        // short-window estimate
    CycleAverage   // long-run average over tracked cycles
};

inline const char* to_string(RateSource s) {
    switch (s) {
        case RateSource::None:         return "None";
        case RateSource::Window:       return "Window";
        case RateSource::CycleAverage: return "CycleAverage";
    }
    return "Unknown";
}

// Below this many units per hour a quota is reported as idle
constexpr double IDLE_RATE_THRESHOLD = 0.01;

struct RateEstimate {
    std::optional<double> per_hour;  // nullopt = collecting data
    RateSource source{RateSource::None};
    Duration basis{Duration::zero()};  // time span the estimate covers

    bool has_rate() const noexcept { return per_hour.has_value(); }
    bool is_idle() const noexcept { return per_hour && *per_hour < IDLE_RATE_THRESHOLD; }
};

struct Projection {
    double current{0.0};
    std::optional<double> limit;
    std::optional<double> rate_per_hour;

    std::optional<double> hours_until_reset;
    std::optional<double> projected;          // consumption at reset
    std::optional<double> projected_percent;

    std::optional<double> hours_to_exhaustion;
    std::optional<Timestamp> exhaustion_time;

    // Exhaustion lands before the provider reset
    bool exhausts_first{false};
};

class RateEngine {
public:
    explicit RateEngine(RateConfig config = RateConfig{});

    // Oldest-to-newest slope of the window; requires min_window_span.
    RateEstimate window_rate(const std::vector<WindowPoint>& points) const;

    // total tracked / hours since the oldest cycle began.
    // `cycles` may be in any order and may include the active cycle.
    RateEstimate cycle_average_rate(const std::vector<Cycle>& cycles, Timestamp now) const;

    // Window estimate, falling back to the cycle average
    RateEstimate estimate(const std::vector<WindowPoint>& points,
                          const std::vector<Cycle>& cycles,
                          Timestamp now) const;

    static Projection project(double current,
                              std::optional<double> limit,
                              const RateEstimate& rate,
                              std::optional<Timestamp> resets_at,
                              Timestamp now);

    const RateConfig& config() const noexcept;

private:
    RateConfig config_;
};

} // namespace quotatrack
