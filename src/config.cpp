#include "quotatrack/config.hpp"
#include "quotatrack/exceptions.hpp"

#include <cmath>

namespace quotatrack {

void validate(const TrackerConfig& config) {
    const auto& d = config.detector;
    if (!std::isfinite(d.drop_ratio) || d.drop_ratio <= 0.0 || d.drop_ratio > 1.0) {
        throw InvalidConfigException("drop_ratio must be in (0, 1], got " +
                                     std::to_string(d.drop_ratio));
    }
    if (!std::isfinite(d.min_signal) || d.min_signal < 0.0) {
        throw InvalidConfigException("min_signal must be a non-negative number");
    }
    if (d.reset_grace < Duration::zero()) {
        throw InvalidConfigException("reset_grace must not be negative");
    }

    const auto& r = config.rate;
    if (r.window_span <= Duration::zero()) {
        throw InvalidConfigException("rate window_span must be positive");
    }
    if (r.min_window_span < Duration::zero() || r.min_fallback_span < Duration::zero()) {
        throw InvalidConfigException("rate minimum spans must not be negative");
    }
    if (r.min_window_span > r.window_span) {
        throw InvalidConfigException("min_window_span exceeds window_span");
    }

    const auto& a = config.analytics;
    if (a.lookback <= Duration::zero() || a.weekly_span <= Duration::zero()) {
        throw InvalidConfigException("analytics spans must be positive");
    }
    if (!std::isfinite(a.period_min_signal) || a.period_min_signal < 0.0) {
        throw InvalidConfigException("period_min_signal must be a non-negative number");
    }
}

} // namespace quotatrack
