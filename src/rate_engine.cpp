#include "quotatrack/rate_engine.hpp"

#include <algorithm>
#include <cmath>

namespace quotatrack {

namespace {

constexpr double MAX_PROJECTION_HOURS = 24.0 * 365.0 * 100.0;

} // anonymous namespace

RateEngine::RateEngine(RateConfig config)
    : config_(std::move(config)) {}

const RateConfig& RateEngine::config() const noexcept {
    return config_;
}

RateEstimate RateEngine::window_rate(const std::vector<WindowPoint>& points) const {
    RateEstimate result;
    if (points.size() < 2) {
        return result;
    }

    const WindowPoint& first = points.front();
    const WindowPoint& last = points.back();
    Duration elapsed = last.timestamp - first.timestamp;

    // Short spans amplify noise into absurd hourly rates
    if (elapsed < config_.min_window_span || elapsed <= Duration::zero()) {
        return result;
    }

    double delta = last.consumed - first.consumed;
    double hours = to_hours(elapsed);

    result.source = RateSource::Window;
    result.basis = elapsed;
    // Flat or falling consumption is idle, not negative
    result.per_hour = (delta > 0.0 && std::isfinite(delta)) ? delta / hours : 0.0;
    return result;
}

RateEstimate RateEngine::cycle_average_rate(const std::vector<Cycle>& cycles, Timestamp now) const {
    RateEstimate result;
    if (cycles.empty()) {
        return result;
    }

    double total_tracked = 0.0;
    Timestamp tracking_since = cycles.front().start;
    for (const auto& c : cycles) {
        total_tracked += c.total_delta;
        tracking_since = std::min(tracking_since, c.start);
    }

    Duration elapsed = now - tracking_since;
    if (elapsed < config_.min_fallback_span || elapsed <= Duration::zero()) {
        return result;
    }
    if (!(total_tracked > 0.0) || !std::isfinite(total_tracked)) {
        return result;
    }

    result.source = RateSource::CycleAverage;
    result.basis = elapsed;
    result.per_hour = total_tracked / to_hours(elapsed);
    return result;
}

RateEstimate RateEngine::estimate(const std::vector<WindowPoint>& points,
                                  const std::vector<Cycle>& cycles,
                                  Timestamp now) const {
    RateEstimate windowed = window_rate(points);
    if (windowed.has_rate()) {
        return windowed;
    }
    return cycle_average_rate(cycles, now);
}

Projection RateEngine::project(double current,
                               std::optional<double> limit,
                               const RateEstimate& rate,
                               std::optional<Timestamp> resets_at,
                               Timestamp now) {
    Projection p;
    p.current = current;
    if (limit && std::isfinite(*limit) && *limit > 0.0) {
        p.limit = limit;
    }
    p.rate_per_hour = rate.per_hour;

    if (resets_at && *resets_at > now) {
        p.hours_until_reset = to_hours(*resets_at - now);
    }

    if (!rate.per_hour) {
        return p;
    }
    const double r = std::max(0.0, *rate.per_hour);

    if (p.hours_until_reset) {
        double projected = current + r * *p.hours_until_reset;
        if (p.limit) {
            projected = std::clamp(projected, 0.0, *p.limit);
            p.projected_percent = (projected / *p.limit) * 100.0;
        } else {
            projected = std::max(0.0, projected);
        }
        p.projected = projected;
    }

    if (r > 0.0 && p.limit && *p.limit > current) {
        double hours = (*p.limit - current) / r;
        if (std::isfinite(hours)) {
            p.hours_to_exhaustion = hours;
            // Keep the time_point arithmetic far from overflow
            if (hours < MAX_PROJECTION_HOURS) {
                p.exhaustion_time = now + from_hours(hours);
            }
        }
    }

    if (p.hours_to_exhaustion && p.hours_until_reset) {
        p.exhausts_first = *p.hours_to_exhaustion < *p.hours_until_reset;
    }
    return p;
}

} // namespace quotatrack
