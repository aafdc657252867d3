#include "quotatrack/insight.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace quotatrack {

namespace {

std::string fixed(double v, int precision = 0) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(precision) << v;
    return os.str();
}

std::string signed_percent(double v) {
    return (v > 0.0 ? "+" : "") + fixed(v) + "%";
}

} // anonymous namespace

// ==================== Usage severity ====================

UsageClassification classify_usage(double percent) {
    UsageClassification c;
    c.percent = percent;
    if (percent >= 95.0) {
        c.level = UsageLevel::Critical;
        c.severity = Severity::Negative;
    } else if (percent >= 80.0) {
        c.level = UsageLevel::Danger;
        c.severity = Severity::Warning;
    } else if (percent >= 50.0) {
        c.level = UsageLevel::Warning;
        c.severity = Severity::Info;
    } else {
        c.level = UsageLevel::Healthy;
        c.severity = Severity::Positive;
    }
    return c;
}

Severity severity_from_percent(double percent) {
    return classify_usage(percent).severity;
}

// ==================== Trend ====================

std::optional<TrendClassification> classify_trend(double recent_average, double older_average) {
    if (!(older_average > 0.0) || !std::isfinite(recent_average)) {
        return std::nullopt;
    }

    TrendClassification t;
    t.recent_average = recent_average;
    t.older_average = older_average;
    t.change_percent = ((recent_average - older_average) / older_average) * 100.0;

    const std::string avgs = "Recent periods avg " + fixed(recent_average) +
                             " vs earlier " + fixed(older_average);
    if (t.change_percent > 15.0) {
        t.direction = TrendDirection::Rising;
        t.severity = Severity::Warning;
        t.summary = avgs + ": usage is increasing (" + signed_percent(t.change_percent) + ").";
    } else if (t.change_percent < -15.0) {
        t.direction = TrendDirection::Falling;
        t.severity = Severity::Positive;
        t.summary = avgs + ": usage is decreasing (" + signed_percent(t.change_percent) + ").";
    } else {
        t.direction = TrendDirection::Stable;
        t.severity = Severity::Positive;
        t.summary = avgs + ": steady usage pattern.";
    }
    return t;
}

std::optional<TrendClassification> trend_from_periods(const BillingSummary& summary) {
    if (summary.count() < MIN_TREND_PERIODS) {
        return std::nullopt;
    }
    auto halves = summary.recent_and_older_average();
    if (!halves) {
        return std::nullopt;
    }
    return classify_trend(halves->first, halves->second);
}

// ==================== Variance ====================

std::optional<VarianceClassification> classify_variance(double peak, double average) {
    if (!(peak > 0.0) || !(average > 0.0)) {
        return std::nullopt;
    }

    VarianceClassification v;
    v.peak = peak;
    v.average = average;
    v.spread_percent = ((peak - average) / average) * 100.0;

    if (v.spread_percent > 50.0) {
        v.level = VarianceLevel::High;
        v.severity = Severity::Warning;
        v.summary = "Peak period hit " + fixed(peak) + ", " + fixed(v.spread_percent) +
                    "% above the average of " + fixed(average) + ". Usage varies significantly.";
    } else if (v.spread_percent > 10.0) {
        v.level = VarianceLevel::Moderate;
        v.severity = Severity::Info;
        v.summary = "Peak " + fixed(peak) + ", average " + fixed(average) +
                    ". Moderately consistent.";
    } else {
        v.level = VarianceLevel::Consistent;
        v.severity = Severity::Positive;
        v.summary = "Peak (" + fixed(peak) + ") is close to average (" + fixed(average) +
                    "). Predictable consumption.";
    }
    return v;
}

// ==================== Average cycle utilization ====================

std::optional<CycleUtilizationClassification>
classify_cycle_utilization(double average_per_period, std::optional<double> limit) {
    if (!(average_per_period > 0.0) || !limit || !(*limit > 0.0)) {
        return std::nullopt;
    }

    CycleUtilizationClassification c;
    c.percent = (average_per_period / *limit) * 100.0;

    const std::string lead = "You average ~" + fixed(c.percent) + "% of your " +
                             fixed(*limit) + " quota per period. ";
    if (c.percent < 25.0) {
        c.fit = UtilizationFit::UnderUtilized;
        c.severity = Severity::Warning;
        c.summary = lead + "Significantly under-utilizing; a lower tier could save costs.";
    } else if (c.percent < 50.0) {
        c.fit = UtilizationFit::Headroom;
        c.severity = Severity::Info;
        c.summary = lead + "Comfortable headroom.";
    } else if (c.percent < 80.0) {
        c.fit = UtilizationFit::GoodFit;
        c.severity = Severity::Positive;
        c.summary = lead + "Plan fits your usage well.";
    } else if (c.percent < 95.0) {
        c.fit = UtilizationFit::Approaching;
        c.severity = Severity::Warning;
        c.summary = lead + "Approaching your limit frequently.";
    } else {
        c.fit = UtilizationFit::NearLimit;
        c.severity = Severity::Negative;
        c.summary = lead + "Consistently near limit; consider upgrading.";
    }
    return c;
}

// ==================== Burn-rate forecast ====================

ForecastClassification classify_forecast(const RateEstimate& rate, const Projection& projection) {
    ForecastClassification f;

    if (!rate.has_rate()) {
        f.state = ForecastState::Analyzing;
        f.severity = Severity::Info;
        f.summary = "Collecting usage patterns to calculate burn rate. Currently at " +
                    fixed(projection.current) + ".";
        return f;
    }

    const double r = *rate.per_hour;
    if (rate.is_idle()) {
        f.state = ForecastState::Idle;
        f.severity = Severity::Info;
        f.summary = "No consumption detected recently. Currently at " +
                    fixed(projection.current) + ".";
        return f;
    }

    if (projection.exhausts_first && projection.hours_to_exhaustion) {
        f.state = ForecastState::ExhaustsFirst;
        f.severity = Severity::Negative;
        f.summary = "At " + fixed(r, 1) + "/hr the quota exhausts in " +
                    format_hours(*projection.hours_to_exhaustion) + ", before it resets in " +
                    format_hours(projection.hours_until_reset.value_or(0.0)) + ".";
        return f;
    }

    if (projection.projected_percent && *projection.projected_percent > 80.0) {
        f.state = ForecastState::HighProjection;
        f.severity = Severity::Warning;
        f.summary = "Consuming " + fixed(r, 1) + "/hr. Projected ~" +
                    fixed(*projection.projected_percent) + "% at reset.";
        return f;
    }

    f.state = ForecastState::Comfortable;
    f.severity = Severity::Positive;
    f.summary = "Consuming " + fixed(r, 1) + "/hr with comfortable headroom.";
    return f;
}

// ==================== Weekly pace ====================

std::optional<WeeklyPaceClassification>
classify_weekly_pace(double week_total, double month_total,
                     std::optional<double> limit, std::size_t periods_per_month) {
    if (!(week_total > 0.0)) {
        return std::nullopt;
    }

    WeeklyPaceClassification w;
    w.week_total = week_total;
    w.month_total = month_total;
    w.monthly_projection = week_total * (30.0 / 7.0);
    if (month_total > 0.0) {
        w.share_percent = (week_total / month_total) * 100.0;
    }

    w.severity = Severity::Info;
    if (limit && *limit > 0.0 && periods_per_month > 0 &&
        w.monthly_projection > *limit * static_cast<double>(periods_per_month) * 0.8) {
        w.severity = Severity::Warning;
    }

    w.summary = fixed(week_total) + " consumed this week";
    if (w.share_percent) {
        w.summary += " (" + fixed(*w.share_percent) + "% of 30-day total). Monthly projection: ~" +
                     fixed(w.monthly_projection) + ".";
    }
    return w;
}

// ==================== Labels ====================

const char* to_string(UsageLevel l) {
    switch (l) {
        case UsageLevel::Healthy:  return "healthy";
        case UsageLevel::Warning:  return "warning";
        case UsageLevel::Danger:   return "danger";
        case UsageLevel::Critical: return "critical";
    }
    return "unknown";
}

const char* to_string(TrendDirection d) {
    switch (d) {
        case TrendDirection::Rising:  return "rising";
        case TrendDirection::Falling: return "falling";
        case TrendDirection::Stable:  return "stable";
    }
    return "unknown";
}

const char* to_string(VarianceLevel l) {
    switch (l) {
        case VarianceLevel::High:       return "high variance";
        case VarianceLevel::Moderate:   return "moderate spread";
        case VarianceLevel::Consistent: return "consistent";
    }
    return "unknown";
}

const char* to_string(UtilizationFit f) {
    switch (f) {
        case UtilizationFit::UnderUtilized: return "under-utilized";
        case UtilizationFit::Headroom:      return "headroom";
        case UtilizationFit::GoodFit:       return "good fit";
        case UtilizationFit::Approaching:   return "approaching limit";
        case UtilizationFit::NearLimit:     return "near limit";
    }
    return "unknown";
}

const char* to_string(ForecastState s) {
    switch (s) {
        case ForecastState::Analyzing:      return "analyzing";
        case ForecastState::Idle:           return "idle";
        case ForecastState::ExhaustsFirst:  return "exhausts before reset";
        case ForecastState::HighProjection: return "high projection";
        case ForecastState::Comfortable:    return "comfortable";
    }
    return "unknown";
}

std::string format_hours(double hours) {
    if (!std::isfinite(hours) || hours <= 0.0) {
        return "0m";
    }
    hours = std::min(hours, 1.0e9);
    auto total_minutes = static_cast<long long>(std::llround(hours * 60.0));
    long long days = total_minutes / (24 * 60);
    long long hrs = (total_minutes / 60) % 24;
    long long mins = total_minutes % 60;

    if (days > 0) {
        return std::to_string(days) + "d " + std::to_string(hrs) + "h";
    }
    if (hrs > 0) {
        return std::to_string(hrs) + "h " + std::to_string(mins) + "m";
    }
    return std::to_string(mins) + "m";
}

} // namespace quotatrack
