#pragma once

#include "quotatrack/types.hpp"
#include "quotatrack/billing_period.hpp"
#include "quotatrack/rate_engine.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace quotatrack {

// Thresholds below are fixed; presentation relies on them verbatim.

// ==================== Usage severity ====================

enum class UsageLevel { Healthy, Warning, Danger, Critical };

struct UsageClassification {
    double percent{0.0};
    UsageLevel level{UsageLevel::Healthy};
    Severity severity{Severity::Positive};
};

// <50 healthy, 50-79 warning, 80-94 danger, >=95 critical
UsageClassification classify_usage(double percent);
Severity severity_from_percent(double percent);

// ==================== Trend ====================

enum class TrendDirection { Rising, Falling, Stable };

struct TrendClassification {
    double recent_average{0.0};
    double older_average{0.0};
    double change_percent{0.0};
    TrendDirection direction{TrendDirection::Stable};
    Severity severity{Severity::Positive};
    std::string summary;
};

// nullopt when the older average is not positive
std::optional<TrendClassification> classify_trend(double recent_average, double older_average);

// Newer half vs older half of the billing periods; needs MIN_TREND_PERIODS
constexpr std::size_t MIN_TREND_PERIODS = 4;
std::optional<TrendClassification> trend_from_periods(const BillingSummary& summary);

// ==================== Variance ====================

enum class VarianceLevel { High, Moderate, Consistent };

struct VarianceClassification {
    double peak{0.0};
    double average{0.0};
    double spread_percent{0.0};  // (peak - avg) / avg * 100
    VarianceLevel level{VarianceLevel::Consistent};
    Severity severity{Severity::Positive};
    std::string summary;
};

// nullopt when peak or average is not positive
std::optional<VarianceClassification> classify_variance(double peak, double average);

// ==================== Average cycle utilization ====================

enum class UtilizationFit { UnderUtilized, Headroom, GoodFit, Approaching, NearLimit };

struct CycleUtilizationClassification {
    double percent{0.0};
    UtilizationFit fit{UtilizationFit::GoodFit};
    Severity severity{Severity::Positive};
    std::string summary;
};

std::optional<CycleUtilizationClassification>
classify_cycle_utilization(double average_per_period, std::optional<double> limit);

// ==================== Burn-rate forecast ====================

enum class ForecastState { Analyzing, Idle, ExhaustsFirst, HighProjection, Comfortable };

struct ForecastClassification {
    ForecastState state{ForecastState::Analyzing};
    Severity severity{Severity::Info};
    std::string summary;
};

ForecastClassification classify_forecast(const RateEstimate& rate, const Projection& projection);

// ==================== Weekly pace ====================

struct WeeklyPaceClassification {
    double week_total{0.0};
    double month_total{0.0};
    double monthly_projection{0.0};        // week * 30/7
    std::optional<double> share_percent;   // week / month * 100
    Severity severity{Severity::Info};
    std::string summary;
};

// nullopt when nothing was consumed in the week
std::optional<WeeklyPaceClassification>
classify_weekly_pace(double week_total, double month_total,
                     std::optional<double> limit, std::size_t periods_per_month);

// ==================== Labels ====================

const char* to_string(UsageLevel l);
const char* to_string(TrendDirection d);
const char* to_string(VarianceLevel l);
const char* to_string(UtilizationFit f);
const char* to_string(ForecastState s);

// "2h 50m", "3d 4h", "12m"
std::string format_hours(double hours);

} // namespace quotatrack
