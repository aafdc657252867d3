#include <gtest/gtest.h>
#include <quotatrack/quotatrack.hpp>

using namespace quotatrack;

namespace {

BillingSummary summary_of(std::initializer_list<double> peaks) {
    std::vector<BillingPeriod> periods;
    for (double peak : peaks) {
        BillingPeriod p;
        p.max_peak = peak;
        p.cycle_count = 1;
        periods.push_back(p);
    }
    return BillingSummary(periods);
}

} // anonymous namespace

// ===========================================================================
// Usage severity
// ===========================================================================

TEST(InsightTest, UsageSeverityThresholds) {
    EXPECT_EQ(severity_from_percent(0.0), Severity::Positive);
    EXPECT_EQ(severity_from_percent(49.9), Severity::Positive);
    EXPECT_EQ(severity_from_percent(50.0), Severity::Info);
    EXPECT_EQ(severity_from_percent(79.9), Severity::Info);
    EXPECT_EQ(severity_from_percent(80.0), Severity::Warning);
    EXPECT_EQ(severity_from_percent(94.9), Severity::Warning);
    EXPECT_EQ(severity_from_percent(95.0), Severity::Negative);
    EXPECT_EQ(severity_from_percent(120.0), Severity::Negative);
}

TEST(InsightTest, UsageLevels) {
    EXPECT_EQ(classify_usage(10.0).level, UsageLevel::Healthy);
    EXPECT_EQ(classify_usage(60.0).level, UsageLevel::Warning);
    EXPECT_EQ(classify_usage(85.0).level, UsageLevel::Danger);
    EXPECT_EQ(classify_usage(99.0).level, UsageLevel::Critical);
    EXPECT_STREQ(to_string(UsageLevel::Danger), "danger");
}

// ===========================================================================
// Trend
// ===========================================================================

TEST(InsightTest, TrendThresholds) {
    EXPECT_EQ(classify_trend(120.0, 100.0)->direction, TrendDirection::Rising);
    EXPECT_EQ(classify_trend(120.0, 100.0)->severity, Severity::Warning);
    EXPECT_EQ(classify_trend(80.0, 100.0)->direction, TrendDirection::Falling);
    EXPECT_EQ(classify_trend(80.0, 100.0)->severity, Severity::Positive);
    EXPECT_EQ(classify_trend(110.0, 100.0)->direction, TrendDirection::Stable);
    EXPECT_EQ(classify_trend(90.0, 100.0)->direction, TrendDirection::Stable);
    EXPECT_NEAR(classify_trend(120.0, 100.0)->change_percent, 20.0, 1e-9);
}

TEST(InsightTest, TrendNeedsPositiveOlderAverage) {
    EXPECT_FALSE(classify_trend(10.0, 0.0).has_value());
}

TEST(InsightTest, TrendFromPeriodsNeedsFour) {
    EXPECT_FALSE(trend_from_periods(summary_of({10, 10, 30})).has_value());

    auto t = trend_from_periods(summary_of({10, 10, 30, 30}));
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(t->direction, TrendDirection::Rising);
    EXPECT_DOUBLE_EQ(t->recent_average, 30.0);
    EXPECT_DOUBLE_EQ(t->older_average, 10.0);
}

// ===========================================================================
// Variance
// ===========================================================================

TEST(InsightTest, VarianceThresholds) {
    EXPECT_EQ(classify_variance(160.0, 100.0)->level, VarianceLevel::High);
    EXPECT_EQ(classify_variance(130.0, 100.0)->level, VarianceLevel::Moderate);
    EXPECT_EQ(classify_variance(105.0, 100.0)->level, VarianceLevel::Consistent);
    EXPECT_EQ(classify_variance(150.0, 100.0)->level, VarianceLevel::Moderate);
    EXPECT_EQ(classify_variance(110.0, 100.0)->level, VarianceLevel::Consistent);
    EXPECT_FALSE(classify_variance(0.0, 0.0).has_value());
}

// ===========================================================================
// Cycle utilization
// ===========================================================================

TEST(InsightTest, CycleUtilizationBands) {
    EXPECT_EQ(classify_cycle_utilization(100.0, 1000.0)->fit, UtilizationFit::UnderUtilized);
    EXPECT_EQ(classify_cycle_utilization(300.0, 1000.0)->fit, UtilizationFit::Headroom);
    EXPECT_EQ(classify_cycle_utilization(600.0, 1000.0)->fit, UtilizationFit::GoodFit);
    EXPECT_EQ(classify_cycle_utilization(900.0, 1000.0)->fit, UtilizationFit::Approaching);
    EXPECT_EQ(classify_cycle_utilization(970.0, 1000.0)->fit, UtilizationFit::NearLimit);
    EXPECT_EQ(classify_cycle_utilization(970.0, 1000.0)->severity, Severity::Negative);
    EXPECT_FALSE(classify_cycle_utilization(100.0, std::nullopt).has_value());
}

// ===========================================================================
// Forecast
// ===========================================================================

TEST(InsightTest, ForecastWithoutRateIsAnalyzing) {
    auto f = classify_forecast(RateEstimate{}, Projection{});
    EXPECT_EQ(f.state, ForecastState::Analyzing);
}

TEST(InsightTest, ForecastIdleBelowThreshold) {
    RateEstimate r;
    r.per_hour = 0.005;
    EXPECT_EQ(classify_forecast(r, Projection{}).state, ForecastState::Idle);
}

TEST(InsightTest, ForecastExhaustsFirstIsNegative) {
    RateEstimate r;
    r.per_hour = 300.0;
    Projection p;
    p.current = 150.0;
    p.hours_to_exhaustion = 2.83;
    p.hours_until_reset = 5.0;
    p.exhausts_first = true;

    auto f = classify_forecast(r, p);
    EXPECT_EQ(f.state, ForecastState::ExhaustsFirst);
    EXPECT_EQ(f.severity, Severity::Negative);
    EXPECT_NE(f.summary.find("2h 50m"), std::string::npos);
}

TEST(InsightTest, ForecastHighProjectionAndComfortable) {
    RateEstimate r;
    r.per_hour = 10.0;
    Projection p;
    p.projected_percent = 85.0;
    EXPECT_EQ(classify_forecast(r, p).state, ForecastState::HighProjection);

    p.projected_percent = 40.0;
    EXPECT_EQ(classify_forecast(r, p).state, ForecastState::Comfortable);
}

// ===========================================================================
// Weekly pace
// ===========================================================================

TEST(InsightTest, WeeklyPaceWarnsWhenProjectionNearsLimit) {
    // Projected 3000 stays under 1000 * 4 periods * 0.8
    auto calm = classify_weekly_pace(700.0, 2000.0, 1000.0, 4);
    ASSERT_TRUE(calm.has_value());
    EXPECT_NEAR(calm->monthly_projection, 3000.0, 1e-9);
    EXPECT_EQ(calm->severity, Severity::Info);
    EXPECT_NEAR(*calm->share_percent, 35.0, 1e-9);

    auto hot = classify_weekly_pace(700.0, 2000.0, 1000.0, 3);
    EXPECT_EQ(hot->severity, Severity::Warning);
}

TEST(InsightTest, WeeklyPaceNeedsConsumption) {
    EXPECT_FALSE(classify_weekly_pace(0.0, 100.0, 1000.0, 1).has_value());
}

// ===========================================================================
// Formatting
// ===========================================================================

TEST(InsightTest, FormatHours) {
    EXPECT_EQ(format_hours(850.0 / 300.0), "2h 50m");
    EXPECT_EQ(format_hours(0.2), "12m");
    EXPECT_EQ(format_hours(76.0), "3d 4h");
    EXPECT_EQ(format_hours(-1.0), "0m");
}
