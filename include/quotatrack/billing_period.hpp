#pragma once

#include "quotatrack/types.hpp"

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

namespace quotatrack {

// A true provider accounting period: one or more adjacent cycles that the
// detector split apart around a jittering reset boundary.
struct BillingPeriod {
    Timestamp start{};
    std::optional<Timestamp> end;  // nullopt while the last cycle is active
    double max_peak{0.0};
    std::size_t cycle_count{0};
};

// Same 50% drop rule as the detector, applied to cycle peaks
constexpr double PERIOD_DROP_RATIO = 0.5;

// Groups cycles (newest first, as the store returns them) into billing
// periods, returned oldest first. A running period is only split when its
// max peak exceeds `min_signal`.
std::vector<BillingPeriod> group_billing_periods(const std::vector<Cycle>& cycles_newest_first,
                                                 double min_signal = 0.0);

// Rollups over grouped billing periods
class BillingSummary {
public:
    BillingSummary() = default;
    explicit BillingSummary(std::vector<BillingPeriod> periods);

    static BillingSummary from_cycles(const std::vector<Cycle>& cycles_newest_first,
                                      double min_signal = 0.0);

    std::size_t count() const noexcept;
    double sum() const noexcept;
    double average() const noexcept;
    double max() const noexcept;

    // Sum of max_peak over periods starting at or after `since`
    double sum_since(Timestamp since) const noexcept;

    // Averages of the newer and the older half of the periods.
    // Needs at least two periods.
    std::optional<std::pair<double, double>> recent_and_older_average() const;

    const std::vector<BillingPeriod>& periods() const noexcept;

private:
    std::vector<BillingPeriod> periods_;
};

} // namespace quotatrack
