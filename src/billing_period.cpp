#include "quotatrack/billing_period.hpp"

#include <algorithm>
#include <utility>

namespace quotatrack {

std::vector<BillingPeriod> group_billing_periods(const std::vector<Cycle>& cycles_newest_first,
                                                 double min_signal) {
    std::vector<BillingPeriod> periods;
    if (cycles_newest_first.empty()) {
        return periods;
    }

    // Walk oldest first
    auto it = cycles_newest_first.rbegin();
    BillingPeriod current;
    current.start = it->start;
    current.end = it->end;
    current.max_peak = it->peak;
    current.cycle_count = 1;

    for (++it; it != cycles_newest_first.rend(); ++it) {
        const Cycle& c = *it;
        if (current.max_peak > min_signal &&
            c.peak < current.max_peak * PERIOD_DROP_RATIO) {
            periods.push_back(current);
            current = BillingPeriod{};
            current.start = c.start;
            current.max_peak = c.peak;
        } else if (c.peak > current.max_peak) {
            current.max_peak = c.peak;
        }
        current.end = c.end;
        current.cycle_count++;
    }
    periods.push_back(current);
    return periods;
}

// ========== BillingSummary ==========

BillingSummary::BillingSummary(std::vector<BillingPeriod> periods)
    : periods_(std::move(periods)) {}

BillingSummary BillingSummary::from_cycles(const std::vector<Cycle>& cycles_newest_first,
                                           double min_signal) {
    return BillingSummary(group_billing_periods(cycles_newest_first, min_signal));
}

std::size_t BillingSummary::count() const noexcept {
    return periods_.size();
}

double BillingSummary::sum() const noexcept {
    double total = 0.0;
    for (const auto& p : periods_) total += p.max_peak;
    return total;
}

double BillingSummary::average() const noexcept {
    if (periods_.empty()) return 0.0;
    return sum() / static_cast<double>(periods_.size());
}

double BillingSummary::max() const noexcept {
    double peak = 0.0;
    for (const auto& p : periods_) peak = std::max(peak, p.max_peak);
    return peak;
}

double BillingSummary::sum_since(Timestamp since) const noexcept {
    double total = 0.0;
    for (const auto& p : periods_) {
        if (p.start >= since) total += p.max_peak;
    }
    return total;
}

std::optional<std::pair<double, double>> BillingSummary::recent_and_older_average() const {
    const std::size_t n = periods_.size();
    if (n < 2) return std::nullopt;

    // periods_ is oldest first: the newer half is the tail
    const std::size_t recent_count = n / 2;
    const std::size_t older_count = n - recent_count;

    double older_sum = 0.0;
    for (std::size_t i = 0; i < older_count; ++i) older_sum += periods_[i].max_peak;
    double recent_sum = 0.0;
    for (std::size_t i = older_count; i < n; ++i) recent_sum += periods_[i].max_peak;

    return std::make_pair(recent_sum / static_cast<double>(recent_count),
                          older_sum / static_cast<double>(older_count));
}

const std::vector<BillingPeriod>& BillingSummary::periods() const noexcept {
    return periods_;
}

} // namespace quotatrack
