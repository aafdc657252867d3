#pragma once

#include "quotatrack/types.hpp"
#include <optional>
#include <string>

namespace quotatrack {

// Registration record for one tracked quota
struct QuotaDescriptor {
    QuotaKey key;
    CounterKind kind{CounterKind::IncreasingUsage};

    // Raw field holding the counter value
    std::string value_field;

    // Raw field holding the limit, if the provider reports one per poll
    std::string limit_field;

    // Declared limit used when neither the sample nor its fields carry one
    std::optional<double> fixed_limit;

    std::string display_name;

    // Per-quota detector tuning; unset means the tracker-wide setting
    std::optional<double> drop_ratio;
    std::optional<double> min_signal;

    const std::string& name() const noexcept {
        return display_name.empty() ? key.quota : display_name;
    }
};

} // namespace quotatrack
