#pragma once

#include "quotatrack/types.hpp"
#include "quotatrack/quota_descriptor.hpp"

#include <optional>
#include <string>

namespace quotatrack::providers {

// Balance left out of a known total
struct RemainingBudgetReading {
    double total{0.0};
    double remain{0.0};
    std::optional<Duration> reset_in;  // relative to the capture time
};

// Remaining-budget counters such as per-model interval allowances
class RemainingBudget {
public:
    static constexpr const char* VALUE_FIELD = "remain";
    static constexpr const char* LIMIT_FIELD = "total";

    static QuotaDescriptor descriptor(const std::string& provider,
                                      const std::string& quota,
                                      const std::string& display_name = "");

    static QuotaSample sample(const QuotaKey& key, Timestamp at,
                              const RemainingBudgetReading& reading);
};

} // namespace quotatrack::providers
