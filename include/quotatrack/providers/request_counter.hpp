#pragma once

#include "quotatrack/types.hpp"
#include "quotatrack/quota_descriptor.hpp"

#include <optional>
#include <string>

namespace quotatrack::providers {

// Requests used so far out of a per-period allowance
struct RequestCounterReading {
    double requests{0.0};
    std::optional<double> limit;
    std::optional<Timestamp> renews_at;
};

// Increasing-usage counters such as subscription request quotas
class RequestCounter {
public:
    static constexpr const char* VALUE_FIELD = "requests";
    static constexpr const char* LIMIT_FIELD = "limit";

    static QuotaDescriptor descriptor(const std::string& provider,
                                      const std::string& quota,
                                      std::optional<double> fixed_limit = std::nullopt,
                                      const std::string& display_name = "");

    static QuotaSample sample(const QuotaKey& key, Timestamp at,
                              const RequestCounterReading& reading);
};

} // namespace quotatrack::providers
