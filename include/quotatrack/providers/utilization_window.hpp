#pragma once

#include "quotatrack/types.hpp"
#include "quotatrack/quota_descriptor.hpp"

#include <optional>
#include <string>

namespace quotatrack::providers {

// Percent of a rolling window already used. Providers report a null
// utilization for windows that are not enabled on the account.
struct UtilizationReading {
    std::optional<double> utilization;
    std::optional<Timestamp> resets_at;
};

// Utilization-percent counters such as five-hour and seven-day windows
class UtilizationWindow {
public:
    static constexpr const char* VALUE_FIELD = "utilization";

    static QuotaDescriptor descriptor(const std::string& provider,
                                      const std::string& quota,
                                      const std::string& display_name = "");

    // Omits the value field when utilization is null; ingestion then
    // discards the sample.
    static QuotaSample sample(const QuotaKey& key, Timestamp at,
                              const UtilizationReading& reading);
};

} // namespace quotatrack::providers
