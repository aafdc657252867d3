#include "quotatrack/providers/request_counter.hpp"

namespace quotatrack::providers {

QuotaDescriptor RequestCounter::descriptor(const std::string& provider,
                                           const std::string& quota,
                                           std::optional<double> fixed_limit,
                                           const std::string& display_name) {
    QuotaDescriptor d;
    d.key = QuotaKey{provider, quota};
    d.kind = CounterKind::IncreasingUsage;
    d.value_field = VALUE_FIELD;
    d.limit_field = LIMIT_FIELD;
    d.fixed_limit = fixed_limit;
    d.display_name = display_name;
    return d;
}

QuotaSample RequestCounter::sample(const QuotaKey& key, Timestamp at,
                                   const RequestCounterReading& reading) {
    QuotaSample s;
    s.key = key;
    s.timestamp = at;
    s.fields[VALUE_FIELD] = reading.requests;
    if (reading.limit) {
        s.fields[LIMIT_FIELD] = *reading.limit;
    }
    s.resets_at = reading.renews_at;
    return s;
}

} // namespace quotatrack::providers
