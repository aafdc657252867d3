#include "quotatrack/providers/remaining_budget.hpp"

namespace quotatrack::providers {

QuotaDescriptor RemainingBudget::descriptor(const std::string& provider,
                                            const std::string& quota,
                                            const std::string& display_name) {
    QuotaDescriptor d;
    d.key = QuotaKey{provider, quota};
    d.kind = CounterKind::RemainingBudget;
    d.value_field = VALUE_FIELD;
    d.limit_field = LIMIT_FIELD;
    d.display_name = display_name;
    return d;
}

QuotaSample RemainingBudget::sample(const QuotaKey& key, Timestamp at,
                                    const RemainingBudgetReading& reading) {
    QuotaSample s;
    s.key = key;
    s.timestamp = at;
    s.fields[VALUE_FIELD] = reading.remain;
    s.fields[LIMIT_FIELD] = reading.total;
    if (reading.reset_in && *reading.reset_in > Duration::zero()) {
        s.resets_at = at + *reading.reset_in;
    }
    return s;
}

} // namespace quotatrack::providers
