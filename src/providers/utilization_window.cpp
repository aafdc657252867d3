#include "quotatrack/providers/utilization_window.hpp"

namespace quotatrack::providers {

QuotaDescriptor UtilizationWindow::descriptor(const std::string& provider,
                                              const std::string& quota,
                                              const std::string& display_name) {
    QuotaDescriptor d;
    d.key = QuotaKey{provider, quota};
    d.kind = CounterKind::UtilizationPercent;
    d.value_field = VALUE_FIELD;
    d.display_name = display_name;
    return d;
}

QuotaSample UtilizationWindow::sample(const QuotaKey& key, Timestamp at,
                                      const UtilizationReading& reading) {
    QuotaSample s;
    s.key = key;
    s.timestamp = at;
    if (reading.utilization) {
        s.fields[VALUE_FIELD] = *reading.utilization;
    }
    s.resets_at = reading.resets_at;
    return s;
}

} // namespace quotatrack::providers
