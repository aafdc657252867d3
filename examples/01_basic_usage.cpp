// 01_basic_usage.cpp
//
// Minimal QuotaTrack example: one request-counter quota polled once a
// minute, with a provider reset in the middle of the run.
//
// Scenario:
//   - A subscription allows 1000 requests per period.
//   - The poller reports the running request count.
//   - The count climbs to 950, then the provider resets it and it drops
//     to 20. The tracker closes the first cycle and opens a second one.

#include <quotatrack/quotatrack.hpp>

#include <iostream>
#include <vector>

using namespace quotatrack;
using namespace std::chrono_literals;

int main() {
    std::cout << "=== QuotaTrack: Basic Usage Example ===\n\n";

    // ----------------------------------------------------------------
    // 1. Create the tracker over an in-memory store.
    // ----------------------------------------------------------------
    auto store = std::make_shared<InMemoryCycleStore>();
    QuotaTracker tracker(store);

    // Attach a console monitor so we can see what happens internally.
    tracker.set_monitor(
        std::make_shared<ConsoleMonitor>(ConsoleMonitor::Verbosity::Verbose));

    // ----------------------------------------------------------------
    // 2. Register the quota.
    // ----------------------------------------------------------------
    auto descriptor = providers::RequestCounter::descriptor(
        "synthetic", "subscription", 1000.0, "Subscription");
    tracker.register_quota(descriptor);
    const QuotaKey key = descriptor.key;

    // ----------------------------------------------------------------
    // 3. Feed one sample per minute.
    // ----------------------------------------------------------------
    const Timestamp start = Clock::now() - 1h;
    const std::vector<double> counts = {100, 250, 400, 700, 950, 20, 60, 110};

    for (std::size_t i = 0; i < counts.size(); ++i) {
        auto result = tracker.ingest(providers::RequestCounter::sample(
            key, start + std::chrono::minutes(i),
            providers::RequestCounterReading{counts[i], std::nullopt, std::nullopt}));
        std::cout << "  sample " << i << " (" << counts[i] << " requests) -> "
                  << to_string(result.outcome) << "\n";
    }

    // ----------------------------------------------------------------
    // 4. Inspect the cycles.
    // ----------------------------------------------------------------
    std::cout << "\nCycles:\n";
    for (const auto& c : store->all_cycles(key)) {
        std::cout << "  #" << c.id << (c.is_active() ? " (active)" : " (closed)")
                  << " peak=" << c.peak << " delta=" << c.total_delta << "\n";
    }

    auto summary = tracker.usage_summary(key);
    std::cout << "\nCurrent usage: " << summary.current << " / "
              << summary.limit.value_or(0.0);
    if (summary.usage_percent) {
        std::cout << " (" << *summary.usage_percent << "%, "
                  << to_string(severity_from_percent(*summary.usage_percent)) << ")";
    }
    std::cout << "\nCompleted cycles: " << summary.completed_cycles
              << ", average per cycle: " << summary.average_per_cycle << "\n";

    tracker.publish_snapshot();

    std::cout << "=== Done ===\n";
    return 0;
}
