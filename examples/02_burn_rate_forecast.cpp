// 02_burn_rate_forecast.cpp
//
// Burn-rate forecasting for a utilization window that resets at a
// provider-reported time, plus a usage alert wired through metrics.
//
// Scenario:
//   - A five-hour window is polled every two minutes.
//   - Utilization grows by about 1.5 points per poll.
//   - The tracker estimates the hourly rate from the last 30 minutes,
//     projects utilization at the reported reset and warns when the
//     window would run out first.

#include <quotatrack/quotatrack.hpp>

#include <iomanip>
#include <iostream>

using namespace quotatrack;
using namespace std::chrono_literals;

int main() {
    std::cout << "=== QuotaTrack: Burn-Rate Forecast Example ===\n\n";

    QuotaTracker tracker(std::make_shared<InMemoryCycleStore>());

    auto metrics = std::make_shared<MetricsMonitor>();
    metrics->set_usage_alert_threshold(50.0, [](const std::string& msg) {
        std::cout << "  [ALERT] " << msg << "\n";
    });

    auto composite = std::make_shared<CompositeMonitor>();
    composite->add_monitor(std::make_shared<ConsoleMonitor>(ConsoleMonitor::Verbosity::Normal));
    composite->add_monitor(metrics);
    tracker.set_monitor(composite);

    auto descriptor = providers::UtilizationWindow::descriptor("anthropic", "five_hour", "5-Hour Limit");
    tracker.register_quota(descriptor);
    const QuotaKey key = descriptor.key;

    const Timestamp now = Clock::now();
    const Timestamp window_start = now - 40min;
    const Timestamp resets_at = window_start + 5h;

    for (int i = 0; i <= 20; ++i) {
        tracker.ingest(providers::UtilizationWindow::sample(
            key, window_start + std::chrono::minutes(2 * i),
            providers::UtilizationReading{12.0 + 1.5 * i, resets_at}));
    }

    auto in = tracker.insights(key, window_start + 40min);

    std::cout << std::fixed << std::setprecision(1);
    std::cout << "Rate: ";
    if (in.rate.per_hour) {
        std::cout << *in.rate.per_hour << "/hr (" << to_string(in.rate.source) << ")\n";
    } else {
        std::cout << "collecting data\n";
    }
    if (in.projection.hours_until_reset) {
        std::cout << "Resets in: " << format_hours(*in.projection.hours_until_reset) << "\n";
    }
    if (in.projection.projected_percent) {
        std::cout << "Projected at reset: " << *in.projection.projected_percent << "%\n";
    }
    std::cout << "Forecast: " << to_string(in.forecast.state)
              << " [" << to_string(in.forecast.severity) << "]\n  "
              << in.forecast.summary << "\n\n";

    tracker.publish_snapshot();

    auto m = metrics->get_metrics();
    std::cout << "Samples ingested: " << m.samples_ingested
              << ", highest usage: " << m.highest_usage_percent << "%\n";

    std::cout << "=== Done ===\n";
    return 0;
}
