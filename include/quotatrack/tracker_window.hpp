#pragma once

#include "quotatrack/types.hpp"

#include <cstddef>
#include <deque>
#include <optional>
#include <vector>

namespace quotatrack {

struct WindowPoint {
    Timestamp timestamp{};
    double consumed{0.0};
};

// Recent (timestamp, consumed) pairs for one quota key, bounded by a
// time span measured back from the newest point. Used only for rates.
class TrackerWindow {
public:
    explicit TrackerWindow(Duration span = std::chrono::minutes(30));

    // Points must arrive in timestamp order; older or equal ones are ignored.
    void add(Timestamp timestamp, double consumed);
    void clear();

    std::optional<WindowPoint> oldest() const;
    std::optional<WindowPoint> newest() const;
    std::vector<WindowPoint> points() const;

    // Points no older than one span before `now`; empty once polling has
    // stalled for longer than the span
    std::vector<WindowPoint> recent_points(Timestamp now) const;

    // Newest minus oldest timestamp, zero with fewer than two points
    Duration elapsed() const;

    std::size_t size() const noexcept;
    bool empty() const noexcept;
    Duration span() const noexcept;

private:
    Duration span_;
    std::deque<WindowPoint> points_;

    void evict_expired();
};

} // namespace quotatrack
