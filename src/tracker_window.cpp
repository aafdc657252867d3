#include "quotatrack/tracker_window.hpp"

namespace quotatrack {

TrackerWindow::TrackerWindow(Duration span)
    : span_(span) {}

void TrackerWindow::add(Timestamp timestamp, double consumed) {
    if (!points_.empty() && timestamp <= points_.back().timestamp) {
        return;
    }
    points_.push_back(WindowPoint{timestamp, consumed});
    evict_expired();
}

void TrackerWindow::clear() {
    points_.clear();
}

std::optional<WindowPoint> TrackerWindow::oldest() const {
    if (points_.empty()) return std::nullopt;
    return points_.front();
}

std::optional<WindowPoint> TrackerWindow::newest() const {
    if (points_.empty()) return std::nullopt;
    return points_.back();
}

std::vector<WindowPoint> TrackerWindow::points() const {
    return std::vector<WindowPoint>(points_.begin(), points_.end());
}

std::vector<WindowPoint> TrackerWindow::recent_points(Timestamp now) const {
    const Timestamp cutoff = now - span_;
    std::vector<WindowPoint> out;
    for (const auto& p : points_) {
        if (p.timestamp >= cutoff && p.timestamp <= now) {
            out.push_back(p);
        }
    }
    return out;
}

Duration TrackerWindow::elapsed() const {
    if (points_.size() < 2) return Duration::zero();
    return points_.back().timestamp - points_.front().timestamp;
}

std::size_t TrackerWindow::size() const noexcept { return points_.size(); }
bool TrackerWindow::empty() const noexcept { return points_.empty(); }
Duration TrackerWindow::span() const noexcept { return span_; }

void TrackerWindow::evict_expired() {
    const Timestamp cutoff = points_.back().timestamp - span_;
    while (points_.size() > 1 && points_.front().timestamp < cutoff) {
        points_.pop_front();
    }
}

} // namespace quotatrack
