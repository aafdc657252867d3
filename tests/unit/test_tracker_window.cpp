#include <gtest/gtest.h>
#include <quotatrack/quotatrack.hpp>

using namespace quotatrack;
using namespace std::chrono_literals;

namespace {

const Timestamp T0 = Clock::from_time_t(1700000000);

} // anonymous namespace

TEST(TrackerWindowTest, StartsEmpty) {
    TrackerWindow w;
    EXPECT_TRUE(w.empty());
    EXPECT_FALSE(w.oldest().has_value());
    EXPECT_FALSE(w.newest().has_value());
    EXPECT_EQ(w.elapsed(), Duration::zero());
    EXPECT_EQ(w.span(), Duration(30min));
}

TEST(TrackerWindowTest, KeepsPointsInsideSpan) {
    TrackerWindow w(30min);
    w.add(T0, 1.0);
    w.add(T0 + 10min, 2.0);
    w.add(T0 + 30min, 3.0);

    EXPECT_EQ(w.size(), 3u);
    EXPECT_EQ(w.elapsed(), Duration(30min));
}

TEST(TrackerWindowTest, EvictsPointsOlderThanSpan) {
    TrackerWindow w(30min);
    w.add(T0, 1.0);
    w.add(T0 + 10min, 2.0);
    w.add(T0 + 35min, 3.0);

    ASSERT_EQ(w.size(), 2u);
    EXPECT_EQ(w.oldest()->timestamp, T0 + 10min);
    EXPECT_DOUBLE_EQ(w.newest()->consumed, 3.0);
}

TEST(TrackerWindowTest, AlwaysKeepsNewestPoint) {
    TrackerWindow w(30min);
    w.add(T0, 1.0);
    w.add(T0 + 5h, 2.0);

    ASSERT_EQ(w.size(), 1u);
    EXPECT_EQ(w.oldest()->timestamp, T0 + 5h);
}

TEST(TrackerWindowTest, RecentPointsMeasuredFromQueryTime) {
    TrackerWindow w(30min);
    w.add(T0, 100.0);
    w.add(T0 + 10min, 150.0);

    EXPECT_EQ(w.recent_points(T0 + 10min).size(), 2u);
    ASSERT_EQ(w.recent_points(T0 + 35min).size(), 1u);
    EXPECT_EQ(w.recent_points(T0 + 35min).front().timestamp, T0 + 10min);
    EXPECT_TRUE(w.recent_points(T0 + 72h).empty());

    // Stored points are untouched by queries
    EXPECT_EQ(w.size(), 2u);
}

TEST(TrackerWindowTest, IgnoresStaleTimestamps) {
    TrackerWindow w;
    w.add(T0 + 5min, 1.0);
    w.add(T0, 9.0);
    w.add(T0 + 5min, 9.0);

    ASSERT_EQ(w.size(), 1u);
    EXPECT_DOUBLE_EQ(w.newest()->consumed, 1.0);
}

TEST(TrackerWindowTest, ClearDropsEverything) {
    TrackerWindow w;
    w.add(T0, 1.0);
    w.add(T0 + 1min, 2.0);
    w.clear();

    EXPECT_TRUE(w.empty());
    EXPECT_TRUE(w.points().empty());
}
