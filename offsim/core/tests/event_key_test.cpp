#include <offsim/core/event.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <vector>

using namespace offsim::core;

class EventKeyTest : public ::testing::Test {
protected:
    TimePoint time(double seconds) {
        return time_from_seconds(seconds);
    }
};

TEST_F(EventKeyTest, OrderByTime) {
    EventKey early{time(1.0), 5};
    EventKey late{time(2.0), 0};

    EXPECT_LT(early, late);
    EXPECT_NE(early, late);
}

TEST_F(EventKeyTest, OrderBySequenceWhenSameTime) {
    EventKey first{time(1.0), 0};
    EventKey second{time(1.0), 1};

    EXPECT_LT(first, second);
}

TEST_F(EventKeyTest, SortingOrder) {
    std::vector<EventKey> keys{
        {time(2.0), 0},
        {time(1.0), 7},
        {time(1.0), 3},
        {time(0.5), 9},
    };

    std::sort(keys.begin(), keys.end());

    EXPECT_EQ(keys[0], (EventKey{time(0.5), 9}));
    EXPECT_EQ(keys[1], (EventKey{time(1.0), 3}));
    EXPECT_EQ(keys[2], (EventKey{time(1.0), 7}));
    EXPECT_EQ(keys[3], (EventKey{time(2.0), 0}));
}
