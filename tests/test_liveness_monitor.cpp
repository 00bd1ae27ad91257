#include <gtest/gtest.h>

#include <convsync/LivenessMonitor.hpp>

#include "test_support.hpp"

using namespace convsync;
using convsync::test::ManualTimer;
using std::chrono::milliseconds;

namespace
{
    struct LivenessFixture : ::testing::Test
    {
        ManualTimer timer;
        int probes = 0;
        int deaths = 0;

        LivenessMonitor monitor{
            timer,
            LivenessConfig{milliseconds{30000}, milliseconds{5000}, 3},
            [this]()
            { ++probes; },
            [this]()
            { ++deaths; }};
    };
} // namespace

TEST_F(LivenessFixture, ProbesAfterIntervalThenWaitsForTimeout)
{
    monitor.start();
    ASSERT_TRUE(timer.armed());
    EXPECT_EQ(timer.delay(), milliseconds{30000});

    timer.fire();
    EXPECT_EQ(probes, 1);
    EXPECT_EQ(timer.delay(), milliseconds{5000});
}

TEST_F(LivenessFixture, TrafficResetsMissedCount)
{
    monitor.start();

    timer.fire(); // probe
    timer.fire(); // no answer
    EXPECT_EQ(monitor.missed(), 1u);

    timer.fire(); // probe
    monitor.note_traffic();
    timer.fire(); // answered
    EXPECT_EQ(monitor.missed(), 0u);
    EXPECT_EQ(timer.delay(), milliseconds{25000});
    EXPECT_EQ(deaths, 0);
}

TEST_F(LivenessFixture, SignalsDeadOnceAfterMaxMisses)
{
    monitor.start();

    for (int i = 0; i < 3; ++i)
    {
        timer.fire(); // probe
        timer.fire(); // miss
    }

    EXPECT_EQ(deaths, 1);
    EXPECT_EQ(probes, 3);
    EXPECT_FALSE(monitor.running());
    EXPECT_FALSE(timer.armed());
}

TEST_F(LivenessFixture, StopCancelsTheTimer)
{
    monitor.start();
    monitor.stop();

    EXPECT_FALSE(timer.armed());
    EXPECT_FALSE(monitor.running());
}

TEST_F(LivenessFixture, RestartClearsMisses)
{
    monitor.start();
    timer.fire();
    timer.fire();
    ASSERT_EQ(monitor.missed(), 1u);

    monitor.stop();
    monitor.start();
    EXPECT_EQ(monitor.missed(), 0u);
}
