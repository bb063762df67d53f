#include "utils/test_main.hxx"

#include "railnet/Link.hxx"
#include "railnet/Liveness.hxx"

namespace railnet
{

TEST(LivenessTest, ToleratesUpToMaxFailures)
{
    LivenessMonitor m(5);
    for (int i = 0; i < 5; ++i)
    {
        EXPECT_FALSE(m.on_timeout()) << i;
    }
    EXPECT_EQ(5, m.failures());
    m.on_traffic();
    EXPECT_EQ(0, m.failures());
    for (int i = 0; i < 5; ++i)
    {
        EXPECT_FALSE(m.on_timeout()) << i;
    }
}

TEST(LivenessTest, DeadAfterOneMoreThanMax)
{
    LivenessMonitor m(5);
    int dead = 0;
    for (int i = 0; i < 6; ++i)
    {
        if (m.on_timeout())
        {
            ++dead;
        }
    }
    EXPECT_EQ(1, dead);
    EXPECT_EQ(0, m.failures());
}

TEST(LivenessTest, TrafficResetsTheCount)
{
    LivenessMonitor m(2);
    EXPECT_FALSE(m.on_timeout());
    EXPECT_FALSE(m.on_timeout());
    m.on_traffic();
    EXPECT_FALSE(m.on_timeout());
    EXPECT_FALSE(m.on_timeout());
    EXPECT_TRUE(m.on_timeout());
}

TEST(LivenessTest, Reset)
{
    LivenessMonitor m(1);
    EXPECT_FALSE(m.on_timeout());
    m.reset();
    EXPECT_FALSE(m.on_timeout());
    EXPECT_TRUE(m.on_timeout());
}

TEST(LivenessTest, HeartbeatInterval)
{
    EXPECT_EQ(MSEC_TO_NSEC(7500),
        Defs::heartbeat_interval(Defs::CONN_TIMEOUT, Defs::MAX_HEARTBEAT_FAIL));
    LinkConfig cfg;
    EXPECT_EQ(MSEC_TO_NSEC(7500), cfg.heartbeat_interval());
}

} // namespace railnet
