#include "utils/test_main.hxx"

#include "railnet/BlinkScheduler.hxx"
#include "railnet/railnet_test_helper.hxx"

namespace railnet
{

TEST(BlinkSchedulerTest, Timing)
{
    BlinkScheduler b(Defs::FLASHING_FREQ, Defs::FLASHING_DUTY_PERCENT);
    EXPECT_EQ(MSEC_TO_NSEC(250), b.on_nsec());
    EXPECT_EQ(MSEC_TO_NSEC(250), b.off_nsec());

    BlinkScheduler c(4, 25);
    EXPECT_EQ(MSEC_TO_NSEC(62) + 500000, c.on_nsec());
    EXPECT_EQ(MSEC_TO_NSEC(187) + 500000, c.off_nsec());
}

TEST(BlinkSchedulerTest, TogglesUntilCancelled)
{
    BlinkScheduler b(50, 50);
    FakeGpio pin;
    b.start("H1", &pin);
    EXPECT_TRUE(b.is_blinking("H1"));
    EXPECT_EQ(&pin, b.blinking_pin("H1"));
    EXPECT_TRUE(wait_for([&pin]() { return pin.sets() >= 3; }));
    EXPECT_TRUE(b.cancel("H1"));
    EXPECT_FALSE(b.is_blinking("H1"));
    EXPECT_FALSE(pin.is_set());
    unsigned writes = pin.writes();
    OSThread::sleep_nsec(MSEC_TO_NSEC(60));
    EXPECT_EQ(writes, pin.writes());
}

TEST(BlinkSchedulerTest, CancelUnknownHead)
{
    BlinkScheduler b(2, 50);
    EXPECT_FALSE(b.cancel("nope"));
    EXPECT_EQ(nullptr, b.blinking_pin("nope"));
}

TEST(BlinkSchedulerTest, CancelIsPrompt)
{
    // A slow blinker must still stop without waiting out its period.
    BlinkScheduler b(1, 50);
    FakeGpio pin;
    b.start("H1", &pin);
    EXPECT_TRUE(wait_for([&pin]() { return pin.is_set(); }));
    long long start = OSTime::get_monotonic();
    EXPECT_TRUE(b.cancel("H1"));
    EXPECT_LT(OSTime::get_monotonic() - start, MSEC_TO_NSEC(300));
    EXPECT_FALSE(pin.is_set());
}

TEST(BlinkSchedulerTest, AtMostOneBlinkerPerHead)
{
    BlinkScheduler b(50, 50);
    FakeGpio pins[5];
    for (int i = 0; i < 5; ++i)
    {
        b.start("SM1-SH1", &pins[i]);
    }
    EXPECT_EQ(1u, b.active_count());
    EXPECT_EQ(&pins[4], b.blinking_pin("SM1-SH1"));
    EXPECT_TRUE(wait_for([&pins]() { return pins[4].sets() >= 2; }));
    for (int i = 0; i < 4; ++i)
    {
        EXPECT_FALSE(pins[i].is_set()) << i;
    }
    unsigned before[4];
    for (int i = 0; i < 4; ++i)
    {
        before[i] = pins[i].writes();
    }
    OSThread::sleep_nsec(MSEC_TO_NSEC(60));
    for (int i = 0; i < 4; ++i)
    {
        EXPECT_EQ(before[i], pins[i].writes()) << i;
    }
}

TEST(BlinkSchedulerTest, IndependentHeads)
{
    BlinkScheduler b(50, 50);
    FakeGpio p1, p2;
    b.start("A", &p1);
    b.start("B", &p2);
    EXPECT_EQ(2u, b.active_count());
    EXPECT_TRUE(b.cancel("A"));
    EXPECT_TRUE(b.is_blinking("B"));
    EXPECT_TRUE(wait_for([&p2]() { return p2.sets() >= 2; }));
    b.cancel_all();
    EXPECT_EQ(0u, b.active_count());
    EXPECT_FALSE(p2.is_set());
}

TEST(BlinkSchedulerTest, CancelToken)
{
    CancelToken t;
    EXPECT_FALSE(t.is_cancelled());
    EXPECT_FALSE(t.sleep(MSEC_TO_NSEC(1)));
    t.cancel();
    EXPECT_TRUE(t.is_cancelled());
    long long start = OSTime::get_monotonic();
    EXPECT_TRUE(t.sleep(SEC_TO_NSEC(10)));
    EXPECT_LT(OSTime::get_monotonic() - start, MSEC_TO_NSEC(100));
}

} // namespace railnet
