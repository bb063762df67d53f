#include "utils/test_main.hxx"

#include "railnet/SignalHeadController.hxx"
#include "railnet/railnet_test_helper.hxx"

namespace railnet
{

class SignalHeadControllerTest : public ::testing::Test
{
protected:
    SignalHeadControllerTest()
        : blinker_(50, 50)
        , ctrl_(&hw_, &blinker_)
    {
    }

    ~SignalHeadControllerTest()
    {
        blinker_.cancel_all();
    }

    const char *set(Aspect aspect)
    {
        return ctrl_.set_aspect("SM1-SH1", 0x24, 6, 14, aspect);
    }

    FakeGpio *red()
    {
        return hw_.extender(0x24)->fake(6);
    }

    FakeGpio *green()
    {
        return hw_.extender(0x24)->fake(14);
    }

    Aspect current()
    {
        Aspect a = Aspect::DARK;
        EXPECT_TRUE(ctrl_.current_aspect("SM1-SH1", &a));
        return a;
    }

    FakeHardware hw_;
    BlinkScheduler blinker_;
    SignalHeadController ctrl_;
};

TEST_F(SignalHeadControllerTest, StaticAspects)
{
    EXPECT_EQ(nullptr, set(Aspect::RED));
    EXPECT_TRUE(red()->is_set());
    EXPECT_FALSE(green()->is_set());
    EXPECT_EQ(Aspect::RED, current());

    EXPECT_EQ(nullptr, set(Aspect::GREEN));
    EXPECT_FALSE(red()->is_set());
    EXPECT_TRUE(green()->is_set());
    EXPECT_EQ(Aspect::GREEN, current());

    EXPECT_EQ(nullptr, set(Aspect::DARK));
    EXPECT_FALSE(red()->is_set());
    EXPECT_FALSE(green()->is_set());
    EXPECT_EQ(Aspect::DARK, current());
    EXPECT_FALSE(blinker_.is_blinking("SM1-SH1"));
}

TEST_F(SignalHeadControllerTest, FlashRed)
{
    EXPECT_EQ(nullptr, set(Aspect::GREEN));
    EXPECT_EQ(nullptr, set(Aspect::FLASH_RED));
    EXPECT_FALSE(green()->is_set());
    EXPECT_TRUE(blinker_.is_blinking("SM1-SH1"));
    EXPECT_EQ(red(), blinker_.blinking_pin("SM1-SH1"));
    EXPECT_TRUE(wait_for([this]() { return red()->sets() >= 2; }));
    EXPECT_EQ(Aspect::FLASH_RED, current());
}

TEST_F(SignalHeadControllerTest, FlashGreenReplacesFlashRed)
{
    EXPECT_EQ(nullptr, set(Aspect::FLASH_RED));
    EXPECT_EQ(nullptr, set(Aspect::FLASH_GREEN));
    EXPECT_EQ(1u, blinker_.active_count());
    EXPECT_EQ(green(), blinker_.blinking_pin("SM1-SH1"));
    EXPECT_FALSE(red()->is_set());
    unsigned red_writes = red()->writes();
    EXPECT_TRUE(wait_for([this]() { return green()->sets() >= 2; }));
    EXPECT_EQ(red_writes, red()->writes());
}

TEST_F(SignalHeadControllerTest, StaticAspectStopsBlinking)
{
    EXPECT_EQ(nullptr, set(Aspect::FLASH_GREEN));
    EXPECT_EQ(nullptr, set(Aspect::RED));
    EXPECT_FALSE(blinker_.is_blinking("SM1-SH1"));
    EXPECT_TRUE(red()->is_set());
    EXPECT_FALSE(green()->is_set());
    unsigned writes = green()->writes();
    OSThread::sleep_nsec(MSEC_TO_NSEC(60));
    EXPECT_EQ(writes, green()->writes());
    EXPECT_FALSE(green()->is_set());
}

TEST_F(SignalHeadControllerTest, ManyFlashCommandsLeaveOneBlinker)
{
    for (int i = 0; i < 10; ++i)
    {
        EXPECT_EQ(nullptr, set(i % 2 ? Aspect::FLASH_GREEN : Aspect::FLASH_RED));
    }
    EXPECT_EQ(1u, blinker_.active_count());
    EXPECT_EQ(green(), blinker_.blinking_pin("SM1-SH1"));
    EXPECT_EQ(Aspect::FLASH_GREEN, current());
}

TEST_F(SignalHeadControllerTest, BoardIsCreatedOncePerAddress)
{
    EXPECT_EQ(nullptr, ctrl_.set_aspect("A", 0x24, 0, 1, Aspect::RED));
    EXPECT_EQ(nullptr, ctrl_.set_aspect("B", 0x24, 2, 3, Aspect::GREEN));
    EXPECT_EQ(nullptr, ctrl_.set_aspect("C", 0x25, 0, 1, Aspect::RED));
    EXPECT_EQ(2u, hw_.extenderCreates);
    EXPECT_EQ(2u, ctrl_.board_count());
    EXPECT_TRUE(hw_.extender(0x24)->fake(0)->is_set());
    EXPECT_TRUE(hw_.extender(0x24)->fake(3)->is_set());
    EXPECT_TRUE(hw_.extender(0x25)->fake(0)->is_set());
}

TEST_F(SignalHeadControllerTest, BoardInitFailure)
{
    hw_.failExtenders.insert(0x24);
    EXPECT_STREQ(reason::BOARD_INIT_FAILED, set(Aspect::RED));
    Aspect a;
    EXPECT_FALSE(ctrl_.current_aspect("SM1-SH1", &a));
}

TEST_F(SignalHeadControllerTest, BadPin)
{
    EXPECT_STREQ(reason::BAD_PIN,
        ctrl_.set_aspect("SM1-SH1", 0x24, 6, 16, Aspect::RED));
    EXPECT_STREQ(reason::BAD_PIN,
        ctrl_.set_aspect("SM1-SH1", 0x24, -1, 3, Aspect::RED));
}

TEST_F(SignalHeadControllerTest, WriteFailureKeepsAspect)
{
    EXPECT_EQ(nullptr, set(Aspect::RED));
    green()->fail_writes(true);
    EXPECT_STREQ(reason::BOARD_WRITE_FAILED, set(Aspect::GREEN));
    EXPECT_EQ(Aspect::RED, current());
    // The red LED was switched off before the green write failed; it is
    // back on.
    EXPECT_TRUE(red()->is_set());
    EXPECT_FALSE(green()->is_set());
}

TEST_F(SignalHeadControllerTest, WriteFailureFromDarkLeavesBothOff)
{
    EXPECT_EQ(nullptr, set(Aspect::DARK));
    green()->fail_writes(true);
    EXPECT_STREQ(reason::BOARD_WRITE_FAILED, set(Aspect::GREEN));
    EXPECT_FALSE(red()->is_set());
    EXPECT_FALSE(green()->is_set());
    EXPECT_EQ(Aspect::DARK, current());
}

TEST_F(SignalHeadControllerTest, WriteFailureKeepsBlinking)
{
    EXPECT_EQ(nullptr, set(Aspect::FLASH_RED));
    ASSERT_TRUE(blinker_.is_blinking("SM1-SH1"));
    green()->fail_writes(true);
    EXPECT_STREQ(reason::BOARD_WRITE_FAILED, set(Aspect::GREEN));
    EXPECT_EQ(Aspect::FLASH_RED, current());
    EXPECT_TRUE(blinker_.is_blinking("SM1-SH1"));
    EXPECT_EQ(red(), blinker_.blinking_pin("SM1-SH1"));
    unsigned sets = red()->sets();
    EXPECT_TRUE(wait_for([this, sets]() { return red()->sets() > sets; }));
}

TEST_F(SignalHeadControllerTest, HandleCommand)
{
    RecordingSink sink;
    Command c = parse_command("OUT_SH:SM1-SH1$0x24$R6$G14:g");
    ASSERT_EQ(Command::SIGNAL_HEAD_SET, c.type);
    EXPECT_EQ(nullptr, ctrl_.handle_command(c, &sink));
    EXPECT_TRUE(green()->is_set());
    EXPECT_FALSE(red()->is_set());
    EXPECT_EQ(0u, sink.count());
}

} // namespace railnet
