#include "utils/test_main.hxx"

#include "railnet/TurnoutController.hxx"
#include "railnet/railnet_test_helper.hxx"

namespace railnet
{

class TurnoutControllerTest : public ::testing::Test
{
protected:
    TurnoutControllerTest()
        : ctrl_(&hw_)
    {
    }

    FakeHardware hw_;
    TurnoutController ctrl_;
    RecordingSink sink_;
};

TEST_F(TurnoutControllerTest, ClosedUsesClosedAngle)
{
    EXPECT_EQ(nullptr, ctrl_.set_position(3, 85, 95, true));
    ASSERT_NE(nullptr, hw_.servo(0));
    EXPECT_EQ(95, hw_.servo(0)->angle(3));
    int angle = 0;
    EXPECT_TRUE(ctrl_.last_angle(3, &angle));
    EXPECT_EQ(95, angle);
}

TEST_F(TurnoutControllerTest, ThrownUsesThrownAngle)
{
    EXPECT_EQ(nullptr, ctrl_.set_position(3, 85, 95, false));
    EXPECT_EQ(85, hw_.servo(0)->angle(3));
}

TEST_F(TurnoutControllerTest, BoardIsCreatedOnce)
{
    EXPECT_EQ(nullptr, ctrl_.set_position(0, 10, 20, true));
    EXPECT_EQ(nullptr, ctrl_.set_position(15, 10, 20, false));
    EXPECT_EQ(nullptr, ctrl_.set_position(0, 10, 20, false));
    EXPECT_EQ(1u, hw_.servoCreates);
    EXPECT_EQ(1u, ctrl_.board_count());
    EXPECT_EQ(10, hw_.servo(0)->angle(0));
    EXPECT_EQ(10, hw_.servo(0)->angle(15));
}

TEST_F(TurnoutControllerTest, ServoAddressSelectsBoardAndChannel)
{
    EXPECT_EQ(nullptr, ctrl_.set_position(16, 30, 40, true));
    EXPECT_EQ(nullptr, ctrl_.set_position(37, 30, 40, false));
    ASSERT_NE(nullptr, hw_.servo(1));
    ASSERT_NE(nullptr, hw_.servo(2));
    EXPECT_EQ(40, hw_.servo(1)->angle(0));
    EXPECT_EQ(30, hw_.servo(2)->angle(5));
    EXPECT_EQ(2u, ctrl_.board_count());
}

TEST_F(TurnoutControllerTest, RangeChecks)
{
    EXPECT_STREQ(reason::BAD_SERVO, ctrl_.set_position(-1, 10, 20, true));
    EXPECT_STREQ(reason::BAD_SERVO, ctrl_.set_position(992, 10, 20, true));
    EXPECT_STREQ(reason::BAD_ANGLE, ctrl_.set_position(1, 10, 181, true));
    EXPECT_STREQ(reason::BAD_ANGLE, ctrl_.set_position(1, -1, 20, false));
    EXPECT_EQ(0u, hw_.servoCreates);
}

TEST_F(TurnoutControllerTest, BoardInitFailure)
{
    hw_.failServoBoards.insert(0);
    EXPECT_STREQ(
        reason::SERVO_INIT_FAILED, ctrl_.set_position(3, 85, 95, true));
    int angle;
    EXPECT_FALSE(ctrl_.last_angle(3, &angle));
    // Failures are not cached; the next attempt retries the board.
    hw_.failServoBoards.clear();
    EXPECT_EQ(nullptr, ctrl_.set_position(3, 85, 95, true));
    EXPECT_EQ(2u, hw_.servoCreates);
}

TEST_F(TurnoutControllerTest, WriteFailureKeepsLastAngle)
{
    EXPECT_EQ(nullptr, ctrl_.set_position(3, 85, 95, true));
    hw_.servo(0)->fail_writes(true);
    EXPECT_STREQ(
        reason::SERVO_WRITE_FAILED, ctrl_.set_position(3, 85, 95, false));
    int angle = 0;
    EXPECT_TRUE(ctrl_.last_angle(3, &angle));
    EXPECT_EQ(95, angle);
    EXPECT_EQ(95, hw_.servo(0)->angle(3));
}

TEST_F(TurnoutControllerTest, HandleCommand)
{
    Command c = parse_command("OUT_TO:3[85][95]:0");
    ASSERT_EQ(Command::TURNOUT_SET, c.type);
    EXPECT_EQ(nullptr, ctrl_.handle_command(c, &sink_));
    EXPECT_EQ(85, hw_.servo(0)->angle(3));
    EXPECT_EQ(0u, sink_.count());
}

} // namespace railnet
