#include "utils/test_main.hxx"

#include "railnet/CommandDispatcher.hxx"
#include "railnet/railnet_test_helper.hxx"

using testing::AllOf;
using testing::Field;
using testing::Return;
using testing::StrictMock;
using testing::_;

namespace railnet
{

class DispatcherTest : public ::testing::Test
{
protected:
    CommandDispatcher d_;
    StrictMock<MockFrameSink> sink_;
    StrictMock<MockCommandHandler> turnouts_;
    StrictMock<MockCommandHandler> heads_;
};

TEST_F(DispatcherTest, RoutesByType)
{
    d_.register_handler(Command::TURNOUT_SET, &turnouts_);
    d_.register_handler(Command::SIGNAL_HEAD_SET, &heads_);

    EXPECT_CALL(turnouts_,
        handle_command(AllOf(Field(&Command::servoAddress, 3),
                           Field(&Command::active, true)),
            &sink_))
        .WillOnce(Return(nullptr));
    d_.dispatch_frame("OUT_TO:3[85][95]:1", &sink_);

    EXPECT_CALL(heads_,
        handle_command(Field(&Command::headId, "SM1-SH1"), &sink_))
        .WillOnce(Return(nullptr));
    d_.dispatch_frame("OUT_SH:SM1-SH1$0x24$R6$G14:g", &sink_);
    EXPECT_EQ(0u, d_.error_count());
}

TEST_F(DispatcherTest, ParseErrorIsReportedNotDispatched)
{
    d_.register_handler(Command::TURNOUT_SET, &turnouts_);
    EXPECT_CALL(sink_, send("ERROR:OUT_TO:3[xx][95]:1:bad_angle"))
        .WillOnce(Return(true));
    d_.dispatch_frame("OUT_TO:3[xx][95]:1", &sink_);
    EXPECT_EQ(1u, d_.error_count());
}

TEST_F(DispatcherTest, HandlerFailureIsReported)
{
    d_.register_handler(Command::TURNOUT_SET, &turnouts_);
    EXPECT_CALL(turnouts_, handle_command(_, &sink_))
        .WillOnce(Return(reason::SERVO_INIT_FAILED));
    EXPECT_CALL(sink_, send("ERROR:OUT_TO:3[85][95]:0:servo_init_failed"))
        .WillOnce(Return(true));
    d_.dispatch_frame("OUT_TO:3[85][95]:0", &sink_);
}

TEST_F(DispatcherTest, MissingHandler)
{
    EXPECT_CALL(sink_, send("ERROR:IN:5:unsupported_command"))
        .WillOnce(Return(true));
    d_.dispatch_frame("IN:5", &sink_);
}

TEST_F(DispatcherTest, RemoteErrorIsNeverAnswered)
{
    LogCapture logs;
    d_.dispatch_frame("ERROR:IN:5:unsupported_command", &sink_);
    EXPECT_EQ(0u, d_.error_count());
    EXPECT_TRUE(logs.contains("peer reported"));
}

TEST_F(DispatcherTest, RemoteErrorHandlerResultIsIgnored)
{
    d_.register_handler(Command::REMOTE_ERROR, &turnouts_);
    EXPECT_CALL(turnouts_, handle_command(_, &sink_))
        .WillOnce(Return(reason::UNSUPPORTED));
    d_.dispatch_frame("ERROR:x:y", &sink_);
    EXPECT_EQ(0u, d_.error_count());
}

TEST_F(DispatcherTest, Unregister)
{
    d_.register_handler(Command::SENSOR_REPORT, &turnouts_);
    d_.unregister_handler(Command::SENSOR_REPORT);
    EXPECT_CALL(sink_, send("ERROR:IN:5:1:unsupported_command"))
        .WillOnce(Return(true));
    d_.dispatch_frame("IN:5:1", &sink_);
}

TEST_F(DispatcherTest, FailedErrorReportIsLogged)
{
    LogCapture logs;
    EXPECT_CALL(sink_, send(_)).WillOnce(Return(false));
    d_.dispatch_frame("garbage", &sink_);
    EXPECT_TRUE(logs.contains("could not report error"));
}

TEST_F(DispatcherTest, FramesKeepTheirOrder)
{
    d_.register_handler(Command::SENSOR_REPORT, &turnouts_);
    testing::InSequence s;
    EXPECT_CALL(turnouts_, handle_command(Field(&Command::gpio, 1), _))
        .WillOnce(Return(nullptr));
    EXPECT_CALL(turnouts_, handle_command(Field(&Command::gpio, 2), _))
        .WillOnce(Return(nullptr));
    EXPECT_CALL(turnouts_, handle_command(Field(&Command::gpio, 3), _))
        .WillOnce(Return(nullptr));
    d_.dispatch_frame("IN:1:1", &sink_);
    d_.dispatch_frame("IN:2:0", &sink_);
    d_.dispatch_frame("IN:3:1", &sink_);
}

} // namespace railnet
