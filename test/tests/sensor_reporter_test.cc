#include "utils/test_main.hxx"

#include "railnet/SensorReporter.hxx"
#include "railnet/railnet_test_helper.hxx"

namespace railnet
{

class SensorReporterTest : public ::testing::Test
{
protected:
    SensorReporterTest()
        : reporter_(&hw_, MSEC_TO_NSEC(5), 3)
        , sink_("origin")
    {
    }

    FakeHardware hw_;
    SensorReporter reporter_;
    RecordingSink sink_;
};

TEST_F(SensorReporterTest, RegistrationReportsCurrentLevel)
{
    hw_.initialLevels[5] = true;
    EXPECT_EQ(nullptr, reporter_.register_sensor(5, &sink_));
    ASSERT_EQ(1u, sink_.count());
    EXPECT_EQ("IN:5:1", sink_.last());
    bool level = false;
    EXPECT_TRUE(reporter_.level(5, &level));
    EXPECT_TRUE(level);
}

TEST_F(SensorReporterTest, SecondRegistrationReusesInput)
{
    EXPECT_EQ(nullptr, reporter_.register_sensor(5, &sink_));
    EXPECT_EQ(nullptr, reporter_.register_sensor(5, &sink_));
    EXPECT_EQ(1u, hw_.inputCreates);
    EXPECT_EQ(1u, reporter_.sensor_count());
    EXPECT_EQ(2u, sink_.count());
    EXPECT_EQ("IN:5:0", sink_.last());
}

TEST_F(SensorReporterTest, InputFailure)
{
    hw_.failInputs.insert(7);
    EXPECT_STREQ(reason::INPUT_INIT_FAILED, reporter_.register_sensor(7, &sink_));
    EXPECT_EQ(0u, reporter_.sensor_count());
    EXPECT_EQ(0u, sink_.count());
}

TEST_F(SensorReporterTest, EdgesAreDebounced)
{
    EXPECT_EQ(nullptr, reporter_.register_sensor(5, &sink_));
    sink_.clear();
    FakeGpio *pin = hw_.input(5);
    ASSERT_NE(nullptr, pin);

    pin->set_level(true);
    reporter_.poll_once();
    reporter_.poll_once();
    EXPECT_EQ(0u, sink_.count());
    reporter_.poll_once();
    ASSERT_EQ(1u, sink_.count());
    EXPECT_EQ("IN:5:1", sink_.last());

    // Steady level: nothing more.
    for (int i = 0; i < 5; ++i)
    {
        reporter_.poll_once();
    }
    EXPECT_EQ(1u, sink_.count());

    pin->set_level(false);
    for (int i = 0; i < 3; ++i)
    {
        reporter_.poll_once();
    }
    ASSERT_EQ(2u, sink_.count());
    EXPECT_EQ("IN:5:0", sink_.last());
}

TEST_F(SensorReporterTest, GlitchIsNotReported)
{
    EXPECT_EQ(nullptr, reporter_.register_sensor(5, &sink_));
    sink_.clear();
    FakeGpio *pin = hw_.input(5);
    pin->set_level(true);
    reporter_.poll_once();
    pin->set_level(false);
    for (int i = 0; i < 5; ++i)
    {
        reporter_.poll_once();
    }
    EXPECT_EQ(0u, sink_.count());
}

TEST_F(SensorReporterTest, PollerThreadReportsEdges)
{
    EXPECT_EQ(nullptr, reporter_.register_sensor(5, &sink_));
    EXPECT_EQ(nullptr, reporter_.register_sensor(6, &sink_));
    sink_.clear();
    reporter_.start();
    hw_.input(5)->set_level(true);
    EXPECT_TRUE(wait_for([this]() { return sink_.count() >= 1; }));
    reporter_.stop();
    auto m = sink_.messages();
    ASSERT_EQ(1u, m.size());
    EXPECT_EQ("IN:5:1", m[0]);
}

TEST_F(SensorReporterTest, FailedSendIsNotFatal)
{
    LogCapture logs;
    sink_.accept(false);
    EXPECT_EQ(nullptr, reporter_.register_sensor(5, &sink_));
    EXPECT_TRUE(logs.contains("not sent"));
    EXPECT_EQ(1u, reporter_.sensor_count());
}

TEST_F(SensorReporterTest, HandleCommand)
{
    Command c = parse_command("IN:9");
    ASSERT_EQ(Command::SENSOR_REGISTER, c.type);
    EXPECT_EQ(nullptr, reporter_.handle_command(c, &sink_));
    EXPECT_EQ("IN:9:0", sink_.last());
}

} // namespace railnet
