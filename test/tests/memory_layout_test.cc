#include "utils/test_main.hxx"

#include <stdlib.h>
#include <unistd.h>

#include "railnet/MemoryLayout.hxx"

using testing::StrictMock;
using testing::_;

namespace railnet
{

class MockTurnoutListener : public TurnoutListener
{
public:
    MOCK_METHOD3(on_commanded_state,
        void(TurnoutEntity *, TurnoutState, TurnoutState));
};

class MockSensorListener : public SensorListener
{
public:
    MOCK_METHOD3(
        on_known_state, void(SensorEntity *, SensorState, SensorState));
};

class MockSignalHeadListener : public SignalHeadListener
{
public:
    MOCK_METHOD3(on_appearance,
        void(SignalHeadEntity *, const string &, const string &));
};

TEST(MemoryLayoutTest, AddEntities)
{
    MemoryLayout layout;
    EXPECT_TRUE(layout.add_entity("IT.RPI$3[85][95]:pi1"));
    EXPECT_TRUE(layout.add_entity("is.rpi$5:pi1"));
    EXPECT_TRUE(layout.add_entity("IH.RPI$SM1-SH1$0x24$R6$G14:pi1"));
    EXPECT_FALSE(layout.add_entity("IT.RPI$3[85][95]:pi1"));
    EXPECT_FALSE(layout.add_entity("XX.something"));
    EXPECT_FALSE(layout.add_entity("IT"));

    EXPECT_EQ(1u, layout.turnouts().size());
    EXPECT_EQ(1u, layout.sensors().size());
    EXPECT_EQ(1u, layout.signal_heads().size());
    ASSERT_NE(nullptr, layout.turnout("IT.RPI$3[85][95]:pi1"));
    ASSERT_NE(nullptr, layout.sensor("is.rpi$5:pi1"));
    EXPECT_EQ(nullptr, layout.sensor("IS.RPI$5:pi1"));
    EXPECT_EQ(nullptr, layout.turnout("nope"));

    EXPECT_EQ(TurnoutState::UNKNOWN,
        layout.turnout("IT.RPI$3[85][95]:pi1")->commanded_state());
    EXPECT_EQ(SensorState::UNKNOWN,
        layout.sensor("is.rpi$5:pi1")->known_state());
    EXPECT_EQ("Dark",
        layout.signal_head("IH.RPI$SM1-SH1$0x24$R6$G14:pi1")->appearance());
}

TEST(MemoryLayoutTest, LoadFile)
{
    char path[] = "/tmp/railnet_layout_XXXXXX";
    int fd = mkstemp(path);
    ASSERT_GE(fd, 0);
    const char content[] = "# yard\n"
                           "\n"
                           "  IT.RPI$3[85][95]:pi1  \n"
                           "IS.RPI$5:pi1\r\n"
                           "IH.RPI$SM1-SH1$0x24$R6$G14:pi1\n"
                           "bogus\n";
    ASSERT_EQ((ssize_t)sizeof(content) - 1,
        ::write(fd, content, sizeof(content) - 1));
    ::close(fd);

    MemoryLayout layout;
    EXPECT_TRUE(layout.load_file(path));
    ::unlink(path);
    EXPECT_NE(nullptr, layout.turnout("IT.RPI$3[85][95]:pi1"));
    EXPECT_NE(nullptr, layout.sensor("IS.RPI$5:pi1"));
    EXPECT_NE(nullptr, layout.signal_head("IH.RPI$SM1-SH1$0x24$R6$G14:pi1"));
    EXPECT_EQ(1u, layout.turnouts().size());
}

TEST(MemoryLayoutTest, MissingFile)
{
    MemoryLayout layout;
    EXPECT_FALSE(layout.load_file("/nonexistent/railnet/layout.txt"));
}

TEST(MemoryLayoutTest, TurnoutNotifiesOnChangeOnly)
{
    MemoryTurnout t("IT.RPI$3[85][95]:pi1");
    StrictMock<MockTurnoutListener> l;
    t.add_listener(&l);
    t.add_listener(&l);
    EXPECT_CALL(l, on_commanded_state(
                       &t, TurnoutState::UNKNOWN, TurnoutState::CLOSED));
    t.set_commanded_state(TurnoutState::CLOSED);
    t.set_commanded_state(TurnoutState::CLOSED);
    EXPECT_CALL(
        l, on_commanded_state(&t, TurnoutState::CLOSED, TurnoutState::THROWN));
    t.set_commanded_state(TurnoutState::THROWN);
    t.remove_listener(&l);
    t.set_commanded_state(TurnoutState::CLOSED);
    EXPECT_EQ(TurnoutState::CLOSED, t.commanded_state());
}

TEST(MemoryLayoutTest, SensorNotifies)
{
    MemorySensor s("IS.RPI$5:pi1");
    StrictMock<MockSensorListener> l;
    s.add_listener(&l);
    EXPECT_CALL(
        l, on_known_state(&s, SensorState::UNKNOWN, SensorState::ACTIVE));
    s.set_known_state(SensorState::ACTIVE);
    s.set_known_state(SensorState::ACTIVE);
}

TEST(MemoryLayoutTest, SignalHeadNotifies)
{
    MemorySignalHead h("IH.RPI$SM1-SH1$0x24$R6$G14:pi1");
    StrictMock<MockSignalHeadListener> l;
    h.add_listener(&l);
    EXPECT_CALL(l, on_appearance(&h, "Dark", "Red"));
    h.set_appearance("Red");
    h.set_appearance("Red");
    EXPECT_EQ("Red", h.appearance());
}

TEST(MemoryLayoutTest, StateNames)
{
    EXPECT_STREQ("CLOSED", turnout_state_name(TurnoutState::CLOSED));
    EXPECT_STREQ("THROWN", turnout_state_name(TurnoutState::THROWN));
    EXPECT_STREQ("ACTIVE", sensor_state_name(SensorState::ACTIVE));
    EXPECT_STREQ("INCONSISTENT", sensor_state_name(SensorState::INCONSISTENT));
}

} // namespace railnet
