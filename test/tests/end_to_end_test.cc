#include "utils/test_main.hxx"

#include "railnet/HostBridge.hxx"
#include "railnet/Link.hxx"
#include "railnet/MemoryLayout.hxx"
#include "railnet/NodeServer.hxx"
#include "railnet/railnet_test_helper.hxx"

namespace railnet
{

/// A node on fake hardware, commanded through a real TCP link.
class NodeTest : public ::testing::Test
{
protected:
    NodeTest()
        : config_(test_link_config())
        , node_(&hw_, 0, config_)
    {
    }

    void SetUp() override
    {
        ASSERT_TRUE(node_.start());
        client_.reset(new ClientLink(
            "127.0.0.1", node_.port(), "pi1:10000", config_, &origin_));
        client_->start();
        ASSERT_TRUE(client_->wait_for_active(SEC_TO_NSEC(2)));
    }

    void TearDown() override
    {
        if (client_)
        {
            client_->stop();
            client_->join();
        }
        node_.stop();
    }

    /// @return true once the origin received @p frame.
    bool received(const string &frame)
    {
        return wait_for([this, frame]() {
            for (const auto &f : origin_.frames())
            {
                if (f == frame)
                {
                    return true;
                }
            }
            return false;
        });
    }

    FakeGpio *red()
    {
        return hw_.extender(0x24)->fake(6);
    }

    FakeGpio *green()
    {
        return hw_.extender(0x24)->fake(14);
    }

    LinkConfig config_;
    FakeHardware hw_;
    NodeServer node_;
    RecordingListener origin_;
    std::unique_ptr<ClientLink> client_;
};

TEST_F(NodeTest, MovesServo)
{
    ASSERT_TRUE(client_->send("OUT_TO:3[85][95]:1"));
    ASSERT_TRUE(wait_for([this]() {
        return hw_.servo(0) && hw_.servo(0)->angle(3) == 95;
    }));
    ASSERT_TRUE(client_->send("OUT_TO:3[85][95]:0"));
    EXPECT_TRUE(wait_for([this]() { return hw_.servo(0)->angle(3) == 85; }));
}

TEST_F(NodeTest, ServoOnSecondBoard)
{
    ASSERT_TRUE(client_->send("OUT_TO:20[85][95]:0"));
    EXPECT_TRUE(wait_for([this]() {
        return hw_.servo(1) && hw_.servo(1)->angle(4) == 85;
    }));
    EXPECT_EQ(nullptr, hw_.servo(0));
}

TEST_F(NodeTest, GreenHead)
{
    ASSERT_TRUE(client_->send("OUT_SH:SM1-SH1$0x24$R6$G14:g"));
    ASSERT_TRUE(wait_for([this]() {
        return hw_.extender(0x24) && green()->is_set();
    }));
    EXPECT_FALSE(red()->is_set());
    EXPECT_FALSE(node_.blinker()->is_blinking("SM1-SH1"));
}

TEST_F(NodeTest, FlashingRedHead)
{
    ASSERT_TRUE(client_->send("OUT_SH:SM1-SH1$0x24$R6$G14:fr"));
    ASSERT_TRUE(
        wait_for([this]() { return node_.blinker()->is_blinking("SM1-SH1"); }));
    EXPECT_FALSE(green()->is_set());
    // Two full periods at 2 Hz must show at least one more rising edge.
    unsigned sets = red()->sets();
    EXPECT_TRUE(wait_for([this, sets]() { return red()->sets() > sets; },
        SEC_TO_NSEC(2)));

    ASSERT_TRUE(client_->send("OUT_SH:SM1-SH1$0x24$R6$G14:d"));
    ASSERT_TRUE(wait_for(
        [this]() { return !node_.blinker()->is_blinking("SM1-SH1"); }));
    EXPECT_FALSE(red()->is_set());
    EXPECT_FALSE(green()->is_set());
}

TEST_F(NodeTest, StopTurnsBlinkingOff)
{
    ASSERT_TRUE(client_->send("OUT_SH:SM1-SH1$0x24$R6$G14:fg"));
    ASSERT_TRUE(
        wait_for([this]() { return node_.blinker()->is_blinking("SM1-SH1"); }));
    node_.stop();
    EXPECT_EQ(0u, node_.blinker()->active_count());
}

TEST_F(NodeTest, SensorRegistrationAndReports)
{
    ASSERT_TRUE(client_->send("IN:5"));
    ASSERT_TRUE(received("IN:5:0"));
    hw_.input(5)->set_level(true);
    EXPECT_TRUE(received("IN:5:1"));
    hw_.input(5)->set_level(false);
    wait_for([this]() { return origin_.frame_count() >= 3; });
    EXPECT_EQ("IN:5:0", origin_.frames().back());
}

TEST_F(NodeTest, RegistrationReportsCurrentLevel)
{
    hw_.initialLevels[7] = true;
    ASSERT_TRUE(client_->send("IN:7"));
    EXPECT_TRUE(received("IN:7:1"));
}

TEST_F(NodeTest, BadAngleIsAnswered)
{
    ASSERT_TRUE(client_->send("OUT_TO:3[xx][95]:1"));
    EXPECT_TRUE(received("ERROR:OUT_TO:3[xx][95]:1:bad_angle"));
    EXPECT_EQ(0u, hw_.servoCreates);
}

TEST_F(NodeTest, FailedBoardIsAnswered)
{
    hw_.failExtenders.insert(0x24);
    ASSERT_TRUE(client_->send("OUT_SH:SM1-SH1$0x24$R6$G14:r"));
    EXPECT_TRUE(received("ERROR:OUT_SH:SM1-SH1$0x24$R6$G14:r:board_init_failed"));
}

TEST_F(NodeTest, SeveralFramesInOneWrite)
{
    ASSERT_TRUE(client_->send("OUT_TO:3[85][95]:1|OUT_TO:4[10][20]:0"));
    EXPECT_TRUE(wait_for([this]() {
        return hw_.servo(0) && hw_.servo(0)->angle(3) == 95 &&
            hw_.servo(0)->angle(4) == 10;
    }));
}

/// A host bridge with an in-memory layout driving a node over TCP.
class HostNodeTest : public ::testing::Test
{
protected:
    HostNodeTest()
        : config_(test_link_config())
        , node_(&hw_, 0, config_)
    {
    }

    void SetUp() override
    {
        ASSERT_TRUE(node_.start());
        suffix_ = ":127.0.0.1:" + std::to_string(node_.port());
        layout_.add_entity("IT.RPI$3[85][95]" + suffix_);
        layout_.add_entity("IH.RPI$SM1-SH1$0x24$R6$G14" + suffix_);
        layout_.add_entity("IS.RPI$5" + suffix_);
        bridge_.reset(new HostBridge(&layout_, config_));
    }

    void TearDown() override
    {
        bridge_.reset();
        node_.stop();
    }

    TurnoutEntity *turnout()
    {
        return layout_.turnout("IT.RPI$3[85][95]" + suffix_);
    }

    SignalHeadEntity *head()
    {
        return layout_.signal_head("IH.RPI$SM1-SH1$0x24$R6$G14" + suffix_);
    }

    SensorEntity *sensor()
    {
        return layout_.sensor("IS.RPI$5" + suffix_);
    }

    LinkConfig config_;
    FakeHardware hw_;
    NodeServer node_;
    MemoryLayout layout_;
    string suffix_;
    std::unique_ptr<HostBridge> bridge_;
};

TEST_F(HostNodeTest, BindsEveryEntity)
{
    EXPECT_EQ(3u, bridge_->bind());
    EXPECT_EQ(1u, bridge_->turnout_count());
    EXPECT_EQ(1u, bridge_->signal_head_count());
    EXPECT_EQ(1u, bridge_->sensors()->size());
    EXPECT_EQ(1u, bridge_->registry()->aliases().size());
}

TEST_F(HostNodeTest, VirtualTurnoutIsNotBound)
{
    layout_.add_entity("IT.RPI$9[85][95]Virtual" + suffix_);
    layout_.add_entity("IT.Virtual-1");
    bridge_->bind();
    EXPECT_EQ(1u, bridge_->turnout_count());
}

TEST_F(HostNodeTest, BadNameIsSkipped)
{
    layout_.add_entity("IS.RPI$x" + suffix_);
    EXPECT_EQ(3u, bridge_->bind());
}

TEST_F(HostNodeTest, TurnoutMovesServo)
{
    bridge_->bind();
    turnout()->set_commanded_state(TurnoutState::THROWN);
    ASSERT_TRUE(wait_for([this]() {
        return hw_.servo(0) && hw_.servo(0)->angle(3) == 85;
    }));
    turnout()->set_commanded_state(TurnoutState::CLOSED);
    EXPECT_TRUE(wait_for([this]() { return hw_.servo(0)->angle(3) == 95; }));
}

TEST_F(HostNodeTest, SignalHeadLightsLed)
{
    bridge_->bind();
    head()->set_appearance("Green");
    EXPECT_TRUE(wait_for([this]() {
        return hw_.extender(0x24) && hw_.extender(0x24)->fake(14)->is_set();
    }));
}

TEST_F(HostNodeTest, SensorFollowsInput)
{
    bridge_->bind();
    ASSERT_TRUE(wait_for(
        [this]() { return sensor()->known_state() == SensorState::INACTIVE; }));
    hw_.input(5)->set_level(true);
    EXPECT_TRUE(wait_for(
        [this]() { return sensor()->known_state() == SensorState::ACTIVE; }));
}

TEST_F(HostNodeTest, InitializeLayout)
{
    bridge_->bind();
    bridge_->initialize_layout();
    EXPECT_EQ(TurnoutState::CLOSED, turnout()->commanded_state());
    EXPECT_EQ("Red", head()->appearance());
    EXPECT_TRUE(wait_for([this]() {
        return hw_.servo(0) && hw_.servo(0)->angle(3) == 95 &&
            hw_.extender(0x24) && hw_.extender(0x24)->fake(6)->is_set();
    }));
}

TEST_F(HostNodeTest, ShutdownLayout)
{
    bridge_->bind();
    turnout()->set_commanded_state(TurnoutState::THROWN);
    head()->set_appearance("Flashing Green");
    ASSERT_TRUE(
        wait_for([this]() { return node_.blinker()->is_blinking("SM1-SH1"); }));
    bridge_->shutdown_layout(SEC_TO_NSEC(1));
    EXPECT_EQ("Dark", head()->appearance());
    EXPECT_EQ(TurnoutState::CLOSED, turnout()->commanded_state());
    EXPECT_TRUE(bridge_->registry()->aliases().empty());

    // Unbound entities are neither sent nor rolled back.
    turnout()->set_commanded_state(TurnoutState::THROWN);
    EXPECT_EQ(TurnoutState::THROWN, turnout()->commanded_state());
}

TEST_F(HostNodeTest, UnreachableEndpointRollsBackTurnout)
{
    // Nothing listens on port 1.
    layout_.add_entity("IT.RPI$4[85][95]:127.0.0.1:1");
    bridge_->bind();
    TurnoutEntity *t = layout_.turnout("IT.RPI$4[85][95]:127.0.0.1:1");
    t->set_commanded_state(TurnoutState::THROWN);
    EXPECT_EQ(TurnoutState::UNKNOWN, t->commanded_state());

    // The reachable turnout is not affected.
    turnout()->set_commanded_state(TurnoutState::THROWN);
    EXPECT_EQ(TurnoutState::THROWN, turnout()->commanded_state());
}

} // namespace railnet
