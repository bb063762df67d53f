#include "utils/test_main.hxx"

#include <algorithm>

#include "railnet/Bindings.hxx"
#include "railnet/MemoryLayout.hxx"
#include "railnet/railnet_test_helper.hxx"

using testing::InSequence;
using testing::Return;
using testing::StrictMock;
using testing::_;

namespace railnet
{

static const char TURNOUT[] = "IT.RPI$3[85][95]:pi1";
static const char HEAD[] = "IH.RPI$SM1-SH1$0x24$R6$G14:pi1";
static const char SENSOR[] = "IS.RPI$5:pi1";
static const char ALIAS[] = "pi1:10000";

class TurnoutBindingTest : public ::testing::Test
{
protected:
    TurnoutBindingTest()
        : turnout_(TURNOUT)
    {
        HASSERT(NameParser::parse_turnout(TURNOUT, &name_));
    }

    MemoryTurnout turnout_;
    TurnoutName name_;
    StrictMock<MockMessageRouter> router_;
};

TEST_F(TurnoutBindingTest, ForwardsChanges)
{
    TurnoutBinding b(&turnout_, name_, &router_);
    b.attach();
    {
        InSequence s;
        EXPECT_CALL(router_, send_to(ALIAS, "OUT_TO:3[85][95]:1"))
            .WillOnce(Return(true));
        EXPECT_CALL(router_, send_to(ALIAS, "OUT_TO:3[85][95]:0"))
            .WillOnce(Return(true));
    }
    turnout_.set_commanded_state(TurnoutState::CLOSED);
    turnout_.set_commanded_state(TurnoutState::THROWN);
    EXPECT_EQ(2u, b.sent_count());
}

TEST_F(TurnoutBindingTest, SameStateTwiceSendsOnce)
{
    TurnoutBinding b(&turnout_, name_, &router_);
    b.attach();
    EXPECT_CALL(router_, send_to(ALIAS, "OUT_TO:3[85][95]:1"))
        .WillOnce(Return(true));
    turnout_.set_commanded_state(TurnoutState::CLOSED);
    turnout_.set_commanded_state(TurnoutState::CLOSED);
    EXPECT_EQ(1u, b.sent_count());
}

TEST_F(TurnoutBindingTest, AttachSendsCurrentState)
{
    turnout_.set_commanded_state(TurnoutState::THROWN);
    TurnoutBinding b(&turnout_, name_, &router_);
    EXPECT_CALL(router_, send_to(ALIAS, "OUT_TO:3[85][95]:0"))
        .WillOnce(Return(true));
    b.attach();
    EXPECT_EQ(TurnoutState::THROWN, turnout_.commanded_state());
}

TEST_F(TurnoutBindingTest, AttachWithUnknownStateSendsNothing)
{
    TurnoutBinding b(&turnout_, name_, &router_);
    b.attach();
    EXPECT_EQ(0u, b.sent_count());
}

TEST_F(TurnoutBindingTest, FailedSendRollsBack)
{
    TurnoutBinding b(&turnout_, name_, &router_);
    b.attach();
    EXPECT_CALL(router_, send_to(ALIAS, "OUT_TO:3[85][95]:1"))
        .WillOnce(Return(true));
    turnout_.set_commanded_state(TurnoutState::CLOSED);

    // The rollback itself must not be sent.
    EXPECT_CALL(router_, send_to(ALIAS, "OUT_TO:3[85][95]:0"))
        .WillOnce(Return(false));
    turnout_.set_commanded_state(TurnoutState::THROWN);
    EXPECT_EQ(TurnoutState::CLOSED, turnout_.commanded_state());
    EXPECT_EQ(1u, b.sent_count());
}

TEST_F(TurnoutBindingTest, DetachStopsForwarding)
{
    TurnoutBinding b(&turnout_, name_, &router_);
    b.attach();
    b.detach();
    turnout_.set_commanded_state(TurnoutState::CLOSED);
}

/// Turnout that notifies its listeners on every set, changed or not, like a
/// model that mirrors the device state back.
class EveryUpdateTurnout : public TurnoutEntity
{
public:
    EveryUpdateTurnout(const string &name)
        : name_(name)
        , state_(TurnoutState::UNKNOWN)
    {
    }

    const string &system_name() override
    {
        return name_;
    }

    TurnoutState commanded_state() override
    {
        return state_;
    }

    void set_commanded_state(TurnoutState state) override
    {
        TurnoutState old = state_;
        state_ = state;
        for (TurnoutListener *l : std::vector<TurnoutListener *>(listeners_))
        {
            l->on_commanded_state(this, old, state);
        }
    }

    void add_listener(TurnoutListener *l) override
    {
        listeners_.push_back(l);
    }

    void remove_listener(TurnoutListener *l) override
    {
        listeners_.erase(
            std::remove(listeners_.begin(), listeners_.end(), l),
            listeners_.end());
    }

private:
    string name_;
    TurnoutState state_;
    std::vector<TurnoutListener *> listeners_;
};

class EveryUpdateTurnoutTest : public ::testing::Test
{
protected:
    EveryUpdateTurnoutTest()
        : turnout_(TURNOUT)
    {
        HASSERT(NameParser::parse_turnout(TURNOUT, &name_));
    }

    EveryUpdateTurnout turnout_;
    TurnoutName name_;
    StrictMock<MockMessageRouter> router_;
};

TEST_F(EveryUpdateTurnoutTest, SameStateTwiceSendsOnce)
{
    TurnoutBinding b(&turnout_, name_, &router_);
    b.attach();
    EXPECT_CALL(router_, send_to(ALIAS, "OUT_TO:3[85][95]:1"))
        .WillOnce(Return(true));
    turnout_.set_commanded_state(TurnoutState::CLOSED);
    turnout_.set_commanded_state(TurnoutState::CLOSED);
    EXPECT_EQ(1u, b.sent_count());
    EXPECT_EQ(TurnoutState::CLOSED, b.last_sent());
}

TEST_F(EveryUpdateTurnoutTest, ChangeAfterRepeatIsSent)
{
    TurnoutBinding b(&turnout_, name_, &router_);
    b.attach();
    {
        InSequence s;
        EXPECT_CALL(router_, send_to(ALIAS, "OUT_TO:3[85][95]:0"))
            .WillOnce(Return(true));
        EXPECT_CALL(router_, send_to(ALIAS, "OUT_TO:3[85][95]:1"))
            .WillOnce(Return(true));
    }
    turnout_.set_commanded_state(TurnoutState::THROWN);
    turnout_.set_commanded_state(TurnoutState::THROWN);
    turnout_.set_commanded_state(TurnoutState::CLOSED);
    EXPECT_EQ(2u, b.sent_count());
}

TEST_F(EveryUpdateTurnoutTest, FailedSendIsRetriedOnNextSet)
{
    TurnoutBinding b(&turnout_, name_, &router_);
    b.attach();
    {
        InSequence s;
        EXPECT_CALL(router_, send_to(ALIAS, "OUT_TO:3[85][95]:1"))
            .WillOnce(Return(false));
        EXPECT_CALL(router_, send_to(ALIAS, "OUT_TO:3[85][95]:1"))
            .WillOnce(Return(true));
    }
    turnout_.set_commanded_state(TurnoutState::CLOSED);
    EXPECT_EQ(TurnoutState::UNKNOWN, turnout_.commanded_state());
    EXPECT_EQ(TurnoutState::UNKNOWN, b.last_sent());
    turnout_.set_commanded_state(TurnoutState::CLOSED);
    EXPECT_EQ(TurnoutState::CLOSED, b.last_sent());
}

TEST_F(EveryUpdateTurnoutTest, ReattachSendsCurrentState)
{
    TurnoutBinding b(&turnout_, name_, &router_);
    EXPECT_CALL(router_, send_to(ALIAS, "OUT_TO:3[85][95]:1"))
        .Times(2)
        .WillRepeatedly(Return(true));
    b.attach();
    turnout_.set_commanded_state(TurnoutState::CLOSED);
    b.detach();
    b.attach();
    EXPECT_EQ(2u, b.sent_count());
}

TEST(SignalHeadBindingTest, AppearanceMapping)
{
    EXPECT_EQ(Aspect::RED, SignalHeadBinding::aspect_for_appearance("Red"));
    EXPECT_EQ(Aspect::GREEN, SignalHeadBinding::aspect_for_appearance("Green"));
    EXPECT_EQ(Aspect::FLASH_RED,
        SignalHeadBinding::aspect_for_appearance("Flashing Red"));
    EXPECT_EQ(Aspect::FLASH_GREEN,
        SignalHeadBinding::aspect_for_appearance("Flashing Green"));
    EXPECT_EQ(Aspect::DARK, SignalHeadBinding::aspect_for_appearance("Dark"));
    EXPECT_EQ(Aspect::DARK,
        SignalHeadBinding::aspect_for_appearance("Flashing Yellow"));
    EXPECT_EQ(Aspect::DARK, SignalHeadBinding::aspect_for_appearance(""));
}

TEST(SignalHeadBindingTest, ForwardsAppearance)
{
    MemorySignalHead head(HEAD);
    SignalHeadName name;
    ASSERT_TRUE(NameParser::parse_signal_head(HEAD, &name));
    StrictMock<MockMessageRouter> router;
    SignalHeadBinding b(&head, name, &router);
    b.attach();
    {
        InSequence s;
        EXPECT_CALL(router, send_to(ALIAS, "OUT_SH:SM1-SH1$0x24$R6$G14:fr"))
            .WillOnce(Return(true));
        EXPECT_CALL(router, send_to(ALIAS, "OUT_SH:SM1-SH1$0x24$R6$G14:d"))
            .WillOnce(Return(false));
    }
    head.set_appearance("Flashing Red");
    head.set_appearance("Lunar");
    EXPECT_EQ(1u, b.sent_count());
    // A failed send leaves the appearance alone.
    EXPECT_EQ("Lunar", head.appearance());
    b.detach();
    head.set_appearance("Red");
}

class SensorBindingTest : public ::testing::Test
{
protected:
    SensorBindingTest()
        : binding_(&router_, &layout_)
        , link_(ALIAS)
    {
        layout_.add_entity(SENSOR);
        sensor_ = layout_.sensor(SENSOR);
        HASSERT(NameParser::parse_sensor(SENSOR, &name_));
    }

    MemoryLayout layout_;
    StrictMock<MockMessageRouter> router_;
    SensorBinding binding_;
    RecordingSink link_;
    SensorEntity *sensor_;
    SensorName name_;
};

TEST_F(SensorBindingTest, AddSendsRegistration)
{
    EXPECT_CALL(router_, send_to(ALIAS, "IN:5")).WillOnce(Return(true));
    EXPECT_TRUE(binding_.add_sensor(sensor_, name_));
    EXPECT_EQ(SensorState::UNKNOWN, sensor_->known_state());
    EXPECT_EQ(1u, binding_.size());
}

TEST_F(SensorBindingTest, FailedRegistrationLeavesUnknown)
{
    sensor_->set_known_state(SensorState::ACTIVE);
    EXPECT_CALL(router_, send_to(ALIAS, "IN:5")).WillOnce(Return(false));
    EXPECT_FALSE(binding_.add_sensor(sensor_, name_));
    EXPECT_EQ(SensorState::UNKNOWN, sensor_->known_state());
}

TEST_F(SensorBindingTest, ReportsUpdateTheSensor)
{
    EXPECT_CALL(router_, send_to(_, _)).WillOnce(Return(true));
    binding_.add_sensor(sensor_, name_);

    EXPECT_EQ(nullptr, binding_.handle_command(parse_command("IN:5:1"), &link_));
    EXPECT_EQ(SensorState::ACTIVE, sensor_->known_state());
    EXPECT_EQ(nullptr, binding_.handle_command(parse_command("IN:5:0"), &link_));
    EXPECT_EQ(SensorState::INACTIVE, sensor_->known_state());
}

TEST_F(SensorBindingTest, UnknownSensor)
{
    LogCapture logs;
    EXPECT_STREQ(reason::UNKNOWN_SENSOR,
        binding_.handle_command(parse_command("IN:6:1"), &link_));
    EXPECT_TRUE(logs.contains("IS.RPI$6:PI1:10000"));
}

TEST_F(SensorBindingTest, LayoutLookupByReportedName)
{
    // Not added through the binding, but named the way reports are looked
    // up.
    layout_.add_entity("IS.RPI$7:PI1:10000");
    EXPECT_EQ(nullptr, binding_.handle_command(parse_command("IN:7:1"), &link_));
    EXPECT_EQ(SensorState::ACTIVE,
        layout_.sensor("IS.RPI$7:PI1:10000")->known_state());
}

TEST_F(SensorBindingTest, ReportFromOtherEndpointDoesNotMatch)
{
    EXPECT_CALL(router_, send_to(_, _)).WillOnce(Return(true));
    binding_.add_sensor(sensor_, name_);
    RecordingSink other("pi2:10000");
    EXPECT_STREQ(reason::UNKNOWN_SENSOR,
        binding_.handle_command(parse_command("IN:5:1"), &other));
    EXPECT_EQ(SensorState::UNKNOWN, sensor_->known_state());
}

TEST_F(SensorBindingTest, ReRegisterEndpoint)
{
    EXPECT_CALL(router_, send_to(ALIAS, "IN:5")).WillOnce(Return(true));
    binding_.add_sensor(sensor_, name_);
    layout_.add_entity("IS.RPI$9:pi1");
    SensorName n9;
    ASSERT_TRUE(NameParser::parse_sensor("IS.RPI$9:pi1", &n9));
    EXPECT_CALL(router_, send_to(ALIAS, "IN:9")).WillOnce(Return(true));
    binding_.add_sensor(layout_.sensor("IS.RPI$9:pi1"), n9);

    EXPECT_CALL(router_, send_to(ALIAS, "IN:5")).WillOnce(Return(true));
    EXPECT_CALL(router_, send_to(ALIAS, "IN:9")).WillOnce(Return(false));
    EXPECT_EQ(1u, binding_.register_endpoint(ALIAS));
    EXPECT_EQ(0u, binding_.register_endpoint("pi2:10000"));
}

} // namespace railnet
