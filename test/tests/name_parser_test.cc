#include "utils/test_main.hxx"

#include "railnet/Defs.hxx"
#include "railnet/NameParser.hxx"

namespace railnet
{

TEST(NameParserTest, Endpoint)
{
    EndpointAddress a;
    ASSERT_TRUE(NameParser::parse_endpoint("PI-Yard.local:10001", &a));
    EXPECT_EQ("PI-Yard.local", a.host);
    EXPECT_EQ(10001, a.port);
    EXPECT_EQ("PI-Yard.local:10001", a.id());
    EXPECT_EQ("pi-yard.local:10001", a.alias());
}

TEST(NameParserTest, EndpointDefaultPort)
{
    EndpointAddress a;
    ASSERT_TRUE(NameParser::parse_endpoint("192.168.1.20", &a));
    EXPECT_EQ("192.168.1.20", a.host);
    EXPECT_EQ(Defs::DEFAULT_ENDPOINT_PORT, a.port);
    EXPECT_EQ("192.168.1.20:10000", a.alias());
}

TEST(NameParserTest, EndpointErrors)
{
    EndpointAddress a;
    EXPECT_FALSE(NameParser::parse_endpoint("", &a));
    EXPECT_FALSE(NameParser::parse_endpoint(":10000", &a));
    EXPECT_FALSE(NameParser::parse_endpoint("host:", &a));
    EXPECT_FALSE(NameParser::parse_endpoint("host:0", &a));
    EXPECT_FALSE(NameParser::parse_endpoint("host:65536", &a));
    EXPECT_FALSE(NameParser::parse_endpoint("host:12:13", &a));
    EXPECT_FALSE(NameParser::parse_endpoint("bad host", &a));
    EXPECT_FALSE(NameParser::parse_endpoint("host|x", &a));
}

TEST(NameParserTest, Sensor)
{
    SensorName s;
    ASSERT_TRUE(NameParser::parse_sensor("IS.RPI$5:pi1", &s));
    EXPECT_EQ(5, s.gpio);
    EXPECT_EQ("pi1", s.endpoint.host);
    EXPECT_EQ(10000, s.endpoint.port);

    ASSERT_TRUE(NameParser::parse_sensor("is.rpi$17:Pi2:10005", &s));
    EXPECT_EQ(17, s.gpio);
    EXPECT_EQ("pi2:10005", s.endpoint.alias());
}

TEST(NameParserTest, SensorErrors)
{
    SensorName s;
    EXPECT_FALSE(NameParser::parse_sensor("IT.RPI$5:pi1", &s));
    EXPECT_FALSE(NameParser::parse_sensor("IS.RPI$x:pi1", &s));
    EXPECT_FALSE(NameParser::parse_sensor("IS.RPI$5", &s));
    EXPECT_FALSE(NameParser::parse_sensor("IS.RPI$:pi1", &s));
    EXPECT_FALSE(NameParser::parse_sensor("IS.RPI$", &s));
    EXPECT_FALSE(NameParser::parse_sensor("IS5:pi1", &s));
}

TEST(NameParserTest, Turnout)
{
    TurnoutName t;
    ASSERT_TRUE(NameParser::parse_turnout("IT.RPI$3[85][95]:pi1:10001", &t));
    EXPECT_EQ(3, t.servoAddress);
    EXPECT_EQ(85, t.thrownAngle);
    EXPECT_EQ(95, t.closedAngle);
    EXPECT_EQ("pi1:10001", t.endpoint.alias());
}

TEST(NameParserTest, TurnoutErrors)
{
    TurnoutName t;
    EXPECT_FALSE(NameParser::parse_turnout("IT.RPI$3[85]:pi1", &t));
    EXPECT_FALSE(NameParser::parse_turnout("IT.RPI$3[85][200]:pi1", &t));
    EXPECT_FALSE(NameParser::parse_turnout("IT.RPI$3[85][95]", &t));
    EXPECT_FALSE(NameParser::parse_turnout("IS.RPI$3[85][95]:pi1", &t));
}

TEST(NameParserTest, SignalHead)
{
    SignalHeadName h;
    ASSERT_TRUE(
        NameParser::parse_signal_head("IH.RPI$SM1-SH1$0x24$R6$G14:pi1", &h));
    EXPECT_EQ("SM1-SH1", h.headId);
    EXPECT_EQ(0x24, h.boardAddress);
    EXPECT_EQ(6, h.redPin);
    EXPECT_EQ(14, h.greenPin);
    EXPECT_EQ("pi1:10000", h.endpoint.alias());
}

TEST(NameParserTest, SignalHeadErrors)
{
    SignalHeadName h;
    EXPECT_FALSE(
        NameParser::parse_signal_head("IH.RPI$SM1-SH1$0x24$R6$G16:pi1", &h));
    EXPECT_FALSE(
        NameParser::parse_signal_head("IH.RPI$SM1-SH1$0x24$R6:pi1", &h));
    EXPECT_FALSE(
        NameParser::parse_signal_head("IH.RPI$SM1-SH1$0x24$R6$G14", &h));
}

TEST(NameParserTest, SensorLookupName)
{
    EXPECT_EQ("IS.RPI$5:PI1:10000", NameParser::sensor_lookup_name(5, "pi1:10000"));
}

} // namespace railnet
