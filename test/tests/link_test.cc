#include "utils/test_main.hxx"

#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include "railnet/Link.hxx"
#include "railnet/railnet_test_helper.hxx"
#include "utils/SocketUtils.hxx"

namespace railnet
{

/** Plain listening socket standing in for a remote peer, so that the tests
 * control exactly which bytes go on the wire. */
class RawPeer
{
public:
    RawPeer()
        : port_(0)
        , fd_(-1)
    {
        listenFd_ = ListenSocket(0, &port_);
        HASSERT(listenFd_ >= 0);
    }

    ~RawPeer()
    {
        drop();
        ::close(listenFd_);
    }

    /// Accepts the next connection. @return false on timeout.
    bool accept(int timeout_msec = 2000)
    {
        drop();
        struct pollfd pfd = {listenFd_, POLLIN, 0};
        if (::poll(&pfd, 1, timeout_msec) <= 0)
        {
            return false;
        }
        fd_ = ::accept(listenFd_, nullptr, nullptr);
        return fd_ >= 0;
    }

    /// Closes the current connection.
    void drop()
    {
        if (fd_ >= 0)
        {
            ::close(fd_);
            fd_ = -1;
        }
    }

    void write(const string &data)
    {
        ASSERT_EQ((ssize_t)data.size(),
            ::send(fd_, data.data(), data.size(), MSG_NOSIGNAL));
    }

    /// Reads until @p count bytes arrived or the timeout expired.
    string read(size_t count, int timeout_msec = 2000)
    {
        string out;
        long long deadline =
            OSTime::get_monotonic() + MSEC_TO_NSEC(timeout_msec);
        while (out.size() < count && OSTime::get_monotonic() < deadline)
        {
            struct pollfd pfd = {fd_, POLLIN, 0};
            if (::poll(&pfd, 1, 20) <= 0)
            {
                continue;
            }
            char buf[256];
            ssize_t ret = ::recv(fd_, buf, sizeof(buf), 0);
            if (ret <= 0)
            {
                break;
            }
            out.append(buf, ret);
        }
        return out;
    }

    int port()
    {
        return port_;
    }

private:
    int port_;
    int listenFd_;
    int fd_;
};

class LinkTest : public ::testing::Test
{
protected:
    LinkTest()
        : config_(test_link_config())
    {
    }

    /// Creates and starts a client link to the raw peer.
    void start_client()
    {
        client_.reset(
            new ClientLink("127.0.0.1", peer_.port(), "pi1", config_, &l_));
        client_->start();
        ASSERT_TRUE(peer_.accept());
        ASSERT_TRUE(client_->wait_for_active(SEC_TO_NSEC(2)));
    }

    LinkConfig config_;
    RawPeer peer_;
    RecordingListener l_;
    std::unique_ptr<ClientLink> client_;
};

TEST_F(LinkTest, ConnectsAndReceivesFrames)
{
    start_client();
    EXPECT_EQ(Link::ACTIVE, client_->state());
    EXPECT_EQ(1u, l_.connects());
    peer_.write("IN:5:1|IN:");
    peer_.write("6:0|");
    EXPECT_TRUE(wait_for([this]() { return l_.frame_count() >= 2; }));
    auto f = l_.frames();
    ASSERT_EQ(2u, f.size());
    EXPECT_EQ("IN:5:1", f[0]);
    EXPECT_EQ("IN:6:0", f[1]);
}

TEST_F(LinkTest, SendAppendsDelimiter)
{
    start_client();
    EXPECT_TRUE(client_->send("OUT_TO:3[85][95]:1"));
    EXPECT_EQ("OUT_TO:3[85][95]:1|", peer_.read(19));
}

TEST_F(LinkTest, UnframeableMessagesAreRefused)
{
    start_client();
    EXPECT_FALSE(client_->send(""));
    EXPECT_FALSE(client_->send("IN:5|IN:6"));
    EXPECT_FALSE(client_->send("IN:5 "));
    EXPECT_TRUE(client_->send("IN:5"));
    EXPECT_EQ("IN:5|", peer_.read(5));
}

TEST_F(LinkTest, HeartbeatsInterleavedWithFrames)
{
    start_client();
    peer_.write("  IN:1:1|   | IN:2");
    peer_.write(":0|  ");
    EXPECT_TRUE(wait_for([this]() { return l_.frame_count() >= 2; }));
    auto f = l_.frames();
    ASSERT_EQ(2u, f.size());
    EXPECT_EQ("IN:1:1", f[0]);
    EXPECT_EQ("IN:2:0", f[1]);
}

TEST_F(LinkTest, SendsHeartbeatWhenIdle)
{
    start_client();
    string got = peer_.read(1, 1000);
    EXPECT_EQ(" ", got);
}

TEST_F(LinkTest, HeartbeatsKeepTheLinkAlive)
{
    start_client();
    long long end = OSTime::get_monotonic() + MSEC_TO_NSEC(700);
    while (OSTime::get_monotonic() < end)
    {
        peer_.write(" ");
        OSThread::sleep_nsec(MSEC_TO_NSEC(40));
    }
    EXPECT_EQ(0u, client_->dead_link_count());
    EXPECT_EQ(1u, client_->connect_count());
    EXPECT_EQ(0u, l_.frame_count());
}

TEST_F(LinkTest, SilenceIsADeadLink)
{
    start_client();
    // No traffic: after maxHeartbeatFail + 1 read timeouts the link dies and
    // dials again. The first socket stays open on our side meanwhile.
    EXPECT_TRUE(wait_for([this]() { return client_->connect_count() >= 2; }));
    EXPECT_EQ(1u, client_->dead_link_count());
    EXPECT_EQ(2u, l_.connects());
    EXPECT_TRUE(peer_.accept());
}

TEST_F(LinkTest, ReconnectsAfterPeerClose)
{
    start_client();
    peer_.drop();
    ASSERT_TRUE(peer_.accept());
    EXPECT_TRUE(wait_for([this]() { return client_->connect_count() >= 2; }));
    EXPECT_TRUE(client_->wait_for_active(SEC_TO_NSEC(1)));
    EXPECT_GE(client_->dead_link_count(), 1u);
    EXPECT_TRUE(client_->send("IN:5"));
    EXPECT_EQ("IN:5|", peer_.read(5));
}

TEST_F(LinkTest, PartialFrameIsDiscardedOnReconnect)
{
    start_client();
    peer_.write("IN:5:");
    OSThread::sleep_nsec(MSEC_TO_NSEC(50));
    peer_.drop();
    ASSERT_TRUE(peer_.accept());
    EXPECT_TRUE(wait_for([this]() { return client_->connect_count() >= 2; }));
    peer_.write("IN:7:0|");
    EXPECT_TRUE(wait_for([this]() { return l_.frame_count() >= 1; }));
    auto f = l_.frames();
    ASSERT_EQ(1u, f.size());
    EXPECT_EQ("IN:7:0", f[0]);
}

TEST_F(LinkTest, SendFailsWhenNotConnected)
{
    int port;
    int fd = ListenSocket(0, &port);
    ASSERT_GE(fd, 0);
    ::close(fd);
    ClientLink link("127.0.0.1", port, "nowhere", config_, &l_);
    link.start();
    long long start = OSTime::get_monotonic();
    EXPECT_FALSE(link.send("IN:5"));
    long long took = OSTime::get_monotonic() - start;
    EXPECT_GE(took, config_.sendWait - MSEC_TO_NSEC(10));
    EXPECT_LT(took, config_.sendWait + SEC_TO_NSEC(1));
    EXPECT_NE(Link::ACTIVE, link.state());
    link.stop();
    link.join();
    EXPECT_TRUE(link.is_finished());
    EXPECT_EQ(1u, l_.finished());
}

TEST_F(LinkTest, StopWhileConnected)
{
    start_client();
    client_->stop();
    client_->join();
    EXPECT_TRUE(client_->is_finished());
    EXPECT_EQ(Link::FAILED, client_->state());
    EXPECT_EQ(1u, l_.finished());
    EXPECT_FALSE(client_->send("IN:5"));
}

TEST(ServerLinkTest, ClientAndServerTalk)
{
    LinkConfig config = test_link_config();
    RecordingListener server_l;
    RecordingListener client_l;
    ServerLink server(0, "origin", config, &server_l);
    ASSERT_TRUE(server.bind_listener());
    EXPECT_NE(0, server.port());
    server.start();
    ClientLink client("localhost", server.port(), "pi1", config, &client_l);
    client.start();
    ASSERT_TRUE(client.wait_for_active(SEC_TO_NSEC(2)));
    ASSERT_TRUE(server.wait_for_active(SEC_TO_NSEC(2)));

    EXPECT_TRUE(client.send("OUT_TO:3[85][95]:1"));
    EXPECT_TRUE(server.send("IN:5:1"));
    EXPECT_TRUE(wait_for([&]() {
        return server_l.frame_count() >= 1 && client_l.frame_count() >= 1;
    }));
    EXPECT_EQ("OUT_TO:3[85][95]:1", server_l.frames()[0]);
    EXPECT_EQ("IN:5:1", client_l.frames()[0]);

    // Idle for longer than the dead-link limit: heartbeats keep both ends up.
    OSThread::sleep_nsec(MSEC_TO_NSEC(800));
    EXPECT_EQ(0u, client.dead_link_count());
    EXPECT_EQ(0u, server.dead_link_count());
    EXPECT_EQ(1u, server_l.frame_count());

    client.stop();
    client.join();
    server.stop();
    server.join();
    EXPECT_EQ(1u, server_l.finished());
}

TEST(ServerLinkTest, AcceptsNewPeerAfterDisconnect)
{
    LinkConfig config = test_link_config();
    RecordingListener server_l;
    RecordingListener client_l;
    ServerLink server(0, "origin", config, &server_l);
    ASSERT_TRUE(server.bind_listener());
    server.start();
    {
        ClientLink client("127.0.0.1", server.port(), "pi1", config, &client_l);
        client.start();
        ASSERT_TRUE(server.wait_for_active(SEC_TO_NSEC(2)));
    }
    ClientLink client("127.0.0.1", server.port(), "pi1", config, &client_l);
    client.start();
    EXPECT_TRUE(wait_for([&]() { return server.connect_count() >= 2; }));
    ASSERT_TRUE(client.wait_for_active(SEC_TO_NSEC(2)));
    EXPECT_TRUE(client.send("IN:9"));
    EXPECT_TRUE(wait_for([&]() { return server_l.frame_count() >= 1; }));
    EXPECT_EQ("IN:9", server_l.frames()[0]);
}

TEST(ServerLinkTest, StopWhileWaitingForPeer)
{
    LinkConfig config = test_link_config();
    config.connTimeout = SEC_TO_NSEC(5);
    RecordingListener l;
    ServerLink server(0, "origin", config, &l);
    ASSERT_TRUE(server.bind_listener());
    server.start();
    OSThread::sleep_nsec(MSEC_TO_NSEC(50));
    long long start = OSTime::get_monotonic();
    server.stop();
    server.join();
    EXPECT_LT(OSTime::get_monotonic() - start, SEC_TO_NSEC(1));
    EXPECT_TRUE(server.is_finished());
}

} // namespace railnet
