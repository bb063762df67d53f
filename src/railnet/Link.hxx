/** \copyright
 * Copyright (c) 2024, railnet contributors
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 *  - Redistributions of source code must retain the above copyright notice,
 *    this list of conditions and the following disclaimer.
 *
 *  - Redistributions in binary form must reproduce the above copyright notice,
 *    this list of conditions and the following disclaimer in the documentation
 *    and/or other materials provided with the distribution.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
 * AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
 * IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE
 * ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE
 * LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR
 * CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF
 * SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
 * INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN
 * CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE)
 * ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE
 * POSSIBILITY OF SUCH DAMAGE.
 *
 * \file railnet/Link.hxx
 *
 * Self-healing framed TCP link with heartbeat supervision.
 *
 * A Link owns one socket at a time and one thread. The thread connects (or
 * accepts), reads frames and hands them to a LinkListener, sends
 * heartbeats when idle, and replaces the socket whenever the connection
 * is found dead. ClientLink dials out, ServerLink accepts.
 *
 * @date 4 March 2024
 */

#ifndef _RAILNET_LINK_HXX_
#define _RAILNET_LINK_HXX_

#include <atomic>
#include <string>

#include "os/OS.hxx"
#include "railnet/Defs.hxx"
#include "railnet/FrameAssembler.hxx"
#include "railnet/FrameSink.hxx"
#include "railnet/Liveness.hxx"

namespace railnet
{

class Link;

/** Receives the events of a Link. All calls arrive on the link thread.
 */
class LinkListener
{
public:
    virtual ~LinkListener()
    {
    }

    /** A complete frame arrived. Frames are delivered in wire order.
     * @param link link the frame arrived on
     * @param frame frame text without delimiter or heartbeat bytes
     */
    virtual void on_frame(Link *link, const string &frame) = 0;

    /// A new socket became ACTIVE.
    virtual void on_connected(Link *link)
    {
    }

    /// The link thread is about to exit after stop().
    virtual void on_finished(Link *link)
    {
    }
};

/** Timing and sizing parameters of a Link.
 */
struct LinkConfig
{
    LinkConfig()
        : connTimeout(Defs::CONN_TIMEOUT)
        , maxHeartbeatFail(Defs::MAX_HEARTBEAT_FAIL)
        , recvChunk(Defs::RECV_CHUNK)
        , sendWait(Defs::SEND_WAIT)
    {
    }

    /// connect retry delay and read timeout, in nanoseconds
    long long connTimeout;
    /// consecutive silent read timeouts tolerated before the link is dead
    int maxHeartbeatFail;
    /// bytes requested per receive call
    int recvChunk;
    /// how long send() waits for a reconnect before giving up, nanoseconds
    long long sendWait;

    /// @return idle time after which a heartbeat is sent, in nanoseconds.
    long long heartbeat_interval() const
    {
        return Defs::heartbeat_interval(connTimeout, maxHeartbeatFail);
    }
};

/** Base class of both link roles.
 */
class Link : public FrameSink, private OSThread
{
public:
    /** Connection state. */
    enum State
    {
        CONNECTING, /**< waiting for a socket */
        ACTIVE, /**< socket established, frames flow */
        FAILED, /**< socket lost or link stopped */
    };

    /** Constructor.
     * @param name name used in log messages and as the peer name
     * @param config timing parameters
     * @param listener receives frames and lifecycle events, not owned
     */
    Link(const string &name, const LinkConfig &config, LinkListener *listener);

    ~Link();

    /// Starts the link thread. May be called once.
    void start();

    /** Requests the link thread to exit. Closes the current connection.
     * Does not wait; use join() for that. Safe to call from any thread and
     * more than once. */
    void stop();

    /// Waits for the link thread to exit.
    void join()
    {
        OSThread::join();
    }

    /** Sends one message, appending the delimiter. If the link is not ACTIVE
     * waits at most LinkConfig::sendWait for it to become ACTIVE. A write
     * failure drops the connection and lets the link thread reconnect.
     * @param message message text, must not contain a delimiter or space
     * @return true if the whole frame was written
     */
    bool send(const string &message) override;

    const string &name() override
    {
        return name_;
    }

    /// @return current connection state.
    State state();

    /// @return true if a socket is established.
    bool is_active()
    {
        return state() == ACTIVE;
    }

    /** Waits until the link is ACTIVE.
     * @param timeout_nsec maximum time to wait
     * @return true if the link is ACTIVE
     */
    bool wait_for_active(long long timeout_nsec);

    /// @return true once the link thread has left its loop after stop().
    bool is_finished()
    {
        return finished_;
    }

    /// @return number of connections torn down because they were dead.
    unsigned dead_link_count()
    {
        return deadLinks_;
    }

    /// @return number of sockets that became ACTIVE so far.
    unsigned connect_count()
    {
        return connects_;
    }

    /// @return the timing parameters.
    const LinkConfig &config()
    {
        return config_;
    }

    /// @return printable name of a state.
    static const char *state_name(State state);

protected:
    /** Establishes one socket. Implementations block at most about one
     * connection timeout, and must return -1 promptly once exit_requested()
     * turns true.
     * @return connected fd, or -1 if no connection was made this time
     */
    virtual int open_socket() = 0;

    /// @return true once stop() was called.
    bool exit_requested()
    {
        return exit_;
    }

    /** Sleeps, returning early when stop() is called.
     * @param nsec maximum time to sleep
     * @return true if the sleep was cut short by stop()
     */
    bool wait_for_exit(long long nsec);

private:
    void *entry() override;

    /// Loops on open_socket() until a connection is made or exit.
    void connect();

    /// Tears down a dead connection and reconnects.
    void dead_link(const char *why);

    /// Closes the current socket, if any.
    void close_socket();

    /// Writes all bytes to the current socket. Caller holds lock_.
    bool write_locked(const char *data, size_t len);

    /// Sends a heartbeat byte if the link has been idle for long enough.
    void maybe_send_heartbeat();

    string name_;
    LinkConfig config_;
    LinkListener *listener_;

    /// protects fd_, state_ and lastSend_, serializes writers
    OSMutex lock_;
    /// posted by stop() to cut reconnect delays short
    OSSem exitSem_;
    std::atomic<bool> exit_;
    std::atomic<bool> finished_;
    int fd_;
    State state_;
    long long lastSend_;

    /// touched by the link thread only
    FrameAssembler assembler_;
    LivenessMonitor liveness_;

    std::atomic<unsigned> deadLinks_;
    std::atomic<unsigned> connects_;

    DISALLOW_COPY_AND_ASSIGN(Link);
};

/** Link that dials out to a remote host and redials after failures.
 */
class ClientLink : public Link
{
public:
    /** Constructor.
     * @param host remote host name or address
     * @param port remote port
     * @param name link name, usually the endpoint alias
     * @param config timing parameters
     * @param listener receives frames, not owned
     */
    ClientLink(const string &host, int port, const string &name,
        const LinkConfig &config, LinkListener *listener)
        : Link(name, config, listener)
        , host_(host)
        , port_(port)
    {
    }

    ~ClientLink();

    /// @return remote host.
    const string &host()
    {
        return host_;
    }

    /// @return remote port.
    int port()
    {
        return port_;
    }

private:
    int open_socket() override;

    string host_;
    int port_;
};

/** Link that accepts one peer at a time on a listening port.
 */
class ServerLink : public Link
{
public:
    /** Constructor.
     * @param port port to listen on, 0 for an ephemeral port
     * @param name link name
     * @param config timing parameters
     * @param listener receives frames, not owned
     */
    ServerLink(
        int port, const string &name, const LinkConfig &config,
        LinkListener *listener)
        : Link(name, config, listener)
        , port_(port)
        , listenFd_(-1)
    {
    }

    ~ServerLink();

    /** Opens the listening socket. Must succeed before start().
     * @return true on success
     */
    bool bind_listener();

    /// @return the bound port, valid after bind_listener().
    int port()
    {
        return port_;
    }

private:
    int open_socket() override;

    int port_;
    int listenFd_;
};

} // namespace railnet

#endif // _RAILNET_LINK_HXX_
