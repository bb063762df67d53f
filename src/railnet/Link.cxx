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
 * \file railnet/Link.cxx
 *
 * Implementation of the link thread, reconnect and heartbeat logic.
 *
 * @date 4 March 2024
 */

#include "railnet/Link.hxx"

#include <errno.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <string.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <vector>

#include "utils/SocketUtils.hxx"
#include "utils/logging.h"

namespace railnet
{

/// Granularity of the waits that must notice stop() quickly.
static constexpr long long POLL_SLICE = MSEC_TO_NSEC(50);

Link::Link(const string &name, const LinkConfig &config, LinkListener *listener)
    : name_(name)
    , config_(config)
    , listener_(listener)
    , exit_(false)
    , finished_(false)
    , fd_(-1)
    , state_(FAILED)
    , lastSend_(0)
    , liveness_(config.maxHeartbeatFail)
    , deadLinks_(0)
    , connects_(0)
{
    HASSERT(listener_);
    HASSERT(config_.recvChunk > 0);
}

Link::~Link()
{
    HASSERT(!is_started());
    close_socket();
}

const char *Link::state_name(State state)
{
    switch (state)
    {
        case CONNECTING:
            return "CONNECTING";
        case ACTIVE:
            return "ACTIVE";
        case FAILED:
        default:
            return "FAILED";
    }
}

void Link::start()
{
    HASSERT(!is_started());
    OSThread::start(name_.c_str(), 0, 0);
}

void Link::stop()
{
    LOG(INFO, "%s: stop requested - closing socket", name_.c_str());
    exit_ = true;
    {
        OSMutexLock l(&lock_);
        if (fd_ >= 0)
        {
            // The link thread owns close(); shutdown wakes its recv().
            ::shutdown(fd_, SHUT_RDWR);
        }
        state_ = FAILED;
    }
    exitSem_.post();
}

Link::State Link::state()
{
    OSMutexLock l(&lock_);
    return state_;
}

bool Link::wait_for_active(long long timeout_nsec)
{
    long long deadline = OSTime::get_monotonic() + timeout_nsec;
    while (!is_active())
    {
        if (exit_ || OSTime::get_monotonic() >= deadline)
        {
            return false;
        }
        OSThread::sleep_nsec(MSEC_TO_NSEC(10));
    }
    return true;
}

bool Link::wait_for_exit(long long nsec)
{
    if (exitSem_.timedwait(nsec) == 0)
    {
        // Keep the semaphore posted so every later wait returns at once.
        exitSem_.post();
        return true;
    }
    return exit_;
}

bool Link::send(const string &message)
{
    if (message.empty() || message.find(Defs::DELIMITER) != string::npos ||
        message.find(Defs::HEARTBEAT) != string::npos)
    {
        LOG(WARNING, "%s: refusing to send unframeable message [%s]",
            name_.c_str(), message.c_str());
        return false;
    }
    if (!is_active() && !wait_for_active(config_.sendWait))
    {
        LOG_ERROR("%s: message [%s] not sent", name_.c_str(), message.c_str());
        return false;
    }
    string frame(message);
    frame.push_back(Defs::DELIMITER);

    OSMutexLock l(&lock_);
    if (state_ != ACTIVE)
    {
        LOG_ERROR("%s: message [%s] not sent", name_.c_str(), message.c_str());
        return false;
    }
    if (!write_locked(frame.data(), frame.size()))
    {
        LOG_ERROR("%s: error sending - closing socket", name_.c_str());
        // Let the link thread notice the broken socket and reconnect.
        ::shutdown(fd_, SHUT_RDWR);
        state_ = FAILED;
        return false;
    }
    LOG(VERBOSE, "%s: sent [%s]", name_.c_str(), message.c_str());
    return true;
}

bool Link::write_locked(const char *data, size_t len)
{
    if (fd_ < 0)
    {
        return false;
    }
    while (len > 0)
    {
        ssize_t ret = ::send(fd_, data, len, MSG_NOSIGNAL);
        if (ret < 0 && errno == EINTR)
        {
            continue;
        }
        if (ret <= 0)
        {
            LOG(WARNING, "%s: write: %s", name_.c_str(),
                ret < 0 ? strerror(errno) : "no progress");
            return false;
        }
        data += ret;
        len -= ret;
    }
    lastSend_ = OSTime::get_monotonic();
    return true;
}

void Link::maybe_send_heartbeat()
{
    OSMutexLock l(&lock_);
    if (state_ != ACTIVE)
    {
        return;
    }
    if (OSTime::get_monotonic() - lastSend_ <= config_.heartbeat_interval())
    {
        return;
    }
    const char hb = Defs::HEARTBEAT;
    if (!write_locked(&hb, 1))
    {
        LOG_ERROR("%s: heartbeat failed - closing socket", name_.c_str());
        ::shutdown(fd_, SHUT_RDWR);
        state_ = FAILED;
    }
}

void Link::close_socket()
{
    OSMutexLock l(&lock_);
    if (fd_ >= 0)
    {
        ::close(fd_);
        fd_ = -1;
    }
    state_ = FAILED;
}

void Link::connect()
{
    while (!exit_)
    {
        {
            OSMutexLock l(&lock_);
            state_ = CONNECTING;
        }
        LOG(INFO, "%s: connecting", name_.c_str());
        int fd = open_socket();
        if (fd < 0)
        {
            continue;
        }
        int val = 1;
        struct timeval tv;
        tv.tv_sec = config_.connTimeout / 1000000000LL;
        tv.tv_usec = (config_.connTimeout % 1000000000LL) / 1000;
        if (!SetSocketRecvTimeout(fd, config_.connTimeout) ||
            ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0 ||
            ::setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &val, sizeof(val)) < 0)
        {
            LOG_ERROR("%s: cannot configure socket: %s", name_.c_str(),
                strerror(errno));
            ::close(fd);
            wait_for_exit(config_.connTimeout);
            continue;
        }
        {
            OSMutexLock l(&lock_);
            fd_ = fd;
            if (exit_)
            {
                state_ = FAILED;
                return;
            }
            state_ = ACTIVE;
            lastSend_ = OSTime::get_monotonic();
        }
        liveness_.reset();
        ++connects_;
        LOG(INFO, "%s: connected", name_.c_str());
        listener_->on_connected(this);
        return;
    }
}

void Link::dead_link(const char *why)
{
    LOG_ERROR("%s: %s - closing socket", name_.c_str(), why);
    ++deadLinks_;
    close_socket();
    if (!assembler_.pending().empty())
    {
        LOG(WARNING, "%s: discarding partial frame [%s]", name_.c_str(),
            assembler_.pending().c_str());
    }
    assembler_.clear();
    liveness_.reset();
    connect();
}

void *Link::entry()
{
    std::vector<char> buf(config_.recvChunk);
    std::vector<string> frames;
    connect();
    while (!exit_)
    {
        maybe_send_heartbeat();
        ssize_t ret = ::recv(fd_, buf.data(), buf.size(), 0);
        int err = errno;
        if (exit_)
        {
            break;
        }
        if (ret > 0)
        {
            liveness_.on_traffic();
            frames.clear();
            assembler_.feed(buf.data(), ret, &frames);
            for (const auto &f : frames)
            {
                LOG(VERBOSE, "%s: received [%s]", name_.c_str(), f.c_str());
                listener_->on_frame(this, f);
            }
        }
        else if (ret == 0)
        {
            dead_link("connection broken");
        }
        else if (err == EAGAIN || err == EWOULDBLOCK)
        {
            if (liveness_.on_timeout())
            {
                dead_link("heartbeat timeout");
            }
        }
        else if (err == EINTR)
        {
            continue;
        }
        else
        {
            LOG(WARNING, "%s: recv: %s", name_.c_str(), strerror(err));
            dead_link("connection reset");
        }
    }
    close_socket();
    assembler_.clear();
    LOG(INFO, "%s: finished", name_.c_str());
    listener_->on_finished(this);
    finished_ = true;
    return nullptr;
}

ClientLink::~ClientLink()
{
    stop();
    join();
}

int ClientLink::open_socket()
{
    int fd = ConnectSocket(host_.c_str(), port_, config().connTimeout);
    if (fd < 0)
    {
        wait_for_exit(config().connTimeout);
    }
    return fd;
}

ServerLink::~ServerLink()
{
    stop();
    join();
    if (listenFd_ >= 0)
    {
        ::close(listenFd_);
    }
}

bool ServerLink::bind_listener()
{
    HASSERT(listenFd_ < 0);
    listenFd_ = ListenSocket(port_, &port_);
    return listenFd_ >= 0;
}

int ServerLink::open_socket()
{
    HASSERT(listenFd_ >= 0);
    long long deadline = OSTime::get_monotonic() + config().connTimeout;
    while (!exit_requested() && OSTime::get_monotonic() < deadline)
    {
        struct pollfd pfd;
        pfd.fd = listenFd_;
        pfd.events = POLLIN;
        pfd.revents = 0;
        int ret = ::poll(&pfd, 1, NSEC_TO_MSEC(POLL_SLICE));
        if (ret < 0 && errno != EINTR)
        {
            LOG_ERROR("%s: poll: %s", name().c_str(), strerror(errno));
            wait_for_exit(config().connTimeout);
            return -1;
        }
        if (ret <= 0)
        {
            continue;
        }
        int fd = ::accept(listenFd_, nullptr, nullptr);
        if (fd < 0)
        {
            LOG(WARNING, "%s: accept: %s", name().c_str(), strerror(errno));
            continue;
        }
        int val = 1;
        if (::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &val, sizeof(val)) < 0)
        {
            LOG_ERROR("%s: setsockopt(nodelay): %s", name().c_str(),
                strerror(errno));
            ::close(fd);
            continue;
        }
        LOG(INFO, "%s: accepted connection. fd=%d", name().c_str(), fd);
        return fd;
    }
    return -1;
}

} // namespace railnet
