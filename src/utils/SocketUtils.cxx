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
 * \file utils/SocketUtils.cxx
 *
 * Implementation of the TCP socket helpers.
 *
 * @date 3 March 2024
 */

#include "utils/SocketUtils.hxx"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>
#include <unistd.h>

#include <memory>
#include <string>

#include "utils/logging.h"
#include "utils/macros.h"

void AddrInfoDeleter::operator()(struct addrinfo *s)
{
    freeaddrinfo(s);
}

void IgnoreSigpipe()
{
    signal(SIGPIPE, SIG_IGN);
}

int ConnectSocket(const char *host, int port, long long timeout_nsec)
{
    IgnoreSigpipe();

    string port_str = std::to_string(port);
    struct addrinfo *addr = nullptr;
    struct addrinfo hints;
    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    int ai_ret = getaddrinfo(host, port_str.c_str(), &hints, &addr);
    if (ai_ret != 0 || !addr)
    {
        LOG(WARNING, "getaddrinfo failed for '%s': %s", host,
            gai_strerror(ai_ret));
        return -1;
    }
    std::unique_ptr<struct addrinfo, AddrInfoDeleter> ai_deleter(addr);

    int fd = ::socket(addr->ai_family, addr->ai_socktype, addr->ai_protocol);
    if (fd < 0)
    {
        LOG_ERROR("socket: %s", strerror(errno));
        return -1;
    }

    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0)
    {
        LOG_ERROR("fcntl: %s", strerror(errno));
        ::close(fd);
        return -1;
    }
    int err = 0;
    if (::connect(fd, addr->ai_addr, addr->ai_addrlen) < 0)
    {
        err = errno;
        if (err == EINPROGRESS)
        {
            struct pollfd pfd;
            pfd.fd = fd;
            pfd.events = POLLOUT;
            pfd.revents = 0;
            int ret = ::poll(&pfd, 1, (int)(timeout_nsec / 1000000LL));
            socklen_t len = sizeof(err);
            if (ret == 0)
            {
                err = ETIMEDOUT;
            }
            else if (ret < 0)
            {
                err = errno;
            }
            else if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) < 0)
            {
                err = errno;
            }
        }
    }
    if (err != 0)
    {
        LOG(WARNING, "connect to %s:%d: %s", host, port, strerror(err));
        ::close(fd);
        return -1;
    }
    if (::fcntl(fd, F_SETFL, flags) < 0)
    {
        LOG_ERROR("fcntl: %s", strerror(errno));
        ::close(fd);
        return -1;
    }

    int val = 1;
    if (::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &val, sizeof(val)) < 0)
    {
        LOG_ERROR("setsockopt(nodelay): %s", strerror(errno));
        ::close(fd);
        return -1;
    }

    LOG(INFO, "Connected to %s:%d. fd=%d", host, port, fd);
    return fd;
}

int ListenSocket(int port, int *bound_port)
{
    IgnoreSigpipe();

    int fd = ::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    if (fd < 0)
    {
        LOG_ERROR("socket: %s", strerror(errno));
        return -1;
    }

    int val = 1;
    if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &val, sizeof(val)) < 0)
    {
        LOG_ERROR("setsockopt(reuseaddr): %s", strerror(errno));
        ::close(fd);
        return -1;
    }

    struct sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = htons(port);
    if (::bind(fd, (struct sockaddr *)&addr, sizeof(addr)) < 0)
    {
        LOG_ERROR("bind port %d: %s", port, strerror(errno));
        ::close(fd);
        return -1;
    }
    if (::listen(fd, 1) < 0)
    {
        LOG_ERROR("listen: %s", strerror(errno));
        ::close(fd);
        return -1;
    }

    socklen_t len = sizeof(addr);
    if (::getsockname(fd, (struct sockaddr *)&addr, &len) < 0)
    {
        LOG_ERROR("getsockname: %s", strerror(errno));
        ::close(fd);
        return -1;
    }
    if (bound_port)
    {
        *bound_port = ntohs(addr.sin_port);
    }
    LOG(INFO, "Listening on port %d. fd=%d", ntohs(addr.sin_port), fd);
    return fd;
}

bool SetSocketRecvTimeout(int fd, long long timeout_nsec)
{
    struct timeval tv;
    tv.tv_sec = timeout_nsec / 1000000000LL;
    tv.tv_usec = (timeout_nsec % 1000000000LL) / 1000;
    if (::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0)
    {
        LOG_ERROR("setsockopt(rcvtimeo): %s", strerror(errno));
        return false;
    }
    return true;
}
