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
 * \file utils/SocketUtils.hxx
 *
 * Helpers for opening TCP client and listening sockets.
 *
 * @date 3 March 2024
 */

#ifndef _UTILS_SOCKETUTILS_HXX_
#define _UTILS_SOCKETUTILS_HXX_

struct addrinfo;

/** Connects a TCP socket to a remote host. Sets TCP_NODELAY and makes
 * write failures on a closed peer return EPIPE instead of raising SIGPIPE.
 * @param host name or address of the remote host
 * @param port remote port
 * @param timeout_nsec give up connecting after this long
 * @return connected (blocking) fd, or -1 on failure (already logged)
 */
int ConnectSocket(const char *host, int port, long long timeout_nsec);

/** Opens a listening TCP socket on all interfaces.
 * @param port port to bind, 0 for an ephemeral port
 * @param bound_port if not null, receives the port actually bound
 * @return listening fd, or -1 on failure (already logged)
 */
int ListenSocket(int port, int *bound_port);

/** Sets the receive timeout of a socket.
 * @param fd socket
 * @param timeout_nsec timeout in nanoseconds
 * @return true on success
 */
bool SetSocketRecvTimeout(int fd, long long timeout_nsec);

/** Ignores SIGPIPE process-wide so that socket write errors are reported as
 * return values. */
void IgnoreSigpipe();

/// Deleter for use with std::unique_ptr on getaddrinfo() results.
struct AddrInfoDeleter
{
    /// Frees the list.
    void operator()(struct addrinfo *s);
};

#endif // _UTILS_SOCKETUTILS_HXX_
