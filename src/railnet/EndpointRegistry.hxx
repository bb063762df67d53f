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
 * \file railnet/EndpointRegistry.hxx
 *
 * Registry of the remote actuator hosts the origin talks to.
 *
 * @date 10 March 2024
 */

#ifndef _RAILNET_ENDPOINTREGISTRY_HXX_
#define _RAILNET_ENDPOINTREGISTRY_HXX_

#include <map>
#include <memory>
#include <vector>

#include "railnet/Link.hxx"
#include "railnet/NameParser.hxx"

namespace railnet
{

/** Sends messages to endpoints by alias. */
class MessageRouter
{
public:
    virtual ~MessageRouter()
    {
    }

    /** Sends a message to an endpoint.
     * @param alias lowercase endpoint alias
     * @param message message without delimiter
     * @return false if the endpoint is unknown or the link did not send
     */
    virtual bool send_to(const string &alias, const string &message) = 0;
};

/** Owns one ClientLink per endpoint alias. Endpoints are created on first
 * reference and live until removed or until shutdown().
 */
class EndpointRegistry : public MessageRouter
{
public:
    /** Constructor.
     * @param config timing parameters of every link
     * @param listener receives the frames of every link, not owned
     */
    EndpointRegistry(const LinkConfig &config, LinkListener *listener);

    virtual ~EndpointRegistry();

    /** Adds an endpoint, or finds it if it exists already. A new endpoint's
     * link is started and the call waits up to @p wait_nsec for it to
     * connect; the link keeps trying afterwards either way.
     * @param address remote host
     * @param wait_nsec how long to wait for a new link to connect
     * @return the link, or nullptr after shutdown(). The link stays valid
     * as long as the caller holds it, even if the endpoint is removed.
     */
    std::shared_ptr<Link> add_endpoint(const EndpointAddress &address, long long wait_nsec);

    /** Stops and removes an endpoint.
     * @param alias endpoint alias
     * @return false if no such endpoint exists
     */
    bool remove_endpoint(const string &alias);

    /// @return the link of an alias, or nullptr.
    std::shared_ptr<Link> find(const string &alias);

    bool send_to(const string &alias, const string &message) override;

    /// @return every alias, sorted.
    std::vector<string> aliases();

    /** Stops every link, waits up to @p grace_nsec for the link threads to
     * finish, then joins and removes them. No endpoint can be added later.
     */
    void shutdown(long long grace_nsec);

    /// @return the wait used by add_endpoint() callers by default.
    long long default_wait()
    {
        return config_.connTimeout * config_.maxHeartbeatFail;
    }

protected:
    /** Creates the link of a new endpoint. Tests override this.
     * @param address remote host
     * @param alias endpoint alias, to be used as the link name
     */
    virtual std::unique_ptr<Link> create_link(
        const EndpointAddress &address, const string &alias);

    /// @return the link parameters.
    const LinkConfig &config()
    {
        return config_;
    }

    /// @return the shared listener.
    LinkListener *listener()
    {
        return listener_;
    }

private:
    LinkConfig config_;
    LinkListener *listener_;
    OSMutex lock_;
    /// Senders hold a reference while they send, so a removed link is freed
    /// by whoever lets go of it last.
    std::map<string, std::shared_ptr<Link>> links_;
    bool shutdown_;

    DISALLOW_COPY_AND_ASSIGN(EndpointRegistry);
};

} // namespace railnet

#endif // _RAILNET_ENDPOINTREGISTRY_HXX_
