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
 * \file railnet/HostBridge.hxx
 *
 * Origin side of the railnet link layer.
 *
 * The HostBridge binds the entities of a layout model to the remote
 * endpoints named in their system names, owns one ClientLink per endpoint
 * and routes the frames coming back to the sensor binding.
 *
 * @date 12 March 2024
 */

#ifndef _RAILNET_HOSTBRIDGE_HXX_
#define _RAILNET_HOSTBRIDGE_HXX_

#include <memory>
#include <vector>

#include "railnet/Bindings.hxx"
#include "railnet/CommandDispatcher.hxx"
#include "railnet/EndpointRegistry.hxx"
#include "railnet/Layout.hxx"

namespace railnet
{

class HostBridge : public LinkListener
{
public:
    /** Constructor.
     * @param layout entities to bind, not owned
     * @param config timing parameters of the endpoint links
     */
    HostBridge(LayoutModel *layout, const LinkConfig &config);

    ~HostBridge();

    /** Parses the system name of every entity, adds the endpoints they name
     * and attaches the bindings. Entities whose name does not parse are
     * logged and skipped, as are turnouts with "Virtual" in their name.
     * @return number of entities bound
     */
    unsigned bind();

    /// Sets every signal head DARK then RED and every turnout CLOSED.
    void initialize_layout();

    /** Sets every signal head DARK and every turnout CLOSED, then stops all
     * endpoints.
     * @param grace_nsec time allowed for the link threads to exit
     */
    void shutdown_layout(long long grace_nsec = Defs::SHUTDOWN_GRACE);

    void on_frame(Link *link, const string &frame) override;
    void on_connected(Link *link) override;

    /// @return the endpoint registry.
    EndpointRegistry *registry()
    {
        return registry_.get();
    }

    /// @return the dispatcher used for incoming frames.
    CommandDispatcher *dispatcher()
    {
        return &dispatcher_;
    }

    /// @return the sensor binding.
    SensorBinding *sensors()
    {
        return &sensors_;
    }

    /// @return number of turnout bindings.
    size_t turnout_count()
    {
        return turnouts_.size();
    }

    /// @return number of signal head bindings.
    size_t signal_head_count()
    {
        return heads_.size();
    }

private:
    /// Adds the endpoint of an entity, waiting for a new one to connect.
    void add_endpoint(const EndpointAddress &address);

    void detach_all();

    LayoutModel *layout_;
    CommandDispatcher dispatcher_;
    std::unique_ptr<EndpointRegistry> registry_;
    SensorBinding sensors_;
    std::vector<std::unique_ptr<TurnoutBinding>> turnouts_;
    std::vector<std::unique_ptr<SignalHeadBinding>> heads_;

    DISALLOW_COPY_AND_ASSIGN(HostBridge);
};

} // namespace railnet

#endif // _RAILNET_HOSTBRIDGE_HXX_
