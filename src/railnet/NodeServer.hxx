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
 * \file railnet/NodeServer.hxx
 *
 * The actuator host: one listening link feeding the device controllers.
 *
 * @date 8 March 2024
 */

#ifndef _RAILNET_NODESERVER_HXX_
#define _RAILNET_NODESERVER_HXX_

#include "railnet/BlinkScheduler.hxx"
#include "railnet/CommandDispatcher.hxx"
#include "railnet/Link.hxx"
#include "railnet/SensorReporter.hxx"
#include "railnet/SignalHeadController.hxx"
#include "railnet/TurnoutController.hxx"

namespace railnet
{

/** Wires a ServerLink, the CommandDispatcher and the device controllers
 * together.
 */
class NodeServer
{
public:
    /** Constructor.
     * @param hw peripheral factory, not owned
     * @param port TCP port to listen on, 0 for an ephemeral port
     * @param config link timing parameters
     */
    NodeServer(HardwareProvider *hw, int port, const LinkConfig &config);

    ~NodeServer();

    /** Binds the port and starts the link and sensor threads.
     * @return false if the port could not be bound
     */
    bool start();

    /// Stops every thread and turns every blinking LED off.
    void stop();

    /// @return the listening port, valid after start().
    int port()
    {
        return link_.port();
    }

    /// @return the link to the origin host.
    ServerLink *link()
    {
        return &link_;
    }

    /// @return the dispatcher.
    CommandDispatcher *dispatcher()
    {
        return &dispatcher_;
    }

    /// @return the turnout controller.
    TurnoutController *turnouts()
    {
        return &turnouts_;
    }

    /// @return the signal head controller.
    SignalHeadController *signal_heads()
    {
        return &heads_;
    }

    /// @return the blink scheduler.
    BlinkScheduler *blinker()
    {
        return &blinker_;
    }

    /// @return the sensor reporter.
    SensorReporter *sensors()
    {
        return &sensors_;
    }

private:
    BlinkScheduler blinker_;
    TurnoutController turnouts_;
    SignalHeadController heads_;
    SensorReporter sensors_;
    CommandDispatcher dispatcher_;
    ServerLink link_;
    bool started_;

    DISALLOW_COPY_AND_ASSIGN(NodeServer);
};

} // namespace railnet

#endif // _RAILNET_NODESERVER_HXX_
