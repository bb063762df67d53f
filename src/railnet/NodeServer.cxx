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
 * \file railnet/NodeServer.cxx
 *
 * Implementation of the actuator host.
 *
 * @date 8 March 2024
 */

#include "railnet/NodeServer.hxx"

#include "utils/logging.h"

namespace railnet
{

NodeServer::NodeServer(
    HardwareProvider *hw, int port, const LinkConfig &config)
    : blinker_(Defs::FLASHING_FREQ, Defs::FLASHING_DUTY_PERCENT)
    , turnouts_(hw)
    , heads_(hw, &blinker_)
    , sensors_(hw)
    , link_(port, "origin", config, &dispatcher_)
    , started_(false)
{
    dispatcher_.register_handler(Command::TURNOUT_SET, &turnouts_);
    dispatcher_.register_handler(Command::SIGNAL_HEAD_SET, &heads_);
    dispatcher_.register_handler(Command::SENSOR_REGISTER, &sensors_);
}

NodeServer::~NodeServer()
{
    stop();
}

bool NodeServer::start()
{
    HASSERT(!started_);
    if (!link_.bind_listener())
    {
        return false;
    }
    sensors_.start();
    link_.start();
    started_ = true;
    LOG(INFO, "Node listening on port %d", link_.port());
    return true;
}

void NodeServer::stop()
{
    if (!started_)
    {
        return;
    }
    started_ = false;
    sensors_.stop();
    link_.stop();
    link_.join();
    blinker_.cancel_all();
    LOG(INFO, "Node stopped");
}

} // namespace railnet
