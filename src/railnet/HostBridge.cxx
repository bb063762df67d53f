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
 * \file railnet/HostBridge.cxx
 *
 * Implementation of the origin side.
 *
 * @date 12 March 2024
 */

#include "railnet/HostBridge.hxx"

#include "utils/logging.h"

namespace railnet
{

HostBridge::HostBridge(LayoutModel *layout, const LinkConfig &config)
    : layout_(layout)
    , registry_(new EndpointRegistry(config, this))
    , sensors_(registry_.get(), layout)
{
    dispatcher_.register_handler(Command::SENSOR_REPORT, &sensors_);
}

HostBridge::~HostBridge()
{
    detach_all();
    registry_->shutdown(0);
}

void HostBridge::add_endpoint(const EndpointAddress &address)
{
    registry_->add_endpoint(address, registry_->default_wait());
}

unsigned HostBridge::bind()
{
    unsigned bound = 0;
    for (SensorEntity *s : layout_->sensors())
    {
        SensorName name;
        if (!NameParser::parse_sensor(s->system_name(), &name))
        {
            LOG(WARNING, "Skipping sensor %s: bad system name",
                s->system_name().c_str());
            continue;
        }
        add_endpoint(name.endpoint);
        sensors_.add_sensor(s, name);
        ++bound;
    }
    for (TurnoutEntity *t : layout_->turnouts())
    {
        if (t->system_name().find("Virtual") != string::npos)
        {
            LOG(INFO, "Skipping virtual turnout %s", t->system_name().c_str());
            continue;
        }
        TurnoutName name;
        if (!NameParser::parse_turnout(t->system_name(), &name))
        {
            LOG(WARNING, "Skipping turnout %s: bad system name",
                t->system_name().c_str());
            continue;
        }
        add_endpoint(name.endpoint);
        turnouts_.emplace_back(
            new TurnoutBinding(t, name, registry_.get()));
        turnouts_.back()->attach();
        ++bound;
    }
    for (SignalHeadEntity *h : layout_->signal_heads())
    {
        SignalHeadName name;
        if (!NameParser::parse_signal_head(h->system_name(), &name))
        {
            LOG(WARNING, "Skipping signal head %s: bad system name",
                h->system_name().c_str());
            continue;
        }
        add_endpoint(name.endpoint);
        heads_.emplace_back(new SignalHeadBinding(h, name, registry_.get()));
        heads_.back()->attach();
        ++bound;
    }
    LOG(INFO, "Bound %u entities to %u endpoints", bound,
        (unsigned)registry_->aliases().size());
    return bound;
}

void HostBridge::initialize_layout()
{
    for (SignalHeadEntity *h : layout_->signal_heads())
    {
        h->set_appearance(aspect_name(Aspect::DARK));
        h->set_appearance(aspect_name(Aspect::RED));
    }
    for (TurnoutEntity *t : layout_->turnouts())
    {
        t->set_commanded_state(TurnoutState::CLOSED);
    }
}

void HostBridge::shutdown_layout(long long grace_nsec)
{
    for (SignalHeadEntity *h : layout_->signal_heads())
    {
        h->set_appearance(aspect_name(Aspect::DARK));
    }
    for (TurnoutEntity *t : layout_->turnouts())
    {
        t->set_commanded_state(TurnoutState::CLOSED);
    }
    detach_all();
    registry_->shutdown(grace_nsec);
}

void HostBridge::detach_all()
{
    for (auto &b : turnouts_)
    {
        b->detach();
    }
    for (auto &b : heads_)
    {
        b->detach();
    }
}

void HostBridge::on_frame(Link *link, const string &frame)
{
    dispatcher_.dispatch_frame(frame, link);
}

void HostBridge::on_connected(Link *link)
{
    unsigned n = sensors_.register_endpoint(link->name());
    if (n)
    {
        LOG(INFO, "%s: %u sensors registered", link->name().c_str(), n);
    }
}

} // namespace railnet
