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
 * \file railnet/Bindings.cxx
 *
 * Implementation of the origin-side bindings.
 *
 * @date 11 March 2024
 */

#include "railnet/Bindings.hxx"

#include "utils/logging.h"

namespace railnet
{

void TurnoutBinding::attach()
{
    if (attached_)
    {
        return;
    }
    TurnoutState state = turnout_->commanded_state();
    lastSent_ = TurnoutState::UNKNOWN;
    turnout_->set_commanded_state(TurnoutState::UNKNOWN);
    turnout_->add_listener(this);
    attached_ = true;
    turnout_->set_commanded_state(state);
}

void TurnoutBinding::detach()
{
    if (!attached_)
    {
        return;
    }
    turnout_->remove_listener(this);
    attached_ = false;
}

void TurnoutBinding::on_commanded_state(
    TurnoutEntity *turnout, TurnoutState old_state, TurnoutState new_state)
{
    if (rollback_)
    {
        return;
    }
    bool active;
    switch (new_state)
    {
        case TurnoutState::CLOSED:
            active = true;
            break;
        case TurnoutState::THROWN:
            active = false;
            break;
        default:
            return;
    }
    if (new_state == lastSent_)
    {
        LOG(VERBOSE, "Turnout %s: already %s", turnout->system_name().c_str(),
            turnout_state_name(new_state));
        return;
    }
    string msg = format_turnout(name_.servoAddress, name_.thrownAngle,
        name_.closedAngle, active);
    if (router_->send_to(name_.endpoint.alias(), msg))
    {
        lastSent_ = new_state;
        ++sent_;
        return;
    }
    LOG_ERROR("Turnout %s: could not send %s, back to %s",
        turnout->system_name().c_str(), msg.c_str(),
        turnout_state_name(old_state));
    rollback_ = true;
    turnout->set_commanded_state(old_state);
    rollback_ = false;
}

void SignalHeadBinding::attach()
{
    if (!attached_)
    {
        head_->add_listener(this);
        attached_ = true;
    }
}

void SignalHeadBinding::detach()
{
    if (attached_)
    {
        head_->remove_listener(this);
        attached_ = false;
    }
}

Aspect SignalHeadBinding::aspect_for_appearance(const string &name)
{
    static const Aspect lit[] = {Aspect::RED, Aspect::GREEN,
        Aspect::FLASH_RED, Aspect::FLASH_GREEN};
    for (Aspect a : lit)
    {
        if (name == aspect_name(a))
        {
            return a;
        }
    }
    return Aspect::DARK;
}

void SignalHeadBinding::on_appearance(
    SignalHeadEntity *head, const string &old_name, const string &new_name)
{
    Aspect aspect = aspect_for_appearance(new_name);
    string msg = format_signal_head(name_.headId, name_.boardAddress,
        name_.redPin, name_.greenPin, aspect);
    if (router_->send_to(name_.endpoint.alias(), msg))
    {
        ++sent_;
        return;
    }
    LOG_ERROR("Signal head %s: could not send %s",
        head->system_name().c_str(), msg.c_str());
}

bool SensorBinding::send_registration(const string &alias, int gpio)
{
    return router_->send_to(alias, format_sensor_register(gpio));
}

bool SensorBinding::add_sensor(SensorEntity *sensor, const SensorName &name)
{
    string alias = name.endpoint.alias();
    {
        OSMutexLock l(&lock_);
        sensors_[Key(alias, name.gpio)] = sensor;
    }
    sensor->set_known_state(SensorState::INCONSISTENT);
    sensor->set_known_state(SensorState::UNKNOWN);
    if (!send_registration(alias, name.gpio))
    {
        LOG_ERROR("Sensor %s: registration not sent",
            sensor->system_name().c_str());
        return false;
    }
    return true;
}

unsigned SensorBinding::register_endpoint(const string &alias)
{
    std::vector<int> gpios;
    {
        OSMutexLock l(&lock_);
        for (auto &kv : sensors_)
        {
            if (kv.first.first == alias)
            {
                gpios.push_back(kv.first.second);
            }
        }
    }
    unsigned sent = 0;
    for (int gpio : gpios)
    {
        if (send_registration(alias, gpio))
        {
            ++sent;
        }
        else
        {
            LOG_ERROR("Sensor %d on %s: registration not sent", gpio,
                alias.c_str());
        }
    }
    return sent;
}

const char *SensorBinding::handle_command(const Command &cmd, FrameSink *reply)
{
    if (cmd.type != Command::SENSOR_REPORT)
    {
        return reason::UNSUPPORTED;
    }
    const string &alias = reply->name();
    SensorEntity *sensor = nullptr;
    {
        OSMutexLock l(&lock_);
        auto it = sensors_.find(Key(alias, cmd.gpio));
        if (it != sensors_.end())
        {
            sensor = it->second;
        }
    }
    if (!sensor && layout_)
    {
        sensor = layout_->sensor(NameParser::sensor_lookup_name(cmd.gpio, alias));
    }
    if (!sensor)
    {
        LOG(WARNING, "Report for unknown sensor %s",
            NameParser::sensor_lookup_name(cmd.gpio, alias).c_str());
        return reason::UNKNOWN_SENSOR;
    }
    sensor->set_known_state(
        cmd.level ? SensorState::ACTIVE : SensorState::INACTIVE);
    return nullptr;
}

} // namespace railnet
