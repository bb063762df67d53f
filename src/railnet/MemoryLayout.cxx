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
 * \file railnet/MemoryLayout.cxx
 *
 * Implementation of the in-memory layout model.
 *
 * @date 9 March 2024
 */

#include "railnet/MemoryLayout.hxx"

#include <ctype.h>
#include <stdio.h>
#include <string.h>

#include "utils/logging.h"

namespace railnet
{

TurnoutState MemoryTurnout::commanded_state()
{
    OSMutexLock l(&lock_);
    return state_;
}

void MemoryTurnout::set_commanded_state(TurnoutState state)
{
    TurnoutState old;
    {
        OSMutexLock l(&lock_);
        old = state_;
        if (old == state)
        {
            return;
        }
        state_ = state;
    }
    for (auto *l : listeners_.snapshot())
    {
        l->on_commanded_state(this, old, state);
    }
}

SensorState MemorySensor::known_state()
{
    OSMutexLock l(&lock_);
    return state_;
}

void MemorySensor::set_known_state(SensorState state)
{
    SensorState old;
    {
        OSMutexLock l(&lock_);
        old = state_;
        if (old == state)
        {
            return;
        }
        state_ = state;
    }
    for (auto *l : listeners_.snapshot())
    {
        l->on_known_state(this, old, state);
    }
}

string MemorySignalHead::appearance()
{
    OSMutexLock l(&lock_);
    return appearance_;
}

void MemorySignalHead::set_appearance(const string &name)
{
    string old;
    {
        OSMutexLock l(&lock_);
        old = appearance_;
        if (old == name)
        {
            return;
        }
        appearance_ = name;
    }
    for (auto *l : listeners_.snapshot())
    {
        l->on_appearance(this, old, name);
    }
}

bool MemoryLayout::add_entity(const string &system_name)
{
    if (system_name.size() < 4)
    {
        LOG(WARNING, "Layout: unrecognized entity name [%s]",
            system_name.c_str());
        return false;
    }
    string prefix = system_name.substr(0, 3);
    for (auto &c : prefix)
    {
        c = toupper((unsigned char)c);
    }
    OSMutexLock l(&lock_);
    if (prefix == "IT.")
    {
        if (turnouts_.count(system_name))
        {
            return false;
        }
        turnouts_[system_name].reset(new MemoryTurnout(system_name));
        return true;
    }
    if (prefix == "IS.")
    {
        if (sensors_.count(system_name))
        {
            return false;
        }
        sensors_[system_name].reset(new MemorySensor(system_name));
        return true;
    }
    if (prefix == "IH.")
    {
        if (heads_.count(system_name))
        {
            return false;
        }
        heads_[system_name].reset(new MemorySignalHead(system_name));
        return true;
    }
    LOG(WARNING, "Layout: unrecognized entity name [%s]", system_name.c_str());
    return false;
}

bool MemoryLayout::load_file(const string &path)
{
    FILE *f = fopen(path.c_str(), "r");
    if (!f)
    {
        LOG_ERROR("Layout: cannot open %s: %s", path.c_str(), strerror(errno));
        return false;
    }
    char line[256];
    unsigned count = 0;
    while (fgets(line, sizeof(line), f))
    {
        string s(line);
        size_t b = s.find_first_not_of(" \t\r\n");
        if (b == string::npos || s[b] == '#')
        {
            continue;
        }
        size_t e = s.find_last_not_of(" \t\r\n");
        if (add_entity(s.substr(b, e - b + 1)))
        {
            ++count;
        }
    }
    fclose(f);
    LOG(INFO, "Layout: %u entities loaded from %s", count, path.c_str());
    return true;
}

TurnoutEntity *MemoryLayout::turnout(const string &system_name)
{
    OSMutexLock l(&lock_);
    auto it = turnouts_.find(system_name);
    return it == turnouts_.end() ? nullptr : it->second.get();
}

SensorEntity *MemoryLayout::sensor(const string &system_name)
{
    OSMutexLock l(&lock_);
    auto it = sensors_.find(system_name);
    return it == sensors_.end() ? nullptr : it->second.get();
}

SignalHeadEntity *MemoryLayout::signal_head(const string &system_name)
{
    OSMutexLock l(&lock_);
    auto it = heads_.find(system_name);
    return it == heads_.end() ? nullptr : it->second.get();
}

std::vector<TurnoutEntity *> MemoryLayout::turnouts()
{
    OSMutexLock l(&lock_);
    std::vector<TurnoutEntity *> out;
    for (auto &kv : turnouts_)
    {
        out.push_back(kv.second.get());
    }
    return out;
}

std::vector<SensorEntity *> MemoryLayout::sensors()
{
    OSMutexLock l(&lock_);
    std::vector<SensorEntity *> out;
    for (auto &kv : sensors_)
    {
        out.push_back(kv.second.get());
    }
    return out;
}

std::vector<SignalHeadEntity *> MemoryLayout::signal_heads()
{
    OSMutexLock l(&lock_);
    std::vector<SignalHeadEntity *> out;
    for (auto &kv : heads_)
    {
        out.push_back(kv.second.get());
    }
    return out;
}

} // namespace railnet
