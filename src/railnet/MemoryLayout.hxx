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
 * \file railnet/MemoryLayout.hxx
 *
 * In-memory layout model, loaded from a list of entity names.
 *
 * @date 9 March 2024
 */

#ifndef _RAILNET_MEMORYLAYOUT_HXX_
#define _RAILNET_MEMORYLAYOUT_HXX_

#include <algorithm>
#include <map>
#include <memory>

#include "os/OS.hxx"
#include "railnet/Layout.hxx"

namespace railnet
{

/** Thread safe set of listeners of one entity.
 * @param L listener type
 */
template <class L> class ListenerList
{
public:
    /// Adds a listener once.
    void add(L *l)
    {
        OSMutexLock h(&lock_);
        if (std::find(listeners_.begin(), listeners_.end(), l) ==
            listeners_.end())
        {
            listeners_.push_back(l);
        }
    }

    /// Removes a listener.
    void remove(L *l)
    {
        OSMutexLock h(&lock_);
        listeners_.erase(
            std::remove(listeners_.begin(), listeners_.end(), l),
            listeners_.end());
    }

    /// @return a copy of the listeners, to notify without holding the lock.
    std::vector<L *> snapshot()
    {
        OSMutexLock h(&lock_);
        return listeners_;
    }

private:
    OSMutex lock_;
    std::vector<L *> listeners_;
};

/** Turnout kept in memory. */
class MemoryTurnout : public TurnoutEntity
{
public:
    MemoryTurnout(const string &name)
        : name_(name)
        , state_(TurnoutState::UNKNOWN)
    {
    }

    const string &system_name() override
    {
        return name_;
    }

    TurnoutState commanded_state() override;
    void set_commanded_state(TurnoutState state) override;

    void add_listener(TurnoutListener *l) override
    {
        listeners_.add(l);
    }

    void remove_listener(TurnoutListener *l) override
    {
        listeners_.remove(l);
    }

private:
    string name_;
    OSMutex lock_;
    TurnoutState state_;
    ListenerList<TurnoutListener> listeners_;
};

/** Sensor kept in memory. */
class MemorySensor : public SensorEntity
{
public:
    MemorySensor(const string &name)
        : name_(name)
        , state_(SensorState::UNKNOWN)
    {
    }

    const string &system_name() override
    {
        return name_;
    }

    SensorState known_state() override;
    void set_known_state(SensorState state) override;

    void add_listener(SensorListener *l) override
    {
        listeners_.add(l);
    }

    void remove_listener(SensorListener *l) override
    {
        listeners_.remove(l);
    }

private:
    string name_;
    OSMutex lock_;
    SensorState state_;
    ListenerList<SensorListener> listeners_;
};

/** Signal head kept in memory. Starts "Dark". */
class MemorySignalHead : public SignalHeadEntity
{
public:
    MemorySignalHead(const string &name)
        : name_(name)
        , appearance_("Dark")
    {
    }

    const string &system_name() override
    {
        return name_;
    }

    string appearance() override;
    void set_appearance(const string &name) override;

    void add_listener(SignalHeadListener *l) override
    {
        listeners_.add(l);
    }

    void remove_listener(SignalHeadListener *l) override
    {
        listeners_.remove(l);
    }

private:
    string name_;
    OSMutex lock_;
    string appearance_;
    ListenerList<SignalHeadListener> listeners_;
};

/** LayoutModel holding Memory* entities. Entity kinds are told apart by the
 * system name prefix: IT. turnouts, IS. sensors, IH. signal heads.
 */
class MemoryLayout : public LayoutModel
{
public:
    MemoryLayout()
    {
    }

    /** Adds an entity.
     * @param system_name name with a known prefix
     * @return false if the prefix is unknown or the name exists
     */
    bool add_entity(const string &system_name);

    /** Adds every entity listed in a file, one name per line. Blank lines
     * and lines starting with # are ignored.
     * @param path file to read
     * @return false if the file could not be read
     */
    bool load_file(const string &path);

    TurnoutEntity *turnout(const string &system_name) override;
    SensorEntity *sensor(const string &system_name) override;
    SignalHeadEntity *signal_head(const string &system_name) override;

    std::vector<TurnoutEntity *> turnouts() override;
    std::vector<SensorEntity *> sensors() override;
    std::vector<SignalHeadEntity *> signal_heads() override;

private:
    OSMutex lock_;
    std::map<string, std::unique_ptr<MemoryTurnout>> turnouts_;
    std::map<string, std::unique_ptr<MemorySensor>> sensors_;
    std::map<string, std::unique_ptr<MemorySignalHead>> heads_;

    DISALLOW_COPY_AND_ASSIGN(MemoryLayout);
};

} // namespace railnet

#endif // _RAILNET_MEMORYLAYOUT_HXX_
