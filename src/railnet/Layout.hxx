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
 * \file railnet/Layout.hxx
 *
 * Entities of the layout control application on the origin host, and
 * the change notifications the railnet bindings subscribe to.
 *
 * @date 9 March 2024
 */

#ifndef _RAILNET_LAYOUT_HXX_
#define _RAILNET_LAYOUT_HXX_

#include <string>
#include <vector>

#include "utils/macros.h"

namespace railnet
{

/** Commanded state of a turnout. */
enum class TurnoutState
{
    UNKNOWN,
    CLOSED,
    THROWN,
};

/** Known state of a sensor. */
enum class SensorState
{
    UNKNOWN,
    INCONSISTENT,
    ACTIVE,
    INACTIVE,
};

/// @return printable name of a turnout state.
const char *turnout_state_name(TurnoutState state);

/// @return printable name of a sensor state.
const char *sensor_state_name(SensorState state);

class TurnoutEntity;
class SensorEntity;
class SignalHeadEntity;

/** Subscriber to turnout changes. */
class TurnoutListener
{
public:
    virtual ~TurnoutListener()
    {
    }

    /** The commanded state changed. Called on the thread that changed it.
     * @param turnout the turnout
     * @param old_state state before the change
     * @param new_state state after the change
     */
    virtual void on_commanded_state(TurnoutEntity *turnout,
        TurnoutState old_state, TurnoutState new_state) = 0;
};

/** Subscriber to sensor changes. */
class SensorListener
{
public:
    virtual ~SensorListener()
    {
    }

    /** The known state changed. Called on the thread that changed it.
     * @param sensor the sensor
     * @param old_state state before the change
     * @param new_state state after the change
     */
    virtual void on_known_state(SensorEntity *sensor, SensorState old_state,
        SensorState new_state) = 0;
};

/** Subscriber to signal head changes. */
class SignalHeadListener
{
public:
    virtual ~SignalHeadListener()
    {
    }

    /** The appearance changed. Called on the thread that changed it.
     * @param head the signal head
     * @param old_name appearance name before the change
     * @param new_name appearance name after the change
     */
    virtual void on_appearance(SignalHeadEntity *head, const string &old_name,
        const string &new_name) = 0;
};

/** A turnout of the layout model. Setting a different state notifies the
 * listeners; setting the same state does not. */
class TurnoutEntity
{
public:
    virtual ~TurnoutEntity()
    {
    }

    /// @return the name that encodes the turnout's address.
    virtual const string &system_name() = 0;
    /// @return the commanded state.
    virtual TurnoutState commanded_state() = 0;
    /// Changes the commanded state.
    virtual void set_commanded_state(TurnoutState state) = 0;
    /// Subscribes a listener, not owned.
    virtual void add_listener(TurnoutListener *l) = 0;
    /// Unsubscribes a listener.
    virtual void remove_listener(TurnoutListener *l) = 0;
};

/** A sensor of the layout model. */
class SensorEntity
{
public:
    virtual ~SensorEntity()
    {
    }

    /// @return the name that encodes the sensor's address.
    virtual const string &system_name() = 0;
    /// @return the known state.
    virtual SensorState known_state() = 0;
    /// Changes the known state.
    virtual void set_known_state(SensorState state) = 0;
    /// Subscribes a listener, not owned.
    virtual void add_listener(SensorListener *l) = 0;
    /// Unsubscribes a listener.
    virtual void remove_listener(SensorListener *l) = 0;
};

/** A signal head of the layout model. Appearances are named ("Red",
 * "Flashing Green", ...). */
class SignalHeadEntity
{
public:
    virtual ~SignalHeadEntity()
    {
    }

    /// @return the name that encodes the head's address.
    virtual const string &system_name() = 0;
    /// @return the current appearance name.
    virtual string appearance() = 0;
    /// Changes the appearance.
    virtual void set_appearance(const string &name) = 0;
    /// Subscribes a listener, not owned.
    virtual void add_listener(SignalHeadListener *l) = 0;
    /// Unsubscribes a listener.
    virtual void remove_listener(SignalHeadListener *l) = 0;
};

/** Lookup of the layout entities by system name. */
class LayoutModel
{
public:
    virtual ~LayoutModel()
    {
    }

    /// @return the turnout with that name, or nullptr.
    virtual TurnoutEntity *turnout(const string &system_name) = 0;
    /// @return the sensor with that name, or nullptr.
    virtual SensorEntity *sensor(const string &system_name) = 0;
    /// @return the signal head with that name, or nullptr.
    virtual SignalHeadEntity *signal_head(const string &system_name) = 0;

    /// @return every turnout.
    virtual std::vector<TurnoutEntity *> turnouts() = 0;
    /// @return every sensor.
    virtual std::vector<SensorEntity *> sensors() = 0;
    /// @return every signal head.
    virtual std::vector<SignalHeadEntity *> signal_heads() = 0;
};

} // namespace railnet

#endif // _RAILNET_LAYOUT_HXX_
