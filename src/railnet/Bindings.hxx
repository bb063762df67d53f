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
 * \file railnet/Bindings.hxx
 *
 * Origin-side glue between layout entities and remote endpoints.
 *
 * A binding translates the state changes of one kind of layout entity
 * into frames for the endpoint named in the entity's system name, and
 * incoming sensor reports back into entity state.
 *
 * @date 11 March 2024
 */

#ifndef _RAILNET_BINDINGS_HXX_
#define _RAILNET_BINDINGS_HXX_

#include <atomic>
#include <map>
#include <utility>

#include "os/OS.hxx"
#include "railnet/CommandDispatcher.hxx"
#include "railnet/EndpointRegistry.hxx"
#include "railnet/Layout.hxx"
#include "railnet/NameParser.hxx"

namespace railnet
{

/** Forwards commanded-state changes of one turnout as OUT_TO frames. When a
 * frame can not be sent the turnout is put back to its previous state.
 */
class TurnoutBinding : public TurnoutListener
{
public:
    /** Constructor.
     * @param turnout layout entity, not owned
     * @param name decoded system name of the turnout
     * @param router delivers frames to the endpoint, not owned
     */
    TurnoutBinding(
        TurnoutEntity *turnout, const TurnoutName &name, MessageRouter *router)
        : turnout_(turnout)
        , name_(name)
        , router_(router)
        , rollback_(false)
        , lastSent_(TurnoutState::UNKNOWN)
        , sent_(0)
    {
    }

    ~TurnoutBinding()
    {
        detach();
    }

    /** Subscribes to the turnout and sends its current state. The turnout is
     * moved through UNKNOWN so that the current state registers as a change.
     * A state equal to the last one sent is not sent again, whether or not
     * the entity reports it as a change.
     */
    void attach();

    /// Unsubscribes from the turnout.
    void detach();

    void on_commanded_state(TurnoutEntity *turnout, TurnoutState old_state,
        TurnoutState new_state) override;

    /// @return number of frames sent successfully.
    unsigned sent_count()
    {
        return sent_;
    }

    /// @return the state last sent to the endpoint, UNKNOWN before any.
    TurnoutState last_sent()
    {
        return lastSent_;
    }

    /// @return the turnout.
    TurnoutEntity *turnout()
    {
        return turnout_;
    }

private:
    TurnoutEntity *turnout_;
    TurnoutName name_;
    MessageRouter *router_;
    /// true while a failed change is being undone
    std::atomic<bool> rollback_;
    /// last state the endpoint accepted
    std::atomic<TurnoutState> lastSent_;
    std::atomic<unsigned> sent_;
    bool attached_ = false;

    DISALLOW_COPY_AND_ASSIGN(TurnoutBinding);
};

/** Forwards appearance changes of one signal head as OUT_SH frames.
 */
class SignalHeadBinding : public SignalHeadListener
{
public:
    /** Constructor.
     * @param head layout entity, not owned
     * @param name decoded system name of the head
     * @param router delivers frames to the endpoint, not owned
     */
    SignalHeadBinding(
        SignalHeadEntity *head, const SignalHeadName &name,
        MessageRouter *router)
        : head_(head)
        , name_(name)
        , router_(router)
        , sent_(0)
    {
    }

    ~SignalHeadBinding()
    {
        detach();
    }

    /// Subscribes to the head.
    void attach();

    /// Unsubscribes from the head.
    void detach();

    void on_appearance(SignalHeadEntity *head, const string &old_name,
        const string &new_name) override;

    /** Maps an appearance name to an aspect. Green, Red, Flashing Red and
     * Flashing Green map to their aspect, anything else is DARK.
     */
    static Aspect aspect_for_appearance(const string &name);

    /// @return number of frames sent successfully.
    unsigned sent_count()
    {
        return sent_;
    }

    /// @return the signal head.
    SignalHeadEntity *head()
    {
        return head_;
    }

private:
    SignalHeadEntity *head_;
    SignalHeadName name_;
    MessageRouter *router_;
    std::atomic<unsigned> sent_;
    bool attached_ = false;

    DISALLOW_COPY_AND_ASSIGN(SignalHeadBinding);
};

/** Keeps the layout's sensors in sync with the reports of the endpoints.
 * Registered with the origin's CommandDispatcher for SENSOR_REPORT.
 */
class SensorBinding : public CommandHandler
{
public:
    /** Constructor.
     * @param router delivers registration frames, not owned
     * @param layout fallback lookup of reported sensors, not owned
     */
    SensorBinding(MessageRouter *router, LayoutModel *layout)
        : router_(router)
        , layout_(layout)
    {
    }

    /** Adds a sensor and asks its endpoint to watch the GPIO. The sensor is
     * INCONSISTENT while being set up and UNKNOWN until the first report.
     * @param sensor layout entity, not owned
     * @param name decoded system name of the sensor
     * @return false if the registration frame could not be sent
     */
    bool add_sensor(SensorEntity *sensor, const SensorName &name);

    /** Sends the registration of every sensor of an endpoint again. Used
     * after the endpoint reconnected.
     * @param alias endpoint alias
     * @return number of registrations sent
     */
    unsigned register_endpoint(const string &alias);

    const char *handle_command(const Command &cmd, FrameSink *reply) override;

    /// @return number of sensors added.
    size_t size()
    {
        OSMutexLock l(&lock_);
        return sensors_.size();
    }

private:
    typedef std::pair<string, int> Key;

    /// Sends the IN:<gpio> registration frame.
    bool send_registration(const string &alias, int gpio);

    MessageRouter *router_;
    LayoutModel *layout_;
    OSMutex lock_;
    /// (endpoint alias, gpio) -> sensor
    std::map<Key, SensorEntity *> sensors_;

    DISALLOW_COPY_AND_ASSIGN(SensorBinding);
};

} // namespace railnet

#endif // _RAILNET_BINDINGS_HXX_
