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
 * \file railnet/SensorReporter.hxx
 *
 * Reports local sensor inputs to the peer that registered them.
 *
 * @date 7 March 2024
 */

#ifndef _RAILNET_SENSORREPORTER_HXX_
#define _RAILNET_SENSORREPORTER_HXX_

#include <atomic>
#include <map>
#include <memory>

#include "railnet/CommandDispatcher.hxx"
#include "railnet/Hardware.hxx"
#include "utils/Debouncer.hxx"

namespace railnet
{

/** Handles IN:<gpio> registrations. A registered input is reported once
 * right away, then on every debounced edge, to the sink that registered it.
 * Sampling runs on the reporter's own thread.
 */
class SensorReporter : public CommandHandler, private OSThread
{
public:
    /** Constructor.
     * @param hw creates the inputs, not owned
     * @param period sample period in nanoseconds
     * @param debounce equal samples needed before an edge is reported
     */
    SensorReporter(HardwareProvider *hw,
        long long period = Defs::SENSOR_POLL_PERIOD,
        unsigned debounce = Defs::SENSOR_DEBOUNCE_COUNT);

    ~SensorReporter();

    /// Starts the sampling thread.
    void start();

    /// Stops and joins the sampling thread.
    void stop();

    /** Configures an input (first time only) and reports its level.
     * @param gpio GPIO number
     * @param sink where this sensor's reports go, not owned
     * @return nullptr on success, else a reason token
     */
    const char *register_sensor(int gpio, FrameSink *sink);

    const char *handle_command(const Command &cmd, FrameSink *reply) override;

    /// Samples every input once and reports the debounced edges.
    void poll_once();

    /** Looks up the debounced level of a sensor.
     * @param gpio GPIO number
     * @param level receives the level
     * @return false if the sensor is not registered
     */
    bool level(int gpio, bool *level);

    /// @return number of registered sensors.
    size_t sensor_count();

private:
    /// One registered input.
    struct Sensor
    {
        Sensor(std::unique_ptr<Gpio> p, unsigned debounce)
            : pin(std::move(p))
            , debouncer(debounce)
        {
        }

        std::unique_ptr<Gpio> pin;
        QuiesceDebouncer debouncer;
        FrameSink *sink = nullptr;
    };

    void *entry() override;

    /// Sends one report, logging a failure.
    void report(int gpio, bool level, FrameSink *sink);

    HardwareProvider *hw_;
    long long period_;
    unsigned debounce_;
    OSMutex lock_;
    std::map<int, std::unique_ptr<Sensor>> sensors_;
    OSSem wakeup_;
    std::atomic<bool> exit_;

    DISALLOW_COPY_AND_ASSIGN(SensorReporter);
};

} // namespace railnet

#endif // _RAILNET_SENSORREPORTER_HXX_
