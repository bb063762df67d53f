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
 * \file railnet/SensorReporter.cxx
 *
 * Implementation of the sensor reporter.
 *
 * @date 7 March 2024
 */

#include "railnet/SensorReporter.hxx"

#include <vector>

#include "utils/logging.h"

namespace railnet
{

SensorReporter::SensorReporter(
    HardwareProvider *hw, long long period, unsigned debounce)
    : hw_(hw)
    , period_(period)
    , debounce_(debounce)
    , exit_(false)
{
    HASSERT(hw_);
    HASSERT(debounce_ > 0);
}

SensorReporter::~SensorReporter()
{
    stop();
}

void SensorReporter::start()
{
    HASSERT(!is_started());
    exit_ = false;
    OSThread::start("sensors", 0, 0);
}

void SensorReporter::stop()
{
    if (!is_started())
    {
        return;
    }
    exit_ = true;
    wakeup_.post();
    join();
}

void *SensorReporter::entry()
{
    while (!exit_)
    {
        poll_once();
        wakeup_.timedwait(period_);
    }
    return nullptr;
}

void SensorReporter::report(int gpio, bool level, FrameSink *sink)
{
    if (!sink)
    {
        return;
    }
    LOG(VERBOSE, "Sensor %d %s", gpio, level ? "asserted" : "deasserted");
    if (!sink->send(format_sensor_report(gpio, level)))
    {
        LOG(WARNING, "Sensor %d: report to %s not sent", gpio,
            sink->name().c_str());
    }
}

const char *SensorReporter::register_sensor(int gpio, FrameSink *sink)
{
    bool level;
    {
        OSMutexLock l(&lock_);
        auto it = sensors_.find(gpio);
        if (it == sensors_.end())
        {
            std::unique_ptr<Gpio> pin = hw_->create_input(gpio);
            if (!pin)
            {
                LOG_ERROR("Could not configure GPIO %d as input", gpio);
                return reason::INPUT_INIT_FAILED;
            }
            std::unique_ptr<Sensor> s(new Sensor(std::move(pin), debounce_));
            it = sensors_.insert(std::make_pair(gpio, std::move(s))).first;
            LOG(INFO, "Sensor %d registered", gpio);
        }
        Sensor *s = it->second.get();
        s->sink = sink;
        level = s->pin->is_set();
        s->debouncer.initialize(level);
    }
    report(gpio, level, sink);
    return nullptr;
}

const char *SensorReporter::handle_command(const Command &cmd, FrameSink *reply)
{
    HASSERT(cmd.type == Command::SENSOR_REGISTER);
    return register_sensor(cmd.gpio, reply);
}

void SensorReporter::poll_once()
{
    struct Edge
    {
        int gpio;
        bool level;
        FrameSink *sink;
    };
    std::vector<Edge> edges;
    {
        OSMutexLock l(&lock_);
        for (auto &kv : sensors_)
        {
            Sensor *s = kv.second.get();
            if (s->debouncer.update_state(s->pin->is_set()))
            {
                edges.push_back({kv.first, s->debouncer.current_state(),
                    s->sink});
            }
        }
    }
    for (const auto &e : edges)
    {
        report(e.gpio, e.level, e.sink);
    }
}

bool SensorReporter::level(int gpio, bool *level)
{
    OSMutexLock l(&lock_);
    auto it = sensors_.find(gpio);
    if (it == sensors_.end())
    {
        return false;
    }
    *level = it->second->debouncer.current_state();
    return true;
}

size_t SensorReporter::sensor_count()
{
    OSMutexLock l(&lock_);
    return sensors_.size();
}

} // namespace railnet
