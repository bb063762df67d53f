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
 * \file railnet/railnet_test_helper.hxx
 *
 * Fakes and mocks shared by the railnet unittests.
 *
 * @date 16 March 2024
 */

#ifndef _RAILNET_RAILNET_TEST_HELPER_HXX_
#define _RAILNET_RAILNET_TEST_HELPER_HXX_

#include <atomic>
#include <map>
#include <memory>
#include <set>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "os/OS.hxx"
#include "railnet/Command.hxx"
#include "railnet/CommandDispatcher.hxx"
#include "railnet/EndpointRegistry.hxx"
#include "railnet/FrameSink.hxx"
#include "railnet/Hardware.hxx"

namespace railnet
{

/// Pin that remembers its value. Safe to use from a blink thread.
class FakeGpio : public Gpio
{
public:
    FakeGpio(Direction dir = DOUTPUT)
        : dir_(dir)
        , value_(false)
        , failWrites_(false)
        , writes_(0)
        , sets_(0)
    {
    }

    bool write(Value new_state) override
    {
        if (failWrites_)
        {
            return false;
        }
        value_ = new_state;
        ++writes_;
        if (new_state == SET)
        {
            ++sets_;
        }
        return true;
    }

    Value read() override
    {
        return value_ ? SET : CLR;
    }

    Direction direction() override
    {
        return dir_;
    }

    /// Drives an input pin from the test.
    void set_level(bool level)
    {
        value_ = level;
    }

    /// Makes every following write fail.
    void fail_writes(bool fail)
    {
        failWrites_ = fail;
    }

    /// @return number of successful writes.
    unsigned writes()
    {
        return writes_;
    }

    /// @return number of successful writes of SET.
    unsigned sets()
    {
        return sets_;
    }

private:
    Direction dir_;
    std::atomic<bool> value_;
    std::atomic<bool> failWrites_;
    std::atomic<unsigned> writes_;
    std::atomic<unsigned> sets_;
};

/// Sixteen FakeGpio outputs, like one GPIO extender.
class FakeGpioBank : public GpioBank
{
public:
    unsigned size() override
    {
        return 16;
    }

    Gpio *pin(unsigned index) override
    {
        return fake(index);
    }

    FakeGpio *fake(unsigned index)
    {
        HASSERT(index < 16);
        return &pins_[index];
    }

private:
    FakeGpio pins_[16];
};

/// Servo board that records the last angle of each channel.
class FakeServoController : public ServoController
{
public:
    bool set_angle(unsigned channel, int degrees) override
    {
        OSMutexLock l(&lock_);
        if (failWrites_)
        {
            return false;
        }
        angles_[channel] = degrees;
        ++writes_;
        return true;
    }

    /// @return last angle of a channel, -1 if never written.
    int angle(unsigned channel)
    {
        OSMutexLock l(&lock_);
        auto it = angles_.find(channel);
        return it == angles_.end() ? -1 : it->second;
    }

    /// @return number of successful writes.
    unsigned writes()
    {
        OSMutexLock l(&lock_);
        return writes_;
    }

    void fail_writes(bool fail)
    {
        OSMutexLock l(&lock_);
        failWrites_ = fail;
    }

private:
    OSMutex lock_;
    std::map<unsigned, int> angles_;
    unsigned writes_ = 0;
    bool failWrites_ = false;
};

/** Hardware provider that hands out fakes and keeps a pointer to each of
 * them for inspection. Must outlive the objects using its peripherals.
 */
class FakeHardware : public HardwareProvider
{
public:
    std::unique_ptr<ServoController> create_servo_controller(int board) override
    {
        OSMutexLock l(&lock_);
        ++servoCreates;
        if (failServoBoards.count(board))
        {
            return nullptr;
        }
        FakeServoController *s = new FakeServoController;
        servos[board] = s;
        return std::unique_ptr<ServoController>(s);
    }

    std::unique_ptr<GpioBank> create_gpio_extender(int address) override
    {
        OSMutexLock l(&lock_);
        ++extenderCreates;
        if (failExtenders.count(address))
        {
            return nullptr;
        }
        FakeGpioBank *b = new FakeGpioBank;
        extenders[address] = b;
        return std::unique_ptr<GpioBank>(b);
    }

    std::unique_ptr<Gpio> create_input(int gpio) override
    {
        OSMutexLock l(&lock_);
        ++inputCreates;
        if (failInputs.count(gpio))
        {
            return nullptr;
        }
        FakeGpio *p = new FakeGpio(Gpio::DINPUT);
        auto it = initialLevels.find(gpio);
        if (it != initialLevels.end())
        {
            p->set_level(it->second);
        }
        inputs[gpio] = p;
        return std::unique_ptr<Gpio>(p);
    }

    /// @return the servo board with that index, or nullptr.
    FakeServoController *servo(int board)
    {
        OSMutexLock l(&lock_);
        auto it = servos.find(board);
        return it == servos.end() ? nullptr : it->second;
    }

    /// @return the extender at that address, or nullptr.
    FakeGpioBank *extender(int address)
    {
        OSMutexLock l(&lock_);
        auto it = extenders.find(address);
        return it == extenders.end() ? nullptr : it->second;
    }

    /// @return the input of that GPIO, or nullptr.
    FakeGpio *input(int gpio)
    {
        OSMutexLock l(&lock_);
        auto it = inputs.find(gpio);
        return it == inputs.end() ? nullptr : it->second;
    }

    std::set<int> failServoBoards;
    std::set<int> failExtenders;
    std::set<int> failInputs;
    std::map<int, bool> initialLevels;

    unsigned servoCreates = 0;
    unsigned extenderCreates = 0;
    unsigned inputCreates = 0;

private:
    OSMutex lock_;
    std::map<int, FakeServoController *> servos;
    std::map<int, FakeGpioBank *> extenders;
    std::map<int, FakeGpio *> inputs;
};

/// FrameSink with a mocked send().
class MockFrameSink : public FrameSink
{
public:
    MockFrameSink(const string &name = "mock")
        : name_(name)
    {
    }

    MOCK_METHOD1(send, bool(const string &message));

    const string &name() override
    {
        return name_;
    }

private:
    string name_;
};

/// FrameSink that stores every message. Safe to use across threads.
class RecordingSink : public FrameSink
{
public:
    RecordingSink(const string &name = "recorder")
        : name_(name)
        , accept_(true)
    {
    }

    bool send(const string &message) override
    {
        if (!accept_)
        {
            return false;
        }
        OSMutexLock l(&lock_);
        messages_.push_back(message);
        return true;
    }

    const string &name() override
    {
        return name_;
    }

    /// Makes send() fail (false) or succeed (true).
    void accept(bool accept)
    {
        accept_ = accept;
    }

    /// @return a copy of the messages sent so far.
    std::vector<string> messages()
    {
        OSMutexLock l(&lock_);
        return messages_;
    }

    /// @return number of messages sent so far.
    size_t count()
    {
        OSMutexLock l(&lock_);
        return messages_.size();
    }

    /// @return the last message, or an empty string.
    string last()
    {
        OSMutexLock l(&lock_);
        return messages_.empty() ? string() : messages_.back();
    }

    void clear()
    {
        OSMutexLock l(&lock_);
        messages_.clear();
    }

private:
    string name_;
    std::atomic<bool> accept_;
    OSMutex lock_;
    std::vector<string> messages_;
};

class MockCommandHandler : public CommandHandler
{
public:
    MOCK_METHOD2(
        handle_command, const char *(const Command &cmd, FrameSink *reply));
};

class MockMessageRouter : public MessageRouter
{
public:
    MOCK_METHOD2(
        send_to, bool(const string &alias, const string &message));
};

/// Link listener that records frames and connection events.
class RecordingListener : public LinkListener
{
public:
    void on_frame(Link *link, const string &frame) override
    {
        OSMutexLock l(&lock_);
        frames_.push_back(frame);
    }

    void on_connected(Link *link) override
    {
        ++connects_;
    }

    void on_finished(Link *link) override
    {
        ++finished_;
    }

    std::vector<string> frames()
    {
        OSMutexLock l(&lock_);
        return frames_;
    }

    size_t frame_count()
    {
        OSMutexLock l(&lock_);
        return frames_.size();
    }

    unsigned connects()
    {
        return connects_;
    }

    unsigned finished()
    {
        return finished_;
    }

private:
    OSMutex lock_;
    std::vector<string> frames_;
    std::atomic<unsigned> connects_{0};
    std::atomic<unsigned> finished_{0};
};

/// Link parameters short enough for unittests.
inline LinkConfig test_link_config()
{
    LinkConfig cfg;
    cfg.connTimeout = MSEC_TO_NSEC(100);
    cfg.maxHeartbeatFail = 3;
    cfg.sendWait = MSEC_TO_NSEC(200);
    return cfg;
}

} // namespace railnet

#endif // _RAILNET_RAILNET_TEST_HELPER_HXX_
