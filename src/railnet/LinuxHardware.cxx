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
 * \file railnet/LinuxHardware.cxx
 *
 * Implementation of the Linux hardware provider.
 *
 * @date 6 March 2024
 */

#include "railnet/LinuxHardware.hxx"

#include "drivers/MCP23017.hxx"
#include "os/LinuxGpio.hxx"
#include "railnet/Defs.hxx"
#include "utils/logging.h"

namespace railnet
{

constexpr uint16_t PCA9685Servo::SERVO_FREQ;
constexpr long long PCA9685Servo::MIN_PULSE_NSEC;
constexpr long long PCA9685Servo::MAX_PULSE_NSEC;

uint16_t PCA9685Servo::angle_to_counts(int degrees)
{
    if (degrees < 0)
    {
        degrees = 0;
    }
    if (degrees > Defs::MAX_ANGLE)
    {
        degrees = Defs::MAX_ANGLE;
    }
    long long pulse = MIN_PULSE_NSEC +
        (MAX_PULSE_NSEC - MIN_PULSE_NSEC) * degrees / Defs::MAX_ANGLE;
    long long period = SEC_TO_NSEC(1) / SERVO_FREQ;
    return (uint16_t)((pulse * PCA9685::MAX_PWM_COUNTS + period / 2) / period);
}

bool PCA9685Servo::set_angle(unsigned channel, int degrees)
{
    if (channel >= PCA9685::NUM_CHANNELS)
    {
        return false;
    }
    return pwm_.write_pwm_duty(channel, angle_to_counts(degrees));
}

bool LinuxHardware::ensure_bus()
{
    OSMutexLock l(&lock_);
    if (bus_.is_open())
    {
        return true;
    }
    return bus_.open(i2cPath_.c_str());
}

std::unique_ptr<ServoController> LinuxHardware::create_servo_controller(
    int board)
{
    int address = servoBase_ + board;
    if (address > 0x7F || !ensure_bus())
    {
        return nullptr;
    }
    std::unique_ptr<PCA9685Servo> servo(new PCA9685Servo(&bus_, address));
    if (!servo->init())
    {
        LOG_ERROR("Servo board %d at 0x%02x did not respond", board, address);
        return nullptr;
    }
    return std::move(servo);
}

std::unique_ptr<GpioBank> LinuxHardware::create_gpio_extender(int address)
{
    if (!ensure_bus())
    {
        return nullptr;
    }
    std::unique_ptr<MCP23017> board(new MCP23017(&bus_, address));
    if (!board->init())
    {
        LOG_ERROR("GPIO extender at 0x%02x did not respond", address);
        return nullptr;
    }
    return std::move(board);
}

std::unique_ptr<Gpio> LinuxHardware::create_input(int gpio)
{
    return LinuxGpio::open_input(gpio, true);
}

} // namespace railnet
