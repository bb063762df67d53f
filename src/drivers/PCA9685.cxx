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
 * \file drivers/PCA9685.cxx
 *
 * Implementation of the PCA9685 driver.
 *
 * @date 5 March 2024
 */

#include "drivers/PCA9685.hxx"

#include "os/OS.hxx"
#include "utils/logging.h"

constexpr unsigned PCA9685::NUM_CHANNELS;
constexpr unsigned PCA9685::MAX_PWM_COUNTS;
constexpr uint8_t PCA9685::BASE_ADDRESS;
constexpr uint32_t PCA9685::CLOCK_FREQ;

bool PCA9685::init(uint16_t pwm_freq)
{
    HASSERT(pwm_freq > 0 && pwm_freq < (CLOCK_FREQ / (4096 * 4)));

    uint8_t mode1 = MODE1_AI | MODE1_SLEEP;
    if (!bus_->register_write(address_, MODE1, &mode1, 1))
    {
        return false;
    }

    uint8_t prescaler = (CLOCK_FREQ / (4096 * (uint32_t)pwm_freq)) - 1;
    if (!bus_->register_write(address_, PRE_SCALE, &prescaler, 1))
    {
        return false;
    }

    mode1 = MODE1_AI;
    if (!bus_->register_write(address_, MODE1, &mode1, 1))
    {
        return false;
    }
    // oscillator start-up time
    OSThread::sleep_nsec(MSEC_TO_NSEC(1));

    uint8_t mode2 = MODE2_OUTDRV | MODE2_OCH;
    if (!bus_->register_write(address_, MODE2, &mode2, 1))
    {
        return false;
    }
    pwmFreq_ = pwm_freq;
    LOG(INFO, "PCA9685 at 0x%02x: %u Hz, prescaler %u", address_, pwm_freq,
        prescaler);
    return true;
}

bool PCA9685::write_pwm_duty(unsigned channel, uint16_t counts)
{
    HASSERT(channel < NUM_CHANNELS);
    uint16_t on = 0;
    uint16_t off = 0;
    if (counts >= MAX_PWM_COUNTS)
    {
        on = 0x1000;
    }
    else if (counts == 0)
    {
        off = 0x1000;
    }
    else
    {
        // the "256" count offset is to help average the current accross
        // all 16 channels when the duty cycle is low
        on = (channel * 256);
        off = (counts + (channel * 256)) % 0x1000;
    }
    uint8_t data[4] = {(uint8_t)(on & 0xFF), (uint8_t)(on >> 8),
        (uint8_t)(off & 0xFF), (uint8_t)(off >> 8)};
    return bus_->register_write(address_, LED0_ON_L + (channel * 4), data, 4);
}
