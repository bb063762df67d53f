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
 * \file drivers/PCA9685.hxx
 *
 * PCA9685 16-channel 12-bit PWM controller on a Linux I2C bus.
 *
 * @date 5 March 2024
 */

#ifndef _DRIVERS_PCA9685_HXX_
#define _DRIVERS_PCA9685_HXX_

#include <stdint.h>

#include "drivers/I2CBus.hxx"

/** Driver for one PCA9685. Duty cycles are written synchronously.
 */
class PCA9685
{
public:
    /// number of PWM channels supported by the PCA9685
    static constexpr unsigned NUM_CHANNELS = 16;

    /// number of PWM counts in one period
    static constexpr unsigned MAX_PWM_COUNTS = 4096;

    /// I2C address of the first device
    static constexpr uint8_t BASE_ADDRESS = 0x40;

    /** Constructor.
     * @param bus bus the chip is attached to, not owned
     * @param address 7-bit I2C address
     */
    PCA9685(I2CBus *bus, uint8_t address)
        : bus_(bus)
        , address_(address)
        , pwmFreq_(0)
    {
    }

    /** Programs the prescaler and wakes the oscillator.
     * @param pwm_freq target PWM frequency in Hz
     * @return false if the chip did not respond
     */
    bool init(uint16_t pwm_freq);

    /** Sets the duty cycle of one channel.
     * @param channel channel index (0 through 15)
     * @param counts on-time in counts, MAX_PWM_COUNTS or more for full on
     * @return false on bus error
     */
    bool write_pwm_duty(unsigned channel, uint16_t counts);

    /// @return the frequency given to init().
    uint16_t pwm_freq()
    {
        return pwmFreq_;
    }

    /// @return the I2C address.
    uint8_t address()
    {
        return address_;
    }

private:
    /// Important device register offsets
    enum Registers
    {
        MODE1 = 0, ///< mode 1 settings
        MODE2, ///< mode 2 settings

        LED0_ON_L = 6, ///< first LED control register

        PRE_SCALE = 254, ///< clock prescale divider
    };

    /// MODE1 bits
    enum
    {
        MODE1_SLEEP = 0x10, ///< oscillator off
        MODE1_AI = 0x20, ///< register auto increment
    };

    /// MODE2 bits
    enum
    {
        MODE2_OUTDRV = 0x04, ///< totem pole outputs
        MODE2_OCH = 0x08, ///< outputs change on ACK
    };

    /// internal oscillator frequency
    static constexpr uint32_t CLOCK_FREQ = 25000000;

    I2CBus *bus_;
    uint8_t address_;
    uint16_t pwmFreq_;

    DISALLOW_COPY_AND_ASSIGN(PCA9685);
};

#endif // _DRIVERS_PCA9685_HXX_
