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
 * \file railnet/LinuxHardware.hxx
 *
 * HardwareProvider for a Linux single board computer: PCA9685 servo
 * boards and MCP23017 extenders on one I2C bus, sensors on sysfs GPIO.
 *
 * @date 6 March 2024
 */

#ifndef _RAILNET_LINUXHARDWARE_HXX_
#define _RAILNET_LINUXHARDWARE_HXX_

#include <string>

#include "drivers/I2CBus.hxx"
#include "drivers/PCA9685.hxx"
#include "railnet/Hardware.hxx"

namespace railnet
{

/** Servo board built on a PCA9685 running at 50 Hz.
 */
class PCA9685Servo : public ServoController
{
public:
    /// PWM frequency of hobby servos.
    static constexpr uint16_t SERVO_FREQ = 50;
    /// Pulse width at 0 degrees.
    static constexpr long long MIN_PULSE_NSEC = 500000;
    /// Pulse width at 180 degrees.
    static constexpr long long MAX_PULSE_NSEC = 2500000;

    /** Constructor.
     * @param bus bus the board is attached to, not owned
     * @param address 7-bit I2C address
     */
    PCA9685Servo(I2CBus *bus, uint8_t address)
        : pwm_(bus, address)
    {
    }

    /// @return false if the board did not respond.
    bool init()
    {
        return pwm_.init(SERVO_FREQ);
    }

    bool set_angle(unsigned channel, int degrees) override;

    /** Converts an angle into PWM counts.
     * @param degrees angle, clamped to 0..180
     * @return on-time in counts of a 4096 count period
     */
    static uint16_t angle_to_counts(int degrees);

private:
    PCA9685 pwm_;
};

/** Production HardwareProvider.
 */
class LinuxHardware : public HardwareProvider
{
public:
    /** Constructor.
     * @param i2c_path device node of the I2C bus
     * @param servo_base I2C address of servo board 0
     */
    LinuxHardware(const string &i2c_path, int servo_base)
        : i2cPath_(i2c_path)
        , servoBase_(servo_base)
    {
    }

    std::unique_ptr<ServoController> create_servo_controller(
        int board) override;

    std::unique_ptr<GpioBank> create_gpio_extender(int address) override;

    std::unique_ptr<Gpio> create_input(int gpio) override;

private:
    /// Opens the bus on first use. @return false if it can not be opened.
    bool ensure_bus();

    OSMutex lock_;
    string i2cPath_;
    int servoBase_;
    I2CBus bus_;
};

} // namespace railnet

#endif // _RAILNET_LINUXHARDWARE_HXX_
