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
 * \file railnet/Hardware.hxx
 *
 * Interfaces through which the device controllers reach physical
 * peripherals. Tests substitute mocks.
 *
 * @date 6 March 2024
 */

#ifndef _RAILNET_HARDWARE_HXX_
#define _RAILNET_HARDWARE_HXX_

#include <memory>

#include "os/Gpio.hxx"

namespace railnet
{

/** One servo controller board.
 */
class ServoController
{
public:
    virtual ~ServoController()
    {
    }

    /** Moves a servo.
     * @param channel channel on this board
     * @param degrees angle, 0 through 180
     * @return false if the board rejected the write
     */
    virtual bool set_angle(unsigned channel, int degrees) = 0;
};

/** Creates the peripherals of the actuator host. Every call creates a new
 * object; callers keep each address at most once.
 */
class HardwareProvider
{
public:
    virtual ~HardwareProvider()
    {
    }

    /** Initializes a servo controller board.
     * @param board board index, counted from the first board address
     * @return the board, or nullptr if it could not be initialized
     */
    virtual std::unique_ptr<ServoController> create_servo_controller(
        int board) = 0;

    /** Initializes a GPIO extender with all pins output-low.
     * @param address I2C address of the extender
     * @return the extender, or nullptr if it could not be initialized
     */
    virtual std::unique_ptr<GpioBank> create_gpio_extender(int address) = 0;

    /** Configures a local GPIO as an active-low input with pull-up.
     * @param gpio GPIO number
     * @return the input, or nullptr if it could not be configured
     */
    virtual std::unique_ptr<Gpio> create_input(int gpio) = 0;
};

} // namespace railnet

#endif // _RAILNET_HARDWARE_HXX_
