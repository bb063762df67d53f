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
 * \file os/LinuxGpio.hxx
 *
 * GPIO pins selected at runtime, using the Linux sysfs ABI.
 *
 * The process needs write access to /sys/class/gpio (usually membership
 * in the gpio group).
 *
 * @date 5 March 2024
 */

#ifndef _OS_LINUXGPIO_HXX_
#define _OS_LINUXGPIO_HXX_

#include <memory>

#include "os/Gpio.hxx"

/** One sysfs GPIO line. Create through open_input() or open_output().
 */
class LinuxGpio : public Gpio
{
public:
    ~LinuxGpio();

    /** Exports a pin and configures it as an input.
     * @param pin kernel GPIO number
     * @param active_low true if grounding the line means SET
     * @return the pin, or nullptr if the pin could not be configured
     */
    static std::unique_ptr<LinuxGpio> open_input(int pin, bool active_low);

    /** Exports a pin and configures it as an output, initially clear.
     * @param pin kernel GPIO number
     * @return the pin, or nullptr if the pin could not be configured
     */
    static std::unique_ptr<LinuxGpio> open_output(int pin);

    bool write(Value new_state) override;

    Value read() override;

    Direction direction() override
    {
        return direction_;
    }

    /// @return kernel GPIO number.
    int number()
    {
        return pin_;
    }

private:
    LinuxGpio(int pin, Direction dir, int value_fd)
        : pin_(pin)
        , direction_(dir)
        , valueFd_(value_fd)
    {
    }

    /** Exports the pin and writes its direction and polarity.
     * @return fd of the value file, or -1
     */
    static int setup(int pin, const char *dir, bool active_low);

    int pin_;
    Direction direction_;
    /// open fd of /sys/class/gpio/gpioN/value
    int valueFd_;

    DISALLOW_COPY_AND_ASSIGN(LinuxGpio);
};

#endif // _OS_LINUXGPIO_HXX_
