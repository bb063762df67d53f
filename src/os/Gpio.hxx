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
 * \file os/Gpio.hxx
 *
 * Generic digital I/O pin and pin bank interfaces.
 *
 * @date 5 March 2024
 */

#ifndef _OS_GPIO_HXX_
#define _OS_GPIO_HXX_

#include "utils/macros.h"

/** One digital I/O pin. Values are logical: an active-low input reads SET
 * when its line is pulled to ground.
 */
class Gpio
{
public:
    /** Values representing the logical state of a pin */
    enum Value : bool
    {
        CLR = false, /**< pin is clear, in other words a '0' */
        SET = true, /**< pin is set, in other words a '1' */
    };

    /** Direction of a pin */
    enum Direction
    {
        DINPUT, /**< pin is an input */
        DOUTPUT, /**< pin is an output */
    };

    virtual ~Gpio()
    {
    }

    /** Sets the output state of the pin.
     * @param new_state state to set the pin to
     * @return false if the hardware rejected the write
     */
    virtual bool write(Value new_state) = 0;

    /** Reads the current state of the pin.
     * @return @ref SET if currently a logical '1', @ref CLR otherwise
     */
    virtual Value read() = 0;

    /// @return the direction the pin is configured for.
    virtual Direction direction() = 0;

    /// Sets the pin to a '1'. @return false on hardware error.
    bool set()
    {
        return write(SET);
    }

    /// Clears the pin to a '0'. @return false on hardware error.
    bool clr()
    {
        return write(CLR);
    }

    /// @return true if the pin reads as a '1'.
    bool is_set()
    {
        return read() == SET;
    }
};

/** A numbered set of pins, such as the ports of an I/O expander.
 */
class GpioBank
{
public:
    virtual ~GpioBank()
    {
    }

    /// @return number of pins in the bank.
    virtual unsigned size() = 0;

    /** Looks up one pin.
     * @param index pin index, must be less than size()
     * @return pin object owned by the bank
     */
    virtual Gpio *pin(unsigned index) = 0;
};

#endif // _OS_GPIO_HXX_
