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
 * \file drivers/MCP23017.hxx
 *
 * MCP23017 16-bit I2C I/O expander driven as a bank of outputs.
 *
 * @date 5 March 2024
 */

#ifndef _DRIVERS_MCP23017_HXX_
#define _DRIVERS_MCP23017_HXX_

#include <stdint.h>

#include "drivers/I2CBus.hxx"
#include "os/Gpio.hxx"
#include "os/OS.hxx"

class MCP23017;

/** One pin of an MCP23017. Writes go to the chip immediately.
 */
class MCP23017Gpio : public Gpio
{
public:
    MCP23017Gpio()
        : parent_(nullptr)
        , pin_(0)
    {
    }

    bool write(Value new_state) override;

    Value read() override;

    Direction direction() override
    {
        return DOUTPUT;
    }

private:
    friend class MCP23017;

    MCP23017 *parent_;
    uint8_t pin_;

    DISALLOW_COPY_AND_ASSIGN(MCP23017Gpio);
};

/** Driver for one MCP23017. All 16 pins are outputs.
 */
class MCP23017 : public GpioBank
{
public:
    /// Number of pins on the chip.
    static constexpr unsigned NUM_PINS = 16;

    /// I2C address of the first device.
    static constexpr uint8_t BASE_ADDRESS = 0x20;

    /** Constructor.
     * @param bus bus the chip is attached to, not owned
     * @param address 7-bit I2C address
     */
    MCP23017(I2CBus *bus, uint8_t address);

    /** Configures every pin as an output and drives it low.
     * @return false if the chip did not respond
     */
    bool init();

    unsigned size() override
    {
        return NUM_PINS;
    }

    Gpio *pin(unsigned index) override
    {
        HASSERT(index < NUM_PINS);
        return &pins_[index];
    }

    /** Changes one output latch.
     * @param index pin index
     * @param value new level
     * @return false on bus error; the shadow latch then keeps the old value
     */
    bool write_pin(unsigned index, bool value);

    /// @return the last latched level of a pin.
    bool latched(unsigned index);

    /// @return the I2C address.
    uint8_t address()
    {
        return address_;
    }

private:
    /// Important device register offsets
    enum Registers
    {
        IODIRA = 0x0,
        IODIRB = 0x1,
        OLATA = 0x14,
        OLATB = 0x15,
    };

    I2CBus *bus_;
    uint8_t address_;
    OSMutex lock_;
    /// Shadow of the latch registers, port A then port B.
    uint8_t lat_[2];
    MCP23017Gpio pins_[NUM_PINS];

    DISALLOW_COPY_AND_ASSIGN(MCP23017);
};

#endif // _DRIVERS_MCP23017_HXX_
