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
 * \file drivers/MCP23017.cxx
 *
 * Implementation of the MCP23017 output bank.
 *
 * @date 5 March 2024
 */

#include "drivers/MCP23017.hxx"

#include "utils/logging.h"

constexpr unsigned MCP23017::NUM_PINS;
constexpr uint8_t MCP23017::BASE_ADDRESS;

bool MCP23017Gpio::write(Value new_state)
{
    return parent_->write_pin(pin_, new_state == SET);
}

Gpio::Value MCP23017Gpio::read()
{
    return parent_->latched(pin_) ? SET : CLR;
}

MCP23017::MCP23017(I2CBus *bus, uint8_t address)
    : bus_(bus)
    , address_(address)
{
    lat_[0] = lat_[1] = 0;
    for (unsigned i = 0; i < NUM_PINS; ++i)
    {
        pins_[i].parent_ = this;
        pins_[i].pin_ = i;
    }
}

bool MCP23017::init()
{
    OSMutexLock l(&lock_);
    lat_[0] = lat_[1] = 0;
    // Latches first so the pins come up low once they turn into outputs.
    if (!bus_->register_write(address_, OLATA, lat_, 2))
    {
        return false;
    }
    const uint8_t dir[2] = {0, 0};
    if (!bus_->register_write(address_, IODIRA, dir, 2))
    {
        return false;
    }
    LOG(INFO, "MCP23017 at 0x%02x: 16 outputs low", address_);
    return true;
}

bool MCP23017::write_pin(unsigned index, bool value)
{
    HASSERT(index < NUM_PINS);
    unsigned port = index / 8;
    uint8_t bit = 1 << (index % 8);
    OSMutexLock l(&lock_);
    uint8_t lat = value ? (lat_[port] | bit) : (lat_[port] & ~bit);
    if (!bus_->register_write(address_, port ? OLATB : OLATA, &lat, 1))
    {
        return false;
    }
    lat_[port] = lat;
    return true;
}

bool MCP23017::latched(unsigned index)
{
    HASSERT(index < NUM_PINS);
    OSMutexLock l(&lock_);
    return lat_[index / 8] & (1 << (index % 8));
}
