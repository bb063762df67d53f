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
 * \file drivers/I2CBus.hxx
 *
 * Shared access to one Linux i2c-dev bus.
 *
 * @date 5 March 2024
 */

#ifndef _DRIVERS_I2CBUS_HXX_
#define _DRIVERS_I2CBUS_HXX_

#include <stdint.h>

#include "os/OS.hxx"

/** One I2C adapter opened through /dev/i2c-N. Transfers from different
 * threads and different devices are serialized.
 */
class I2CBus
{
public:
    I2CBus()
        : fd_(-1)
    {
    }

    ~I2CBus();

    /** Opens the adapter.
     * @param path device node, for example /dev/i2c-1
     * @return true on success
     */
    bool open(const char *path);

    /// @return true if open() succeeded.
    bool is_open()
    {
        return fd_ >= 0;
    }

    /** Writes one or more sequential registers.
     * @param address 7-bit device address
     * @param reg first register
     * @param data payload
     * @param len number of payload bytes, at most MAX_WRITE
     * @return true if the device acknowledged the transfer
     */
    bool register_write(
        uint8_t address, uint8_t reg, const uint8_t *data, uint16_t len);

    /** Reads one or more sequential registers.
     * @param address 7-bit device address
     * @param reg first register
     * @param data where the payload goes
     * @param len number of registers to read
     * @return true if the device acknowledged the transfer
     */
    bool register_read(uint8_t address, uint8_t reg, uint8_t *data, uint16_t len);

    /// Largest payload of one register_write().
    static constexpr uint16_t MAX_WRITE = 8;

private:
    OSMutex lock_;
    int fd_;

    DISALLOW_COPY_AND_ASSIGN(I2CBus);
};

#endif // _DRIVERS_I2CBUS_HXX_
