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
 * \file drivers/I2CBus.cxx
 *
 * I2C_RDWR based register access.
 *
 * @date 5 March 2024
 */

#include "drivers/I2CBus.hxx"

#include <errno.h>
#include <fcntl.h>
#include <linux/i2c-dev.h>
#include <linux/i2c.h>
#include <string.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include "utils/logging.h"

constexpr uint16_t I2CBus::MAX_WRITE;

I2CBus::~I2CBus()
{
    if (fd_ >= 0)
    {
        ::close(fd_);
    }
}

bool I2CBus::open(const char *path)
{
    HASSERT(fd_ < 0);
    fd_ = ::open(path, O_RDWR);
    if (fd_ < 0)
    {
        LOG_ERROR("I2CBus: cannot open %s: %s", path, strerror(errno));
        return false;
    }
    return true;
}

bool I2CBus::register_write(
    uint8_t address, uint8_t reg, const uint8_t *data, uint16_t len)
{
    HASSERT(len <= MAX_WRITE);
    uint8_t dat[MAX_WRITE + 1];
    dat[0] = reg;
    memcpy(dat + 1, data, len);

    struct i2c_msg msgs[1];
    msgs[0].addr = address;
    msgs[0].flags = 0;
    msgs[0].len = (uint16_t)(len + 1);
    msgs[0].buf = dat;

    struct i2c_rdwr_ioctl_data ioctl_data;
    ioctl_data.msgs = msgs;
    ioctl_data.nmsgs = ARRAYSIZE(msgs);

    OSMutexLock l(&lock_);
    if (fd_ < 0 || ::ioctl(fd_, I2C_RDWR, &ioctl_data) < 0)
    {
        LOG(WARNING, "I2CBus: write 0x%02x reg 0x%02x failed: %s", address,
            reg, fd_ < 0 ? "bus not open" : strerror(errno));
        return false;
    }
    return true;
}

bool I2CBus::register_read(
    uint8_t address, uint8_t reg, uint8_t *data, uint16_t len)
{
    struct i2c_msg msgs[2];
    msgs[0].addr = address;
    msgs[0].flags = 0;
    msgs[0].len = 1;
    msgs[0].buf = &reg;
    msgs[1].addr = address;
    msgs[1].flags = I2C_M_RD;
    msgs[1].len = len;
    msgs[1].buf = data;

    struct i2c_rdwr_ioctl_data ioctl_data;
    ioctl_data.msgs = msgs;
    ioctl_data.nmsgs = ARRAYSIZE(msgs);

    OSMutexLock l(&lock_);
    if (fd_ < 0 || ::ioctl(fd_, I2C_RDWR, &ioctl_data) < 0)
    {
        LOG(WARNING, "I2CBus: read 0x%02x reg 0x%02x failed: %s", address,
            reg, fd_ < 0 ? "bus not open" : strerror(errno));
        return false;
    }
    return true;
}
