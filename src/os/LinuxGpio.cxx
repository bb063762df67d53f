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
 * \file os/LinuxGpio.cxx
 *
 * Implementation of the sysfs GPIO pins.
 *
 * @date 5 March 2024
 */

#include "os/LinuxGpio.hxx"

#include <errno.h>
#include <fcntl.h>
#include <stdio.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include "utils/logging.h"

namespace
{

/// Writes a short string to a sysfs attribute file.
bool write_attribute(const char *path, const char *value)
{
    int fd = ::open(path, O_WRONLY);
    if (fd < 0)
    {
        LOG(WARNING, "LinuxGpio: cannot open %s: %s", path, strerror(errno));
        return false;
    }
    size_t len = strlen(value);
    bool ok = ::write(fd, value, len) == (ssize_t)len;
    if (!ok)
    {
        LOG(WARNING, "LinuxGpio: cannot write %s: %s", path, strerror(errno));
    }
    ::close(fd);
    return ok;
}

} // namespace

LinuxGpio::~LinuxGpio()
{
    if (valueFd_ >= 0)
    {
        ::close(valueFd_);
    }
}

int LinuxGpio::setup(int pin, const char *dir, bool active_low)
{
    char path[64];
    snprintf(path, sizeof(path), "/sys/class/gpio/gpio%d", pin);
    struct stat st;
    if (::stat(path, &st) != 0)
    {
        char num[16];
        snprintf(num, sizeof(num), "%d", pin);
        if (!write_attribute("/sys/class/gpio/export", num))
        {
            return -1;
        }
    }
    snprintf(path, sizeof(path), "/sys/class/gpio/gpio%d/direction", pin);
    if (!write_attribute(path, dir))
    {
        return -1;
    }
    snprintf(path, sizeof(path), "/sys/class/gpio/gpio%d/active_low", pin);
    if (!write_attribute(path, active_low ? "1" : "0"))
    {
        return -1;
    }
    snprintf(path, sizeof(path), "/sys/class/gpio/gpio%d/value", pin);
    int fd = ::open(path, O_RDWR);
    if (fd < 0)
    {
        LOG(WARNING, "LinuxGpio: cannot open %s: %s", path, strerror(errno));
    }
    return fd;
}

std::unique_ptr<LinuxGpio> LinuxGpio::open_input(int pin, bool active_low)
{
    int fd = setup(pin, "in", active_low);
    if (fd < 0)
    {
        return nullptr;
    }
    return std::unique_ptr<LinuxGpio>(new LinuxGpio(pin, DINPUT, fd));
}

std::unique_ptr<LinuxGpio> LinuxGpio::open_output(int pin)
{
    int fd = setup(pin, "low", false);
    if (fd < 0)
    {
        return nullptr;
    }
    return std::unique_ptr<LinuxGpio>(new LinuxGpio(pin, DOUTPUT, fd));
}

bool LinuxGpio::write(Value new_state)
{
    if (direction_ != DOUTPUT)
    {
        return false;
    }
    const char *v = new_state == SET ? "1" : "0";
    if (::pwrite(valueFd_, v, 1, 0) != 1)
    {
        LOG(WARNING, "LinuxGpio::write(): cannot set value of pin (%d): %s",
            pin_, strerror(errno));
        return false;
    }
    return true;
}

Gpio::Value LinuxGpio::read()
{
    char c = '0';
    if (::pread(valueFd_, &c, 1, 0) != 1)
    {
        LOG(WARNING, "LinuxGpio::read(): cannot read value of pin (%d): %s",
            pin_, strerror(errno));
        return CLR;
    }
    return c == '1' ? SET : CLR;
}
