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
 * \file logging.cxx
 *
 * Default log sink: timestamped lines on stderr.
 *
 * @date 2 March 2024
 */

#include "utils/logging.h"

#include <stdlib.h>
#include <time.h>

char logbuffer[1024];

pthread_mutex_t g_log_mutex = PTHREAD_MUTEX_INITIALIZER;

int g_log_level = INFO;

void set_log_level(int level)
{
    if (level < FATAL)
    {
        level = FATAL;
    }
    if (level > VERBOSE)
    {
        level = VERBOSE;
    }
    g_log_level = level;
}

__attribute__((weak)) void log_output(char *buf, int size)
{
    if (size <= 0)
    {
        return;
    }
    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);
    fprintf(stderr, "%5ld.%03ld: ", (long)ts.tv_sec, ts.tv_nsec / 1000000);
    fwrite(buf, size, 1, stderr);
    fwrite("\n", 1, 1, stderr);
}

void print_errno_and_exit(const char *where)
{
    int err = errno;
    LOG(FATAL, "%s: %s", where, strerror(err));
    exit(1);
}
