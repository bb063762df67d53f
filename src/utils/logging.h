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
 * \file logging.h
 *
 * Facility to do debug printf's on a configurable loglevel.
 *
 * The compile-time ceiling is LOGLEVEL; g_log_level filters further at
 * runtime. All output funnels through log_output(), which may be replaced
 * (it is a weak symbol) by tests.
 *
 * @date 2 March 2024
 */

#ifndef _UTILS_LOGGING_H_
#define _UTILS_LOGGING_H_

#include <inttypes.h>
#include <pthread.h>
#include <stdio.h>
#include <string.h>
#include <errno.h>

static const int FATAL = 0;
static const int ERROR = 1;
static const int WARNING = 2;
static const int INFO = 3;
static const int VERBOSE = 4;

extern pthread_mutex_t g_log_mutex;
#define LOCK_LOG pthread_mutex_lock(&g_log_mutex)
#define UNLOCK_LOG pthread_mutex_unlock(&g_log_mutex)

#ifdef __cplusplus
#define GLOBAL_LOG_OUTPUT ::log_output
#else
#define GLOBAL_LOG_OUTPUT log_output
#endif

#ifndef LOGLEVEL
#define LOGLEVEL VERBOSE
#endif // ifndef LOGLEVEL

/// Runtime log level. Messages above this level are dropped even if they
/// pass the compile-time LOGLEVEL check.
extern int g_log_level;

#define LOG(level, message...)                                                 \
    do                                                                         \
    {                                                                          \
        if (LOGLEVEL >= level && g_log_level >= level)                         \
        {                                                                      \
            LOCK_LOG;                                                          \
            int sret = snprintf(logbuffer, sizeof(logbuffer), message);        \
            if (sret >= (int)sizeof(logbuffer))                                \
                sret = sizeof(logbuffer) - 1;                                  \
            GLOBAL_LOG_OUTPUT(logbuffer, sret);                                \
            UNLOCK_LOG;                                                        \
        }                                                                      \
    } while (0)

#define LOG_ERROR(message...) LOG(ERROR, message)

extern char logbuffer[1024];

#ifdef __cplusplus
extern "C" {
#endif
/// Writes one formatted log line. Called with the log lock held.
/// @param buf formatted message, not necessarily null terminated
/// @param size number of valid bytes in buf
void log_output(char *buf, int size);
/// Sets the runtime log level, clamped to FATAL..VERBOSE.
void set_log_level(int level);
/// Logs errno with a location string and exits the process.
void print_errno_and_exit(const char *where);
#ifdef __cplusplus
}
#endif

#define ERRNOCHECK(where, x...)                                                \
    do                                                                         \
    {                                                                          \
        if ((x) < 0)                                                           \
        {                                                                      \
            print_errno_and_exit(where);                                       \
        }                                                                      \
    } while (0)

#endif // _UTILS_LOGGING_H_
