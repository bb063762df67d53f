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
 * \file OS.cxx
 *
 * POSIX implementation of the OS wrappers.
 *
 * @date 2 March 2024
 */

#include "os/OS.hxx"

#include <errno.h>
#include <string.h>
#include <time.h>

void OSThread::start(const char *name, int priority, size_t stack_size)
{
    HASSERT(!started_ || joined_);
    (void)priority;
    name_ = name ? name : "";
    pthread_attr_t attr;
    pthread_attr_init(&attr);
    if (stack_size > 0)
    {
        pthread_attr_setstacksize(&attr, stack_size);
    }
    int ret = pthread_create(&handle_, &attr, start_routine, this);
    pthread_attr_destroy(&attr);
    HASSERT(ret == 0);
#if defined(__linux__)
    char short_name[16];
    strncpy(short_name, name_, sizeof(short_name) - 1);
    short_name[sizeof(short_name) - 1] = 0;
    pthread_setname_np(handle_, short_name);
#endif
    started_ = true;
    joined_ = false;
}

void OSThread::join()
{
    if (!started_ || joined_)
    {
        return;
    }
    pthread_join(handle_, nullptr);
    joined_ = true;
}

void *OSThread::start_routine(void *arg)
{
    OSThread *thread = static_cast<OSThread *>(arg);
    return thread->entry();
}

void OSThread::sleep_nsec(long long nsec)
{
    struct timespec ts;
    ts.tv_sec = nsec / 1000000000LL;
    ts.tv_nsec = nsec % 1000000000LL;
    while (nanosleep(&ts, &ts) == -1 && errno == EINTR)
    {
    }
}

OSSem::OSSem(unsigned int value)
    : count_(value)
{
    pthread_mutex_init(&mutex_, nullptr);
    pthread_condattr_t attr;
    pthread_condattr_init(&attr);
    pthread_condattr_setclock(&attr, CLOCK_MONOTONIC);
    pthread_cond_init(&cond_, &attr);
    pthread_condattr_destroy(&attr);
}

OSSem::~OSSem()
{
    pthread_cond_destroy(&cond_);
    pthread_mutex_destroy(&mutex_);
}

void OSSem::post()
{
    pthread_mutex_lock(&mutex_);
    ++count_;
    pthread_cond_signal(&cond_);
    pthread_mutex_unlock(&mutex_);
}

void OSSem::wait()
{
    pthread_mutex_lock(&mutex_);
    while (count_ == 0)
    {
        pthread_cond_wait(&cond_, &mutex_);
    }
    --count_;
    pthread_mutex_unlock(&mutex_);
}

int OSSem::timedwait(long long timeout)
{
    if (timeout == OS_WAIT_FOREVER)
    {
        wait();
        return 0;
    }
    long long deadline = OSTime::get_monotonic() + (timeout > 0 ? timeout : 0);
    struct timespec ts;
    ts.tv_sec = deadline / 1000000000LL;
    ts.tv_nsec = deadline % 1000000000LL;
    pthread_mutex_lock(&mutex_);
    while (count_ == 0)
    {
        int ret = pthread_cond_timedwait(&cond_, &mutex_, &ts);
        if (ret == ETIMEDOUT && count_ == 0)
        {
            pthread_mutex_unlock(&mutex_);
            errno = ETIMEDOUT;
            return -1;
        }
    }
    --count_;
    pthread_mutex_unlock(&mutex_);
    return 0;
}

OSMutex::OSMutex(bool recursive)
{
    if (recursive)
    {
        pthread_mutexattr_t attr;
        pthread_mutexattr_init(&attr);
        pthread_mutexattr_settype(&attr, PTHREAD_MUTEX_RECURSIVE);
        pthread_mutex_init(&handle_, &attr);
        pthread_mutexattr_destroy(&attr);
    }
    else
    {
        pthread_mutex_init(&handle_, nullptr);
    }
}

long long OSTime::get_monotonic()
{
    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return ((long long)ts.tv_sec * 1000000000LL) + ts.tv_nsec;
}
