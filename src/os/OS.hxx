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
 * \file OS.hxx
 *
 * Thin C++ wrappers over the POSIX threading primitives: threads,
 * semaphores, mutexes and the monotonic clock.
 *
 * @date 2 March 2024
 */

#ifndef _OS_OS_HXX_
#define _OS_OS_HXX_

#include <pthread.h>
#include <stddef.h>

#include "utils/macros.h"

/// Converts milliseconds to nanoseconds.
#define MSEC_TO_NSEC(_msec) (((long long)_msec) * 1000000LL)
/// Converts seconds to nanoseconds.
#define SEC_TO_NSEC(_sec) (((long long)_sec) * 1000000000LL)
/// Converts nanoseconds to milliseconds.
#define NSEC_TO_MSEC(_nsec) (((long long)_nsec) / 1000000LL)

/// Passed to OSSem::timedwait to block without a deadline.
#define OS_WAIT_FOREVER (-1LL)

/** This class provides a threading API. Inherit from it, override entry()
 * and call start() to run it. The owner must call join() before the object
 * is destroyed.
 */
class OSThread
{
public:
    OSThread()
        : started_(false)
        , joined_(false)
    {
    }

    virtual ~OSThread()
    {
    }

    /** Create and run the thread.
     * @param name name of thread, shown in debuggers and logs
     * @param priority ignored on POSIX, kept for call compatibility
     * @param stack_size size in bytes of the stack, 0 for the default
     */
    void start(const char *name, int priority, size_t stack_size);

    /** Waits for the thread to return from entry(). Does nothing if the
     * thread was never started or was already joined. */
    void join();

    /// @return true if start() was called and join() was not.
    bool is_started()
    {
        return started_ && !joined_;
    }

    /// @return the name given to start().
    const char *thread_name()
    {
        return name_;
    }

    /// Sleeps the calling thread.
    /// @param nsec time to sleep in nanoseconds
    static void sleep_nsec(long long nsec);

protected:
    /** User entry point for the created thread.
     * @return exit status
     */
    virtual void *entry() = 0;

private:
    /** Starting point for a new thread.
     * @param arg pointer to an OSThread instance
     * @return exit status
     */
    static void *start_routine(void *arg);

    DISALLOW_COPY_AND_ASSIGN(OSThread);

    pthread_t handle_;
    const char *name_ = "";
    bool started_;
    bool joined_;
};

/** This class provides a counting semaphore API.
 */
class OSSem
{
public:
    /** Initialize a Semaphore.
     * @param value initial count
     */
    OSSem(unsigned int value = 0);

    ~OSSem();

    /** Post (increment) a semaphore.
     */
    void post();

    /** Wait on (decrement) a semaphore.
     */
    void wait();

    /** Wait on (decrement) a semaphore with timeout condition.
     * @param timeout timeout in nanoseconds, else OS_WAIT_FOREVER to wait
     * forever
     * @return 0 upon success, else -1 with errno set to ETIMEDOUT
     */
    int timedwait(long long timeout);

private:
    DISALLOW_COPY_AND_ASSIGN(OSSem);

    pthread_mutex_t mutex_;
    pthread_cond_t cond_;
    unsigned int count_;
};

/** This class provides a mutex API.
 */
class OSMutex
{
public:
    /** Initialize a mutex.
     * @param recursive false creates a normal mutex, true creates a recursive
     * mutex
     */
    OSMutex(bool recursive = false);

    /** Lock a mutex.
     */
    void lock()
    {
        pthread_mutex_lock(&handle_);
    }

    /** Unlock a mutex.
     */
    void unlock()
    {
        pthread_mutex_unlock(&handle_);
    }

    ~OSMutex()
    {
        pthread_mutex_destroy(&handle_);
    }

private:
    DISALLOW_COPY_AND_ASSIGN(OSMutex);

    friend class OSMutexLock;
    pthread_mutex_t handle_;
};

/**
 * Scoped lock. The mutex is unlocked when the enclosing block is left, even
 * through multiple return, break or continue statements.
 *
 * Usage:
 *
 * void foo()
 * {
 *   {
 *     OSMutexLock locker(&mutex_);
 *     // ...critical section here...
 *   }
 * }
 */
class OSMutexLock
{
public:
    OSMutexLock(OSMutex *mutex)
        : mutex_(&mutex->handle_)
    {
        pthread_mutex_lock(mutex_);
    }

    ~OSMutexLock()
    {
        pthread_mutex_unlock(mutex_);
    }

private:
    DISALLOW_COPY_AND_ASSIGN(OSMutexLock);

    pthread_mutex_t *mutex_;
};

/** Catches declaring a locker object without a name, which would unlock the
 * mutex on the same line it was locked. */
#define OSMutexLock(l) int error_omitted_mutex_lock_variable[-1]

class OSTime
{
public:
    /** Get the monotonic time since the system started.
     * @return time in nanoseconds since system start
     */
    static long long get_monotonic();

private:
    DISALLOW_COPY_AND_ASSIGN(OSTime);

    OSTime();
    ~OSTime();
};

#endif // _OS_OS_HXX_
