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
 * \file railnet/BlinkScheduler.hxx
 *
 * Background LED blinking for flashing signal aspects.
 *
 * Each blinking head has one BlinkTask thread. Cancellation is cooperative
 * through a CancelToken owned by the scheduler; the scheduler joins a task
 * before anything else may touch its pins, so two tasks never drive the
 * same head.
 *
 * @date 7 March 2024
 */

#ifndef _RAILNET_BLINKSCHEDULER_HXX_
#define _RAILNET_BLINKSCHEDULER_HXX_

#include <atomic>
#include <map>
#include <memory>

#include "os/Gpio.hxx"
#include "os/OS.hxx"

namespace railnet
{

/** Cancellation flag with an interruptible sleep.
 */
class CancelToken
{
public:
    CancelToken()
        : cancelled_(false)
    {
    }

    /// Raises the flag and wakes a sleeping task.
    void cancel()
    {
        cancelled_ = true;
        wakeup_.post();
    }

    /// @return true once cancel() was called.
    bool is_cancelled()
    {
        return cancelled_;
    }

    /** Sleeps unless cancelled.
     * @param nsec time to sleep
     * @return true if the token is cancelled
     */
    bool sleep(long long nsec)
    {
        if (cancelled_)
        {
            return true;
        }
        wakeup_.timedwait(nsec);
        return cancelled_;
    }

private:
    std::atomic<bool> cancelled_;
    OSSem wakeup_;

    DISALLOW_COPY_AND_ASSIGN(CancelToken);
};

/** One blinking LED. The pin is left clear when the task exits.
 */
class BlinkTask : private OSThread
{
public:
    /** Constructor.
     * @param name thread name, the head id
     * @param pin LED to toggle, not owned
     * @param on_nsec time the LED is lit in each cycle
     * @param off_nsec time the LED is dark in each cycle
     * @param token cancellation flag, not owned
     */
    BlinkTask(const string &name, Gpio *pin, long long on_nsec,
        long long off_nsec, CancelToken *token)
        : name_(name)
        , pin_(pin)
        , onNsec_(on_nsec)
        , offNsec_(off_nsec)
        , token_(token)
        , cycles_(0)
    {
    }

    ~BlinkTask()
    {
        HASSERT(!is_started());
    }

    /// Starts the blink thread.
    void start()
    {
        OSThread::start(name_.c_str(), 0, 0);
    }

    /// Waits for the thread to exit. The token must be cancelled first.
    void join()
    {
        OSThread::join();
    }

    /// @return number of completed on/off cycles.
    unsigned cycles()
    {
        return cycles_;
    }

    /// @return the LED being toggled.
    Gpio *pin()
    {
        return pin_;
    }

private:
    void *entry() override;

    string name_;
    Gpio *pin_;
    long long onNsec_;
    long long offNsec_;
    CancelToken *token_;
    std::atomic<unsigned> cycles_;

    DISALLOW_COPY_AND_ASSIGN(BlinkTask);
};

/** Keeps at most one BlinkTask per signal head.
 */
class BlinkScheduler
{
public:
    /** Constructor.
     * @param freq blink frequency in Hz
     * @param duty_percent share of the cycle the LED is lit
     */
    BlinkScheduler(int freq, int duty_percent);

    ~BlinkScheduler();

    /** Starts blinking a pin for a head. Any task already running for the
     * head is cancelled and joined first.
     * @param head_id signal head identity
     * @param pin LED to toggle, not owned
     */
    void start(const string &head_id, Gpio *pin);

    /** Cancels and joins the task of a head.
     * @param head_id signal head identity
     * @return true if a task was running
     */
    bool cancel(const string &head_id);

    /// Cancels and joins every task.
    void cancel_all();

    /// @return true if a task runs for the head.
    bool is_blinking(const string &head_id);

    /// @return the pin blinking for a head, or nullptr.
    Gpio *blinking_pin(const string &head_id);

    /// @return number of running tasks.
    size_t active_count();

    /// @return lit time of one cycle in nanoseconds.
    long long on_nsec()
    {
        return onNsec_;
    }

    /// @return dark time of one cycle in nanoseconds.
    long long off_nsec()
    {
        return offNsec_;
    }

private:
    /// A task with its token.
    struct Entry
    {
        std::unique_ptr<CancelToken> token;
        std::unique_ptr<BlinkTask> task;
    };

    /// Cancels and joins one entry. Caller holds lock_.
    void stop_entry(Entry *e);

    long long onNsec_;
    long long offNsec_;
    OSMutex lock_;
    std::map<string, Entry> tasks_;

    DISALLOW_COPY_AND_ASSIGN(BlinkScheduler);
};

} // namespace railnet

#endif // _RAILNET_BLINKSCHEDULER_HXX_
