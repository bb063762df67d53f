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
 * \file railnet/BlinkScheduler.cxx
 *
 * Implementation of the blink tasks and their scheduler.
 *
 * @date 7 March 2024
 */

#include "railnet/BlinkScheduler.hxx"

#include "utils/logging.h"

namespace railnet
{

void *BlinkTask::entry()
{
    LOG(VERBOSE, "%s: blinking started", name_.c_str());
    while (!token_->is_cancelled())
    {
        if (!pin_->set())
        {
            LOG(WARNING, "%s: blink write failed", name_.c_str());
        }
        if (token_->sleep(onNsec_))
        {
            break;
        }
        if (!pin_->clr())
        {
            LOG(WARNING, "%s: blink write failed", name_.c_str());
        }
        if (token_->sleep(offNsec_))
        {
            break;
        }
        ++cycles_;
    }
    if (!pin_->clr())
    {
        LOG(WARNING, "%s: could not clear LED after blinking", name_.c_str());
    }
    LOG(VERBOSE, "%s: blinking stopped", name_.c_str());
    return nullptr;
}

BlinkScheduler::BlinkScheduler(int freq, int duty_percent)
{
    HASSERT(freq > 0);
    HASSERT(duty_percent > 0 && duty_percent < 100);
    long long period = SEC_TO_NSEC(1) / freq;
    onNsec_ = period * duty_percent / 100;
    offNsec_ = period - onNsec_;
}

BlinkScheduler::~BlinkScheduler()
{
    cancel_all();
}

void BlinkScheduler::stop_entry(Entry *e)
{
    e->token->cancel();
    e->task->join();
}

void BlinkScheduler::start(const string &head_id, Gpio *pin)
{
    HASSERT(pin);
    OSMutexLock l(&lock_);
    auto it = tasks_.find(head_id);
    if (it != tasks_.end())
    {
        stop_entry(&it->second);
        tasks_.erase(it);
    }
    Entry &e = tasks_[head_id];
    e.token.reset(new CancelToken);
    e.task.reset(
        new BlinkTask(head_id, pin, onNsec_, offNsec_, e.token.get()));
    e.task->start();
}

bool BlinkScheduler::cancel(const string &head_id)
{
    OSMutexLock l(&lock_);
    auto it = tasks_.find(head_id);
    if (it == tasks_.end())
    {
        return false;
    }
    stop_entry(&it->second);
    tasks_.erase(it);
    return true;
}

void BlinkScheduler::cancel_all()
{
    OSMutexLock l(&lock_);
    for (auto &kv : tasks_)
    {
        kv.second.token->cancel();
    }
    for (auto &kv : tasks_)
    {
        kv.second.task->join();
    }
    tasks_.clear();
}

bool BlinkScheduler::is_blinking(const string &head_id)
{
    OSMutexLock l(&lock_);
    return tasks_.find(head_id) != tasks_.end();
}

Gpio *BlinkScheduler::blinking_pin(const string &head_id)
{
    OSMutexLock l(&lock_);
    auto it = tasks_.find(head_id);
    return it == tasks_.end() ? nullptr : it->second.task->pin();
}

size_t BlinkScheduler::active_count()
{
    OSMutexLock l(&lock_);
    return tasks_.size();
}

} // namespace railnet
