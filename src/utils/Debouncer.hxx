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
 * \file utils/Debouncer.hxx
 *
 * Input debouncing strategies for polled pins.
 *
 * @date 17 October 2026
 */

#ifndef _UTILS_DEBOUNCER_HXX_
#define _UTILS_DEBOUNCER_HXX_

/** This debouncer will update state if for N consecutive attempts the input
 * value is the same. */
class QuiesceDebouncer
{
public:
    /// Number of consecutive equal samples needed for a change.
    typedef unsigned Options;

    explicit QuiesceDebouncer(const Options &wait_count)
        : count_(0)
        , waitCount_(wait_count)
        , currentState_(false)
    {
    }

    /// Takes over @param state as is, e.g. at registration time.
    void initialize(bool state)
    {
        currentState_ = state;
        count_ = 0;
    }

    /// Forces the debounced state to @param new_state.
    void override(bool new_state)
    {
        initialize(new_state);
    }

    /// @return the last debounced state.
    bool current_state()
    {
        return currentState_;
    }

    /** Feeds one sample from the polling loop.
     * @param state sampled level
     * @return true if the debounced state has just changed to state
     */
    bool update_state(bool state)
    {
        if (state == currentState_)
        {
            count_ = 0;
            return false;
        }
        if (++count_ >= waitCount_)
        {
            currentState_ = state;
            count_ = 0;
            return true;
        }
        return false;
    }

private:
    unsigned count_;
    unsigned waitCount_;
    bool currentState_;
};

#endif // _UTILS_DEBOUNCER_HXX_
