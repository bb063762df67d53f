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
 * \file railnet/Liveness.hxx
 *
 * Counts consecutive silent read timeouts of a link.
 *
 * @date 3 March 2024
 */

#ifndef _RAILNET_LIVENESS_HXX_
#define _RAILNET_LIVENESS_HXX_

#include "utils/macros.h"

namespace railnet
{

/** Decides when a silent link is dead. Any received byte, heartbeat or
 * data, counts as traffic.
 */
class LivenessMonitor
{
public:
    /** Constructor.
     * @param max_fail number of consecutive timeouts tolerated
     */
    LivenessMonitor(int max_fail)
        : maxFail_(max_fail)
        , failures_(0)
    {
    }

    /// Notifies the monitor that the peer sent something.
    void on_traffic()
    {
        failures_ = 0;
    }

    /** Notifies the monitor that a read timed out.
     * @return true if the link must be declared dead. The counter is reset
     * in that case.
     */
    bool on_timeout()
    {
        if (++failures_ > maxFail_)
        {
            failures_ = 0;
            return true;
        }
        return false;
    }

    /// Forgets any accumulated failures, used after a reconnect.
    void reset()
    {
        failures_ = 0;
    }

    /// @return the current number of consecutive timeouts.
    int failures()
    {
        return failures_;
    }

private:
    int maxFail_;
    int failures_;

    DISALLOW_COPY_AND_ASSIGN(LivenessMonitor);
};

} // namespace railnet

#endif // _RAILNET_LIVENESS_HXX_
