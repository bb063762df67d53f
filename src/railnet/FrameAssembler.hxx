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
 * \file railnet/FrameAssembler.hxx
 *
 * Reassembles delimiter-terminated frames from a byte stream.
 *
 * @date 3 March 2024
 */

#ifndef _RAILNET_FRAMEASSEMBLER_HXX_
#define _RAILNET_FRAMEASSEMBLER_HXX_

#include <string>
#include <vector>

#include "utils/macros.h"

namespace railnet
{

/** Accumulates received bytes and cuts them into frames. Heartbeat bytes
 * are dropped on arrival; everything after the last delimiter is kept for
 * the next call. Not thread safe, owned by one Link.
 */
class FrameAssembler
{
public:
    FrameAssembler()
        : discarding_(false)
    {
    }

    /** Appends received data and extracts the complete frames.
     * @param data received bytes
     * @param len number of bytes in data
     * @param frames complete frames are appended here, in arrival order;
     * empty frames are skipped. A run longer than MAX_FRAME_LENGTH is
     * dropped together with everything up to and including its delimiter.
     * @return number of frames appended
     */
    unsigned feed(const char *data, size_t len, std::vector<string> *frames);

    /// Convenience overload of feed().
    unsigned feed(const string &data, std::vector<string> *frames)
    {
        return feed(data.data(), data.size(), frames);
    }

    /// Discards any partially received frame.
    void clear()
    {
        pending_.clear();
        discarding_ = false;
    }

    /// @return true while the rest of an overlong frame is being skipped.
    bool discarding() const
    {
        return discarding_;
    }

    /// @return the undelimited remainder waiting for more data.
    const string &pending() const
    {
        return pending_;
    }

private:
    /// Bytes received after the last delimiter.
    string pending_;
    /// true from an overflow until the next delimiter.
    bool discarding_;

    DISALLOW_COPY_AND_ASSIGN(FrameAssembler);
};

} // namespace railnet

#endif // _RAILNET_FRAMEASSEMBLER_HXX_
