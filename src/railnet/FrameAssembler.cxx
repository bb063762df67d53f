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
 * \file railnet/FrameAssembler.cxx
 *
 * Implementation of the inbound frame reassembly.
 *
 * @date 3 March 2024
 */

#include "railnet/FrameAssembler.hxx"

#include "railnet/Defs.hxx"
#include "utils/logging.h"

namespace railnet
{

unsigned FrameAssembler::feed(
    const char *data, size_t len, std::vector<string> *frames)
{
    unsigned count = 0;
    for (size_t i = 0; i < len; ++i)
    {
        char c = data[i];
        if (c == Defs::HEARTBEAT)
        {
            continue;
        }
        if (discarding_)
        {
            if (c == Defs::DELIMITER)
            {
                LOG(WARNING, "End of overlong frame, resuming");
                discarding_ = false;
            }
            continue;
        }
        if (c != Defs::DELIMITER)
        {
            pending_.push_back(c);
            if (pending_.size() > Defs::MAX_FRAME_LENGTH)
            {
                LOG(WARNING, "Dropping overlong frame (more than %u bytes)",
                    (unsigned)Defs::MAX_FRAME_LENGTH);
                pending_.clear();
                discarding_ = true;
            }
            continue;
        }
        if (!pending_.empty())
        {
            frames->push_back(pending_);
            ++count;
        }
        pending_.clear();
    }
    return count;
}

} // namespace railnet
