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
 * \file railnet/Layout.cxx
 *
 * Printable names of the layout entity states.
 *
 * @date 9 March 2024
 */

#include "railnet/Layout.hxx"

namespace railnet
{

const char *turnout_state_name(TurnoutState state)
{
    switch (state)
    {
        case TurnoutState::CLOSED:
            return "CLOSED";
        case TurnoutState::THROWN:
            return "THROWN";
        case TurnoutState::UNKNOWN:
        default:
            return "UNKNOWN";
    }
}

const char *sensor_state_name(SensorState state)
{
    switch (state)
    {
        case SensorState::ACTIVE:
            return "ACTIVE";
        case SensorState::INACTIVE:
            return "INACTIVE";
        case SensorState::INCONSISTENT:
            return "INCONSISTENT";
        case SensorState::UNKNOWN:
        default:
            return "UNKNOWN";
    }
}

} // namespace railnet
