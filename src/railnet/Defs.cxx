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
 * \file railnet/Defs.cxx
 *
 * Storage for the Defs constants that are bound to references.
 *
 * @date 3 March 2024
 */

#include "railnet/Defs.hxx"

namespace railnet
{

constexpr const char Defs::DELIMITER;
constexpr const char Defs::HEARTBEAT;
constexpr const char Defs::FIELD_SEPARATOR;
constexpr const char Defs::ADDRESS_SEPARATOR;
constexpr long long Defs::CONN_TIMEOUT;
constexpr const int Defs::MAX_HEARTBEAT_FAIL;
constexpr long long Defs::SEND_WAIT;
constexpr const int Defs::RECV_CHUNK;
constexpr const unsigned Defs::MAX_FRAME_LENGTH;
constexpr const int Defs::FLASHING_FREQ;
constexpr const int Defs::FLASHING_DUTY_PERCENT;
constexpr const int Defs::DEFAULT_NODE_PORT;
constexpr const int Defs::DEFAULT_ENDPOINT_PORT;
constexpr const int Defs::EXTENDER_PINS;
constexpr const int Defs::SERVO_CHANNELS;
constexpr const int Defs::MAX_SERVO_ADDRESS;
constexpr const int Defs::MAX_ANGLE;
constexpr long long Defs::SENSOR_POLL_PERIOD;
constexpr const unsigned Defs::SENSOR_DEBOUNCE_COUNT;
constexpr long long Defs::SHUTDOWN_GRACE;
constexpr const char *Defs::SENSOR_PREFIX;
constexpr const char *Defs::TURNOUT_PREFIX;
constexpr const char *Defs::SIGNAL_HEAD_PREFIX;
constexpr const char *Defs::ERROR_PREFIX;

} // namespace railnet
