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
 * \file railnet/Defs.hxx
 *
 * Wire-level constants of the railnet link protocol.
 *
 * @date 3 March 2024
 */

#ifndef _RAILNET_DEFS_HXX_
#define _RAILNET_DEFS_HXX_

#include "os/OS.hxx"

namespace railnet
{

/** The interface definitions for the railnet link.
 */
struct Defs
{
    /** Terminates every application frame */
    static constexpr const char DELIMITER = '|';

    /** Heartbeat padding byte, stripped on receipt */
    static constexpr const char HEARTBEAT = ' ';

    /** Separates the fields of a frame */
    static constexpr const char FIELD_SEPARATOR = ':';

    /** Separates the parts of a signal head address */
    static constexpr const char ADDRESS_SEPARATOR = '$';

    /** Connect retry delay and socket read timeout, in nanoseconds */
    static constexpr long long CONN_TIMEOUT = SEC_TO_NSEC(3);

    /** Number of consecutive silent read timeouts tolerated */
    static constexpr const int MAX_HEARTBEAT_FAIL = 5;

    /** Longest time send() waits for a reconnect, in nanoseconds */
    static constexpr long long SEND_WAIT = MSEC_TO_NSEC(500);

    /** Bytes requested from the socket per receive call */
    static constexpr const int RECV_CHUNK = 256;

    /** An undelimited inbound fragment longer than this is discarded */
    static constexpr const unsigned MAX_FRAME_LENGTH = 4096;

    /** Blink frequency of flashing aspects, in Hz */
    static constexpr const int FLASHING_FREQ = 2;

    /** On-time share of a blink cycle, in percent */
    static constexpr const int FLASHING_DUTY_PERCENT = 50;

    /** Default listening port of the actuator node */
    static constexpr const int DEFAULT_NODE_PORT = 14200;

    /** Port assumed when an entity name omits it */
    static constexpr const int DEFAULT_ENDPOINT_PORT = 10000;

    /** Pins on one GPIO extender board */
    static constexpr const int EXTENDER_PINS = 16;

    /** Channels on one servo controller board */
    static constexpr const int SERVO_CHANNELS = 16;

    /** Highest accepted servo address */
    static constexpr const int MAX_SERVO_ADDRESS = 991;

    /** Highest accepted servo angle, in degrees */
    static constexpr const int MAX_ANGLE = 180;

    /** Sensor input sample period, in nanoseconds */
    static constexpr long long SENSOR_POLL_PERIOD = MSEC_TO_NSEC(20);

    /** Equal consecutive samples needed before a sensor edge is reported */
    static constexpr const unsigned SENSOR_DEBOUNCE_COUNT = 3;

    /** Time allowed for link threads to exit at shutdown, in nanoseconds */
    static constexpr long long SHUTDOWN_GRACE = SEC_TO_NSEC(3);

    /** Command family of sensor frames */
    static constexpr const char *SENSOR_PREFIX = "IN";
    /** Command family of turnout frames */
    static constexpr const char *TURNOUT_PREFIX = "OUT_TO";
    /** Command family of signal head frames */
    static constexpr const char *SIGNAL_HEAD_PREFIX = "OUT_SH";
    /** Command family of diagnostic frames */
    static constexpr const char *ERROR_PREFIX = "ERROR";

    /** @return the interval after which an idle link sends a heartbeat.
     * @param conn_timeout read timeout in nanoseconds
     * @param max_fail heartbeat failure threshold
     */
    static long long heartbeat_interval(long long conn_timeout, int max_fail)
    {
        return conn_timeout * max_fail / 2;
    }
};

/** Reason tokens carried in diagnostic frames. They must not contain spaces
 * or delimiters. */
namespace reason
{
static constexpr const char *MALFORMED = "malformed";
static constexpr const char *UNKNOWN_COMMAND = "unknown_command";
static constexpr const char *BAD_GPIO = "bad_gpio";
static constexpr const char *BAD_LEVEL = "bad_level";
static constexpr const char *BAD_SERVO = "bad_servo";
static constexpr const char *BAD_ANGLE = "bad_angle";
static constexpr const char *BAD_HEAD = "bad_head";
static constexpr const char *BAD_BOARD = "bad_board";
static constexpr const char *BAD_PIN = "bad_pin";
static constexpr const char *BAD_ASPECT = "bad_aspect";
static constexpr const char *UNSUPPORTED = "unsupported_command";
static constexpr const char *SERVO_INIT_FAILED = "servo_init_failed";
static constexpr const char *SERVO_WRITE_FAILED = "servo_write_failed";
static constexpr const char *BOARD_INIT_FAILED = "board_init_failed";
static constexpr const char *BOARD_WRITE_FAILED = "board_write_failed";
static constexpr const char *INPUT_INIT_FAILED = "input_init_failed";
static constexpr const char *UNKNOWN_SENSOR = "unknown_sensor";
} // namespace reason

} // namespace railnet

#endif // _RAILNET_DEFS_HXX_
