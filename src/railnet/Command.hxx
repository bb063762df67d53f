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
 * \file railnet/Command.hxx
 *
 * Typed representation of railnet frames, with the decoder and the
 * encoders for every frame family.
 *
 * @date 3 March 2024
 */

#ifndef _RAILNET_COMMAND_HXX_
#define _RAILNET_COMMAND_HXX_

#include <string>

#include "utils/macros.h"

namespace railnet
{

/** Visual state of a two-LED signal head. */
enum class Aspect
{
    DARK, /**< both LEDs off */
    RED, /**< red on, green off */
    GREEN, /**< red off, green on */
    FLASH_RED, /**< green off, red blinking */
    FLASH_GREEN, /**< red off, green blinking */
};

/** One decoded frame. Only the fields belonging to the type are
 * meaningful.
 */
struct Command
{
    /** type of command.
     */
    enum Type
    {
        SENSOR_REPORT, /**< IN:<gpio>:<level> */
        SENSOR_REGISTER, /**< IN:<gpio> */
        TURNOUT_SET, /**< OUT_TO:<servo>[<thrown>][<closed>]:<active> */
        SIGNAL_HEAD_SET, /**< OUT_SH:<head>$<board>$R<red>$G<green>:<aspect> */
        PARSE_ERROR, /**< the frame could not be decoded */
        REMOTE_ERROR, /**< the peer sent us a diagnostic frame */
    };

    Type type = PARSE_ERROR; /**< type of command */

    int gpio = 0; /**< sensor GPIO number */
    bool level = false; /**< sensor level, true = asserted */

    int servoAddress = 0; /**< servo address, 0..991 */
    int thrownAngle = 0; /**< servo angle of the thrown position */
    int closedAngle = 0; /**< servo angle of the closed position */
    bool active = false; /**< true = closed, false = thrown */

    string headId; /**< signal head identity */
    int boardAddress = 0; /**< I2C address of the GPIO extender */
    int redPin = 0; /**< extender pin of the red LED */
    int greenPin = 0; /**< extender pin of the green LED */
    Aspect aspect = Aspect::DARK; /**< commanded aspect */

    string raw; /**< the frame text this command was decoded from */
    const char *reason = nullptr; /**< why decoding failed, PARSE_ERROR only */

    /// @return the servo angle selected by the active flag.
    int target_angle() const
    {
        return active ? closedAngle : thrownAngle;
    }
};

/** Decodes one frame. Never fails: a frame that does not match the grammar
 * comes back as a PARSE_ERROR command carrying the original text and a
 * reason token.
 * @param frame frame text without the delimiter
 * @return decoded command
 */
Command parse_command(const string &frame);

/** Parses a non-negative decimal integer. The whole string must be digits.
 * @param s text to parse
 * @param value result, written only on success
 * @return true on success
 */
bool parse_uint(const string &s, int *value);

/** Parses a hexadecimal integer with an optional 0x prefix.
 * @param s text to parse
 * @param value result, written only on success
 * @return true on success
 */
bool parse_hex(const string &s, int *value);

/// @return the wire code (r, g, fr, fg, d) of an aspect.
const char *aspect_code(Aspect aspect);

/** Decodes a wire aspect code.
 * @param code one of r, g, fr, fg, d
 * @param aspect result, written only on success
 * @return true if the code is known
 */
bool parse_aspect_code(const string &code, Aspect *aspect);

/// @return human readable aspect name, for logging.
const char *aspect_name(Aspect aspect);

/// @return IN:<gpio>:<0|1>
string format_sensor_report(int gpio, bool level);

/// @return IN:<gpio>
string format_sensor_register(int gpio);

/// @return OUT_TO:<servo>[<thrown>][<closed>]:<0|1>
string format_turnout(int servo, int thrown, int closed, bool active);

/// @return OUT_SH:<head>$0x<board>$R<red>$G<green>:<aspect code>
string format_signal_head(const string &head_id, int board, int red_pin,
    int green_pin, Aspect aspect);

/// @return ERROR:<raw>:<reason>
string format_error(const string &raw, const char *reason);

} // namespace railnet

#endif // _RAILNET_COMMAND_HXX_
