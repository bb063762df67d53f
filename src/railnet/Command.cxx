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
 * \file railnet/Command.cxx
 *
 * Frame grammar: tokenizer, typed field decoding and encoders.
 *
 * @date 3 March 2024
 */

#include "railnet/Command.hxx"

#include <ctype.h>
#include <stdio.h>

#include <vector>

#include "railnet/Defs.hxx"

namespace railnet
{

namespace
{

/// Longest decimal field accepted, keeps int conversion overflow free.
static constexpr unsigned MAX_DIGITS = 6;

/// Splits @p s on @p sep. Empty fields are kept.
std::vector<string> split(const string &s, char sep)
{
    std::vector<string> out;
    size_t start = 0;
    while (true)
    {
        size_t pos = s.find(sep, start);
        if (pos == string::npos)
        {
            out.push_back(s.substr(start));
            return out;
        }
        out.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
}

string to_upper(const string &s)
{
    string out(s);
    for (auto &c : out)
    {
        c = toupper((unsigned char)c);
    }
    return out;
}

bool parse_level(const string &s, bool *level)
{
    if (s == "1")
    {
        *level = true;
        return true;
    }
    if (s == "0")
    {
        *level = false;
        return true;
    }
    return false;
}

bool valid_head_id(const string &s)
{
    if (s.empty())
    {
        return false;
    }
    for (char c : s)
    {
        if (!isalnum((unsigned char)c) && c != '-' && c != '_' && c != '.')
        {
            return false;
        }
    }
    return true;
}

Command make_error(const string &frame, const char *why)
{
    Command c;
    c.type = Command::PARSE_ERROR;
    c.raw = frame;
    c.reason = why;
    return c;
}

/// Decodes `<servo>[<thrown>][<closed>]`.
const char *parse_servo_field(const string &s, Command *c)
{
    size_t open1 = s.find('[');
    if (open1 == string::npos)
    {
        return reason::MALFORMED;
    }
    size_t close1 = s.find(']', open1);
    if (close1 == string::npos || close1 + 1 >= s.size() ||
        s[close1 + 1] != '[' || s.back() != ']')
    {
        return reason::MALFORMED;
    }
    size_t open2 = close1 + 1;
    string servo = s.substr(0, open1);
    string thrown = s.substr(open1 + 1, close1 - open1 - 1);
    string closed = s.substr(open2 + 1, s.size() - open2 - 2);
    if (!parse_uint(servo, &c->servoAddress) ||
        c->servoAddress > Defs::MAX_SERVO_ADDRESS)
    {
        return reason::BAD_SERVO;
    }
    if (!parse_uint(thrown, &c->thrownAngle) ||
        !parse_uint(closed, &c->closedAngle) ||
        c->thrownAngle > Defs::MAX_ANGLE || c->closedAngle > Defs::MAX_ANGLE)
    {
        return reason::BAD_ANGLE;
    }
    return nullptr;
}

/// Decodes `<head>$<board>$R<red>$G<green>`.
const char *parse_head_field(const string &s, Command *c)
{
    std::vector<string> parts = split(s, Defs::ADDRESS_SEPARATOR);
    if (parts.size() != 4)
    {
        return reason::MALFORMED;
    }
    if (!valid_head_id(parts[0]))
    {
        return reason::BAD_HEAD;
    }
    c->headId = parts[0];
    if (!parse_hex(parts[1], &c->boardAddress) || c->boardAddress > 0x7F)
    {
        return reason::BAD_BOARD;
    }
    const string &red = parts[2];
    const string &green = parts[3];
    if (red.size() < 2 || toupper((unsigned char)red[0]) != 'R' ||
        green.size() < 2 || toupper((unsigned char)green[0]) != 'G')
    {
        return reason::MALFORMED;
    }
    if (!parse_uint(red.substr(1), &c->redPin) ||
        !parse_uint(green.substr(1), &c->greenPin) ||
        c->redPin >= Defs::EXTENDER_PINS ||
        c->greenPin >= Defs::EXTENDER_PINS)
    {
        return reason::BAD_PIN;
    }
    return nullptr;
}

} // namespace

bool parse_uint(const string &s, int *value)
{
    if (s.empty() || s.size() > MAX_DIGITS)
    {
        return false;
    }
    int v = 0;
    for (char c : s)
    {
        if (c < '0' || c > '9')
        {
            return false;
        }
        v = v * 10 + (c - '0');
    }
    *value = v;
    return true;
}

bool parse_hex(const string &s, int *value)
{
    size_t start = 0;
    if (s.size() > 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X'))
    {
        start = 2;
    }
    if (start >= s.size() || s.size() - start > MAX_DIGITS)
    {
        return false;
    }
    int v = 0;
    for (size_t i = start; i < s.size(); ++i)
    {
        char c = s[i];
        int d;
        if (c >= '0' && c <= '9')
        {
            d = c - '0';
        }
        else if (c >= 'a' && c <= 'f')
        {
            d = c - 'a' + 10;
        }
        else if (c >= 'A' && c <= 'F')
        {
            d = c - 'A' + 10;
        }
        else
        {
            return false;
        }
        v = v * 16 + d;
    }
    *value = v;
    return true;
}

Command parse_command(const string &frame)
{
    std::vector<string> tokens = split(frame, Defs::FIELD_SEPARATOR);
    string family = to_upper(tokens[0]);

    if (family == Defs::ERROR_PREFIX)
    {
        Command c;
        c.type = Command::REMOTE_ERROR;
        c.raw = frame;
        return c;
    }
    if (tokens.size() < 2)
    {
        return make_error(frame, reason::MALFORMED);
    }

    Command c;
    c.raw = frame;
    if (family == Defs::SENSOR_PREFIX)
    {
        if (tokens.size() > 3)
        {
            return make_error(frame, reason::MALFORMED);
        }
        if (!parse_uint(tokens[1], &c.gpio))
        {
            return make_error(frame, reason::BAD_GPIO);
        }
        if (tokens.size() == 2)
        {
            c.type = Command::SENSOR_REGISTER;
            return c;
        }
        if (!parse_level(tokens[2], &c.level))
        {
            return make_error(frame, reason::BAD_LEVEL);
        }
        c.type = Command::SENSOR_REPORT;
        return c;
    }
    if (family == Defs::TURNOUT_PREFIX)
    {
        if (tokens.size() != 3)
        {
            return make_error(frame, reason::MALFORMED);
        }
        const char *why = parse_servo_field(tokens[1], &c);
        if (why)
        {
            return make_error(frame, why);
        }
        if (!parse_level(tokens[2], &c.active))
        {
            return make_error(frame, reason::BAD_LEVEL);
        }
        c.type = Command::TURNOUT_SET;
        return c;
    }
    if (family == Defs::SIGNAL_HEAD_PREFIX)
    {
        if (tokens.size() != 3)
        {
            return make_error(frame, reason::MALFORMED);
        }
        const char *why = parse_head_field(tokens[1], &c);
        if (why)
        {
            return make_error(frame, why);
        }
        if (!parse_aspect_code(tokens[2], &c.aspect))
        {
            return make_error(frame, reason::BAD_ASPECT);
        }
        c.type = Command::SIGNAL_HEAD_SET;
        return c;
    }
    return make_error(frame, reason::UNKNOWN_COMMAND);
}

const char *aspect_code(Aspect aspect)
{
    switch (aspect)
    {
        case Aspect::RED:
            return "r";
        case Aspect::GREEN:
            return "g";
        case Aspect::FLASH_RED:
            return "fr";
        case Aspect::FLASH_GREEN:
            return "fg";
        case Aspect::DARK:
        default:
            return "d";
    }
}

bool parse_aspect_code(const string &code, Aspect *aspect)
{
    static const Aspect ALL[] = {Aspect::DARK, Aspect::RED, Aspect::GREEN,
        Aspect::FLASH_RED, Aspect::FLASH_GREEN};
    for (unsigned i = 0; i < ARRAYSIZE(ALL); ++i)
    {
        if (code == aspect_code(ALL[i]))
        {
            *aspect = ALL[i];
            return true;
        }
    }
    return false;
}

const char *aspect_name(Aspect aspect)
{
    switch (aspect)
    {
        case Aspect::RED:
            return "Red";
        case Aspect::GREEN:
            return "Green";
        case Aspect::FLASH_RED:
            return "Flashing Red";
        case Aspect::FLASH_GREEN:
            return "Flashing Green";
        case Aspect::DARK:
        default:
            return "Dark";
    }
}

string format_sensor_report(int gpio, bool level)
{
    string out(Defs::SENSOR_PREFIX);
    out.push_back(Defs::FIELD_SEPARATOR);
    out.append(std::to_string(gpio));
    out.push_back(Defs::FIELD_SEPARATOR);
    out.push_back(level ? '1' : '0');
    return out;
}

string format_sensor_register(int gpio)
{
    string out(Defs::SENSOR_PREFIX);
    out.push_back(Defs::FIELD_SEPARATOR);
    out.append(std::to_string(gpio));
    return out;
}

string format_turnout(int servo, int thrown, int closed, bool active)
{
    string out(Defs::TURNOUT_PREFIX);
    out.push_back(Defs::FIELD_SEPARATOR);
    out.append(std::to_string(servo));
    out.push_back('[');
    out.append(std::to_string(thrown));
    out.append("][");
    out.append(std::to_string(closed));
    out.push_back(']');
    out.push_back(Defs::FIELD_SEPARATOR);
    out.push_back(active ? '1' : '0');
    return out;
}

string format_signal_head(const string &head_id, int board, int red_pin,
    int green_pin, Aspect aspect)
{
    char board_hex[8];
    snprintf(board_hex, sizeof(board_hex), "0x%02x", board & 0xFF);
    string out(Defs::SIGNAL_HEAD_PREFIX);
    out.push_back(Defs::FIELD_SEPARATOR);
    out.append(head_id);
    out.push_back(Defs::ADDRESS_SEPARATOR);
    out.append(board_hex);
    out.push_back(Defs::ADDRESS_SEPARATOR);
    out.push_back('R');
    out.append(std::to_string(red_pin));
    out.push_back(Defs::ADDRESS_SEPARATOR);
    out.push_back('G');
    out.append(std::to_string(green_pin));
    out.push_back(Defs::FIELD_SEPARATOR);
    out.append(aspect_code(aspect));
    return out;
}

string format_error(const string &raw, const char *why)
{
    string out(Defs::ERROR_PREFIX);
    out.push_back(Defs::FIELD_SEPARATOR);
    out.append(raw);
    out.push_back(Defs::FIELD_SEPARATOR);
    out.append(why ? why : reason::MALFORMED);
    return out;
}

} // namespace railnet
