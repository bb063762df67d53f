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
 * \file railnet/NameParser.cxx
 *
 * Implementation of the entity name parser.
 *
 * @date 9 March 2024
 */

#include "railnet/NameParser.hxx"

#include <ctype.h>

#include "railnet/Command.hxx"
#include "railnet/Defs.hxx"

namespace railnet
{

namespace
{

/// Prefix shared by all entity names, after the kind letters.
static const char ENTITY_TAG[] = ".RPI$";

string lower(const string &s)
{
    string out(s);
    for (auto &c : out)
    {
        c = tolower((unsigned char)c);
    }
    return out;
}

/** Checks `<kind>.RPI$` at the start of a name, case-insensitively, and
 * stores what follows it in @p rest. */
bool strip_prefix(const string &name, const char *kind, string *rest)
{
    string prefix(kind);
    prefix.append(ENTITY_TAG);
    if (name.size() <= prefix.size())
    {
        return false;
    }
    for (size_t i = 0; i < prefix.size(); ++i)
    {
        if (toupper((unsigned char)name[i]) != prefix[i])
        {
            return false;
        }
    }
    *rest = name.substr(prefix.size());
    return true;
}

/** Splits `<address>:<host>[:<port>]` at the first colon. */
bool split_endpoint(const string &rest, string *address, EndpointAddress *ep)
{
    size_t colon = rest.find(Defs::FIELD_SEPARATOR);
    if (colon == string::npos || colon == 0)
    {
        return false;
    }
    *address = rest.substr(0, colon);
    return NameParser::parse_endpoint(rest.substr(colon + 1), ep);
}

} // namespace

string EndpointAddress::id() const
{
    return host + Defs::FIELD_SEPARATOR + std::to_string(port);
}

string EndpointAddress::alias() const
{
    return lower(id());
}

bool NameParser::parse_endpoint(const string &s, EndpointAddress *out)
{
    size_t colon = s.find(Defs::FIELD_SEPARATOR);
    string host = colon == string::npos ? s : s.substr(0, colon);
    if (host.empty())
    {
        return false;
    }
    for (char c : host)
    {
        if (!isalnum((unsigned char)c) && c != '.' && c != '-' && c != '_')
        {
            return false;
        }
    }
    int port = Defs::DEFAULT_ENDPOINT_PORT;
    if (colon != string::npos)
    {
        if (!parse_uint(s.substr(colon + 1), &port) || port == 0 ||
            port > 65535)
        {
            return false;
        }
    }
    out->host = host;
    out->port = port;
    return true;
}

bool NameParser::parse_sensor(const string &name, SensorName *out)
{
    string rest;
    string address;
    if (!strip_prefix(name, "IS", &rest) ||
        !split_endpoint(rest, &address, &out->endpoint))
    {
        return false;
    }
    return parse_uint(address, &out->gpio);
}

bool NameParser::parse_turnout(const string &name, TurnoutName *out)
{
    string rest;
    string address;
    if (!strip_prefix(name, "IT", &rest) ||
        !split_endpoint(rest, &address, &out->endpoint))
    {
        return false;
    }
    // Reuse the frame grammar for `<servo>[<thrown>][<closed>]`.
    Command c = parse_command(
        string(Defs::TURNOUT_PREFIX) + Defs::FIELD_SEPARATOR + address + ":1");
    if (c.type != Command::TURNOUT_SET)
    {
        return false;
    }
    out->servoAddress = c.servoAddress;
    out->thrownAngle = c.thrownAngle;
    out->closedAngle = c.closedAngle;
    return true;
}

bool NameParser::parse_signal_head(const string &name, SignalHeadName *out)
{
    string rest;
    string address;
    if (!strip_prefix(name, "IH", &rest) ||
        !split_endpoint(rest, &address, &out->endpoint))
    {
        return false;
    }
    Command c = parse_command(string(Defs::SIGNAL_HEAD_PREFIX) +
        Defs::FIELD_SEPARATOR + address + ":d");
    if (c.type != Command::SIGNAL_HEAD_SET)
    {
        return false;
    }
    out->headId = c.headId;
    out->boardAddress = c.boardAddress;
    out->redPin = c.redPin;
    out->greenPin = c.greenPin;
    return true;
}

string NameParser::sensor_lookup_name(int gpio, const string &alias)
{
    string out("IS");
    out.append(ENTITY_TAG);
    out.append(std::to_string(gpio));
    out.push_back(Defs::FIELD_SEPARATOR);
    for (char c : alias)
    {
        out.push_back(toupper((unsigned char)c));
    }
    return out;
}

} // namespace railnet
