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
 * \file railnet/NameParser.hxx
 *
 * Decodes the addresses encoded in layout entity names.
 *
 *   sensor       IS.RPI$<gpio>:<host>[:<port>]
 *   turnout      IT.RPI$<servo>[<thrown>][<closed>]:<host>[:<port>]
 *   signal head  IH.RPI$<head>$<board>$R<red>$G<green>:<host>[:<port>]
 *
 * @date 9 March 2024
 */

#ifndef _RAILNET_NAMEPARSER_HXX_
#define _RAILNET_NAMEPARSER_HXX_

#include <string>

#include "utils/macros.h"

namespace railnet
{

/** Identity of a remote actuator host. */
struct EndpointAddress
{
    string host; /**< host name or address as written in the entity name */
    int port = 0; /**< TCP port */

    /// @return <host>:<port>
    string id() const;

    /// @return the lowercase id, used as registry key.
    string alias() const;
};

/** Decoded sensor name. */
struct SensorName
{
    int gpio = 0; /**< GPIO number on the remote host */
    EndpointAddress endpoint; /**< remote host */
};

/** Decoded turnout name. */
struct TurnoutName
{
    int servoAddress = 0; /**< servo address */
    int thrownAngle = 0; /**< angle of the thrown position */
    int closedAngle = 0; /**< angle of the closed position */
    EndpointAddress endpoint; /**< remote host */
};

/** Decoded signal head name. */
struct SignalHeadName
{
    string headId; /**< head identity, e.g. SM1-SH1 */
    int boardAddress = 0; /**< I2C address of the GPIO extender */
    int redPin = 0; /**< extender pin of the red LED */
    int greenPin = 0; /**< extender pin of the green LED */
    EndpointAddress endpoint; /**< remote host */
};

/** Parsers for the entity naming convention. All of them fail closed: on a
 * false return the output is left in an unspecified state.
 */
struct NameParser
{
    /** Parses `<host>[:<port>]`. A missing port means
     * Defs::DEFAULT_ENDPOINT_PORT.
     */
    static bool parse_endpoint(const string &s, EndpointAddress *out);

    /// Parses a sensor name.
    static bool parse_sensor(const string &name, SensorName *out);

    /// Parses a turnout name.
    static bool parse_turnout(const string &name, TurnoutName *out);

    /// Parses a signal head name.
    static bool parse_signal_head(const string &name, SignalHeadName *out);

    /** Builds the name under which a received sensor report is looked up.
     * @param gpio GPIO number from the report
     * @param alias alias of the endpoint the report came from
     * @return IS.RPI$<gpio>:<ALIAS>
     */
    static string sensor_lookup_name(int gpio, const string &alias);
};

} // namespace railnet

#endif // _RAILNET_NAMEPARSER_HXX_
