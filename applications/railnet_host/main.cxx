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
 * \file railnet_host/main.cxx
 *
 * Origin host: loads a layout, binds its entities to the actuator hosts
 * named in their system names and offers a console to operate them.
 *
 * @date 15 March 2024
 */

#include <getopt.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include "console/Console.hxx"
#include "railnet/HostBridge.hxx"
#include "railnet/MemoryLayout.hxx"
#include "utils/logging.h"

const char *layout_file = nullptr;
bool initialize = false;
long long conn_timeout = railnet::Defs::CONN_TIMEOUT;
int max_heartbeat_fail = railnet::Defs::MAX_HEARTBEAT_FAIL;
int log_level = INFO;

void usage(const char *e)
{
    fprintf(stderr, "Usage: %s -l layout_file [-I] [-t timeout_msec] "
                    "[-f max_fail] [-v] [-q]\n\n",
            e);
    fprintf(stderr, "Railnet origin host.\nConnects to every actuator host "
                    "named in the layout and keeps the layout's turnouts, "
                    "signal heads and sensors in sync with them.\n\n"
                    "Arguments:\n");
    fprintf(stderr, "\t-l layout_file   lists the system names of the "
                    "entities, one per line.\n");
    fprintf(stderr, "\t-I sets all signal heads red and all turnouts closed "
                    "after startup.\n");
    fprintf(stderr, "\t-t timeout_msec   is the connection timeout, default "
                    "is 3000.\n");
    fprintf(stderr, "\t-f max_fail   is the number of silent timeouts after "
                    "which a link is dead, default is %d.\n",
            railnet::Defs::MAX_HEARTBEAT_FAIL);
    fprintf(stderr, "\t-v more verbose logging, -q less logging.\n");
    exit(1);
}

void parse_args(int argc, char *argv[])
{
    int opt;
    while ((opt = getopt(argc, argv, "hl:It:f:vq")) >= 0)
    {
        switch (opt)
        {
            case 'h':
                usage(argv[0]);
                break;
            case 'l':
                layout_file = optarg;
                break;
            case 'I':
                initialize = true;
                break;
            case 't':
                conn_timeout = MSEC_TO_NSEC(atoll(optarg));
                break;
            case 'f':
                max_heartbeat_fail = atoi(optarg);
                break;
            case 'v':
                ++log_level;
                break;
            case 'q':
                --log_level;
                break;
            default:
                fprintf(stderr, "Unknown option %c\n", opt);
                usage(argv[0]);
        }
    }
    if (!layout_file || conn_timeout <= 0 || max_heartbeat_fail <= 0)
    {
        usage(argv[0]);
    }
}

/// Objects the console commands operate on.
struct HostContext
{
    railnet::MemoryLayout *layout;
    railnet::HostBridge *bridge;
};

Console::CommandStatus turnout_command(
    FILE *fp, int argc, const char *argv[], void *context)
{
    if (argc == 0)
    {
        fprintf(fp, "turnout <name> closed|thrown\n");
        return Console::COMMAND_OK;
    }
    if (argc != 3)
    {
        return Console::COMMAND_ERROR;
    }
    HostContext *ctx = static_cast<HostContext *>(context);
    railnet::TurnoutEntity *t = ctx->layout->turnout(argv[1]);
    if (!t)
    {
        fprintf(fp, "no turnout %s\n", argv[1]);
        return Console::COMMAND_OK;
    }
    if (strcmp(argv[2], "closed") == 0)
    {
        t->set_commanded_state(railnet::TurnoutState::CLOSED);
    }
    else if (strcmp(argv[2], "thrown") == 0)
    {
        t->set_commanded_state(railnet::TurnoutState::THROWN);
    }
    else
    {
        return Console::COMMAND_ERROR;
    }
    fprintf(fp, "%s is %s\n", argv[1],
        railnet::turnout_state_name(t->commanded_state()));
    return Console::COMMAND_OK;
}

Console::CommandStatus signal_command(
    FILE *fp, int argc, const char *argv[], void *context)
{
    if (argc == 0)
    {
        fprintf(fp, "signal <name> r|g|fr|fg|d\n");
        return Console::COMMAND_OK;
    }
    railnet::Aspect aspect;
    if (argc != 3 || !railnet::parse_aspect_code(argv[2], &aspect))
    {
        return Console::COMMAND_ERROR;
    }
    HostContext *ctx = static_cast<HostContext *>(context);
    railnet::SignalHeadEntity *h = ctx->layout->signal_head(argv[1]);
    if (!h)
    {
        fprintf(fp, "no signal head %s\n", argv[1]);
        return Console::COMMAND_OK;
    }
    h->set_appearance(railnet::aspect_name(aspect));
    return Console::COMMAND_OK;
}

Console::CommandStatus sensors_command(
    FILE *fp, int argc, const char *argv[], void *context)
{
    if (argc == 0)
    {
        fprintf(fp, "list the sensors and their state\n");
        return Console::COMMAND_OK;
    }
    HostContext *ctx = static_cast<HostContext *>(context);
    for (railnet::SensorEntity *s : ctx->layout->sensors())
    {
        fprintf(fp, "%-40s %s\n", s->system_name().c_str(),
            railnet::sensor_state_name(s->known_state()));
    }
    return Console::COMMAND_OK;
}

Console::CommandStatus links_command(
    FILE *fp, int argc, const char *argv[], void *context)
{
    if (argc == 0)
    {
        fprintf(fp, "list the actuator host links\n");
        return Console::COMMAND_OK;
    }
    HostContext *ctx = static_cast<HostContext *>(context);
    railnet::EndpointRegistry *registry = ctx->bridge->registry();
    for (const string &alias : registry->aliases())
    {
        std::shared_ptr<railnet::Link> link = registry->find(alias);
        if (!link)
        {
            continue;
        }
        fprintf(fp, "%-24s %-10s connects %u dead %u\n", alias.c_str(),
            railnet::Link::state_name(link->state()), link->connect_count(),
            link->dead_link_count());
    }
    return Console::COMMAND_OK;
}

/** Entry point to application.
 * @param argc number of command line arguments
 * @param argv array of command line arguments
 * @return 0 after a clean shutdown
 */
int main(int argc, char *argv[])
{
    parse_args(argc, argv);
    set_log_level(log_level);

    railnet::MemoryLayout layout;
    if (!layout.load_file(layout_file))
    {
        LOG_ERROR("Could not load layout %s", layout_file);
        return 1;
    }

    railnet::LinkConfig config;
    config.connTimeout = conn_timeout;
    config.maxHeartbeatFail = max_heartbeat_fail;

    railnet::HostBridge bridge(&layout, config);
    bridge.bind();
    if (initialize)
    {
        bridge.initialize_layout();
    }

    HostContext ctx = {&layout, &bridge};
    Console console(stdin, stdout);
    console.add_command("turnout", turnout_command, &ctx);
    console.add_command("signal", signal_command, &ctx);
    console.add_command("sensors", sensors_command, &ctx);
    console.add_command("links", links_command, &ctx);
    console.run();

    LOG(INFO, "Shutting down the layout");
    bridge.shutdown_layout();
    return 0;
}
