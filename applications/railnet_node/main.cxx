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
 * \file railnet_node/main.cxx
 *
 * Actuator host: drives the servos, signal LEDs and sensors of one layout
 * section on behalf of the origin host connected over TCP.
 *
 * @date 14 March 2024
 */

#include <getopt.h>
#include <pthread.h>
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>

#include "railnet/LinuxHardware.hxx"
#include "railnet/NodeServer.hxx"
#include "utils/logging.h"

int port = railnet::Defs::DEFAULT_NODE_PORT;
const char *i2c_path = "/dev/i2c-1";
int servo_base = 0x40;
long long conn_timeout = railnet::Defs::CONN_TIMEOUT;
int max_heartbeat_fail = railnet::Defs::MAX_HEARTBEAT_FAIL;
int log_level = INFO;

void usage(const char *e)
{
    fprintf(stderr, "Usage: %s [-p port] [-i i2c_bus] [-s servo_base] "
                    "[-t timeout_msec] [-f max_fail] [-v] [-q]\n\n",
            e);
    fprintf(stderr, "Railnet actuator host.\nListens for one origin host, "
                    "executes its turnout and signal head commands and "
                    "reports the state of the registered sensors.\n\n"
                    "Arguments:\n");
    fprintf(stderr, "\t-p port     specifies the port number to listen on, "
                    "default is %d.\n", railnet::Defs::DEFAULT_NODE_PORT);
    fprintf(stderr, "\t-i i2c_bus  is the I2C bus device, default is "
                    "/dev/i2c-1.\n");
    fprintf(stderr, "\t-s servo_base   is the I2C address of the first servo "
                    "board, default is 0x40.\n");
    fprintf(stderr, "\t-t timeout_msec   is the connection timeout, default "
                    "is 3000.\n");
    fprintf(stderr, "\t-f max_fail   is the number of silent timeouts after "
                    "which the link is dead, default is %d.\n",
            railnet::Defs::MAX_HEARTBEAT_FAIL);
    fprintf(stderr, "\t-v more verbose logging, -q less logging.\n");
    exit(1);
}

void parse_args(int argc, char *argv[])
{
    int opt;
    while ((opt = getopt(argc, argv, "hp:i:s:t:f:vq")) >= 0)
    {
        switch (opt)
        {
            case 'h':
                usage(argv[0]);
                break;
            case 'p':
                port = atoi(optarg);
                break;
            case 'i':
                i2c_path = optarg;
                break;
            case 's':
                servo_base = strtol(optarg, nullptr, 0);
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
    if (port <= 0 || port > 65535 || conn_timeout <= 0 ||
        max_heartbeat_fail <= 0 || servo_base < 0 || servo_base > 0x7F)
    {
        usage(argv[0]);
    }
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

    /* block the termination signals in every thread, main waits for them */
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    railnet::LinkConfig config;
    config.connTimeout = conn_timeout;
    config.maxHeartbeatFail = max_heartbeat_fail;

    railnet::LinuxHardware hardware(i2c_path, servo_base);
    railnet::NodeServer server(&hardware, port, config);
    if (!server.start())
    {
        LOG_ERROR("Could not listen on port %d", port);
        return 1;
    }
    LOG(INFO, "Listening on port %d", server.port());

    int sig = 0;
    sigwait(&signals, &sig);
    LOG(INFO, "Signal %d, shutting down", sig);
    server.stop();
    return 0;
}
