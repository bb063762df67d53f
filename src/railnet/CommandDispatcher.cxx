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
 * \file railnet/CommandDispatcher.cxx
 *
 * Implementation of the command dispatcher.
 *
 * @date 4 March 2024
 */

#include "railnet/CommandDispatcher.hxx"

#include "utils/logging.h"

namespace railnet
{

constexpr unsigned CommandDispatcher::NUM_TYPES;

CommandDispatcher::CommandDispatcher()
    : errors_(0)
{
    for (unsigned i = 0; i < NUM_TYPES; ++i)
    {
        handlers_[i] = nullptr;
    }
}

void CommandDispatcher::register_handler(
    Command::Type type, CommandHandler *handler)
{
    HASSERT(handler);
    HASSERT((unsigned)type < NUM_TYPES);
    OSMutexLock l(&lock_);
    HASSERT(handlers_[type] == nullptr);
    handlers_[type] = handler;
}

void CommandDispatcher::unregister_handler(Command::Type type)
{
    HASSERT((unsigned)type < NUM_TYPES);
    OSMutexLock l(&lock_);
    handlers_[type] = nullptr;
}

void CommandDispatcher::dispatch_frame(const string &frame, FrameSink *reply)
{
    dispatch(parse_command(frame), reply);
}

void CommandDispatcher::dispatch(const Command &cmd, FrameSink *reply)
{
    switch (cmd.type)
    {
        case Command::PARSE_ERROR:
            LOG(WARNING, "%s: cannot parse [%s]: %s", reply->name().c_str(),
                cmd.raw.c_str(), cmd.reason);
            report_error(cmd.raw, cmd.reason, reply);
            return;
        case Command::REMOTE_ERROR:
            LOG(WARNING, "%s: peer reported [%s]", reply->name().c_str(),
                cmd.raw.c_str());
            break;
        default:
            break;
    }

    CommandHandler *handler;
    {
        OSMutexLock l(&lock_);
        handler = handlers_[cmd.type];
    }
    if (!handler)
    {
        if (cmd.type != Command::REMOTE_ERROR)
        {
            LOG(WARNING, "%s: no handler for [%s]", reply->name().c_str(),
                cmd.raw.c_str());
            report_error(cmd.raw, reason::UNSUPPORTED, reply);
        }
        return;
    }
    const char *why = handler->handle_command(cmd, reply);
    if (why && cmd.type != Command::REMOTE_ERROR)
    {
        report_error(cmd.raw, why, reply);
    }
}

void CommandDispatcher::report_error(
    const string &raw, const char *why, FrameSink *reply)
{
    ++errors_;
    if (!reply->send(format_error(raw, why)))
    {
        LOG_ERROR("%s: could not report error for [%s]",
            reply->name().c_str(), raw.c_str());
    }
}

} // namespace railnet
