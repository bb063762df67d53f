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
 * \file railnet/CommandDispatcher.hxx
 *
 * Routes decoded frames to the handler registered for their type.
 *
 * @date 4 March 2024
 */

#ifndef _RAILNET_COMMANDDISPATCHER_HXX_
#define _RAILNET_COMMANDDISPATCHER_HXX_

#include "os/OS.hxx"
#include "railnet/Command.hxx"
#include "railnet/Link.hxx"

namespace railnet
{

/** Handles one type of command.
 */
class CommandHandler
{
public:
    virtual ~CommandHandler()
    {
    }

    /** Executes a command. Runs on the thread of the link that received it
     * and must not block for longer than the device action itself.
     * @param cmd decoded command
     * @param reply sink of the peer that sent the command
     * @return nullptr on success, else a reason token that is reported back
     * to the peer in a diagnostic frame
     */
    virtual const char *handle_command(const Command &cmd, FrameSink *reply) = 0;
};

/** Decodes frames and invokes the registered CommandHandler. Decoding
 * failures and handler failures are answered with ERROR frames; received
 * ERROR frames are only logged. Can be used directly as the LinkListener of
 * any number of links.
 */
class CommandDispatcher : public LinkListener
{
public:
    CommandDispatcher();

    /** Registers a handler. At most one handler per type.
     * @param type command type to handle
     * @param handler handler, not owned, must outlive the dispatcher's use
     */
    void register_handler(Command::Type type, CommandHandler *handler);

    /// Removes the handler of a type, if any.
    void unregister_handler(Command::Type type);

    /** Decodes one frame and dispatches it.
     * @param frame frame text without delimiter
     * @param reply sink the answers go to
     */
    void dispatch_frame(const string &frame, FrameSink *reply);

    /** Dispatches one decoded command.
     * @param cmd command
     * @param reply sink the answers go to
     */
    void dispatch(const Command &cmd, FrameSink *reply);

    void on_frame(Link *link, const string &frame) override
    {
        dispatch_frame(frame, link);
    }

    /// @return number of ERROR frames this dispatcher answered with.
    unsigned error_count()
    {
        return errors_;
    }

private:
    /// Sends a diagnostic frame back to the peer.
    void report_error(const string &raw, const char *why, FrameSink *reply);

    static constexpr unsigned NUM_TYPES = Command::REMOTE_ERROR + 1;

    OSMutex lock_;
    CommandHandler *handlers_[NUM_TYPES];
    std::atomic<unsigned> errors_;

    DISALLOW_COPY_AND_ASSIGN(CommandDispatcher);
};

} // namespace railnet

#endif // _RAILNET_COMMANDDISPATCHER_HXX_
