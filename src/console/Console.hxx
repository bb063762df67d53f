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
 * \file Console.hxx
 *
 * This file provides an implementation of an interactive text console.
 *
 * @date 10 May 2014
 */

#ifndef _CONSOLE_CONSOLE_HXX_
#define _CONSOLE_CONSOLE_HXX_

#include <cstdio>
#include <string>
#include <vector>

#include "utils/macros.h"

/** This class provides a line based console on a pair of stdio streams.
 * Adding a command to the console is as simple as using the @ref
 * add_command() method. A command callback is responsible for providing its
 * own help text. When the command callback is called with argc = 0, this is
 * a clue to the callback to print its help information. In this case, argv[0]
 * will still have the command name itself, but argv[1] will have an
 * additional parameter that can be used to indent and align multi-line help
 * information.
 *
 * Arguments are separated by spaces. Single or double quotes group an
 * argument that contains spaces.
 */
class Console
{
public:
    /** Enumeration of recognized command callback results.
     */
    enum CommandStatus
    {
        COMMAND_OK,        /**< Command executed successfully */
        COMMAND_ERROR,     /**< Command had some kind of error */
        COMMAND_CLOSE,     /**< Command wants to close the session. */
        COMMAND_NOT_FOUND, /**< Command not found */
    };

    /** Console command callback.
     */
    typedef CommandStatus (*Callback)(FILE *, int, const char *argv[], void *);

    /** Constructor.
     * @param in stream the command lines are read from
     * @param out stream prompts and command output are written to
     * @param prompt prompt printed before each line
     */
    Console(FILE *in, FILE *out, const char *prompt = "> ");

    /** Add a new command to the console.
     * @param name command name
     * @param callback callback function for command
     * @param context context pointer to pass into callback
     */
    void add_command(const char *name, Callback callback, void *context = NULL);

    /** Reads and executes lines until end of input or until a command asks
     * to close the session.
     */
    void run();

    /** Executes one line of input.
     * @param line command line, with or without the trailing newline
     * @return false if the session should close
     */
    bool process_line(const string &line);

    /** Splits a line into arguments.
     * @param line command line; modified in place
     * @param argv filled with pointers into line
     * @return number of arguments, or -1 on a syntax error
     */
    static int tokenize(char *line, std::vector<const char *> *argv);

    /** Maximum number of supported arguments including the command itself */
    static const size_t MAX_ARGS = 10;

private:
    /** Console command metadata.
     */
    struct Command
    {
        const char *name;  /**< command name */
        Callback callback; /**< callback function for command */
        void *context;     /**< context pointer to pass into callback */
    };

    /** Runs the command named in argv[0].
     * @return status of the command
     */
    CommandStatus callback(int argc, const char *argv[]);

    /** Prints the help text of every command.
     */
    static CommandStatus help_command(
        FILE *fp, int argc, const char *argv[], void *context);

    /** Closes the session.
     */
    static CommandStatus quit_command(
        FILE *fp, int argc, const char *argv[], void *context);

    FILE *in_;
    FILE *out_;
    const char *prompt_;
    std::vector<Command> commands_;

    DISALLOW_COPY_AND_ASSIGN(Console);
};

#endif /* _CONSOLE_CONSOLE_HXX_ */
