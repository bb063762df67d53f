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
 * \file Console.cxx
 *
 * This file provides an implementation of an interactive text console.
 *
 * @date 10 May 2014
 */

#include "console/Console.hxx"

#include <cstdlib>
#include <cstring>
#include <sys/types.h>

/*
 * Console::Console()
 */
Console::Console(FILE *in, FILE *out, const char *prompt)
    : in_(in)
    , out_(out)
    , prompt_(prompt)
{
    add_command("help", help_command, this);
    add_command("?", help_command, this);
    add_command("quit", quit_command, this);
}

/*
 * Console::add_command()
 */
void Console::add_command(const char *name, Callback callback, void *context)
{
    commands_.push_back({name, callback, context});
}

/*
 * Console::help_command()
 */
Console::CommandStatus Console::help_command(
    FILE *fp, int argc, const char *argv[], void *context)
{
    if (argc == 0)
    {
        fprintf(fp, "print out this help menu\n");
        return COMMAND_OK;
    }
    Console *console = static_cast<Console *>(context);
    /* call each of the commands with argc = 0 */
    for (Command &current : console->commands_)
    {
        if (current.callback == help_command)
        {
            continue;
        }
        fprintf(fp, "%10s : ", current.name);
        const char *help_argv[2] = {current.name, "             "};
        (*current.callback)(fp, 0, help_argv, current.context);
    }
    fprintf(fp, "%10s : print out this help menu\n", "help | ?");
    return COMMAND_OK;
}

/*
 * Console::quit_command()
 */
Console::CommandStatus Console::quit_command(
    FILE *fp, int argc, const char *argv[], void *context)
{
    switch (argc)
    {
        case 0:
            fprintf(fp, "shut the layout down and exit\n");
            return COMMAND_OK;
        case 1:
            return COMMAND_CLOSE;
        default:
            return COMMAND_ERROR;
    }
}

/*
 * Console::tokenize()
 */
int Console::tokenize(char *line, std::vector<const char *> *argv)
{
    argv->clear();
    char quote = '\0'; // Quote mark we are in (\0 means no quotes).
    bool in_arg = false;
    for (char *p = line; *p; ++p)
    {
        if (quote != '\0')
        {
            if (*p == quote)
            {
                /* End of quoted */
                *p = '\0';
                quote = '\0';
                in_arg = false;
            }
            continue;
        }
        switch (*p)
        {
            case '\r':
            case '\n':
            case '\t':
            case ' ':
                *p = '\0';
                in_arg = false;
                break;
            case '\'':
            case '"':
                quote = *p;
                *p = '\0';
                argv->push_back(p + 1);
                in_arg = true;
                break;
            default:
                if (!in_arg)
                {
                    argv->push_back(p);
                    in_arg = true;
                }
                break;
        }
    }
    if (quote != '\0')
    {
        return -1;
    }
    return argv->size();
}

/*
 * Console::callback()
 */
Console::CommandStatus Console::callback(int argc, const char *argv[])
{
    /* run through each command */
    for (Command &current : commands_)
    {
        /* look for a command match */
        if (strcmp(current.name, argv[0]) == 0)
        {
            return (*current.callback)(out_, argc, argv, current.context);
        }
    }
    return COMMAND_NOT_FOUND;
}

/*
 * Console::process_line()
 */
bool Console::process_line(const string &line)
{
    std::vector<char> buf(line.begin(), line.end());
    buf.push_back('\0');
    std::vector<const char *> args;
    int argc = tokenize(buf.data(), &args);
    if (argc < 0)
    {
        fprintf(out_, "syntax error: unclosed quote\n");
        return true;
    }
    if (argc == 0)
    {
        return true;
    }
    if ((size_t)argc > MAX_ARGS)
    {
        fprintf(out_, "too many arguments\n");
        return true;
    }
    switch (callback(argc, args.data()))
    {
        default:
            break;
        case COMMAND_ERROR:
            fprintf(out_, "invalid arguments\n");
            break;
        case COMMAND_CLOSE:
            return false;
        case COMMAND_NOT_FOUND:
            fprintf(out_, "%s: command not found\n", args[0]);
            break;
    }
    return true;
}

/*
 * Console::run()
 */
void Console::run()
{
    char *line = nullptr;
    size_t line_size = 0;
    while (true)
    {
        fputs(prompt_, out_);
        fflush(out_);
        ssize_t len = getline(&line, &line_size, in_);
        if (len < 0)
        {
            break;
        }
        if (!process_line(string(line, len)))
        {
            break;
        }
        fflush(out_);
    }
    free(line);
}
