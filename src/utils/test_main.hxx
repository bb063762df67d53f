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
 * \file utils/test_main.hxx
 *
 * Unittest entry point. Include this file exactly once, into the test file
 * that defines the tests; it provides the main function, the log sink used
 * while testing and a few helpers for tests that involve threads.
 *
 * @date 3 Nov 2013
 */

#ifdef _UTILS_TEST_MAIN_HXX_
#error Only ever include test_main into the main unittest file.
#else
#define _UTILS_TEST_MAIN_HXX_

#include <stdio.h>
#include <functional>
#include <string>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "os/OS.hxx"
#include "utils/logging.h"

int main(int argc, char *argv[])
{
    testing::InitGoogleMock(&argc, argv);
    set_log_level(VERBOSE);
    return RUN_ALL_TESTS();
}

/// Set to false to see the log output of the tests on stderr.
bool mute_log_output = true;
/// Set to true to collect the log lines in captured_log_lines.
bool capture_log_output = false;
/// Log lines collected while capture_log_output was true. Guarded by the
/// log lock.
std::vector<std::string> captured_log_lines;

extern "C" {

void log_output(char *buf, int size)
{
    if (size <= 0)
    {
        return;
    }
    if (capture_log_output)
    {
        captured_log_lines.emplace_back(buf, size);
    }
    if (mute_log_output)
    {
        return;
    }
    fwrite(buf, size, 1, stderr);
    fwrite("\n", 1, 1, stderr);
}

}

/** Collects the log lines written while it is alive. */
class LogCapture
{
public:
    LogCapture()
    {
        LOCK_LOG;
        captured_log_lines.clear();
        capture_log_output = true;
        UNLOCK_LOG;
    }

    ~LogCapture()
    {
        LOCK_LOG;
        capture_log_output = false;
        UNLOCK_LOG;
    }

    /// @return true if any captured line contains @p needle.
    bool contains(const std::string &needle)
    {
        LOCK_LOG;
        bool found = false;
        for (const auto &l : captured_log_lines)
        {
            if (l.find(needle) != std::string::npos)
            {
                found = true;
                break;
            }
        }
        UNLOCK_LOG;
        return found;
    }
};

/** Polls a condition until it holds or the timeout expires.
 * @param cond condition to wait for
 * @param timeout_nsec maximum time to wait
 * @return the final value of the condition
 */
bool wait_for(std::function<bool()> cond,
    long long timeout_nsec = SEC_TO_NSEC(5))
{
    long long deadline = OSTime::get_monotonic() + timeout_nsec;
    while (!cond())
    {
        if (OSTime::get_monotonic() > deadline)
        {
            return cond();
        }
        OSThread::sleep_nsec(MSEC_TO_NSEC(5));
    }
    return true;
}

#endif // _UTILS_TEST_MAIN_HXX_
