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
 * \file macros.h
 *
 * Assertion and class-declaration helpers shared by every railnet module.
 *
 * @date 2 March 2024
 */

#ifndef _UTILS_MACROS_H_
#define _UTILS_MACROS_H_

#ifdef __cplusplus
#include <string>
#include <vector>

using std::string;
using std::vector;
#endif

#include <stdio.h>
#include <stdlib.h>

/**
   Hard assertion facility. These checks remain in production code. They
   guard logic errors after which the process can not sensibly continue, such
   as registering a null handler or starting a thread twice. Runtime
   conditions (socket failures, bad frames, missing hardware) are never
   checked with HASSERT.
 */
#define HASSERT(x)                                                             \
    do                                                                         \
    {                                                                          \
        if (!(x))                                                              \
        {                                                                      \
            fprintf(stderr,                                                    \
                "Assertion failed in file " __FILE__ " line %d: assert(" #x    \
                ")\n",                                                         \
                __LINE__);                                                     \
            abort();                                                           \
        }                                                                      \
    } while (0)

/// Unconditionally terminates the process with a message.
#define DIE(MSG)                                                               \
    do                                                                         \
    {                                                                          \
        fprintf(stderr, "Crashed in file " __FILE__ " line %d: " MSG "\n",     \
            __LINE__);                                                         \
        abort();                                                               \
    } while (0)

#ifdef NDEBUG
/// Debug assertion facility. Compiled out when NDEBUG is defined.
#define DASSERT(x)
#else
#define DASSERT(x) HASSERT(x)
#endif

/**
   Removes default copy-constructor and assignment added by C++.

   This macro should be used in the private part of all classes that are not
   meant to be copied (which is almost all classes), to avoid bugs resulting
   from unintended passing of the objects by value.
 */
#define DISALLOW_COPY_AND_ASSIGN(TypeName)                                     \
    TypeName(const TypeName &) = delete;                                       \
    void operator=(const TypeName &) = delete

/** Returns the number of elements in a statically defined array (of static
 *  size) */
#define ARRAYSIZE(a) (sizeof(a) / sizeof(a[0]))

#endif // _UTILS_MACROS_H_
