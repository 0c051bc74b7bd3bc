/*
 * SPDX-License-Identifier: BSD-3-Clause
 *
 * Copyright (c) 2025, Michael VanLoon
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 * 1. Redistributions of source code must retain the above copyright notice, this
 *    list of conditions and the following disclaimer.
 *
 * 2. Redistributions in binary form must reproduce the above copyright notice,
 *    this list of conditions and the following disclaimer in the documentation
 *    and/or other materials provided with the distribution.
 *
 * 3. Neither the name of the copyright holder nor the names of its
 *    contributors may be used to endorse or promote products derived from
 *    this software without specific prior written permission.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
 * AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
 * IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
 * DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
 * FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
 * DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
 * SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
 * CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
 * OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
 * OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */

#ifndef MULTICAST_HELPER_HPP_
#define MULTICAST_HELPER_HPP_

#include <cstddef>
#include <cstdlib>
#include <format>
#include <iostream>
#include <source_location>
#include <string>
#include <version>

#if defined(__cpp_lib_print) && __cpp_lib_print >= 202207L
#include <print>
#endif


#ifndef NDEBUG
    constexpr bool DEBUG_BUILD = true;
#else
    constexpr bool DEBUG_BUILD = false;
#endif

// Library tracing is opt-in: define MULTICAST_VERBOSE_DEBUG (CMake option of
// the same name) in a debug build to see delegate registration, removal and
// allocation failures on stdout.
#ifdef MULTICAST_VERBOSE_DEBUG
    constexpr bool VERBOSE_DEBUG = DEBUG_BUILD;
#else
    constexpr bool VERBOSE_DEBUG = false;
#endif


namespace multicast
{

    #if defined(__cpp_lib_print) && __cpp_lib_print >= 202207L
        using std::print;
        using std::println;
    #else
        #pragma message("C++23 print and println not available; using std::format on std::cout")
        template<typename... Args>
        inline void print(std::format_string<Args...> fmt, Args&&... args)
        {
            std::cout << std::format(fmt, std::forward<Args>(args)...);
        }

        template<typename... Args>
        inline void println(std::format_string<Args...> fmt, Args&&... args)
        {
            std::cout << std::format(fmt, std::forward<Args>(args)...) << '\n';
        }
    #endif


    //
    // Debug-only trace output. The if constexpr drops the formatting work
    // entirely from release builds and from debug builds that did not ask
    // for verbose output.
    //
    template<typename... Args>
    inline void debug_print(std::format_string<Args...> fmt, Args&&... args)
    {
        if constexpr (VERBOSE_DEBUG) {
            print(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    inline void debug_println(std::format_string<Args...> fmt, Args&&... args)
    {
        if constexpr (VERBOSE_DEBUG) {
            println(fmt, std::forward<Args>(args)...);
        }
    }


    //
    // runtime_assert checks an internal invariant in debug builds and halts
    // with the failing location if it does not hold.
    //
    // It is for conditions that can only fail through a bug in this library
    // or a caller breaking a documented precondition (pushing past a
    // snapshot's reserved capacity, a reference count going negative). It is
    // not for conditions that can happen in a correct program, such as an
    // allocator running dry or a target disappearing; those are reported
    // with exceptions from error.hpp.
    //
    inline void runtime_assert(bool condition,
                               const char* message,
                               const std::source_location& loc = std::source_location::current())
    {
        if constexpr (DEBUG_BUILD)
        {
            if (!condition)
            {
                std::cerr << std::format(
                    "Runtime assertion failed: {}\n  File: {}:{}\n  Function: {}\n",
                    message, loc.file_name(), loc.line(), loc.function_name());
                std::abort();
            }
        }
    }

    inline void runtime_assert(bool condition,
                               const std::string& message,
                               const std::source_location& loc = std::source_location::current())
    {
        runtime_assert(condition, message.c_str(), loc);
    }

} // namespace multicast


#endif // MULTICAST_HELPER_HPP_
