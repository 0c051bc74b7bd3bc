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

#ifndef MULTICAST_ERROR_HPP_
#define MULTICAST_ERROR_HPP_

#include <cstddef>
#include <exception>
#include <format>
#include <stdexcept>
#include <string>


namespace multicast
{

    enum class e_errorCode
    {
        out_of_memory,
        marshaling_failed,
        target_gone,        // the target itself is permanently unreachable
        context_gone        // the context that owns the target was torn down
    };


    // Base of every error this library raises. Callers that only care about
    // "did the registry operation fail" can catch this; the event itself
    // looks at code() through classifyError() below.
    class Error: public std::runtime_error
    {
    public: // methods
        Error(e_errorCode error_code, const std::string& what):
            std::runtime_error(what),
            code_value(error_code)
        {
        }

        e_errorCode code() const noexcept { return code_value; }

    private: // data members
        e_errorCode code_value;
    };


    class OutOfMemory: public Error
    {
    public: // methods
        explicit OutOfMemory(std::size_t requested_bytes):
            Error(e_errorCode::out_of_memory,
                  std::format("Unable to allocate {} bytes", requested_bytes)),
            requested(requested_bytes)
        {
        }

        std::size_t requestedBytes() const noexcept { return requested; }

    private: // data members
        std::size_t requested;
    };


    class MarshalingFailure: public Error
    {
    public: // methods
        explicit MarshalingFailure(const std::string& what):
            Error(e_errorCode::marshaling_failed, what)
        {
        }
    };


    // Thrown by targets (or by callbacks on their behalf) to report that the
    // target will never be reachable again, e.g. its remote peer hung up.
    class TargetGone: public Error
    {
    public: // methods
        explicit TargetGone(const std::string& what = "Target is permanently disconnected"):
            Error(e_errorCode::target_gone, what)
        {
        }
    };


    class ContextGone: public Error
    {
    public: // methods
        explicit ContextGone(const std::string& what = "Owning context has been destroyed"):
            Error(e_errorCode::context_gone, what)
        {
        }
    };


    enum class e_errorClass
    {
        target_gone,
        context_gone,
        other
    };

    //
    // Decides whether an error raised while invoking a delegate means the
    // delegate is dead (and should be dropped from its event) or is an
    // ordinary failure to hand back to whoever raised the event.
    //
    inline e_errorClass classifyError(const std::exception& error) noexcept
    {
        if (auto* multicast_error = dynamic_cast<const Error*>(&error))
        {
            switch (multicast_error->code())
            {
                case e_errorCode::target_gone:
                    return e_errorClass::target_gone;
                case e_errorCode::context_gone:
                    return e_errorClass::context_gone;
                default:
                    break;
            }
        }
        return e_errorClass::other;
    }

    inline const char* toString(e_errorClass error_class) noexcept
    {
        switch (error_class)
        {
            case e_errorClass::target_gone:
                return "target gone";
            case e_errorClass::context_gone:
                return "context gone";
            default:
                return "other";
        }
    }

} // namespace multicast


#endif // MULTICAST_ERROR_HPP_
