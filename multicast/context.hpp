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

#ifndef MULTICAST_CONTEXT_HPP_
#define MULTICAST_CONTEXT_HPP_

#include <string>
#include <type_traits>
#include <utility>

#include "helper.hpp"
#include "lifetimeobserver.hpp"


namespace multicast
{

    //
    // Marker base for targets that may be held and called from any thread
    // without going through a Context. Events store such targets directly.
    //
    class AgileObject
    {
    public: // methods
        virtual ~AgileObject() = default;

    protected: // methods
        AgileObject() = default;
        AgileObject(const AgileObject&) = default;
        AgileObject& operator=(const AgileObject&) = default;
    };


    // Capability probe: is `target` free-threaded?
    template<typename T>
    bool isAgile(const T& target)
    {
        if constexpr (std::is_base_of_v<AgileObject, T>)
        {
            return true;
        }
        else if constexpr (std::is_polymorphic_v<T>)
        {
            // the dynamic type may opt in even if T does not
            return dynamic_cast<const AgileObject*>(&target) != nullptr;
        }
        else
        {
            (void)target;
            return false;
        }
    }


    //
    // A Context is the owning execution context of targets that are not
    // agile, typically a UI or other single-threaded loop. Bind it to the
    // thread that runs it with a Context::Scope; targets registered with an
    // event from that thread are wrapped in an AgileReference that remembers
    // the context and refuses to resolve once the context has been destroyed.
    //
    // A context is bound to at most one thread at a time, and scopes nest:
    // leaving a scope restores whatever was current before it.
    //
    class Context: public LifetimeObserver
    {
    public: // types
        class Scope
        {
        public: // methods
            explicit Scope(Context& context):
                previous(std::exchange(current_context, &context))
            {
                debug_println("Context '{}' entered", context.getName());
            }

            ~Scope()
            {
                current_context = previous;
            }

        private: // methods
            Scope(const Scope&) = delete;
            Scope& operator=(const Scope&) = delete;
            Scope(Scope&&) = delete;
            Scope& operator=(Scope&&) = delete;

        private: // data members
            Context* previous;
        };

    public: // methods
        explicit Context(std::string context_name = "context"):
            name(std::move(context_name))
        {
        }

        ~Context()
        {
            debug_println("Context '{}' destroyed", name);
            if (current_context == this)
            {
                current_context = nullptr;
            }
        }

        const std::string& getName() const { return name; }

        // The context bound to the calling thread, or nullptr
        static Context* current() { return current_context; }

    private: // methods
        Context(const Context&) = delete;
        Context& operator=(const Context&) = delete;
        Context(Context&&) = delete;
        Context& operator=(Context&&) = delete;

    private: // data members
        std::string name;

        static inline thread_local Context* current_context = nullptr;
    };

} // namespace multicast


#endif // MULTICAST_CONTEXT_HPP_
