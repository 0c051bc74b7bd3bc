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

#ifndef MULTICAST_AGILE_REFERENCE_HPP_
#define MULTICAST_AGILE_REFERENCE_HPP_

#include <format>
#include <memory>
#include <string>
#include <utility>

#include "context.hpp"
#include "error.hpp"
#include "lifetimeobserver.hpp"


namespace multicast
{

    //
    // AgileReference stands in for a target that belongs to a Context. It
    // can be copied to and stored on any thread; resolve() hands back the
    // target only while the owning context is still alive.
    //
    template<typename T>
    class AgileReference
    {
    public: // methods
        // Wraps `target` for the context bound to the calling thread.
        // Throws MarshalingFailure when there is no such context.
        static AgileReference wrap(std::shared_ptr<T> target);

        // Throws ContextGone once the owning context has been destroyed.
        std::shared_ptr<T> resolve() const;

        bool isContextAlive() const { return context_lifetime.isAlive(); }
        const std::string& getContextName() const { return context_name; }

        AgileReference(const AgileReference&) = default;
        ~AgileReference() = default;

    private: // methods
        AgileReference(std::shared_ptr<T> wrapped, const Context& owner):
            target(std::move(wrapped)),
            context_lifetime(owner.getObserver()),
            context_name(owner.getName())
        {
        }

        AgileReference& operator=(const AgileReference&) = delete;
        AgileReference& operator=(AgileReference&&) = delete;

    private: // data members
        std::shared_ptr<T> target;
        LifetimeObserver context_lifetime;
        std::string context_name;
    };


    template<typename T>
    AgileReference<T> AgileReference<T>::wrap(std::shared_ptr<T> target)
    {
        if (!target)
        {
            throw MarshalingFailure("Cannot marshal a null target");
        }

        const Context* owner = Context::current();
        if (owner == nullptr)
        {
            throw MarshalingFailure(
                "Target is not agile and no Context is bound to the registering thread");
        }

        return AgileReference(std::move(target), *owner);
    }


    template<typename T>
    std::shared_ptr<T> AgileReference<T>::resolve() const
    {
        if (!context_lifetime.isAlive())
        {
            throw ContextGone(std::format("Context '{}' has been destroyed", context_name));
        }
        return target;
    }

} // namespace multicast


#endif // MULTICAST_AGILE_REFERENCE_HPP_
