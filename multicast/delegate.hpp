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

#ifndef MULTICAST_DELEGATE_HPP_
#define MULTICAST_DELEGATE_HPP_

#include <atomic>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <utility>
#include <variant>

#include "agilereference.hpp"
#include "context.hpp"


namespace multicast
{

    using Token = int64_t;

    // Tokens come from one process-wide sequence so a token from one event
    // can never match a delegate registered with another. 0 is never issued.
    inline Token nextToken() noexcept
    {
        static std::atomic<Token> next_token{1};
        return next_token.fetch_add(1, std::memory_order_relaxed);
    }


    //
    // A Delegate is one registration: the target, held either directly (it
    // is agile) or through an AgileReference, plus the token it was issued.
    // Copies share the target and the token.
    //
    template<typename T>
    class Delegate
    {
    public: // methods
        // Throws std::invalid_argument for a null target, MarshalingFailure
        // if a non-agile target cannot be wrapped.
        static Delegate fromTarget(const std::shared_ptr<T>& target)
        {
            if (!target)
            {
                throw std::invalid_argument("Cannot register a null delegate target");
            }
            if (isAgile(*target))
            {
                return Delegate(target);
            }
            return Delegate(AgileReference<T>::wrap(target));
        }

        Token token() const noexcept { return delegate_token; }

        bool isDirect() const noexcept { return std::holds_alternative<std::shared_ptr<T>>(reference); }

        // Passes the target to `callback`. For an indirect delegate this
        // resolves first, so ContextGone may be thrown before the callback
        // runs. Whatever the callback throws propagates unchanged.
        template<typename F>
        void invoke(F&& callback) const
        {
            if (auto* direct = std::get_if<std::shared_ptr<T>>(&reference))
            {
                std::forward<F>(callback)(**direct);
            }
            else
            {
                std::shared_ptr<T> resolved = std::get<AgileReference<T>>(reference).resolve();
                std::forward<F>(callback)(*resolved);
            }
        }

    private: // methods
        explicit Delegate(std::shared_ptr<T> target):
            reference(std::move(target)),
            delegate_token(nextToken())
        {
        }

        explicit Delegate(AgileReference<T> target):
            reference(std::move(target)),
            delegate_token(nextToken())
        {
        }

    private: // data members
        std::variant<std::shared_ptr<T>, AgileReference<T>> reference;
        Token delegate_token;
    };

} // namespace multicast


#endif // MULTICAST_DELEGATE_HPP_
