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

#ifndef MULTICAST_EVENT_HPP_
#define MULTICAST_EVENT_HPP_

#include <concepts>
#include <cstddef>
#include <exception>
#include <memory>
#include <mutex>

#include "allocator.hpp"
#include "delegate.hpp"
#include "error.hpp"
#include "helper.hpp"
#include "snapshot.hpp"
#include "spinlock.hpp"


namespace multicast
{

    //
    // Event is a thread-safe multicast callback list.
    //
    // The registered delegates live in an immutable, reference-counted
    // Snapshot. Writers (add, remove, clear) serialize on change_lock, build
    // a complete replacement snapshot, and publish it by exchanging it for
    // the current one under swap_lock. Raising the event (call) takes only
    // swap_lock, and only long enough to take a reference to the current
    // snapshot; the delegates are invoked with no lock held. So a slow or
    // re-entrant handler never holds up writers or other callers, and every
    // call sees exactly one published set of delegates.
    //
    // Lock order is always change_lock then swap_lock, and swap_lock is
    // never held while user code runs or while a snapshot is released.
    //
    template<typename T, typename SwapLock = BasicSpinLock<ShortSectionSpinPolicy>>
    class Event
    {
    public: // types
        using Target = T;
        using DelegateType = Delegate<T>;
        using SnapshotType = Snapshot<DelegateType>;

    public: // methods
        explicit Event(AbstractAllocator& buffer_allocator = HeapAllocator::instance()):
            allocator(buffer_allocator)
        {
        }
        ~Event() = default;

        // Registers `target` and returns the token to remove it with.
        // Throws OutOfMemory, MarshalingFailure, or std::invalid_argument
        // for a null target; on failure the event is unchanged.
        Token add(const std::shared_ptr<T>& target);

        // Removes the first delegate registered under `token`. Unknown
        // tokens are ignored. May throw OutOfMemory, leaving the event
        // unchanged.
        void remove(Token token);

        void clear();

        // Invokes `callback` with each registered target, in registration
        // order, on the calling thread. Delegates whose invocation throws
        // TargetGone or ContextGone are removed and the rest still run; any
        // other exception stops the iteration and propagates.
        template<typename F>
            requires std::invocable<F&, T&>
        void call(F&& callback);

        std::size_t size() const;
        bool empty() const { return size() == 0; }

    private: // methods
        Event(const Event&) = delete;
        Event& operator=(const Event&) = delete;
        Event(Event&&) = delete;
        Event& operator=(Event&&) = delete;

        // Publishes `replacement` and returns the previous snapshot.
        // Caller holds change_lock.
        SnapshotType publish(SnapshotType replacement);

    private: // data members
        mutable SwapLock swap_lock;
        std::mutex change_lock;

        // Written only with both locks held. Read with swap_lock held, or
        // with change_lock held (writers are the only ones who replace it).
        SnapshotType delegates;

        AbstractAllocator& allocator;
    };


    template<typename T, typename SwapLock>
    typename Event<T, SwapLock>::SnapshotType Event<T, SwapLock>::publish(SnapshotType replacement)
    {
        std::scoped_lock<SwapLock> guard(swap_lock);
        return delegates.swapWith(std::move(replacement));
    }


    template<typename T, typename SwapLock>
    Token Event<T, SwapLock>::add(const std::shared_ptr<T>& target)
    {
        // Declared before the lock so the old snapshot, and possibly the
        // last reference to its buffer, is released after unlocking.
        SnapshotType lock_free_drop;
        Token token = 0;
        {
            std::scoped_lock<std::mutex> change_guard(change_lock);

            auto new_delegates = SnapshotType::withCapacity(allocator, delegates.size() + 1);
            for (const auto& delegate : delegates.items())
            {
                new_delegates.push(delegate);
            }

            auto delegate = DelegateType::fromTarget(target);
            token = delegate.token();
            new_delegates.push(std::move(delegate));

            lock_free_drop.swapWith(publish(std::move(new_delegates)));
        }

        debug_println("Event: added delegate {}", token);
        return token;
    }


    template<typename T, typename SwapLock>
    void Event<T, SwapLock>::remove(Token token)
    {
        SnapshotType lock_free_drop;
        {
            std::scoped_lock<std::mutex> change_guard(change_lock);

            auto current = delegates.items();
            std::size_t match = current.size();
            for (std::size_t i = 0; i < current.size(); ++i)
            {
                if (current[i].token() == token)
                {
                    match = i;
                    break;
                }
            }
            if (match == current.size())
            {
                return;
            }

            // the last delegate leaves an empty, unallocated snapshot
            auto new_delegates = SnapshotType::withCapacity(allocator, current.size() - 1);
            for (std::size_t i = 0; i < current.size(); ++i)
            {
                if (i != match)
                {
                    new_delegates.push(current[i]);
                }
            }

            lock_free_drop.swapWith(publish(std::move(new_delegates)));
        }

        debug_println("Event: removed delegate {}", token);
    }


    template<typename T, typename SwapLock>
    void Event<T, SwapLock>::clear()
    {
        SnapshotType lock_free_drop;
        {
            std::scoped_lock<std::mutex> change_guard(change_lock);
            if (delegates.empty())
            {
                return;
            }
            lock_free_drop.swapWith(publish(SnapshotType()));
        }

        debug_println("Event: cleared {} delegates", lock_free_drop.size());
    }


    template<typename T, typename SwapLock>
    template<typename F>
        requires std::invocable<F&, T&>
    void Event<T, SwapLock>::call(F&& callback)
    {
        const SnapshotType lock_free_calls = [this]() {
            std::scoped_lock<SwapLock> guard(swap_lock);
            return delegates;
        }();

        for (const auto& delegate : lock_free_calls.items())
        {
            try
            {
                delegate.invoke(callback);
            }
            catch (const std::exception& error)
            {
                e_errorClass error_class = classifyError(error);
                if (error_class == e_errorClass::other)
                {
                    throw;
                }

                debug_println("Event: dropping delegate {} ({}): {}",
                              delegate.token(), toString(error_class), error.what());
                remove(delegate.token());
            }
        }
    }


    template<typename T, typename SwapLock>
    std::size_t Event<T, SwapLock>::size() const
    {
        std::scoped_lock<SwapLock> guard(swap_lock);
        return delegates.size();
    }

} // namespace multicast


#endif // MULTICAST_EVENT_HPP_
