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

#ifndef MULTICAST_SPINLOCK_HPP_
#define MULTICAST_SPINLOCK_HPP_

#include <atomic>
#include <chrono>
#include <random>
#include <thread>


// ThreadSanitizer does not understand atomic_flag based locks on its own;
// these annotations describe the acquire/release edges of SpinLock to it.
#ifdef __has_feature
  #if __has_feature(thread_sanitizer)
    #define MULTICAST_TSAN_ENABLED 1
  #endif
#endif
#if defined(__SANITIZE_THREAD__) && !defined(MULTICAST_TSAN_ENABLED)
  #define MULTICAST_TSAN_ENABLED 1
#endif

#ifdef MULTICAST_TSAN_ENABLED
extern "C" {
    void __tsan_acquire(void *addr);
    void __tsan_release(void *addr);
}
#define MULTICAST_TSAN_HAPPENS_BEFORE(addr) __tsan_release(addr)
#define MULTICAST_TSAN_HAPPENS_AFTER(addr)  __tsan_acquire(addr)
#else
#define MULTICAST_TSAN_HAPPENS_BEFORE(addr)
#define MULTICAST_TSAN_HAPPENS_AFTER(addr)
#endif


namespace multicast
{

    //
    // Tuning knobs for BasicSpinLock.
    //
    // spin_iterations: relaxed test/yield rounds while the lock looks held,
    //   before trying to take it.
    // backoff_steps: failed acquisitions answered by a randomized, doubling
    //   sleep. After that many the waiter parks on the flag until unlock().
    // initial_backoff_max_ns: upper bound of the first randomized sleep.
    //
    struct DefaultSpinPolicy
    {
        static constexpr int spin_iterations = 100;
        static constexpr int backoff_steps = 10;
        static constexpr int initial_backoff_max_ns = 100;
    };

    // For sections only ever held for a handful of instructions, such as
    // publishing a snapshot. Parks almost immediately instead of sleeping.
    struct ShortSectionSpinPolicy
    {
        static constexpr int spin_iterations = 32;
        static constexpr int backoff_steps = 2;
        static constexpr int initial_backoff_max_ns = 50;
    };


    //
    // Test-and-test-and-set spin lock with escalating, randomized backoff.
    // Meets the Lockable requirements, so std::scoped_lock and
    // std::unique_lock work with it.
    //
    template<typename Policy = DefaultSpinPolicy>
    class BasicSpinLock
    {
        static_assert(Policy::spin_iterations > 0, "Policy must spin at least once");
        static_assert(Policy::backoff_steps >= 0, "Policy backoff_steps cannot be negative");
        static_assert(Policy::initial_backoff_max_ns > 0, "Policy initial backoff must be positive");

    public: // methods
        BasicSpinLock() = default;
        ~BasicSpinLock() = default;

        void lock()
        {
            // Per-thread generator; no shared state to synchronize
            thread_local static std::minstd_rand gen{std::random_device{}()};
            std::uniform_int_distribution<int> dist{1, Policy::initial_backoff_max_ns};

            // Randomizing the first wait spreads contending threads apart so
            // they do not all retry the flag at the same instant after a
            // release.
            std::chrono::nanoseconds wait_time{dist(gen)};

            int backoff_count = 0;

            while (true)
            {
                for (int i = 0; i < Policy::spin_iterations; ++i)
                {
                    if (!lock_flag.test(std::memory_order_relaxed))
                    {
                        break;
                    }
                    std::this_thread::yield();
                }

                if (!lock_flag.test_and_set(std::memory_order_acquire))
                {
                    MULTICAST_TSAN_HAPPENS_AFTER(this);
                    return;
                }

                if (backoff_count < Policy::backoff_steps)
                {
                    std::this_thread::sleep_for(wait_time);
                    wait_time += wait_time;
                    ++backoff_count;
                }
                else
                {
                    lock_flag.wait(true, std::memory_order_relaxed);
                }
            }
        }

        bool try_lock()
        {
            if (lock_flag.test(std::memory_order_relaxed))
            {
                return false;
            }

            if (!lock_flag.test_and_set(std::memory_order_acquire))
            {
                MULTICAST_TSAN_HAPPENS_AFTER(this);
                return true;
            }
            return false;
        }

        void unlock()
        {
            MULTICAST_TSAN_HAPPENS_BEFORE(this);
            lock_flag.clear(std::memory_order_release);
            lock_flag.notify_one();
        }

        // Diagnostic only; the answer may be stale by the time it is used.
        bool isLocked() const
        {
            return lock_flag.test(std::memory_order_relaxed);
        }

    private: // methods
        BasicSpinLock(const BasicSpinLock&) = delete;
        BasicSpinLock& operator=(const BasicSpinLock&) = delete;
        BasicSpinLock(BasicSpinLock&&) = delete;
        BasicSpinLock& operator=(BasicSpinLock&&) = delete;

    private: // data members
        std::atomic_flag lock_flag = ATOMIC_FLAG_INIT;
    };

    using SpinLock = BasicSpinLock<>;

} // namespace multicast


#endif // MULTICAST_SPINLOCK_HPP_
