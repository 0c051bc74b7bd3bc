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

#ifndef MULTICAST_LIFETIME_OBSERVER_HPP_
#define MULTICAST_LIFETIME_OBSERVER_HPP_

#include <atomic>
#include <cstdint>

#include "helper.hpp"


namespace multicast
{

    //
    // LifetimeObserver tracks whether an object is still alive from places
    // that must not keep it alive and may run on other threads.
    //
    // An object that wants to be observed derives from LifetimeObserver and
    // is the "owner". getObserver() hands out "observer" references that
    // share the owner's control block. When the owner is destroyed its
    // observers report isAlive() == false from then on; the control block
    // itself lives until the last reference of either kind goes away.
    //
    // Counts are atomic, so an observer may be checked or dropped on one
    // thread while the owner is destroyed on another. isAlive() only answers
    // "was the owner alive at the moment of the check"; it does not pin the
    // owner. Context uses it to let AgileReference detect that the context a
    // target belongs to has been torn down.
    //
    class LifetimeObserver
    {
    public: // types
        enum class e_refType
        {
            owner,
            observer
        };

    private: // encapsulated types
        struct ControlBlock
        {
            void addRef(e_refType ref_type);

            // Returns true when the caller dropped the last reference of any
            // kind and must delete the block.
            bool releaseRef(e_refType ref_type);

            int64_t getCount(e_refType ref_type) const;

            explicit ControlBlock(e_refType ref_type);
            ~ControlBlock() = default;

        private: // methods
            ControlBlock(const ControlBlock&) = delete;
            ControlBlock& operator=(const ControlBlock&) = delete;
            ControlBlock(ControlBlock&&) = delete;
            ControlBlock& operator=(ControlBlock&&) = delete;

        private: // data members
            std::atomic<int64_t> owner_count{0};
            std::atomic<int64_t> observer_count{0};
            // owners + observers; the block goes when this reaches zero
            std::atomic<int64_t> block_refs{0};
        };

        ControlBlock* control_block = nullptr;

    public: // methods
        bool isAlive() const;
        operator bool() const { return isAlive(); }

        LifetimeObserver getObserver() const;

        // Useful for diagnostics
        int64_t getCount(e_refType ref_type) const;
        e_refType getRefType() const { return my_ownership; }

        // Copying produces an observer of whatever this object observes or
        // owns. A derived class that wants its copies to be independent
        // owners must call the (other, e_refType::owner) constructor from
        // its own copy constructor.
        LifetimeObserver(const LifetimeObserver& other);

        // Adopts other's kind: copying from an owner makes this a fresh
        // owner, copying from an observer makes this an observer of the same
        // object.
        LifetimeObserver& operator=(const LifetimeObserver& other);

        ~LifetimeObserver();

    protected: // methods
        // Creates an owner reference with a new control block
        LifetimeObserver();

        LifetimeObserver(const LifetimeObserver& other, e_refType ref_type);

        // A moved-from owner is given a new control block, so it still owns
        // something. A moved-from observer observes nothing.
        LifetimeObserver(LifetimeObserver&& other) noexcept;
        LifetimeObserver& operator=(LifetimeObserver&& other) noexcept;

    private: // methods
        void attach(const LifetimeObserver& other, e_refType ref_type);
        void detach() noexcept;

    private: // data members
        e_refType my_ownership = e_refType::owner;
    };


    inline LifetimeObserver::ControlBlock::ControlBlock(e_refType ref_type)
    {
        addRef(ref_type);
    }


    inline void LifetimeObserver::ControlBlock::addRef(e_refType ref_type)
    {
        block_refs.fetch_add(1, std::memory_order_relaxed);
        if (ref_type == e_refType::owner)
        {
            owner_count.fetch_add(1, std::memory_order_relaxed);
        }
        else
        {
            observer_count.fetch_add(1, std::memory_order_relaxed);
        }
    }

    inline bool LifetimeObserver::ControlBlock::releaseRef(e_refType ref_type)
    {
        int64_t remaining = 0;
        if (ref_type == e_refType::owner)
        {
            remaining = owner_count.fetch_sub(1, std::memory_order_acq_rel) - 1;
        }
        else
        {
            remaining = observer_count.fetch_sub(1, std::memory_order_acq_rel) - 1;
        }
        runtime_assert(remaining >= 0, "Reference count went negative in LifetimeObserver");

        return block_refs.fetch_sub(1, std::memory_order_acq_rel) == 1;
    }

    inline int64_t LifetimeObserver::ControlBlock::getCount(e_refType ref_type) const
    {
        if (ref_type == e_refType::owner)
        {
            return owner_count.load(std::memory_order_acquire);
        }
        else
        {
            return observer_count.load(std::memory_order_acquire);
        }
    }


    inline bool LifetimeObserver::isAlive() const
    {
        return control_block != nullptr &&
               control_block->getCount(e_refType::owner) > 0;
    }


    inline LifetimeObserver LifetimeObserver::getObserver() const
    {
        return LifetimeObserver(*this, e_refType::observer);
    }


    inline int64_t LifetimeObserver::getCount(e_refType ref_type) const
    {
        return control_block ? control_block->getCount(ref_type) : 0;
    }


    inline LifetimeObserver::LifetimeObserver():
        control_block(new ControlBlock(e_refType::owner)),
        my_ownership(e_refType::owner)
    {
    }

    inline LifetimeObserver::LifetimeObserver(const LifetimeObserver& other)
    {
        attach(other, e_refType::observer);
    }

    inline LifetimeObserver::LifetimeObserver(const LifetimeObserver& other, e_refType ref_type)
    {
        attach(other, ref_type);
    }

    inline LifetimeObserver& LifetimeObserver::operator=(const LifetimeObserver& other)
    {
        if (this != &other)
        {
            e_refType ref_type = other.my_ownership;
            if (ref_type == e_refType::observer && control_block == other.control_block)
            {
                // already observing the same object
                my_ownership = ref_type;
                return *this;
            }
            detach();
            attach(other, ref_type);
        }
        return *this;
    }

    inline LifetimeObserver::LifetimeObserver(LifetimeObserver&& other) noexcept:
        control_block(other.control_block),
        my_ownership(other.my_ownership)
    {
        other.control_block = (other.my_ownership == e_refType::owner)
            ? new ControlBlock(e_refType::owner)
            : nullptr;
    }

    inline LifetimeObserver& LifetimeObserver::operator=(LifetimeObserver&& other) noexcept
    {
        if (this != &other)
        {
            detach();
            control_block = other.control_block;
            my_ownership = other.my_ownership;
            other.control_block = (other.my_ownership == e_refType::owner)
                ? new ControlBlock(e_refType::owner)
                : nullptr;
        }
        return *this;
    }

    inline LifetimeObserver::~LifetimeObserver()
    {
        detach();
    }


    inline void LifetimeObserver::attach(const LifetimeObserver& other, e_refType ref_type)
    {
        my_ownership = ref_type;
        if (ref_type == e_refType::owner)
        {
            // An owner always gets a block of its own; two objects never
            // share one lifetime.
            control_block = new ControlBlock(e_refType::owner);
        }
        else
        {
            control_block = other.control_block;
            if (control_block)
            {
                control_block->addRef(e_refType::observer);
            }
        }
    }

    inline void LifetimeObserver::detach() noexcept
    {
        if (control_block)
        {
            if (control_block->releaseRef(my_ownership))
            {
                delete control_block;
            }
            control_block = nullptr;
        }
    }

} // namespace multicast


#endif // MULTICAST_LIFETIME_OBSERVER_HPP_
