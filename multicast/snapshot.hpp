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

#ifndef MULTICAST_SNAPSHOT_HPP_
#define MULTICAST_SNAPSHOT_HPP_

#include <atomic>
#include <cstddef>
#include <limits>
#include <new>
#include <span>
#include <type_traits>
#include <utility>

#include "allocator.hpp"
#include "helper.hpp"


namespace multicast
{

    //
    // SharedBuffer is a single allocation laid out as
    //
    //   [ header: ref count | capacity | allocator ][ pad ][ slot 0 ] ... [ slot capacity-1 ]
    //
    // The header tracks neither how many slots are constructed nor which;
    // that is the owning Snapshot's length. It is created with a count of
    // one and destroyed by whoever drops the count to zero.
    //
    template<typename Elem>
    class SharedBuffer
    {
    public: // methods
        // Returns nullptr for a capacity of zero; nothing is allocated.
        static SharedBuffer* allocate(AbstractAllocator& allocator, std::size_t capacity);

        void addRef() noexcept
        {
            ref_count.fetch_add(1, std::memory_order_relaxed);
        }

        // Returns the count after the decrement. The caller that sees zero
        // must call destroy().
        std::size_t release() noexcept
        {
            return ref_count.fetch_sub(1, std::memory_order_acq_rel) - 1;
        }

        // Destructs the first `length` slots, in index order, and returns
        // the block to its allocator.
        void destroy(std::size_t length) noexcept;

        std::size_t getRefCount() const noexcept { return ref_count.load(std::memory_order_acquire); }
        std::size_t getCapacity() const noexcept { return slot_capacity; }

        Elem* data() noexcept
        {
            return std::launder(reinterpret_cast<Elem*>(reinterpret_cast<std::byte*>(this) + headerSize()));
        }

        const Elem* data() const noexcept
        {
            return std::launder(reinterpret_cast<const Elem*>(reinterpret_cast<const std::byte*>(this) + headerSize()));
        }

    private: // methods
        SharedBuffer(AbstractAllocator& source, std::size_t capacity) noexcept:
            slot_capacity(capacity),
            allocator(&source)
        {
        }
        ~SharedBuffer() = default;

        SharedBuffer(const SharedBuffer&) = delete;
        SharedBuffer& operator=(const SharedBuffer&) = delete;
        SharedBuffer(SharedBuffer&&) = delete;
        SharedBuffer& operator=(SharedBuffer&&) = delete;

        static constexpr std::size_t blockAlignment()
        {
            return alignof(SharedBuffer) > alignof(Elem) ? alignof(SharedBuffer) : alignof(Elem);
        }

        // header rounded up so slot 0 is aligned for Elem
        static constexpr std::size_t headerSize()
        {
            return (sizeof(SharedBuffer) + alignof(Elem) - 1) / alignof(Elem) * alignof(Elem);
        }

        static std::size_t blockSize(std::size_t capacity)
        {
            return headerSize() + capacity * sizeof(Elem);
        }

    private: // data members
        std::atomic<std::size_t> ref_count{1};
        std::size_t slot_capacity;
        AbstractAllocator* allocator;
    };


    //
    // Snapshot is a (buffer, length) handle onto a SharedBuffer.
    //
    // Copying a snapshot shares its buffer; it never copies elements.
    // Snapshots are filled with push() while private to the thread building
    // them and are treated as immutable from the moment they are published
    // to other threads. To "change" one, build a new one.
    //
    template<typename Elem>
    class Snapshot
    {
    public: // types
        using Buffer = SharedBuffer<Elem>;

    public: // methods
        Snapshot() noexcept = default;

        static Snapshot withCapacity(AbstractAllocator& allocator, std::size_t capacity)
        {
            Snapshot snapshot;
            snapshot.buffer = Buffer::allocate(allocator, capacity);
            return snapshot;
        }

        Snapshot(const Snapshot& other) noexcept:
            buffer(other.buffer),
            length(other.length)
        {
            if (buffer)
            {
                buffer->addRef();
            }
        }

        Snapshot(Snapshot&& other) noexcept:
            buffer(std::exchange(other.buffer, nullptr)),
            length(std::exchange(other.length, 0))
        {
        }

        // Assignment would hide a release inside an innocent-looking `=`;
        // use swapWith() so the old contents are visible at the call site.
        Snapshot& operator=(const Snapshot&) = delete;
        Snapshot& operator=(Snapshot&&) = delete;

        ~Snapshot()
        {
            if (buffer && buffer->release() == 0)
            {
                buffer->destroy(length);
            }
        }

        // Precondition: capacity() > size()
        template<typename... Args>
        void push(Args&&... args)
        {
            runtime_assert(buffer != nullptr && length < buffer->getCapacity(),
                "Snapshot::push past reserved capacity");
            new (buffer->data() + length) Elem(std::forward<Args>(args)...);
            ++length;
        }

        // Exchanges contents with `other` and returns what this snapshot
        // held before. Neither allocates nor touches reference counts.
        Snapshot swapWith(Snapshot other) noexcept
        {
            std::swap(buffer, other.buffer);
            std::swap(length, other.length);
            return other;
        }

        std::size_t size() const noexcept { return length; }
        bool empty() const noexcept { return length == 0; }
        std::size_t capacity() const noexcept { return buffer ? buffer->getCapacity() : 0; }

        // Diagnostic: holders of this snapshot's buffer, 0 when unallocated
        std::size_t useCount() const noexcept { return buffer ? buffer->getRefCount() : 0; }

        bool sharesBufferWith(const Snapshot& other) const noexcept
        {
            return buffer != nullptr && buffer == other.buffer;
        }

        std::span<const Elem> items() const noexcept
        {
            if (empty())
            {
                return {};
            }
            return {buffer->data(), length};
        }

        // Only valid while the snapshot is still private to its builder
        std::span<Elem> mutableItems() noexcept
        {
            if (empty())
            {
                return {};
            }
            return {buffer->data(), length};
        }

    private: // data members
        Buffer* buffer = nullptr;
        std::size_t length = 0;
    };


    template<typename Elem>
    SharedBuffer<Elem>* SharedBuffer<Elem>::allocate(AbstractAllocator& allocator, std::size_t capacity)
    {
        if (capacity == 0)
        {
            return nullptr;
        }

        constexpr std::size_t max_capacity =
            (std::numeric_limits<std::size_t>::max() - headerSize()) / sizeof(Elem);
        if (capacity > max_capacity)
        {
            throw OutOfMemory(std::numeric_limits<std::size_t>::max());
        }

        std::byte* mem = allocator.allocate(blockSize(capacity), blockAlignment());
        return new (mem) SharedBuffer(allocator, capacity);
    }


    template<typename Elem>
    void SharedBuffer<Elem>::destroy(std::size_t length) noexcept
    {
        runtime_assert(length <= slot_capacity, "SharedBuffer destroyed with length past capacity");

        if constexpr (!std::is_trivially_destructible_v<Elem>)
        {
            Elem* slots = data();
            for (std::size_t i = 0; i < length; ++i)
            {
                slots[i].~Elem();
            }
        }

        AbstractAllocator* source = allocator;
        std::size_t size = blockSize(slot_capacity);
        this->~SharedBuffer();
        source->deallocate(reinterpret_cast<std::byte*>(this), size, blockAlignment());
    }

} // namespace multicast


#endif // MULTICAST_SNAPSHOT_HPP_
