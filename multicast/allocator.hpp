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

#ifndef MULTICAST_ALLOCATOR_HPP_
#define MULTICAST_ALLOCATOR_HPP_

#include <atomic>
#include <cstddef>
#include <new>

#include "error.hpp"
#include "helper.hpp"


namespace multicast
{

    //
    // Raw memory source for snapshot buffers. Implementations throw
    // OutOfMemory when they cannot satisfy a request; deallocate() is handed
    // back the same size and alignment that were passed to allocate().
    //
    class AbstractAllocator
    {
    public: // methods
        virtual std::byte* allocate(std::size_t size, std::size_t alignment) = 0;
        virtual void deallocate(std::byte* item, std::size_t size, std::size_t alignment) noexcept = 0;

        virtual ~AbstractAllocator() = default;

    protected: // methods
        AbstractAllocator() = default;

        static void checkAlignment(std::size_t alignment)
        {
            runtime_assert(alignment > 0 && (alignment & (alignment - 1)) == 0,
                "Alignment must be a non-zero power of two");
        }

    private: // methods
        AbstractAllocator(const AbstractAllocator&) = delete;
        AbstractAllocator& operator=(const AbstractAllocator&) = delete;
        AbstractAllocator(AbstractAllocator&&) = delete;
        AbstractAllocator& operator=(AbstractAllocator&&) = delete;
    };


    //
    // HeapAllocator forwards to the global aligned operator new/delete.
    // Stateless; instance() is the allocator events use unless told
    // otherwise.
    //
    class HeapAllocator: public AbstractAllocator
    {
    public: // methods
        std::byte* allocate(std::size_t size, std::size_t alignment) override;
        void deallocate(std::byte* item, std::size_t size, std::size_t alignment) noexcept override;

        static HeapAllocator& instance();

        HeapAllocator() = default;
        virtual ~HeapAllocator() = default;
    };


    //
    // CountingAllocator wraps another allocator and keeps running totals,
    // so tests and diagnostics can check that every snapshot buffer handed
    // out was eventually returned.
    //
    class CountingAllocator: public AbstractAllocator
    {
    public: // methods
        std::byte* allocate(std::size_t size, std::size_t alignment) override;
        void deallocate(std::byte* item, std::size_t size, std::size_t alignment) noexcept override;

        std::size_t getLiveBlocks() const { return live_blocks.load(std::memory_order_acquire); }
        std::size_t getLiveBytes() const { return live_bytes.load(std::memory_order_acquire); }
        std::size_t getTotalAllocations() const { return total_allocations.load(std::memory_order_acquire); }
        std::size_t getFailedAllocations() const { return failed_allocations.load(std::memory_order_acquire); }

        explicit CountingAllocator(AbstractAllocator& upstream_allocator = HeapAllocator::instance()):
            upstream(upstream_allocator)
        {
        }
        virtual ~CountingAllocator();

    private: // data members
        AbstractAllocator& upstream;

        std::atomic<std::size_t> live_blocks{0};
        std::atomic<std::size_t> live_bytes{0};
        std::atomic<std::size_t> total_allocations{0};
        std::atomic<std::size_t> failed_allocations{0};
    };


    inline std::byte* HeapAllocator::allocate(std::size_t size, std::size_t alignment)
    {
        checkAlignment(alignment);

        void* mem = ::operator new(size, std::align_val_t{alignment}, std::nothrow);
        if (mem == nullptr)
        {
            debug_println("HeapAllocator: failed to allocate {} bytes (alignment {})",
                          size, alignment);
            throw OutOfMemory(size);
        }
        return static_cast<std::byte*>(mem);
    }


    inline void HeapAllocator::deallocate(std::byte* item, std::size_t size, std::size_t alignment) noexcept
    {
        if (item == nullptr)
        {
            return;
        }
        ::operator delete(item, size, std::align_val_t{alignment});
    }


    inline HeapAllocator& HeapAllocator::instance()
    {
        static HeapAllocator heap;
        return heap;
    }


    inline std::byte* CountingAllocator::allocate(std::size_t size, std::size_t alignment)
    {
        std::byte* item = nullptr;
        try
        {
            item = upstream.allocate(size, alignment);
        }
        catch (const OutOfMemory&)
        {
            failed_allocations.fetch_add(1, std::memory_order_relaxed);
            throw;
        }

        total_allocations.fetch_add(1, std::memory_order_relaxed);
        live_blocks.fetch_add(1, std::memory_order_relaxed);
        live_bytes.fetch_add(size, std::memory_order_relaxed);
        return item;
    }


    inline void CountingAllocator::deallocate(std::byte* item, std::size_t size, std::size_t alignment) noexcept
    {
        if (item == nullptr)
        {
            return;
        }
        upstream.deallocate(item, size, alignment);
        live_bytes.fetch_sub(size, std::memory_order_acq_rel);
        live_blocks.fetch_sub(1, std::memory_order_acq_rel);
    }


    inline CountingAllocator::~CountingAllocator()
    {
        if (getLiveBlocks() != 0)
        {
            debug_println("CountingAllocator destroyed with {} live blocks ({} bytes)",
                          getLiveBlocks(), getLiveBytes());
        }
    }

} // namespace multicast


#endif // MULTICAST_ALLOCATOR_HPP_
