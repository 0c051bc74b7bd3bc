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

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <cstdlib>
#include <latch>
#include <limits>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>
#include <gtest/gtest.h>

#include "multicast/helper.hpp"
#include "multicast/error.hpp"
#include "multicast/spinlock.hpp"
#include "multicast/lifetimeobserver.hpp"
#include "multicast/allocator.hpp"
#include "multicast/snapshot.hpp"
#include "multicast/context.hpp"
#include "multicast/agilereference.hpp"
#include "multicast/delegate.hpp"
#include "multicast/event.hpp"

using namespace std::literals;
using namespace multicast;


namespace
{
    // Free-threaded target; events hold it directly.
    class Listener: public AgileObject
    {
    public:
        explicit Listener(int listener_id = 0): id(listener_id) {}

        void onEvent() { fired.fetch_add(1, std::memory_order_relaxed); }
        int getFired() const { return fired.load(std::memory_order_relaxed); }

        const int id;

    private:
        std::atomic<int> fired{0};
    };

    // Belongs to whatever Context registered it.
    struct Widget
    {
        int id = 0;
        int fired = 0;
    };

    class Handler
    {
    public:
        virtual ~Handler() = default;
        virtual int handle() = 0;
    };

    class AgileHandler: public Handler, public AgileObject
    {
    public:
        int handle() override { return 1; }
    };

    class UiHandler: public Handler
    {
    public:
        int handle() override { return 2; }
    };

    // Fails on demand, otherwise counts like CountingAllocator.
    class FailingAllocator: public AbstractAllocator
    {
    public:
        std::byte* allocate(std::size_t size, std::size_t alignment) override
        {
            if (fail_next)
            {
                throw OutOfMemory(size);
            }
            return counting.allocate(size, alignment);
        }

        void deallocate(std::byte* item, std::size_t size, std::size_t alignment) noexcept override
        {
            counting.deallocate(item, size, alignment);
        }

        bool fail_next = false;
        CountingAllocator counting;
    };

    // Records its value into `log` on destruction
    struct Tracked
    {
        Tracked(int v, std::vector<int>* destroyed): value(v), log(destroyed) {}
        ~Tracked() { log->push_back(value); }

        int value;
        std::vector<int>* log;
    };

    std::size_t testThreadCount()
    {
        std::size_t const num_cores = std::thread::hardware_concurrency();
        return std::clamp<std::size_t>(num_cores / 2, 2, 8);
    }
}


TEST(SpinLockTest, BasicLocking)
{
    SpinLock lock;

    EXPECT_FALSE(lock.isLocked());
    lock.lock();
    EXPECT_TRUE(lock.isLocked());
    EXPECT_FALSE(lock.try_lock());
    lock.unlock();

    EXPECT_TRUE(lock.try_lock());
    EXPECT_TRUE(lock.isLocked());
    lock.unlock();
    EXPECT_FALSE(lock.isLocked());
}


TEST(SpinLockTest, TryLockContention)
{
    int tested_value = 0;

    SpinLock lock;

    lock.lock();

    std::thread t([&lock, &tested_value]() {
        while (!lock.try_lock())
        {
            std::this_thread::yield();
        }
        tested_value = 42;
        lock.unlock();
    });

    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(tested_value, 0);

    lock.unlock();
    t.join();

    EXPECT_EQ(tested_value, 42);
}


TEST(SpinLockTest, ShortSectionPolicyManyThreads)
{
    const std::size_t num_threads = testThreadCount();
    constexpr std::size_t increments_per_thread = 10000;

    std::size_t counter = 0;
    BasicSpinLock<ShortSectionSpinPolicy> lock;

    // hold the lock until every worker is queued on it
    std::unique_lock<BasicSpinLock<ShortSectionSpinPolicy>> ulock(lock);

    auto worker = [&counter, &lock]() {
        for (std::size_t i = 0; i < increments_per_thread; ++i)
        {
            std::scoped_lock<BasicSpinLock<ShortSectionSpinPolicy>> slock(lock);
            ++counter;
        }
    };

    std::vector<std::thread> threads;
    for (std::size_t i = 0; i < num_threads; ++i)
    {
        threads.emplace_back(worker);
    }

    EXPECT_EQ(counter, 0u);
    ulock.unlock();

    for (auto& t : threads)
    {
        t.join();
    }

    EXPECT_EQ(counter, num_threads * increments_per_thread);
}


TEST(LifetimeObserverTest, ObserverSeesOwnerDestruction)
{
    class TestObject: public LifetimeObserver
    {
    public:
        TestObject() = default;
        ~TestObject() = default;
    };

    TestObject* obj = new TestObject();
    EXPECT_EQ(obj->getCount(LifetimeObserver::e_refType::owner), 1);
    EXPECT_EQ(obj->getCount(LifetimeObserver::e_refType::observer), 0);

    LifetimeObserver observer1 = obj->getObserver();
    {
        LifetimeObserver observer2 = observer1;
        EXPECT_EQ(observer2.getRefType(), LifetimeObserver::e_refType::observer);
        EXPECT_EQ(obj->getCount(LifetimeObserver::e_refType::observer), 2);
        EXPECT_TRUE(observer2.isAlive());
    }
    EXPECT_EQ(obj->getCount(LifetimeObserver::e_refType::observer), 1);
    EXPECT_TRUE(observer1);

    delete obj;

    EXPECT_FALSE(observer1.isAlive());
    EXPECT_EQ(observer1.getCount(LifetimeObserver::e_refType::owner), 0);
    EXPECT_EQ(observer1.getCount(LifetimeObserver::e_refType::observer), 1);
}


TEST(LifetimeObserverTest, CopyAssignmentAdoptsKind)
{
    class TestObject: public LifetimeObserver
    {
    public:
        TestObject() = default;
        TestObject(const TestObject& other): LifetimeObserver(other, e_refType::owner) {}
        TestObject& operator=(const TestObject& other) = default;
    };

    TestObject a;
    TestObject b;
    LifetimeObserver watch_a = a.getObserver();
    LifetimeObserver watch_b = b.getObserver();

    // owner copy: b becomes an independent owner; a keeps its observers
    b = a;
    EXPECT_EQ(b.getRefType(), LifetimeObserver::e_refType::owner);
    EXPECT_TRUE(watch_a.isAlive());
    EXPECT_FALSE(watch_b.isAlive());

    // observer copy: watch_b now follows a
    watch_b = watch_a;
    EXPECT_TRUE(watch_b.isAlive());
    EXPECT_EQ(a.getCount(LifetimeObserver::e_refType::observer), 2);

    TestObject c(a);
    EXPECT_EQ(c.getRefType(), LifetimeObserver::e_refType::owner);
    EXPECT_EQ(c.getCount(LifetimeObserver::e_refType::observer), 0);
}


TEST(LifetimeObserverTest, MovedFromOwnerStillOwns)
{
    class TestObject: public LifetimeObserver
    {
    public:
        TestObject() = default;
        TestObject(TestObject&& other) noexcept = default;
    };

    TestObject original;
    LifetimeObserver watch = original.getObserver();

    TestObject moved(std::move(original));
    EXPECT_TRUE(watch.isAlive());
    EXPECT_EQ(moved.getCount(LifetimeObserver::e_refType::observer), 1);
    EXPECT_TRUE(original.isAlive());
    EXPECT_EQ(original.getCount(LifetimeObserver::e_refType::observer), 0);
}


TEST(LifetimeObserverTest, ObserversReleasedConcurrentlyWithOwner)
{
    class TestObject: public LifetimeObserver
    {
    public:
        TestObject() = default;
    };

    const std::size_t num_threads = testThreadCount();
    constexpr int copies_per_thread = 10000;

    auto* obj = new TestObject();
    LifetimeObserver base = obj->getObserver();
    std::latch start(static_cast<std::ptrdiff_t>(num_threads) + 1);

    std::vector<std::thread> threads;
    for (std::size_t i = 0; i < num_threads; ++i)
    {
        threads.emplace_back([&base, &start]() {
            start.arrive_and_wait();
            for (int n = 0; n < copies_per_thread; ++n)
            {
                LifetimeObserver copy = base;
                (void)copy.isAlive();
            }
        });
    }

    start.arrive_and_wait();
    delete obj;

    for (auto& t : threads)
    {
        t.join();
    }

    EXPECT_FALSE(base.isAlive());
    EXPECT_EQ(base.getCount(LifetimeObserver::e_refType::observer), 1);
}


TEST(AllocatorTest, HeapAllocatorHonorsAlignment)
{
    HeapAllocator& heap = HeapAllocator::instance();
    for (std::size_t alignment : {8u, 16u, 64u, 256u})
    {
        std::byte* mem = heap.allocate(100, alignment);
        ASSERT_NE(mem, nullptr);
        EXPECT_EQ(reinterpret_cast<std::uintptr_t>(mem) % alignment, 0u);
        heap.deallocate(mem, 100, alignment);
    }
}


TEST(AllocatorTest, CountingAllocatorTracksBlocks)
{
    CountingAllocator alloc;

    std::byte* a = alloc.allocate(64, 8);
    std::byte* b = alloc.allocate(32, 16);
    EXPECT_EQ(alloc.getLiveBlocks(), 2u);
    EXPECT_EQ(alloc.getLiveBytes(), 96u);
    EXPECT_EQ(alloc.getTotalAllocations(), 2u);

    alloc.deallocate(a, 64, 8);
    EXPECT_EQ(alloc.getLiveBlocks(), 1u);
    EXPECT_EQ(alloc.getLiveBytes(), 32u);

    alloc.deallocate(b, 32, 16);
    alloc.deallocate(nullptr, 0, 8);
    EXPECT_EQ(alloc.getLiveBlocks(), 0u);
    EXPECT_EQ(alloc.getLiveBytes(), 0u);
    EXPECT_EQ(alloc.getTotalAllocations(), 2u);
}


TEST(AllocatorTest, CountingAllocatorCountsFailures)
{
    FailingAllocator failing;
    CountingAllocator alloc(failing);

    failing.fail_next = true;
    EXPECT_THROW(alloc.allocate(128, 8), OutOfMemory);
    EXPECT_EQ(alloc.getFailedAllocations(), 1u);
    EXPECT_EQ(alloc.getLiveBlocks(), 0u);
    EXPECT_EQ(alloc.getTotalAllocations(), 0u);
}


TEST(ErrorTest, ClassifiesLivenessErrors)
{
    EXPECT_EQ(classifyError(TargetGone()), e_errorClass::target_gone);
    EXPECT_EQ(classifyError(ContextGone()), e_errorClass::context_gone);
    EXPECT_EQ(classifyError(OutOfMemory(16)), e_errorClass::other);
    EXPECT_EQ(classifyError(MarshalingFailure("no context")), e_errorClass::other);
    EXPECT_EQ(classifyError(std::runtime_error("boom")), e_errorClass::other);

    OutOfMemory oom(4096);
    EXPECT_EQ(oom.code(), e_errorCode::out_of_memory);
    EXPECT_EQ(oom.requestedBytes(), 4096u);
}


TEST(SnapshotTest, EmptySnapshotDoesNotAllocate)
{
    CountingAllocator alloc;

    Snapshot<int> empty;
    auto zero = Snapshot<int>::withCapacity(alloc, 0);
    Snapshot<int> copy(zero);

    EXPECT_TRUE(empty.empty());
    EXPECT_EQ(zero.capacity(), 0u);
    EXPECT_EQ(copy.useCount(), 0u);
    EXPECT_TRUE(copy.items().empty());
    EXPECT_EQ(alloc.getTotalAllocations(), 0u);
}


TEST(SnapshotTest, PushFillsReservedCapacity)
{
    CountingAllocator alloc;

    auto snapshot = Snapshot<int>::withCapacity(alloc, 3);
    EXPECT_EQ(snapshot.capacity(), 3u);
    EXPECT_EQ(snapshot.size(), 0u);

    snapshot.push(10);
    snapshot.push(20);
    snapshot.push(30);

    ASSERT_EQ(snapshot.size(), 3u);
    auto items = snapshot.items();
    EXPECT_EQ(std::vector<int>(items.begin(), items.end()), (std::vector<int>{10, 20, 30}));

    snapshot.mutableItems()[1] = 25;
    EXPECT_EQ(snapshot.items()[1], 25);
    EXPECT_EQ(alloc.getLiveBlocks(), 1u);
}


TEST(SnapshotTest, CopySharesBuffer)
{
    CountingAllocator alloc;
    {
        auto snapshot = Snapshot<int>::withCapacity(alloc, 2);
        snapshot.push(1);
        snapshot.push(2);

        Snapshot<int> copy(snapshot);
        EXPECT_TRUE(copy.sharesBufferWith(snapshot));
        EXPECT_EQ(snapshot.useCount(), 2u);
        EXPECT_EQ(copy.items().data(), snapshot.items().data());
        EXPECT_EQ(alloc.getTotalAllocations(), 1u);

        Snapshot<int> moved(std::move(copy));
        EXPECT_EQ(snapshot.useCount(), 2u);
        EXPECT_TRUE(copy.empty());
        EXPECT_EQ(copy.useCount(), 0u);
    }
    EXPECT_EQ(alloc.getLiveBlocks(), 0u);
}


TEST(SnapshotTest, LastReleaseDestroysInIndexOrder)
{
    CountingAllocator alloc;
    std::vector<int> destroyed;

    auto* original = new Snapshot<Tracked>(Snapshot<Tracked>::withCapacity(alloc, 3));
    original->push(0, &destroyed);
    original->push(1, &destroyed);
    original->push(2, &destroyed);

    auto* reader = new Snapshot<Tracked>(*original);

    delete original;
    EXPECT_TRUE(destroyed.empty());
    EXPECT_EQ(alloc.getLiveBlocks(), 1u);
    EXPECT_EQ(reader->items()[2].value, 2);

    delete reader;
    EXPECT_EQ(destroyed, (std::vector<int>{0, 1, 2}));
    EXPECT_EQ(alloc.getLiveBlocks(), 0u);
}


TEST(SnapshotTest, PartiallyFilledBufferIsFreed)
{
    CountingAllocator alloc;
    std::vector<int> destroyed;
    {
        auto snapshot = Snapshot<Tracked>::withCapacity(alloc, 4);
        snapshot.push(7, &destroyed);
    }
    EXPECT_EQ(destroyed, (std::vector<int>{7}));
    EXPECT_EQ(alloc.getLiveBlocks(), 0u);
}


TEST(SnapshotTest, SwapWithReturnsPreviousContents)
{
    CountingAllocator alloc;

    auto current = Snapshot<int>::withCapacity(alloc, 1);
    current.push(1);
    auto next = Snapshot<int>::withCapacity(alloc, 2);
    next.push(2);
    next.push(3);

    auto previous = current.swapWith(std::move(next));
    EXPECT_EQ(current.size(), 2u);
    EXPECT_EQ(current.items()[0], 2);
    ASSERT_EQ(previous.size(), 1u);
    EXPECT_EQ(previous.items()[0], 1);
    EXPECT_EQ(current.useCount(), 1u);
    EXPECT_EQ(previous.useCount(), 1u);

    auto drained = current.swapWith(Snapshot<int>());
    EXPECT_TRUE(current.empty());
    EXPECT_EQ(drained.size(), 2u);
    EXPECT_EQ(alloc.getTotalAllocations(), 2u);
}


TEST(SnapshotTest, SlotsAlignedForElement)
{
    struct alignas(64) Wide
    {
        double lanes[8];
    };

    CountingAllocator alloc;
    auto snapshot = Snapshot<Wide>::withCapacity(alloc, 3);
    snapshot.push();
    snapshot.push();
    for (const auto& wide : snapshot.items())
    {
        EXPECT_EQ(reinterpret_cast<std::uintptr_t>(&wide) % 64, 0u);
    }
}


TEST(SnapshotTest, AllocationFailurePropagates)
{
    FailingAllocator alloc;
    alloc.fail_next = true;
    EXPECT_THROW(Snapshot<int>::withCapacity(alloc, 2), OutOfMemory);

    // the size computation itself overflows; nothing reaches the allocator
    alloc.fail_next = false;
    EXPECT_THROW(Snapshot<int>::withCapacity(alloc, std::numeric_limits<std::size_t>::max()),
                 OutOfMemory);
    EXPECT_EQ(alloc.counting.getTotalAllocations(), 0u);
}


TEST(DelegateTest, AgileTargetIsHeldDirectly)
{
    auto listener = std::make_shared<Listener>(1);
    auto delegate = Delegate<Listener>::fromTarget(listener);

    EXPECT_TRUE(delegate.isDirect());
    delegate.invoke([](Listener& l) { l.onEvent(); });
    EXPECT_EQ(listener->getFired(), 1);
}


TEST(DelegateTest, NonAgileTargetNeedsContext)
{
    ASSERT_EQ(Context::current(), nullptr);
    auto widget = std::make_shared<Widget>();
    EXPECT_THROW(Delegate<Widget>::fromTarget(widget), MarshalingFailure);
}


TEST(DelegateTest, NonAgileTargetResolvesThroughContext)
{
    Context ui("ui");
    Context::Scope scope(ui);
    ASSERT_EQ(Context::current(), &ui);

    auto widget = std::make_shared<Widget>();
    auto delegate = Delegate<Widget>::fromTarget(widget);
    EXPECT_FALSE(delegate.isDirect());

    // resolvable from another thread while the context lives
    std::thread t([&delegate]() {
        delegate.invoke([](Widget& w) { ++w.fired; });
    });
    t.join();
    EXPECT_EQ(widget->fired, 1);
}


TEST(DelegateTest, ResolveFailsAfterContextDestroyed)
{
    auto ui = std::make_unique<Context>("ui");
    auto widget = std::make_shared<Widget>();

    auto delegate = [&]() {
        Context::Scope scope(*ui);
        return Delegate<Widget>::fromTarget(widget);
    }();
    EXPECT_EQ(Context::current(), nullptr);

    ui.reset();

    bool ran = false;
    EXPECT_THROW(delegate.invoke([&ran](Widget&) { ran = true; }), ContextGone);
    EXPECT_FALSE(ran);
}


TEST(DelegateTest, ProbeUsesDynamicType)
{
    AgileHandler agile;
    UiHandler ui;
    const Handler& agile_base = agile;
    const Handler& ui_base = ui;

    EXPECT_TRUE(isAgile(agile_base));
    EXPECT_FALSE(isAgile(ui_base));
    EXPECT_TRUE(isAgile(Listener()));
    EXPECT_FALSE(isAgile(Widget()));

    std::shared_ptr<Handler> handler = std::make_shared<AgileHandler>();
    auto delegate = Delegate<Handler>::fromTarget(handler);
    EXPECT_TRUE(delegate.isDirect());
    int result = 0;
    delegate.invoke([&result](Handler& h) { result = h.handle(); });
    EXPECT_EQ(result, 1);
}


TEST(DelegateTest, TokensDistinctPerRegistration)
{
    auto listener = std::make_shared<Listener>();
    auto first = Delegate<Listener>::fromTarget(listener);
    auto second = Delegate<Listener>::fromTarget(listener);
    Delegate<Listener> copy(first);

    EXPECT_NE(first.token(), 0);
    EXPECT_NE(first.token(), second.token());
    EXPECT_EQ(copy.token(), first.token());
}


TEST(DelegateTest, NullTargetRejected)
{
    EXPECT_THROW(Delegate<Listener>::fromTarget(nullptr), std::invalid_argument);
}


TEST(EventTest, AddThenRemoveIsNetNoOp)
{
    Event<Listener> event;
    event.add(std::make_shared<Listener>(1));
    std::size_t before = event.size();

    Token token = event.add(std::make_shared<Listener>(2));
    EXPECT_EQ(event.size(), before + 1);

    event.remove(token);
    EXPECT_EQ(event.size(), before);
}


TEST(EventTest, RemoveUnknownTokenIsNoOp)
{
    CountingAllocator alloc;
    Event<Listener> event(alloc);

    event.remove(0);
    event.add(std::make_shared<Listener>(1));
    std::size_t allocations = alloc.getTotalAllocations();

    EXPECT_NO_THROW(event.remove(0));
    EXPECT_NO_THROW(event.remove(-1));
    EXPECT_EQ(event.size(), 1u);
    EXPECT_EQ(alloc.getTotalAllocations(), allocations);
}


TEST(EventTest, RemoveTwiceRemovesOnce)
{
    Event<Listener> event;
    Token t1 = event.add(std::make_shared<Listener>(1));
    event.add(std::make_shared<Listener>(2));
    event.add(std::make_shared<Listener>(3));

    event.remove(t1);
    EXPECT_EQ(event.size(), 2u);
    event.remove(t1);
    EXPECT_EQ(event.size(), 2u);
}


TEST(EventTest, SameTargetRegisteredTwice)
{
    auto listener = std::make_shared<Listener>(1);
    Event<Listener> event;
    Token first = event.add(listener);
    Token second = event.add(listener);
    EXPECT_NE(first, second);

    event.call([](Listener& l) { l.onEvent(); });
    EXPECT_EQ(listener->getFired(), 2);

    event.remove(first);
    event.call([](Listener& l) { l.onEvent(); });
    EXPECT_EQ(listener->getFired(), 3);
}


TEST(EventTest, ClearOnEmptyIsNoOp)
{
    CountingAllocator alloc;
    Event<Listener> event(alloc);

    event.clear();
    EXPECT_TRUE(event.empty());
    EXPECT_EQ(alloc.getTotalAllocations(), 0u);
}


TEST(EventTest, ClearStopsInvocation)
{
    CountingAllocator alloc;
    Event<Listener> event(alloc);
    auto listener = std::make_shared<Listener>(1);
    event.add(listener);
    event.add(std::make_shared<Listener>(2));

    event.clear();
    EXPECT_EQ(event.size(), 0u);
    EXPECT_EQ(alloc.getLiveBlocks(), 0u);

    int invoked = 0;
    event.call([&invoked](Listener&) { ++invoked; });
    EXPECT_EQ(invoked, 0);
    EXPECT_EQ(listener.use_count(), 1);
}


TEST(EventTest, InvokesInRegistrationOrder)
{
    Event<Listener> event;
    event.add(std::make_shared<Listener>(1));
    Token t2 = event.add(std::make_shared<Listener>(2));
    event.add(std::make_shared<Listener>(3));

    std::vector<int> order;
    event.call([&order](Listener& l) { order.push_back(l.id); });
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));

    event.remove(t2);
    order.clear();
    event.call([&order](Listener& l) { order.push_back(l.id); });
    EXPECT_EQ(order, (std::vector<int>{1, 3}));
}


TEST(EventTest, TargetGoneSelfHeals)
{
    Event<Listener> event;
    event.add(std::make_shared<Listener>(1));

    EXPECT_NO_THROW(event.call([](Listener&) { throw TargetGone(); }));
    EXPECT_EQ(event.size(), 0u);

    int invoked = 0;
    event.call([&invoked](Listener&) { ++invoked; });
    EXPECT_EQ(invoked, 0);
}


TEST(EventTest, TargetGoneDoesNotAffectOthers)
{
    Event<Listener> event;
    event.add(std::make_shared<Listener>(1));
    event.add(std::make_shared<Listener>(2));
    event.add(std::make_shared<Listener>(3));

    std::vector<int> order;
    event.call([&order](Listener& l) {
        order.push_back(l.id);
        if (l.id == 2)
        {
            throw TargetGone("peer hung up");
        }
    });
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(event.size(), 2u);

    order.clear();
    event.call([&order](Listener& l) { order.push_back(l.id); });
    EXPECT_EQ(order, (std::vector<int>{1, 3}));
}


TEST(EventTest, ContextGoneSelfHeals)
{
    Event<Widget> event;
    auto survivor_context = std::make_unique<Context>("survivor");
    auto doomed_context = std::make_unique<Context>("doomed");

    auto doomed = std::make_shared<Widget>();
    doomed->id = 1;
    auto survivor = std::make_shared<Widget>();
    survivor->id = 2;

    {
        Context::Scope scope(*doomed_context);
        event.add(doomed);
    }
    {
        Context::Scope scope(*survivor_context);
        event.add(survivor);
    }
    ASSERT_EQ(event.size(), 2u);

    doomed_context.reset();

    EXPECT_NO_THROW(event.call([](Widget& w) { ++w.fired; }));
    EXPECT_EQ(doomed->fired, 0);
    EXPECT_EQ(survivor->fired, 1);
    EXPECT_EQ(event.size(), 1u);

    // the event no longer holds the orphaned target
    EXPECT_EQ(doomed.use_count(), 1);
}


TEST(EventTest, OtherErrorAbortsIteration)
{
    Event<Listener> event;
    event.add(std::make_shared<Listener>(1));
    event.add(std::make_shared<Listener>(2));
    event.add(std::make_shared<Listener>(3));

    std::vector<int> order;
    EXPECT_THROW(event.call([&order](Listener& l) {
        order.push_back(l.id);
        if (l.id == 2)
        {
            throw std::runtime_error("handler failed");
        }
    }), std::runtime_error);

    EXPECT_EQ(order, (std::vector<int>{1, 2}));
    EXPECT_EQ(event.size(), 3u);

    // library errors that are not liveness signals propagate too
    EXPECT_THROW(event.call([](Listener&) { throw OutOfMemory(1); }), OutOfMemory);
    EXPECT_EQ(event.size(), 3u);
}


TEST(EventTest, AddOutOfMemoryLeavesEventUnchanged)
{
    FailingAllocator alloc;
    {
        Event<Listener> event(alloc);
        event.add(std::make_shared<Listener>(1));
        event.add(std::make_shared<Listener>(2));

        auto rejected = std::make_shared<Listener>(3);
        alloc.fail_next = true;
        EXPECT_THROW(event.add(rejected), OutOfMemory);
        EXPECT_EQ(event.size(), 2u);
        EXPECT_EQ(rejected.use_count(), 1);

        std::vector<int> order;
        event.call([&order](Listener& l) { order.push_back(l.id); });
        EXPECT_EQ(order, (std::vector<int>{1, 2}));

        alloc.fail_next = false;
        event.add(rejected);
        EXPECT_EQ(event.size(), 3u);
    }
    EXPECT_EQ(alloc.counting.getLiveBlocks(), 0u);
}


TEST(EventTest, AddMarshalingFailureLeavesEventUnchanged)
{
    CountingAllocator alloc;
    {
        Event<Widget> event(alloc);
        Context ui("ui");
        {
            Context::Scope scope(ui);
            event.add(std::make_shared<Widget>());
        }

        // no context bound here; the new snapshot built so far is discarded
        EXPECT_THROW(event.add(std::make_shared<Widget>()), MarshalingFailure);
        EXPECT_EQ(event.size(), 1u);
        EXPECT_EQ(alloc.getLiveBlocks(), 1u);
    }
    EXPECT_EQ(alloc.getLiveBlocks(), 0u);
}


TEST(EventTest, RemoveOutOfMemoryLeavesEventUnchanged)
{
    FailingAllocator alloc;
    Event<Listener> event(alloc);
    Token t1 = event.add(std::make_shared<Listener>(1));
    Token t2 = event.add(std::make_shared<Listener>(2));

    alloc.fail_next = true;
    EXPECT_THROW(event.remove(t1), OutOfMemory);
    EXPECT_EQ(event.size(), 2u);
    alloc.fail_next = false;

    event.remove(t1);
    EXPECT_EQ(event.size(), 1u);

    // removing the last delegate needs no allocation
    alloc.fail_next = true;
    EXPECT_NO_THROW(event.remove(t2));
    EXPECT_TRUE(event.empty());
    alloc.fail_next = false;
}


TEST(EventTest, NullTargetRejected)
{
    Event<Listener> event;
    EXPECT_THROW(event.add(nullptr), std::invalid_argument);
    EXPECT_TRUE(event.empty());
}


TEST(EventTest, CallIteratesSnapshotTakenAtStart)
{
    Event<Listener> event;
    event.add(std::make_shared<Listener>(1));
    Token t2 = event.add(std::make_shared<Listener>(2));

    std::vector<int> order;
    event.call([&](Listener& l) {
        order.push_back(l.id);
        if (l.id == 1)
        {
            // neither change is visible to this call
            event.remove(t2);
            event.add(std::make_shared<Listener>(3));
        }
    });
    EXPECT_EQ(order, (std::vector<int>{1, 2}));

    order.clear();
    event.call([&order](Listener& l) { order.push_back(l.id); });
    EXPECT_EQ(order, (std::vector<int>{1, 3}));
}


TEST(EventTest, HandlerMayUnsubscribeItselfAndClear)
{
    Event<Listener> event;
    Token self = event.add(std::make_shared<Listener>(1));
    event.add(std::make_shared<Listener>(2));

    int invoked = 0;
    event.call([&](Listener& l) {
        ++invoked;
        if (l.id == 1)
        {
            event.remove(self);
        }
    });
    EXPECT_EQ(invoked, 2);
    EXPECT_EQ(event.size(), 1u);

    invoked = 0;
    event.call([&](Listener&) {
        ++invoked;
        event.clear();
        event.call([&](Listener&) { ++invoked; });
    });
    EXPECT_EQ(invoked, 1);
    EXPECT_TRUE(event.empty());
}


TEST(EventTest, BuffersReturnedToAllocator)
{
    CountingAllocator alloc;
    {
        Event<Listener> event(alloc);
        Token t1 = event.add(std::make_shared<Listener>(1));
        event.add(std::make_shared<Listener>(2));
        event.add(std::make_shared<Listener>(3));
        event.remove(t1);

        // one block for the published snapshot
        EXPECT_EQ(alloc.getLiveBlocks(), 1u);
        EXPECT_EQ(alloc.getTotalAllocations(), 4u);
    }
    EXPECT_EQ(alloc.getLiveBlocks(), 0u);
    EXPECT_EQ(alloc.getLiveBytes(), 0u);
}


TEST(EventTest, MutexSwapLock)
{
    Event<Listener, std::mutex> event;
    auto listener = std::make_shared<Listener>(1);
    Token token = event.add(listener);

    event.call([](Listener& l) { l.onEvent(); });
    EXPECT_EQ(listener->getFired(), 1);

    event.remove(token);
    EXPECT_TRUE(event.empty());
}


TEST(EventTest, CallersSeeWholeSnapshots)
{
    // The writer only ever appends ids in order, so every published snapshot
    // holds exactly ids 0..n-1. A caller seeing anything else saw a torn set.
    constexpr int num_listeners = 300;

    Event<Listener> event;
    std::atomic<bool> done{false};
    std::atomic<int> torn{0};

    std::vector<std::thread> callers;
    for (std::size_t i = 0; i < testThreadCount(); ++i)
    {
        callers.emplace_back([&]() {
            while (!done.load(std::memory_order_acquire))
            {
                int expected = 0;
                event.call([&](Listener& l) {
                    if (l.id != expected)
                    {
                        torn.fetch_add(1, std::memory_order_relaxed);
                    }
                    ++expected;
                });
            }
        });
    }

    for (int id = 0; id < num_listeners; ++id)
    {
        event.add(std::make_shared<Listener>(id));
    }
    done.store(true, std::memory_order_release);

    for (auto& t : callers)
    {
        t.join();
    }

    EXPECT_EQ(torn.load(), 0);
    EXPECT_EQ(event.size(), static_cast<std::size_t>(num_listeners));
}


TEST(EventTest, ConcurrentAddRemoveWithCaller)
{
    const std::size_t num_threads = testThreadCount();
    println("Running add/remove cycles on {} threads", num_threads);

    constexpr int cycles_per_thread = 1000;
    constexpr int keep_every = 100;

    CountingAllocator alloc;
    std::vector<std::vector<std::shared_ptr<Listener>>> kept(num_threads);
    {
        Event<Listener> event(alloc);
        std::atomic<bool> done{false};
        std::atomic<std::size_t> calls{0};

        std::thread caller([&]() {
            while (!done.load(std::memory_order_acquire))
            {
                event.call([](Listener& l) { l.onEvent(); });
                calls.fetch_add(1, std::memory_order_relaxed);
            }
        });

        auto worker = [&event, &kept](std::size_t thread_index) {
            for (int i = 0; i < cycles_per_thread; ++i)
            {
                auto listener = std::make_shared<Listener>(i);
                Token token = event.add(listener);
                if (i % keep_every == 0)
                {
                    kept[thread_index].push_back(listener);
                }
                else
                {
                    event.remove(token);
                }
            }
        };

        std::vector<std::thread> threads;
        for (std::size_t i = 0; i < num_threads; ++i)
        {
            threads.emplace_back(worker, i);
        }
        for (auto& t : threads)
        {
            t.join();
        }
        done.store(true, std::memory_order_release);
        caller.join();

        EXPECT_EQ(event.size(), num_threads * (cycles_per_thread / keep_every));
        EXPECT_GT(calls.load(), 0u);
        EXPECT_EQ(alloc.getLiveBlocks(), 1u);
    }

    EXPECT_EQ(alloc.getLiveBlocks(), 0u);
    EXPECT_EQ(alloc.getLiveBytes(), 0u);
    for (const auto& per_thread : kept)
    {
        for (const auto& listener : per_thread)
        {
            EXPECT_EQ(listener.use_count(), 1);
        }
    }
}


TEST(EventTest, ConcurrentRemoveOfSameToken)
{
    const std::size_t num_threads = testThreadCount();

    Event<Listener> event;
    event.add(std::make_shared<Listener>(1));
    Token target = event.add(std::make_shared<Listener>(2));
    event.add(std::make_shared<Listener>(3));

    std::latch start(static_cast<std::ptrdiff_t>(num_threads));
    std::vector<std::thread> threads;
    for (std::size_t i = 0; i < num_threads; ++i)
    {
        threads.emplace_back([&]() {
            start.arrive_and_wait();
            event.remove(target);
        });
    }
    for (auto& t : threads)
    {
        t.join();
    }

    EXPECT_EQ(event.size(), 2u);
    std::vector<int> order;
    event.call([&order](Listener& l) { order.push_back(l.id); });
    EXPECT_EQ(order, (std::vector<int>{1, 3}));
}


TEST(EventTest, SelfHealingUnderConcurrentCallers)
{
    // Every caller hits the same dead delegate; it must be removed exactly
    // once and the live ones must keep being invoked.
    const std::size_t num_threads = testThreadCount();

    CountingAllocator alloc;
    {
        Event<Listener> event(alloc);
        auto alive = std::make_shared<Listener>(1);
        event.add(alive);
        event.add(std::make_shared<Listener>(2));

        std::latch start(static_cast<std::ptrdiff_t>(num_threads));
        std::vector<std::thread> threads;
        for (std::size_t i = 0; i < num_threads; ++i)
        {
            threads.emplace_back([&]() {
                start.arrive_and_wait();
                event.call([](Listener& l) {
                    if (l.id == 2)
                    {
                        throw TargetGone();
                    }
                    l.onEvent();
                });
            });
        }
        for (auto& t : threads)
        {
            t.join();
        }

        EXPECT_EQ(event.size(), 1u);
        EXPECT_EQ(alive->getFired(), static_cast<int>(num_threads));
    }
    EXPECT_EQ(alloc.getLiveBlocks(), 0u);
}


void pre_test()
{
    println("Running multicast tests (debug build: {}, verbose: {})", DEBUG_BUILD, VERBOSE_DEBUG);
}


int main(int argc, char** argv)
{
    pre_test();

    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
