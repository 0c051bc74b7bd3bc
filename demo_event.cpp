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

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "multicast/multicast.hpp"

using namespace multicast;


// A thread-safe sensor listener; events hold it directly.
class TemperatureLogger: public AgileObject
{
public:
    explicit TemperatureLogger(std::string logger_name): name(std::move(logger_name)) {}

    void onReading(double celsius)
    {
        readings.fetch_add(1, std::memory_order_relaxed);
        println("   [{}] {:.1f} C", name, celsius);
    }

    int getReadings() const { return readings.load(std::memory_order_relaxed); }

private:
    std::string name;
    std::atomic<int> readings{0};
};


// Bound to a UI context; only usable while that context is alive.
class Gauge
{
public:
    void onReading(double celsius)
    {
        println("   [gauge] needle at {:.1f} C", celsius);
    }
};


// Stands in for a remote observer whose connection drops.
class RemoteDisplay: public AgileObject
{
public:
    void onReading(double celsius)
    {
        if (disconnected)
        {
            throw TargetGone("remote display disconnected");
        }
        println("   [remote] {:.1f} C", celsius);
    }

    bool disconnected = false;
};


int main()
{
    println("=== Demonstration of multicast::Event ===\n");

    // Example 1: register, raise, unregister
    println("1. Register, raise and unregister:");
    {
        Event<TemperatureLogger> reading;
        auto kitchen = std::make_shared<TemperatureLogger>("kitchen");
        auto garage = std::make_shared<TemperatureLogger>("garage");

        Token kitchen_token = reading.add(kitchen);
        reading.add(garage);
        println("   {} listeners registered", reading.size());

        reading.call([](TemperatureLogger& logger) { logger.onReading(21.5); });

        reading.remove(kitchen_token);
        println("   kitchen removed, {} listener left", reading.size());
        reading.call([](TemperatureLogger& logger) { logger.onReading(19.0); });
    }
    println("");

    // Example 2: a dead target removes itself
    println("2. Self-healing when a target goes away:");
    {
        Event<RemoteDisplay> reading;
        auto display = std::make_shared<RemoteDisplay>();
        reading.add(display);

        reading.call([](RemoteDisplay& d) { d.onReading(22.0); });
        display->disconnected = true;
        reading.call([](RemoteDisplay& d) { d.onReading(22.5); });
        println("   listeners after disconnect: {}", reading.size());
    }
    println("");

    // Example 3: context-bound targets
    println("3. Targets owned by a context:");
    {
        Event<Gauge> reading;
        auto ui = std::make_unique<Context>("ui");
        {
            Context::Scope scope(*ui);
            reading.add(std::make_shared<Gauge>());
        }

        // raised from a worker thread while the UI context lives
        std::thread sensor([&reading]() {
            reading.call([](Gauge& g) { g.onReading(23.0); });
        });
        sensor.join();

        println("   destroying ui context");
        ui.reset();
        reading.call([](Gauge& g) { g.onReading(23.5); });
        println("   listeners after context teardown: {}", reading.size());
    }
    println("");

    // Example 4: many threads raising while the listener set changes
    println("4. Concurrent raise and registration:");
    {
        CountingAllocator allocator;
        {
            Event<TemperatureLogger> reading(allocator);
            auto quiet = std::make_shared<TemperatureLogger>("quiet");
            std::atomic<bool> done{false};

            std::vector<std::thread> raisers;
            for (int i = 0; i < 4; ++i)
            {
                raisers.emplace_back([&reading, &done]() {
                    while (!done.load(std::memory_order_acquire))
                    {
                        reading.call([](TemperatureLogger& logger) { (void)logger.getReadings(); });
                    }
                });
            }

            for (int i = 0; i < 1000; ++i)
            {
                Token token = reading.add(quiet);
                reading.remove(token);
            }
            done.store(true, std::memory_order_release);
            for (auto& t : raisers)
            {
                t.join();
            }
            println("   {} snapshot buffers allocated, {} still live",
                    allocator.getTotalAllocations(), allocator.getLiveBlocks());
        }
        println("   after the event is gone: {} live", allocator.getLiveBlocks());
    }
    println("");

    println("=== Demo completed ===");
    return 0;
}
