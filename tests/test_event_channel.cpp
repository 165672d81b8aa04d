#include "../src/core/event_channel.hpp"
#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>
#include <variant>
#include <vector>

/**
 * @brief Test EventChannel queueing, overflow and multi-producer use
 */
int main() {
    std::cout << "Testing EventChannel functionality..." << std::endl;

    // Test 1: Push order and typed events
    {
        std::cout << "Test 1: Basic push and drain" << std::endl;

        EventChannel ch(16);
        ch.on_register_changes({TriggerEvent{"PLC-1", 100, 1000.0, std::chrono::system_clock::now()},
                                TriggerEvent{"PLC-1", 102, 5.0, std::chrono::system_clock::now()}});
        PollHealthEvent h;
        h.device_id = "PLC-1";
        h.status = PollStatus::OK;
        ch.on_poll_health(h);

        assert(ch.size() == 3);
        auto events = ch.drain(std::chrono::milliseconds(10));
        assert(events.size() == 3);
        assert(std::get<TriggerEvent>(events[0]).address == 100);
        assert(std::get<TriggerEvent>(events[1]).address == 102);
        assert(std::get<PollHealthEvent>(events[2]).status == PollStatus::OK);
        assert(ch.size() == 0);

        std::cout << "  Basic push and drain test passed" << std::endl;
    }

    // Test 2: Oldest events are dropped when full
    {
        std::cout << "Test 2: Overflow" << std::endl;

        EventChannel ch(3);
        for (int i = 0; i < 5; i++) {
            BlendProgressEvent p;
            p.operation_id = static_cast<std::uint64_t>(i);
            ch.on_blend_progress(p);
        }
        assert(ch.size() == 3);
        assert(ch.pushed() == 5);
        assert(ch.dropped() == 2);

        auto events = ch.drain(std::chrono::milliseconds(10));
        assert(std::get<BlendProgressEvent>(events.front()).operation_id == 2);
        assert(std::get<BlendProgressEvent>(events.back()).operation_id == 4);

        std::cout << "  Overflow test passed" << std::endl;
    }

    // Test 3: Drain times out when empty, close wakes the consumer
    {
        std::cout << "Test 3: Timeout and close" << std::endl;

        EventChannel ch(8);
        auto start = std::chrono::steady_clock::now();
        assert(ch.drain(std::chrono::milliseconds(30)).empty());
        assert(std::chrono::steady_clock::now() - start >= std::chrono::milliseconds(25));

        std::thread consumer([&] {
            auto got = ch.drain(std::chrono::seconds(10));
            assert(got.empty());
        });
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        ch.close();
        consumer.join();

        // closed channel refuses new events
        ch.on_poll_health(PollHealthEvent{});
        assert(ch.size() == 0);

        std::cout << "  Timeout and close test passed" << std::endl;
    }

    // Test 4: Several producers, one consumer
    {
        std::cout << "Test 4: Concurrent producers" << std::endl;

        EventChannel ch(100000);
        const int producers = 4;
        const int per_producer = 5000;
        std::vector<std::thread> threads;
        for (int p = 0; p < producers; p++) {
            threads.emplace_back([&ch, p] {
                for (int i = 0; i < per_producer; i++) {
                    ch.push(TriggerEvent{"D" + std::to_string(p), static_cast<std::uint16_t>(i), 0.0, {}});
                }
            });
        }

        std::size_t received = 0;
        while (received < static_cast<std::size_t>(producers * per_producer)) {
            received += ch.drain(std::chrono::milliseconds(100)).size();
        }
        for (auto& t : threads) t.join();

        assert(received == static_cast<std::size_t>(producers * per_producer));
        assert(ch.dropped() == 0);

        std::cout << "  Concurrent producers test passed" << std::endl;
    }

    std::cout << "✅ All EventChannel tests passed!" << std::endl;
    return 0;
}
