#include "../src/core/clock.hpp"
#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>

/**
 * @brief Test PeriodicClock timing and StopSignal cancellation
 */
int main() {
    std::cout << "Testing PeriodicClock and StopSignal..." << std::endl;
    using namespace std::chrono;

    // Test 1: Ticks follow the period
    {
        std::cout << "Test 1: Periodic ticks" << std::endl;

        StopSignal stop;
        PeriodicClock clk(milliseconds(20));
        auto start = steady_clock::now();
        double measured = 0.0;
        clk.tick();
        for (int i = 0; i < 5; i++) {
            assert(clk.wait_next(stop));
            measured += clk.tick();
        }
        double elapsed = duration<double>(steady_clock::now() - start).count();

        assert(elapsed >= 0.095);
        assert(elapsed < 0.5);
        assert(measured > 0.08 && measured < 0.5);
        assert(clk.get_period() == milliseconds(20));

        std::cout << "  5 ticks in " << elapsed * 1000 << " ms" << std::endl;
        std::cout << "  Periodic ticks test passed" << std::endl;
    }

    // Test 2: Stop wakes a sleeping loop
    {
        std::cout << "Test 2: Stop wakes sleeper" << std::endl;

        StopSignal stop;
        std::atomic<bool> exited{false};
        auto start = steady_clock::now();
        std::thread sleeper([&] {
            PeriodicClock clk(seconds(10));
            while (clk.wait_next(stop)) {
            }
            exited = true;
        });

        std::this_thread::sleep_for(milliseconds(50));
        stop.request_stop();
        sleeper.join();

        assert(exited);
        assert(stop.stop_requested());
        assert(steady_clock::now() - start < seconds(2));

        // a latched stop returns immediately
        assert(stop.wait_for(seconds(5)));

        std::cout << "  Stop wakes sleeper test passed" << std::endl;
    }

    // Test 3: Overrun re-bases instead of bursting
    {
        std::cout << "Test 3: Overrun handling" << std::endl;

        StopSignal stop;
        PeriodicClock clk(milliseconds(10));
        std::this_thread::sleep_for(milliseconds(50));
        assert(clk.wait_next(stop));
        assert(clk.overruns == 1);

        auto before = steady_clock::now();
        assert(clk.wait_next(stop));
        // next tick is a full period after the re-based one, not immediate
        assert(steady_clock::now() - before >= milliseconds(8));

        std::cout << "  Overrun handling test passed" << std::endl;
    }

    std::cout << "✅ All clock tests passed!" << std::endl;
    return 0;
}
