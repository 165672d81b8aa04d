#include <iostream>
#include <signal.h>
#include <atomic>
#include <thread>
#include <chrono>
#include <string>

#include "config/site_config.hpp"
#include "control/api.hpp"
#include "control/blend_orchestrator.hpp"
#include "core/event_channel.hpp"
#include "poll/device_manager.hpp"
#include "ipc/telemetry_pub.hpp"
#include "ipc/control_rep.hpp"

// Global flag for clean shutdown
std::atomic<bool> shutdown_requested{false};

void signal_handler(int) {
    shutdown_requested.store(true);
}

static void usage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " <site.json> [--telemetry tcp://host:port] [--control tcp://host:port]"
              << std::endl;
}

int main(int argc, char** argv) {
    std::string config_path;
    std::string telemetry_address = "tcp://127.0.0.1:5556";
    std::string control_address = "tcp://127.0.0.1:5555";

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--telemetry" && i + 1 < argc) {
            telemetry_address = argv[++i];
        } else if (arg == "--control" && i + 1 < argc) {
            control_address = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            usage(argv[0]);
            return 0;
        } else if (config_path.empty() && arg[0] != '-') {
            config_path = arg;
        } else {
            usage(argv[0]);
            return 2;
        }
    }
    if (config_path.empty()) {
        usage(argv[0]);
        return 2;
    }

    std::cout << "Blendline RT - Starting up..." << std::endl;

    // Install signal handlers for clean shutdown
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    try {
        SiteConfig site = SiteConfig::load_file(config_path);
        std::cout << "Loaded " << config_path << ": " << site.devices.size() << " device(s), "
                  << site.tanks.size() << " tank(s), " << site.products.size() << " product(s)" << std::endl;

        // Initialize IPC
        TelemetryPub telemetry_pub(telemetry_address);
        ControlRep control_rep(control_address);

        if (!telemetry_pub.is_connected()) {
            std::cerr << "Failed to bind telemetry publisher" << std::endl;
            return 1;
        }

        if (!control_rep.is_connected()) {
            std::cerr << "Failed to bind control responder" << std::endl;
            return 1;
        }

        EventChannel events;
        DeviceManager devices(site, &events, &events);
        BlendOrchestrator blends(devices, &events);
        TerminalAPI api{devices, blends};

        // Forward queued events until the channel is closed and empty
        std::atomic<bool> events_closed{false};
        std::thread publisher([&]() {
            for (;;) {
                auto batch = events.drain(std::chrono::milliseconds(200));
                for (const auto& e : batch) {
                    telemetry_pub.publish(e);
                }
                if (batch.empty() && events_closed.load()) break;
            }
        });

        devices.start_all();

        std::cout << "System ready!" << std::endl;
        std::cout << "  Telemetry: " << telemetry_pub.get_bind_address() << std::endl;
        std::cout << "  Control:   " << control_rep.get_bind_address() << std::endl;
        std::cout << "Press Ctrl+C to stop" << std::endl;

        auto last_reap = std::chrono::steady_clock::now();
        while (!shutdown_requested.load()) {
            if (auto cmd = control_rep.recv()) {
                control_rep.reply(api.handle_cmd(*cmd));
            }

            auto now = std::chrono::steady_clock::now();
            if (now - last_reap >= std::chrono::seconds(5)) {
                blends.reap();
                last_reap = now;
            }
        }

        // Clean shutdown: safe the plant first, then stop polling
        std::cout << "\nShutdown signal received, stopping..." << std::endl;
        blends.shutdown();
        devices.stop_all();
        events.close();
        events_closed.store(true);
        if (publisher.joinable()) {
            publisher.join();
        }

        std::cout << "Events published: " << telemetry_pub.sent() << ", dropped: " << events.dropped() << std::endl;
        std::cout << "Shutdown complete." << std::endl;

    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
