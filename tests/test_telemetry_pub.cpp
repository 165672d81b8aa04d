#include "../src/ipc/telemetry_pub.hpp"
#include <algorithm>
#include <cassert>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <zmq.h>

/**
 * @brief Test TelemetryPub functionality
 *
 * Publishes typed events and checks a subscriber sees them as
 * topic + JSON body, filtered by topic.
 */

static std::string recv_frame(void* sock) {
    char buf[4096];
    int n = zmq_recv(sock, buf, sizeof(buf), 0);
    if (n < 0) return "";
    return std::string(buf, buf + std::min<int>(n, sizeof(buf)));
}

int main() {
    std::cout << "Testing TelemetryPub functionality..." << std::endl;
    const std::string address = "tcp://127.0.0.1:5566";

    // Test 1: Bind, publish and clean up
    {
        std::cout << "Test 1: Publisher lifecycle" << std::endl;

        for (int i = 0; i < 3; i++) {
            TelemetryPub pub(address);
            assert(pub.is_connected());
            assert(pub.get_bind_address() == address);

            TriggerEvent e{"PLC-1", 100, 1000.0 + i, std::chrono::system_clock::now()};
            assert(pub.publish(e));
            assert(pub.sent() == 1);
        }

        std::cout << "  Publisher lifecycle test passed" << std::endl;
    }

    // Test 2: Subscriber receives topic and JSON body
    {
        std::cout << "Test 2: Subscriber delivery" << std::endl;

        TelemetryPub pub(address);
        void* ctx = zmq_ctx_new();
        void* sub = zmq_socket(ctx, ZMQ_SUB);
        int timeout_ms = 2000;
        zmq_setsockopt(sub, ZMQ_RCVTIMEO, &timeout_ms, sizeof(timeout_ms));
        zmq_setsockopt(sub, ZMQ_SUBSCRIBE, "blend_progress", 14);
        assert(zmq_connect(sub, address.c_str()) == 0);

        // let the subscription reach the publisher
        std::this_thread::sleep_for(std::chrono::milliseconds(300));

        PollHealthEvent health;
        health.device_id = "PLC-1";
        assert(pub.publish(health));

        BlendProgressEvent progress;
        progress.operation_id = 7;
        progress.status = BlendStatus::BLENDING;
        progress.accumulated_volume = 250.0;
        progress.target_volume = 1000.0;
        progress.api_gravity = 36.0;
        progress.components.push_back(ComponentProgress{"T-101", "ULSD", 600.0, 150.0, 120.0, ComponentState::ACTIVE});
        assert(pub.publish(progress));
        assert(pub.sent() == 2);

        // only the subscribed topic arrives
        std::string topic = recv_frame(sub);
        assert(topic == "blend_progress");
        int more = 0;
        size_t more_size = sizeof(more);
        zmq_getsockopt(sub, ZMQ_RCVMORE, &more, &more_size);
        assert(more == 1);

        auto body = json::parse(recv_frame(sub));
        std::cout << "  " << body.dump() << std::endl;
        assert(body["operation_id"] == 7);
        assert(body["status"] == "blending");
        assert(body["percent_complete"] == 25.0);
        assert(body["components"][0]["source_tank"] == "T-101");
        assert(body["components"][0]["state"] == "active");
        assert(body["components"][0]["active"] == true);
        assert(body["components"][0]["failed"] == false);

        zmq_close(sub);
        zmq_ctx_term(ctx);

        std::cout << "  Subscriber delivery test passed" << std::endl;
    }

    // Test 3: Event topics
    {
        std::cout << "Test 3: Event topics" << std::endl;

        assert(std::string(event_topic(Event{TriggerEvent{}})) == "trigger");
        assert(std::string(event_topic(Event{PollHealthEvent{}})) == "poll_health");
        assert(std::string(event_topic(Event{BlendProgressEvent{}})) == "blend_progress");

        auto j = event_to_json(Event{PollHealthEvent{}});
        assert(j["status"] == "never_polled");
        assert(j["last_poll_time"].is_null());

        std::cout << "  Event topics test passed" << std::endl;
    }

    std::cout << "✅ All TelemetryPub tests passed!" << std::endl;
    return 0;
}
