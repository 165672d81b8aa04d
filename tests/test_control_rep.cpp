#include "../src/ipc/control_rep.hpp"
#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <zmq.h>

/**
 * @brief Test ControlRep functionality
 *
 * A REQ client sends commands to the responder, which echoes a reply per
 * command. Also checks that recv() gives up after its timeout.
 */
int main() {
    std::cout << "Testing ControlRep functionality..." << std::endl;
    using namespace std::chrono;
    const std::string address = "tcp://127.0.0.1:5565";

    // Test 1: Receive timeout
    {
        std::cout << "Test 1: Receive timeout" << std::endl;

        ControlRep rep(address, 100);
        assert(rep.is_connected());
        assert(rep.get_bind_address() == address);

        auto start = steady_clock::now();
        auto cmd = rep.recv();
        auto elapsed = steady_clock::now() - start;
        assert(!cmd);
        assert(elapsed >= milliseconds(50));
        assert(elapsed < milliseconds(2000));

        std::cout << "  Receive timeout test passed" << std::endl;
    }

    // Test 2: Request/reply
    {
        std::cout << "Test 2: Request/reply" << std::endl;

        ControlRep rep(address, 100);
        std::atomic<bool> running{true};
        std::atomic<int> handled{0};

        std::thread server([&] {
            while (running) {
                auto cmd = rep.recv();
                if (!cmd) continue;
                std::cout << "  Server received: " << *cmd << std::endl;
                bool sent = rep.reply(R"({"ok":true,"echo":)" + *cmd + "}");
                assert(sent);
                handled++;
            }
        });

        void* ctx = zmq_ctx_new();
        void* req = zmq_socket(ctx, ZMQ_REQ);
        int timeout_ms = 2000;
        zmq_setsockopt(req, ZMQ_RCVTIMEO, &timeout_ms, sizeof(timeout_ms));
        assert(zmq_connect(req, address.c_str()) == 0);

        for (int i = 0; i < 3; i++) {
            std::string cmd = R"({"cmd":"get_status","id":)" + std::to_string(i) + "}";
            assert(zmq_send(req, cmd.data(), cmd.size(), 0) >= 0);

            char buf[1024];
            int n = zmq_recv(req, buf, sizeof(buf), 0);
            assert(n > 0);
            std::string response(buf, buf + n);
            std::cout << "  Client received: " << response << std::endl;
            assert(response.find("\"ok\":true") != std::string::npos);
            assert(response.find(cmd) != std::string::npos);
        }

        running = false;
        server.join();
        assert(handled == 3);

        zmq_close(req);
        zmq_ctx_term(ctx);

        std::cout << "  Request/reply test passed" << std::endl;
    }

    std::cout << "✅ All ControlRep tests passed!" << std::endl;
    return 0;
}
