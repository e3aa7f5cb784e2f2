#include "../src/ipc/control_rep.hpp"
#include "../src/control/api.hpp"
#include "test_rig.hpp"
#include <zmq.h>
#include <atomic>
#include <cassert>
#include <iostream>
#include <string>
#include <thread>

/**
 * @brief Test ControlRep functionality
 *
 * Serves ControlAPI over the REP socket and drives it from a REQ client,
 * as the executable's main loop does.
 */
int main() {
    std::cout << "Testing ControlRep functionality..." << std::endl;

    const std::string endpoint = "tcp://127.0.0.1:15555";

    // Test 1: Nothing pending
    {
        std::cout << "Test 1: Poll timeout" << std::endl;
        ControlRep rep(endpoint);
        assert(rep.is_connected());
        assert(rep.get_bind_address() == endpoint);
        assert(!rep.poll(20));
        std::cout << "  Poll timeout test passed" << std::endl;
    }

    // Test 2: Request/response through the control API
    {
        std::cout << "Test 2: Request/response" << std::endl;
        TestRig rig(2);
        rig.set_machine_state(MachineState::Off);
        ControlAPI api(rig.store, *rig.actuator, *rig.sensors, *rig.interlock);
        ControlRep rep(endpoint);
        assert(rep.is_connected());

        std::atomic<bool> done{false};
        std::thread server([&]() {
            while (!done.load()) {
                if (rep.poll(20)) {
                    rep.reply(api.handle_command(rep.recv()));
                }
            }
        });

        void* ctx = zmq_ctx_new();
        void* req = zmq_socket(ctx, ZMQ_REQ);
        int timeout_ms = 2000;
        zmq_setsockopt(req, ZMQ_RCVTIMEO, &timeout_ms, sizeof(timeout_ms));
        assert(zmq_connect(req, endpoint.c_str()) == 0);

        auto request = [&](const std::string& cmd) {
            zmq_send(req, cmd.data(), cmd.size(), 0);
            char buf[8192];
            int n = zmq_recv(req, buf, sizeof(buf), 0);
            assert(n > 0);
            return json::parse(std::string(buf, buf + n));
        };

        json r = request(R"({"cmd":"set_machine_state","state":"on"})");
        assert(r["ok"].get<bool>());
        assert(rig.store.machine()->machine_state == MachineState::On);

        r = request(R"({"cmd":"bogus"})");
        assert(!r["ok"].get<bool>());

        r = request(R"({"cmd":"get_status"})");
        assert(r["ok"].get<bool>());
        assert(r["machine_state"] == "on");

        done.store(true);
        server.join();
        zmq_close(req);
        zmq_ctx_term(ctx);
        std::cout << "  Request/response test passed" << std::endl;
    }

    std::cout << "✅ All ControlRep tests passed!" << std::endl;
    return 0;
}
