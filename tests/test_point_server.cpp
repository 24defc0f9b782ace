#include "../src/cs/memory_control_system.hpp"
#include "../src/ipc/point_server.hpp"
#include "../src/ipc/zmq_control_system.hpp"
#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

template <class F>
static bool access_fails(AccessErrorKind kind, F&& f) {
    try {
        f();
    } catch (const AccessError& e) {
        std::cout << "  (expected) " << e.what() << std::endl;
        return e.kind() == kind;
    }
    return false;
}

/**
 * @brief Test the point server and its ZeroMQ client
 *
 * Verifies:
 * 1. Request handling without sockets
 * 2. Single and multiple reads and writes over TCP
 * 3. Error replies mapped back to access errors
 * 4. Client timeout with no server listening
 * 5. Connect and bind failures
 */
int main() {
    std::cout << "Testing PointServer and ZmqControlSystem..." << std::endl;

    MemoryControlSystem backend;
    backend.define("Q1:I", 12.5, true);
    backend.define("Q1:SETI", 0.0);
    backend.define("Q2:SETI", 0.0);

    PointServer server(backend, "tcp://127.0.0.1:5557");
    assert(server.get_bind_address() == "tcp://127.0.0.1:5557");

    // Test 1: Request handling
    {
        std::cout << "Test 1: Request handling" << std::endl;
        auto reply = json::parse(server.handle(R"({"cmd":"get","pv":"Q1:I"})"));
        assert(reply["ok"] == true && reply["value"] == 12.5);

        reply = json::parse(server.handle(R"({"cmd":"set","pv":"Q1:SETI","value":3.0})"));
        assert(reply["ok"] == true);
        assert(backend.get_single("Q1:SETI") == 3.0);

        reply = json::parse(server.handle(R"({"cmd":"get_multiple","pvs":["Q1:I","Q1:SETI"]})"));
        assert(reply["values"].size() == 2 && reply["values"][1] == 3.0);

        reply = json::parse(server.handle(R"({"cmd":"set","pv":"Q1:I","value":1.0})"));
        assert(reply["ok"] == false && reply["kind"] == "READ_ONLY");

        reply = json::parse(server.handle(R"({"cmd":"get","pv":"NOPE"})"));
        assert(reply["ok"] == false && reply["kind"] == "CONTROL_SYSTEM_ERROR");
        assert(reply["error"] == "cannot connect to NOPE");

        for (const char* bad : {"not json", "[]", R"({"pv":"Q1:I"})", R"({"cmd":"reboot"})",
                                R"({"cmd":"get"})", R"({"cmd":"set","pv":"Q1:SETI","value":"x"})"}) {
            reply = json::parse(server.handle(bad));
            assert(reply["ok"] == false);
        }
    }

    std::atomic<bool> running{true};
    std::thread server_thread([&] { server.run(running, 20); });

    // Test 2: Round trip over TCP
    {
        std::cout << "Test 2: TCP round trip" << std::endl;
        ZmqControlSystem client({"tcp://127.0.0.1:5557", 1000, 1});
        assert(client.get_type_name() == "ZmqControlSystem");

        assert(client.get_single("Q1:I") == 12.5);
        client.set_single("Q1:SETI", 7.25);
        assert(backend.get_single("Q1:SETI") == 7.25);

        client.set_multiple({"Q1:SETI", "Q2:SETI"}, {1.0, 2.0});
        auto values = client.get_multiple({"Q1:SETI", "Q2:SETI", "Q1:I"});
        assert(values.size() == 3);
        assert(values[0] == 1.0 && values[1] == 2.0 && values[2] == 12.5);

        // Server-side failures keep their kind
        assert(access_fails(AccessErrorKind::READ_ONLY, [&] { client.set_single("Q1:I", 0.0); }));
        assert(access_fails(AccessErrorKind::CONTROL_SYSTEM_ERROR, [&] { client.get_single("NOPE"); }));
        assert(access_fails(AccessErrorKind::CONTROL_SYSTEM_ERROR,
                            [&] { client.set_multiple({"Q1:SETI"}, {1.0, 2.0}); }));

        // The client stays usable after an error reply
        assert(client.get_single("Q2:SETI") == 2.0);
    }

    running.store(false);
    server_thread.join();
    assert(server.served_count() >= 7);
    std::cout << "  Served " << server.served_count() << " requests" << std::endl;

    // Test 3: No server listening
    {
        std::cout << "Test 3: Timeout" << std::endl;
        ZmqControlSystem client({"tcp://127.0.0.1:5558", 100, 1});
        auto start = std::chrono::steady_clock::now();
        assert(access_fails(AccessErrorKind::CONTROL_SYSTEM_ERROR, [&] { client.get_single("Q1:I"); }));
        auto elapsed = std::chrono::steady_clock::now() - start;
        assert(elapsed >= std::chrono::milliseconds(150));
        assert(elapsed < std::chrono::seconds(5));
    }

    // Test 4: Malformed endpoint fails construction and releases the context
    {
        std::cout << "Test 4: Connect failure" << std::endl;
        for (int i = 0; i < 50; i++) {
            assert(access_fails(AccessErrorKind::CONTROL_SYSTEM_ERROR,
                                [&] { ZmqControlSystem bad({"not-an-endpoint", 100, 0}); }));
        }
    }

    // Test 5: Binding an address in use
    {
        std::cout << "Test 5: Bind failure" << std::endl;
        assert(access_fails(AccessErrorKind::CONTROL_SYSTEM_ERROR,
                            [&] { PointServer second(backend, "tcp://127.0.0.1:5557"); }));
    }

    std::cout << "✅ All PointServer tests passed!" << std::endl;
    return 0;
}
