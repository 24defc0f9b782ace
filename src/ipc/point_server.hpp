#pragma once
#include "../cs/icontrol_system.hpp"
#include "point_protocol.hpp"
#include <atomic>
#include <cstdint>
#include <string>
#include <vector>
#include <zmq.h>
#include <nlohmann/json.hpp>

/**
 * @brief ZeroMQ responder exposing a control system over the point protocol
 *
 * Typically wraps a MemoryControlSystem so that remote clients (and the
 * command-line driver) can read and write its points.
 */
class PointServer {
public:
    /**
     * @brief Create the REP socket and bind it
     * @throws AccessError CONTROL_SYSTEM_ERROR if the endpoint cannot be bound
     */
    PointServer(IControlSystem& backend, const std::string& endpoint)
        : backend_(backend), endpoint_(endpoint) {
        ctx_ = zmq_ctx_new();
        rep_ = zmq_socket(ctx_, ZMQ_REP);
        int linger = 0;
        zmq_setsockopt(rep_, ZMQ_LINGER, &linger, sizeof(linger));
        if (zmq_bind(rep_, endpoint.c_str()) != 0) {
            std::string reason = zmq_strerror(zmq_errno());
            zmq_close(rep_);
            zmq_ctx_term(ctx_);
            throw AccessError(AccessErrorKind::CONTROL_SYSTEM_ERROR,
                              "cannot bind point server to " + endpoint + ": " + reason);
        }
    }

    ~PointServer() {
        zmq_close(rep_);
        zmq_ctx_term(ctx_);
    }

    PointServer(const PointServer&) = delete;
    PointServer& operator=(const PointServer&) = delete;

    /**
     * @brief Wait for one request and answer it
     * @param timeout_ms Poll timeout; -1 blocks
     * @return true if a request was served
     */
    bool serve_once(int timeout_ms) {
        zmq_pollitem_t items[] = {{rep_, 0, ZMQ_POLLIN, 0}};
        if (zmq_poll(items, 1, timeout_ms) <= 0) return false;
        if (!(items[0].revents & ZMQ_POLLIN)) return false;

        std::string request;
        if (!PointProtocol::recv_frame(rep_, request)) return false;
        PointProtocol::send_frame(rep_, handle(request));
        served_.fetch_add(1, std::memory_order_relaxed);
        return true;
    }

    /**
     * @brief Serve until running is cleared
     */
    void run(const std::atomic<bool>& running, int poll_ms = 100) {
        while (running.load(std::memory_order_relaxed)) {
            serve_once(poll_ms);
        }
    }

    /**
     * @brief Answer one JSON request against the backend
     * @return JSON reply; never throws for malformed requests
     */
    std::string handle(const std::string& request) {
        using json = nlohmann::json;
        auto j = json::parse(request, nullptr, false);
        if (!j.is_object() || !j.contains("cmd") || !j["cmd"].is_string()) {
            return error_reply(AccessErrorKind::CONTROL_SYSTEM_ERROR, "malformed request");
        }

        try {
            const std::string cmd = j["cmd"].get<std::string>();
            if (cmd == "get") {
                double v = backend_.get_single(j.at("pv").get<std::string>());
                return json{{"ok", true}, {"value", v}}.dump();
            } else if (cmd == "set") {
                backend_.set_single(j.at("pv").get<std::string>(), j.at("value").get<double>());
                return json{{"ok", true}}.dump();
            } else if (cmd == "get_multiple") {
                auto values = backend_.get_multiple(j.at("pvs").get<std::vector<std::string>>());
                return json{{"ok", true}, {"values", values}}.dump();
            } else if (cmd == "set_multiple") {
                backend_.set_multiple(j.at("pvs").get<std::vector<std::string>>(),
                                      j.at("values").get<std::vector<double>>());
                return json{{"ok", true}}.dump();
            }
            return error_reply(AccessErrorKind::CONTROL_SYSTEM_ERROR, "unknown command '" + cmd + "'");
        } catch (const AccessError& e) {
            return error_reply(e.kind(), e.message());
        } catch (const json::exception& e) {
            return error_reply(AccessErrorKind::CONTROL_SYSTEM_ERROR,
                               std::string("malformed request: ") + e.what());
        }
    }

    const std::string& get_bind_address() const { return endpoint_; }
    std::uint64_t served_count() const { return served_.load(std::memory_order_relaxed); }

private:
    IControlSystem& backend_;
    std::string endpoint_;
    void* ctx_{nullptr};  ///< ZeroMQ context
    void* rep_{nullptr};  ///< ZeroMQ REP socket
    std::atomic<std::uint64_t> served_{0};

    static std::string error_reply(AccessErrorKind kind, const std::string& message) {
        return nlohmann::json{{"ok", false}, {"error", message}, {"kind", to_string(kind)}}.dump();
    }
};
