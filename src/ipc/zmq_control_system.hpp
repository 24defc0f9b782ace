#pragma once
#include "../core/config.hpp"
#include "../cs/icontrol_system.hpp"
#include "point_protocol.hpp"
#include <mutex>
#include <string>
#include <vector>
#include <zmq.h>
#include <nlohmann/json.hpp>

/**
 * @brief Control-system client speaking the point protocol to a PointServer
 *
 * Each request waits at most timeout_ms for its reply. On timeout the REQ
 * socket is discarded and reconnected (a REQ socket cannot send again before
 * it has received) and the request is retried up to `retries` times. Calls
 * are serialized; one instance may be shared between threads.
 */
class ZmqControlSystem : public IControlSystem {
public:
    explicit ZmqControlSystem(const ControlSystemConfig& config)
        : endpoint_(config.endpoint), timeout_ms_(config.timeout_ms), retries_(config.retries) {
        ctx_ = zmq_ctx_new();
        try {
            open_socket();
        } catch (const AccessError&) {
            zmq_ctx_term(ctx_);
            throw;
        }
    }

    ~ZmqControlSystem() override {
        if (req_) zmq_close(req_);
        zmq_ctx_term(ctx_);
    }

    ZmqControlSystem(const ZmqControlSystem&) = delete;
    ZmqControlSystem& operator=(const ZmqControlSystem&) = delete;

    double get_single(const std::string& pv) override {
        auto reply = request({{"cmd", "get"}, {"pv", pv}});
        return field<double>(reply, "value");
    }

    void set_single(const std::string& pv, double value) override {
        request({{"cmd", "set"}, {"pv", pv}, {"value", value}});
    }

    std::vector<double> get_multiple(const std::vector<std::string>& pvs) override {
        auto reply = request({{"cmd", "get_multiple"}, {"pvs", pvs}});
        auto values = field<std::vector<double>>(reply, "values");
        if (values.size() != pvs.size()) {
            throw AccessError(AccessErrorKind::CONTROL_SYSTEM_ERROR,
                              "point server returned " + std::to_string(values.size()) +
                              " values for " + std::to_string(pvs.size()) + " points");
        }
        return values;
    }

    void set_multiple(const std::vector<std::string>& pvs, const std::vector<double>& values) override {
        if (pvs.size() != values.size()) {
            throw AccessError(AccessErrorKind::CONTROL_SYSTEM_ERROR,
                              "set_multiple given " + std::to_string(pvs.size()) + " points but " +
                              std::to_string(values.size()) + " values");
        }
        request({{"cmd", "set_multiple"}, {"pvs", pvs}, {"values", values}});
    }

    std::string get_type_name() const override { return "ZmqControlSystem"; }
    const std::string& get_endpoint() const { return endpoint_; }

private:
    std::string endpoint_;
    int timeout_ms_;
    int retries_;
    void* ctx_{nullptr};  ///< ZeroMQ context
    void* req_{nullptr};  ///< ZeroMQ REQ socket
    std::mutex mutex_;

    void open_socket() {
        req_ = zmq_socket(ctx_, ZMQ_REQ);
        int linger = 0;
        zmq_setsockopt(req_, ZMQ_LINGER, &linger, sizeof(linger));
        zmq_setsockopt(req_, ZMQ_SNDTIMEO, &timeout_ms_, sizeof(timeout_ms_));
        if (zmq_connect(req_, endpoint_.c_str()) != 0) {
            std::string reason = zmq_strerror(zmq_errno());
            zmq_close(req_);
            req_ = nullptr;
            throw AccessError(AccessErrorKind::CONTROL_SYSTEM_ERROR,
                              "cannot connect to " + endpoint_ + ": " + reason);
        }
    }

    void reopen_socket() {
        if (req_) zmq_close(req_);
        req_ = nullptr;
        open_socket();
    }

    nlohmann::json request(const nlohmann::json& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        const std::string payload = message.dump();

        for (int attempt = 0; attempt <= retries_; ++attempt) {
            if (!req_) open_socket();
            if (!PointProtocol::send_frame(req_, payload)) {
                reopen_socket();
                continue;
            }

            zmq_pollitem_t items[] = {{req_, 0, ZMQ_POLLIN, 0}};
            int rc = zmq_poll(items, 1, timeout_ms_);
            std::string raw;
            if (rc > 0 && (items[0].revents & ZMQ_POLLIN) && PointProtocol::recv_frame(req_, raw)) {
                return check_reply(raw);
            }
            reopen_socket();
        }
        throw AccessError(AccessErrorKind::CONTROL_SYSTEM_ERROR,
                          "no reply from " + endpoint_ + " after " + std::to_string(retries_ + 1) +
                          " attempt(s)");
    }

    static nlohmann::json check_reply(const std::string& raw) {
        auto reply = nlohmann::json::parse(raw, nullptr, false);
        if (!reply.is_object()) {
            throw AccessError(AccessErrorKind::CONTROL_SYSTEM_ERROR, "malformed reply: " + raw);
        }
        if (!reply.value("ok", false)) {
            throw AccessError(PointProtocol::parse_kind(reply.value("kind", std::string())),
                              reply.value("error", std::string("request failed")));
        }
        return reply;
    }

    template <class T>
    static T field(const nlohmann::json& reply, const char* name) {
        try {
            return reply.at(name).get<T>();
        } catch (const nlohmann::json::exception& e) {
            throw AccessError(AccessErrorKind::CONTROL_SYSTEM_ERROR,
                              std::string("malformed reply field '") + name + "': " + e.what());
        }
    }
};
