#pragma once
#include "../core/units_error.hpp"
#include <string>
#include <zmq.h>

/**
 * @brief Wire helpers shared by the point server and client
 *
 * Requests and replies are single-frame JSON documents:
 * - {"cmd":"get","pv":"NAME"}                       -> {"ok":true,"value":1.5}
 * - {"cmd":"set","pv":"NAME","value":1.5}           -> {"ok":true}
 * - {"cmd":"get_multiple","pvs":["A","B"]}          -> {"ok":true,"values":[1.0,2.0]}
 * - {"cmd":"set_multiple","pvs":["A"],"values":[1]} -> {"ok":true}
 * Failures reply {"ok":false,"error":"...","kind":"CONTROL_SYSTEM_ERROR"}.
 */
namespace PointProtocol {

/**
 * @brief Receive one whole frame, whatever its size
 * @return false on timeout or error
 */
inline bool recv_frame(void* socket, std::string& out) {
    zmq_msg_t msg;
    zmq_msg_init(&msg);
    int n = zmq_msg_recv(&msg, socket, 0);
    if (n < 0) {
        zmq_msg_close(&msg);
        return false;
    }
    const char* data = static_cast<const char*>(zmq_msg_data(&msg));
    out.assign(data, data + zmq_msg_size(&msg));
    zmq_msg_close(&msg);
    return true;
}

inline bool send_frame(void* socket, const std::string& s) {
    return zmq_send(socket, s.data(), s.size(), 0) >= 0;
}

inline AccessErrorKind parse_kind(const std::string& s) {
    if (s == "FIELD_ERROR") return AccessErrorKind::FIELD_ERROR;
    if (s == "HANDLE_ERROR") return AccessErrorKind::HANDLE_ERROR;
    if (s == "READ_ONLY") return AccessErrorKind::READ_ONLY;
    return AccessErrorKind::CONTROL_SYSTEM_ERROR;
}

}  // namespace PointProtocol
