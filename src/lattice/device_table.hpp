#pragma once
#include "../core/unit_system.hpp"
#include "../core/units_error.hpp"
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

/**
 * @brief Binding of a field to control-system points
 *
 * A device has a readback point, a setpoint point, or both.
 */
struct Device {
    std::string name;                       ///< Device prefix, e.g. SR01A-PC-Q1D-01
    std::optional<std::string> readback;    ///< Readback point name
    std::optional<std::string> setpoint;    ///< Setpoint point name

    /**
     * @brief Point name for a handle
     * @throws AccessError HANDLE_ERROR if the device has no such point
     */
    const std::string& point(Handle handle) const {
        const auto& pv = handle == Handle::READBACK ? readback : setpoint;
        if (!pv) {
            throw AccessError(AccessErrorKind::HANDLE_ERROR,
                              "device " + name + " has no " + to_string(handle) + " point");
        }
        return *pv;
    }
};

/**
 * @brief Devices keyed by (element id, field)
 */
class DeviceTable {
public:
    void add(int element_id, const std::string& field, Device device) {
        if (!device.readback && !device.setpoint) {
            throw AccessError(AccessErrorKind::HANDLE_ERROR,
                              "device " + device.name + " needs a readback or setpoint point");
        }
        auto key = std::make_pair(element_id, field);
        if (devices_.count(key)) {
            throw AccessError(AccessErrorKind::FIELD_ERROR,
                              "element " + std::to_string(element_id) + " already has a device on field '" +
                              field + "'");
        }
        devices_.emplace(std::move(key), std::move(device));
    }

    /**
     * @throws AccessError FIELD_ERROR if no device is bound
     */
    const Device& get(int element_id, const std::string& field) const {
        auto it = devices_.find(std::make_pair(element_id, field));
        if (it == devices_.end()) {
            throw AccessError(AccessErrorKind::FIELD_ERROR,
                              "element " + std::to_string(element_id) + " has no field '" + field + "'");
        }
        return it->second;
    }

    bool contains(int element_id, const std::string& field) const {
        return devices_.count(std::make_pair(element_id, field)) > 0;
    }

    std::vector<std::string> fields(int element_id) const {
        std::vector<std::string> out;
        for (auto it = devices_.lower_bound(std::make_pair(element_id, std::string()));
             it != devices_.end() && it->first.first == element_id; ++it) {
            out.push_back(it->first.second);
        }
        return out;
    }

    std::size_t size() const { return devices_.size(); }

private:
    std::map<std::pair<int, std::string>, Device> devices_;
};
