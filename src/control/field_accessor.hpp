#pragma once
#include "../core/unit_system.hpp"
#include "../core/units_error.hpp"
#include "../cs/icontrol_system.hpp"
#include "../lattice/device_table.hpp"
#include "../units/conversion_registry.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Read and write element fields in either unit system
 *
 * Points are always exchanged with the control system in engineering units;
 * the accessor converts readbacks with to_physics() and setpoints with
 * to_engineering() through the registry. Every engineering value written is
 * saturated into the field's limits. Holds references to the device table
 * and client, which must outlive it.
 */
class FieldAccessor {
public:
    FieldAccessor(std::shared_ptr<const ConversionRegistry> registry,
                  const DeviceTable& devices,
                  IControlSystem& cs,
                  Units default_units = Units::PHYSICS)
        : registry_(std::move(registry)), devices_(devices), cs_(cs), default_units_(default_units) {
        if (!registry_) {
            throw AccessError(AccessErrorKind::FIELD_ERROR, "field accessor needs a registry");
        }
    }

    /**
     * @brief Read a field
     * @param handle READBACK or SETPOINT point of the device
     * @param units Requested unit system; the default units when absent
     * @throws AccessError FIELD_ERROR, HANDLE_ERROR or CONTROL_SYSTEM_ERROR
     */
    double get_value(int element_id, const std::string& field,
                     Handle handle = Handle::READBACK,
                     std::optional<Units> units = std::nullopt) const {
        const auto& pv = devices_.get(element_id, field).point(handle);
        double eng = cs_.get_single(pv);
        if (units.value_or(default_units_) == Units::ENGINEERING) return eng;
        return registry_->resolve(element_id, field).to_physics(eng);
    }

    /**
     * @brief Write a field's setpoint
     * @param value Value in the given (or default) unit system
     * @return Engineering value sent to the control system, after clamping
     * @throws UnitsError DIVISION_ERROR / NOT_INVERTIBLE from the conversion
     */
    double set_value(int element_id, const std::string& field, double value,
                     std::optional<Units> units = std::nullopt) const {
        const auto& pv = devices_.get(element_id, field).point(Handle::SETPOINT);
        double eng = to_engineering(element_id, field, value, units);
        cs_.set_single(pv, eng);
        return eng;
    }

    /**
     * @brief Read one field across several elements in a single client call
     */
    std::vector<double> get_values(const std::vector<int>& element_ids, const std::string& field,
                                   Handle handle = Handle::READBACK,
                                   std::optional<Units> units = std::nullopt) const {
        std::vector<std::string> pvs;
        pvs.reserve(element_ids.size());
        for (int id : element_ids) pvs.push_back(devices_.get(id, field).point(handle));

        auto values = cs_.get_multiple(pvs);
        if (units.value_or(default_units_) == Units::PHYSICS) {
            for (std::size_t i = 0; i < values.size(); ++i) {
                values[i] = registry_->resolve(element_ids[i], field).to_physics(values[i]);
            }
        }
        return values;
    }

    /**
     * @brief Write one field across several elements in a single client call
     * @return Engineering values sent, after clamping
     */
    std::vector<double> set_values(const std::vector<int>& element_ids, const std::string& field,
                                   const std::vector<double>& values,
                                   std::optional<Units> units = std::nullopt) const {
        if (element_ids.size() != values.size()) {
            throw AccessError(AccessErrorKind::FIELD_ERROR,
                              "set_values given " + std::to_string(element_ids.size()) +
                              " elements but " + std::to_string(values.size()) + " values");
        }
        std::vector<std::string> pvs;
        std::vector<double> eng;
        pvs.reserve(element_ids.size());
        eng.reserve(element_ids.size());
        // Convert everything before writing anything
        for (std::size_t i = 0; i < element_ids.size(); ++i) {
            pvs.push_back(devices_.get(element_ids[i], field).point(Handle::SETPOINT));
            eng.push_back(to_engineering(element_ids[i], field, values[i], units));
        }
        cs_.set_multiple(pvs, eng);
        return eng;
    }

    Units default_units() const { return default_units_; }
    const ConversionRegistry& registry() const { return *registry_; }

private:
    std::shared_ptr<const ConversionRegistry> registry_;
    const DeviceTable& devices_;
    IControlSystem& cs_;
    Units default_units_;

    double to_engineering(int element_id, const std::string& field, double value,
                          std::optional<Units> units) const {
        const auto& record = registry_->resolve(element_id, field);
        if (units.value_or(default_units_) == Units::PHYSICS) return record.to_engineering(value);
        return record.clamp(value);
    }
};
