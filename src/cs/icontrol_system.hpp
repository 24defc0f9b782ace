#pragma once
#include "../core/units_error.hpp"
#include <string>
#include <vector>

/**
 * @brief Abstract control-system client
 *
 * Reads and writes named points (process variables) in engineering units.
 * Implementations report failures as AccessError CONTROL_SYSTEM_ERROR (or
 * READ_ONLY for points that cannot be written); calls may block for the
 * client's own timeout.
 */
class IControlSystem {
public:
    virtual ~IControlSystem() = default;

    /**
     * @brief Read one point
     */
    virtual double get_single(const std::string& pv) = 0;

    /**
     * @brief Write one point
     */
    virtual void set_single(const std::string& pv, double value) = 0;

    /**
     * @brief Read several points, in order
     */
    virtual std::vector<double> get_multiple(const std::vector<std::string>& pvs) {
        std::vector<double> values;
        values.reserve(pvs.size());
        for (const auto& pv : pvs) values.push_back(get_single(pv));
        return values;
    }

    /**
     * @brief Write several points, in order
     * @throws AccessError CONTROL_SYSTEM_ERROR if the sequences differ in length
     */
    virtual void set_multiple(const std::vector<std::string>& pvs, const std::vector<double>& values) {
        if (pvs.size() != values.size()) {
            throw AccessError(AccessErrorKind::CONTROL_SYSTEM_ERROR,
                              "set_multiple given " + std::to_string(pvs.size()) + " points but " +
                              std::to_string(values.size()) + " values");
        }
        for (std::size_t i = 0; i < pvs.size(); ++i) set_single(pvs[i], values[i]);
    }

    virtual std::string get_type_name() const = 0;
};
