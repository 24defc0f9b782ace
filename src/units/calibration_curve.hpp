#pragma once
#include "../core/units_error.hpp"
#include <cmath>
#include <cstddef>
#include <string>
#include <vector>

/**
 * @brief Measured calibration of one device
 *
 * Paired samples relating engineering input (e.g. power supply current in A)
 * to physical response (e.g. integrated field strength). Both sequences must
 * have the same length (at least 2) and be strictly increasing, so that the
 * curve and its inverse are single-valued.
 */
class CalibrationCurve {
public:
    CalibrationCurve(std::vector<double> current, std::vector<double> field)
        : current_(std::move(current)), field_(std::move(field)) {
        validate();
    }

    const std::vector<double>& current() const { return current_; }
    const std::vector<double>& field() const { return field_; }
    std::size_t size() const { return current_.size(); }

    bool operator==(const CalibrationCurve& other) const {
        return current_ == other.current_ && field_ == other.field_;
    }

private:
    std::vector<double> current_;
    std::vector<double> field_;

    void validate() const {
        if (current_.size() != field_.size()) {
            throw UnitsError(UnitsErrorKind::DOMAIN_ERROR,
                             "calibration curve has " + std::to_string(current_.size()) +
                             " current samples but " + std::to_string(field_.size()) +
                             " field samples");
        }
        if (current_.size() < 2) {
            throw UnitsError(UnitsErrorKind::DOMAIN_ERROR,
                             "calibration curve needs at least 2 samples, got " +
                             std::to_string(current_.size()));
        }
        check_increasing(current_, "current");
        check_increasing(field_, "field");
    }

    static void check_increasing(const std::vector<double>& v, const char* name) {
        for (std::size_t i = 0; i < v.size(); ++i) {
            if (!std::isfinite(v[i])) {
                throw UnitsError(UnitsErrorKind::DOMAIN_ERROR,
                                 std::string("calibration ") + name + " sample " +
                                 std::to_string(i) + " is not finite");
            }
            if (i > 0 && !(v[i] > v[i - 1])) {
                throw UnitsError(UnitsErrorKind::DOMAIN_ERROR,
                                 std::string("calibration ") + name +
                                 " samples not strictly increasing at index " + std::to_string(i));
            }
        }
    }
};
