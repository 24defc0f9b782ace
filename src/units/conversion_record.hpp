#pragma once
#include "../core/unit_system.hpp"
#include "../core/units_error.hpp"
#include "calibration_curve.hpp"
#include "limits.hpp"
#include "pchip.hpp"
#include <cmath>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Conversion algorithm of a record
 *
 * NONE is the identity ("null" in the unit tables); it is used for fields
 * without a unit distinction and as the fallback for unknown fields.
 */
enum class ConversionKind {
    NONE = 0,     ///< Identity in both directions, never clamped
    POLYNOMIAL,   ///< sum(coeff[i] * x^i), inverted for degree 1
    PIECEWISE     ///< Monotone cubic interpolation through a calibration curve
};

inline const char* to_string(ConversionKind kind) {
    switch (kind) {
        case ConversionKind::NONE:       return "null";
        case ConversionKind::POLYNOMIAL: return "poly";
        case ConversionKind::PIECEWISE:  return "pchip";
    }
    return "unknown";
}

/**
 * @brief Conversion between engineering and physics units for one field
 *
 * Immutable once built; all members are const-callable and safe to share
 * between threads. Engineering values written to hardware are saturated into
 * the record's limits, readbacks are never clamped.
 *
 * An optional beam rigidity turns a raw physical response into a normalised
 * strength: to_physics divides the raw result by it, to_engineering
 * multiplies the physics value by it before inverting.
 */
class ConversionRecord {
public:
    /**
     * @brief Identity conversion
     */
    static ConversionRecord identity(std::string eng_units = "", std::string phys_units = "") {
        ConversionRecord r;
        r.eng_units_ = std::move(eng_units);
        r.phys_units_ = std::move(phys_units);
        return r;
    }

    /**
     * @brief Polynomial conversion, coefficients in ascending powers
     * @param coefficients coefficients[i] multiplies x^i; must not be empty
     */
    static ConversionRecord polynomial(std::vector<double> coefficients,
                                       std::string eng_units = "", std::string phys_units = "",
                                       Limits limits = {},
                                       std::optional<double> rigidity = std::nullopt) {
        if (coefficients.empty()) {
            throw UnitsError(UnitsErrorKind::DOMAIN_ERROR, "polynomial conversion has no coefficients");
        }
        for (std::size_t i = 0; i < coefficients.size(); ++i) {
            if (!std::isfinite(coefficients[i])) {
                throw UnitsError(UnitsErrorKind::DOMAIN_ERROR,
                                 "polynomial coefficient " + std::to_string(i) + " is not finite");
            }
        }
        ConversionRecord r;
        r.kind_ = ConversionKind::POLYNOMIAL;
        r.coefficients_ = std::move(coefficients);
        r.init_common(std::move(eng_units), std::move(phys_units), limits, rigidity);
        return r;
    }

    /**
     * @brief Piecewise monotone conversion through a calibration curve
     */
    static ConversionRecord piecewise(CalibrationCurve curve,
                                      std::string eng_units = "", std::string phys_units = "",
                                      Limits limits = {},
                                      std::optional<double> rigidity = std::nullopt) {
        ConversionRecord r;
        r.kind_ = ConversionKind::PIECEWISE;
        r.forward_.emplace(curve.current(), curve.field());
        r.inverse_.emplace(curve.field(), curve.current());
        r.curve_.emplace(std::move(curve));
        r.init_common(std::move(eng_units), std::move(phys_units), limits, rigidity);
        return r;
    }

    ConversionKind kind() const { return kind_; }
    const std::vector<double>& coefficients() const { return coefficients_; }
    const std::optional<CalibrationCurve>& curve() const { return curve_; }
    const std::string& eng_units() const { return eng_units_; }
    const std::string& phys_units() const { return phys_units_; }
    const Limits& limits() const { return limits_; }
    std::optional<double> lower_limit() const { return limits_.lower; }
    std::optional<double> upper_limit() const { return limits_.upper; }
    std::optional<double> rigidity() const { return rigidity_; }

    /**
     * @brief Convert an engineering value to physics units (never clamped)
     */
    double to_physics(double eng) const {
        switch (kind_) {
            case ConversionKind::NONE:
                return eng;
            case ConversionKind::POLYNOMIAL:
                return scale_down(horner(eng));
            case ConversionKind::PIECEWISE:
                return scale_down((*forward_)(eng));
        }
        return eng;
    }

    /**
     * @brief Convert a physics value to engineering units, saturated into limits
     * @throws UnitsError DIVISION_ERROR or NOT_INVERTIBLE for polynomials
     */
    double to_engineering(double phys) const {
        if (kind_ == ConversionKind::NONE) return phys;
        return clamp(to_engineering_unclamped(phys));
    }

    /**
     * @brief Inverse conversion without saturation
     *
     * Lets callers compare the requested engineering value with the one
     * to_engineering() would send to hardware.
     */
    double to_engineering_unclamped(double phys) const {
        switch (kind_) {
            case ConversionKind::NONE:
                return phys;
            case ConversionKind::POLYNOMIAL:
                return invert_polynomial(scale_up(phys));
            case ConversionKind::PIECEWISE:
                return (*inverse_)(scale_up(phys));
        }
        return phys;
    }

    std::vector<double> to_physics(const std::vector<double>& eng) const {
        std::vector<double> out;
        out.reserve(eng.size());
        for (double v : eng) out.push_back(to_physics(v));
        return out;
    }

    std::vector<double> to_engineering(const std::vector<double>& phys) const {
        std::vector<double> out;
        out.reserve(phys.size());
        for (double v : phys) out.push_back(to_engineering(v));
        return out;
    }

    /**
     * @brief Saturate an engineering value into the record's limits
     *
     * Identity records are never clamped.
     */
    double clamp(double eng) const {
        if (kind_ == ConversionKind::NONE) return eng;
        return limits_.clamp(eng);
    }

    /**
     * @brief Convert between unit systems; identity when origin == target
     */
    double convert(double value, Units origin, Units target) const {
        if (origin == target) return value;
        if (origin == Units::ENGINEERING) return to_physics(value);
        return to_engineering(value);
    }

    /**
     * @brief Clamp bounds expressed in the requested unit system
     */
    Limits limits(Units units) const {
        if (units == Units::ENGINEERING || kind_ == ConversionKind::NONE) return limits_;
        Limits out;
        if (limits_.lower) out.lower = to_physics(*limits_.lower);
        if (limits_.upper) out.upper = to_physics(*limits_.upper);
        return out;
    }

    /**
     * @brief Same conversion data, units, limits and rigidity
     */
    bool equivalent(const ConversionRecord& other) const {
        return kind_ == other.kind_ && coefficients_ == other.coefficients_ &&
               curve_ == other.curve_ && eng_units_ == other.eng_units_ &&
               phys_units_ == other.phys_units_ && limits_ == other.limits_ &&
               rigidity_ == other.rigidity_;
    }

private:
    ConversionKind kind_{ConversionKind::NONE};
    std::vector<double> coefficients_;
    std::optional<CalibrationCurve> curve_;
    std::optional<PchipInterpolator> forward_;  ///< current -> field
    std::optional<PchipInterpolator> inverse_;  ///< field -> current
    std::string eng_units_;
    std::string phys_units_;
    Limits limits_;
    std::optional<double> rigidity_;

    ConversionRecord() = default;

    void init_common(std::string eng_units, std::string phys_units, Limits limits,
                     std::optional<double> rigidity) {
        if (!limits.finite()) {
            throw UnitsError(UnitsErrorKind::DOMAIN_ERROR, "clamp limits must be finite");
        }
        if (!limits.valid()) {
            throw UnitsError(UnitsErrorKind::DOMAIN_ERROR,
                             "lower limit " + std::to_string(*limits.lower) +
                             " exceeds upper limit " + std::to_string(*limits.upper));
        }
        if (rigidity && (!std::isfinite(*rigidity) || *rigidity <= 0.0)) {
            throw UnitsError(UnitsErrorKind::DOMAIN_ERROR,
                             "rigidity must be positive, got " + std::to_string(*rigidity));
        }
        eng_units_ = std::move(eng_units);
        phys_units_ = std::move(phys_units);
        limits_ = limits;
        rigidity_ = rigidity;
    }

    double scale_down(double raw) const { return rigidity_ ? raw / *rigidity_ : raw; }
    double scale_up(double phys) const { return rigidity_ ? phys * *rigidity_ : phys; }

    double horner(double x) const {
        double y = 0.0;
        for (auto it = coefficients_.rbegin(); it != coefficients_.rend(); ++it) {
            y = y * x + *it;
        }
        return y;
    }

    double invert_polynomial(double y) const {
        // Trailing zero coefficients above x^1 do not count towards the degree
        std::size_t n = coefficients_.size();
        while (n > 2 && coefficients_[n - 1] == 0.0) --n;
        if (n > 2) {
            throw UnitsError(UnitsErrorKind::NOT_INVERTIBLE,
                             "cannot invert polynomial of degree " + std::to_string(n - 1));
        }
        double offset = coefficients_[0];
        double gradient = n == 2 ? coefficients_[1] : 0.0;
        if (gradient == 0.0) {
            throw UnitsError(UnitsErrorKind::DIVISION_ERROR,
                             "linear conversion has zero gradient");
        }
        return (y - offset) / gradient;
    }
};
