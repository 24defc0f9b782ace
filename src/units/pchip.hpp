#pragma once
#include "../core/units_error.hpp"
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

/**
 * @brief Piecewise cubic Hermite interpolating polynomial (PCHIP)
 *
 * Monotone cubic interpolation through (x, y) samples using the
 * Fritsch-Carlson derivative estimate: interior slopes are the weighted
 * harmonic mean of the neighbouring secants (zero at local extrema), end
 * slopes use the shape-preserving three-point formula. The interpolant passes
 * through every sample and never overshoots monotone data.
 *
 * Outside [x.front(), x.back()] the value continues linearly along the
 * secant of the boundary segment.
 */
class PchipInterpolator {
public:
    PchipInterpolator(std::vector<double> x, std::vector<double> y)
        : x_(std::move(x)), y_(std::move(y)) {
        if (x_.size() != y_.size()) {
            throw UnitsError(UnitsErrorKind::DOMAIN_ERROR,
                             "interpolation samples differ in length (" +
                             std::to_string(x_.size()) + " vs " + std::to_string(y_.size()) + ")");
        }
        if (x_.size() < 2) {
            throw UnitsError(UnitsErrorKind::DOMAIN_ERROR,
                             "interpolation needs at least 2 samples, got " +
                             std::to_string(x_.size()));
        }
        for (std::size_t i = 0; i + 1 < x_.size(); ++i) {
            if (!(x_[i + 1] > x_[i])) {
                throw UnitsError(UnitsErrorKind::DOMAIN_ERROR,
                                 "interpolation abscissae not strictly increasing at sample " +
                                 std::to_string(i + 1));
            }
        }
        compute_slopes();
    }

    /**
     * @brief Evaluate the interpolant at x
     */
    double operator()(double x) const {
        const std::size_t n = x_.size();
        if (x < x_.front()) {
            return y_.front() + (x - x_.front()) * secant_.front();
        }
        if (x > x_.back()) {
            return y_.back() + (x - x_.back()) * secant_.back();
        }
        if (x == x_.back()) return y_.back();

        // Segment k satisfies x_[k] <= x < x_[k+1]
        auto it = std::upper_bound(x_.begin(), x_.end(), x);
        std::size_t k = static_cast<std::size_t>(it - x_.begin()) - 1;
        if (k >= n - 1) k = n - 2;

        double h = x_[k + 1] - x_[k];
        double t = (x - x_[k]) / h;
        double t2 = t * t;
        double t3 = t2 * t;

        double h00 = 2.0 * t3 - 3.0 * t2 + 1.0;
        double h10 = t3 - 2.0 * t2 + t;
        double h01 = -2.0 * t3 + 3.0 * t2;
        double h11 = t3 - t2;

        return h00 * y_[k] + h10 * h * d_[k] + h01 * y_[k + 1] + h11 * h * d_[k + 1];
    }

    const std::vector<double>& x() const { return x_; }
    const std::vector<double>& y() const { return y_; }
    const std::vector<double>& slopes() const { return d_; }

private:
    std::vector<double> x_;
    std::vector<double> y_;
    std::vector<double> secant_;  ///< Secant slope of each segment
    std::vector<double> d_;       ///< Derivative at each sample

    static int sign(double v) { return (v > 0.0) - (v < 0.0); }

    void compute_slopes() {
        const std::size_t n = x_.size();
        std::vector<double> h(n - 1);
        secant_.resize(n - 1);
        for (std::size_t k = 0; k + 1 < n; ++k) {
            h[k] = x_[k + 1] - x_[k];
            secant_[k] = (y_[k + 1] - y_[k]) / h[k];
        }

        d_.assign(n, 0.0);
        if (n == 2) {
            d_[0] = d_[1] = secant_[0];
            return;
        }

        for (std::size_t k = 1; k + 1 < n; ++k) {
            double m0 = secant_[k - 1];
            double m1 = secant_[k];
            if (sign(m0) != sign(m1) || m0 == 0.0 || m1 == 0.0) {
                d_[k] = 0.0;
            } else {
                double w1 = 2.0 * h[k] + h[k - 1];
                double w2 = h[k] + 2.0 * h[k - 1];
                d_[k] = (w1 + w2) / (w1 / m0 + w2 / m1);
            }
        }

        d_[0] = end_slope(h[0], h[1], secant_[0], secant_[1]);
        d_[n - 1] = end_slope(h[n - 2], h[n - 3], secant_[n - 2], secant_[n - 3]);
    }

    // Three-point end estimate, limited so the end segment stays monotone
    static double end_slope(double h0, double h1, double m0, double m1) {
        double d = ((2.0 * h0 + h1) * m0 - h0 * m1) / (h0 + h1);
        if (sign(d) != sign(m0)) {
            d = 0.0;
        } else if (sign(m0) != sign(m1) && std::abs(d) > 3.0 * std::abs(m0)) {
            d = 3.0 * m0;
        }
        return d;
    }
};
