#pragma once
#include "units_error.hpp"
#include <cmath>
#include <string>

/**
 * @brief Magnetic rigidity of an electron beam
 *
 * Brho = p / e = beta * E / (c * e). With E expressed in MeV the elementary
 * charge cancels and Brho [T m] = beta * E[MeV] * 1e6 / c.
 */
namespace Rigidity {

constexpr double ELECTRON_MASS_MEV = 0.51099895000;  ///< m_e c^2 (CODATA 2018)
constexpr double SPEED_OF_LIGHT = 299792458.0;       ///< c in m/s

/**
 * @brief Compute beam rigidity
 * @param energy_mev Total beam energy in MeV
 * @return Rigidity in T m
 */
inline double of_electron_beam(double energy_mev) {
    if (!std::isfinite(energy_mev) || energy_mev <= ELECTRON_MASS_MEV) {
        throw UnitsError(UnitsErrorKind::DOMAIN_ERROR,
                         "beam energy " + std::to_string(energy_mev) +
                         " MeV is not above the electron rest mass");
    }
    double gamma = energy_mev / ELECTRON_MASS_MEV;
    double beta = std::sqrt(1.0 - 1.0 / (gamma * gamma));
    return beta * energy_mev * 1e6 / SPEED_OF_LIGHT;
}

}  // namespace Rigidity
