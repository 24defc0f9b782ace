#pragma once
#include "../core/rigidity.hpp"
#include "../units/conversion_registry.hpp"
#include "element_table.hpp"
#include <optional>

/**
 * @brief Scale magnet conversions of a lattice by the beam rigidity
 *
 * Elements whose category is rigidity-scaled (bends, quadrupoles,
 * sextupoles, multipoles, correctors) get the rigidity at the given energy;
 * everything else, including the lattice itself (id 0), is left unscaled.
 * The table is captured by copy so the policy outlives its source.
 */
inline RigidityPolicy make_rigidity_policy(const ElementTable& elements, double energy_mev) {
    double brho = Rigidity::of_electron_beam(energy_mev);
    return [elements, brho](int element_id) -> std::optional<double> {
        if (!elements.contains(element_id)) return std::nullopt;
        if (!is_rigidity_scaled(elements.at(element_id).category)) return std::nullopt;
        return brho;
    };
}
