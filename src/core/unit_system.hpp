#pragma once
#include "units_error.hpp"
#include <string>

/**
 * @brief Unit system of a value
 *
 * ENGINEERING values are native to the hardware controller (e.g. A),
 * PHYSICS values are what the accelerator model works in (e.g. m^-2).
 */
enum class Units {
    ENGINEERING = 0,
    PHYSICS
};

/**
 * @brief Direction of interaction with a controllable field
 */
enum class Handle {
    READBACK = 0,
    SETPOINT
};

inline const char* to_string(Units units) {
    return units == Units::ENGINEERING ? "engineering" : "physics";
}

inline const char* to_string(Handle handle) {
    return handle == Handle::READBACK ? "readback" : "setpoint";
}

/**
 * @brief Parse "eng"/"engineering" or "phys"/"physics"
 */
inline Units parse_units(const std::string& s) {
    if (s == "eng" || s == "engineering" || s == "ENG") return Units::ENGINEERING;
    if (s == "phys" || s == "physics" || s == "PHYS") return Units::PHYSICS;
    throw UnitsError(UnitsErrorKind::UNKNOWN_UNITS, "unit system '" + s + "' not understood");
}

inline Handle parse_handle(const std::string& s) {
    if (s == "rb" || s == "readback" || s == "RB") return Handle::READBACK;
    if (s == "sp" || s == "setpoint" || s == "SP") return Handle::SETPOINT;
    throw UnitsError(UnitsErrorKind::UNKNOWN_UNITS, "handle '" + s + "' not understood");
}
