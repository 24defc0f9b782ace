#pragma once
#include "../core/config.hpp"
#include "../lattice/device_table.hpp"
#include "../lattice/element_table.hpp"
#include "../lattice/rigidity_policy.hpp"
#include "../units/conversion_registry.hpp"
#include "csv_reader.hpp"
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

/**
 * @brief File names of the tables in a mode directory
 */
namespace Tables {
constexpr const char* ELEMENTS = "elements.csv";
constexpr const char* DEVICES = "epics_devices.csv";
constexpr const char* UNITS = "unitconv.csv";
constexpr const char* POLY = "uc_poly_data.csv";
constexpr const char* PCHIP = "uc_pchip_data.csv";
}  // namespace Tables

/**
 * @brief Parsed contents of a mode directory
 */
struct LatticeTables {
    ElementTable elements;
    DeviceTable devices;
    std::vector<UnitsRow> units;
    std::vector<PolyRow> poly;
    std::vector<PchipRow> pchip;
};

inline std::vector<UnitsRow> load_units_table(const std::string& path) {
    auto table = CsvTable::read(path);
    table.require_columns({"el_id", "field", "uc_type", "uc_id", "phys_units", "eng_units",
                           "lower_lim", "upper_lim"});
    std::vector<UnitsRow> rows;
    rows.reserve(table.size());
    for (std::size_t i = 0; i < table.size(); ++i) {
        auto r = table.row(i);
        UnitsRow row;
        row.element_id = r.get_int("el_id");
        row.field = r.get("field");
        row.kind = r.get("uc_type");
        row.conversion_id = r.get_optional_int("uc_id");
        row.phys_units = r.get("phys_units");
        row.eng_units = r.get("eng_units");
        row.lower_limit = r.get_optional_double("lower_lim");
        row.upper_limit = r.get_optional_double("upper_lim");
        rows.push_back(std::move(row));
    }
    return rows;
}

inline std::vector<PolyRow> load_poly_table(const std::string& path) {
    auto table = CsvTable::read(path);
    table.require_columns({"uc_id", "coeff", "val"});
    std::vector<PolyRow> rows;
    rows.reserve(table.size());
    for (std::size_t i = 0; i < table.size(); ++i) {
        auto r = table.row(i);
        rows.push_back({r.get_int("uc_id"), r.get_int("coeff"), r.get_double("val")});
    }
    return rows;
}

inline std::vector<PchipRow> load_pchip_table(const std::string& path) {
    auto table = CsvTable::read(path);
    table.require_columns({"uc_id", "eng", "phy"});
    std::vector<PchipRow> rows;
    rows.reserve(table.size());
    for (std::size_t i = 0; i < table.size(); ++i) {
        auto r = table.row(i);
        rows.push_back({r.get_int("uc_id"), r.get_double("eng"), r.get_double("phy")});
    }
    return rows;
}

inline ElementTable load_element_table(const std::string& path) {
    auto table = CsvTable::read(path);
    table.require_columns({"type", "length"});
    bool named = table.has_column("name");
    ElementTable elements;
    for (std::size_t i = 0; i < table.size(); ++i) {
        auto r = table.row(i);
        try {
            elements.add(named ? r.get("name") : std::string(), r.get("type"), r.get_double("length"));
        } catch (const UnitsError& e) {
            throw TableError(path, r.line(), e.message());
        }
    }
    return elements;
}

inline DeviceTable load_device_table(const std::string& path) {
    auto table = CsvTable::read(path);
    table.require_columns({"el_id", "name", "field", "get_pv", "set_pv"});
    DeviceTable devices;
    for (std::size_t i = 0; i < table.size(); ++i) {
        auto r = table.row(i);
        Device d;
        d.name = r.get("name");
        if (!r.empty("get_pv")) d.readback = r.get("get_pv");
        if (!r.empty("set_pv")) d.setpoint = r.get("set_pv");
        try {
            devices.add(r.get_int("el_id"), r.get("field"), std::move(d));
        } catch (const AccessError& e) {
            throw TableError(path, r.line(), e.message());
        }
    }
    return devices;
}

/**
 * @brief Read the units table and the conversion data it refers to
 */
inline void load_conversion_tables(const std::filesystem::path& dir, LatticeTables& tables) {
    namespace fs = std::filesystem;
    tables.units = load_units_table((dir / Tables::UNITS).string());
    if (fs::exists(dir / Tables::POLY)) {
        tables.poly = load_poly_table((dir / Tables::POLY).string());
    } else {
        std::cerr << "Warning: " << (dir / Tables::POLY).string()
                  << " not found, unable to load polynomial conversions" << std::endl;
    }
    if (fs::exists(dir / Tables::PCHIP)) {
        tables.pchip = load_pchip_table((dir / Tables::PCHIP).string());
    } else {
        std::cerr << "Warning: " << (dir / Tables::PCHIP).string()
                  << " not found, unable to load piecewise conversions" << std::endl;
    }
}

/**
 * @brief Describe device and units rows naming a field their element does not expose
 *
 * Rows on the lattice itself (id 0) are not checked. Such rows are still
 * loaded; they usually mean a mistyped field or element type.
 */
inline std::vector<std::string> undeclared_fields(const LatticeTables& tables) {
    std::vector<std::string> out;
    auto check = [&](int element_id, const std::string& field, const char* table) {
        if (element_id == 0) return;
        std::string where = std::string(table) + ": element " + std::to_string(element_id);
        if (!tables.elements.contains(element_id)) {
            out.push_back(where + " is not in " + Tables::ELEMENTS);
            return;
        }
        const auto& element = tables.elements.at(element_id);
        if (!exposes_field(element.category, field)) {
            out.push_back(where + " (" + to_string(element.category) + ") has no field '" +
                          field + "'");
        }
    };
    for (const auto& element : tables.elements.elements()) {
        for (const auto& field : tables.devices.fields(element.id)) {
            check(element.id, field, Tables::DEVICES);
        }
    }
    for (const auto& row : tables.units) check(row.element_id, row.field, Tables::UNITS);
    return out;
}

/**
 * @brief Read every table of a mode directory
 *
 * elements.csv is required; the device and units tables are optional. A
 * missing polynomial or calibration table only logs a warning: any units
 * row that needs it then fails the registry build.
 */
inline LatticeTables load_tables(const std::string& mode_dir) {
    namespace fs = std::filesystem;
    fs::path dir(mode_dir);
    if (!fs::is_directory(dir)) throw TableError(mode_dir, 0, "not a directory");

    LatticeTables tables;
    tables.elements = load_element_table((dir / Tables::ELEMENTS).string());

    if (fs::exists(dir / Tables::DEVICES)) {
        tables.devices = load_device_table((dir / Tables::DEVICES).string());
    }
    if (fs::exists(dir / Tables::UNITS)) load_conversion_tables(dir, tables);

    for (const auto& message : undeclared_fields(tables)) {
        std::cerr << "Warning: " << message << std::endl;
    }
    return tables;
}

/**
 * @brief Build the registry for loaded tables under a configuration
 *
 * Rigidity scaling is applied only when enabled and a beam energy is known.
 */
inline std::shared_ptr<const ConversionRegistry> build_registry(const LatticeTables& tables,
                                                                const LatticeConfig& config) {
    RigidityPolicy policy;
    if (config.apply_rigidity && config.beam_energy_mev) {
        policy = make_rigidity_policy(tables.elements, *config.beam_energy_mev);
    }
    return ConversionRegistry::build(tables.units, tables.poly, tables.pchip, policy);
}
