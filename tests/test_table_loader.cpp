#include "../src/io/table_loader.hpp"
#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#ifndef TEST_DATA_DIR
#define TEST_DATA_DIR "tests/data"
#endif

namespace fs = std::filesystem;

/**
 * @brief Scratch mode directory removed on scope exit
 */
class ScratchDir {
public:
    explicit ScratchDir(const std::string& name)
        : path_(fs::temp_directory_path() / ("lattice_units_" + name)) {
        fs::remove_all(path_);
        fs::create_directories(path_);
    }
    ~ScratchDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    void write(const std::string& file, const std::string& content) const {
        std::ofstream out(path_ / file);
        out << content;
    }

    std::string file(const std::string& name) const { return (path_ / name).string(); }
    std::string str() const { return path_.string(); }

private:
    fs::path path_;
};

template <class F>
static std::size_t table_error_line(F&& f) {
    try {
        f();
    } catch (const TableError& e) {
        std::cout << "  (expected) " << e.what() << std::endl;
        return e.line();
    }
    assert(false && "expected TableError");
    return 0;
}

/**
 * @brief Test reading the CSV tables of a mode directory
 */
int main() {
    std::cout << "Testing table loading..." << std::endl;
    const std::string mode_dir = std::string(TEST_DATA_DIR) + "/I04";

    // Test 1: Fixture mode directory
    {
        std::cout << "Test 1: Load fixture tables" << std::endl;
        auto tables = load_tables(mode_dir);
        assert(tables.elements.size() == 7);
        assert(tables.devices.size() == 8);
        assert(tables.units.size() == 8);
        assert(tables.poly.size() == 6);
        assert(tables.pchip.size() == 5);

        assert(tables.elements.at(2).category == ElementCategory::QUADRUPOLE);
        assert(tables.elements.at(7).category == ElementCategory::RF_CAVITY);
        assert(std::abs(tables.elements.at(3).s - 2.75) < 1e-12);

        const auto& energy = tables.units[0];
        assert(energy.element_id == 0 && energy.field == "energy" && energy.kind == "null");
        assert(!energy.conversion_id && !energy.lower_limit && !energy.upper_limit);
        const auto& b1 = tables.units[1];
        assert(b1.conversion_id == 1 && b1.lower_limit == 0.0 && b1.upper_limit == 200.0);
        assert(b1.phys_units == "m^-2" && b1.eng_units == "A");

        const auto& bpm = tables.devices.get(5, "x");
        assert(bpm.readback && !bpm.setpoint);

        // Every fixture row names a field its element type exposes
        assert(undeclared_fields(tables).empty());
    }

    // Test 2: Registry from fixture tables with rigidity
    {
        std::cout << "Test 2: Build registry from fixtures" << std::endl;
        auto tables = load_tables(mode_dir);
        LatticeConfig config;
        config.data_directory = TEST_DATA_DIR;
        config.mode = "I04";
        config.beam_energy_mev = 3000.0;

        auto registry = build_registry(tables, config);
        assert(registry->size() == 8);
        assert(registry->distinct_records() == 6);
        assert(registry->find(2, "b1") == registry->find(6, "b1"));
        assert(registry->find(5, "x") == registry->find(5, "y"));

        double brho = Rigidity::of_electron_beam(3000.0);
        const auto& q1 = registry->resolve(2, "b1");
        assert(std::abs(q1.to_physics(100.0) - 4.8 / brho) < 1e-12);
        assert(std::abs(q1.to_engineering(4.8 / brho) - 100.0) < 1e-9);
        assert(q1.to_engineering(1.0) == 200.0);

        const auto& kick = registry->resolve(4, "x_kick");
        assert(std::abs(kick.to_physics(10.0) - 1e-3 / brho) < 1e-15);

        // Diagnostics and RF are never scaled
        const auto& x = registry->resolve(5, "x");
        assert(!x.rigidity());
        assert(std::abs(x.to_physics(1e6) - 1e-3) < 1e-15);
        assert(registry->resolve(7, "f").to_physics(499654096.6) == 499654096.6);

        config.apply_rigidity = false;
        auto raw = build_registry(tables, config);
        assert(std::abs(raw->resolve(2, "b1").to_physics(100.0) - 4.8) < 1e-12);

        config.apply_rigidity = true;
        config.beam_energy_mev.reset();
        auto unknown_energy = build_registry(tables, config);
        assert(!unknown_energy->resolve(2, "b1").rigidity());
    }

    // Test 3: Quoting, comments and blank lines
    {
        std::cout << "Test 3: CSV syntax" << std::endl;
        ScratchDir dir("syntax");
        dir.write("t.csv",
                  "# comment\r\n"
                  "   # indented comment\r\n"
                  "a, b ,c\r\n"
                  "1, \"x, y\",\"say \"\"hi\"\"\"\r\n"
                  "\n"
                  "2,,3.5\n");
        auto t = CsvTable::read(dir.file("t.csv"));
        assert(t.size() == 2);
        assert(t.header()[1] == "b");
        assert(t.row(0).get("b") == "x, y");
        assert(t.row(0).get("c") == "say \"hi\"");
        assert(t.row(0).line() == 4);
        assert(t.row(1).empty("b"));
        assert(!t.row(1).get_optional_int("b"));
        assert(t.row(1).get_double("c") == 3.5);
        assert(t.row(1).line() == 6);
    }

    // Test 4: Malformed tables name file and line
    {
        std::cout << "Test 4: Malformed tables" << std::endl;
        ScratchDir dir("malformed");

        dir.write("ragged.csv", "uc_id,coeff,val\n1,0,0.0\n1,1\n");
        assert(table_error_line([&] { load_poly_table(dir.file("ragged.csv")); }) == 3);

        dir.write("notint.csv", "uc_id,coeff,val\n1,zero,0.0\n");
        assert(table_error_line([&] { load_poly_table(dir.file("notint.csv")); }) == 2);

        dir.write("notnum.csv", "uc_id,eng,phy\n1,0,abc\n");
        assert(table_error_line([&] { load_pchip_table(dir.file("notnum.csv")); }) == 2);

        dir.write("missing.csv", "uc_id,coeff\n1,0\n");
        assert(table_error_line([&] { load_poly_table(dir.file("missing.csv")); }) == 0);

        dir.write("empty_id.csv",
                  "el_id,field,uc_type,uc_id,phys_units,eng_units,lower_lim,upper_lim\n"
                  ",b1,poly,1,m^-2,A,,\n");
        assert(table_error_line([&] { load_units_table(dir.file("empty_id.csv")); }) == 2);

        dir.write("neg_len.csv", "name,type,length\nQ1,quad,-0.2\n");
        assert(table_error_line([&] { load_element_table(dir.file("neg_len.csv")); }) == 2);

        dir.write("dup_dev.csv",
                  "el_id,name,field,get_pv,set_pv\n"
                  "1,Q,b1,Q:I,Q:SETI\n"
                  "1,Q,b1,Q:I,Q:SETI\n");
        assert(table_error_line([&] { load_device_table(dir.file("dup_dev.csv")); }) == 3);

        assert(table_error_line([&] { CsvTable::read(dir.file("absent.csv")); }) == 0);
        assert(table_error_line([&] { load_tables(dir.file("absent")); }) == 0);
    }

    // Test 5: Optional tables
    {
        std::cout << "Test 5: Optional tables" << std::endl;
        ScratchDir dir("optional");
        dir.write(Tables::ELEMENTS, "type,length\nquad,0.3\n");
        auto tables = load_tables(dir.str());
        assert(tables.elements.size() == 1);
        assert(tables.elements.at(1).name.empty());
        assert(tables.units.empty() && tables.devices.size() == 0);

        // A polynomial row without its coefficient table fails the build
        dir.write(Tables::UNITS,
                  "el_id,field,uc_type,uc_id,phys_units,eng_units,lower_lim,upper_lim\n"
                  "1,b1,poly,3,m^-2,A,,\n");
        tables = load_tables(dir.str());
        assert(tables.units.size() == 1 && tables.poly.empty());
        bool threw = false;
        try {
            build_registry(tables, LatticeConfig{});
        } catch (const RegistryBuildError& e) {
            threw = e.element_id() == 1 && e.conversion_id() == 3;
        }
        assert(threw);
    }

    // Test 6: Rows naming fields their element type lacks
    {
        std::cout << "Test 6: Undeclared fields" << std::endl;
        ScratchDir dir("fields");
        dir.write(Tables::ELEMENTS, "name,type,length\nQ1,quad,0.3\nBPM1,bpm,0\n");
        dir.write(Tables::DEVICES,
                  "el_id,name,field,get_pv,set_pv\n"
                  "1,Q1,b1,Q1:I,Q1:SETI\n"
                  "2,BPM1,x_kick,BPM1:K,\n");
        dir.write(Tables::UNITS,
                  "el_id,field,uc_type,uc_id,phys_units,eng_units,lower_lim,upper_lim\n"
                  "0,energy,null,,eV,eV,,\n"
                  "1,b2,null,,,,,\n"
                  "9,b1,null,,,,,\n");
        dir.write(Tables::POLY, "uc_id,coeff,val\n");
        dir.write(Tables::PCHIP, "uc_id,eng,phy\n");

        // Still loaded, only reported
        auto tables = load_tables(dir.str());
        assert(tables.devices.size() == 2 && tables.units.size() == 3);
        auto messages = undeclared_fields(tables);
        for (const auto& m : messages) std::cout << "  " << m << std::endl;
        assert(messages.size() == 3);
        assert(messages[0].find("element 2 (bpm) has no field 'x_kick'") != std::string::npos);
        assert(messages[1].find("element 1 (quadrupole) has no field 'b2'") != std::string::npos);
        assert(messages[2].find("element 9 is not in") != std::string::npos);
    }

    // Test 7: Non-finite limits in a units table fail the build
    {
        std::cout << "Test 7: NaN limits" << std::endl;
        ScratchDir dir("nan_limits");
        dir.write(Tables::ELEMENTS, "name,type,length\nQ1,quad,0.3\nQ2,quad,0.3\n");
        dir.write(Tables::UNITS,
                  "el_id,field,uc_type,uc_id,phys_units,eng_units,lower_lim,upper_lim\n"
                  "1,b1,poly,2,m^-2,A,-5,10\n"
                  "2,b1,poly,2,m^-2,A,nan,10\n");
        dir.write(Tables::POLY, "uc_id,coeff,val\n2,0,0\n2,1,0.05\n");
        dir.write(Tables::PCHIP, "uc_id,eng,phy\n");
        auto tables = load_tables(dir.str());
        bool threw = false;
        try {
            build_registry(tables, LatticeConfig{});
        } catch (const RegistryBuildError& e) {
            threw = e.kind() == UnitsErrorKind::DOMAIN_ERROR && e.element_id() == 2;
        }
        assert(threw);
    }

    std::cout << "✅ All table loading tests passed!" << std::endl;
    return 0;
}
