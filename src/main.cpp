#include <iostream>
#include <signal.h>
#include <atomic>
#include <cstdlib>
#include <iomanip>
#include <optional>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "core/unit_system.hpp"
#include "core/units_error.hpp"
#include "control/field_accessor.hpp"
#include "cs/memory_control_system.hpp"
#include "io/table_loader.hpp"
#include "ipc/point_server.hpp"
#include "ipc/zmq_control_system.hpp"

// Global flag for clean shutdown of the point server
std::atomic<bool> running{true};

void signal_handler(int signal) {
    std::cout << "\nShutdown signal received (" << signal << "), stopping..." << std::endl;
    running.store(false);
}

static void usage() {
    std::cerr << "Usage: lattice_units <config.json> <command> [args]\n"
              << "Commands:\n"
              << "  summary\n"
              << "  convert <el_id> <field> <eng|phys> <value>\n"
              << "  get <el_id> <field> [eng|phys] [rb|sp]\n"
              << "  set <el_id> <field> <eng|phys> <value>\n"
              << "  serve\n";
}

static int parse_int(const std::string& s) {
    std::size_t used = 0;
    int v = std::stoi(s, &used);
    if (used != s.size()) throw std::invalid_argument("'" + s + "' is not an integer");
    return v;
}

static double parse_double(const std::string& s) {
    std::size_t used = 0;
    double v = std::stod(s, &used);
    if (used != s.size()) throw std::invalid_argument("'" + s + "' is not a number");
    return v;
}

static void print_summary(const LatticeTables& tables, const ConversionRegistry& registry) {
    std::cout << "Elements:      " << tables.elements.size() << std::endl;
    std::cout << "Devices:       " << tables.devices.size() << std::endl;
    std::cout << "Conversions:   " << registry.size() << " fields, "
              << registry.distinct_records() << " distinct records" << std::endl;

    std::size_t counts[3] = {0, 0, 0};
    for (const auto& [key, record] : registry.entries()) {
        counts[static_cast<int>(record->kind())]++;
    }
    std::cout << "  null:  " << counts[0] << std::endl;
    std::cout << "  poly:  " << counts[1] << std::endl;
    std::cout << "  pchip: " << counts[2] << std::endl;
}

static int serve(const LatticeConfig& config, const LatticeTables& tables) {
    MemoryControlSystem points;
    for (const auto& element : tables.elements.elements()) {
        for (const auto& field : tables.devices.fields(element.id)) {
            const auto& device = tables.devices.get(element.id, field);
            if (device.readback) points.define(*device.readback, 0.0, true);
            if (device.setpoint) points.define(*device.setpoint, 0.0);
        }
    }

    PointServer server(points, config.control_system.endpoint);
    std::cout << "Point server bound to: " << server.get_bind_address() << std::endl;
    std::cout << "Press Ctrl+C to stop" << std::endl;
    server.run(running);
    std::cout << "Served " << server.served_count() << " requests" << std::endl;
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 3) {
        usage();
        return 1;
    }

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    try {
        const std::string command = argv[2];
        std::vector<std::string> args(argv + 3, argv + argc);

        LatticeConfig config = LatticeConfig::load(argv[1]);
        std::cout << "Loading lattice from " << config.mode_directory() << "..." << std::endl;
        LatticeTables tables = load_tables(config.mode_directory());
        auto registry = build_registry(tables, config);

        if (command == "summary") {
            print_summary(tables, *registry);
        } else if (command == "convert" && args.size() == 4) {
            int el = parse_int(args[0]);
            Units origin = parse_units(args[2]);
            Units target = origin == Units::ENGINEERING ? Units::PHYSICS : Units::ENGINEERING;
            const auto& record = registry->resolve(el, args[1]);
            double result = record.convert(parse_double(args[3]), origin, target);
            const auto& unit = target == Units::PHYSICS ? record.phys_units() : record.eng_units();
            std::cout << std::setprecision(12) << result << (unit.empty() ? "" : " ") << unit
                      << " (" << to_string(target) << ", " << to_string(record.kind()) << ")" << std::endl;
        } else if (command == "get" && args.size() >= 2 && args.size() <= 4) {
            ZmqControlSystem cs(config.control_system);
            FieldAccessor accessor(registry, tables.devices, cs, config.default_units);
            std::optional<Units> units;
            Handle handle = Handle::READBACK;
            if (args.size() >= 3) units = parse_units(args[2]);
            if (args.size() == 4) handle = parse_handle(args[3]);
            double v = accessor.get_value(parse_int(args[0]), args[1], handle, units);
            std::cout << std::setprecision(12) << v << std::endl;
        } else if (command == "set" && args.size() == 4) {
            ZmqControlSystem cs(config.control_system);
            FieldAccessor accessor(registry, tables.devices, cs, config.default_units);
            double sent = accessor.set_value(parse_int(args[0]), args[1], parse_double(args[3]),
                                             parse_units(args[2]));
            std::cout << "Wrote " << std::setprecision(12) << sent << " (engineering)" << std::endl;
        } else if (command == "serve") {
            return serve(config, tables);
        } else {
            usage();
            return 1;
        }

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
