#pragma once
#include "unit_system.hpp"
#include "units_error.hpp"
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief Connection settings of the ZeroMQ control-system client
 */
struct ControlSystemConfig {
    std::string endpoint{"tcp://127.0.0.1:5557"};  ///< Point server address
    int timeout_ms{1000};                           ///< Per-request receive/send timeout
    int retries{1};                                 ///< Reconnect attempts after a timeout
};

/**
 * @brief Runtime configuration of a lattice-units process
 *
 * Loaded from a JSON file:
 * {"data_directory": "data", "mode": "I04", "beam_energy_mev": 3000.0,
 *  "apply_rigidity": true, "default_units": "physics",
 *  "control_system": {"endpoint": "tcp://127.0.0.1:5557", "timeout_ms": 1000, "retries": 1}}
 *
 * A relative data_directory is taken relative to the configuration file.
 */
struct LatticeConfig {
    std::string data_directory;                 ///< Directory holding one subdirectory per mode
    std::string mode;                           ///< Mode subdirectory; empty uses data_directory itself
    std::optional<double> beam_energy_mev;      ///< Beam energy for rigidity scaling
    bool apply_rigidity{true};                  ///< Scale magnet conversions when energy is known
    Units default_units{Units::PHYSICS};        ///< Unit system used when none is given
    ControlSystemConfig control_system;

    /**
     * @brief Directory containing the CSV tables of the configured mode
     */
    std::string mode_directory() const {
        std::filesystem::path dir(data_directory);
        if (!mode.empty()) dir /= mode;
        return dir.string();
    }

    static LatticeConfig from_json(const nlohmann::json& j) {
        if (!j.is_object()) throw ConfigError("configuration must be a JSON object");

        LatticeConfig cfg;
        try {
            if (!j.contains("data_directory")) throw ConfigError("missing 'data_directory'");
            cfg.data_directory = j.at("data_directory").get<std::string>();
            cfg.mode = j.value("mode", std::string());
            if (j.contains("beam_energy_mev") && !j.at("beam_energy_mev").is_null()) {
                cfg.beam_energy_mev = j.at("beam_energy_mev").get<double>();
            }
            cfg.apply_rigidity = j.value("apply_rigidity", cfg.apply_rigidity);
            if (j.contains("default_units")) {
                cfg.default_units = parse_units(j.at("default_units").get<std::string>());
            }
            if (j.contains("control_system")) {
                const auto& cs = j.at("control_system");
                if (!cs.is_object()) throw ConfigError("'control_system' must be an object");
                cfg.control_system.endpoint = cs.value("endpoint", cfg.control_system.endpoint);
                cfg.control_system.timeout_ms = cs.value("timeout_ms", cfg.control_system.timeout_ms);
                cfg.control_system.retries = cs.value("retries", cfg.control_system.retries);
            }
        } catch (const nlohmann::json::exception& e) {
            throw ConfigError(std::string("invalid configuration: ") + e.what());
        } catch (const UnitsError& e) {
            throw ConfigError(std::string("invalid configuration: ") + e.message());
        }

        if (cfg.beam_energy_mev && *cfg.beam_energy_mev <= 0.0) {
            throw ConfigError("'beam_energy_mev' must be positive");
        }
        if (cfg.control_system.timeout_ms <= 0) {
            throw ConfigError("'control_system.timeout_ms' must be positive");
        }
        if (cfg.control_system.retries < 0) {
            throw ConfigError("'control_system.retries' must not be negative");
        }
        return cfg;
    }

    /**
     * @brief Load and validate a configuration file
     * @throws ConfigError on I/O, syntax or value errors
     */
    static LatticeConfig load(const std::string& path) {
        std::ifstream in(path);
        if (!in) throw ConfigError("cannot open configuration file " + path);

        auto j = nlohmann::json::parse(in, nullptr, false);
        if (j.is_discarded()) throw ConfigError("configuration file " + path + " is not valid JSON");

        LatticeConfig cfg = from_json(j);
        std::filesystem::path dir(cfg.data_directory);
        if (dir.is_relative()) {
            cfg.data_directory = (std::filesystem::path(path).parent_path() / dir).string();
        }
        return cfg;
    }
};
