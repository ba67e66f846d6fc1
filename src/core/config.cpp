/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"

#include <toml++/toml.hpp>

namespace workflow_orchestrator {

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{"Configuration file not found: " + path.string(), ErrorCode::ConfigError};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        // [orchestrator]
        if (auto orch = tbl["orchestrator"]; orch.is_table()) {
            config.orchestrator.id = orch["id"].value_or(std::string{"orchestrator"});
            config.orchestrator.max_decomposition_depth = static_cast<uint32_t>(
                orch["max_decomposition_depth"].value_or(int64_t{3}));
        }

        // [executor]
        if (auto executor = tbl["executor"]; executor.is_table()) {
            config.executor.thread_count = static_cast<uint32_t>(
                executor["thread_count"].value_or(int64_t{0}));
            config.executor.parallel_dispatch = executor["parallel_dispatch"].value_or(true);
        }

        // [bus]
        if (auto bus = tbl["bus"]; bus.is_table()) {
            config.bus.history_capacity = static_cast<size_t>(
                bus["history_capacity"].value_or(int64_t{1000}));
            config.bus.default_history_limit = static_cast<size_t>(
                bus["default_history_limit"].value_or(int64_t{100}));
        }

        // [planner]
        if (auto planner = tbl["planner"]; planner.is_table()) {
            config.planner.simple_minutes = static_cast<uint32_t>(
                planner["simple_minutes"].value_or(int64_t{5}));
            config.planner.medium_minutes = static_cast<uint32_t>(
                planner["medium_minutes"].value_or(int64_t{15}));
            config.planner.complex_minutes = static_cast<uint32_t>(
                planner["complex_minutes"].value_or(int64_t{30}));
        }

        // [decomposer]
        if (auto decomposer = tbl["decomposer"]; decomposer.is_table()) {
            config.decomposer.max_generic_subtasks = static_cast<size_t>(
                decomposer["max_generic_subtasks"].value_or(int64_t{5}));
        }

        // [analyzer]
        if (auto analyzer = tbl["analyzer"]; analyzer.is_table()) {
            config.analyzer.max_requirements = static_cast<size_t>(
                analyzer["max_requirements"].value_or(int64_t{10}));
            config.analyzer.max_estimated_subtasks = static_cast<size_t>(
                analyzer["max_estimated_subtasks"].value_or(int64_t{10}));
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{});
            config.telemetry.max_file_size_mb = static_cast<uint32_t>(
                telemetry["max_file_size_mb"].value_or(int64_t{50}));
            config.telemetry.rotate_count = static_cast<uint32_t>(
                telemetry["rotate_count"].value_or(int64_t{5}));
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
        }

        return config;

    } catch (const toml::parse_error& err) {
        return Error{std::string{"TOML parse error: "} + std::string{err.description()},
                     ErrorCode::ConfigError};
    }
}

Config default_config() {
    return Config{};
}

}  // namespace workflow_orchestrator
