/**
 * @file config.hpp
 * @brief Orchestrator configuration with TOML deserialization.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "core/result.hpp"

namespace workflow_orchestrator {

struct OrchestratorConfig {
    std::string id = "orchestrator";
    uint32_t max_decomposition_depth = 3;
};

struct ExecutorConfig {
    uint32_t thread_count = 0;          ///< 0 = hardware_concurrency
    bool parallel_dispatch = true;      ///< Dispatch parallel steps on the pool
};

struct BusConfig {
    size_t history_capacity = 1000;
    size_t default_history_limit = 100;
};

/// Per-complexity duration weights, in minutes.
struct PlannerConfig {
    uint32_t simple_minutes = 5;
    uint32_t medium_minutes = 15;
    uint32_t complex_minutes = 30;
};

struct DecomposerConfig {
    size_t max_generic_subtasks = 5;
};

struct AnalyzerConfig {
    size_t max_requirements = 10;
    size_t max_estimated_subtasks = 10;
};

struct TelemetryConfig {
    std::filesystem::path log_dir;      ///< Empty = log to stdout
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
};

/**
 * @brief Top-level configuration.
 */
struct Config {
    OrchestratorConfig orchestrator;
    ExecutorConfig executor;
    BusConfig bus;
    PlannerConfig planner;
    DecomposerConfig decomposer;
    AnalyzerConfig analyzer;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

}  // namespace workflow_orchestrator
