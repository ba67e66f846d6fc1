/**
 * @file main.cpp
 * @brief workflow_orchestrator command-line entry point.
 *
 * Wires all modules into a complete pipeline:
 *   Config → Logger → Analyzer → Decomposer → Mapper → Planner → Orchestrator → Telemetry
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "executor/worker.hpp"
#include "orchestrator/orchestrator.hpp"
#include "telemetry/json_sink.hpp"

#include <algorithm>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace workflow_orchestrator;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::string task;
    OutputFormat format = OutputFormat::Summary;
    std::string log_dir;
    bool plan_only = false;
    bool demo_mode = false;
};

void print_usage() {
    std::cout << "Usage: workflow_orchestrator [OPTIONS]\n"
              << "  --config <path>    Configuration file (default: config/default.toml)\n"
              << "  --task <text>      Task description to orchestrate\n"
              << "  --format <fmt>     Result format: summary | detailed | json (default: summary)\n"
              << "  --plan-only        Print analysis, subtasks and plan without dispatching\n"
              << "  --log-dir <path>   Log output directory (default: stdout)\n"
              << "  --demo             Run the built-in demo tasks, then exit\n"
              << "  --help, -h         Show this help message\n";
}

CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--task" && i + 1 < argc) {
            args.task = argv[++i];
        } else if (arg == "--format" && i + 1 < argc) {
            std::string value = argv[++i];
            auto format = parse_output_format(value);
            if (!format) {
                std::cerr << "Unknown format '" << value << "'\n";
                print_usage();
                std::exit(2);
            }
            args.format = *format;
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--plan-only") {
            args.plan_only = true;
        } else if (arg == "--demo") {
            args.demo_mode = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        } else {
            std::cerr << "Unknown argument '" << arg << "'\n";
            print_usage();
            std::exit(2);
        }
    }
    return args;
}

/**
 * @brief Built-in worker that reports the description back as its output.
 */
std::shared_ptr<IWorker> make_echo_worker() {
    return std::make_shared<FunctionWorker>("echo_worker",
        [](const std::string& description, const TaskContext& context) {
            Metadata metadata;
            for (const auto& key : {"domain", "step", "workflow_id"}) {
                if (auto it = context.find(key); it != context.end()) {
                    metadata[key] = it->second;
                }
            }
            return WorkerResult::completed("Completed: " + description, std::move(metadata));
        });
}

void print_plan(const WorkflowPlan& wp) {
    const auto& a = wp.analysis;
    std::cout << "Analysis\n"
              << "  complexity:     " << to_string(a.complexity) << "\n"
              << "  domains:       ";
    for (const auto& d : a.domains) std::cout << " " << d;
    std::cout << "\n  decomposition:  " << (a.requires_decomposition ? "yes" : "no")
              << "\n  est. subtasks:  " << a.estimated_subtasks << "\n";
    for (const auto& r : a.key_requirements) {
        std::cout << "  requirement:    " << r << "\n";
    }

    std::cout << "\nSubtasks\n";
    for (const auto& t : wp.decomposition.subtasks) {
        std::cout << "  " << t.id << " [" << t.domain << ", " << to_string(t.complexity) << "] "
                  << t.description;
        if (!t.dependencies.empty()) {
            std::cout << "  <- ";
            for (size_t i = 0; i < t.dependencies.size(); ++i) {
                std::cout << (i ? ", " : "") << t.dependencies[i];
            }
        }
        std::cout << "\n";
    }

    const auto& p = wp.plan;
    std::cout << "\nPlan: " << p.total_steps << " step(s), parallel="
              << (p.can_parallelize ? "yes" : "no")
              << ", estimated " << p.estimated_duration_minutes << " min\n";
    for (const auto& step : p.steps) {
        std::cout << "  step " << step.step_number << ":";
        for (const auto& id : step.task_ids) std::cout << " " << id;
        std::cout << (step.can_parallelize ? "  (parallel)" : "") << "\n";
    }
    std::cout << "  critical path:";
    for (const auto& id : p.critical_path) std::cout << " " << id;
    std::cout << " (" << p.critical_path_minutes << " min)\n";
}

int run_task(Orchestrator& orchestrator, const std::string& task, const CLIArgs& args) {
    if (args.plan_only) {
        auto planned = orchestrator.plan_task(task);
        if (!planned) {
            std::cerr << "Planning failed [" << to_string(planned.error().code) << "]: "
                      << planned.error().message << "\n";
            return 1;
        }
        print_plan(*planned);
        return 0;
    }

    auto result = orchestrator.execute_task(task);
    if (!result) {
        std::cerr << "Workflow failed [" << to_string(result.error().code) << "]: "
                  << result.error().message << "\n";
        return 1;
    }

    if (args.format == OutputFormat::Json) {
        std::cout << to_json(*result) << "\n";
    } else {
        std::cout << "Workflow " << result->workflow_id << ": " << to_string(result->status)
                  << " (" << result->total_steps << " steps, critical path "
                  << result->critical_path_length << " tasks / "
                  << result->critical_path_minutes << " min)\n"
                  << orchestrator.get_results(args.format) << "\n";
    }
    return 0;
}

const std::vector<std::string>& demo_tasks() {
    static const std::vector<std::string> tasks = {
        "Create a simple Python function",
        "Build a REST API with authentication and database integration",
        "Deploy a containerized service to kubernetes with CI/CD pipeline",
        "Analyze sales data and visualize trends, then train a prediction model",
        "Research and compare vector databases, survey benchmarks and summarize findings",
    };
    return tasks;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();

    // Apply CLI overrides
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;

    // ── Initialize Logging ───────────────────
    std::unique_ptr<ILogSink> log_sink;
    std::unique_ptr<ILogSink> metrics_sink;
    if (!config.telemetry.log_dir.empty()) {
        log_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "workflow_orchestrator",
                                                  config.telemetry.max_file_size_mb,
                                                  config.telemetry.rotate_count);
        metrics_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "metrics",
                                                      config.telemetry.max_file_size_mb,
                                                      config.telemetry.rotate_count);
    } else {
        log_sink = std::make_unique<StdoutSink>();
        metrics_sink = std::make_unique<NullSink>();
    }

    Orchestrator orchestrator(Orchestrator::Options{
        .config = config,
        .log_sink = std::move(log_sink),
        .metrics_sink = std::move(metrics_sink),
        .log_level = parse_log_level(config.telemetry.log_level)
    });
    orchestrator.set_default_worker(make_echo_worker());

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    if (!args.plan_only) {
        if (auto started = orchestrator.start(); !started) {
            std::cerr << "Failed to start: " << started.error().message << "\n";
            return 1;
        }
    }

    int exit_code = 0;
    if (args.demo_mode) {
        for (const auto& task : demo_tasks()) {
            if (g_shutdown_requested) break;
            std::cout << "\n=== " << task << " ===\n";
            exit_code = std::max(exit_code, run_task(orchestrator, task, args));
        }
    } else if (!args.task.empty()) {
        exit_code = run_task(orchestrator, args.task, args);
    } else {
        print_usage();
        exit_code = 2;
    }

    orchestrator.stop();
    return exit_code;
}
