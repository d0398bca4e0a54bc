/**
 * @file main.cpp
 * @brief Hybrid router daemon entry point.
 *
 * Wires all modules into a complete routing pipeline:
 *   Config → Logger → Classifier → Executors → Connectivity → Job store → Router
 */

#include "classifier/classifier.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "executor/local_executor.hpp"
#include "executor/remote_executor.hpp"
#include "network/connectivity.hpp"
#include "network/tool_server.hpp"
#include "queue/job_store.hpp"
#include "router/router.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/performance_monitor.hpp"
#include "tools/builtin_tools.hpp"

#include <algorithm>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

using namespace hybrid_router;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

void print_banner() {
    std::cerr << R"(
  ╔═══════════════════════════════════════════╗
  ║           HybridRouter v1.0.0             ║
  ║   Local / Remote / Offline Tool Routing   ║
  ╚═══════════════════════════════════════════╝
)" << std::endl;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    bool serve = false;
    bool demo = false;
    std::optional<std::string> execute_tool;
    std::string params = "{}";
    std::optional<ExportFormat> export_format;
};

void print_usage() {
    std::cout << "Usage: hybrid_router [OPTIONS]\n"
              << "  --config <path>        Configuration file (default: config/default.toml)\n"
              << "  --serve                Run the backend tool server on remote.port\n"
              << "  --execute <tool>       Route a single invocation and print the outcome\n"
              << "  --params <json>        Parameters for --execute (default: {})\n"
              << "  --demo                 Run the routing demo against an in-process backend\n"
              << "  --export json|csv      Print the metrics export before exiting\n"
              << "  --help, -h             Show this help message\n"
              << "Without --serve, --execute or --demo the router runs until SIGINT/SIGTERM.\n";
}

CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--serve") {
            args.serve = true;
        } else if (arg == "--execute" && i + 1 < argc) {
            args.execute_tool = argv[++i];
        } else if (arg == "--params" && i + 1 < argc) {
            args.params = argv[++i];
        } else if (arg == "--demo") {
            args.demo = true;
        } else if (arg == "--export" && i + 1 < argc) {
            ExportFormat format;
            if (!parse_export_format(argv[++i], format)) {
                std::cerr << "Unknown export format: " << argv[i] << "\n";
                std::exit(2);
            }
            args.export_format = format;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage();
            std::exit(2);
        }
    }
    return args;
}

std::unique_ptr<ILogSink> make_log_sink(const TelemetryConfig& telemetry) {
    if (telemetry.log_to_stdout || telemetry.log_dir.empty()) {
        return std::make_unique<StdoutSink>();
    }
    return std::make_unique<JsonFileSink>(telemetry.log_dir, "hybrid_router",
                                          telemetry.max_file_size_mb, telemetry.rotate_count);
}

Json outcome_to_json(const ExecutionOutcome& outcome) {
    if (outcome.is_deferred()) {
        return {{"status", "deferred"}, {"job_id", outcome.job_id}};
    }
    return {
        {"status", "completed"},
        {"route", std::string{to_string(outcome.route)}},
        {"cached", outcome.cached},
        {"latency_us", outcome.latency.count()},
        {"result", outcome.payload}
    };
}

int print_export(const Router& router, std::optional<ExportFormat> format) {
    if (!format) return 0;
    auto exported = router.export_metrics(*format);
    if (!exported) {
        std::cerr << "Export failed: " << exported.error().message << "\n";
        return 1;
    }
    std::cout << *exported << std::endl;
    return 0;
}

/**
 * @brief Serve the local tool registry to remote routers until shutdown.
 */
int run_server(const Config& config, LocalExecutor& executor, Logger& logger) {
    ToolServer server(executor, logger);
    auto started = server.start(config.remote.port);
    if (!started) {
        logger.error("main", "Could not start tool server: " + started.error().message);
        return 1;
    }
    logger.info("main", "Tool server listening on port " + std::to_string(server.port()));

    while (!g_shutdown_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    logger.info("main", "Shutdown requested, served " + std::to_string(server.requests_served())
                + " requests");
    server.stop();
    return 0;
}

/**
 * @brief Run the three routing scenarios against an in-process backend.
 */
int run_demo(const Config& config, Classifier& classifier, LocalExecutor& executor,
             std::optional<ExportFormat> export_format, Logger& logger) {
    logger.info("main", "=== Demo Mode ===");

    ToolServer backend(executor, logger);
    if (auto started = backend.start(0, "127.0.0.1"); !started) {
        logger.error("main", "Could not start demo backend: " + started.error().message);
        return 1;
    }

    TcpRemoteExecutor remote("127.0.0.1", backend.port(), config.remote.connect_timeout_ms, logger);
    ConnectivityMonitor connectivity(true, &logger);
    MemoryJobStore store;

    auto options = make_router_options(config);
    options.metrics_persist_path.clear();
    Router router(options, classifier, executor, remote, connectivity, store, logger);
    if (auto started = router.start(); !started) {
        return 1;
    }

    auto show = [](std::string_view label, const Result<ExecutionOutcome>& outcome) {
        std::cout << label << ": "
                  << (outcome ? outcome_to_json(*outcome).dump()
                              : std::string{"error "} + std::string{to_string(outcome.error().kind)}
                                + ": " + outcome.error().message)
                  << "\n";
    };

    Json text{{"text", "Routing keeps simple tools local and sends complex tools to the backend. "
                       "Queued tools wait for connectivity and drain by priority."}};

    // Simple tool twice: local, then cache.
    show("simple (first)", router.execute("calculate_reading_time", text));
    show("simple (again)", router.execute("calculate_reading_time", text));

    // Medium tool served locally within its timeout.
    show("medium", router.execute("extract_keywords", text));

    // Complex tool while offline, then drained once connectivity returns.
    Json graph{{"edges", Json::array({Json::array({"a", "b"}), Json::array({"b", "c"}),
                                       Json::array({"x", "y"})})}};
    connectivity.set_online(false);
    show("complex (offline)", router.execute("build_graph", graph));
    auto status = router.queue_status();
    std::cout << "queue: " << status.queued << " queued\n";

    connectivity.set_online(true);
    router.trigger_sync();
    status = router.queue_status();
    std::cout << "queue after sync: " << status.completed << " completed, "
              << status.failed << " failed\n";

    router.stop();
    int rc = print_export(router, export_format);
    backend.stop();

    logger.info("main", "=== Demo Complete ===");
    return rc;
}

}  // namespace

int main(int argc, char* argv[]) {
    print_banner();

    auto args = parse_args(argc, argv);

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();

    // ── Initialize Logger ────────────────────
    Logger logger(make_log_sink(config.telemetry), parse_log_level(config.telemetry.log_level));
    logger.info("main", "HybridRouter starting...");

    // Register signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // ── Tools ────────────────────────────────
    auto thread_count = config.executor.local_threads == 0
        ? std::max(1u, std::thread::hardware_concurrency())
        : config.executor.local_threads;
    LocalExecutor executor(thread_count, logger);

    Classifier classifier(config.tiers);
    classifier.load(config.tools, &logger);
    tools::register_builtin_tools(executor, &classifier);
    logger.info("main", "Executor: " + std::to_string(thread_count) + " threads, "
                + std::to_string(classifier.size()) + " tools");

    if (args.serve) {
        return run_server(config, executor, logger);
    }
    if (args.demo) {
        return run_demo(config, classifier, executor, args.export_format, logger);
    }

    // ── Router ───────────────────────────────
    TcpRemoteExecutor remote(config.remote.host, config.remote.port,
                             config.remote.connect_timeout_ms, logger);

    ConnectivityMonitor connectivity(config.remote.start_online, &logger);
    if (config.remote.probe_interval_ms > 0) {
        connectivity.start_probe(config.remote.host, config.remote.port,
                                 config.remote.probe_interval_ms, config.remote.connect_timeout_ms);
    }

    FileJobStore store(config.queue.store_dir);
    if (auto opened = store.open(); !opened) {
        logger.error("main", "Job store unavailable: " + opened.error().message);
        return 1;
    }

    Router router(make_router_options(config), classifier, executor, remote, connectivity,
                  store, logger);
    if (auto started = router.start(); !started) {
        return 1;
    }

    if (args.execute_tool) {
        auto params = Json::parse(args.params, nullptr, false);
        if (params.is_discarded()) {
            std::cerr << "--params is not valid JSON\n";
            return 2;
        }

        auto outcome = router.execute(*args.execute_tool, params);
        int rc = 0;
        if (outcome) {
            std::cout << outcome_to_json(*outcome).dump(2) << std::endl;
        } else {
            std::cerr << to_string(outcome.error().kind) << ": " << outcome.error().message << "\n";
            rc = 1;
        }
        router.stop();
        connectivity.stop_probe();
        return rc != 0 ? rc : print_export(router, args.export_format);
    }

    // ── Main Loop ────────────────────────────
    logger.info("main", "Entering main loop. Press Ctrl+C to shutdown.");

    uint64_t loop_count = 0;
    while (!g_shutdown_requested) {
        // Periodic status logging (every 30 seconds at 100ms intervals)
        if (loop_count % 300 == 0 && loop_count > 0) {
            auto status = router.queue_status();
            auto snap = router.metrics_snapshot();
            logger.info("main", "Status: " + std::string{connectivity.is_online() ? "online" : "offline"}
                        + ", queue " + std::to_string(status.queued) + " queued / "
                        + std::to_string(status.failed) + " failed, cache hit rate "
                        + std::to_string(static_cast<int>(snap.cache_hit_rate() * 100)) + "%");
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        ++loop_count;
    }

    // ── Graceful Shutdown ────────────────────
    logger.info("main", "Shutdown requested. Cleaning up...");
    router.stop();
    connectivity.stop_probe();
    int rc = print_export(router, args.export_format);
    logger.info("main", "HybridRouter stopped.");
    return rc;
}
