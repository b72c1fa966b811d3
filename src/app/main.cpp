/**
 * @file main.cpp
 * @brief runbox daemon entry point.
 *
 * Wires all modules into the execution pipeline:
 *   Config → Logger → SandboxRunner → ExecutionService → RequestHandler → Transport
 */

#include "api/request_handler.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "network/transport.hpp"
#include "sandbox/sandbox_runner.hpp"
#include "service/execution_service.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>

using namespace runbox;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

void print_banner() {
    std::cout << R"(
  ╔═══════════════════════════════════════════╗
  ║              runbox v1.0.0                ║
  ║   Sandboxed execution of untrusted code   ║
  ╚═══════════════════════════════════════════╝
)" << std::endl;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    uint16_t port = 0;
    std::string log_dir;
    uint32_t workers = 0;
    std::filesystem::path run_request;
};

void print_usage() {
    std::cout << "Usage: runbox [OPTIONS]\n"
              << "  --config <path>    Configuration file (default: config/default.toml)\n"
              << "  --port <port>      TCP port for execution requests\n"
              << "  --log-dir <path>   Log output directory\n"
              << "  --workers <n>      Sandbox worker count\n"
              << "  --run <file>       Execute one JSON request, print the response, exit\n"
              << "  --help, -h         Show this help message\n";
}

CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--config" && i + 1 < argc) {
                args.config_path = argv[++i];
            } else if (arg == "--port" && i + 1 < argc) {
                args.port = static_cast<uint16_t>(std::stoi(argv[++i]));
            } else if (arg == "--log-dir" && i + 1 < argc) {
                args.log_dir = argv[++i];
            } else if (arg == "--workers" && i + 1 < argc) {
                args.workers = static_cast<uint32_t>(std::stoul(argv[++i]));
            } else if (arg == "--run" && i + 1 < argc) {
                args.run_request = argv[++i];
            } else if (arg == "--help" || arg == "-h") {
                print_usage();
                std::exit(0);
            } else {
                std::cerr << "Unknown argument: " << arg << "\n";
                print_usage();
                std::exit(2);
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid argument value: " << e.what() << "\n";
        std::exit(2);
    }
    return args;
}

std::unique_ptr<ILogSink> make_sink(const TelemetryConfig& telemetry, const std::string& prefix) {
    if (telemetry.log_dir.empty()) {
        return std::make_unique<StdoutSink>();
    }
    return std::make_unique<JsonFileSink>(telemetry.log_dir, prefix,
                                          telemetry.max_file_size_mb,
                                          telemetry.rotate_count);
}

/**
 * @brief One-shot mode: execute the request in `path` and print the response.
 */
int run_once(const std::filesystem::path& path,
             RequestHandler<SandboxRunner>& handler,
             Logger& logger) {
    std::ifstream in(path);
    if (!in) {
        logger.error("Cannot read request file", {{"path", path.string()}});
        return 1;
    }
    std::ostringstream payload;
    payload << in.rdbuf();

    std::cout << handler.handle(payload.str()) << std::endl;
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);
    const bool one_shot = !args.run_request.empty();
    if (!one_shot) print_banner();

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        if (config_result.error().code == ErrorCode::Config
            && std::filesystem::exists(args.config_path)) {
            return 1;
        }
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();

    // Apply CLI overrides
    if (args.port != 0) config.server.port = args.port;
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;
    if (args.workers != 0) config.service.workers = args.workers;
    if (auto valid = validate_config(config); !valid) {
        std::cerr << "Invalid configuration: " << valid.error().message << std::endl;
        return 1;
    }

    // ── Initialize Logger ────────────────────
    auto level = parse_log_level(config.telemetry.log_level).value_or(LogLevel::Info);
    if (one_shot && config.telemetry.log_dir.empty()) {
        // Keep stdout for the response.
        level = LogLevel::Error;
    }
    Logger logger(make_sink(config.telemetry, "runbox"), level);
    logger.info("runbox starting", {
        {"workers", std::to_string(config.service.workers)},
        {"queue_capacity", std::to_string(config.service.queue_capacity)},
        {"connection_threads", std::to_string(effective_connection_threads(config))},
        {"scratch_root", config.sandbox.scratch_root.string()}
    });

    // ── Initialize Telemetry ─────────────────
    std::unique_ptr<ILogSink> telemetry_sink;
    if (config.telemetry.log_dir.empty()) {
        telemetry_sink = std::make_unique<NullSink>();
    } else {
        telemetry_sink = make_sink(config.telemetry, "runbox_metrics");
    }
    MetricsCollector metrics(std::move(telemetry_sink));

    // ── Initialize Execution Pipeline ────────
    SandboxRunner runner(config, &logger, &metrics);
    ExecutionService<SandboxRunner> service(config, runner, &logger, &metrics);
    RequestHandler<SandboxRunner> handler(service, &logger);

    if (one_shot) {
        int rc = run_once(args.run_request, handler, logger);
        service.shutdown();
        return rc;
    }

    // Register signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGPIPE, SIG_IGN);

    // ── Initialize Network Layer ─────────────
    TcpTransport server(effective_connection_threads(config),
                        static_cast<uint32_t>(config.server.max_request_bytes));
    auto listen_result = server.listen(config.server.port);
    if (!listen_result) {
        logger.error("Could not start server", {{"error", listen_result.error().message}});
        service.shutdown();
        return 1;
    }
    server.serve([&handler](const std::vector<uint8_t>& request) -> std::vector<uint8_t> {
        std::string_view payload(reinterpret_cast<const char*>(request.data()), request.size());
        auto response = handler.handle(payload);
        return std::vector<uint8_t>(response.begin(), response.end());
    });
    logger.info("Listening", {{"port", std::to_string(server.bound_port())}});

    // ── Main Loop ────────────────────────────
    logger.info("Entering main loop. Press Ctrl+C to shutdown.");

    uint64_t loop_count = 0;
    while (!g_shutdown_requested) {
        // Periodic status (every 30 seconds at 100ms intervals)
        if (loop_count % 300 == 0 && loop_count > 0) {
            auto stats = service.stats();
            metrics.record_service_stats(stats.workers, stats.busy, stats.queued,
                                         stats.completed, stats.rejected);
            logger.info("Status", {
                {"busy", std::to_string(stats.busy)},
                {"queued", std::to_string(stats.queued)},
                {"completed", std::to_string(stats.completed)},
                {"rejected", std::to_string(stats.rejected)},
                {"refused_connections", std::to_string(server.refused_connections())}
            });
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        ++loop_count;
    }

    // ── Graceful Shutdown ────────────────────
    // Service first: waiting connections receive shutting_down or Cancelled results.
    logger.info("Shutdown requested. Cleaning up...");
    service.shutdown();
    server.stop_serving();
    metrics.flush();

    logger.info("runbox stopped.");
    logger.flush();
    return 0;
}
