/**
 * @file main.cpp
 * @brief Cloudlet daemon entry point.
 *
 * Wires all modules into a running host:
 *   Config → Logger → BlobStore → FunctionHost (queues, executor, dispatch, schedules)
 *
 * Administration happens in-process through FunctionHost; the daemon itself
 * only restores persisted triggers and runs them until SIGINT or SIGTERM.
 */

#include "blob/file_blob_store.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "host/function_host.hpp"
#include "telemetry/json_sink.hpp"

#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace cloudlet;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    bool config_given = false;
    std::string log_dir;
    bool log_to_stdout = false;
};

void print_usage() {
    std::cout << "Usage: cloudlet [OPTIONS]\n"
              << "  --config <path>    Configuration file (default: config/default.toml)\n"
              << "  --log-dir <path>   Log output directory\n"
              << "  --stdout           Log to stdout instead of files\n"
              << "  --help, -h         Show this help message\n";
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
            args.config_given = true;
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--stdout") {
            args.log_to_stdout = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage();
            return false;
        }
    }
    return true;
}

}  // namespace

int main(int argc, char* argv[]) {
    CLIArgs args;
    if (!parse_args(argc, argv, args)) return 2;

    // Load configuration
    Config config = default_config();
    if (args.config_given || std::filesystem::exists(args.config_path)) {
        auto config_result = load_config(args.config_path);
        if (!config_result) {
            std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
            return 1;
        }
        config = *config_result;
    }
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;

    if (auto valid = validate_config(config); !valid) {
        std::cerr << "Invalid configuration: " << valid.error().message << std::endl;
        return 1;
    }

    // ── Initialize Logger ────────────────────
    std::unique_ptr<ILogSink> log_sink;
    std::unique_ptr<ILogSink> metrics_sink;
    if (args.log_to_stdout || config.telemetry.log_dir.empty()) {
        log_sink = std::make_unique<StdoutSink>();
        metrics_sink = std::make_unique<NullSink>();
    } else {
        log_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "cloudlet",
                                                  config.telemetry.max_file_size_mb,
                                                  config.telemetry.rotate_count);
        metrics_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "metrics",
                                                      config.telemetry.max_file_size_mb,
                                                      config.telemetry.rotate_count);
    }
    Logger logger(std::move(log_sink),
                  parse_log_level(config.telemetry.log_level).value_or(LogLevel::Info));
    logger.info("Cloudlet starting...");
    logger.info("Queue root: " + config.queue.root.string());
    logger.info("Blob root: " + config.blob_store.root.string());
    logger.info("Execution: timeout " + std::to_string(config.executor.execution_timeout_seconds)
                + "s, max concurrent "
                + std::to_string(config.executor.enable_parallel_execution
                                     ? config.executor.max_concurrent_executions : 1));

    // Register signal handlers. Functions that close their stdin early must
    // not take the daemon down with them.
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGPIPE, SIG_IGN);

    // ── Initialize Blob Store ────────────────
    FileBlobStore blobs(config.blob_store);
    if (auto opened = blobs.open(); !opened) {
        logger.error("Cannot open blob store: " + opened.error().message);
        logger.flush();
        return 1;
    }

    // ── Initialize Host ──────────────────────
    FunctionHost host(config, blobs, logger, std::move(metrics_sink));
    if (auto started = host.start(); !started) {
        logger.error("Cannot start host: " + started.error().message);
        logger.flush();
        return 1;
    }

    logger.info("Entering main loop. Press Ctrl+C to shutdown.");
    while (!g_shutdown_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    // ── Graceful Shutdown ────────────────────
    logger.info("Shutdown requested. Draining workers...");
    auto report = host.stop();
    for (const auto& id : report.timed_out) {
        logger.warn("Worker for function " + id + " did not drain in time");
    }

    logger.info("Cloudlet stopped.");
    logger.flush();
    return report.clean() ? 0 : 3;
}
