/**
 * @file head_main.cpp
 * @brief HydraMesh head daemon entry point.
 * @author Dimitris Kafetzis
 *
 * Config file → environment overrides → CLI overrides → HeadController.
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "head/head_controller.hpp"
#include "telemetry/json_sink.hpp"

#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

using namespace hydramesh;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

void print_banner() {
    std::cout << R"(
  ╔═══════════════════════════════════════════╗
  ║            HydraMesh Head v1.0.0          ║
  ║   UDP Inference Cluster Coordinator       ║
  ╚═══════════════════════════════════════════╝
)" << std::endl;
}

template <typename T>
std::optional<T> parse_number(const std::string& text) {
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
    return value;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::string bind_address;
    std::optional<uint16_t> client_port;
    std::optional<uint16_t> worker_port;
    std::optional<uint32_t> worker_timeout_ms;
    std::optional<uint32_t> request_timeout_ms;
    std::string policy;
    std::string log_dir;
    std::string log_level;
};

void print_usage() {
    std::cout << "Usage: hydramesh_head [OPTIONS]\n"
              << "  --config <path>            Configuration file (default: config/default.toml)\n"
              << "  --bind <address>           Bind address for both sockets\n"
              << "  --client-port <port>       Client-facing UDP port\n"
              << "  --worker-port <port>       Worker-facing UDP port\n"
              << "  --worker-timeout-ms <ms>   Heartbeat liveness timeout\n"
              << "  --request-timeout-ms <ms>  Per-task deadline\n"
              << "  --policy <name>            round_robin | least_recent\n"
              << "  --log-dir <path>           Log output directory (default: stdout)\n"
              << "  --log-level <level>        debug | info | warn | error\n"
              << "  --help, -h                 Show this help message\n";
}

std::optional<CLIArgs> parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;

        if (arg == "--config" && has_value) {
            args.config_path = argv[++i];
        } else if (arg == "--bind" && has_value) {
            args.bind_address = argv[++i];
        } else if (arg == "--client-port" && has_value) {
            if (!(args.client_port = parse_number<uint16_t>(argv[++i]))) return std::nullopt;
        } else if (arg == "--worker-port" && has_value) {
            if (!(args.worker_port = parse_number<uint16_t>(argv[++i]))) return std::nullopt;
        } else if (arg == "--worker-timeout-ms" && has_value) {
            if (!(args.worker_timeout_ms = parse_number<uint32_t>(argv[++i]))) return std::nullopt;
        } else if (arg == "--request-timeout-ms" && has_value) {
            if (!(args.request_timeout_ms = parse_number<uint32_t>(argv[++i]))) return std::nullopt;
        } else if (arg == "--policy" && has_value) {
            args.policy = argv[++i];
        } else if (arg == "--log-dir" && has_value) {
            args.log_dir = argv[++i];
        } else if (arg == "--log-level" && has_value) {
            args.log_level = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        } else {
            std::cerr << "Unknown or incomplete option: " << arg << "\n";
            return std::nullopt;
        }
    }
    return args;
}

}  // namespace

int main(int argc, char* argv[]) {
    print_banner();

    auto parsed = parse_args(argc, argv);
    if (!parsed) {
        print_usage();
        return 2;
    }
    auto& args = *parsed;

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();

    if (auto env = apply_env_overrides(config); !env) {
        std::cerr << env.error().message << std::endl;
    }

    // Apply CLI overrides
    if (!args.bind_address.empty()) config.head.bind_address = args.bind_address;
    if (args.client_port) config.head.client_port = *args.client_port;
    if (args.worker_port) config.head.worker_port = *args.worker_port;
    if (args.worker_timeout_ms) config.registry.worker_timeout_ms = *args.worker_timeout_ms;
    if (args.request_timeout_ms) config.router.request_timeout_ms = *args.request_timeout_ms;
    if (!args.policy.empty()) config.registry.selection_policy = args.policy;
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;
    if (!args.log_level.empty()) config.telemetry.log_level = args.log_level;

    if (auto valid = validate_config(config); !valid) {
        std::cerr << "Invalid configuration: " << valid.error().message << std::endl;
        return 1;
    }

    // Register signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    auto level = parse_log_level(config.telemetry.log_level).value_or(LogLevel::Info);
    auto telemetry = config.telemetry;

    HeadController head(HeadController::Options{
        .config = std::move(config),
        .log_sink = make_log_sink(telemetry, "hydramesh_head"),
        .log_level = level,
        .metrics_sink = make_metrics_sink(telemetry)
    });

    if (auto started = head.start(); !started) {
        std::cerr << "Failed to start head: " << started.error().message << std::endl;
        return 1;
    }

    head.logger().info("Entering main loop. Press Ctrl+C to shutdown.");

    // ── Main Loop ────────────────────────────
    uint64_t loop_count = 0;
    while (!g_shutdown_requested) {
        // Periodic status logging (every 30 seconds at 100ms intervals)
        if (loop_count % 300 == 0 && loop_count > 0) {
            auto workers = head.registry().stats(std::chrono::steady_clock::now());
            auto tasks = head.router().stats();
            head.logger().info("Status: " + std::to_string(workers.healthy) + " idle, "
                               + std::to_string(workers.busy) + " busy, "
                               + std::to_string(tasks.in_flight) + " in flight, "
                               + std::to_string(tasks.completed) + " completed, "
                               + std::to_string(tasks.failed) + " failed");
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        ++loop_count;
    }

    // ── Graceful Shutdown ────────────────────
    head.logger().info("Shutdown requested. Cleaning up...");
    head.stop();
    return 0;
}
