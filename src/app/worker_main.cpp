/**
 * @file worker_main.cpp
 * @brief HydraMesh worker daemon entry point.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "network/udp_socket.hpp"
#include "telemetry/json_sink.hpp"
#include "worker/inference_executor.hpp"
#include "worker/worker_agent.hpp"

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
  ║           HydraMesh Worker v1.0.0         ║
  ║   Inference Worker Agent                  ║
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
    std::string id;
    std::string head;
    std::optional<uint16_t> listen_port;
    std::optional<uint32_t> heartbeat_ms;
    std::string executor;
    std::string admission;
    std::string log_dir;
    std::string log_level;
};

void print_usage() {
    std::cout << "Usage: hydramesh_worker [OPTIONS]\n"
              << "  --config <path>          Configuration file (default: config/default.toml)\n"
              << "  --id <worker-id>         Explicit worker identity (default: address)\n"
              << "  --head <host:port>       Head worker-facing endpoint\n"
              << "  --listen-port <port>     Local UDP port\n"
              << "  --heartbeat-ms <ms>      Heartbeat interval\n"
              << "  --executor <name>        echo | synthetic\n"
              << "  --admission <policy>     reject | queue\n"
              << "  --log-dir <path>         Log output directory (default: stdout)\n"
              << "  --log-level <level>      debug | info | warn | error\n"
              << "  --help, -h               Show this help message\n";
}

std::optional<CLIArgs> parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;

        if (arg == "--config" && has_value) {
            args.config_path = argv[++i];
        } else if (arg == "--id" && has_value) {
            args.id = argv[++i];
        } else if (arg == "--head" && has_value) {
            args.head = argv[++i];
        } else if (arg == "--listen-port" && has_value) {
            if (!(args.listen_port = parse_number<uint16_t>(argv[++i]))) return std::nullopt;
        } else if (arg == "--heartbeat-ms" && has_value) {
            if (!(args.heartbeat_ms = parse_number<uint32_t>(argv[++i]))) return std::nullopt;
        } else if (arg == "--executor" && has_value) {
            args.executor = argv[++i];
        } else if (arg == "--admission" && has_value) {
            args.admission = argv[++i];
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
    if (!args.id.empty()) config.worker.id = args.id;
    if (!args.head.empty()) {
        auto head = parse_endpoint(args.head);
        if (!head) {
            std::cerr << head.error().message << std::endl;
            return 2;
        }
        config.worker.head_host = head->host;
        config.worker.head_port = head->port;
    }
    if (args.listen_port) config.worker.listen_port = *args.listen_port;
    if (args.heartbeat_ms) config.worker.heartbeat_interval_ms = *args.heartbeat_ms;
    if (!args.executor.empty()) config.worker.executor = args.executor;
    if (!args.admission.empty()) config.worker.admission = args.admission;
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;
    if (!args.log_level.empty()) config.telemetry.log_level = args.log_level;

    if (auto valid = validate_config(config); !valid) {
        std::cerr << "Invalid configuration: " << valid.error().message << std::endl;
        return 1;
    }

    auto executor = make_executor(config.worker);
    if (!executor) {
        std::cerr << executor.error().message << std::endl;
        return 1;
    }

    // Register signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    auto level = parse_log_level(config.telemetry.log_level).value_or(LogLevel::Info);
    auto log_sink = make_log_sink(config.telemetry, "hydramesh_worker");

    WorkerAgent agent(WorkerAgent::Options{
        .config = std::move(config),
        .executor = std::move(*executor),
        .log_sink = std::move(log_sink),
        .log_level = level
    });

    if (auto started = agent.start(); !started) {
        std::cerr << "Failed to start worker: " << started.error().message << std::endl;
        return 1;
    }

    agent.logger().info("Entering main loop. Press Ctrl+C to shutdown.");

    while (!g_shutdown_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    // ── Graceful Shutdown ────────────────────
    auto stats = agent.stats();
    agent.logger().info("Shutdown requested. Completed " + std::to_string(stats.tasks_completed)
                        + " tasks, failed " + std::to_string(stats.tasks_failed)
                        + ", rejected " + std::to_string(stats.tasks_rejected));
    agent.stop();
    return 0;
}
