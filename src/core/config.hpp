/**
 * @file config.hpp
 * @brief Head and worker configuration with TOML deserialization.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

#include "core/result.hpp"

namespace hydramesh {

struct HeadConfig {
    std::string bind_address = "0.0.0.0";
    uint16_t client_port = 7777;
    uint16_t worker_port = 7778;
};

struct RegistryConfig {
    uint32_t worker_timeout_ms = 10000;
    uint32_t sweep_interval_ms = 0;           ///< 0 = worker_timeout_ms / 2
    std::string selection_policy = "round_robin";  ///< "round_robin", "least_recent"
};

struct RouterConfig {
    uint32_t request_timeout_ms = 300000;
    uint32_t max_retries = 2;
    uint32_t max_pending = 10000;
    uint32_t maintenance_interval_ms = 500;
};

struct ProtocolConfig {
    uint32_t max_fragment_bytes = 60000;      ///< Largest payload carried by one datagram
    uint32_t reassembly_timeout_ms = 0;       ///< 0 = request_timeout_ms / 10
    uint64_t max_reassembly_bytes = 64ULL * 1024 * 1024;
    uint32_t max_reassembly_buffers = 1024;
};

struct WorkerConfig {
    std::string id;                           ///< Empty = head derives host:port
    std::string head_host = "127.0.0.1";
    uint16_t head_port = 7778;
    uint16_t listen_port = 7779;
    uint32_t heartbeat_interval_ms = 0;       ///< 0 = registry.worker_timeout_ms / 3
    std::string admission = "reject";         ///< "reject", "queue"
    std::string executor = "echo";            ///< "echo", "synthetic"
    uint64_t synthetic_output_bytes = 4096;
    uint32_t synthetic_compute_ms = 100;
    std::string capabilities = "cpu";
};

struct TelemetryConfig {
    std::filesystem::path log_dir;            ///< Empty = stdout
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
    std::filesystem::path metrics_file;       ///< Empty = metrics discarded
};

/**
 * @brief Top-level configuration shared by the head and worker executables.
 */
struct Config {
    HeadConfig head;
    RegistryConfig registry;
    RouterConfig router;
    ProtocolConfig protocol;
    WorkerConfig worker;
    TelemetryConfig telemetry;

    [[nodiscard]] std::chrono::milliseconds worker_timeout() const noexcept {
        return std::chrono::milliseconds(registry.worker_timeout_ms);
    }
    [[nodiscard]] std::chrono::milliseconds sweep_interval() const noexcept;
    [[nodiscard]] std::chrono::milliseconds heartbeat_interval() const noexcept;
    [[nodiscard]] std::chrono::milliseconds request_timeout() const noexcept {
        return std::chrono::milliseconds(router.request_timeout_ms);
    }
    [[nodiscard]] std::chrono::milliseconds reassembly_timeout() const noexcept;
};

/**
 * @brief Load configuration from a TOML file.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

/**
 * @brief Apply HYDRAMESH_* environment variable overrides in place.
 *
 * Recognised: HYDRAMESH_CLIENT_PORT, HYDRAMESH_WORKER_PORT, HYDRAMESH_LISTEN_PORT,
 * HYDRAMESH_HEAD_HOST, HYDRAMESH_WORKER_TIMEOUT_MS, HYDRAMESH_REQUEST_TIMEOUT_MS,
 * HYDRAMESH_MAX_PENDING. Unparseable values are reported and leave the field as is.
 */
Result<void> apply_env_overrides(Config& config);

/**
 * @brief Reject configurations the head or worker cannot run with.
 */
Result<void> validate_config(const Config& config);

}  // namespace hydramesh
