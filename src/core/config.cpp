/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <limits>
#include <string_view>

#include <toml++/toml.hpp>

namespace hydramesh {

namespace {

/// Parse an unsigned environment value into @p out; false if set but unparseable.
template <typename T>
bool env_unsigned(const char* name, T& out) {
    const char* raw = std::getenv(name);
    if (raw == nullptr || *raw == '\0') return true;

    std::string_view text(raw);
    uint64_t parsed = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
    if (ec != std::errc{} || ptr != text.data() + text.size()) return false;
    if (parsed > static_cast<uint64_t>(std::numeric_limits<T>::max())) return false;

    out = static_cast<T>(parsed);
    return true;
}

}  // anonymous namespace

std::chrono::milliseconds Config::sweep_interval() const noexcept {
    if (registry.sweep_interval_ms != 0) {
        return std::chrono::milliseconds(registry.sweep_interval_ms);
    }
    return std::chrono::milliseconds(std::max<uint32_t>(1, registry.worker_timeout_ms / 2));
}

std::chrono::milliseconds Config::heartbeat_interval() const noexcept {
    if (worker.heartbeat_interval_ms != 0) {
        return std::chrono::milliseconds(worker.heartbeat_interval_ms);
    }
    return std::chrono::milliseconds(std::max<uint32_t>(1, registry.worker_timeout_ms / 3));
}

std::chrono::milliseconds Config::reassembly_timeout() const noexcept {
    if (protocol.reassembly_timeout_ms != 0) {
        return std::chrono::milliseconds(protocol.reassembly_timeout_ms);
    }
    return std::chrono::milliseconds(std::max<uint32_t>(1, router.request_timeout_ms / 10));
}

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{"Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        // [head]
        if (auto head = tbl["head"]; head.is_table()) {
            config.head.bind_address = head["bind_address"].value_or(std::string{"0.0.0.0"});
            config.head.client_port = static_cast<uint16_t>(
                head["client_port"].value_or(int64_t{7777}));
            config.head.worker_port = static_cast<uint16_t>(
                head["worker_port"].value_or(int64_t{7778}));
        }

        // [registry]
        if (auto registry = tbl["registry"]; registry.is_table()) {
            config.registry.worker_timeout_ms = static_cast<uint32_t>(
                registry["worker_timeout_ms"].value_or(int64_t{10000}));
            config.registry.sweep_interval_ms = static_cast<uint32_t>(
                registry["sweep_interval_ms"].value_or(int64_t{0}));
            config.registry.selection_policy =
                registry["selection_policy"].value_or(std::string{"round_robin"});
        }

        // [router]
        if (auto router = tbl["router"]; router.is_table()) {
            config.router.request_timeout_ms = static_cast<uint32_t>(
                router["request_timeout_ms"].value_or(int64_t{300000}));
            config.router.max_retries = static_cast<uint32_t>(
                router["max_retries"].value_or(int64_t{2}));
            config.router.max_pending = static_cast<uint32_t>(
                router["max_pending"].value_or(int64_t{10000}));
            config.router.maintenance_interval_ms = static_cast<uint32_t>(
                router["maintenance_interval_ms"].value_or(int64_t{500}));
        }

        // [protocol]
        if (auto protocol = tbl["protocol"]; protocol.is_table()) {
            config.protocol.max_fragment_bytes = static_cast<uint32_t>(
                protocol["max_fragment_bytes"].value_or(int64_t{60000}));
            config.protocol.reassembly_timeout_ms = static_cast<uint32_t>(
                protocol["reassembly_timeout_ms"].value_or(int64_t{0}));
            config.protocol.max_reassembly_bytes = static_cast<uint64_t>(
                protocol["max_reassembly_bytes"].value_or(int64_t{64LL * 1024 * 1024}));
            config.protocol.max_reassembly_buffers = static_cast<uint32_t>(
                protocol["max_reassembly_buffers"].value_or(int64_t{1024}));
        }

        // [worker]
        if (auto worker = tbl["worker"]; worker.is_table()) {
            config.worker.id = worker["id"].value_or(std::string{});
            config.worker.head_host = worker["head_host"].value_or(std::string{"127.0.0.1"});
            config.worker.head_port = static_cast<uint16_t>(
                worker["head_port"].value_or(int64_t{7778}));
            config.worker.listen_port = static_cast<uint16_t>(
                worker["listen_port"].value_or(int64_t{7779}));
            config.worker.heartbeat_interval_ms = static_cast<uint32_t>(
                worker["heartbeat_interval_ms"].value_or(int64_t{0}));
            config.worker.admission = worker["admission"].value_or(std::string{"reject"});
            config.worker.executor = worker["executor"].value_or(std::string{"echo"});
            config.worker.synthetic_output_bytes = static_cast<uint64_t>(
                worker["synthetic_output_bytes"].value_or(int64_t{4096}));
            config.worker.synthetic_compute_ms = static_cast<uint32_t>(
                worker["synthetic_compute_ms"].value_or(int64_t{100}));
            config.worker.capabilities = worker["capabilities"].value_or(std::string{"cpu"});
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{});
            config.telemetry.max_file_size_mb = static_cast<uint32_t>(
                telemetry["max_file_size_mb"].value_or(int64_t{50}));
            config.telemetry.rotate_count = static_cast<uint32_t>(
                telemetry["rotate_count"].value_or(int64_t{5}));
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
            config.telemetry.metrics_file = telemetry["metrics_file"].value_or(std::string{});
        }

        return config;

    } catch (const toml::parse_error& err) {
        return Error{std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

Result<void> apply_env_overrides(Config& config) {
    std::string bad;
    auto check = [&bad](bool ok, const char* name) {
        if (!ok) bad += (bad.empty() ? "" : ", ") + std::string{name};
    };

    check(env_unsigned("HYDRAMESH_CLIENT_PORT", config.head.client_port), "HYDRAMESH_CLIENT_PORT");
    check(env_unsigned("HYDRAMESH_WORKER_PORT", config.head.worker_port), "HYDRAMESH_WORKER_PORT");
    check(env_unsigned("HYDRAMESH_LISTEN_PORT", config.worker.listen_port), "HYDRAMESH_LISTEN_PORT");
    check(env_unsigned("HYDRAMESH_WORKER_TIMEOUT_MS", config.registry.worker_timeout_ms),
          "HYDRAMESH_WORKER_TIMEOUT_MS");
    check(env_unsigned("HYDRAMESH_REQUEST_TIMEOUT_MS", config.router.request_timeout_ms),
          "HYDRAMESH_REQUEST_TIMEOUT_MS");
    check(env_unsigned("HYDRAMESH_MAX_PENDING", config.router.max_pending), "HYDRAMESH_MAX_PENDING");

    if (const char* host = std::getenv("HYDRAMESH_HEAD_HOST"); host != nullptr && *host != '\0') {
        config.worker.head_host = host;
    }

    if (!bad.empty()) {
        return Error{"Invalid environment override(s): " + bad};
    }
    return Result<void>{};
}

Result<void> validate_config(const Config& config) {
    if (config.registry.worker_timeout_ms == 0) {
        return Error{"registry.worker_timeout_ms must be positive"};
    }
    if (config.router.request_timeout_ms == 0) {
        return Error{"router.request_timeout_ms must be positive"};
    }
    if (config.router.maintenance_interval_ms == 0) {
        return Error{"router.maintenance_interval_ms must be positive"};
    }
    if (config.protocol.max_fragment_bytes == 0 || config.protocol.max_fragment_bytes > 65000) {
        return Error{"protocol.max_fragment_bytes must be in [1, 65000]"};
    }
    if (config.registry.selection_policy != "round_robin"
        && config.registry.selection_policy != "least_recent") {
        return Error{"Unknown registry.selection_policy: " + config.registry.selection_policy};
    }
    if (config.worker.admission != "reject" && config.worker.admission != "queue") {
        return Error{"Unknown worker.admission: " + config.worker.admission};
    }
    if (config.worker.executor != "echo" && config.worker.executor != "synthetic") {
        return Error{"Unknown worker.executor: " + config.worker.executor};
    }
    if (config.worker.id.size() > 255) {
        return Error{"worker.id longer than 255 bytes"};
    }
    if (!parse_log_level(config.telemetry.log_level)) {
        return Error{"Unknown telemetry.log_level: " + config.telemetry.log_level};
    }
    return Result<void>{};
}

}  // namespace hydramesh
