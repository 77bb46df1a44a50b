/**
 * @file inference_executor.hpp
 * @brief The worker's inference step, behind a virtual interface.
 * @author Dimitris Kafetzis
 *
 * Real model backends live outside this repository. EchoExecutor and
 * SyntheticExecutor stand in for them in tests and demos.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <span>
#include <stop_token>
#include <string_view>
#include <vector>

namespace hydramesh {

struct WorkerConfig;

/**
 * @brief Turns a task payload into a result payload.
 *
 * Called on the agent's executor thread, never on the receive loop.
 * Implementations should return promptly once @p stop is requested.
 */
class IInferenceExecutor {
public:
    virtual ~IInferenceExecutor() = default;

    virtual Result<std::vector<uint8_t>> execute(std::span<const uint8_t> request,
                                                 std::stop_token stop) = 0;
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

/**
 * @brief Returns the request unchanged.
 */
class EchoExecutor : public IInferenceExecutor {
public:
    Result<std::vector<uint8_t>> execute(std::span<const uint8_t> request,
                                         std::stop_token stop) override;
    [[nodiscard]] std::string_view name() const noexcept override { return "echo"; }
};

/**
 * @brief Burns CPU for a fixed time, then returns a deterministic byte pattern.
 *
 * Output byte i is (i + first request byte) mod 256, so tests can verify
 * large chunked results end to end.
 */
class SyntheticExecutor : public IInferenceExecutor {
public:
    SyntheticExecutor(uint64_t output_bytes, std::chrono::milliseconds compute_time);

    Result<std::vector<uint8_t>> execute(std::span<const uint8_t> request,
                                         std::stop_token stop) override;
    [[nodiscard]] std::string_view name() const noexcept override { return "synthetic"; }

private:
    void simulate_compute(Duration target_duration, std::stop_token stop);

    uint64_t output_bytes_;
    std::chrono::milliseconds compute_time_;
};

/// Build the executor named by @p config.executor.
Result<std::unique_ptr<IInferenceExecutor>> make_executor(const WorkerConfig& config);

}  // namespace hydramesh
