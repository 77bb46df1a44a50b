/**
 * @file inference_executor.cpp
 * @brief Built-in inference executors.
 * @author Dimitris Kafetzis
 */

#include "worker/inference_executor.hpp"
#include "core/config.hpp"

#include <thread>

namespace hydramesh {

Result<std::vector<uint8_t>> EchoExecutor::execute(std::span<const uint8_t> request,
                                                   std::stop_token stop) {
    if (stop.stop_requested()) {
        return Error{ErrorCode::ExecutionFailed, "Cancelled via stop token"};
    }
    return std::vector<uint8_t>(request.begin(), request.end());
}

SyntheticExecutor::SyntheticExecutor(uint64_t output_bytes, std::chrono::milliseconds compute_time)
    : output_bytes_(output_bytes)
    , compute_time_(compute_time) {}

Result<std::vector<uint8_t>> SyntheticExecutor::execute(std::span<const uint8_t> request,
                                                        std::stop_token stop) {
    simulate_compute(std::chrono::duration_cast<Duration>(compute_time_), stop);
    if (stop.stop_requested()) {
        return Error{ErrorCode::ExecutionFailed, "Cancelled via stop token"};
    }

    uint8_t seed = request.empty() ? 0 : request.front();
    std::vector<uint8_t> output(output_bytes_);
    for (size_t i = 0; i < output.size(); ++i) {
        output[i] = static_cast<uint8_t>((i + seed) & 0xFF);
    }
    return output;
}

void SyntheticExecutor::simulate_compute(Duration target_duration, std::stop_token stop) {
    // Busy-wait simulation calibrated to target duration
    auto start = std::chrono::steady_clock::now();
    volatile uint64_t counter = 0;

    while (!stop.stop_requested()) {
        auto elapsed = std::chrono::steady_clock::now() - start;
        if (std::chrono::duration_cast<Duration>(elapsed) >= target_duration) break;

        for (int i = 0; i < 1000; ++i) {
            counter = counter + static_cast<uint64_t>(i) * static_cast<uint64_t>(i);
        }
    }
}

Result<std::unique_ptr<IInferenceExecutor>> make_executor(const WorkerConfig& config) {
    if (config.executor == "echo") {
        return std::unique_ptr<IInferenceExecutor>(std::make_unique<EchoExecutor>());
    }
    if (config.executor == "synthetic") {
        return std::unique_ptr<IInferenceExecutor>(std::make_unique<SyntheticExecutor>(
            config.synthetic_output_bytes,
            std::chrono::milliseconds(config.synthetic_compute_ms)));
    }
    return Error{"Unknown executor '" + config.executor + "' (expected echo or synthetic)"};
}

}  // namespace hydramesh
