/**
 * @file json_sink.cpp
 * @brief Log sink implementations.
 * @author Dimitris Kafetzis
 */

#include "telemetry/json_sink.hpp"

#include <iostream>
#include <system_error>

namespace hydramesh {

// ── JsonFileSink ─────────────────────────────

JsonFileSink::JsonFileSink(const std::filesystem::path& log_dir,
                           const std::string& prefix,
                           uint32_t max_file_size_mb,
                           uint32_t max_files)
    : log_dir_(log_dir)
    , prefix_(prefix)
    , max_file_size_bytes_(static_cast<uint64_t>(max_file_size_mb) * 1024 * 1024)
    , max_files_(max_files) {
    std::error_code ec;
    std::filesystem::create_directories(log_dir_, ec);
    if (ec) {
        std::cerr << "JsonFileSink: cannot create " << log_dir_ << ": " << ec.message() << '\n';
    }
    open_current();
}

JsonFileSink::~JsonFileSink() {
    if (current_file_.is_open()) {
        current_file_.flush();
        current_file_.close();
    }
}

std::filesystem::path JsonFileSink::current_path() const {
    return log_dir_ / (prefix_ + ".ndjson");
}

std::filesystem::path JsonFileSink::rotated_path(uint32_t index) const {
    return log_dir_ / (prefix_ + "." + std::to_string(index) + ".ndjson");
}

void JsonFileSink::open_current() {
    auto path = current_path();
    current_file_.open(path, std::ios::app);

    std::error_code ec;
    auto existing = std::filesystem::file_size(path, ec);
    current_size_ = ec ? 0 : existing;
}

void JsonFileSink::write(std::string_view json_line) {
    rotate_if_needed();
    if (current_file_.is_open()) {
        current_file_ << json_line << '\n';
        current_size_ += json_line.size() + 1;
    }
}

void JsonFileSink::flush() {
    if (current_file_.is_open()) {
        current_file_.flush();
    }
}

void JsonFileSink::rotate_if_needed() {
    if (current_size_ < max_file_size_bytes_) return;

    current_file_.flush();
    current_file_.close();

    std::error_code ec;
    if (max_files_ == 0) {
        std::filesystem::remove(current_path(), ec);
    } else {
        std::filesystem::remove(rotated_path(max_files_), ec);
        for (uint32_t i = max_files_; i > 1; --i) {
            auto from = rotated_path(i - 1);
            if (std::filesystem::exists(from, ec)) {
                std::filesystem::rename(from, rotated_path(i), ec);
            }
        }
        std::filesystem::rename(current_path(), rotated_path(1), ec);
    }
    if (ec) {
        std::cerr << "JsonFileSink: rotation of " << current_path() << " failed: " << ec.message() << '\n';
    }

    open_current();
}

// ── StdoutSink ───────────────────────────────

void StdoutSink::write(std::string_view json_line) {
    std::cout << json_line << '\n';
}

void StdoutSink::flush() {
    std::cout.flush();
}

// ── Factories ────────────────────────────────

std::unique_ptr<ILogSink> or_null_sink(std::unique_ptr<ILogSink> sink) {
    if (sink) return sink;
    return std::make_unique<NullSink>();
}

std::unique_ptr<ILogSink> make_log_sink(const TelemetryConfig& telemetry, const std::string& prefix) {
    if (telemetry.log_dir.empty()) {
        return std::make_unique<StdoutSink>();
    }
    return std::make_unique<JsonFileSink>(telemetry.log_dir, prefix,
                                          telemetry.max_file_size_mb, telemetry.rotate_count);
}

std::unique_ptr<ILogSink> make_metrics_sink(const TelemetryConfig& telemetry) {
    if (telemetry.metrics_file.empty()) {
        return std::make_unique<NullSink>();
    }
    auto dir = telemetry.metrics_file.parent_path();
    if (dir.empty()) dir = ".";
    return std::make_unique<JsonFileSink>(dir, telemetry.metrics_file.stem().string(),
                                          telemetry.max_file_size_mb, telemetry.rotate_count);
}

}  // namespace hydramesh
