/**
 * @file json_sink.hpp
 * @brief NDJSON file log sink with rotation support.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>

namespace hydramesh {

/**
 * @brief Writes NDJSON to rotating log files.
 *
 * The live file is <prefix>.ndjson. When it reaches the size limit it is
 * renamed to <prefix>.1.ndjson, older files shift up by one, and anything
 * beyond max_files is deleted.
 */
class JsonFileSink : public ILogSink {
public:
    JsonFileSink(const std::filesystem::path& log_dir,
                 const std::string& prefix,
                 uint32_t max_file_size_mb = 50,
                 uint32_t max_files = 5);
    ~JsonFileSink() override;

    void write(std::string_view json_line) override;
    void flush() override;

    [[nodiscard]] std::filesystem::path current_path() const;
    [[nodiscard]] std::filesystem::path rotated_path(uint32_t index) const;

    /// Byte limit override, mainly for exercising rotation in tests.
    void set_max_file_size_bytes(uint64_t bytes) noexcept { max_file_size_bytes_ = bytes; }

private:
    void open_current();
    void rotate_if_needed();

    std::filesystem::path log_dir_;
    std::string prefix_;
    uint64_t max_file_size_bytes_;
    uint32_t max_files_;
    std::ofstream current_file_;
    uint64_t current_size_{0};
};

/**
 * @brief Writes to stdout for development and debugging.
 */
class StdoutSink : public ILogSink {
public:
    void write(std::string_view json_line) override;
    void flush() override;
};

/**
 * @brief Discards all output (tests, disabled metrics).
 */
class NullSink : public ILogSink {
public:
    void write(std::string_view /*json_line*/) override {}
    void flush() override {}
};

/// @p sink itself, or a NullSink when none was supplied.
std::unique_ptr<ILogSink> or_null_sink(std::unique_ptr<ILogSink> sink);

/// JsonFileSink under telemetry.log_dir when set, otherwise StdoutSink.
std::unique_ptr<ILogSink> make_log_sink(const TelemetryConfig& telemetry, const std::string& prefix);

/// JsonFileSink at telemetry.metrics_file when set, otherwise NullSink.
std::unique_ptr<ILogSink> make_metrics_sink(const TelemetryConfig& telemetry);

}  // namespace hydramesh
