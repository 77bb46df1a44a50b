/**
 * @file test_telemetry.cpp
 * @brief Unit tests for the logger, log sinks, metrics and health rendering.
 */

#include "core/logger.hpp"
#include "telemetry/health_report.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace hydramesh;

namespace {

/// Captures written lines; the vector outlives the sink that writes to it.
class CaptureSink : public ILogSink {
public:
    explicit CaptureSink(std::vector<std::string>& lines) : lines_(lines) {}
    void write(std::string_view json_line) override { lines_.emplace_back(json_line); }
    void flush() override { ++flushes; }
    int flushes{0};

private:
    std::vector<std::string>& lines_;
};

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

}  // anonymous namespace

// ═══════════════════════════════════════════════
// Logger Tests
// ═══════════════════════════════════════════════

TEST(LoggerTest, WritesJsonLine) {
    std::vector<std::string> lines;
    Logger logger(std::make_unique<CaptureSink>(lines), LogLevel::Info, "head");

    logger.info("worker \"w1\" registered");
    ASSERT_EQ(lines.size(), 1u);
    const auto& line = lines[0];
    EXPECT_EQ(line.front(), '{');
    EXPECT_EQ(line.back(), '}');
    EXPECT_TRUE(contains(line, R"("level":"info")"));
    EXPECT_TRUE(contains(line, R"("component":"head")"));
    EXPECT_TRUE(contains(line, R"("msg":"worker \"w1\" registered")"));
    EXPECT_TRUE(contains(line, R"("ts":")"));
}

TEST(LoggerTest, FiltersBelowLevel) {
    std::vector<std::string> lines;
    Logger logger(std::make_unique<CaptureSink>(lines), LogLevel::Warn);

    logger.debug("d");
    logger.info("i");
    logger.warn("w");
    logger.error("e");
    EXPECT_EQ(lines.size(), 2u);

    logger.set_level(LogLevel::Debug);
    logger.debug("d");
    EXPECT_EQ(lines.size(), 3u);
    EXPECT_EQ(logger.level(), LogLevel::Debug);
}

TEST(LoggerTest, ParseLogLevel) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::Debug);
    EXPECT_EQ(parse_log_level("warning"), LogLevel::Warn);
    EXPECT_EQ(parse_log_level("error"), LogLevel::Error);
    EXPECT_FALSE(parse_log_level("verbose").has_value());
}

TEST(LoggerTest, JsonEscape) {
    EXPECT_EQ(json_escape("plain"), "plain");
    EXPECT_EQ(json_escape("a\"b\\c"), "a\\\"b\\\\c");
    EXPECT_EQ(json_escape("line\nbreak\t"), "line\\nbreak\\t");
    EXPECT_EQ(json_escape(std::string(1, '\x01')), "\\u0001");
}

// ═══════════════════════════════════════════════
// JsonFileSink Tests
// ═══════════════════════════════════════════════

class JsonFileSinkTest : public ::testing::Test {
protected:
    std::filesystem::path dir_;

    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() / "hm_test_sink";
        std::filesystem::remove_all(dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }

    static size_t count_lines(const std::filesystem::path& path) {
        std::ifstream in(path);
        size_t n = 0;
        std::string line;
        while (std::getline(in, line)) ++n;
        return n;
    }
};

TEST_F(JsonFileSinkTest, WritesNdjson) {
    {
        JsonFileSink sink(dir_, "head");
        sink.write(R"({"a":1})");
        sink.write(R"({"a":2})");
        sink.flush();
        EXPECT_EQ(sink.current_path(), dir_ / "head.ndjson");
    }
    EXPECT_EQ(count_lines(dir_ / "head.ndjson"), 2u);
}

TEST_F(JsonFileSinkTest, RotatesAndBoundsFileCount) {
    JsonFileSink sink(dir_, "worker", 1, 2);
    sink.set_max_file_size_bytes(20);

    // Each line is 16 bytes with the newline: every second write rotates.
    for (int i = 0; i < 8; ++i) {
        sink.write(R"({"n":"abcdefg"})");
    }
    sink.flush();

    EXPECT_TRUE(std::filesystem::exists(sink.current_path()));
    EXPECT_TRUE(std::filesystem::exists(sink.rotated_path(1)));
    EXPECT_TRUE(std::filesystem::exists(sink.rotated_path(2)));
    EXPECT_FALSE(std::filesystem::exists(sink.rotated_path(3)));
}

TEST_F(JsonFileSinkTest, FactoryFallsBackToStdout) {
    TelemetryConfig telemetry;
    auto sink = make_log_sink(telemetry, "head");
    EXPECT_NE(dynamic_cast<StdoutSink*>(sink.get()), nullptr);

    auto metrics = make_metrics_sink(telemetry);
    EXPECT_NE(dynamic_cast<NullSink*>(metrics.get()), nullptr);

    telemetry.log_dir = dir_;
    auto file_sink = make_log_sink(telemetry, "head");
    EXPECT_NE(dynamic_cast<JsonFileSink*>(file_sink.get()), nullptr);
}

TEST(LogSinkTest, MissingSinkBecomesNullSink) {
    auto sink = or_null_sink(nullptr);
    ASSERT_NE(sink, nullptr);
    EXPECT_NE(dynamic_cast<NullSink*>(sink.get()), nullptr);

    std::vector<std::string> lines;
    auto kept = or_null_sink(std::make_unique<CaptureSink>(lines));
    EXPECT_NE(dynamic_cast<CaptureSink*>(kept.get()), nullptr);
}

// ═══════════════════════════════════════════════
// MetricsCollector Tests
// ═══════════════════════════════════════════════

TEST(MetricsCollectorTest, TaskOutcomeEvent) {
    std::vector<std::string> lines;
    MetricsCollector metrics(std::make_unique<CaptureSink>(lines));

    TaskOutcome outcome{
        .key = TaskKey{Endpoint{"10.0.0.1", 5000}, 17},
        .worker_id = std::nullopt,
        .status = TaskStatus::Failed,
        .error = ErrorCode::TaskTimeout,
        .latency = Duration(1500),
        .retries = 1
    };
    metrics.record_task_outcome(outcome);

    ASSERT_EQ(lines.size(), 1u);
    EXPECT_TRUE(contains(lines[0], R"("event":"task_failed")"));
    EXPECT_TRUE(contains(lines[0], R"("client":"10.0.0.1:5000")"));
    EXPECT_TRUE(contains(lines[0], R"("seq":17)"));
    EXPECT_TRUE(contains(lines[0], R"("latency_us":1500)"));
    EXPECT_TRUE(contains(lines[0], R"("retries":1)"));
    EXPECT_FALSE(contains(lines[0], R"("worker")"));
}

TEST(MetricsCollectorTest, WorkerAndCustomEvents) {
    std::vector<std::string> lines;
    MetricsCollector metrics(std::make_unique<CaptureSink>(lines));

    metrics.record_worker_event("gpu-0", Endpoint{"127.0.0.1", 9100}, "evicted");
    metrics.record_custom("head_shutdown", R"({"uptime_s":3})");

    ASSERT_EQ(lines.size(), 2u);
    EXPECT_TRUE(contains(lines[0], R"("event":"worker_evicted")"));
    EXPECT_TRUE(contains(lines[0], R"("worker":"gpu-0")"));
    EXPECT_TRUE(contains(lines[1], R"("data":{"uptime_s":3})"));
}

// ═══════════════════════════════════════════════
// Health Report Tests
// ═══════════════════════════════════════════════

TEST(HealthReportTest, RendersAllSections) {
    RegistryStats registry;
    registry.total = 1;
    registry.healthy = 1;
    registry.workers.push_back(WorkerSummary{
        .worker_id = "w1",
        .address = Endpoint{"127.0.0.1", 9001},
        .status = WorkerStatus::Healthy,
        .load_hint = 0,
        .tasks_completed = 4,
        .tasks_failed = 1,
        .avg_latency_ms = 12.5,
        .heartbeat_age = std::chrono::milliseconds(250)
    });

    RouterStats router;
    router.submitted = 5;
    router.completed = 4;

    NodeCounters node;
    node.messages_received = 10;

    auto json = render_health_json(registry, router, node, std::chrono::seconds(42));
    EXPECT_EQ(json.front(), '{');
    EXPECT_EQ(json.back(), '}');
    EXPECT_TRUE(contains(json, R"("total":1)"));
    EXPECT_TRUE(contains(json, R"("healthy":1)"));
    EXPECT_TRUE(contains(json, R"("id":"w1")"));
    EXPECT_TRUE(contains(json, R"("address":"127.0.0.1:9001")"));
    EXPECT_TRUE(contains(json, R"("status":"healthy")"));
    EXPECT_TRUE(contains(json, R"("avg_latency_ms":12.50)"));
    EXPECT_TRUE(contains(json, R"("heartbeat_age_ms":250)"));
    EXPECT_TRUE(contains(json, R"("submitted":5)"));
    EXPECT_TRUE(contains(json, R"("messages_received":10)"));
    EXPECT_TRUE(contains(json, R"("uptime_s":42)"));
}
