/**
 * @file bench_coordination.cpp
 * @brief Performance benchmarks for the wire codecs, coordination state and UDP paths.
 * @author Dimitris Kafetzis
 *
 * Measures per-message codec cost, registry selection and router
 * bookkeeping overhead, and loopback round trips through a full head.
 *
 * Usage: ./bench_coordination [--csv]
 */

#include "client/head_client.hpp"
#include "cluster/task_router.hpp"
#include "cluster/worker_registry.hpp"
#include "core/config.hpp"
#include "core/types.hpp"
#include "executor/thread_pool.hpp"
#include "head/head_controller.hpp"
#include "network/udp_socket.hpp"
#include "protocol/chunking.hpp"
#include "protocol/message.hpp"
#include "protocol/payloads.hpp"
#include "telemetry/json_sink.hpp"
#include "worker/worker_agent.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstring>
#include <future>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <string>
#include <thread>
#include <vector>

using namespace hydramesh;
using Clock = std::chrono::high_resolution_clock;

// ─────────────────────────────────────────────
// Benchmark Harness
// ─────────────────────────────────────────────

struct BenchResult {
    std::string name;
    std::string category;
    double mean_us;
    double stddev_us;
    double min_us;
    double max_us;
    double p99_us;
    size_t iterations;
    std::string extra;
};

template <typename Fn>
BenchResult run_bench(const std::string& name,
                      const std::string& category,
                      size_t iterations,
                      Fn&& fn,
                      const std::string& extra = "") {
    std::vector<double> timings;
    timings.reserve(iterations);

    // Warmup
    for (size_t i = 0; i < std::min(iterations / 10, size_t{5}); ++i) fn();

    for (size_t i = 0; i < iterations; ++i) {
        auto start = Clock::now();
        fn();
        auto end = Clock::now();
        timings.push_back(std::chrono::duration<double, std::micro>(end - start).count());
    }

    std::sort(timings.begin(), timings.end());

    double sum = std::accumulate(timings.begin(), timings.end(), 0.0);
    double mean = sum / static_cast<double>(iterations);
    double sq_sum = std::accumulate(timings.begin(), timings.end(), 0.0,
        [mean](double acc, double v) { return acc + (v - mean) * (v - mean); });
    double stddev = std::sqrt(sq_sum / static_cast<double>(iterations));

    size_t p99_idx = std::min(static_cast<size_t>(0.99 * static_cast<double>(iterations)),
                              iterations - 1);

    return BenchResult{
        .name = name, .category = category,
        .mean_us = mean, .stddev_us = stddev,
        .min_us = timings.front(), .max_us = timings.back(),
        .p99_us = timings[p99_idx], .iterations = iterations, .extra = extra
    };
}

void print_results(const std::vector<BenchResult>& results, bool csv) {
    if (csv) {
        std::cout << "category,name,mean_us,stddev_us,min_us,max_us,p99_us,iterations,extra\n";
        for (const auto& r : results) {
            std::cout << r.category << "," << r.name << ","
                      << std::fixed << std::setprecision(2)
                      << r.mean_us << "," << r.stddev_us << ","
                      << r.min_us << "," << r.max_us << "," << r.p99_us << ","
                      << r.iterations << "," << r.extra << "\n";
        }
        return;
    }

    std::string current_cat;
    for (const auto& r : results) {
        if (r.category != current_cat) {
            current_cat = r.category;
            std::cout << "\n══ " << current_cat << " ══\n";
            std::cout << std::left << std::setw(42) << "Benchmark"
                      << std::right << std::setw(11) << "Mean(us)"
                      << std::setw(11) << "Stddev"
                      << std::setw(11) << "P99(us)"
                      << std::setw(11) << "Min(us)"
                      << "  Info\n"
                      << std::string(98, '-') << "\n";
        }
        std::cout << std::left << std::setw(42) << r.name
                  << std::right << std::fixed << std::setprecision(1)
                  << std::setw(11) << r.mean_us
                  << std::setw(11) << r.stddev_us
                  << std::setw(11) << r.p99_us
                  << std::setw(11) << r.min_us
                  << "  " << r.extra << "\n";
    }
}

// ─────────────────────────────────────────────
// Helpers
// ─────────────────────────────────────────────

void populate(WorkerRegistry& registry, size_t n, SteadyTime now) {
    for (size_t i = 0; i < n; ++i) {
        registry.record_heartbeat("worker-" + std::to_string(i),
                                  Endpoint{"10.0.0." + std::to_string(i % 250), static_cast<uint16_t>(9000 + i)},
                                  {}, 0, now);
    }
}

// ─────────────────────────────────────────────
// Suites
// ─────────────────────────────────────────────

std::vector<BenchResult> bench_protocol() {
    std::vector<BenchResult> R;
    constexpr size_t N = 2000;

    auto small = Message::make(MessageType::Task, 1, std::vector<uint8_t>(64, 0xAB));
    auto large = Message::make(MessageType::Result, 1, std::vector<uint8_t>(60000, 0xCD));
    auto small_wire = MessageCodec::encode(small);
    auto large_wire = MessageCodec::encode(large);

    R.push_back(run_bench("encode_64B", "Protocol", N,
        [&]{ auto b = MessageCodec::encode(small); (void)b; }));
    R.push_back(run_bench("decode_64B", "Protocol", N,
        [&]{ auto m = MessageCodec::decode(small_wire); (void)m; }));
    R.push_back(run_bench("encode_60KB", "Protocol", N,
        [&]{ auto b = MessageCodec::encode(large); (void)b; }));
    R.push_back(run_bench("decode_60KB", "Protocol", N,
        [&]{ auto m = MessageCodec::decode(large_wire); (void)m; }));

    std::vector<uint8_t> payload(1 << 20, 0x11);
    R.push_back(run_bench("split_1MB", "Protocol", 200,
        [&]{ auto c = split_into_chunks(1, payload, 60000); (void)c; }, "18 chunks"));

    auto chunks = split_into_chunks(1, payload, 60000);
    std::vector<ChunkPayload> fragments;
    for (const auto& m : chunks) {
        auto c = PayloadCodec::decode_chunk(m.payload);
        if (c) fragments.push_back(std::move(*c));
    }
    std::reverse(fragments.begin(), fragments.end());

    uint32_t id = 0;
    ChunkReassembler reassembler;
    R.push_back(run_bench("reassemble_1MB_reversed", "Protocol", 200, [&]{
        ++id;
        auto now = std::chrono::steady_clock::now();
        for (const auto& f : fragments) {
            auto r = reassembler.ingest(id, f.offset, f.data, f.total_len, now);
            (void)r;
        }
    }));

    return R;
}

std::vector<BenchResult> bench_cluster() {
    std::vector<BenchResult> R;
    constexpr size_t N = 1000;
    auto now = std::chrono::steady_clock::now();

    for (size_t workers : {8, 128, 1024}) {
        WorkerRegistry rr(std::chrono::seconds(10));
        populate(rr, workers, now);
        R.push_back(run_bench("select_round_robin_" + std::to_string(workers), "Cluster", N,
            [&]{ auto w = rr.select_worker(now); (void)w; }, std::to_string(workers) + " workers"));

        WorkerRegistry lra(std::chrono::seconds(10), make_selection_policy("least_recent"));
        populate(lra, workers, now);
        R.push_back(run_bench("select_least_recent_" + std::to_string(workers), "Cluster", N,
            [&]{ auto w = lra.select_worker(now); (void)w; }, std::to_string(workers) + " workers"));
    }

    WorkerRegistry hb_registry(std::chrono::seconds(10));
    populate(hb_registry, 128, now);
    R.push_back(run_bench("heartbeat_refresh", "Cluster", N,
        [&]{ hb_registry.record_heartbeat("worker-7", Endpoint{"10.0.0.7", 9007}, {}, 0, now); }));

    WorkerRegistry registry(std::chrono::seconds(10));
    populate(registry, 16, now);
    TaskRouter router(registry, RouterOptions{});
    Endpoint client{"10.1.0.1", 40000};
    uint32_t seq = 0;
    R.push_back(run_bench("router_submit_complete", "Cluster", N, [&]{
        auto task = Message::make(MessageType::Task, ++seq, std::vector<uint8_t>(64, 0));
        auto out = router.submit(client, task, now);
        if (out.empty() || out[0].channel != Channel::ToWorker) return;
        auto done = router.complete(out[0].destination, out[0].message.sequence, {1, 2, 3}, now);
        (void)done;
    }, "16 workers"));

    return R;
}

std::vector<BenchResult> bench_executor() {
    std::vector<BenchResult> R;
    constexpr size_t N = 500;

    ThreadPool tpool(4);
    R.push_back(run_bench("threadpool_submit", "Executor", N, [&]{
        std::promise<void> p; auto f = p.get_future();
        tpool.submit([&p]{ p.set_value(); }); f.wait();
    }));

    return R;
}

std::vector<BenchResult> bench_transport() {
    std::vector<BenchResult> R;

    UdpSocket a;
    UdpSocket b;
    if (!a.bind(0, "127.0.0.1") || !b.bind(0, "127.0.0.1")) return R;
    Endpoint to_b{"127.0.0.1", b.local_port()};

    std::vector<uint8_t> small(64), large(60000);
    R.push_back(run_bench("udp_send_recv_64B", "Transport", 500, [&]{
        if (!a.send_to(to_b, small)) return;
        auto r = b.receive(1000); (void)r;
    }, "64 B"));
    R.push_back(run_bench("udp_send_recv_60KB", "Transport", 200, [&]{
        if (!a.send_to(to_b, large)) return;
        auto r = b.receive(1000); (void)r;
    }, "60 KB"));

    // Full path: client -> head -> worker -> head -> client
    auto config = default_config();
    config.head.bind_address = "127.0.0.1";
    config.head.client_port = 0;
    config.head.worker_port = 0;

    HeadController head(HeadController::Options{
        .config = config,
        .log_sink = std::make_unique<NullSink>(),
        .log_level = LogLevel::Error,
        .metrics_sink = nullptr
    });
    if (!head.start()) return R;

    auto worker_config = config;
    worker_config.worker.id = "bench";
    worker_config.worker.head_port = head.worker_port();
    worker_config.worker.listen_port = 0;
    WorkerAgent worker(WorkerAgent::Options{
        .config = worker_config,
        .executor = std::make_unique<EchoExecutor>(),
        .log_sink = std::make_unique<NullSink>(),
        .log_level = LogLevel::Error
    });
    if (!worker.start()) { head.stop(); return R; }

    for (int i = 0; i < 200 && head.registry().size() == 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    HeadClient client(Endpoint{"127.0.0.1", head.client_port()});
    if (client.open()) {
        R.push_back(run_bench("head_roundtrip_64B", "Transport", 300,
            [&]{ auto r = client.submit(small, std::chrono::milliseconds(2000)); (void)r; }, "echo"));
        std::vector<uint8_t> mid(32 * 1024, 0x7F);
        R.push_back(run_bench("head_roundtrip_32KB", "Transport", 100,
            [&]{ auto r = client.submit(mid, std::chrono::milliseconds(2000)); (void)r; }, "echo"));
    }

    worker.stop();
    head.stop();
    return R;
}

int main(int argc, char* argv[]) {
    bool csv = (argc > 1 && std::strcmp(argv[1], "--csv") == 0);

    if (!csv) {
        std::cout << "\n  HydraMesh Coordination Benchmarks\n"
                  << "  " << std::string(40, '=') << "\n"
                  << "  Platform: " << sizeof(void*) * 8 << "-bit, "
                  << std::thread::hardware_concurrency() << " cores\n";
    }

    std::vector<BenchResult> all;
    auto append = [&](auto&& v){ all.insert(all.end(), v.begin(), v.end()); };

    append(bench_protocol());
    append(bench_cluster());
    append(bench_executor());
    append(bench_transport());

    print_results(all, csv);
    if (!csv) std::cout << "\n  Total: " << all.size() << " benchmarks\n\n";
    return 0;
}
