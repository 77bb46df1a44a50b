/**
 * @file test_task_router.cpp
 * @brief Unit tests for the TaskRouter state machine.
 */

#include "cluster/task_router.hpp"
#include "protocol/chunking.hpp"

#include <gtest/gtest.h>

using namespace hydramesh;
using namespace std::chrono_literals;

namespace {

ErrorCode error_code_of(const Outbound& out) {
    EXPECT_EQ(out.message.type, MessageType::Error);
    auto err = PayloadCodec::decode_error(out.message.payload);
    EXPECT_TRUE(err.has_value());
    return err.has_value() ? err->code : ErrorCode::Internal;
}

}  // anonymous namespace

class TaskRouterTest : public ::testing::Test {
protected:
    SteadyTime t0_ = std::chrono::steady_clock::now();
    WorkerRegistry registry_{1000ms};
    Endpoint client_{"10.0.0.5", 40000};

    RouterOptions options(uint32_t max_retries = 2, size_t max_pending = 100) {
        RouterOptions o;
        o.request_timeout = 5000ms;
        o.max_retries = max_retries;
        o.max_pending = max_pending;
        o.max_fragment_bytes = 1000;
        return o;
    }

    void add_worker(const WorkerId& id, uint16_t port, SteadyTime at) {
        registry_.record_heartbeat(id, Endpoint{"127.0.0.1", port}, {}, 0, at);
    }

    static Message task(uint32_t seq, std::vector<uint8_t> payload = {1, 2, 3}) {
        return Message::make(MessageType::Task, seq, std::move(payload));
    }
};

TEST_F(TaskRouterTest, NormalPath) {
    TaskRouter router(registry_, options());
    add_worker("w1", 9001, t0_);

    std::vector<TaskOutcome> outcomes;
    router.on_outcome([&](const TaskOutcome& o) { outcomes.push_back(o); });

    auto out = router.submit(client_, task(7), t0_);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].channel, Channel::ToWorker);
    EXPECT_EQ(out[0].destination.port, 9001);
    EXPECT_EQ(out[0].message.type, MessageType::Task);
    EXPECT_NE(out[0].message.sequence, 0u);
    EXPECT_EQ(out[0].message.payload, (std::vector<uint8_t>{1, 2, 3}));

    auto record = router.find(TaskKey{client_, 7});
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->status, TaskStatus::AwaitingResult);
    EXPECT_EQ(registry_.find("w1")->status, WorkerStatus::Busy);

    auto reply = router.complete(Endpoint{"127.0.0.1", 9001}, out[0].message.sequence,
                                 {9, 9}, t0_ + 20ms);
    ASSERT_EQ(reply.size(), 1u);
    EXPECT_EQ(reply[0].channel, Channel::ToClient);
    EXPECT_EQ(reply[0].destination, client_);
    EXPECT_EQ(reply[0].message.type, MessageType::Result);
    EXPECT_EQ(reply[0].message.sequence, 7u);
    EXPECT_EQ(reply[0].message.payload, (std::vector<uint8_t>{9, 9}));

    EXPECT_EQ(router.in_flight(), 0u);
    auto worker = registry_.find("w1");
    EXPECT_EQ(worker->status, WorkerStatus::Healthy);
    EXPECT_EQ(worker->tasks_completed, 1u);

    ASSERT_EQ(outcomes.size(), 1u);
    EXPECT_EQ(outcomes[0].status, TaskStatus::Complete);
    EXPECT_EQ(outcomes[0].worker_id, WorkerId("w1"));
    EXPECT_EQ(outcomes[0].latency, Duration(20000));

    auto stats = router.stats();
    EXPECT_EQ(stats.submitted, 1u);
    EXPECT_EQ(stats.completed, 1u);
    EXPECT_DOUBLE_EQ(stats.avg_latency_ms, 20.0);
}

TEST_F(TaskRouterTest, LargeResultIsChunked) {
    TaskRouter router(registry_, options());
    add_worker("w1", 9001, t0_);

    auto out = router.submit(client_, task(3), t0_);
    ASSERT_EQ(out.size(), 1u);

    auto reply = router.complete(Endpoint{"127.0.0.1", 9001}, out[0].message.sequence,
                                 std::vector<uint8_t>(2500, 0x5A), t0_);
    ASSERT_EQ(reply.size(), 3u);

    ChunkReassembler reassembler;
    Reassembled whole;
    for (const auto& o : reply) {
        EXPECT_EQ(o.message.type, MessageType::Chunk);
        EXPECT_EQ(o.message.sequence, 3u);
        auto chunk = PayloadCodec::decode_chunk(o.message.payload);
        ASSERT_TRUE(chunk.has_value());
        EXPECT_EQ(chunk->message_id, 3u);
        auto r = reassembler.ingest(*chunk, t0_);
        ASSERT_TRUE(r.has_value());
        if (r->has_value()) whole = *r;
    }
    ASSERT_TRUE(whole.has_value());
    EXPECT_EQ(whole->size(), 2500u);
}

TEST_F(TaskRouterTest, NoWorkersRejectsImmediately) {
    TaskRouter router(registry_, options());

    auto out = router.submit(client_, task(1), t0_);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].channel, Channel::ToClient);
    EXPECT_EQ(out[0].message.sequence, 1u);
    EXPECT_EQ(error_code_of(out[0]), ErrorCode::NoWorkers);
    EXPECT_EQ(router.in_flight(), 0u);
    EXPECT_EQ(router.stats().rejected, 1u);
}

TEST_F(TaskRouterTest, CapacityLimit) {
    TaskRouter router(registry_, options(2, 1));
    add_worker("w1", 9001, t0_);
    add_worker("w2", 9002, t0_);

    ASSERT_EQ(router.submit(client_, task(1), t0_).size(), 1u);
    auto out = router.submit(client_, task(2), t0_);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(error_code_of(out[0]), ErrorCode::Capacity);
    EXPECT_EQ(router.in_flight(), 1u);
}

TEST_F(TaskRouterTest, DuplicateSubmissionIgnored) {
    TaskRouter router(registry_, options());
    add_worker("w1", 9001, t0_);
    add_worker("w2", 9002, t0_);

    ASSERT_EQ(router.submit(client_, task(5), t0_).size(), 1u);
    EXPECT_TRUE(router.submit(client_, task(5), t0_).empty());
    EXPECT_EQ(router.stats().duplicates, 1u);
    EXPECT_EQ(router.in_flight(), 1u);

    // Same sequence from a different client is a different task.
    Endpoint other{"10.0.0.6", 40000};
    EXPECT_EQ(router.submit(other, task(5), t0_).size(), 1u);
    EXPECT_EQ(router.in_flight(), 2u);
}

TEST_F(TaskRouterTest, EvictedWorkerTaskIsReassigned) {
    TaskRouter router(registry_, options());
    add_worker("w1", 9001, t0_);

    auto first = router.submit(client_, task(8), t0_);
    ASSERT_EQ(first.size(), 1u);
    auto first_dispatch = first[0].message.sequence;

    // w2 joins later and stays fresh; w1 goes silent.
    add_worker("w2", 9002, t0_ + 1000ms);
    auto now = t0_ + 1500ms;
    auto evicted = registry_.sweep(now);
    ASSERT_EQ(evicted.size(), 1u);

    auto out = router.handle_evictions(evicted, now);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].channel, Channel::ToWorker);
    EXPECT_EQ(out[0].destination.port, 9002);
    EXPECT_NE(out[0].message.sequence, first_dispatch);

    auto record = router.find(TaskKey{client_, 8});
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->assigned_worker_id, WorkerId("w2"));
    EXPECT_EQ(record->retry_count, 1u);
    EXPECT_EQ(router.stats().reassigned, 1u);

    // A late result from the evicted worker is stale.
    EXPECT_TRUE(router.complete(Endpoint{"127.0.0.1", 9001}, first_dispatch, {1}, now).empty());
    EXPECT_EQ(router.stats().stale_results, 1u);

    auto reply = router.complete(Endpoint{"127.0.0.1", 9002}, out[0].message.sequence, {2}, now);
    ASSERT_EQ(reply.size(), 1u);
    EXPECT_EQ(reply[0].message.type, MessageType::Result);
    EXPECT_EQ(reply[0].message.sequence, 8u);
}

TEST_F(TaskRouterTest, EvictionWithoutSpareWorkerFails) {
    TaskRouter router(registry_, options());
    add_worker("w1", 9001, t0_);
    ASSERT_EQ(router.submit(client_, task(8), t0_).size(), 1u);

    auto now = t0_ + 1500ms;
    auto out = router.handle_evictions(registry_.sweep(now), now);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].channel, Channel::ToClient);
    EXPECT_EQ(out[0].message.sequence, 8u);
    EXPECT_EQ(error_code_of(out[0]), ErrorCode::WorkerUnreachable);
    EXPECT_EQ(router.in_flight(), 0u);
    EXPECT_EQ(router.stats().failed, 1u);
}

TEST_F(TaskRouterTest, WorkerBusyRetriesElsewhere) {
    TaskRouter router(registry_, options());
    add_worker("a", 9001, t0_);
    add_worker("b", 9002, t0_);

    auto first = router.submit(client_, task(2), t0_);
    ASSERT_EQ(first.size(), 1u);
    auto busy_port = first[0].destination.port;

    auto out = router.fail_from_worker(first[0].destination, first[0].message.sequence,
                                       ErrorPayload{ErrorCode::WorkerBusy, "busy"}, t0_);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].channel, Channel::ToWorker);
    EXPECT_NE(out[0].destination.port, busy_port);
    EXPECT_EQ(router.stats().reassigned, 1u);
}

TEST_F(TaskRouterTest, WorkerBusyWithExhaustedRetriesFails) {
    TaskRouter router(registry_, options(0));
    add_worker("a", 9001, t0_);

    auto first = router.submit(client_, task(2), t0_);
    ASSERT_EQ(first.size(), 1u);

    auto out = router.fail_from_worker(first[0].destination, first[0].message.sequence,
                                       ErrorPayload{ErrorCode::WorkerBusy, "busy"}, t0_);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].channel, Channel::ToClient);
    EXPECT_EQ(error_code_of(out[0]), ErrorCode::WorkerBusy);
    EXPECT_EQ(registry_.find("a")->status, WorkerStatus::Healthy);
}

TEST_F(TaskRouterTest, ExecutionErrorForwardedToClient) {
    TaskRouter router(registry_, options());
    add_worker("a", 9001, t0_);

    auto first = router.submit(client_, task(4), t0_);
    ASSERT_EQ(first.size(), 1u);

    auto out = router.fail_from_worker(first[0].destination, first[0].message.sequence,
                                       ErrorPayload{ErrorCode::ExecutionFailed, "model crashed"}, t0_);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].message.sequence, 4u);
    auto err = PayloadCodec::decode_error(out[0].message.payload);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, ErrorCode::ExecutionFailed);
    EXPECT_EQ(err->message, "model crashed");

    auto worker = registry_.find("a");
    EXPECT_EQ(worker->status, WorkerStatus::Healthy);
    EXPECT_EQ(worker->tasks_failed, 1u);
}

TEST_F(TaskRouterTest, DeadlineExpiryReleasesWorker) {
    TaskRouter router(registry_, options());
    add_worker("a", 9001, t0_);

    auto first = router.submit(client_, task(6), t0_);
    ASSERT_EQ(first.size(), 1u);

    EXPECT_TRUE(router.expire(t0_ + 4999ms).empty());

    auto out = router.expire(t0_ + 5000ms);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(error_code_of(out[0]), ErrorCode::TaskTimeout);
    EXPECT_EQ(router.stats().timed_out, 1u);
    EXPECT_EQ(registry_.find("a")->status, WorkerStatus::Healthy);

    // The result arriving after the deadline is dropped.
    EXPECT_TRUE(router.complete(first[0].destination, first[0].message.sequence, {1}, t0_ + 6s).empty());
    EXPECT_EQ(router.stats().stale_results, 1u);
}

TEST_F(TaskRouterTest, ResultFromWrongAddressIsStale) {
    TaskRouter router(registry_, options());
    add_worker("a", 9001, t0_);

    auto first = router.submit(client_, task(6), t0_);
    ASSERT_EQ(first.size(), 1u);

    EXPECT_TRUE(router.complete(Endpoint{"127.0.0.1", 9999}, first[0].message.sequence, {1}, t0_).empty());
    EXPECT_EQ(router.in_flight(), 1u);
    EXPECT_EQ(router.stats().stale_results, 1u);
}

TEST_F(TaskRouterTest, ResultFromReboundWorkerIsAccepted) {
    TaskRouter router(registry_, options());
    registry_.record_heartbeat("w1", Endpoint{"10.0.0.9", 9001}, {}, 0, t0_);

    auto first = router.submit(client_, task(12), t0_);
    ASSERT_EQ(first.size(), 1u);
    EXPECT_EQ(first[0].destination, (Endpoint{"10.0.0.9", 9001}));

    // Same worker id, new source port after a NAT re-binding.
    Endpoint rebound{"10.0.0.9", 9002};
    registry_.record_heartbeat("w1", rebound, {}, 1, t0_ + 100ms);

    auto reply = router.complete(rebound, first[0].message.sequence, {4, 2}, t0_ + 200ms);
    ASSERT_EQ(reply.size(), 1u);
    EXPECT_EQ(reply[0].message.type, MessageType::Result);
    EXPECT_EQ(reply[0].message.sequence, 12u);
    EXPECT_EQ(router.stats().stale_results, 0u);
    EXPECT_EQ(router.in_flight(), 0u);
    EXPECT_EQ(registry_.find("w1")->status, WorkerStatus::Healthy);
}

TEST_F(TaskRouterTest, ErrorFromReboundWorkerIsAccepted) {
    TaskRouter router(registry_, options());
    registry_.record_heartbeat("w1", Endpoint{"10.0.0.9", 9001}, {}, 0, t0_);

    auto first = router.submit(client_, task(13), t0_);
    ASSERT_EQ(first.size(), 1u);

    Endpoint rebound{"10.0.0.9", 9002};
    registry_.record_heartbeat("w1", rebound, {}, 0, t0_ + 100ms);

    auto out = router.fail_from_worker(rebound, first[0].message.sequence,
                                       ErrorPayload{ErrorCode::ExecutionFailed, "oom"}, t0_ + 200ms);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(error_code_of(out[0]), ErrorCode::ExecutionFailed);
    EXPECT_EQ(router.stats().stale_results, 0u);
}

TEST_F(TaskRouterTest, EvictionLeavesTaskOfReregisteredWorker) {
    TaskRouter router(registry_, options());
    add_worker("w1", 9001, t0_);

    auto first = router.submit(client_, task(1), t0_);
    ASSERT_EQ(first.size(), 1u);

    auto now = t0_ + 1500ms;
    auto evicted = registry_.sweep(now);
    ASSERT_EQ(evicted.size(), 1u);

    // w1 comes back and takes a new task before the router hears of the sweep.
    add_worker("w1", 9001, now);
    auto second = router.submit(client_, task(2), now);
    ASSERT_EQ(second.size(), 1u);
    EXPECT_EQ(second[0].channel, Channel::ToWorker);

    auto out = router.handle_evictions(evicted, now);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].channel, Channel::ToClient);
    EXPECT_EQ(out[0].message.sequence, 1u);
    EXPECT_EQ(error_code_of(out[0]), ErrorCode::WorkerUnreachable);

    auto alive = router.find(TaskKey{client_, 2});
    ASSERT_TRUE(alive.has_value());
    EXPECT_EQ(alive->assigned_worker_id, WorkerId("w1"));
    EXPECT_EQ(alive->status, TaskStatus::AwaitingResult);

    auto worker = registry_.find("w1");
    ASSERT_TRUE(worker.has_value());
    EXPECT_EQ(worker->status, WorkerStatus::Busy);
    EXPECT_EQ(worker->current_task, (TaskKey{client_, 2}));
}

TEST_F(TaskRouterTest, AtMostOneTaskPerWorker) {
    TaskRouter router(registry_, options());
    add_worker("a", 9001, t0_);
    add_worker("b", 9002, t0_);

    for (uint32_t seq = 1; seq <= 3; ++seq) {
        (void)router.submit(client_, task(seq), t0_);
    }
    EXPECT_EQ(router.in_flight(), 2u);

    auto records = router.snapshot();
    ASSERT_EQ(records.size(), 2u);
    EXPECT_NE(records[0].assigned_worker_id, records[1].assigned_worker_id);
    EXPECT_EQ(router.stats().rejected, 1u);
}

TEST_F(TaskRouterTest, ReassemblyFailure) {
    TaskRouter router(registry_, options());
    add_worker("a", 9001, t0_);

    auto first = router.submit(client_, task(11), t0_);
    ASSERT_EQ(first.size(), 1u);

    auto out = router.fail_reassembly(first[0].message.sequence, t0_ + 1s);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(error_code_of(out[0]), ErrorCode::ReassemblyTimeout);
    EXPECT_EQ(router.in_flight(), 0u);

    EXPECT_TRUE(router.fail_reassembly(first[0].message.sequence, t0_ + 1s).empty());
}
