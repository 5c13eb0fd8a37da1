#include <gtest/gtest.h>
#include "switchyard/engine/dispatch_queue.hpp"
#include "mocks/mock_handlers.hpp"
#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

using namespace switchyard;
using namespace switchyard::engine;
using namespace switchyard::testing;

class DispatchQueueTest : public ::testing::Test {
protected:
    void TearDown() override {
        gate.release();
        queue.shutdown();
    }

    /// Records every attempt in order; "block" waits on the gate; "fail-once" fails its first attempt.
    ChannelHandler recording_handler() {
        return [this](const std::string& command, const Payload& payload) -> Expected<Payload> {
            if (command == "block") {
                return gate(command, payload);
            }
            {
                std::lock_guard<std::mutex> lock(order_mutex);
                order.push_back(command);
            }
            if (command == "fail-once" && !failed_once.exchange(true)) {
                return tl::unexpected(Error{ErrorCode::HandlerFailed, "first attempt fails"});
            }
            return Payload{{"command", command}};
        };
    }

    std::vector<std::string> recorded() {
        std::lock_guard<std::mutex> lock(order_mutex);
        return order;
    }

    GateHandler gate;
    std::mutex order_mutex;
    std::vector<std::string> order;
    std::atomic<bool> failed_once{false};

    DispatchQueue queue{4};
};

// ============================================================================
// Registration and Submission
// ============================================================================

TEST_F(DispatchQueueTest, RegisterChannel) {
    ASSERT_TRUE(queue.register_channel("cad", recording_handler(), 1).has_value());
    EXPECT_TRUE(queue.has_channel("cad"));
    EXPECT_FALSE(queue.has_channel("trading"));

    auto status = queue.get_queue_status();
    ASSERT_EQ(status.count("cad"), 1u);
    EXPECT_EQ(status["cad"].concurrency, 1);
    EXPECT_EQ(status["cad"].pending, 0u);
    EXPECT_EQ(status["cad"].running, 0);
}

TEST_F(DispatchQueueTest, RejectsDuplicateChannel) {
    ASSERT_TRUE(queue.register_channel("cad", recording_handler()).has_value());
    auto again = queue.register_channel("cad", recording_handler());
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, ErrorCode::ChannelAlreadyRegistered);
}

TEST_F(DispatchQueueTest, RejectsInvalidConcurrency) {
    auto result = queue.register_channel("cad", recording_handler(), 0);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidChannelConfig);
    EXPECT_FALSE(queue.has_channel("cad"));
}

TEST_F(DispatchQueueTest, SubmitToUnknownChannel) {
    auto id = queue.submit("missing", "noop");
    ASSERT_FALSE(id.has_value());
    EXPECT_EQ(id.error().code, ErrorCode::ChannelNotFound);
}

TEST_F(DispatchQueueTest, TaskIdFormat) {
    ASSERT_TRUE(queue.register_channel("cad", recording_handler()).has_value());
    auto first = queue.submit("cad", "one");
    auto second = queue.submit("cad", "two");
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*first, "cad-000001");
    EXPECT_EQ(*second, "cad-000002");
}

TEST_F(DispatchQueueTest, SubmitAndAwait) {
    ASSERT_TRUE(queue.register_channel("cad", recording_handler()).has_value());
    auto id = queue.submit("cad", "rebuild", Payload{{"part", "flange"}});
    ASSERT_TRUE(id.has_value());

    auto result = queue.await_result(*id, std::chrono::seconds(5));
    ASSERT_TRUE(result.has_value()) << result.error().to_string();
    EXPECT_EQ((*result)["command"], "rebuild");

    auto task = queue.get_task(*id);
    ASSERT_TRUE(task.has_value());
    EXPECT_EQ(task->status, TaskStatus::Completed);
    EXPECT_EQ(task->channel, "cad");
    EXPECT_EQ(task->payload["part"], "flange");
    EXPECT_EQ(task->retry_count, 0);
    EXPECT_TRUE(task->started_at.has_value());
    EXPECT_TRUE(task->completed_at.has_value());
}

TEST_F(DispatchQueueTest, AwaitUnknownTask) {
    auto result = queue.await_result("cad-999999", std::chrono::milliseconds(10));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::TaskNotFound);
}

// ============================================================================
// Concurrency and Ordering
// ============================================================================

TEST_F(DispatchQueueTest, ConcurrencyLimitHoldsUnderBurst) {
    ConcurrencyTracker tracker(std::chrono::milliseconds(40));
    ASSERT_TRUE(queue.register_channel("pool", tracker, 2).has_value());

    std::vector<TaskId> ids;
    for (int i = 0; i < 5; ++i) {
        auto id = queue.submit("pool", "work", Payload{{"seq", i}});
        ASSERT_TRUE(id.has_value());
        ids.push_back(*id);
    }

    // Sample in-flight counts while the burst drains
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (tracker.completed().size() < 5 && std::chrono::steady_clock::now() < deadline) {
        auto status = queue.get_queue_status();
        EXPECT_GE(status["pool"].running, 0);
        EXPECT_LE(status["pool"].running, 2);
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }

    for (const auto& id : ids) {
        auto result = queue.await_result(id, std::chrono::seconds(5));
        EXPECT_TRUE(result.has_value());
        EXPECT_EQ(queue.get_task(id)->status, TaskStatus::Completed);
    }
    EXPECT_LE(tracker.max_running(), 2);
    EXPECT_GE(tracker.max_running(), 1);
}

TEST_F(DispatchQueueTest, FifoWithinBandAtConcurrencyOne) {
    ConcurrencyTracker tracker(std::chrono::milliseconds(5));
    ASSERT_TRUE(queue.register_channel("serial", tracker, 1).has_value());

    std::vector<TaskId> ids;
    for (int i = 0; i < 6; ++i) {
        ids.push_back(*queue.submit("serial", "work", Payload{{"seq", i}}));
    }
    for (const auto& id : ids) {
        ASSERT_TRUE(queue.await_result(id, std::chrono::seconds(5)).has_value());
    }

    EXPECT_EQ(tracker.completed(), (std::vector<int>{0, 1, 2, 3, 4, 5}));
    EXPECT_EQ(tracker.max_running(), 1);
}

TEST_F(DispatchQueueTest, HigherPriorityStartsFirst) {
    ASSERT_TRUE(queue.register_channel("cad", recording_handler(), 1).has_value());

    auto blocker = queue.submit("cad", "block");
    ASSERT_TRUE(blocker.has_value());
    ASSERT_TRUE(gate.wait_entered(1));

    std::vector<TaskId> ids;
    ids.push_back(*queue.submit("cad", "low", Payload::object(), Priority::Low));
    ids.push_back(*queue.submit("cad", "normal", Payload::object(), Priority::Normal));
    ids.push_back(*queue.submit("cad", "critical", Payload::object(), Priority::Critical));
    ids.push_back(*queue.submit("cad", "high", Payload::object(), Priority::High));
    EXPECT_EQ(queue.get_queue_status()["cad"].pending, 4u);

    gate.release();
    for (const auto& id : ids) {
        ASSERT_TRUE(queue.await_result(id, std::chrono::seconds(5)).has_value());
    }

    EXPECT_EQ(recorded(), (std::vector<std::string>{"critical", "high", "normal", "low"}));
}

// ============================================================================
// Retries
// ============================================================================

TEST_F(DispatchQueueTest, RetriesThenSucceeds) {
    FlakyHandler flaky(2);
    ChannelConfig config;
    config.max_retries = 3;
    ASSERT_TRUE(queue.register_channel("flaky", flaky, config).has_value());

    auto id = queue.submit("flaky", "sync");
    ASSERT_TRUE(id.has_value());

    auto result = queue.await_result(*id, std::chrono::seconds(5));
    ASSERT_TRUE(result.has_value()) << result.error().to_string();

    auto task = queue.get_task(*id);
    EXPECT_EQ(task->status, TaskStatus::Completed);
    EXPECT_EQ(task->retry_count, 2);
    EXPECT_LT(task->retry_count, task->max_retries);
    EXPECT_EQ(flaky.calls(), 3);
}

TEST_F(DispatchQueueTest, FailsAfterMaxRetriesPlusOneAttempts) {
    FlakyHandler flaky(1000);
    ChannelConfig config;
    config.max_retries = 2;
    ASSERT_TRUE(queue.register_channel("flaky", flaky, config).has_value());

    auto id = queue.submit("flaky", "sync");
    auto result = queue.await_result(*id, std::chrono::seconds(5));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::TaskRetryExhausted);
    ASSERT_TRUE(result.error().context.has_value());
    EXPECT_EQ(*result.error().context, "flaky failure on sync");

    auto task = queue.get_task(*id);
    EXPECT_EQ(task->status, TaskStatus::Failed);
    EXPECT_EQ(task->retry_count, 2);
    ASSERT_TRUE(task->error.has_value());

    // Terminal: never retried again
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(flaky.calls(), 3);
    EXPECT_EQ(queue.get_task(*id)->status, TaskStatus::Failed);
}

TEST_F(DispatchQueueTest, ZeroRetriesFailsOnFirstError) {
    FlakyHandler flaky(1);
    ChannelConfig config;
    config.max_retries = 0;
    ASSERT_TRUE(queue.register_channel("flaky", flaky, config).has_value());

    auto id = queue.submit("flaky", "sync");
    EXPECT_FALSE(queue.await_result(*id, std::chrono::seconds(5)).has_value());
    EXPECT_EQ(flaky.calls(), 1);
}

TEST_F(DispatchQueueTest, ThrowingHandlerBecomesTaskError) {
    FlakyHandler thrower(1000, true);
    ChannelConfig config;
    config.max_retries = 1;
    ASSERT_TRUE(queue.register_channel("thrower", thrower, config).has_value());

    auto id = queue.submit("thrower", "explode");
    auto result = queue.await_result(*id, std::chrono::seconds(5));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::TaskRetryExhausted);

    auto task = queue.get_task(*id);
    ASSERT_TRUE(task->error.has_value());
    EXPECT_NE(task->error->find("Handler threw"), std::string::npos);
    EXPECT_EQ(thrower.calls(), 2);

    // Channel keeps working after a throwing handler
    EXPECT_TRUE(queue.is_running());
}

TEST_F(DispatchQueueTest, RetryGoesToFrontOfBand) {
    ASSERT_TRUE(queue.register_channel("cad", recording_handler(), 1).has_value());

    auto blocker = queue.submit("cad", "block");
    ASSERT_TRUE(gate.wait_entered(1));
    auto first = queue.submit("cad", "fail-once");
    auto second = queue.submit("cad", "later");
    gate.release();

    ASSERT_TRUE(queue.await_result(*first, std::chrono::seconds(5)).has_value());
    ASSERT_TRUE(queue.await_result(*second, std::chrono::seconds(5)).has_value());

    EXPECT_EQ(recorded(), (std::vector<std::string>{"fail-once", "fail-once", "later"}));
    EXPECT_EQ(queue.get_task(*first)->retry_count, 1);
}

TEST_F(DispatchQueueTest, RetryBackoffDelaysNextAttempt) {
    FlakyHandler flaky(1);
    ChannelConfig config;
    config.max_retries = 1;
    config.retry_backoff = std::chrono::milliseconds(60);
    ASSERT_TRUE(queue.register_channel("flaky", flaky, config).has_value());

    const auto start = std::chrono::steady_clock::now();
    auto id = queue.submit("flaky", "sync");
    ASSERT_TRUE(queue.await_result(*id, std::chrono::seconds(5)).has_value());
    const auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_GE(elapsed, std::chrono::milliseconds(60));
    EXPECT_EQ(flaky.calls(), 2);
}

// ============================================================================
// Cancel, Timeout, Pause
// ============================================================================

TEST_F(DispatchQueueTest, CancelPendingTask) {
    ASSERT_TRUE(queue.register_channel("cad", recording_handler(), 1).has_value());

    auto blocker = queue.submit("cad", "block");
    ASSERT_TRUE(gate.wait_entered(1));
    auto pending = queue.submit("cad", "never-runs");

    EXPECT_TRUE(queue.cancel(*pending));
    EXPECT_FALSE(queue.cancel(*pending));   // already terminal
    EXPECT_FALSE(queue.cancel(*blocker));   // running tasks are not cancelled

    auto result = queue.await_result(*pending, std::chrono::seconds(1));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::TaskCancelled);
    EXPECT_EQ(queue.get_queue_status()["cad"].pending, 0u);

    gate.release();
    ASSERT_TRUE(queue.await_result(*blocker, std::chrono::seconds(5)).has_value());
    EXPECT_TRUE(recorded().empty());
}

TEST_F(DispatchQueueTest, AwaitTimeoutLeavesTaskRunning) {
    ASSERT_TRUE(queue.register_channel("cad", recording_handler(), 1).has_value());

    auto id = queue.submit("cad", "block");
    ASSERT_TRUE(gate.wait_entered(1));

    auto timed_out = queue.await_result(*id, std::chrono::milliseconds(30));
    ASSERT_FALSE(timed_out.has_value());
    EXPECT_EQ(timed_out.error().code, ErrorCode::TaskTimeout);
    EXPECT_EQ(queue.get_task(*id)->status, TaskStatus::Running);

    gate.release();
    auto result = queue.await_result(*id, std::chrono::seconds(5));
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(queue.get_task(*id)->status, TaskStatus::Completed);
}

TEST_F(DispatchQueueTest, PauseAndResume) {
    ASSERT_TRUE(queue.register_channel("cad", recording_handler(), 1).has_value());
    ASSERT_TRUE(queue.pause("cad").has_value());

    auto id = queue.submit("cad", "deferred");
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    auto status = queue.get_queue_status()["cad"];
    EXPECT_TRUE(status.paused);
    EXPECT_EQ(status.pending, 1u);
    EXPECT_EQ(status.running, 0);
    EXPECT_EQ(queue.get_task(*id)->status, TaskStatus::Pending);

    ASSERT_TRUE(queue.resume("cad").has_value());
    ASSERT_TRUE(queue.await_result(*id, std::chrono::seconds(5)).has_value());
    EXPECT_FALSE(queue.get_queue_status()["cad"].paused);
}

TEST_F(DispatchQueueTest, PauseUnknownChannel) {
    auto result = queue.pause("missing");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ChannelNotFound);
}

// ============================================================================
// Introspection, Retention, Shutdown
// ============================================================================

TEST_F(DispatchQueueTest, QueueStatusIsIdempotent) {
    ASSERT_TRUE(queue.register_channel("cad", recording_handler(), 2).has_value());
    ASSERT_TRUE(queue.register_channel("trading", recording_handler(), 1).has_value());
    auto id = queue.submit("cad", "one");
    ASSERT_TRUE(queue.await_result(*id, std::chrono::seconds(5)).has_value());

    auto first = queue.get_queue_status();
    auto second = queue.get_queue_status();
    EXPECT_EQ(first, second);
}

TEST_F(DispatchQueueTest, TaskSnapshotToJson) {
    ASSERT_TRUE(queue.register_channel("cad", recording_handler()).has_value());
    auto id = queue.submit("cad", "export", Payload{{"format", "pdf"}}, Priority::High);
    ASSERT_TRUE(queue.await_result(*id, std::chrono::seconds(5)).has_value());

    auto json = queue.get_task(*id)->to_json();
    EXPECT_EQ(json["id"], *id);
    EXPECT_EQ(json["status"], "completed");
    EXPECT_EQ(json["priority"], "high");
    EXPECT_EQ(json["payload"]["format"], "pdf");
    EXPECT_EQ(json["result"]["command"], "export");
    EXPECT_TRUE(json["error"].is_null());
}

TEST(DispatchQueueRetentionTest, EvictsOldestFinishedTasks) {
    DispatchQueue queue(std::make_shared<ThreadPool>(2), 2);
    ASSERT_TRUE(queue.register_channel("cad", [](const std::string& command, const Payload&) -> Expected<Payload> {
        return Payload(command);
    }).has_value());

    std::vector<TaskId> ids;
    for (int i = 0; i < 3; ++i) {
        auto id = queue.submit("cad", "task");
        ASSERT_TRUE(queue.await_result(*id, std::chrono::seconds(5)).has_value());
        ids.push_back(*id);
    }

    EXPECT_FALSE(queue.get_task(ids[0]).has_value());
    EXPECT_TRUE(queue.get_task(ids[1]).has_value());
    EXPECT_TRUE(queue.get_task(ids[2]).has_value());
}

TEST(DispatchQueueRetentionTest, WaitingCallerKeepsTaskPastRetention) {
    GateHandler gate;
    DispatchQueue queue(std::make_shared<ThreadPool>(2), 1);
    ChannelConfig config;
    config.concurrency = 2;
    ASSERT_TRUE(queue.register_channel("cad", gate, config).has_value());

    auto first = queue.submit("cad", "first");
    auto second = queue.submit("cad", "second");
    ASSERT_TRUE(gate.wait_entered(2));

    std::thread releaser([&gate]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        gate.release();
    });
    auto result = queue.await_result(*first, std::chrono::seconds(5));
    releaser.join();

    ASSERT_TRUE(result.has_value()) << result.error().to_string();
    EXPECT_EQ((*result)["command"], "first");
    EXPECT_TRUE(second.has_value());
}

TEST(DispatchQueueRetentionTest, HeldResultSurvivesUntilCollected) {
    DispatchQueue queue(std::make_shared<ThreadPool>(2), 1);
    ASSERT_TRUE(queue.register_channel("cad", [](const std::string& command, const Payload&) -> Expected<Payload> {
        return Payload(command);
    }).has_value());

    auto held = queue.submit("cad", "held", Payload::object(), Priority::Normal, true);
    auto later = queue.submit("cad", "later");
    ASSERT_TRUE(queue.await_result(*later, std::chrono::seconds(5)).has_value());

    auto result = queue.await_result(*held, std::chrono::seconds(5));
    ASSERT_TRUE(result.has_value()) << result.error().to_string();
    EXPECT_EQ(*result, "held");

    EXPECT_FALSE(queue.get_task(*held).has_value());
    EXPECT_TRUE(queue.get_task(*later).has_value());
}

TEST_F(DispatchQueueTest, ShutdownCancelsPendingAndRejectsSubmissions) {
    ASSERT_TRUE(queue.register_channel("cad", recording_handler(), 1).has_value());

    auto running = queue.submit("cad", "block");
    ASSERT_TRUE(gate.wait_entered(1));
    auto pending = queue.submit("cad", "queued");

    std::thread releaser([this]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        gate.release();
    });
    queue.shutdown();
    releaser.join();

    EXPECT_FALSE(queue.is_running());
    EXPECT_EQ(queue.get_task(*running)->status, TaskStatus::Completed);
    EXPECT_EQ(queue.get_task(*pending)->status, TaskStatus::Cancelled);

    auto rejected = queue.submit("cad", "late");
    ASSERT_FALSE(rejected.has_value());
    EXPECT_EQ(rejected.error().code, ErrorCode::QueueShutdown);
    EXPECT_TRUE(recorded().empty());
}
