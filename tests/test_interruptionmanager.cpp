/**
 * @file test_interruptionmanager.cpp
 * @brief Unit tests for InterruptionManager
 *
 * ## Test Coverage
 *
 * ### Registry
 * - Registration, progress, completion, duplicate ids
 *
 * ### Interruption
 * - Graceful interruption runs both callbacks and publishes the result
 * - Failing and throwing callbacks mark the cleanup as failed
 * - Non-graceful and timed-out requests are forced
 * - Rejected requests (unknown, not interruptible, duplicate)
 *
 * ### Resume and Shutdown
 * - Resume registers the remaining work under a new id
 * - Shutdown force-interrupts what is still active
 * - Destruction waits for a callback that outlives the shutdown timeout
 *
 * @see InterruptionManager
 */

#include <gtest/gtest.h>
#include "interruptionmanager.hpp"
#include "safetyevents.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

class InterruptionManagerTest : public ::testing::Test {
protected:
    EventBusPtr bus = std::make_shared<EventBus>();
    InterruptionConfig config;

    std::mutex events_mutex;
    std::vector<InterruptionResult> interrupted;

    void SetUp() override {
        config.pollInterval = 20ms;
        config.gracefulShutdownTimeout = 2000ms;
        bus->subscribe<OperationInterruptedEvent>([this](const OperationInterruptedEvent& e) {
            std::lock_guard<std::mutex> lock(events_mutex);
            interrupted.push_back(e.result);
        });
    }

    std::size_t interruptedCount() {
        std::lock_guard<std::mutex> lock(events_mutex);
        return interrupted.size();
    }

    InterruptionResult lastInterrupted() {
        std::lock_guard<std::mutex> lock(events_mutex);
        return interrupted.back();
    }

    /**
     * @brief Polls @p condition until it holds or @p timeout passes
     */
    static bool waitFor(const std::function<bool()>& condition,
                        std::chrono::milliseconds timeout = 2000ms) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (condition())
                return true;
            std::this_thread::sleep_for(5ms);
        }
        return condition();
    }
};

TEST_F(InterruptionManagerTest, RegistersAndCompletesOperations) {
    InterruptionManager manager(config, bus);

    auto token = manager.registerOperation("op1", "organize", 10);
    EXPECT_FALSE(token.isCancelled());
    EXPECT_TRUE(manager.canInterruptOperation("op1"));

    EXPECT_TRUE(manager.updateOperationProgress("op1", 4));
    auto info = manager.getOperationInfo("op1");
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->processedFiles, 4);
    EXPECT_EQ(info->totalFiles, 10);
    EXPECT_EQ(info->state, OperationState::Active);

    EXPECT_TRUE(manager.completeOperation("op1"));
    EXPECT_FALSE(manager.getOperationInfo("op1").has_value());
    EXPECT_EQ(manager.getOperationState("op1"), OperationState::Completed);
    EXPECT_FALSE(manager.completeOperation("op1"));
    EXPECT_FALSE(manager.updateOperationProgress("op1", 5));
}

TEST_F(InterruptionManagerTest, DuplicateRegistrationSharesToken) {
    InterruptionManager manager(config, bus);

    auto first = manager.registerOperation("op1", "organize", 3);
    auto second = manager.registerOperation("op1", "organize", 3);
    first.cancel();

    EXPECT_TRUE(second.isCancelled());
    EXPECT_EQ(manager.getActiveOperations().size(), 1u);
}

/**
 * @test GracefulInterruptionCompletesWithinPollInterval
 * @brief Both callbacks run, the result is published and the id is gone
 */
TEST_F(InterruptionManagerTest, GracefulInterruptionCompletesWithinPollInterval) {
    InterruptionManager manager(config, bus);
    manager.start();
    ASSERT_TRUE(manager.isRunning());

    auto token = manager.registerOperation("op1", "organize", 10);
    manager.updateOperationProgress("op1", 3);

    std::atomic<int> order{0};
    int interruptCalledAt = 0;
    int cleanupCalledAt = 0;

    InterruptionRequest request;
    request.operationId = "op1";
    request.onInterrupt = [&] { interruptCalledAt = ++order; return true; };
    request.onCleanup = [&] { cleanupCalledAt = ++order; return true; };

    ASSERT_TRUE(manager.requestInterruption(request));
    EXPECT_TRUE(token.isCancelled());
    EXPECT_FALSE(manager.canInterruptOperation("op1"));

    ASSERT_TRUE(waitFor([&] { return interruptedCount() == 1; }, 1000ms));
    InterruptionResult result = lastInterrupted();

    EXPECT_EQ(result.operationId, "op1");
    EXPECT_EQ(result.operationType, "organize");
    EXPECT_TRUE(result.wasGraceful);
    EXPECT_TRUE(result.cleanupSuccessful);
    EXPECT_FALSE(result.errorMessage.has_value());
    EXPECT_EQ(result.filesProcessed, 3);
    EXPECT_EQ(result.filesRemaining, 7);
    EXPECT_TRUE(result.canResume);
    EXPECT_EQ(interruptCalledAt, 1);
    EXPECT_EQ(cleanupCalledAt, 2);
    EXPECT_FALSE(token.isForced());

    EXPECT_FALSE(manager.getOperationInfo("op1").has_value());
    EXPECT_EQ(manager.getOperationState("op1"), OperationState::Interrupted);
    ASSERT_TRUE(manager.getInterruptionResult("op1").has_value());
}

TEST_F(InterruptionManagerTest, FailingCallbackMarksCleanupFailed) {
    InterruptionManager manager(config, bus);
    manager.start();
    manager.registerOperation("op1", "organize", 2);

    InterruptionRequest request;
    request.operationId = "op1";
    request.onInterrupt = [] { return false; };

    ASSERT_TRUE(manager.requestInterruption(request));
    ASSERT_TRUE(waitFor([&] { return interruptedCount() == 1; }));

    InterruptionResult result = lastInterrupted();
    EXPECT_TRUE(result.wasGraceful);
    EXPECT_FALSE(result.cleanupSuccessful);
    EXPECT_TRUE(result.errorMessage.has_value());
}

TEST_F(InterruptionManagerTest, ThrowingCallbackIsContained) {
    InterruptionManager manager(config, bus);
    manager.start();
    manager.registerOperation("op1", "organize", 2);

    bool cleanupRan = false;
    InterruptionRequest request;
    request.operationId = "op1";
    request.onInterrupt = []() -> bool { throw std::runtime_error("disk gone"); };
    request.onCleanup = [&] { cleanupRan = true; return true; };

    ASSERT_TRUE(manager.requestInterruption(request));
    ASSERT_TRUE(waitFor([&] { return interruptedCount() == 1; }));

    InterruptionResult result = lastInterrupted();
    EXPECT_FALSE(result.cleanupSuccessful);
    ASSERT_TRUE(result.errorMessage.has_value());
    EXPECT_NE(result.errorMessage->find("disk gone"), std::string::npos);
    EXPECT_TRUE(cleanupRan);
    EXPECT_TRUE(manager.isRunning());
}

/**
 * @test NonGracefulRequestIsForced
 * @brief Callbacks are skipped and the token is marked forced
 */
TEST_F(InterruptionManagerTest, NonGracefulRequestIsForced) {
    InterruptionManager manager(config, bus);
    manager.start();
    auto token = manager.registerOperation("op1", "organize", 2);

    bool callbackRan = false;
    InterruptionRequest request;
    request.operationId = "op1";
    request.gracefulShutdown = false;
    request.onInterrupt = [&] { callbackRan = true; return true; };

    ASSERT_TRUE(manager.requestInterruption(request));
    ASSERT_TRUE(waitFor([&] { return interruptedCount() == 1; }));

    InterruptionResult result = lastInterrupted();
    EXPECT_FALSE(result.wasGraceful);
    EXPECT_FALSE(result.cleanupSuccessful);
    EXPECT_FALSE(callbackRan);
    EXPECT_TRUE(token.isForced());
}

TEST_F(InterruptionManagerTest, TimedOutRequestIsForced) {
    InterruptionManager manager(config, bus);
    manager.registerOperation("op1", "organize", 2);

    InterruptionRequest request;
    request.operationId = "op1";
    request.maxWaitTime = 1ms;
    ASSERT_TRUE(manager.requestInterruption(request));

    // Worker starts after the request has waited past its limit
    std::this_thread::sleep_for(30ms);
    manager.start();

    ASSERT_TRUE(waitFor([&] { return interruptedCount() == 1; }));
    EXPECT_FALSE(lastInterrupted().wasGraceful);
}

TEST_F(InterruptionManagerTest, TimeoutWithoutForcingStaysGraceful) {
    config.forceInterruptAfterTimeout = false;
    InterruptionManager manager(config, bus);
    manager.registerOperation("op1", "organize", 2);

    InterruptionRequest request;
    request.operationId = "op1";
    request.maxWaitTime = 1ms;
    ASSERT_TRUE(manager.requestInterruption(request));

    std::this_thread::sleep_for(30ms);
    manager.start();

    ASSERT_TRUE(waitFor([&] { return interruptedCount() == 1; }));
    EXPECT_TRUE(lastInterrupted().wasGraceful);
}

TEST_F(InterruptionManagerTest, RejectsInvalidRequests) {
    InterruptionManager manager(config, bus);
    manager.registerOperation("locked", "backup", 1, false);
    manager.registerOperation("op1", "organize", 1);

    InterruptionRequest unknown;
    unknown.operationId = "nope";
    EXPECT_FALSE(manager.requestInterruption(unknown));

    InterruptionRequest locked;
    locked.operationId = "locked";
    EXPECT_FALSE(manager.requestInterruption(locked));
    EXPECT_FALSE(manager.canInterruptOperation("locked"));

    InterruptionRequest notAllowed;
    notAllowed.operationId = "op1";
    notAllowed.canInterrupt = false;
    EXPECT_FALSE(manager.requestInterruption(notAllowed));

    InterruptionRequest first;
    first.operationId = "op1";
    EXPECT_TRUE(manager.requestInterruption(first));
    EXPECT_FALSE(manager.requestInterruption(first));
    EXPECT_EQ(manager.getOperationState("op1"), OperationState::InterruptRequested);
}

/**
 * @test ResumeRegistersRemainingWork
 * @brief A resumed operation gets a new id and the remaining file count
 */
TEST_F(InterruptionManagerTest, ResumeRegistersRemainingWork) {
    std::vector<OperationResumeRequestedEvent> resumes;
    bus->subscribe<OperationResumeRequestedEvent>(
        [&](const OperationResumeRequestedEvent& e) { resumes.push_back(e); });

    InterruptionManager manager(config, bus);
    manager.start();
    manager.registerOperation("op1", "organize", 10);
    manager.updateOperationProgress("op1", 4);

    InterruptionRequest request;
    request.operationId = "op1";
    ASSERT_TRUE(manager.requestInterruption(request));
    ASSERT_TRUE(waitFor([&] { return interruptedCount() == 1; }));

    auto ticket = manager.resumeOperation("op1");
    ASSERT_TRUE(ticket.has_value());
    EXPECT_EQ(ticket->resumeFrom, 4);
    EXPECT_EQ(ticket->operationId, "op1_resume_1");
    EXPECT_FALSE(ticket->token.isCancelled());

    auto info = manager.getOperationInfo(ticket->operationId);
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->totalFiles, 6);
    EXPECT_EQ(manager.getOperationState("op1"), OperationState::Interrupted);

    ASSERT_EQ(resumes.size(), 1u);
    EXPECT_EQ(resumes[0].originalOperationId, "op1");
    EXPECT_EQ(resumes[0].newOperationId, "op1_resume_1");

    auto clamped = manager.resumeOperation("op1", 50);
    ASSERT_TRUE(clamped.has_value());
    EXPECT_EQ(clamped->resumeFrom, 10);
}

TEST_F(InterruptionManagerTest, CannotResumeCompletedOperation) {
    InterruptionManager manager(config, bus);
    manager.registerOperation("op1", "organize", 2);
    manager.completeOperation("op1");

    EXPECT_FALSE(manager.resumeOperation("op1").has_value());
    EXPECT_FALSE(manager.resumeOperation("never").has_value());
}

/**
 * @test ShutdownForcesActiveOperations
 * @brief Operations still registered at shutdown are force-interrupted
 */
TEST_F(InterruptionManagerTest, ShutdownForcesActiveOperations) {
    InterruptionManager manager(config, bus);
    manager.start();
    auto token = manager.registerOperation("op1", "organize", 5);
    manager.registerOperation("locked", "backup", 1, false);

    manager.shutdown();

    EXPECT_FALSE(manager.isRunning());
    EXPECT_TRUE(token.isCancelled());
    EXPECT_TRUE(token.isForced());
    ASSERT_EQ(interruptedCount(), 1u);
    EXPECT_EQ(lastInterrupted().reason, InterruptionReason::SystemError);
    EXPECT_TRUE(manager.getOperationInfo("locked").has_value());

    manager.shutdown();
}

/**
 * @test DestroyWaitsForSlowCallback
 * @brief A callback that outlives the shutdown timeout finishes before the
 *        manager goes away
 */
TEST_F(InterruptionManagerTest, DestroyWaitsForSlowCallback) {
    config.gracefulShutdownTimeout = 50ms;
    auto manager = std::make_unique<InterruptionManager>(config, bus);
    manager->start();
    auto token = manager->registerOperation("slow", "organize", 4);

    std::atomic<bool> callbackStarted{false};
    std::atomic<bool> callbackFinished{false};
    InterruptionRequest request;
    request.operationId = "slow";
    request.onInterrupt = [&] {
        callbackStarted = true;
        std::this_thread::sleep_for(300ms);
        callbackFinished = true;
        return true;
    };

    ASSERT_TRUE(manager->requestInterruption(request));
    ASSERT_TRUE(waitFor([&] { return callbackStarted.load(); }, 1000ms));

    const auto started = std::chrono::steady_clock::now();
    manager.reset();

    EXPECT_TRUE(callbackFinished);
    EXPECT_GE(std::chrono::steady_clock::now() - started, 100ms);
    ASSERT_EQ(interruptedCount(), 1u);
    EXPECT_TRUE(lastInterrupted().wasGraceful);
    EXPECT_TRUE(token.isCancelled());
}

TEST_F(InterruptionManagerTest, CleanupDropsOldRecords) {
    InterruptionManager manager(config, bus);
    manager.registerOperation("idle", "organize", 1);
    manager.registerOperation("done", "organize", 1);
    manager.completeOperation("done");

    std::this_thread::sleep_for(20ms);
    EXPECT_EQ(manager.cleanupOldOperations(10ms), 2);
    EXPECT_FALSE(manager.getOperationState("idle").has_value());
    EXPECT_FALSE(manager.getOperationState("done").has_value());
    EXPECT_EQ(manager.cleanupOldOperations(10ms), 0);
}
