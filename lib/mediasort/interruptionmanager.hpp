/**
 * @file interruptionmanager.hpp
 * @brief Registry of running operations and cooperative interruption
 */

#ifndef INTERRUPTIONMANAGER_HPP
#define INTERRUPTIONMANAGER_HPP

#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "cancellationtoken.hpp"
#include "eventbus.hpp"
#include "safetytypes.hpp"

struct InterruptionConfig {
    std::chrono::milliseconds pollInterval{100};
    std::chrono::milliseconds gracefulShutdownTimeout{30000};
    std::chrono::milliseconds defaultMaxWait{30000};
    bool forceInterruptAfterTimeout = true;
};

enum class OperationState {
    Active,
    InterruptRequested,
    Interrupting,
    Interrupted,
    Completed
};

std::string toString(OperationState state);

/**
 * @brief Request to stop one registered operation
 *
 * onInterrupt is called first, then onCleanup, both on the worker thread and
 * without any lock held. Either may be empty. A callback that returns false
 * or throws marks the cleanup as failed.
 */
struct InterruptionRequest {
    std::string operationId;
    std::string operationType;
    InterruptionReason reason = InterruptionReason::UserRequest;
    bool canInterrupt = true;
    bool gracefulShutdown = true;
    std::optional<std::chrono::milliseconds> maxWaitTime;
    bool forceInterruptAfterTimeout = true;
    std::function<bool()> onInterrupt;
    std::function<bool()> onCleanup;
};

struct OperationInfo {
    std::string operationId;
    std::string operationType;
    int totalFiles = 0;
    int processedFiles = 0;
    OperationState state = OperationState::Active;
    bool canInterrupt = true;
    std::chrono::system_clock::time_point startedAt;
    std::chrono::system_clock::time_point lastUpdate;
    CancellationToken token;
};

/**
 * @brief Handle for continuing an interrupted operation
 */
struct ResumeTicket {
    std::string operationId;
    int resumeFrom = 0;
    CancellationToken token;
};

/**
 * @class InterruptionManager
 * @brief Hands out cancellation tokens and processes interruption requests
 *
 * One worker thread processes queued requests in arrival order. It is woken
 * by requestInterruption() and otherwise polls every pollInterval for
 * requests that waited too long. All public methods are thread-safe; one
 * mutex guards active operations, pending requests and in-progress markers.
 *
 * Interruption is cooperative: requestInterruption() cancels the
 * operation's token at once, and the batch stops before its next item. A
 * forced interruption (timeout, non-graceful request or shutdown) skips the
 * callbacks and never stops a file operation that is already running.
 *
 * Callbacks must not call back into the manager.
 */
class InterruptionManager {
public:
    explicit InterruptionManager(InterruptionConfig config = {}, EventBusPtr bus = nullptr);
    ~InterruptionManager();

    InterruptionManager(const InterruptionManager&) = delete;
    InterruptionManager& operator=(const InterruptionManager&) = delete;

    /// Starts the worker; no-op if it is running
    void start();

    /**
     * @brief Stops the worker and force-interrupts what is left
     *
     * Waits up to gracefulShutdownTimeout for the worker, then
     * force-interrupts the requests it has not started. A callback that is
     * still running is waited for before the worker is joined.
     */
    void shutdown();

    bool isRunning() const;

    /**
     * @brief Adds an operation to the registry
     *
     * Registering an id that is already active returns the existing token.
     */
    CancellationToken registerOperation(const std::string& operationId,
                                        const std::string& operationType, int totalFiles,
                                        bool canInterrupt = true);

    bool updateOperationProgress(const std::string& operationId, int processedFiles);

    /// Marks the operation Completed and removes it from the registry
    bool completeOperation(const std::string& operationId);

    /**
     * @brief Queues an interruption and cancels the operation's token
     *
     * @return false if the request or the operation does not allow
     *         interruption, the operation is unknown, or it already has a
     *         pending request
     */
    bool requestInterruption(InterruptionRequest request);

    bool canInterruptOperation(const std::string& operationId) const;

    std::vector<OperationInfo> getActiveOperations() const;
    std::optional<OperationInfo> getOperationInfo(const std::string& operationId) const;

    /// State of an active or finished operation
    std::optional<OperationState> getOperationState(const std::string& operationId) const;

    std::optional<InterruptionResult> getInterruptionResult(const std::string& operationId) const;

    /**
     * @brief Continues an interrupted operation under a new id
     *
     * The interrupted operation stays Interrupted. The new operation is
     * registered with the remaining file count and an
     * OperationResumeRequestedEvent is published.
     *
     * @param resumeFrom Index to continue from, filesProcessed if omitted
     * @return std::nullopt if the operation was not interrupted or has
     *         nothing left to do
     */
    std::optional<ResumeTicket> resumeOperation(const std::string& operationId,
                                                std::optional<int> resumeFrom = std::nullopt);

    /**
     * @brief Drops active operations idle for longer than @p maxAge and
     *        finished records older than @p maxAge
     * @return Number of entries removed
     */
    int cleanupOldOperations(std::chrono::milliseconds maxAge);

private:
    struct PendingRequest {
        InterruptionRequest request;
        std::chrono::steady_clock::time_point queuedAt;
    };

    struct FinishedRecord {
        OperationState state;
        std::chrono::system_clock::time_point finishedAt;
        std::optional<InterruptionResult> result;
    };

    void workerLoop();
    bool hasUnstartedRequests() const;
    void processGracefully(const InterruptionRequest& request);
    void forceInterrupt(const InterruptionRequest& request, const std::string& why);
    InterruptionResult finishInterruption(const InterruptionRequest& request, bool graceful,
                                          bool cleanupOk, std::optional<std::string> error,
                                          std::chrono::milliseconds cleanupTime);

    template <typename Event>
    void publish(const Event& event) const {
        if (m_bus)
            m_bus->publish(event);
    }

    InterruptionConfig m_config;
    EventBusPtr m_bus;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::map<std::string, OperationInfo> m_active;
    std::map<std::string, PendingRequest> m_pending;
    std::set<std::string> m_inProgress;
    std::map<std::string, FinishedRecord> m_finished;
    int m_resumeCounter = 0;

    bool m_running = false;
    bool m_stopping = false;
    std::thread m_worker;
    std::future<void> m_workerExit;
};

#endif // INTERRUPTIONMANAGER_HPP
