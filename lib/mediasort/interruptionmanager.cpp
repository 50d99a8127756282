/**
 * @file interruptionmanager.cpp
 * @brief Worker thread and registry bookkeeping of InterruptionManager
 */

#include "interruptionmanager.hpp"

#include <algorithm>
#include <exception>

#include "logging.hpp"
#include "safetyevents.hpp"

std::string toString(OperationState state) {
    switch (state) {
        case OperationState::Active:             return "active";
        case OperationState::InterruptRequested: return "interrupt_requested";
        case OperationState::Interrupting:       return "interrupting";
        case OperationState::Interrupted:        return "interrupted";
        case OperationState::Completed:          return "completed";
    }
    return "unknown";
}

InterruptionManager::InterruptionManager(InterruptionConfig config, EventBusPtr bus)
    : m_config(config), m_bus(std::move(bus)) {}

InterruptionManager::~InterruptionManager() {
    shutdown();
}

void InterruptionManager::start() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_running)
        return;

    m_running = true;
    m_stopping = false;

    std::promise<void> exitSignal;
    m_workerExit = exitSignal.get_future();
    m_worker = std::thread([this, signal = std::move(exitSignal)]() mutable {
        workerLoop();
        signal.set_value();
    });
    MEDIASORT_LOG_INFO("Interruption worker started (poll interval {} ms)",
                       m_config.pollInterval.count());
}

bool InterruptionManager::isRunning() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_running && !m_stopping;
}

void InterruptionManager::shutdown() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running)
            return;
        m_stopping = true;
    }
    m_cv.notify_all();

    if (m_worker.joinable() && m_workerExit.valid() &&
        m_workerExit.wait_for(m_config.gracefulShutdownTimeout) != std::future_status::ready) {
        MEDIASORT_LOG_WARN("Interruption worker did not stop within {} ms, "
                           "waiting for its running callback",
                           m_config.gracefulShutdownTimeout.count());
    }

    std::vector<InterruptionRequest> stragglers;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& [id, pending] : m_pending) {
            if (m_inProgress.count(id) == 0) {
                m_inProgress.insert(id);
                stragglers.push_back(pending.request);
            }
        }
        for (const auto& [id, info] : m_active) {
            if (m_pending.count(id) == 0 && info.canInterrupt) {
                InterruptionRequest request;
                request.operationId = id;
                request.operationType = info.operationType;
                request.reason = InterruptionReason::SystemError;
                m_inProgress.insert(id);
                stragglers.push_back(request);
            }
        }
        m_running = false;
    }

    for (const auto& request : stragglers)
        forceInterrupt(request, "Interrupted by shutdown");

    // The worker captures this; it must be gone before the manager is.
    if (m_worker.joinable())
        m_worker.join();

    MEDIASORT_LOG_INFO("Interruption manager shut down, {} operations force-interrupted",
                       stragglers.size());
}

bool InterruptionManager::hasUnstartedRequests() const {
    for (const auto& entry : m_pending) {
        if (m_inProgress.count(entry.first) == 0)
            return true;
    }
    return false;
}

/**
 * @brief Worker body
 *
 * Takes the oldest unstarted request, decides between graceful and forced
 * handling while holding the lock, then runs it without the lock. A request
 * is forced when it is not graceful, or when it waited longer than its
 * maxWaitTime and forcing after timeout is enabled for it and globally.
 */
void InterruptionManager::workerLoop() {
    std::unique_lock<std::mutex> lock(m_mutex);
    while (!m_stopping) {
        m_cv.wait_for(lock, m_config.pollInterval,
                      [this] { return m_stopping || hasUnstartedRequests(); });

        while (!m_stopping) {
            const PendingRequest* next = nullptr;
            for (const auto& entry : m_pending) {
                if (m_inProgress.count(entry.first) > 0)
                    continue;
                if (!next || entry.second.queuedAt < next->queuedAt)
                    next = &entry.second;
            }
            if (!next)
                break;

            const InterruptionRequest request = next->request;
            const auto waited = std::chrono::steady_clock::now() - next->queuedAt;
            const auto maxWait = request.maxWaitTime.value_or(m_config.defaultMaxWait);
            const bool timedOut = waited > maxWait;
            const bool force = !request.gracefulShutdown ||
                               (timedOut && request.forceInterruptAfterTimeout &&
                                m_config.forceInterruptAfterTimeout);

            m_inProgress.insert(request.operationId);
            auto active = m_active.find(request.operationId);
            if (active != m_active.end())
                active->second.state = OperationState::Interrupting;

            lock.unlock();
            if (force)
                forceInterrupt(request, timedOut ? "Forced after waiting longer than max wait time"
                                                 : "Non-graceful interruption requested");
            else
                processGracefully(request);
            lock.lock();
        }
    }
}

void InterruptionManager::processGracefully(const InterruptionRequest& request) {
    publish(OperationInterruptRequestedEvent{request.operationId, request.operationType,
                                             request.reason});

    const auto started = std::chrono::steady_clock::now();
    bool interruptOk = true;
    bool cleanupOk = true;
    std::optional<std::string> error;

    try {
        if (request.onInterrupt && !request.onInterrupt()) {
            interruptOk = false;
            error = "Interrupt callback reported failure";
        }
    } catch (const std::exception& e) {
        interruptOk = false;
        error = std::string("Interrupt callback threw: ") + e.what();
        MEDIASORT_LOG_ERROR("Interrupt callback of {} threw: {}", request.operationId, e.what());
    }

    try {
        if (request.onCleanup && !request.onCleanup()) {
            cleanupOk = false;
            if (!error)
                error = "Cleanup callback reported failure";
        }
    } catch (const std::exception& e) {
        cleanupOk = false;
        error = std::string("Cleanup callback threw: ") + e.what();
        MEDIASORT_LOG_ERROR("Cleanup callback of {} threw: {}", request.operationId, e.what());
    }

    const auto cleanupTime = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    finishInterruption(request, true, interruptOk && cleanupOk, error, cleanupTime);
}

void InterruptionManager::forceInterrupt(const InterruptionRequest& request, const std::string& why) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto active = m_active.find(request.operationId);
        if (active != m_active.end())
            active->second.token.cancel(true);
    }
    MEDIASORT_LOG_WARN("Force-interrupting {}: {}", request.operationId, why);
    finishInterruption(request, false, false, why, std::chrono::milliseconds(0));
}

InterruptionResult InterruptionManager::finishInterruption(const InterruptionRequest& request,
                                                           bool graceful, bool cleanupOk,
                                                           std::optional<std::string> error,
                                                           std::chrono::milliseconds cleanupTime) {
    InterruptionResult result;
    result.operationId = request.operationId;
    result.operationType = request.operationType;
    result.reason = request.reason;
    result.wasGraceful = graceful;
    result.cleanupSuccessful = cleanupOk;
    result.errorMessage = std::move(error);
    result.cleanupTime = cleanupTime;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto active = m_active.find(request.operationId);
        if (active != m_active.end()) {
            result.filesProcessed = active->second.processedFiles;
            result.filesRemaining = std::max(0, active->second.totalFiles - active->second.processedFiles);
            if (result.operationType.empty())
                result.operationType = active->second.operationType;
            m_active.erase(active);
        }
        result.canResume = result.filesRemaining > 0;

        m_pending.erase(request.operationId);
        m_inProgress.erase(request.operationId);
        m_finished[request.operationId] =
            FinishedRecord{OperationState::Interrupted, std::chrono::system_clock::now(), result};
    }

    MEDIASORT_LOG_INFO("Operation {} interrupted ({}, cleanup {}, {} files remaining)",
                       result.operationId, graceful ? "graceful" : "forced",
                       cleanupOk ? "ok" : "failed", result.filesRemaining);
    publish(OperationInterruptedEvent{result});
    return result;
}

CancellationToken InterruptionManager::registerOperation(const std::string& operationId,
                                                         const std::string& operationType,
                                                         int totalFiles, bool canInterrupt) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto existing = m_active.find(operationId);
    if (existing != m_active.end())
        return existing->second.token;

    OperationInfo info;
    info.operationId = operationId;
    info.operationType = operationType;
    info.totalFiles = totalFiles;
    info.canInterrupt = canInterrupt;
    info.startedAt = std::chrono::system_clock::now();
    info.lastUpdate = info.startedAt;

    m_finished.erase(operationId);
    m_active.emplace(operationId, info);
    MEDIASORT_LOG_DEBUG("Registered operation {} ({}, {} files)", operationId, operationType,
                        totalFiles);
    return info.token;
}

bool InterruptionManager::updateOperationProgress(const std::string& operationId,
                                                  int processedFiles) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_active.find(operationId);
    if (it == m_active.end())
        return false;
    it->second.processedFiles = processedFiles;
    it->second.lastUpdate = std::chrono::system_clock::now();
    return true;
}

bool InterruptionManager::completeOperation(const std::string& operationId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_active.find(operationId);
    if (it == m_active.end() || m_inProgress.count(operationId) > 0)
        return false;

    m_active.erase(it);
    m_pending.erase(operationId);
    m_finished[operationId] =
        FinishedRecord{OperationState::Completed, std::chrono::system_clock::now(), std::nullopt};
    return true;
}

bool InterruptionManager::requestInterruption(InterruptionRequest request) {
    if (!request.canInterrupt) {
        MEDIASORT_LOG_WARN("Interruption of {} rejected, request is not interruptible",
                           request.operationId);
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_active.find(request.operationId);
        if (it == m_active.end()) {
            MEDIASORT_LOG_WARN("Interruption of unknown operation {} rejected", request.operationId);
            return false;
        }
        if (!it->second.canInterrupt || m_pending.count(request.operationId) > 0)
            return false;

        if (request.operationType.empty())
            request.operationType = it->second.operationType;
        it->second.state = OperationState::InterruptRequested;
        it->second.token.cancel();

        const std::string id = request.operationId;
        m_pending[id] = PendingRequest{std::move(request), std::chrono::steady_clock::now()};
    }

    m_cv.notify_one();
    return true;
}

bool InterruptionManager::canInterruptOperation(const std::string& operationId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_active.find(operationId);
    return it != m_active.end() && it->second.canInterrupt &&
           m_pending.count(operationId) == 0;
}

std::vector<OperationInfo> InterruptionManager::getActiveOperations() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<OperationInfo> out;
    for (const auto& entry : m_active)
        out.push_back(entry.second);
    return out;
}

std::optional<OperationInfo> InterruptionManager::getOperationInfo(const std::string& operationId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_active.find(operationId);
    if (it == m_active.end())
        return std::nullopt;
    return it->second;
}

std::optional<OperationState> InterruptionManager::getOperationState(const std::string& operationId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto active = m_active.find(operationId);
    if (active != m_active.end())
        return active->second.state;
    auto finished = m_finished.find(operationId);
    if (finished != m_finished.end())
        return finished->second.state;
    return std::nullopt;
}

std::optional<InterruptionResult>
InterruptionManager::getInterruptionResult(const std::string& operationId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_finished.find(operationId);
    if (it == m_finished.end())
        return std::nullopt;
    return it->second.result;
}

std::optional<ResumeTicket> InterruptionManager::resumeOperation(const std::string& operationId,
                                                                 std::optional<int> resumeFrom) {
    ResumeTicket ticket;
    std::string operationType;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_finished.find(operationId);
        if (it == m_finished.end() || !it->second.result || !it->second.result->canResume)
            return std::nullopt;

        const InterruptionResult& previous = *it->second.result;
        const int total = previous.filesProcessed + previous.filesRemaining;
        ticket.resumeFrom = std::min(resumeFrom.value_or(previous.filesProcessed), total);
        ticket.operationId = operationId + "_resume_" + std::to_string(++m_resumeCounter);
        operationType = previous.operationType;

        OperationInfo info;
        info.operationId = ticket.operationId;
        info.operationType = operationType;
        info.totalFiles = total - ticket.resumeFrom;
        info.startedAt = std::chrono::system_clock::now();
        info.lastUpdate = info.startedAt;
        ticket.token = info.token;
        m_active.emplace(ticket.operationId, info);
    }

    MEDIASORT_LOG_INFO("Resuming {} as {} from item {}", operationId, ticket.operationId,
                       ticket.resumeFrom);
    publish(OperationResumeRequestedEvent{operationId, ticket.operationId, ticket.resumeFrom});
    return ticket;
}

int InterruptionManager::cleanupOldOperations(std::chrono::milliseconds maxAge) {
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto cutoff = std::chrono::system_clock::now() - maxAge;
    int removed = 0;

    for (auto it = m_active.begin(); it != m_active.end();) {
        if (it->second.lastUpdate < cutoff && m_pending.count(it->first) == 0) {
            it = m_active.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }

    for (auto it = m_finished.begin(); it != m_finished.end();) {
        if (it->second.finishedAt < cutoff) {
            it = m_finished.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }

    if (removed > 0)
        MEDIASORT_LOG_INFO("Removed {} stale operation records", removed);
    return removed;
}
