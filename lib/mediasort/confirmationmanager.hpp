/**
 * @file confirmationmanager.hpp
 * @brief User confirmation of risky operations
 */

#ifndef CONFIRMATIONMANAGER_HPP
#define CONFIRMATIONMANAGER_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "eventbus.hpp"
#include "safetyevents.hpp"
#include "safetytypes.hpp"

/**
 * @brief Answers confirmation requests, e.g. by asking on the console
 *
 * confirm() runs on its own thread and may block; the manager stops waiting
 * for it once the request times out.
 */
class IConfirmationHandler {
public:
    virtual ~IConfirmationHandler() = default;
    virtual ConfirmationDecision confirm(const ConfirmationRequest& request) = 0;
};

/**
 * @brief Handler backed by a callable
 */
class FunctionConfirmationHandler : public IConfirmationHandler {
public:
    using Callback = std::function<ConfirmationDecision(const ConfirmationRequest&)>;

    explicit FunctionConfirmationHandler(Callback callback) : m_callback(std::move(callback)) {}

    ConfirmationDecision confirm(const ConfirmationRequest& request) override {
        return m_callback ? m_callback(request) : ConfirmationDecision::Cancel;
    }

private:
    Callback m_callback;
};

using AutoConfirmRules = std::map<SafetyOperation, std::set<RiskLevel>>;

struct ConfirmationConfig {
    std::chrono::milliseconds defaultTimeout{30000};
    int batchWarningThreshold = 50;
    int batchMaxFiles = 200;
    AutoConfirmRules autoConfirmRules = defaultRules();

    /// move, rename: low; copy: low and medium; delete, batch: never
    static AutoConfirmRules defaultRules() {
        return {
            {SafetyOperation::Move, {RiskLevel::Low}},
            {SafetyOperation::Copy, {RiskLevel::Low, RiskLevel::Medium}},
            {SafetyOperation::Delete, {}},
            {SafetyOperation::Rename, {RiskLevel::Low}},
            {SafetyOperation::Batch, {}},
        };
    }
};

/**
 * @class ConfirmationManager
 * @brief Tracks pending confirmation requests and collects their answers
 *
 * requestConfirmation() blocks until the request is answered by the handler,
 * by processUserResponse() from another thread, by cancelConfirmation(), or
 * until its timeout expires. On timeout the request is confirmed only if
 * autoConfirmOnTimeout is set, otherwise the decision is Timeout.
 */
class ConfirmationManager {
public:
    explicit ConfirmationManager(ConfirmationConfig config = {}, EventBusPtr bus = nullptr);

    void setHandler(std::shared_ptr<IConfirmationHandler> handler);

    /**
     * @brief Asks for confirmation of @p request
     *
     * Requests with requiresConfirmation == false are answered at once from
     * the auto-confirm rules using @p risk. Otherwise the request is added to
     * the pending list and ConfirmationRequiredEvent is published. A
     * ConfirmationResponseEvent is published for every answer.
     */
    ConfirmationResponse requestConfirmation(ConfirmationRequest request,
                                             RiskLevel risk = RiskLevel::Medium);

    /**
     * @brief Answers a pending request
     * @return false if @p id is not pending
     */
    bool processUserResponse(const std::string& id, ConfirmationDecision decision,
                             std::optional<std::string> comment = std::nullopt);

    /// Answers a pending request with Cancel
    bool cancelConfirmation(const std::string& id);

    std::vector<ConfirmationRequest> getPendingConfirmations() const;

    bool shouldAutoConfirm(SafetyOperation operation, RiskLevel risk) const;

    /**
     * @brief Decides from the auto-confirm rules alone and publishes the
     *        resulting response
     */
    bool autoConfirmOperation(SafetyOperation operation,
                              const std::vector<std::filesystem::path>& files, RiskLevel risk);

    /**
     * @brief Publishes a BatchOperationWarningEvent
     *
     * Batches above batchWarningThreshold files are Medium risk; batches above
     * batchMaxFiles cannot proceed without confirmation.
     */
    BatchOperationWarningEvent createBatchWarning(SafetyOperation operation, int totalFiles,
                                                  std::uintmax_t totalSizeBytes = 0,
                                                  double estimatedSeconds = 0.0);

    /**
     * @brief Cancels pending requests older than @p maxAge
     * @return Number of requests cancelled
     */
    int cleanupExpired(std::chrono::milliseconds maxAge);

    const ConfirmationConfig& config() const { return m_config; }

private:
    struct Pending;

    ConfirmationResponse respond(const ConfirmationRequest& request, ConfirmationDecision decision,
                                 std::optional<std::string> comment, bool automatic);

    template <typename Event>
    void publish(const Event& event) const {
        if (m_bus)
            m_bus->publish(event);
    }

    ConfirmationConfig m_config;
    EventBusPtr m_bus;

    mutable std::mutex m_mutex;
    std::shared_ptr<IConfirmationHandler> m_handler;
    std::map<std::string, std::shared_ptr<Pending>> m_pending;
};

#endif // CONFIRMATIONMANAGER_HPP
