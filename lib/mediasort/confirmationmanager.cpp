/**
 * @file confirmationmanager.cpp
 */

#include "confirmationmanager.hpp"

#include <exception>
#include <future>
#include <thread>

#include <spdlog/fmt/fmt.h>

#include "logging.hpp"
#include "utils.hpp"

/**
 * @brief One outstanding request, shared with the handler thread
 *
 * The first resolve() wins; later answers are ignored.
 */
struct ConfirmationManager::Pending {
    explicit Pending(ConfirmationRequest r)
        : request(std::move(r)), answer(promise.get_future()) {}

    bool resolve(ConfirmationDecision decision, std::optional<std::string> note) {
        std::lock_guard<std::mutex> lock(mutex);
        if (resolved)
            return false;
        resolved = true;
        comment = std::move(note);
        promise.set_value(decision);
        return true;
    }

    std::optional<std::string> takeComment() {
        std::lock_guard<std::mutex> lock(mutex);
        return comment;
    }

    ConfirmationRequest request;
    std::mutex mutex;
    bool resolved = false;
    std::optional<std::string> comment;
    std::promise<ConfirmationDecision> promise;
    std::future<ConfirmationDecision> answer;
};

ConfirmationManager::ConfirmationManager(ConfirmationConfig config, EventBusPtr bus)
    : m_config(std::move(config)), m_bus(std::move(bus)) {}

void ConfirmationManager::setHandler(std::shared_ptr<IConfirmationHandler> handler) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_handler = std::move(handler);
}

bool ConfirmationManager::shouldAutoConfirm(SafetyOperation operation, RiskLevel risk) const {
    auto it = m_config.autoConfirmRules.find(operation);
    if (it == m_config.autoConfirmRules.end())
        return false;
    return it->second.count(risk) > 0;
}

ConfirmationResponse ConfirmationManager::requestConfirmation(ConfirmationRequest request,
                                                              RiskLevel risk) {
    if (request.id.empty())
        request.id = "confirm_" + randomHex(8);

    if (!request.requiresConfirmation) {
        const bool confirmed = shouldAutoConfirm(request.operationType, risk);
        return respond(request,
                       confirmed ? ConfirmationDecision::Confirm : ConfirmationDecision::Cancel,
                       std::nullopt, true);
    }

    auto pending = std::make_shared<Pending>(request);
    std::shared_ptr<IConfirmationHandler> handler;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_pending[request.id] = pending;
        handler = m_handler;
    }

    MEDIASORT_LOG_INFO("Confirmation required: {} ({} files)", request.title,
                       request.affectedFiles.size());
    publish(ConfirmationRequiredEvent{request});

    if (handler) {
        std::thread([pending, handler] {
            ConfirmationDecision decision = ConfirmationDecision::Cancel;
            try {
                decision = handler->confirm(pending->request);
            } catch (const std::exception& e) {
                MEDIASORT_LOG_ERROR("Confirmation handler failed for {}: {}", pending->request.id,
                                    e.what());
            }
            pending->resolve(decision, std::nullopt);
        }).detach();
    }

    const auto timeout = request.timeout.value_or(m_config.defaultTimeout);
    bool automatic = false;
    if (pending->answer.wait_for(timeout) != std::future_status::ready) {
        const auto onTimeout = request.autoConfirmOnTimeout ? ConfirmationDecision::Confirm
                                                            : ConfirmationDecision::Timeout;
        automatic = pending->resolve(onTimeout, std::string("No answer within timeout"));
        if (automatic)
            MEDIASORT_LOG_WARN("Confirmation {} timed out after {} ms", request.id, timeout.count());
    }
    const ConfirmationDecision decision = pending->answer.get();

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_pending.erase(request.id);
    }
    return respond(request, decision, pending->takeComment(), automatic);
}

ConfirmationResponse ConfirmationManager::respond(const ConfirmationRequest& request,
                                                  ConfirmationDecision decision,
                                                  std::optional<std::string> comment,
                                                  bool automatic) {
    ConfirmationResponse response;
    response.id = request.id;
    response.decision = decision;
    response.comment = std::move(comment);
    response.wasAutoResponse = automatic;
    response.responseTime = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now() - request.createdAt);

    MEDIASORT_LOG_INFO("Confirmation {} for {}: {}{}", request.id,
                       toString(request.operationType),
                       decision == ConfirmationDecision::Confirm   ? "confirmed"
                       : decision == ConfirmationDecision::Cancel ? "cancelled"
                                                                   : "timed out",
                       automatic ? " (automatic)" : "");
    publish(ConfirmationResponseEvent{response});
    return response;
}

bool ConfirmationManager::processUserResponse(const std::string& id, ConfirmationDecision decision,
                                              std::optional<std::string> comment) {
    std::shared_ptr<Pending> pending;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_pending.find(id);
        if (it == m_pending.end())
            return false;
        pending = it->second;
    }
    return pending->resolve(decision, std::move(comment));
}

bool ConfirmationManager::cancelConfirmation(const std::string& id) {
    return processUserResponse(id, ConfirmationDecision::Cancel, std::string("Cancelled"));
}

std::vector<ConfirmationRequest> ConfirmationManager::getPendingConfirmations() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<ConfirmationRequest> out;
    out.reserve(m_pending.size());
    for (const auto& entry : m_pending)
        out.push_back(entry.second->request);
    return out;
}

bool ConfirmationManager::autoConfirmOperation(SafetyOperation operation,
                                               const std::vector<std::filesystem::path>& files,
                                               RiskLevel risk) {
    ConfirmationRequest request;
    request.title = "Automatic confirmation: " + toString(operation);
    request.message = fmt::format("{} operation on {} files", toString(operation), files.size());
    request.details = "Risk: " + toString(risk);
    request.operationType = operation;
    request.affectedFiles = files;
    request.requiresConfirmation = false;
    request.severity = ConfirmationSeverity::Info;

    return requestConfirmation(std::move(request), risk).decision == ConfirmationDecision::Confirm;
}

BatchOperationWarningEvent ConfirmationManager::createBatchWarning(SafetyOperation operation,
                                                                   int totalFiles,
                                                                   std::uintmax_t totalSizeBytes,
                                                                   double estimatedSeconds) {
    BatchOperationWarningEvent warning;
    warning.operationType = operation;
    warning.fileCount = totalFiles;
    warning.totalSizeBytes = totalSizeBytes;
    warning.riskLevel = totalFiles > m_config.batchWarningThreshold ? RiskLevel::Medium : RiskLevel::Low;
    warning.canProceed = totalFiles <= m_config.batchMaxFiles;
    warning.message = fmt::format("{} operation on {} files ({})", toString(operation), totalFiles,
                                  formatBytes(static_cast<long long>(totalSizeBytes)));
    if (estimatedSeconds > 60.0)
        warning.message += fmt::format(", estimated {:.1f} min", estimatedSeconds / 60.0);

    MEDIASORT_LOG_WARN("Batch warning: {}", warning.message);
    publish(warning);
    return warning;
}

int ConfirmationManager::cleanupExpired(std::chrono::milliseconds maxAge) {
    const auto cutoff = std::chrono::system_clock::now() - maxAge;
    std::vector<std::string> expired;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& entry : m_pending) {
            if (entry.second->request.createdAt < cutoff)
                expired.push_back(entry.first);
        }
    }

    int cancelled = 0;
    for (const auto& id : expired) {
        if (cancelConfirmation(id))
            ++cancelled;
    }
    return cancelled;
}
