/**
 * @file fileorganizer.cpp
 */

#include "fileorganizer.hpp"

#include <algorithm>

#include "filecommands.hpp"
#include "logging.hpp"
#include "safetyevents.hpp"
#include "utils.hpp"

FileOrganizer::FileOrganizer(const OrganizerConfig& config, EventBusPtr bus,
                             InterruptionManager* interruptions)
    : m_bus(std::move(bus)),
      m_interruptions(interruptions),
      m_strategy(NamingStrategyFactory::create(config.namingStrategy, config.naming)),
      m_planner(m_parser, config.planner),
      m_executor(*m_strategy, config.executor),
      m_invoker(config.maxHistorySize) {}

std::string FileOrganizer::newOperationId() {
    return "organize_" + timestampString() + "_" + randomHex(6);
}

std::vector<OperationPlan> FileOrganizer::plan(const OrganizeRequest& request) const {
    return m_planner.scanAndPlan(request.sourceDir, request.destRoot, *m_strategy,
                                 request.operationType, request.resolution);
}

SimulationReport FileOrganizer::simulate(const OrganizeRequest& request) const {
    return m_executor.simulate(plan(request));
}

OrganizeReport FileOrganizer::organize(const OrganizeRequest& request) {
    return executePlans(plan(request), newOperationId());
}

OrganizeReport FileOrganizer::executePlans(const std::vector<OperationPlan>& plans,
                                           const std::string& operationId) {
    CancellationToken token;
    if (m_interruptions) {
        token = m_interruptions->registerOperation(operationId, "organize",
                                                   static_cast<int>(plans.size()));
    }
    return run(plans, operationId, 0, token);
}

OrganizeReport FileOrganizer::resume(const ResumeTicket& ticket,
                                     const std::vector<OperationPlan>& plans) {
    return run(plans, ticket.operationId, ticket.resumeFrom, ticket.token);
}

OrganizeReport FileOrganizer::run(const std::vector<OperationPlan>& plans,
                                  const std::string& operationId, int startIndex,
                                  CancellationToken token) {
    OrganizeReport report;
    report.operationId = operationId;
    report.plans = plans;
    report.startIndex = std::max(0, std::min(startIndex, static_cast<int>(plans.size())));

    const std::vector<OperationPlan> remaining(plans.begin() + report.startIndex, plans.end());
    MEDIASORT_LOG_INFO("Operation {}: executing {} of {} plans", operationId, remaining.size(),
                       plans.size());

    auto onProgress = [&](const BatchProgress& progress) {
        if (m_interruptions)
            m_interruptions->updateOperationProgress(operationId, progress.current);
        if (m_bus)
            m_bus->publish(FileProcessingProgressEvent{operationId, progress});
        if (m_onProgress)
            m_onProgress(progress);
    };

    report.batch = m_executor.executeBatch(remaining, onProgress, &token);

    if (m_interruptions && !report.batch.cancelled)
        m_interruptions->completeOperation(operationId);

    recordUndo(plans, report.startIndex, report.batch, operationId);
    return report;
}

void FileOrganizer::recordUndo(const std::vector<OperationPlan>& plans, int startIndex,
                               const BatchResult& batch, const std::string& operationId) {
    auto command = std::make_unique<BatchCommand>(operationId);
    for (std::size_t i = 0; i < batch.results.size(); ++i) {
        const OperationResult& result = batch.results[i];
        if (!result.success || result.skipped)
            continue;

        auto single = std::make_unique<FileOperationCommand>(
            m_executor, plans[static_cast<std::size_t>(startIndex) + i]);
        single->adopt(result);
        command->addApplied(std::move(single));
    }

    if (command->size() > 0)
        m_invoker.record(std::move(command));
}

UndoOutcome FileOrganizer::undoLast() {
    return m_invoker.undo();
}

bool FileOrganizer::redoLast() {
    return m_invoker.redo();
}
