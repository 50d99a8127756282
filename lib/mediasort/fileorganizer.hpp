/**
 * @file fileorganizer.hpp
 * @brief Planning, execution and undo history behind one object
 */

#ifndef FILEORGANIZER_HPP
#define FILEORGANIZER_HPP

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "commandinvoker.hpp"
#include "eventbus.hpp"
#include "interruptionmanager.hpp"
#include "metadataparser.hpp"
#include "namingstrategy.hpp"
#include "operationexecutor.hpp"
#include "operationplanner.hpp"
#include "organizerconfig.hpp"

struct OrganizeRequest {
    std::filesystem::path sourceDir;
    std::filesystem::path destRoot;
    OperationType operationType = OperationType::Copy;
    ConflictResolution resolution = ConflictResolution::Rename;
};

struct OrganizeReport {
    std::string operationId;
    std::vector<OperationPlan> plans;
    BatchResult batch;
    int startIndex = 0;
};

/**
 * @class FileOrganizer
 * @brief Organizes a media folder into a library
 *
 * Every executed batch is recorded as one BatchCommand, so undoLast()
 * reverts a whole run. When an InterruptionManager is given, each run is
 * registered with it and stops at the next item once interrupted.
 */
class FileOrganizer {
public:
    using ProgressCallback = OperationExecutor::ProgressCallback;

    /**
     * @throws ValidationError if config.namingStrategy is unknown
     */
    FileOrganizer(const OrganizerConfig& config, EventBusPtr bus = nullptr,
                  InterruptionManager* interruptions = nullptr);

    FileOrganizer(const FileOrganizer&) = delete;
    FileOrganizer& operator=(const FileOrganizer&) = delete;

    std::vector<OperationPlan> plan(const OrganizeRequest& request) const;
    SimulationReport simulate(const OrganizeRequest& request) const;

    /// plan() followed by executePlans()
    OrganizeReport organize(const OrganizeRequest& request);

    /**
     * @brief Executes @p plans as operation @p operationId
     *
     * Publishes a FileProcessingProgressEvent per item.
     */
    OrganizeReport executePlans(const std::vector<OperationPlan>& plans,
                                const std::string& operationId);

    /**
     * @brief Continues an interrupted run from ticket.resumeFrom
     */
    OrganizeReport resume(const ResumeTicket& ticket, const std::vector<OperationPlan>& plans);

    UndoOutcome undoLast();
    bool redoLast();
    bool canUndo() const { return m_invoker.canUndo(); }
    bool canRedo() const { return m_invoker.canRedo(); }
    std::vector<std::string> history() const { return m_invoker.undoHistory(); }

    void setProgressCallback(ProgressCallback callback) { m_onProgress = std::move(callback); }

    const NamingStrategy& strategy() const { return *m_strategy; }
    const OperationPlanner& planner() const { return m_planner; }

    static std::string newOperationId();

private:
    OrganizeReport run(const std::vector<OperationPlan>& plans, const std::string& operationId,
                       int startIndex, CancellationToken token);
    void recordUndo(const std::vector<OperationPlan>& plans, int startIndex,
                    const BatchResult& batch, const std::string& operationId);

    EventBusPtr m_bus;
    InterruptionManager* m_interruptions;
    FilenameMetadataParser m_parser;
    std::unique_ptr<NamingStrategy> m_strategy;
    OperationPlanner m_planner;
    OperationExecutor m_executor;
    CommandInvoker m_invoker;
    ProgressCallback m_onProgress;
};

#endif // FILEORGANIZER_HPP
