/**
 * @file filecommands.cpp
 * @brief Undoable commands over executed operation plans
 */

#include "filecommands.hpp"

#include <filesystem>
#include <system_error>

#include "logging.hpp"

namespace fs = std::filesystem;

Reversibility reversibilityOf(OperationType type) {
    switch (type) {
        case OperationType::Copy:
        case OperationType::Move:
            return Reversibility::Inverse;
        case OperationType::Rename:
            return Reversibility::BackupOnly;
    }
    return Reversibility::BackupOnly;
}

std::string toString(UndoOutcome outcome) {
    switch (outcome) {
        case UndoOutcome::RestoredFromBackup: return "restored from backup";
        case UndoOutcome::ReversedInverse:    return "reversed";
        case UndoOutcome::Unsupported:        return "unsupported";
        case UndoOutcome::Failed:             return "failed";
    }
    return "unknown";
}

FileOperationCommand::FileOperationCommand(const OperationExecutor& executor, OperationPlan plan)
    : m_executor(executor), m_plan(std::move(plan)) {}

bool FileOperationCommand::execute() {
    m_result = m_executor.execute(m_plan);
    m_applied = m_result->success && !m_result->skipped;
    return m_result->success;
}

void FileOperationCommand::adopt(OperationResult result) {
    m_result = std::move(result);
    m_applied = m_result->success && !m_result->skipped;
}

bool FileOperationCommand::canUndo() const {
    if (!m_applied || !m_result)
        return false;
    if (reversibilityOf(m_plan.operationType) == Reversibility::Inverse)
        return true;
    return m_result->backupPath.has_value();
}

UndoOutcome FileOperationCommand::undo() {
    if (!canUndo()) {
        MEDIASORT_LOG_WARN("Undo not supported for {}", description());
        return UndoOutcome::Unsupported;
    }

    const fs::path& target = m_result->targetPath;
    const fs::path& source = m_plan.sourcePath;

    try {
        if (m_plan.operationType == OperationType::Copy) {
            fs::remove(target);
        } else {
            if (source.has_parent_path())
                fs::create_directories(source.parent_path());
            moveFile(target, source);
        }

        UndoOutcome outcome = UndoOutcome::ReversedInverse;
        if (m_result->backupPath) {
            moveFile(*m_result->backupPath, target);
            outcome = UndoOutcome::RestoredFromBackup;
        }

        m_applied = false;
        MEDIASORT_LOG_INFO("Undone ({}): {}", toString(outcome), description());
        return outcome;
    } catch (const fs::filesystem_error& e) {
        MEDIASORT_LOG_ERROR("Undo of {} failed: {}", description(), e.what());
        return UndoOutcome::Failed;
    }
}

bool FileOperationCommand::redo() {
    if (m_applied || !m_result)
        return false;

    // Same target as the first run, not a freshly generated one
    OperationPlan again = m_plan;
    again.targetPath = m_result->targetPath;
    m_result = m_executor.execute(again);
    m_applied = m_result->success && !m_result->skipped;
    return m_result->success;
}

std::string FileOperationCommand::description() const {
    const fs::path& target = m_result ? m_result->targetPath : m_plan.targetPath;
    return toString(m_plan.operationType) + " " + m_plan.sourcePath.filename().string() +
           " -> " + target.string();
}

BatchCommand::BatchCommand(std::string name) : m_name(std::move(name)) {}

void BatchCommand::add(std::unique_ptr<IFileCommand> command) {
    m_commands.push_back(std::move(command));
}

void BatchCommand::addApplied(std::unique_ptr<IFileCommand> command) {
    m_applied.resize(m_commands.size(), false);
    m_undone.resize(m_commands.size(), false);
    m_commands.push_back(std::move(command));
    m_applied.push_back(true);
    m_undone.push_back(false);
}

bool BatchCommand::execute() {
    m_applied.assign(m_commands.size(), false);
    m_undone.assign(m_commands.size(), false);
    m_lastFailures = 0;
    bool any = false;
    for (std::size_t i = 0; i < m_commands.size(); ++i) {
        m_applied[i] = m_commands[i]->execute();
        if (m_applied[i])
            any = true;
        else
            ++m_lastFailures;
    }
    return any;
}

UndoOutcome BatchCommand::undo() {
    m_lastUndoCount = 0;
    m_lastUndoTotal = 0;

    for (std::size_t i = m_commands.size(); i-- > 0;) {
        if (i >= m_applied.size() || !m_applied[i] || !m_commands[i]->canUndo())
            continue;
        ++m_lastUndoTotal;
        if (undoSucceeded(m_commands[i]->undo())) {
            m_applied[i] = false;
            m_undone[i] = true;
            ++m_lastUndoCount;
        }
    }

    MEDIASORT_LOG_INFO("Batch '{}' undone: {}/{} operations", m_name, m_lastUndoCount,
                       m_lastUndoTotal);
    if (m_lastUndoTotal == 0)
        return UndoOutcome::Unsupported;
    return m_lastUndoCount == m_lastUndoTotal ? UndoOutcome::ReversedInverse : UndoOutcome::Failed;
}

bool BatchCommand::redo() {
    m_applied.resize(m_commands.size(), false);
    m_undone.resize(m_commands.size(), false);
    bool all = true;
    for (std::size_t i = 0; i < m_commands.size(); ++i) {
        if (!m_undone[i])
            continue;
        m_applied[i] = m_commands[i]->redo();
        m_undone[i] = !m_applied[i];
        all = all && m_applied[i];
    }
    return all;
}

bool BatchCommand::canUndo() const {
    for (std::size_t i = 0; i < m_commands.size() && i < m_applied.size(); ++i) {
        if (m_applied[i] && m_commands[i]->canUndo())
            return true;
    }
    return false;
}

std::string BatchCommand::description() const {
    return m_name + " (" + std::to_string(m_commands.size()) + " operations)";
}
