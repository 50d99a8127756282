/**
 * @file filecommands.hpp
 * @brief Undoable file commands built on OperationExecutor
 */

#ifndef FILECOMMANDS_HPP
#define FILECOMMANDS_HPP

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "fileoperation.hpp"
#include "operationexecutor.hpp"

/**
 * @brief What undo() did
 */
enum class UndoOutcome {
    RestoredFromBackup, ///< effect reversed and the overwritten file restored
    ReversedInverse,    ///< effect reversed by the inverse operation
    Unsupported,        ///< command cannot be undone, nothing changed
    Failed              ///< undo was attempted and failed
};

/**
 * @brief How an operation type can be reversed
 */
enum class Reversibility {
    Inverse,   ///< the inverse operation restores the previous state
    BackupOnly ///< only reversible when a backup of the target was taken
};

Reversibility reversibilityOf(OperationType type);

std::string toString(UndoOutcome outcome);

inline bool undoSucceeded(UndoOutcome outcome) {
    return outcome == UndoOutcome::RestoredFromBackup || outcome == UndoOutcome::ReversedInverse;
}

class IFileCommand {
public:
    virtual ~IFileCommand() = default;

    virtual bool execute() = 0;
    virtual UndoOutcome undo() = 0;
    virtual bool redo() = 0;
    virtual bool canUndo() const = 0;
    virtual std::string description() const = 0;
};

/**
 * @brief One OperationPlan as a command
 *
 * Remembers the OperationResult of its last execution, so undo works on the
 * target actually written and redo writes to that same target again.
 */
class FileOperationCommand : public IFileCommand {
public:
    FileOperationCommand(const OperationExecutor& executor, OperationPlan plan);

    bool execute() override;
    UndoOutcome undo() override;
    bool redo() override;
    bool canUndo() const override;
    std::string description() const override;

    /**
     * @brief Records a result produced outside execute()
     *
     * Used when the plan already ran as part of
     * OperationExecutor::executeBatch(); the command can then be undone
     * like one that was executed directly.
     */
    void adopt(OperationResult result);

    const std::optional<OperationResult>& result() const { return m_result; }
    const OperationPlan& plan() const { return m_plan; }

private:
    const OperationExecutor& m_executor;
    OperationPlan m_plan;
    std::optional<OperationResult> m_result;
    bool m_applied = false;
};

/**
 * @brief Group of commands executed in order and undone in reverse order
 *
 * Failures of single children do not stop the batch in either direction.
 */
class BatchCommand : public IFileCommand {
public:
    explicit BatchCommand(std::string name);

    void add(std::unique_ptr<IFileCommand> command);

    /// Adds a child that has already been applied
    void addApplied(std::unique_ptr<IFileCommand> command);

    /// @return true if at least one child succeeded, see lastFailures()
    bool execute() override;

    /// @return ReversedInverse if every applied child was undone, Failed otherwise
    UndoOutcome undo() override;

    /// Re-applies the children undone by the last undo()
    bool redo() override;
    bool canUndo() const override;
    std::string description() const override;

    std::size_t size() const { return m_commands.size(); }
    int lastFailures() const { return m_lastFailures; }
    int lastUndoCount() const { return m_lastUndoCount; }
    int lastUndoTotal() const { return m_lastUndoTotal; }

private:
    std::string m_name;
    std::vector<std::unique_ptr<IFileCommand>> m_commands;
    std::vector<bool> m_applied;
    std::vector<bool> m_undone;
    int m_lastFailures = 0;
    int m_lastUndoCount = 0;
    int m_lastUndoTotal = 0;
};

#endif // FILECOMMANDS_HPP
