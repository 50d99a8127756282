#ifndef COMMANDINVOKER_HPP
#define COMMANDINVOKER_HPP

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "filecommands.hpp"

/**
 * @class CommandInvoker
 * @brief Bounded linear undo/redo history
 *
 * History is one sequence with a cursor. Executing a command after an undo
 * discards everything after the cursor. When the history exceeds
 * maxHistorySize the oldest command is dropped and can no longer be undone.
 *
 * Not thread-safe; used from the thread that runs the batch.
 */
class CommandInvoker {
public:
    explicit CommandInvoker(std::size_t maxHistorySize = 100);

    /**
     * @brief Executes @p command and records it if it succeeded
     * @return Result of IFileCommand::execute()
     */
    bool execute(std::unique_ptr<IFileCommand> command);

    /**
     * @brief Adds an already executed command to the history
     */
    void record(std::unique_ptr<IFileCommand> command);

    /**
     * @brief Undoes the command before the cursor
     *
     * The cursor only moves back when the undo succeeded.
     */
    UndoOutcome undo();

    /**
     * @brief Re-applies the command after the cursor
     * @return false if there is nothing to redo or the redo failed
     */
    bool redo();

    bool canUndo() const;
    bool canRedo() const;

    /// Descriptions of the undoable commands, oldest first
    std::vector<std::string> undoHistory() const;
    /// Descriptions of the redoable commands, next redo first
    std::vector<std::string> redoHistory() const;

    void clear();

    std::size_t size() const { return m_history.size(); }
    std::size_t maxHistorySize() const { return m_maxHistorySize; }

private:
    void push(std::unique_ptr<IFileCommand> command);

    std::vector<std::unique_ptr<IFileCommand>> m_history;
    std::size_t m_cursor = 0;
    std::size_t m_maxHistorySize;
};

#endif // COMMANDINVOKER_HPP
