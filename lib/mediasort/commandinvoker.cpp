/**
 * @file commandinvoker.cpp
 * @brief Bounded undo and redo history of file commands
 */

#include "commandinvoker.hpp"

#include "logging.hpp"

CommandInvoker::CommandInvoker(std::size_t maxHistorySize)
    : m_maxHistorySize(maxHistorySize == 0 ? 1 : maxHistorySize) {}

bool CommandInvoker::execute(std::unique_ptr<IFileCommand> command) {
    if (!command)
        return false;

    if (!command->execute()) {
        MEDIASORT_LOG_WARN("Command failed, not recorded: {}", command->description());
        return false;
    }

    push(std::move(command));
    return true;
}

void CommandInvoker::record(std::unique_ptr<IFileCommand> command) {
    if (command)
        push(std::move(command));
}

void CommandInvoker::push(std::unique_ptr<IFileCommand> command) {
    m_history.erase(m_history.begin() + static_cast<std::ptrdiff_t>(m_cursor), m_history.end());
    m_history.push_back(std::move(command));
    m_cursor = m_history.size();

    while (m_history.size() > m_maxHistorySize) {
        m_history.erase(m_history.begin());
        --m_cursor;
    }
}

UndoOutcome CommandInvoker::undo() {
    if (m_cursor == 0)
        return UndoOutcome::Unsupported;

    auto& command = m_history[m_cursor - 1];
    if (!command->canUndo())
        return UndoOutcome::Unsupported;

    UndoOutcome outcome = command->undo();
    if (undoSucceeded(outcome))
        --m_cursor;
    return outcome;
}

bool CommandInvoker::redo() {
    if (m_cursor >= m_history.size())
        return false;

    if (!m_history[m_cursor]->redo()) {
        MEDIASORT_LOG_WARN("Redo failed: {}", m_history[m_cursor]->description());
        return false;
    }
    ++m_cursor;
    return true;
}

bool CommandInvoker::canUndo() const {
    return m_cursor > 0 && m_history[m_cursor - 1]->canUndo();
}

bool CommandInvoker::canRedo() const {
    return m_cursor < m_history.size();
}

std::vector<std::string> CommandInvoker::undoHistory() const {
    std::vector<std::string> out;
    for (std::size_t i = 0; i < m_cursor; ++i)
        out.push_back(m_history[i]->description());
    return out;
}

std::vector<std::string> CommandInvoker::redoHistory() const {
    std::vector<std::string> out;
    for (std::size_t i = m_cursor; i < m_history.size(); ++i)
        out.push_back(m_history[i]->description());
    return out;
}

void CommandInvoker::clear() {
    m_history.clear();
    m_cursor = 0;
}
