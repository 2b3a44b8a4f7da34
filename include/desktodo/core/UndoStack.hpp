#pragma once

#include <QString>
#include <cstddef>
#include <memory>
#include <vector>

namespace desktodo {
namespace core {

class UndoCommand;

class UndoStack
{
public:
    explicit UndoStack(std::size_t limit = 100);
    ~UndoStack();

    // Runs command->redo() before recording it.
    void push(std::unique_ptr<UndoCommand> command);
    bool canUndo() const;
    bool canRedo() const;
    QString undoText() const;
    QString redoText() const;
    bool undo();
    bool redo();
    void clear();
    std::size_t count() const;

private:
    std::vector<std::unique_ptr<UndoCommand>> m_commands;
    std::size_t m_index = 0;
    std::size_t m_limit = 0;
};

} // namespace core
} // namespace desktodo
