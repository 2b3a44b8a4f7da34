#include "desktodo/core/UndoStack.hpp"

#include "desktodo/core/Logging.hpp"
#include "desktodo/core/UndoCommand.hpp"

namespace desktodo {
namespace core {

UndoStack::UndoStack(std::size_t limit)
    : m_limit(limit > 0 ? limit : 1)
{
    m_commands.reserve(m_limit);
}

UndoStack::~UndoStack() = default;

void UndoStack::push(std::unique_ptr<UndoCommand> command)
{
    if (!command) {
        return;
    }
    // Pushing discards everything that could still be redone.
    if (m_index < m_commands.size()) {
        m_commands.erase(m_commands.begin() + static_cast<long>(m_index), m_commands.end());
    }

    if (m_commands.size() == m_limit) {
        m_commands.erase(m_commands.begin());
        if (m_index > 0) {
            --m_index;
        }
    }

    command->redo();
    qCDebug(lcCore) << "Executed" << command->text();
    m_commands.push_back(std::move(command));
    m_index = m_commands.size();
}

bool UndoStack::canUndo() const
{
    return m_index > 0;
}

bool UndoStack::canRedo() const
{
    return m_index < m_commands.size();
}

QString UndoStack::undoText() const
{
    if (!canUndo()) {
        return {};
    }
    return m_commands[m_index - 1]->text();
}

QString UndoStack::redoText() const
{
    if (!canRedo()) {
        return {};
    }
    return m_commands[m_index]->text();
}

bool UndoStack::undo()
{
    if (!canUndo()) {
        return false;
    }
    auto &command = m_commands[m_index - 1];
    command->undo();
    qCDebug(lcCore) << "Undid" << command->text();
    --m_index;
    return true;
}

bool UndoStack::redo()
{
    if (!canRedo()) {
        return false;
    }
    auto &command = m_commands[m_index];
    command->redo();
    qCDebug(lcCore) << "Redid" << command->text();
    ++m_index;
    return true;
}

void UndoStack::clear()
{
    m_commands.clear();
    m_index = 0;
}

std::size_t UndoStack::count() const
{
    return m_commands.size();
}

} // namespace core
} // namespace desktodo
