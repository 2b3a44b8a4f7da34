#pragma once

#include <QDateTime>
#include <QList>
#include <QUuid>
#include <utility>
#include <vector>

#include "desktodo/core/UndoCommand.hpp"
#include "desktodo/data/Task.hpp"

namespace desktodo {
namespace data {
class TaskRepository;
}

namespace core {

class AddTaskCommand : public UndoCommand
{
public:
    AddTaskCommand(data::TaskRepository &repository, data::TaskItem task);

    void redo() override;
    void undo() override;
    QString text() const override;

    const data::TaskItem &task() const;

private:
    data::TaskRepository &m_repository;
    data::TaskItem m_task;
    int m_position = -1;
};

class RemoveTasksCommand : public UndoCommand
{
public:
    RemoveTasksCommand(data::TaskRepository &repository, QList<QUuid> ids);

    void redo() override;
    void undo() override;
    QString text() const override;

    int removedCount() const;

private:
    data::TaskRepository &m_repository;
    QList<QUuid> m_ids;
    std::vector<std::pair<int, data::TaskItem>> m_removed;
};

// Flips the completion state of every task independently.
class SetCompletionCommand : public UndoCommand
{
public:
    SetCompletionCommand(data::TaskRepository &repository,
                         QList<QUuid> ids,
                         QDateTime now = QDateTime::currentDateTime());

    void redo() override;
    void undo() override;
    QString text() const override;

private:
    data::TaskRepository &m_repository;
    QList<QUuid> m_ids;
    QDateTime m_now;
    std::vector<data::TaskItem> m_before;
    std::vector<data::TaskItem> m_after;
};

class ClearCompletedCommand : public UndoCommand
{
public:
    explicit ClearCompletedCommand(data::TaskRepository &repository);

    void redo() override;
    void undo() override;
    QString text() const override;

    int removedCount() const;

private:
    data::TaskRepository &m_repository;
    std::vector<std::pair<int, data::TaskItem>> m_removed;
};

// An invalid QDateTime removes the reminder.
class SetReminderCommand : public UndoCommand
{
public:
    SetReminderCommand(data::TaskRepository &repository, const QUuid &id, QDateTime remindAt);

    void redo() override;
    void undo() override;
    QString text() const override;

private:
    data::TaskRepository &m_repository;
    QUuid m_id;
    QDateTime m_remindAt;
    QDateTime m_previous;
};

} // namespace core
} // namespace desktodo
