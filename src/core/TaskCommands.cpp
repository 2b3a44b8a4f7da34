#include "desktodo/core/TaskCommands.hpp"

#include <QObject>
#include <algorithm>

#include "desktodo/data/TaskRepository.hpp"

namespace desktodo {
namespace core {

namespace {
void restoreInOrder(data::TaskRepository &repository, std::vector<std::pair<int, data::TaskItem>> &removed)
{
    // Ascending positions so every index is valid once the previous ones are back.
    std::sort(removed.begin(), removed.end(), [](const auto &lhs, const auto &rhs) {
        return lhs.first < rhs.first;
    });
    for (const auto &entry : removed) {
        repository.restoreTask(entry.second, entry.first);
    }
}
} // namespace

AddTaskCommand::AddTaskCommand(data::TaskRepository &repository, data::TaskItem task)
    : m_repository(repository)
    , m_task(std::move(task))
{
}

void AddTaskCommand::redo()
{
    if (m_position < 0) {
        m_task = m_repository.addTask(m_task);
        return;
    }
    m_repository.restoreTask(m_task, m_position);
}

void AddTaskCommand::undo()
{
    m_position = m_repository.positionOf(m_task.id);
    m_repository.removeTask(m_task.id);
}

QString AddTaskCommand::text() const
{
    return QObject::tr("Aufgabe hinzufügen: %1").arg(m_task.title);
}

const data::TaskItem &AddTaskCommand::task() const
{
    return m_task;
}

RemoveTasksCommand::RemoveTasksCommand(data::TaskRepository &repository, QList<QUuid> ids)
    : m_repository(repository)
    , m_ids(std::move(ids))
{
}

void RemoveTasksCommand::redo()
{
    m_removed.clear();
    for (const auto &id : qAsConst(m_ids)) {
        const int position = m_repository.positionOf(id);
        auto task = m_repository.findById(id);
        if (!task.has_value() || position < 0) {
            continue;
        }
        m_removed.emplace_back(position, *task);
    }
    // Positions were taken before any removal, so undo can reinsert them as-is.
    for (const auto &entry : m_removed) {
        m_repository.removeTask(entry.second.id);
    }
}

void RemoveTasksCommand::undo()
{
    restoreInOrder(m_repository, m_removed);
}

QString RemoveTasksCommand::text() const
{
    return QObject::tr("%1 Aufgabe(n) löschen").arg(m_ids.size());
}

int RemoveTasksCommand::removedCount() const
{
    return static_cast<int>(m_removed.size());
}

SetCompletionCommand::SetCompletionCommand(data::TaskRepository &repository, QList<QUuid> ids, QDateTime now)
    : m_repository(repository)
    , m_ids(std::move(ids))
    , m_now(std::move(now))
{
}

void SetCompletionCommand::redo()
{
    if (m_after.empty()) {
        for (const auto &id : qAsConst(m_ids)) {
            auto task = m_repository.findById(id);
            if (!task.has_value()) {
                continue;
            }
            m_before.push_back(*task);
            data::toggleCompleted(*task, m_now);
            m_after.push_back(*task);
        }
    }
    for (const auto &task : m_after) {
        m_repository.updateTask(task);
    }
}

void SetCompletionCommand::undo()
{
    for (const auto &task : m_before) {
        m_repository.updateTask(task);
    }
}

QString SetCompletionCommand::text() const
{
    return QObject::tr("Erledigt-Status von %1 Aufgabe(n) ändern").arg(m_ids.size());
}

ClearCompletedCommand::ClearCompletedCommand(data::TaskRepository &repository)
    : m_repository(repository)
{
}

void ClearCompletedCommand::redo()
{
    m_removed.clear();
    const auto tasks = m_repository.fetchTasks();
    for (std::size_t i = 0; i < tasks.size(); ++i) {
        if (tasks[i].completed) {
            m_removed.emplace_back(static_cast<int>(i), tasks[i]);
        }
    }
    if (!m_removed.empty()) {
        m_repository.removeCompleted();
    }
}

void ClearCompletedCommand::undo()
{
    restoreInOrder(m_repository, m_removed);
}

QString ClearCompletedCommand::text() const
{
    return QObject::tr("Erledigte Aufgaben entfernen");
}

int ClearCompletedCommand::removedCount() const
{
    return static_cast<int>(m_removed.size());
}

SetReminderCommand::SetReminderCommand(data::TaskRepository &repository, const QUuid &id, QDateTime remindAt)
    : m_repository(repository)
    , m_id(id)
    , m_remindAt(std::move(remindAt))
{
}

void SetReminderCommand::redo()
{
    auto task = m_repository.findById(m_id);
    if (!task.has_value()) {
        return;
    }
    m_previous = task->remindAt;
    if (m_remindAt.isValid()) {
        data::setReminder(*task, m_remindAt);
    } else {
        data::clearReminder(*task);
    }
    m_repository.updateTask(*task);
}

void SetReminderCommand::undo()
{
    auto task = m_repository.findById(m_id);
    if (!task.has_value()) {
        return;
    }
    data::setReminder(*task, m_previous);
    m_repository.updateTask(*task);
}

QString SetReminderCommand::text() const
{
    if (!m_remindAt.isValid()) {
        return QObject::tr("Erinnerung entfernen");
    }
    return QObject::tr("Erinnerung setzen");
}

} // namespace core
} // namespace desktodo
