#pragma once

#include <QString>
#include <optional>
#include <vector>

#include "desktodo/data/Task.hpp"

namespace desktodo {
namespace data {

class TaskRepository
{
public:
    virtual ~TaskRepository() = default;

    virtual std::vector<TaskItem> fetchTasks() const = 0;
    virtual std::optional<TaskItem> findById(const QUuid &id) const = 0;
    virtual int positionOf(const QUuid &id) const = 0;
    virtual TaskItem addTask(TaskItem task) = 0;
    virtual bool restoreTask(const TaskItem &task, int position) = 0;
    virtual bool updateTask(const TaskItem &task) = 0;
    virtual bool removeTask(const QUuid &id) = 0;
    virtual int removeCompleted() = 0;
    virtual void reload() = 0;

    // Empty unless the last write to the backing store failed.
    virtual QString lastError() const = 0;
    // True while in-memory changes are not on disk; reload() would discard them.
    virtual bool hasUnsavedChanges() const = 0;

    std::vector<TaskItem> tasksInCategory(const QString &category) const;
    std::vector<TaskItem> completedTasks() const;
    std::vector<TaskItem> pendingTasks() const;
};

} // namespace data
} // namespace desktodo
