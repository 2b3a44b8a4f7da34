#pragma once

#include <QVector>

#include "desktodo/data/TaskRepository.hpp"

namespace desktodo {
namespace data {

class InMemoryTaskRepository : public TaskRepository
{
public:
    InMemoryTaskRepository();
    ~InMemoryTaskRepository() override;

    std::vector<TaskItem> fetchTasks() const override;
    std::optional<TaskItem> findById(const QUuid &id) const override;
    int positionOf(const QUuid &id) const override;
    TaskItem addTask(TaskItem task) override;
    bool restoreTask(const TaskItem &task, int position) override;
    bool updateTask(const TaskItem &task) override;
    bool removeTask(const QUuid &id) override;
    int removeCompleted() override;
    void reload() override;
    QString lastError() const override;
    bool hasUnsavedChanges() const override;

private:
    QVector<TaskItem> m_items;
};

} // namespace data
} // namespace desktodo
