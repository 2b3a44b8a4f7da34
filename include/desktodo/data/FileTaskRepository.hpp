#pragma once

#include "desktodo/data/JsonTaskStorage.hpp"
#include "desktodo/data/TaskRepository.hpp"

#include <memory>

namespace desktodo {
namespace data {

class FileTaskRepository : public TaskRepository
{
public:
    explicit FileTaskRepository(std::shared_ptr<JsonTaskStorage> storage);
    ~FileTaskRepository() override = default;

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
    std::shared_ptr<JsonTaskStorage> m_storage;
};

} // namespace data
} // namespace desktodo
