#include "desktodo/data/FileTaskRepository.hpp"

namespace desktodo {
namespace data {

FileTaskRepository::FileTaskRepository(std::shared_ptr<JsonTaskStorage> storage)
    : m_storage(std::move(storage))
{
}

std::vector<TaskItem> FileTaskRepository::fetchTasks() const
{
    if (!m_storage) {
        return {};
    }
    const auto &tasks = m_storage->tasks();
    return std::vector<TaskItem>(tasks.cbegin(), tasks.cend());
}

std::optional<TaskItem> FileTaskRepository::findById(const QUuid &id) const
{
    if (!m_storage) {
        return std::nullopt;
    }
    const int index = m_storage->indexOf(id);
    if (index < 0) {
        return std::nullopt;
    }
    return m_storage->tasks().at(index);
}

int FileTaskRepository::positionOf(const QUuid &id) const
{
    if (!m_storage) {
        return -1;
    }
    return m_storage->indexOf(id);
}

TaskItem FileTaskRepository::addTask(TaskItem task)
{
    if (!m_storage) {
        return task;
    }
    return m_storage->addOrUpdate(std::move(task));
}

bool FileTaskRepository::restoreTask(const TaskItem &task, int position)
{
    if (!m_storage) {
        return false;
    }
    return m_storage->insertAt(task, position);
}

bool FileTaskRepository::updateTask(const TaskItem &task)
{
    if (!m_storage) {
        return false;
    }
    if (m_storage->indexOf(task.id) < 0) {
        return false;
    }
    m_storage->addOrUpdate(task);
    return true;
}

bool FileTaskRepository::removeTask(const QUuid &id)
{
    if (!m_storage) {
        return false;
    }
    return m_storage->remove(id);
}

int FileTaskRepository::removeCompleted()
{
    if (!m_storage) {
        return 0;
    }
    return m_storage->removeIf([](const TaskItem &task) { return task.completed; });
}

void FileTaskRepository::reload()
{
    if (m_storage) {
        m_storage->load();
    }
}

QString FileTaskRepository::lastError() const
{
    if (!m_storage || !m_storage->isDirty()) {
        return {};
    }
    return m_storage->lastError();
}

bool FileTaskRepository::hasUnsavedChanges() const
{
    return m_storage && m_storage->isDirty();
}

} // namespace data
} // namespace desktodo
