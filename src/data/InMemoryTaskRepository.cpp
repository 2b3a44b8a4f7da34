#include "desktodo/data/InMemoryTaskRepository.hpp"

#include <algorithm>

namespace desktodo {
namespace data {

InMemoryTaskRepository::InMemoryTaskRepository() = default;
InMemoryTaskRepository::~InMemoryTaskRepository() = default;

std::vector<TaskItem> InMemoryTaskRepository::fetchTasks() const
{
    return std::vector<TaskItem>(m_items.cbegin(), m_items.cend());
}

std::optional<TaskItem> InMemoryTaskRepository::findById(const QUuid &id) const
{
    const int index = positionOf(id);
    if (index < 0) {
        return std::nullopt;
    }
    return m_items.at(index);
}

int InMemoryTaskRepository::positionOf(const QUuid &id) const
{
    for (int i = 0; i < m_items.size(); ++i) {
        if (m_items.at(i).id == id) {
            return i;
        }
    }
    return -1;
}

TaskItem InMemoryTaskRepository::addTask(TaskItem task)
{
    if (task.id.isNull()) {
        task.id = QUuid::createUuid();
    }
    const int index = positionOf(task.id);
    if (index >= 0) {
        m_items[index] = task;
    } else {
        m_items.push_back(task);
    }
    return task;
}

bool InMemoryTaskRepository::restoreTask(const TaskItem &task, int position)
{
    if (task.id.isNull() || positionOf(task.id) >= 0) {
        return false;
    }
    m_items.insert(std::clamp(position, 0, static_cast<int>(m_items.size())), task);
    return true;
}

bool InMemoryTaskRepository::updateTask(const TaskItem &task)
{
    const int index = positionOf(task.id);
    if (index < 0) {
        return false;
    }
    m_items[index] = task;
    return true;
}

bool InMemoryTaskRepository::removeTask(const QUuid &id)
{
    const int index = positionOf(id);
    if (index < 0) {
        return false;
    }
    m_items.removeAt(index);
    return true;
}

int InMemoryTaskRepository::removeCompleted()
{
    const auto before = m_items.size();
    m_items.erase(std::remove_if(m_items.begin(), m_items.end(), [](const TaskItem &task) {
                      return task.completed;
                  }),
                  m_items.end());
    return static_cast<int>(before - m_items.size());
}

void InMemoryTaskRepository::reload()
{
}

QString InMemoryTaskRepository::lastError() const
{
    return {};
}

bool InMemoryTaskRepository::hasUnsavedChanges() const
{
    return false;
}

} // namespace data
} // namespace desktodo
