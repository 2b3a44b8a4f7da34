#include "desktodo/data/TaskRepository.hpp"

#include <algorithm>
#include <iterator>

namespace desktodo {
namespace data {

namespace {
template<typename Predicate>
std::vector<TaskItem> filterTasks(const std::vector<TaskItem> &tasks, Predicate predicate)
{
    std::vector<TaskItem> result;
    std::copy_if(tasks.begin(), tasks.end(), std::back_inserter(result), predicate);
    return result;
}
} // namespace

std::vector<TaskItem> TaskRepository::tasksInCategory(const QString &category) const
{
    return filterTasks(fetchTasks(), [&category](const TaskItem &task) {
        return task.category == category;
    });
}

std::vector<TaskItem> TaskRepository::completedTasks() const
{
    return filterTasks(fetchTasks(), [](const TaskItem &task) { return task.completed; });
}

std::vector<TaskItem> TaskRepository::pendingTasks() const
{
    return filterTasks(fetchTasks(), [](const TaskItem &task) { return !task.completed; });
}

} // namespace data
} // namespace desktodo
