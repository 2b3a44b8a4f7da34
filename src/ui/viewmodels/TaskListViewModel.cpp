#include "desktodo/ui/viewmodels/TaskListViewModel.hpp"

#include <QVector>

#include "desktodo/data/TaskRepository.hpp"
#include "desktodo/ui/models/TaskListModel.hpp"

namespace desktodo {
namespace ui {

TaskListViewModel::TaskListViewModel(data::TaskRepository &repository, QObject *parent)
    : QObject(parent)
    , m_repository(repository)
    , m_model(std::make_unique<TaskListModel>())
{
}

TaskListModel *TaskListViewModel::model() const
{
    return m_model.get();
}

int TaskListViewModel::taskCount() const
{
    return m_model->rowCount();
}

void TaskListViewModel::refresh()
{
    const auto tasks = m_repository.fetchTasks();
    QVector<data::TaskItem> items;
    items.reserve(static_cast<int>(tasks.size()));
    for (const auto &task : tasks) {
        items.append(task);
    }
    m_model->setTasks(std::move(items));
    emit tasksChanged(m_model->rowCount());
}

} // namespace ui
} // namespace desktodo
