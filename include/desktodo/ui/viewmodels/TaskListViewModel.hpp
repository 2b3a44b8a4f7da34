#pragma once

#include <QObject>
#include <memory>

#include "desktodo/data/Task.hpp"

namespace desktodo {
namespace data {
class TaskRepository;
}

namespace ui {

class TaskListModel;

class TaskListViewModel : public QObject
{
    Q_OBJECT
public:
    TaskListViewModel(data::TaskRepository &repository, QObject *parent = nullptr);

    TaskListModel *model() const;
    int taskCount() const;

public slots:
    void refresh();

signals:
    void tasksChanged(int count);

private:
    data::TaskRepository &m_repository;
    std::unique_ptr<TaskListModel> m_model;
};

} // namespace ui
} // namespace desktodo
