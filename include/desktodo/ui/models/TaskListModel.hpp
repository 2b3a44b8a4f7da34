#pragma once

#include <QAbstractListModel>
#include <QColor>
#include <QVector>

#include "desktodo/data/Task.hpp"

namespace desktodo {
namespace ui {

class TaskListModel : public QAbstractListModel
{
    Q_OBJECT

public:
    enum Roles
    {
        IdRole = Qt::UserRole + 1,
        TitleRole,
        CategoryRole,
        CompletedRole,
        RemindAtRole,
    };

    explicit TaskListModel(QObject *parent = nullptr);

    int rowCount(const QModelIndex &parent = QModelIndex()) const override;
    QVariant data(const QModelIndex &index, int role) const override;
    Qt::ItemFlags flags(const QModelIndex &index) const override;
    QHash<int, QByteArray> roleNames() const override;

    void setTasks(QVector<data::TaskItem> tasks);
    const data::TaskItem *taskAt(const QModelIndex &index) const;
    QModelIndex indexOf(const QUuid &id) const;
    void setCompletedColor(const QColor &color);

private:
    QVector<data::TaskItem> m_tasks;
    QColor m_completedColor = QColor(Qt::gray);
};

} // namespace ui
} // namespace desktodo
