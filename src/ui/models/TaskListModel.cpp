#include "desktodo/ui/models/TaskListModel.hpp"

#include <QFont>

namespace desktodo {
namespace ui {

TaskListModel::TaskListModel(QObject *parent)
    : QAbstractListModel(parent)
{
}

int TaskListModel::rowCount(const QModelIndex &parent) const
{
    if (parent.isValid()) {
        return 0;
    }
    return m_tasks.size();
}

QVariant TaskListModel::data(const QModelIndex &index, int role) const
{
    if (!index.isValid() || index.row() < 0 || index.row() >= m_tasks.size()) {
        return {};
    }

    const auto &task = m_tasks.at(index.row());
    switch (role) {
    case Qt::DisplayRole:
        return data::displayText(task);
    case Qt::ToolTipRole: {
        QString tooltip = tr("Erstellt: %1").arg(task.createdAt.toString(QStringLiteral("yyyy-MM-dd hh:mm")));
        if (task.completed && task.completedAt.isValid()) {
            tooltip += QLatin1Char('\n') + tr("Erledigt: %1").arg(task.completedAt.toString(QStringLiteral("yyyy-MM-dd hh:mm")));
        }
        if (data::hasReminder(task)) {
            tooltip += QLatin1Char('\n') + tr("Erinnerung: %1").arg(task.remindAt.toString(QStringLiteral("yyyy-MM-dd hh:mm")));
        }
        return tooltip;
    }
    case Qt::ForegroundRole:
        if (task.completed) {
            return m_completedColor;
        }
        return {};
    case Qt::FontRole:
        if (task.completed) {
            QFont font;
            font.setStrikeOut(true);
            return font;
        }
        return {};
    case IdRole:
        return task.id;
    case TitleRole:
        return task.title;
    case CategoryRole:
        return task.category;
    case CompletedRole:
        return task.completed;
    case RemindAtRole:
        return task.remindAt;
    default:
        return {};
    }
}

Qt::ItemFlags TaskListModel::flags(const QModelIndex &index) const
{
    auto defaultFlags = QAbstractListModel::flags(index);
    if (!index.isValid()) {
        return defaultFlags;
    }
    return defaultFlags | Qt::ItemIsSelectable | Qt::ItemIsEnabled;
}

QHash<int, QByteArray> TaskListModel::roleNames() const
{
    auto names = QAbstractListModel::roleNames();
    names.insert(IdRole, "taskId");
    names.insert(TitleRole, "title");
    names.insert(CategoryRole, "category");
    names.insert(CompletedRole, "completed");
    names.insert(RemindAtRole, "remindAt");
    return names;
}

void TaskListModel::setTasks(QVector<data::TaskItem> tasks)
{
    beginResetModel();
    m_tasks = std::move(tasks);
    endResetModel();
}

const data::TaskItem *TaskListModel::taskAt(const QModelIndex &index) const
{
    if (!index.isValid() || index.row() < 0 || index.row() >= m_tasks.size()) {
        return nullptr;
    }
    return &m_tasks.at(index.row());
}

QModelIndex TaskListModel::indexOf(const QUuid &id) const
{
    for (int row = 0; row < m_tasks.size(); ++row) {
        if (m_tasks.at(row).id == id) {
            return index(row, 0);
        }
    }
    return {};
}

void TaskListModel::setCompletedColor(const QColor &color)
{
    m_completedColor = color;
    if (m_tasks.isEmpty()) {
        return;
    }
    const QModelIndex first = index(0, 0);
    const QModelIndex last = index(m_tasks.size() - 1, 0);
    emit dataChanged(first, last, { Qt::ForegroundRole });
}

} // namespace ui
} // namespace desktodo
