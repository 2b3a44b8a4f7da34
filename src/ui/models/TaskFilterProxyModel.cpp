#include "desktodo/ui/models/TaskFilterProxyModel.hpp"

#include "desktodo/ui/models/TaskListModel.hpp"

namespace desktodo {
namespace ui {

TaskFilterProxyModel::TaskFilterProxyModel(QObject *parent)
    : QSortFilterProxyModel(parent)
{
    setFilterCaseSensitivity(Qt::CaseInsensitive);
}

void TaskFilterProxyModel::setFilterText(const QString &text)
{
    const QString normalized = text.trimmed();
    if (m_filterText == normalized) {
        return;
    }
    m_filterText = normalized;
    invalidateFilter();
}

QString TaskFilterProxyModel::filterText() const
{
    return m_filterText;
}

void TaskFilterProxyModel::setCompletionFilter(std::optional<bool> completed)
{
    if (m_completionFilter == completed) {
        return;
    }
    m_completionFilter = completed;
    invalidateFilter();
}

void TaskFilterProxyModel::setCategoryFilter(const QString &category)
{
    if (m_categoryFilter == category) {
        return;
    }
    m_categoryFilter = category;
    invalidateFilter();
}

bool TaskFilterProxyModel::isFiltering() const
{
    return !m_filterText.isEmpty() || m_completionFilter.has_value() || !m_categoryFilter.isEmpty();
}

bool TaskFilterProxyModel::filterAcceptsRow(int sourceRow, const QModelIndex &sourceParent) const
{
    const auto index = sourceModel()->index(sourceRow, 0, sourceParent);
    auto *taskModel = qobject_cast<TaskListModel *>(sourceModel());
    if (!taskModel) {
        return true;
    }
    const auto *task = taskModel->taskAt(index);
    if (!task) {
        return true;
    }

    if (!m_filterText.isEmpty()) {
        if (!task->title.contains(m_filterText, Qt::CaseInsensitive)
            && !task->category.contains(m_filterText, Qt::CaseInsensitive)) {
            return false;
        }
    }

    if (m_completionFilter.has_value() && task->completed != m_completionFilter.value()) {
        return false;
    }

    if (!m_categoryFilter.isEmpty() && task->category.compare(m_categoryFilter, Qt::CaseInsensitive) != 0) {
        return false;
    }

    return true;
}

} // namespace ui
} // namespace desktodo
