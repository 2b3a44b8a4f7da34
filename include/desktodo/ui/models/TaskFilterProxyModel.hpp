#pragma once

#include <QSortFilterProxyModel>
#include <optional>

#include "desktodo/data/Task.hpp"

namespace desktodo {
namespace ui {

class TaskFilterProxyModel : public QSortFilterProxyModel
{
    Q_OBJECT

public:
    explicit TaskFilterProxyModel(QObject *parent = nullptr);

    // Matches title or category, case-insensitive.
    void setFilterText(const QString &text);
    QString filterText() const;
    void setCompletionFilter(std::optional<bool> completed);
    void setCategoryFilter(const QString &category);
    bool isFiltering() const;

protected:
    bool filterAcceptsRow(int sourceRow, const QModelIndex &sourceParent) const override;

private:
    QString m_filterText;
    std::optional<bool> m_completionFilter;
    QString m_categoryFilter;
};

} // namespace ui
} // namespace desktodo
