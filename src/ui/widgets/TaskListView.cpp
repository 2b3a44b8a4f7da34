#include "desktodo/ui/widgets/TaskListView.hpp"

#include <QContextMenuEvent>
#include <QItemSelectionModel>
#include <QKeyEvent>
#include <QPainter>

namespace desktodo {
namespace ui {

TaskListView::TaskListView(QWidget *parent)
    : QListView(parent)
{
    setSelectionMode(QAbstractItemView::ExtendedSelection);
    setSelectionBehavior(QAbstractItemView::SelectRows);
    setUniformItemSizes(true);
    setEditTriggers(QAbstractItemView::NoEditTriggers);
    setAlternatingRowColors(true);
}

void TaskListView::setPlaceholderText(const QString &text)
{
    m_placeholderText = text;
    if (viewport()) {
        viewport()->update();
    }
}

void TaskListView::keyPressEvent(QKeyEvent *event)
{
    switch (event->key()) {
    case Qt::Key_Delete:
    case Qt::Key_Backspace:
        if (selectionModel() && selectionModel()->hasSelection()) {
            emit deleteRequested();
            event->accept();
            return;
        }
        break;
    case Qt::Key_Space:
        if (selectionModel() && selectionModel()->hasSelection()) {
            emit toggleRequested();
            event->accept();
            return;
        }
        break;
    default:
        break;
    }
    QListView::keyPressEvent(event);
}

void TaskListView::contextMenuEvent(QContextMenuEvent *event)
{
    const QModelIndex index = indexAt(event->pos());
    if (!index.isValid()) {
        return;
    }
    // Right-clicking outside the current selection acts on the clicked row only.
    if (selectionModel() && !selectionModel()->isSelected(index)) {
        selectionModel()->select(index, QItemSelectionModel::ClearAndSelect | QItemSelectionModel::Rows);
        setCurrentIndex(index);
    }
    emit taskMenuRequested(event->globalPos());
    event->accept();
}

void TaskListView::paintEvent(QPaintEvent *event)
{
    QListView::paintEvent(event);
    if (m_placeholderText.isEmpty() || !model() || model()->rowCount() > 0 || !viewport()) {
        return;
    }
    QPainter painter(viewport());
    QColor color = palette().text().color();
    color.setAlpha(120);
    painter.setPen(color);
    painter.drawText(viewport()->rect().adjusted(12, 12, -12, -12),
                     Qt::AlignCenter | Qt::TextWordWrap,
                     m_placeholderText);
}

} // namespace ui
} // namespace desktodo
