#pragma once

#include <QListView>
#include <QPoint>

namespace desktodo {
namespace ui {

class TaskListView : public QListView
{
    Q_OBJECT

public:
    explicit TaskListView(QWidget *parent = nullptr);

    void setPlaceholderText(const QString &text);

signals:
    void toggleRequested();
    void deleteRequested();
    void taskMenuRequested(const QPoint &globalPos);

protected:
    void keyPressEvent(QKeyEvent *event) override;
    void contextMenuEvent(QContextMenuEvent *event) override;
    void paintEvent(QPaintEvent *event) override;

private:
    QString m_placeholderText;
};

} // namespace ui
} // namespace desktodo
