#pragma once

#include <QDateTime>
#include <QString>
#include <QStringList>
#include <QUuid>

namespace desktodo {
namespace data {

struct TaskItem
{
    QUuid id = QUuid::createUuid();
    QString title;
    QString category;
    bool completed = false;
    QDateTime remindAt;
    QDateTime createdAt = QDateTime::currentDateTime();
    QDateTime completedAt;
};

namespace categories {
QString general();
QString work();
QString life();
QString study();
QString health();
QStringList all();
} // namespace categories

TaskItem makeTask(const QString &title, const QString &category = QString());

void markCompleted(TaskItem &task, const QDateTime &now = QDateTime::currentDateTime());
void markPending(TaskItem &task);
void toggleCompleted(TaskItem &task, const QDateTime &now = QDateTime::currentDateTime());
void setReminder(TaskItem &task, const QDateTime &when);
void clearReminder(TaskItem &task);
bool hasReminder(const TaskItem &task);

// "○ title [category] ⏰MM/dd hh:mm"
QString displayText(const TaskItem &task);

bool operator==(const TaskItem &lhs, const TaskItem &rhs);
bool operator!=(const TaskItem &lhs, const TaskItem &rhs);

} // namespace data
} // namespace desktodo
