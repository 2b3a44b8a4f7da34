#include "desktodo/data/Task.hpp"

#include <QObject>

namespace desktodo {
namespace data {

namespace categories {

QString general()
{
    return QObject::tr("Allgemein");
}

QString work()
{
    return QObject::tr("Arbeit");
}

QString life()
{
    return QObject::tr("Privat");
}

QString study()
{
    return QObject::tr("Lernen");
}

QString health()
{
    return QObject::tr("Gesundheit");
}

QStringList all()
{
    return { general(), work(), life(), study(), health() };
}

} // namespace categories

TaskItem makeTask(const QString &title, const QString &category)
{
    TaskItem task;
    task.title = title.trimmed();
    task.category = category.trimmed().isEmpty() ? categories::general() : category.trimmed();
    return task;
}

void markCompleted(TaskItem &task, const QDateTime &now)
{
    task.completed = true;
    task.completedAt = now;
}

void markPending(TaskItem &task)
{
    task.completed = false;
    task.completedAt = QDateTime();
}

void toggleCompleted(TaskItem &task, const QDateTime &now)
{
    if (task.completed) {
        markPending(task);
    } else {
        markCompleted(task, now);
    }
}

void setReminder(TaskItem &task, const QDateTime &when)
{
    task.remindAt = when;
}

void clearReminder(TaskItem &task)
{
    task.remindAt = QDateTime();
}

bool hasReminder(const TaskItem &task)
{
    return task.remindAt.isValid();
}

QString displayText(const TaskItem &task)
{
    const QString status = task.completed ? QString::fromUtf8("\xE2\x9C\x93") : QString::fromUtf8("\xE2\x97\x8B");
    QString text = QStringLiteral("%1 %2 [%3]").arg(status, task.title, task.category);
    if (hasReminder(task)) {
        text += QStringLiteral(" %1%2")
                    .arg(QString::fromUtf8("\xE2\x8F\xB0"), task.remindAt.toString(QStringLiteral("MM/dd hh:mm")));
    }
    return text;
}

bool operator==(const TaskItem &lhs, const TaskItem &rhs)
{
    return lhs.id == rhs.id
        && lhs.title == rhs.title
        && lhs.category == rhs.category
        && lhs.completed == rhs.completed
        && lhs.remindAt == rhs.remindAt
        && lhs.createdAt == rhs.createdAt
        && lhs.completedAt == rhs.completedAt;
}

bool operator!=(const TaskItem &lhs, const TaskItem &rhs)
{
    return !(lhs == rhs);
}

} // namespace data
} // namespace desktodo
