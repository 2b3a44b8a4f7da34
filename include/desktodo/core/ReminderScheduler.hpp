#pragma once

#include <QDateTime>
#include <QObject>
#include <QString>
#include <QUuid>
#include <vector>

#include "desktodo/data/Task.hpp"

class QTimer;

namespace desktodo {
namespace core {

struct ReminderEntry
{
    QUuid taskId;
    QString title;
    QDateTime remindAt;
    bool notified = false;
};

struct ReminderStatus
{
    bool running = false;
    int total = 0;
    int active = 0;
    int overdue = 0;
    int intervalMs = 0;
};

class ReminderScheduler : public QObject
{
    Q_OBJECT

public:
    explicit ReminderScheduler(QObject *parent = nullptr);
    ~ReminderScheduler() override;

    void setInterval(int intervalMs);
    int interval() const;
    bool isRunning() const;

    // Registers pending tasks whose reminder lies after now; replaces all entries.
    // Entries already tracked with the same time stay registered even when due.
    void setTasks(const std::vector<data::TaskItem> &tasks, const QDateTime &now = QDateTime::currentDateTime());
    bool addReminder(const data::TaskItem &task, const QDateTime &now = QDateTime::currentDateTime());
    void removeReminder(const QUuid &taskId);

    const std::vector<ReminderEntry> &entries() const;
    std::vector<ReminderEntry> upcoming(const QDateTime &now, int hours = 24) const;
    ReminderStatus status(const QDateTime &now = QDateTime::currentDateTime()) const;

public slots:
    void start();
    void stop();
    int checkDue(const QDateTime &now);

signals:
    void reminderDue(const desktodo::core::ReminderEntry &entry);

private:
    void handleTimeout();

    QTimer *m_timer = nullptr;
    std::vector<ReminderEntry> m_entries;
};

} // namespace core
} // namespace desktodo

Q_DECLARE_METATYPE(desktodo::core::ReminderEntry)
