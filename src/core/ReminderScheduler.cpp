#include "desktodo/core/ReminderScheduler.hpp"

#include <QTimer>
#include <algorithm>

#include "desktodo/core/AppSettings.hpp"
#include "desktodo/core/Logging.hpp"

namespace desktodo {
namespace core {

ReminderScheduler::ReminderScheduler(QObject *parent)
    : QObject(parent)
    , m_timer(new QTimer(this))
{
    qRegisterMetaType<ReminderEntry>();
    m_timer->setInterval(AppSettings::DefaultReminderIntervalMs);
    connect(m_timer, &QTimer::timeout, this, &ReminderScheduler::handleTimeout);
}

ReminderScheduler::~ReminderScheduler() = default;

void ReminderScheduler::setInterval(int intervalMs)
{
    m_timer->setInterval(std::max(intervalMs, 1));
}

int ReminderScheduler::interval() const
{
    return m_timer->interval();
}

bool ReminderScheduler::isRunning() const
{
    return m_timer->isActive();
}

void ReminderScheduler::setTasks(const std::vector<data::TaskItem> &tasks, const QDateTime &now)
{
    std::vector<ReminderEntry> previous;
    previous.swap(m_entries);
    for (const auto &task : tasks) {
        if (task.completed || !data::hasReminder(task)) {
            continue;
        }
        // An unchanged reminder that fell due since the last check still has to fire.
        const auto kept = std::find_if(previous.begin(), previous.end(), [&task](const ReminderEntry &entry) {
            return entry.taskId == task.id && entry.remindAt == task.remindAt && !entry.notified;
        });
        if (kept != previous.end()) {
            m_entries.push_back({ task.id, task.title, task.remindAt, false });
            continue;
        }
        addReminder(task, now);
    }
    qCDebug(lcReminder) << "Tracking" << m_entries.size() << "reminders";
}

bool ReminderScheduler::addReminder(const data::TaskItem &task, const QDateTime &now)
{
    removeReminder(task.id);
    if (!data::hasReminder(task) || task.remindAt <= now) {
        return false;
    }
    m_entries.push_back({ task.id, task.title, task.remindAt, false });
    return true;
}

void ReminderScheduler::removeReminder(const QUuid &taskId)
{
    m_entries.erase(std::remove_if(m_entries.begin(), m_entries.end(), [&taskId](const ReminderEntry &entry) {
                        return entry.taskId == taskId;
                    }),
                    m_entries.end());
}

const std::vector<ReminderEntry> &ReminderScheduler::entries() const
{
    return m_entries;
}

std::vector<ReminderEntry> ReminderScheduler::upcoming(const QDateTime &now, int hours) const
{
    const QDateTime cutoff = now.addSecs(static_cast<qint64>(hours) * 60 * 60);
    std::vector<ReminderEntry> result;
    for (const auto &entry : m_entries) {
        if (!entry.notified && entry.remindAt >= now && entry.remindAt <= cutoff) {
            result.push_back(entry);
        }
    }
    std::sort(result.begin(), result.end(), [](const ReminderEntry &lhs, const ReminderEntry &rhs) {
        return lhs.remindAt < rhs.remindAt;
    });
    return result;
}

ReminderStatus ReminderScheduler::status(const QDateTime &now) const
{
    ReminderStatus result;
    result.running = isRunning();
    result.total = static_cast<int>(m_entries.size());
    result.intervalMs = interval();
    for (const auto &entry : m_entries) {
        if (entry.notified) {
            continue;
        }
        ++result.active;
        if (entry.remindAt < now) {
            ++result.overdue;
        }
    }
    return result;
}

void ReminderScheduler::start()
{
    if (m_timer->isActive()) {
        return;
    }
    m_timer->start();
    qCInfo(lcReminder) << "Reminder monitoring started, interval" << m_timer->interval() << "ms";
}

void ReminderScheduler::stop()
{
    if (!m_timer->isActive()) {
        return;
    }
    m_timer->stop();
    qCInfo(lcReminder) << "Reminder monitoring stopped";
}

int ReminderScheduler::checkDue(const QDateTime &now)
{
    // Copy first: a slot connected to reminderDue may call back into setTasks().
    std::vector<ReminderEntry> due;
    for (auto &entry : m_entries) {
        if (!entry.notified && entry.remindAt <= now) {
            entry.notified = true;
            due.push_back(entry);
        }
    }
    m_entries.erase(std::remove_if(m_entries.begin(), m_entries.end(), [&now](const ReminderEntry &entry) {
                        return entry.notified && entry.remindAt <= now;
                    }),
                    m_entries.end());

    for (const auto &entry : due) {
        qCInfo(lcReminder) << "Reminder due:" << entry.title << entry.remindAt.toString(Qt::ISODate);
        emit reminderDue(entry);
    }
    return static_cast<int>(due.size());
}

void ReminderScheduler::handleTimeout()
{
    checkDue(QDateTime::currentDateTime());
}

} // namespace core
} // namespace desktodo
