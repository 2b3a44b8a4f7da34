#pragma once

#include <QDateTime>
#include <QString>
#include <optional>
#include <vector>

namespace desktodo {
namespace core {

struct QuickReminderOption
{
    QString label;
    QDateTime dateTime;
};

// Accepts "14:30", "2:30 PM", "2:30PM" and "14:30:00"; dateText is "yyyy-MM-dd".
// Without a date the time refers to today and rolls over to tomorrow once it has passed.
std::optional<QDateTime> parseReminderTime(const QString &timeText,
                                           const QString &dateText = QString(),
                                           const QDateTime &now = QDateTime::currentDateTime());

std::vector<QuickReminderOption> quickReminderOptions(const QDateTime &now = QDateTime::currentDateTime());

} // namespace core
} // namespace desktodo
