#include "desktodo/core/ReminderTime.hpp"

#include <QObject>
#include <QStringList>
#include <QTime>

#include "desktodo/core/Logging.hpp"

namespace desktodo {
namespace core {

namespace {
constexpr auto DATE_FORMAT = "yyyy-MM-dd";

QTime parseTimeOfDay(const QString &text)
{
    static const QStringList twentyFourHourFormats = {
        QStringLiteral("h:mm"),
        QStringLiteral("h:mm:ss"),
    };
    static const QStringList twelveHourFormats = {
        QStringLiteral("h:mm AP"),
        QStringLiteral("h:mmAP"),
    };
    for (const QString &format : twentyFourHourFormats) {
        const QTime time = QTime::fromString(text, format);
        if (time.isValid()) {
            return time;
        }
    }
    const QString upper = text.toUpper();
    for (const QString &format : twelveHourFormats) {
        const QTime time = QTime::fromString(upper, format);
        if (time.isValid()) {
            return time;
        }
    }
    return {};
}
} // namespace

std::optional<QDateTime> parseReminderTime(const QString &timeText, const QString &dateText, const QDateTime &now)
{
    const QString trimmedDate = dateText.trimmed();
    QDate targetDate = now.date();
    if (!trimmedDate.isEmpty()) {
        targetDate = QDate::fromString(trimmedDate, QLatin1String(DATE_FORMAT));
        if (!targetDate.isValid()) {
            qCDebug(lcReminder) << "Rejected reminder date" << dateText;
            return std::nullopt;
        }
    }

    QTime time = parseTimeOfDay(timeText.trimmed());
    if (!time.isValid()) {
        qCDebug(lcReminder) << "Rejected reminder time" << timeText;
        return std::nullopt;
    }
    time = QTime(time.hour(), time.minute());

    QDateTime target(targetDate, time);
    if (trimmedDate.isEmpty() && target <= now) {
        target = target.addDays(1);
    }
    return target;
}

std::vector<QuickReminderOption> quickReminderOptions(const QDateTime &now)
{
    const std::vector<QuickReminderOption> candidates = {
        { QObject::tr("In 5 Minuten"), now.addSecs(5 * 60) },
        { QObject::tr("In 15 Minuten"), now.addSecs(15 * 60) },
        { QObject::tr("In 30 Minuten"), now.addSecs(30 * 60) },
        { QObject::tr("In 1 Stunde"), now.addSecs(60 * 60) },
        { QObject::tr("Heute 17:00"), QDateTime(now.date(), QTime(17, 0)) },
        { QObject::tr("Morgen 09:00"), QDateTime(now.date().addDays(1), QTime(9, 0)) },
    };
    std::vector<QuickReminderOption> options;
    for (const auto &candidate : candidates) {
        if (candidate.dateTime > now) {
            options.push_back(candidate);
        }
    }
    return options;
}

} // namespace core
} // namespace desktodo
