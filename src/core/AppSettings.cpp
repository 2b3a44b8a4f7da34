#include "desktodo/core/AppSettings.hpp"

#include <QSettings>
#include <QtGlobal>

namespace desktodo {
namespace core {

namespace {
const QString DataFileKey = QStringLiteral("storage/dataFile");
const QString DarkModeKey = QStringLiteral("ui/darkMode");
const QString GeometryKey = QStringLiteral("ui/geometry");
const QString ReminderIntervalKey = QStringLiteral("reminders/checkIntervalMs");
const QString StatusTimeoutKey = QStringLiteral("ui/statusTimeoutMs");
} // namespace

QString AppSettings::dataFile() const
{
    QSettings settings;
    return settings.value(DataFileKey).toString();
}

void AppSettings::setDataFile(const QString &path)
{
    QSettings settings;
    if (path.isEmpty()) {
        settings.remove(DataFileKey);
        return;
    }
    settings.setValue(DataFileKey, path);
}

bool AppSettings::darkMode() const
{
    QSettings settings;
    return settings.value(DarkModeKey, false).toBool();
}

void AppSettings::setDarkMode(bool enabled)
{
    QSettings settings;
    settings.setValue(DarkModeKey, enabled);
}

QByteArray AppSettings::windowGeometry() const
{
    QSettings settings;
    return settings.value(GeometryKey).toByteArray();
}

void AppSettings::setWindowGeometry(const QByteArray &geometry)
{
    QSettings settings;
    settings.setValue(GeometryKey, geometry);
}

int AppSettings::reminderCheckIntervalMs() const
{
    QSettings settings;
    const int stored = settings.value(ReminderIntervalKey, DefaultReminderIntervalMs).toInt();
    return qBound(100, stored, 60 * 1000);
}

int AppSettings::statusTimeoutMs() const
{
    QSettings settings;
    const int stored = settings.value(StatusTimeoutKey, DefaultStatusTimeoutMs).toInt();
    return stored > 0 ? stored : DefaultStatusTimeoutMs;
}

void AppSettings::setStatusTimeoutMs(int timeoutMs)
{
    QSettings settings;
    settings.setValue(StatusTimeoutKey, timeoutMs);
}

} // namespace core
} // namespace desktodo
