#pragma once

#include <QByteArray>
#include <QString>

namespace desktodo {
namespace core {

class AppSettings
{
public:
    static constexpr int DefaultReminderIntervalMs = 1000;
    static constexpr int DefaultStatusTimeoutMs = 3000;

    AppSettings() = default;

    QString dataFile() const;
    void setDataFile(const QString &path);

    bool darkMode() const;
    void setDarkMode(bool enabled);

    QByteArray windowGeometry() const;
    void setWindowGeometry(const QByteArray &geometry);

    int reminderCheckIntervalMs() const;

    int statusTimeoutMs() const;
    void setStatusTimeoutMs(int timeoutMs);
};

} // namespace core
} // namespace desktodo
