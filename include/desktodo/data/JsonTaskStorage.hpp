#pragma once

#include <QDateTime>
#include <QJsonObject>
#include <QString>
#include <QUuid>
#include <QVector>
#include <functional>
#include <optional>

#include "desktodo/data/Task.hpp"

namespace desktodo {
namespace data {

enum class LoadStatus
{
    Missing,
    Loaded,
    Corrupted,
    Unreadable,
};

struct StorageFileInfo
{
    bool exists = false;
    QString path;
    qint64 size = 0;
    QDateTime modified;
};

class JsonTaskStorage
{
public:
    explicit JsonTaskStorage(QString filePath);
    ~JsonTaskStorage() = default;

    const QString &filePath() const;
    const QVector<TaskItem> &tasks() const;
    int indexOf(const QUuid &id) const;

    LoadStatus load();
    bool save();

    TaskItem addOrUpdate(TaskItem task);
    bool insertAt(TaskItem task, int position);
    bool remove(const QUuid &id);
    int removeIf(const std::function<bool(const TaskItem &)> &predicate);

    bool backup(const QString &suffix = QString());
    StorageFileInfo fileInfo() const;

    LoadStatus lastLoadStatus() const;
    int skippedRecords() const;
    QString corruptBackupPath() const;
    QString lastError() const;
    bool isDirty() const;
    // True after a load that could neither read nor preserve the existing file.
    bool overwriteBlocked() const;

private:
    static QJsonObject encodeTask(const TaskItem &task);
    static std::optional<TaskItem> decodeTask(const QJsonObject &object);
    static QJsonValue encodeDateTime(const QDateTime &dt);
    static QDateTime decodeDateTime(const QJsonValue &value);
    static QString timestampSuffix();

    QString m_filePath;
    QVector<TaskItem> m_tasks;
    LoadStatus m_lastLoadStatus = LoadStatus::Missing;
    int m_skippedRecords = 0;
    QString m_corruptBackupPath;
    QString m_lastError;
    bool m_dirty = false;
    bool m_overwriteBlocked = false;
};

} // namespace data
} // namespace desktodo
