#include "desktodo/data/JsonTaskStorage.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSaveFile>
#include <algorithm>

#include "desktodo/core/Logging.hpp"

namespace desktodo {
namespace data {

namespace {
constexpr auto BACKUP_TIMESTAMP_FORMAT = "yyyyMMdd_hhmmss";

QString prepareUid(const QUuid &id)
{
    return id.toString(QUuid::WithoutBraces);
}

QUuid parseUid(const QString &value)
{
    const QUuid id = QUuid::fromString(value.trimmed());
    if (id.isNull()) {
        return QUuid::createUuid();
    }
    return id;
}
} // namespace

JsonTaskStorage::JsonTaskStorage(QString filePath)
    : m_filePath(std::move(filePath))
{
    load();
}

const QString &JsonTaskStorage::filePath() const
{
    return m_filePath;
}

const QVector<TaskItem> &JsonTaskStorage::tasks() const
{
    return m_tasks;
}

int JsonTaskStorage::indexOf(const QUuid &id) const
{
    for (int i = 0; i < m_tasks.size(); ++i) {
        if (m_tasks.at(i).id == id) {
            return i;
        }
    }
    return -1;
}

LoadStatus JsonTaskStorage::load()
{
    m_tasks.clear();
    m_skippedRecords = 0;
    m_corruptBackupPath.clear();
    m_dirty = false;
    m_overwriteBlocked = false;

    QFile file(m_filePath);
    if (!file.exists()) {
        qCInfo(lcStorage) << "Task file does not exist yet:" << m_filePath;
        m_lastLoadStatus = LoadStatus::Missing;
        return m_lastLoadStatus;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        m_lastError = QObject::tr("%1 kann nicht gelesen werden: %2").arg(m_filePath, file.errorString());
        qCWarning(lcStorage) << "Cannot open task file" << m_filePath << file.errorString();
        m_lastLoadStatus = LoadStatus::Unreadable;
        m_overwriteBlocked = true;
        return m_lastLoadStatus;
    }
    const QByteArray payload = file.readAll();
    file.close();

    QJsonParseError parseError{};
    const QJsonDocument document = QJsonDocument::fromJson(payload, &parseError);
    if (parseError.error != QJsonParseError::NoError || !document.isArray()) {
        const QString reason = parseError.error != QJsonParseError::NoError
            ? parseError.errorString()
            : QStringLiteral("top level is not an array");
        qCWarning(lcStorage) << "Task file is corrupted:" << m_filePath << reason;

        const QString backupPath = QStringLiteral("%1.corrupt_%2").arg(m_filePath, timestampSuffix());
        if (QFile::copy(m_filePath, backupPath)) {
            m_corruptBackupPath = backupPath;
            qCInfo(lcStorage) << "Corrupted task file preserved as" << backupPath;
        } else {
            qCWarning(lcStorage) << "Could not preserve corrupted task file as" << backupPath;
            m_overwriteBlocked = true;
        }
        m_lastError = QObject::tr("%1 ist beschädigt: %2").arg(m_filePath, reason);
        m_lastLoadStatus = LoadStatus::Corrupted;
        return m_lastLoadStatus;
    }

    const QJsonArray records = document.array();
    m_tasks.reserve(records.size());
    for (const QJsonValue &record : records) {
        if (!record.isObject()) {
            ++m_skippedRecords;
            continue;
        }
        auto task = decodeTask(record.toObject());
        if (!task.has_value()) {
            ++m_skippedRecords;
            continue;
        }
        // Duplicate ids would break identity, keep the first occurrence's id.
        if (indexOf(task->id) >= 0) {
            task->id = QUuid::createUuid();
        }
        m_tasks.push_back(std::move(*task));
    }
    if (m_skippedRecords > 0) {
        qCWarning(lcStorage) << "Skipped" << m_skippedRecords << "invalid task records in" << m_filePath;
    }
    qCInfo(lcStorage) << "Loaded" << m_tasks.size() << "tasks from" << m_filePath;
    m_lastError.clear();
    m_lastLoadStatus = LoadStatus::Loaded;
    return m_lastLoadStatus;
}

bool JsonTaskStorage::save()
{
    if (m_filePath.isEmpty()) {
        m_lastError = QObject::tr("Kein Speicherort konfiguriert");
        m_dirty = true;
        return false;
    }
    // The file on disk was never read into m_tasks, writing now would replace its content.
    if (m_overwriteBlocked && QFileInfo::exists(m_filePath)) {
        m_lastError = QObject::tr("%1 wird nicht überschrieben, weil die Datei nicht gelesen werden konnte")
                          .arg(m_filePath);
        qCWarning(lcStorage) << "Refusing to overwrite unread task file" << m_filePath;
        m_dirty = true;
        return false;
    }

    QFileInfo info(m_filePath);
    QDir dir = info.dir();
    if (!dir.exists()) {
        if (!dir.mkpath(QStringLiteral("."))) {
            m_lastError = QObject::tr("Ordner %1 kann nicht erstellt werden").arg(dir.path());
            qCWarning(lcStorage) << "Cannot create data directory" << dir.path();
            m_dirty = true;
            return false;
        }
        qCInfo(lcStorage) << "Recreated data directory" << dir.path();
    }

    QJsonArray records;
    for (const TaskItem &task : qAsConst(m_tasks)) {
        records.append(encodeTask(task));
    }

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        m_lastError = QObject::tr("%1 kann nicht geschrieben werden: %2").arg(m_filePath, file.errorString());
        qCWarning(lcStorage) << "Cannot open task file for writing" << m_filePath << file.errorString();
        m_dirty = true;
        return false;
    }
    const QByteArray payload = QJsonDocument(records).toJson(QJsonDocument::Indented);
    if (file.write(payload) != payload.size() || !file.commit()) {
        m_lastError = QObject::tr("%1 kann nicht geschrieben werden: %2").arg(m_filePath, file.errorString());
        qCWarning(lcStorage) << "Writing task file failed" << m_filePath << file.errorString();
        m_dirty = true;
        return false;
    }

    m_lastError.clear();
    m_dirty = false;
    qCDebug(lcStorage) << "Saved" << m_tasks.size() << "tasks to" << m_filePath;
    return true;
}

TaskItem JsonTaskStorage::addOrUpdate(TaskItem task)
{
    if (task.id.isNull()) {
        task.id = QUuid::createUuid();
    }
    const int index = indexOf(task.id);
    if (index >= 0) {
        m_tasks[index] = task;
    } else {
        m_tasks.push_back(task);
    }
    save();
    return task;
}

bool JsonTaskStorage::insertAt(TaskItem task, int position)
{
    if (task.id.isNull() || indexOf(task.id) >= 0) {
        return false;
    }
    position = std::clamp(position, 0, static_cast<int>(m_tasks.size()));
    m_tasks.insert(position, std::move(task));
    save();
    return true;
}

bool JsonTaskStorage::remove(const QUuid &id)
{
    const int index = indexOf(id);
    if (index < 0) {
        return false;
    }
    m_tasks.removeAt(index);
    save();
    return true;
}

int JsonTaskStorage::removeIf(const std::function<bool(const TaskItem &)> &predicate)
{
    const auto before = m_tasks.size();
    m_tasks.erase(std::remove_if(m_tasks.begin(), m_tasks.end(), predicate), m_tasks.end());
    const int removed = static_cast<int>(before - m_tasks.size());
    if (removed > 0) {
        save();
    }
    return removed;
}

bool JsonTaskStorage::backup(const QString &suffix)
{
    if (!QFile::exists(m_filePath)) {
        qCInfo(lcStorage) << "Nothing to back up, task file does not exist";
        return true;
    }
    const QString backupPath = QStringLiteral("%1.backup_%2")
                                   .arg(m_filePath, suffix.isEmpty() ? timestampSuffix() : suffix);
    if (QFile::exists(backupPath) && !QFile::remove(backupPath)) {
        m_lastError = QObject::tr("Sicherung %1 kann nicht ersetzt werden").arg(backupPath);
        qCWarning(lcStorage) << "Cannot replace existing backup" << backupPath;
        return false;
    }
    if (!QFile::copy(m_filePath, backupPath)) {
        m_lastError = QObject::tr("Sicherung %1 fehlgeschlagen").arg(backupPath);
        qCWarning(lcStorage) << "Backup failed" << backupPath;
        return false;
    }
    qCInfo(lcStorage) << "Backup created" << backupPath;
    return true;
}

StorageFileInfo JsonTaskStorage::fileInfo() const
{
    StorageFileInfo result;
    result.path = m_filePath;
    const QFileInfo info(m_filePath);
    if (!info.exists()) {
        return result;
    }
    result.exists = true;
    result.size = info.size();
    result.modified = info.lastModified();
    return result;
}

LoadStatus JsonTaskStorage::lastLoadStatus() const
{
    return m_lastLoadStatus;
}

int JsonTaskStorage::skippedRecords() const
{
    return m_skippedRecords;
}

QString JsonTaskStorage::corruptBackupPath() const
{
    return m_corruptBackupPath;
}

QString JsonTaskStorage::lastError() const
{
    return m_lastError;
}

bool JsonTaskStorage::isDirty() const
{
    return m_dirty;
}

bool JsonTaskStorage::overwriteBlocked() const
{
    return m_overwriteBlocked;
}

QJsonObject JsonTaskStorage::encodeTask(const TaskItem &task)
{
    return QJsonObject{
        { QStringLiteral("id"), prepareUid(task.id) },
        { QStringLiteral("title"), task.title },
        { QStringLiteral("category"), task.category },
        { QStringLiteral("completed"), task.completed },
        { QStringLiteral("remind_at"), encodeDateTime(task.remindAt) },
        { QStringLiteral("created_at"), encodeDateTime(task.createdAt) },
        { QStringLiteral("completed_at"), encodeDateTime(task.completedAt) },
    };
}

std::optional<TaskItem> JsonTaskStorage::decodeTask(const QJsonObject &object)
{
    const QString title = object.value(QStringLiteral("title")).toString().trimmed();
    if (title.isEmpty()) {
        return std::nullopt;
    }
    TaskItem task;
    task.id = parseUid(object.value(QStringLiteral("id")).toString());
    task.title = title;
    task.category = object.value(QStringLiteral("category")).toString().trimmed();
    if (task.category.isEmpty()) {
        task.category = categories::general();
    }
    task.completed = object.value(QStringLiteral("completed")).toBool(false);
    task.remindAt = decodeDateTime(object.value(QStringLiteral("remind_at")));
    const QDateTime created = decodeDateTime(object.value(QStringLiteral("created_at")));
    if (created.isValid()) {
        task.createdAt = created;
    }
    task.completedAt = task.completed ? decodeDateTime(object.value(QStringLiteral("completed_at"))) : QDateTime();
    return task;
}

QJsonValue JsonTaskStorage::encodeDateTime(const QDateTime &dt)
{
    if (!dt.isValid()) {
        return QJsonValue(QJsonValue::Null);
    }
    return dt.toString(Qt::ISODateWithMs);
}

QDateTime JsonTaskStorage::decodeDateTime(const QJsonValue &value)
{
    if (!value.isString()) {
        return {};
    }
    return QDateTime::fromString(value.toString(), Qt::ISODateWithMs);
}

QString JsonTaskStorage::timestampSuffix()
{
    return QDateTime::currentDateTime().toString(QLatin1String(BACKUP_TIMESTAMP_FORMAT));
}

} // namespace data
} // namespace desktodo
