#include <QtTest/QtTest>

#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>

#include "desktodo/data/JsonTaskStorage.hpp"

using namespace desktodo::data;

namespace {

void writeFile(const QString &path, const QByteArray &content)
{
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
    file.write(content);
}

QByteArray readFile(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return {};
    }
    return file.readAll();
}

} // namespace

class JsonTaskStorageTest : public QObject
{
    Q_OBJECT

private slots:
    void roundTripPreservesTasks();
    void writesExpectedFormat();
    void missingFileStartsEmpty();
    void corruptedFileIsBackedUp();
    void nonArrayIsCorrupted();
    void skipsInvalidRecords();
    void duplicateIdsGetFreshIds();
    void recreatesDeletedDirectory();
    void unwritablePathMarksDirty();
    void unreadableFileIsNotOverwritten();
    void directoryInPlaceOfFileIsUnreadable();
    void backupCopiesFile();
};

void JsonTaskStorageTest::roundTripPreservesTasks()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("tasks.json"));

    JsonTaskStorage storage(path);
    auto plain = makeTask(QStringLiteral("Milch kaufen"), categories::life());
    auto done = makeTask(QStringLiteral("Bericht"), categories::work());
    markCompleted(done, QDateTime(QDate(2024, 3, 2), QTime(9, 15, 30, 250)));
    auto reminded = makeTask(QStringLiteral("Zahnarzt"), categories::health());
    setReminder(reminded, QDateTime(QDate(2030, 1, 1), QTime(8, 0)));
    storage.addOrUpdate(plain);
    storage.addOrUpdate(done);
    storage.addOrUpdate(reminded);
    QVERIFY(!storage.isDirty());

    JsonTaskStorage reloaded(path);
    QCOMPARE(reloaded.lastLoadStatus(), LoadStatus::Loaded);
    QCOMPARE(reloaded.tasks().size(), 3);
    QVERIFY(reloaded.tasks() == storage.tasks());
    QCOMPARE(reloaded.skippedRecords(), 0);
}

void JsonTaskStorageTest::writesExpectedFormat()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("tasks.json"));

    JsonTaskStorage storage(path);
    const auto stored = storage.addOrUpdate(makeTask(QStringLiteral("Lesen"), categories::study()));

    const QJsonDocument document = QJsonDocument::fromJson(readFile(path));
    QVERIFY(document.isArray());
    QCOMPARE(document.array().size(), 1);
    const QJsonObject record = document.array().first().toObject();
    QCOMPARE(record.value(QStringLiteral("id")).toString(), stored.id.toString(QUuid::WithoutBraces));
    QCOMPARE(record.value(QStringLiteral("title")).toString(), QStringLiteral("Lesen"));
    QCOMPARE(record.value(QStringLiteral("category")).toString(), categories::study());
    QCOMPARE(record.value(QStringLiteral("completed")).toBool(true), false);
    QVERIFY(record.value(QStringLiteral("remind_at")).isNull());
    QVERIFY(record.value(QStringLiteral("completed_at")).isNull());
    QVERIFY(record.value(QStringLiteral("created_at")).isString());
}

void JsonTaskStorageTest::missingFileStartsEmpty()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("tasks.json"));

    JsonTaskStorage storage(path);
    QCOMPARE(storage.lastLoadStatus(), LoadStatus::Missing);
    QVERIFY(storage.tasks().isEmpty());
    QVERIFY(!QFile::exists(path));
    QVERIFY(!storage.fileInfo().exists);
}

void JsonTaskStorageTest::corruptedFileIsBackedUp()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("tasks.json"));
    const QByteArray garbage("[{\"title\": \"kaputt\"");
    writeFile(path, garbage);

    JsonTaskStorage storage(path);
    QCOMPARE(storage.lastLoadStatus(), LoadStatus::Corrupted);
    QVERIFY(storage.tasks().isEmpty());
    QVERIFY(!storage.lastError().isEmpty());

    const QString backup = storage.corruptBackupPath();
    QVERIFY(backup.startsWith(path + QStringLiteral(".corrupt_")));
    QCOMPARE(readFile(backup), garbage);

    // Still usable afterwards
    storage.addOrUpdate(makeTask(QStringLiteral("Neu")));
    QVERIFY(!storage.isDirty());
    JsonTaskStorage reloaded(path);
    QCOMPARE(reloaded.lastLoadStatus(), LoadStatus::Loaded);
    QCOMPARE(reloaded.tasks().size(), 1);
}

void JsonTaskStorageTest::nonArrayIsCorrupted()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("tasks.json"));
    writeFile(path, "{\"title\": \"Objekt statt Liste\"}");

    JsonTaskStorage storage(path);
    QCOMPARE(storage.lastLoadStatus(), LoadStatus::Corrupted);
    QVERIFY(storage.tasks().isEmpty());
    QVERIFY(QFile::exists(storage.corruptBackupPath()));
}

void JsonTaskStorageTest::skipsInvalidRecords()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("tasks.json"));
    writeFile(path,
              "[ 42,"
              "  {\"title\": \"   \"},"
              "  {\"id\": \"not-a-uuid\", \"title\": \"Gültig\", \"completed\": true,"
              "   \"completed_at\": \"2024-01-02T03:04:05.000\"},"
              "  {\"title\": \"Ohne Kategorie\", \"remind_at\": \"kein Datum\"} ]");

    JsonTaskStorage storage(path);
    QCOMPARE(storage.lastLoadStatus(), LoadStatus::Loaded);
    QCOMPARE(storage.skippedRecords(), 2);
    QCOMPARE(storage.tasks().size(), 2);

    const auto &valid = storage.tasks().at(0);
    QVERIFY(!valid.id.isNull());
    QCOMPARE(valid.title, QStringLiteral("Gültig"));
    QVERIFY(valid.completed);
    QCOMPARE(valid.completedAt, QDateTime(QDate(2024, 1, 2), QTime(3, 4, 5)));

    const auto &fallback = storage.tasks().at(1);
    QCOMPARE(fallback.category, categories::general());
    QVERIFY(!hasReminder(fallback));
}

void JsonTaskStorageTest::duplicateIdsGetFreshIds()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("tasks.json"));
    const QString id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    writeFile(path,
              QStringLiteral("[{\"id\": \"%1\", \"title\": \"Eins\"}, {\"id\": \"%1\", \"title\": \"Zwei\"}]")
                  .arg(id)
                  .toUtf8());

    JsonTaskStorage storage(path);
    QCOMPARE(storage.tasks().size(), 2);
    QCOMPARE(storage.tasks().at(0).id, QUuid::fromString(id));
    QVERIFY(storage.tasks().at(1).id != storage.tasks().at(0).id);
}

void JsonTaskStorageTest::recreatesDeletedDirectory()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString dataDir = dir.filePath(QStringLiteral("data"));
    QVERIFY(QDir().mkpath(dataDir));
    const QString path = QDir(dataDir).filePath(QStringLiteral("tasks.json"));

    JsonTaskStorage storage(path);
    storage.addOrUpdate(makeTask(QStringLiteral("Vorher")));
    QVERIFY(QFile::exists(path));

    QVERIFY(QDir(dataDir).removeRecursively());
    QVERIFY(!QFile::exists(path));

    storage.addOrUpdate(makeTask(QStringLiteral("Nachher")));
    QVERIFY(!storage.isDirty());
    QVERIFY(QFile::exists(path));

    JsonTaskStorage reloaded(path);
    QCOMPARE(reloaded.tasks().size(), 2);
}

void JsonTaskStorageTest::unwritablePathMarksDirty()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    // A regular file where the data directory should be
    const QString blocker = dir.filePath(QStringLiteral("blocker"));
    writeFile(blocker, "x");
    const QString path = QDir(blocker).filePath(QStringLiteral("tasks.json"));

    JsonTaskStorage storage(path);
    const auto task = storage.addOrUpdate(makeTask(QStringLiteral("Nicht verlieren")));
    QVERIFY(storage.isDirty());
    QVERIFY(!storage.lastError().isEmpty());
    QCOMPARE(storage.tasks().size(), 1);
    QCOMPARE(storage.tasks().first().id, task.id);
    QVERIFY(!storage.save());

    QVERIFY(QFile::remove(blocker));
    QVERIFY(storage.save());
    QVERIFY(!storage.isDirty());
    QVERIFY(storage.lastError().isEmpty());

    JsonTaskStorage reloaded(path);
    QCOMPARE(reloaded.tasks().size(), 1);
}

void JsonTaskStorageTest::unreadableFileIsNotOverwritten()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("tasks.json"));
    {
        JsonTaskStorage storage(path);
        storage.addOrUpdate(makeTask(QStringLiteral("Eins")));
        storage.addOrUpdate(makeTask(QStringLiteral("Zwei")));
        storage.addOrUpdate(makeTask(QStringLiteral("Drei")));
    }
    const QByteArray original = readFile(path);
    QVERIFY(QFile::setPermissions(path, QFileDevice::WriteOwner));
    QFile readCheck(path);
    if (readCheck.open(QIODevice::ReadOnly)) {
        QFile::setPermissions(path, QFileDevice::ReadOwner | QFileDevice::WriteOwner);
        QSKIP("File permissions are not enforced for this user");
    }

    JsonTaskStorage storage(path);
    QCOMPARE(storage.lastLoadStatus(), LoadStatus::Unreadable);
    QVERIFY(storage.overwriteBlocked());
    QVERIFY(storage.tasks().isEmpty());

    storage.addOrUpdate(makeTask(QStringLiteral("Neu")));
    QVERIFY(storage.isDirty());
    QVERIFY(!storage.lastError().isEmpty());
    QCOMPARE(storage.tasks().size(), 1);

    QVERIFY(QFile::setPermissions(path, QFileDevice::ReadOwner | QFileDevice::WriteOwner));
    QCOMPARE(readFile(path), original);

    QCOMPARE(storage.load(), LoadStatus::Loaded);
    QVERIFY(!storage.overwriteBlocked());
    QCOMPARE(storage.tasks().size(), 3);
}

void JsonTaskStorageTest::directoryInPlaceOfFileIsUnreadable()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("tasks.json"));
    QVERIFY(QDir(dir.path()).mkdir(QStringLiteral("tasks.json")));
    writeFile(QDir(path).filePath(QStringLiteral("inhalt.txt")), "bleibt");

    JsonTaskStorage storage(path);
    QCOMPARE(storage.lastLoadStatus(), LoadStatus::Unreadable);
    QVERIFY(storage.overwriteBlocked());
    QVERIFY(!storage.lastError().isEmpty());

    QVERIFY(!storage.save());
    QVERIFY(storage.isDirty());
    QVERIFY(storage.lastError().contains(path));
    QCOMPARE(readFile(QDir(path).filePath(QStringLiteral("inhalt.txt"))), QByteArray("bleibt"));
}

void JsonTaskStorageTest::backupCopiesFile()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("tasks.json"));

    JsonTaskStorage storage(path);
    QVERIFY(storage.backup(QStringLiteral("leer")));
    QVERIFY(!QFile::exists(path + QStringLiteral(".backup_leer")));

    storage.addOrUpdate(makeTask(QStringLiteral("Sichern")));
    QVERIFY(storage.backup(QStringLiteral("test")));
    const QString backup = path + QStringLiteral(".backup_test");
    QCOMPARE(readFile(backup), readFile(path));

    // Existing backup is replaced
    storage.addOrUpdate(makeTask(QStringLiteral("Mehr")));
    QVERIFY(storage.backup(QStringLiteral("test")));
    QCOMPARE(readFile(backup), readFile(path));

    const StorageFileInfo info = storage.fileInfo();
    QVERIFY(info.exists);
    QVERIFY(info.size > 0);
    QCOMPARE(info.path, path);
}

QTEST_GUILESS_MAIN(JsonTaskStorageTest)
#include "JsonTaskStorageTest.moc"
