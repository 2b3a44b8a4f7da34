#include <QtTest/QtTest>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>

#include "desktodo/data/DataProvider.hpp"
#include "desktodo/data/FileTaskRepository.hpp"
#include "desktodo/data/InMemoryTaskRepository.hpp"
#include "desktodo/data/JsonTaskStorage.hpp"

using namespace desktodo::data;

class FileTaskRepositoryTest : public QObject
{
    Q_OBJECT

private slots:
    void writesThroughOnEveryMutation();
    void updateUnknownTaskFails();
    void reloadPicksUpExternalChanges();
    void lastErrorOnlyWhileDirty();
    void unsavedChangesReportedBeforeReload();
    void dataProviderCreatesDirectory();
    void dataProviderReportsUncreatableDirectory();
};

void FileTaskRepositoryTest::writesThroughOnEveryMutation()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("tasks.json"));
    FileTaskRepository repo(std::make_shared<JsonTaskStorage>(path));

    const auto first = repo.addTask(makeTask(QStringLiteral("Eins")));
    const auto second = repo.addTask(makeTask(QStringLiteral("Zwei")));
    QCOMPARE(JsonTaskStorage(path).tasks().size(), 2);

    auto changed = second;
    markCompleted(changed);
    QVERIFY(repo.updateTask(changed));
    QVERIFY(JsonTaskStorage(path).tasks().at(1).completed);

    QVERIFY(repo.removeTask(first.id));
    QCOMPARE(JsonTaskStorage(path).tasks().size(), 1);

    QVERIFY(repo.restoreTask(first, 0));
    QCOMPARE(JsonTaskStorage(path).tasks().first().id, first.id);

    QCOMPARE(repo.removeCompleted(), 1);
    const JsonTaskStorage reloaded(path);
    QCOMPARE(reloaded.tasks().size(), 1);
    QCOMPARE(reloaded.tasks().first().title, QStringLiteral("Eins"));
}

void FileTaskRepositoryTest::updateUnknownTaskFails()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("tasks.json"));
    FileTaskRepository repo(std::make_shared<JsonTaskStorage>(path));

    QVERIFY(!repo.updateTask(makeTask(QStringLiteral("Fremd"))));
    QVERIFY(repo.fetchTasks().empty());
    QVERIFY(!QFile::exists(path));
}

void FileTaskRepositoryTest::reloadPicksUpExternalChanges()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("tasks.json"));
    FileTaskRepository repo(std::make_shared<JsonTaskStorage>(path));
    repo.addTask(makeTask(QStringLiteral("Lokal")));

    {
        JsonTaskStorage other(path);
        other.addOrUpdate(makeTask(QStringLiteral("Extern")));
    }
    QCOMPARE(repo.fetchTasks().size(), static_cast<std::size_t>(1));

    repo.reload();
    const auto tasks = repo.fetchTasks();
    QCOMPARE(tasks.size(), static_cast<std::size_t>(2));
    QCOMPARE(tasks.back().title, QStringLiteral("Extern"));
}

void FileTaskRepositoryTest::lastErrorOnlyWhileDirty()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString blocker = dir.filePath(QStringLiteral("blocker"));
    {
        QFile file(blocker);
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write("x");
    }
    auto storage = std::make_shared<JsonTaskStorage>(QDir(blocker).filePath(QStringLiteral("tasks.json")));
    FileTaskRepository repo(storage);
    QVERIFY(repo.lastError().isEmpty());

    repo.addTask(makeTask(QStringLiteral("Bleibt im Speicher")));
    QVERIFY(!repo.lastError().isEmpty());
    QCOMPARE(repo.fetchTasks().size(), static_cast<std::size_t>(1));

    QVERIFY(QFile::remove(blocker));
    repo.addTask(makeTask(QStringLiteral("Jetzt klappt es")));
    QVERIFY(repo.lastError().isEmpty());
    QCOMPARE(JsonTaskStorage(storage->filePath()).tasks().size(), 2);
}

void FileTaskRepositoryTest::unsavedChangesReportedBeforeReload()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString blocker = dir.filePath(QStringLiteral("blocker"));
    {
        QFile file(blocker);
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write("x");
    }
    FileTaskRepository repo(std::make_shared<JsonTaskStorage>(QDir(blocker).filePath(QStringLiteral("tasks.json"))));
    QVERIFY(!repo.hasUnsavedChanges());

    repo.addTask(makeTask(QStringLiteral("Nur im Speicher")));
    QVERIFY(repo.hasUnsavedChanges());
    QCOMPARE(repo.fetchTasks().size(), static_cast<std::size_t>(1));

    // Reloading drops what never reached the disk
    repo.reload();
    QVERIFY(!repo.hasUnsavedChanges());
    QVERIFY(repo.fetchTasks().empty());

    InMemoryTaskRepository memory;
    memory.addTask(makeTask(QStringLiteral("Flüchtig")));
    QVERIFY(!memory.hasUnsavedChanges());
}

void FileTaskRepositoryTest::dataProviderCreatesDirectory()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("nested/data/tasks.json"));

    DataProvider provider(path);
    QVERIFY(provider.startupError().isEmpty());
    QVERIFY(QDir(dir.filePath(QStringLiteral("nested/data"))).exists());
    QCOMPARE(provider.storage().filePath(), QFileInfo(path).absoluteFilePath());
    QCOMPARE(provider.storage().lastLoadStatus(), LoadStatus::Missing);

    provider.taskRepository().addTask(makeTask(QStringLiteral("Start")));
    QVERIFY(QFile::exists(path));
}

void FileTaskRepositoryTest::dataProviderReportsUncreatableDirectory()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString blocker = dir.filePath(QStringLiteral("blocker"));
    {
        QFile file(blocker);
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write("x");
    }
    const QString path = QDir(blocker).filePath(QStringLiteral("data/tasks.json"));

    DataProvider provider(path);
    QVERIFY(!provider.startupError().isEmpty());
    QVERIFY(provider.startupError().contains(QStringLiteral("blocker")));
    QCOMPARE(provider.storage().lastLoadStatus(), LoadStatus::Missing);

    provider.taskRepository().addTask(makeTask(QStringLiteral("Bleibt im Speicher")));
    QVERIFY(provider.taskRepository().hasUnsavedChanges());
    QCOMPARE(provider.taskRepository().fetchTasks().size(), static_cast<std::size_t>(1));
}

QTEST_GUILESS_MAIN(FileTaskRepositoryTest)
#include "FileTaskRepositoryTest.moc"
