#include <QtTest/QtTest>

#include "desktodo/core/TaskStatistics.hpp"

using namespace desktodo;

class TaskStatisticsTest : public QObject
{
    Q_OBJECT

private slots:
    void emptyListHasZeroRate();
    void countsAndRates();
    void categoriesKeepFirstAppearanceOrder();
    void upcomingRemindersAreCapped();
};

void TaskStatisticsTest::emptyListHasZeroRate()
{
    const auto stats = core::computeStatistics({});
    QCOMPARE(stats.total, 0);
    QCOMPARE(stats.completed, 0);
    QCOMPARE(stats.pending, 0);
    QCOMPARE(stats.completionRate, 0.0);
    QVERIFY(stats.categories.empty());
    QVERIFY(stats.upcomingReminders.empty());
}

void TaskStatisticsTest::countsAndRates()
{
    std::vector<data::TaskItem> tasks;
    for (int i = 0; i < 4; ++i) {
        auto task = data::makeTask(QStringLiteral("Task %1").arg(i), data::categories::work());
        if (i == 0) {
            data::markCompleted(task);
        }
        tasks.push_back(task);
    }

    const auto stats = core::computeStatistics(tasks);
    QCOMPARE(stats.total, 4);
    QCOMPARE(stats.completed, 1);
    QCOMPARE(stats.pending, 3);
    QCOMPARE(stats.completionRate, 25.0);
    QCOMPARE(stats.categories.size(), static_cast<std::size_t>(1));
    QCOMPARE(stats.categories.front().total, 4);
    QCOMPARE(stats.categories.front().completed, 1);
    QCOMPARE(stats.categories.front().completionRate, 25.0);
}

void TaskStatisticsTest::categoriesKeepFirstAppearanceOrder()
{
    std::vector<data::TaskItem> tasks;
    tasks.push_back(data::makeTask(QStringLiteral("a"), data::categories::study()));
    tasks.push_back(data::makeTask(QStringLiteral("b"), data::categories::general()));
    auto done = data::makeTask(QStringLiteral("c"), data::categories::study());
    data::markCompleted(done);
    tasks.push_back(done);

    const auto stats = core::computeStatistics(tasks);
    QCOMPARE(stats.categories.size(), static_cast<std::size_t>(2));
    QCOMPARE(stats.categories.at(0).category, data::categories::study());
    QCOMPARE(stats.categories.at(0).total, 2);
    QCOMPARE(stats.categories.at(0).completionRate, 50.0);
    QCOMPARE(stats.categories.at(1).category, data::categories::general());
    QCOMPARE(stats.categories.at(1).completionRate, 0.0);
}

void TaskStatisticsTest::upcomingRemindersAreCapped()
{
    std::vector<core::ReminderEntry> upcoming;
    const QDateTime base(QDate(2030, 1, 1), QTime(8, 0));
    for (int i = 0; i < 7; ++i) {
        upcoming.push_back({ QUuid::createUuid(), QStringLiteral("R%1").arg(i), base.addSecs(i * 60), false });
    }

    const auto stats = core::computeStatistics({}, upcoming);
    QCOMPARE(stats.upcomingReminders.size(), core::TaskStatistics::MaxUpcomingReminders);
    QCOMPARE(stats.upcomingReminders.front().title, QStringLiteral("R0"));
    QCOMPARE(stats.upcomingReminders.back().title, QStringLiteral("R4"));
}

QTEST_GUILESS_MAIN(TaskStatisticsTest)
#include "TaskStatisticsTest.moc"
