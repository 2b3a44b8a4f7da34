#include <QtTest/QtTest>

#include "desktodo/core/ReminderTime.hpp"

using namespace desktodo;

class ReminderTimeTest : public QObject
{
    Q_OBJECT

private slots:
    void parsesFormats_data();
    void parsesFormats();
    void rollsOverToTomorrow();
    void rejectsInvalidDate();
    void quickOptionsAreInFuture();
};

void ReminderTimeTest::parsesFormats_data()
{
    QTest::addColumn<QString>("timeText");
    QTest::addColumn<QDateTime>("expected");

    const QDate day(2030, 5, 1);
    QTest::newRow("24h") << QStringLiteral("14:30") << QDateTime(day, QTime(14, 30));
    QTest::newRow("single digit hour") << QStringLiteral("9:05") << QDateTime(day, QTime(9, 5));
    QTest::newRow("with seconds") << QStringLiteral("14:30:45") << QDateTime(day, QTime(14, 30));
    QTest::newRow("12h spaced") << QStringLiteral("2:30 PM") << QDateTime(day, QTime(14, 30));
    QTest::newRow("12h compact") << QStringLiteral("2:30PM") << QDateTime(day, QTime(14, 30));
    QTest::newRow("12h lowercase") << QStringLiteral("11:15 am") << QDateTime(day, QTime(11, 15));
    QTest::newRow("surrounding spaces") << QStringLiteral("  07:00 ") << QDateTime(day, QTime(7, 0));
    QTest::newRow("hour out of range") << QStringLiteral("25:00") << QDateTime();
    QTest::newRow("text") << QStringLiteral("morgen") << QDateTime();
    QTest::newRow("empty") << QString() << QDateTime();
}

void ReminderTimeTest::parsesFormats()
{
    QFETCH(QString, timeText);
    QFETCH(QDateTime, expected);

    const QDateTime now(QDate(2030, 4, 1), QTime(12, 0));
    const auto parsed = core::parseReminderTime(timeText, QStringLiteral("2030-05-01"), now);
    if (!expected.isValid()) {
        QVERIFY(!parsed.has_value());
        return;
    }
    QVERIFY(parsed.has_value());
    QCOMPARE(*parsed, expected);
}

void ReminderTimeTest::rollsOverToTomorrow()
{
    const QDateTime now(QDate(2024, 5, 1), QTime(15, 0));

    const auto later = core::parseReminderTime(QStringLiteral("16:00"), QString(), now);
    QVERIFY(later.has_value());
    QCOMPARE(*later, QDateTime(QDate(2024, 5, 1), QTime(16, 0)));

    const auto passed = core::parseReminderTime(QStringLiteral("14:00"), QString(), now);
    QVERIFY(passed.has_value());
    QCOMPARE(*passed, QDateTime(QDate(2024, 5, 2), QTime(14, 0)));

    const auto exactlyNow = core::parseReminderTime(QStringLiteral("15:00"), QString(), now);
    QVERIFY(exactlyNow.has_value());
    QCOMPARE(*exactlyNow, QDateTime(QDate(2024, 5, 2), QTime(15, 0)));

    // An explicit date is taken as given
    const auto explicitPast = core::parseReminderTime(QStringLiteral("14:00"), QStringLiteral("2024-05-01"), now);
    QVERIFY(explicitPast.has_value());
    QCOMPARE(*explicitPast, QDateTime(QDate(2024, 5, 1), QTime(14, 0)));
}

void ReminderTimeTest::rejectsInvalidDate()
{
    const QDateTime now(QDate(2024, 5, 1), QTime(15, 0));
    QVERIFY(!core::parseReminderTime(QStringLiteral("10:00"), QStringLiteral("2024-13-01"), now).has_value());
    QVERIFY(!core::parseReminderTime(QStringLiteral("10:00"), QStringLiteral("01.05.2024"), now).has_value());
}

void ReminderTimeTest::quickOptionsAreInFuture()
{
    const QDateTime morning(QDate(2024, 5, 1), QTime(10, 0));
    const auto all = core::quickReminderOptions(morning);
    QCOMPARE(all.size(), static_cast<std::size_t>(6));
    QCOMPARE(all.front().dateTime, morning.addSecs(5 * 60));
    QCOMPARE(all.back().dateTime, QDateTime(QDate(2024, 5, 2), QTime(9, 0)));

    const QDateTime evening(QDate(2024, 5, 1), QTime(18, 0));
    const auto later = core::quickReminderOptions(evening);
    QCOMPARE(later.size(), static_cast<std::size_t>(5));
    for (const auto &option : later) {
        QVERIFY(option.dateTime > evening);
        QVERIFY(!option.label.isEmpty());
    }
}

QTEST_GUILESS_MAIN(ReminderTimeTest)
#include "ReminderTimeTest.moc"
