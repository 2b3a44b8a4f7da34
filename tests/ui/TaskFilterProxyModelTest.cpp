#include <QtTest/QtTest>

#include "desktodo/ui/models/TaskFilterProxyModel.hpp"
#include "desktodo/ui/models/TaskListModel.hpp"

using namespace desktodo;

class TaskFilterProxyModelTest : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void emptyFilterShowsAll();
    void matchesTitleCaseInsensitive();
    void matchesCategory();
    void trimsFilterText();
    void filtersByCompletion();

private:
    ui::TaskListModel m_model;
    ui::TaskFilterProxyModel m_proxy;
};

void TaskFilterProxyModelTest::init()
{
    auto done = data::makeTask(QStringLiteral("Steuererklärung abgeben"), data::categories::work());
    data::markCompleted(done);
    m_model.setTasks({ data::makeTask(QStringLiteral("Milch kaufen"), data::categories::life()),
                       done,
                       data::makeTask(QStringLiteral("Joggen"), data::categories::health()) });
    m_proxy.setSourceModel(&m_model);
    m_proxy.setFilterText(QString());
    m_proxy.setCompletionFilter(std::nullopt);
    m_proxy.setCategoryFilter(QString());
}

void TaskFilterProxyModelTest::emptyFilterShowsAll()
{
    QCOMPARE(m_proxy.rowCount(), 3);
    QVERIFY(!m_proxy.isFiltering());
}

void TaskFilterProxyModelTest::matchesTitleCaseInsensitive()
{
    m_proxy.setFilterText(QStringLiteral("MILCH"));
    QCOMPARE(m_proxy.rowCount(), 1);
    QCOMPARE(m_proxy.data(m_proxy.index(0, 0), ui::TaskListModel::TitleRole).toString(),
             QStringLiteral("Milch kaufen"));
    QVERIFY(m_proxy.isFiltering());

    m_proxy.setFilterText(QStringLiteral("gibt es nicht"));
    QCOMPARE(m_proxy.rowCount(), 0);
}

void TaskFilterProxyModelTest::matchesCategory()
{
    m_proxy.setFilterText(QStringLiteral("gesund"));
    QCOMPARE(m_proxy.rowCount(), 1);
    QCOMPARE(m_proxy.data(m_proxy.index(0, 0), ui::TaskListModel::TitleRole).toString(), QStringLiteral("Joggen"));

    m_proxy.setFilterText(QString());
    m_proxy.setCategoryFilter(data::categories::work());
    QCOMPARE(m_proxy.rowCount(), 1);
}

void TaskFilterProxyModelTest::trimsFilterText()
{
    m_proxy.setFilterText(QStringLiteral("   "));
    QCOMPARE(m_proxy.rowCount(), 3);
    QVERIFY(m_proxy.filterText().isEmpty());

    m_proxy.setFilterText(QStringLiteral("  joggen "));
    QCOMPARE(m_proxy.rowCount(), 1);
}

void TaskFilterProxyModelTest::filtersByCompletion()
{
    m_proxy.setCompletionFilter(true);
    QCOMPARE(m_proxy.rowCount(), 1);
    m_proxy.setCompletionFilter(false);
    QCOMPARE(m_proxy.rowCount(), 2);

    // Source updates flow through the active filter
    m_model.setTasks({ data::makeTask(QStringLiteral("Neu")) });
    QCOMPARE(m_proxy.rowCount(), 1);
}

QTEST_GUILESS_MAIN(TaskFilterProxyModelTest)
#include "TaskFilterProxyModelTest.moc"
