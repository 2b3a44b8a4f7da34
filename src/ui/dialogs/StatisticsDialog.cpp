#include "desktodo/ui/dialogs/StatisticsDialog.hpp"

#include <QDialogButtonBox>
#include <QHeaderView>
#include <QLabel>
#include <QListWidget>
#include <QTableWidget>
#include <QVBoxLayout>

namespace desktodo {
namespace ui {

namespace {
QString percent(double rate)
{
    return QStringLiteral("%1 %").arg(rate, 0, 'f', 1);
}

QLabel *sectionTitle(const QString &text, QWidget *parent)
{
    auto *label = new QLabel(text, parent);
    QFont font = label->font();
    font.setBold(true);
    label->setFont(font);
    return label;
}
} // namespace

StatisticsDialog::StatisticsDialog(QWidget *parent)
    : QDialog(parent)
{
    setWindowTitle(tr("Statistiken"));
    resize(480, 460);
    auto *layout = new QVBoxLayout(this);
    layout->setSpacing(8);

    layout->addWidget(sectionTitle(tr("Übersicht"), this));
    m_summaryLabel = new QLabel(this);
    m_summaryLabel->setTextInteractionFlags(Qt::TextSelectableByMouse);
    layout->addWidget(m_summaryLabel);

    layout->addWidget(sectionTitle(tr("Nach Kategorie"), this));
    m_categoryTable = new QTableWidget(0, 3, this);
    m_categoryTable->setHorizontalHeaderLabels({ tr("Kategorie"), tr("Erledigt"), tr("Quote") });
    m_categoryTable->horizontalHeader()->setSectionResizeMode(0, QHeaderView::Stretch);
    m_categoryTable->verticalHeader()->setVisible(false);
    m_categoryTable->setEditTriggers(QAbstractItemView::NoEditTriggers);
    m_categoryTable->setSelectionMode(QAbstractItemView::NoSelection);
    layout->addWidget(m_categoryTable, 1);

    layout->addWidget(sectionTitle(tr("Nächste Erinnerungen"), this));
    m_reminderList = new QListWidget(this);
    m_reminderList->setSelectionMode(QAbstractItemView::NoSelection);
    layout->addWidget(m_reminderList, 1);

    auto *buttonBox = new QDialogButtonBox(QDialogButtonBox::Close, this);
    connect(buttonBox, &QDialogButtonBox::rejected, this, &QDialog::reject);
    layout->addWidget(buttonBox);
}

void StatisticsDialog::setStatistics(const core::TaskStatistics &statistics)
{
    m_summaryLabel->setText(tr("Gesamt: %1\nErledigt: %2\nOffen: %3\nAbschlussquote: %4")
                                .arg(statistics.total)
                                .arg(statistics.completed)
                                .arg(statistics.pending)
                                .arg(percent(statistics.completionRate)));

    m_categoryTable->setRowCount(static_cast<int>(statistics.categories.size()));
    int row = 0;
    for (const auto &category : statistics.categories) {
        m_categoryTable->setItem(row, 0, new QTableWidgetItem(category.category));
        m_categoryTable->setItem(row, 1, new QTableWidgetItem(QStringLiteral("%1/%2").arg(category.completed).arg(category.total)));
        m_categoryTable->setItem(row, 2, new QTableWidgetItem(percent(category.completionRate)));
        ++row;
    }

    m_reminderList->clear();
    if (statistics.upcomingReminders.empty()) {
        m_reminderList->addItem(tr("Keine anstehenden Erinnerungen"));
        return;
    }
    for (const auto &entry : statistics.upcomingReminders) {
        m_reminderList->addItem(QStringLiteral("%1  %2")
                                    .arg(entry.remindAt.toString(QStringLiteral("dd.MM. hh:mm")), entry.title));
    }
}

} // namespace ui
} // namespace desktodo
