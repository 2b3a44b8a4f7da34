#pragma once

#include <QDialog>

#include "desktodo/core/TaskStatistics.hpp"

class QLabel;
class QTableWidget;
class QListWidget;

namespace desktodo {
namespace ui {

class StatisticsDialog : public QDialog
{
    Q_OBJECT

public:
    explicit StatisticsDialog(QWidget *parent = nullptr);

    void setStatistics(const core::TaskStatistics &statistics);

private:
    QLabel *m_summaryLabel = nullptr;
    QTableWidget *m_categoryTable = nullptr;
    QListWidget *m_reminderList = nullptr;
};

} // namespace ui
} // namespace desktodo
