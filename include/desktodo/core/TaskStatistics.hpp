#pragma once

#include <QString>
#include <vector>

#include "desktodo/core/ReminderScheduler.hpp"
#include "desktodo/data/Task.hpp"

namespace desktodo {
namespace core {

struct CategoryStatistics
{
    QString category;
    int total = 0;
    int completed = 0;
    double completionRate = 0.0;
};

struct TaskStatistics
{
    static constexpr std::size_t MaxUpcomingReminders = 5;

    int total = 0;
    int completed = 0;
    int pending = 0;
    double completionRate = 0.0;
    std::vector<CategoryStatistics> categories;
    std::vector<ReminderEntry> upcomingReminders;
};

// Categories keep the order in which they first appear in tasks.
TaskStatistics computeStatistics(const std::vector<data::TaskItem> &tasks,
                                 const std::vector<ReminderEntry> &upcoming = {});

} // namespace core
} // namespace desktodo
