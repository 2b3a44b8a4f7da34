#include "desktodo/core/TaskStatistics.hpp"

#include <QHash>
#include <algorithm>

namespace desktodo {
namespace core {

namespace {
double percentage(int part, int whole)
{
    if (whole <= 0) {
        return 0.0;
    }
    return static_cast<double>(part) * 100.0 / static_cast<double>(whole);
}
} // namespace

TaskStatistics computeStatistics(const std::vector<data::TaskItem> &tasks, const std::vector<ReminderEntry> &upcoming)
{
    TaskStatistics stats;
    QHash<QString, std::size_t> categoryIndex;

    for (const auto &task : tasks) {
        ++stats.total;
        if (task.completed) {
            ++stats.completed;
        }

        auto it = categoryIndex.constFind(task.category);
        std::size_t index = 0;
        if (it == categoryIndex.constEnd()) {
            index = stats.categories.size();
            categoryIndex.insert(task.category, index);
            stats.categories.push_back({ task.category, 0, 0, 0.0 });
        } else {
            index = it.value();
        }
        auto &category = stats.categories[index];
        ++category.total;
        if (task.completed) {
            ++category.completed;
        }
    }

    stats.pending = stats.total - stats.completed;
    stats.completionRate = percentage(stats.completed, stats.total);
    for (auto &category : stats.categories) {
        category.completionRate = percentage(category.completed, category.total);
    }

    const std::size_t upcomingCount = std::min(upcoming.size(), TaskStatistics::MaxUpcomingReminders);
    stats.upcomingReminders.assign(upcoming.begin(), upcoming.begin() + static_cast<long>(upcomingCount));
    return stats;
}

} // namespace core
} // namespace desktodo
