#include "aggregator.h"
#include <algorithm>

using namespace std;

namespace
{
    bool by_period(const Assignment &a, const Assignment &b)
    {
        return a.period < b.period;
    }

    bool by_class(const Assignment &a, const Assignment &b)
    {
        return a.class_id < b.class_id;
    }

    void sort_days(map<string, DayAssignments> &view, MetricsCollector *metrics)
    {
        for (auto &entry : view)
        {
            for (const auto &day : DAYS)
            {
                auto &list = entry.second[day];
                stable_sort(list.begin(), list.end(), by_period);
                if (metrics)
                    metrics->record_sort();
            }
        }
    }
}

ScheduleAggregator::ScheduleAggregator()
{
    for (const auto &day : DAYS)
        result_.day_grid[day];
}

void ScheduleAggregator::add(const string &day, const Assignment &a)
{
    result_.day_grid[day][a.period].push_back(a);
    result_.class_summary[a.class_id][day].push_back(a);
    result_.teacher_summary[a.teacher_label()][day].push_back(a);
}

void ScheduleAggregator::finalize(MetricsCollector *metrics)
{
    for (const auto &day : DAYS)
    {
        for (auto &cell : result_.day_grid[day])
        {
            stable_sort(cell.second.begin(), cell.second.end(), by_class);
            if (metrics)
                metrics->record_sort();
        }
    }
    sort_days(result_.class_summary, metrics);
    sort_days(result_.teacher_summary, metrics);
}
