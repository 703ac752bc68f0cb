#pragma once

#include "timetable.h"
#include "metrics.h"

// Folds emitted assignments into the three read views of a ScheduleResult.
class ScheduleAggregator
{
public:
    ScheduleAggregator();

    void add(const string &day, const Assignment &a);

    // Stable-sorts every list: grid cells by class id, class and teacher
    // days by period. Classes and teachers get an entry for every day.
    void finalize(MetricsCollector *metrics);

    const ScheduleResult &result() const { return result_; }
    ScheduleResult release() { return std::move(result_); }

private:
    ScheduleResult result_;
};
