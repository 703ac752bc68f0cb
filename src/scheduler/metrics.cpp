#include "metrics.h"
#include <cmath>

using namespace std;

void MetricsCollector::start()
{
    started_ = chrono::steady_clock::now();
    total_ = 0;
    assigned_ = 0;
    sort_operations_ = 0;
    cache_hits_ = 0;
    cache_misses_ = 0;
}

void MetricsCollector::record_assignment(bool assigned)
{
    ++total_;
    if (assigned)
        ++assigned_;
}

ScheduleMetrics MetricsCollector::finish(const ScheduleResult &result) const
{
    ScheduleMetrics m;
    auto elapsed = chrono::steady_clock::now() - started_;
    m.generation_time_ms = chrono::duration<double, milli>(elapsed).count();

    m.total_assignments = total_;
    m.assigned_count = assigned_;
    m.unassigned_count = total_ - assigned_;
    m.warnings_count = (int)result.warnings.size();

    int teachers = 0;
    for (const auto &entry : result.teacher_summary)
        if (entry.first != UNASSIGNED_LABEL)
            ++teachers;
    m.teachers_count = teachers;
    m.classes_count = (int)result.class_summary.size();

    m.sort_operations = sort_operations_;
    m.cache_hits = cache_hits_;
    m.cache_misses = cache_misses_;
    int lookups = cache_hits_ + cache_misses_;
    m.cache_hit_rate = lookups > 0 ? (int)lround(100.0 * cache_hits_ / lookups) : 0;
    return m;
}
