#pragma once

#include "timetable.h"
#include <chrono>

// Observes one generate() call. Never feeds back into assignment decisions.
class MetricsCollector
{
public:
    void start();

    void record_assignment(bool assigned);
    void record_sort() { ++sort_operations_; }
    void record_cache_hit() { ++cache_hits_; }
    void record_cache_miss() { ++cache_misses_; }

    int cache_hits() const { return cache_hits_; }
    int cache_misses() const { return cache_misses_; }

    // Stops the clock and derives counts that need the finished views.
    ScheduleMetrics finish(const ScheduleResult &result) const;

private:
    chrono::steady_clock::time_point started_{};
    int total_ = 0;
    int assigned_ = 0;
    int sort_operations_ = 0;
    int cache_hits_ = 0;
    int cache_misses_ = 0;
};
