#pragma once

#include "timetable.h"
#include "metrics.h"
#include <unordered_map>

// Declared unavailability lookup, memoized for the lifetime of one run.
class AvailabilityFilter
{
public:
    AvailabilityFilter(const map<string, TeacherConstraints> &constraints, MetricsCollector *metrics = nullptr);

    bool is_unavailable(const string &teacher, const string &day, double period);
    bool is_available(const string &teacher, const string &day, double period)
    {
        return !is_unavailable(teacher, day, period);
    }

private:
    const map<string, TeacherConstraints> &constraints_;
    MetricsCollector *metrics_;
    unordered_map<string, bool> cache_; // "teacher#Mon|3"
};
