#pragma once

#include "timetable.h"
#include <unordered_map>
#include <unordered_set>

// Occupied (day, period, teacher) triples for one generation run.
// Callers check can() before occupy(); occupying twice is a no-op.
class ConflictTracker
{
public:
    bool can(const string &day, double period, const string &teacher) const;
    void occupy(const string &day, double period, const string &teacher);

    // Sorted for stable diagnostics output.
    set<string> busy_teachers(const string &day, double period) const;

    size_t occupied_count() const { return occupied_; }

private:
    // teacher -> set of slot keys
    unordered_map<string, unordered_set<string>> teacher_busy_;
    // slot key -> teachers
    unordered_map<string, set<string>> slot_busy_;
    size_t occupied_ = 0;
};
