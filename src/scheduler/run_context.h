#pragma once

#include "timetable.h"
#include "availability.h"
#include "conflict_tracker.h"
#include "homeroom.h"
#include "metrics.h"
#include <unordered_map>

// Everything a single generate() call mutates. Built fresh per call and
// passed down explicitly, so independent calls never share state.
struct RunContext
{
    explicit RunContext(const SlotConfiguration &cfg)
        : config(cfg), availability(cfg.constraints, &metrics) {}

    RunContext(const RunContext &) = delete;
    RunContext &operator=(const RunContext &) = delete;

    const SlotConfiguration &config;
    HomeroomMap homerooms;
    ConflictTracker tracker;
    MetricsCollector metrics;
    AvailabilityFilter availability;
    unordered_map<string, int> loads; // across all roles
    vector<string> warnings;

    int load_of(const string &teacher) const
    {
        auto it = loads.find(teacher);
        return it == loads.end() ? 0 : it->second;
    }

    bool is_free(const string &teacher, const string &day, double period)
    {
        return availability.is_available(teacher, day, period) && tracker.can(day, period, teacher);
    }

    void commit(const string &teacher, const string &day, double period)
    {
        tracker.occupy(day, period, teacher);
        ++loads[teacher];
    }
};
