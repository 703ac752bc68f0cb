#pragma once

#include "timetable.h"

// Runs one greedy pass over rounds 1..4, Mon/Wed/Fri and every class of
// the round, and returns the aggregated views with warnings and metrics.
// Throws InvalidConfigError before doing any work when the configuration
// is rejected. Slots nobody can fill become unassigned assignments plus a
// warning. Safe to call concurrently: all mutable state is per call.
ScheduleResult generate(const SlotConfiguration &config);
