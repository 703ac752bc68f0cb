#pragma once

#include "run_context.h"

// Proctoring slots for one round on one day, in class order. Round 1 has
// none. With custom markers for the day every class gets one exam per
// marker; otherwise one exam anchored at the round's first period.
// The proctor is the homeroom owner. The conflict tracker is neither
// consulted nor updated.
vector<Assignment> place_exams(RunContext &ctx, int round, const vector<string> &classes, const string &day);

string exam_between_label(double marker);
