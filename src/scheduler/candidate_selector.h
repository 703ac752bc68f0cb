#pragma once

#include "run_context.h"

// The class's own homeroom owner, or nothing when that owner is unresolved,
// unavailable or already teaching. Never substitutes another teacher.
optional<string> pick_homeroom_teacher(RunContext &ctx, const string &class_id, const string &day, double period);

// Homeroom/Korean pool, plus other classes' homeroom owners when enabled.
// The class's own homeroom owner is never a candidate.
optional<string> pick_korean_teacher(RunContext &ctx, const string &class_id, const string &day, double period);

// Foreign pool. Callers must not ask for round 4.
optional<string> pick_foreign_teacher(RunContext &ctx, const string &day, double period);

// Dispatches on role; Foreign in round 4 and Exam always yield nothing.
optional<string> select_candidate(RunContext &ctx, Role role, int round,
                                  const string &class_id, const string &day, double period);

// Ascending load, then name.
void order_by_fairness(vector<string> &candidates, const RunContext &ctx);
