#pragma once

#include "timetable.h"

struct AuditViolation
{
    string kind; // double_booking, korean_self, foreign_round4, ...
    string message;
};

struct RoleTally
{
    int homeroom = 0;
    int korean = 0;
    int foreign = 0;
    int total = 0;
};

struct FairnessReport
{
    map<string, RoleTally> per_teacher;
    RoleTally deviation; // max - min of each column
};

struct AuditReport
{
    vector<AuditViolation> violations;
    FairnessReport fairness;

    bool ok() const { return violations.empty(); }
};

// Teaching sessions per teacher (exams and unassigned slots excluded).
// Every pool teacher is listed, including those with no sessions.
FairnessReport build_fairness_report(const SlotConfiguration &config, const ScheduleResult &result);

// Re-checks a generated result against the configuration it came from.
AuditReport audit_schedule(const SlotConfiguration &config, const ScheduleResult &result);
