#pragma once

#include "timetable.h"
#include "schedule_audit.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

json assignment_to_json(const Assignment &a);
json schedule_to_json(const ScheduleResult &result);
json audit_to_json(const AuditReport &report);

// {"status": "success", "result": ..., "audit": ...}
json build_schedule_response(const ScheduleResult &result, const AuditReport &audit);
