#include "schedule_json.h"

using namespace std;

namespace
{
    json day_lists_to_json(const DayAssignments &days)
    {
        json jd = json::object();
        for (const auto &day : DAYS)
        {
            jd[day] = json::array();
            auto it = days.find(day);
            if (it == days.end())
                continue;
            for (const auto &a : it->second)
                jd[day].push_back(assignment_to_json(a));
        }
        return jd;
    }

    json tally_to_json(const RoleTally &t)
    {
        return json{{"H", t.homeroom}, {"K", t.korean}, {"F", t.foreign}, {"total", t.total}};
    }
}

json assignment_to_json(const Assignment &a)
{
    json ja;
    ja["class_id"] = a.class_id;
    ja["round"] = a.round;
    ja["period"] = a.period;
    ja["time"] = a.time;
    ja["role"] = role_code(a.role);
    if (a.teacher)
        ja["teacher"] = *a.teacher;
    else
        ja["teacher"] = nullptr;
    ja["unassigned"] = !a.assigned();
    return ja;
}

json schedule_to_json(const ScheduleResult &result)
{
    json jout;

    jout["class_summary"] = json::object();
    for (const auto &entry : result.class_summary)
        jout["class_summary"][entry.first] = day_lists_to_json(entry.second);

    jout["teacher_summary"] = json::object();
    for (const auto &entry : result.teacher_summary)
        jout["teacher_summary"][entry.first] = day_lists_to_json(entry.second);

    // object keys would reorder days and stringify periods, so use arrays
    jout["day_grid"] = json::array();
    for (const auto &day : DAYS)
    {
        json jday;
        jday["day"] = day;
        jday["periods"] = json::array();
        auto it = result.day_grid.find(day);
        if (it != result.day_grid.end())
        {
            for (const auto &cell : it->second)
            {
                json jcell;
                jcell["period"] = cell.first;
                jcell["assignments"] = json::array();
                for (const auto &a : cell.second)
                    jcell["assignments"].push_back(assignment_to_json(a));
                jday["periods"].push_back(jcell);
            }
        }
        jout["day_grid"].push_back(jday);
    }

    jout["warnings"] = result.warnings;

    jout["homerooms"] = json::object();
    for (const auto &entry : result.homerooms)
    {
        jout["homerooms"][entry.first] = {
            {"teacher", entry.second.teacher},
            {"resolved", entry.second.resolved},
            {"fixed", entry.second.fixed}};
    }

    const ScheduleMetrics &m = result.metrics;
    jout["metrics"] = {
        {"generation_time_ms", m.generation_time_ms},
        {"total_assignments", m.total_assignments},
        {"assigned_count", m.assigned_count},
        {"unassigned_count", m.unassigned_count},
        {"warnings_count", m.warnings_count},
        {"teachers_count", m.teachers_count},
        {"classes_count", m.classes_count},
        {"sort_operations", m.sort_operations},
        {"cache_hits", m.cache_hits},
        {"cache_misses", m.cache_misses},
        {"cache_hit_rate", m.cache_hit_rate}};
    return jout;
}

json audit_to_json(const AuditReport &report)
{
    json ja;
    ja["ok"] = report.ok();
    ja["violations"] = json::array();
    for (const auto &v : report.violations)
        ja["violations"].push_back({{"kind", v.kind}, {"message", v.message}});

    ja["fairness"]["per_teacher"] = json::object();
    for (const auto &entry : report.fairness.per_teacher)
        ja["fairness"]["per_teacher"][entry.first] = tally_to_json(entry.second);
    ja["fairness"]["deviation"] = tally_to_json(report.fairness.deviation);
    return ja;
}

json build_schedule_response(const ScheduleResult &result, const AuditReport &audit)
{
    json jout;
    jout["status"] = "success";
    jout["result"] = schedule_to_json(result);
    jout["audit"] = audit_to_json(audit);
    return jout;
}
