#include "schedule_audit.h"
#include "homeroom.h"
#include <algorithm>
#include <functional>

using namespace std;

namespace
{
    template <typename Fn>
    void for_each_assignment(const ScheduleResult &result, Fn fn)
    {
        for (const auto &day : DAYS)
        {
            auto it = result.day_grid.find(day);
            if (it == result.day_grid.end())
                continue;
            for (const auto &cell : it->second)
                for (const auto &a : cell.second)
                    fn(day, a);
        }
    }

    void add_violation(AuditReport &report, const string &kind, const string &day, const Assignment &a,
                       const string &detail)
    {
        report.violations.push_back({kind, "[" + day + " " + format_period(a.period) + "] " + a.class_id + " " +
                                               role_code(a.role) + " " + a.teacher_label() + ": " + detail});
    }

    int column_spread(const map<string, RoleTally> &tallies, function<int(const RoleTally &)> col)
    {
        if (tallies.empty())
            return 0;
        int lo = col(tallies.begin()->second), hi = lo;
        for (const auto &entry : tallies)
        {
            lo = min(lo, col(entry.second));
            hi = max(hi, col(entry.second));
        }
        return hi - lo;
    }
}

FairnessReport build_fairness_report(const SlotConfiguration &config, const ScheduleResult &result)
{
    FairnessReport report;
    for (const auto &t : config.pools.homeroom_korean)
        report.per_teacher[t];
    for (const auto &t : config.pools.foreign)
        report.per_teacher[t];

    for_each_assignment(result, [&](const string &, const Assignment &a)
                        {
        if (!a.assigned() || a.role == Role::Exam)
            return;
        RoleTally &tally = report.per_teacher[*a.teacher];
        if (a.role == Role::Homeroom)
            ++tally.homeroom;
        else if (a.role == Role::Korean)
            ++tally.korean;
        else if (a.role == Role::Foreign)
            ++tally.foreign;
        ++tally.total; });

    report.deviation.homeroom = column_spread(report.per_teacher, [](const RoleTally &t)
                                              { return t.homeroom; });
    report.deviation.korean = column_spread(report.per_teacher, [](const RoleTally &t)
                                            { return t.korean; });
    report.deviation.foreign = column_spread(report.per_teacher, [](const RoleTally &t)
                                             { return t.foreign; });
    report.deviation.total = column_spread(report.per_teacher, [](const RoleTally &t)
                                           { return t.total; });
    return report;
}

AuditReport audit_schedule(const SlotConfiguration &config, const ScheduleResult &result)
{
    AuditReport report;
    set<string> booked;
    map<string, int> teaching_per_class_day; // "R1C1|Mon" -> count

    for_each_assignment(result, [&](const string &day, const Assignment &a)
                        {
        optional<string> owner = homeroom_teacher(result.homerooms, a.class_id);

        if (a.role == Role::Exam)
        {
            if (a.round == 1)
                add_violation(report, "exam_round1", day, a, "no exams in round 1");
            if (a.teacher != owner)
                add_violation(report, "exam_proctor", day, a, "proctor is not the homeroom teacher");
            return;
        }

        ++teaching_per_class_day[a.class_id + "|" + day];

        if (a.round == ROUND_COUNT && a.role == Role::Foreign)
            add_violation(report, "foreign_round4", day, a, "foreign session in round 4");

        if (!a.assigned())
            return;
        const string &teacher = *a.teacher;

        if (!booked.insert(day + "|" + format_period(a.period) + "|" + teacher).second)
            add_violation(report, "double_booking", day, a, "teacher already busy at this slot");

        auto own = result.homerooms.find(a.class_id);
        if (a.role == Role::Korean && own != result.homerooms.end() && own->second.teacher == teacher)
            add_violation(report, "korean_self", day, a, "homeroom teacher teaching own Korean slot");

        if (a.role == Role::Homeroom && a.teacher != owner)
            add_violation(report, "homeroom_substitute", day, a, "homeroom slot not taught by homeroom teacher");

        auto c = config.constraints.find(teacher);
        if (c != config.constraints.end() && c->second.unavailable.count(slot_key(day, a.period)))
            add_violation(report, "unavailable", day, a, "teacher declared this slot unavailable"); });

    // coverage: two teaching assignments per class per day
    for (const auto &rc : config.options.round_class_counts)
    {
        for (const auto &cid : class_ids_for_round(rc.first, rc.second))
        {
            for (const auto &day : DAYS)
            {
                auto it = teaching_per_class_day.find(cid + "|" + day);
                int n = it == teaching_per_class_day.end() ? 0 : it->second;
                if (n != 2)
                    report.violations.push_back({"coverage", "[" + day + "] " + cid + ": " + to_string(n) +
                                                                 " teaching assignments (expected 2)"});
            }
        }
    }

    // homeroom ownership against per-teacher limits; fixed overrides exempt
    map<string, int> owned;
    for (const auto &entry : result.homerooms)
        if (entry.second.resolved)
            ++owned[entry.second.teacher];
    for (const auto &entry : result.homerooms)
    {
        const HomeroomOwner &h = entry.second;
        if (!h.resolved || h.fixed)
            continue;
        auto c = config.constraints.find(h.teacher);
        if (c == config.constraints.end())
            continue;
        if (c->second.homeroom_disabled)
            report.violations.push_back({"homeroom_disabled", entry.first + ": " + h.teacher +
                                                                  " may not take homerooms"});
        if (c->second.max_homerooms && owned[h.teacher] > *c->second.max_homerooms)
            report.violations.push_back({"max_homerooms", entry.first + ": " + h.teacher + " owns " +
                                                              to_string(owned[h.teacher]) + " homerooms (max " +
                                                              to_string(*c->second.max_homerooms) + ")"});
    }

    report.fairness = build_fairness_report(config, result);
    return report;
}
