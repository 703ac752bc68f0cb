#include "generator.h"
#include "aggregator.h"
#include "candidate_selector.h"
#include "exam_placer.h"
#include "role_stagger.h"
#include "run_context.h"
#include "slot_config.h"
#include <sstream>
#include <trantor/utils/Logger.h>

using namespace std;

namespace
{
    string join_names(const set<string> &names)
    {
        ostringstream oss;
        for (auto it = names.begin(); it != names.end(); ++it)
            oss << (it == names.begin() ? "" : ", ") << *it;
        return oss.str();
    }

    void emit(RunContext &ctx, ScheduleAggregator &agg, const string &day, const Assignment &a)
    {
        ctx.metrics.record_assignment(a.assigned());
        agg.add(day, a);
    }

    void assign_one(RunContext &ctx, ScheduleAggregator &agg, int round, const string &class_id,
                    const string &day, Role role, double period)
    {
        optional<string> teacher = select_candidate(ctx, role, round, class_id, day, period);

        Assignment a;
        a.class_id = class_id;
        a.round = round;
        a.period = period;
        a.time = period_time(period);
        a.role = role;

        if (teacher)
        {
            ctx.commit(*teacher, day, period);
            a.teacher = teacher;
        }
        else
        {
            ctx.warnings.push_back("[" + day + " " + format_period(period) + "] " + class_id + " " +
                                   role_code(role) + " assignment failed");
            LOG_DEBUG << "[Generate] " << class_id << " " << role_code(role) << " unfilled at " << day << " "
                      << format_period(period) << ", busy: " << join_names(ctx.tracker.busy_teachers(day, period));
        }
        emit(ctx, agg, day, a);
    }

    string describe_homerooms(const HomeroomMap &homerooms)
    {
        ostringstream oss;
        bool first = true;
        for (const auto &entry : homerooms)
        {
            if (!first)
                oss << ", ";
            first = false;
            oss << entry.first << "=" << entry.second.teacher;
            if (!entry.second.resolved)
                oss << "(unresolved)";
        }
        return oss.str();
    }
}

ScheduleResult generate(const SlotConfiguration &config)
{
    validate_slot_configuration(config);

    RunContext ctx(config);
    ctx.metrics.start();

    map<int, vector<string>> round_classes = build_round_classes(config.options);
    ctx.homerooms = assign_homerooms(round_classes, config);
    LOG_DEBUG << "[Generate] Homerooms: " << describe_homerooms(ctx.homerooms);

    ScheduleAggregator agg;

    for (const auto &rc : round_classes)
    {
        const int round = rc.first;
        const vector<string> &classes = rc.second;
        const pair<int, int> periods = round_periods(round);
        const int capacity = stagger_capacity(round, config.pools);

        for (int day_idx = 0; day_idx < (int)DAYS.size(); ++day_idx)
        {
            const string &day = DAYS[day_idx];

            for (const auto &exam : place_exams(ctx, round, classes, day))
                emit(ctx, agg, day, exam);

            for (int class_idx = 0; class_idx < (int)classes.size(); ++class_idx)
            {
                const string &cid = classes[class_idx];
                pair<Role, Role> roles = stagger_roles(round, day_idx, class_idx, capacity);
                assign_one(ctx, agg, round, cid, day, roles.first, periods.first);
                assign_one(ctx, agg, round, cid, day, roles.second, periods.second);
            }
        }
    }

    agg.finalize(&ctx.metrics);

    ScheduleResult result = agg.release();
    result.warnings = std::move(ctx.warnings);
    result.homerooms = std::move(ctx.homerooms);
    result.metrics = ctx.metrics.finish(result);

    LOG_INFO << "[Generate] Finished. Assignments: " << result.metrics.total_assignments
             << ", unassigned: " << result.metrics.unassigned_count
             << ", warnings: " << result.metrics.warnings_count
             << ", classes: " << result.metrics.classes_count
             << ", time: " << result.metrics.generation_time_ms << " ms";
    return result;
}
