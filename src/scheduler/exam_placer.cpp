#include "exam_placer.h"
#include <cmath>

using namespace std;

string exam_between_label(double marker)
{
    return "Exam (between periods " + to_string((int)floor(marker)) + " and " +
           to_string((int)ceil(marker)) + ")";
}

vector<Assignment> place_exams(RunContext &ctx, int round, const vector<string> &classes, const string &day)
{
    vector<Assignment> out;
    if (round == 1)
        return out;

    vector<double> markers;
    auto custom = ctx.config.options.exam_periods.find(day);
    if (custom != ctx.config.options.exam_periods.end())
        markers = custom->second;

    const double anchor = round_periods(round).first;

    for (const auto &cid : classes)
    {
        optional<string> proctor = homeroom_teacher(ctx.homerooms, cid);

        auto make = [&](double period, const string &time)
        {
            Assignment a;
            a.class_id = cid;
            a.round = round;
            a.period = period;
            a.time = time;
            a.role = Role::Exam;
            a.teacher = proctor;
            if (!proctor)
                ctx.warnings.push_back("[" + day + " " + format_period(period) + "] " + cid +
                                       " EXAM proctor missing (no homeroom teacher)");
            out.push_back(std::move(a));
        };

        if (!markers.empty())
        {
            for (double m : markers)
                make(m, exam_between_label(m));
        }
        else
        {
            make(anchor, default_exam_time(round));
        }
    }
    return out;
}
