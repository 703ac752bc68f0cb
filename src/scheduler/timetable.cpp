#include "timetable.h"
#include <sstream>

using namespace std;

const vector<string> DAYS = {"Mon", "Wed", "Fri"};
const string UNASSIGNED_LABEL = "(unassigned)";

namespace
{
    const map<int, vector<Role>> ROLE_PATTERNS = {
        {1, {Role::Homeroom, Role::Korean, Role::Foreign, Role::Homeroom, Role::Foreign, Role::Korean}},
        {2, {Role::Homeroom, Role::Korean, Role::Foreign, Role::Homeroom, Role::Foreign, Role::Korean}},
        {3, {Role::Homeroom, Role::Korean, Role::Foreign, Role::Homeroom, Role::Foreign, Role::Korean}},
        // no foreign sessions in the last round
        {4, {Role::Homeroom, Role::Korean, Role::Homeroom, Role::Korean, Role::Homeroom, Role::Homeroom}},
    };

    const map<double, string> PERIOD_TIMES = {
        {1, "14:20-15:05"},
        {1.5, "15:05-15:10"},
        {2, "15:10-15:55"},
        {2.5, "15:55-16:15"},
        {3, "16:15-17:00"},
        {3.5, "17:00-17:05"},
        {4, "17:05-17:50"},
        {4.5, "17:50-18:05"},
        {5, "18:05-18:55"},
        {5.5, "18:55-19:00"},
        {6, "19:00-19:50"},
        {6.5, "19:50-20:15"},
        {7, "20:15-21:05"},
        {7.5, "21:05-21:10"},
        {8, "21:10-22:00"},
    };

    const map<int, string> EXAM_TIMES = {
        {2, "16:00-16:15"},
        {3, "17:50-18:05"},
        {4, "20:00-20:15"},
    };
}

string role_code(Role role)
{
    switch (role)
    {
    case Role::Homeroom:
        return "H";
    case Role::Korean:
        return "K";
    case Role::Foreign:
        return "F";
    case Role::Exam:
        return "EXAM";
    }
    return "?";
}

const string &Assignment::teacher_label() const
{
    return teacher ? *teacher : UNASSIGNED_LABEL;
}

pair<int, int> round_periods(int round)
{
    return {round * 2 - 1, round * 2};
}

const vector<Role> &weekly_role_pattern(int round)
{
    return ROLE_PATTERNS.at(round);
}

string period_time(double period)
{
    auto it = PERIOD_TIMES.find(period);
    return it == PERIOD_TIMES.end() ? string() : it->second;
}

string default_exam_time(int round)
{
    auto it = EXAM_TIMES.find(round);
    return it == EXAM_TIMES.end() ? string() : it->second;
}

string format_period(double period)
{
    ostringstream oss;
    oss << period;
    return oss.str();
}

string slot_key(const string &day, double period)
{
    return day + "|" + format_period(period);
}

vector<string> class_ids_for_round(int round, int count)
{
    vector<string> out;
    out.reserve(count > 0 ? count : 0);
    for (int i = 1; i <= count; ++i)
        out.push_back("R" + to_string(round) + "C" + to_string(i));
    return out;
}

bool is_known_day(const string &day)
{
    for (const auto &d : DAYS)
        if (d == day)
            return true;
    return false;
}
