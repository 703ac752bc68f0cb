#pragma once

#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

using namespace std;

enum class Role
{
    Homeroom,
    Korean,
    Foreign,
    Exam
};

// Short codes used in warnings and JSON: H, K, F, EXAM
string role_code(Role role);

struct TeacherConstraints
{
    set<string> unavailable; // "Mon|3"
    bool homeroom_disabled = false;
    optional<int> max_homerooms;
};

struct TeacherPools
{
    vector<string> homeroom_korean;
    vector<string> foreign;
};

struct GlobalOptions
{
    map<int, int> round_class_counts;
    map<string, vector<double>> exam_periods; // day -> markers like 2.5
    bool include_homerooms_in_korean = true;
};

struct SlotConfiguration
{
    TeacherPools pools;
    map<string, TeacherConstraints> constraints;
    map<string, string> fixed_homerooms; // teacher -> class id
    GlobalOptions options;
};

struct Assignment
{
    string class_id;
    int round = 1;
    double period = 1;
    string time;
    Role role = Role::Homeroom;
    optional<string> teacher; // empty = unassigned

    bool assigned() const { return teacher.has_value(); }
    const string &teacher_label() const;
};

struct HomeroomOwner
{
    string teacher; // fallback label when unresolved
    bool resolved = false;
    bool fixed = false;
};

struct ScheduleMetrics
{
    double generation_time_ms = 0.0;
    int total_assignments = 0;
    int assigned_count = 0;
    int unassigned_count = 0;
    int warnings_count = 0;
    int teachers_count = 0;
    int classes_count = 0;
    int sort_operations = 0;
    int cache_hits = 0;
    int cache_misses = 0;
    int cache_hit_rate = 0; // percent
};

using DayAssignments = map<string, vector<Assignment>>;

struct ScheduleResult
{
    map<string, DayAssignments> class_summary;   // class -> day -> list
    map<string, DayAssignments> teacher_summary; // teacher -> day -> list
    map<string, map<double, vector<Assignment>>> day_grid;
    vector<string> warnings;
    map<string, HomeroomOwner> homerooms;
    ScheduleMetrics metrics;
};

// Raised before any assignment work when the input cannot be scheduled.
class InvalidConfigError : public runtime_error
{
public:
    InvalidConfigError(const string &field, const string &message)
        : runtime_error(field + ": " + message), field_(field) {}

    const string &field() const { return field_; }

private:
    string field_;
};

// ---------- Calendar ----------
extern const vector<string> DAYS;
extern const string UNASSIGNED_LABEL;

constexpr int ROUND_COUNT = 4;
constexpr int PATTERN_SLOTS = 6;

pair<int, int> round_periods(int round);
const vector<Role> &weekly_role_pattern(int round);
string period_time(double period);
string default_exam_time(int round);

string slot_key(const string &day, double period);
string format_period(double period);
vector<string> class_ids_for_round(int round, int count);
bool is_known_day(const string &day);
