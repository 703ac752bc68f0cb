#include "conflict_tracker.h"

using namespace std;

bool ConflictTracker::can(const string &day, double period, const string &teacher) const
{
    auto it = teacher_busy_.find(teacher);
    if (it == teacher_busy_.end())
        return true;
    return it->second.find(slot_key(day, period)) == it->second.end();
}

void ConflictTracker::occupy(const string &day, double period, const string &teacher)
{
    string sk = slot_key(day, period);
    if (!teacher_busy_[teacher].insert(sk).second)
        return;
    slot_busy_[sk].insert(teacher);
    ++occupied_;
}

set<string> ConflictTracker::busy_teachers(const string &day, double period) const
{
    auto it = slot_busy_.find(slot_key(day, period));
    if (it == slot_busy_.end())
        return {};
    return it->second;
}
