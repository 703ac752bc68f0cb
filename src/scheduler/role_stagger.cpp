#include "role_stagger.h"
#include <algorithm>

using namespace std;

int stagger_capacity(int round, const TeacherPools &pools)
{
    size_t size = round == ROUND_COUNT ? pools.homeroom_korean.size() : pools.foreign.size();
    return max(1, (int)size);
}

pair<Role, Role> stagger_roles(int round, int day_index, int class_index, int capacity)
{
    const vector<Role> &pattern = weekly_role_pattern(round);
    int cap = max(1, capacity);
    int phase = (day_index + class_index) % cap;
    int base = (day_index * 2 + phase) % PATTERN_SLOTS;
    return {pattern[base], pattern[(base + 1) % PATTERN_SLOTS]};
}
