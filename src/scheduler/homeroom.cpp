#include "homeroom.h"
#include <algorithm>
#include <limits>

using namespace std;

map<int, vector<string>> build_round_classes(const GlobalOptions &options)
{
    map<int, vector<string>> out;
    for (int round = 1; round <= ROUND_COUNT; ++round)
    {
        auto it = options.round_class_counts.find(round);
        int count = it == options.round_class_counts.end() ? 0 : it->second;
        if (count > 0)
            out[round] = class_ids_for_round(round, count);
    }
    return out;
}

HomeroomMap assign_homerooms(const map<int, vector<string>> &round_classes, const SlotConfiguration &config)
{
    HomeroomMap homerooms;

    // 1) fixed overrides, verbatim
    for (const auto &fixed : config.fixed_homerooms)
        homerooms[fixed.second] = HomeroomOwner{fixed.first, true, true};

    // 2) eligible pool teachers with their caps and current counts
    vector<string> allowed;
    map<string, int> max_count;
    map<string, int> cur_count;
    for (const auto &t : config.pools.homeroom_korean)
    {
        auto c = config.constraints.find(t);
        if (c != config.constraints.end() && c->second.homeroom_disabled)
            continue;
        allowed.push_back(t);
        max_count[t] = (c != config.constraints.end() && c->second.max_homerooms)
                           ? *c->second.max_homerooms
                           : numeric_limits<int>::max();
        cur_count[t] = 0;
    }
    for (const auto &entry : homerooms)
    {
        auto it = cur_count.find(entry.second.teacher);
        if (it != cur_count.end())
            ++it->second;
    }

    // 3) greedy balance over the remaining classes, round by round
    for (const auto &rc : round_classes)
    {
        for (const auto &cid : rc.second)
        {
            if (homerooms.count(cid))
                continue;

            vector<string> candidates;
            for (const auto &t : allowed)
                if (cur_count[t] < max_count[t])
                    candidates.push_back(t);

            if (candidates.empty())
            {
                homerooms[cid] = HomeroomOwner{"H-" + cid, false, false};
                continue;
            }

            sort(candidates.begin(), candidates.end(),
                 [&](const string &a, const string &b)
                 {
                     if (cur_count[a] != cur_count[b])
                         return cur_count[a] < cur_count[b];
                     return a < b;
                 });
            const string &picked = candidates.front();
            homerooms[cid] = HomeroomOwner{picked, true, false};
            ++cur_count[picked];
        }
    }
    return homerooms;
}

optional<string> homeroom_teacher(const HomeroomMap &homerooms, const string &class_id)
{
    auto it = homerooms.find(class_id);
    if (it == homerooms.end() || !it->second.resolved)
        return nullopt;
    return it->second.teacher;
}
