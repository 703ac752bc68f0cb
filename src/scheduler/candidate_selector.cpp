#include "candidate_selector.h"
#include <algorithm>

using namespace std;

namespace
{
    optional<string> first_free(RunContext &ctx, vector<string> candidates, const string &day, double period)
    {
        sort(candidates.begin(), candidates.end());
        candidates.erase(unique(candidates.begin(), candidates.end()), candidates.end());

        candidates.erase(remove_if(candidates.begin(), candidates.end(),
                                   [&](const string &t)
                                   { return !ctx.is_free(t, day, period); }),
                         candidates.end());
        if (candidates.empty())
            return nullopt;

        order_by_fairness(candidates, ctx);
        return candidates.front();
    }
}

void order_by_fairness(vector<string> &candidates, const RunContext &ctx)
{
    sort(candidates.begin(), candidates.end(),
         [&](const string &a, const string &b)
         {
             int la = ctx.load_of(a), lb = ctx.load_of(b);
             if (la != lb)
                 return la < lb;
             return a < b;
         });
}

optional<string> pick_homeroom_teacher(RunContext &ctx, const string &class_id, const string &day, double period)
{
    optional<string> owner = homeroom_teacher(ctx.homerooms, class_id);
    if (!owner)
        return nullopt;
    if (!ctx.is_free(*owner, day, period))
        return nullopt;
    return owner;
}

optional<string> pick_korean_teacher(RunContext &ctx, const string &class_id, const string &day, double period)
{
    auto own_it = ctx.homerooms.find(class_id);
    const string own = own_it == ctx.homerooms.end() ? string() : own_it->second.teacher;

    vector<string> candidates;
    for (const auto &t : ctx.config.pools.homeroom_korean)
        if (t != own)
            candidates.push_back(t);

    if (ctx.config.options.include_homerooms_in_korean)
    {
        for (const auto &entry : ctx.homerooms)
        {
            const HomeroomOwner &h = entry.second;
            if (h.resolved && h.teacher != own)
                candidates.push_back(h.teacher);
        }
    }
    return first_free(ctx, std::move(candidates), day, period);
}

optional<string> pick_foreign_teacher(RunContext &ctx, const string &day, double period)
{
    return first_free(ctx, ctx.config.pools.foreign, day, period);
}

optional<string> select_candidate(RunContext &ctx, Role role, int round,
                                  const string &class_id, const string &day, double period)
{
    switch (role)
    {
    case Role::Homeroom:
        return pick_homeroom_teacher(ctx, class_id, day, period);
    case Role::Korean:
        return pick_korean_teacher(ctx, class_id, day, period);
    case Role::Foreign:
        if (round == ROUND_COUNT)
            return nullopt;
        return pick_foreign_teacher(ctx, day, period);
    case Role::Exam:
        break;
    }
    return nullopt;
}
