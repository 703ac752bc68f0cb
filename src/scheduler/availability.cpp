#include "availability.h"

using namespace std;

AvailabilityFilter::AvailabilityFilter(const map<string, TeacherConstraints> &constraints, MetricsCollector *metrics)
    : constraints_(constraints), metrics_(metrics)
{
}

bool AvailabilityFilter::is_unavailable(const string &teacher, const string &day, double period)
{
    string sk = slot_key(day, period);
    string cache_key = teacher + "#" + sk;

    auto cached = cache_.find(cache_key);
    if (cached != cache_.end())
    {
        if (metrics_)
            metrics_->record_cache_hit();
        return cached->second;
    }
    if (metrics_)
        metrics_->record_cache_miss();

    bool blocked = false;
    auto it = constraints_.find(teacher);
    if (it != constraints_.end())
        blocked = it->second.unavailable.count(sk) > 0;

    cache_.emplace(cache_key, blocked);
    return blocked;
}
