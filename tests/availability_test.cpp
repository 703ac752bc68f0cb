#include "scheduler/availability.h"
#include <gtest/gtest.h>

namespace
{
    map<string, TeacherConstraints> sample_constraints()
    {
        map<string, TeacherConstraints> c;
        c["Kim"].unavailable = {"Mon|1", "Wed|4"};
        c["Lee"].homeroom_disabled = true;
        return c;
    }
}

TEST(AvailabilityFilterTest, DeclaredSlotsAreUnavailable)
{
    auto constraints = sample_constraints();
    AvailabilityFilter filter(constraints);

    EXPECT_TRUE(filter.is_unavailable("Kim", "Mon", 1));
    EXPECT_TRUE(filter.is_unavailable("Kim", "Wed", 4));
    EXPECT_FALSE(filter.is_unavailable("Kim", "Mon", 2));
    EXPECT_FALSE(filter.is_unavailable("Kim", "Fri", 1));
    EXPECT_TRUE(filter.is_available("Lee", "Mon", 1));
}

TEST(AvailabilityFilterTest, TeachersWithoutConstraintsAreAlwaysAvailable)
{
    map<string, TeacherConstraints> none;
    AvailabilityFilter filter(none);
    EXPECT_TRUE(filter.is_available("Nobody", "Fri", 8));
}

TEST(AvailabilityFilterTest, RepeatedLookupsHitTheCache)
{
    auto constraints = sample_constraints();
    MetricsCollector metrics;
    metrics.start();
    AvailabilityFilter filter(constraints, &metrics);

    filter.is_unavailable("Kim", "Mon", 1);
    filter.is_unavailable("Kim", "Mon", 1);
    filter.is_unavailable("Kim", "Mon", 2);
    filter.is_unavailable("Kim", "Mon", 1);

    EXPECT_EQ(metrics.cache_misses(), 2);
    EXPECT_EQ(metrics.cache_hits(), 2);
}

TEST(AvailabilityFilterTest, CachedAnswerMatchesFirstAnswer)
{
    auto constraints = sample_constraints();
    AvailabilityFilter filter(constraints);

    EXPECT_TRUE(filter.is_unavailable("Kim", "Wed", 4));
    EXPECT_TRUE(filter.is_unavailable("Kim", "Wed", 4));
    EXPECT_FALSE(filter.is_unavailable("Kim", "Wed", 3));
    EXPECT_FALSE(filter.is_unavailable("Kim", "Wed", 3));
}
