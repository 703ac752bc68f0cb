#include "scheduler/generator.h"
#include "scheduler/schedule_audit.h"
#include "test_helpers.h"
#include <gtest/gtest.h>

namespace
{
    // One round-2 class owned by Kim, with a clean Monday.
    struct Fixture
    {
        SlotConfiguration config = make_config({"Kim", "Lee"}, {"Tom"}, {{2, 1}});
        ScheduleResult result;

        Fixture()
        {
            result.homerooms["R2C1"] = HomeroomOwner{"Kim", true, false};
            for (const auto &day : DAYS)
            {
                add(day, make_assignment("R2C1", 2, 3, Role::Homeroom, string("Kim")));
                add(day, make_assignment("R2C1", 2, 4, Role::Korean, string("Lee")));
            }
        }

        void add(const string &day, const Assignment &a)
        {
            result.day_grid[day][a.period].push_back(a);
        }

        // Replaces the Monday period-4 slot.
        void replace_mon_4(const Assignment &a)
        {
            result.day_grid["Mon"][4] = {a};
        }
    };

    bool has_kind(const AuditReport &report, const string &kind)
    {
        for (const auto &v : report.violations)
            if (v.kind == kind)
                return true;
        return false;
    }
}

TEST(ScheduleAuditTest, CleanScheduleHasNoViolations)
{
    Fixture f;
    AuditReport report = audit_schedule(f.config, f.result);
    EXPECT_TRUE(report.ok());
}

TEST(ScheduleAuditTest, DetectsDoubleBooking)
{
    Fixture f;
    f.config.options.round_class_counts[2] = 2;
    f.result.homerooms["R2C2"] = HomeroomOwner{"Lee", true, false};
    for (const auto &day : DAYS)
    {
        f.add(day, make_assignment("R2C2", 2, 3, Role::Korean, string("Tom")));
        f.add(day, make_assignment("R2C2", 2, 4, Role::Foreign, string("Tom")));
    }
    f.result.day_grid["Mon"][4][1].teacher = string("Lee");
    f.result.day_grid["Mon"][4][1].role = Role::Korean;

    AuditReport report = audit_schedule(f.config, f.result);
    EXPECT_TRUE(has_kind(report, "double_booking"));
    EXPECT_TRUE(has_kind(report, "korean_self"));
}

TEST(ScheduleAuditTest, DetectsHomeroomTeacherOnOwnKorean)
{
    Fixture f;
    f.replace_mon_4(make_assignment("R2C1", 2, 4, Role::Korean, string("Kim")));
    EXPECT_TRUE(has_kind(audit_schedule(f.config, f.result), "korean_self"));
}

TEST(ScheduleAuditTest, DetectsHomeroomSubstitute)
{
    Fixture f;
    f.result.day_grid["Wed"][3] = {make_assignment("R2C1", 2, 3, Role::Homeroom, string("Lee"))};
    EXPECT_TRUE(has_kind(audit_schedule(f.config, f.result), "homeroom_substitute"));
}

TEST(ScheduleAuditTest, DetectsForeignInLastRound)
{
    Fixture f;
    f.config.options.round_class_counts = {{4, 1}};
    f.result.homerooms.clear();
    f.result.day_grid.clear();
    f.result.homerooms["R4C1"] = HomeroomOwner{"Kim", true, false};
    for (const auto &day : DAYS)
    {
        f.add(day, make_assignment("R4C1", 4, 7, Role::Homeroom, string("Kim")));
        f.add(day, make_assignment("R4C1", 4, 8, Role::Foreign, nullopt));
    }

    AuditReport report = audit_schedule(f.config, f.result);
    EXPECT_TRUE(has_kind(report, "foreign_round4"));
    EXPECT_FALSE(has_kind(report, "coverage"));
}

TEST(ScheduleAuditTest, DetectsExamProblems)
{
    Fixture f;
    f.add("Mon", make_assignment("R2C1", 2, 3, Role::Exam, string("Lee")));
    f.add("Wed", make_assignment("R1C1", 1, 1, Role::Exam, nullopt));

    AuditReport report = audit_schedule(f.config, f.result);
    EXPECT_TRUE(has_kind(report, "exam_proctor"));
    EXPECT_TRUE(has_kind(report, "exam_round1"));
    EXPECT_FALSE(has_kind(report, "double_booking"));
}

TEST(ScheduleAuditTest, DetectsUnavailableSlot)
{
    Fixture f;
    f.config.constraints["Lee"].unavailable = {"Fri|4"};
    EXPECT_TRUE(has_kind(audit_schedule(f.config, f.result), "unavailable"));
}

TEST(ScheduleAuditTest, DetectsMissingCoverage)
{
    Fixture f;
    f.result.day_grid["Fri"].erase(4);
    AuditReport report = audit_schedule(f.config, f.result);
    ASSERT_EQ(report.violations.size(), 1u);
    EXPECT_EQ(report.violations[0].kind, "coverage");
    EXPECT_EQ(report.violations[0].message, "[Fri] R2C1: 1 teaching assignments (expected 2)");
}

TEST(ScheduleAuditTest, DetectsHomeroomLimitBreaches)
{
    Fixture f;
    f.config.constraints["Kim"].homeroom_disabled = true;
    EXPECT_TRUE(has_kind(audit_schedule(f.config, f.result), "homeroom_disabled"));

    f.config.constraints["Kim"].homeroom_disabled = false;
    f.config.constraints["Kim"].max_homerooms = 0;
    EXPECT_TRUE(has_kind(audit_schedule(f.config, f.result), "max_homerooms"));

    f.result.homerooms["R2C1"].fixed = true;
    EXPECT_TRUE(audit_schedule(f.config, f.result).ok());
}

TEST(ScheduleAuditTest, FairnessOfTwoClassesOneForeignTeacher)
{
    SlotConfiguration config = make_config({"H1", "H2"}, {"F1"}, {{1, 2}});
    FairnessReport fairness = build_fairness_report(config, generate(config));

    ASSERT_EQ(fairness.per_teacher.size(), 3u);
    for (const char *t : {"H1", "H2"})
    {
        const RoleTally &tally = fairness.per_teacher.at(t);
        EXPECT_EQ(tally.homeroom, 2) << t;
        EXPECT_EQ(tally.korean, 2) << t;
        EXPECT_EQ(tally.foreign, 0) << t;
        EXPECT_EQ(tally.total, 4) << t;
    }
    EXPECT_EQ(fairness.per_teacher.at("F1").foreign, 2);
    EXPECT_EQ(fairness.per_teacher.at("F1").total, 2);

    EXPECT_EQ(fairness.deviation.homeroom, 2);
    EXPECT_EQ(fairness.deviation.korean, 2);
    EXPECT_EQ(fairness.deviation.foreign, 2);
    EXPECT_EQ(fairness.deviation.total, 2);
}

TEST(ScheduleAuditTest, IdleTeachersStillAppearInFairness)
{
    SlotConfiguration config = make_config({"A", "B"}, {"Idle"}, {{4, 1}});
    FairnessReport fairness = build_fairness_report(config, generate(config));

    ASSERT_EQ(fairness.per_teacher.count("Idle"), 1u);
    EXPECT_EQ(fairness.per_teacher.at("Idle").total, 0);
}
