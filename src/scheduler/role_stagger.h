#pragma once

#include "timetable.h"

// Size of the pool that limits how many classes can share a role at once:
// the homeroom/Korean pool in round 4, the foreign pool otherwise. Never 0.
int stagger_capacity(int round, const TeacherPools &pools);

// Roles for the round's two periods on a given day.
//   phase = (day_index + class_index) % capacity
//   base  = (day_index * 2 + phase) % 6
// and the roles are pattern[base], pattern[(base + 1) % 6].
pair<Role, Role> stagger_roles(int round, int day_index, int class_index, int capacity);
