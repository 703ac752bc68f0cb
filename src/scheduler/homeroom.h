#pragma once

#include "timetable.h"

using HomeroomMap = map<string, HomeroomOwner>;

// round -> class ids in that round, for every round with classes
map<int, vector<string>> build_round_classes(const GlobalOptions &options);

// Fixed overrides first, then the least-loaded eligible pool teacher per
// class (ties by name). Classes nobody can take get the label "H-<class>"
// with resolved = false. The returned map covers every class.
HomeroomMap assign_homerooms(const map<int, vector<string>> &round_classes, const SlotConfiguration &config);

// Owner of a class when one was resolved.
optional<string> homeroom_teacher(const HomeroomMap &homerooms, const string &class_id);
