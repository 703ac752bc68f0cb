#pragma once

#include "timetable.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

// Builds a SlotConfiguration from a JSON document. Required keys:
// "teachers" and "global_options.round_class_counts". Throws
// InvalidConfigError on missing keys or wrongly typed values.
SlotConfiguration parse_slot_configuration(const json &j_input);

// Reads and parses a JSON file from disk.
SlotConfiguration load_slot_configuration(const string &filename);

// Rejects configurations the engine cannot schedule. Called by generate()
// before any assignment work.
void validate_slot_configuration(const SlotConfiguration &config);

// "Mon|3" -> ("Mon", 3); nullopt when malformed.
optional<pair<string, int>> parse_unavailable_key(const string &key);
