#include "slot_config.h"
#include <cmath>
#include <fstream>

using namespace std;

namespace
{
    constexpr int FIRST_PERIOD = 1;
    constexpr int LAST_PERIOD = ROUND_COUNT * 2;

    template <typename T>
    T read_field(const json &j, const string &key, const string &path, T fallback)
    {
        if (!j.contains(key) || j.at(key).is_null())
            return fallback;
        try
        {
            return j.at(key).get<T>();
        }
        catch (const json::exception &ex)
        {
            throw InvalidConfigError(path + "." + key, ex.what());
        }
    }

    const json &require_object(const json &j, const string &key, const string &path)
    {
        if (!j.contains(key))
            throw InvalidConfigError(path.empty() ? key : path + "." + key, "missing required key");
        const json &v = j.at(key);
        if (!v.is_object())
            throw InvalidConfigError(path.empty() ? key : path + "." + key, "expected an object");
        return v;
    }

    void fill_constraints_from_json(TeacherConstraints &c, const json &jc, const string &path)
    {
        if (!jc.is_object())
            throw InvalidConfigError(path, "expected an object");
        for (const auto &key : read_field<vector<string>>(jc, "unavailable", path, {}))
            c.unavailable.insert(key);
        c.homeroom_disabled = read_field<bool>(jc, "homeroom_disabled", path, false);
        if (jc.contains("max_homerooms") && !jc.at("max_homerooms").is_null())
            c.max_homerooms = read_field<int>(jc, "max_homerooms", path, 0);
    }

    void fill_options_from_json(GlobalOptions &options, const json &jo)
    {
        const json &counts = require_object(jo, "round_class_counts", "global_options");
        for (auto it = counts.begin(); it != counts.end(); ++it)
        {
            string field = "global_options.round_class_counts." + it.key();
            int round = 0;
            try
            {
                size_t used = 0;
                round = stoi(it.key(), &used);
                if (used != it.key().size())
                    throw invalid_argument(it.key());
            }
            catch (const logic_error &)
            {
                throw InvalidConfigError(field, "round key must be an integer");
            }
            if (!it.value().is_number_integer())
                throw InvalidConfigError(field, "class count must be an integer");
            options.round_class_counts[round] = it.value().get<int>();
        }

        if (jo.contains("exam_periods") && !jo.at("exam_periods").is_null())
        {
            const json &exams = require_object(jo, "exam_periods", "global_options");
            for (auto it = exams.begin(); it != exams.end(); ++it)
            {
                string field = "global_options.exam_periods." + it.key();
                try
                {
                    options.exam_periods[it.key()] = it.value().get<vector<double>>();
                }
                catch (const json::exception &ex)
                {
                    throw InvalidConfigError(field, ex.what());
                }
            }
        }

        options.include_homerooms_in_korean =
            read_field<bool>(jo, "include_homerooms_in_korean", "global_options", true);
    }
}

optional<pair<string, int>> parse_unavailable_key(const string &key)
{
    size_t bar = key.find('|');
    if (bar == string::npos)
        return nullopt;
    string day = key.substr(0, bar);
    string period = key.substr(bar + 1);
    if (!is_known_day(day) || period.empty() || period[0] == '0')
        return nullopt;
    for (char ch : period)
        if (ch < '0' || ch > '9')
            return nullopt;
    if (period.size() > 2)
        return nullopt;
    int p = stoi(period);
    if (p < FIRST_PERIOD || p > LAST_PERIOD)
        return nullopt;
    return make_pair(day, p);
}

SlotConfiguration parse_slot_configuration(const json &j_input)
{
    if (!j_input.is_object())
        throw InvalidConfigError("slot configuration", "expected a JSON object");

    SlotConfiguration config;

    // Teachers
    const json &jt = require_object(j_input, "teachers", "");
    config.pools.homeroom_korean = read_field<vector<string>>(jt, "homeroom_korean_pool", "teachers", {});
    config.pools.foreign = read_field<vector<string>>(jt, "foreign_pool", "teachers", {});
    if (jt.contains("constraints") && !jt.at("constraints").is_null())
    {
        const json &jc = require_object(jt, "constraints", "teachers");
        for (auto it = jc.begin(); it != jc.end(); ++it)
        {
            TeacherConstraints c;
            fill_constraints_from_json(c, it.value(), "teachers.constraints." + it.key());
            config.constraints[it.key()] = std::move(c);
        }
    }

    // Fixed homerooms
    config.fixed_homerooms = read_field<map<string, string>>(j_input, "fixed_homerooms", "slot configuration", {});

    // Options
    fill_options_from_json(config.options, require_object(j_input, "global_options", ""));

    return config;
}

SlotConfiguration load_slot_configuration(const string &filename)
{
    ifstream f(filename);
    if (!f.is_open())
        throw runtime_error("Cannot open file: " + filename);

    json j;
    try
    {
        f >> j;
    }
    catch (const json::parse_error &ex)
    {
        throw InvalidConfigError(filename, ex.what());
    }
    return parse_slot_configuration(j);
}

void validate_slot_configuration(const SlotConfiguration &config)
{
    // Rounds and class counts
    for (const auto &rc : config.options.round_class_counts)
    {
        string field = "global_options.round_class_counts." + to_string(rc.first);
        if (rc.first < 1 || rc.first > ROUND_COUNT)
            throw InvalidConfigError(field, "round must be between 1 and " + to_string(ROUND_COUNT));
        if (rc.second < 0)
            throw InvalidConfigError(field, "class count must not be negative");
    }

    // Pools: non-empty names, no duplicates, disjoint
    set<string> homeroom_pool;
    for (const auto &t : config.pools.homeroom_korean)
    {
        if (t.empty())
            throw InvalidConfigError("teachers.homeroom_korean_pool", "teacher name must not be empty");
        if (!homeroom_pool.insert(t).second)
            throw InvalidConfigError("teachers.homeroom_korean_pool", "duplicate teacher " + t);
    }
    set<string> foreign_pool;
    for (const auto &t : config.pools.foreign)
    {
        if (t.empty())
            throw InvalidConfigError("teachers.foreign_pool", "teacher name must not be empty");
        if (!foreign_pool.insert(t).second)
            throw InvalidConfigError("teachers.foreign_pool", "duplicate teacher " + t);
        if (homeroom_pool.count(t))
            throw InvalidConfigError("teachers.foreign_pool", "teacher " + t + " is in both pools");
    }

    // Per-teacher constraints
    for (const auto &entry : config.constraints)
    {
        string field = "teachers.constraints." + entry.first;
        for (const auto &key : entry.second.unavailable)
            if (!parse_unavailable_key(key))
                throw InvalidConfigError(field + ".unavailable", "malformed slot key '" + key + "'");
        if (entry.second.max_homerooms && *entry.second.max_homerooms < 0)
            throw InvalidConfigError(field + ".max_homerooms", "must not be negative");
    }

    // Fixed homerooms must name generated classes, one teacher per class
    set<string> known_classes;
    for (const auto &rc : config.options.round_class_counts)
        for (const auto &cid : class_ids_for_round(rc.first, rc.second))
            known_classes.insert(cid);
    set<string> fixed_classes;
    for (const auto &fixed : config.fixed_homerooms)
    {
        string field = "fixed_homerooms." + fixed.first;
        if (fixed.first.empty())
            throw InvalidConfigError("fixed_homerooms", "teacher name must not be empty");
        if (!known_classes.count(fixed.second))
            throw InvalidConfigError(field, "unknown class " + fixed.second);
        if (!fixed_classes.insert(fixed.second).second)
            throw InvalidConfigError(field, "class " + fixed.second + " is fixed to more than one teacher");
    }

    // Exam markers sit between two periods: 1.5, 2.5, ... 7.5
    for (const auto &entry : config.options.exam_periods)
    {
        string field = "global_options.exam_periods." + entry.first;
        if (!is_known_day(entry.first))
            throw InvalidConfigError(field, "unknown day");
        for (double m : entry.second)
        {
            if (!(m >= FIRST_PERIOD && m <= LAST_PERIOD) || fmod(m, 1.0) != 0.5)
                throw InvalidConfigError(field, "exam marker " + format_period(m) + " is not between two periods");
        }
    }
}
