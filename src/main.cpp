#include <drogon/drogon.h>
#include <fstream>
#include <iostream>

#include "scheduler/generator.h"
#include "scheduler/schedule_audit.h"
#include "scheduler/schedule_json.h"
#include "scheduler/slot_config.h"

using namespace std;

// With a slot configuration file: generate once and print the result.
// Without arguments: serve POST /schedule using ./config.json.
int main(int argc, char *argv[])
{
    if (argc > 1)
    {
        try
        {
            SlotConfiguration config = load_slot_configuration(argv[1]);
            ScheduleResult result = generate(config);
            AuditReport audit = audit_schedule(config, result);
            cout << build_schedule_response(result, audit).dump(2) << "\n";
            return 0;
        }
        catch (const InvalidConfigError &ex)
        {
            LOG_ERROR << "Invalid configuration (" << ex.field() << "): " << ex.what();
            return 1;
        }
        catch (const exception &ex)
        {
            LOG_ERROR << ex.what();
            return 1;
        }
    }

    ifstream probe("config.json");
    if (probe.good())
        drogon::app().loadConfigFile("config.json");
    else
        drogon::app().addListener("0.0.0.0", 8080);

    LOG_INFO << "Timetable server starting";
    drogon::app().run();
    return 0;
}
