#include "TimetableController.h"
#include <drogon/drogon.h>
#include <nlohmann/json.hpp>

#include "../scheduler/generator.h"
#include "../scheduler/schedule_audit.h"
#include "../scheduler/schedule_json.h"
#include "../scheduler/slot_config.h"

using json = nlohmann::json;
using namespace drogon;
using namespace std;

namespace
{
    HttpResponsePtr json_response(HttpStatusCode code, const json &body)
    {
        auto resp = HttpResponse::newHttpResponse();
        resp->setStatusCode(code);
        resp->setContentTypeCode(CT_APPLICATION_JSON);
        resp->setBody(body.dump());
        return resp;
    }

    json error_body(const string &message)
    {
        json err;
        err["status"] = "error";
        err["message"] = message;
        return err;
    }
}

void TimetableController::schedule(const HttpRequestPtr &req,
                                   function<void(const HttpResponsePtr &)> &&callback)
{
    try
    {
        auto body = req->getBody();
        if (body.empty())
        {
            LOG_WARN << "[Schedule] Empty body";
            return callback(json_response(k400BadRequest, error_body("empty body")));
        }

        json jin = json::parse(body);
        LOG_INFO << "[Schedule] JSON parsed successfully";

        SlotConfiguration config = parse_slot_configuration(jin);
        LOG_INFO << "[Schedule] Slot configuration loaded: "
                 << config.pools.homeroom_korean.size() << " homeroom/Korean teachers, "
                 << config.pools.foreign.size() << " foreign teachers";

        ScheduleResult result = generate(config);
        AuditReport audit = audit_schedule(config, result);
        if (!audit.ok())
            LOG_ERROR << "[Schedule] Audit found " << audit.violations.size() << " violations";

        callback(json_response(k200OK, build_schedule_response(result, audit)));
        LOG_INFO << "[Schedule] Response sent to client";
    }
    catch (const InvalidConfigError &ex)
    {
        LOG_WARN << "[Schedule] Invalid configuration: " << ex.what();
        json err = error_body(ex.what());
        err["field"] = ex.field();
        callback(json_response(k400BadRequest, err));
    }
    catch (const json::parse_error &ex)
    {
        LOG_WARN << "[Schedule] Malformed JSON: " << ex.what();
        callback(json_response(k400BadRequest, error_body(ex.what())));
    }
    catch (const exception &ex)
    {
        LOG_ERROR << "[Schedule] Exception: " << ex.what();
        callback(json_response(k500InternalServerError, error_body(ex.what())));
    }
}
