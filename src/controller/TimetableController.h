#pragma once

#include <drogon/HttpController.h>

class TimetableController : public drogon::HttpController<TimetableController> {
public:
    METHOD_LIST_BEGIN
    // POST /schedule
    ADD_METHOD_TO(TimetableController::schedule, "/schedule", drogon::Post);
    METHOD_LIST_END

    void schedule(const drogon::HttpRequestPtr &req,
                  std::function<void (const drogon::HttpResponsePtr &)> &&callback);
};
