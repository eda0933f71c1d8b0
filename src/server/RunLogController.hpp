#pragma once

#include <drogon/HttpController.h>

#include <functional>
#include <string>

namespace ag::server {

/**
 * @class RunLogController
 * @brief Drogon 기반 실행 로그 조회 HTTP 컨트롤러
 *
 * 경로:
 * - GET /health
 * - GET /logs                   실행 목록 (최신순)
 * - GET /logs/latest            가장 최근 실행의 마지막 샘플
 * - GET /logs/{run_id}/latest   특정 실행의 마지막 샘플
 * - GET /logs/{run_id}/samples  특정 실행의 전체 샘플
 */
class RunLogController : public drogon::HttpController<RunLogController> {
public:
    using Callback = std::function<void(const drogon::HttpResponsePtr&)>;

    METHOD_LIST_BEGIN
        ADD_METHOD_TO(RunLogController::health, "/health", drogon::Get);
        ADD_METHOD_TO(RunLogController::list_logs, "/logs", drogon::Get);
        ADD_METHOD_TO(RunLogController::latest_any, "/logs/latest", drogon::Get);
        ADD_METHOD_TO(RunLogController::latest_for_run, "/logs/{1}/latest", drogon::Get);
        ADD_METHOD_TO(RunLogController::samples_for_run, "/logs/{1}/samples", drogon::Get);
    METHOD_LIST_END

    void health(const drogon::HttpRequestPtr& req, Callback&& callback);
    void list_logs(const drogon::HttpRequestPtr& req, Callback&& callback);
    void latest_any(const drogon::HttpRequestPtr& req, Callback&& callback);
    void latest_for_run(const drogon::HttpRequestPtr& req, Callback&& callback,
                        std::string run_id);
    void samples_for_run(const drogon::HttpRequestPtr& req, Callback&& callback,
                         std::string run_id);

private:
    static drogon::HttpResponsePtr make_response(
        const Json::Value& payload,
        drogon::HttpStatusCode code = drogon::k200OK);
    static drogon::HttpResponsePtr not_found(const std::string& run_id);
};

}  // namespace ag::server
