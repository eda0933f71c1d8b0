#include "RunLogController.hpp"
#include "RunLogJson.hpp"
#include "ServerConfig.hpp"

#include <iostream>

namespace ag::server {

drogon::HttpResponsePtr RunLogController::make_response(
    const Json::Value& payload, drogon::HttpStatusCode code) {
    auto resp = drogon::HttpResponse::newHttpResponse();
    resp->setStatusCode(code);
    resp->setContentTypeCode(drogon::CT_APPLICATION_JSON);
    resp->setBody(to_string(payload));
    resp->addHeader("Access-Control-Allow-Origin", "*");
    return resp;
}

drogon::HttpResponsePtr RunLogController::not_found(const std::string& run_id) {
    return make_response(error_payload("log not found for run_id=" + run_id),
                         drogon::k404NotFound);
}

void RunLogController::health(const drogon::HttpRequestPtr&, Callback&& callback) {
    Json::Value payload;
    payload["ok"] = true;
    payload["log_dir"] = GetRunLogStore().get_config().log_dir;
    callback(make_response(payload));
}

void RunLogController::list_logs(const drogon::HttpRequestPtr&, Callback&& callback) {
    callback(make_response(ok_payload(runs_to_json(GetRunLogStore().list_runs()))));
}

void RunLogController::latest_any(const drogon::HttpRequestPtr&, Callback&& callback) {
    callback(make_response(ok_payload(GetRunLogStore().read_latest_any())));
}

void RunLogController::latest_for_run(const drogon::HttpRequestPtr&,
                                      Callback&& callback,
                                      std::string run_id) {
    RunLogStore& store = GetRunLogStore();
    if (!store.has_run(run_id)) {
        callback(not_found(run_id));
        return;
    }
    callback(make_response(ok_payload(store.read_latest(run_id))));
}

void RunLogController::samples_for_run(const drogon::HttpRequestPtr&,
                                       Callback&& callback,
                                       std::string run_id) {
    RunLogStore& store = GetRunLogStore();
    if (!store.has_run(run_id)) {
        callback(not_found(run_id));
        return;
    }
    Json::Value data(Json::arrayValue);
    for (const auto& row : store.read_all(run_id)) {
        data.append(row_to_json(row));
    }
    callback(make_response(ok_payload(data)));
}

}  // namespace ag::server
