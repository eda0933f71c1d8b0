#include "RunLogJson.hpp"

namespace ag::server {

Json::Value row_to_json(const RunLogStore::Row& row) {
    Json::Value value;
    value["ts"] = row.ts;
    value["score"] = row.score;
    value["ear"] = row.ear;
    value["gaze_h"] = row.gaze_h;
    value["gaze_v"] = row.gaze_v;
    return value;
}

Json::Value runs_to_json(const std::vector<RunLogStore::RunInfo>& runs) {
    Json::Value data(Json::arrayValue);
    for (const auto& run : runs) {
        Json::Value item;
        item["id"] = run.id;
        item["title"] = run.id;
        item["start"] = Json::Value::null;
        item["isOnline"] = Json::Value::null;
        item["created_at"] = run.created_at;
        data.append(item);
    }
    return data;
}

Json::Value ok_payload(const Json::Value& data) {
    Json::Value payload;
    payload["status"] = "ok";
    payload["data"] = data;
    return payload;
}

Json::Value ok_payload(const std::optional<RunLogStore::Row>& row) {
    return ok_payload(row ? row_to_json(*row) : Json::Value(Json::nullValue));
}

Json::Value error_payload(const std::string& message) {
    Json::Value payload;
    payload["status"] = "error";
    payload["message"] = message;
    return payload;
}

std::string to_string(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

}  // namespace ag::server
