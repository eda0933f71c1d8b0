#pragma once

#include <optional>
#include <string>
#include <vector>

#include <json/json.h>

#include "RunLogStore.hpp"

namespace ag::server {

/**
 * @brief 데이터 행 → {"ts","score","ear","gaze_h","gaze_v"}
 */
Json::Value row_to_json(const RunLogStore::Row& row);

/**
 * @brief 실행 목록 → [{"id","title","start","isOnline","created_at"}]
 */
Json::Value runs_to_json(const std::vector<RunLogStore::RunInfo>& runs);

/**
 * @brief {"status":"ok","data":...} 응답 본문
 */
Json::Value ok_payload(const Json::Value& data);
Json::Value ok_payload(const std::optional<RunLogStore::Row>& row);
Json::Value error_payload(const std::string& message);

std::string to_string(const Json::Value& value);

}  // namespace ag::server
