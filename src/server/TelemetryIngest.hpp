#pragma once

#include <cstddef>
#include <istream>
#include <string>

#include "RunLogStore.hpp"
#include "server/TelemetryLineParser.h"

namespace ag::server {

/**
 * @brief 수치 샘플을 로그 행으로 변환
 *
 * 클라이언트 타임스탬프는 재생 기준 상대 시간이므로 쓰지 않고,
 * ts 에는 서버가 행을 받은 로컬 시각을 기록합니다 (stdin 수집과 동일).
 */
RunLogStore::Row make_row(double score, double ear, double gaze_h, double gaze_v);

/**
 * @brief 텔레메트리 줄 스트림을 읽어 run_id 에 기록
 * @return 기록된 행 수 (형식이 맞지 않는 줄은 무시)
 */
size_t ingest_lines(std::istream& in, RunLogStore& store,
                    const std::string& run_id,
                    const TelemetryLineParser& parser);

}  // namespace ag::server
