#pragma once

#include <string>

#include "RunLogStore.hpp"

namespace ag::server {

struct ServerConfig {
    std::string log_dir = "logs";
    std::string http_host = "0.0.0.0";
    int http_port = 8000;
    int http_threads = 4;
    std::string grpc_address = "0.0.0.0:50051";
    bool ingest_stdin = false;
};

// AG_* 환경 변수로 기본값을 덮어씀
ServerConfig LoadServerConfig();

ServerConfig& GetServerConfig();

// 프로세스 전체에서 공유하는 로그 저장소 (GetServerConfig().log_dir 기준, 종료 시에도 유지)
RunLogStore& GetRunLogStore();

}  // namespace ag::server
