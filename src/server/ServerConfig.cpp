#include "ServerConfig.hpp"

#include <cstdlib>
#include <iostream>

namespace ag::server {

namespace {

void read_env_int(const char* name, int& out) {
    const char* v = std::getenv(name);
    if (v == nullptr || *v == '\0') return;
    char* end = nullptr;
    const long parsed = std::strtol(v, &end, 10);
    if (end == v || *end != '\0' || parsed <= 0) {
        std::cerr << "[ServerConfig] Ignoring invalid " << name << "=" << v << std::endl;
        return;
    }
    out = static_cast<int>(parsed);
}

}  // namespace

ServerConfig LoadServerConfig() {
    ServerConfig cfg;
    if (const char* v = std::getenv("AG_LOG_DIR")) cfg.log_dir = v;
    if (const char* v = std::getenv("AG_HTTP_HOST")) cfg.http_host = v;
    if (const char* v = std::getenv("AG_GRPC_ADDRESS")) cfg.grpc_address = v;
    if (const char* v = std::getenv("AG_INGEST_STDIN")) {
        const std::string s(v);
        cfg.ingest_stdin = (s == "1" || s == "true" || s == "on");
    }
    read_env_int("AG_HTTP_PORT", cfg.http_port);
    read_env_int("AG_HTTP_THREADS", cfg.http_threads);
    return cfg;
}

ServerConfig& GetServerConfig() {
    static ServerConfig cfg = LoadServerConfig();
    return cfg;
}

RunLogStore& GetRunLogStore() {
    // 분리된 stdin 수집 스레드가 종료 시점에도 append 할 수 있으므로 소멸시키지 않음
    static RunLogStore* store = new RunLogStore(RunLogStore::Config{GetServerConfig().log_dir});
    return *store;
}

}  // namespace ag::server
