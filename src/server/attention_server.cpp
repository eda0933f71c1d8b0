#include "RunLogStore.hpp"
#include "ServerConfig.hpp"
#include "TelemetryIngest.hpp"
#include "server/TelemetryLineParser.h"

#include <drogon/drogon.h>

#include <iostream>
#include <memory>
#include <thread>

#if defined(AG_ENABLE_GRPC)
#include <grpcpp/grpcpp.h>

#include "attention.grpc.pb.h"
#endif

#if defined(AG_ENABLE_GRPC)
class TelemetryServiceImpl final : public attentiongauge::TelemetryService::Service {
 public:
  grpc::Status StreamSamples(
      grpc::ServerContext* context,
      grpc::ServerReader<attentiongauge::ScoreSample>* reader,
      attentiongauge::StreamSummary* summary) override {
    (void)context;
    ag::server::RunLogStore& store = ag::server::GetRunLogStore();
    const std::string run_id = store.create_run();
    if (run_id.empty()) {
      return grpc::Status(grpc::StatusCode::INTERNAL, "failed to create run log");
    }

    int64_t received = 0;
    attentiongauge::ScoreSample sample;
    while (reader->Read(&sample)) {
      if (!store.append(run_id, ag::server::make_row(sample.score(), sample.ear(),
                                                     sample.gaze_h(), sample.gaze_v()))) {
        return grpc::Status(grpc::StatusCode::INTERNAL, "failed to write run log");
      }
      ++received;
    }
    std::cout << "[TelemetryService] " << run_id << ": " << received << " samples\n";
    summary->set_received(received);
    summary->set_run_id(run_id);
    return grpc::Status::OK;
  }
};
#endif

int main() {
  std::cout << "================================================\n";
  std::cout << "  Attention Gauge Log Server\n";
  std::cout << "================================================\n\n";

  const ag::server::ServerConfig& config = ag::server::GetServerConfig();
  ag::server::RunLogStore& store = ag::server::GetRunLogStore();
  if (!store.initialize()) {
    return 1;
  }

#if defined(AG_ENABLE_GRPC)
  TelemetryServiceImpl service;
  grpc::ServerBuilder builder;
  builder.AddListeningPort(config.grpc_address, grpc::InsecureServerCredentials());
  builder.RegisterService(&service);
  std::unique_ptr<grpc::Server> grpc_server(builder.BuildAndStart());
  if (!grpc_server) {
    std::cerr << "Failed to start gRPC server on " << config.grpc_address << "\n";
    return 1;
  }
  std::cout << "gRPC telemetry listening on " << config.grpc_address << "\n";
#endif

  std::thread ingest_thread;
  if (config.ingest_stdin) {
    const std::string run_id = store.create_run();
    if (run_id.empty()) {
      return 1;
    }
    std::cout << "Recording stdin telemetry into " << run_id << "\n";
    ingest_thread = std::thread([&store, run_id]() {
      ag::server::TelemetryLineParser parser;
      const size_t written = ag::server::ingest_lines(std::cin, store, run_id, parser);
      std::cout << "[Ingest] stdin closed after " << written << " samples\n";
    });
  }

  std::cout << "Starting Drogon HTTP server on " << config.http_host << ":"
            << config.http_port << "\n";
  drogon::app()
      .setThreadNum(config.http_threads)
      .addListener(config.http_host, static_cast<uint16_t>(config.http_port))
      .run();

#if defined(AG_ENABLE_GRPC)
  grpc_server->Shutdown();
#endif
  // 블로킹된 std::cin 읽기는 중단할 수 없으므로 분리 (저장소는 소멸되지 않음)
  if (ingest_thread.joinable()) {
    ingest_thread.detach();
  }
  return 0;
}
