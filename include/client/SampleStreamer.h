#pragma once

#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>

#include "attention.grpc.pb.h"
#include "core/Types.h"

namespace ag::client {

// Client-streaming upload of score samples to attention_server.
class SampleStreamer {
 public:
  explicit SampleStreamer(std::string address);
  ~SampleStreamer();

  bool Open();
  bool Send(const core::ScoreSample& sample);
  // Finishes the stream; run_id receives the server-side run on success.
  bool Close(std::string* run_id);
  bool IsOpen() const { return writer_ != nullptr; }

 private:
  std::string address_;
  std::unique_ptr<attentiongauge::TelemetryService::Stub> stub_;
  std::unique_ptr<grpc::ClientContext> context_;
  attentiongauge::StreamSummary summary_;
  std::unique_ptr<grpc::ClientWriter<attentiongauge::ScoreSample>> writer_;
};

}  // namespace ag::client
