#include "client/SampleStreamer.h"

#include <iostream>
#include <utility>

namespace ag::client {

SampleStreamer::SampleStreamer(std::string address)
    : address_(std::move(address)) {}

SampleStreamer::~SampleStreamer() {
  if (writer_) {
    Close(nullptr);
  }
}

bool SampleStreamer::Open() {
  auto channel =
      grpc::CreateChannel(address_, grpc::InsecureChannelCredentials());
  stub_ = attentiongauge::TelemetryService::NewStub(channel);
  context_ = std::make_unique<grpc::ClientContext>();
  writer_ = stub_->StreamSamples(context_.get(), &summary_);
  if (!writer_) {
    std::cerr << "[SampleStreamer] Failed to open stream to " << address_
              << std::endl;
    return false;
  }
  std::cerr << "[SampleStreamer] Streaming to " << address_ << std::endl;
  return true;
}

bool SampleStreamer::Send(const core::ScoreSample& sample) {
  if (!writer_) {
    return false;
  }
  attentiongauge::ScoreSample msg;
  msg.set_timestamp(sample.timestamp);
  msg.set_score(sample.score);
  msg.set_ear(sample.ear);
  msg.set_gaze_h(sample.gaze_h);
  msg.set_gaze_v(sample.gaze_v);
  return writer_->Write(msg);
}

bool SampleStreamer::Close(std::string* run_id) {
  if (!writer_) {
    return false;
  }
  writer_->WritesDone();
  const grpc::Status status = writer_->Finish();
  writer_.reset();
  if (!status.ok()) {
    std::cerr << "[SampleStreamer] Stream failed: " << status.error_message()
              << std::endl;
    return false;
  }
  std::cerr << "[SampleStreamer] Server recorded " << summary_.received()
            << " samples as " << summary_.run_id() << std::endl;
  if (run_id != nullptr) {
    *run_id = summary_.run_id();
  }
  return true;
}

}  // namespace ag::client
