#include "client/ClientOptions.h"
#include "client/FrameReplay.h"
#include "client/TelemetryWriter.h"
#include "client/TickDriver.h"
#include "core/ScoringConfig.h"

#include <iostream>
#include <memory>
#include <string>

#if defined(AG_ENABLE_GRPC)
#include "client/SampleStreamer.h"
#endif

namespace {

void ReportStateChanges(const ag::core::Session& session, bool& was_present,
                        bool& was_calibrating) {
  const bool present = session.State() == ag::core::PresenceState::kPresent;
  if (present != was_present) {
    std::cerr << "[Client] " << (present ? "Face acquired" : "No face detected")
              << std::endl;
    was_present = present;
  }
  const bool calibrating = session.IsCalibrating();
  if (calibrating != was_calibrating) {
    if (calibrating) {
      std::cerr << "[Client] Calibrating... look straight & keep eyes open"
                << std::endl;
    } else if (auto target = session.CalibrationTarget()) {
      std::cerr << "[Client] EAR target=" << *target << std::endl;
    } else {
      std::cerr << "[Client] Calibration window had no centered samples, "
                << "using default EAR target" << std::endl;
    }
    was_calibrating = calibrating;
  }
}

}  // namespace

int main(int argc, char** argv) {
  const ag::client::ParseResult parsed =
      ag::client::ParseClientOptions(argc, argv, ag::core::LoadScoringConfig());
  if (parsed.show_help) {
    std::cout << ag::client::ClientUsage();
    return 0;
  }
  if (!parsed.success) {
    std::cerr << "[Client] " << parsed.error_message << "\n"
              << ag::client::ClientUsage();
    return 2;
  }
  const ag::client::ClientOptions& options = parsed.options;

  ag::client::FrameReplay::LoadResult replay =
      ag::client::FrameReplay::LoadFile(options.replay_path);
  if (!replay.success) {
    std::cerr << "[Client] " << replay.error_message << std::endl;
    return 1;
  }
  std::cerr << "[Client] Loaded " << replay.frames.size() << " frames from "
            << options.replay_path << " (fps=" << options.scoring.processing_fps
            << ", start-100=" << (options.scoring.start_at_100 ? "on" : "off")
            << ")" << std::endl;
  if (replay.frames.empty()) {
    return 0;
  }

  ag::client::TickDriver driver(options.scoring);
  ag::client::TelemetryWriter telemetry(std::cout, options.csv_path,
                                        replay.frames.front().timestamp);
  if (options.log_csv && !telemetry.SetCsvLogging(true)) {
    return 1;
  }

#if defined(AG_ENABLE_GRPC)
  std::unique_ptr<ag::client::SampleStreamer> streamer;
  if (!options.server_address.empty()) {
    streamer = std::make_unique<ag::client::SampleStreamer>(options.server_address);
    if (!streamer->Open()) {
      return 1;
    }
  }
#else
  if (!options.server_address.empty()) {
    std::cerr << "[Client] Built without gRPC, ignoring --server" << std::endl;
  }
#endif

  bool upload_ok = true;
  bool was_present = false;
  bool was_calibrating = false;
  size_t processed = 0;
  for (const auto& frame : replay.frames) {
    if (driver.IsQuitRequested()) {
      break;
    }
    auto sample = driver.SupplyTick(frame);
    if (!sample) {
      continue;
    }
    ++processed;
    ReportStateChanges(driver.session(), was_present, was_calibrating);
    telemetry.Write(*sample);
#if defined(AG_ENABLE_GRPC)
    if (streamer && !streamer->Send(*sample)) {
      std::cerr << "[Client] Server stream closed, stopping upload" << std::endl;
      if (!streamer->Close(nullptr)) {
        std::cerr << "[Client] Upload ended early" << std::endl;
      }
      upload_ok = false;
      streamer.reset();
    }
#endif
  }

#if defined(AG_ENABLE_GRPC)
  if (streamer && !streamer->Close(nullptr)) {
    upload_ok = false;
  }
#endif

  std::cerr << "[Client] Processed " << processed << " of "
            << replay.frames.size() << " frames, final score="
            << driver.session().score() << std::endl;
  return upload_ok ? 0 : 1;
}
