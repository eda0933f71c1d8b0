#include "client/TelemetryWriter.h"

#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

namespace ag::client {

TelemetryWriter::TelemetryWriter(std::ostream& out, std::string csv_path,
                                 double start_time)
    : out_(out), csv_path_(std::move(csv_path)), start_time_(start_time) {}

TelemetryWriter::~TelemetryWriter() {
  if (csv_.is_open()) {
    csv_.close();
  }
}

void TelemetryWriter::Write(const core::ScoreSample& sample) {
  out_ << FormatLine(sample, start_time_) << std::endl;
  if (csv_enabled_ && csv_.is_open()) {
    csv_ << FormatCsvRow(sample) << "\n";
    csv_.flush();
  }
}

bool TelemetryWriter::SetCsvLogging(bool enabled) {
  if (enabled && !csv_.is_open()) {
    csv_.open(csv_path_, std::ios::out | std::ios::trunc);
    if (!csv_.is_open()) {
      std::cerr << "[TelemetryWriter] Failed to open CSV log: " << csv_path_
                << std::endl;
      csv_enabled_ = false;
      return false;
    }
    csv_ << CsvHeader() << "\n";
    std::cerr << "[TelemetryWriter] CSV logging to " << csv_path_ << std::endl;
  }
  csv_enabled_ = enabled;
  return true;
}

bool TelemetryWriter::ToggleCsvLogging() {
  return SetCsvLogging(!csv_enabled_);
}

bool TelemetryWriter::IsCsvLogging() const {
  return csv_enabled_;
}

std::string TelemetryWriter::FormatLine(const core::ScoreSample& sample,
                                        double start_time) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(2) << "t="
      << (sample.timestamp - start_time) << " score=" << sample.score
      << std::setprecision(3) << " ear=" << sample.ear
      << " gaze_h=" << sample.gaze_h << " gaze_v=" << sample.gaze_v;
  return oss.str();
}

std::string TelemetryWriter::FormatCsvRow(const core::ScoreSample& sample) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(3) << sample.timestamp << ","
      << sample.score << "," << std::setprecision(4) << sample.ear << ","
      << sample.gaze_h << "," << sample.gaze_v;
  return oss.str();
}

const char* TelemetryWriter::CsvHeader() {
  return "ts,score,ear,gaze_h,gaze_v";
}

}  // namespace ag::client
