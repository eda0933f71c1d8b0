#pragma once

#include <fstream>
#include <ostream>
#include <string>

#include "core/Types.h"

namespace ag::client {

class TelemetryWriter {
 public:
  TelemetryWriter(std::ostream& out, std::string csv_path, double start_time);
  ~TelemetryWriter();

  void Write(const core::ScoreSample& sample);

  // Opens the CSV (with header) on first enable. Returns false if the file
  // could not be opened.
  bool SetCsvLogging(bool enabled);
  bool ToggleCsvLogging();
  bool IsCsvLogging() const;

  static std::string FormatLine(const core::ScoreSample& sample,
                                double start_time);
  static std::string FormatCsvRow(const core::ScoreSample& sample);
  static const char* CsvHeader();

 private:
  std::ostream& out_;
  std::string csv_path_;
  double start_time_;
  std::ofstream csv_;
  bool csv_enabled_ = false;
};

}  // namespace ag::client
