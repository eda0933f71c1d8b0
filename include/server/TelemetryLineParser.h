#pragma once

#include <optional>
#include <regex>
#include <string>

namespace ag::server {

// Field values as printed by attention_client, kept verbatim.
struct TelemetryFields {
  std::string score;
  std::string ear;
  std::string gaze_h;
  std::string gaze_v;
};

class TelemetryLineParser {
 public:
  TelemetryLineParser();

  std::optional<TelemetryFields> Parse(const std::string& line) const;

 private:
  std::regex line_regex_;
};

}  // namespace ag::server
