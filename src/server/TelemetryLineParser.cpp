#include "server/TelemetryLineParser.h"

namespace ag::server {

TelemetryLineParser::TelemetryLineParser()
    : line_regex_(
          "score=([-0-9.]+).*ear=([-0-9.]+).*gaze_h=([-0-9.]+).*gaze_v=([-0-9.]+)") {}

std::optional<TelemetryFields> TelemetryLineParser::Parse(
    const std::string& line) const {
  std::smatch m;
  if (!std::regex_search(line, m, line_regex_)) {
    return std::nullopt;
  }
  return TelemetryFields{m[1].str(), m[2].str(), m[3].str(), m[4].str()};
}

}  // namespace ag::server
