#include "client/FrameReplay.h"

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace ag::client {

namespace {

std::string Trim(const std::string& s) {
  const auto begin = s.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return "";
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(begin, end - begin + 1);
}

bool ParseDouble(const std::string& text, double& out) {
  if (text.empty()) {
    return false;
  }
  char* end = nullptr;
  out = std::strtod(text.c_str(), &end);
  return end != text.c_str() && *end == '\0';
}

bool ParseFlag(const std::string& text, bool& out) {
  if (text == "1" || text == "true" || text == "True") {
    out = true;
    return true;
  }
  if (text == "0" || text == "false" || text == "False") {
    out = false;
    return true;
  }
  return false;
}

}  // namespace

FrameReplay::LoadResult FrameReplay::LoadFile(const std::string& path) {
  std::ifstream file(path);
  if (!file.good()) {
    return LoadResult{.success = false,
                      .error_message = "Cannot open replay file: " + path};
  }
  return Load(file);
}

FrameReplay::LoadResult FrameReplay::Load(std::istream& in) {
  LoadResult result;
  std::string line;
  int line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    line = Trim(line);
    if (line.empty() || line.rfind("ts", 0) == 0) {
      continue;
    }

    std::vector<std::string> fields;
    std::stringstream ss(line);
    std::string field;
    while (std::getline(ss, field, ',')) {
      fields.push_back(Trim(field));
    }

    core::FrameSignal frame;
    if (fields.size() != 5 || !ParseDouble(fields[0], frame.timestamp) ||
        !ParseDouble(fields[1], frame.ear) ||
        !ParseDouble(fields[2], frame.gaze_h) ||
        !ParseDouble(fields[3], frame.gaze_v) ||
        !ParseFlag(fields[4], frame.detected)) {
      result.frames.clear();
      result.error_message =
          "Malformed replay row at line " + std::to_string(line_no);
      return result;
    }
    result.frames.push_back(frame);
  }
  result.success = true;
  return result;
}

}  // namespace ag::client
