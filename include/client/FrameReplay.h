#pragma once

#include <istream>
#include <string>
#include <vector>

#include "core/Types.h"

namespace ag::client {

// Per-frame features recorded by an external landmark extractor, one CSV
// row per frame: ts,ear,gaze_h,gaze_v,detected.
class FrameReplay {
 public:
  struct LoadResult {
    std::vector<core::FrameSignal> frames;
    bool success = false;
    std::string error_message;
  };

  static LoadResult LoadFile(const std::string& path);
  static LoadResult Load(std::istream& in);
};

}  // namespace ag::client
