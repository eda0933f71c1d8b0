#include "client/ClientOptions.h"

#include <cstdlib>

namespace ag::client {

ParseResult ParseClientOptions(int argc, const char* const* argv,
                               const core::ScoringConfig& defaults) {
  ParseResult result;
  result.options.scoring = defaults;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    const bool has_value = i + 1 < argc;

    if (arg == "--help" || arg == "-h") {
      result.show_help = true;
      return result;
    } else if (arg == "--start-100") {
      result.options.scoring.start_at_100 = true;
    } else if (arg == "--log") {
      result.options.log_csv = true;
    } else if (arg == "--replay" || arg == "--csv-path" || arg == "--server" ||
               arg == "--fps") {
      if (!has_value) {
        result.error_message = "Missing value for " + arg;
        return result;
      }
      const std::string value = argv[++i];
      if (arg == "--replay") {
        result.options.replay_path = value;
      } else if (arg == "--csv-path") {
        result.options.csv_path = value;
      } else if (arg == "--server") {
        result.options.server_address = value;
      } else {
        char* end = nullptr;
        const long fps = std::strtol(value.c_str(), &end, 10);
        if (end == value.c_str() || *end != '\0') {
          result.error_message = "Invalid --fps value: " + value;
          return result;
        }
        result.options.scoring.processing_fps = fps < 1 ? 1 : static_cast<int>(fps);
      }
    } else {
      result.error_message = "Unknown argument: " + arg;
      return result;
    }
  }

  if (result.options.replay_path.empty()) {
    result.error_message = "--replay is required";
    return result;
  }
  result.success = true;
  return result;
}

const char* ClientUsage() {
  return "Usage: attention_client --replay <frames.csv> [--fps N] [--start-100]\n"
         "                        [--log] [--csv-path P] [--server host:port]\n";
}

}  // namespace ag::client
