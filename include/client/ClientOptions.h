#pragma once

#include <string>

#include "core/ScoringConfig.h"

namespace ag::client {

struct ClientOptions {
  std::string replay_path;
  std::string csv_path = "attention_log.csv";
  std::string server_address;
  bool log_csv = false;
  core::ScoringConfig scoring;
};

struct ParseResult {
  ClientOptions options;
  bool success = false;
  bool show_help = false;
  std::string error_message;
};

// Parses attention_client arguments on top of the given scoring defaults.
ParseResult ParseClientOptions(int argc, const char* const* argv,
                               const core::ScoringConfig& defaults);

const char* ClientUsage();

}  // namespace ag::client
