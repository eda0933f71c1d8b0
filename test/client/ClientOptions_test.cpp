#include "client/ClientOptions.h"

#include <gtest/gtest.h>

#include <vector>

namespace ag::client {
namespace {

ParseResult Parse(std::vector<const char*> args) {
  args.insert(args.begin(), "attention_client");
  return ParseClientOptions(static_cast<int>(args.size()), args.data(),
                            core::ScoringConfig{});
}

TEST(ClientOptions, ReplayOnlyUsesDefaults) {
  const auto result = Parse({"--replay", "frames.csv"});
  ASSERT_TRUE(result.success) << result.error_message;
  EXPECT_EQ(result.options.replay_path, "frames.csv");
  EXPECT_EQ(result.options.csv_path, "attention_log.csv");
  EXPECT_TRUE(result.options.server_address.empty());
  EXPECT_FALSE(result.options.log_csv);
  EXPECT_FALSE(result.options.scoring.start_at_100);
  EXPECT_EQ(result.options.scoring.processing_fps, 10);
}

TEST(ClientOptions, ParsesAllFlags) {
  const auto result =
      Parse({"--replay", "f.csv", "--fps", "15", "--start-100", "--log",
             "--csv-path", "out.csv", "--server", "localhost:50051"});
  ASSERT_TRUE(result.success) << result.error_message;
  EXPECT_EQ(result.options.scoring.processing_fps, 15);
  EXPECT_TRUE(result.options.scoring.start_at_100);
  EXPECT_TRUE(result.options.log_csv);
  EXPECT_EQ(result.options.csv_path, "out.csv");
  EXPECT_EQ(result.options.server_address, "localhost:50051");
}

TEST(ClientOptions, FpsBelowOneClampsToOne) {
  const auto result = Parse({"--replay", "f.csv", "--fps", "0"});
  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.options.scoring.processing_fps, 1);
}

TEST(ClientOptions, ReportsErrors) {
  EXPECT_EQ(Parse({}).error_message, "--replay is required");
  EXPECT_EQ(Parse({"--replay"}).error_message, "Missing value for --replay");
  EXPECT_EQ(Parse({"--replay", "f.csv", "--fps", "fast"}).error_message,
            "Invalid --fps value: fast");
  EXPECT_EQ(Parse({"--verbose"}).error_message, "Unknown argument: --verbose");
  EXPECT_FALSE(Parse({"--verbose"}).success);
}

TEST(ClientOptions, HelpShortCircuits) {
  const auto result = Parse({"--help", "--bogus"});
  EXPECT_TRUE(result.show_help);
  EXPECT_FALSE(result.success);
  EXPECT_TRUE(result.error_message.empty());
}

}  // namespace
}  // namespace ag::client
