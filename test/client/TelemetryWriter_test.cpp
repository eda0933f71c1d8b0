#include "client/TelemetryWriter.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace ag::client {
namespace {

namespace fs = std::filesystem;

core::ScoreSample MakeSample(double ts, double score) {
  return core::ScoreSample{.timestamp = ts,
                           .score = score,
                           .ear = 0.25,
                           .gaze_h = 0.032,
                           .gaze_v = 0.02};
}

std::string ReadAll(const fs::path& path) {
  std::ifstream in(path);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

class TelemetryWriterFileTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = fs::temp_directory_path() /
           ("ag_writer_" + std::string(::testing::UnitTest::GetInstance()
                                           ->current_test_info()
                                           ->name()));
    fs::remove_all(dir_);
    fs::create_directories(dir_);
  }

  void TearDown() override { fs::remove_all(dir_); }

  fs::path dir_;
};

TEST(TelemetryWriter, FormatsStatusLine) {
  EXPECT_EQ(TelemetryWriter::FormatLine(MakeSample(10.25, 85.23), 10.0),
            "t=0.25 score=85.23 ear=0.250 gaze_h=0.032 gaze_v=0.020");
}

TEST(TelemetryWriter, FormatsCsvRow) {
  EXPECT_EQ(TelemetryWriter::FormatCsvRow(MakeSample(10.25, 85.23)),
            "10.250,85.230,0.2500,0.0320,0.0200");
  EXPECT_STREQ(TelemetryWriter::CsvHeader(), "ts,score,ear,gaze_h,gaze_v");
}

TEST(TelemetryWriter, WritesOneLinePerSample) {
  std::ostringstream out;
  TelemetryWriter writer(out, "unused.csv", 0.0);
  writer.Write(MakeSample(0.5, 40.0));
  writer.Write(MakeSample(1.0, 42.5));
  EXPECT_EQ(out.str(),
            "t=0.50 score=40.00 ear=0.250 gaze_h=0.032 gaze_v=0.020\n"
            "t=1.00 score=42.50 ear=0.250 gaze_h=0.032 gaze_v=0.020\n");
  EXPECT_FALSE(writer.IsCsvLogging());
}

TEST_F(TelemetryWriterFileTest, CsvLoggingWritesHeaderAndRows) {
  const fs::path csv = dir_ / "log.csv";
  std::ostringstream out;
  {
    TelemetryWriter writer(out, csv.string(), 0.0);
    writer.Write(MakeSample(1.0, 50.0));
    ASSERT_TRUE(writer.SetCsvLogging(true));
    writer.Write(MakeSample(2.0, 60.0));
  }
  EXPECT_EQ(ReadAll(csv),
            "ts,score,ear,gaze_h,gaze_v\n"
            "2.000,60.000,0.2500,0.0320,0.0200\n");
}

TEST_F(TelemetryWriterFileTest, ToggleSuspendsRowsWithoutReopening) {
  const fs::path csv = dir_ / "log.csv";
  std::ostringstream out;
  {
    TelemetryWriter writer(out, csv.string(), 0.0);
    EXPECT_TRUE(writer.ToggleCsvLogging());
    EXPECT_TRUE(writer.IsCsvLogging());
    writer.Write(MakeSample(1.0, 50.0));
    EXPECT_TRUE(writer.ToggleCsvLogging());
    EXPECT_FALSE(writer.IsCsvLogging());
    writer.Write(MakeSample(2.0, 60.0));
    EXPECT_TRUE(writer.ToggleCsvLogging());
    writer.Write(MakeSample(3.0, 70.0));
  }
  EXPECT_EQ(ReadAll(csv),
            "ts,score,ear,gaze_h,gaze_v\n"
            "1.000,50.000,0.2500,0.0320,0.0200\n"
            "3.000,70.000,0.2500,0.0320,0.0200\n");
}

TEST_F(TelemetryWriterFileTest, UnwritablePathDisablesCsvLogging) {
  const fs::path csv = dir_ / "missing" / "log.csv";
  std::ostringstream out;
  TelemetryWriter writer(out, csv.string(), 0.0);
  EXPECT_FALSE(writer.SetCsvLogging(true));
  EXPECT_FALSE(writer.IsCsvLogging());
  writer.Write(MakeSample(1.0, 50.0));
  EXPECT_FALSE(out.str().empty());
  EXPECT_FALSE(fs::exists(csv));
}

}  // namespace
}  // namespace ag::client
