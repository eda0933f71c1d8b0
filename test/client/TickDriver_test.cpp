#include "client/TickDriver.h"

#include <gtest/gtest.h>

namespace ag::client {
namespace {

core::ScoringConfig FourHz() {
  core::ScoringConfig config;
  config.processing_fps = 4;
  return config;
}

core::FrameSignal Face(double t) {
  core::FrameSignal frame;
  frame.timestamp = t;
  frame.ear = 0.25;
  frame.detected = true;
  return frame;
}

TEST(TickDriver, DropsFramesFasterThanProcessingRate) {
  TickDriver driver(FourHz());
  EXPECT_TRUE(driver.SupplyTick(Face(0.0)).has_value());
  EXPECT_FALSE(driver.SupplyTick(Face(0.125)).has_value());
  EXPECT_TRUE(driver.SupplyTick(Face(0.25)).has_value());
  EXPECT_FALSE(driver.SupplyTick(Face(0.375)).has_value());
  EXPECT_TRUE(driver.SupplyTick(Face(0.5)).has_value());
}

TEST(TickDriver, ForwardsToSession) {
  TickDriver driver(FourHz());
  auto sample = driver.SupplyTick(Face(1.0));
  ASSERT_TRUE(sample.has_value());
  EXPECT_DOUBLE_EQ(sample->timestamp, 1.0);
  EXPECT_DOUBLE_EQ(sample->score, 42.5);
  EXPECT_DOUBLE_EQ(driver.session().score(), 42.5);
}

TEST(TickDriver, PausedDriverDeliversNoTicks) {
  TickDriver driver(FourHz());
  driver.Pause();
  EXPECT_TRUE(driver.IsPaused());
  EXPECT_FALSE(driver.SupplyTick(Face(0.0)).has_value());
  EXPECT_FALSE(driver.SupplyTick(Face(1.0)).has_value());
  EXPECT_DOUBLE_EQ(driver.session().score(), 40.0);

  driver.Resume();
  EXPECT_TRUE(driver.SupplyTick(Face(1.25)).has_value());
}

TEST(TickDriver, CanStartPaused) {
  TickDriver driver(FourHz(), true);
  EXPECT_FALSE(driver.SupplyTick(Face(0.0)).has_value());
  driver.Resume();
  EXPECT_TRUE(driver.SupplyTick(Face(0.0)).has_value());
}

TEST(TickDriver, QuitIsFinal) {
  TickDriver driver(FourHz());
  driver.Quit();
  EXPECT_TRUE(driver.IsQuitRequested());
  driver.Resume();
  EXPECT_FALSE(driver.SupplyTick(Face(0.0)).has_value());
}

}  // namespace
}  // namespace ag::client
