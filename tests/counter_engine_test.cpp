#include <gtest/gtest.h>

#include <deckprep/counter_engine.hpp>

#include <cmath>
#include <limits>

namespace deckprep::test {

namespace {

calibration_table table_of(std::initializer_list<calibration_checkpoint> cps)
{
  calibration_table table;
  table.checkpoints = cps;
  return table;
}

}

TEST(StaticCounter, FloorsElapsedTimesRate) {
  EXPECT_EQ(counter_at(0.0, static_counter{1.0}), 0);
  EXPECT_EQ(counter_at(10.0, static_counter{1.42}), 14);
  EXPECT_EQ(counter_at(59.99, static_counter{1.0}), 59);
}

TEST(StaticCounter, IsMonotonic) {
  const static_counter model{1.35};
  long previous = counter_at(0.0, model);
  for (double t = 0.25; t < 1800.0; t += 0.25) {
    const long current = counter_at(t, model);
    ASSERT_GE(current, previous) << "at " << t;
    previous = current;
  }
}

TEST(ManualCounter, InterpolatesBetweenCheckpoints) {
  const manual_counter model{table_of({{60, 60, ""}, {300, 300, ""}}), 1.0};
  EXPECT_EQ(counter_at(180.0, model), 180);
  EXPECT_EQ(counter_at(60.0, model), 60);
  EXPECT_EQ(counter_at(300.0, model), 300);
}

TEST(ManualCounter, InterpolationUsesBracketingPair) {
  const manual_counter model{
    table_of({{60, 90, ""}, {300, 420, ""}, {1200, 1500, ""}}), 1.0
  };
  // 420 + (1500 - 420) * 450 / 900
  EXPECT_EQ(counter_at(750.0, model), 960);
  // 90 + 330 * 0.5
  EXPECT_EQ(counter_at(180.0, model), 255);
}

TEST(ManualCounter, ExtrapolatesBeforeFirstCheckpoint) {
  const manual_counter model{table_of({{60, 90, ""}}), 1.0};
  EXPECT_EQ(counter_at(30.0, model), 45);
  EXPECT_EQ(counter_at(0.0, model), 0);
}

TEST(ManualCounter, ExtrapolatesPastLastCheckpointWithLastSlope) {
  const manual_counter model{table_of({{60, 60, ""}, {300, 420, ""}}), 1.0};
  // slope of the last two is 1.5 counts/sec
  EXPECT_EQ(counter_at(400.0, model), 570);
}

TEST(ManualCounter, SingleCheckpointExtrapolatesWithItsOwnRatio) {
  const manual_counter model{table_of({{60, 90, ""}}), 1.0};
  EXPECT_EQ(counter_at(120.0, model), 180);
}

TEST(ManualCounter, CheckpointAtZeroDoesNotDivideByZero) {
  const manual_counter model{table_of({{0, 0, ""}}), 1.0};
  EXPECT_EQ(counter_at(0.0, model), 0);
  EXPECT_EQ(counter_at(100.0, model), 0);
}

TEST(ManualCounter, WithoutCalibrationUsesFallbackRate) {
  const manual_counter model{std::nullopt, 1.5};
  EXPECT_EQ(counter_at(100.0, model), 150);

  const manual_counter empty{calibration_table{}, 2.0};
  EXPECT_EQ(counter_at(100.0, empty), 200);
}

TEST(AutoCounter, MidpointMatchesBaseRate) {
  const auto_counter model{1.0, reel_geometry{}};
  const double half = reel_geometry{}.tape_length_mm
                    / reel_geometry{}.tape_speed_mm_per_s / 2.0;
  EXPECT_EQ(counter_at(half, model), static_cast<long>(std::floor(half)));
}

TEST(AutoCounter, RunsFastEarlyAndSlowLate) {
  const auto_counter model{1.0, reel_geometry{}};
  EXPECT_GT(counter_at(60.0, model), 60);
  EXPECT_LT(counter_at(1700.0, model), 1700);
}

TEST(AutoCounter, IsMonotonic) {
  const auto_counter model{1.2, reel_geometry{}};
  long previous = 0;
  for (double t = 0.0; t <= 1800.0; t += 1.0) {
    const long current = counter_at(t, model);
    ASSERT_GE(current, previous) << "at " << t;
    previous = current;
  }
}

TEST(AutoCounter, WithoutTapeLengthBehavesLikeStatic) {
  reel_geometry geometry;
  geometry.tape_length_mm = 0.0;
  const auto_counter model{1.5, geometry};
  EXPECT_EQ(counter_at(100.0, model), 150);
}

TEST(TakeupRadius, StartsAtHub) {
  reel_geometry geometry;
  EXPECT_DOUBLE_EQ(takeup_radius(geometry, 0.0), geometry.hub_radius_mm);
  EXPECT_GT(takeup_radius(geometry, geometry.tape_length_mm), geometry.hub_radius_mm);
}

TEST(TapeTransport, VisitDispatchesToModel) {
  const tape_transport stat = static_counter{2.0};
  const tape_transport manual = manual_counter{table_of({{60, 90, ""}}), 1.0};
  const tape_transport physics = auto_counter{1.0, reel_geometry{}};

  EXPECT_EQ(counter_at(10.0, stat), 20);
  EXPECT_EQ(counter_at(30.0, manual), 45);
  EXPECT_EQ(counter_at(60.0, physics),
            counter_at(60.0, auto_counter{1.0, reel_geometry{}}));

  EXPECT_EQ(mode_of(stat), counter_mode::static_rate);
  EXPECT_EQ(mode_of(manual), counter_mode::manual);
  EXPECT_EQ(mode_of(physics), counter_mode::automatic);
}

TEST(TapeTransport, NonFiniteTimeReadsZero) {
  EXPECT_EQ(counter_at(std::numeric_limits<double>::quiet_NaN(),
                       tape_transport{static_counter{1.0}}), 0);
}

TEST(CounterMode, ParsesCommandLineNames) {
  EXPECT_EQ(parse_counter_mode("static").value(), counter_mode::static_rate);
  EXPECT_EQ(parse_counter_mode("manual").value(), counter_mode::manual);
  EXPECT_EQ(parse_counter_mode("auto").value(), counter_mode::automatic);
  EXPECT_FALSE(parse_counter_mode("physics").has_value());

  for (auto mode: {counter_mode::static_rate, counter_mode::manual,
                   counter_mode::automatic})
    EXPECT_EQ(parse_counter_mode(to_string(mode)).value(), mode);
}

TEST(CounterMode, DescribeNamesTheMode) {
  EXPECT_NE(describe(static_counter{1.42}).find("Static Linear"), std::string::npos);
  EXPECT_NE(describe(manual_counter{}).find("no calibration"), std::string::npos);
  EXPECT_NE(describe(auto_counter{}).find("Auto Physics"), std::string::npos);
}

} // namespace deckprep::test
