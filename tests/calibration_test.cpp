#include <gtest/gtest.h>

#include <deckprep/calibration.hpp>

#include "scratch_dir.hpp"

#include <fstream>
#include <string>

namespace deckprep::test {

class CalibrationFile : public ScratchDir {
protected:
  std::filesystem::path write(const std::string &text) {
    auto file = dir / "counter_calibration.json";
    std::ofstream(file) << text;
    return file;
  }
};

TEST_F(CalibrationFile, LoadsAndSortsCheckpoints) {
  auto file = write(R"({
    "deck_model": "Sony TC-D5M",
    "tape_type": "C60",
    "calibration_date": "2024-05-01 10:00:00",
    "interpolation": "linear",
    "checkpoints": [
      {"time_seconds": 300, "counter": 310, "note": "5 minutes"},
      {"time_seconds": 60,  "counter": 70,  "note": "1 minute"},
      {"time_seconds": 1800, "counter": 1500, "note": "30 minutes"}
    ]
  })");

  auto table = load_calibration(file);
  ASSERT_TRUE(table.has_value()) << table.error();
  EXPECT_EQ(table->deck_model, "Sony TC-D5M");
  EXPECT_EQ(table->tape_type, "C60");
  ASSERT_EQ(table->checkpoints.size(), 3u);
  EXPECT_DOUBLE_EQ(table->checkpoints[0].time_seconds, 60.0);
  EXPECT_EQ(table->checkpoints[1].counter, 310);
  EXPECT_EQ(table->checkpoints[2].note, "30 minutes");
}

TEST_F(CalibrationFile, MissingMetadataDefaultsToUnknown) {
  auto table = load_calibration(write(R"({"checkpoints": [{"time_seconds": 60, "counter": 64}]})"));
  ASSERT_TRUE(table.has_value()) << table.error();
  EXPECT_EQ(table->deck_model, "Unknown");
  EXPECT_EQ(table->interpolation, "linear");
}

TEST_F(CalibrationFile, RejectsDuplicateTimes) {
  auto table = load_calibration(write(R"({"checkpoints": [
    {"time_seconds": 60, "counter": 60},
    {"time_seconds": 60, "counter": 62}
  ]})"));
  ASSERT_FALSE(table.has_value());
  EXPECT_NE(table.error().find("share the time"), std::string::npos);
}

TEST_F(CalibrationFile, RejectsUnsupportedInterpolation) {
  auto table = load_calibration(write(R"({"interpolation": "cubic",
    "checkpoints": [{"time_seconds": 60, "counter": 60}]})"));
  ASSERT_FALSE(table.has_value());
  EXPECT_NE(table.error().find("cubic"), std::string::npos);
}

TEST_F(CalibrationFile, RejectsEmptyAndMalformedFiles) {
  EXPECT_FALSE(load_calibration(write(R"({"checkpoints": []})")).has_value());
  EXPECT_FALSE(load_calibration(write(R"({"deck_model": "x"})")).has_value());
  EXPECT_FALSE(load_calibration(write("not json")).has_value());
  EXPECT_FALSE(load_calibration(write(R"({"checkpoints": [{"time_seconds": -1, "counter": 0}]})")).has_value());
  EXPECT_FALSE(load_calibration(dir / "missing.json").has_value());
}

TEST_F(CalibrationFile, SaveThenLoad) {
  calibration_table table;
  table.deck_model = "AIWA AD-F780";
  table.tape_type = "C90";
  table.calibration_date = "2024-05-01 10:00:00";
  table.checkpoints = {{60, 64, "1 minute"}, {1200, 1100, "20 minutes"}};

  const auto file = dir / "nested" / "cal.json";
  save_calibration(table, file);

  auto loaded = load_calibration(file);
  ASSERT_TRUE(loaded.has_value()) << loaded.error();
  EXPECT_EQ(loaded->deck_model, table.deck_model);
  ASSERT_EQ(loaded->checkpoints.size(), 2u);
  EXPECT_EQ(loaded->checkpoints[1].counter, 1100);
  EXPECT_EQ(loaded->checkpoints[1].note, "20 minutes");
}

TEST(CalibrationValidate, SortsInPlace) {
  calibration_table table;
  table.checkpoints = {{300, 300, "b"}, {60, 60, "a"}};
  ASSERT_TRUE(validate(table).has_value());
  EXPECT_EQ(table.checkpoints.front().note, "a");
}

TEST(CalibrationFit, RecoversLinearCounter) {
  calibration_table table;
  table.checkpoints = {{60, 90, ""}, {300, 450, ""}, {1200, 1800, ""}};

  auto fit = fit_calibration(table);
  ASSERT_TRUE(fit.has_value());
  EXPECT_NEAR(fit->counts_per_second, 1.5, 1e-9);
  EXPECT_NEAR(fit->offset, 0.0, 1e-6);
  EXPECT_NEAR(fit->R2, 1.0, 1e-9);
  EXPECT_EQ(fit->n, 3u);
  EXPECT_DOUBLE_EQ(average_rate(table), 1.5);
}

TEST(CalibrationFit, NeedsTwoDistinctTimes) {
  calibration_table table;
  table.checkpoints = {{60, 90, ""}};
  EXPECT_FALSE(fit_calibration(table).has_value());
  EXPECT_EQ(average_rate(table), 0.0);
}

} // namespace deckprep::test
