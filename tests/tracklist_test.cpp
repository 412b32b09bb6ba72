#include <gtest/gtest.h>

#include <deckprep/tracklist.hpp>

#include "scratch_dir.hpp"

#include <chrono>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace deckprep::test {

namespace {

const std::vector<double> three_tracks{100.0, 150.0, 80.0};

bool contains(const std::string &text, const std::string &needle)
{
  return text.find(needle) != std::string::npos;
}

}

TEST(SessionPlan, LeaderThenTracksSeparatedByGaps) {
  auto slots = plan_session(three_tracks, 10, 5);
  ASSERT_EQ(slots.size(), 3u);

  const tape_transport transport = static_counter{1.0};
  const long expected[][2] = {{10, 110}, {115, 265}, {270, 350}};
  for (size_t i = 0; i < slots.size(); ++i) {
    EXPECT_EQ(slots[i].start, expected[i][0]);
    EXPECT_EQ(slots[i].end, expected[i][1]);
    auto counter = counter_range(slots[i], transport);
    EXPECT_EQ(counter.start, expected[i][0]);
    EXPECT_EQ(counter.end, expected[i][1]);
  }
}

TEST(SessionPlan, RoundsDurationsToWholeSeconds) {
  auto slots = plan_session(std::vector<double>{99.6, 10.4}, 0, 2);
  ASSERT_EQ(slots.size(), 2u);
  EXPECT_EQ(slots[0].duration, 100);
  EXPECT_EQ(slots[1].start, 102);
  EXPECT_EQ(slots[1].end, 112);
}

TEST(SessionPlan, TotalsAndCapacity) {
  EXPECT_EQ(total_recording_time(three_tracks, 10, 5), 350);
  EXPECT_EQ(total_recording_time(std::vector<double>{}, 10, 5), 10);
  EXPECT_EQ(total_recording_time(std::vector<double>{60.0}, 10, 5), 70);

  EXPECT_TRUE(fits_on_tape(1800, 30));
  EXPECT_FALSE(fits_on_tape(1801, 30));
}

TEST(FormatDuration, MinutesAndSeconds) {
  EXPECT_EQ(format_duration(0.0), "0:00");
  EXPECT_EQ(format_duration(65.0), "1:05");
  EXPECT_EQ(format_duration(59.6), "1:00");
  EXPECT_EQ(format_duration(3600.0), "60:00");
}

class Tracklist : public ScratchDir {
protected:
  tracklist_report report() const {
    tracklist_report r;
    r.tracks = {{"intro.wav", 100.0}, {"middle.flac", 150.0}, {"outro.wav", 80.0}};
    r.config.tape_type = "Type II";
    r.transport = static_counter{1.0};
    return r;
  }
};

TEST_F(Tracklist, RendersCounterRanges) {
  auto text = render_tracklist(report(), std::chrono::system_clock::now());

  EXPECT_TRUE(contains(text, "Tape Deck Tracklist Reference"));
  EXPECT_TRUE(contains(text, "Tape Type: Type II - Chrome/High Bias"));
  EXPECT_TRUE(contains(text, "Counter Mode: Static Linear"));
  EXPECT_TRUE(contains(text, "Leader Gap: 10s (Counter: 0000 - 0010)"));
  EXPECT_TRUE(contains(text, "Normalization: LUFS (target: -14.0 LUFS)"));
  EXPECT_TRUE(contains(text, "Total Tracks: 3"));
  EXPECT_TRUE(contains(text, "Total Recording Time: 5:50 (including gaps)"));
  EXPECT_TRUE(contains(text, "01. intro.wav"));
  EXPECT_TRUE(contains(text, "Start: 0:10   End: 1:50   Duration: 1:40"));
  EXPECT_TRUE(contains(text, "Counter: 0010 - 0110"));
  EXPECT_TRUE(contains(text, "Counter: 0115 - 0265"));
  EXPECT_TRUE(contains(text, "Counter: 0270 - 0350"));
  EXPECT_FALSE(contains(text, "WARNING"));
}

TEST_F(Tracklist, ReportsCalibrationSource) {
  auto r = report();
  calibration_table table;
  table.deck_model = "AIWA AD-F780";
  table.checkpoints = {{60, 60, ""}, {300, 300, ""}};
  r.config.mode = counter_mode::manual;
  r.transport = manual_counter{table, 1.0};

  auto text = render_tracklist(r, std::chrono::system_clock::now());
  EXPECT_TRUE(contains(text, "Counter Mode: Manual Calibrated"));
  EXPECT_TRUE(contains(text, "Deck Model: AIWA AD-F780"));
  EXPECT_TRUE(contains(text, "Calibration Points: 2 measured checkpoints"));
}

TEST_F(Tracklist, WarnsWhenSideIsTooShort) {
  auto r = report();
  r.config.duration_minutes = 5;
  auto text = render_tracklist(r, std::chrono::system_clock::now());
  EXPECT_TRUE(contains(text, "WARNING"));
}

TEST_F(Tracklist, FileNameCarriesNormalization) {
  session_config config;
  auto lufs = tracklist_file_name(config, std::chrono::system_clock::now());
  EXPECT_TRUE(lufs.starts_with("deck_tracklist_"));
  EXPECT_TRUE(lufs.ends_with("_lufs-14.0.txt"));

  config.normalization = normalization_method::peak;
  EXPECT_TRUE(tracklist_file_name(config, std::chrono::system_clock::now())
                .ends_with("_peak.txt"));
}

TEST_F(Tracklist, WritesReportIntoFolder) {
  const auto when = std::chrono::system_clock::now();
  auto file = write_tracklist(report(), dir, when);

  EXPECT_EQ(file.parent_path(), dir);
  std::ifstream in(file);
  std::stringstream content;
  content << in.rdbuf();
  EXPECT_EQ(content.str(), render_tracklist(report(), when));
}

} // namespace deckprep::test
