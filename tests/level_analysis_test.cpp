#include <gtest/gtest.h>

#include <deckprep/level_analysis.hpp>

#include <algorithm>
#include <cmath>

namespace deckprep::test {

namespace {

// 1 kHz sample rate keeps chunk arithmetic easy: 50 ms is 50 frames.
pcm_buffer constant_mono(size_t frames, int32_t value)
{
  pcm_buffer audio(1000, 1, 2, frames);
  std::fill_n(audio.data(), audio.samples(), value);
  return audio;
}

}

TEST(LevelAnalysis, OneSamplePerChunk) {
  auto series = analyze(constant_mono(1000, 1000));
  ASSERT_EQ(series.size(), 20u);
  EXPECT_EQ(series.chunk_ms(), 50u);
  for (size_t k = 0; k < series.size(); ++k)
    EXPECT_EQ(series.samples()[k].time_ms, int64_t(k) * 50);
}

TEST(LevelAnalysis, TrailingPartialChunkIsKept) {
  auto series = analyze(constant_mono(1020, 1000));
  ASSERT_EQ(series.size(), 21u);
  EXPECT_EQ(series.samples().back().time_ms, 1000);
}

TEST(LevelAnalysis, SilenceReadsZero) {
  auto series = analyze(constant_mono(500, 0));
  ASSERT_FALSE(series.empty());
  for (auto const &s: series.samples()) {
    EXPECT_EQ(s.left, 0.f);
    EXPECT_EQ(s.right, 0.f);
  }
}

TEST(LevelAnalysis, LevelsStayWithinUnitRange) {
  pcm_buffer audio(1000, 2, 2, 5000);
  for (size_t f = 0; f < audio.frames(); ++f) {
    const bool loud = f >= 4950;
    audio[f, 0] = loud ? 32767 : 1000;
    audio[f, 1] = loud ? -32768 : -1000;
  }

  auto series = analyze(audio);
  ASSERT_EQ(series.size(), 100u);
  for (auto const &s: series.samples()) {
    EXPECT_GE(s.left, 0.f);
    EXPECT_LE(s.left, 1.f);
    EXPECT_GE(s.right, 0.f);
    EXPECT_LE(s.right, 1.f);
  }
  // Above the 95th percentile the meter pins at full deflection.
  EXPECT_EQ(series.samples().back().left, 1.f);
  EXPECT_EQ(series.samples().back().right, 1.f);
}

TEST(LevelAnalysis, ConstantSignalSitsBelowFullScale) {
  auto series = analyze(constant_mono(1000, 32767));
  const float expected = static_cast<float>(std::sqrt(1.0 / level_headroom));
  for (auto const &s: series.samples())
    EXPECT_NEAR(s.left, expected, 1e-6);
}

TEST(LevelAnalysis, QuietTracksUseMinimumCeiling) {
  auto series = analyze(constant_mono(1000, 10));
  const float expected = static_cast<float>(std::sqrt(10.0 / level_min_ceiling));
  EXPECT_NEAR(series.samples().front().left, expected, 1e-6);
}

TEST(LevelAnalysis, MonoFeedsBothMeters) {
  auto series = analyze(constant_mono(1000, 5000));
  for (auto const &s: series.samples())
    EXPECT_EQ(s.left, s.right);
}

TEST(LevelAnalysis, ExtraChannelsAreIgnored) {
  pcm_buffer audio(1000, 4, 2, 1000);
  for (size_t f = 0; f < audio.frames(); ++f) {
    audio[f, 0] = 4000;
    audio[f, 1] = 2000;
    audio[f, 2] = 32767;
    audio[f, 3] = 32767;
  }
  auto series = analyze(audio);
  ASSERT_FALSE(series.empty());
  EXPECT_GT(series.samples()[0].left, series.samples()[0].right);
  EXPECT_LT(series.samples()[0].left, 1.f);
}

TEST(LevelAnalysis, MalformedInputGivesEmptySeries) {
  EXPECT_TRUE(analyze(pcm_buffer{}).empty());
  EXPECT_TRUE(analyze(pcm_buffer(0, 2, 2, 100)).empty());
  EXPECT_TRUE(analyze(constant_mono(100, 100), 0).empty());
}

TEST(LevelAt, ExactAtSamplePoints) {
  pcm_buffer audio(1000, 1, 2, 1000);
  for (size_t f = 0; f < audio.frames(); ++f)
    audio[f, 0] = int32_t((f / 50) * 1000);

  auto series = analyze(audio);
  for (auto const &s: series.samples()) {
    auto level = level_at(series, double(s.time_ms));
    EXPECT_EQ(level.left, s.left);
    EXPECT_EQ(level.right, s.right);
  }
}

TEST(LevelAt, InterpolatesBetweenSamples) {
  pcm_buffer audio(1000, 1, 2, 100);
  for (size_t f = 0; f < 50; ++f) audio[f, 0] = 0;
  for (size_t f = 50; f < 100; ++f) audio[f, 0] = 20000;

  auto series = analyze(audio);
  ASSERT_EQ(series.size(), 2u);
  const float a = series.samples()[0].left;
  const float b = series.samples()[1].left;
  EXPECT_NEAR(level_at(series, 25.0).left, (a + b) / 2, 1e-6);
}

TEST(LevelAt, HoldsLastValueAndReadsSilenceWhenEmpty) {
  auto series = analyze(constant_mono(1000, 3000));
  auto last = series.samples().back();
  EXPECT_EQ(level_at(series, 1e9).left, last.left);

  auto nothing = level_at(level_series{}, 100.0);
  EXPECT_EQ(nothing.left, 0.f);
  EXPECT_EQ(nothing.right, 0.f);
}

TEST(LevelAt, BeforeFirstSampleReadsFirstSample) {
  auto series = analyze(constant_mono(1000, 3000));
  EXPECT_EQ(level_at(series, -250.0).left, series.samples().front().left);
}

} // namespace deckprep::test
