#ifndef DECKPREP_LEVEL_ANALYSIS_HPP
#define DECKPREP_LEVEL_ANALYSIS_HPP

#include <deckprep/pcm_buffer.hpp>

#include <cstdint>
#include <span>
#include <vector>

namespace deckprep {

struct level_sample {
  int64_t time_ms = 0;
  float left  = 0.f;
  float right = 0.f;
};

struct level_pair {
  float left  = 0.f;
  float right = 0.f;
};

// Evenly spaced meter levels for one track, immutable once analyzed.
class level_series {
  std::vector<level_sample> samples_;
  unsigned chunk_ms_ = 50;

public:
  level_series() = default;
  level_series(std::vector<level_sample> samples, unsigned chunk_ms)
  : samples_(std::move(samples)), chunk_ms_(chunk_ms) {}

  [[nodiscard]] std::span<const level_sample> samples() const noexcept
  { return samples_; }
  [[nodiscard]] size_t size() const noexcept { return samples_.size(); }
  [[nodiscard]] bool empty() const noexcept { return samples_.empty(); }
  [[nodiscard]] unsigned chunk_ms() const noexcept { return chunk_ms_; }
};

// Ceiling headroom over the 95th percentile chunk RMS.
inline constexpr double level_headroom = 1.2;
// Lowest ceiling in raw sample units, keeps near-silent tracks from
// pinning the meters.
inline constexpr double level_min_ceiling = 1000.0;

// RMS of contiguous chunk_ms chunks, scaled against a shared adaptive
// ceiling and compressed with a square root.
[[nodiscard]] level_series analyze(const pcm_buffer &audio, unsigned chunk_ms = 50);

// Interpolated levels at elapsed_ms; holds the last value past the end and
// reads silence on an empty series.
[[nodiscard]] level_pair level_at(const level_series &series, double elapsed_ms) noexcept;

} // namespace deckprep

#endif
