#include <deckprep/level_analysis.hpp>

#include <algorithm>
#include <cmath>
#include <iterator>

namespace deckprep {

using std::max, std::min, std::sqrt;
using std::vector;

namespace {

// Element at int(n * 0.95) of the sorted values, the last one if that
// index runs off the end.
[[nodiscard]] double percentile_95(vector<double> values)
{
  if (values.empty()) return 0.0;
  std::ranges::sort(values);
  const auto idx = static_cast<size_t>(double(values.size()) * 0.95);
  return idx < values.size() ? values[idx] : values.back();
}

[[nodiscard]] size_t chunk_start(size_t chunk, unsigned chunk_ms, uint32_t sr) noexcept
{
  return static_cast<size_t>(uint64_t(chunk) * chunk_ms * sr / 1000);
}

}

level_series analyze(const pcm_buffer &audio, unsigned chunk_ms)
{
  if (audio.empty() || audio.channels() == 0 || audio.sample_rate == 0
      || chunk_ms == 0)
    return level_series({}, chunk_ms);

  const uint32_t sr = audio.sample_rate;
  const size_t frames = audio.frames();
  const size_t left_ch  = 0;
  const size_t right_ch = audio.channels() >= 2 ? 1 : 0;

  vector<double> rms_l, rms_r;
  for (size_t k = 0;; ++k) {
    const size_t begin = chunk_start(k, chunk_ms, sr);
    if (begin >= frames) break;
    const size_t end = min(frames, chunk_start(k + 1, chunk_ms, sr));

    double sum_l = 0.0, sum_r = 0.0;
    for (size_t f = begin; f < end; ++f) {
      const double l = audio[f, left_ch];
      const double r = audio[f, right_ch];
      sum_l += l * l;
      sum_r += r * r;
    }
    const auto n = double(end - begin);
    rms_l.push_back(n > 0 ? sqrt(sum_l / n) : 0.0);
    rms_r.push_back(n > 0 ? sqrt(sum_r / n) : 0.0);
  }

  const double ceiling = max(
    max(percentile_95(rms_l), percentile_95(rms_r)) * level_headroom,
    level_min_ceiling
  );

  auto level = [ceiling](double rms) {
    return static_cast<float>(min(1.0, sqrt(rms / ceiling)));
  };

  vector<level_sample> samples;
  samples.reserve(rms_l.size());
  for (size_t k = 0; k < rms_l.size(); ++k) {
    samples.push_back(level_sample{
      int64_t(k) * chunk_ms, level(rms_l[k]), level(rms_r[k])
    });
  }

  return level_series(std::move(samples), chunk_ms);
}

level_pair level_at(const level_series &series, double elapsed_ms) noexcept
{
  auto samples = series.samples();
  if (samples.empty()) return {};

  auto it = std::lower_bound(samples.begin(), samples.end(), elapsed_ms,
    [](level_sample const &s, double t) { return double(s.time_ms) < t; }
  );

  if (it == samples.end()) return { samples.back().left, samples.back().right };
  if (it == samples.begin()) return { it->left, it->right };

  auto const &prev = *std::prev(it);
  const double span = double(it->time_ms - prev.time_ms);
  if (!(span > 0.0)) return { it->left, it->right };

  const double frac = (elapsed_ms - double(prev.time_ms)) / span;
  return {
    static_cast<float>(std::lerp(double(prev.left),  double(it->left),  frac)),
    static_cast<float>(std::lerp(double(prev.right), double(it->right), frac))
  };
}

} // namespace deckprep
