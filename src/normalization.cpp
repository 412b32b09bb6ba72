#include <deckprep/normalization.hpp>

#include <algorithm>
#include <cmath>
#include <format>
#include <limits>
#include <memory>
#include <vector>

#include <ebur128.h>

namespace deckprep {

using std::clamp, std::llround;
using std::expected, std::unexpected;
using std::string, std::string_view;
using std::unique_ptr;

namespace {

template<typename T>
[[nodiscard]] constexpr T dbamp(T db) noexcept
{ return std::pow(T(10.0), db * T(0.05)); }

struct ebur128_state_deleter {
  void operator()(ebur128_state *p) const noexcept { if (p) ebur128_destroy(&p); }
};

using ebur128_state_ptr = unique_ptr<ebur128_state, ebur128_state_deleter>;

// Frames handed to libebur128 per call while converting to double.
constexpr size_t meter_block_frames = 4096;

}

expected<double, string> measure_lufs(const pcm_buffer &audio)
{
  if (audio.empty() || audio.sample_rate == 0)
    return unexpected(string("measure_lufs: empty buffer"));

  ebur128_state_ptr state{
    ebur128_init(unsigned(audio.channels()), audio.sample_rate, EBUR128_MODE_I)
  };
  if (!state) return unexpected(string("measure_lufs: ebur128_init failed"));

  const double scale = 1.0 / audio.reference_amplitude();
  const size_t ch = audio.channels();
  std::vector<double> block(meter_block_frames * ch);

  for (size_t start = 0; start < audio.frames(); start += meter_block_frames) {
    const size_t n = std::min(meter_block_frames, audio.frames() - start);
    const int32_t *src = audio.data() + start * ch;
    std::transform(src, src + n * ch, block.begin(),
                   [scale](int32_t v) { return v * scale; });

    if (ebur128_add_frames_double(state.get(), block.data(), n) != EBUR128_SUCCESS)
      return unexpected(string("measure_lufs: ebur128_add_frames_double failed"));
  }

  double lufs = 0.0;
  if (ebur128_loudness_global(state.get(), &lufs) != EBUR128_SUCCESS)
    return unexpected(string("measure_lufs: ebur128_loudness_global failed"));

  return lufs;
}

loudness_meter ebur128_meter()
{
  return [](const pcm_buffer &audio) { return measure_lufs(audio); };
}

double measure_dbfs(const pcm_buffer &audio) noexcept
{
  if (audio.samples() == 0) return -std::numeric_limits<double>::infinity();

  double sum = 0.0;
  for (int32_t v: audio.samples_view()) sum += double(v) * double(v);
  const double rms = std::sqrt(sum / double(audio.samples()));
  if (rms <= 0.0) return -std::numeric_limits<double>::infinity();
  return 20.0 * std::log10(rms / audio.reference_amplitude());
}

pcm_buffer apply_gain(const pcm_buffer &audio, double gain)
{
  pcm_buffer out = audio.clone();
  const int64_t limit = audio.full_scale();

  std::ranges::transform(audio.samples_view(), out.data(), [&](int32_t v) {
    return static_cast<int32_t>(clamp<int64_t>(llround(v * gain), -limit, limit));
  });

  return out;
}

pcm_buffer peak_normalize(const pcm_buffer &audio)
{
  const int64_t peak = audio.peak();
  if (peak == 0) return audio.clone();
  return apply_gain(audio, double(audio.full_scale()) / double(peak));
}

normalization_result
normalize(const pcm_buffer &audio, normalization_method method,
          double target_lufs, const loudness_meter &meter)
{
  auto peak_result = [&] {
    return normalization_result{
      peak_normalize(audio), std::nullopt, normalization_method::peak
    };
  };

  if (method == normalization_method::peak || !meter) return peak_result();

  auto measured = meter(audio);
  if (!measured || !std::isfinite(*measured)) return peak_result();

  pcm_buffer out = apply_gain(audio, dbamp(target_lufs - *measured));

  std::optional<double> loudness;
  if (auto after = meter(out); after && std::isfinite(*after))
    loudness = *after;

  return normalization_result{ std::move(out), loudness, normalization_method::lufs };
}

expected<normalization_method, string> parse_normalization_method(string_view name)
{
  if (name == "peak") return normalization_method::peak;
  if (name == "lufs") return normalization_method::lufs;
  return unexpected(
    std::format("unknown normalization '{}'; expected peak or lufs", name)
  );
}

string_view to_string(normalization_method method) noexcept
{
  switch (method) {
    case normalization_method::peak: return "peak";
    case normalization_method::lufs: return "lufs";
  }
  return "peak";
}

} // namespace deckprep
