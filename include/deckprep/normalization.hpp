#ifndef DECKPREP_NORMALIZATION_HPP
#define DECKPREP_NORMALIZATION_HPP

#include <deckprep/pcm_buffer.hpp>

#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace deckprep {

enum class normalization_method { peak, lufs };

// Integrated loudness measurement. An empty meter means the capability is
// not available and LUFS normalization degrades to peak normalization.
using loudness_meter =
  std::function<std::expected<double, std::string>(const pcm_buffer&)>;

struct normalization_result {
  pcm_buffer audio;
  std::optional<double> loudness;   // LUFS after normalization
  normalization_method applied = normalization_method::peak;
};

inline constexpr double default_target_lufs = -14.0;

// Integrated loudness (EBU R128, mode I) through libebur128.
[[nodiscard]] std::expected<double, std::string>
measure_lufs(const pcm_buffer &audio);

// The libebur128 meter as a loudness_meter.
[[nodiscard]] loudness_meter ebur128_meter();

// RMS over all samples in dB relative to 2^(bits-1); -inf for silence.
[[nodiscard]] double measure_dbfs(const pcm_buffer &audio) noexcept;

// Multiply every sample by gain, rounding and clipping to the width's range.
[[nodiscard]] pcm_buffer apply_gain(const pcm_buffer &audio, double gain);

// Scale so the largest absolute sample reaches full scale.
[[nodiscard]] pcm_buffer peak_normalize(const pcm_buffer &audio);

[[nodiscard]] normalization_result
normalize(const pcm_buffer &audio, normalization_method method,
          double target_lufs = default_target_lufs,
          const loudness_meter &meter = {});

[[nodiscard]] std::expected<normalization_method, std::string>
parse_normalization_method(std::string_view name);

[[nodiscard]] std::string_view to_string(normalization_method method) noexcept;

} // namespace deckprep

#endif
