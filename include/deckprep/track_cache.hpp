#ifndef DECKPREP_TRACK_CACHE_HPP
#define DECKPREP_TRACK_CACHE_HPP

#include <deckprep/level_analysis.hpp>
#include <deckprep/normalization.hpp>
#include <deckprep/pcm_buffer.hpp>

#include <expected>
#include <filesystem>
#include <optional>
#include <string>

namespace deckprep {

// Identifies one normalized rendition of a source file. The target only
// matters for LUFS.
struct cache_key {
  std::string source_name;
  normalization_method method = normalization_method::lufs;
  double target_lufs = default_target_lufs;
};

[[nodiscard]] std::string cache_file_name(const cache_key &key);

// What normalize() will actually do for the requested method.
[[nodiscard]] normalization_method
effective_method(normalization_method requested, const loudness_meter &meter) noexcept;

struct track_record {
  std::string name;
  std::filesystem::path source;
  std::filesystem::path cache_path;
  pcm_buffer audio;
  double dbfs = 0.0;
  std::optional<double> loudness;
  level_series levels;
  normalization_method method = normalization_method::peak;
  bool from_cache = false;

  [[nodiscard]] double duration() const noexcept { return audio.duration(); }
};

struct prepare_options {
  normalization_method method = normalization_method::lufs;
  double target_lufs = default_target_lufs;
  unsigned chunk_ms = 50;
};

// Loads source's normalized rendition from cache_dir, creating it first
// when it does not exist yet.
[[nodiscard]] std::expected<track_record, std::string>
prepare_track(const std::filesystem::path &source,
              const std::filesystem::path &cache_dir,
              const prepare_options &options,
              const loudness_meter &meter);

} // namespace deckprep

#endif
