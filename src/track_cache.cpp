#include <deckprep/track_cache.hpp>

#include <deckprep/audio_file.hpp>

#include <cmath>
#include <format>
#include <stdexcept>
#include <system_error>

namespace deckprep {

using std::expected, std::unexpected;
using std::filesystem::path;
using std::optional, std::nullopt;
using std::string;

string cache_file_name(const cache_key &key)
{
  if (key.method == normalization_method::lufs)
    return std::format("{}.lufs{:+.1f}.normalized.wav",
                       key.source_name, key.target_lufs);
  return std::format("{}.peak.normalized.wav", key.source_name);
}

normalization_method
effective_method(normalization_method requested, const loudness_meter &meter) noexcept
{
  if (requested == normalization_method::lufs && !meter)
    return normalization_method::peak;
  return requested;
}

namespace {

[[nodiscard]] optional<double> display_loudness(const pcm_buffer &audio,
                                                normalization_method method,
                                                const loudness_meter &meter)
{
  if (method != normalization_method::lufs || !meter) return nullopt;
  auto lufs = meter(audio);
  if (!lufs || !std::isfinite(*lufs)) return nullopt;
  return *lufs;
}

}

expected<track_record, string>
prepare_track(const path &source, const path &cache_dir,
              const prepare_options &options, const loudness_meter &meter)
{
  track_record record;
  record.name   = source.filename().string();
  record.source = source;
  record.method = effective_method(options.method, meter);

  const cache_key key{record.name, record.method, options.target_lufs};
  record.cache_path = cache_dir / cache_file_name(key);

  std::error_code ec;
  if (std::filesystem::exists(record.cache_path, ec)) {
    auto cached = load_pcm(record.cache_path);
    if (!cached) return unexpected(cached.error());
    record.audio      = std::move(*cached);
    record.loudness   = display_loudness(record.audio, record.method, meter);
    record.from_cache = true;
  } else {
    auto decoded = load_pcm(source);
    if (!decoded) return unexpected(decoded.error());

    auto result = normalize(*decoded, record.method, options.target_lufs, meter);
    if (result.applied != record.method) {
      record.method = result.applied;
      record.cache_path =
        cache_dir / cache_file_name({record.name, record.method, options.target_lufs});
    }
    record.audio    = std::move(result.audio);
    record.loudness = result.loudness;

    std::filesystem::create_directories(cache_dir, ec);
    if (ec) {
      return unexpected(std::format("Failed to create {}: {}",
                                    cache_dir.generic_string(), ec.message()));
    }
    try {
      write_wav(record.audio, record.cache_path);
    } catch (const std::runtime_error &e) {
      return unexpected(std::format("Failed to write {}: {}",
                                    record.cache_path.generic_string(), e.what()));
    }
  }

  record.dbfs   = measure_dbfs(record.audio);
  record.levels = analyze(record.audio, options.chunk_ms);
  return record;
}

} // namespace deckprep
