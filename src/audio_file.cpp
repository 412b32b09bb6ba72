#include <deckprep/audio_file.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <format>
#include <stdexcept>
#include <string_view>
#include <utility>

#include <sndfile.hh>

namespace deckprep {

using std::expected, std::unexpected;
using std::filesystem::path;
using std::in_range;
using std::runtime_error;
using std::string, std::string_view;
using std::vector;

namespace {

// Frames converted per libsndfile call.
constexpr sf_count_t io_block_frames = 8192;

[[nodiscard]] unsigned width_of(int format) noexcept
{
  switch (format & SF_FORMAT_SUBMASK) {
    case SF_FORMAT_PCM_S8:
    case SF_FORMAT_PCM_U8: return 1;
    case SF_FORMAT_PCM_16: return 2;
    case SF_FORMAT_PCM_24: return 3;
    case SF_FORMAT_PCM_32: return 4;
    default:               return 2;
  }
}

[[nodiscard]] int wav_subformat(unsigned width) noexcept
{
  switch (width) {
    case 1:  return SF_FORMAT_PCM_U8;
    case 3:  return SF_FORMAT_PCM_24;
    case 4:  return SF_FORMAT_PCM_32;
    default: return SF_FORMAT_PCM_16;
  }
}

[[nodiscard]] string format_name(SndfileHandle &sf, int format)
{
  SF_FORMAT_INFO info{};
  info.format = format;
  if (sf.command(SFC_GET_FORMAT_INFO, &info, sizeof(info)) != 0 || !info.name)
    return "Unknown";
  return info.name;
}

}

expected<pcm_buffer, string> load_pcm(const path &file)
{
  SndfileHandle sf(file.string());
  if (sf.error()) {
    return unexpected("Failed to open audio file: " + file.generic_string());
  }

  const sf_count_t frames = sf.frames();
  const int sr = sf.samplerate();
  if (sr <= 0) {
    return unexpected("Invalid sample rate in file: " + file.generic_string());
  }
  if (sf.channels() <= 0 || frames < 0) {
    return unexpected("Invalid channel layout in file: " + file.generic_string());
  }

  // Float and compressed sources come in as full-range ints.
  sf.command(SFC_SET_SCALE_FLOAT_INT_READ, nullptr, SF_TRUE);

  const unsigned width = width_of(sf.format());
  const int shift = 32 - 8 * int(width);

  pcm_buffer track(
    static_cast<uint32_t>(sr),
    static_cast<size_t>(sf.channels()),
    width,
    static_cast<size_t>(frames)
  );

  const sf_count_t read_frames = sf.readf(track.data(), frames);
  if (read_frames < 0) {
    return unexpected(
      "Failed to read audio data from file: " + file.generic_string()
    );
  }
  if (read_frames != frames) {
    track.resize(static_cast<size_t>(read_frames));
  }

  if (shift > 0) {
    std::transform(track.data(), track.data() + track.samples(), track.data(),
                   [shift](int32_t v) { return v >> shift; });
  }

  return track;
}

expected<audio_info, string> probe(const path &file)
{
  SndfileHandle sf(file.string());
  if (sf.error()) {
    return unexpected("Failed to open audio file: " + file.generic_string());
  }
  if (sf.samplerate() <= 0) {
    return unexpected("Invalid sample rate in file: " + file.generic_string());
  }

  audio_info info;
  info.sample_rate = static_cast<uint32_t>(sf.samplerate());
  info.channels    = static_cast<unsigned>(sf.channels());
  info.duration    = double(sf.frames()) / sf.samplerate();
  info.format      = format_name(sf, sf.format() & SF_FORMAT_TYPEMASK);
  info.encoding    = format_name(sf, sf.format() & SF_FORMAT_SUBMASK);
  return info;
}

void write_wav(const pcm_buffer &audio, const path &out_path)
{
  if (!in_range<sf_count_t>(audio.frames()))
    throw runtime_error("frame count too large for libsndfile");
  if (audio.channels() == 0 || audio.sample_rate == 0)
    throw runtime_error("cannot write an empty audio buffer");

  SndfileHandle sf(out_path.string(), SFM_WRITE,
    SF_FORMAT_WAV | wav_subformat(audio.sample_width),
    int(audio.channels()), int(audio.sample_rate)
  );

  if (sf.error() != SF_ERR_NO_ERROR) throw runtime_error(sf.strError());

  // libsndfile's int interface is left-aligned 32 bit.
  const int shift = 32 - 8 * int(audio.sample_width);
  const size_t ch = audio.channels();
  vector<int> block(size_t(io_block_frames) * ch);

  const auto frames = sf_count_t(audio.frames());
  for (sf_count_t start = 0; start < frames; start += io_block_frames) {
    const sf_count_t n = std::min(io_block_frames, frames - start);
    const int32_t *src = audio.data() + size_t(start) * ch;
    std::transform(src, src + size_t(n) * ch, block.begin(),
                   [shift](int32_t v) { return int(uint32_t(v) << shift); });

    const sf_count_t written = sf.writef(block.data(), n);
    if (written != n)
      throw runtime_error(
        std::format("Short write: wrote {} of {} frames", start + written, frames)
      );
  }
}

bool is_audio_file(const path &file)
{
  static constexpr std::array<string_view, 9> extensions{
    ".wav", ".flac", ".ogg", ".oga", ".opus", ".mp3", ".aif", ".aiff", ".caf"
  };
  string ext = file.extension().string();
  std::ranges::transform(ext, ext.begin(),
    [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  return std::ranges::find(extensions, ext) != extensions.end();
}

vector<track_entry> list_tracks(const path &folder, vector<string> *skipped)
{
  vector<track_entry> tracks;
  std::error_code ec;
  if (!std::filesystem::is_directory(folder, ec)) return tracks;

  for (auto const &entry: std::filesystem::directory_iterator(folder, ec)) {
    if (!entry.is_regular_file(ec) || !is_audio_file(entry.path())) continue;
    if (auto info = probe(entry.path())) {
      tracks.push_back(track_entry{entry.path(), *info});
    } else if (skipped) {
      skipped->push_back(info.error());
    }
  }

  std::ranges::sort(tracks, {}, [](track_entry const &t) { return t.file.filename(); });
  return tracks;
}

} // namespace deckprep
