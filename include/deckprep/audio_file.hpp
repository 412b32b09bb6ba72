#ifndef DECKPREP_AUDIO_FILE_HPP
#define DECKPREP_AUDIO_FILE_HPP

#include <deckprep/pcm_buffer.hpp>

#include <expected>
#include <filesystem>
#include <string>
#include <vector>

namespace deckprep {

struct audio_info {
  double duration = 0.0;     // seconds
  uint32_t sample_rate = 0;
  unsigned channels = 0;
  std::string format;        // e.g. "FLAC", "WAV"
  std::string encoding;      // e.g. "16 bit PCM"
};

struct track_entry {
  std::filesystem::path file;
  audio_info info;
};

// Decode a whole file. Integer PCM keeps its width, anything else is
// decoded to 16 bit.
[[nodiscard]] std::expected<pcm_buffer, std::string>
load_pcm(const std::filesystem::path &file);

// Header information only, no sample decoding.
[[nodiscard]] std::expected<audio_info, std::string>
probe(const std::filesystem::path &file);

// WAV at the buffer's sample width. Throws std::runtime_error.
void write_wav(const pcm_buffer &audio, const std::filesystem::path &out_path);

[[nodiscard]] bool is_audio_file(const std::filesystem::path &file);

// Audio files directly inside folder, sorted by name. Files that cannot be
// probed are reported through skipped and left out.
[[nodiscard]] std::vector<track_entry>
list_tracks(const std::filesystem::path &folder,
            std::vector<std::string> *skipped = nullptr);

} // namespace deckprep

#endif
