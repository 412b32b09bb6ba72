#ifndef DECKPREP_PCM_BUFFER_HPP
#define DECKPREP_PCM_BUFFER_HPP

#include <algorithm>
#include <cassert>
#include <cstdint>
#include <cstdlib>
#include <span>
#include <vector>

namespace deckprep {

// Interleaved integer PCM. Samples are kept in the native range of
// sample_width (bytes), so a 16-bit buffer holds values in [-32768, 32767]
// even though the storage is int32_t.
class pcm_buffer {
  std::vector<int32_t> storage;
  size_t frames_   = 0;
  size_t channels_ = 0;

public:
  uint32_t sample_rate  = 0;
  unsigned sample_width = 2;

  pcm_buffer() = default;

  pcm_buffer(uint32_t sr, size_t ch, unsigned width, size_t frames)
  : storage(frames * ch), frames_(frames), channels_(ch),
    sample_rate(sr), sample_width(width)
  { assert(ch > 0); assert(width >= 1 && width <= 4); }

  // move-only; copies are explicit through clone()
  pcm_buffer(const pcm_buffer&) = delete;
  pcm_buffer& operator=(const pcm_buffer&) = delete;

  pcm_buffer(pcm_buffer&&) noexcept = default;
  pcm_buffer& operator=(pcm_buffer&&) noexcept = default;

  [[nodiscard]] pcm_buffer clone() const
  {
    pcm_buffer copy(sample_rate, channels_ ? channels_ : 1, sample_width, 0);
    copy.storage  = storage;
    copy.frames_  = frames_;
    copy.channels_ = channels_;
    return copy;
  }

  [[nodiscard]] size_t   frames()   const noexcept { return frames_; }
  [[nodiscard]] size_t   channels() const noexcept { return channels_; }
  [[nodiscard]] size_t   samples()  const noexcept { return storage.size(); }
  [[nodiscard]] bool     empty()    const noexcept { return frames_ == 0; }
  [[nodiscard]] int32_t*       data()       noexcept { return storage.data(); }
  [[nodiscard]] const int32_t* data() const noexcept { return storage.data(); }

  [[nodiscard]] double duration() const noexcept
  { return sample_rate ? double(frames_) / sample_rate : 0.0; }

  // Largest positive value representable at sample_width.
  [[nodiscard]] int32_t full_scale() const noexcept
  { return int32_t((int64_t(1) << (8 * sample_width - 1)) - 1); }

  // 2^(bits-1), the reference for dBFS and float conversion.
  [[nodiscard]] double reference_amplitude() const noexcept
  { return double(int64_t(1) << (8 * sample_width - 1)); }

  [[nodiscard]] std::span<const int32_t> samples_view() const noexcept
  { return storage; }

  int32_t& operator[](size_t frame, size_t ch) noexcept {
    assert(frame < frames_ && ch < channels_);
    return storage[frame * channels_ + ch];
  }
  const int32_t& operator[](size_t frame, size_t ch) const noexcept
  {
    assert(frame < frames_ && ch < channels_);
    return storage[frame * channels_ + ch];
  }

  // Largest absolute sample value.
  [[nodiscard]] int64_t peak() const noexcept
  {
    int64_t p = 0;
    for (int32_t v: storage) p = std::max<int64_t>(p, std::abs(int64_t(v)));
    return p;
  }

  void resize(size_t new_frames)
  {
    storage.resize(new_frames * channels_);
    frames_ = new_frames;
  }
};

} // namespace deckprep

#endif
