#ifndef DECKPREP_DECK_SESSION_HPP
#define DECKPREP_DECK_SESSION_HPP

#include <deckprep/pcm_buffer.hpp>
#include <deckprep/track_cache.hpp>

#include <atomic>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace deckprep {

struct session_position {
  std::optional<size_t> track;      // empty during the leader and the gaps
  double track_elapsed = 0.0;       // seconds into track
  std::optional<size_t> next;       // upcoming track while waiting
  double until_next = 0.0;          // seconds until next starts
};

// Playback timeline of one tape side: leader silence, then the tracks with
// silent gaps between them. The records passed in must outlive the session.
//
// render() runs on the audio thread; everything it shares with the display
// thread is atomic.
class deck_session {
  struct entry {
    const pcm_buffer *audio;
    double start;       // seconds on the tape
    double length;      // seconds of audio
  };

  std::vector<entry> entries_;
  double total_ = 0.0;

  std::atomic<uint64_t> frames_played_{0};
  std::atomic<uint32_t> device_rate_{0};
  std::atomic<bool> stopped_{false};
  std::atomic<bool> finished_{false};

public:
  deck_session(std::span<const track_record> tracks, long leader_gap, long track_gap);

  deck_session(const deck_session&) = delete;
  deck_session& operator=(const deck_session&) = delete;

  [[nodiscard]] double total_duration() const noexcept { return total_; }
  [[nodiscard]] size_t size() const noexcept { return entries_.size(); }
  [[nodiscard]] double track_start(size_t index) const noexcept
  { return entries_[index].start; }

  [[nodiscard]] session_position locate(double elapsed_seconds) const noexcept;

  // Fills frames interleaved frames of channels channels at device_rate.
  void render(float *out, size_t frames, size_t channels, uint32_t device_rate) noexcept;

  // Seconds rendered so far.
  [[nodiscard]] double elapsed() const noexcept;

  void stop() noexcept { stopped_.store(true); }
  [[nodiscard]] bool stopped() const noexcept { return stopped_.load(); }
  [[nodiscard]] bool finished() const noexcept { return finished_.load(); }
};

} // namespace deckprep

#endif
