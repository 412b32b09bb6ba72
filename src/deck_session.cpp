#include <deckprep/deck_session.hpp>

#include <deckprep/tracklist.hpp>

#include <algorithm>
#include <cmath>
#include <iterator>

namespace deckprep {

using std::min;
using std::span;
using std::vector;

deck_session::deck_session(span<const track_record> tracks,
                           long leader_gap, long track_gap)
{
  vector<double> durations;
  durations.reserve(tracks.size());
  for (auto const &t: tracks) durations.push_back(t.duration());

  auto slots = plan_session(durations, leader_gap, track_gap);
  entries_.reserve(tracks.size());
  for (size_t i = 0; i < tracks.size(); ++i) {
    entries_.push_back(entry{
      &tracks[i].audio, double(slots[i].start), tracks[i].duration()
    });
  }

  total_ = slots.empty() ? double(leader_gap) : double(slots.back().end);
  if (!entries_.empty())
    total_ = std::max(total_, entries_.back().start + entries_.back().length);
}

session_position deck_session::locate(double elapsed_seconds) const noexcept
{
  session_position pos;

  // Last track that has started.
  auto it = std::upper_bound(entries_.begin(), entries_.end(), elapsed_seconds,
    [](double t, entry const &e) { return t < e.start; }
  );

  if (it != entries_.begin()) {
    auto const &current = *std::prev(it);
    const double into = elapsed_seconds - current.start;
    if (into < current.length) {
      pos.track = size_t(std::distance(entries_.begin(), std::prev(it)));
      pos.track_elapsed = into;
      return pos;
    }
  }

  if (it != entries_.end()) {
    pos.next = size_t(std::distance(entries_.begin(), it));
    pos.until_next = it->start - elapsed_seconds;
  }
  return pos;
}

void deck_session::render(float *out, size_t frames, size_t channels,
                          uint32_t device_rate) noexcept
{
  std::fill_n(out, frames * channels, 0.f);
  if (device_rate == 0 || channels == 0 || stopped_.load() || finished_.load())
    return;

  device_rate_.store(device_rate);
  uint64_t played = frames_played_.load();

  for (size_t i = 0; i < frames; ++i, ++played) {
    const double t = double(played) / device_rate;
    if (t >= total_) {
      finished_.store(true);
      break;
    }

    const auto pos = locate(t);
    if (!pos.track) continue;

    auto const &track = *entries_[*pos.track].audio;
    const size_t total_src = track.frames();
    if (total_src == 0) continue;

    // Linear interpolation in source frames.
    const double src = pos.track_elapsed * track.sample_rate;
    const auto i0 = min(size_t(src), total_src - 1);
    const auto i1 = min(i0 + 1, total_src - 1);
    const auto frac = static_cast<float>(src - double(i0));
    const auto scale = static_cast<float>(1.0 / track.reference_amplitude());
    const size_t src_ch = track.channels();

    for (size_t ch = 0; ch < channels; ++ch) {
      const size_t c = ch % src_ch;
      const auto s0 = static_cast<float>(track[i0, c]);
      const auto s1 = static_cast<float>(track[i1, c]);
      out[i * channels + ch] = std::lerp(s0, s1, frac) * scale;
    }
  }

  frames_played_.store(played);
}

double deck_session::elapsed() const noexcept
{
  const uint32_t rate = device_rate_.load();
  if (rate == 0) return 0.0;
  return double(frames_played_.load()) / rate;
}

} // namespace deckprep
