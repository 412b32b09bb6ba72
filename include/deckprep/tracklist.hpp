#ifndef DECKPREP_TRACKLIST_HPP
#define DECKPREP_TRACKLIST_HPP

#include <deckprep/counter_engine.hpp>
#include <deckprep/deck_profile.hpp>

#include <chrono>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

namespace deckprep {

// Position of one track on the tape, whole seconds from the start of the side.
struct track_slot {
  long start = 0;
  long end = 0;
  long duration = 0;
};

struct counter_span {
  long start = 0;
  long end = 0;
};

// Lays tracks out after the leader with track_gap seconds between them.
// Durations are rounded to whole seconds.
[[nodiscard]] std::vector<track_slot>
plan_session(std::span<const double> durations, long leader_gap, long track_gap);

[[nodiscard]] counter_span counter_range(const track_slot &slot,
                                         const tape_transport &transport) noexcept;

// Leader plus all tracks plus the gaps between them.
[[nodiscard]] long total_recording_time(std::span<const double> durations,
                                        long leader_gap, long track_gap) noexcept;

[[nodiscard]] bool fits_on_tape(long total_seconds, int tape_minutes) noexcept;

// strftime() of when in local time.
[[nodiscard]] std::string local_time(std::chrono::system_clock::time_point when,
                                     const char *fmt);

// "M:SS", rounded to whole seconds.
[[nodiscard]] std::string format_duration(double seconds);

struct tracklist_entry {
  std::string name;
  double duration = 0.0;
};

struct tracklist_report {
  std::vector<tracklist_entry> tracks;
  session_config config;
  tape_transport transport;
};

[[nodiscard]] std::string
tracklist_file_name(const session_config &config,
                    std::chrono::system_clock::time_point when);

[[nodiscard]] std::string
render_tracklist(const tracklist_report &report,
                 std::chrono::system_clock::time_point when);

// Writes the report into folder under a timestamped name and returns its
// path. Throws std::runtime_error.
std::filesystem::path
write_tracklist(const tracklist_report &report, const std::filesystem::path &folder,
                std::chrono::system_clock::time_point when =
                  std::chrono::system_clock::now());

} // namespace deckprep

#endif
