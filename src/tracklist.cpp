#include <deckprep/tracklist.hpp>

#include <cmath>
#include <ctime>
#include <format>
#include <fstream>
#include <iterator>
#include <string_view>
#include <type_traits>

namespace deckprep {

using std::chrono::system_clock;
using std::filesystem::path;
using std::span;
using std::string, std::string_view;
using std::vector;

namespace {

[[nodiscard]] long whole_seconds(double seconds) noexcept
{
  return std::isfinite(seconds) ? long(std::lround(seconds)) : 0;
}

void section(string &out, string_view title, size_t rule)
{
  std::format_to(std::back_inserter(out), "{}\n{}\n", title, string(rule, '-'));
}

}

string local_time(system_clock::time_point when, const char *fmt)
{
  const std::time_t t = system_clock::to_time_t(when);
  std::tm tm{};
  localtime_r(&t, &tm);
  char buf[64];
  const size_t n = std::strftime(buf, sizeof buf, fmt, &tm);
  return string(buf, n);
}

vector<track_slot>
plan_session(span<const double> durations, long leader_gap, long track_gap)
{
  vector<track_slot> slots;
  slots.reserve(durations.size());

  long position = leader_gap;
  for (double d: durations) {
    const long duration = whole_seconds(d);
    slots.push_back(track_slot{position, position + duration, duration});
    position += duration + track_gap;
  }
  return slots;
}

counter_span counter_range(const track_slot &slot,
                           const tape_transport &transport) noexcept
{
  return { counter_at(double(slot.start), transport),
           counter_at(double(slot.end), transport) };
}

long total_recording_time(span<const double> durations,
                          long leader_gap, long track_gap) noexcept
{
  long total = leader_gap;
  for (double d: durations) total += whole_seconds(d);
  if (durations.size() > 1) total += track_gap * long(durations.size() - 1);
  return total;
}

bool fits_on_tape(long total_seconds, int tape_minutes) noexcept
{
  return total_seconds <= long(tape_minutes) * 60;
}

string format_duration(double seconds)
{
  if (!std::isfinite(seconds)) return "Unknown";
  const long s = whole_seconds(seconds);
  if (s < 0) return "-" + format_duration(double(-s));
  return std::format("{}:{:02}", s / 60, s % 60);
}

string tracklist_file_name(const session_config &config, system_clock::time_point when)
{
  const string norm = config.normalization == normalization_method::lufs
                    ? std::format("lufs{:+.1f}", config.target_lufs)
                    : string("peak");
  return std::format("deck_tracklist_{}_{}.txt",
                     local_time(when, "%Y%m%d_%H%M%S"), norm);
}

string render_tracklist(const tracklist_report &report, system_clock::time_point when)
{
  auto const &config = report.config;
  auto const &transport = report.transport;

  string out;
  auto line = [&out]<typename... Args>(std::format_string<Args...> fmt, Args&&... args) {
    std::format_to(std::back_inserter(out), fmt, std::forward<Args>(args)...);
    out += '\n';
  };

  line("Tape Deck Tracklist Reference");
  line("{}", string(60, '='));
  line("Session: {}\n", local_time(when, "%Y-%m-%d %H:%M:%S"));

  auto const &tape = tape_type_info(config.tape_type);
  section(out, "TAPE INFORMATION:", 17);
  line("Tape Type: {} - {}", config.tape_type, tape.name);
  line("Material: {}", tape.material);
  line("Bias Setting: {}", tape.bias);
  line("Sound Character: {}", tape.sound);
  line("Physical Notes: {}\n", tape.notches);

  section(out, "TAPE COUNTER CONFIGURATION:", 30);
  line("Counter Mode: {}", display_name(mode_of(transport)));
  std::visit([&](auto const &model) {
    using T = std::decay_t<decltype(model)>;
    if constexpr (std::is_same_v<T, static_counter>) {
      line("Counter Rate: {} counts/second (constant)", model.rate);
    } else if constexpr (std::is_same_v<T, manual_counter>) {
      if (model.calibration) {
        auto const &cal = *model.calibration;
        line("Calibration Source: {}", config.calibration_path().generic_string());
        line("Deck Model: {}", cal.deck_model);
        line("Tape Type: {}", cal.tape_type);
        line("Calibration Date: {}", cal.calibration_date);
        line("Calibration Points: {} measured checkpoints", cal.checkpoints.size());
      } else {
        line("Calibration: unavailable, {} counts/second (constant)",
             model.fallback_rate);
      }
    } else {
      line("Physics Simulation: Reel-based calculation");
      line("Base Rate: {} counts/second (at tape midpoint)", model.base_rate);
    }
  }, transport);
  line("Leader Gap: {}s (Counter: 0000 - {:04})\n",
       config.leader_gap, counter_at(double(config.leader_gap), transport));

  section(out, "AUDIO CONFIGURATION:", 20);
  if (config.normalization == normalization_method::lufs)
    line("Normalization: LUFS (target: {:+.1f} LUFS)", config.target_lufs);
  else
    line("Normalization: PEAK (peak normalization)");
  line("Track Gap: {}s between tracks", config.track_gap);
  line("Tape Duration: {} minutes per side", config.duration_minutes);
  if (config.audio_latency > 0.0)
    line("Audio Latency Compensation: {}s", config.audio_latency);
  line("Total Tracks: {}", report.tracks.size());

  vector<double> durations;
  durations.reserve(report.tracks.size());
  for (auto const &t: report.tracks) durations.push_back(t.duration);

  const long total = total_recording_time(durations, config.leader_gap, config.track_gap);
  line("Total Recording Time: {} (including gaps)", format_duration(double(total)));
  if (!fits_on_tape(total, config.duration_minutes))
    line("WARNING: exceeds the {} minute tape side by {}", config.duration_minutes,
         format_duration(double(total - long(config.duration_minutes) * 60)));
  line("");

  line("TRACK LIST:");
  line("{}", string(60, '='));
  auto slots = plan_session(durations, config.leader_gap, config.track_gap);
  for (size_t i = 0; i < slots.size(); ++i) {
    auto const &slot = slots[i];
    const auto counter = counter_range(slot, transport);
    line("{:02}. {}", i + 1, report.tracks[i].name);
    line("    Start: {}   End: {}   Duration: {}",
         format_duration(double(slot.start)), format_duration(double(slot.end)),
         format_duration(double(slot.duration)));
    line("    Counter: {:04} - {:04}", counter.start, counter.end);
  }

  return out;
}

path write_tracklist(const tracklist_report &report, const path &folder,
                     system_clock::time_point when)
{
  std::filesystem::create_directories(folder);
  const path out_path = folder / tracklist_file_name(report.config, when);

  std::ofstream out;
  out.exceptions(std::ofstream::failbit | std::ofstream::badbit);
  out.open(out_path, std::ios::trunc);
  out << render_tracklist(report, when);

  return out_path;
}

} // namespace deckprep
