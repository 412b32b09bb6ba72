// Command-line tool to prepare tracks for recording onto cassette tape

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <expected>
#include <filesystem>
#include <format>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <print>
#include <ranges>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <deckprep/audio_file.hpp>
#include <deckprep/calibration.hpp>
#include <deckprep/counter_engine.hpp>
#include <deckprep/deck_profile.hpp>
#include <deckprep/deck_session.hpp>
#include <deckprep/level_analysis.hpp>
#include <deckprep/normalization.hpp>
#include <deckprep/parse.hpp>
#include <deckprep/track_cache.hpp>
#include <deckprep/tracklist.hpp>

#include <getopt.h>
#include <miniaudio.h>
#include <poll.h>
#include <readline/history.h>
#include <readline/readline.h>
#include <unistd.h>

namespace {

using namespace deckprep;
using std::cerr, std::cout;
using std::expected, std::unexpected;
using std::filesystem::path;
using std::optional, std::nullopt;
using std::print, std::println;
namespace ranges { using namespace std::ranges; }
namespace views { using namespace std::views; }
using std::runtime_error;
using std::unique_ptr;
using std::string, std::string_view;
using std::vector;

// RAII wrapper around miniaudio playback device, templated on callback type.
template<class Callback>
class miniplayer {
public:
  miniplayer(uint32_t sample_rate, uint32_t channels, Callback cb)
  : callback_(std::move(cb))
  {
    auto config = ma_device_config_init(ma_device_type_playback);
    config.playback.format   = ma_format_f32;
    config.playback.channels = channels;
    config.sampleRate        = sample_rate;
    config.noPreSilencedOutputBuffer = false;
    config.dataCallback      = &miniplayer::ma_callback_trampoline;
    config.pUserData         = this;

    if (ma_result res = ma_device_init(nullptr, &config, &device_);
        res != MA_SUCCESS) {
      throw runtime_error(
        string("Audio device init failed: ") + ma_result_description(res)
      );
    }
  }

  miniplayer(const miniplayer&) = delete;
  miniplayer& operator=(const miniplayer&) = delete;

  ~miniplayer() {
    ma_device_uninit(&device_);
  }

  void start() {
    if (ma_result res = ma_device_start(&device_); res != MA_SUCCESS) {
      throw runtime_error(
        string("Audio device start failed: ") + ma_result_description(res)
      );
    }
  }

  void stop() noexcept {
    ma_device_stop(&device_); // ignore errors on stop
  }

  [[nodiscard]] uint32_t sample_rate() const noexcept {
    return device_.sampleRate;
  }

private:
  static void ma_callback_trampoline(ma_device* pDevice,
                                     void* pOutput,
                                     const void* pInput,
                                     ma_uint32 frameCount)
  {
    (void)pInput;
    auto* self = static_cast<miniplayer*>(pDevice->pUserData);
    if (!self) return;

    self->callback_(
      static_cast<float*>(pOutput),
      static_cast<size_t>(frameCount),
      static_cast<size_t>(pDevice->playback.channels),
      pDevice->sampleRate
    );
  }

  ma_device device_{};
  Callback  callback_;
};

// Simple command registry.
using command_args = std::span<const string>;
using command = std::move_only_function<void(command_args)>;
struct command_entry {
  string help;
  command fn;
};

class REPL {
public:
  void register_command(string name, string help, command fn) {
    commands_.emplace(std::move(name), command_entry{std::move(help), std::move(fn)});
  }

  void run(const char* prompt = "deckprep> ") {
    running_ = true;
    while (running_) {
      char* line = readline(prompt);
      if (!line) break; // EOF (Ctrl-D)
      unique_ptr<char, decltype(&std::free)> guard(line, &std::free);

      string input(line);
      if (input.empty()) continue;

      add_history(line);
      auto args = parse_command_line(input);
      if (args.empty()) continue;

      auto it = commands_.find(args[0]);
      if (it == commands_.end()) {
        println(cerr, "Unknown command: {}", args[0]);
        continue;
      }
      try {
        it->second.fn(std::span<const string>{args}.subspan(1));
      } catch (const std::exception& e) {
        println(cerr, "Error: {}", e.what());
      }
    }
  }

  void stop() { running_ = false; }

  void print_help() const {
    cout << "Commands:\n";
    for (const auto& [name, entry] : commands_) {
      cout << "  " << name;
      if (!entry.help.empty()) cout << " - " << entry.help;
      cout << "\n";
    }
  }

private:
  std::map<string, command_entry> commands_;
  bool running_ = true;
};

// Trimmed line from readline, nullopt on EOF.
[[nodiscard]] optional<string> prompt_line(const char* prompt)
{
  char* line = readline(prompt);
  if (!line) return nullopt;
  unique_ptr<char, decltype(&std::free)> guard(line, &std::free);
  return trim(line);
}

struct deck_state {
  session_config config;
  optional<calibration_table> calibration;
  tape_transport transport;
  loudness_meter meter = ebur128_meter();

  vector<path> selected;
  vector<track_record> prepared;
  vector<path> prepared_for;  // selection the prepared records belong to

  // Rebuild the counter model after config changed. A missing or broken
  // calibration leaves manual mode running on the static rate.
  void reload_transport()
  {
    calibration.reset();
    if (config.mode == counter_mode::manual) {
      const path file = config.calibration_path();
      if (auto table = load_calibration(file)) {
        calibration = std::move(*table);
        println(cout, "Loaded calibration from: {}", file.generic_string());
        println(cout, "  Deck: {}", calibration->deck_model);
        println(cout, "  Tape: {}", calibration->tape_type);
        println(cout, "  Checkpoints: {}", calibration->checkpoints.size());
        println(cout, "  Date: {}", calibration->calibration_date);
      } else {
        println(cerr, "Warning: {}", table.error());
        println(cerr, "Warning: manual counter mode falls back to {} counts/second; "
                      "run --calibrate-counter to create a calibration.",
                config.counter_rate);
      }
    }
    transport = make_transport(config, calibration);
  }

  [[nodiscard]] bool is_prepared() const
  { return !prepared.empty() && prepared_for == selected; }
};

void print_report(const profile_report &report, string_view what)
{
  for (auto const &w: report.warnings) println(cerr, "Warning: {}: {}", what, w);
  for (auto const &e: report.errors)   println(cerr, "Error: {}: {}", what, e);
}

void print_config(const deck_state &state)
{
  auto const &c = state.config;
  auto const &tape = tape_type_info(c.tape_type);
  println(cout, "Folder:        {}", c.folder.generic_string());
  if (!c.deck_model.empty())
    println(cout, "Deck:          {}", c.deck_model);
  println(cout, "Tape:          {} - {} ({})", c.tape_type, tape.name, tape.bias);
  println(cout, "Side length:   {} minutes", c.duration_minutes);
  println(cout, "Counter:       {}", describe(state.transport));
  println(cout, "Leader gap:    {}s (counter 0000 - {:04})", c.leader_gap,
          counter_at(double(c.leader_gap), state.transport));
  println(cout, "Track gap:     {}s", c.track_gap);
  if (c.normalization == normalization_method::lufs)
    println(cout, "Normalization: LUFS (target {:+.1f} LUFS)", c.target_lufs);
  else
    println(cout, "Normalization: peak");
  println(cout, "Audio latency: {}s", c.audio_latency);
}

// A command line argument names either a file or a file inside the folder.
[[nodiscard]] expected<path, string> resolve_track(const path &folder, const path &arg)
{
  std::error_code ec;
  for (auto const &candidate: {arg, folder / arg}) {
    if (std::filesystem::is_regular_file(candidate, ec)) {
      if (!is_audio_file(candidate))
        return unexpected("Not an audio file: " + candidate.generic_string());
      return candidate;
    }
  }
  return unexpected("No such track: " + arg.generic_string());
}

[[nodiscard]] expected<vector<track_record>, string>
prepare_tracks(const deck_state &state)
{
  if (state.selected.empty()) return unexpected(string("No tracks selected."));

  const prepare_options options{
    state.config.normalization, state.config.target_lufs, 50
  };
  const path cache_dir = state.config.cache_dir();

  vector<track_record> records;
  records.reserve(state.selected.size());
  for (auto [index, file]: views::enumerate(state.selected)) {
    println(cout, "[{}/{}] {}", index + 1, state.selected.size(),
            file.filename().generic_string());

    auto record = prepare_track(file, cache_dir, options, state.meter);
    if (!record) return unexpected(record.error());

    if (record->from_cache) {
      println(cout, "  Loaded cached: {}",
              record->cache_path.filename().generic_string());
    } else {
      println(cout, "  Normalized ({}): {}", to_string(record->method),
              record->cache_path.filename().generic_string());
    }
    if (record->method != state.config.normalization) {
      println(cerr, "Warning: loudness of {} could not be measured, "
                    "peak normalized instead", record->name);
    }
    if (record->loudness)
      println(cout, "  {:.1f} LUFS, {:.1f} dBFS, {}", *record->loudness,
              record->dbfs, format_duration(record->duration()));
    else
      println(cout, "  {:.1f} dBFS, {}", record->dbfs,
              format_duration(record->duration()));

    records.push_back(std::move(*record));
  }
  return records;
}

bool ensure_prepared(deck_state &state)
{
  if (state.is_prepared()) return true;
  auto records = prepare_tracks(state);
  if (!records) {
    println(cerr, "Error: {}", records.error());
    return false;
  }
  state.prepared = std::move(*records);
  state.prepared_for = state.selected;
  return true;
}

[[nodiscard]] tracklist_report make_report(const deck_state &state)
{
  tracklist_report report{ {}, state.config, state.transport };
  for (auto const &record: state.prepared)
    report.tracks.push_back(tracklist_entry{record.name, record.duration()});
  return report;
}

void print_plan(const deck_state &state)
{
  vector<double> durations;
  for (auto const &record: state.prepared) durations.push_back(record.duration());

  auto const &c = state.config;
  auto slots = plan_session(durations, c.leader_gap, c.track_gap);
  for (auto [index, slot]: views::enumerate(slots)) {
    const auto counter = counter_range(slot, state.transport);
    println(cout, "{:02}. {:<40} {:>6} - {:<6} [{:04} - {:04}]",
            index + 1, state.prepared[size_t(index)].name,
            format_duration(double(slot.start)), format_duration(double(slot.end)),
            counter.start, counter.end);
  }

  const long total = total_recording_time(durations, c.leader_gap, c.track_gap);
  println(cout, "Total recording time: {} of {} minutes",
          format_duration(double(total)), c.duration_minutes);
  if (!fits_on_tape(total, c.duration_minutes))
    println(cerr, "Warning: the selection does not fit on one {} minute side.",
            c.duration_minutes);
}

// Waits up to timeout_ms for a line on stdin and consumes it.
bool wait_for_enter(int timeout_ms)
{
  pollfd pfd{STDIN_FILENO, POLLIN, 0};
  if (::poll(&pfd, 1, timeout_ms) <= 0 || !(pfd.revents & (POLLIN | POLLHUP)))
    return false;

  char buf[256];
  return ::read(STDIN_FILENO, buf, sizeof buf) >= 0;
}

[[nodiscard]] string level_bar(float level, size_t width = 20)
{
  const auto filled = std::min(width,
    static_cast<size_t>(std::lround(std::clamp(level, 0.f, 1.f) * float(width))));
  return string(filled, '#') + string(width - filled, '.');
}

void record_session(const deck_state &state)
{
  auto const &records = state.prepared;
  auto const &c = state.config;
  deck_session session(records, c.leader_gap, c.track_gap);

  println(cout, "Reset the tape counter to 0000, then press RECORD and PAUSE.");
  for (int s = 10; s > 0; --s) {
    print(cout, "\rStarting in {:2}s (Enter cancels) ", s);
    cout.flush();
    if (wait_for_enter(1000)) {
      println(cout, "\nCancelled.");
      return;
    }
  }
  println(cout, "\rRecording. Release PAUSE now; Enter stops.");

  auto device = miniplayer(44100, 2,
    [&session](float *out, size_t frames, size_t channels, uint32_t device_rate) {
      session.render(out, frames, channels, device_rate);
    }
  );
  device.start();

  // 20 Hz display
  while (!session.finished()) {
    if (wait_for_enter(50)) {
      session.stop();
      break;
    }

    const double elapsed = session.elapsed();
    const auto pos = session.locate(elapsed);

    level_pair levels;
    string where;
    if (pos.track) {
      auto const &record = records[*pos.track];
      levels = level_at(record.levels,
                        (pos.track_elapsed - c.audio_latency) * 1000.0);
      where = std::format("{:02}/{:02} {:.24} {}/{}", *pos.track + 1,
                          records.size(), record.name,
                          format_duration(pos.track_elapsed),
                          format_duration(record.duration()));
    } else if (pos.next) {
      where = std::format("{} {:02} in {}", *pos.next == 0 ? "leader, track" : "gap, track",
                          *pos.next + 1, format_duration(pos.until_next));
    }

    const double total = session.total_duration();
    const double progress = total > 0.0 ? std::min(1.0, elapsed / total) : 1.0;
    print(cout, "\r\x1b[2K[{:04}] {:<44} L {} R {} {:3.0f}%",
          counter_at(elapsed, state.transport), where,
          level_bar(levels.left), level_bar(levels.right), progress * 100.0);
    cout.flush();
  }
  device.stop();

  const double elapsed = session.elapsed();
  println(cout, "");
  if (session.stopped())
    println(cout, "Stopped at {} (counter {:04}).", format_duration(elapsed),
            counter_at(elapsed, state.transport));
  else
    println(cout, "Side complete at {} (counter {:04}). Stop the deck.",
            format_duration(elapsed), counter_at(elapsed, state.transport));
}

// Reads a non-negative counter reading, empty input skips.
[[nodiscard]] optional<optional<long>> prompt_counter(const string &prompt)
{
  while (true) {
    auto input = prompt_line(prompt.c_str());
    if (!input) return nullopt;
    if (input->empty()) return optional<long>{};
    if (auto v = parse_number<long>(*input); v && *v >= 0) return optional<long>{*v};
    println(cerr, "    Invalid input. Enter a counter value or press Enter to skip.");
  }
}

[[nodiscard]] optional<calibration_table> run_calibration_wizard()
{
  const string rule(70, '=');
  println(cout, "\n{}\n    TAPE COUNTER CALIBRATION WIZARD\n{}", rule, rule);
  println(cout, "\nPREPARATION:");
  println(cout, "  1. Insert a blank cassette tape (C60 or C90)");
  println(cout, "  2. Reset your tape deck counter to 000");
  println(cout, "  3. Have a stopwatch ready");
  println(cout, "  4. Press RECORD on your deck to start the tape");
  println(cout, "\nRecommended checkpoints: 1min, 5min, 20min, 30min");
  println(cout, "Optional: end of the tape side");

  if (!prompt_line("\nPress Enter when you're ready to start...")) return nullopt;

  calibration_table table;
  println(cout, "\nDECK INFORMATION (optional, press Enter to skip):");
  if (auto v = prompt_line("  Tape type (e.g., C60, C90): "); v && !v->empty())
    table.tape_type = *v;
  if (auto v = prompt_line("  Deck model (e.g., Sony TC-D5M): "); v && !v->empty())
    table.deck_model = *v;

  static constexpr std::pair<int, const char*> suggested[] = {
    {60, "1 minute"}, {300, "5 minutes"}, {1200, "20 minutes"}, {1800, "30 minutes"}
  };

  println(cout, "\nCHECKPOINT MEASUREMENT:");
  println(cout, "Let the tape run and note the counter at each checkpoint.");
  for (auto [seconds, label]: suggested) {
    println(cout, "\nCheckpoint: {} ({} sec)", label, seconds);
    auto value = prompt_counter(std::format("  Counter value at {}: ", label));
    if (!value) return nullopt;
    if (!*value) {
      println(cout, "    Skipped.");
      continue;
    }
    table.checkpoints.push_back({double(seconds), **value, label});
    println(cout, "    Recorded: {} at {}", **value, label);
  }

  println(cout, "\nOPTIONAL: End of tape measurement");
  if (auto answer = prompt_line("Measure end of tape? (y/n): ");
      answer && (*answer == "y" || *answer == "Y")) {
    println(cout, "Let the tape run until it stops at the end.");
    while (true) {
      auto input = prompt_line("Total time in seconds (or MM:SS): ");
      if (!input || input->empty()) {
        println(cout, "    Skipped end-of-tape measurement.");
        break;
      }
      auto seconds = parse_clock(*input);
      if (!seconds) {
        println(cerr, "    Invalid format ({}). Use seconds (1800) or MM:SS (30:00)",
                seconds.error());
        continue;
      }
      auto value = prompt_counter("Final counter value: ");
      if (value && *value) {
        table.checkpoints.push_back({double(*seconds), **value, "End of tape"});
        println(cout, "    Recorded end: {} at {}s", **value, *seconds);
      }
      break;
    }
  }

  if (table.checkpoints.empty()) {
    println(cout, "\nNo checkpoints recorded. Calibration cancelled.");
    return nullopt;
  }

  table.calibration_date =
    local_time(std::chrono::system_clock::now(), "%Y-%m-%d %H:%M:%S");
  if (auto ok = validate(table); !ok) {
    println(cerr, "Error: {}", ok.error());
    return nullopt;
  }

  println(cout, "\n{}\nCALIBRATION SUMMARY:", rule);
  println(cout, "  Tape Type: {}", table.tape_type);
  println(cout, "  Deck Model: {}", table.deck_model);
  println(cout, "  Checkpoints Measured: {}", table.checkpoints.size());
  println(cout, "\n  Checkpoint Details:");
  for (auto const &cp: table.checkpoints) {
    const double rate = cp.time_seconds > 0.0 ? cp.counter / cp.time_seconds : 0.0;
    println(cout, "    {:20} {:4} (rate: {:.3f} counts/sec)", cp.note, cp.counter, rate);
  }
  if (table.checkpoints.size() >= 2)
    println(cout, "\n  Average Rate: {:.3f} counts/second", average_rate(table));
  if (auto fit = fit_calibration(table))
    println(cout, "  Least squares: {:.3f} counts/second, offset {:.1f}, R^2 {:.4f}",
            fit->counts_per_second, fit->offset, fit->R2);

  return table;
}

void calibrate(deck_state &state)
{
  auto table = run_calibration_wizard();
  if (!table) return;

  const path file = state.config.calibration_path();
  save_calibration(*table, file);
  println(cout, "\nCalibration saved to: {}", file.generic_string());
  println(cout, "Use --counter-mode manual to record with it.");

  if (state.config.mode == counter_mode::manual) state.reload_transport();
}

void list_folder(const deck_state &state)
{
  vector<string> skipped;
  auto tracks = list_tracks(state.config.folder, &skipped);
  for (auto const &msg: skipped) println(cerr, "Warning: skipped {}", msg);

  if (tracks.empty()) {
    println(cout, "(no audio files in {})", state.config.folder.generic_string());
    return;
  }
  for (auto [index, track]: views::enumerate(tracks)) {
    println(cout, "{:3}. {:<40} {:>6}  {} Hz  {} ch  {}",
            index + 1, track.file.filename().generic_string(),
            format_duration(track.info.duration), track.info.sample_rate,
            track.info.channels, track.info.format);
  }
}

void print_selected(const deck_state &state)
{
  if (state.selected.empty()) {
    println(cout, "No tracks selected.");
    return;
  }

  vector<double> durations;
  for (auto [index, file]: views::enumerate(state.selected)) {
    auto info = probe(file);
    const double duration = info ? info->duration : 0.0;
    durations.push_back(duration);
    println(cout, "{:3}. {:<40} {}", index + 1, file.filename().generic_string(),
            info ? format_duration(duration) : info.error());
  }

  auto const &c = state.config;
  const long total = total_recording_time(durations, c.leader_gap, c.track_gap);
  println(cout, "Total: {} with leader and gaps, side: {}:00{}",
          format_duration(double(total)), c.duration_minutes,
          fits_on_tape(total, c.duration_minutes) ? "" : "  (does not fit)");
}

[[nodiscard]] expected<size_t, string> parse_index(string_view s, size_t count)
{
  auto v = parse_number<size_t>(s);
  if (!v) return unexpected(v.error());
  if (*v < 1 || *v > count)
    return unexpected(std::format("index out of range (1..{})", count));
  return *v - 1;
}

void print_usage()
{
  cerr << "Usage: deckprep [options] [track...]\n"
          "Options:\n"
          "  --track-gap <s>        Gap between tracks in seconds (default: 5)\n"
          "  --duration <min>       Tape duration per side in minutes (default: 30)\n"
          "  --folder <dir>         Folder with audio tracks (default: ./tracks)\n"
          "  --counter-rate <r>     Counter counts per second (default: 1.0)\n"
          "  --counter-mode <m>     static, manual or auto (default: static)\n"
          "  --calibrate-counter    Run the counter calibration wizard and exit\n"
          "  --counter-config <f>   Calibration file inside the folder\n"
          "                         (default: counter_calibration.json)\n"
          "  --leader-gap <s>       Leader before the first track (default: 10)\n"
          "  --normalization <m>    peak or lufs (default: lufs)\n"
          "  --target-lufs <db>     Target loudness for lufs (default: -14.0)\n"
          "  --audio-latency <s>    Delay of the VU meters (default: 0.0)\n"
          "  --tape-type <t>        Type I, Type II, Type III or Type IV\n"
          "  --deck-profile <f>     Deck profile JSON, options given here win\n"
          "  --tracklist            Prepare the tracks, write the tracklist and exit\n"
          "  --sample-profiles      Write example deck profiles to deck_profiles/\n";
}

enum option_id {
  opt_track_gap = 256, opt_duration, opt_folder, opt_counter_rate,
  opt_counter_mode, opt_calibrate, opt_counter_config, opt_leader_gap,
  opt_normalization, opt_target_lufs, opt_audio_latency, opt_tape_type,
  opt_deck_profile, opt_tracklist, opt_sample_profiles, opt_help
};

[[nodiscard]] expected<void, string>
apply_option(session_config &config, int opt, const string &value)
{
  auto need = [&](bool ok, string_view what) -> expected<void, string> {
    if (ok) return {};
    return unexpected(std::format("'{}': {}", value, what));
  };
  auto as_int = [&](int &out, int min) -> expected<void, string> {
    auto v = parse_number<int>(value);
    if (!v) return need(false, v.error());
    if (*v < min) return need(false, std::format("must be >= {}", min));
    out = *v;
    return {};
  };

  switch (opt) {
    case opt_track_gap:  return as_int(config.track_gap, 0);
    case opt_duration:   return as_int(config.duration_minutes, 1);
    case opt_leader_gap: return as_int(config.leader_gap, 0);
    case opt_folder:
      config.folder = value;
      return {};
    case opt_counter_config:
      config.counter_config = value;
      return {};
    case opt_counter_rate: {
      auto v = parse_number<double>(value);
      if (!v) return need(false, v.error());
      if (!(*v > 0.0)) return need(false, "must be > 0");
      config.counter_rate = *v;
      return {};
    }
    case opt_counter_mode:
      return parse_counter_mode(value).transform([&](counter_mode m) {
        config.mode = m;
      });
    case opt_normalization:
      return parse_normalization_method(value).transform([&](normalization_method m) {
        config.normalization = m;
      });
    case opt_target_lufs: {
      auto v = parse_number<double>(value);
      if (!v) return need(false, v.error());
      config.target_lufs = *v;
      return {};
    }
    case opt_audio_latency: {
      auto v = parse_number<double>(value);
      if (!v) return need(false, v.error());
      if (*v < 0.0) return need(false, "must be >= 0");
      config.audio_latency = *v;
      return {};
    }
    case opt_tape_type:
      if (!is_known_tape_type(value))
        return need(false, "expected Type I, Type II, Type III or Type IV");
      config.tape_type = value;
      return {};
    default:
      return unexpected(string("unknown option"));
  }
}

void register_commands(REPL &repl, deck_state &state)
{
  repl.register_command("help",
    "List commands",
    [&](command_args) {
      repl.print_help();
    }
  );
  repl.register_command("exit",
    "Exit program",
    [&](command_args) {
      repl.stop();
    }
  );
  repl.register_command("quit",
    "Alias for exit",
    [&](command_args) {
      repl.stop();
    }
  );

  repl.register_command("list",
    "list - audio files in the track folder",
    [&](command_args) {
      list_folder(state);
    }
  );

  repl.register_command("add",
    "add <file|number>... - append tracks to the selection "
    "(numbers refer to 'list')",
    [&](command_args a) {
      if (a.empty()) {
        println(cerr, "Usage: add <file|number>...");
        return;
      }
      auto folder_tracks = list_tracks(state.config.folder);
      for (auto const &arg: a) {
        if (auto index = parse_index(arg, folder_tracks.size())) {
          state.selected.push_back(folder_tracks[*index].file);
        } else if (auto file = resolve_track(state.config.folder, arg)) {
          state.selected.push_back(*file);
        } else {
          println(cerr, "{}", file.error());
          continue;
        }
        println(cout, "Added {}", state.selected.back().filename().generic_string());
      }
    }
  );

  repl.register_command("remove",
    "remove <index> - remove a track from the selection (1-based)",
    [&](command_args a) {
      if (a.size() != 1) {
        println(cerr, "Usage: remove <index>");
        return;
      }
      auto index = parse_index(a[0], state.selected.size());
      if (!index) {
        println(cerr, "Invalid index: {}", index.error());
        return;
      }
      auto it = state.selected.begin() + std::ptrdiff_t(*index);
      println(cout, "Removed {}", it->filename().generic_string());
      state.selected.erase(it);
    }
  );

  repl.register_command("move",
    "move <from> <to> - move a track within the selection (1-based)",
    [&](command_args a) {
      if (a.size() != 2) {
        println(cerr, "Usage: move <from> <to>");
        return;
      }
      auto from = parse_index(a[0], state.selected.size());
      auto to   = parse_index(a[1], state.selected.size());
      if (!from) {
        println(cerr, "Invalid <from> index: {}", from.error());
        return;
      }
      if (!to) {
        println(cerr, "Invalid <to> index: {}", to.error());
        return;
      }

      path moving = std::move(state.selected[*from]);
      state.selected.erase(state.selected.begin() + std::ptrdiff_t(*from));
      state.selected.insert(state.selected.begin() + std::ptrdiff_t(*to),
                            std::move(moving));
      print_selected(state);
    }
  );

  repl.register_command("selected",
    "selected - show the selection with durations and tape usage",
    [&](command_args) {
      print_selected(state);
    }
  );

  repl.register_command("clear",
    "clear - empty the selection",
    [&](command_args) {
      state.selected.clear();
      state.prepared.clear();
      state.prepared_for.clear();
    }
  );

  repl.register_command("config",
    "config - show the session configuration",
    [&](command_args) {
      print_config(state);
    }
  );

  repl.register_command("counter",
    "counter [time] - counter reading at a record time (seconds or MM:SS); "
    "without argument a table for the whole side",
    [&](command_args a) {
      if (a.size() > 1) {
        println(cerr, "Usage: counter [time]");
        return;
      }
      if (a.size() == 1) {
        auto seconds = parse_clock(a[0]);
        if (!seconds) {
          println(cerr, "Invalid time '{}': {}", a[0], seconds.error());
          return;
        }
        println(cout, "{} -> {:04}", format_duration(*seconds),
                counter_at(double(*seconds), state.transport));
        return;
      }
      println(cout, "{}", describe(state.transport));
      for (int minute = 0; minute <= state.config.duration_minutes; minute += 5) {
        println(cout, "  {:>5} -> {:04}", format_duration(minute * 60.0),
                counter_at(minute * 60.0, state.transport));
      }
    }
  );

  repl.register_command("prepare",
    "prepare - normalize and analyze the selection, show the counter plan",
    [&](command_args) {
      state.prepared.clear();
      if (ensure_prepared(state)) print_plan(state);
    }
  );

  repl.register_command("tracklist",
    "tracklist - write the tracklist report into the track folder",
    [&](command_args) {
      if (!ensure_prepared(state)) return;
      const path file = write_tracklist(make_report(state), state.config.folder);
      println(cout, "Tracklist written to: {}", file.generic_string());
    }
  );

  repl.register_command("record",
    "record - play the selection to the deck with counter and VU meters",
    [&](command_args) {
      if (!ensure_prepared(state)) return;
      print_plan(state);
      record_session(state);
    }
  );

  repl.register_command("calibrate",
    "calibrate - run the counter calibration wizard",
    [&](command_args) {
      calibrate(state);
    }
  );
}

}

int main(int argc, char** argv)
{
  deck_state state;

  vector<std::pair<int, string>> overrides;
  optional<path> profile_path;
  bool calibrate_only = false;
  bool tracklist_only = false;
  bool sample_profiles = false;

  int opt;
  int option_index = 0;
  static struct option long_options[] = {
    {"track-gap",         required_argument, nullptr, opt_track_gap},
    {"duration",          required_argument, nullptr, opt_duration},
    {"folder",            required_argument, nullptr, opt_folder},
    {"counter-rate",      required_argument, nullptr, opt_counter_rate},
    {"counter-mode",      required_argument, nullptr, opt_counter_mode},
    {"calibrate-counter", no_argument,       nullptr, opt_calibrate},
    {"counter-config",    required_argument, nullptr, opt_counter_config},
    {"leader-gap",        required_argument, nullptr, opt_leader_gap},
    {"normalization",     required_argument, nullptr, opt_normalization},
    {"target-lufs",       required_argument, nullptr, opt_target_lufs},
    {"audio-latency",     required_argument, nullptr, opt_audio_latency},
    {"tape-type",         required_argument, nullptr, opt_tape_type},
    {"deck-profile",      required_argument, nullptr, opt_deck_profile},
    {"tracklist",         no_argument,       nullptr, opt_tracklist},
    {"sample-profiles",   no_argument,       nullptr, opt_sample_profiles},
    {"help",              no_argument,       nullptr, opt_help},
    {nullptr,             0,                 nullptr,  0 }
  };

  while ((opt = getopt_long(argc, argv, "", long_options, &option_index)) != -1) {
    switch (opt) {
      case opt_calibrate:       calibrate_only = true; break;
      case opt_tracklist:       tracklist_only = true; break;
      case opt_sample_profiles: sample_profiles = true; break;
      case opt_deck_profile:    profile_path = path(optarg); break;
      case opt_help:
        print_usage();
        return EXIT_SUCCESS;
      case '?':
        print_usage();
        return EXIT_FAILURE;
      default:
        overrides.emplace_back(opt, optarg);
        break;
    }
  }

  if (sample_profiles) {
    try {
      for (auto const &file: write_sample_profiles("deck_profiles"))
        println(cout, "Created sample profile: {}", file.generic_string());
    } catch (const std::exception &e) {
      println(cerr, "Error: {}", e.what());
      return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
  }

  if (profile_path) {
    auto profile = read_profile(*profile_path);
    if (!profile) {
      println(cerr, "Error: {}", profile.error());
      return EXIT_FAILURE;
    }
    auto report = validate_deck_profile(*profile);
    print_report(report, profile_path->generic_string());
    if (!report.ok()) return EXIT_FAILURE;
    if (auto ok = apply_profile(*profile, state.config); !ok) {
      println(cerr, "Error: {}: {}", profile_path->generic_string(), ok.error());
      return EXIT_FAILURE;
    }
    println(cout, "Loaded deck profile: {}", profile_path->generic_string());
    if (!state.config.deck_model.empty())
      println(cout, "  Deck: {}", state.config.deck_model);
    println(cout, "  Tape: {}", state.config.tape_type);
  }

  for (auto const &[id, value]: overrides) {
    if (auto ok = apply_option(state.config, id, value); !ok) {
      auto it = ranges::find(long_options, id, &option::val);
      println(cerr, "Invalid --{} value {}", it->name, ok.error());
      return EXIT_FAILURE;
    }
  }

  auto settings = validate_settings(state.config);
  print_report(settings, "settings");
  if (!settings.ok()) return EXIT_FAILURE;

  try {
    if (calibrate_only) {
      calibrate(state);
      return EXIT_SUCCESS;
    }

    state.reload_transport();

    for (int i = optind; i < argc; ++i) {
      auto file = resolve_track(state.config.folder, argv[i]);
      if (!file) {
        println(cerr, "Error: {}", file.error());
        return EXIT_FAILURE;
      }
      state.selected.push_back(*file);
    }

    if (tracklist_only) {
      if (!ensure_prepared(state)) return EXIT_FAILURE;
      print_plan(state);
      const path file = write_tracklist(make_report(state), state.config.folder);
      println(cout, "Tracklist written to: {}", file.generic_string());
      return EXIT_SUCCESS;
    }

    print_config(state);
    println(cout, "Type 'help' for commands.");

    REPL repl;
    register_commands(repl, state);
    repl.run("deckprep> ");
  } catch (const std::exception& e) {
    println(cerr, "Error: {}", e.what());
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
