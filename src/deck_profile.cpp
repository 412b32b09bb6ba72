#include <deckprep/deck_profile.hpp>

#include <algorithm>
#include <format>
#include <fstream>
#include <stdexcept>
#include <utility>

#include <nlohmann/json.hpp>

namespace deckprep {

using nlohmann::json;
using std::expected, std::unexpected;
using std::filesystem::path;
using std::optional;
using std::runtime_error;
using std::string, std::string_view;
using std::vector;

reel_geometry session_config::geometry() const noexcept
{
  reel_geometry g;
  g.tape_length_mm = tape_seconds() * g.tape_speed_mm_per_s;
  return g;
}

namespace {

constexpr tape_type_spec tape_catalogue[] = {
  { "Normal (Ferric Oxide)", "Ferric Oxide", "Brown",
    "Good bass, lacks high-frequency detail", "Standard (120us EQ)",
    "Standard write-protect only" },
  { "Chrome/High Bias", "Chromium Dioxide (CrO2)", "Dark brown/black",
    "Crisp highs, better dynamics", "High bias (70us EQ)",
    "Extra detection notches" },
  { "Ferrochrome (Rare)", "Ferric + Chrome mix", "Varies",
    "Type I bass + Type II highs", "High bias (70us EQ)",
    "Distinct pattern" },
  { "Metal (Pure Metal)", "Pure metal particles", "Solid black",
    "Highest output, best clarity", "Metal bias (70us EQ)",
    "Third center notch set" },
};

[[nodiscard]] optional<size_t> tape_index(string_view tape_type) noexcept
{
  auto it = std::ranges::find(tape_types, tape_type);
  if (it == std::end(tape_types)) return std::nullopt;
  return size_t(it - std::begin(tape_types));
}

struct sample_profile {
  const char *file;
  json profile;
};

const sample_profile sample_profiles[] = {
  { "aiwa_adf780.json", {
      {"deck_model", "AIWA AD-F780"},
      {"tape_type", "Type II"},
      {"tape_duration", 45},
      {"counter_mode", "manual"},
      {"counter_config", "counter_calibration_aiwa.json"},
      {"leader_gap", 10},
      {"track_gap", 5},
      {"normalization", "lufs"},
      {"target_lufs", -14.0},
      {"audio_latency", 0.2}
  }},
  { "sony_tcwe475.json", {
      {"deck_model", "Sony TC-WE475"},
      {"tape_type", "Type I"},
      {"tape_duration", 30},
      {"counter_mode", "static"},
      {"counter_rate", 1.42},
      {"leader_gap", 8},
      {"track_gap", 4},
      {"normalization", "peak"},
      {"audio_latency", 0.1}
  }},
  { "pioneer_ctr305.json", {
      {"deck_model", "Pioneer CT-R305"},
      {"tape_type", "Type I"},
      {"tape_duration", 30},
      {"counter_mode", "static"},
      {"counter_rate", 1.35},
      {"leader_gap", 8},
      {"track_gap", 4},
      {"normalization", "peak"},
      {"audio_latency", 0.0}
  }},
  { "technics_rsx205.json", {
      {"deck_model", "Technics RS-X205"},
      {"tape_type", "Type IV"},
      {"tape_duration", 45},
      {"counter_mode", "auto"},
      {"counter_rate", 1.5},
      {"leader_gap", 12},
      {"track_gap", 6},
      {"normalization", "lufs"},
      {"target_lufs", -12.0},
      {"audio_latency", 0.15}
  }},
};

}

const tape_type_spec &tape_type_info(string_view tape_type) noexcept
{
  return tape_catalogue[tape_index(tape_type).value_or(0)];
}

bool is_known_tape_type(string_view tape_type) noexcept
{
  return tape_index(tape_type).has_value();
}

expected<void, string> apply_profile(const json &profile, session_config &config)
{
  if (!profile.is_object()) return unexpected(string("profile is not an object"));

  session_config next = config;
  try {
    if (auto it = profile.find("counter_mode"); it != profile.end()) {
      auto mode = parse_counter_mode(it->get<string>());
      if (!mode) return unexpected(mode.error());
      next.mode = *mode;
    }
    if (auto it = profile.find("normalization"); it != profile.end()) {
      auto method = parse_normalization_method(it->get<string>());
      if (!method) return unexpected(method.error());
      next.normalization = *method;
    }
    if (profile.contains("counter_config"))
      next.counter_config = profile["counter_config"].get<string>();
    if (profile.contains("counter_rate"))
      next.counter_rate = profile["counter_rate"].get<double>();
    if (profile.contains("leader_gap"))
      next.leader_gap = profile["leader_gap"].get<int>();
    if (profile.contains("track_gap"))
      next.track_gap = profile["track_gap"].get<int>();
    if (profile.contains("target_lufs"))
      next.target_lufs = profile["target_lufs"].get<double>();
    if (profile.contains("tape_type"))
      next.tape_type = profile["tape_type"].get<string>();
    if (profile.contains("deck_model"))
      next.deck_model = profile["deck_model"].get<string>();
    if (profile.contains("folder"))
      next.folder = profile["folder"].get<string>();
    if (profile.contains("duration"))
      next.duration_minutes = profile["duration"].get<int>();
    if (profile.contains("tape_duration"))
      next.duration_minutes = profile["tape_duration"].get<int>();
    if (profile.contains("audio_latency"))
      next.audio_latency = profile["audio_latency"].get<double>();
  } catch (const json::exception &e) {
    return unexpected(std::format("invalid profile value: {}", e.what()));
  }

  config = std::move(next);
  return {};
}

expected<json, string> read_profile(const path &file)
{
  std::ifstream in(file);
  if (!in) return unexpected("Deck profile not found: " + file.generic_string());

  try {
    return json::parse(in);
  } catch (const json::exception &e) {
    return unexpected(std::format("Failed to parse {}: {}",
                                  file.generic_string(), e.what()));
  }
}

expected<void, string> load_deck_profile(const path &file, session_config &config)
{
  return read_profile(file).and_then([&](json const &profile) {
    return apply_profile(profile, config);
  }).transform_error([&](string msg) {
    return file.generic_string() + ": " + msg;
  });
}

profile_report validate_deck_profile(const json &profile)
{
  profile_report report;
  if (!profile.is_object()) {
    report.errors.push_back("Profile is not a JSON object");
    return report;
  }

  for (auto field: {"deck_model", "tape_type", "counter_mode", "normalization"}) {
    if (!profile.contains(field))
      report.warnings.push_back(std::format("Missing recommended field: {}", field));
  }

  try {
    const string mode = profile.value("counter_mode", string("static"));
    if (mode == "manual" && !profile.contains("counter_config"))
      report.errors.push_back("Manual counter mode requires 'counter_config' field");
    if (mode == "static" && !profile.contains("counter_rate"))
      report.warnings.push_back("Static counter mode should include 'counter_rate' field");
    if (!parse_counter_mode(mode))
      report.errors.push_back(std::format(
        "Invalid counter_mode: {}. Valid options: static, manual, auto", mode));

    const string tape = profile.value("tape_type", string("Type I"));
    if (!is_known_tape_type(tape))
      report.errors.push_back(std::format(
        "Invalid tape_type: {}. Valid options: Type I, Type II, Type III, Type IV", tape));

    const string norm = profile.value("normalization", string("lufs"));
    if (!parse_normalization_method(norm))
      report.errors.push_back(std::format(
        "Invalid normalization: {}. Valid options: peak, lufs", norm));

    if (norm == "lufs") {
      auto it = profile.find("target_lufs");
      if (it == profile.end()) {
        report.warnings.push_back("LUFS normalization should include 'target_lufs' field");
      } else if (!it->is_number()) {
        report.errors.push_back("target_lufs must be a number");
      } else if (double t = it->get<double>(); t < -30.0 || t > -6.0) {
        report.warnings.push_back(std::format(
          "Unusual target_lufs value: {}. Typical range: -23 to -14 LUFS", t));
      }
    }
  } catch (const json::exception &e) {
    report.errors.push_back(std::format("Invalid field type: {}", e.what()));
  }

  return report;
}

profile_report validate_settings(const session_config &config)
{
  profile_report report;

  if (config.duration_minutes <= 0)
    report.errors.push_back(std::format(
      "Tape duration must be positive, got {} minutes", config.duration_minutes));
  else if (config.duration_minutes != 30 && config.duration_minutes != 45
           && config.duration_minutes != 60)
    report.warnings.push_back(std::format(
      "Unusual tape duration: {} minutes. Common values: 30 (C60), 45 (C90), 60 (C120)",
      config.duration_minutes));

  if (config.track_gap < 0)
    report.errors.push_back("Track gap must not be negative");
  if (config.leader_gap < 0)
    report.errors.push_back("Leader gap must not be negative");

  if (!(config.counter_rate > 0.0))
    report.errors.push_back("Counter rate must be positive");
  else if (config.mode == counter_mode::static_rate
           && (config.counter_rate < 0.5 || config.counter_rate > 5.0))
    report.warnings.push_back(std::format(
      "Unusual counter rate: {}. Typical range: 0.8-2.0 counts/second",
      config.counter_rate));

  if (config.normalization == normalization_method::lufs
      && (config.target_lufs < -30.0 || config.target_lufs > -6.0))
    report.warnings.push_back(std::format(
      "Unusual LUFS target: {}. Broadcast standard: -23 LUFS, Music: -14 LUFS",
      config.target_lufs));

  if (config.audio_latency < 0.0)
    report.errors.push_back("Audio latency must not be negative");
  else if (config.audio_latency > 1.0)
    report.warnings.push_back(std::format(
      "High audio latency compensation: {}s. Typical range: 0.1-0.5s",
      config.audio_latency));

  if (!is_known_tape_type(config.tape_type))
    report.warnings.push_back(std::format(
      "Unknown tape type '{}', reporting it as Type I", config.tape_type));

  return report;
}

vector<path> write_sample_profiles(const path &dir)
{
  std::filesystem::create_directories(dir);

  vector<path> created;
  for (auto const &[name, profile]: sample_profiles) {
    const path file = dir / name;
    if (std::filesystem::exists(file)) continue;

    std::ofstream out;
    out.exceptions(std::ofstream::failbit | std::ofstream::badbit);
    out.open(file, std::ios::trunc);
    out << profile.dump(2) << '\n';
    created.push_back(file);
  }
  return created;
}

tape_transport make_transport(const session_config &config,
                              optional<calibration_table> calibration)
{
  switch (config.mode) {
    case counter_mode::manual:
      return manual_counter{ std::move(calibration), config.counter_rate };
    case counter_mode::automatic:
      return auto_counter{ config.counter_rate, config.geometry() };
    case counter_mode::static_rate:
      break;
  }
  return static_counter{ config.counter_rate };
}

} // namespace deckprep
