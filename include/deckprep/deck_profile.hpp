#ifndef DECKPREP_DECK_PROFILE_HPP
#define DECKPREP_DECK_PROFILE_HPP

#include <deckprep/calibration.hpp>
#include <deckprep/counter_engine.hpp>
#include <deckprep/normalization.hpp>

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace deckprep {

// Everything one recording session is configured by. Defaults first, then a
// deck profile, then command line options.
struct session_config {
  int track_gap = 5;                 // seconds between tracks
  int duration_minutes = 30;         // one side of a C60
  std::filesystem::path folder = "./tracks";
  double counter_rate = 1.0;
  counter_mode mode = counter_mode::static_rate;
  std::filesystem::path counter_config = "counter_calibration.json";
  int leader_gap = 10;               // seconds before the first track
  normalization_method normalization = normalization_method::lufs;
  double target_lufs = default_target_lufs;
  double audio_latency = 0.0;        // seconds the meters run behind playback
  std::string tape_type = "Type I";
  std::string deck_model;

  [[nodiscard]] double tape_seconds() const noexcept
  { return duration_minutes * 60.0; }

  [[nodiscard]] reel_geometry geometry() const noexcept;

  [[nodiscard]] std::filesystem::path calibration_path() const
  { return folder / counter_config; }

  [[nodiscard]] std::filesystem::path cache_dir() const
  { return folder / "normalized"; }
};

struct profile_report {
  std::vector<std::string> errors;
  std::vector<std::string> warnings;

  [[nodiscard]] bool ok() const noexcept { return errors.empty(); }
};

struct tape_type_spec {
  std::string_view name;
  std::string_view material;
  std::string_view color;
  std::string_view sound;
  std::string_view bias;
  std::string_view notches;
};

inline constexpr std::string_view tape_types[] = {
  "Type I", "Type II", "Type III", "Type IV"
};

// Catalogue entry for a tape type; unknown names read as Type I.
[[nodiscard]] const tape_type_spec &tape_type_info(std::string_view tape_type) noexcept;

[[nodiscard]] bool is_known_tape_type(std::string_view tape_type) noexcept;

// Overrides the fields of config named in profile. Unknown keys are ignored.
[[nodiscard]] std::expected<void, std::string>
apply_profile(const nlohmann::json &profile, session_config &config);

[[nodiscard]] std::expected<nlohmann::json, std::string>
read_profile(const std::filesystem::path &file);

[[nodiscard]] std::expected<void, std::string>
load_deck_profile(const std::filesystem::path &file, session_config &config);

[[nodiscard]] profile_report validate_deck_profile(const nlohmann::json &profile);
[[nodiscard]] profile_report validate_settings(const session_config &config);

// Writes the bundled example profiles into dir, leaving existing files alone.
// Returns the files created. Throws std::runtime_error.
std::vector<std::filesystem::path>
write_sample_profiles(const std::filesystem::path &dir);

[[nodiscard]] tape_transport
make_transport(const session_config &config,
               std::optional<calibration_table> calibration = std::nullopt);

} // namespace deckprep

#endif
