#ifndef DECKPREP_COUNTER_ENGINE_HPP
#define DECKPREP_COUNTER_ENGINE_HPP

#include <deckprep/calibration.hpp>

#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace deckprep {

// Physical constants of a compact cassette transport.
struct reel_geometry {
  double tape_length_mm      = 30 * 60 * 47.625; // one C60 side
  double hub_radius_mm       = 10.0;
  double tape_speed_mm_per_s = 47.625;           // 1 7/8 ips
  double tape_thickness_mm   = 0.016;
};

// Constant counts per second for the whole side.
struct static_counter {
  double rate = 1.0;
};

// Interpolates user-measured checkpoints; without a usable table it
// behaves like static_counter{fallback_rate}.
struct manual_counter {
  std::optional<calibration_table> calibration;
  double fallback_rate = 1.0;
};

// Take-up reel simulation, base_rate applies at the middle of the tape.
struct auto_counter {
  double base_rate = 1.0;
  reel_geometry geometry;
};

using tape_transport = std::variant<static_counter, manual_counter, auto_counter>;

enum class counter_mode { static_rate, manual, automatic };

// Counter reading after elapsed_seconds of recording.
[[nodiscard]] long counter_at(double elapsed_seconds,
                              const tape_transport &transport) noexcept;

[[nodiscard]] long counter_at(double elapsed_seconds,
                              const static_counter &model) noexcept;
[[nodiscard]] long counter_at(double elapsed_seconds,
                              const manual_counter &model) noexcept;
[[nodiscard]] long counter_at(double elapsed_seconds,
                              const auto_counter &model) noexcept;

// Radius of the take-up pack after tape_consumed_mm has been wound on.
[[nodiscard]] double takeup_radius(const reel_geometry &geometry,
                                   double tape_consumed_mm) noexcept;

[[nodiscard]] counter_mode mode_of(const tape_transport &transport) noexcept;

[[nodiscard]] std::expected<counter_mode, std::string>
parse_counter_mode(std::string_view name);

[[nodiscard]] std::string_view to_string(counter_mode mode) noexcept;
[[nodiscard]] std::string_view display_name(counter_mode mode) noexcept;

// One line such as "Static Linear (1.42 counts/sec)".
[[nodiscard]] std::string describe(const tape_transport &transport);

} // namespace deckprep

#endif
