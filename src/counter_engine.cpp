#include <deckprep/counter_engine.hpp>

#include <algorithm>
#include <cmath>
#include <format>
#include <iterator>
#include <numbers>
#include <type_traits>

namespace deckprep {

using std::floor, std::min, std::sqrt;
using std::expected, std::unexpected;
using std::is_same_v;
using std::string, std::string_view;

namespace {

// floor() into the counter type; non-finite values (a table edited by hand
// into an unvalidated state) read as zero.
[[nodiscard]] long to_counter(double value) noexcept
{
  if (!std::isfinite(value)) return 0;
  constexpr double limit = 1e15;
  return static_cast<long>(std::clamp(floor(value), -limit, limit));
}

}

long counter_at(double elapsed_seconds, const static_counter &model) noexcept
{
  return to_counter(elapsed_seconds * model.rate);
}

long counter_at(double elapsed_seconds, const manual_counter &model) noexcept
{
  if (!model.calibration || model.calibration->checkpoints.empty())
    return counter_at(elapsed_seconds, static_counter{model.fallback_rate});

  auto const &cps = model.calibration->checkpoints;
  auto const &first = cps.front();
  auto const &last  = cps.back();

  // Before the first checkpoint: straight line from the reset counter (0,0).
  if (elapsed_seconds <= first.time_seconds) {
    const double rate = first.time_seconds > 0.0
      ? double(first.counter) / first.time_seconds : 0.0;
    return to_counter(elapsed_seconds * rate);
  }

  if (elapsed_seconds >= last.time_seconds) {
    if (cps.size() >= 2) {
      auto const &prev = cps[cps.size() - 2];
      const double dt = last.time_seconds - prev.time_seconds;
      const double rate = dt > 0.0 ? double(last.counter - prev.counter) / dt : 0.0;
      return to_counter(last.counter + rate * (elapsed_seconds - last.time_seconds));
    }
    const double rate = last.time_seconds > 0.0
      ? double(last.counter) / last.time_seconds : 0.0;
    return to_counter(elapsed_seconds * rate);
  }

  // first.time < elapsed < last.time: hi is the first checkpoint past elapsed.
  auto hi = std::upper_bound(cps.begin(), cps.end(), elapsed_seconds,
    [](double t, auto const &cp) { return t < cp.time_seconds; }
  );
  auto lo = std::prev(hi);

  const double factor = (elapsed_seconds - lo->time_seconds)
                      / (hi->time_seconds - lo->time_seconds);
  return to_counter(lo->counter + double(hi->counter - lo->counter) * factor);
}

double takeup_radius(const reel_geometry &geometry, double tape_consumed_mm) noexcept
{
  const double area = tape_consumed_mm * geometry.tape_thickness_mm;
  return sqrt(geometry.hub_radius_mm * geometry.hub_radius_mm
              + area / std::numbers::pi);
}

long counter_at(double elapsed_seconds, const auto_counter &model) noexcept
{
  auto const &g = model.geometry;
  if (!(g.tape_length_mm > 0.0))
    return counter_at(elapsed_seconds, static_counter{model.base_rate});

  const double consumed = min(elapsed_seconds * g.tape_speed_mm_per_s,
                              g.tape_length_mm);
  const double radius = takeup_radius(g, consumed);
  const double mid_radius = takeup_radius(g, g.tape_length_mm / 2.0);
  if (!(radius > 0.0))
    return counter_at(elapsed_seconds, static_counter{model.base_rate});

  // The counter spindle turns slower as the take-up pack grows.
  const double scale = mid_radius / radius;
  return to_counter(elapsed_seconds * model.base_rate * scale);
}

long counter_at(double elapsed_seconds, const tape_transport &transport) noexcept
{
  return std::visit([elapsed_seconds](auto const &model) {
    return counter_at(elapsed_seconds, model);
  }, transport);
}

counter_mode mode_of(const tape_transport &transport) noexcept
{
  return std::visit([](auto const &model) {
    using T = std::decay_t<decltype(model)>;
    if constexpr (is_same_v<T, static_counter>) return counter_mode::static_rate;
    else if constexpr (is_same_v<T, manual_counter>) return counter_mode::manual;
    else return counter_mode::automatic;
  }, transport);
}

expected<counter_mode, string> parse_counter_mode(string_view name)
{
  if (name == "static") return counter_mode::static_rate;
  if (name == "manual") return counter_mode::manual;
  if (name == "auto")   return counter_mode::automatic;
  return unexpected(
    std::format("unknown counter mode '{}'; expected static, manual or auto", name)
  );
}

string_view to_string(counter_mode mode) noexcept
{
  switch (mode) {
    case counter_mode::static_rate: return "static";
    case counter_mode::manual:      return "manual";
    case counter_mode::automatic:   return "auto";
  }
  return "static";
}

string_view display_name(counter_mode mode) noexcept
{
  switch (mode) {
    case counter_mode::static_rate: return "Static Linear";
    case counter_mode::manual:      return "Manual Calibrated";
    case counter_mode::automatic:   return "Auto Physics";
  }
  return "Static Linear";
}

string describe(const tape_transport &transport)
{
  const auto name = display_name(mode_of(transport));
  return std::visit([&](auto const &model) -> string {
    using T = std::decay_t<decltype(model)>;
    if constexpr (is_same_v<T, static_counter>) {
      return std::format("{} ({} counts/sec)", name, model.rate);
    } else if constexpr (is_same_v<T, manual_counter>) {
      if (!model.calibration)
        return std::format("{} (no calibration, {} counts/sec)",
                           name, model.fallback_rate);
      return std::format("{} ({}, {} checkpoints)", name,
                         model.calibration->deck_model,
                         model.calibration->checkpoints.size());
    } else {
      return std::format("{} ({} counts/sec at tape midpoint)",
                         name, model.base_rate);
    }
  }, transport);
}

} // namespace deckprep
