#include <deckprep/calibration.hpp>

#include <algorithm>
#include <fstream>
#include <format>
#include <iterator>
#include <stdexcept>

#include <boost/math/statistics/linear_regression.hpp>
#include <nlohmann/json.hpp>

namespace deckprep {

using boost::math::statistics::simple_ordinary_least_squares_with_R_squared;
using nlohmann::json;
using std::expected, std::unexpected;
using std::filesystem::path;
using std::optional, std::nullopt;
using std::runtime_error;
using std::string;
using std::vector;

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(calibration_checkpoint,
  time_seconds, counter, note
)

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(calibration_table,
  checkpoints, deck_model, tape_type, calibration_date, interpolation
)

expected<void, string> validate(calibration_table &table)
{
  auto &cps = table.checkpoints;
  if (cps.empty()) return unexpected(string("calibration has no checkpoints"));

  if (table.interpolation != "linear")
    return unexpected(
      std::format("unsupported interpolation '{}'", table.interpolation)
    );

  for (auto const &cp: cps) {
    if (!(cp.time_seconds >= 0.0))
      return unexpected(
        std::format("checkpoint '{}' has a negative time", cp.note)
      );
    if (cp.counter < 0)
      return unexpected(
        std::format("checkpoint '{}' has a negative counter", cp.note)
      );
  }

  std::stable_sort(cps.begin(), cps.end(),
    [](auto const &a, auto const &b) { return a.time_seconds < b.time_seconds; }
  );

  auto dup = std::adjacent_find(cps.begin(), cps.end(),
    [](auto const &a, auto const &b) { return a.time_seconds == b.time_seconds; }
  );
  if (dup != cps.end())
    return unexpected(
      std::format("two checkpoints share the time {} s", dup->time_seconds)
    );

  return {};
}

expected<calibration_table, string> load_calibration(const path &file)
{
  std::ifstream in(file);
  if (!in)
    return unexpected("Calibration file not found: " + file.generic_string());

  calibration_table table;
  try {
    json j = json::parse(in);
    if (!j.is_object()) return unexpected(string("root is not an object"));
    if (!j.contains("checkpoints") || !j["checkpoints"].is_array())
      return unexpected(string("missing 'checkpoints' array"));
    table = j.get<calibration_table>();
  } catch (const json::exception &e) {
    return unexpected(file.generic_string() + ": " + e.what());
  }

  if (auto ok = validate(table); !ok)
    return unexpected(file.generic_string() + ": " + ok.error());

  return table;
}

void save_calibration(const calibration_table &table, const path &file)
{
  if (file.has_parent_path())
    std::filesystem::create_directories(file.parent_path());

  std::ofstream out;
  out.exceptions(std::ofstream::failbit | std::ofstream::badbit);
  out.open(file, std::ios::trunc);

  out << json(table).dump(2);
}

double average_rate(const calibration_table &table) noexcept
{
  if (table.checkpoints.size() < 2) return 0.0;
  auto const &first = table.checkpoints.front();
  auto const &last  = table.checkpoints.back();
  const double dt = last.time_seconds - first.time_seconds;
  return dt > 0.0 ? double(last.counter - first.counter) / dt : 0.0;
}

optional<calibration_fit> fit_calibration(const calibration_table &table)
{
  const size_t n = table.checkpoints.size();
  if (n < 2) return nullopt;

  vector<double> t, c;
  t.reserve(n);
  c.reserve(n);
  for (auto const &cp: table.checkpoints) {
    t.push_back(cp.time_seconds);
    c.push_back(double(cp.counter));
  }

  // boost throws on a degenerate design (all times equal).
  if (std::ranges::all_of(t, [&](double v) { return v == t.front(); }))
    return nullopt;

  auto [A, B, R2] = simple_ordinary_least_squares_with_R_squared(t, c);

  calibration_fit fit;
  fit.offset = A;
  fit.counts_per_second = B;
  fit.R2 = R2;
  fit.n = n;
  return fit;
}

} // namespace deckprep
