#ifndef DECKPREP_CALIBRATION_HPP
#define DECKPREP_CALIBRATION_HPP

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace deckprep {

// A measured (elapsed record time, counter reading) pair.
struct calibration_checkpoint {
  double time_seconds = 0.0;
  long counter = 0;
  std::string note;
};

// Checkpoints are sorted by time and have unique times once a table has
// passed validate(); the engine relies on both.
struct calibration_table {
  std::vector<calibration_checkpoint> checkpoints;
  std::string deck_model = "Unknown";
  std::string tape_type = "Unknown";
  std::string calibration_date = "Unknown";
  std::string interpolation = "linear";
};

// Least squares line counter = offset + counts_per_second * t.
struct calibration_fit {
  double counts_per_second = 0.0;
  double offset = 0.0;
  double R2 = 0.0;
  size_t n = 0;
};

// Sorts the checkpoints and rejects tables the counter engine cannot use:
// no checkpoints, negative values, two checkpoints at the same time, or an
// interpolation other than "linear".
[[nodiscard]] std::expected<void, std::string>
validate(calibration_table &table);

[[nodiscard]] std::expected<calibration_table, std::string>
load_calibration(const std::filesystem::path &file);

void save_calibration(const calibration_table &table,
                      const std::filesystem::path &file);

// Slope between the first and the last checkpoint, 0 when undefined.
[[nodiscard]] double average_rate(const calibration_table &table) noexcept;

[[nodiscard]] std::optional<calibration_fit>
fit_calibration(const calibration_table &table);

} // namespace deckprep

#endif
