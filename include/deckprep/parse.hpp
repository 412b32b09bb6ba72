#ifndef DECKPREP_PARSE_HPP
#define DECKPREP_PARSE_HPP

#include <cassert>
#include <charconv>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <vector>

namespace deckprep {

template<typename T>
requires (std::is_integral_v<T> || std::is_floating_point_v<T>)
[[nodiscard]] std::expected<T, std::string> parse_number(std::string_view s)
{
  static_assert(!std::is_same_v<T, bool>, "parse_number<bool> is not supported");
  T v{};
  const char* b = s.data();
  const char* e = b + s.size();

  auto to_msg = [](std::errc ec) -> std::string {
    assert(ec != std::errc());
    if (ec == std::errc::invalid_argument) return "not a number";
    if (ec == std::errc::result_out_of_range) return "out of range";
    return "parse error";
  };

  // from_chars rejects a leading '+', which users type for LUFS targets.
  if (b != e && *b == '+') ++b;

  std::from_chars_result r = [&]{
    if constexpr (std::is_floating_point_v<T>)
      return std::from_chars(b, e, v, std::chars_format::general);
    return std::from_chars(b, e, v);
  }();

  constexpr std::errc ok{};
  if (r.ec == ok) {
    if (r.ptr != e) return std::unexpected(std::string("trailing characters"));
    return v;
  }
  return std::unexpected(to_msg(r.ec));
}

// Seconds given either as a plain integer ("1800") or as "MM:SS" ("30:00").
[[nodiscard]] std::expected<int, std::string> parse_clock(std::string_view s);

// Shell-style tokenizer supporting quotes and backslashes.
[[nodiscard]] std::vector<std::string> parse_command_line(const std::string& s);

// Trim ASCII whitespace from both ends.
[[nodiscard]] std::string trim(std::string_view s);

} // namespace deckprep

#endif
