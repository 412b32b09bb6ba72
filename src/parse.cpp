#include <deckprep/parse.hpp>

#include <algorithm>
#include <cctype>

namespace deckprep {

using std::expected, std::unexpected;
using std::string, std::string_view;
using std::vector;

expected<int, string> parse_clock(string_view s)
{
  const string text = trim(s);
  if (text.empty()) return unexpected(string("empty time"));

  const auto colon = text.find(':');
  if (colon == string::npos) {
    auto v = parse_number<int>(text);
    if (!v) return unexpected(v.error());
    if (*v < 0) return unexpected(string("time must not be negative"));
    return *v;
  }

  if (text.find(':', colon + 1) != string::npos)
    return unexpected(string("expected MM:SS"));

  auto minutes = parse_number<int>(string_view(text).substr(0, colon));
  auto seconds = parse_number<int>(string_view(text).substr(colon + 1));
  if (!minutes || !seconds) return unexpected(string("expected MM:SS"));
  if (*minutes < 0 || *seconds < 0 || *seconds >= 60)
    return unexpected(string("expected MM:SS with 0 <= SS < 60"));

  return *minutes * 60 + *seconds;
}

// - Whitespace splits args when not inside quotes.
// - Single quotes: literals (no escapes inside).
// - Double quotes: supports backslash escaping of \" and \\ (simple treatment).
vector<string> parse_command_line(const string& s)
{
  vector<string> out;
  string cur;
  bool in_single = false, in_double = false, escape = false;

  auto push = [&](){
    out.push_back(cur);
    cur.clear();
  };

  for (char ch: s) {
    if (in_single) {
      if (ch == '\'') {
        in_single = false;
      } else {
        cur.push_back(ch);
      }
      continue;
    }

    if (escape) {
      cur.push_back(ch);
      escape = false;
      continue;
    }

    if (in_double) {
      if (ch == '\\') {
        escape = true;
      } else if (ch == '"') {
        in_double = false;
      } else {
        cur.push_back(ch);
      }
      continue;
    }

    if (std::isspace(static_cast<unsigned char>(ch))) {
      if (!cur.empty()) push();
      continue;
    }
    if (ch == '\'') { in_single = true; continue; }
    if (ch == '"')  { in_double = true; continue; }
    if (ch == '\\') { escape = true; continue; }

    cur.push_back(ch);
  }

  if (escape) { cur.push_back('\\'); } // trailing backslash literal
  if (!cur.empty()) push();

  return out;
}

string trim(string_view s)
{
  auto is_space = [](unsigned char c){ return std::isspace(c); };
  auto first = std::find_if_not(s.begin(), s.end(), is_space);
  auto last  = std::find_if_not(s.rbegin(), s.rend(), is_space).base();
  if (first >= last) return {};
  return string(first, last);
}

} // namespace deckprep
