#include "parallel_reader/parse_util.hpp"
#include <cctype>
#include <cmath>
#include <system_error>
#include <fast_float/fast_float.h>

namespace pr {

static bool ieq(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i])) return false;
  return true;
}

std::optional<std::size_t> parse_size(std::string_view s) {
  while (!s.empty() && std::isspace((unsigned char)s.front())) s.remove_prefix(1);
  while (!s.empty() && std::isspace((unsigned char)s.back())) s.remove_suffix(1);
  if (s.empty()) return std::nullopt;

  double v;
  auto [ptr, ec] = fast_float::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc()) return std::nullopt;

  std::string_view unit(ptr, static_cast<std::size_t>(s.data() + s.size() - ptr));
  while (!unit.empty() && unit.front() == ' ') unit.remove_prefix(1);

  double mult = 1.0;
  if (unit.empty() || ieq(unit, "b")) mult = 1.0;
  else if (ieq(unit, "k") || ieq(unit, "kb") || ieq(unit, "kib")) mult = 1024.0;
  else if (ieq(unit, "m") || ieq(unit, "mb") || ieq(unit, "mib")) mult = 1024.0 * 1024.0;
  else if (ieq(unit, "g") || ieq(unit, "gb") || ieq(unit, "gib")) mult = 1024.0 * 1024.0 * 1024.0;
  else return std::nullopt;

  const double bytes = std::floor(v * mult);
  if (!std::isfinite(bytes) || bytes < 1.0) return std::nullopt;
  if (bytes > 1e15) return std::nullopt;
  return static_cast<std::size_t>(bytes);
}

std::string unescape(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size(); ++i) {
    char c = s[i];
    if (c != '\\' || i + 1 == s.size()) { out.push_back(c); continue; }
    char n = s[++i];
    switch (n) {
      case 'n':  out.push_back('\n'); break;
      case 'r':  out.push_back('\r'); break;
      case 't':  out.push_back('\t'); break;
      case '0':  out.push_back('\0'); break;
      case '\\': out.push_back('\\'); break;
      default:   out.push_back('\\'); out.push_back(n); break;
    }
  }
  return out;
}

}
