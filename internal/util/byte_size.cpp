#include "internal/util/byte_size.hpp"

#include <array>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <limits>
#include <string>
#include <utility>

#include "internal/util/errors.hpp"

namespace sbomgraph::util {

namespace {

constexpr std::array<std::pair<std::string_view, std::uint64_t>, 10> kUnits = {{
    {"b", 1ULL},
    {"kb", 1000ULL},
    {"mb", 1000ULL * 1000},
    {"gb", 1000ULL * 1000 * 1000},
    {"tb", 1000ULL * 1000 * 1000 * 1000},
    {"kib", 1ULL << 10},
    {"mib", 1ULL << 20},
    {"gib", 1ULL << 30},
    {"tib", 1ULL << 40},
    {"", 1ULL},
}};

std::string_view Trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

} // namespace

std::uint64_t ParseByteSize(std::string_view text) {
  const auto trimmed = Trim(text);

  std::size_t digits = 0;
  bool        dot    = false;
  while (digits < trimmed.size()) {
    const char c = trimmed[digits];
    if (c == '.' && !dot) {
      dot = true;
    } else if (!std::isdigit(static_cast<unsigned char>(c))) {
      break;
    }
    ++digits;
  }

  const auto number = trimmed.substr(0, digits);
  if (number.empty() || number == ".") {
    throw InvalidArgument("invalid byte size: '" + std::string(text) + "'");
  }

  std::string unit;
  for (char c : Trim(trimmed.substr(digits))) unit += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

  for (const auto& [name, factor] : kUnits) {
    if (unit != name) continue;

    const double value = std::stod(std::string(number)) * static_cast<double>(factor);
    if (value >= static_cast<double>(std::numeric_limits<std::uint64_t>::max())) {
      throw InvalidArgument("byte size out of range: '" + std::string(text) + "'");
    }
    return static_cast<std::uint64_t>(std::round(value));
  }

  throw InvalidArgument("unknown byte size unit in '" + std::string(text) + "'");
}

std::string FormatByteSize(std::uint64_t bytes) {
  static constexpr std::array<const char*, 5> kSuffix = {"B", "KiB", "MiB", "GiB", "TiB"};

  double      value = static_cast<double>(bytes);
  std::size_t unit  = 0;
  while (value >= 1024.0 && unit + 1 < kSuffix.size()) {
    value /= 1024.0;
    ++unit;
  }

  char buf[32];
  std::snprintf(buf, sizeof(buf), unit == 0 ? "%.0f %s" : "%.1f %s", value, kSuffix[unit]);
  return buf;
}

} // namespace sbomgraph::util
