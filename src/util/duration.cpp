#include "util/duration.hpp"

#include <cctype>
#include <stdexcept>

namespace gri {

std::chrono::milliseconds parse_duration(const std::string &str) {
  if (str.empty()) {
    return std::chrono::milliseconds{0};
  }

  long long total_ms = 0;
  std::size_t i = 0;
  bool has_unit = false;

  while (i < str.size()) {
    if (!std::isdigit(static_cast<unsigned char>(str[i]))) {
      throw std::runtime_error("Invalid duration string: " + str);
    }

    long long value = 0;
    while (i < str.size() && std::isdigit(static_cast<unsigned char>(str[i]))) {
      value = value * 10 + (str[i] - '0');
      ++i;
    }

    if (i == str.size()) {
      if (has_unit) {
        throw std::runtime_error("Missing unit in duration: " + str);
      }
      total_ms += value * 1000;
      break;
    }

    char unit = static_cast<char>(
        std::tolower(static_cast<unsigned char>(str[i])));
    ++i;
    if (unit == 'm' && i < str.size() &&
        std::tolower(static_cast<unsigned char>(str[i])) == 's') {
      ++i;
      total_ms += value;
    } else if (unit == 's') {
      total_ms += value * 1000;
    } else if (unit == 'm') {
      total_ms += value * 60 * 1000;
    } else if (unit == 'h') {
      total_ms += value * 3600 * 1000;
    } else {
      throw std::runtime_error("Invalid duration suffix: " + str);
    }
    has_unit = true;
  }

  return std::chrono::milliseconds{total_ms};
}

} // namespace gri
