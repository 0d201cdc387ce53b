#pragma once

#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace facefind_core {

// Timestamps are stored as GMT "YYYY-MM-DD HH:MM:SS".
inline std::string time_point_to_string(const std::chrono::system_clock::time_point& tp) {
  auto time_t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm_struct = {};
  gmtime_r(&time_t, &tm_struct);
  std::stringstream ss;
  ss << std::put_time(&tm_struct, "%Y-%m-%d %H:%M:%S");
  return ss.str();
}

/**
 * Parses "YYYY-MM-DD HH:MM:SS" and the ISO-8601 form PostgREST returns for
 * timestamptz columns: a 'T' separator, optional fractional seconds and an
 * optional "Z" or "+HH:MM" / "-HH:MM" / "+HHMM" / "+HH" offset. Fractional
 * seconds are dropped; the result is UTC.
 */
inline std::chrono::system_clock::time_point string_to_time_point(const std::string& time_str) {
  auto fail = [&time_str]() {
    return std::runtime_error("Failed to parse time string: " + time_str +
                              ". Expected YYYY-MM-DD HH:MM:SS or ISO-8601.");
  };

  std::string text = time_str;
  if (text.size() > 10 && (text[10] == 'T' || text[10] == 't')) {
    text[10] = ' ';
  }

  std::tm tm_struct = {};
  std::istringstream ss(text);
  ss >> std::get_time(&tm_struct, "%Y-%m-%d %H:%M:%S");
  if (ss.fail()) {
    throw fail();
  }

  std::string rest;
  std::getline(ss, rest);
  size_t pos = 0;
  if (pos < rest.size() && rest[pos] == '.') {
    ++pos;
    const size_t digits_start = pos;
    while (pos < rest.size() && std::isdigit(static_cast<unsigned char>(rest[pos]))) {
      ++pos;
    }
    if (pos == digits_start) {
      throw fail();
    }
  }

  long offset_seconds = 0;
  if (pos < rest.size()) {
    const char sign = rest[pos];
    if ((sign == 'Z' || sign == 'z') && pos + 1 == rest.size()) {
      pos = rest.size();
    } else if (sign == '+' || sign == '-') {
      std::string digits;
      for (size_t i = pos + 1; i < rest.size(); ++i) {
        if (rest[i] == ':') {
          continue;
        }
        if (!std::isdigit(static_cast<unsigned char>(rest[i]))) {
          throw fail();
        }
        digits.push_back(rest[i]);
      }
      if (digits.size() != 2 && digits.size() != 4) {
        throw fail();
      }
      const long hours = std::stol(digits.substr(0, 2));
      const long minutes = digits.size() == 4 ? std::stol(digits.substr(2, 2)) : 0;
      offset_seconds = (hours * 3600 + minutes * 60) * (sign == '-' ? -1 : 1);
      pos = rest.size();
    } else {
      throw fail();
    }
  }

  // A local time of +02:00 is two hours ahead of UTC
  return std::chrono::system_clock::from_time_t(timegm(&tm_struct) - offset_seconds);
}

}  // namespace facefind_core
