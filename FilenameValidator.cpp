#include "FilenameValidator.hpp"

#include <array>
#include <format>
#include <iterator>
#include <string_view>

namespace {

constexpr std::array<std::string_view, 5> kValidModifiers = {"A", "B", "C",
                                                              "E", "F"};

// February is always allowed 29 days; no leap year arithmetic is done.
constexpr std::array<int, 12> kDaysInMonth = {31, 29, 31, 30, 31, 30,
                                              31, 31, 30, 31, 30, 31};

constexpr int kLooseDayBound = 31;

bool time_is_zero(const ParsedFilename& p) {
  return p.hour == 0 && p.minute == 0 && p.second == 0;
}

std::string format_time(const ParsedFilename& p) {
  return std::format("{:02d}:{:02d}:{:02d}", p.hour, p.minute, p.second);
}

void append(std::vector<std::string>& to, std::vector<std::string> from) {
  to.insert(to.end(), std::make_move_iterator(from.begin()),
            std::make_move_iterator(from.end()));
}

}  // namespace

std::vector<std::string> FilenameValidator::validate(
    const ParsedFilename& parsed) const {
  std::vector<std::string> errors;
  append(errors, validate_modifier(parsed));
  append(errors, validate_date(parsed));
  append(errors, validate_time(parsed));
  append(errors, validate_zero_sequence(parsed));
  return errors;
}

std::vector<std::string> FilenameValidator::validate_modifier(
    const ParsedFilename& parsed) {
  for (const auto& m : kValidModifiers) {
    if (parsed.modifier == m) return {};
  }
  return {std::format("invalid modifier '{}' (must be one of: A, B, C, E, F)",
                      parsed.modifier)};
}

std::vector<std::string> FilenameValidator::validate_date(
    const ParsedFilename& parsed) {
  std::vector<std::string> errors;

  if (parsed.month > 12) {
    errors.push_back(std::format("invalid month value: {} (must be 00-12)",
                                 parsed.month));
  }

  if (parsed.month >= 1 && parsed.month <= 12) {
    const int max_days = kDaysInMonth[parsed.month - 1];
    if (parsed.day > max_days) {
      errors.push_back(
          std::format("invalid day value: {} for month {} (must be 00-{:02d})",
                      parsed.day, parsed.month, max_days));
    }
  } else if (parsed.day > kLooseDayBound) {
    errors.push_back(std::format("invalid day value: {} (must be 00-{})",
                                 parsed.day, kLooseDayBound));
  }

  return errors;
}

std::vector<std::string> FilenameValidator::validate_time(
    const ParsedFilename& parsed) {
  std::vector<std::string> errors;

  if (parsed.hour > 23) {
    errors.push_back(
        std::format("invalid hour value: {} (must be 00-23)", parsed.hour));
  }
  if (parsed.minute > 59) {
    errors.push_back(
        std::format("invalid minute value: {} (must be 00-59)", parsed.minute));
  }
  if (parsed.second > 59) {
    errors.push_back(
        std::format("invalid second value: {} (must be 00-59)", parsed.second));
  }

  return errors;
}

std::vector<std::string> FilenameValidator::validate_zero_sequence(
    const ParsedFilename& parsed) {
  std::vector<std::string> errors;

  if (parsed.month == 0) {
    if (parsed.day != 0) {
      errors.push_back(std::format(
          "invalid date: month is 00 but day is {:02d} (when month=00, day "
          "must also be 00)",
          parsed.day));
    }
    if (!time_is_zero(parsed)) {
      errors.push_back(std::format(
          "invalid date: month is 00 but time is {} (when month=00, time must "
          "be 00:00:00)",
          format_time(parsed)));
    }
  }

  if (parsed.day == 0 && !time_is_zero(parsed)) {
    errors.push_back(std::format(
        "invalid date: day is 00 but time is {} (when day=00, time must be "
        "00:00:00)",
        format_time(parsed)));
  }

  if (parsed.hour == 0 && (parsed.minute != 0 || parsed.second != 0)) {
    errors.push_back(std::format(
        "invalid time: hour is 00 but minute/second are {:02d}:{:02d} (when "
        "hour=00, minute and second must also be 00)",
        parsed.minute, parsed.second));
  }

  if (parsed.minute == 0 && parsed.second != 0) {
    errors.push_back(std::format(
        "invalid time: minute is 00 but second is {:02d} (when minute=00, "
        "second must also be 00)",
        parsed.second));
  }

  return errors;
}
