#include "FilenameParser.hpp"

#include <algorithm>
#include <charconv>
#include <string>
#include <vector>

#include "utils.hpp"

namespace {

// Positions of the mandatory fields in the dot-separated token list.
enum Field : size_t {
  kYear = 0,
  kMonth,
  kDay,
  kHour,
  kMinute,
  kSecond,
  kModifier,
  kGroup,
  kSubgroup,
  kSequence,
  kMandatoryCount
};

std::vector<std::string_view> split_on_dots(std::string_view sv) {
  std::vector<std::string_view> tokens;
  size_t start = 0;
  while (true) {
    size_t dot = sv.find('.', start);
    if (dot == std::string_view::npos) {
      tokens.push_back(sv.substr(start));
      break;
    }
    tokens.push_back(sv.substr(start, dot - start));
    start = dot + 1;
  }
  return tokens;
}

bool is_digits(std::string_view sv) {
  return !sv.empty() && std::all_of(sv.begin(), sv.end(), is_ascii_digit);
}

bool is_letters(std::string_view sv) {
  return !sv.empty() && std::all_of(sv.begin(), sv.end(), is_ascii_alpha);
}

// Fails on anything but a complete, in-range decimal number.
std::optional<int> to_int(std::string_view sv) {
  int value = 0;
  auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
  if (ec != std::errc() || ptr != sv.data() + sv.size()) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

std::optional<ParsedFilename> FilenameParser::parse(
    std::string_view filename) const {
  const auto tokens = split_on_dots(filename);

  // Ten mandatory fields plus the extension.
  if (tokens.size() < kMandatoryCount + 1) return std::nullopt;

  // Suffix tokens may be anything but empty.
  if (std::any_of(tokens.begin(), tokens.end(),
                  [](std::string_view t) { return t.empty(); })) {
    return std::nullopt;
  }

  for (size_t i = kYear; i <= kSecond; ++i) {
    if (!is_digits(tokens[i])) return std::nullopt;
  }
  if (tokens[kModifier].size() != 1 || !is_letters(tokens[kModifier])) {
    return std::nullopt;
  }
  if (!is_digits(tokens[kSequence])) return std::nullopt;

  const std::string_view extension = tokens.back();
  if (!is_letters(extension)) return std::nullopt;

  const auto year = to_int(tokens[kYear]);
  const auto month = to_int(tokens[kMonth]);
  const auto day = to_int(tokens[kDay]);
  const auto hour = to_int(tokens[kHour]);
  const auto minute = to_int(tokens[kMinute]);
  const auto second = to_int(tokens[kSecond]);
  if (!year || !month || !day || !hour || !minute || !second) {
    return std::nullopt;
  }

  return ParsedFilename{*year,
                        *month,
                        *day,
                        *hour,
                        *minute,
                        *second,
                        string_to_upper_ascii(tokens[kModifier]),
                        std::string(tokens[kGroup]),
                        std::string(tokens[kSubgroup]),
                        std::string(tokens[kSequence]),
                        string_to_lower_ascii(extension)};
}
