#pragma once

#include <string>
#include <vector>

#include "types.hpp"

// Checks a parsed filename for legal date/time values and for the zero
// sequence rule: once a component is 00, every more precise component must
// be 00 as well. All rules run; the result lists every violation in a fixed
// order (modifier, date, time, zero sequence) and is empty for a valid name.
class FilenameValidator {
 public:
  std::vector<std::string> validate(const ParsedFilename& parsed) const;

 private:
  static std::vector<std::string> validate_modifier(
      const ParsedFilename& parsed);
  static std::vector<std::string> validate_date(const ParsedFilename& parsed);
  static std::vector<std::string> validate_time(const ParsedFilename& parsed);
  static std::vector<std::string> validate_zero_sequence(
      const ParsedFilename& parsed);
};
