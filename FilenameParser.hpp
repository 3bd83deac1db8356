#pragma once

#include <optional>
#include <string_view>

#include "types.hpp"

// Parses structured photo filenames of the form
//   YYYY.MM.DD.HH.NN.SS.X.GGG.SSS.NNNNNN.ext
// The ten leading fields are mandatory. Any number of non-empty suffix
// tokens (.A, .RAW, .WEB, ...) may sit between the sequence number and the
// extension and are ignored. Matching is case-insensitive; the modifier is
// returned uppercased and the extension lowercased.
class FilenameParser {
 public:
  std::optional<ParsedFilename> parse(std::string_view filename) const;
};
