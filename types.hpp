#pragma once

#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

// The typed contents of a structured photo filename:
//   YYYY.MM.DD.HH.NN.SS.X.GGG.SSS.NNNNNN[.SUFFIX...].ext
// Built by FilenameParser and handed on by const reference.
struct ParsedFilename {
  int year = 0;
  int month = 0;
  int day = 0;
  int hour = 0;
  int minute = 0;
  int second = 0;
  std::string modifier;
  std::string group;
  std::string subgroup;
  std::string sequence;
  std::string extension;

  bool operator==(const ParsedFilename&) const = default;
};

// Key/value pairs handed to a MetadataWriter, split by metadata family.
// Keys use Exiv2 naming ("Exif.Photo.DateTimeOriginal", "Xmp.dc.identifier").
struct MetadataPlan {
  std::map<std::string, std::string> exif;
  std::map<std::string, std::string> xmp;
};

struct Config {
  fs::path watch_folder;
  std::vector<std::string> extensions = {".tiff", ".tif", ".jpg", ".jpeg"};
  std::string processed_folder = "processed";
  bool preserve_timestamps = true;
};

inline void from_json(const json& j, Config& c) {
  if (j.contains("watch_folder")) {
    c.watch_folder = j.at("watch_folder").get<std::string>();
  }
  if (j.contains("extensions")) {
    j.at("extensions").get_to(c.extensions);
  }
  if (j.contains("processed_folder")) {
    j.at("processed_folder").get_to(c.processed_folder);
  }
  if (j.contains("preserve_timestamps")) {
    j.at("preserve_timestamps").get_to(c.preserve_timestamps);
  }
}

struct Action {
  fs::path from;
  fs::path to;
  std::string reason;
};

// One candidate file found by a folder scan, with what the naming rules
// made of it. `violations` is empty exactly when `accepted` is set.
struct ScanEntry {
  fs::path path;
  std::optional<ParsedFilename> parsed;
  std::vector<std::string> violations;
  bool accepted = false;
};
