#pragma once

#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include "FilenameParser.hpp"
#include "FilenameValidator.hpp"
#include "FileProcessorPlugin.hpp"

// Walks a watched folder for files with a supported extension. inspect()
// reports every such file with its parsed fields or rule violations;
// generate_plan() keeps the ones the plugin accepts as Actions.
class FolderScanner {
 public:
  FolderScanner(const Config& config, const FileProcessorPlugin& plugin);

  std::vector<ScanEntry> inspect(
      const fs::path& targetDir,
      std::optional<std::stop_token> stoken = std::nullopt) const;

  std::vector<Action> generate_plan(
      const fs::path& targetDir,
      std::optional<std::stop_token> stoken = std::nullopt) const;

  // One-line summary of the dates and tags a name carries, e.g.
  // "1950-06-15T12:30:45 [E] FAM/POR #000001".
  static std::string describe(const ParsedFilename& parsed);

 private:
  std::vector<fs::path> collect_candidates(const fs::path& targetDir) const;
  ScanEntry inspect_path(const fs::path& path) const;

  const Config& m_config;
  const FileProcessorPlugin& m_plugin;
  FilenameParser m_parser;
  FilenameValidator m_validator;
};
