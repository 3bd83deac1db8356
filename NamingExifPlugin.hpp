#pragma once

#include <memory>
#include <optional>

#include "FileProcessorPlugin.hpp"
#include "FilenameParser.hpp"
#include "FilenameValidator.hpp"
#include "MetadataWriter.hpp"

// Writes the date and identifier encoded in a structured photo filename
// into the file's EXIF/XMP metadata, then moves the file into the
// processed folder next to it.
class NamingExifPlugin : public FileProcessorPlugin {
 public:
  NamingExifPlugin();
  explicit NamingExifPlugin(std::unique_ptr<MetadataWriter> writer);

  std::string name() const override;
  std::string version() const override;
  bool can_handle(const fs::path& path) const override;
  bool initialize(const Config& config) override;
  bool process(const fs::path& path, const Config& config) override;

  // Parses and validates a bare file name. Absent when the name is
  // structurally or semantically invalid.
  std::optional<ParsedFilename> parse_and_validate(
      std::string_view filename) const;

 private:
  bool check_exiv2();
  bool is_in_processed_folder(const fs::path& path) const;
  bool has_supported_extension(const fs::path& path) const;

  FilenameParser m_parser;
  FilenameValidator m_validator;
  std::unique_ptr<MetadataWriter> m_writer;
  Config m_config;
  bool m_exiv2_checked = false;
};
