#include "NamingExifPlugin.hpp"

#include <algorithm>
#include <exiv2/exiv2.hpp>
#include <format>
#include <system_error>
#include <utility>

#include "IOManager.hpp"
#include "MetadataFormatter.hpp"
#include "utils.hpp"

NamingExifPlugin::NamingExifPlugin() = default;

NamingExifPlugin::NamingExifPlugin(std::unique_ptr<MetadataWriter> writer)
    : m_writer(std::move(writer)) {}

std::string NamingExifPlugin::name() const { return "naming_exif"; }

std::string NamingExifPlugin::version() const { return "0.1.0"; }

bool NamingExifPlugin::is_in_processed_folder(const fs::path& path) const {
  for (const auto& part : path.parent_path()) {
    if (part == m_config.processed_folder) return true;
  }
  return false;
}

bool NamingExifPlugin::has_supported_extension(const fs::path& path) const {
  const std::string ext =
      string_to_lower_ascii(safe_path_to_string(path.extension()));
  return std::find(m_config.extensions.begin(), m_config.extensions.end(),
                   ext) != m_config.extensions.end();
}

std::optional<ParsedFilename> NamingExifPlugin::parse_and_validate(
    std::string_view filename) const {
  auto parsed = m_parser.parse(filename);
  if (!parsed) return std::nullopt;
  if (!m_validator.validate(*parsed).empty()) return std::nullopt;
  return parsed;
}

bool NamingExifPlugin::can_handle(const fs::path& path) const {
  std::error_code ec;
  if (fs::is_symlink(path, ec)) return false;

  if (is_in_processed_folder(path)) return false;

  if (!has_supported_extension(path)) return false;

  return parse_and_validate(safe_path_to_string(path.filename())).has_value();
}

bool NamingExifPlugin::check_exiv2() {
  if (m_exiv2_checked) return true;

  if (!Exiv2::testVersion(0, 27, 0)) {
    IOManager::log(std::format(
        "Exiv2 version {} is too old. Minimum required version is 0.27.0",
        Exiv2::versionString()));
    return false;
  }
  Exiv2::XmpParser::initialize();
  IOManager::log(
      std::format("Exiv2 version {} detected", Exiv2::versionString()));
  m_exiv2_checked = true;
  return true;
}

bool NamingExifPlugin::initialize(const Config& config) {
  if (!check_exiv2()) return false;

  m_config = config;
  if (!m_writer) {
    m_writer =
        std::make_unique<Exiv2MetadataWriter>(m_config.preserve_timestamps);
  }

  IOManager::log("NamingExifPlugin initialized successfully");
  return true;
}

// Works from the configuration stored by initialize(), the same one
// can_handle() admits files with. The per-call config is not consulted.
bool NamingExifPlugin::process(const fs::path& path,
                               const Config& /*config*/) {
  const std::string filename = safe_path_to_string(path.filename());
  IOManager::log(
      std::format("Processing file: {}", safe_path_to_string(path)));

  // can_handle already checked the name, but the host may call us directly.
  auto parsed = m_parser.parse(filename);
  if (!parsed) {
    IOManager::log(std::format("Failed to parse filename: {}", filename));
    return false;
  }

  const auto errors = m_validator.validate(*parsed);
  if (!errors.empty()) {
    std::string details;
    for (const auto& error : errors) {
      details += std::format("\n  - {}", error);
    }
    IOManager::log(
        std::format("Invalid filename format: {}{}", filename, details));
    return false;
  }

  if (!m_writer) {
    m_writer =
        std::make_unique<Exiv2MetadataWriter>(m_config.preserve_timestamps);
  }

  const MetadataPlan plan = MetadataFormatter::build_metadata_plan(*parsed);
  if (!m_writer->write(path, plan)) return false;

  if (!IOManager::move_to_processed(path, m_config.processed_folder)) {
    return false;
  }

  IOManager::log(std::format("Successfully processed: {}", filename));
  return true;
}
