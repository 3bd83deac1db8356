#include "MetadataWriter.hpp"

#include <exiv2/exiv2.hpp>
#include <format>
#include <mutex>
#include <system_error>

#include "IOManager.hpp"
#include "utils.hpp"

namespace {
std::mutex g_exiv2_mutex;
}

Exiv2MetadataWriter::Exiv2MetadataWriter(bool preserve_timestamps)
    : m_preserve_timestamps(preserve_timestamps) {}

bool Exiv2MetadataWriter::write(const fs::path& path,
                                const MetadataPlan& plan) {
  std::scoped_lock lock(g_exiv2_mutex);

  std::error_code ec;
  const auto original_mtime = fs::last_write_time(path, ec);
  const bool restore_mtime = m_preserve_timestamps && !ec;

  try {
    Exiv2::Image::UniquePtr image =
        Exiv2::ImageFactory::open(safe_path_to_string(path));
    if (!image.get()) {
      IOManager::log(std::format("Failed to open image '{}'",
                                 safe_path_to_string(path)));
      return false;
    }
    image->readMetadata();

    auto& exifData = image->exifData();
    for (const auto& [key, value] : plan.exif) {
      exifData[key] = value;
    }
    auto& xmpData = image->xmpData();
    for (const auto& [key, value] : plan.xmp) {
      xmpData[key] = value;
    }

    image->writeMetadata();
  } catch (const Exiv2::Error& e) {
    IOManager::log(std::format("Failed to write metadata to '{}': {}",
                               safe_path_to_string(path), e.what()));
    return false;
  } catch (const std::exception& e) {
    IOManager::log(std::format("Failed to write metadata to '{}': {}",
                               safe_path_to_string(path), e.what()));
    return false;
  }

  if (restore_mtime) {
    fs::last_write_time(path, original_mtime, ec);
    if (ec) {
      IOManager::log(
          std::format("Could not restore modification time of '{}': {}",
                      safe_path_to_string(path), ec.message()));
    }
  }

  IOManager::log(std::format("  Metadata written to {}:",
                             safe_path_to_string(path.filename())));
  for (const auto& [key, value] : plan.exif) {
    IOManager::log(std::format("    - {}: {}", key, value));
  }
  for (const auto& [key, value] : plan.xmp) {
    IOManager::log(std::format("    - {}: {}", key, value));
  }
  return true;
}
