#include "IOManager.hpp"

#include <chrono>
#include <format>
#include <fstream>
#include <functional>
#include <mutex>
#include <system_error>

#include "utils.hpp"

namespace {
std::ofstream& get_log_stream() {
  static std::ofstream log_file("naming_exif.log", std::ios_base::app);
  return log_file;
}

std::mutex log_mutex;

std::function<void(std::string_view)> g_log_handler = nullptr;

}  // namespace

void IOManager::initialize_logger() { get_log_stream(); }

void IOManager::set_log_handler(std::function<void(std::string_view)> handler) {
  std::scoped_lock lock(log_mutex);
  g_log_handler = handler;
}

void IOManager::log(std::string_view message) {
  std::scoped_lock lock(log_mutex);

  auto now = std::chrono::system_clock::now();
  auto time_str = std::format("{:%Y-%m-%d %H:%M:%S}",
                              std::chrono::floor<std::chrono::seconds>(now));
  std::string full_message = std::format("{} | {}", time_str, message);

  if (g_log_handler) {
    g_log_handler(full_message);
  }

  auto& log_stream = get_log_stream();
  if (log_stream.is_open()) {
    log_stream << full_message << "\n" << std::flush;
  }
}

std::optional<Config> IOManager::load_config(const fs::path& configPath) {
  if (!fs::exists(configPath)) {
    log(std::format("Error: Config file not found at {}",
                    safe_path_to_string(configPath)));
    return std::nullopt;
  }
  std::ifstream configFile(configPath);
  try {
    json configJson = json::parse(configFile);
    Config config = configJson.get<Config>();
    for (auto& ext : config.extensions) {
      ext = string_to_lower_ascii(ext);
    }
    return config;
  } catch (const json::exception& e) {
    log(std::format("Error parsing {}: {}", safe_path_to_string(configPath),
                    e.what()));
    return std::nullopt;
  }
}

std::optional<fs::path> IOManager::move_to_processed(
    const fs::path& file, std::string_view folder_name) {
  const fs::path processed_dir = file.parent_path() / folder_name;
  const fs::path dest_path = processed_dir / file.filename();

  try {
    if (!fs::exists(processed_dir)) {
      fs::create_directories(processed_dir);
      log(std::format("[DIR] Creating directory: '{}'",
                      safe_path_to_string(processed_dir)));
    }

    if (fs::exists(dest_path)) {
      log(std::format(
          "Destination file already exists: {}. Leaving source file in place.",
          safe_path_to_string(dest_path)));
      return std::nullopt;
    }

    fs::rename(file, dest_path);
    log(std::format("  Moved to: {}", safe_path_to_string(dest_path)));
    return dest_path;
  } catch (const fs::filesystem_error& e) {
    log(std::format("Failed to move file {} to {}/: {}",
                    safe_path_to_string(file), folder_name, e.what()));
    return std::nullopt;
  }
}
