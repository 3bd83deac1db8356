#include <exception>
#include <exiv2/exiv2.hpp>
#include <format>
#include <optional>
#include <print>
#include <string_view>
#include <utility>
#include <vector>

#include "FolderScanner.hpp"
#include "IOManager.hpp"
#include "NamingExifPlugin.hpp"
#include "UI.hpp"
#include "types.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

namespace {

void print_usage() {
  std::println(stderr, "Usage: naming_exif [folder] [--batch]");
  std::println(stderr,
               "  folder   folder to scan (default: watch_folder from "
               "config.json, else the current directory)");
  std::println(stderr, "  --batch  process every valid file and exit");
}

int run_batch(const Config& config, const fs::path& targetDir,
              NamingExifPlugin& plugin) {
  FolderScanner scanner(config, plugin);
  const std::vector<Action> plan = scanner.generate_plan(targetDir);

  size_t failed = 0;
  for (const auto& action : plan) {
    if (!plugin.process(action.from, config)) {
      ++failed;
    }
  }

  IOManager::log(std::format("Batch complete. {} processed, {} failed.",
                             plan.size() - failed, failed));
  std::println("{} processed, {} failed. See naming_exif.log for details.",
               plan.size() - failed, failed);
  return failed == 0 ? 0 : 1;
}

}  // namespace

int main(int argc, char* argv[]) {
  Exiv2::XmpParser::initialize();

  try {
    IOManager::initialize_logger();
    IOManager::log("--- naming_exif v0.1.0 Started ---");

    bool batch = false;
    std::optional<fs::path> folderArg;
    for (int i = 1; i < argc; ++i) {
      std::string_view arg = argv[i];
      if (arg == "--batch") {
        batch = true;
      } else if (arg == "--help" || arg == "-h") {
        print_usage();
        Exiv2::XmpParser::terminate();
        return 0;
      } else if (!folderArg && !arg.starts_with("-")) {
        folderArg = fs::path(arg);
      } else {
        print_usage();
        Exiv2::XmpParser::terminate();
        return 1;
      }
    }

    fs::path exePath;
    if (argc > 0) {
      exePath = fs::path(argv[0]).parent_path();
    }
    if (exePath.empty()) {
      exePath = fs::current_path();
    }

    std::vector<fs::path> configPaths = {exePath / "config.json",
                                         fs::current_path() / "config.json",
                                         exePath.parent_path() / "config.json"};

    Config config;
    bool configLoaded = false;
    for (const auto& configPath : configPaths) {
      if (fs::exists(configPath)) {
        IOManager::log(std::format("Found config.json at: {}",
                                   safe_path_to_string(configPath)));
        if (auto loaded = IOManager::load_config(configPath)) {
          config = std::move(*loaded);
          configLoaded = true;
          break;
        }
      }
    }
    if (!configLoaded) {
      IOManager::log("No usable config.json found. Using defaults.");
    }

    fs::path targetDir = folderArg.value_or(
        config.watch_folder.empty() ? fs::current_path() : config.watch_folder);
    IOManager::log(
        std::format("Target directory: {}", safe_path_to_string(targetDir)));

    if (!fs::is_directory(targetDir)) {
      IOManager::log("CRITICAL: Target directory does not exist.");
      std::println(stderr, "\n=== ERROR ===");
      std::println(stderr, "Folder does not exist: {}",
                   safe_path_to_string(targetDir));
      Exiv2::XmpParser::terminate();
      return 1;
    }

    NamingExifPlugin plugin;
    if (!plugin.initialize(config)) {
      std::println(stderr, "\n=== ERROR ===");
      std::println(stderr, "Plugin initialization failed.");
      std::println(stderr, "Check naming_exif.log for details.");
      Exiv2::XmpParser::terminate();
      return 1;
    }

    int status = 0;
    if (batch) {
      status = run_batch(config, targetDir, plugin);
    } else {
      IOManager::log("Initializing UI...");
      UI application(config, targetDir, plugin);
      application.run();
    }

    IOManager::log("--- naming_exif Exited Normally ---");

    Exiv2::XmpParser::terminate();
    return status;

  } catch (const std::exception& e) {
    IOManager::log(std::format("FATAL EXCEPTION: {}", e.what()));
    std::println(stderr, "\n=== FATAL ERROR ===");
    std::println(stderr, "Exception: {}", e.what());
    std::println(stderr, "Check naming_exif.log for details.");
    Exiv2::XmpParser::terminate();
    return 1;
  }
}
