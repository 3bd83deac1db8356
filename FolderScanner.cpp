#include "FolderScanner.hpp"

#include <algorithm>
#include <format>
#include <utility>

#include "IOManager.hpp"
#include "MetadataFormatter.hpp"
#include "utils.hpp"

FolderScanner::FolderScanner(const Config& config,
                             const FileProcessorPlugin& plugin)
    : m_config(config), m_plugin(plugin) {}

std::vector<fs::path> FolderScanner::collect_candidates(
    const fs::path& targetDir) const {
  std::vector<fs::path> candidates;
  auto it = fs::recursive_directory_iterator(
      targetDir, fs::directory_options::skip_permission_denied);
  for (; it != fs::recursive_directory_iterator(); ++it) {
    if (it->is_directory() &&
        it->path().filename() == m_config.processed_folder) {
      it.disable_recursion_pending();
      continue;
    }
    if (!it->is_regular_file()) continue;

    const std::string ext =
        string_to_lower_ascii(safe_path_to_string(it->path().extension()));
    if (std::find(m_config.extensions.begin(), m_config.extensions.end(),
                  ext) != m_config.extensions.end()) {
      candidates.push_back(it->path());
    }
  }
  std::sort(candidates.begin(), candidates.end());
  return candidates;
}

ScanEntry FolderScanner::inspect_path(const fs::path& path) const {
  ScanEntry entry{path, m_parser.parse(safe_path_to_string(path.filename())),
                  {}, false};
  if (!entry.parsed) {
    entry.violations.push_back(
        "name does not follow "
        "YYYY.MM.DD.HH.NN.SS.X.GGG.SSS.NNNNNN[.SUFFIX...].ext");
    return entry;
  }

  entry.violations = m_validator.validate(*entry.parsed);
  if (!entry.violations.empty()) return entry;

  entry.accepted = m_plugin.can_handle(path);
  if (!entry.accepted) {
    entry.violations.push_back(
        std::format("not accepted by plugin '{}'", m_plugin.name()));
  }
  return entry;
}

std::vector<ScanEntry> FolderScanner::inspect(
    const fs::path& targetDir, std::optional<std::stop_token> stoken) const {
  IOManager::log("Scanning directory for photos...");

  std::vector<fs::path> candidates;
  try {
    candidates = collect_candidates(targetDir);
  } catch (const fs::filesystem_error& e) {
    IOManager::log(std::format(
        "Error during directory scan of '{}': {}. Aborting.",
        safe_path_to_string(targetDir), e.what()));
    return {};
  }

  IOManager::log(
      std::format("Found {} candidate files. Checking names...",
                  candidates.size()));

  std::vector<ScanEntry> entries;
  entries.reserve(candidates.size());
  for (const auto& path : candidates) {
    if (stoken && stoken->stop_requested()) {
      IOManager::log(std::format(
          "Scan cancelled. {} of {} files checked before stop.",
          entries.size(), candidates.size()));
      break;
    }
    entries.push_back(inspect_path(path));
  }
  return entries;
}

std::vector<Action> FolderScanner::generate_plan(
    const fs::path& targetDir, std::optional<std::stop_token> stoken) const {
  std::vector<Action> plan;
  for (auto& entry : inspect(targetDir, stoken)) {
    const std::string filename = safe_path_to_string(entry.path.filename());
    if (!entry.accepted) {
      for (const auto& violation : entry.violations) {
        IOManager::log(std::format("Skipping '{}': {}", filename, violation));
      }
      continue;
    }
    fs::path to =
        entry.path.parent_path() / m_config.processed_folder /
        entry.path.filename();
    plan.push_back(
        Action{std::move(entry.path), std::move(to), describe(*entry.parsed)});
  }

  IOManager::log(
      std::format("Analysis complete. {} files ready.", plan.size()));
  return plan;
}

std::string FolderScanner::describe(const ParsedFilename& parsed) {
  std::string date = MetadataFormatter::format_full_datetime(parsed)
                         .or_else([&] {
                           return MetadataFormatter::format_partial_date(
                               parsed);
                         })
                         .value_or("no date");
  return std::format("{} [{}] {}/{} #{}", date, parsed.modifier, parsed.group,
                     parsed.subgroup, parsed.sequence);
}
