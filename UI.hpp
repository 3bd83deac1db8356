#pragma once

#include <deque>
#include <ftxui/component/component.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "BackgroundTask.hpp"
#include "FolderScanner.hpp"

// Terminal front end. Lists every candidate photo under the target folder,
// shows the dates its name encodes or the rules it breaks, and writes
// metadata into the accepted files the user marks.
class UI {
 public:
  UI(const Config& config, const fs::path& targetDir,
     FileProcessorPlugin& plugin);
  void run();

 private:
  void start_scan();
  void start_write();
  void show_entries(std::vector<ScanEntry> entries);
  bool handle_event(const ftxui::Event& event);

  ftxui::Element render();
  ftxui::Element render_file_list() const;
  ftxui::Element render_details() const;
  ftxui::Element render_log();

  void on_log_line(std::string_view line);
  size_t accepted_count() const;
  size_t marked_count() const;

  ftxui::ScreenInteractive m_screen;
  Config m_config;
  const fs::path m_targetDir;
  FileProcessorPlugin& m_plugin;
  FolderScanner m_scanner;

  // Touched only on the UI thread; workers hand results over via Post().
  std::vector<ScanEntry> m_entries;
  std::vector<bool> m_marked;
  int m_cursor = 0;
  std::string m_status_text;

  std::mutex m_log_mutex;
  std::deque<std::string> m_log_lines;

  // Last member: its thread is joined before the state above goes away.
  BackgroundTask m_task;
};
