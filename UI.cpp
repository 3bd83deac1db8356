#include "UI.hpp"

#include <algorithm>
#include <exception>
#include <format>
#include <ftxui/dom/elements.hpp>
#include <optional>
#include <utility>

#include "IOManager.hpp"
#include "MetadataFormatter.hpp"
#include "utils.hpp"

using namespace ftxui;

namespace {

constexpr size_t kMaxLogLines = 100;
constexpr int kDetailsWidth = 48;

Element field_row(const std::string& label,
                  const std::optional<std::string>& value) {
  return hbox({text(label) | dim | size(WIDTH, EQUAL, 12),
               text(value.value_or("-"))});
}

}  // namespace

UI::UI(const Config& config, const fs::path& targetDir,
       FileProcessorPlugin& plugin)
    : m_screen(ScreenInteractive::Fullscreen()),
      m_config(config),
      m_targetDir(targetDir),
      m_plugin(plugin),
      m_scanner(m_config, m_plugin),
      m_status_text("Press 's' to scan.") {}

void UI::on_log_line(std::string_view line) {
  {
    std::scoped_lock lock(m_log_mutex);
    m_log_lines.emplace_back(line);
    while (m_log_lines.size() > kMaxLogLines) {
      m_log_lines.pop_front();
    }
  }
  m_screen.Post(Event::Custom);
}

size_t UI::accepted_count() const {
  return static_cast<size_t>(
      std::count_if(m_entries.begin(), m_entries.end(),
                    [](const ScanEntry& e) { return e.accepted; }));
}

size_t UI::marked_count() const {
  size_t marked = 0;
  for (size_t i = 0; i < m_entries.size(); ++i) {
    if (m_entries[i].accepted && m_marked[i]) ++marked;
  }
  return marked;
}

void UI::show_entries(std::vector<ScanEntry> entries) {
  m_entries = std::move(entries);
  m_marked.assign(m_entries.size(), false);
  for (size_t i = 0; i < m_entries.size(); ++i) {
    m_marked[i] = m_entries[i].accepted;
  }
  m_cursor = 0;

  if (m_entries.empty()) {
    m_status_text = "No photos with a supported extension found.";
  } else {
    m_status_text = "Scan complete.";
  }
}

void UI::start_scan() {
  const bool started = m_task.start([this](std::stop_token stoken) {
    try {
      std::vector<ScanEntry> entries = m_scanner.inspect(m_targetDir, stoken);
      if (stoken.stop_requested()) return;
      m_screen.Post([this, entries = std::move(entries)]() mutable {
        show_entries(std::move(entries));
      });
    } catch (const std::exception& e) {
      IOManager::log(std::format("ERROR during scan: {}", e.what()));
      m_screen.Post([this, message = std::string(e.what())] {
        m_status_text = "Scan failed: " + message;
      });
    }
  });
  if (started) m_status_text = "Scanning...";
}

void UI::start_write() {
  std::vector<fs::path> files;
  for (size_t i = 0; i < m_entries.size(); ++i) {
    if (m_entries[i].accepted && m_marked[i]) {
      files.push_back(m_entries[i].path);
    }
  }
  if (files.empty()) {
    m_status_text = "Nothing marked to write.";
    return;
  }

  const bool started = m_task.start([this, files = std::move(files)](
                                        std::stop_token stoken) {
    try {
      size_t written = 0;
      for (const auto& file : files) {
        if (stoken.stop_requested()) {
          IOManager::log("Writing cancelled by user.");
          return;
        }
        if (m_plugin.process(file, m_config)) ++written;
      }
      IOManager::log(std::format("Metadata written to {} of {} files.",
                                 written, files.size()));

      // Processed files have moved away; show what is left.
      std::vector<ScanEntry> entries = m_scanner.inspect(m_targetDir, stoken);
      m_screen.Post([this, written, total = files.size(),
                     entries = std::move(entries)]() mutable {
        show_entries(std::move(entries));
        m_status_text =
            std::format("Metadata written to {} of {} files.", written, total);
      });
    } catch (const std::exception& e) {
      IOManager::log(std::format("ERROR while writing: {}", e.what()));
      m_screen.Post([this, message = std::string(e.what())] {
        m_status_text = "Writing failed: " + message;
      });
    }
  });
  if (started) m_status_text = "Writing metadata...";
}

bool UI::handle_event(const Event& event) {
  if (event == Event::Character('q') || event == Event::Escape) {
    m_task.request_stop();
    m_screen.Exit();
    return true;
  }
  if (event.is_mouse() || m_task.busy()) return false;

  if (event == Event::Character('s')) {
    start_scan();
  } else if (event == Event::Character('w') || event == Event::Return) {
    start_write();
  } else if (m_entries.empty()) {
    return false;
  } else if (event == Event::ArrowUp) {
    m_cursor = std::max(0, m_cursor - 1);
  } else if (event == Event::ArrowDown) {
    m_cursor = std::min(static_cast<int>(m_entries.size()) - 1, m_cursor + 1);
  } else if (event == Event::Character(' ')) {
    if (m_entries[m_cursor].accepted) {
      m_marked[m_cursor] = !m_marked[m_cursor];
    }
  } else if (event == Event::Character('a')) {
    // Mark every accepted file, or clear when all are already marked.
    const bool mark = marked_count() < accepted_count();
    for (size_t i = 0; i < m_entries.size(); ++i) {
      m_marked[i] = mark && m_entries[i].accepted;
    }
  } else {
    return false;
  }
  return true;
}

Element UI::render_file_list() const {
  if (m_entries.empty()) {
    return text(m_status_text) | center;
  }

  Elements rows;
  for (size_t i = 0; i < m_entries.size(); ++i) {
    const ScanEntry& entry = m_entries[i];
    std::string mark = " !  ";
    if (entry.accepted) mark = m_marked[i] ? "[x] " : "[ ] ";

    Element row = text(
        mark + safe_path_to_string(entry.path.lexically_relative(m_targetDir)));
    if (!entry.accepted) row = row | color(Color::Red);
    if (static_cast<int>(i) == m_cursor) row = row | inverted | focus;
    rows.push_back(std::move(row));
  }
  return vbox(std::move(rows)) | vscroll_indicator | frame;
}

Element UI::render_details() const {
  if (m_entries.empty()) return filler();

  const ScanEntry& entry = m_entries[m_cursor];
  Elements lines;
  lines.push_back(paragraph(safe_path_to_string(entry.path.filename())) |
                  bold);
  lines.push_back(separator());

  if (entry.parsed) {
    const ParsedFilename& p = *entry.parsed;
    lines.push_back(field_row("Modifier", p.modifier));
    lines.push_back(field_row("Group", p.group + "/" + p.subgroup));
    lines.push_back(field_row("Sequence", p.sequence));
    lines.push_back(
        field_row("Date", MetadataFormatter::format_partial_date(p)));
    lines.push_back(
        field_row("Date/time", MetadataFormatter::format_full_datetime(p)));
    lines.push_back(
        field_row("EXIF", MetadataFormatter::format_numeric_datetime(p)));
    lines.push_back(separator());
  }

  if (entry.accepted) {
    lines.push_back(text("Ready to write") | color(Color::Green));
  } else {
    lines.push_back(text("Rejected") | bold | color(Color::Red));
    for (const auto& violation : entry.violations) {
      lines.push_back(paragraph("- " + violation));
    }
  }
  return vbox(std::move(lines)) | vscroll_indicator | yframe;
}

Element UI::render_log() {
  Elements lines;
  {
    std::scoped_lock lock(m_log_mutex);
    for (const auto& line : m_log_lines) {
      lines.push_back(text(line));
    }
  }
  // Keep the newest line in view.
  return vbox(std::move(lines)) | focusPositionRelative(0.f, 1.f) |
         vscroll_indicator | frame | flex;
}

Element UI::render() {
  const bool busy = m_task.busy();
  const size_t accepted = accepted_count();

  auto header = hbox({text(" Naming EXIF v0.1.0 ") | bold, filler(),
                      text(safe_path_to_string(m_targetDir) + " ")}) |
                color(Color::White) | bgcolor(Color::Blue);

  auto body = hbox({render_file_list() | flex, separator(),
                    render_details() | size(WIDTH, EQUAL, kDetailsWidth)});

  auto status = hbox(
      {text(" " + std::string(busy ? "[busy] " : "") + m_status_text),
       filler(),
       text(std::format("{} ready, {} rejected, {} marked ", accepted,
                        m_entries.size() - accepted, marked_count()))});

  auto keys =
      text(" s scan  w/Enter write marked  Space mark  a mark all  q quit") |
      dim;

  auto log = vbox({text("Log") | bold, render_log()}) |
             size(HEIGHT, EQUAL, 10);

  return vbox({header, body | flex, separator(), status, keys, separator(),
               log}) |
         border;
}

void UI::run() {
  IOManager::set_log_handler(
      [this](std::string_view line) { on_log_line(line); });

  try {
    auto view = Renderer([this] { return render(); }) |
                CatchEvent([this](Event event) { return handle_event(event); });

    start_scan();
    m_screen.Loop(view);
  } catch (const std::exception& e) {
    IOManager::log(std::format("CRITICAL: Exception in UI::run(): {}",
                               e.what()));
    m_task.request_stop();
    m_task.wait();
    IOManager::set_log_handler(nullptr);
    throw;
  }

  IOManager::log("UI closed. Waiting for background work to stop...");
  m_task.request_stop();
  m_task.wait();
  IOManager::set_log_handler(nullptr);
}
