#pragma once

#include <functional>
#include <optional>
#include <string_view>

#include "types.hpp"

namespace IOManager {
void initialize_logger();

void set_log_handler(std::function<void(std::string_view)> handler);

void log(std::string_view message);
std::optional<Config> load_config(const fs::path& configPath);

// Moves `file` into the sibling folder `<parent>/<folder_name>`, creating it
// when missing. Refuses to overwrite a file of the same name that is already
// there. Returns the new location on success.
std::optional<fs::path> move_to_processed(const fs::path& file,
                                          std::string_view folder_name);
}  // namespace IOManager
