#pragma once

#include <string>

#include "types.hpp"

// Contract between the file-processing host and a plugin. The host asks
// can_handle() for every candidate file and calls process() for the ones a
// plugin accepts. initialize() runs once before any processing and its
// config governs both can_handle() and process().
class FileProcessorPlugin {
 public:
  virtual ~FileProcessorPlugin() = default;

  virtual std::string name() const = 0;
  virtual std::string version() const = 0;
  virtual bool can_handle(const fs::path& path) const = 0;
  virtual bool initialize(const Config& config) = 0;
  virtual bool process(const fs::path& path, const Config& config) = 0;
};
