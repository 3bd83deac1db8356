#pragma once

#include "types.hpp"

// Persists a MetadataPlan into a file's embedded metadata, overwriting the
// planned keys in place.
class MetadataWriter {
 public:
  virtual ~MetadataWriter() = default;
  virtual bool write(const fs::path& path, const MetadataPlan& plan) = 0;
};

class Exiv2MetadataWriter : public MetadataWriter {
 public:
  explicit Exiv2MetadataWriter(bool preserve_timestamps = true);

  bool write(const fs::path& path, const MetadataPlan& plan) override;

 private:
  bool m_preserve_timestamps;
};
