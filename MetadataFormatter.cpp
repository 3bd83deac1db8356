#include "MetadataFormatter.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <format>
#include <functional>
#include <random>

namespace {

bool is_exact(const ParsedFilename& p) { return p.modifier == "E"; }

// Seeds every word of the engine state from the OS entropy source, so no
// two threads or runs share an identifier stream by drawing the same seed.
std::mt19937_64 make_seeded_engine() {
  std::random_device device;
  std::array<std::uint32_t, std::mt19937_64::state_size * 2> words;
  std::generate(words.begin(), words.end(), std::ref(device));
  std::seed_seq seq(words.begin(), words.end());
  return std::mt19937_64(seq);
}

std::mt19937_64& thread_rng() {
  thread_local std::mt19937_64 rng = make_seeded_engine();
  return rng;
}

}  // namespace

std::optional<std::string> MetadataFormatter::format_partial_date(
    const ParsedFilename& parsed) {
  if (parsed.year == 0) return std::nullopt;

  if (parsed.month == 0) return std::format("{:04d}", parsed.year);

  if (parsed.day == 0) {
    return std::format("{:04d}-{:02d}", parsed.year, parsed.month);
  }

  return std::format("{:04d}-{:02d}-{:02d}", parsed.year, parsed.month,
                     parsed.day);
}

std::optional<std::string> MetadataFormatter::format_full_datetime(
    const ParsedFilename& parsed) {
  if (!is_exact(parsed)) return std::nullopt;
  return std::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}", parsed.year,
                     parsed.month, parsed.day, parsed.hour, parsed.minute,
                     parsed.second);
}

std::optional<std::string> MetadataFormatter::format_numeric_datetime(
    const ParsedFilename& parsed) {
  if (!is_exact(parsed)) return std::nullopt;
  return std::format("{:04d}:{:02d}:{:02d} {:02d}:{:02d}:{:02d}", parsed.year,
                     parsed.month, parsed.day, parsed.hour, parsed.minute,
                     parsed.second);
}

std::string MetadataFormatter::new_identifier() {
  auto& rng = thread_rng();
  std::array<uint8_t, 16> bytes;
  for (size_t i = 0; i < bytes.size(); i += 8) {
    uint64_t word = rng();
    for (size_t b = 0; b < 8; ++b) {
      bytes[i + b] = static_cast<uint8_t>(word >> (b * 8));
    }
  }

  // RFC 4122: version 4, variant 10xx.
  bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
  bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);

  std::string out;
  out.reserve(36);
  for (size_t i = 0; i < bytes.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) out += '-';
    out += std::format("{:02x}", bytes[i]);
  }
  return out;
}

MetadataPlan MetadataFormatter::build_metadata_plan(
    const ParsedFilename& parsed) {
  MetadataPlan plan;

  const std::string identifier = new_identifier();
  plan.xmp[kXmpIdentifier] = identifier;
  plan.xmp[kXmpDocumentId] = identifier;

  if (auto numeric = format_numeric_datetime(parsed)) {
    plan.exif[kExifDateTimeOriginal] = *numeric;
  }
  if (auto partial = format_partial_date(parsed)) {
    plan.xmp[kXmpIptcDateCreated] = *partial;
  }
  if (auto full = format_full_datetime(parsed)) {
    plan.xmp[kXmpPhotoshopDateCreated] = *full;
  }

  return plan;
}
