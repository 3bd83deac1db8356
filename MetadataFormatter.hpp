#pragma once

#include <optional>
#include <string>

#include "types.hpp"

// Derives the date strings written into image metadata from a validated
// ParsedFilename. Each target field has its own precision rule; none of
// these functions fail, an absent value simply means "do not write".
namespace MetadataFormatter {

inline constexpr const char* kExifDateTimeOriginal =
    "Exif.Photo.DateTimeOriginal";
inline constexpr const char* kXmpIptcDateCreated =
    "Xmp.Iptc4xmpCore.DateCreated";
inline constexpr const char* kXmpPhotoshopDateCreated =
    "Xmp.photoshop.DateCreated";
inline constexpr const char* kXmpIdentifier = "Xmp.dc.identifier";
inline constexpr const char* kXmpDocumentId = "Xmp.xmpMM.DocumentID";

// "YYYY-MM-DD", "YYYY-MM" or "YYYY" depending on which of day and month are
// known. Absent when the year is 00.
std::optional<std::string> format_partial_date(const ParsedFilename& parsed);

// "YYYY-MM-DDThh:mm:ss". Only exact dates (modifier E) get one.
std::optional<std::string> format_full_datetime(const ParsedFilename& parsed);

// EXIF style "YYYY:MM:DD hh:mm:ss", same gate as format_full_datetime.
std::optional<std::string> format_numeric_datetime(
    const ParsedFilename& parsed);

// Random version 4 UUID, e.g. "3f2b8c1e-9d4a-4b7e-a1c2-5e6f7a8b9c0d".
std::string new_identifier();

// Everything the writer needs for one file. A single identifier is
// generated per call and used for every identifier field.
MetadataPlan build_metadata_plan(const ParsedFilename& parsed);

}  // namespace MetadataFormatter
