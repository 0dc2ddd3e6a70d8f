#ifndef EXIF_READER_HPP
#define EXIF_READER_HPP

#include "Types.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace ExifReader {

// jpg/jpeg/tiff/tif/raw/cr2/nef/arw, compared case-insensitively.
bool is_supported_image(const std::filesystem::path& path);

/**
 * @brief Reads the first usable DateTime, DateTimeOriginal or
 * DateTimeDigitized tag from a JPEG (APP1 Exif) or TIFF-based file.
 *
 * Missing tags, unreadable files and malformed structures all yield
 * std::nullopt; this never throws.
 */
std::optional<TimePoint> read_capture_date(const std::filesystem::path& path);

// Parses the EXIF "YYYY:MM:DD HH:MM:SS" form as local time.
std::optional<TimePoint> parse_exif_datetime(const std::string& value);

} // namespace ExifReader

#endif
