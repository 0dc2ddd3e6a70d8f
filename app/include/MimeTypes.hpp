#ifndef MIME_TYPES_HPP
#define MIME_TYPES_HPP

#include <cstddef>
#include <optional>
#include <string>

namespace MimeTypes {

constexpr std::size_t kSignatureProbeSize = 16;

// Guesses a MIME type from the file name only (no content sniffing).
std::optional<std::string> guess_from_filename(const std::string& file_name);

// Maps a MIME type onto one of the built-in categories that carry MIME lists.
std::optional<std::string> category_for_mime(const std::string& mime_type);

/**
 * @brief Matches the leading bytes of a file against known binary signatures.
 *
 * @param header Up to kSignatureProbeSize bytes read from the start of the file.
 * @return Category name, or std::nullopt when nothing matches. ISO base media
 *         files ("ftyp" at offset 4) map to Videos.
 */
std::optional<std::string> category_for_signature(const std::string& header);

} // namespace MimeTypes

#endif
