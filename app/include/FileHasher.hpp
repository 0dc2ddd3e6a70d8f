#ifndef FILE_HASHER_HPP
#define FILE_HASHER_HPP

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace FileHasher {

constexpr std::size_t kChunkSize = 64 * 1024;

// Streams the file through SHA-256; returns the lowercase hex digest, or
// std::nullopt when the file cannot be read.
std::optional<std::string> sha256_file(const std::filesystem::path& path);

} // namespace FileHasher

#endif
