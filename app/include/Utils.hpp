#ifndef UTILS_HPP
#define UTILS_HPP

#include "Types.hpp"

#include <cstddef>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <optional>
#include <string>

namespace Utils {

std::string to_lower_copy(std::string value);
std::string to_upper_copy(std::string value);
std::string trim_copy(std::string value);

std::string path_to_utf8(const std::filesystem::path& path);
std::filesystem::path utf8_to_path(const std::string& value);

// Dot-prefixed names are hidden by convention on every platform we scan.
bool is_hidden_name(const std::string& file_name);

struct FileTimes {
    TimePoint creation;
    TimePoint modification;
    TimePoint access;
};

// Returns std::nullopt when the path cannot be stat'ed.
std::optional<FileTimes> read_file_times(const std::filesystem::path& path);
bool set_file_times(const std::filesystem::path& path, TimePoint modification, TimePoint access);

// Builds a local wall-clock time. Rejects impossible calendar dates (month 13, Feb 30).
std::optional<TimePoint> make_local_time(int year, int month, int day,
                                         int hour = 0, int minute = 0, int second = 0);
std::optional<std::tm> to_local_tm(TimePoint time);
std::string format_time(TimePoint time, const std::string& pattern);
std::string timestamp_for_filename(TimePoint time, bool with_millis = false);

double round_to(double value, int decimals);
double bytes_to_mb(std::uintmax_t bytes);
std::string hex_encode(const unsigned char* data, std::size_t size);

} // namespace Utils

#endif
