#include "Utils.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdio>

#include <sys/stat.h>
#if defined(_WIN32)
#include <sys/utime.h>
#else
#include <fcntl.h>
#endif

namespace {

TimePoint from_timespec(std::time_t seconds, long nanoseconds) {
    return TimePoint{} + std::chrono::seconds(seconds)
        + std::chrono::duration_cast<TimePoint::duration>(std::chrono::nanoseconds(nanoseconds));
}

} // namespace

namespace Utils {

std::string to_lower_copy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::string to_upper_copy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return value;
}

std::string trim_copy(std::string value) {
    auto not_space = [](unsigned char ch) { return !std::isspace(ch); };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), not_space));
    value.erase(std::find_if(value.rbegin(), value.rend(), not_space).base(), value.end());
    return value;
}

std::string path_to_utf8(const std::filesystem::path& path) {
    const auto u8 = path.u8string();
    return std::string(u8.begin(), u8.end());
}

std::filesystem::path utf8_to_path(const std::string& value) {
    return std::filesystem::path(std::u8string(value.begin(), value.end()));
}

bool is_hidden_name(const std::string& file_name) {
    return !file_name.empty() && file_name.front() == '.';
}

std::optional<FileTimes> read_file_times(const std::filesystem::path& path) {
#if defined(_WIN32)
    struct _stat64 info {};
    if (_wstat64(path.c_str(), &info) != 0) {
        return std::nullopt;
    }
    return FileTimes{from_timespec(info.st_ctime, 0),
                     from_timespec(info.st_mtime, 0),
                     from_timespec(info.st_atime, 0)};
#else
    struct stat info {};
    if (::stat(path.c_str(), &info) != 0) {
        return std::nullopt;
    }
#if defined(__APPLE__)
    return FileTimes{from_timespec(info.st_ctimespec.tv_sec, info.st_ctimespec.tv_nsec),
                     from_timespec(info.st_mtimespec.tv_sec, info.st_mtimespec.tv_nsec),
                     from_timespec(info.st_atimespec.tv_sec, info.st_atimespec.tv_nsec)};
#else
    return FileTimes{from_timespec(info.st_ctim.tv_sec, info.st_ctim.tv_nsec),
                     from_timespec(info.st_mtim.tv_sec, info.st_mtim.tv_nsec),
                     from_timespec(info.st_atim.tv_sec, info.st_atim.tv_nsec)};
#endif
#endif
}

bool set_file_times(const std::filesystem::path& path, TimePoint modification, TimePoint access) {
#if defined(_WIN32)
    struct _utimbuf times {};
    times.actime = std::chrono::system_clock::to_time_t(access);
    times.modtime = std::chrono::system_clock::to_time_t(modification);
    return _wutime(path.c_str(), &times) == 0;
#else
    const auto to_timespec = [](TimePoint time) {
        const auto since_epoch = time.time_since_epoch();
        const auto secs = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
        const auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch - secs);
        struct timespec spec {};
        spec.tv_sec = static_cast<std::time_t>(secs.count());
        spec.tv_nsec = static_cast<long>(nanos.count());
        return spec;
    };
    const std::array<struct timespec, 2> times{to_timespec(access), to_timespec(modification)};
    return ::utimensat(AT_FDCWD, path.c_str(), times.data(), 0) == 0;
#endif
}

std::optional<TimePoint> make_local_time(int year, int month, int day,
                                         int hour, int minute, int second) {
    const std::chrono::year_month_day ymd{std::chrono::year{year},
                                          std::chrono::month{static_cast<unsigned>(month)},
                                          std::chrono::day{static_cast<unsigned>(day)}};
    if (month < 1 || day < 1 || !ymd.ok()) {
        return std::nullopt;
    }
    if (hour < 0 || hour > 23 || minute < 0 || minute > 59 || second < 0 || second > 59) {
        return std::nullopt;
    }

    std::tm local{};
    local.tm_year = year - 1900;
    local.tm_mon = month - 1;
    local.tm_mday = day;
    local.tm_hour = hour;
    local.tm_min = minute;
    local.tm_sec = second;
    local.tm_isdst = -1;
    const std::time_t seconds = std::mktime(&local);
    if (seconds == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(seconds);
}

std::optional<std::tm> to_local_tm(TimePoint time) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(time);
    std::tm local{};
#if defined(_WIN32)
    if (localtime_s(&local, &seconds) != 0) {
        return std::nullopt;
    }
#else
    if (localtime_r(&seconds, &local) == nullptr) {
        return std::nullopt;
    }
#endif
    return local;
}

std::string format_time(TimePoint time, const std::string& pattern) {
    const auto local = to_local_tm(time);
    if (!local || pattern.empty()) {
        return std::string();
    }
    std::array<char, 256> buffer{};
    const std::size_t written = std::strftime(buffer.data(), buffer.size(), pattern.c_str(), &*local);
    return std::string(buffer.data(), written);
}

std::string timestamp_for_filename(TimePoint time, bool with_millis) {
    std::string stamp = format_time(time, "%Y%m%d_%H%M%S");
    if (with_millis) {
        const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
            time.time_since_epoch()).count() % 1000;
        std::array<char, 8> suffix{};
        std::snprintf(suffix.data(), suffix.size(), "_%03d", static_cast<int>(millis));
        stamp += suffix.data();
    }
    return stamp;
}

double round_to(double value, int decimals) {
    const double factor = std::pow(10.0, decimals);
    return std::round(value * factor) / factor;
}

double bytes_to_mb(std::uintmax_t bytes) {
    return round_to(static_cast<double>(bytes) / (1024.0 * 1024.0), 2);
}

std::string hex_encode(const unsigned char* data, std::size_t size) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(size * 2);
    for (std::size_t i = 0; i < size; ++i) {
        out.push_back(kDigits[data[i] >> 4]);
        out.push_back(kDigits[data[i] & 0x0F]);
    }
    return out;
}

} // namespace Utils
