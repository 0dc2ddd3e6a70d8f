#ifndef TYPES_HPP
#define TYPES_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using TimePoint = std::chrono::system_clock::time_point;

enum class DateSource {
    EmbeddedMetadata,
    FilenamePattern,
    CreationTime,
    ModificationTime,
    AccessTime,
    Auto
};

enum class DateFormat {
    Year,              ///< 2024
    YearMonth,         ///< 2024-01
    YearMonthDay,      ///< 2024-01-15
    YearQuarter,       ///< 2024-Q1
    YearWeek,          ///< 2024-W03
    MonthYear,         ///< 01-2024
    MonthNameYear,     ///< Jan-2024
    YearMonthName,     ///< 2024-Jan
    YearFullMonthName, ///< 2024-January
    Custom             ///< strftime pattern supplied by the user
};

enum class ConflictStrategy {
    Skip,
    Rename,
    Overwrite,
    Backup,
    SizeCompare,
    DateCompare,
    HashCompare
};

enum class ClassificationMethod {Extension, Mime, Magic, Unknown, Error};

enum class OperationType {Move, Copy};

enum class PreviewMode {Type, Date};

inline std::string to_string(DateSource source) {
    switch (source) {
        case DateSource::EmbeddedMetadata: return "exif";
        case DateSource::FilenamePattern: return "filename";
        case DateSource::CreationTime: return "creation";
        case DateSource::ModificationTime: return "modification";
        case DateSource::AccessTime: return "access";
        case DateSource::Auto: return "auto";
    }
    return "unknown";
}

inline std::string to_string(DateFormat format) {
    switch (format) {
        case DateFormat::Year: return "YYYY";
        case DateFormat::YearMonth: return "YYYY-MM";
        case DateFormat::YearMonthDay: return "YYYY-MM-DD";
        case DateFormat::YearQuarter: return "YYYY-QQ";
        case DateFormat::YearWeek: return "YYYY-WW";
        case DateFormat::MonthYear: return "MM-YYYY";
        case DateFormat::MonthNameYear: return "MMM-YYYY";
        case DateFormat::YearMonthName: return "YYYY-MMM";
        case DateFormat::YearFullMonthName: return "YYYY-MMMM";
        case DateFormat::Custom: return "custom";
    }
    return "unknown";
}

inline std::string to_string(ConflictStrategy strategy) {
    switch (strategy) {
        case ConflictStrategy::Skip: return "skip";
        case ConflictStrategy::Rename: return "rename";
        case ConflictStrategy::Overwrite: return "overwrite";
        case ConflictStrategy::Backup: return "backup";
        case ConflictStrategy::SizeCompare: return "size_compare";
        case ConflictStrategy::DateCompare: return "date_compare";
        case ConflictStrategy::HashCompare: return "hash_compare";
    }
    return "unknown";
}

inline std::string to_string(ClassificationMethod method) {
    switch (method) {
        case ClassificationMethod::Extension: return "extension";
        case ClassificationMethod::Mime: return "mime";
        case ClassificationMethod::Magic: return "magic";
        case ClassificationMethod::Unknown: return "unknown";
        case ClassificationMethod::Error: return "error";
    }
    return "unknown";
}

inline std::string to_string(OperationType type) {
    switch (type) {
        case OperationType::Move: return "move";
        case OperationType::Copy: return "copy";
    }
    return "unknown";
}

inline std::string to_string(PreviewMode mode) {
    switch (mode) {
        case PreviewMode::Type: return "type";
        case PreviewMode::Date: return "date";
    }
    return "unknown";
}

std::optional<DateSource> date_source_from_string(std::string_view value);
std::optional<DateFormat> date_format_from_string(std::string_view value);
std::optional<ConflictStrategy> conflict_strategy_from_string(std::string_view value);
std::optional<OperationType> operation_type_from_string(std::string_view value);
std::optional<PreviewMode> preview_mode_from_string(std::string_view value);

/**
 * @brief A named bucket of files. Groups keep first-seen order, and so do
 * the files inside each group.
 */
struct FileGroup {
    std::string name;
    std::vector<std::string> files;
};

using FileGroups = std::vector<FileGroup>;

struct FileError {
    std::string file;
    std::string message;
};

void append_to_group(FileGroups& groups, const std::string& name, const std::string& file);
const FileGroup* find_group(const FileGroups& groups, const std::string& name);
std::size_t count_grouped_files(const FileGroups& groups);

/**
 * @brief Per-file progress notification: completed fraction in [0, 1], the
 * file just handled and the group (category or date folder) it belongs to.
 */
using ProgressCallback = std::function<void(double fraction,
                                            const std::string& file_path,
                                            const std::string& group)>;

#endif
