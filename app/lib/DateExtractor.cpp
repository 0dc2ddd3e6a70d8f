#include "DateExtractor.hpp"
#include "Errors.hpp"
#include "ExifReader.hpp"
#include "Utils.hpp"

#include <algorithm>
#include <chrono>
#include <regex>
#include <string_view>

#include <fmt/format.h>

namespace {

constexpr std::size_t kLargestFoldersLogged = 5;
constexpr int kDaysPerMonthSpan = 31;
constexpr int kDaysPerThreeYearSpan = 365 * 3;

// Tried in order against the bare file name; the first pattern yielding a
// valid calendar date wins.
const std::vector<std::regex>& filename_patterns()
{
    static const std::vector<std::regex> patterns = {
        std::regex(R"((\d{4})-(\d{2})-(\d{2}))"),                         // YYYY-MM-DD
        std::regex(R"((\d{4})(\d{2})(\d{2}))"),                           // YYYYMMDD
        std::regex(R"((\d{2})-(\d{2})-(\d{4}))"),                         // MM-DD-YYYY
        std::regex(R"((\d{2})(\d{2})(\d{4}))"),                           // MMDDYYYY
        std::regex(R"((\d{4})-(\d{2}))"),                                 // YYYY-MM
        std::regex(R"((\d{4})(\d{2}))"),                                  // YYYYMM
        std::regex(R"(IMG_(\d{4})(\d{2})(\d{2}))"),                       // IMG_YYYYMMDD
        std::regex(R"((\d{4})-(\d{2})-(\d{2})_(\d{2})-(\d{2})-(\d{2}))"), // YYYY-MM-DD_HH-MM-SS
    };
    return patterns;
}

std::optional<TimePoint> date_from_match(const std::smatch& match)
{
    const auto group = [&](std::size_t index) { return std::stoi(match[index].str()); };
    std::optional<TimePoint> date;
    int year = 0;
    switch (match.size() - 1) {
        case 3:
            if (match[1].length() == 4) {
                year = group(1);
                date = Utils::make_local_time(year, group(2), group(3));
            } else {
                // US convention for month-first forms
                year = group(3);
                date = Utils::make_local_time(year, group(1), group(2));
            }
            break;
        case 2:
            year = group(1);
            date = Utils::make_local_time(year, group(2), 1);
            break;
        case 6:
            year = group(1);
            date = Utils::make_local_time(year, group(2), group(3), group(4), group(5), group(6));
            break;
        default:
            break;
    }
    if (year < 1) {
        return std::nullopt;
    }
    return date;
}

void bump(std::vector<std::pair<std::string, std::size_t>>& counts, const std::string& key)
{
    auto it = std::find_if(counts.begin(), counts.end(), [&](const auto& entry) { return entry.first == key; });
    if (it == counts.end()) {
        counts.emplace_back(key, 1);
    } else {
        ++it->second;
    }
}

} // namespace

std::optional<TimePoint> FileDates::get(DateSource source) const
{
    switch (source) {
        case DateSource::Auto: return best_date;
        case DateSource::EmbeddedMetadata: return embedded;
        case DateSource::FilenamePattern: return filename;
        case DateSource::CreationTime: return creation;
        case DateSource::ModificationTime: return modification;
        case DateSource::AccessTime: return access;
    }
    return best_date;
}

bool DateRange::contains(TimePoint date) const
{
    if (start && date < *start) {
        return false;
    }
    if (end && date > *end) {
        return false;
    }
    return true;
}

std::string DateRange::describe() const
{
    const std::string from = start ? Utils::format_time(*start, "%Y-%m-%d") : "open";
    const std::string to = end ? Utils::format_time(*end, "%Y-%m-%d") : "open";
    return fmt::format("[{} to {}]", from, to);
}

DateExtractor::DateExtractor(std::shared_ptr<spdlog::logger> core_logger)
    : core_logger(std::move(core_logger)) {}

void DateExtractor::set_unknown_date_folder(const std::string& value)
{
    const std::string folder = Utils::trim_copy(value);
    if (folder.empty() || folder.find_first_of("/\\") != std::string::npos) {
        throw ConfigurationError(fmt::format("Invalid unknown-date folder name '{}'", value));
    }
    unknown_date_folder = folder;
}

std::optional<TimePoint> DateExtractor::date_from_filename(const std::string& file_name)
{
    for (const auto& pattern : filename_patterns()) {
        std::smatch match;
        if (!std::regex_search(file_name, match, pattern)) {
            continue;
        }
        if (auto date = date_from_match(match)) {
            return date;
        }
    }
    return std::nullopt;
}

FileDates DateExtractor::extract_dates(const std::string& file_path) const
{
    const auto path = Utils::utf8_to_path(file_path);
    const auto times = Utils::read_file_times(path);
    if (!times) {
        throw ValidationError(fmt::format("Cannot read file dates: {}", file_path));
    }

    FileDates dates;
    dates.file_path = file_path;
    dates.creation = times->creation;
    dates.modification = times->modification;
    dates.access = times->access;
    dates.filename = date_from_filename(Utils::path_to_utf8(path.filename()));
    if (ExifReader::is_supported_image(path)) {
        dates.embedded = ExifReader::read_capture_date(path);
    }

    if (dates.embedded) {
        dates.best_date = *dates.embedded;
        dates.best_source = DateSource::EmbeddedMetadata;
    } else if (dates.filename) {
        dates.best_date = *dates.filename;
        dates.best_source = DateSource::FilenamePattern;
    } else if (dates.creation) {
        dates.best_date = *dates.creation;
        dates.best_source = DateSource::CreationTime;
    } else if (dates.modification) {
        dates.best_date = *dates.modification;
        dates.best_source = DateSource::ModificationTime;
    } else {
        dates.best_date = std::chrono::system_clock::now();
    }
    return dates;
}

void DateExtractor::validate_custom_format(const std::string& custom_format)
{
    if (Utils::trim_copy(custom_format).empty()) {
        throw ConfigurationError("Custom date format requires a non-empty pattern");
    }
    if (custom_format.find_first_of("/\\") != std::string::npos) {
        throw ConfigurationError(fmt::format("Custom date format '{}' must not contain path separators",
                                             custom_format));
    }
    if (custom_format.find('%') == std::string::npos) {
        throw ConfigurationError(fmt::format("Custom date format '{}' has no date fields", custom_format));
    }
}

std::string DateExtractor::format_date_folder(TimePoint date, DateFormat format, const std::string& custom_format)
{
    const auto local = Utils::to_local_tm(date);
    const int year = local ? local->tm_year + 1900 : 1970;
    const int month = local ? local->tm_mon + 1 : 1;

    switch (format) {
        case DateFormat::Year: return Utils::format_time(date, "%Y");
        case DateFormat::YearMonth: return Utils::format_time(date, "%Y-%m");
        case DateFormat::YearMonthDay: return Utils::format_time(date, "%Y-%m-%d");
        case DateFormat::YearQuarter: return fmt::format("{}-Q{}", year, (month - 1) / 3 + 1);
        case DateFormat::YearWeek: return fmt::format("{}-W{}", year, Utils::format_time(date, "%V"));
        case DateFormat::MonthYear: return Utils::format_time(date, "%m-%Y");
        case DateFormat::MonthNameYear: return Utils::format_time(date, "%b-%Y");
        case DateFormat::YearMonthName: return Utils::format_time(date, "%Y-%b");
        case DateFormat::YearFullMonthName: return Utils::format_time(date, "%Y-%B");
        case DateFormat::Custom: {
            validate_custom_format(custom_format);
            std::string folder = Utils::format_time(date, custom_format);
            if (Utils::trim_copy(folder).empty()) {
                throw ConfigurationError(fmt::format("Custom date format '{}' produced an empty folder name",
                                                     custom_format));
            }
            return folder;
        }
    }
    return Utils::format_time(date, "%Y-%m-%d");
}

DateGrouping DateExtractor::organize_by_date(const std::vector<std::string>& file_paths,
                                             DateSource source,
                                             DateFormat format,
                                             const std::optional<DateRange>& range,
                                             const std::string& custom_format) const
{
    if (format == DateFormat::Custom) {
        validate_custom_format(custom_format);
    }

    DateGrouping grouping;
    std::size_t processed = 0;

    if (core_logger) {
        core_logger->info("Organizing {} files by date", file_paths.size());
        core_logger->info("Date source: {}, Format: {}", to_string(source), to_string(format));
    }

    for (const auto& file_path : file_paths) {
        try {
            const FileDates dates = extract_dates(file_path);
            const auto selected = dates.get(source);

            std::string source_used = "unknown";
            if (source == DateSource::Auto) {
                if (dates.best_source) {
                    source_used = to_string(*dates.best_source);
                }
            } else if (selected) {
                source_used = to_string(source);
            }
            bump(grouping.source_counts, source_used);

            if (range && selected && !range->contains(*selected)) {
                if (core_logger) {
                    core_logger->debug("File {} outside date range {}", file_path, range->describe());
                }
                continue;
            }

            std::string folder;
            if (selected) {
                folder = format_date_folder(*selected, format, custom_format);
            } else if (handle_unknown_dates) {
                folder = unknown_date_folder;
            } else {
                continue;
            }

            append_to_group(grouping.groups, folder, file_path);
            ++processed;
            if (core_logger) {
                core_logger->debug("{} -> {} ({})", file_path, folder,
                                   selected ? Utils::format_time(*selected, "%Y-%m-%d %H:%M") : "no date");
            }
        } catch (const std::exception& e) {
            if (core_logger) {
                core_logger->error("Error processing {}: {}", file_path, e.what());
            }
            grouping.errors.push_back(FileError{file_path, e.what()});
            if (handle_unknown_dates) {
                append_to_group(grouping.groups, unknown_date_folder, file_path);
            }
        }
    }

    log_grouping_stats(grouping, processed);
    return grouping;
}

void DateExtractor::log_grouping_stats(const DateGrouping& grouping, std::size_t processed) const
{
    if (!core_logger) {
        return;
    }
    core_logger->info("Date organization complete: {} date folders, {} files",
                      grouping.groups.size(), count_grouped_files(grouping.groups));

    core_logger->info("Date sources used:");
    for (const auto& [source, count] : grouping.source_counts) {
        const double percentage = processed > 0
            ? static_cast<double>(count) * 100.0 / static_cast<double>(processed)
            : 0.0;
        core_logger->info("   {}: {} files ({:.1f}%)", source, count, percentage);
    }

    std::vector<const FileGroup*> largest;
    for (const auto& group : grouping.groups) {
        largest.push_back(&group);
    }
    std::stable_sort(largest.begin(), largest.end(), [](const FileGroup* lhs, const FileGroup* rhs) {
        return lhs->files.size() > rhs->files.size();
    });
    if (largest.size() > kLargestFoldersLogged) {
        largest.resize(kLargestFoldersLogged);
    }
    core_logger->info("Largest date folders:");
    for (const auto* group : largest) {
        core_logger->info("   {}: {} files", group->name, group->files.size());
    }
}

DateAnalysisReport DateExtractor::analyze_date_distribution(const std::vector<std::string>& file_paths) const
{
    DateAnalysisReport report;
    report.total_files = file_paths.size();

    for (const auto& file_path : file_paths) {
        try {
            const FileDates dates = extract_dates(file_path);
            if (!dates.best_source) {
                ++report.files_without_dates;
                report.problematic_files.push_back(file_path);
                continue;
            }

            ++report.files_with_dates;
            ++report.date_sources[to_string(*dates.best_source)];

            const auto local = Utils::to_local_tm(dates.best_date);
            if (local) {
                ++report.yearly_distribution[local->tm_year + 1900];
                ++report.monthly_distribution[fmt::format("{}-{:02d}", local->tm_year + 1900, local->tm_mon + 1)];
            }

            if (!report.earliest || dates.best_date < *report.earliest) {
                report.earliest = dates.best_date;
            }
            if (!report.latest || dates.best_date > *report.latest) {
                report.latest = dates.best_date;
            }
        } catch (const ValidationError& e) {
            ++report.files_without_dates;
            report.problematic_files.push_back(fmt::format("{}: {}", file_path, e.what()));
        }
    }
    return report;
}

DateFormat DateExtractor::suggest_format(const std::vector<std::string>& file_paths) const
{
    const auto report = analyze_date_distribution(file_paths);
    if (report.files_with_dates == 0 || !report.earliest || !report.latest) {
        return DateFormat::YearMonthDay;
    }

    const auto span_days = std::chrono::duration_cast<std::chrono::hours>(*report.latest - *report.earliest).count() / 24;
    if (span_days <= kDaysPerMonthSpan) {
        return DateFormat::YearMonthDay;
    }
    if (span_days <= kDaysPerThreeYearSpan) {
        return DateFormat::YearMonth;
    }
    return DateFormat::Year;
}

std::vector<std::string> DateExtractor::get_files_in_date_range(const std::vector<std::string>& file_paths,
                                                                const std::optional<TimePoint>& start,
                                                                const std::optional<TimePoint>& end,
                                                                DateSource source) const
{
    const DateRange range{start, end};
    std::vector<std::string> filtered;

    if (core_logger) {
        core_logger->info("Filtering {} files by date range: {}", file_paths.size(), range.describe());
    }

    for (const auto& file_path : file_paths) {
        try {
            const auto selected = extract_dates(file_path).get(source);
            if (selected && range.contains(*selected)) {
                filtered.push_back(file_path);
            }
        } catch (const ValidationError& e) {
            if (core_logger) {
                core_logger->warn("Error filtering {}: {}", file_path, e.what());
            }
        }
    }

    if (core_logger) {
        core_logger->info("Found {} files in date range", filtered.size());
    }
    return filtered;
}
