#ifndef DATE_EXTRACTOR_HPP
#define DATE_EXTRACTOR_HPP

#include "Types.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

/**
 * @brief Every candidate date of one file, extracted once.
 *
 * best_date follows embedded metadata > filename > creation > modification;
 * when none is available it holds the extraction time and best_source is empty.
 */
struct FileDates {
    std::string file_path;
    std::optional<TimePoint> embedded;
    std::optional<TimePoint> filename;
    std::optional<TimePoint> creation;
    std::optional<TimePoint> modification;
    std::optional<TimePoint> access;
    TimePoint best_date;
    std::optional<DateSource> best_source;

    // Auto returns best_date; every other source returns its own candidate.
    std::optional<TimePoint> get(DateSource source) const;
};

// Inclusive on both ends; a missing bound is open.
struct DateRange {
    std::optional<TimePoint> start;
    std::optional<TimePoint> end;

    bool contains(TimePoint date) const;
    std::string describe() const;
};

struct DateGrouping {
    FileGroups groups;
    std::vector<std::pair<std::string, std::size_t>> source_counts; ///< first-seen order
    std::vector<FileError> errors;
};

struct DateAnalysisReport {
    std::size_t total_files{0};
    std::size_t files_with_dates{0};
    std::size_t files_without_dates{0};
    std::optional<TimePoint> earliest;
    std::optional<TimePoint> latest;
    std::map<std::string, std::size_t> date_sources;
    std::map<int, std::size_t> yearly_distribution;
    std::map<std::string, std::size_t> monthly_distribution;
    std::vector<std::string> problematic_files;
};

class DateExtractor {
public:
    static constexpr const char* kDefaultUnknownFolder = "Unknown-Date";

    explicit DateExtractor(std::shared_ptr<spdlog::logger> core_logger = nullptr);

    // Throws ValidationError when the file cannot be stat'ed.
    FileDates extract_dates(const std::string& file_path) const;

    static std::optional<TimePoint> date_from_filename(const std::string& file_name);

    // Throws ConfigurationError for an unusable custom pattern.
    static std::string format_date_folder(TimePoint date,
                                          DateFormat format,
                                          const std::string& custom_format = std::string());
    static void validate_custom_format(const std::string& custom_format);

    /**
     * @brief Buckets files into date folders.
     *
     * Files whose date falls outside @p range are left out entirely. Files
     * without a date for @p source, and files whose extraction failed, go to
     * the unknown-date folder when handle_unknown_dates is on and are
     * dropped otherwise.
     */
    DateGrouping organize_by_date(const std::vector<std::string>& file_paths,
                                  DateSource source,
                                  DateFormat format,
                                  const std::optional<DateRange>& range = std::nullopt,
                                  const std::string& custom_format = std::string()) const;

    DateAnalysisReport analyze_date_distribution(const std::vector<std::string>& file_paths) const;
    DateFormat suggest_format(const std::vector<std::string>& file_paths) const;

    std::vector<std::string> get_files_in_date_range(const std::vector<std::string>& file_paths,
                                                     const std::optional<TimePoint>& start,
                                                     const std::optional<TimePoint>& end,
                                                     DateSource source = DateSource::Auto) const;

    void set_handle_unknown_dates(bool value) { handle_unknown_dates = value; }
    bool get_handle_unknown_dates() const { return handle_unknown_dates; }
    void set_unknown_date_folder(const std::string& value);
    const std::string& get_unknown_date_folder() const { return unknown_date_folder; }

private:
    void log_grouping_stats(const DateGrouping& grouping, std::size_t processed) const;

    std::shared_ptr<spdlog::logger> core_logger;
    bool handle_unknown_dates{true};
    std::string unknown_date_folder{kDefaultUnknownFolder};
};

#endif
