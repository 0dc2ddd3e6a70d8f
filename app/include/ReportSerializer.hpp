#ifndef REPORT_SERIALIZER_HPP
#define REPORT_SERIALIZER_HPP

#include "ConflictResolver.hpp"
#include "DateExtractor.hpp"
#include "FileOrganizer.hpp"
#include "OrganizationResult.hpp"
#include "PathValidator.hpp"

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace ReportSerializer {

nlohmann::json to_json(const OrganizationSummary& summary);
// Summary fields plus the error and skipped-file lists.
nlohmann::json to_json(const OrganizationResult& result);
// A failed preview serializes as {"error": message} only.
nlohmann::json to_json(const PreviewReport& preview);
nlohmann::json to_json(const DateAnalysisReport& report);
nlohmann::json to_json(const SafetyReport& report);
nlohmann::json to_json(const ConflictAnalysis& analysis);
nlohmann::json to_json(const ConflictStats& stats);

// ISO-8601 local time without zone, e.g. 2024-03-10T14:05:00.
std::string format_timestamp(TimePoint time);

/**
 * @brief Writes the combined analysis file: directory, mode, timestamp and
 * whichever previews were produced (null otherwise).
 * @return false when the file cannot be written; the failure is logged.
 */
bool export_analysis(const std::string& output_path,
                     const std::string& directory,
                     const std::string& mode,
                     const std::optional<PreviewReport>& type_preview,
                     const std::optional<PreviewReport>& date_preview);

} // namespace ReportSerializer

#endif
