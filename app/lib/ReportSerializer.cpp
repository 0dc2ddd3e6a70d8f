#include "ReportSerializer.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <system_error>

using json = nlohmann::json;

namespace ReportSerializer {

namespace {

json optional_time(const std::optional<TimePoint>& time)
{
    return time ? json(format_timestamp(*time)) : json(nullptr);
}

json groups_to_json(const FileGroups& groups)
{
    json mappings = json::object();
    for (const auto& group : groups) {
        mappings[group.name] = group.files;
    }
    return mappings;
}

} // namespace

std::string format_timestamp(TimePoint time)
{
    return Utils::format_time(time, "%Y-%m-%dT%H:%M:%S");
}

json to_json(const OrganizationSummary& summary)
{
    json categories = json::object();
    for (const auto& [name, tally] : summary.processed_categories) {
        categories[name] = {{"count", tally.count}, {"size", tally.size}};
    }

    return {
        {"total_files", summary.total_files},
        {"processed_files", summary.processed_files},
        {"skipped_files", summary.skipped_files},
        {"error_files", summary.error_files},
        {"success_rate", summary.success_rate},
        {"categories_created", summary.categories_created},
        {"conflicts_resolved", summary.conflicts_resolved},
        {"total_size_mb", summary.total_size_mb},
        {"operation_time", summary.operation_time},
        {"dry_run", summary.dry_run},
        {"stopped", summary.stopped},
        {"processed_categories", categories}
    };
}

json to_json(const OrganizationResult& result)
{
    json out = to_json(result.get_summary());

    json errors = json::array();
    for (const auto& error : result.errors) {
        errors.push_back({{"file", error.file}, {"error", error.message}});
    }
    json skipped = json::array();
    for (const auto& entry : result.skipped) {
        skipped.push_back({{"file", entry.file}, {"reason", entry.reason}});
    }
    out["errors"] = errors;
    out["skipped"] = skipped;
    return out;
}

json to_json(const PreviewReport& preview)
{
    if (preview.error) {
        return {{"error", *preview.error}};
    }

    json categories = json::object();
    for (const auto& group : preview.groups) {
        categories[group.name] = {
            {"file_count", group.file_count},
            {"total_size_bytes", group.total_size_bytes},
            {"total_size_mb", group.total_size_mb}
        };
    }

    return {
        {"mode", to_string(preview.mode)},
        {"total_files", preview.total_files},
        {"estimated_folders", preview.estimated_folders},
        {"categories", categories},
        {"file_mappings", groups_to_json(preview.file_mappings)}
    };
}

json to_json(const DateAnalysisReport& report)
{
    json yearly = json::object();
    for (const auto& [year, count] : report.yearly_distribution) {
        yearly[std::to_string(year)] = count;
    }

    return {
        {"total_files", report.total_files},
        {"files_with_dates", report.files_with_dates},
        {"files_without_dates", report.files_without_dates},
        {"date_range", {{"earliest", optional_time(report.earliest)}, {"latest", optional_time(report.latest)}}},
        {"date_sources", report.date_sources},
        {"yearly_distribution", yearly},
        {"monthly_distribution", report.monthly_distribution},
        {"problematic_files", report.problematic_files}
    };
}

json to_json(const SafetyReport& report)
{
    json large_files = json::array();
    for (const auto& file : report.large_files) {
        large_files.push_back({
            {"path", file.path},
            {"size_bytes", file.size_bytes},
            {"size_mb", Utils::bytes_to_mb(file.size_bytes)}
        });
    }

    return {
        {"total_files", report.total_files},
        {"accessible_files", report.accessible_files},
        {"locked_files", report.locked_files},
        {"hidden_files", report.hidden_files},
        {"system_files", report.system_files},
        {"large_files", large_files},
        {"warnings", report.warnings},
        {"suppressed_warnings", report.suppressed_warnings},
        {"is_safe", report.is_safe()}
    };
}

json to_json(const ConflictAnalysis& analysis)
{
    json details = json::array();
    for (const auto& detail : analysis.conflict_details) {
        details.push_back({
            {"source", detail.source},
            {"destination", detail.destination},
            {"source_size", detail.source_size},
            {"dest_size", detail.dest_size},
            {"identical", detail.identical},
            {"recommendation", detail.recommendation}
        });
    }

    return {
        {"total_files", analysis.total_files},
        {"conflicts", analysis.conflicts},
        {"identical_files", analysis.identical_files},
        {"size_conflicts", analysis.size_conflicts},
        {"date_conflicts", analysis.date_conflicts},
        {"potential_overwrites", analysis.potential_overwrites},
        {"conflict_details", details}
    };
}

json to_json(const ConflictStats& stats)
{
    return {
        {"total_conflicts", stats.total_conflicts},
        {"resolution_strategies", stats.resolution_strategies},
        {"backup_directory", stats.backup_directory ? json(*stats.backup_directory) : json(nullptr)}
    };
}

bool export_analysis(const std::string& output_path,
                     const std::string& directory,
                     const std::string& mode,
                     const std::optional<PreviewReport>& type_preview,
                     const std::optional<PreviewReport>& date_preview)
{
    const json document = {
        {"directory", directory},
        {"mode", mode},
        {"timestamp", format_timestamp(std::chrono::system_clock::now())},
        {"type_preview", type_preview ? to_json(*type_preview) : json(nullptr)},
        {"date_preview", date_preview ? to_json(*date_preview) : json(nullptr)}
    };

    auto logger = Logger::get_logger(Logger::kCoreLoggerName);
    const std::filesystem::path path = Utils::utf8_to_path(output_path);
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
    }

    std::ofstream stream(path);
    if (!stream) {
        if (logger) {
            logger->error("Could not write analysis to {}", output_path);
        }
        return false;
    }
    stream << document.dump(2);
    if (!stream) {
        if (logger) {
            logger->error("Writing analysis to {} failed", output_path);
        }
        return false;
    }
    if (logger) {
        logger->info("Analysis exported to {}", output_path);
    }
    return true;
}

} // namespace ReportSerializer
