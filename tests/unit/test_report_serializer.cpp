#include <catch2/catch_test_macros.hpp>

#include "CategoryClassifier.hpp"
#include "ConflictResolver.hpp"
#include "DateExtractor.hpp"
#include "FileOrganizer.hpp"
#include "OrganizationResult.hpp"
#include "PathValidator.hpp"
#include "ReportSerializer.hpp"
#include "TestHelpers.hpp"

#include <fstream>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

TEST_CASE("OrganizationResult summarizes counts, rate and sizes") {
    OrganizationResult result;
    result.total_files = 3;
    result.add_processed_file("/in/a.jpg", "Images", 1024 * 1024);
    result.add_processed_file("/in/b.jpg", "Images", 1024 * 1024);
    result.add_error("/in/c.txt", "permission denied");
    result.operation_time = 0.123456;

    const OrganizationSummary summary = result.get_summary();
    CHECK(summary.processed_files == 2);
    CHECK(summary.error_files == 1);
    CHECK(summary.success_rate == 66.7);
    CHECK(summary.total_size_mb == 2.0);
    CHECK(summary.operation_time == 0.12);
    REQUIRE(summary.processed_categories.size() == 1);
    CHECK(summary.processed_categories.front().second.count == 2);

    OrganizationResult empty;
    CHECK(empty.success_rate() == 0.0);
}

TEST_CASE("ReportSerializer writes result fields under their documented names") {
    OrganizationResult result;
    result.total_files = 3;
    result.dry_run = true;
    result.add_processed_file("/in/a.pdf", "Documents", 10);
    result.add_skipped_file("/in/b.pdf", "already organized");
    result.add_error("/in/c.pdf", "boom");

    const json out = ReportSerializer::to_json(result);
    CHECK(out.at("total_files") == 3);
    CHECK(out.at("processed_files") == 1);
    CHECK(out.at("skipped_files") == 1);
    CHECK(out.at("error_files") == 1);
    CHECK(out.at("dry_run") == true);
    CHECK(out.at("stopped") == false);
    CHECK(out.at("processed_categories").at("Documents").at("count") == 1);
    CHECK(out.at("processed_categories").at("Documents").at("size") == 10);
    REQUIRE(out.at("errors").size() == 1);
    CHECK(out.at("errors")[0].at("file") == "/in/c.pdf");
    CHECK(out.at("errors")[0].at("error") == "boom");
    CHECK(out.at("skipped")[0].at("reason") == "already organized");
    CHECK(out.contains("operation_time"));
    CHECK(out.contains("success_rate"));
}

TEST_CASE("ReportSerializer renders previews and preview failures") {
    PreviewReport failed;
    failed.error = "Source directory does not exist: /nope";
    const json failed_json = ReportSerializer::to_json(failed);
    CHECK(failed_json.size() == 1);
    CHECK(failed_json.at("error") == "Source directory does not exist: /nope");

    PreviewReport preview;
    preview.mode = PreviewMode::Date;
    preview.total_files = 2;
    preview.estimated_folders = 1;
    preview.groups.push_back(GroupPreview{"2024-03", 2, 2048, 0.0});
    preview.file_mappings.push_back(FileGroup{"2024-03", {"/in/a.jpg", "/in/b.jpg"}});

    const json out = ReportSerializer::to_json(preview);
    CHECK(out.at("mode") == "date");
    CHECK(out.at("total_files") == 2);
    CHECK(out.at("estimated_folders") == 1);
    CHECK(out.at("categories").at("2024-03").at("file_count") == 2);
    CHECK(out.at("categories").at("2024-03").at("total_size_bytes") == 2048);
    CHECK(out.at("file_mappings").at("2024-03") == json::array({"/in/a.jpg", "/in/b.jpg"}));
    CHECK_FALSE(out.contains("error"));
}

TEST_CASE("ReportSerializer keys yearly counts by year string and tolerates missing ranges") {
    DateAnalysisReport report;
    report.total_files = 1;
    report.files_without_dates = 1;
    report.yearly_distribution[2022] = 4;

    const json out = ReportSerializer::to_json(report);
    CHECK(out.at("yearly_distribution").at("2022") == 4);
    CHECK(out.at("date_range").at("earliest").is_null());
    CHECK(out.at("date_range").at("latest").is_null());
}

TEST_CASE("ReportSerializer reports conflict statistics") {
    TempDir dir;
    ConflictResolver resolver(ConflictStrategy::Rename, dir.path() / "backup");
    const json out = ReportSerializer::to_json(resolver.get_conflict_stats());
    CHECK(out.at("total_conflicts") == 0);
    CHECK(out.at("backup_directory").is_null());
}

TEST_CASE("ReportSerializer exports both previews to a file") {
    TempDir dir;
    const auto source = dir.path() / "source";
    write_file(source / "a.jpg", "a");
    write_file(source / "2024-03-10_notes.txt", "b");

    PathValidator validator;
    CategoryClassifier classifier(validator, CategoryClassifier::default_categories());
    DateExtractor extractor;
    ConflictResolver resolver(ConflictStrategy::Rename, dir.path() / "backup");
    FileOrganizer organizer(validator, classifier, extractor, resolver);

    const auto type_preview = organizer.get_organization_preview(source.string(), PreviewMode::Type);
    const auto date_preview = organizer.get_organization_preview(source.string(), PreviewMode::Date);
    const auto output = dir.path() / "reports" / "analysis.json";

    REQUIRE(ReportSerializer::export_analysis(output.string(), source.string(), "both", type_preview, date_preview));

    std::ifstream stream(output);
    const json document = json::parse(stream);
    CHECK(document.at("directory") == source.string());
    CHECK(document.at("mode") == "both");
    CHECK(document.at("timestamp").get<std::string>().size() == 19);
    CHECK(document.at("type_preview").at("total_files") == 2);
    CHECK(document.at("date_preview").at("file_mappings").contains("2024-03-10"));

    REQUIRE(ReportSerializer::export_analysis(output.string(), source.string(), "type", type_preview, std::nullopt));
    std::ifstream again(output);
    CHECK(json::parse(again).at("date_preview").is_null());
}
