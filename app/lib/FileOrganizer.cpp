#include "FileOrganizer.hpp"

#include "CategoryClassifier.hpp"
#include "ConflictResolver.hpp"
#include "Errors.hpp"
#include "PathValidator.hpp"
#include "TestHooks.hpp"
#include "Utils.hpp"

#include <algorithm>
#include <system_error>
#include <unordered_set>
#include <utility>

#include <fmt/format.h>

namespace fs = std::filesystem;

namespace {

constexpr std::size_t kMaxLoggedErrors = 5;
constexpr const char* kAlreadyOrganized = "already organized";
constexpr const char* kUncategorizedSkip = "uncategorized";
constexpr const char* kNoMatchingDate = "no date folder (outside range or undated)";

std::string display(const fs::path& path)
{
    return Utils::path_to_utf8(path);
}

fs::path resolve_unchecked(const std::string& value)
{
    std::error_code ec;
    fs::path path = fs::absolute(Utils::utf8_to_path(value), ec);
    if (ec) {
        return Utils::utf8_to_path(value);
    }
    fs::path canonical = fs::weakly_canonical(path, ec);
    return ec ? path : canonical;
}

std::uintmax_t size_or_zero(const fs::path& path)
{
    std::error_code ec;
    const auto size = fs::file_size(path, ec);
    return ec ? 0 : size;
}

} // namespace

FileOrganizer::FileOrganizer(const PathValidator& validator,
                             const CategoryClassifier& classifier,
                             const DateExtractor& date_extractor,
                             ConflictResolver& conflict_resolver,
                             std::shared_ptr<spdlog::logger> core_logger)
    : validator(validator),
      classifier(classifier),
      date_extractor(date_extractor),
      conflict_resolver(conflict_resolver),
      activity(core_logger),
      core_logger(std::move(core_logger))
{
}

OrganizationResult FileOrganizer::organize_by_type(const std::string& source_dir,
                                                   const std::optional<std::string>& destination_dir,
                                                   bool dry_run,
                                                   bool create_subdirs,
                                                   const ProgressCallback& on_progress,
                                                   const std::atomic<bool>* stop_flag)
{
    OrganizationResult result;
    result.dry_run = dry_run;
    const auto started = std::chrono::steady_clock::now();
    RunContext context{ActivityLog::make_operation_id("organize_type"), dry_run, on_progress, stop_flag};
    activity.operation_started(context.operation_id, fmt::format("Organizing files by type - Source: {}", source_dir));

    try {
        fs::path source_root;
        fs::path destination_root;
        prepare_directories(source_dir, destination_dir, dry_run, source_root, destination_root);

        const std::vector<std::string> files = scan_files(source_root);
        result.total_files = files.size();
        if (files.empty()) {
            if (core_logger) {
                core_logger->info("No files found to organize in {}", display(source_root));
            }
            finish(context.operation_id, result, started);
            return result;
        }

        const FileGroups groups = classifier.classify_all(files);
        for (const auto& group : groups) {
            if (result.stopped) {
                break;
            }
            if (!create_subdirs && group.name == CategoryClassifier::kUncategorized) {
                for (const auto& file : group.files) {
                    result.add_skipped_file(file, kUncategorizedSkip);
                    report_progress(context, result, file, group.name);
                }
                continue;
            }

            const fs::path group_dir = create_subdirs
                ? destination_root / Utils::utf8_to_path(group.name)
                : destination_root;
            process_group(group, group_dir, context, result);
        }
    } catch (const ValidationError& ex) {
        result.add_error(kOperationErrorKey, ex.what());
        activity.operation_failed(context.operation_id, ex.what());
    } catch (const fs::filesystem_error& ex) {
        result.add_error(kOperationErrorKey, ex.what());
        activity.operation_failed(context.operation_id, ex.what());
    }

    finish(context.operation_id, result, started);
    return result;
}

OrganizationResult FileOrganizer::organize_by_date(const std::string& source_dir,
                                                   const std::optional<std::string>& destination_dir,
                                                   bool dry_run,
                                                   const DateOrganizeOptions& options,
                                                   const ProgressCallback& on_progress,
                                                   const std::atomic<bool>* stop_flag)
{
    OrganizationResult result;
    result.dry_run = dry_run;
    const auto started = std::chrono::steady_clock::now();
    RunContext context{ActivityLog::make_operation_id("organize_date"), dry_run, on_progress, stop_flag};
    activity.operation_started(context.operation_id,
                               fmt::format("Organizing files by date ({}, source {}) - Source: {}",
                                           to_string(options.format), to_string(options.source), source_dir));

    try {
        fs::path source_root;
        fs::path destination_root;
        prepare_directories(source_dir, destination_dir, dry_run, source_root, destination_root);

        const std::vector<std::string> files = scan_files(source_root);
        result.total_files = files.size();
        if (files.empty()) {
            if (core_logger) {
                core_logger->info("No files found to organize in {}", display(source_root));
            }
            finish(context.operation_id, result, started);
            return result;
        }

        const DateGrouping grouping = date_extractor.organize_by_date(
            files, options.source, options.format, options.range, options.custom_format);
        for (const auto& error : grouping.errors) {
            if (core_logger) {
                core_logger->warn("Could not read dates for {}: {}", error.file, error.message);
            }
        }

        std::unordered_set<std::string> grouped;
        for (const auto& group : grouping.groups) {
            grouped.insert(group.files.begin(), group.files.end());
        }
        for (const auto& file : files) {
            if (grouped.count(file) == 0) {
                result.add_skipped_file(file, kNoMatchingDate);
            }
        }

        for (const auto& group : grouping.groups) {
            if (result.stopped) {
                break;
            }
            process_group(group, destination_root / Utils::utf8_to_path(group.name), context, result);
        }
    } catch (const ValidationError& ex) {
        result.add_error(kOperationErrorKey, ex.what());
        activity.operation_failed(context.operation_id, ex.what());
    } catch (const ConfigurationError& ex) {
        result.add_error(kOperationErrorKey, ex.what());
        activity.operation_failed(context.operation_id, ex.what());
    } catch (const fs::filesystem_error& ex) {
        result.add_error(kOperationErrorKey, ex.what());
        activity.operation_failed(context.operation_id, ex.what());
    }

    finish(context.operation_id, result, started);
    return result;
}

fs::path FileOrganizer::move_file(const std::string& source, const std::string& destination, bool dry_run)
{
    auto [source_path, destination_path] = validator.validate_move_operation(source, destination, dry_run);

    std::error_code ec;
    if (fs::exists(destination_path, ec)) {
        destination_path = conflict_resolver.resolve(source_path, destination_path, std::nullopt, dry_run);
    }
    if (!dry_run) {
        relocate(source_path, destination_path);
    }
    activity.file_action("MOVE", display(source_path), display(destination_path), dry_run);
    return destination_path;
}

fs::path FileOrganizer::copy_file(const std::string& source, const std::string& destination, bool dry_run)
{
    auto [source_path, destination_path] = validator.validate_copy_operation(source, destination, dry_run);

    std::error_code ec;
    if (fs::exists(destination_path, ec)) {
        destination_path = conflict_resolver.resolve(source_path, destination_path, std::nullopt, dry_run);
    }
    if (!dry_run) {
        duplicate(source_path, destination_path);
    }
    activity.file_action("COPY", display(source_path), display(destination_path), dry_run);
    return destination_path;
}

OrganizationResult FileOrganizer::batch_operation(const std::vector<BatchOperation>& operations,
                                                  bool dry_run,
                                                  const ProgressCallback& on_progress,
                                                  const std::atomic<bool>* stop_flag)
{
    OrganizationResult result;
    result.dry_run = dry_run;
    result.total_files = operations.size();
    const auto started = std::chrono::steady_clock::now();
    RunContext context{ActivityLog::make_operation_id("batch"), dry_run, on_progress, stop_flag};
    activity.operation_started(context.operation_id, fmt::format("Batch operation: {} files", operations.size()));

    for (const auto& operation : operations) {
        if (stop_requested(context)) {
            result.stopped = true;
            break;
        }

        const std::string label = Utils::to_lower_copy(Utils::trim_copy(operation.type));
        try {
            const auto type = operation_type_from_string(operation.type);
            if (!type) {
                throw OperationError(fmt::format("Unknown operation type: {}", operation.type));
            }
            const std::uintmax_t size = size_or_zero(Utils::utf8_to_path(operation.source));
            switch (*type) {
                case OperationType::Move:
                    move_file(operation.source, operation.destination, dry_run);
                    break;
                case OperationType::Copy:
                    copy_file(operation.source, operation.destination, dry_run);
                    break;
            }
            result.add_processed_file(operation.source, to_string(*type), size);
        } catch (const ConflictUnresolvable& ex) {
            result.add_skipped_file(operation.source, ex.what());
        } catch (const std::exception& ex) {
            result.add_error(operation.source, ex.what());
            if (core_logger) {
                core_logger->error("Failed {} operation for {}: {}", label, operation.source, ex.what());
            }
        }
        report_progress(context, result, operation.source, label);
    }

    finish(context.operation_id, result, started);
    return result;
}

PreviewReport FileOrganizer::get_organization_preview(const std::string& source_dir, PreviewMode mode) const
{
    PreviewReport report;
    report.mode = mode;

    try {
        const fs::path source_root = validator.validate_source_directory(source_dir);
        const std::vector<std::string> files = scan_files(source_root);
        report.total_files = files.size();

        switch (mode) {
            case PreviewMode::Type: {
                report.file_mappings = classifier.classify_all(files);
                for (const auto& stats : classifier.get_category_stats(report.file_mappings)) {
                    report.groups.push_back(GroupPreview{stats.category, stats.file_count,
                                                         stats.total_size_bytes, stats.total_size_mb});
                }
                break;
            }
            case PreviewMode::Date: {
                report.file_mappings = date_extractor.organize_by_date(
                    files, DateSource::Auto, DateFormat::YearMonthDay).groups;
                for (const auto& group : report.file_mappings) {
                    GroupPreview preview{group.name, group.files.size(), 0, 0.0};
                    for (const auto& file : group.files) {
                        preview.total_size_bytes += size_or_zero(Utils::utf8_to_path(file));
                    }
                    preview.total_size_mb = Utils::bytes_to_mb(preview.total_size_bytes);
                    report.groups.push_back(std::move(preview));
                }
                break;
            }
        }
        report.estimated_folders = report.groups.size();
    } catch (const std::exception& ex) {
        report.error = ex.what();
        if (core_logger) {
            core_logger->error("Preview failed: {}", ex.what());
        }
    }
    return report;
}

std::vector<std::string> FileOrganizer::scan_files(const fs::path& directory) const
{
    std::vector<std::string> files;

    std::error_code ec;
    fs::recursive_directory_iterator it(directory, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        if (core_logger) {
            core_logger->warn("Cannot scan {}: {}", display(directory), ec.message());
        }
        return files;
    }

    for (const fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            if (core_logger) {
                core_logger->warn("Scan error below {}: {}", display(directory), ec.message());
            }
            ec.clear();
            continue;
        }
        std::error_code entry_ec;
        if (PathValidator::is_hidden_file(it->path())) {
            if (it->is_directory(entry_ec)) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (it->is_regular_file(entry_ec) && !entry_ec) {
            files.push_back(display(it->path()));
        }
    }

    std::sort(files.begin(), files.end());
    if (core_logger) {
        core_logger->info("Found {} files to process", files.size());
    }
    return files;
}

std::size_t FileOrganizer::undo_moves()
{
    std::size_t restored = 0;
    std::vector<RollbackEntry> remaining;

    for (auto it = rollback_entries.rbegin(); it != rollback_entries.rend(); ++it) {
        std::error_code ec;
        if (fs::exists(it->original_path, ec)) {
            if (core_logger) {
                core_logger->warn("Cannot undo move, {} is occupied", display(it->original_path));
            }
            remaining.push_back(*it);
            continue;
        }
        fs::create_directories(it->original_path.parent_path(), ec);
        try {
            transfer(it->current_path, it->original_path);
        } catch (const std::exception& ex) {
            if (core_logger) {
                core_logger->warn("Cannot undo move {} -> {}: {}",
                                  display(it->current_path), display(it->original_path), ex.what());
            }
            remaining.push_back(*it);
            continue;
        }
        activity.file_action("UNDO", display(it->current_path), display(it->original_path), false);
        ++restored;
    }

    std::reverse(remaining.begin(), remaining.end());
    rollback_entries = std::move(remaining);
    return restored;
}

void FileOrganizer::prepare_directories(const std::string& source_dir,
                                        const std::optional<std::string>& destination_dir,
                                        bool dry_run,
                                        fs::path& source_root,
                                        fs::path& destination_root) const
{
    source_root = validator.validate_source_directory(source_dir);
    if (!destination_dir) {
        destination_root = source_root;
        return;
    }

    std::error_code ec;
    const fs::path requested = resolve_unchecked(*destination_dir);
    if (dry_run && !fs::exists(requested, ec)) {
        destination_root = requested;
        return;
    }
    destination_root = validator.validate_destination_directory(*destination_dir, true);
}

bool FileOrganizer::ensure_group_directory(const fs::path& directory, bool dry_run, OrganizationResult& result) const
{
    if (dry_run) {
        return true;
    }
    std::error_code ec;
    if (fs::is_directory(directory, ec)) {
        return true;
    }
    const bool created = fs::create_directories(directory, ec);
    if (ec) {
        if (core_logger) {
            core_logger->error("Failed to create folder {}: {}", display(directory), ec.message());
        }
        return false;
    }
    if (created) {
        ++result.categories_created;
        if (core_logger) {
            core_logger->debug("Created folder {}", display(directory));
        }
    }
    return true;
}

void FileOrganizer::process_group(const FileGroup& group,
                                  const fs::path& group_dir,
                                  RunContext& context,
                                  OrganizationResult& result)
{
    const bool folder_ready = ensure_group_directory(group_dir, context.dry_run, result);

    for (const auto& file : group.files) {
        if (stop_requested(context)) {
            result.stopped = true;
            if (core_logger) {
                core_logger->info("Stop requested, leaving remaining files untouched");
            }
            return;
        }

        if (!folder_ready) {
            result.add_error(file, fmt::format("Cannot create folder: {}", display(group_dir)));
            report_progress(context, result, file, group.name);
            continue;
        }

        try {
            place_file(file, group.name, group_dir, context.dry_run, result);
        } catch (const ConflictUnresolvable& ex) {
            result.add_skipped_file(file, ex.what());
            if (core_logger) {
                core_logger->info("Skipped {}: {}", file, ex.what());
            }
        } catch (const std::exception& ex) {
            result.add_error(file, ex.what());
            if (core_logger) {
                core_logger->error("Failed to process {}: {}", file, ex.what());
            }
        }
        report_progress(context, result, file, group.name);
    }
}

void FileOrganizer::place_file(const std::string& file,
                               const std::string& group,
                               const fs::path& group_dir,
                               bool dry_run,
                               OrganizationResult& result)
{
    const fs::path source = validator.validate_file_path(file);
    fs::path destination = group_dir / source.filename();

    std::error_code ec;
    const fs::path group_key = fs::weakly_canonical(group_dir, ec);
    if (!ec && source == group_key / source.filename()) {
        result.add_skipped_file(file, kAlreadyOrganized);
        return;
    }

    const std::uintmax_t size = size_or_zero(source);
    if (fs::exists(destination, ec)) {
        destination = conflict_resolver.resolve(source, destination, std::nullopt, dry_run);
        ++result.conflicts_resolved;
    }

    if (!dry_run) {
        relocate(source, destination);
    }
    activity.file_action("MOVE", display(source), display(destination), dry_run);
    result.add_processed_file(file, group, size);
}

void FileOrganizer::relocate(const fs::path& source, const fs::path& destination)
{
    TestHooks::run_file_operation_probe(TestHooks::FileOperationInfo{"MOVE", source, destination});
    transfer(source, destination);
    rollback_entries.push_back(RollbackEntry{source, destination});
}

void FileOrganizer::transfer(const fs::path& source, const fs::path& destination) const
{
    std::error_code ec = TestHooks::run_rename_hook(source, destination);
    if (!ec) {
        fs::rename(source, destination, ec);
    }
    if (!ec) {
        return;
    }
    if (ec != std::errc::cross_device_link) {
        throw OperationError(fmt::format("Failed to move {} to {}: {}",
                                         display(source), display(destination), ec.message()));
    }

    std::error_code link_ec;
    if (fs::is_symlink(fs::symlink_status(source, link_ec))) {
        fs::create_directories(destination.parent_path(), link_ec);
        link_ec.clear();
        fs::copy_symlink(source, destination, link_ec);
        if (link_ec) {
            throw OperationError(fmt::format("Failed to copy link {} to {}: {}",
                                             display(source), display(destination), link_ec.message()));
        }
    } else {
        duplicate(source, destination);
    }

    std::error_code remove_ec;
    fs::remove(source, remove_ec);
    if (remove_ec) {
        throw OperationError(fmt::format("Copied {} but could not remove the original: {}",
                                         display(source), remove_ec.message()));
    }
}

void FileOrganizer::duplicate(const fs::path& source, const fs::path& destination) const
{
    TestHooks::run_file_operation_probe(TestHooks::FileOperationInfo{"COPY", source, destination});

    std::error_code ec;
    fs::create_directories(destination.parent_path(), ec);
    ec.clear();
    fs::copy_file(source, destination, fs::copy_options::none, ec);
    if (ec) {
        throw OperationError(fmt::format("Failed to copy {} to {}: {}",
                                         display(source), display(destination), ec.message()));
    }

    if (const auto times = Utils::read_file_times(source)) {
        if (!Utils::set_file_times(destination, times->modification, times->access) && core_logger) {
            core_logger->debug("Could not preserve timestamps on {}", display(destination));
        }
    }
}

void FileOrganizer::report_progress(const RunContext& context,
                                    const OrganizationResult& result,
                                    const std::string& file,
                                    const std::string& group) const
{
    if (!context.on_progress || result.total_files == 0) {
        return;
    }
    const std::size_t done = result.processed_files + result.error_files + result.skipped_files;
    const double fraction = std::min(1.0, static_cast<double>(done) / static_cast<double>(result.total_files));
    context.on_progress(fraction, file, group);
}

bool FileOrganizer::stop_requested(const RunContext& context)
{
    return context.stop_flag && context.stop_flag->load();
}

void FileOrganizer::finish(const std::string& operation_id,
                           OrganizationResult& result,
                           std::chrono::steady_clock::time_point started) const
{
    result.operation_time = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();

    if (result.dry_run) {
        activity.dry_run_summary(result.total_files, {{"processed", result.processed_files},
                                                      {"skipped", result.skipped_files},
                                                      {"errors", result.error_files}});
    } else if (result.error_files == 0 || result.processed_files > 0) {
        activity.operation_succeeded(operation_id,
                                     fmt::format("Processed {}/{} files", result.processed_files, result.total_files));
    }

    std::vector<std::pair<std::string, std::string>> entries;
    for (const auto& [group, tally] : result.processed_categories) {
        entries.emplace_back(group, fmt::format("{} files ({} MB)", tally.count, Utils::bytes_to_mb(tally.size)));
    }
    entries.emplace_back("Success rate", fmt::format("{}%", result.success_rate()));
    entries.emplace_back("Operation time", fmt::format("{:.2f}s", result.operation_time));
    activity.stats("Operation statistics", entries);

    if (!core_logger) {
        return;
    }
    if (!result.errors.empty()) {
        core_logger->warn("{} errors occurred:", result.errors.size());
        const std::size_t shown = std::min(result.errors.size(), kMaxLoggedErrors);
        for (std::size_t i = 0; i < shown; ++i) {
            core_logger->error("  {}: {}", result.errors[i].file, result.errors[i].message);
        }
    }
}
