#include "ConflictResolver.hpp"
#include "Errors.hpp"
#include "FileHasher.hpp"
#include "TestHooks.hpp"
#include "Utils.hpp"

#include <chrono>
#include <system_error>
#include <utility>

#include <fmt/format.h>

namespace fs = std::filesystem;

namespace {

std::string display(const fs::path& path)
{
    return Utils::path_to_utf8(path);
}

std::string display_name(const fs::path& path)
{
    return Utils::path_to_utf8(path.filename());
}

} // namespace

ConflictInfo::ConflictInfo(fs::path source, fs::path destination)
    : source_path(std::move(source)),
      destination_path(std::move(destination))
{
    std::error_code ec;
    source_present = fs::exists(source_path, ec);
    destination_present = fs::exists(destination_path, ec);

    if (source_present) {
        const auto size = fs::file_size(source_path, ec);
        source_bytes = ec ? 0 : size;
        if (const auto times = Utils::read_file_times(source_path)) {
            source_modified = times->modification;
        }
    }
    if (destination_present) {
        const auto size = fs::file_size(destination_path, ec);
        destination_bytes = ec ? 0 : size;
        if (const auto times = Utils::read_file_times(destination_path)) {
            destination_modified = times->modification;
        }
    }
}

const std::optional<std::string>& ConflictInfo::source_hash()
{
    if (!source_hashed && source_present) {
        source_digest = FileHasher::sha256_file(source_path);
        source_hashed = true;
    }
    return source_digest;
}

const std::optional<std::string>& ConflictInfo::destination_hash()
{
    if (!destination_hashed && destination_present) {
        destination_digest = FileHasher::sha256_file(destination_path);
        destination_hashed = true;
    }
    return destination_digest;
}

bool ConflictInfo::are_files_identical()
{
    if (!source_present || !destination_present || source_bytes != destination_bytes) {
        return false;
    }
    const auto& source_digest_value = source_hash();
    const auto& destination_digest_value = destination_hash();
    return source_digest_value && destination_digest_value && *source_digest_value == *destination_digest_value;
}

ConflictResolver::ConflictResolver(ConflictStrategy default_strategy,
                                   const fs::path& backup_root,
                                   std::shared_ptr<spdlog::logger> core_logger)
    : default_strategy(default_strategy),
      backup_dir(backup_root / Utils::timestamp_for_filename(std::chrono::system_clock::now())),
      core_logger(std::move(core_logger)) {}

void ConflictResolver::set_default_strategy(ConflictStrategy strategy)
{
    std::lock_guard<std::mutex> lock(mutex);
    default_strategy = strategy;
}

ConflictStrategy ConflictResolver::get_default_strategy() const
{
    std::lock_guard<std::mutex> lock(mutex);
    return default_strategy;
}

void ConflictResolver::set_backup_directory(const fs::path& directory)
{
    {
        std::lock_guard<std::mutex> lock(mutex);
        backup_dir = directory;
    }
    if (core_logger) {
        core_logger->info("Backup directory set to: {}", display(directory));
    }
}

fs::path ConflictResolver::get_backup_directory() const
{
    std::lock_guard<std::mutex> lock(mutex);
    return backup_dir;
}

fs::path ConflictResolver::resolve(const fs::path& source,
                                   const fs::path& destination,
                                   std::optional<ConflictStrategy> strategy,
                                   bool dry_run)
{
    ConflictInfo conflict(source, destination);
    if (!conflict.destination_exists()) {
        return destination;
    }

    ConflictStrategy selected;
    {
        std::lock_guard<std::mutex> lock(mutex);
        selected = strategy.value_or(default_strategy);
        ++conflict_count;
        ++resolution_stats[to_string(selected)];
    }

    if (core_logger) {
        core_logger->warn("File conflict detected: {} (strategy: {})", display(destination), to_string(selected));
    }

    switch (selected) {
        case ConflictStrategy::Skip: return resolve_skip(conflict);
        case ConflictStrategy::Rename: return resolve_rename(conflict);
        case ConflictStrategy::Overwrite: return resolve_overwrite(conflict, dry_run);
        case ConflictStrategy::Backup: return resolve_backup(conflict, dry_run);
        case ConflictStrategy::SizeCompare: return resolve_size_compare(conflict, dry_run);
        case ConflictStrategy::DateCompare: return resolve_date_compare(conflict, dry_run);
        case ConflictStrategy::HashCompare: return resolve_hash_compare(conflict, dry_run);
    }
    throw ConflictUnresolvable(ConflictUnresolvable::Reason::Skipped, "Unknown conflict strategy");
}

fs::path ConflictResolver::resolve_skip(ConflictInfo& conflict) const
{
    if (core_logger) {
        core_logger->info("Skipping conflicting file: {}", display_name(conflict.source()));
    }
    throw ConflictUnresolvable(ConflictUnresolvable::Reason::Skipped, "File skipped due to conflict");
}

fs::path ConflictResolver::resolve_rename(ConflictInfo& conflict) const
{
    const fs::path& destination = conflict.destination();
    const fs::path parent = destination.parent_path();
    const std::string stem = Utils::path_to_utf8(destination.stem());
    const std::string suffix = Utils::path_to_utf8(destination.extension());

    for (int counter = 1; counter <= kMaxRenameAttempts; ++counter) {
        const std::string candidate_name = fmt::format("{}_{}{}", stem, counter, suffix);
        const fs::path candidate = parent / Utils::utf8_to_path(candidate_name);
        std::error_code ec;
        if (!fs::exists(candidate, ec) && !ec) {
            if (core_logger) {
                core_logger->info("Renamed to avoid conflict: {}", candidate_name);
            }
            return candidate;
        }
    }
    throw ConflictUnresolvable(ConflictUnresolvable::Reason::RenameExhausted,
                               "Cannot generate unique filename - too many conflicts");
}

fs::path ConflictResolver::resolve_overwrite(ConflictInfo& conflict, bool dry_run) const
{
    const fs::path& destination = conflict.destination();
    if (dry_run) {
        if (core_logger) {
            core_logger->info("Would overwrite: {}", display_name(destination));
        }
        return destination;
    }

    try {
        TestHooks::run_file_operation_probe({"DELETE", destination, fs::path()});
        fs::remove(destination);
    } catch (const fs::filesystem_error& e) {
        throw OperationError(fmt::format("Cannot overwrite file: {}", e.what()));
    }
    if (core_logger) {
        core_logger->info("Overwriting existing file: {}", display_name(destination));
    }
    return destination;
}

fs::path ConflictResolver::resolve_backup(ConflictInfo& conflict, bool dry_run) const
{
    const fs::path& destination = conflict.destination();
    if (dry_run) {
        if (core_logger) {
            core_logger->info("Would backup and overwrite: {}", display_name(destination));
        }
        return destination;
    }

    const fs::path directory = get_backup_directory();
    try {
        fs::create_directories(directory);

        const std::string backup_name = generate_safe_filename(
            fmt::format("{}_{}{}",
                        Utils::path_to_utf8(destination.stem()),
                        Utils::timestamp_for_filename(std::chrono::system_clock::now()),
                        Utils::path_to_utf8(destination.extension())),
            directory);
        const fs::path backup_path = directory / Utils::utf8_to_path(backup_name);

        TestHooks::run_file_operation_probe({"BACKUP", destination, backup_path});
        fs::copy_file(destination, backup_path);
        if (const auto& modified = conflict.destination_mtime();
            modified && !Utils::set_file_times(backup_path, *modified, *modified) && core_logger) {
            core_logger->debug("Could not preserve timestamps on backup {}", display(backup_path));
        }
        if (core_logger) {
            core_logger->info("Created backup: {}", display(backup_path));
        }

        TestHooks::run_file_operation_probe({"DELETE", destination, fs::path()});
        fs::remove(destination);
    } catch (const fs::filesystem_error& e) {
        throw OperationError(fmt::format("Cannot create backup: {}", e.what()));
    }
    return destination;
}

fs::path ConflictResolver::resolve_size_compare(ConflictInfo& conflict, bool dry_run) const
{
    const auto source_size = conflict.source_size();
    const auto destination_size = conflict.destination_size();
    if (source_size > destination_size) {
        if (core_logger) {
            core_logger->info("Keeping larger file (source): {} > {} bytes", source_size, destination_size);
        }
        return resolve_overwrite(conflict, dry_run);
    }
    if (source_size < destination_size) {
        if (core_logger) {
            core_logger->info("Keeping larger file (destination): {} > {} bytes", destination_size, source_size);
        }
        throw ConflictUnresolvable(ConflictUnresolvable::Reason::DestinationLarger,
                                   "Destination file is larger - keeping existing");
    }
    if (core_logger) {
        core_logger->info("Files are same size - comparing content");
    }
    return resolve_hash_compare(conflict, dry_run);
}

fs::path ConflictResolver::resolve_date_compare(ConflictInfo& conflict, bool dry_run) const
{
    const auto& source_mtime = conflict.source_mtime();
    const auto& destination_mtime = conflict.destination_mtime();
    if (!source_mtime || !destination_mtime) {
        if (core_logger) {
            core_logger->warn("Cannot compare file dates - falling back to rename");
        }
        return resolve_rename(conflict);
    }
    if (*source_mtime > *destination_mtime) {
        if (core_logger) {
            core_logger->info("Keeping newer file (source): {}", display_name(conflict.source()));
        }
        return resolve_overwrite(conflict, dry_run);
    }
    if (*source_mtime < *destination_mtime) {
        if (core_logger) {
            core_logger->info("Keeping newer file (destination): {}", display_name(conflict.destination()));
        }
        throw ConflictUnresolvable(ConflictUnresolvable::Reason::DestinationNewer,
                                   "Destination file is newer - keeping existing");
    }
    if (core_logger) {
        core_logger->info("Files have same date - comparing content");
    }
    return resolve_hash_compare(conflict, dry_run);
}

fs::path ConflictResolver::resolve_hash_compare(ConflictInfo& conflict, bool /*dry_run*/) const
{
    if (conflict.are_files_identical()) {
        if (core_logger) {
            core_logger->info("Files are identical - skipping duplicate: {}", display_name(conflict.source()));
        }
        throw ConflictUnresolvable(ConflictUnresolvable::Reason::Duplicate,
                                   "Files are identical - skipping duplicate");
    }
    if (core_logger) {
        core_logger->info("Files are different - keeping both with rename");
    }
    return resolve_rename(conflict);
}

std::string ConflictResolver::generate_safe_filename(const std::string& filename,
                                                     const fs::path& directory,
                                                     int max_attempts) const
{
    std::error_code ec;
    if (!fs::exists(directory / Utils::utf8_to_path(filename), ec)) {
        return filename;
    }

    const fs::path name = Utils::utf8_to_path(filename);
    const std::string stem = Utils::path_to_utf8(name.stem());
    const std::string suffix = Utils::path_to_utf8(name.extension());

    for (int counter = 1; counter <= max_attempts; ++counter) {
        std::string candidate = fmt::format("{}_{}{}", stem, counter, suffix);
        if (!fs::exists(directory / Utils::utf8_to_path(candidate), ec)) {
            if (core_logger) {
                core_logger->debug("Generated safe filename: {}", candidate);
            }
            return candidate;
        }
    }

    std::string fallback = fmt::format("{}_{}{}", stem,
                                       Utils::timestamp_for_filename(std::chrono::system_clock::now(), true),
                                       suffix);
    if (core_logger) {
        core_logger->warn("Using timestamp fallback: {}", fallback);
    }
    return fallback;
}

ConflictAnalysis ConflictResolver::analyze_conflicts(const std::vector<std::string>& source_files,
                                                     const fs::path& destination_dir) const
{
    ConflictAnalysis analysis;
    analysis.total_files = source_files.size();

    for (const auto& source_file : source_files) {
        const fs::path source = Utils::utf8_to_path(source_file);
        const fs::path destination = destination_dir / source.filename();
        std::error_code ec;
        if (!fs::exists(destination, ec)) {
            continue;
        }

        ConflictInfo conflict(source, destination);
        ++analysis.conflicts;

        ConflictDetail detail;
        detail.source = source_file;
        detail.destination = display(destination);
        detail.source_size = conflict.source_size();
        detail.dest_size = conflict.destination_size();
        detail.identical = conflict.are_files_identical();

        const auto& source_mtime = conflict.source_mtime();
        const auto& destination_mtime = conflict.destination_mtime();
        const bool source_newer = source_mtime && destination_mtime && *source_mtime > *destination_mtime;

        if (detail.identical) {
            ++analysis.identical_files;
            detail.recommendation = "skip_identical";
        } else if (conflict.source_size() > conflict.destination_size()) {
            ++analysis.size_conflicts;
            detail.recommendation = "overwrite_larger";
        } else if (source_newer) {
            ++analysis.date_conflicts;
            detail.recommendation = "overwrite_newer";
        } else {
            ++analysis.potential_overwrites;
            detail.recommendation = "rename_safe";
        }
        analysis.conflict_details.push_back(std::move(detail));
    }
    return analysis;
}

ConflictStats ConflictResolver::get_conflict_stats() const
{
    ConflictStats stats;
    fs::path directory;
    {
        std::lock_guard<std::mutex> lock(mutex);
        stats.total_conflicts = conflict_count;
        stats.resolution_strategies = resolution_stats;
        directory = backup_dir;
    }
    std::error_code ec;
    if (fs::exists(directory, ec)) {
        stats.backup_directory = display(directory);
    }
    return stats;
}
