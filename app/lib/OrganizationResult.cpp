#include "OrganizationResult.hpp"
#include "Utils.hpp"

#include <algorithm>

void OrganizationResult::add_error(const std::string& file, const std::string& message)
{
    errors.push_back(FileError{file, message});
    ++error_files;
}

void OrganizationResult::add_processed_file(const std::string& /*file*/, const std::string& group, std::uintmax_t size)
{
    ++processed_files;
    total_size_moved += size;

    auto it = std::find_if(processed_categories.begin(), processed_categories.end(),
                           [&](const auto& entry) { return entry.first == group; });
    if (it == processed_categories.end()) {
        processed_categories.emplace_back(group, GroupTally{1, size});
    } else {
        ++it->second.count;
        it->second.size += size;
    }
}

void OrganizationResult::add_skipped_file(const std::string& file, const std::string& reason)
{
    skipped.push_back(SkippedFile{file, reason});
    ++skipped_files;
}

double OrganizationResult::success_rate() const
{
    if (total_files == 0) {
        return 0.0;
    }
    return Utils::round_to(static_cast<double>(processed_files) * 100.0 / static_cast<double>(total_files), 1);
}

OrganizationSummary OrganizationResult::get_summary() const
{
    OrganizationSummary summary;
    summary.total_files = total_files;
    summary.processed_files = processed_files;
    summary.skipped_files = skipped_files;
    summary.error_files = error_files;
    summary.success_rate = success_rate();
    summary.categories_created = categories_created;
    summary.conflicts_resolved = conflicts_resolved;
    summary.total_size_mb = Utils::bytes_to_mb(total_size_moved);
    summary.operation_time = Utils::round_to(operation_time, 2);
    summary.dry_run = dry_run;
    summary.stopped = stopped;
    summary.processed_categories = processed_categories;
    return summary;
}
