#include "ActivityLog.hpp"

#include <chrono>

#include <fmt/format.h>

ActivityLog::ActivityLog(std::shared_ptr<spdlog::logger> core_logger)
    : core_logger(std::move(core_logger)) {}

void ActivityLog::operation_started(const std::string& operation_id, const std::string& details) const
{
    if (!core_logger) {
        return;
    }
    if (details.empty()) {
        core_logger->info("Starting operation: {}", operation_id);
    } else {
        core_logger->info("Starting operation: {} | {}", operation_id, details);
    }
}

void ActivityLog::operation_succeeded(const std::string& operation_id, const std::string& details) const
{
    if (!core_logger) {
        return;
    }
    if (details.empty()) {
        core_logger->info("Completed operation: {}", operation_id);
    } else {
        core_logger->info("Completed operation: {} | {}", operation_id, details);
    }
}

void ActivityLog::operation_failed(const std::string& operation_id, const std::string& error) const
{
    if (core_logger) {
        core_logger->error("Failed operation: {} | Error: {}", operation_id, error);
    }
}

void ActivityLog::file_action(std::string_view action,
                              const std::string& source,
                              const std::string& destination,
                              bool dry_run) const
{
    if (!core_logger) {
        return;
    }
    const std::string prefix = dry_run ? "[DRY RUN] " : "";
    if (destination.empty()) {
        core_logger->info("{}{}: {}", prefix, action, source);
    } else {
        core_logger->info("{}{}: {} -> {}", prefix, action, source, destination);
    }
}

void ActivityLog::stats(const std::string& title,
                        const std::vector<std::pair<std::string, std::string>>& entries) const
{
    if (!core_logger) {
        return;
    }
    core_logger->info("{}:", title);
    for (const auto& [key, value] : entries) {
        core_logger->info("   {}: {}", key, value);
    }
}

void ActivityLog::dry_run_summary(std::size_t total_files,
                                  const std::vector<std::pair<std::string, std::size_t>>& actions) const
{
    if (!core_logger) {
        return;
    }
    core_logger->info("DRY RUN SUMMARY - {} files would be processed:", total_files);
    for (const auto& [action, count] : actions) {
        if (count > 0) {
            core_logger->info("   {}: {} files", action, count);
        }
    }
}

std::string ActivityLog::make_operation_id(std::string_view prefix)
{
    const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return fmt::format("{}_{}", prefix, seconds);
}
