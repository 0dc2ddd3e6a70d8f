#ifndef ACTIVITY_LOG_HPP
#define ACTIVITY_LOG_HPP

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

/**
 * @brief Structured operation events (start, success, failure, file actions)
 * written through a leveled spdlog logger. A null logger turns every call
 * into a no-op.
 */
class ActivityLog {
public:
    explicit ActivityLog(std::shared_ptr<spdlog::logger> core_logger);

    void operation_started(const std::string& operation_id, const std::string& details = std::string()) const;
    void operation_succeeded(const std::string& operation_id, const std::string& details = std::string()) const;
    void operation_failed(const std::string& operation_id, const std::string& error) const;

    void file_action(std::string_view action,
                     const std::string& source,
                     const std::string& destination,
                     bool dry_run) const;

    void stats(const std::string& title,
               const std::vector<std::pair<std::string, std::string>>& entries) const;
    void dry_run_summary(std::size_t total_files,
                         const std::vector<std::pair<std::string, std::size_t>>& actions) const;

    static std::string make_operation_id(std::string_view prefix);

private:
    std::shared_ptr<spdlog::logger> core_logger;
};

#endif
