#ifndef CONFLICT_RESOLVER_HPP
#define CONFLICT_RESOLVER_HPP

#include "Types.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

/**
 * @brief Facts about one (source, occupied destination) pair.
 *
 * Sizes and modification times are read at construction. Content digests
 * are computed on first request only, at most once per side.
 */
class ConflictInfo {
public:
    ConflictInfo(std::filesystem::path source, std::filesystem::path destination);

    const std::filesystem::path& source() const { return source_path; }
    const std::filesystem::path& destination() const { return destination_path; }
    bool source_exists() const { return source_present; }
    bool destination_exists() const { return destination_present; }
    std::uintmax_t source_size() const { return source_bytes; }
    std::uintmax_t destination_size() const { return destination_bytes; }
    const std::optional<TimePoint>& source_mtime() const { return source_modified; }
    const std::optional<TimePoint>& destination_mtime() const { return destination_modified; }

    const std::optional<std::string>& source_hash();
    const std::optional<std::string>& destination_hash();

    // Same size and same digest; false when either side is missing or unreadable.
    bool are_files_identical();

private:
    std::filesystem::path source_path;
    std::filesystem::path destination_path;
    bool source_present{false};
    bool destination_present{false};
    std::uintmax_t source_bytes{0};
    std::uintmax_t destination_bytes{0};
    std::optional<TimePoint> source_modified;
    std::optional<TimePoint> destination_modified;
    bool source_hashed{false};
    bool destination_hashed{false};
    std::optional<std::string> source_digest;
    std::optional<std::string> destination_digest;
};

struct ConflictDetail {
    std::string source;
    std::string destination;
    std::uintmax_t source_size{0};
    std::uintmax_t dest_size{0};
    bool identical{false};
    std::string recommendation; ///< skip_identical, overwrite_larger, overwrite_newer or rename_safe
};

struct ConflictAnalysis {
    std::size_t total_files{0};
    std::size_t conflicts{0};
    std::size_t identical_files{0};
    std::size_t size_conflicts{0};
    std::size_t date_conflicts{0};
    std::size_t potential_overwrites{0};
    std::vector<ConflictDetail> conflict_details;
};

struct ConflictStats {
    std::size_t total_conflicts{0};
    std::map<std::string, std::size_t> resolution_strategies;
    std::optional<std::string> backup_directory; ///< set once the folder exists
};

/**
 * @brief Decides where a file goes when its destination is already taken.
 *
 * resolve() returns the final destination or throws ConflictUnresolvable
 * when the strategy declines the file. Filesystem failures while deleting or
 * backing up the existing file surface as OperationError. Under dry_run no
 * file is touched, but counters still move so previews and real runs report
 * the same shape of statistics.
 */
class ConflictResolver {
public:
    static constexpr int kMaxRenameAttempts = 9999;

    explicit ConflictResolver(ConflictStrategy default_strategy = ConflictStrategy::Rename,
                              const std::filesystem::path& backup_root = "backup",
                              std::shared_ptr<spdlog::logger> core_logger = nullptr);

    std::filesystem::path resolve(const std::filesystem::path& source,
                                  const std::filesystem::path& destination,
                                  std::optional<ConflictStrategy> strategy = std::nullopt,
                                  bool dry_run = false);

    std::string generate_safe_filename(const std::string& filename,
                                       const std::filesystem::path& directory,
                                       int max_attempts = kMaxRenameAttempts) const;

    // Read-only pass over the files that would collide in @p destination_dir.
    ConflictAnalysis analyze_conflicts(const std::vector<std::string>& source_files,
                                       const std::filesystem::path& destination_dir) const;

    ConflictStats get_conflict_stats() const;

    void set_default_strategy(ConflictStrategy strategy);
    ConflictStrategy get_default_strategy() const;

    void set_backup_directory(const std::filesystem::path& directory);
    std::filesystem::path get_backup_directory() const;

private:
    std::filesystem::path resolve_skip(ConflictInfo& conflict) const;
    std::filesystem::path resolve_rename(ConflictInfo& conflict) const;
    std::filesystem::path resolve_overwrite(ConflictInfo& conflict, bool dry_run) const;
    std::filesystem::path resolve_backup(ConflictInfo& conflict, bool dry_run) const;
    std::filesystem::path resolve_size_compare(ConflictInfo& conflict, bool dry_run) const;
    std::filesystem::path resolve_date_compare(ConflictInfo& conflict, bool dry_run) const;
    std::filesystem::path resolve_hash_compare(ConflictInfo& conflict, bool dry_run) const;

    mutable std::mutex mutex;
    ConflictStrategy default_strategy;
    std::filesystem::path backup_dir;
    std::size_t conflict_count{0};
    std::map<std::string, std::size_t> resolution_stats;
    std::shared_ptr<spdlog::logger> core_logger;
};

#endif
