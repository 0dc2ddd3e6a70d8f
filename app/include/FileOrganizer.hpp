#ifndef FILE_ORGANIZER_HPP
#define FILE_ORGANIZER_HPP

#include "ActivityLog.hpp"
#include "DateExtractor.hpp"
#include "OrganizationResult.hpp"
#include "Types.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

class PathValidator;
class CategoryClassifier;
class ConflictResolver;

struct DateOrganizeOptions {
    DateFormat format{DateFormat::YearMonth};
    DateSource source{DateSource::Auto};
    std::optional<DateRange> range;
    std::string custom_format; ///< used when format is Custom
};

struct BatchOperation {
    std::string type; ///< "move" or "copy"
    std::string source;
    std::string destination;
};

// One committed move, enough to put the file back.
struct RollbackEntry {
    std::filesystem::path original_path;
    std::filesystem::path current_path;
};

struct GroupPreview {
    std::string name;
    std::size_t file_count{0};
    std::uintmax_t total_size_bytes{0};
    double total_size_mb{0.0};
};

struct PreviewReport {
    PreviewMode mode{PreviewMode::Type};
    std::size_t total_files{0};
    std::size_t estimated_folders{0};
    std::vector<GroupPreview> groups;
    FileGroups file_mappings;
    std::optional<std::string> error; ///< set when the source directory was rejected
};

/**
 * @brief Scans a source tree, buckets the files by category or date and
 * moves them into per-group folders.
 *
 * Directory-level validation failures end the run with a single
 * "OPERATION" error. Everything that goes wrong for one file is recorded in
 * the result and the loop moves on to the next file. The engine holds no
 * locks: callers must not run two invocations over overlapping trees.
 */
class FileOrganizer {
public:
    static constexpr const char* kOperationErrorKey = "OPERATION";

    FileOrganizer(const PathValidator& validator,
                  const CategoryClassifier& classifier,
                  const DateExtractor& date_extractor,
                  ConflictResolver& conflict_resolver,
                  std::shared_ptr<spdlog::logger> core_logger = nullptr);

    OrganizationResult organize_by_type(const std::string& source_dir,
                                        const std::optional<std::string>& destination_dir = std::nullopt,
                                        bool dry_run = false,
                                        bool create_subdirs = true,
                                        const ProgressCallback& on_progress = {},
                                        const std::atomic<bool>* stop_flag = nullptr);

    OrganizationResult organize_by_date(const std::string& source_dir,
                                        const std::optional<std::string>& destination_dir = std::nullopt,
                                        bool dry_run = false,
                                        const DateOrganizeOptions& options = {},
                                        const ProgressCallback& on_progress = {},
                                        const std::atomic<bool>* stop_flag = nullptr);

    /**
     * @brief Moves one file, resolving a conflict at @p destination first.
     * @return The path the file ended up at (or would, under dry_run).
     *
     * Throws ValidationError, ConflictUnresolvable or OperationError. A
     * committed move is appended to the rollback log.
     */
    std::filesystem::path move_file(const std::string& source,
                                    const std::string& destination,
                                    bool dry_run = false);

    // Same contract as move_file; also requires 10% free-space headroom.
    std::filesystem::path copy_file(const std::string& source,
                                    const std::string& destination,
                                    bool dry_run = false);

    OrganizationResult batch_operation(const std::vector<BatchOperation>& operations,
                                       bool dry_run = false,
                                       const ProgressCallback& on_progress = {},
                                       const std::atomic<bool>* stop_flag = nullptr);

    // Stat and read only; never creates, moves or deletes anything.
    PreviewReport get_organization_preview(const std::string& source_dir, PreviewMode mode) const;

    // Regular files below @p directory, hidden entries excluded, sorted by path.
    std::vector<std::string> scan_files(const std::filesystem::path& directory) const;

    const std::vector<RollbackEntry>& rollback_log() const { return rollback_entries; }
    void clear_rollback_log() { rollback_entries.clear(); }

    /**
     * @brief Best-effort undo of the logged moves, newest first.
     * Entries that cannot be restored stay in the log.
     * @return Number of files put back.
     */
    std::size_t undo_moves();

private:
    struct RunContext {
        std::string operation_id;
        bool dry_run{false};
        const ProgressCallback& on_progress;
        const std::atomic<bool>* stop_flag{nullptr};
    };

    // Throws ValidationError; the destination defaults to the source.
    void prepare_directories(const std::string& source_dir,
                             const std::optional<std::string>& destination_dir,
                             bool dry_run,
                             std::filesystem::path& source_root,
                             std::filesystem::path& destination_root) const;
    bool ensure_group_directory(const std::filesystem::path& directory,
                                bool dry_run,
                                OrganizationResult& result) const;
    void process_group(const FileGroup& group,
                       const std::filesystem::path& group_dir,
                       RunContext& context,
                       OrganizationResult& result);
    void place_file(const std::string& file,
                    const std::string& group,
                    const std::filesystem::path& group_dir,
                    bool dry_run,
                    OrganizationResult& result);
    void relocate(const std::filesystem::path& source, const std::filesystem::path& destination);
    void duplicate(const std::filesystem::path& source, const std::filesystem::path& destination) const;
    // rename, or copy-and-remove across devices; a symlink stays a symlink.
    void transfer(const std::filesystem::path& source, const std::filesystem::path& destination) const;
    void report_progress(const RunContext& context,
                         const OrganizationResult& result,
                         const std::string& file,
                         const std::string& group) const;
    static bool stop_requested(const RunContext& context);
    void finish(const std::string& operation_id,
                OrganizationResult& result,
                std::chrono::steady_clock::time_point started) const;

    const PathValidator& validator;
    const CategoryClassifier& classifier;
    const DateExtractor& date_extractor;
    ConflictResolver& conflict_resolver;
    ActivityLog activity;
    std::vector<RollbackEntry> rollback_entries;
    std::shared_ptr<spdlog::logger> core_logger;
};

#endif
