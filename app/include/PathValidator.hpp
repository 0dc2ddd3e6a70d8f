#ifndef PATH_VALIDATOR_HPP
#define PATH_VALIDATOR_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

struct LargeFileInfo {
    std::string path;
    std::uintmax_t size_bytes{0};
};

struct SafetyReport {
    std::size_t total_files{0};
    std::size_t accessible_files{0};
    std::size_t locked_files{0};
    std::size_t hidden_files{0};
    std::size_t system_files{0};
    std::vector<LargeFileInfo> large_files;
    std::vector<std::string> warnings;
    std::size_t suppressed_warnings{0};

    /// Safe iff (locked + system) / total < 0.1; an empty tree is safe.
    bool is_safe() const;
};

/**
 * @brief Gatekeeper for every path the organizer touches.
 *
 * All validate_* calls throw ValidationError with a human readable message.
 * The locked-file check is a best-effort open attempt and only a hint: the
 * real move or copy can still fail and must be handled by the caller.
 */
class PathValidator {
public:
    static constexpr std::uintmax_t kLargeFileThreshold = 100ULL * 1024ULL * 1024ULL;
    static constexpr std::size_t kMaxWarnings = 50;
    static constexpr double kMaxProblemRatio = 0.1;
    static constexpr double kFreeSpaceHeadroom = 1.1;

    explicit PathValidator(std::shared_ptr<spdlog::logger> core_logger = nullptr);

    std::filesystem::path validate_source_directory(const std::string& path) const;
    std::filesystem::path validate_destination_directory(const std::string& path,
                                                         bool create_if_missing = true) const;
    // A symlink to a regular file is accepted and returned as the link's own
    // path; its target is never substituted.
    std::filesystem::path validate_file_path(const std::string& path) const;

    // Returns the resolved (source, destination). Under dry_run a missing
    // destination folder is accepted instead of being created.
    std::pair<std::filesystem::path, std::filesystem::path>
        validate_move_operation(const std::string& source, const std::string& destination, bool dry_run = false) const;
    std::pair<std::filesystem::path, std::filesystem::path>
        validate_copy_operation(const std::string& source, const std::string& destination, bool dry_run = false) const;

    SafetyReport scan_directory_safety(const std::string& directory) const;
    bool is_safe_to_organize(const std::string& directory) const;

    bool is_file_accessible(const std::filesystem::path& path) const;
    bool has_free_space_for(const std::filesystem::path& source_file,
                            const std::filesystem::path& destination_dir) const;

    static bool is_hidden_file(const std::filesystem::path& path);
    static bool is_system_file(const std::filesystem::path& path);
    static bool has_read_permission(const std::filesystem::path& path);
    static bool has_write_permission(const std::filesystem::path& path);

private:
    static std::filesystem::path resolve(const std::string& path);
    void check_destination_parent(const std::filesystem::path& dir, bool dry_run) const;
    bool is_directory_listable(const std::filesystem::path& path) const;

    std::shared_ptr<spdlog::logger> core_logger;
};

#endif
