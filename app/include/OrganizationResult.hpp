#ifndef ORGANIZATION_RESULT_HPP
#define ORGANIZATION_RESULT_HPP

#include "Types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

struct GroupTally {
    std::size_t count{0};
    std::uintmax_t size{0};
};

struct SkippedFile {
    std::string file;
    std::string reason;
};

struct OrganizationSummary {
    std::size_t total_files{0};
    std::size_t processed_files{0};
    std::size_t skipped_files{0};
    std::size_t error_files{0};
    double success_rate{0.0};   ///< percent, one decimal
    std::size_t categories_created{0};
    std::size_t conflicts_resolved{0};
    double total_size_mb{0.0};  ///< two decimals
    double operation_time{0.0}; ///< seconds, two decimals
    bool dry_run{false};
    bool stopped{false};
    std::vector<std::pair<std::string, GroupTally>> processed_categories;
};

/**
 * @brief Accumulator for one organize or batch run. Built up file by file
 * and handed back to the caller once the run ends.
 */
struct OrganizationResult {
    std::size_t total_files{0};
    std::size_t processed_files{0};
    std::size_t skipped_files{0};
    std::size_t error_files{0};
    std::size_t categories_created{0};
    std::size_t conflicts_resolved{0};
    std::uintmax_t total_size_moved{0};
    double operation_time{0.0};
    bool dry_run{false};
    bool stopped{false};
    std::vector<FileError> errors;
    std::vector<SkippedFile> skipped;
    std::vector<std::pair<std::string, GroupTally>> processed_categories; ///< first-seen order

    void add_error(const std::string& file, const std::string& message);
    void add_processed_file(const std::string& file, const std::string& group, std::uintmax_t size);
    void add_skipped_file(const std::string& file, const std::string& reason);

    double success_rate() const;
    OrganizationSummary get_summary() const;
};

#endif
