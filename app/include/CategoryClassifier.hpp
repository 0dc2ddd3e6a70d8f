#ifndef CATEGORY_CLASSIFIER_HPP
#define CATEGORY_CLASSIFIER_HPP

#include "Types.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include <spdlog/spdlog.h>

class PathValidator;

struct Category {
    std::string name;
    std::vector<std::string> extensions; ///< lowercase, leading dot
};

// Registration order matters: when two categories claim an extension the
// later one wins.
using CategoryTable = std::vector<Category>;

struct ClassificationResult {
    std::string category;
    ClassificationMethod method{ClassificationMethod::Unknown};
};

struct CategoryStats {
    std::string category;
    std::size_t file_count{0};
    double percentage{0.0};
    std::uintmax_t total_size_bytes{0};
    double total_size_mb{0.0};
    std::size_t accessible_files{0};
    std::size_t inaccessible_files{0};
};

class CategoryClassifier {
public:
    static constexpr const char* kUncategorized = "Uncategorized";

    CategoryClassifier(const PathValidator& validator,
                       CategoryTable categories,
                       std::shared_ptr<spdlog::logger> core_logger = nullptr);

    static CategoryTable default_categories();
    static std::string normalize_extension(const std::string& extension);

    /**
     * @brief Picks a category for one file: compound extension, single
     * extension, MIME guess from the name, then leading-byte signature.
     * Never throws; a path that fails validation yields method Error.
     */
    ClassificationResult classify(const std::string& file_path) const;

    // Buckets files by category keeping first-seen order; logs a tally.
    FileGroups classify_all(const std::vector<std::string>& file_paths) const;

    // Both throw ConfigurationError and leave the table untouched on failure.
    void add_category(const std::string& name, const std::vector<std::string>& extensions);
    void remove_category(const std::string& name);

    void set_categories(CategoryTable categories);
    const CategoryTable& get_all_categories() const { return categories; }
    std::set<std::string> get_supported_extensions() const;
    std::optional<std::string> category_for_extension(const std::string& extension) const;

    std::vector<CategoryStats> get_category_stats(const FileGroups& groups) const;

    static std::optional<std::string> suggest_category(const std::string& extension);

private:
    void rebuild_extension_map();
    std::optional<std::string> match_extension(const std::filesystem::path& path) const;
    std::optional<std::string> match_signature(const std::filesystem::path& path) const;

    const PathValidator& validator;
    CategoryTable categories;
    std::unordered_map<std::string, std::string> extension_map;
    std::shared_ptr<spdlog::logger> core_logger;
};

#endif
