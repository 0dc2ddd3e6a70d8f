#include "CategoryClassifier.hpp"
#include "Errors.hpp"
#include "MimeTypes.hpp"
#include "PathValidator.hpp"
#include "Utils.hpp"

#include <algorithm>
#include <fstream>
#include <system_error>

#include <fmt/format.h>

namespace fs = std::filesystem;

namespace {

// Suffixes of a file name the way "a.tar.gz" -> {".tar", ".gz"}; leading
// dots belong to the stem, a trailing dot yields no suffix.
std::vector<std::string> name_suffixes(const std::string& file_name)
{
    std::vector<std::string> suffixes;
    if (file_name.empty() || file_name.back() == '.') {
        return suffixes;
    }
    const auto stem_start = file_name.find_first_not_of('.');
    if (stem_start == std::string::npos) {
        return suffixes;
    }
    auto pos = file_name.find('.', stem_start);
    while (pos != std::string::npos) {
        const auto next = file_name.find('.', pos + 1);
        suffixes.push_back(file_name.substr(pos, next == std::string::npos ? std::string::npos : next - pos));
        pos = next;
    }
    return suffixes;
}

bool contains_extension(const std::vector<std::string>& extensions, const std::string& extension)
{
    return std::find(extensions.begin(), extensions.end(), extension) != extensions.end();
}

} // namespace

CategoryClassifier::CategoryClassifier(const PathValidator& validator,
                                       CategoryTable categories,
                                       std::shared_ptr<spdlog::logger> core_logger)
    : validator(validator),
      categories(std::move(categories)),
      core_logger(std::move(core_logger))
{
    rebuild_extension_map();
}

CategoryTable CategoryClassifier::default_categories()
{
    return {
        {"Documents", {".pdf", ".doc", ".docx", ".txt", ".rtf", ".odt", ".pages",
                       ".xls", ".xlsx", ".csv", ".ods", ".numbers",
                       ".ppt", ".pptx", ".odp", ".key",
                       ".epub", ".mobi", ".azw", ".azw3"}},
        {"Images", {".jpg", ".jpeg", ".png", ".gif", ".bmp", ".tiff", ".tif",
                    ".svg", ".webp", ".ico", ".raw", ".cr2", ".nef", ".arw",
                    ".heic", ".heif", ".avif"}},
        {"Videos", {".mp4", ".avi", ".mkv", ".mov", ".wmv", ".flv", ".webm",
                    ".m4v", ".3gp", ".mpg", ".mpeg", ".m2v", ".asf"}},
        {"Audio", {".mp3", ".wav", ".flac", ".aac", ".ogg", ".wma", ".m4a",
                   ".opus", ".aiff", ".au", ".ra", ".ape"}},
        {"Archives", {".zip", ".rar", ".7z", ".tar", ".gz", ".bz2", ".xz",
                      ".tar.gz", ".tar.bz2", ".tar.xz", ".dmg", ".iso"}},
        {"Code", {".py", ".js", ".html", ".css", ".cpp", ".c", ".h", ".hpp",
                  ".java", ".php", ".rb", ".go", ".rs", ".swift", ".kt",
                  ".ts", ".jsx", ".tsx", ".vue", ".sql", ".json", ".xml",
                  ".yaml", ".yml", ".toml", ".ini", ".cfg", ".conf"}},
        {"Executables", {".exe", ".msi", ".app", ".deb", ".rpm", ".dmg", ".pkg",
                         ".apk", ".ipa", ".appx", ".snap"}},
        {"Fonts", {".ttf", ".otf", ".woff", ".woff2", ".eot", ".pfb", ".pfm"}},
        {"3D_Models", {".obj", ".fbx", ".dae", ".3ds", ".blend", ".max", ".ma", ".mb",
                       ".c4d", ".lwo", ".lws", ".ply", ".stl"}},
        {"CAD", {".dwg", ".dxf", ".step", ".stp", ".iges", ".igs", ".sat",
                 ".parasolid", ".x_t", ".x_b"}},
        {"eBooks", {".epub", ".mobi", ".azw", ".azw3", ".fb2", ".lit", ".pdb"}},
        {"Spreadsheets", {".xls", ".xlsx", ".csv", ".ods", ".numbers", ".tsv"}},
    };
}

std::string CategoryClassifier::normalize_extension(const std::string& extension)
{
    std::string normalized = Utils::to_lower_copy(Utils::trim_copy(extension));
    if (normalized.empty() || normalized == ".") {
        return std::string();
    }
    if (normalized.front() != '.') {
        normalized.insert(normalized.begin(), '.');
    }
    return normalized;
}

void CategoryClassifier::rebuild_extension_map()
{
    extension_map.clear();
    for (const auto& category : categories) {
        for (const auto& raw : category.extensions) {
            const std::string extension = normalize_extension(raw);
            if (extension.empty()) {
                continue;
            }
            auto [it, inserted] = extension_map.try_emplace(extension, category.name);
            if (!inserted && it->second != category.name) {
                if (core_logger) {
                    core_logger->debug("Extension conflict: {} mapped to {} (was {})",
                                       extension, category.name, it->second);
                }
                it->second = category.name;
            }
        }
    }
}

std::optional<std::string> CategoryClassifier::category_for_extension(const std::string& extension) const
{
    const auto it = extension_map.find(normalize_extension(extension));
    if (it == extension_map.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> CategoryClassifier::match_extension(const fs::path& path) const
{
    const auto suffixes = name_suffixes(Utils::path_to_utf8(path.filename()));
    if (suffixes.size() >= 2) {
        const std::string compound = Utils::to_lower_copy(suffixes[suffixes.size() - 2] + suffixes.back());
        if (const auto it = extension_map.find(compound); it != extension_map.end()) {
            return it->second;
        }
    }
    if (!suffixes.empty()) {
        if (const auto it = extension_map.find(Utils::to_lower_copy(suffixes.back())); it != extension_map.end()) {
            return it->second;
        }
    }
    return std::nullopt;
}

std::optional<std::string> CategoryClassifier::match_signature(const fs::path& path) const
{
    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
        return std::nullopt;
    }
    std::string header(MimeTypes::kSignatureProbeSize, '\0');
    stream.read(header.data(), static_cast<std::streamsize>(header.size()));
    header.resize(static_cast<std::size_t>(stream.gcount()));
    return MimeTypes::category_for_signature(header);
}

ClassificationResult CategoryClassifier::classify(const std::string& file_path) const
{
    fs::path path;
    try {
        path = validator.validate_file_path(file_path);
    } catch (const ValidationError& e) {
        if (core_logger) {
            core_logger->error("Cannot categorize file {}: {}", file_path, e.what());
        }
        return {kUncategorized, ClassificationMethod::Error};
    }

    if (auto category = match_extension(path)) {
        return {*category, ClassificationMethod::Extension};
    }
    if (const auto mime = MimeTypes::guess_from_filename(Utils::path_to_utf8(path.filename()))) {
        if (auto category = MimeTypes::category_for_mime(*mime)) {
            return {*category, ClassificationMethod::Mime};
        }
    }
    if (auto category = match_signature(path)) {
        return {*category, ClassificationMethod::Magic};
    }
    return {kUncategorized, ClassificationMethod::Unknown};
}

FileGroups CategoryClassifier::classify_all(const std::vector<std::string>& file_paths) const
{
    FileGroups groups;
    std::size_t categorized = 0;
    std::size_t uncategorized = 0;
    std::size_t errors = 0;

    for (const auto& file_path : file_paths) {
        const auto result = classify(file_path);
        append_to_group(groups, result.category, file_path);

        if (result.method == ClassificationMethod::Error) {
            ++errors;
        } else if (result.category == kUncategorized) {
            ++uncategorized;
        } else {
            ++categorized;
        }

        if (core_logger) {
            core_logger->debug("{} -> {} ({})",
                               Utils::path_to_utf8(Utils::utf8_to_path(file_path).filename()),
                               result.category, to_string(result.method));
        }
    }

    if (core_logger) {
        core_logger->info("Categorization complete: {} files, {} categorized, {} uncategorized, {} errors",
                          file_paths.size(), categorized, uncategorized, errors);
    }
    return groups;
}

void CategoryClassifier::add_category(const std::string& name, const std::vector<std::string>& extensions)
{
    const std::string category_name = Utils::trim_copy(name);
    if (category_name.empty()) {
        throw ConfigurationError("Category name must not be empty");
    }
    if (category_name == kUncategorized) {
        throw ConfigurationError(fmt::format("Category name '{}' is reserved", category_name));
    }

    std::vector<std::string> normalized;
    for (const auto& extension : extensions) {
        std::string value = normalize_extension(extension);
        if (!value.empty() && !contains_extension(normalized, value)) {
            normalized.push_back(std::move(value));
        }
    }
    if (normalized.empty()) {
        throw ConfigurationError(fmt::format("Category '{}' needs at least one extension", category_name));
    }

    const auto count = normalized.size();
    auto it = std::find_if(categories.begin(), categories.end(),
                           [&](const Category& category) { return category.name == category_name; });
    if (it != categories.end()) {
        it->extensions = std::move(normalized);
    } else {
        categories.push_back(Category{category_name, std::move(normalized)});
    }
    rebuild_extension_map();

    if (core_logger) {
        core_logger->info("Added custom category '{}' with {} extensions", category_name, count);
    }
}

void CategoryClassifier::remove_category(const std::string& name)
{
    auto it = std::find_if(categories.begin(), categories.end(),
                           [&](const Category& category) { return category.name == name; });
    if (it == categories.end()) {
        if (core_logger) {
            core_logger->warn("Category '{}' not found", name);
        }
        throw ConfigurationError(fmt::format("Category '{}' not found", name));
    }
    categories.erase(it);
    rebuild_extension_map();

    if (core_logger) {
        core_logger->info("Removed category '{}'", name);
    }
}

void CategoryClassifier::set_categories(CategoryTable table)
{
    categories = std::move(table);
    rebuild_extension_map();
}

std::set<std::string> CategoryClassifier::get_supported_extensions() const
{
    std::set<std::string> extensions;
    for (const auto& [extension, category] : extension_map) {
        extensions.insert(extension);
    }
    return extensions;
}

std::vector<CategoryStats> CategoryClassifier::get_category_stats(const FileGroups& groups) const
{
    std::vector<CategoryStats> stats;
    const std::size_t total_files = count_grouped_files(groups);

    for (const auto& group : groups) {
        CategoryStats entry;
        entry.category = group.name;
        entry.file_count = group.files.size();

        for (const auto& file : group.files) {
            std::error_code ec;
            const auto size = fs::file_size(Utils::utf8_to_path(file), ec);
            if (!ec) {
                entry.total_size_bytes += size;
                ++entry.accessible_files;
            }
        }
        entry.inaccessible_files = entry.file_count - entry.accessible_files;
        entry.percentage = total_files > 0
            ? Utils::round_to(static_cast<double>(entry.file_count) * 100.0 / static_cast<double>(total_files), 1)
            : 0.0;
        entry.total_size_mb = Utils::bytes_to_mb(entry.total_size_bytes);
        stats.push_back(std::move(entry));
    }
    return stats;
}

std::optional<std::string> CategoryClassifier::suggest_category(const std::string& extension)
{
    const std::string ext = normalize_extension(extension);
    if (ext == ".txt" || ext == ".md" || ext == ".rst") {
        return std::string("Documents");
    }
    if (ext == ".log" || ext == ".cfg" || ext == ".ini") {
        return std::string("System");
    }
    if ((ext.size() >= 2 && ext.compare(ext.size() - 2, 2, "rc") == 0)
        || ext == ".sh" || ext == ".bat" || ext == ".ps1") {
        return std::string("Scripts");
    }
    if (ext == ".tmp" || ext == ".temp" || ext == ".bak" || ext == ".old") {
        return std::string("Temporary");
    }
    return std::nullopt;
}
