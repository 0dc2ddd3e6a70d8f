#include "Types.hpp"
#include "Utils.hpp"

#include <algorithm>

namespace {

// Lowercases and folds '-' into '_' so "size-compare" and "size_compare" agree.
std::string normalize_token(std::string_view value) {
    std::string token = Utils::to_lower_copy(Utils::trim_copy(std::string(value)));
    std::replace(token.begin(), token.end(), '-', '_');
    return token;
}

} // namespace

std::optional<DateSource> date_source_from_string(std::string_view value) {
    const std::string token = normalize_token(value);
    if (token == "auto" || token == "auto_detect") return DateSource::Auto;
    if (token == "exif" || token == "embedded" || token == "metadata") return DateSource::EmbeddedMetadata;
    if (token == "filename" || token == "filename_pattern") return DateSource::FilenamePattern;
    if (token == "creation" || token == "created") return DateSource::CreationTime;
    if (token == "modification" || token == "modified") return DateSource::ModificationTime;
    if (token == "access" || token == "accessed") return DateSource::AccessTime;
    return std::nullopt;
}

std::optional<DateFormat> date_format_from_string(std::string_view value) {
    const std::string token = Utils::to_upper_copy(Utils::trim_copy(std::string(value)));
    if (token == "YYYY") return DateFormat::Year;
    if (token == "YYYY-MM") return DateFormat::YearMonth;
    if (token == "YYYY-MM-DD") return DateFormat::YearMonthDay;
    if (token == "YYYY-QQ") return DateFormat::YearQuarter;
    if (token == "YYYY-WW") return DateFormat::YearWeek;
    if (token == "MM-YYYY") return DateFormat::MonthYear;
    if (token == "MMM-YYYY") return DateFormat::MonthNameYear;
    if (token == "YYYY-MMM") return DateFormat::YearMonthName;
    if (token == "YYYY-MMMM") return DateFormat::YearFullMonthName;
    if (token == "CUSTOM") return DateFormat::Custom;
    return std::nullopt;
}

std::optional<ConflictStrategy> conflict_strategy_from_string(std::string_view value) {
    const std::string token = normalize_token(value);
    if (token == "skip") return ConflictStrategy::Skip;
    if (token == "rename") return ConflictStrategy::Rename;
    if (token == "overwrite") return ConflictStrategy::Overwrite;
    if (token == "backup") return ConflictStrategy::Backup;
    if (token == "size_compare") return ConflictStrategy::SizeCompare;
    if (token == "date_compare") return ConflictStrategy::DateCompare;
    if (token == "hash_compare") return ConflictStrategy::HashCompare;
    return std::nullopt;
}

std::optional<OperationType> operation_type_from_string(std::string_view value) {
    const std::string token = normalize_token(value);
    if (token == "move") return OperationType::Move;
    if (token == "copy") return OperationType::Copy;
    return std::nullopt;
}

std::optional<PreviewMode> preview_mode_from_string(std::string_view value) {
    const std::string token = normalize_token(value);
    if (token == "type") return PreviewMode::Type;
    if (token == "date") return PreviewMode::Date;
    return std::nullopt;
}

void append_to_group(FileGroups& groups, const std::string& name, const std::string& file) {
    auto it = std::find_if(groups.begin(), groups.end(), [&](const FileGroup& group) {
        return group.name == name;
    });
    if (it == groups.end()) {
        groups.push_back(FileGroup{name, {file}});
        return;
    }
    it->files.push_back(file);
}

const FileGroup* find_group(const FileGroups& groups, const std::string& name) {
    auto it = std::find_if(groups.begin(), groups.end(), [&](const FileGroup& group) {
        return group.name == name;
    });
    return it == groups.end() ? nullptr : &*it;
}

std::size_t count_grouped_files(const FileGroups& groups) {
    std::size_t total = 0;
    for (const auto& group : groups) {
        total += group.files.size();
    }
    return total;
}
