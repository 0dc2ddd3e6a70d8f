#include "CategoryConfigStore.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <optional>
#include <system_error>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

using CategoryEntries = std::vector<std::pair<std::string, std::vector<std::string>>>;

Category* find_category(CategoryTable& table, const std::string& name)
{
    auto it = std::find_if(table.begin(), table.end(),
                           [&](const Category& category) { return category.name == name; });
    return it == table.end() ? nullptr : &*it;
}

std::optional<CategoryEntries> read_category_file(const std::filesystem::path& path)
{
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::nullopt;
    }

    auto logger = Logger::get_logger("core_logger");
    std::ifstream stream(path);
    if (!stream) {
        if (logger) {
            logger->warn("Could not open category config: {}", Utils::path_to_utf8(path));
        }
        return std::nullopt;
    }

    try {
        json data;
        stream >> data;
        auto categories = data.find("categories");
        if (categories == data.end() || !categories->is_object()) {
            if (logger) {
                logger->warn("Category config {} has no `categories` object", Utils::path_to_utf8(path));
            }
            return std::nullopt;
        }

        CategoryEntries entries;
        for (const auto& [name, extensions] : categories->items()) {
            std::vector<std::string> normalized;
            for (const auto& ext : extensions.get<std::vector<std::string>>()) {
                auto value = CategoryClassifier::normalize_extension(ext);
                if (!value.empty()) {
                    normalized.push_back(std::move(value));
                }
            }
            entries.emplace_back(name, std::move(normalized));
        }
        if (logger) {
            logger->debug("Loaded category configuration: {}", Utils::path_to_utf8(path));
        }
        return entries;
    } catch (const json::exception& e) {
        if (logger) {
            logger->warn("Could not load category config {}: {}", Utils::path_to_utf8(path), e.what());
        }
        return std::nullopt;
    }
}

} // namespace

CategoryConfigStore::CategoryConfigStore(std::string config_dir)
    : config_dir(std::move(config_dir)) {}

std::string CategoryConfigStore::default_file() const
{
    return Utils::path_to_utf8(Utils::utf8_to_path(config_dir) / "default_categories.json");
}

std::string CategoryConfigStore::custom_file() const
{
    return Utils::path_to_utf8(Utils::utf8_to_path(config_dir) / "custom_categories.json");
}

CategoryTable CategoryConfigStore::load() const
{
    CategoryTable table = CategoryClassifier::default_categories();

    if (const auto defaults = read_category_file(Utils::utf8_to_path(default_file()))) {
        for (const auto& [name, extensions] : *defaults) {
            if (Category* existing = find_category(table, name)) {
                existing->extensions.insert(existing->extensions.end(), extensions.begin(), extensions.end());
            } else {
                table.push_back(Category{name, extensions});
            }
        }
    }

    if (const auto custom = read_category_file(Utils::utf8_to_path(custom_file()))) {
        for (const auto& [name, extensions] : *custom) {
            if (Category* existing = find_category(table, name)) {
                existing->extensions = extensions;
            } else {
                table.push_back(Category{name, extensions});
            }
        }
    }

    return table;
}

bool CategoryConfigStore::save(const CategoryTable& categories) const
{
    const CategoryTable defaults = CategoryClassifier::default_categories();
    json custom_only = json::object();
    for (const auto& category : categories) {
        const auto it = std::find_if(defaults.begin(), defaults.end(),
                                     [&](const Category& entry) { return entry.name == category.name; });
        if (it == defaults.end() || it->extensions != category.extensions) {
            custom_only[category.name] = category.extensions;
        }
    }

    auto logger = Logger::get_logger("core_logger");
    std::error_code ec;
    std::filesystem::create_directories(Utils::utf8_to_path(config_dir), ec);
    if (ec) {
        if (logger) {
            logger->error("Failed to create config directory {}: {}", config_dir, ec.message());
        }
        return false;
    }

    std::ofstream stream(Utils::utf8_to_path(custom_file()), std::ios::trunc);
    if (!stream) {
        if (logger) {
            logger->error("Failed to save custom config: {}", custom_file());
        }
        return false;
    }
    stream << json{{"categories", custom_only}}.dump(2) << '\n';
    if (logger) {
        logger->debug("Saved custom configuration: {}", custom_file());
    }
    return static_cast<bool>(stream);
}
