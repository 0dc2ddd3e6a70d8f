#ifndef CATEGORY_CONFIG_STORE_HPP
#define CATEGORY_CONFIG_STORE_HPP

#include "CategoryClassifier.hpp"

#include <string>

/**
 * @brief Resolves the category table from the built-in defaults and two
 * optional files in the config directory, both shaped
 * {"categories": {"Name": [".ext", ...]}}:
 *
 *  - default_categories.json extends existing categories or adds new ones;
 *  - custom_categories.json replaces whole categories.
 */
class CategoryConfigStore {
public:
    explicit CategoryConfigStore(std::string config_dir);

    // Unreadable or malformed files are logged and ignored.
    CategoryTable load() const;

    // Writes every category that differs from the built-in defaults.
    bool save(const CategoryTable& categories) const;

    std::string default_file() const;
    std::string custom_file() const;

private:
    std::string config_dir;
};

#endif
