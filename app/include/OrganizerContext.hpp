#ifndef ORGANIZER_CONTEXT_HPP
#define ORGANIZER_CONTEXT_HPP

#include "CategoryClassifier.hpp"
#include "ConflictResolver.hpp"
#include "DateExtractor.hpp"
#include "FileOrganizer.hpp"
#include "PathValidator.hpp"
#include "Settings.hpp"

#include <memory>

#include <spdlog/spdlog.h>

/**
 * @brief Builds the validator, classifier, date extractor, conflict resolver
 * and engine once and wires them together.
 *
 * Components are owned here and handed out by reference, so the context must
 * outlive every caller that holds one of them.
 */
class OrganizerContext {
public:
    // Loads the category table through CategoryConfigStore in the settings' config dir.
    explicit OrganizerContext(const Settings& settings,
                              std::shared_ptr<spdlog::logger> core_logger = nullptr);
    OrganizerContext(const Settings& settings,
                     CategoryTable categories,
                     std::shared_ptr<spdlog::logger> core_logger = nullptr);

    OrganizerContext(const OrganizerContext&) = delete;
    OrganizerContext& operator=(const OrganizerContext&) = delete;

    // Sets up the core logger from the settings' log directory and verbosity.
    static std::shared_ptr<spdlog::logger> init_logging(const Settings& settings);

    PathValidator& validator() { return path_validator; }
    CategoryClassifier& classifier() { return category_classifier; }
    DateExtractor& date_extractor() { return extractor; }
    ConflictResolver& conflict_resolver() { return resolver; }
    FileOrganizer& organizer() { return file_organizer; }

    DateOrganizeOptions default_date_options() const;
    bool default_create_subdirs() const { return create_subdirs; }

private:
    std::shared_ptr<spdlog::logger> core_logger;
    PathValidator path_validator;
    CategoryClassifier category_classifier;
    DateExtractor extractor;
    ConflictResolver resolver;
    FileOrganizer file_organizer;
    DateFormat date_format;
    DateSource date_source;
    std::string custom_date_format;
    bool create_subdirs;
};

#endif
