#include "OrganizerContext.hpp"
#include "CategoryConfigStore.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <filesystem>
#include <utility>

OrganizerContext::OrganizerContext(const Settings& settings, std::shared_ptr<spdlog::logger> core_logger)
    : OrganizerContext(settings, CategoryConfigStore(settings.get_config_dir()).load(), std::move(core_logger))
{
}

OrganizerContext::OrganizerContext(const Settings& settings,
                                   CategoryTable categories,
                                   std::shared_ptr<spdlog::logger> core_logger)
    : core_logger(std::move(core_logger)),
      path_validator(this->core_logger),
      category_classifier(path_validator, std::move(categories), this->core_logger),
      extractor(this->core_logger),
      resolver(settings.get_conflict_strategy(),
               Utils::utf8_to_path(settings.get_backup_root()),
               this->core_logger),
      file_organizer(path_validator, category_classifier, extractor, resolver, this->core_logger),
      date_format(settings.get_date_format()),
      date_source(settings.get_date_source()),
      custom_date_format(settings.get_custom_date_format()),
      create_subdirs(settings.get_create_subdirs())
{
    extractor.set_handle_unknown_dates(settings.get_handle_unknown_dates());
    extractor.set_unknown_date_folder(settings.get_unknown_date_folder());

    if (this->core_logger) {
        this->core_logger->debug("Organizer ready: {} categories, conflict strategy {}, date format {}",
                                 category_classifier.get_all_categories().size(),
                                 to_string(settings.get_conflict_strategy()),
                                 to_string(date_format));
    }
}

std::shared_ptr<spdlog::logger> OrganizerContext::init_logging(const Settings& settings)
{
    std::filesystem::path log_dir = Utils::utf8_to_path(settings.get_log_dir());
    if (!log_dir.empty() && log_dir.is_relative()) {
        log_dir = Utils::utf8_to_path(settings.get_config_dir()) / log_dir;
    }
    Logger::setup_loggers(Utils::path_to_utf8(log_dir), settings.get_verbose());
    return Logger::get_logger(Logger::kCoreLoggerName);
}

DateOrganizeOptions OrganizerContext::default_date_options() const
{
    DateOrganizeOptions options;
    options.format = date_format;
    options.source = date_source;
    options.custom_format = custom_date_format;
    return options;
}
