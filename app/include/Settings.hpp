#ifndef SETTINGS_HPP
#define SETTINGS_HPP

#include "Types.hpp"

#include <string>

/**
 * @brief Engine defaults persisted as settings.json in the config directory.
 *
 * The config directory is FILE_ORGANIZER_CONFIG_DIR when set, otherwise
 * $XDG_CONFIG_HOME/file-organizer, otherwise ~/.config/file-organizer.
 */
class Settings {
public:
    Settings();

    // A missing file keeps defaults and returns true; a malformed one is
    // logged and returns false without touching the current values.
    bool load();
    bool save() const;

    std::string get_config_dir() const { return config_dir; }
    std::string get_settings_file() const;

    ConflictStrategy get_conflict_strategy() const { return conflict_strategy; }
    void set_conflict_strategy(ConflictStrategy value) { conflict_strategy = value; }

    DateSource get_date_source() const { return date_source; }
    void set_date_source(DateSource value) { date_source = value; }

    DateFormat get_date_format() const { return date_format; }
    void set_date_format(DateFormat value) { date_format = value; }

    std::string get_custom_date_format() const { return custom_date_format; }
    void set_custom_date_format(const std::string& value) { custom_date_format = value; }

    bool get_handle_unknown_dates() const { return handle_unknown_dates; }
    void set_handle_unknown_dates(bool value) { handle_unknown_dates = value; }

    std::string get_unknown_date_folder() const { return unknown_date_folder; }
    void set_unknown_date_folder(const std::string& value) { unknown_date_folder = value; }

    bool get_create_subdirs() const { return create_subdirs; }
    void set_create_subdirs(bool value) { create_subdirs = value; }

    std::string get_backup_root() const { return backup_root; }
    void set_backup_root(const std::string& value) { backup_root = value; }

    std::string get_log_dir() const { return log_dir; }
    void set_log_dir(const std::string& value) { log_dir = value; }

    bool get_verbose() const { return verbose; }
    void set_verbose(bool value) { verbose = value; }

    static std::string default_config_dir();

private:
    std::string config_dir;
    ConflictStrategy conflict_strategy{ConflictStrategy::Rename};
    DateSource date_source{DateSource::Auto};
    DateFormat date_format{DateFormat::YearMonth};
    std::string custom_date_format;
    bool handle_unknown_dates{true};
    std::string unknown_date_folder{"Unknown-Date"};
    bool create_subdirs{true};
    std::string backup_root{"backup"};
    std::string log_dir{"logs"};
    bool verbose{false};
};

#endif
