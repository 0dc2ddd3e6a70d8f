#include "Settings.hpp"
#include "Errors.hpp"
#include "Logger.hpp"
#include "Utils.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <system_error>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {
constexpr const char* kConfigDirEnv = "FILE_ORGANIZER_CONFIG_DIR";
constexpr const char* kAppDirName = "file-organizer";
constexpr const char* kSettingsFileName = "settings.json";

std::string env_or_empty(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

template <typename Enum, typename Parser>
void read_enum(const json& data, const char* key, Enum& target, Parser parse) {
    auto it = data.find(key);
    if (it == data.end()) {
        return;
    }
    if (!it->is_string()) {
        throw ConfigurationError(std::string("`") + key + "` must be a string");
    }
    const auto text = it->get<std::string>();
    const auto parsed = parse(text);
    if (!parsed) {
        throw ConfigurationError("unknown value '" + text + "' for `" + key + "`");
    }
    target = *parsed;
}

template <typename T>
void read_value(const json& data, const char* key, T& target) {
    if (auto it = data.find(key); it != data.end()) {
        target = it->get<T>();
    }
}
} // namespace

Settings::Settings()
    : config_dir(default_config_dir()) {}

std::string Settings::default_config_dir()
{
    if (const auto override_dir = env_or_empty(kConfigDirEnv); !override_dir.empty()) {
        return override_dir;
    }
    if (const auto xdg = env_or_empty("XDG_CONFIG_HOME"); !xdg.empty()) {
        return Utils::path_to_utf8(Utils::utf8_to_path(xdg) / kAppDirName);
    }
    const auto home = env_or_empty("HOME");
    const std::filesystem::path base = home.empty() ? std::filesystem::path(".") : Utils::utf8_to_path(home);
    return Utils::path_to_utf8(base / ".config" / kAppDirName);
}

std::string Settings::get_settings_file() const
{
    return Utils::path_to_utf8(Utils::utf8_to_path(config_dir) / kSettingsFileName);
}

bool Settings::load()
{
    const auto path = Utils::utf8_to_path(get_settings_file());
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return true;
    }

    std::ifstream stream(path);
    if (!stream) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->warn("Could not open settings file: {}", Utils::path_to_utf8(path));
        }
        return false;
    }

    Settings loaded(*this);
    try {
        json data;
        stream >> data;
        if (!data.is_object()) {
            throw ConfigurationError("settings root must be an object");
        }
        read_enum(data, "conflict_strategy", loaded.conflict_strategy, conflict_strategy_from_string);
        read_enum(data, "date_source", loaded.date_source, date_source_from_string);
        read_enum(data, "date_format", loaded.date_format, date_format_from_string);
        read_value(data, "custom_date_format", loaded.custom_date_format);
        read_value(data, "handle_unknown_dates", loaded.handle_unknown_dates);
        read_value(data, "unknown_date_folder", loaded.unknown_date_folder);
        read_value(data, "create_subdirs", loaded.create_subdirs);
        read_value(data, "backup_root", loaded.backup_root);
        read_value(data, "log_dir", loaded.log_dir);
        read_value(data, "verbose", loaded.verbose);
    } catch (const json::exception& e) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->warn("Could not load settings from {}: {}", Utils::path_to_utf8(path), e.what());
        }
        return false;
    } catch (const ConfigurationError& e) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->warn("Invalid settings in {}: {}", Utils::path_to_utf8(path), e.what());
        }
        return false;
    }

    *this = std::move(loaded);
    return true;
}

bool Settings::save() const
{
    const auto dir = Utils::utf8_to_path(config_dir);
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->error("Could not create config directory {}: {}", config_dir, ec.message());
        }
        return false;
    }

    json data = {
        {"conflict_strategy", to_string(conflict_strategy)},
        {"date_source", to_string(date_source)},
        {"date_format", to_string(date_format)},
        {"custom_date_format", custom_date_format},
        {"handle_unknown_dates", handle_unknown_dates},
        {"unknown_date_folder", unknown_date_folder},
        {"create_subdirs", create_subdirs},
        {"backup_root", backup_root},
        {"log_dir", log_dir},
        {"verbose", verbose},
    };

    std::ofstream stream(Utils::utf8_to_path(get_settings_file()), std::ios::trunc);
    if (!stream) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->error("Could not write settings file {}", get_settings_file());
        }
        return false;
    }
    stream << data.dump(2) << '\n';
    return static_cast<bool>(stream);
}
