#include <catch2/catch_test_macros.hpp>

#include "CategoryClassifier.hpp"
#include "CategoryConfigStore.hpp"
#include "Logger.hpp"
#include "OrganizerContext.hpp"
#include "Settings.hpp"
#include "TestHelpers.hpp"
#include "Types.hpp"

#include <algorithm>
#include <filesystem>

#include <nlohmann/json.hpp>
#include <spdlog/sinks/sink.h>

namespace {

const Category* find_category(const CategoryTable& table, const std::string& name) {
    auto it = std::find_if(table.begin(), table.end(),
                           [&](const Category& category) { return category.name == name; });
    return it == table.end() ? nullptr : &*it;
}

struct LoggerGuard {
    ~LoggerGuard() { Logger::shutdown(); }
};

} // namespace

TEST_CASE("Settings resolve the config directory from the environment") {
    TempDir dir;
    SECTION("explicit override wins") {
        EnvVarGuard config("FILE_ORGANIZER_CONFIG_DIR", dir.path().string());
        CHECK(Settings::default_config_dir() == dir.path().string());
    }
    SECTION("XDG config home is used next") {
        EnvVarGuard config("FILE_ORGANIZER_CONFIG_DIR", std::nullopt);
        EnvVarGuard xdg("XDG_CONFIG_HOME", dir.path().string());
        CHECK(Settings::default_config_dir() == (dir.path() / "file-organizer").string());
    }
}

TEST_CASE("Settings round-trip through settings.json") {
    TempDir dir;
    EnvVarGuard config("FILE_ORGANIZER_CONFIG_DIR", dir.path().string());

    Settings defaults;
    REQUIRE(defaults.load());
    CHECK(defaults.get_conflict_strategy() == ConflictStrategy::Rename);
    CHECK(defaults.get_date_format() == DateFormat::YearMonth);
    CHECK(defaults.get_unknown_date_folder() == "Unknown-Date");

    Settings settings;
    settings.set_conflict_strategy(ConflictStrategy::HashCompare);
    settings.set_date_source(DateSource::FilenamePattern);
    settings.set_date_format(DateFormat::Custom);
    settings.set_custom_date_format("%Y/%m");
    settings.set_handle_unknown_dates(false);
    settings.set_create_subdirs(false);
    settings.set_verbose(true);
    REQUIRE(settings.save());
    CHECK(std::filesystem::exists(settings.get_settings_file()));

    Settings reloaded;
    REQUIRE(reloaded.load());
    CHECK(reloaded.get_conflict_strategy() == ConflictStrategy::HashCompare);
    CHECK(reloaded.get_date_source() == DateSource::FilenamePattern);
    CHECK(reloaded.get_date_format() == DateFormat::Custom);
    CHECK(reloaded.get_custom_date_format() == "%Y/%m");
    CHECK_FALSE(reloaded.get_handle_unknown_dates());
    CHECK_FALSE(reloaded.get_create_subdirs());
    CHECK(reloaded.get_verbose());
}

TEST_CASE("Settings keep their values when the file is malformed") {
    TempDir dir;
    EnvVarGuard config("FILE_ORGANIZER_CONFIG_DIR", dir.path().string());

    Settings settings;
    settings.set_date_format(DateFormat::Year);

    SECTION("broken JSON") {
        write_file(dir.path() / "settings.json", "{ not json");
        CHECK_FALSE(settings.load());
    }
    SECTION("unknown enum value") {
        write_file(dir.path() / "settings.json",
                   R"({"date_format": "YYYY-MM-DD", "conflict_strategy": "shred"})");
        CHECK_FALSE(settings.load());
    }
    CHECK(settings.get_date_format() == DateFormat::Year);
}

TEST_CASE("Enum names parse leniently and print canonically") {
    CHECK(conflict_strategy_from_string("Size-Compare") == ConflictStrategy::SizeCompare);
    CHECK(conflict_strategy_from_string(" BACKUP ") == ConflictStrategy::Backup);
    CHECK_FALSE(conflict_strategy_from_string("shred").has_value());
    CHECK(date_source_from_string("exif") == DateSource::EmbeddedMetadata);
    CHECK(date_source_from_string("modified") == DateSource::ModificationTime);
    CHECK(date_format_from_string("yyyy-qq") == DateFormat::YearQuarter);
    CHECK_FALSE(date_format_from_string("DD-MM").has_value());
    CHECK(operation_type_from_string("Copy") == OperationType::Copy);
    CHECK(preview_mode_from_string("date") == PreviewMode::Date);

    CHECK(to_string(ConflictStrategy::HashCompare) == "hash_compare");
    CHECK(to_string(DateFormat::YearWeek) == "YYYY-WW");
    CHECK(to_string(DateSource::CreationTime) == "creation");
}

TEST_CASE("CategoryConfigStore merges default and custom files over the built-ins") {
    TempDir dir;
    CategoryConfigStore store(dir.path().string());

    SECTION("no files gives the built-in table") {
        const CategoryTable table = store.load();
        CHECK(table.size() == CategoryClassifier::default_categories().size());
    }

    SECTION("default file extends, custom file replaces") {
        write_file(store.default_file(),
                   R"({"categories": {"Images": ["HEIF"], "CAD": [".dwg", ".dxf"]}})");
        write_file(store.custom_file(),
                   R"({"categories": {"Audio": [".mp3"], "Notes": ["md"]}})");

        const CategoryTable table = store.load();
        const Category* images = find_category(table, "Images");
        REQUIRE(images != nullptr);
        CHECK(std::find(images->extensions.begin(), images->extensions.end(), ".heif") != images->extensions.end());
        CHECK(std::find(images->extensions.begin(), images->extensions.end(), ".jpg") != images->extensions.end());

        const Category* audio = find_category(table, "Audio");
        REQUIRE(audio != nullptr);
        CHECK(audio->extensions == std::vector<std::string>{".mp3"});

        REQUIRE(find_category(table, "CAD") != nullptr);
        const Category* notes = find_category(table, "Notes");
        REQUIRE(notes != nullptr);
        CHECK(notes->extensions == std::vector<std::string>{".md"});
    }

    SECTION("a malformed file is ignored") {
        write_file(store.custom_file(), "[1, 2");
        CHECK(store.load().size() == CategoryClassifier::default_categories().size());
    }
}

TEST_CASE("CategoryConfigStore saves only categories that differ from the built-ins") {
    TempDir dir;
    CategoryConfigStore store((dir.path() / "cfg").string());

    CategoryTable table = CategoryClassifier::default_categories();
    table.push_back(Category{"Notes", {".md"}});
    REQUIRE(store.save(table));

    const auto saved = nlohmann::json::parse(read_file(store.custom_file()));
    CHECK(saved.at("categories").size() == 1);
    CHECK(saved.at("categories").at("Notes") == nlohmann::json::array({".md"}));

    const CategoryTable reloaded = store.load();
    CHECK(find_category(reloaded, "Notes") != nullptr);
}

TEST_CASE("Logger writes a dated log file in the requested directory") {
    TempDir dir;
    LoggerGuard guard;

    Logger::setup_loggers((dir.path() / "logs").string(), false);
    auto logger = Logger::get_logger(Logger::kCoreLoggerName);
    REQUIRE(logger != nullptr);
    logger->warn("disk almost full");
    logger->flush();

    const std::filesystem::path log_file = Logger::get_log_file_path();
    CHECK(log_file.parent_path() == dir.path() / "logs");
    CHECK(log_file.filename().string().rfind("file_organizer_", 0) == 0);
    CHECK(read_file(log_file).find("disk almost full") != std::string::npos);

    Logger::shutdown();
    CHECK(Logger::get_logger(Logger::kCoreLoggerName) == nullptr);
    CHECK(Logger::get_log_file_path().empty());
}

TEST_CASE("Logger console level changes leave the log file untouched") {
    TempDir dir;
    LoggerGuard guard;

    Logger::setup_loggers((dir.path() / "logs").string(), false);
    auto logger = Logger::get_logger(Logger::kCoreLoggerName);
    REQUIRE(logger != nullptr);
    REQUIRE(logger->sinks().size() == 2);
    CHECK(logger->sinks().front()->level() == spdlog::level::info);

    Logger::set_console_level(spdlog::level::err);
    CHECK(logger->sinks().front()->level() == spdlog::level::err);

    logger->info("quiet on the console");
    logger->flush();
    CHECK(read_file(Logger::get_log_file_path()).find("quiet on the console") != std::string::npos);
}

TEST_CASE("OrganizerContext places a relative log directory under the config directory") {
    TempDir dir;
    LoggerGuard guard;
    const auto config_dir = dir.path() / "cfg";
    EnvVarGuard config("FILE_ORGANIZER_CONFIG_DIR", config_dir.string());

    Settings settings;
    settings.set_log_dir("logs");
    auto logger = OrganizerContext::init_logging(settings);
    REQUIRE(logger != nullptr);
    CHECK(logger == Logger::get_logger(Logger::kCoreLoggerName));

    const std::filesystem::path log_file = Logger::get_log_file_path();
    CHECK(log_file.parent_path() == config_dir / "logs");
    CHECK(std::filesystem::exists(log_file));
}

TEST_CASE("OrganizerContext wires settings into every component") {
    TempDir dir;
    EnvVarGuard config("FILE_ORGANIZER_CONFIG_DIR", (dir.path() / "cfg").string());
    write_file(dir.path() / "cfg" / "custom_categories.json", R"({"categories": {"Notes": [".md"]}})");

    Settings settings;
    settings.set_conflict_strategy(ConflictStrategy::Skip);
    settings.set_date_format(DateFormat::Year);
    settings.set_date_source(DateSource::ModificationTime);
    settings.set_unknown_date_folder("Undated");
    settings.set_create_subdirs(false);
    settings.set_backup_root((dir.path() / "backup").string());

    OrganizerContext context(settings);
    CHECK(context.classifier().category_for_extension(".md") == std::optional<std::string>("Notes"));
    CHECK(context.conflict_resolver().get_default_strategy() == ConflictStrategy::Skip);
    CHECK(context.date_extractor().get_unknown_date_folder() == "Undated");
    CHECK_FALSE(context.default_create_subdirs());

    const DateOrganizeOptions options = context.default_date_options();
    CHECK(options.format == DateFormat::Year);
    CHECK(options.source == DateSource::ModificationTime);

    const auto source = dir.path() / "source";
    const auto flat = dir.path() / "flat";
    write_file(source / "todo.md", "- [ ] ship");
    const auto result = context.organizer().organize_by_type(source.string(), flat.string(), false,
                                                             context.default_create_subdirs());
    CHECK(result.processed_files == 1);
    CHECK(std::filesystem::exists(flat / "todo.md"));
}
