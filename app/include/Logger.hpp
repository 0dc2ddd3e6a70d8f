#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

class Logger {
public:
    static constexpr const char* kCoreLoggerName = "core_logger";

    /**
     * @brief Registers the named loggers used across the organizer.
     *
     * The console sink logs at info (debug when @p verbose), the file sink
     * writes everything to `file_organizer_YYYYMMDD.log` inside @p log_dir.
     * An empty or unwritable @p log_dir leaves only the console sink.
     */
    static void setup_loggers(const std::string& log_dir = std::string(), bool verbose = false);

    static std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

    static void set_console_level(spdlog::level::level_enum level);

    /// Path of the active log file, empty when logging to console only.
    static std::string get_log_file_path();

    static void shutdown();
};

#endif
