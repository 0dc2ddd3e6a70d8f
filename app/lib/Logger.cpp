#include "Logger.hpp"
#include "Utils.hpp"

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <mutex>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace {

std::mutex& logger_mutex() {
    static std::mutex mutex;
    return mutex;
}

std::shared_ptr<spdlog::sinks::sink>& console_sink_slot() {
    static std::shared_ptr<spdlog::sinks::sink> sink;
    return sink;
}

std::string& log_file_slot() {
    static std::string path;
    return path;
}

std::shared_ptr<spdlog::sinks::sink> make_file_sink(const std::string& log_dir, std::string& out_path) {
    if (log_dir.empty()) {
        return nullptr;
    }
    std::error_code ec;
    const std::filesystem::path dir = Utils::utf8_to_path(log_dir);
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        std::fprintf(stderr, "Cannot create log directory '%s': %s\n", log_dir.c_str(), ec.message().c_str());
        return nullptr;
    }

    const std::string file_name =
        "file_organizer_" + Utils::format_time(std::chrono::system_clock::now(), "%Y%m%d") + ".log";
    const std::filesystem::path file_path = dir / file_name;
    try {
        auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(Utils::path_to_utf8(file_path));
        sink->set_level(spdlog::level::debug);
        sink->set_pattern("%Y-%m-%d %H:%M:%S | %-8l | %n | %v");
        out_path = Utils::path_to_utf8(file_path);
        return sink;
    } catch (const spdlog::spdlog_ex& ex) {
        std::fprintf(stderr, "Cannot open log file '%s': %s\n", file_path.string().c_str(), ex.what());
        return nullptr;
    }
}

} // namespace

void Logger::setup_loggers(const std::string& log_dir, bool verbose)
{
    std::lock_guard<std::mutex> lock(logger_mutex());

    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
    console_sink->set_pattern("%H:%M:%S | %^%l%$ | %v");

    std::vector<spdlog::sink_ptr> sinks{console_sink};
    std::string file_path;
    if (auto file_sink = make_file_sink(log_dir, file_path)) {
        sinks.push_back(std::move(file_sink));
    }

    spdlog::drop(kCoreLoggerName);
    auto logger = std::make_shared<spdlog::logger>(kCoreLoggerName, sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::debug);
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);

    console_sink_slot() = console_sink;
    log_file_slot() = file_path;

    if (verbose) {
        logger->debug("Verbose logging enabled");
    }
}

std::shared_ptr<spdlog::logger> Logger::get_logger(const std::string& name)
{
    return spdlog::get(name);
}

void Logger::set_console_level(spdlog::level::level_enum level)
{
    std::lock_guard<std::mutex> lock(logger_mutex());
    if (auto& sink = console_sink_slot()) {
        sink->set_level(level);
    }
}

std::string Logger::get_log_file_path()
{
    std::lock_guard<std::mutex> lock(logger_mutex());
    return log_file_slot();
}

void Logger::shutdown()
{
    std::lock_guard<std::mutex> lock(logger_mutex());
    spdlog::drop(kCoreLoggerName);
    console_sink_slot().reset();
    log_file_slot().clear();
}
