#include "PathValidator.hpp"
#include "Errors.hpp"
#include "TestHooks.hpp"
#include "Utils.hpp"

#include <array>
#include <fstream>
#include <string_view>
#include <system_error>

#include <fmt/format.h>

#if defined(_WIN32)
#include <io.h>
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace {

constexpr std::array<std::string_view, 5> kUnixSystemDirs = {
    "/bin", "/sbin", "/usr/bin", "/usr/sbin", "/etc"
};

bool is_under_directory(const std::string& path, std::string_view dir) {
    if (path.size() < dir.size() || path.compare(0, dir.size(), dir) != 0) {
        return false;
    }
    return path.size() == dir.size() || path[dir.size()] == '/';
}

void add_warning(SafetyReport& report, std::string message) {
    if (report.warnings.size() < PathValidator::kMaxWarnings) {
        report.warnings.push_back(std::move(message));
    } else {
        ++report.suppressed_warnings;
    }
}

} // namespace

bool SafetyReport::is_safe() const {
    if (total_files == 0) {
        return true;
    }
    const double problem_ratio = static_cast<double>(locked_files + system_files)
        / static_cast<double>(total_files);
    return problem_ratio < PathValidator::kMaxProblemRatio;
}

PathValidator::PathValidator(std::shared_ptr<spdlog::logger> core_logger)
    : core_logger(std::move(core_logger)) {}

fs::path PathValidator::resolve(const std::string& path)
{
    if (path.empty()) {
        throw ValidationError("Path is empty");
    }
    std::error_code ec;
    fs::path absolute = fs::absolute(Utils::utf8_to_path(path), ec);
    if (ec) {
        throw ValidationError(fmt::format("Cannot resolve path '{}': {}", path, ec.message()));
    }
    const fs::path normal = absolute.lexically_normal();
    const fs::path name = normal.filename();
    if (name.empty() || name == "." || name == "..") {
        fs::path canonical = fs::weakly_canonical(normal, ec);
        return ec ? normal : canonical;
    }

    // Only the parent is canonicalized, so a symlink in the last component
    // names the link itself and never its target.
    fs::path parent = fs::weakly_canonical(normal.parent_path(), ec);
    return ec ? normal : parent / name;
}

fs::path PathValidator::validate_source_directory(const std::string& path) const
{
    const fs::path source = resolve(path);
    const std::string display = Utils::path_to_utf8(source);
    std::error_code ec;

    std::string failure;
    if (!fs::exists(source, ec)) {
        failure = fmt::format("Source directory does not exist: {}", display);
    } else if (!fs::is_directory(source, ec)) {
        failure = fmt::format("Source path is not a directory: {}", display);
    } else if (!has_read_permission(source)) {
        failure = fmt::format("No read permission for directory: {}", display);
    } else if (!is_directory_listable(source)) {
        failure = fmt::format("Directory is not accessible: {}", display);
    }

    if (!failure.empty()) {
        if (core_logger) {
            core_logger->error("Source directory validation failed: {}", failure);
        }
        throw ValidationError(failure);
    }

    if (core_logger) {
        core_logger->debug("Source directory validated: {}", display);
    }
    return source;
}

fs::path PathValidator::validate_destination_directory(const std::string& path, bool create_if_missing) const
{
    const fs::path destination = resolve(path);
    const std::string display = Utils::path_to_utf8(destination);
    std::error_code ec;

    if (!fs::exists(destination, ec)) {
        if (!create_if_missing) {
            throw ValidationError(fmt::format("Destination directory does not exist: {}", display));
        }
        fs::create_directories(destination, ec);
        if (ec) {
            if (core_logger) {
                core_logger->error("Cannot create destination directory '{}': {}", display, ec.message());
            }
            throw ValidationError(fmt::format("Cannot create destination directory: {} ({})", display, ec.message()));
        }
        if (core_logger) {
            core_logger->debug("Created destination directory: {}", display);
        }
    }

    if (!fs::is_directory(destination, ec)) {
        throw ValidationError(fmt::format("Destination path is not a directory: {}", display));
    }
    if (!has_write_permission(destination)) {
        throw ValidationError(fmt::format("No write permission for directory: {}", display));
    }

    if (core_logger) {
        core_logger->debug("Destination directory validated: {}", display);
    }
    return destination;
}

fs::path PathValidator::validate_file_path(const std::string& path) const
{
    const fs::path file = resolve(path);
    const std::string display = Utils::path_to_utf8(file);
    std::error_code ec;

    if (!fs::exists(file, ec)) {
        throw ValidationError(fmt::format("File does not exist: {}", display));
    }
    if (fs::is_symlink(fs::symlink_status(file, ec)) && core_logger) {
        core_logger->debug("File is a symbolic link, the link itself will be handled: {}", display);
    }
    if (!fs::is_regular_file(file, ec)) {
        throw ValidationError(fmt::format("Path is not a file: {}", display));
    }
    if (!has_read_permission(file)) {
        throw ValidationError(fmt::format("No read permission for file: {}", display));
    }
    if (!is_file_accessible(file)) {
        throw ValidationError(fmt::format("File may be in use or locked: {}", display));
    }
    return file;
}

void PathValidator::check_destination_parent(const fs::path& dir, bool dry_run) const
{
    std::error_code ec;
    if (dry_run && !fs::exists(dir, ec)) {
        return;
    }
    validate_destination_directory(Utils::path_to_utf8(dir), true);
}

std::pair<fs::path, fs::path> PathValidator::validate_move_operation(const std::string& source,
                                                                     const std::string& destination,
                                                                     bool dry_run) const
{
    const fs::path source_path = validate_file_path(source);
    const fs::path destination_path = resolve(destination);
    check_destination_parent(destination_path.parent_path(), dry_run);

    std::error_code ec;
    if (fs::exists(destination_path, ec) && core_logger) {
        core_logger->warn("Destination file already exists: {}", Utils::path_to_utf8(destination_path));
    }

    const fs::path source_dir = source_path.parent_path();
    if (!has_write_permission(source_dir)) {
        throw ValidationError(fmt::format("No permission to move file from: {}", Utils::path_to_utf8(source_dir)));
    }
    return {source_path, destination_path};
}

std::pair<fs::path, fs::path> PathValidator::validate_copy_operation(const std::string& source,
                                                                     const std::string& destination,
                                                                     bool dry_run) const
{
    const fs::path source_path = validate_file_path(source);
    const fs::path destination_path = resolve(destination);
    check_destination_parent(destination_path.parent_path(), dry_run);

    if (!has_free_space_for(source_path, destination_path.parent_path())) {
        throw ValidationError("Insufficient disk space for copy operation");
    }
    return {source_path, destination_path};
}

SafetyReport PathValidator::scan_directory_safety(const std::string& directory) const
{
    SafetyReport report;
    const fs::path root = Utils::utf8_to_path(directory);

    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        add_warning(report, fmt::format("Scan error: {}", ec.message()));
        return report;
    }

    for (const fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            add_warning(report, fmt::format("Scan error: {}", ec.message()));
            ec.clear();
            continue;
        }
        std::error_code entry_ec;
        if (!it->is_regular_file(entry_ec) || entry_ec) {
            continue;
        }

        const fs::path& file = it->path();
        const std::string display = Utils::path_to_utf8(file);
        ++report.total_files;

        if (is_file_accessible(file)) {
            ++report.accessible_files;
        } else {
            ++report.locked_files;
            add_warning(report, fmt::format("Locked file: {}", display));
        }

        if (is_hidden_file(file)) {
            ++report.hidden_files;
        }

        if (is_system_file(file)) {
            ++report.system_files;
            add_warning(report, fmt::format("System file: {}", display));
        }

        const auto size = it->file_size(entry_ec);
        if (!entry_ec && size > kLargeFileThreshold) {
            report.large_files.push_back(LargeFileInfo{display, size});
        }
    }

    if (core_logger) {
        core_logger->debug("Safety scan of '{}': {} files, {} locked, {} system, {} hidden",
                           directory, report.total_files, report.locked_files,
                           report.system_files, report.hidden_files);
    }
    return report;
}

bool PathValidator::is_safe_to_organize(const std::string& directory) const
{
    try {
        const fs::path root = validate_source_directory(directory);
        return scan_directory_safety(Utils::path_to_utf8(root)).is_safe();
    } catch (const ValidationError& e) {
        if (core_logger) {
            core_logger->warn("Directory '{}' is not safe to organize: {}", directory, e.what());
        }
        return false;
    }
}

bool PathValidator::is_file_accessible(const fs::path& path) const
{
    if (TestHooks::probe_locked_file(path)) {
        return false;
    }
    std::ifstream stream(path, std::ios::binary);
    return stream.is_open();
}

bool PathValidator::has_free_space_for(const fs::path& source_file, const fs::path& destination_dir) const
{
    std::error_code ec;
    const auto file_size = fs::file_size(source_file, ec);
    if (ec) {
        return true;
    }

    std::uintmax_t available = 0;
    if (const auto probed = TestHooks::probe_free_space(destination_dir)) {
        available = *probed;
    } else {
        // Walk up to the closest existing ancestor; dry runs may target folders not created yet.
        fs::path probe_dir = destination_dir;
        while (!probe_dir.empty() && !fs::exists(probe_dir, ec)) {
            probe_dir = probe_dir.parent_path();
        }
        const auto info = fs::space(probe_dir.empty() ? fs::current_path(ec) : probe_dir, ec);
        if (ec) {
            return true;
        }
        available = info.available;
    }
    return static_cast<double>(available) > static_cast<double>(file_size) * kFreeSpaceHeadroom;
}

bool PathValidator::is_hidden_file(const fs::path& path)
{
#if defined(_WIN32)
    const DWORD attributes = GetFileAttributesW(path.c_str());
    if (attributes != INVALID_FILE_ATTRIBUTES && (attributes & FILE_ATTRIBUTE_HIDDEN)) {
        return true;
    }
#endif
    return Utils::is_hidden_name(Utils::path_to_utf8(path.filename()));
}

bool PathValidator::is_system_file(const fs::path& path)
{
#if defined(_WIN32)
    const DWORD attributes = GetFileAttributesW(path.c_str());
    return attributes != INVALID_FILE_ATTRIBUTES && (attributes & FILE_ATTRIBUTE_SYSTEM);
#else
    const std::string value = Utils::path_to_utf8(path);
    for (const auto dir : kUnixSystemDirs) {
        if (is_under_directory(value, dir)) {
            return true;
        }
    }
    return false;
#endif
}

bool PathValidator::has_read_permission(const fs::path& path)
{
#if defined(_WIN32)
    return _waccess(path.c_str(), 4) == 0;
#else
    return ::access(path.c_str(), R_OK) == 0;
#endif
}

bool PathValidator::has_write_permission(const fs::path& path)
{
#if defined(_WIN32)
    return _waccess(path.c_str(), 2) == 0;
#else
    return ::access(path.c_str(), W_OK) == 0;
#endif
}

bool PathValidator::is_directory_listable(const fs::path& path) const
{
    std::error_code ec;
    fs::directory_iterator it(path, ec);
    return !ec;
}
