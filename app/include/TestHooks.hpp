#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <system_error>

namespace TestHooks {

struct FileOperationInfo {
    std::string action; ///< "MOVE", "COPY", "DELETE" or "BACKUP"
    std::filesystem::path source;
    std::filesystem::path destination;
};

// Runs right before a real filesystem mutation; throwing from the probe
// simulates the mutation failing.
using FileOperationProbe = std::function<void(const FileOperationInfo&)>;
void set_file_operation_probe(FileOperationProbe probe);
void reset_file_operation_probe();
void run_file_operation_probe(const FileOperationInfo& info);

// Returning a non-zero error code makes the rename fail with that error
// without touching the filesystem.
using RenameHook = std::function<std::error_code(const std::filesystem::path& from,
                                                 const std::filesystem::path& to)>;
void set_rename_hook(RenameHook hook);
void reset_rename_hook();
std::error_code run_rename_hook(const std::filesystem::path& from, const std::filesystem::path& to);

using FreeSpaceProbe = std::function<std::optional<std::uintmax_t>(const std::filesystem::path& directory)>;
void set_free_space_probe(FreeSpaceProbe probe);
void reset_free_space_probe();
std::optional<std::uintmax_t> probe_free_space(const std::filesystem::path& directory);

// Returns true when the file should be reported as locked.
using LockedFileProbe = std::function<bool(const std::filesystem::path& file)>;
void set_locked_file_probe(LockedFileProbe probe);
void reset_locked_file_probe();
bool probe_locked_file(const std::filesystem::path& file);

} // namespace TestHooks
