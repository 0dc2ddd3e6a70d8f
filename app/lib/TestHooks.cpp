#include "TestHooks.hpp"

#include <utility>

namespace TestHooks {

namespace {

FileOperationProbe& file_operation_probe_slot() {
    static FileOperationProbe probe;
    return probe;
}

RenameHook& rename_hook_slot() {
    static RenameHook hook;
    return hook;
}

FreeSpaceProbe& free_space_probe_slot() {
    static FreeSpaceProbe probe;
    return probe;
}

LockedFileProbe& locked_file_probe_slot() {
    static LockedFileProbe probe;
    return probe;
}

} // namespace

void set_file_operation_probe(FileOperationProbe probe) {
    file_operation_probe_slot() = std::move(probe);
}

void reset_file_operation_probe() {
    file_operation_probe_slot() = FileOperationProbe{};
}

void run_file_operation_probe(const FileOperationInfo& info) {
    if (const auto& probe = file_operation_probe_slot()) {
        probe(info);
    }
}

void set_rename_hook(RenameHook hook) {
    rename_hook_slot() = std::move(hook);
}

void reset_rename_hook() {
    rename_hook_slot() = RenameHook{};
}

std::error_code run_rename_hook(const std::filesystem::path& from, const std::filesystem::path& to) {
    if (const auto& hook = rename_hook_slot()) {
        return hook(from, to);
    }
    return {};
}

void set_free_space_probe(FreeSpaceProbe probe) {
    free_space_probe_slot() = std::move(probe);
}

void reset_free_space_probe() {
    free_space_probe_slot() = FreeSpaceProbe{};
}

std::optional<std::uintmax_t> probe_free_space(const std::filesystem::path& directory) {
    if (const auto& probe = free_space_probe_slot()) {
        return probe(directory);
    }
    return std::nullopt;
}

void set_locked_file_probe(LockedFileProbe probe) {
    locked_file_probe_slot() = std::move(probe);
}

void reset_locked_file_probe() {
    locked_file_probe_slot() = LockedFileProbe{};
}

bool probe_locked_file(const std::filesystem::path& file) {
    if (const auto& probe = locked_file_probe_slot()) {
        return probe(file);
    }
    return false;
}

} // namespace TestHooks
