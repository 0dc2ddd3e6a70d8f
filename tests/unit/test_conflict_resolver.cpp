#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include "ConflictResolver.hpp"
#include "Errors.hpp"
#include "TestHelpers.hpp"
#include "TestHooks.hpp"

#include <filesystem>
#include <iterator>
#include <string>
#include <vector>

namespace {

struct FileOperationProbeGuard {
    ~FileOperationProbeGuard() {
        TestHooks::reset_file_operation_probe();
    }
};

ConflictUnresolvable::Reason resolve_failure(ConflictResolver& resolver,
                                             const std::filesystem::path& source,
                                             const std::filesystem::path& destination,
                                             ConflictStrategy strategy) {
    try {
        resolver.resolve(source, destination, strategy);
    } catch (const ConflictUnresolvable& ex) {
        return ex.reason();
    }
    FAIL("resolve was expected to decline the conflict");
    return ConflictUnresolvable::Reason::Skipped;
}

} // namespace

TEST_CASE("ConflictResolver returns the destination untouched when nothing is there") {
    TempDir dir;
    ConflictResolver resolver(ConflictStrategy::Skip, dir.path() / "backup");
    const auto source = write_file(dir.path() / "in" / "a.txt", "a");
    const auto destination = dir.path() / "out" / "a.txt";

    CHECK(resolver.resolve(source, destination) == destination);
    CHECK(resolver.get_conflict_stats().total_conflicts == 0);
}

TEST_CASE("ConflictResolver rename picks the first free numbered name") {
    TempDir dir;
    ConflictResolver resolver(ConflictStrategy::Rename, dir.path() / "backup");
    const auto source = write_file(dir.path() / "in" / "report.txt", "new");

    const int existing = GENERATE(1, 2, 5);
    write_file(dir.path() / "out" / "report.txt", "old");
    for (int i = 1; i < existing; ++i) {
        write_file(dir.path() / "out" / ("report_" + std::to_string(i) + ".txt"), "old");
    }

    const auto resolved = resolver.resolve(source, dir.path() / "out" / "report.txt");
    CHECK(resolved == dir.path() / "out" / ("report_" + std::to_string(existing) + ".txt"));
    CHECK_FALSE(std::filesystem::exists(resolved));
}

TEST_CASE("ConflictResolver hash-compare skips identical files without touching them") {
    TempDir dir;
    FileOperationProbeGuard guard;
    std::vector<std::string> operations;
    TestHooks::set_file_operation_probe([&](const TestHooks::FileOperationInfo& info) {
        operations.push_back(info.action);
    });

    ConflictResolver resolver(ConflictStrategy::Rename, dir.path() / "backup");
    const auto source = write_file(dir.path() / "in" / "photo.jpg", "same bytes");
    const auto destination = write_file(dir.path() / "out" / "photo.jpg", "same bytes");

    CHECK(resolve_failure(resolver, source, destination, ConflictStrategy::HashCompare)
          == ConflictUnresolvable::Reason::Duplicate);
    CHECK(operations.empty());
    CHECK(read_file(source) == "same bytes");
    CHECK(read_file(destination) == "same bytes");
    CHECK(std::distance(std::filesystem::directory_iterator(dir.path() / "out"),
                        std::filesystem::directory_iterator()) == 1);
}

TEST_CASE("ConflictResolver hash-compare keeps both when the content differs") {
    TempDir dir;
    ConflictResolver resolver;
    const auto source = write_file(dir.path() / "in" / "photo.jpg", "one");
    const auto destination = write_file(dir.path() / "out" / "photo.jpg", "two");

    const auto resolved = resolver.resolve(source, destination, ConflictStrategy::HashCompare);
    CHECK(resolved.filename() == "photo_1.jpg");
}

TEST_CASE("ConflictResolver skip always declines") {
    TempDir dir;
    ConflictResolver resolver(ConflictStrategy::Skip, dir.path() / "backup");
    const auto source = write_file(dir.path() / "in" / "a.txt", "a");
    const auto destination = write_file(dir.path() / "out" / "a.txt", "b");

    CHECK_THROWS_AS(resolver.resolve(source, destination), ConflictUnresolvable);
    CHECK(std::filesystem::exists(destination));
}

TEST_CASE("ConflictResolver overwrite removes the existing file outside dry run") {
    TempDir dir;
    ConflictResolver resolver(ConflictStrategy::Overwrite, dir.path() / "backup");
    const auto source = write_file(dir.path() / "in" / "a.txt", "new");
    const auto destination = write_file(dir.path() / "out" / "a.txt", "old");

    CHECK(resolver.resolve(source, destination, std::nullopt, true) == destination);
    CHECK(std::filesystem::exists(destination));

    CHECK(resolver.resolve(source, destination) == destination);
    CHECK_FALSE(std::filesystem::exists(destination));
}

TEST_CASE("ConflictResolver overwrite reports delete failures as operation errors") {
    TempDir dir;
    FileOperationProbeGuard guard;
    TestHooks::set_file_operation_probe([](const TestHooks::FileOperationInfo& info) {
        if (info.action == "DELETE") {
            throw std::filesystem::filesystem_error("denied", info.source,
                                                    std::make_error_code(std::errc::permission_denied));
        }
    });

    ConflictResolver resolver(ConflictStrategy::Overwrite, dir.path() / "backup");
    const auto source = write_file(dir.path() / "in" / "a.txt", "new");
    const auto destination = write_file(dir.path() / "out" / "a.txt", "old");

    CHECK_THROWS_AS(resolver.resolve(source, destination), OperationError);
    CHECK(std::filesystem::exists(destination));
}

TEST_CASE("ConflictResolver backup copies the existing file into a timestamped folder") {
    TempDir dir;
    ConflictResolver resolver(ConflictStrategy::Backup, dir.path() / "backup");
    const auto source = write_file(dir.path() / "in" / "notes.txt", "new");
    const auto destination = write_file(dir.path() / "out" / "notes.txt", "old");

    SECTION("dry run creates nothing") {
        CHECK(resolver.resolve(source, destination, std::nullopt, true) == destination);
        CHECK_FALSE(std::filesystem::exists(dir.path() / "backup"));
        CHECK_FALSE(resolver.get_conflict_stats().backup_directory.has_value());
    }

    SECTION("real run moves the old content aside") {
        CHECK(resolver.resolve(source, destination) == destination);
        CHECK_FALSE(std::filesystem::exists(destination));

        const auto backup_dir = resolver.get_backup_directory();
        CHECK(backup_dir.parent_path() == dir.path() / "backup");
        REQUIRE(std::filesystem::is_directory(backup_dir));
        std::vector<std::filesystem::path> backups;
        for (const auto& entry : std::filesystem::directory_iterator(backup_dir)) {
            backups.push_back(entry.path());
        }
        REQUIRE(backups.size() == 1);
        CHECK(backups.front().filename().string().rfind("notes_", 0) == 0);
        CHECK(backups.front().extension() == ".txt");
        CHECK(read_file(backups.front()) == "old");

        const auto stats = resolver.get_conflict_stats();
        REQUIRE(stats.backup_directory.has_value());
        CHECK(stats.resolution_strategies.at("backup") == 1);
    }
}

TEST_CASE("ConflictResolver size-compare keeps the larger file") {
    TempDir dir;
    ConflictResolver resolver;
    const auto small = write_file(dir.path() / "in" / "small.bin", "12");
    const auto large = write_file(dir.path() / "in2" / "small.bin", "123456");
    const auto destination = write_file(dir.path() / "out" / "small.bin", "1234");

    CHECK(resolve_failure(resolver, small, destination, ConflictStrategy::SizeCompare)
          == ConflictUnresolvable::Reason::DestinationLarger);
    CHECK(resolver.resolve(large, destination, ConflictStrategy::SizeCompare, true) == destination);

    const auto same = write_file(dir.path() / "in3" / "small.bin", "1234");
    CHECK(resolve_failure(resolver, same, destination, ConflictStrategy::SizeCompare)
          == ConflictUnresolvable::Reason::Duplicate);
}

TEST_CASE("ConflictResolver date-compare keeps the newer file") {
    TempDir dir;
    ConflictResolver resolver;
    const auto older = write_file(dir.path() / "in" / "doc.txt", "older");
    const auto newer = write_file(dir.path() / "in2" / "doc.txt", "newer");
    const auto destination = write_file(dir.path() / "out" / "doc.txt", "middle");
    set_mtime(older, 2020, 1, 1);
    set_mtime(destination, 2021, 1, 1);
    set_mtime(newer, 2022, 1, 1);

    CHECK(resolve_failure(resolver, older, destination, ConflictStrategy::DateCompare)
          == ConflictUnresolvable::Reason::DestinationNewer);
    CHECK(resolver.resolve(newer, destination, ConflictStrategy::DateCompare, true) == destination);

    const auto same_day = write_file(dir.path() / "in3" / "doc.txt", "different");
    set_mtime(same_day, 2021, 1, 1);
    CHECK(resolver.resolve(same_day, destination, ConflictStrategy::DateCompare).filename() == "doc_1.txt");
}

TEST_CASE("ConflictResolver counts every conflict per strategy") {
    TempDir dir;
    ConflictResolver resolver(ConflictStrategy::Rename, dir.path() / "backup");
    const auto source = write_file(dir.path() / "in" / "a.txt", "a");
    const auto destination = write_file(dir.path() / "out" / "a.txt", "b");

    resolver.resolve(source, destination);
    resolver.resolve(source, destination, ConflictStrategy::Rename, true);
    CHECK_THROWS(resolver.resolve(source, destination, ConflictStrategy::Skip));

    const auto stats = resolver.get_conflict_stats();
    CHECK(stats.total_conflicts == 3);
    CHECK(stats.resolution_strategies.at("rename") == 2);
    CHECK(stats.resolution_strategies.at("skip") == 1);
    CHECK_FALSE(stats.backup_directory.has_value());
}

TEST_CASE("ConflictResolver analyzes conflicts without changing anything") {
    TempDir dir;
    ConflictResolver resolver;
    const auto out = dir.path() / "out";
    const auto identical = write_file(dir.path() / "in" / "same.txt", "same");
    write_file(out / "same.txt", "same");
    const auto bigger = write_file(dir.path() / "in" / "big.txt", "bigger content");
    write_file(out / "big.txt", "tiny");
    const auto newer = write_file(dir.path() / "in" / "new.txt", "aaaa");
    set_mtime(write_file(out / "new.txt", "bbbb"), 2020, 1, 1);
    set_mtime(newer, 2023, 1, 1);
    const auto older = write_file(dir.path() / "in" / "old.txt", "cc");
    set_mtime(write_file(out / "old.txt", "dd"), 2023, 1, 1);
    set_mtime(older, 2020, 1, 1);
    const auto unique = write_file(dir.path() / "in" / "unique.txt", "unique");

    const auto analysis = resolver.analyze_conflicts(
        {identical.string(), bigger.string(), newer.string(), older.string(), unique.string()}, out);

    CHECK(analysis.total_files == 5);
    CHECK(analysis.conflicts == 4);
    CHECK(analysis.identical_files == 1);
    CHECK(analysis.size_conflicts == 1);
    CHECK(analysis.date_conflicts == 1);
    CHECK(analysis.potential_overwrites == 1);
    REQUIRE(analysis.conflict_details.size() == 4);
    CHECK(analysis.conflict_details[0].recommendation == "skip_identical");
    CHECK(analysis.conflict_details[1].recommendation == "overwrite_larger");
    CHECK(analysis.conflict_details[2].recommendation == "overwrite_newer");
    CHECK(analysis.conflict_details[3].recommendation == "rename_safe");
    CHECK(resolver.get_conflict_stats().total_conflicts == 0);
}

TEST_CASE("ConflictResolver generates safe file names") {
    TempDir dir;
    ConflictResolver resolver;
    CHECK(resolver.generate_safe_filename("free.txt", dir.path()) == "free.txt");

    write_file(dir.path() / "taken.txt", "x");
    write_file(dir.path() / "taken_1.txt", "x");
    CHECK(resolver.generate_safe_filename("taken.txt", dir.path()) == "taken_2.txt");

    const auto fallback = resolver.generate_safe_filename("taken.txt", dir.path(), 1);
    CHECK(fallback.rfind("taken_", 0) == 0);
    CHECK(fallback != "taken_1.txt");
    CHECK(fallback.size() > std::string("taken_2.txt").size());
}

TEST_CASE("ConflictResolver rename gives up once every numbered name is taken") {
    TempDir dir;
    ConflictResolver resolver(ConflictStrategy::Rename, dir.path() / "backup");
    const auto source = write_file(dir.path() / "in" / "report.txt", "new");
    const auto destination = write_file(dir.path() / "out" / "report.txt", "old");
    for (int i = 1; i <= ConflictResolver::kMaxRenameAttempts; ++i) {
        write_file(dir.path() / "out" / ("report_" + std::to_string(i) + ".txt"), "");
    }

    CHECK(resolve_failure(resolver, source, destination, ConflictStrategy::Rename)
          == ConflictUnresolvable::Reason::RenameExhausted);
    CHECK(read_file(destination) == "old");
}

TEST_CASE("ConflictResolver writes backups into an overridden directory") {
    TempDir dir;
    ConflictResolver resolver(ConflictStrategy::Backup, dir.path() / "backup");
    const auto custom = dir.path() / "vault";
    resolver.set_backup_directory(custom);
    CHECK(resolver.get_backup_directory() == custom);

    const auto source = write_file(dir.path() / "in" / "notes.txt", "new");
    const auto destination = write_file(dir.path() / "out" / "notes.txt", "old");
    CHECK(resolver.resolve(source, destination) == destination);

    REQUIRE(std::filesystem::is_directory(custom));
    std::vector<std::filesystem::path> backups;
    for (const auto& entry : std::filesystem::directory_iterator(custom)) {
        backups.push_back(entry.path());
    }
    REQUIRE(backups.size() == 1);
    CHECK(read_file(backups.front()) == "old");
    CHECK_FALSE(std::filesystem::exists(dir.path() / "backup"));
}
