//
// Created by WhySkyDie on 21.07.2025.
//

#include "test_helpers.h"
#include "quarantine/quarantine.h"
#include "file_utils.h"

using namespace testing;

namespace QuarantineTests {

// ============================================================================
// QuarantineManager
// ============================================================================

class QuarantineManagerTest : public TempDirFixture {
protected:
    void SetUp() override {
        TempDirFixture::SetUp();
        scan_root = test_dir / "data";
        quarantine_dir = test_dir / "quarantine-20250721-101010";
        std::filesystem::create_directories(scan_root);
    }

    std::vector<std::filesystem::path> Discover() {
        FileUtils::EmptyFileScanner scanner(FileUtils::ScanOptions(), logger);
        return scanner.Find(scan_root).empty_files;
    }

    std::filesystem::path scan_root;
    std::filesystem::path quarantine_dir;
};

TEST_F(QuarantineManagerTest, MovesAllFilesAndWritesJournal) {
    // Arrange
    CreateFile("data/one.txt");
    CreateFile("data/sub/two.txt");
    QuarantineEngine::QuarantineManager manager(QuarantineEngine::QuarantineConfig(), logger);

    // Act
    auto result = manager.Run(Discover(), quarantine_dir, false, scan_root, false);

    // Assert
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(result.journal_written);
    EXPECT_TRUE(result.failures.empty());
    ASSERT_EQ(result.outcomes.size(), 2u);
    for (const auto& outcome : result.outcomes) {
        EXPECT_TRUE(std::filesystem::is_regular_file(outcome.final_destination));
        EXPECT_FALSE(std::filesystem::exists(outcome.record.original));
    }

    QuarantineEngine::Journal journal(quarantine_dir, logger);
    EXPECT_EQ(journal.Load().size(), 2u);
}

TEST_F(QuarantineManagerTest, KeepsDiscoveryOrder) {
    const std::vector<std::filesystem::path> files = {
        CreateFile("data/zeta.txt"), CreateFile("data/alpha.txt"), CreateFile("data/mid.txt")
    };
    QuarantineEngine::QuarantineManager manager(QuarantineEngine::QuarantineConfig(), logger);

    auto result = manager.Run(files, quarantine_dir, false, scan_root, false);

    ASSERT_EQ(result.outcomes.size(), 3u);
    EXPECT_EQ(result.outcomes[0].final_destination.filename(), "zeta.txt");
    EXPECT_EQ(result.outcomes[1].final_destination.filename(), "alpha.txt");
    EXPECT_EQ(result.outcomes[2].final_destination.filename(), "mid.txt");
}

TEST_F(QuarantineManagerTest, SameNamesWithoutStructureGetSuffix) {
    const std::vector<std::filesystem::path> files = {
        CreateFile("data/a/same.txt"), CreateFile("data/b/same.txt")
    };
    QuarantineEngine::QuarantineManager manager(QuarantineEngine::QuarantineConfig(), logger);

    auto result = manager.Run(files, quarantine_dir, false, scan_root, false);

    ASSERT_EQ(result.outcomes.size(), 2u);
    EXPECT_EQ(result.outcomes[0].final_destination, quarantine_dir / "same.txt");
    EXPECT_EQ(result.outcomes[1].final_destination, quarantine_dir / "same_1.txt");
}

TEST_F(QuarantineManagerTest, FailureIsIsolatedPerFile) {
    // Arrange
    const std::vector<std::filesystem::path> files = {
        CreateFile("data/first.txt"), scan_root / "vanished.txt", CreateFile("data/last.txt")
    };
    QuarantineEngine::QuarantineManager manager(QuarantineEngine::QuarantineConfig(), logger);

    std::vector<std::string> reported;
    manager.SetErrorCallback([&reported](const std::string&, const std::filesystem::path& file_path) {
        reported.push_back(file_path.filename().string());
    });

    // Act
    auto result = manager.Run(files, quarantine_dir, false, scan_root, false);

    // Assert
    EXPECT_EQ(result.outcomes.size(), 2u);
    ASSERT_EQ(result.failures.size(), 1u);
    EXPECT_EQ(result.failures[0].source, scan_root / "vanished.txt");
    EXPECT_THAT(reported, ElementsAre("vanished.txt"));
    EXPECT_EQ(QuarantineEngine::Journal(quarantine_dir, logger).Load().size(), 2u);
}

TEST_F(QuarantineManagerTest, NonUtf8NameStaysInPlaceAndIsReported) {
    // Arrange
    auto plain = CreateFile("data/plain.txt");
    auto latin1 = CreateFile(std::string("data/r\xe9sum\xe9.txt"));
    QuarantineEngine::QuarantineManager manager(QuarantineEngine::QuarantineConfig(), logger);

    // Act
    auto result = manager.Run({plain, latin1}, quarantine_dir, false, scan_root, false);

    // Assert
    ASSERT_EQ(result.outcomes.size(), 1u);
    ASSERT_EQ(result.failures.size(), 1u);
    EXPECT_EQ(result.failures[0].source, latin1);
    EXPECT_THAT(result.failures[0].error_message, HasSubstr("UTF-8"));
    EXPECT_TRUE(std::filesystem::exists(latin1));
    EXPECT_FALSE(std::filesystem::exists(plain));

    auto journaled = QuarantineEngine::Journal(quarantine_dir, logger).Load();
    ASSERT_EQ(journaled.size(), 1u);
    EXPECT_EQ(journaled[0].original.filename(), "plain.txt");
}

TEST_F(QuarantineManagerTest, DryRunLeavesFilesystemUnchanged) {
    // Arrange
    auto one = CreateFile("data/one.txt");
    auto two = CreateFile("data/nested/two.txt");

    QuarantineEngine::QuarantineManager manager(QuarantineEngine::QuarantineConfig(), logger);

    // Act
    auto result = manager.Run({one, two}, quarantine_dir, true, scan_root, true);

    // Assert
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(result.dry_run);
    EXPECT_FALSE(result.journal_written);
    EXPECT_FALSE(std::filesystem::exists(quarantine_dir));
    EXPECT_TRUE(std::filesystem::exists(one));
    EXPECT_TRUE(std::filesystem::exists(two));

    ASSERT_EQ(result.outcomes.size(), 2u);
    EXPECT_EQ(result.outcomes[0].final_destination, quarantine_dir / "one.txt");
    EXPECT_EQ(result.outcomes[1].final_destination, quarantine_dir / "nested" / "two.txt");
    for (const auto& record : result.Records()) {
        EXPECT_EQ(record.action, QuarantineEngine::MoveAction::DRY_RUN);
    }
}

TEST_F(QuarantineManagerTest, UnusableQuarantineDirectoryMovesNothing) {
    auto file = CreateFile("data/one.txt");
    auto blocker = CreateFile("blocker");
    QuarantineEngine::QuarantineManager manager(QuarantineEngine::QuarantineConfig(), logger);

    std::vector<std::filesystem::path> reported;
    manager.SetErrorCallback([&reported](const std::string&, const std::filesystem::path& path) {
        reported.push_back(path);
    });

    auto result = manager.Run({file}, blocker / "quarantine-x", false, scan_root, false);

    EXPECT_FALSE(result.success);
    EXPECT_THAT(reported, ElementsAre(blocker / "quarantine-x"));
    EXPECT_FALSE(result.error_message.empty());
    EXPECT_TRUE(result.outcomes.empty());
    EXPECT_TRUE(std::filesystem::exists(file));
}

TEST_F(QuarantineManagerTest, NoFilesNoJournal) {
    QuarantineEngine::QuarantineManager manager(QuarantineEngine::QuarantineConfig(), logger);

    auto result = manager.Run({}, quarantine_dir, false, scan_root, false);

    EXPECT_TRUE(result.success);
    EXPECT_FALSE(result.journal_written);
    EXPECT_TRUE(std::filesystem::is_directory(quarantine_dir));
    EXPECT_FALSE(std::filesystem::exists(quarantine_dir / "metadata.json"));
}

TEST_F(QuarantineManagerTest, MoveCallbackSeesEveryOutcome) {
    const std::vector<std::filesystem::path> files = {CreateFile("data/a.txt"), CreateFile("data/b.txt")};
    QuarantineEngine::QuarantineManager manager(QuarantineEngine::QuarantineConfig(), logger);

    std::size_t calls = 0;
    manager.SetMoveCallback([&calls](const std::filesystem::path&, const QuarantineEngine::MoveOutcome&) {
        ++calls;
    });

    manager.Run(files, quarantine_dir, false, scan_root, false);

    EXPECT_EQ(calls, 2u);
}

// ============================================================================
// QuarantineDirectory
// ============================================================================

class QuarantineDirectoryTest : public TempDirFixture {};

TEST_F(QuarantineDirectoryTest, MakePathUsesTimestampedName) {
    QuarantineEngine::QuarantineDirectory directories(QuarantineEngine::DEFAULT_QUARANTINE_PREFIX,
                                                      QuarantineEngine::DEFAULT_JOURNAL_FILE_NAME, logger);

    auto path = directories.MakePath(test_dir, std::chrono::system_clock::now());

    EXPECT_EQ(path.parent_path(), test_dir);
    EXPECT_THAT(path.filename().string(), MatchesRegex("quarantine-[0-9]{8}-[0-9]{6}"));
    EXPECT_FALSE(std::filesystem::exists(path));
}

TEST_F(QuarantineDirectoryTest, CreateIsIdempotent) {
    QuarantineEngine::QuarantineDirectory directories(QuarantineEngine::DEFAULT_QUARANTINE_PREFIX,
                                                      QuarantineEngine::DEFAULT_JOURNAL_FILE_NAME, logger);
    const auto path = test_dir / "quarantine-20250101-000000";

    EXPECT_NO_THROW(directories.Create(path));
    EXPECT_NO_THROW(directories.Create(path));
    EXPECT_TRUE(std::filesystem::is_directory(path));

    auto blocker = CreateFile("quarantine-file");
    EXPECT_THROW(directories.Create(blocker), QuarantineEngine::IOError);
}

TEST_F(QuarantineDirectoryTest, FindLatestPicksGreatestName) {
    QuarantineEngine::QuarantineDirectory directories(QuarantineEngine::DEFAULT_QUARANTINE_PREFIX,
                                                      QuarantineEngine::DEFAULT_JOURNAL_FILE_NAME, logger);
    EXPECT_FALSE(directories.FindLatest(test_dir).has_value());

    std::filesystem::create_directories(test_dir / "quarantine-20250101-000000");
    std::filesystem::create_directories(test_dir / "quarantine-20250721-101010");
    std::filesystem::create_directories(test_dir / "quarantine-20240101-000000");
    CreateFile("quarantine-20991231-235959"); // файл, не каталог
    std::filesystem::create_directories(test_dir / "other");

    auto latest = directories.FindLatest(test_dir);

    ASSERT_TRUE(latest.has_value());
    EXPECT_EQ(latest->filename(), "quarantine-20250721-101010");
    EXPECT_TRUE(latest->is_absolute());
}

TEST_F(QuarantineDirectoryTest, ListReportsCounts) {
    // Arrange
    QuarantineEngine::QuarantineDirectory directories(QuarantineEngine::DEFAULT_QUARANTINE_PREFIX,
                                                      QuarantineEngine::DEFAULT_JOURNAL_FILE_NAME, logger);
    CreateFile("quarantine-20250102-000000/metadata.json", "[{}, {}, {}]");
    CreateFile("quarantine-20250101-000000/metadata.json", "broken");
    std::filesystem::create_directories(test_dir / "quarantine-20250103-000000");

    // Act
    auto listings = directories.List(test_dir);

    // Assert
    ASSERT_EQ(listings.size(), 3u);
    EXPECT_EQ(listings[0].directory.filename(), "quarantine-20250101-000000");
    EXPECT_FALSE(listings[0].item_count.has_value());
    EXPECT_EQ(listings[1].item_count, std::optional<std::size_t>(3));
    EXPECT_FALSE(listings[2].item_count.has_value());
}

TEST_F(QuarantineDirectoryTest, MissingBaseListsNothing) {
    QuarantineEngine::QuarantineDirectory directories;

    EXPECT_TRUE(directories.List(test_dir / "missing").empty());
    EXPECT_FALSE(directories.FindLatest(test_dir / "missing").has_value());
}

} // namespace QuarantineTests
