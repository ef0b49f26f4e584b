//
// Created by WhySkyDie on 21.07.2025.
//

#include "test_helpers.h"
#include "quarantine/path_namer.h"

using namespace testing;

namespace QuarantineTests {

class PathNamerTest : public TempDirFixture {};

TEST_F(PathNamerTest, FreePathIsReturnedUnchanged) {
    const auto path = test_dir / "free.txt";

    EXPECT_EQ(QuarantineEngine::PathNamer::Unique(path), path);
    EXPECT_FALSE(std::filesystem::exists(path));
}

TEST_F(PathNamerTest, ExistingPathGetsNumberedSibling) {
    // Arrange
    auto taken = CreateFile("report.txt");

    // Act
    auto unique = QuarantineEngine::PathNamer::Unique(taken);

    // Assert
    EXPECT_NE(unique, taken);
    EXPECT_EQ(unique, test_dir / "report_1.txt");
    EXPECT_FALSE(std::filesystem::exists(unique));
}

TEST_F(PathNamerTest, CounterSkipsTakenCandidates) {
    auto taken = CreateFile("report.txt");
    CreateFile("report_1.txt");
    CreateFile("report_2.txt");

    EXPECT_EQ(QuarantineEngine::PathNamer::Unique(taken), test_dir / "report_3.txt");
}

TEST_F(PathNamerTest, NoExtensionAndDotFiles) {
    auto plain = CreateFile("Makefile");
    auto dot_file = CreateFile(".env");
    auto archive = CreateFile("backup.tar.gz");

    EXPECT_EQ(QuarantineEngine::PathNamer::Unique(plain), test_dir / "Makefile_1");
    EXPECT_EQ(QuarantineEngine::PathNamer::Unique(dot_file), test_dir / ".env_1");
    EXPECT_EQ(QuarantineEngine::PathNamer::Unique(archive), test_dir / "backup.tar_1.gz");
}

TEST_F(PathNamerTest, DanglingSymlinkCountsAsTaken) {
    const auto link = test_dir / "ghost.txt";
    std::filesystem::create_symlink(test_dir / "does-not-exist", link);

    EXPECT_EQ(QuarantineEngine::PathNamer::Unique(link), test_dir / "ghost_1.txt");
}

TEST_F(PathNamerTest, IsSideEffectFree) {
    auto taken = CreateFile("a.txt");

    auto first = QuarantineEngine::PathNamer::Unique(taken);
    auto second = QuarantineEngine::PathNamer::Unique(taken);

    EXPECT_EQ(first, second);
    EXPECT_FALSE(std::filesystem::exists(first));
}

} // namespace QuarantineTests
