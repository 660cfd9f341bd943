#include <gtest/gtest.h>
#include <csignal>
#include <random>
#include <sys/resource.h>
#include "file_backup.hpp"
#include "test_support.hpp"

namespace fs = std::filesystem;

namespace {

// Caps the size of files this process may write and ignores SIGXFSZ, so writes past
// the cap fail with EFBIG. The previous limit and handler are restored on exit.
class FileSizeLimit {
public:
    explicit FileSizeLimit(rlim_t bytes) {
        previousHandler_ = std::signal(SIGXFSZ, SIG_IGN);
        active_ = getrlimit(RLIMIT_FSIZE, &previous_) == 0;
        if (active_) {
            rlimit capped = previous_;
            capped.rlim_cur = bytes;
            active_ = setrlimit(RLIMIT_FSIZE, &capped) == 0;
        }
    }

    ~FileSizeLimit() {
        if (active_) {
            setrlimit(RLIMIT_FSIZE, &previous_);
        }
        std::signal(SIGXFSZ, previousHandler_);
    }

    FileSizeLimit(const FileSizeLimit&) = delete;
    FileSizeLimit& operator=(const FileSizeLimit&) = delete;

    bool active() const { return active_; }

private:
    rlimit previous_{};
    bool active_ = false;
    void (*previousHandler_)(int) = SIG_DFL;
};

std::string randomBytes(std::size_t count) {
    std::mt19937 engine(42);
    std::uniform_int_distribution<int> byte(0, 255);
    std::string data(count, '\0');
    for (auto& c : data) {
        c = static_cast<char>(byte(engine));
    }
    return data;
}

} // namespace

class ZipFileBackupStrategyTest : public ::testing::Test {
protected:
    void SetUp() override {
        source_ = temp_.path() / "src";
        destination_ = temp_.path() / "out";
        fs::create_directories(source_);
        config_ = makeConfig(source_, destination_);
        strategy_ = std::make_unique<ZipFileBackupStrategy>(config_);
    }

    ArchiveTask makeTask(const std::string& name = "backup_20250111_143022.zip") const {
        return ArchiveTask{source_.string(), destination_.string(), ExclusionRuleSet::withDefaults(), name};
    }

    TempDir temp_;
    fs::path source_;
    fs::path destination_;
    BackupConfig config_;
    std::unique_ptr<ZipFileBackupStrategy> strategy_;
};

TEST_F(ZipFileBackupStrategyTest, ArchivesOnlyEligibleEntries) {
    writeFile(source_ / "app" / "main.py", "print('hello')\n");
    writeFile(source_ / ".venv" / "lib" / "x.so");
    writeFile(source_ / "__pycache__" / "a.pyc");
    writeFile(source_ / "data.log");
    writeFile(source_ / "notes.txt", "remember");

    auto result = strategy_->execute(makeTask());
    ASSERT_TRUE(result.has_value()) << result.error().message;

    EXPECT_EQ(result->fileName, "backup_20250111_143022.zip");
    EXPECT_EQ(fs::path(result->archivePath), destination_ / "backup_20250111_143022.zip");
    EXPECT_EQ(result->filesAdded, 2u);
    EXPECT_EQ(result->skippedEntries, 0u);
    EXPECT_GT(result->sizeBytes, 0u);
    EXPECT_EQ(result->sizeBytes, fs::file_size(result->archivePath));

    std::vector<std::string> expected{"app/main.py", "notes.txt"};
    EXPECT_EQ(listArchiveEntries(result->archivePath), expected);
    EXPECT_EQ(readArchiveEntry(result->archivePath, "app/main.py"), "print('hello')\n");
    EXPECT_EQ(readArchiveEntry(result->archivePath, "notes.txt"), "remember");
}

TEST_F(ZipFileBackupStrategyTest, ExcludedDirectoriesAreSkippedAtAnyDepth) {
    writeFile(source_ / "deep" / "a" / "node_modules" / "pkg" / "index.js");
    writeFile(source_ / "deep" / "b" / ".git" / "HEAD");
    writeFile(source_ / "deep" / "b" / "c" / "__pycache__" / "mod.cpython-311.pyc");
    writeFile(source_ / "deep" / "b" / "c" / "cache.tmp");
    writeFile(source_ / "deep" / "keep.txt");

    auto result = strategy_->execute(makeTask());
    ASSERT_TRUE(result.has_value()) << result.error().message;

    std::vector<std::string> expected{"deep/keep.txt"};
    EXPECT_EQ(listArchiveEntries(result->archivePath), expected);
}

TEST_F(ZipFileBackupStrategyTest, ConfiguredRulesAreApplied) {
    writeFile(source_ / "build" / "out.o");
    writeFile(source_ / "old.bak");
    writeFile(source_ / "main.cpp");

    ArchiveTask task = makeTask();
    task.rules = ExclusionRuleSet::withDefaults({"build"}, {".bak"});
    auto result = strategy_->execute(task);
    ASSERT_TRUE(result.has_value()) << result.error().message;

    std::vector<std::string> expected{"main.cpp"};
    EXPECT_EQ(listArchiveEntries(result->archivePath), expected);
}

TEST_F(ZipFileBackupStrategyTest, ExistingNameFailsWithCollision) {
    writeFile(source_ / "notes.txt");

    auto first = strategy_->execute(makeTask());
    ASSERT_TRUE(first.has_value()) << first.error().message;
    auto sizeBefore = fs::file_size(first->archivePath);

    writeFile(source_ / "more.txt", std::string(4096, 'x'));
    auto second = strategy_->execute(makeTask());
    ASSERT_FALSE(second.has_value());
    EXPECT_EQ(second.error().kind, BackupErrorKind::NameCollision);

    EXPECT_EQ(fs::file_size(first->archivePath), sizeBefore);
    std::vector<std::string> expected{"notes.txt"};
    EXPECT_EQ(listArchiveEntries(first->archivePath), expected);
}

TEST_F(ZipFileBackupStrategyTest, DestinationInsideSourceIsNotArchivedRecursively) {
    destination_ = source_ / "backups";
    writeFile(source_ / "notes.txt");
    writeFile(destination_ / "backup_20240101_000000.zip", "previous archive");
    writeFile(destination_ / "readme.txt");

    auto result = strategy_->execute(makeTask());
    ASSERT_TRUE(result.has_value()) << result.error().message;

    std::vector<std::string> expected{"backups/readme.txt", "notes.txt"};
    EXPECT_EQ(listArchiveEntries(result->archivePath), expected);
}

TEST_F(ZipFileBackupStrategyTest, MissingSourceFailsWithIOError) {
    source_ = temp_.path() / "does-not-exist";

    auto result = strategy_->execute(makeTask());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, BackupErrorKind::IOError);
    EXPECT_TRUE(listFiles(destination_).empty());
}

TEST_F(ZipFileBackupStrategyTest, UnusableDestinationFailsWithIOError) {
    writeFile(source_ / "notes.txt");
    destination_ = temp_.path() / "not-a-directory";
    writeFile(destination_);

    auto result = strategy_->execute(makeTask());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, BackupErrorKind::IOError);
}

TEST_F(ZipFileBackupStrategyTest, DanglingEntriesAreSkippedAndCounted) {
    writeFile(source_ / "notes.txt");
    fs::create_symlink(source_ / "vanished.txt", source_ / "ghost.txt");

    auto result = strategy_->execute(makeTask());
    ASSERT_TRUE(result.has_value()) << result.error().message;

    EXPECT_EQ(result->skippedEntries, 1u);
    std::vector<std::string> expected{"notes.txt"};
    EXPECT_EQ(listArchiveEntries(result->archivePath), expected);
}

TEST_F(ZipFileBackupStrategyTest, WriteFailureRemovesPartialArchive) {
    writeFile(source_ / "notes.txt");
    writeFile(source_ / "blob.bin", randomBytes(1024 * 1024));
    fs::create_directories(destination_);

    std::expected<ArchiveResult, BackupError> result;
    {
        FileSizeLimit limit(64 * 1024);
        if (!limit.active()) {
            GTEST_SKIP() << "cannot lower RLIMIT_FSIZE";
        }
        result = strategy_->execute(makeTask());
    }

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, BackupErrorKind::IOError);
    EXPECT_TRUE(listFiles(destination_).empty());
}

TEST_F(ZipFileBackupStrategyTest, FileFailingOnFirstReadIsSkippedWhole) {
    // Reading /proc/self/mem at offset 0 fails with EIO.
    if (!fs::is_regular_file("/proc/self/mem")) {
        GTEST_SKIP() << "/proc/self/mem not available";
    }
    writeFile(source_ / "notes.txt");
    fs::create_symlink("/proc/self/mem", source_ / "memory.bin");

    auto result = strategy_->execute(makeTask());
    ASSERT_TRUE(result.has_value()) << result.error().message;

    EXPECT_EQ(result->filesAdded, 1u);
    EXPECT_EQ(result->skippedEntries, 1u);
    std::vector<std::string> expected{"notes.txt"};
    EXPECT_EQ(listArchiveEntries(result->archivePath), expected);
}

TEST_F(ZipFileBackupStrategyTest, EmptySourceProducesEmptyArchive) {
    auto result = strategy_->execute(makeTask());
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result->filesAdded, 0u);
    EXPECT_TRUE(fs::exists(result->archivePath));
}

TEST(ArchiveNameTest, EncodesLocalTimestamp) {
    EXPECT_EQ(makeArchiveName(localTime(2025, 1, 11, 14, 30, 22)), "backup_20250111_143022.zip");
}

TEST(ArchiveNameTest, DistinctSecondsGiveDistinctNames) {
    auto when = localTime(2025, 1, 11, 14, 30, 22);
    EXPECT_NE(makeArchiveName(when), makeArchiveName(when + std::chrono::seconds(1)));
    EXPECT_EQ(makeArchiveName(when), makeArchiveName(when + std::chrono::milliseconds(500)));
}

TEST(ArchiveNameTest, RecognizesBackupFileNames) {
    EXPECT_TRUE(isBackupFileName("backup_20250111_143022.zip"));
    EXPECT_FALSE(isBackupFileName("backup_2025011_143022.zip"));
    EXPECT_FALSE(isBackupFileName("backup_20250111_143022.tar.gz"));
    EXPECT_FALSE(isBackupFileName("astrbot_backup_20250111_143022.zip"));
    EXPECT_FALSE(isBackupFileName("backup_2025O111_143022.zip"));
    EXPECT_FALSE(isBackupFileName("backup_latest.zip"));
}
