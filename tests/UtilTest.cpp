#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

#include "aux/JoiningThread.hpp"
#include "support/TempDirectory.hpp"
#include "util/args.hpp"
#include "util/file.hpp"
#include "util/format.hpp"
#include "util/http.hpp"
#include "util/log.hpp"
#include "util/version.hpp"

TEST(VersionTest, ComparesNumericComponents)
{
    EXPECT_EQ(compareVersions("1.2.3", "1.2.3"), 0);
    EXPECT_EQ(compareVersions("1.2.10", "1.2.9"), 1);
    EXPECT_EQ(compareVersions("1.9", "1.10"), -1);
    EXPECT_EQ(compareVersions("2.0.0", "1.99.99"), 1);
}

TEST(VersionTest, IgnoresLeadingVAndMissingComponents)
{
    EXPECT_EQ(compareVersions("v1.2.0", "1.2"), 0);
    EXPECT_EQ(compareVersions("V2", "2.0.0"), 0);
    EXPECT_EQ(compareVersions("v1.2.1", "1.2"), 1);
}

TEST(VersionTest, PreReleaseRanksBelowRelease)
{
    EXPECT_EQ(compareVersions("1.3.0-beta.1", "1.3.0"), -1);
    EXPECT_EQ(compareVersions("1.3.0", "1.3.0-rc.2"), 1);
    EXPECT_EQ(compareVersions("1.3.0-alpha", "1.3.0-beta"), -1);
    EXPECT_EQ(compareVersions("1.3.0-beta", "1.2.9"), 1);
}

TEST(VersionTest, PreReleaseNumbersCompareNumerically)
{
    EXPECT_EQ(compareVersions("1.0.0-rc.10", "1.0.0-rc.2"), 1);
    EXPECT_EQ(compareVersions("1.0.0-rc.2", "1.0.0-RC.2"), 0);
    EXPECT_EQ(compareVersions("1.0.0-alpha", "1.0.0-alpha.1"), -1);
    EXPECT_EQ(compareVersions("1.0.0-1", "1.0.0-alpha"), -1);
}

TEST(VersionTest, BuildMetadataDoesNotAffectOrdering)
{
    EXPECT_EQ(compareVersions("1.0.0+build.5", "1.0.0"), 0);
}

TEST(ArgsTest, ExtractsArgumentsAfterCommand)
{
    auto args = extractArguments("download http://host/a.bin /tmp/a.bin", 2);
    ASSERT_EQ(args.size(), 2u);
    EXPECT_EQ(args[0], "http://host/a.bin");
    EXPECT_EQ(args[1], "/tmp/a.bin");
}

TEST(ArgsTest, QuotedArgumentsKeepSpaces)
{
    auto args = extractArguments("download http://host/a.bin \"/tmp/my file.bin\"", 2);
    ASSERT_EQ(args.size(), 2u);
    EXPECT_EQ(args[1], "/tmp/my file.bin");
}

TEST(ArgsTest, StopsAtMaxArgs)
{
    auto args = extractArguments("pause 1 2 3", 1);
    ASSERT_EQ(args.size(), 1u);
    EXPECT_EQ(args[0], "1");
    EXPECT_TRUE(extractArguments("pause", 1).empty());
}

TEST(ArgsTest, ParsesUnsignedNumbers)
{
    EXPECT_EQ(parseUnsigned("42"), std::optional<std::uint64_t>(42));
    EXPECT_EQ(parseUnsigned("0"), std::optional<std::uint64_t>(0));
    EXPECT_FALSE(parseUnsigned(""));
    EXPECT_FALSE(parseUnsigned("-1"));
    EXPECT_FALSE(parseUnsigned("12a"));
    EXPECT_FALSE(parseUnsigned("99999999999999999999999"));
}

TEST(ArgsTest, ParsesFlags)
{
    EXPECT_EQ(parseFlag("on"), std::optional<bool>(true));
    EXPECT_EQ(parseFlag("Yes"), std::optional<bool>(true));
    EXPECT_EQ(parseFlag("off"), std::optional<bool>(false));
    EXPECT_EQ(parseFlag("0"), std::optional<bool>(false));
    EXPECT_FALSE(parseFlag("maybe"));
}

TEST(FormatTest, FormatsBytesAndDurations)
{
    EXPECT_EQ(formatBytes(512), "512 B");
    EXPECT_EQ(formatBytes(2048), "2 KB");
    EXPECT_EQ(formatBytes(1.5 * 1024 * 1024), "1.5 MB");
    EXPECT_EQ(formatDuration(5), "5s");
    EXPECT_EQ(formatDuration(65), "1m 5s");
    EXPECT_EQ(formatDuration(3725), "1h 2m 5s");
    EXPECT_EQ(toLowerCase("MiXeD"), "mixed");
}

TEST(FileTest, UniqueFilenameAppendsCounterBeforeExtension)
{
    TempDirectory dir;
    const std::string original = dir.file("report.tar");

    EXPECT_EQ(getUniqueFilename(original), original);

    writeFile(original, "x");
    EXPECT_EQ(getUniqueFilename(original), dir.file("report__1.tar"));

    writeFile(dir.file("report__1.tar"), "x");
    EXPECT_EQ(getUniqueFilename(original), dir.file("report__2.tar"));
}

TEST(FileTest, NormalisedPathsCompareEqual)
{
    EXPECT_EQ(normalisePath("/tmp/a/../b/./c.bin"), "/tmp/b/c.bin");
    EXPECT_EQ(normalisePath("/tmp//x.bin"), "/tmp/x.bin");
}

TEST(FileTest, WritableDestinationRules)
{
    TempDirectory dir;

    EXPECT_TRUE(isWritableDestination(dir.file("new.bin")));
    EXPECT_FALSE(isWritableDestination(""));
    EXPECT_FALSE(isWritableDestination(dir.path()));
    EXPECT_FALSE(isWritableDestination(dir.file("missing/child.bin")));
}

TEST(FileTest, AtomicWriteReplacesContent)
{
    TempDirectory dir;
    const std::string path = dir.file("state");

    ASSERT_TRUE(writeFileAtomically(path, "first"));
    ASSERT_TRUE(writeFileAtomically(path, "second"));
    EXPECT_EQ(readFile(path), "second");
    EXPECT_FALSE(fileExists(path + ".tmp"));
}

TEST(HttpTest, DerivesFilenameFromUrl)
{
    EXPECT_EQ(http::deriveFilenameFromUrl("https://host/path/file.zip"), "file.zip");
    EXPECT_EQ(http::deriveFilenameFromUrl("https://host/path/file.zip?token=1#frag"), "file.zip");
    EXPECT_EQ(http::deriveFilenameFromUrl("https://host"), DEFAULT_FILENAME);
    EXPECT_EQ(http::deriveFilenameFromUrl("https://host/dir/"), DEFAULT_FILENAME);
}

TEST(JoiningThreadTest, JoinsWhenAnExceptionUnwindsPastIt)
{
    std::atomic<bool> finished{false};

    EXPECT_THROW(
        {
            JoiningThread worker([&finished]
                                 {
                                     std::this_thread::sleep_for(std::chrono::milliseconds(50));
                                     finished = true;
                                 });
            throw std::runtime_error("front end failed");
        },
        std::runtime_error);

    EXPECT_TRUE(finished);
}

TEST(JoiningThreadTest, JoinIsIdempotent)
{
    int runs = 0;
    JoiningThread worker([&runs]
                         { ++runs; });
    worker.join();
    worker.join();
    EXPECT_EQ(runs, 1);
}

TEST(LogTest, WrappersFormatAndRespectTheThreshold)
{
    TempDirectory dir;
    const std::string path = dir.file("rdm.log");
    ASSERT_TRUE(logging::openFile(path));

    const LogLevel previous = logging::getLevel();
    logging::setLevel(LogLevel::INFO);

    logging::debug("hidden {}", 1);
    logging::info("task {} queued", "t-1");
    logging::warn("{} retries left", 2);
    logging::error("disk {}", "full");

    logging::setLevel(previous);

    const std::string content = readFile(path);
    EXPECT_EQ(content.find("hidden"), std::string::npos);
    EXPECT_NE(content.find("[INFO] task t-1 queued"), std::string::npos);
    EXPECT_NE(content.find("[WARN] 2 retries left"), std::string::npos);
    EXPECT_NE(content.find("[ERROR] disk full"), std::string::npos);
}
