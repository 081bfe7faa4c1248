#include <gtest/gtest.h>

#include "core/HistoryStore.hpp"
#include "core/ManagerError.hpp"
#include "support/TempDirectory.hpp"

namespace
{
    CompletedTask makeEntry(const std::string &url, const std::string &destination, time_t completedAt)
    {
        CompletedTask entry;
        entry.url = url;
        entry.destination = destination;
        entry.totalBytes = 1000;
        entry.durationSecs = 4;
        entry.completedAt = completedAt;
        return entry;
    }
}

TEST(HistoryStoreTest, AddAssignsIdsAndListsNewestFirst)
{
    HistoryStore history;

    std::string older = history.add(makeEntry("http://host/old.iso", "/data/old.iso", 100));
    std::string newer = history.add(makeEntry("http://host/new.iso", "/data/new.iso", 200));

    EXPECT_FALSE(older.empty());
    EXPECT_NE(older, newer);

    auto entries = history.list();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].id, newer);
    EXPECT_EQ(entries[1].id, older);
}

TEST(HistoryStoreTest, ExplicitIdIsKept)
{
    HistoryStore history;
    CompletedTask entry = makeEntry("http://host/a", "/data/a", 1);
    entry.id = "h-manual";

    EXPECT_EQ(history.add(entry), "h-manual");
    EXPECT_EQ(history.list().front().id, "h-manual");
}

TEST(HistoryStoreTest, ReusedIdReplacesTheEarlierEntry)
{
    HistoryStore history;
    CompletedTask first = makeEntry("http://host/a", "/data/a", 1);
    first.id = "h-manual";
    CompletedTask second = makeEntry("http://host/b", "/data/b", 2);
    second.id = "h-manual";

    history.add(first);
    history.add(second);

    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history.list().front().url, "http://host/b");

    history.remove("h-manual");
    EXPECT_EQ(history.size(), 0u);
}

TEST(HistoryStoreTest, SearchIsCaseInsensitiveOverUrlAndDestination)
{
    HistoryStore history;
    history.add(makeEntry("http://mirror.example/Ubuntu.ISO", "/data/os.img", 1));
    history.add(makeEntry("http://host/song.mp3", "/music/UBUNTU-theme.mp3", 2));
    history.add(makeEntry("http://host/other.bin", "/data/other.bin", 3));

    auto matches = history.search("ubuntu");
    ASSERT_EQ(matches.size(), 2u);
    EXPECT_EQ(matches[0].url, "http://host/song.mp3");
    EXPECT_EQ(matches[1].url, "http://mirror.example/Ubuntu.ISO");

    EXPECT_TRUE(history.search("nothing-like-this").empty());
    EXPECT_EQ(history.search("").size(), 3u);
}

TEST(HistoryStoreTest, SearchOnEmptyStoreReturnsNothing)
{
    HistoryStore history;
    EXPECT_TRUE(history.search("anything").empty());
}

TEST(HistoryStoreTest, RemoveUnknownIdIsNotFound)
{
    HistoryStore history;
    std::string id = history.add(makeEntry("http://host/a", "/data/a", 1));

    try
    {
        history.remove("h-unknown");
        FAIL() << "expected NotFound";
    }
    catch (const ManagerError &e)
    {
        EXPECT_EQ(e.getKind(), ErrorKind::NOT_FOUND);
    }

    history.remove(id);
    EXPECT_EQ(history.size(), 0u);
}

TEST(HistoryStoreTest, ClearEmptiesTheStore)
{
    HistoryStore history;
    history.add(makeEntry("http://host/a", "/data/a", 1));
    history.add(makeEntry("http://host/b", "/data/b", 2));

    history.clear();
    EXPECT_TRUE(history.list().empty());
}

TEST(HistoryStoreTest, OldestEntriesAreDroppedAtCapacity)
{
    HistoryStore history("", 3);
    for (time_t t = 1; t <= 5; ++t)
    {
        history.add(makeEntry("http://host/" + std::to_string(t), "/data/x", t));
    }

    auto entries = history.list();
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].completedAt, 5);
    EXPECT_EQ(entries[2].completedAt, 3);
}

TEST(HistoryStoreTest, AverageSpeed)
{
    CompletedTask entry = makeEntry("http://host/a", "/data/a", 1);
    EXPECT_DOUBLE_EQ(entry.getAverageSpeed(), 250.0);

    entry.durationSecs = 0;
    EXPECT_DOUBLE_EQ(entry.getAverageSpeed(), 0.0);
}

TEST(HistoryStoreTest, PersistsAcrossInstances)
{
    TempDirectory dir;
    const std::string file = dir.file("history");

    std::string id;
    {
        HistoryStore history(file);
        CompletedTask entry = makeEntry("http://host/a b", "/data/with space", 42);
        entry.outcome = CompletionOutcome::CANCELLED;
        id = history.add(entry);
    }

    HistoryStore reloaded(file);
    auto entries = reloaded.list();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].id, id);
    EXPECT_EQ(entries[0].url, "http://host/a b");
    EXPECT_EQ(entries[0].destination, "/data/with space");
    EXPECT_EQ(entries[0].completedAt, 42);
    EXPECT_EQ(entries[0].outcome, CompletionOutcome::CANCELLED);
}
