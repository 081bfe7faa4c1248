#include <gtest/gtest.h>

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "core/CurlTransferChannel.hpp"
#include "core/DownloadManager.hpp"
#include "support/TempDirectory.hpp"
#include "support/TestHttpServer.hpp"
#include "util/file.hpp"

using namespace std::chrono_literals;

namespace
{
    bool eventually(const std::function<bool()> &condition, std::chrono::milliseconds timeout = 10000ms)
    {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline)
        {
            if (condition())
                return true;
            std::this_thread::sleep_for(10ms);
        }
        return condition();
    }
}

// End-to-end: real libcurl channels against a local HTTP server
class DownloadManagerTest : public ::testing::Test
{
protected:
    TempDirectory _dir;
    TempDirectory _state;
    TestHttpServer _server;
    std::unique_ptr<DownloadManager> _manager;

    void SetUp() override
    {
        _manager = makeManager("");
    }

    void TearDown() override
    {
        _server.releaseHold();
        _manager.reset();
    }

    std::unique_ptr<DownloadManager> makeManager(const std::string &stateDirectory)
    {
        auto manager = std::make_unique<DownloadManager>(stateDirectory, makeCurlChannelFactory(), nullptr);

        AppConfig config = manager->getConfig();
        config.defaultDirectory = _dir.file("downloads");
        config.requestTimeoutSecs = 5;
        config.retryCount = 0;
        manager->updateConfig(config);
        return manager;
    }

    void setCeiling(size_t ceiling)
    {
        AppConfig config = _manager->getConfig();
        config.maxConcurrentDownloads = ceiling;
        _manager->updateConfig(config);
    }

    bool reachesState(DownloadManager &manager, const std::string &id, TaskState state)
    {
        return eventually([&]
                          { return manager.getTask(id).getState() == state; });
    }

    bool reachesBytes(DownloadManager &manager, const std::string &id, std::uint64_t bytes)
    {
        return eventually([&]
                          { return manager.getTask(id).getBytesReceived() == bytes; });
    }
};

TEST_F(DownloadManagerTest, PauseAndResumeContinuesWithARangeRequest)
{
    const std::string body = makeBody(1000);
    TestResource resource{body};
    resource.holdAt = 400;
    _server.setResource("/movie.bin", resource);

    std::string id = _manager->addTask(_server.url("/movie.bin"), _dir.file("movie.bin"));

    ASSERT_TRUE(_server.waitForBodyBytes("/movie.bin", 400, 5000ms));
    ASSERT_TRUE(reachesBytes(*_manager, id, 400));

    _manager->pauseTask(id);

    DownloadTask paused = _manager->getTask(id);
    EXPECT_EQ(paused.getState(), TaskState::PAUSED);
    EXPECT_EQ(paused.getBytesReceived(), 400u);

    _server.releaseHold();
    _manager->resumeTask(id);

    ASSERT_TRUE(reachesState(*_manager, id, TaskState::COMPLETED));
    EXPECT_EQ(_manager->getTask(id).getBytesReceived(), 1000u);
    EXPECT_EQ(readFile(_dir.file("movie.bin")), body);

    std::vector<std::string> ranges = _server.rangeHeaders("/movie.bin");
    ASSERT_EQ(ranges.size(), 2u);
    EXPECT_EQ(ranges[0], "");
    EXPECT_EQ(ranges[1], "bytes=400-");

    ASSERT_TRUE(eventually([&]
                           { return _manager->getHistory().size() == 1u; }));
    EXPECT_EQ(_manager->getHistory().front().totalBytes, 1000u);
}

TEST_F(DownloadManagerTest, CancellingTheOnlyRunningTaskStartsTheNext)
{
    setCeiling(1);

    TestResource first{makeBody(800)};
    first.holdAt = 100;
    _server.setResource("/first.bin", first);
    _server.setResource("/second.bin", TestResource{makeBody(500)});

    std::string a = _manager->addTask(_server.url("/first.bin"), _dir.file("first.bin"));
    std::string b = _manager->addTask(_server.url("/second.bin"), _dir.file("second.bin"));

    ASSERT_TRUE(_server.waitForBodyBytes("/first.bin", 100, 5000ms));
    EXPECT_EQ(_manager->getTask(a).getState(), TaskState::DOWNLOADING);
    EXPECT_EQ(_manager->getTask(b).getState(), TaskState::QUEUED);

    _manager->cancelTask(a);

    EXPECT_THROW(_manager->getTask(a), ManagerError);
    ASSERT_TRUE(reachesState(*_manager, b, TaskState::COMPLETED));
    EXPECT_TRUE(eventually([&]
                           { return !fileExists(_dir.file("first.bin")); }));
    EXPECT_TRUE(eventually([&]
                           { return _manager->getHistory().size() == 1u; }));
}

TEST_F(DownloadManagerTest, ZeroConcurrencyIsRejected)
{
    AppConfig before = _manager->getConfig();

    AppConfig bad = before;
    bad.maxConcurrentDownloads = 0;

    try
    {
        _manager->updateConfig(bad);
        FAIL() << "expected InvalidConfig";
    }
    catch (const ManagerError &e)
    {
        EXPECT_EQ(e.getKind(), ErrorKind::INVALID_CONFIG);
    }

    EXPECT_EQ(_manager->getConfig(), before);
}

TEST_F(DownloadManagerTest, ServerNamesTheFileWhenNoneIsGiven)
{
    TestResource resource{makeBody(256)};
    resource.contentDisposition = "attachment; filename=\"report.pdf\"";
    _server.setResource("/export", resource);

    std::string first = _manager->addTask(_server.url("/export"), "");
    EXPECT_EQ(_manager->getTask(first).getDestination(), normalisePath(_dir.file("downloads/report.pdf")));
    ASSERT_TRUE(reachesState(*_manager, first, TaskState::COMPLETED));

    std::string second = _manager->addTask(_server.url("/export"), _dir.file("downloads"));
    EXPECT_EQ(_manager->getTask(second).getDestination(), normalisePath(_dir.file("downloads/report__1.pdf")));
    ASSERT_TRUE(reachesState(*_manager, second, TaskState::COMPLETED));
}

TEST_F(DownloadManagerTest, QueuedTasksWithTheSameServerNameGetDistinctFiles)
{
    setCeiling(1);

    TestResource first{makeBody(600)};
    first.holdAt = 100;
    _server.setResource("/file.bin", first);
    _server.setResource("/other/file.bin", TestResource{makeBody(300)});

    std::string a = _manager->addTask(_server.url("/file.bin"), "");
    ASSERT_TRUE(_server.waitForBodyBytes("/file.bin", 100, 5000ms));

    std::string b = _manager->addTask(_server.url("/other/file.bin"), "");
    std::string c;
    ASSERT_NO_THROW(c = _manager->addTask(_server.url("/file.bin"), ""));

    EXPECT_EQ(_manager->getTask(a).getDestination(), normalisePath(_dir.file("downloads/file.bin")));
    EXPECT_EQ(_manager->getTask(b).getDestination(), normalisePath(_dir.file("downloads/file__1.bin")));
    EXPECT_EQ(_manager->getTask(c).getDestination(), normalisePath(_dir.file("downloads/file__2.bin")));

    _server.releaseHold();
    ASSERT_TRUE(reachesState(*_manager, a, TaskState::COMPLETED));
    ASSERT_TRUE(reachesState(*_manager, b, TaskState::COMPLETED));
    ASSERT_TRUE(reachesState(*_manager, c, TaskState::COMPLETED));
    EXPECT_EQ(readFile(_dir.file("downloads/file__1.bin")), makeBody(300));
}

TEST_F(DownloadManagerTest, UrlNamesTheFileWithoutContentDisposition)
{
    _server.setResource("/files/archive.tar.gz", TestResource{makeBody(128)});

    std::string id = _manager->addTask(_server.url("/files/archive.tar.gz?token=abc"), "");
    EXPECT_EQ(_manager->getTask(id).getDestination(), normalisePath(_dir.file("downloads/archive.tar.gz")));
}

TEST_F(DownloadManagerTest, FailedDownloadCanBeRetried)
{
    TestResource broken{"upstream down"};
    broken.status = 503;
    _server.setResource("/flaky.bin", broken);

    std::string id = _manager->addTask(_server.url("/flaky.bin"), _dir.file("flaky.bin"));

    ASSERT_TRUE(reachesState(*_manager, id, TaskState::FAILED));
    DownloadTask failed = _manager->getTask(id);
    ASSERT_TRUE(failed.getError());
    EXPECT_EQ(failed.getError()->httpStatus, 503);
    EXPECT_EQ(failed.getError()->curlCode, CURLE_HTTP_RETURNED_ERROR);
    EXPECT_TRUE(_manager->getHistory().empty());

    const std::string body = makeBody(600);
    _server.setResource("/flaky.bin", TestResource{body});
    _manager->retryTask(id);

    ASSERT_TRUE(reachesState(*_manager, id, TaskState::COMPLETED));
    EXPECT_FALSE(_manager->getTask(id).getError());
    EXPECT_EQ(readFile(_dir.file("flaky.bin")), body);
}

TEST_F(DownloadManagerTest, PausedAndFailedTasksCanBeCancelled)
{
    TestResource held{makeBody(800)};
    held.holdAt = 100;
    _server.setResource("/held.bin", held);
    TestResource broken{"upstream down"};
    broken.status = 503;
    _server.setResource("/broken.bin", broken);

    std::string paused = _manager->addTask(_server.url("/held.bin"), _dir.file("held.bin"));
    ASSERT_TRUE(reachesBytes(*_manager, paused, 100));
    _manager->pauseTask(paused);
    ASSERT_TRUE(fileExists(_dir.file("held.bin")));

    std::string failed = _manager->addTask(_server.url("/broken.bin"), _dir.file("broken.bin"));
    ASSERT_TRUE(reachesState(*_manager, failed, TaskState::FAILED));
    writeFile(_dir.file("broken.bin"), "partial");

    _manager->cancelTask(paused);
    _manager->cancelTask(failed);

    for (const std::string &id : {paused, failed})
    {
        try
        {
            _manager->getTask(id);
            ADD_FAILURE() << "expected NotFound for " << id;
        }
        catch (const ManagerError &e)
        {
            EXPECT_EQ(e.getKind(), ErrorKind::NOT_FOUND);
        }
    }

    _server.releaseHold();
    EXPECT_TRUE(eventually([&]
                           { return !fileExists(_dir.file("held.bin")); }));
    EXPECT_FALSE(fileExists(_dir.file("broken.bin")));
    EXPECT_TRUE(_manager->getTasks().empty());
}

TEST_F(DownloadManagerTest, CommandErrorsCarryTheirKind)
{
    TestResource held{makeBody(500)};
    held.holdAt = 50;
    _server.setResource("/held.bin", held);

    std::string id = _manager->addTask(_server.url("/held.bin"), _dir.file("held.bin"));
    ASSERT_TRUE(_server.waitForBodyBytes("/held.bin", 50, 5000ms));

    auto kindOf = [](const std::function<void()> &action)
    {
        try
        {
            action();
        }
        catch (const ManagerError &e)
        {
            return e.getKind();
        }
        ADD_FAILURE() << "expected a ManagerError";
        return ErrorKind::IO_ERROR;
    };

    EXPECT_EQ(kindOf([&]
                     { _manager->removeTask(id); }),
              ErrorKind::TASK_BUSY);
    EXPECT_EQ(kindOf([&]
                     { _manager->resumeTask(id); }),
              ErrorKind::INVALID_TRANSITION);
    EXPECT_EQ(kindOf([&]
                     { _manager->retryTask(id); }),
              ErrorKind::INVALID_TRANSITION);
    EXPECT_EQ(kindOf([&]
                     { _manager->pauseTask("t-unknown"); }),
              ErrorKind::NOT_FOUND);
    EXPECT_EQ(kindOf([&]
                     { _manager->addTask(_server.url("/held.bin"), _dir.file("held.bin")); }),
              ErrorKind::DUPLICATE_DESTINATION);
    EXPECT_EQ(kindOf([&]
                     { _manager->addTask(_server.url("/held.bin"), _dir.file("missing/dir/held.bin")); }),
              ErrorKind::INVALID_DESTINATION);
}

TEST_F(DownloadManagerTest, ListenersSeeTheLifecycleInOrder)
{
    _server.setResource("/small.bin", TestResource{makeBody(300)});

    std::mutex mutex;
    std::vector<TaskUpdate> updates;
    _manager->subscribe([&](const TaskUpdate &update)
                        {
                            std::lock_guard<std::mutex> lock(mutex);
                            updates.push_back(update);
                        });

    std::string id = _manager->addTask(_server.url("/small.bin"), _dir.file("small.bin"));
    // Delivery follows the change, so the last update may still be on its way
    ASSERT_TRUE(eventually([&]
                           {
                               std::lock_guard<std::mutex> lock(mutex);
                               return !updates.empty() && updates.back().task.getState() == TaskState::COMPLETED;
                           }));

    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_EQ(updates.front().kind, TaskUpdateKind::CREATED);

    std::vector<TaskState> states;
    std::uint64_t lastBytes = 0;
    for (const auto &update : updates)
    {
        if (update.kind == TaskUpdateKind::STATE_CHANGED)
        {
            states.push_back(update.task.getState());
        }
        EXPECT_GE(update.task.getBytesReceived(), lastBytes);
        lastBytes = update.task.getBytesReceived();
    }
    EXPECT_EQ(states, (std::vector<TaskState>{TaskState::DOWNLOADING, TaskState::COMPLETED}));
    EXPECT_EQ(lastBytes, 300u);
}

TEST_F(DownloadManagerTest, StateSurvivesARestart)
{
    const std::string body = makeBody(900);
    TestResource resource{body};
    resource.holdAt = 300;
    _server.setResource("/big.bin", resource);

    std::string id;
    {
        auto first = makeManager(_state.path());
        AppConfig config = first->getConfig();
        config.maxConcurrentDownloads = 5;
        first->updateConfig(config);

        id = first->addTask(_server.url("/big.bin"), _dir.file("big.bin"));
        ASSERT_TRUE(reachesBytes(*first, id, 300));
    }

    _server.releaseHold();

    auto second = std::make_unique<DownloadManager>(_state.path(), makeCurlChannelFactory(), nullptr);
    EXPECT_EQ(second->getConfig().maxConcurrentDownloads, 5u);

    DownloadTask restored = second->getTask(id);
    EXPECT_EQ(restored.getState(), TaskState::PAUSED);
    EXPECT_EQ(restored.getBytesReceived(), 300u);

    second->resumeTask(id);
    ASSERT_TRUE(reachesState(*second, id, TaskState::COMPLETED));
    EXPECT_EQ(readFile(_dir.file("big.bin")), body);
    EXPECT_EQ(_server.rangeHeaders("/big.bin").back(), "bytes=300-");
    second.reset();

    DownloadManager third(_state.path(), makeCurlChannelFactory(), nullptr);
    ASSERT_EQ(third.getHistory().size(), 1u);
    EXPECT_EQ(third.getHistory().front().totalBytes, 900u);
    EXPECT_EQ(third.getTask(id).getState(), TaskState::COMPLETED);
}

TEST_F(DownloadManagerTest, HistoryCommands)
{
    CompletedTask entry;
    entry.url = "https://mirror.example/iso/debian.iso";
    entry.destination = "/data/debian.iso";
    entry.totalBytes = 4096;
    entry.completedAt = 1700000000;

    std::string id = _manager->addHistory(entry);
    EXPECT_EQ(_manager->searchHistory("DEBIAN").size(), 1u);
    EXPECT_TRUE(_manager->searchHistory("ubuntu").empty());

    _manager->removeHistory(id);
    EXPECT_TRUE(_manager->getHistory().empty());
    EXPECT_THROW(_manager->removeHistory(id), ManagerError);

    _manager->addHistory(entry);
    _manager->addHistory(entry);
    _manager->clearHistory();
    EXPECT_TRUE(_manager->getHistory().empty());
}
