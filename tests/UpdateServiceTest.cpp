#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <filesystem>
#include <functional>
#include <memory>

#include "core/CurlTransferChannel.hpp"
#include "core/UpdateService.hpp"
#include "support/TempDirectory.hpp"
#include "support/TestHttpServer.hpp"

using ::testing::_;
using ::testing::Invoke;

namespace
{
    class MockInstaller : public Installer
    {
    public:
        MOCK_METHOD(void, launch, (const std::string &artifactPath), (override));
    };

    ErrorKind kindOf(const std::function<void()> &action)
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
    }
}

TEST(UpdateManifestTest, NewerVersionIsAvailable)
{
    UpdateInfo info = UpdateService::parseManifest(
        R"({"version": "1.4.0", "url": "http://host/rdm-1.4.0", "notes": "Faster resume",
            "mandatory": true, "date": "2026-09-01"})",
        "1.3.2");

    EXPECT_TRUE(info.available);
    EXPECT_EQ(info.latestVersion, "1.4.0");
    EXPECT_EQ(info.currentVersion, "1.3.2");
    EXPECT_EQ(info.url, "http://host/rdm-1.4.0");
    EXPECT_EQ(info.notes, "Faster resume");
    EXPECT_EQ(info.releaseDate, "2026-09-01");
    EXPECT_TRUE(info.mandatory);
}

TEST(UpdateManifestTest, SameOrOlderVersionIsNotAvailable)
{
    EXPECT_FALSE(UpdateService::parseManifest(R"({"version": "1.3.2"})", "1.3.2").available);
    EXPECT_FALSE(UpdateService::parseManifest(R"({"version": "v1.2", "url": "http://host/x"})", "1.3.2").available);
    EXPECT_FALSE(UpdateService::parseManifest(R"({"version": "1.3.2-rc.1", "url": "http://host/x"})", "1.3.2").available);
}

TEST(UpdateManifestTest, MalformedManifestsAreNetworkErrors)
{
    const char *malformed[] = {
        "not json",
        "[1, 2, 3]",
        R"({"url": "http://host/x"})",
        R"({"version": "2.0.0", "mandatory": "yes", "url": "http://host/x"})",
        R"({"version": "2.0.0"})",
    };

    for (const char *body : malformed)
    {
        EXPECT_EQ(kindOf([body]
                         { UpdateService::parseManifest(body, "1.0.0"); }),
                  ErrorKind::NETWORK_ERROR)
            << body;
    }
}

class UpdateServiceTest : public ::testing::Test
{
protected:
    TempDirectory _dir;
    TestHttpServer _server;
    ConfigStore _config;
    bool _exitRequested{false};
    MockInstaller *_installer{nullptr};
    std::unique_ptr<UpdateService> _service;

    void SetUp() override
    {
        useManifest(_server.url("/manifest.json"));

        auto installer = std::make_unique<MockInstaller>();
        _installer = installer.get();
        _service = std::make_unique<UpdateService>(_config, makeCurlChannelFactory(), std::move(installer),
                                                   [this]
                                                   { _exitRequested = true; },
                                                   "1.0.0");
    }

    void useManifest(const std::string &url)
    {
        AppConfig config = _config.get();
        config.defaultDirectory = _dir.path();
        config.updateManifestUrl = url;
        config.requestTimeoutSecs = 5;
        config.retryCount = 0;
        _config.update(config);
    }

    void publish(const std::string &version, const std::string &artifactBody)
    {
        _server.setResource("/rdm-" + version, TestResource{artifactBody});
        _server.setResource("/manifest.json",
                            TestResource{R"({"version": ")" + version + R"(", "url": ")" +
                                         _server.url("/rdm-" + version) + R"(", "notes": "fixes"})"});
    }
};

TEST_F(UpdateServiceTest, CheckReportsAvailableUpdate)
{
    publish("1.1.0", "installer");

    UpdateInfo info = _service->check();

    EXPECT_TRUE(info.available);
    EXPECT_EQ(info.latestVersion, "1.1.0");
    EXPECT_EQ(info.currentVersion, "1.0.0");
    EXPECT_EQ(info.notes, "fixes");
}

TEST_F(UpdateServiceTest, CheckReportsUpToDate)
{
    publish("1.0.0", "installer");

    EXPECT_FALSE(_service->check().available);
}

TEST_F(UpdateServiceTest, UnreachableOrMissingManifestIsNetworkError)
{
    EXPECT_EQ(kindOf([this]
                     { _service->check(); }),
              ErrorKind::NETWORK_ERROR);

    _server.setResource("/manifest.json", TestResource{"{ broken"});
    EXPECT_EQ(kindOf([this]
                     { _service->check(); }),
              ErrorKind::NETWORK_ERROR);

    useManifest("");
    EXPECT_EQ(kindOf([this]
                     { _service->check(); }),
              ErrorKind::NETWORK_ERROR);
}

TEST_F(UpdateServiceTest, InstallLaunchesTheDownloadedArtifactAndRequestsExit)
{
    const std::string artifact = makeBody(3000);
    publish("2.0.0", artifact);

    std::string launchedContent;
    std::string launchedPath;
    EXPECT_CALL(*_installer, launch(_))
        .WillOnce(Invoke([&](const std::string &path)
                         {
                             launchedPath = path;
                             launchedContent = readFile(path);
                         }));

    std::uint64_t lastReport = 0;
    _service->downloadAndInstall([&](std::uint64_t bytes, std::optional<std::uint64_t>)
                                 { lastReport = bytes; });

    EXPECT_EQ(launchedContent, artifact);
    EXPECT_EQ(std::filesystem::path(launchedPath).filename().string(), "rdm-2.0.0");
    EXPECT_EQ(lastReport, artifact.size());
    EXPECT_TRUE(_exitRequested);

    std::filesystem::remove_all(std::filesystem::path(launchedPath).parent_path());
}

TEST_F(UpdateServiceTest, InstallWithoutUpdateFails)
{
    publish("1.0.0", "installer");
    EXPECT_CALL(*_installer, launch(_)).Times(0);

    EXPECT_EQ(kindOf([this]
                     { _service->downloadAndInstall(); }),
              ErrorKind::INSTALL_FAILED);
    EXPECT_FALSE(_exitRequested);
}

TEST_F(UpdateServiceTest, MissingArtifactIsNetworkError)
{
    _server.setResource("/manifest.json",
                        TestResource{R"({"version": "3.0.0", "url": ")" + _server.url("/gone") + R"("})"});
    EXPECT_CALL(*_installer, launch(_)).Times(0);

    EXPECT_EQ(kindOf([this]
                     { _service->downloadAndInstall(); }),
              ErrorKind::NETWORK_ERROR);
    EXPECT_FALSE(_exitRequested);
}

TEST_F(UpdateServiceTest, InstallerFailureIsReportedAndTheAppKeepsRunning)
{
    publish("2.0.0", "installer");
    std::string launchedPath;
    EXPECT_CALL(*_installer, launch(_))
        .WillOnce(Invoke([&](const std::string &path)
                         {
                             launchedPath = path;
                             throw ManagerError(ErrorKind::INSTALL_FAILED, "not executable");
                         }));

    EXPECT_EQ(kindOf([this]
                     { _service->downloadAndInstall(); }),
              ErrorKind::INSTALL_FAILED);
    EXPECT_FALSE(_exitRequested);

    if (!launchedPath.empty())
    {
        std::filesystem::remove_all(std::filesystem::path(launchedPath).parent_path());
    }
}

TEST_F(UpdateServiceTest, AutoCheckFollowsConfig)
{
    EXPECT_TRUE(_service->isAutoCheckEnabled());

    AppConfig config = _config.get();
    config.autoCheckUpdates = false;
    _config.update(config);

    EXPECT_FALSE(_service->isAutoCheckEnabled());
}
