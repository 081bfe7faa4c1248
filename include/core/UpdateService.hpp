#ifndef UPDATESERVICE_HPP
#define UPDATESERVICE_HPP

#include <string>
#include <memory>
#include <functional>

#include "core/ConfigStore.hpp"
#include "core/TransferChannel.hpp"

struct UpdateInfo
{
    bool available{false};
    std::string latestVersion;
    std::string currentVersion;
    std::string url;
    std::string notes;
    std::string releaseDate;
    bool mandatory{false};
};

// Launches a downloaded update artifact. Throws ManagerError(INSTALL_FAILED) when it cannot.
class Installer
{
public:
    virtual ~Installer() = default;
    virtual void launch(const std::string &artifactPath) = 0;
};

// Marks the artifact executable and starts it in its own session, without waiting for it
class PosixInstaller final : public Installer
{
public:
    void launch(const std::string &artifactPath) override;
};

// Asks the host application to exit so the installer can replace it
using ExitRequest = std::function<void()>;

// Checks the configured manifest URL for a newer release and installs it.
// The manifest is a JSON object: {"version", "url", "notes", "mandatory", "date"}.
class UpdateService
{
public:
    UpdateService(ConfigStore &config, ChannelFactory channelFactory, std::unique_ptr<Installer> installer,
                  ExitRequest exitRequest, std::string currentVersion);

    UpdateService(const UpdateService &) = delete;
    UpdateService &operator=(const UpdateService &) = delete;

    // Throws ManagerError(NETWORK_ERROR) if the manifest is unreachable or malformed
    UpdateInfo check();

    // Throws NETWORK_ERROR if the artifact cannot be fetched, INSTALL_FAILED if there is
    // no update or the installer cannot be launched
    void downloadAndInstall(const ProgressCallback &progress = nullptr);

    bool isAutoCheckEnabled() const;

    const std::string &getCurrentVersion() const { return _currentVersion; }

    // Parses a manifest document; throws NETWORK_ERROR when it is malformed
    static UpdateInfo parseManifest(const std::string &body, const std::string &currentVersion);

private:
    ConfigStore &_config;
    ChannelFactory _channelFactory;
    std::unique_ptr<Installer> _installer;
    ExitRequest _exitRequest;
    std::string _currentVersion;
};

#endif
