#include <spawn.h>
#include <sys/stat.h>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <nlohmann/json.hpp>

#include "core/UpdateService.hpp"
#include "core/ManagerError.hpp"
#include "util/file.hpp"
#include "util/http.hpp"
#include "util/id.hpp"
#include "util/log.hpp"
#include "util/version.hpp"

extern char **environ;

namespace
{
    std::string optionalString(const nlohmann::json &root, const char *key)
    {
        if (root.contains(key) && root[key].is_string())
            return root[key].get<std::string>();

        return "";
    }

    // A fresh directory under the system temp directory for one artifact download
    std::string makeDownloadDirectory()
    {
        std::error_code ec;
        std::filesystem::path base = std::filesystem::temp_directory_path(ec);
        if (ec)
        {
            base = "/tmp";
        }

        std::filesystem::path directory = base / generateId("rdm-update-");
        std::filesystem::create_directories(directory, ec);
        if (ec)
        {
            throw ManagerError(ErrorKind::IO_ERROR, "Cannot create " + directory.string() + ": " + ec.message());
        }

        return directory.string();
    }
}

void PosixInstaller::launch(const std::string &artifactPath)
{
    if (chmod(artifactPath.c_str(), 0755) != 0)
    {
        throw ManagerError(ErrorKind::INSTALL_FAILED,
                           "Cannot mark " + artifactPath + " executable: " + std::strerror(errno));
    }

    posix_spawnattr_t attributes;
    posix_spawnattr_init(&attributes);
#ifdef POSIX_SPAWN_SETSID
    // Detach from our session so the installer outlives this process
    posix_spawnattr_setflags(&attributes, POSIX_SPAWN_SETSID);
#endif

    pid_t pid;
    char *const argv[] = {const_cast<char *>(artifactPath.c_str()), nullptr};
    int rc = posix_spawn(&pid, artifactPath.c_str(), nullptr, &attributes, argv, environ);
    posix_spawnattr_destroy(&attributes);

    if (rc != 0)
    {
        throw ManagerError(ErrorKind::INSTALL_FAILED, "Cannot launch " + artifactPath + ": " + std::strerror(rc));
    }

    logging::info("Launched installer {} (pid {})", artifactPath, static_cast<long>(pid));
}

UpdateService::UpdateService(ConfigStore &config, ChannelFactory channelFactory, std::unique_ptr<Installer> installer,
                             ExitRequest exitRequest, std::string currentVersion)
    : _config(config),
      _channelFactory(std::move(channelFactory)),
      _installer(std::move(installer)),
      _exitRequest(std::move(exitRequest)),
      _currentVersion(std::move(currentVersion))
{
}

UpdateInfo UpdateService::parseManifest(const std::string &body, const std::string &currentVersion)
{
    nlohmann::json root;
    try
    {
        root = nlohmann::json::parse(body);
    }
    catch (const nlohmann::json::exception &e)
    {
        throw ManagerError(ErrorKind::NETWORK_ERROR, std::string("Update manifest is not valid JSON: ") + e.what());
    }

    if (!root.is_object())
        throw ManagerError(ErrorKind::NETWORK_ERROR, "Update manifest is not a JSON object");

    UpdateInfo info;
    info.currentVersion = currentVersion;
    info.latestVersion = optionalString(root, "version");
    info.url = optionalString(root, "url");
    info.notes = optionalString(root, "notes");
    info.releaseDate = optionalString(root, "date");

    if (info.latestVersion.empty())
        throw ManagerError(ErrorKind::NETWORK_ERROR, "Update manifest has no version");

    if (root.contains("mandatory"))
    {
        if (!root["mandatory"].is_boolean())
            throw ManagerError(ErrorKind::NETWORK_ERROR, "Update manifest field 'mandatory' is not a boolean");
        info.mandatory = root["mandatory"].get<bool>();
    }

    info.available = compareVersions(info.latestVersion, currentVersion) > 0;
    if (info.available && info.url.empty())
        throw ManagerError(ErrorKind::NETWORK_ERROR, "Update manifest has no artifact url");

    return info;
}

UpdateInfo UpdateService::check()
{
    const AppConfig config = _config.get();
    if (config.updateManifestUrl.empty())
    {
        throw ManagerError(ErrorKind::NETWORK_ERROR, "No update manifest URL is configured");
    }

    logging::info("Checking for updates at {}", config.updateManifestUrl);

    http::Response response = http::fetchText(config.updateManifestUrl, config.requestTimeoutSecs, config.userAgent);
    if (!response.ok())
    {
        std::string reason = response.curlCode != CURLE_OK ? curl_easy_strerror(response.curlCode)
                                                           : "HTTP status " + std::to_string(response.status);
        logging::warn("Update check failed: {}", reason);
        throw ManagerError(ErrorKind::NETWORK_ERROR, "Update check failed: " + reason);
    }

    UpdateInfo info = parseManifest(response.body, _currentVersion);
    logging::info("Update check: current {}, latest {}{}", info.currentVersion, info.latestVersion,
                 info.available ? " (available)" : "");
    return info;
}

void UpdateService::downloadAndInstall(const ProgressCallback &progress)
{
    UpdateInfo info = check();
    if (!info.available)
    {
        throw ManagerError(ErrorKind::INSTALL_FAILED, "No update is available; " + _currentVersion + " is current");
    }

    const AppConfig config = _config.get();

    TransferRequest request;
    request.url = info.url;
    request.destination = joinPath(makeDownloadDirectory(), http::deriveFilenameFromUrl(info.url));
    request.options.chunkSize = config.chunkSize;
    request.options.timeoutSecs = config.requestTimeoutSecs;
    request.options.retryCount = config.retryCount;
    request.options.userAgent = config.userAgent;

    TransferListener listener;
    listener.onProgress = progress;

    logging::info("Downloading update {} from {}", info.latestVersion, info.url);

    TransferChannelPtr channel = _channelFactory();
    TransferResult result = channel->run(request, listener);
    if (result.outcome != TransferOutcome::COMPLETED)
    {
        logging::error("Update download failed: {} (curl code {}, HTTP status {})", result.message,
                      static_cast<int>(result.curlCode), result.httpStatus);
        throw ManagerError(ErrorKind::NETWORK_ERROR, "Update download failed: " + result.message);
    }

    if (!_installer)
    {
        throw ManagerError(ErrorKind::INSTALL_FAILED, "No installer is available on this platform");
    }
    _installer->launch(request.destination);

    if (_exitRequest)
    {
        _exitRequest();
    }
}

bool UpdateService::isAutoCheckEnabled() const
{
    return _config.get().autoCheckUpdates;
}
