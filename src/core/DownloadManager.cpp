#include <filesystem>
#include <system_error>

#include "core/DownloadManager.hpp"
#include "util/http.hpp"
#include "util/file.hpp"
#include "util/log.hpp"
#include "util/version.hpp"

namespace
{
    // Path of a state file, or "" for an in-memory manager
    std::string statePath(const std::string &stateDirectory, const char *filename)
    {
        return stateDirectory.empty() ? std::string() : joinPath(stateDirectory, filename);
    }
}

// Builds the stores first, then restores saved tasks and re-admits the queued ones
DownloadManager::DownloadManager(const std::string &stateDirectory, ChannelFactory channelFactory,
                                 std::unique_ptr<Installer> installer, ExitRequest exitRequest)
    : _config(statePath(stateDirectory, RDM_CONFIG_FILENAME)),
      _history(statePath(stateDirectory, RDM_HISTORY_FILENAME)),
      _registry(statePath(stateDirectory, RDM_TASKS_FILENAME)),
      _scheduler(_registry, _config, _history, channelFactory),
      _updates(_config, channelFactory, std::move(installer), std::move(exitRequest), RDM_VERSION)
{
    _registry.load();
    _scheduler.restore();
}

DownloadManager::~DownloadManager()
{
    shutdown();
}

std::string DownloadManager::addTask(const std::string &url, const std::string &destination)
{
    // A name the user did not choose is made unique rather than rejected
    const bool autoNamed = destination.empty() || isDirectory(destination);
    std::string resolved = resolveDestination(url, destination);
    std::string id = _registry.create(url, resolved, autoNamed);
    _scheduler.enqueue(id);
    return id;
}

std::vector<DownloadTask> DownloadManager::getTasks() const
{
    return _registry.list();
}

DownloadTask DownloadManager::getTask(const std::string &id) const
{
    std::optional<DownloadTask> task = _registry.get(id);
    if (!task)
    {
        throw ManagerError(ErrorKind::NOT_FOUND, "No task with id " + id);
    }

    return *task;
}

void DownloadManager::pauseTask(const std::string &id)
{
    _scheduler.pause(id);
}

void DownloadManager::resumeTask(const std::string &id)
{
    _scheduler.resume(id);
}

void DownloadManager::cancelTask(const std::string &id)
{
    _scheduler.cancel(id);
}

void DownloadManager::removeTask(const std::string &id)
{
    _scheduler.remove(id);
}

void DownloadManager::retryTask(const std::string &id)
{
    _scheduler.retry(id);
}

size_t DownloadManager::pauseAll()
{
    return _scheduler.pauseAll();
}

size_t DownloadManager::resumeAll()
{
    return _scheduler.resumeAll();
}

AppConfig DownloadManager::getConfig() const
{
    return _config.get();
}

// A raised ceiling takes effect at once: waiting tasks are offered the new slots
void DownloadManager::updateConfig(const AppConfig &config)
{
    _config.update(config);
    _scheduler.restore();
}

std::vector<CompletedTask> DownloadManager::getHistory() const
{
    return _history.list();
}

std::vector<CompletedTask> DownloadManager::searchHistory(const std::string &query) const
{
    return _history.search(query);
}

std::string DownloadManager::addHistory(const CompletedTask &entry)
{
    return _history.add(entry);
}

void DownloadManager::removeHistory(const std::string &id)
{
    _history.remove(id);
}

void DownloadManager::clearHistory()
{
    _history.clear();
}

UpdateInfo DownloadManager::checkUpdates()
{
    return _updates.check();
}

void DownloadManager::downloadAndInstallUpdate(const ProgressCallback &progress)
{
    _updates.downloadAndInstall(progress);
}

bool DownloadManager::isAutoCheckEnabled() const
{
    return _updates.isAutoCheckEnabled();
}

size_t DownloadManager::subscribe(TaskListener listener)
{
    return _registry.subscribe(std::move(listener));
}

void DownloadManager::unsubscribe(size_t token)
{
    _registry.unsubscribe(token);
}

bool DownloadManager::waitUntilIdle(std::chrono::milliseconds timeout)
{
    return _scheduler.waitUntilIdle(timeout);
}

void DownloadManager::shutdown()
{
    _scheduler.shutdown();
    _registry.save();
}

// Picks the file a new task writes to
std::string DownloadManager::resolveDestination(const std::string &url, const std::string &destination) const
{
    if (!destination.empty() && !isDirectory(destination))
    {
        return destination;
    }

    const AppConfig config = _config.get();
    std::string directory = destination.empty() ? config.defaultDirectory : destination;

    if (!isDirectory(directory))
    {
        std::error_code ec;
        std::filesystem::create_directories(directory, ec);
        if (ec)
        {
            throw ManagerError(ErrorKind::INVALID_DESTINATION, "Cannot create " + directory + ": " + ec.message());
        }
    }

    // If the user does not provide a file name, resolve it from the server
    std::string filename = http::resolveFilenameFromServer(url, config.requestTimeoutSecs, config.userAgent);
    return joinPath(directory, filename);
}
