#ifndef DOWNLOADMANAGER_HPP
#define DOWNLOADMANAGER_HPP

#include <string>
#include <vector>
#include <memory>
#include <chrono>

#include "core/ConfigStore.hpp"
#include "core/HistoryStore.hpp"
#include "core/TaskRegistry.hpp"
#include "core/Scheduler.hpp"
#include "core/UpdateService.hpp"

// Command surface of the download manager. Owns every component, builds them in
// dependency order and tears them down in reverse. Every command either succeeds or
// throws ManagerError.
class DownloadManager
{
public:
    // An empty stateDirectory keeps everything in memory
    DownloadManager(const std::string &stateDirectory, ChannelFactory channelFactory,
                    std::unique_ptr<Installer> installer, ExitRequest exitRequest = nullptr);
    ~DownloadManager();

    DownloadManager(const DownloadManager &) = delete;
    DownloadManager &operator=(const DownloadManager &) = delete;

    // An empty destination or an existing directory gets a file name from the server
    std::string addTask(const std::string &url, const std::string &destination);

    std::vector<DownloadTask> getTasks() const;
    DownloadTask getTask(const std::string &id) const;

    void pauseTask(const std::string &id);
    void resumeTask(const std::string &id);
    void cancelTask(const std::string &id);
    void removeTask(const std::string &id);
    void retryTask(const std::string &id);
    size_t pauseAll();
    size_t resumeAll();

    AppConfig getConfig() const;
    void updateConfig(const AppConfig &config);

    std::vector<CompletedTask> getHistory() const;
    std::vector<CompletedTask> searchHistory(const std::string &query) const;
    std::string addHistory(const CompletedTask &entry);
    void removeHistory(const std::string &id);
    void clearHistory();

    UpdateInfo checkUpdates();
    void downloadAndInstallUpdate(const ProgressCallback &progress = nullptr);
    bool isAutoCheckEnabled() const;

    size_t subscribe(TaskListener listener);
    void unsubscribe(size_t token);

    bool waitUntilIdle(std::chrono::milliseconds timeout);

    // Pauses running transfers and saves state; later commands still read but start nothing
    void shutdown();

private:
    ConfigStore _config;
    HistoryStore _history;
    TaskRegistry _registry;
    Scheduler _scheduler;
    UpdateService _updates;

    std::string resolveDestination(const std::string &url, const std::string &destination) const;
};

#endif
