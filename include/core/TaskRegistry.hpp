#ifndef TASKREGISTRY_HPP
#define TASKREGISTRY_HPP

#include <string>
#include <vector>
#include <unordered_map>
#include <map>
#include <mutex>
#include <optional>
#include <functional>
#include <cstdint>

#include "core/DownloadTask.hpp"

static constexpr const char RDM_TASKS_FILENAME[] = "tasks";

enum class TaskUpdateKind
{
    CREATED,
    PROGRESS,
    STATE_CHANGED,
    REMOVED
};

struct TaskUpdate
{
    TaskUpdateKind kind;
    DownloadTask task; // snapshot taken atomically with the change
};

// Listeners run on the thread that made the change, in the order the changes happened.
// They may read the registry but must not mutate it.
using TaskListener = std::function<void(const TaskUpdate &)>;

// Authoritative store of live download tasks. Every mutation is atomic: no reader ever
// observes a task halfway through a transition.
class TaskRegistry
{
public:
    // With a non-empty stateFilePath the registry persists itself after lifecycle changes
    explicit TaskRegistry(std::string stateFilePath = "");

    TaskRegistry(const TaskRegistry &) = delete;
    TaskRegistry &operator=(const TaskRegistry &) = delete;

    // With uniqueName set, a destination already on disk or held by a live task is renamed
    // to the first free "name__N.ext" instead of being rejected as a duplicate
    std::string create(const std::string &url, const std::string &destination, bool uniqueName = false);

    std::optional<DownloadTask> get(const std::string &id) const;
    std::vector<DownloadTask> list() const;
    size_t countInState(TaskState state) const;

    // Applies one state machine edge. Throws ManagerError(NOT_FOUND | INVALID_TRANSITION).
    // A CANCEL edge also removes the task; the returned snapshot is its final state.
    DownloadTask transition(const std::string &id, TaskEvent event);

    // START edge that also rebases bytesReceived to the offset the transfer resumes from
    DownloadTask startTransfer(const std::string &id, std::uint64_t resumeOffset);

    // FAIL edge recording why the transfer failed
    DownloadTask failTransfer(const std::string &id, const TaskError &error);

    // Throws NOT_FOUND, or TASK_BUSY while DOWNLOADING or PAUSED
    void remove(const std::string &id);

    // Applies a progress report. Ignored unless the task is DOWNLOADING and the count does
    // not go backwards. Returns whether it was applied.
    bool updateProgress(const std::string &id, std::uint64_t bytesReceived, std::optional<std::uint64_t> totalBytes);

    // The server ignored a range request: the transfer starts over from zero
    bool restartProgress(const std::string &id);

    size_t subscribe(TaskListener listener);
    void unsubscribe(size_t token);

    // Restores tasks from the state file. Tasks that were DOWNLOADING come back PAUSED.
    void load();
    void save() const;

private:
    using TaskMap = std::unordered_map<std::string, DownloadTask>;

    std::string _stateFilePath;

    mutable std::mutex _mutex;   // guards tasks and order
    std::mutex _notifyMutex;     // serialises mutation + delivery so listeners see changes in order
    std::mutex _listenerMutex;
    TaskMap _tasks;
    std::vector<std::string> _order;
    std::map<size_t, TaskListener> _listeners;
    size_t _nextToken{1};

    DownloadTask &findLocked(const std::string &id);
    DownloadTask applyLocked(DownloadTask &task, TaskEvent event);
    void eraseLocked(const std::string &id);
    bool hasLiveDestinationLocked(const std::string &normalisedDestination) const;
    void saveLocked() const;
    void notify(const TaskUpdate &update);
};

#endif
