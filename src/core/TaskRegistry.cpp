#include <algorithm>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

#include "core/TaskRegistry.hpp"
#include "util/file.hpp"
#include "util/id.hpp"
#include "util/log.hpp"

namespace
{
    // Reads one task from a state file line, returning false on malformed data
    bool parseTaskLine(const std::string &line, DownloadTask &task)
    {
        std::istringstream iss(line);

        std::string id, url, destination, errorMessage;
        std::uint64_t bytesReceived;
        long long totalBytes;
        int stateInt, hasError, errorKindInt, curlCodeInt;
        long httpStatus;
        time_t createdAt, updatedAt, startedAt;

        if (!(iss >> std::quoted(id)
                  >> std::quoted(url)
                  >> std::quoted(destination) // Enable reading strings with spaces
                  >> bytesReceived
                  >> totalBytes
                  >> stateInt
                  >> createdAt
                  >> updatedAt
                  >> startedAt
                  >> hasError
                  >> errorKindInt
                  >> curlCodeInt
                  >> httpStatus
                  >> std::quoted(errorMessage)))
        {
            return false;
        }

        if (stateInt < static_cast<int>(TaskState::QUEUED) || stateInt > static_cast<int>(TaskState::FAILED))
        {
            return false;
        }

        task = DownloadTask(id, url, destination);
        task.setBytesReceived(bytesReceived);
        if (totalBytes >= 0)
        {
            task.setTotalBytes(static_cast<std::uint64_t>(totalBytes));
        }
        task.setState(static_cast<TaskState>(stateInt));
        task.setCreatedAt(createdAt);
        task.setUpdatedAt(updatedAt);
        task.setStartedAt(startedAt);

        if (hasError)
        {
            TaskError error;
            error.kind = static_cast<ErrorKind>(errorKindInt);
            error.curlCode = static_cast<CURLcode>(curlCodeInt);
            error.httpStatus = httpStatus;
            error.message = errorMessage;
            task.setError(error);
        }

        return true;
    }

    void writeTaskLine(std::ostream &out, const DownloadTask &task)
    {
        const auto &error = task.getError();
        long long totalBytes = task.getTotalBytes() ? static_cast<long long>(*task.getTotalBytes()) : -1;

        out << std::quoted(task.getId()) << " "
            << std::quoted(task.getUrl()) << " "
            << std::quoted(task.getDestination()) << " "
            << task.getBytesReceived() << " "
            << totalBytes << " "
            << static_cast<int>(task.getState()) << " "
            << task.getCreatedAt() << " "
            << task.getUpdatedAt() << " "
            << task.getStartedAt() << " "
            << (error ? 1 : 0) << " "
            << (error ? static_cast<int>(error->kind) : 0) << " "
            << (error ? static_cast<int>(error->curlCode) : 0) << " "
            << (error ? error->httpStatus : 0) << " "
            << std::quoted(error ? error->message : std::string()) << "\n";
    }
}

TaskRegistry::TaskRegistry(std::string stateFilePath)
    : _stateFilePath(std::move(stateFilePath))
{
}

// Allocates a QUEUED task after validating the destination
std::string TaskRegistry::create(const std::string &url, const std::string &destination, bool uniqueName)
{
    if (url.empty())
    {
        throw ManagerError(ErrorKind::INVALID_DESTINATION, "URL is empty");
    }

    if (!isWritableDestination(destination))
    {
        throw ManagerError(ErrorKind::INVALID_DESTINATION, "Destination is not writable: " + destination);
    }

    std::string normalised = normalisePath(destination);

    std::lock_guard<std::mutex> notifyLock(_notifyMutex);
    TaskUpdate update{TaskUpdateKind::CREATED, DownloadTask()};
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (uniqueName)
        {
            normalised = getUniqueFilename(normalised, [this](const std::string &candidate)
                                           { return fileExists(candidate) || hasLiveDestinationLocked(candidate); });
        }
        else if (hasLiveDestinationLocked(normalised))
        {
            throw ManagerError(ErrorKind::DUPLICATE_DESTINATION, "Another task already writes to " + normalised);
        }

        std::string id;
        do
        {
            id = generateId("t-");
        } while (_tasks.count(id));

        DownloadTask task(id, url, normalised);
        _tasks.emplace(id, task);
        _order.push_back(id);
        update.task = task;
        saveLocked();
    }

    logging::info("Task {} created: {} -> {}", update.task.getId(), url, normalised);
    notify(update);
    return update.task.getId();
}

std::optional<DownloadTask> TaskRegistry::get(const std::string &id) const
{
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _tasks.find(id);
    if (it == _tasks.end())
    {
        return std::nullopt;
    }

    return it->second;
}

// Snapshot of every live task in creation order
std::vector<DownloadTask> TaskRegistry::list() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    std::vector<DownloadTask> snapshot;
    snapshot.reserve(_order.size());
    for (const auto &id : _order)
    {
        snapshot.push_back(_tasks.at(id));
    }

    return snapshot;
}

size_t TaskRegistry::countInState(TaskState state) const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return static_cast<size_t>(std::count_if(_tasks.begin(), _tasks.end(),
                                             [state](const TaskMap::value_type &entry)
                                             { return entry.second.getState() == state; }));
}

DownloadTask TaskRegistry::transition(const std::string &id, TaskEvent event)
{
    std::lock_guard<std::mutex> notifyLock(_notifyMutex);
    TaskUpdate update{TaskUpdateKind::STATE_CHANGED, DownloadTask()};
    {
        std::lock_guard<std::mutex> lock(_mutex);
        DownloadTask &task = findLocked(id);
        update.task = applyLocked(task, event);

        if (event == TaskEvent::CANCEL)
        {
            eraseLocked(id);
        }
        saveLocked();
    }

    notify(update);
    if (event == TaskEvent::CANCEL)
    {
        notify(TaskUpdate{TaskUpdateKind::REMOVED, update.task});
    }

    return update.task;
}

DownloadTask TaskRegistry::startTransfer(const std::string &id, std::uint64_t resumeOffset)
{
    std::lock_guard<std::mutex> notifyLock(_notifyMutex);
    TaskUpdate update{TaskUpdateKind::STATE_CHANGED, DownloadTask()};
    {
        std::lock_guard<std::mutex> lock(_mutex);
        DownloadTask &task = findLocked(id);
        if (!nextState(task.getState(), TaskEvent::START))
        {
            throw ManagerError(ErrorKind::INVALID_TRANSITION,
                               std::string("Cannot start a task that is ") + toString(task.getState()));
        }

        task.setBytesReceived(resumeOffset);
        task.setStartedAt(std::time(nullptr));
        update.task = applyLocked(task, TaskEvent::START);
        saveLocked();
    }

    notify(update);
    return update.task;
}

DownloadTask TaskRegistry::failTransfer(const std::string &id, const TaskError &error)
{
    std::lock_guard<std::mutex> notifyLock(_notifyMutex);
    TaskUpdate update{TaskUpdateKind::STATE_CHANGED, DownloadTask()};
    {
        std::lock_guard<std::mutex> lock(_mutex);
        DownloadTask &task = findLocked(id);
        update.task = applyLocked(task, TaskEvent::FAIL);
        task.setError(error);
        update.task = task;
        saveLocked();
    }

    notify(update);
    return update.task;
}

// Deletes a task that is not in flight
void TaskRegistry::remove(const std::string &id)
{
    std::lock_guard<std::mutex> notifyLock(_notifyMutex);
    TaskUpdate update{TaskUpdateKind::REMOVED, DownloadTask()};
    {
        std::lock_guard<std::mutex> lock(_mutex);
        DownloadTask &task = findLocked(id);
        if (task.getState() == TaskState::DOWNLOADING || task.getState() == TaskState::PAUSED)
        {
            throw ManagerError(ErrorKind::TASK_BUSY,
                               std::string("Task is ") + toString(task.getState()) + "; cancel it first");
        }

        update.task = task;
        eraseLocked(id);
        saveLocked();
    }

    logging::info("Task {} removed", id);
    notify(update);
}

bool TaskRegistry::updateProgress(const std::string &id, std::uint64_t bytesReceived, std::optional<std::uint64_t> totalBytes)
{
    std::lock_guard<std::mutex> notifyLock(_notifyMutex);
    TaskUpdate update{TaskUpdateKind::PROGRESS, DownloadTask()};
    {
        std::lock_guard<std::mutex> lock(_mutex);
        auto it = _tasks.find(id);
        if (it == _tasks.end())
        {
            return false;
        }

        DownloadTask &task = it->second;
        if (task.getState() != TaskState::DOWNLOADING || bytesReceived < task.getBytesReceived())
        {
            return false;
        }

        if (totalBytes && bytesReceived > *totalBytes)
        {
            totalBytes.reset(); // A size smaller than what already arrived is not a size
        }

        task.setBytesReceived(bytesReceived);
        if (totalBytes)
        {
            task.setTotalBytes(totalBytes);
        }
        else if (task.getTotalBytes() && bytesReceived > *task.getTotalBytes())
        {
            task.setTotalBytes(std::nullopt);
        }
        task.setUpdatedAt(std::time(nullptr));
        update.task = task;
    }

    notify(update);
    return true;
}

bool TaskRegistry::restartProgress(const std::string &id)
{
    std::lock_guard<std::mutex> notifyLock(_notifyMutex);
    TaskUpdate update{TaskUpdateKind::PROGRESS, DownloadTask()};
    {
        std::lock_guard<std::mutex> lock(_mutex);
        auto it = _tasks.find(id);
        if (it == _tasks.end() || it->second.getState() != TaskState::DOWNLOADING)
        {
            return false;
        }

        it->second.setBytesReceived(0);
        it->second.setTotalBytes(std::nullopt);
        it->second.setUpdatedAt(std::time(nullptr));
        update.task = it->second;
    }

    logging::info("Task {} restarted from zero; the server does not support ranges", id);
    notify(update);
    return true;
}

size_t TaskRegistry::subscribe(TaskListener listener)
{
    std::lock_guard<std::mutex> lock(_listenerMutex);
    size_t token = _nextToken++;
    _listeners.emplace(token, std::move(listener));
    return token;
}

void TaskRegistry::unsubscribe(size_t token)
{
    std::lock_guard<std::mutex> lock(_listenerMutex);
    _listeners.erase(token);
}

//------------------------------------------------------------------------------
// Loading and saving live tasks from and to disk
//------------------------------------------------------------------------------

void TaskRegistry::load()
{
    if (_stateFilePath.empty())
    {
        return;
    }

    std::ifstream inFile(_stateFilePath);
    if (!inFile.is_open())
    {
        return; // No file => nothing to load
    }

    std::lock_guard<std::mutex> lock(_mutex);

    std::string line;
    size_t lineNumber = 0;
    while (std::getline(inFile, line))
    {
        ++lineNumber;
        if (line.empty())
            continue;

        DownloadTask task;
        if (!parseTaskLine(line, task))
        {
            logging::warn("Skipping malformed task on line {} of {}", lineNumber, _stateFilePath);
            continue;
        }

        if (_tasks.count(task.getId()))
        {
            continue;
        }

        // The process writing this file may have died mid-write; resuming is the user's call
        if (task.getState() == TaskState::DOWNLOADING)
        {
            task.setState(TaskState::PAUSED);
        }

        _order.push_back(task.getId());
        _tasks.emplace(task.getId(), task);
    }

    logging::info("Loaded {} task(s) from {}", _tasks.size(), _stateFilePath);
}

void TaskRegistry::save() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    saveLocked();
}

//------------------------------------------------------------------------------
// Private helpers; callers hold _mutex
//------------------------------------------------------------------------------

DownloadTask &TaskRegistry::findLocked(const std::string &id)
{
    auto it = _tasks.find(id);
    if (it == _tasks.end())
    {
        throw ManagerError(ErrorKind::NOT_FOUND, "No task with id " + id);
    }

    return it->second;
}

DownloadTask TaskRegistry::applyLocked(DownloadTask &task, TaskEvent event)
{
    std::optional<TaskState> target = nextState(task.getState(), event);
    if (!target)
    {
        throw ManagerError(ErrorKind::INVALID_TRANSITION,
                           std::string("Cannot ") + toString(event) + " a task that is " + toString(task.getState()));
    }

    logging::info("Task {}: {} -> {}", task.getId(), toString(task.getState()), toString(*target));

    task.setState(*target);
    task.setUpdatedAt(std::time(nullptr));
    if (*target != TaskState::FAILED)
    {
        task.setError(std::nullopt);
    }

    return task;
}

void TaskRegistry::eraseLocked(const std::string &id)
{
    _tasks.erase(id);
    _order.erase(std::remove(_order.begin(), _order.end(), id), _order.end());
}

bool TaskRegistry::hasLiveDestinationLocked(const std::string &normalisedDestination) const
{
    return std::any_of(_tasks.begin(), _tasks.end(),
                       [&normalisedDestination](const TaskMap::value_type &entry)
                       {
                           return !isTerminal(entry.second.getState()) &&
                                  entry.second.getDestination() == normalisedDestination;
                       });
}

void TaskRegistry::saveLocked() const
{
    if (_stateFilePath.empty())
    {
        return;
    }

    std::ostringstream out;
    for (const auto &id : _order)
    {
        writeTaskLine(out, _tasks.at(id));
    }

    if (!writeFileAtomically(_stateFilePath, out.str()))
    {
        logging::error("Failed to save tasks to {}", _stateFilePath);
    }
}

// Delivers an update to every listener; a throwing listener is logged and skipped
void TaskRegistry::notify(const TaskUpdate &update)
{
    std::vector<TaskListener> listeners;
    {
        std::lock_guard<std::mutex> lock(_listenerMutex);
        for (const auto &entry : _listeners)
        {
            listeners.push_back(entry.second);
        }
    }

    for (const auto &listener : listeners)
    {
        try
        {
            listener(update);
        }
        catch (const std::exception &e)
        {
            logging::error("Task listener threw for task {}: {}", update.task.getId(), e.what());
        }
    }
}
