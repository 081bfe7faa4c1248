#include <algorithm>
#include <cstdio>
#include <cerrno>
#include <cstring>
#include <ctime>

#include "core/Scheduler.hpp"
#include "util/file.hpp"
#include "util/log.hpp"

namespace
{
    // Removes a partially downloaded file; a file that never existed is not an error
    void deletePartialFile(const std::string &path)
    {
        if (std::remove(path.c_str()) != 0 && errno != ENOENT)
        {
            logging::warn("Could not delete {}: {}", path, std::strerror(errno));
        }
    }

    TransferOptions makeTransferOptions(const AppConfig &config)
    {
        TransferOptions options;
        options.chunkSize = config.chunkSize;
        options.timeoutSecs = config.requestTimeoutSecs;
        options.retryCount = config.retryCount;
        options.userAgent = config.userAgent;
        return options;
    }
}

Scheduler::Scheduler(TaskRegistry &registry, ConfigStore &config, HistoryStore &history, ChannelFactory channelFactory)
    : _registry(registry),
      _config(config),
      _history(history),
      _channelFactory(std::move(channelFactory))
{
}

Scheduler::~Scheduler()
{
    shutdown();
}

void Scheduler::enqueue(const std::string &id)
{
    std::lock_guard<std::mutex> lock(_mutex);

    std::optional<DownloadTask> task = _registry.get(id);
    if (!task)
    {
        throw ManagerError(ErrorKind::NOT_FOUND, "No task with id " + id);
    }
    if (task->getState() != TaskState::QUEUED)
    {
        throw ManagerError(ErrorKind::INVALID_TRANSITION,
                           std::string("Only queued tasks can be enqueued; task is ") + toString(task->getState()));
    }

    if (!isWaitingLocked(id))
    {
        _waiting.push_back(id);
    }
    dispatchLocked();
}

void Scheduler::restore()
{
    std::lock_guard<std::mutex> lock(_mutex);

    for (const auto &task : _registry.list())
    {
        if (task.getState() == TaskState::QUEUED && !isWaitingLocked(task.getId()))
        {
            _waiting.push_back(task.getId());
        }
    }
    dispatchLocked();
}

// Pauses a downloading task, or withdraws a resumed task that is still waiting for a slot
void Scheduler::pause(const std::string &id)
{
    std::lock_guard<std::mutex> lock(_mutex);
    pauseLocked(id);
}

// Puts a paused task back in line; it starts when a slot is free
void Scheduler::resume(const std::string &id)
{
    std::lock_guard<std::mutex> lock(_mutex);

    std::optional<DownloadTask> task = _registry.get(id);
    if (!task)
    {
        throw ManagerError(ErrorKind::NOT_FOUND, "No task with id " + id);
    }
    if (task->getState() != TaskState::PAUSED)
    {
        throw ManagerError(ErrorKind::INVALID_TRANSITION,
                           std::string("Cannot resume a task that is ") + toString(task->getState()));
    }

    if (!isWaitingLocked(id))
    {
        _waiting.push_back(id);
        logging::info("Task {} resumed; waiting for a slot", id);
    }
    dispatchLocked();
}

// Cancels any non-terminal task, deleting its partial file and registry entry
void Scheduler::cancel(const std::string &id)
{
    std::lock_guard<std::mutex> lock(_mutex);

    DownloadTask last = _registry.transition(id, TaskEvent::CANCEL);
    eraseWaitingLocked(id);

    auto running = _running.find(id);
    if (running != _running.end())
    {
        // The worker deletes the file once the channel lets go of it
        running->second.intent = StopIntent::CANCEL;
        running->second.channel->stop();
    }
    else
    {
        deletePartialFile(last.getDestination());
    }

    dispatchLocked();
}

void Scheduler::retry(const std::string &id)
{
    std::lock_guard<std::mutex> lock(_mutex);

    _registry.transition(id, TaskEvent::RETRY);
    if (!isWaitingLocked(id))
    {
        _waiting.push_back(id);
    }
    dispatchLocked();
}

void Scheduler::remove(const std::string &id)
{
    std::lock_guard<std::mutex> lock(_mutex);

    _registry.remove(id);
    eraseWaitingLocked(id);
}

size_t Scheduler::pauseAll()
{
    std::lock_guard<std::mutex> lock(_mutex);

    size_t affected = 0;
    for (const auto &task : _registry.list())
    {
        bool pausable = task.getState() == TaskState::DOWNLOADING ||
                        (task.getState() == TaskState::PAUSED && isWaitingLocked(task.getId()));
        if (!pausable)
            continue;

        try
        {
            pauseLocked(task.getId());
            ++affected;
        }
        catch (const ManagerError &e)
        {
            // The transfer finished between the snapshot and the pause
            logging::debug("Pause all skipped task {}: {}", task.getId(), e.what());
        }
    }

    return affected;
}

size_t Scheduler::resumeAll()
{
    std::lock_guard<std::mutex> lock(_mutex);

    size_t affected = 0;
    for (const auto &task : _registry.list())
    {
        if (task.getState() == TaskState::PAUSED && !isWaitingLocked(task.getId()))
        {
            _waiting.push_back(task.getId());
            ++affected;
        }
    }

    dispatchLocked();
    return affected;
}

void Scheduler::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_stopping)
            return;

        _stopping = true;
        _waiting.clear();

        for (auto &entry : _running)
        {
            if (entry.second.intent == StopIntent::NONE)
            {
                entry.second.intent = StopIntent::SHUTDOWN;

                std::optional<DownloadTask> task = _registry.get(entry.first);
                if (task && task->getState() == TaskState::DOWNLOADING)
                {
                    try
                    {
                        _registry.transition(entry.first, TaskEvent::PAUSE);
                    }
                    catch (const ManagerError &e)
                    {
                        logging::warn("Could not pause task {} during shutdown: {}", entry.first, e.what());
                    }
                }
            }
            entry.second.channel->stop();
        }

        logging::info("Scheduler stopping; {} transfer(s) to drain", _running.size());
    }

    _pool.shutdown();
    _idleCondition.notify_all();
}

size_t Scheduler::activeCount() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _running.size();
}

size_t Scheduler::waitingCount() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _waiting.size();
}

bool Scheduler::waitUntilIdle(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(_mutex);
    return _idleCondition.wait_for(lock, timeout, [this]
                                   { return _running.empty() && (_waiting.empty() || _stopping); });
}

//------------------------------------------------------------------------------
// Private helpers; callers hold _mutex
//------------------------------------------------------------------------------

bool Scheduler::isWaitingLocked(const std::string &id) const
{
    return std::find(_waiting.begin(), _waiting.end(), id) != _waiting.end();
}

void Scheduler::eraseWaitingLocked(const std::string &id)
{
    _waiting.erase(std::remove(_waiting.begin(), _waiting.end(), id), _waiting.end());
}

bool Scheduler::isDestinationBusyLocked(const std::string &destination) const
{
    return std::any_of(_running.begin(), _running.end(),
                       [&destination](const std::pair<const std::string, RunningTransfer> &entry)
                       { return entry.second.destination == destination; });
}

void Scheduler::pauseLocked(const std::string &id)
{
    std::optional<DownloadTask> task = _registry.get(id);
    if (!task)
    {
        throw ManagerError(ErrorKind::NOT_FOUND, "No task with id " + id);
    }

    if (task->getState() == TaskState::PAUSED && isWaitingLocked(id))
    {
        eraseWaitingLocked(id);
        logging::info("Task {} withdrawn from the queue", id);
        return;
    }

    // Freezes bytesReceived: progress reported after this point is ignored
    _registry.transition(id, TaskEvent::PAUSE);

    auto running = _running.find(id);
    if (running != _running.end())
    {
        running->second.intent = StopIntent::PAUSE;
        running->second.channel->stop();
    }
}

// Starts waiting tasks, oldest first, while running channels are below the ceiling
void Scheduler::dispatchLocked()
{
    if (_stopping)
        return;

    const AppConfig config = _config.get();

    auto it = _waiting.begin();
    while (_running.size() < config.maxConcurrentDownloads && it != _waiting.end())
    {
        const std::string id = *it;

        std::optional<DownloadTask> task = _registry.get(id);
        if (!task || (task->getState() != TaskState::QUEUED && task->getState() != TaskState::PAUSED))
        {
            it = _waiting.erase(it);
            continue;
        }

        // The previous channel for this file has not returned yet; it keeps its place in line
        if (_running.count(id) || isDestinationBusyLocked(task->getDestination()))
        {
            ++it;
            continue;
        }

        it = _waiting.erase(it);
        admitLocked(*task, config);
    }

    _idleCondition.notify_all();
}

// Moves one task to DOWNLOADING and hands its transfer to a worker. A task that cannot
// start is FAILED, or left alone if it changed meanwhile.
void Scheduler::admitLocked(const DownloadTask &task, const AppConfig &config)
{
    const std::string &id = task.getId();
    const std::string &destination = task.getDestination();

    if (!isWritableDestination(destination))
    {
        TaskError error;
        error.kind = ErrorKind::IO_ERROR;
        error.curlCode = CURLE_WRITE_ERROR;
        error.message = "Destination is not writable: " + destination;

        try
        {
            // START then FAIL: only a downloading task may fail
            _registry.startTransfer(id, task.getBytesReceived());
            _registry.failTransfer(id, error);
        }
        catch (const ManagerError &e)
        {
            logging::debug("Task {} changed before it could be failed: {}", id, e.what());
        }
        logging::error("Task {} cannot start: {}", id, error.message);
        return;
    }

    // Resume from what is confirmed both in the registry and on disk
    std::uint64_t offset = 0;
    if (std::optional<std::uint64_t> onDisk = fileSize(destination))
    {
        offset = std::min(task.getBytesReceived(), *onDisk);
    }

    try
    {
        _registry.startTransfer(id, offset);
    }
    catch (const ManagerError &e)
    {
        logging::debug("Task {} skipped at admission: {}", id, e.what());
        return;
    }

    TransferRequest request;
    request.url = task.getUrl();
    request.destination = destination;
    request.resumeOffset = offset;
    request.options = makeTransferOptions(config);

    TransferChannelPtr channel = _channelFactory();
    _running[id] = RunningTransfer{channel, destination, StopIntent::NONE};
    _pool.reserveWorkers(config.maxConcurrentDownloads);

    logging::info("Task {} admitted at offset {} ({} of {} slots in use)", id, offset, _running.size(),
                 config.maxConcurrentDownloads);

    if (!_pool.enqueue([this, id, channel, request]()
                       { runTransfer(id, channel, request); }))
    {
        _running.erase(id);
        TaskError error;
        error.kind = ErrorKind::IO_ERROR;
        error.message = "Worker pool is shut down";
        try
        {
            _registry.failTransfer(id, error);
        }
        catch (const ManagerError &e)
        {
            logging::debug("Task {} changed before it could be failed: {}", id, e.what());
        }
        return;
    }
}

//------------------------------------------------------------------------------
// Worker side
//------------------------------------------------------------------------------

void Scheduler::runTransfer(const std::string &id, TransferChannelPtr channel, const TransferRequest &request)
{
    TransferListener listener;
    listener.onProgress = [this, id](std::uint64_t bytesReceived, std::optional<std::uint64_t> totalBytes)
    {
        _registry.updateProgress(id, bytesReceived, totalBytes);
    };
    listener.onRestart = [this, id]()
    {
        _registry.restartProgress(id);
    };

    TransferResult result;
    try
    {
        result = channel->run(request, listener);
    }
    catch (const std::exception &e)
    {
        result.outcome = TransferOutcome::FAILED;
        result.errorKind = ErrorKind::IO_ERROR;
        result.message = e.what();
    }

    finishTransfer(id, request, result);
}

void Scheduler::finishTransfer(const std::string &id, const TransferRequest &request, const TransferResult &result)
{
    std::lock_guard<std::mutex> lock(_mutex);

    StopIntent intent = StopIntent::NONE;
    auto running = _running.find(id);
    if (running != _running.end())
    {
        intent = running->second.intent;
    }

    if (intent == StopIntent::NONE)
    {
        switch (result.outcome)
        {
        case TransferOutcome::COMPLETED:
            recordCompletion(id, result);
            break;

        case TransferOutcome::FAILED:
        {
            logging::error("Task {} failed: {} (curl code {}, HTTP status {})", id, result.message,
                          static_cast<int>(result.curlCode), result.httpStatus);

            _registry.updateProgress(id, result.bytesReceived, result.totalBytes);

            TaskError error;
            error.kind = result.errorKind;
            error.curlCode = result.curlCode;
            error.httpStatus = result.httpStatus;
            error.message = result.message;
            try
            {
                _registry.failTransfer(id, error);
            }
            catch (const ManagerError &e)
            {
                logging::debug("Task {} changed before it could be failed: {}", id, e.what());
            }
            break;
        }

        case TransferOutcome::STOPPED:
            logging::warn("Task {} stopped without a request", id);
            break;
        }
    }
    else if (intent == StopIntent::CANCEL)
    {
        deletePartialFile(request.destination);
        logging::info("Task {} cancelled; removed {}", id, request.destination);
    }
    else
    {
        logging::info("Task {} stopped at {} bytes", id, result.bytesReceived);
    }

    _running.erase(id);
    dispatchLocked();
    _idleCondition.notify_all();
}

void Scheduler::recordCompletion(const std::string &id, const TransferResult &result)
{
    _registry.updateProgress(id, result.bytesReceived, result.totalBytes);

    DownloadTask task;
    try
    {
        task = _registry.transition(id, TaskEvent::COMPLETE);
    }
    catch (const ManagerError &e)
    {
        // A pause or cancel won the race against the last chunk
        logging::debug("Task {} not completed: {}", id, e.what());
        return;
    }

    const time_t now = std::time(nullptr);

    CompletedTask entry;
    entry.url = task.getUrl();
    entry.destination = task.getDestination();
    entry.totalBytes = task.getTotalBytes().value_or(task.getBytesReceived());
    entry.durationSecs = task.getStartedAt() > 0 && now > task.getStartedAt()
                             ? static_cast<std::uint64_t>(now - task.getStartedAt())
                             : 0;
    entry.completedAt = now;
    entry.outcome = CompletionOutcome::SUCCEEDED;
    _history.add(entry);

    logging::info("Task {} completed: {} bytes in {}s", id, entry.totalBytes, entry.durationSecs);
}
