#include <ctime>

#include "core/DownloadTask.hpp"

const char *toString(TaskState state)
{
    switch (state)
    {
    case TaskState::QUEUED:
        return "Queued";
    case TaskState::DOWNLOADING:
        return "Downloading";
    case TaskState::PAUSED:
        return "Paused";
    case TaskState::COMPLETED:
        return "Completed";
    case TaskState::FAILED:
        return "Failed";
    case TaskState::CANCELLED:
        return "Cancelled";
    }

    return "Unknown";
}

const char *toString(TaskEvent event)
{
    switch (event)
    {
    case TaskEvent::START:
        return "start";
    case TaskEvent::PAUSE:
        return "pause";
    case TaskEvent::COMPLETE:
        return "complete";
    case TaskEvent::FAIL:
        return "fail";
    case TaskEvent::CANCEL:
        return "cancel";
    case TaskEvent::RETRY:
        return "retry";
    }

    return "unknown";
}

bool isTerminal(TaskState state)
{
    return state == TaskState::COMPLETED || state == TaskState::CANCELLED;
}

std::optional<TaskState> nextState(TaskState state, TaskEvent event)
{
    switch (event)
    {
    case TaskEvent::START:
        if (state == TaskState::QUEUED || state == TaskState::PAUSED)
            return TaskState::DOWNLOADING;
        break;
    case TaskEvent::PAUSE:
        if (state == TaskState::DOWNLOADING)
            return TaskState::PAUSED;
        break;
    case TaskEvent::COMPLETE:
        if (state == TaskState::DOWNLOADING)
            return TaskState::COMPLETED;
        break;
    case TaskEvent::FAIL:
        if (state == TaskState::DOWNLOADING)
            return TaskState::FAILED;
        break;
    case TaskEvent::CANCEL:
        if (!isTerminal(state))
            return TaskState::CANCELLED;
        break;
    case TaskEvent::RETRY:
        if (state == TaskState::FAILED)
            return TaskState::QUEUED;
        break;
    }

    return std::nullopt;
}

DownloadTask::DownloadTask(const std::string &id, const std::string &url, const std::string &destination)
    : _id(id),
      _url(url),
      _destination(destination),
      _createdAt(std::time(nullptr)),
      _updatedAt(_createdAt)
{
}

double DownloadTask::getProgress() const
{
    if (!_totalBytes)
    {
        return -1.0;
    }

    if (*_totalBytes == 0)
    {
        return _state == TaskState::COMPLETED ? 100.0 : 0.0;
    }

    double percentage = (static_cast<double>(_bytesReceived) / static_cast<double>(*_totalBytes)) * 100.0;
    return percentage > 100.0 ? 100.0 : percentage;
}
