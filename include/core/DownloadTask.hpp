#ifndef DOWNLOADTASK_HPP
#define DOWNLOADTASK_HPP

#include <string>
#include <cstdint>
#include <ctime>
#include <optional>
#include <curl/curl.h>

#include "core/ManagerError.hpp"

enum class TaskState
{
    QUEUED,
    DOWNLOADING,
    PAUSED,
    COMPLETED,
    FAILED,
    CANCELLED
};

// Edges of the task state machine
enum class TaskEvent
{
    START,    // QUEUED/PAUSED -> DOWNLOADING, scheduler only
    PAUSE,    // DOWNLOADING -> PAUSED
    COMPLETE, // DOWNLOADING -> COMPLETED
    FAIL,     // DOWNLOADING -> FAILED
    CANCEL,   // any non-terminal state -> CANCELLED
    RETRY     // FAILED -> QUEUED
};

const char *toString(TaskState state);
const char *toString(TaskEvent event);

bool isTerminal(TaskState state);

// Returns the state reached by applying event in state, or nothing if the edge is illegal
std::optional<TaskState> nextState(TaskState state, TaskEvent event);

// Why a transfer ended in FAILED
struct TaskError
{
    ErrorKind kind{ErrorKind::NETWORK_ERROR};
    CURLcode curlCode{CURLE_OK};
    long httpStatus{0};
    std::string message;
};

// Snapshot of a single download task. The live copy is owned by TaskRegistry;
// every other component works on ids and copies returned by the registry.
class DownloadTask
{
public:
    DownloadTask() = default;
    DownloadTask(const std::string &id, const std::string &url, const std::string &destination);

    std::string getId() const { return _id; }
    std::string getUrl() const { return _url; }
    std::string getDestination() const { return _destination; }
    TaskState getState() const { return _state; }
    std::uint64_t getBytesReceived() const { return _bytesReceived; }
    std::optional<std::uint64_t> getTotalBytes() const { return _totalBytes; }
    time_t getCreatedAt() const { return _createdAt; }
    time_t getUpdatedAt() const { return _updatedAt; }
    time_t getStartedAt() const { return _startedAt; }
    const std::optional<TaskError> &getError() const { return _error; }

    // Percentage in [0, 100], or -1 when the total size is unknown
    double getProgress() const;

    void setState(TaskState state) { _state = state; }
    void setBytesReceived(std::uint64_t bytes) { _bytesReceived = bytes; }
    void setTotalBytes(std::optional<std::uint64_t> total) { _totalBytes = total; }
    void setCreatedAt(time_t t) { _createdAt = t; }
    void setUpdatedAt(time_t t) { _updatedAt = t; }
    void setStartedAt(time_t t) { _startedAt = t; }
    void setError(std::optional<TaskError> error) { _error = std::move(error); }

private:
    std::string _id;
    std::string _url;
    std::string _destination;
    TaskState _state{TaskState::QUEUED};
    std::uint64_t _bytesReceived{0};
    std::optional<std::uint64_t> _totalBytes;
    time_t _createdAt{0};
    time_t _updatedAt{0};
    time_t _startedAt{0};
    std::optional<TaskError> _error;
};

#endif
