#ifndef SCHEDULER_HPP
#define SCHEDULER_HPP

#include <string>
#include <deque>
#include <unordered_map>
#include <mutex>
#include <condition_variable>
#include <chrono>

#include "core/TaskRegistry.hpp"
#include "core/ConfigStore.hpp"
#include "core/HistoryStore.hpp"
#include "core/TransferChannel.hpp"
#include "aux/ThreadPool.hpp"

// Decides which waiting tasks get a transfer slot. Admission is FIFO over queued tasks
// and resumed paused tasks; the number of running channels never exceeds the configured
// ceiling, which is re-read at every admission decision.
class Scheduler
{
public:
    Scheduler(TaskRegistry &registry, ConfigStore &config, HistoryStore &history, ChannelFactory channelFactory);
    ~Scheduler();

    Scheduler(const Scheduler &) = delete;
    Scheduler &operator=(const Scheduler &) = delete;

    // Adds a QUEUED task to the back of the admission queue
    void enqueue(const std::string &id);

    // Re-admits every QUEUED task in the registry, oldest first (after a restart)
    void restore();

    void pause(const std::string &id);
    void resume(const std::string &id);
    void cancel(const std::string &id);
    void retry(const std::string &id);
    void remove(const std::string &id);

    // Return how many tasks were affected
    size_t pauseAll();
    size_t resumeAll();

    // Stops admissions, pauses every running transfer and joins the workers
    void shutdown();

    // Channels currently running, including ones still draining after a pause
    size_t activeCount() const;
    size_t waitingCount() const;

    // Blocks until no channel runs and nothing waits for a slot
    bool waitUntilIdle(std::chrono::milliseconds timeout);

private:
    enum class StopIntent
    {
        NONE,
        PAUSE,
        CANCEL,
        SHUTDOWN
    };

    struct RunningTransfer
    {
        TransferChannelPtr channel;
        std::string destination;
        StopIntent intent{StopIntent::NONE};
    };

    TaskRegistry &_registry;
    ConfigStore &_config;
    HistoryStore &_history;
    ChannelFactory _channelFactory;

    mutable std::mutex _mutex;
    std::condition_variable _idleCondition;
    std::deque<std::string> _waiting;
    std::unordered_map<std::string, RunningTransfer> _running;
    bool _stopping{false};

    ThreadPool _pool;

    bool isWaitingLocked(const std::string &id) const;
    void eraseWaitingLocked(const std::string &id);
    bool isDestinationBusyLocked(const std::string &destination) const;
    void pauseLocked(const std::string &id);
    void dispatchLocked();
    void admitLocked(const DownloadTask &task, const AppConfig &config);

    void runTransfer(const std::string &id, TransferChannelPtr channel, const TransferRequest &request);
    void finishTransfer(const std::string &id, const TransferRequest &request, const TransferResult &result);
    void recordCompletion(const std::string &id, const TransferResult &result);
};

#endif
