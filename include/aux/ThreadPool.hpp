#ifndef THREADPOOL_HPP
#define THREADPOOL_HPP

#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>

// Worker pool that only ever grows: reserveWorkers() raises the number of threads
// when the scheduler's concurrency ceiling goes up.
class ThreadPool
{
public:
    explicit ThreadPool(size_t nThreads = 0);
    ~ThreadPool();

    ThreadPool(const ThreadPool &) = delete;
    ThreadPool &operator=(const ThreadPool &) = delete;

    size_t size() const;
    void reserveWorkers(size_t nThreads);
    bool enqueue(std::function<void()> func);

    // Runs every job already queued, then joins the workers. Later enqueue() calls are rejected.
    void shutdown();

private:
    void workerThread();

    std::vector<std::thread> _workers;
    std::queue<std::function<void()>> _tasks;
    mutable std::mutex _queueMutex;
    std::condition_variable _condition;
    bool _stop;
};

#endif
