#include "aux/ThreadPool.hpp"

ThreadPool::ThreadPool(size_t nThreads)
    : _stop(false)
{
    reserveWorkers(nThreads);
}

ThreadPool::~ThreadPool()
{
    shutdown();
}

size_t ThreadPool::size() const
{
    std::lock_guard<std::mutex> lock(_queueMutex);
    return _workers.size();
}

// Launches additional worker threads until at least nThreads exist
void ThreadPool::reserveWorkers(size_t nThreads)
{
    std::lock_guard<std::mutex> lock(_queueMutex);
    if (_stop)
        return;

    while (_workers.size() < nThreads)
    {
        _workers.emplace_back(&ThreadPool::workerThread, this);
    }
}

// Add a new job to the thread pool's queue
// Returns false if the pool is shutting down and the job was dropped
bool ThreadPool::enqueue(std::function<void()> f)
{
    {
        std::unique_lock<std::mutex> lock(_queueMutex);
        if (_stop)
            return false;
        _tasks.push(std::move(f));
    }

    // Notify a worker thread that a new job is available
    _condition.notify_one();
    return true;
}

// Signal all worker threads to stop and wait for them to finish
void ThreadPool::shutdown()
{
    std::vector<std::thread> workers;
    {
        std::unique_lock<std::mutex> lock(_queueMutex);
        _stop = true;
        workers.swap(_workers);
    }

    // Notify all threads that they should wake up and check the stop condition
    _condition.notify_all();

    for (auto &worker : workers)
    {
        if (worker.joinable())
        {
            worker.join();
        }
    }
}

// Executed by each worker thread
// Continuously retrieves and executes jobs until the pool is signalled to stop
void ThreadPool::workerThread()
{
    while (true)
    {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(_queueMutex);
            // Wait until there is a job available or the thread pool is stopping
            _condition.wait(lock, [this]
                            { return _stop || !_tasks.empty(); });

            // If the pool is stopping and there are no remaining jobs, exit
            if (_stop && _tasks.empty())
                return;

            task = std::move(_tasks.front());
            _tasks.pop();
        }

        // Execute the retrieved job outside of the lock scope
        task();
    }
}
