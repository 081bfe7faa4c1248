#ifndef JOININGTHREAD_HPP
#define JOININGTHREAD_HPP

#include <thread>
#include <functional>

// Thread that is joined when it goes out of scope, including during stack unwinding
class JoiningThread
{
public:
    JoiningThread() = default;
    explicit JoiningThread(std::function<void()> func);
    ~JoiningThread();

    JoiningThread(const JoiningThread &) = delete;
    JoiningThread &operator=(const JoiningThread &) = delete;

    void join();

private:
    std::thread _thread;
};

#endif
