#include "aux/JoiningThread.hpp"

JoiningThread::JoiningThread(std::function<void()> func)
    : _thread(std::move(func))
{
}

JoiningThread::~JoiningThread()
{
    join();
}

void JoiningThread::join()
{
    if (_thread.joinable())
    {
        _thread.join();
    }
}
