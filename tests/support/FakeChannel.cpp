#include "support/FakeChannel.hpp"

TransferResult FakeChannel::run(const TransferRequest &request, const TransferListener &listener)
{
    std::unique_lock<std::mutex> lock(_mutex);
    _request = request;
    _started = true;
    _condition.notify_all();

    std::uint64_t position = request.resumeOffset;
    if (listener.onProgress)
    {
        lock.unlock();
        listener.onProgress(position, _totalBytes);
        lock.lock();
    }

    TransferResult result;
    while (true)
    {
        _condition.wait(lock, [this]
                        { return (_stopRequested && _honoursStop) || _finish || !_progress.empty(); });

        while (!_progress.empty())
        {
            position = _progress.front();
            _progress.pop_front();
            if (listener.onProgress)
            {
                lock.unlock();
                listener.onProgress(position, _totalBytes);
                lock.lock();
            }
        }

        if (_finish)
        {
            result.outcome = *_finish;
            if (result.outcome == TransferOutcome::COMPLETED)
            {
                position = _totalBytes;
                if (listener.onProgress)
                {
                    lock.unlock();
                    listener.onProgress(position, _totalBytes);
                    lock.lock();
                }
            }
            else
            {
                result.errorKind = ErrorKind::NETWORK_ERROR;
                result.curlCode = CURLE_HTTP_RETURNED_ERROR;
                result.httpStatus = _failStatus;
                result.message = "HTTP status " + std::to_string(_failStatus);
            }
            break;
        }

        if (_stopRequested && _honoursStop)
        {
            result.outcome = TransferOutcome::STOPPED;
            break;
        }
    }

    result.bytesReceived = position;
    result.totalBytes = _totalBytes;
    _finished = true;
    _condition.notify_all();
    return result;
}

void FakeChannel::stop()
{
    std::lock_guard<std::mutex> lock(_mutex);
    _stopRequested = true;
    _condition.notify_all();
}

bool FakeChannel::waitStarted(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(_mutex);
    return _condition.wait_for(lock, timeout, [this]
                               { return _started; });
}

bool FakeChannel::waitFinished(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(_mutex);
    return _condition.wait_for(lock, timeout, [this]
                               { return _finished; });
}

void FakeChannel::reportProgress(std::uint64_t bytes)
{
    std::lock_guard<std::mutex> lock(_mutex);
    _progress.push_back(bytes);
    _condition.notify_all();
}

void FakeChannel::complete()
{
    std::lock_guard<std::mutex> lock(_mutex);
    _finish = TransferOutcome::COMPLETED;
    _condition.notify_all();
}

void FakeChannel::fail(long httpStatus)
{
    std::lock_guard<std::mutex> lock(_mutex);
    _finish = TransferOutcome::FAILED;
    _failStatus = httpStatus;
    _condition.notify_all();
}

void FakeChannel::setHonoursStop(bool honours)
{
    std::lock_guard<std::mutex> lock(_mutex);
    _honoursStop = honours;
    _condition.notify_all();
}

bool FakeChannel::wasStopped() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _stopRequested;
}

TransferRequest FakeChannel::getRequest() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _request;
}

ChannelFactory FakeChannelFactory::factory()
{
    return [this]() -> TransferChannelPtr
    {
        std::lock_guard<std::mutex> lock(_mutex);
        auto channel = std::make_shared<FakeChannel>(_totalBytes);
        channel->setHonoursStop(_honoursStop);
        _channels.push_back(channel);
        _condition.notify_all();
        return channel;
    };
}

size_t FakeChannelFactory::count() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _channels.size();
}

std::shared_ptr<FakeChannel> FakeChannelFactory::channel(size_t index) const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return index < _channels.size() ? _channels[index] : nullptr;
}

bool FakeChannelFactory::waitForCount(size_t n, std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(_mutex);
    return _condition.wait_for(lock, timeout, [this, n]
                               { return _channels.size() >= n; });
}

void FakeChannelFactory::setHonoursStop(bool honours)
{
    std::lock_guard<std::mutex> lock(_mutex);
    _honoursStop = honours;
}
