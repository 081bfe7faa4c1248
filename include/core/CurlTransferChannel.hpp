#ifndef CURLTRANSFERCHANNEL_HPP
#define CURLTRANSFERCHANNEL_HPP

#include <atomic>
#include <mutex>
#include <condition_variable>

#include "core/TransferChannel.hpp"

// libcurl implementation of TransferChannel: a single GET, with a "Range: bytes=N-"
// header when resuming. A 206 reply appends at N; a 200 reply restarts the file.
class CurlTransferChannel final : public TransferChannel
{
public:
    CurlTransferChannel();
    ~CurlTransferChannel() override;

    TransferResult run(const TransferRequest &request, const TransferListener &listener) override;
    void stop() override;

    bool isStopRequested() const { return _stopRequested.load(); }

private:
    std::atomic<bool> _stopRequested{false};
    std::mutex _waitMutex;
    std::condition_variable _waitCondition;

    // Sleeps between connection attempts; returns false if stop() interrupted the wait
    bool waitBeforeRetry(long seconds);
};

ChannelFactory makeCurlChannelFactory();

#endif
