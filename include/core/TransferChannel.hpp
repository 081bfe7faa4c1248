#ifndef TRANSFERCHANNEL_HPP
#define TRANSFERCHANNEL_HPP

#include <string>
#include <cstdint>
#include <memory>
#include <optional>
#include <functional>
#include <curl/curl.h>

#include "core/ManagerError.hpp"

struct TransferOptions
{
    size_t chunkSize{64 * 1024};
    long timeoutSecs{30};
    int retryCount{2};
    std::string userAgent;
};

struct TransferRequest
{
    std::string url;
    std::string destination;
    std::uint64_t resumeOffset{0};
    TransferOptions options;
};

enum class TransferOutcome
{
    COMPLETED,
    STOPPED, // stop() was called; the file holds every byte reported so far
    FAILED
};

struct TransferResult
{
    TransferOutcome outcome{TransferOutcome::FAILED};
    ErrorKind errorKind{ErrorKind::NETWORK_ERROR};
    CURLcode curlCode{CURLE_OK};
    long httpStatus{0};
    std::string message;
    std::uint64_t bytesReceived{0};
    std::optional<std::uint64_t> totalBytes;
};

// Progress report: bytes of the destination file that are confirmed written, and the
// full resource size once known.
using ProgressCallback = std::function<void(std::uint64_t bytesReceived, std::optional<std::uint64_t> totalBytes)>;

// Called when the server ignored a range request and the file restarted from zero
using RestartCallback = std::function<void()>;

struct TransferListener
{
    ProgressCallback onProgress;
    RestartCallback onRestart;
};

// One resumable fetch of a single resource into a single file. run() blocks the calling
// worker; stop() may be called from any thread and takes effect within one read.
class TransferChannel
{
public:
    virtual ~TransferChannel() = default;

    virtual TransferResult run(const TransferRequest &request, const TransferListener &listener) = 0;
    virtual void stop() = 0;
};

using TransferChannelPtr = std::shared_ptr<TransferChannel>;
using ChannelFactory = std::function<TransferChannelPtr()>;

#endif
