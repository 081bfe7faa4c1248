#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <string>

#include "core/CurlTransferChannel.hpp"
#include "aux/FileWriter.hpp"
#include "util/http.hpp"
#include "util/log.hpp"

namespace
{
    using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

    constexpr long MIN_BUFFER_SIZE = 1024;
    constexpr long MAX_BUFFER_SIZE = CURL_MAX_READ_SIZE;
    constexpr long RETRY_DELAY_SECS = 1;

    // State shared with the libcurl callbacks for one request attempt
    struct TransferContext
    {
        CurlTransferChannel *channel{nullptr};
        CURL *handle{nullptr};
        FileWriter *writer{nullptr};
        const TransferListener *listener{nullptr};
        std::uint64_t requestedOffset{0};
        bool bodyStarted{false};
        bool writeFailed{false};
        bool rangeMismatch{false};
        long httpStatus{0};
        std::optional<std::uint64_t> totalBytes;

        // From the most recent Content-Range header of the current response
        std::optional<std::uint64_t> rangeStart;
        std::optional<std::uint64_t> rangeTotal;
    };

    bool isSuccessStatus(long status)
    {
        // 0 is reported for non-HTTP schemes such as file://, which honour ranges natively
        return status == 0 || (status >= 200 && status < 300);
    }

    // Parses "Content-Range: bytes 400-999/1000" or "Content-Range: bytes */1000"
    void parseContentRange(const std::string &value, TransferContext &ctx)
    {
        auto bytesPos = value.find("bytes");
        if (bytesPos == std::string::npos)
            return;

        std::string spec = value.substr(bytesPos + 5);
        spec.erase(0, spec.find_first_not_of(" \t"));

        auto slash = spec.find('/');
        if (slash == std::string::npos)
            return;

        std::string total = spec.substr(slash + 1);
        total.erase(total.find_last_not_of(" \t\r\n") + 1);
        if (!total.empty() && total != "*")
        {
            ctx.rangeTotal = std::strtoull(total.c_str(), nullptr, 10);
        }

        if (spec[0] != '*')
        {
            ctx.rangeStart = std::strtoull(spec.c_str(), nullptr, 10);
        }
    }

    // Tracks the status line and Content-Range of each response (redirects produce several)
    size_t curlHeaderCallback(char *buffer, size_t size, size_t nmemb, void *userdata)
    {
        auto *ctx = static_cast<TransferContext *>(userdata);
        size_t length = size * nmemb;
        std::string line(buffer, length);

        if (line.rfind("HTTP/", 0) == 0)
        {
            ctx->rangeStart.reset();
            ctx->rangeTotal.reset();
            return length;
        }

        auto colon = line.find(':');
        if (colon == std::string::npos)
            return length;

        std::string name = line.substr(0, colon);
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (name == "content-range")
        {
            parseContentRange(line.substr(colon + 1), *ctx);
        }

        return length;
    }

    // Decides where the body lands once the final response is known
    bool beginBody(TransferContext &ctx)
    {
        ctx.bodyStarted = true;
        curl_easy_getinfo(ctx.handle, CURLINFO_RESPONSE_CODE, &ctx.httpStatus);

        if (!isSuccessStatus(ctx.httpStatus))
        {
            return false; // Error bodies are never written to the destination
        }

        if (ctx.requestedOffset > 0)
        {
            if (ctx.httpStatus == 200)
            {
                // Server ignored the range: the partial file is useless, start over
                logging::info("Server ignored range request at offset {}, restarting from zero", ctx.requestedOffset);
                if (!ctx.writer->restart())
                {
                    ctx.writeFailed = true;
                    return false;
                }
                if (ctx.listener->onRestart)
                {
                    ctx.listener->onRestart();
                }
            }
            else if (ctx.httpStatus == 206 && ctx.rangeStart && *ctx.rangeStart != ctx.requestedOffset)
            {
                ctx.rangeMismatch = true;
                return false;
            }
        }

        curl_off_t contentLength = -1;
        curl_easy_getinfo(ctx.handle, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &contentLength);

        if (ctx.httpStatus == 206 && ctx.rangeTotal)
        {
            ctx.totalBytes = ctx.rangeTotal;
        }
        else if (contentLength >= 0)
        {
            ctx.totalBytes = ctx.writer->getPosition() + static_cast<std::uint64_t>(contentLength);
        }

        if (ctx.listener->onProgress)
        {
            ctx.listener->onProgress(ctx.writer->getPosition(), ctx.totalBytes);
        }

        return true;
    }

    // Writes incoming data from libcurl to the destination file
    // Returning less than the full size makes libcurl abort the transfer
    size_t curlWriteCallback(char *ptr, size_t size, size_t nmemb, void *userdata)
    {
        auto *ctx = static_cast<TransferContext *>(userdata);
        if (!ctx || ctx->channel->isStopRequested())
        {
            return 0;
        }

        if (!ctx->bodyStarted && !beginBody(*ctx))
        {
            return 0;
        }

        size_t totalBytes = size * nmemb;
        if (!ctx->writer->write(ptr, totalBytes))
        {
            ctx->writeFailed = true;
            return 0;
        }

        std::uint64_t position = ctx->writer->getPosition();
        if (ctx->totalBytes && position > *ctx->totalBytes)
        {
            // More body than announced; the size we were given was wrong
            ctx->totalBytes.reset();
        }

        if (ctx->listener->onProgress)
        {
            ctx->listener->onProgress(position, ctx->totalBytes);
        }

        return totalBytes;
    }

    // Aborts an idle connection promptly when a stop was requested; libcurl calls this
    // at least once per second even when no data arrives
    int curlProgressCallback(void *clientp,
                             curl_off_t /* dltotal */,
                             curl_off_t /* dlnow */,
                             curl_off_t /* ultotal */,
                             curl_off_t /* ulnow */)
    {
        auto *ctx = static_cast<TransferContext *>(clientp);
        return (ctx && ctx->channel->isStopRequested()) ? 1 : 0;
    }

    bool isRetryable(CURLcode code)
    {
        switch (code)
        {
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_CONNECT:
        case CURLE_OPERATION_TIMEDOUT:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
            return true;
        default:
            return false;
        }
    }

    void configureHandle(CURL *handle, const TransferRequest &request, TransferContext &ctx, const std::string &range)
    {
        const TransferOptions &options = request.options;
        long bufferSize = static_cast<long>(std::min<size_t>(options.chunkSize, static_cast<size_t>(MAX_BUFFER_SIZE)));
        bufferSize = std::max(bufferSize, MIN_BUFFER_SIZE);

        curl_easy_setopt(handle, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, curlWriteCallback);
        curl_easy_setopt(handle, CURLOPT_WRITEDATA, &ctx);
        curl_easy_setopt(handle, CURLOPT_HEADERFUNCTION, curlHeaderCallback);
        curl_easy_setopt(handle, CURLOPT_HEADERDATA, &ctx);
        curl_easy_setopt(handle, CURLOPT_NOPROGRESS, 0L); // Enable the progress callback
        curl_easy_setopt(handle, CURLOPT_XFERINFOFUNCTION, curlProgressCallback);
        curl_easy_setopt(handle, CURLOPT_XFERINFODATA, &ctx);
        curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, 1L); // Follow redirects
        curl_easy_setopt(handle, CURLOPT_MAXREDIRS, 10L);
        curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);       // Worker threads must not get SIGALRM
        curl_easy_setopt(handle, CURLOPT_BUFFERSIZE, bufferSize);
        curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT, options.timeoutSecs);
        // A transfer that moves less than one byte per second for the whole timeout is stalled
        curl_easy_setopt(handle, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(handle, CURLOPT_LOW_SPEED_TIME, options.timeoutSecs);

        if (!options.userAgent.empty())
        {
            curl_easy_setopt(handle, CURLOPT_USERAGENT, options.userAgent.c_str());
        }

        if (!range.empty())
        {
            curl_easy_setopt(handle, CURLOPT_RANGE, range.c_str());
        }
    }

    TransferResult failure(ErrorKind kind, CURLcode code, long httpStatus, const std::string &message)
    {
        TransferResult result;
        result.outcome = TransferOutcome::FAILED;
        result.errorKind = kind;
        result.curlCode = code;
        result.httpStatus = httpStatus;
        result.message = message;
        return result;
    }
}

CurlTransferChannel::CurlTransferChannel()
{
    http::ensureCurlInitialized();
}

CurlTransferChannel::~CurlTransferChannel() = default;

void CurlTransferChannel::stop()
{
    {
        std::lock_guard<std::mutex> lock(_waitMutex);
        _stopRequested.store(true);
    }
    _waitCondition.notify_all();
}

bool CurlTransferChannel::waitBeforeRetry(long seconds)
{
    std::unique_lock<std::mutex> lock(_waitMutex);
    return !_waitCondition.wait_for(lock, std::chrono::seconds(seconds), [this]
                                    { return _stopRequested.load(); });
}

// Performs the transfer, retrying connection failures that happen before any body byte arrives
TransferResult CurlTransferChannel::run(const TransferRequest &request, const TransferListener &listener)
{
    FileWriter writer(request.destination, request.resumeOffset);
    if (!writer.isOpen())
    {
        return failure(ErrorKind::IO_ERROR, CURLE_WRITE_ERROR, 0,
                       "Cannot open destination file " + request.destination);
    }

    int attempt = 0;
    while (true)
    {
        TransferResult result;
        result.bytesReceived = writer.getPosition();

        if (isStopRequested())
        {
            result.outcome = TransferOutcome::STOPPED;
            return result;
        }

        CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
        if (!curl)
        {
            return failure(ErrorKind::NETWORK_ERROR, CURLE_FAILED_INIT, 0, curl_easy_strerror(CURLE_FAILED_INIT));
        }

        TransferContext ctx;
        ctx.channel = this;
        ctx.handle = curl.get();
        ctx.writer = &writer;
        ctx.listener = &listener;
        ctx.requestedOffset = writer.getPosition();

        std::string range;
        if (ctx.requestedOffset > 0)
        {
            range = std::to_string(ctx.requestedOffset) + "-";
        }

        configureHandle(curl.get(), request, ctx, range);

        CURLcode res = curl_easy_perform(curl.get());
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &ctx.httpStatus);

        if (res == CURLE_OK && !ctx.bodyStarted && isSuccessStatus(ctx.httpStatus) && !isStopRequested())
        {
            // Empty body: the write callback never ran
            beginBody(ctx);
        }

        bool flushed = writer.flush();
        result.curlCode = res;
        result.httpStatus = ctx.httpStatus;
        result.bytesReceived = writer.getPosition();
        result.totalBytes = ctx.totalBytes;

        if (isStopRequested())
        {
            result.outcome = TransferOutcome::STOPPED;
            return result;
        }

        if (ctx.writeFailed || !flushed)
        {
            TransferResult failed = failure(ErrorKind::IO_ERROR, CURLE_WRITE_ERROR, ctx.httpStatus,
                                            "Failed writing to " + request.destination);
            failed.bytesReceived = result.bytesReceived;
            failed.totalBytes = result.totalBytes;
            return failed;
        }

        if (ctx.rangeMismatch)
        {
            return failure(ErrorKind::NETWORK_ERROR, res, ctx.httpStatus,
                           "Server returned a range that does not start at the requested offset");
        }

        if (ctx.httpStatus == 416 && ctx.requestedOffset > 0 && ctx.rangeTotal && *ctx.rangeTotal == ctx.requestedOffset)
        {
            // Nothing left to fetch: the previous run already wrote the whole resource
            result.outcome = TransferOutcome::COMPLETED;
            result.curlCode = CURLE_OK;
            result.totalBytes = ctx.rangeTotal;
            return result;
        }

        if (!isSuccessStatus(ctx.httpStatus))
        {
            TransferResult failed = failure(ErrorKind::NETWORK_ERROR, CURLE_HTTP_RETURNED_ERROR, ctx.httpStatus,
                                            "HTTP status " + std::to_string(ctx.httpStatus));
            failed.bytesReceived = result.bytesReceived;
            failed.totalBytes = result.totalBytes;
            return failed;
        }

        if (res == CURLE_OK)
        {
            if (result.totalBytes && result.bytesReceived != *result.totalBytes)
            {
                TransferResult failed = failure(ErrorKind::NETWORK_ERROR, CURLE_PARTIAL_FILE, ctx.httpStatus,
                                                "Connection closed before the whole body arrived");
                failed.bytesReceived = result.bytesReceived;
                failed.totalBytes = result.totalBytes;
                return failed;
            }

            result.outcome = TransferOutcome::COMPLETED;
            if (!result.totalBytes)
            {
                result.totalBytes = result.bytesReceived;
            }
            return result;
        }

        if (!ctx.bodyStarted && isRetryable(res) && attempt < request.options.retryCount)
        {
            ++attempt;
            logging::warn("Attempt {} for {} failed: {}, retrying", attempt, request.url, curl_easy_strerror(res));
            if (!waitBeforeRetry(RETRY_DELAY_SECS))
            {
                result.outcome = TransferOutcome::STOPPED;
                return result;
            }
            continue;
        }

        TransferResult failed = failure(ErrorKind::NETWORK_ERROR, res, ctx.httpStatus, curl_easy_strerror(res));
        failed.bytesReceived = result.bytesReceived;
        failed.totalBytes = result.totalBytes;
        return failed;
    }
}

ChannelFactory makeCurlChannelFactory()
{
    return []() -> TransferChannelPtr
    { return std::make_shared<CurlTransferChannel>(); };
}
