#ifndef HTTP_HPP
#define HTTP_HPP

#include <string>
#include <curl/curl.h>

static constexpr char DEFAULT_FILENAME[] = "downloaded_file";

namespace http
{
    struct Response
    {
        CURLcode curlCode{CURLE_OK};
        long status{0};
        std::string body;

        bool ok() const { return curlCode == CURLE_OK && status >= 200 && status < 300; }
    };

    // Initialises libcurl once per process; later calls are no-ops
    void ensureCurlInitialized();

    // Derives a file name from the last path segment of a URL (query and fragment removed)
    std::string deriveFilenameFromUrl(const std::string &url);

    // Resolves a file name for url from a Content-Disposition header (HEAD request),
    // falling back to the effective URL after redirects, then to DEFAULT_FILENAME
    std::string resolveFilenameFromServer(const std::string &url, long timeoutSecs, const std::string &userAgent);

    // Performs a GET and returns the whole body in memory; for small documents only
    Response fetchText(const std::string &url, long timeoutSecs, const std::string &userAgent);
}

#endif
