#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

#include "util/http.hpp"
#include "util/log.hpp"

namespace http
{
    namespace
    {
        using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

        // Upper bound for documents fetched into memory
        constexpr size_t MAX_TEXT_BYTES = 1024 * 1024;

        // Extracts the filename from a Content-Disposition header line
        // Searches for the "filename=" parameter and extracts the filename string
        // Returns an empty string if no filename can be extracted
        std::string extractFilenameFromContentDisposition(const std::string &headerLine)
        {
            auto pos = headerLine.find("filename=");
            if (pos != std::string::npos)
            {
                pos += 9; // Advance position to start of filename (after "filename=")

                // If the filename is quoted, extract the quoted string
                if (pos < headerLine.size() && headerLine[pos] == '"')
                {
                    auto endPos = headerLine.find('"', pos + 1);
                    if (endPos != std::string::npos)
                    {
                        return headerLine.substr(pos + 1, endPos - (pos + 1));
                    }
                }
                else
                {
                    // If not quoted, extract until the first delimiter (space, semicolon, CR or LF)
                    size_t endPos = headerLine.find_first_of(" ;\r\n", pos);
                    return headerLine.substr(pos, endPos - pos);
                }
            }

            return std::string(); // No valid filename found in the header line
        }

        // Strips any directory components so a server cannot choose where the file lands
        std::string sanitiseFilename(const std::string &name)
        {
            std::string base = name;
            auto slash = base.find_last_of("/\\");
            if (slash != std::string::npos)
            {
                base = base.substr(slash + 1);
            }

            if (base.empty() || base == "." || base == "..")
            {
                return std::string();
            }

            return base;
        }

        // Callback function for processing HTTP headers received by libcurl; invoked for each header line
        // If the header contains a Content-Disposition field with a filename, it is extracted
        size_t headerCallback(char *buffer, size_t size, size_t nmemb, void *userData)
        {
            size_t length = size * nmemb;

            std::string header(buffer, length);
            std::string lowered = header;
            std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

            // Check if the header line contains the Content-Disposition field
            if (lowered.rfind("content-disposition:", 0) == 0)
            {
                std::string fname = sanitiseFilename(extractFilenameFromContentDisposition(header));
                if (!fname.empty())
                {
                    // Store the extracted filename at the address provided by the user data
                    std::string *resolvedName = static_cast<std::string *>(userData);
                    *resolvedName = fname;
                }
            }

            return length; // Return the number of bytes processed
        }

        size_t bodyCallback(char *ptr, size_t size, size_t nmemb, void *userData)
        {
            auto *body = static_cast<std::string *>(userData);
            size_t length = size * nmemb;
            if (body->size() + length > MAX_TEXT_BYTES)
            {
                return 0; // Aborts the transfer with CURLE_WRITE_ERROR
            }

            body->append(ptr, length);
            return length;
        }
    }

    void ensureCurlInitialized()
    {
        static std::once_flag flag;
        std::call_once(flag, [] {
            if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
            {
                throw std::runtime_error("Failed to initialize libcurl");
            }
            std::atexit([] { curl_global_cleanup(); });
        });
    }

    // Derives a filename from the provided URL
    // The function extracts the substring following the last '/' in the URL path
    // If the URL does not appear to contain a valid filename, a default filename is returned
    std::string deriveFilenameFromUrl(const std::string &url)
    {
        std::string path = url.substr(0, url.find_first_of("?#"));

        auto schemePos = path.find("://");
        if (schemePos != std::string::npos && path.find('/', schemePos + 3) == std::string::npos)
        {
            // Host only, no path
            return DEFAULT_FILENAME;
        }

        auto pos = path.find_last_of('/');
        if (pos == std::string::npos || pos == path.size() - 1)
        {
            // Either no '/' found or the URL ends with '/', so return the default filename
            return DEFAULT_FILENAME;
        }

        std::string fname = sanitiseFilename(path.substr(pos + 1));
        return fname.empty() ? DEFAULT_FILENAME : fname;
    }

    // Resolves the filename from the server based on HTTP headers or the URL
    // Performs an HTTP HEAD request to retrieve header information
    // If a Content-Disposition header is present and includes a filename, that name is used
    // Else, the filename is derived from the effective URL after following redirects
    std::string resolveFilenameFromServer(const std::string &url, long timeoutSecs, const std::string &userAgent)
    {
        std::string resolvedName;

        ensureCurlInitialized();
        CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
        if (!curl)
        {
            logging::warn("Cannot allocate a curl handle to resolve a file name for {}", url);
            return deriveFilenameFromUrl(url);
        }

        curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);         // HEAD request
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L); // Follow HTTP redirects
        curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeoutSecs);
        curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, userAgent.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, headerCallback);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &resolvedName);

        CURLcode res = curl_easy_perform(curl.get());

        long httpStatus = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &httpStatus);

        if (res != CURLE_OK || httpStatus >= 400)
        {
            // The name is only a convenience; the transfer itself reports the real error later
            logging::warn("HEAD {} failed ({}, HTTP {}), naming file from the URL",
                         url, curl_easy_strerror(res), httpStatus);
            return deriveFilenameFromUrl(url);
        }

        if (resolvedName.empty())
        {
            // No filename was extracted from the headers, derive it from the effective URL
            char *effectiveUrl = nullptr;
            curl_easy_getinfo(curl.get(), CURLINFO_EFFECTIVE_URL, &effectiveUrl);
            resolvedName = deriveFilenameFromUrl(effectiveUrl ? std::string(effectiveUrl) : url);
        }

        return resolvedName;
    }

    Response fetchText(const std::string &url, long timeoutSecs, const std::string &userAgent)
    {
        Response response;

        ensureCurlInitialized();
        CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
        if (!curl)
        {
            response.curlCode = CURLE_FAILED_INIT;
            return response;
        }

        curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeoutSecs);
        curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, userAgent.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, bodyCallback);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);

        response.curlCode = curl_easy_perform(curl.get());
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);

        return response;
    }
}
