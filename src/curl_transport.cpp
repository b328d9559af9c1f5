#include "curl_transport.hpp"

#include <exception>
#include <string>

#include <fmt/core.h>

#include "errors.hpp"
#include "string_utils.hpp"

struct CurlTransport::TransferContext
{
    CURL *handle = nullptr;
    ResponseSink *sink = nullptr;
    HttpResponseHead head;
    bool headDelivered = false;
    bool stoppedBySink = false;
    std::exception_ptr error;
};

namespace
{
using HeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;
} // namespace

CurlTransport::CurlTransport() : curl_(curl_easy_init(), curl_easy_cleanup)
{
    if (!curl_)
    {
        throw TransportError("Failed to initialize CURL (out of memory or library error)");
    }
}

// unique_ptr handles cleanup
CurlTransport::~CurlTransport() = default;

size_t CurlTransport::headerCallback(char *buffer, size_t size, size_t nitems, void *userdata)
{
    auto *context = static_cast<TransferContext *>(userdata);
    size_t length = size * nitems;
    std::string line(buffer, length);

    // A new status line starts a new response (redirects, 100 Continue)
    if (line.rfind("HTTP/", 0) == 0)
    {
        context->head.headers.clear();
        return length;
    }

    auto colon = line.find(':');
    if (colon != std::string::npos)
    {
        context->head.setHeader(trim(line.substr(0, colon)), trim(line.substr(colon + 1)));
    }
    return length;
}

bool CurlTransport::deliverHead(TransferContext &context)
{
    context.headDelivered = true;

    curl_easy_getinfo(context.handle, CURLINFO_RESPONSE_CODE, &context.head.status);

    curl_off_t contentLength = -1;
    curl_easy_getinfo(context.handle, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &contentLength);
    if (contentLength >= 0)
    {
        context.head.contentLength = static_cast<std::uint64_t>(contentLength);
    }

    if (!context.sink->onHead(context.head))
    {
        context.stoppedBySink = true;
        return false;
    }
    return true;
}

size_t CurlTransport::writeCallback(char *ptr, size_t size, size_t nmemb, void *userdata)
{
    auto *context = static_cast<TransferContext *>(userdata);
    size_t totalSize = size * nmemb;

    // Exceptions must not cross the C library boundary: stash and abort
    try
    {
        if (!context->headDelivered && !deliverHead(*context))
        {
            return 0;
        }
        context->sink->onChunk(ptr, totalSize);
    }
    catch (...)
    {
        context->error = std::current_exception();
        return 0;
    }
    return totalSize;
}

void CurlTransport::perform(const HttpRequest &request, ResponseSink &sink)
{
    CURL *handle = curl_.get();
    curl_easy_reset(handle);

    TransferContext context;
    context.handle = handle;
    context.sink = &sink;

    char errorBuffer[CURL_ERROR_SIZE] = {0};

    // Set a user-agent (some servers block requests without one)
    curl_easy_setopt(handle, CURLOPT_USERAGENT, "armory-downloader/1.0");
    curl_easy_setopt(handle, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(handle, CURLOPT_ERRORBUFFER, errorBuffer);

    if (request.method == "POST")
    {
        curl_easy_setopt(handle, CURLOPT_POST, 1L);
        curl_easy_setopt(handle, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
    }
    else
    {
        curl_easy_setopt(handle, CURLOPT_HTTPGET, 1L);
    }

    HeaderList headers(nullptr, curl_slist_free_all);
    for (const auto &line : request.headers)
    {
        curl_slist *appended = curl_slist_append(headers.get(), line.c_str());
        if (!appended)
        {
            throw TransportError("Failed to build request headers (out of memory)");
        }
        headers.release();
        headers.reset(appended);
    }
    curl_easy_setopt(handle, CURLOPT_HTTPHEADER, headers.get());

    curl_easy_setopt(handle, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(handle, CURLOPT_HEADERDATA, &context);
    curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(handle, CURLOPT_WRITEDATA, &context);

    // HTTPS settings
    curl_easy_setopt(handle, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(handle, CURLOPT_SSL_VERIFYHOST, 2L);

    // Follow HTTP redirects, limit the chain
    curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(handle, CURLOPT_MAXREDIRS, 5L);

    curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT, 30L);
    curl_easy_setopt(handle, CURLOPT_TIMEOUT, static_cast<long>(request.timeoutSeconds));

    // Abort stalled transfers: below 1 byte/s for 60 seconds
    curl_easy_setopt(handle, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(handle, CURLOPT_LOW_SPEED_TIME, 60L);

    CURLcode res = curl_easy_perform(handle);

    if (context.error)
    {
        std::rethrow_exception(context.error);
    }

    if (res == CURLE_WRITE_ERROR && context.stoppedBySink)
    {
        return;
    }

    if (res != CURLE_OK)
    {
        std::string detail = errorBuffer[0] != '\0' ? errorBuffer : curl_easy_strerror(res);
        throw TransportError(fmt::format("{} {} failed: {}", request.method, request.url, detail));
    }

    // Empty body: no write callback fired, the head still has to reach the sink
    if (!context.headDelivered)
    {
        deliverHead(context);
    }
}
