#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

/**
 * A single outgoing request. Only what the armory endpoints need.
 */
struct HttpRequest
{
    std::string method = "GET";
    std::string url;
    std::vector<std::string> headers; // Raw "Name: value" lines
    std::string body;
    int timeoutSeconds = 0; // 0 = no overall limit
};

/**
 * Status line and headers of a response, available before the body.
 */
struct HttpResponseHead
{
    long status = 0;

    // Header names are stored lower-cased; the last occurrence wins
    std::map<std::string, std::string> headers;

    // Body length announced by the server, if any
    std::optional<std::uint64_t> contentLength;

    /**
     * Case-insensitive header lookup.
     * @return Header value, or std::nullopt if the header was not sent
     */
    std::optional<std::string> header(const std::string &name) const;

    void setHeader(const std::string &name, const std::string &value);

    bool isSuccess() const { return status >= 200 && status < 300; }
};

/**
 * A fully buffered response (used for small JSON exchanges like login).
 */
struct HttpResponse
{
    HttpResponseHead head;
    std::string body;
};

/**
 * Receives a streamed response. The transport calls onHead() exactly once,
 * then onChunk() for each piece of the body in arrival order.
 */
class ResponseSink
{
public:
    virtual ~ResponseSink() = default;

    /**
     * @return false to stop the transfer without reading the body (not an error)
     */
    virtual bool onHead(const HttpResponseHead &head) = 0;

    /**
     * Consume one body chunk. Throwing aborts the transfer and the exception
     * propagates out of HttpTransport::perform().
     */
    virtual void onChunk(const char *data, std::size_t size) = 0;
};

/**
 * Minimal request/response seam between the armory logic and the network.
 * CurlTransport is the production implementation; tests script their own.
 */
class HttpTransport
{
public:
    virtual ~HttpTransport() = default;

    /**
     * Perform a request and stream the response into sink.
     *
     * @throws TransportError on network failure (DNS, connect, TLS, reset)
     * @throws whatever the sink throws
     */
    virtual void perform(const HttpRequest &request, ResponseSink &sink) = 0;

    /**
     * Perform a request and buffer the whole body in memory.
     * @throws TransportError on network failure
     */
    HttpResponse fetch(const HttpRequest &request);
};

/**
 * Human-readable reason phrase for an HTTP status code ("Not Found").
 */
std::string httpStatusText(long code);
