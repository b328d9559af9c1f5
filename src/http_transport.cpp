#include "http_transport.hpp"

#include "string_utils.hpp"

namespace
{
// Collects the whole body into a string
class BufferingSink : public ResponseSink
{
public:
    explicit BufferingSink(HttpResponse &response) : response_(response) {}

    bool onHead(const HttpResponseHead &head) override
    {
        response_.head = head;
        return true;
    }

    void onChunk(const char *data, std::size_t size) override
    {
        response_.body.append(data, size);
    }

private:
    HttpResponse &response_;
};
} // namespace

std::optional<std::string> HttpResponseHead::header(const std::string &name) const
{
    auto it = headers.find(toLower(name));
    if (it == headers.end())
    {
        return std::nullopt;
    }
    return it->second;
}

void HttpResponseHead::setHeader(const std::string &name, const std::string &value)
{
    headers[toLower(name)] = value;
}

HttpResponse HttpTransport::fetch(const HttpRequest &request)
{
    HttpResponse response;
    BufferingSink sink(response);
    perform(request, sink);
    return response;
}

std::string httpStatusText(long code)
{
    switch (code)
    {
    case 200:
        return "OK";
    case 206:
        return "Partial Content";
    case 301:
        return "Moved Permanently";
    case 302:
        return "Found";
    case 400:
        return "Bad Request";
    case 401:
        return "Unauthorized";
    case 403:
        return "Forbidden";
    case 404:
        return "Not Found";
    case 416:
        return "Range Not Satisfiable";
    case 500:
        return "Internal Server Error";
    case 502:
        return "Bad Gateway";
    case 503:
        return "Service Unavailable";
    default:
        return "Unknown Status";
    }
}
