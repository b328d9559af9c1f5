#pragma once

#include <memory>
#include <curl/curl.h>

#include "http_transport.hpp"

/**
 * HttpTransport backed by libcurl's easy interface.
 * Uses RAII to manage the CURL handle lifecycle; the handle is reused
 * across requests (connection reuse for probe + transfer).
 */
class CurlTransport : public HttpTransport
{
public:
    CurlTransport();
    ~CurlTransport() override;

    // CURL handles aren't copyable
    CurlTransport(const CurlTransport &) = delete;
    CurlTransport &operator=(const CurlTransport &) = delete;

    CurlTransport(CurlTransport &&) noexcept = default;
    CurlTransport &operator=(CurlTransport &&) noexcept = default;

    void perform(const HttpRequest &request, ResponseSink &sink) override;

private:
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl_;

    // Per-request state shared with the static callbacks
    struct TransferContext;

    /**
     * libcurl calls this once per received header line (including the
     * status line of every response in a redirect chain).
     */
    static size_t headerCallback(char *buffer, size_t size, size_t nitems, void *userdata);

    /**
     * libcurl calls this with chunks of the body.
     * Returning anything other than size * nmemb aborts the transfer.
     */
    static size_t writeCallback(char *ptr, size_t size, size_t nmemb, void *userdata);

    static bool deliverHead(TransferContext &context);
};
