#pragma once

#include <string>

#include "http_transport.hpp"

/**
 * Exchanges armory credentials for a short-lived access token.
 * Makes exactly one attempt; the token is never persisted.
 */
class AuthClient
{
public:
    explicit AuthClient(HttpTransport &transport);

    /**
     * POST {account, password} to {baseUrl}/usercenter/v1/auth/login.
     *
     * @param baseUrl Repository base URL, e.g. "https://armory.example.com"
     * @return The accessToken from the response
     * @throws AuthError TransportFailure, RejectedCredentials or MalformedResponse
     */
    std::string login(const std::string &baseUrl, const std::string &username, const std::string &password);

    static constexpr const char *LOGIN_PATH = "/usercenter/v1/auth/login";

private:
    HttpTransport &transport_;
};
