#include "auth_client.hpp"

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "errors.hpp"

using json = nlohmann::json;

namespace
{
// Shape of a successful login response. Only accessToken is used, but the
// other fields are required so a foreign JSON body is not mistaken for success.
struct LoginData
{
    long id = 0;
    std::string username;
    std::string jti;
    std::string accessToken;
    std::string refreshToken;
};

void from_json(const json &j, LoginData &data)
{
    j.at("id").get_to(data.id);
    j.at("username").get_to(data.username);
    j.at("jti").get_to(data.jti);
    j.at("accessToken").get_to(data.accessToken);
    j.at("refreshToken").get_to(data.refreshToken);
}
} // namespace

AuthClient::AuthClient(HttpTransport &transport) : transport_(transport)
{
}

std::string AuthClient::login(const std::string &baseUrl, const std::string &username, const std::string &password)
{
    HttpRequest request;
    request.method = "POST";
    request.url = baseUrl + LOGIN_PATH;
    request.headers = {"Content-Type: application/json", "Accept: application/json"};
    request.body = json{{"account", username}, {"password", password}}.dump();
    request.timeoutSeconds = 60;

    fmt::print("Attempting login to: {}\n", request.url);
    fmt::print("Using credentials - username: {}\n", username);

    HttpResponse response;
    try
    {
        response = transport_.fetch(request);
    }
    catch (const TransportError &e)
    {
        throw AuthError(AuthError::Kind::TransportFailure, fmt::format("Login request failed: {}", e.what()));
    }

    if (!response.head.isSuccess())
    {
        throw AuthError(AuthError::Kind::RejectedCredentials,
                        fmt::format("Login failed with status {} {}: {}",
                                    response.head.status, httpStatusText(response.head.status), response.body),
                        response.head.status, response.body);
    }

    LoginData data;
    try
    {
        json::parse(response.body).at("data").get_to(data);
    }
    catch (const json::exception &e)
    {
        throw AuthError(AuthError::Kind::MalformedResponse,
                        fmt::format("Failed to parse login response: {}\nRaw response: {}", e.what(), response.body),
                        response.head.status, response.body);
    }

    if (data.accessToken.empty())
    {
        throw AuthError(AuthError::Kind::MalformedResponse, "Server returned empty access token",
                        response.head.status, response.body);
    }

    fmt::print("Successfully obtained token from {}\n", baseUrl);
    return data.accessToken;
}
