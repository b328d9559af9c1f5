#include "url_utils.hpp"

#include "string_utils.hpp"

namespace
{
int hexValue(char c)
{
    if (c >= '0' && c <= '9')
    {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f')
    {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F')
    {
        return c - 'A' + 10;
    }
    return -1;
}

// Index just past "scheme://", or npos when the URL has no scheme
std::string::size_type authorityStart(const std::string &url)
{
    auto pos = url.find("://");
    if (pos == std::string::npos || pos == 0)
    {
        return std::string::npos;
    }
    return pos + 3;
}
} // namespace

std::string percentDecode(const std::string &text)
{
    std::string decoded;
    decoded.reserve(text.size());

    for (std::string::size_type i = 0; i < text.size(); ++i)
    {
        if (text[i] == '%' && i + 2 < text.size())
        {
            int high = hexValue(text[i + 1]);
            int low = hexValue(text[i + 2]);
            if (high >= 0 && low >= 0)
            {
                decoded.push_back(static_cast<char>((high << 4) | low));
                i += 2;
                continue;
            }
        }
        decoded.push_back(text[i]);
    }
    return decoded;
}

std::optional<std::string> sanitizeFileName(const std::string &name)
{
    std::string candidate = trim(name);

    // Never let a server pick a directory: keep only the last component
    auto slash = candidate.find_last_of("/\\");
    if (slash != std::string::npos)
    {
        candidate = trim(candidate.substr(slash + 1));
    }

    if (candidate.empty() || candidate == "." || candidate == "..")
    {
        return std::nullopt;
    }

    // A decoded NUL would silently cut the path short when the file is opened
    for (unsigned char c : candidate)
    {
        if (c < 0x20 || c == 0x7F)
        {
            return std::nullopt;
        }
    }
    return candidate;
}

std::string fileNameFromUrl(const std::string &url)
{
    std::string path = url;

    auto cut = path.find_first_of("?#");
    if (cut != std::string::npos)
    {
        path.erase(cut);
    }

    auto start = authorityStart(path);
    if (start != std::string::npos)
    {
        auto pathStart = path.find('/', start);
        if (pathStart == std::string::npos)
        {
            return "download"; // Bare host, no path at all
        }
        path = path.substr(pathStart);
    }

    auto slash = path.find_last_of('/');
    std::string segment = (slash == std::string::npos) ? path : path.substr(slash + 1);

    auto name = sanitizeFileName(percentDecode(segment));
    return name.value_or("download");
}

std::optional<std::string> repositoryBaseUrl(const std::string &url)
{
    if (url.find("armory") == std::string::npos)
    {
        return std::nullopt;
    }

    auto start = authorityStart(url);
    if (start == std::string::npos)
    {
        return std::nullopt;
    }

    std::string scheme = toLower(url.substr(0, start - 3));

    auto end = url.find_first_of("/?#", start);
    std::string authority = url.substr(start, end == std::string::npos ? std::string::npos : end - start);

    // Drop "user:pass@" if present
    auto at = authority.find('@');
    if (at != std::string::npos)
    {
        authority.erase(0, at + 1);
    }

    if (authority.empty() || authority.front() == ':')
    {
        return std::nullopt;
    }

    // Host names are case-insensitive and the default port is implied
    authority = toLower(authority);
    auto colon = authority.rfind(':');
    if (colon != std::string::npos && authority.find(']', colon) == std::string::npos)
    {
        std::string port = authority.substr(colon + 1);
        if (port.empty() || (scheme == "https" && port == "443") || (scheme == "http" && port == "80"))
        {
            authority.erase(colon);
        }
    }
    return scheme + "://" + authority;
}
