#include "content_headers.hpp"

#include <algorithm>
#include <cctype>
#include <utility>
#include <vector>

#include "string_utils.hpp"
#include "url_utils.hpp"

namespace
{
// Strip surrounding double quotes and resolve backslash escapes inside them
std::string unquote(const std::string &value)
{
    if (value.size() < 2 || value.front() != '"' || value.back() != '"')
    {
        return value;
    }

    std::string result;
    for (std::string::size_type i = 1; i + 1 < value.size(); ++i)
    {
        if (value[i] == '\\' && i + 2 < value.size())
        {
            ++i;
        }
        result.push_back(value[i]);
    }
    return result;
}

// Split "attachment; a=1; b=\"x;y\"" into lower-cased name/value pairs.
// Semicolons inside quoted strings do not separate parameters.
std::vector<std::pair<std::string, std::string>> splitParameters(const std::string &header)
{
    std::vector<std::string> parts;
    std::string current;
    bool inQuotes = false;

    for (std::string::size_type i = 0; i < header.size(); ++i)
    {
        char c = header[i];
        if (c == '"')
        {
            inQuotes = !inQuotes;
        }
        else if (c == '\\' && inQuotes && i + 1 < header.size())
        {
            current.push_back(c);
            c = header[++i];
        }
        else if (c == ';' && !inQuotes)
        {
            parts.push_back(current);
            current.clear();
            continue;
        }
        current.push_back(c);
    }
    parts.push_back(current);

    std::vector<std::pair<std::string, std::string>> parameters;
    for (const auto &part : parts)
    {
        auto equals = part.find('=');
        if (equals == std::string::npos)
        {
            continue; // Disposition type ("attachment") or garbage
        }
        parameters.emplace_back(toLower(trim(part.substr(0, equals))), trim(part.substr(equals + 1)));
    }
    return parameters;
}

// ISO-8859-1 bytes to UTF-8
std::string latin1ToUtf8(const std::string &text)
{
    std::string result;
    for (unsigned char c : text)
    {
        if (c < 0x80)
        {
            result.push_back(static_cast<char>(c));
        }
        else
        {
            result.push_back(static_cast<char>(0xC0 | (c >> 6)));
            result.push_back(static_cast<char>(0x80 | (c & 0x3F)));
        }
    }
    return result;
}

// RFC 5987 ext-value: charset'language'percent-encoded
std::string decodeExtendedValue(const std::string &raw)
{
    std::string value = unquote(raw);

    auto first = value.find('\'');
    auto second = (first == std::string::npos) ? std::string::npos : value.find('\'', first + 1);
    if (second == std::string::npos)
    {
        return percentDecode(value);
    }

    std::string charset = toLower(value.substr(0, first));
    std::string decoded = percentDecode(value.substr(second + 1));
    if (charset == "iso-8859-1" || charset == "latin1")
    {
        return latin1ToUtf8(decoded);
    }
    return decoded;
}

std::optional<std::uint64_t> parseNumber(const std::string &text)
{
    if (text.empty() || text.size() > 20 ||
        !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); }))
    {
        return std::nullopt;
    }

    std::uint64_t value = 0;
    for (char c : text)
    {
        std::uint64_t digit = static_cast<std::uint64_t>(c - '0');
        if (value > (UINT64_MAX - digit) / 10)
        {
            return std::nullopt; // Overflow
        }
        value = value * 10 + digit;
    }
    return value;
}
} // namespace

std::optional<std::string> parseContentDisposition(const std::string &value)
{
    auto parameters = splitParameters(value);

    for (const auto &[name, raw] : parameters)
    {
        if (name == "filename*")
        {
            if (auto fileName = sanitizeFileName(decodeExtendedValue(raw)))
            {
                return fileName;
            }
        }
    }

    for (const auto &[name, raw] : parameters)
    {
        if (name == "filename")
        {
            if (auto fileName = sanitizeFileName(unquote(raw)))
            {
                return fileName;
            }
        }
    }

    return std::nullopt;
}

std::optional<ContentRange> parseContentRange(const std::string &value)
{
    std::string text = trim(value);
    if (text.size() < 6 || toLower(text.substr(0, 5)) != "bytes")
    {
        return std::nullopt;
    }

    // "bytes 0-9/10"; some servers write "bytes=0-9/10"
    char separator = text[5];
    if (separator != ' ' && separator != '=')
    {
        return std::nullopt;
    }
    text = trim(text.substr(6));

    auto slash = text.find('/');
    if (slash == std::string::npos)
    {
        return std::nullopt;
    }
    std::string rangePart = trim(text.substr(0, slash));
    std::string totalPart = trim(text.substr(slash + 1));

    ContentRange range;

    if (totalPart != "*")
    {
        range.total = parseNumber(totalPart);
        if (!range.total)
        {
            return std::nullopt;
        }
    }

    if (rangePart == "*")
    {
        // Unsatisfied-range form only makes sense with a known total
        if (!range.total)
        {
            return std::nullopt;
        }
        return range;
    }

    auto dash = rangePart.find('-');
    if (dash == std::string::npos)
    {
        return std::nullopt;
    }
    range.first = parseNumber(rangePart.substr(0, dash));
    range.last = parseNumber(rangePart.substr(dash + 1));
    if (!range.first || !range.last || *range.first > *range.last)
    {
        return std::nullopt;
    }
    if (range.total && *range.last >= *range.total)
    {
        return std::nullopt;
    }
    return range;
}
