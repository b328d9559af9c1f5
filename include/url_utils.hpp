#pragma once

#include <optional>
#include <string>

/**
 * Decode %XX escapes. Malformed escapes are kept verbatim.
 * Does not treat '+' as a space (path/header semantics, not form data).
 */
std::string percentDecode(const std::string &text);

/**
 * Reduce a server or URL supplied name to a safe local file name: the last
 * path component, with "." and ".." and names holding control bytes rejected.
 *
 * @return Safe name, or std::nullopt if nothing usable remains
 */
std::optional<std::string> sanitizeFileName(const std::string &name);

/**
 * Last path segment of a URL, without query or fragment, percent decoded.
 * Falls back to "download" when the URL has no usable segment.
 *
 * Example: "https://x/y/report.csv?x=1" -> "report.csv"
 */
std::string fileNameFromUrl(const std::string &url);

/**
 * Base URL ("scheme://host[:port]") of the armory repository serving url.
 * Scheme and host are lower-cased; a port equal to the scheme's default is dropped.
 *
 * @return std::nullopt if url is not an armory URL or has no host
 */
std::optional<std::string> repositoryBaseUrl(const std::string &url);
