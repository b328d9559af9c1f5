#pragma once

#include <cstdint>
#include <optional>
#include <string>

/**
 * Parsed "Content-Range" response header.
 *   "bytes 100-199/1000" -> {100, 199, 1000}
 *   "bytes 100-199/x"    -> {100, 199, nullopt}
 *   "bytes x/1000"       -> unsatisfied range, only total is set
 */
struct ContentRange
{
    std::optional<std::uint64_t> first;
    std::optional<std::uint64_t> last;
    std::optional<std::uint64_t> total;
};

/**
 * Extract the file name from a Content-Disposition header value.
 *
 * Prefers the RFC 5987 extended form (filename*=UTF-8''caf%C3%A9.bin, percent
 * decoded) over the plain filename= parameter. Quotes, surrounding whitespace
 * and trailing ;-parameters are removed, and the result is reduced to its last
 * path component.
 *
 * @param value Raw header value, e.g. attachment; filename="report.csv"
 * @return File name, or std::nullopt if no usable name is present
 */
std::optional<std::string> parseContentDisposition(const std::string &value);

/**
 * Parse a Content-Range header value.
 * @return std::nullopt if the value is not a "bytes" range
 */
std::optional<ContentRange> parseContentRange(const std::string &value);
