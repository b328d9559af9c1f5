#pragma once

#include <string>

/**
 * Remove leading and trailing spaces, tabs, CR and LF.
 */
std::string trim(const std::string &text);

/**
 * ASCII lower-case copy (header names, URL schemes, charsets).
 */
std::string toLower(std::string text);
