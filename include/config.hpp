#pragma once

#include <string>
#include <optional>

/**
 * Configuration for one armory-downloader run.
 * Populated by CLI11 argument parser from command-line arguments.
 */
struct DownloadConfig
{
    // Required parameters
    std::string url;

    // Save name; resolved from the server when not given
    std::optional<std::string> outputName;

    // Empty = current working directory
    std::string directory;

    // Credential file override; empty = ~/.amr/config.json
    std::string configPath;

    int timeoutSeconds = 0; // 0 = no overall limit

    bool showVersion = false;
};
