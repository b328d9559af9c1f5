#include <filesystem>
#include <optional>
#include <string>

#include <fmt/core.h>
#include <CLI/CLI.hpp>

#include "auth_client.hpp"
#include "config.hpp"
#include "credential_prompter.hpp"
#include "credential_store.hpp"
#include "curl_transport.hpp"
#include "downloader.hpp"
#include "errors.hpp"
#include "terminal_progress.hpp"
#include "token_provider.hpp"
#include "url_utils.hpp"

int main(int argc, char *argv[])
{
    // Quick check for --version flag before full parsing
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--version" || arg == "-v")
        {
            fmt::print("armory-downloader v1.0\n");
            return 0;
        }
    }

    CLI::App app{"armory-downloader - Downloads files from Armory repositories"};

    DownloadConfig config;

    app.add_option("url", config.url, "The URL to download from")
        ->required()
        ->check([](const std::string &url) -> std::string {
            if (url.rfind("http://", 0) == 0 || url.rfind("https://", 0) == 0)
            {
                return "";
            }
            return "URL must start with http:// or https://";
        });

    app.add_option("-o,--output", config.outputName, "Output file name");

    app.add_option("-d,--directory", config.directory, "Directory to save into (default: current directory)");

    app.add_option("-c,--config", config.configPath, "Credential file (default: ~/.amr/config.json)");

    app.add_option("-t,--timeout", config.timeoutSeconds, "Overall timeout per request in seconds (0 = none)")
        ->check(CLI::NonNegativeNumber)
        ->default_val(0);

    // For help display only, actual handling is done above
    app.add_flag("-v,--version", config.showVersion, "Display version information");

    try
    {
        app.parse(argc, argv);
    }
    catch (const CLI::ParseError &e)
    {
        return app.exit(e);
    }

    try
    {
        CurlTransport transport;

        std::string token;
        if (auto repository = repositoryBaseUrl(config.url))
        {
            CredentialStore store(config.configPath.empty() ? CredentialStore::defaultPath()
                                                            : std::filesystem::path(config.configPath));
            TerminalPrompter prompter;
            AuthClient auth(transport);
            TokenProvider tokens(store, prompter, auth);
            token = tokens.acquire(*repository);
        }
        else
        {
            fmt::print(stderr, "Warning: {} is not an armory URL, downloading without credentials.\n", config.url);
        }

        std::filesystem::path directory =
            config.directory.empty() ? std::filesystem::current_path() : std::filesystem::path(config.directory);

        TerminalProgress progress;
        ResumableDownloader downloader(transport, progress);
        downloader.setTimeout(config.timeoutSeconds);

        std::string filename = downloader.download(token, config.url, directory, config.outputName);
        fmt::print("✓ Download completed successfully: {}\n", (directory / filename).string());
        return 0;
    }
    catch (const AuthError &e)
    {
        fmt::print(stderr, "✗ Failed to get token: {}\n", e.what());
        if (e.kind() == AuthError::Kind::RejectedCredentials)
        {
            fmt::print(stderr, "  Please check your credentials and try again.\n");
        }
        return 1;
    }
    catch (const DownloadError &e)
    {
        fmt::print(stderr, "✗ Download failed: {}\n", e.what());
        return 1;
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "✗ Fatal error: {}\n", e.what());
        return 1;
    }
}
