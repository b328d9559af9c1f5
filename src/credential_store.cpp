#include "credential_store.hpp"

#include <cstdlib>
#include <fstream>
#include <iterator>
#include <pwd.h>
#include <system_error>
#include <unistd.h>
#include <utility>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "errors.hpp"

using json = nlohmann::json;

void to_json(json &j, const RepositoryCredential &credential)
{
    j = json{{"url", credential.baseUrl}, {"username", credential.username}, {"password", credential.password}};
}

void from_json(const json &j, RepositoryCredential &credential)
{
    j.at("url").get_to(credential.baseUrl);
    j.at("username").get_to(credential.username);
    j.at("password").get_to(credential.password);
}

CredentialStore::CredentialStore(std::filesystem::path configPath) : configPath_(std::move(configPath))
{
}

std::vector<RepositoryCredential> CredentialStore::loadAll() const
{
    std::error_code ec;
    if (!std::filesystem::exists(configPath_, ec))
    {
        return {};
    }

    std::ifstream file(configPath_);
    if (!file)
    {
        throw IoError(fmt::format("Cannot open {}", configPath_.string()), configPath_);
    }
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    try
    {
        json document = json::parse(content);
        if (!document.is_object())
        {
            throw ConfigError(ConfigError::Kind::Malformed,
                              fmt::format("{} is not a JSON object", configPath_.string()));
        }
        return document.value("repositories", json::array()).get<std::vector<RepositoryCredential>>();
    }
    catch (const json::exception &e)
    {
        throw ConfigError(ConfigError::Kind::Malformed,
                          fmt::format("Invalid config file {}: {}", configPath_.string(), e.what()));
    }
}

RepositoryCredential CredentialStore::load(const std::string &baseUrl) const
{
    std::error_code ec;
    if (!std::filesystem::exists(configPath_, ec))
    {
        throw ConfigError(ConfigError::Kind::NotFound,
                          fmt::format("Config file does not exist at {}", configPath_.string()));
    }

    for (const auto &credential : loadAll())
    {
        if (credential.baseUrl == baseUrl)
        {
            return credential;
        }
    }

    throw ConfigError(ConfigError::Kind::NotFound, fmt::format("No configuration found for URL: {}", baseUrl));
}

void CredentialStore::save(const RepositoryCredential &credential)
{
    std::vector<RepositoryCredential> repositories = loadAll();

    bool found = false;
    for (auto &existing : repositories)
    {
        if (existing.baseUrl == credential.baseUrl)
        {
            existing = credential;
            found = true;
            break;
        }
    }
    if (!found)
    {
        repositories.push_back(credential);
    }

    std::error_code ec;
    auto directory = configPath_.parent_path();
    if (!directory.empty())
    {
        std::filesystem::create_directories(directory, ec);
        if (ec)
        {
            throw IoError(fmt::format("Failed to create {}: {}", directory.string(), ec.message()), directory);
        }
    }

    // Write a sibling file and rename it over the old one, so a crash never
    // leaves a half-written config behind
    auto staging = configPath_;
    staging += ".tmp";
    {
        std::ofstream out(staging, std::ios::trunc);
        if (!out)
        {
            throw IoError(fmt::format("Cannot open {} for writing", staging.string()), staging);
        }

        // Restrict before any secret hits the disk
        std::filesystem::permissions(staging,
                                     std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                                     std::filesystem::perm_options::replace, ec);
        if (ec)
        {
            throw IoError(fmt::format("Cannot set permissions on {}: {}", staging.string(), ec.message()), staging);
        }

        out << json{{"repositories", repositories}}.dump(2) << '\n';
        out.close();
        if (out.fail())
        {
            throw IoError(fmt::format("Failed writing {}", staging.string()), staging);
        }
    }

    std::filesystem::rename(staging, configPath_, ec);
    if (ec)
    {
        throw IoError(fmt::format("Failed to move {} to {}: {}", staging.string(), configPath_.string(), ec.message()),
                      configPath_);
    }
}

std::filesystem::path CredentialStore::defaultPath()
{
    std::string home;
    if (const char *env = std::getenv("HOME"); env && *env)
    {
        home = env;
    }
    else if (const passwd *entry = ::getpwuid(::getuid()); entry && entry->pw_dir)
    {
        home = entry->pw_dir;
    }
    else
    {
        throw ConfigError(ConfigError::Kind::Unavailable, "Failed to get home directory");
    }
    return std::filesystem::path(home) / ".amr" / "config.json";
}
