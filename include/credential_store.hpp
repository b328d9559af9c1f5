#pragma once

#include <filesystem>
#include <string>
#include <vector>

/**
 * Login for one armory repository, keyed by its base URL.
 */
struct RepositoryCredential
{
    std::string baseUrl;
    std::string username;
    std::string password;

    bool operator==(const RepositoryCredential &other) const
    {
        return baseUrl == other.baseUrl && username == other.username && password == other.password;
    }
};

/**
 * Credentials persisted as JSON:
 *
 *   { "repositories": [ { "url": ..., "username": ..., "password": ... } ] }
 *
 * The file holds plain-text passwords and is written with owner-only
 * permissions (0600).
 */
class CredentialStore
{
public:
    explicit CredentialStore(std::filesystem::path configPath);

    /**
     * Find the stored credential for a repository.
     * @throws ConfigError NotFound if the file or the entry does not exist,
     *         Malformed if the file is not valid
     */
    RepositoryCredential load(const std::string &baseUrl) const;

    /**
     * Insert or replace (by baseUrl) and write the file back.
     * @throws IoError if the file cannot be written
     */
    void save(const RepositoryCredential &credential);

    /**
     * All stored credentials in file order. Empty if the file does not exist.
     */
    std::vector<RepositoryCredential> loadAll() const;

    const std::filesystem::path &path() const { return configPath_; }

    /**
     * ~/.amr/config.json for the current user.
     * @throws ConfigError Unavailable if no home directory can be determined
     */
    static std::filesystem::path defaultPath();

private:
    std::filesystem::path configPath_;
};
