#include "token_provider.hpp"

#include <fmt/core.h>

#include "errors.hpp"

TokenProvider::TokenProvider(CredentialStore &store, CredentialPrompter &prompter, AuthClient &auth)
    : store_(store), prompter_(prompter), auth_(auth)
{
}

std::string TokenProvider::acquire(const std::string &baseUrl)
{
    RepositoryCredential credential;
    try
    {
        credential = store_.load(baseUrl);
    }
    catch (const ConfigError &e)
    {
        if (e.kind() != ConfigError::Kind::NotFound)
        {
            throw;
        }

        fmt::print("{}, please enter credentials for repository {}\n", e.what(), baseUrl);
        credential = prompter_.prompt(baseUrl);
        credential.baseUrl = baseUrl;
        store_.save(credential);
        fmt::print("Configuration saved successfully to {}\n", store_.path().string());
    }

    return auth_.login(baseUrl, credential.username, credential.password);
}
