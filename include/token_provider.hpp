#pragma once

#include <string>

#include "auth_client.hpp"
#include "credential_prompter.hpp"
#include "credential_store.hpp"

/**
 * Obtains an access token for a repository.
 *
 * Stored credentials are used when present. When none are stored the user is
 * prompted, the answer is saved, and login is attempted once with it. A login
 * rejected with stored credentials is reported, not re-prompted.
 */
class TokenProvider
{
public:
    TokenProvider(CredentialStore &store, CredentialPrompter &prompter, AuthClient &auth);

    /**
     * @throws AuthError if login fails
     * @throws ConfigError if the credential file is malformed
     * @throws IoError if fresh credentials cannot be read or saved
     */
    std::string acquire(const std::string &baseUrl);

private:
    CredentialStore &store_;
    CredentialPrompter &prompter_;
    AuthClient &auth_;
};
