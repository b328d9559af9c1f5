#pragma once

#include <istream>
#include <ostream>
#include <string>

#include "credential_store.hpp"

/**
 * Asks a human for repository credentials.
 */
class CredentialPrompter
{
public:
    virtual ~CredentialPrompter() = default;

    /**
     * Blocks until username and password are entered.
     * @throws IoError if input ends before both are read
     */
    virtual RepositoryCredential prompt(const std::string &baseUrl) = 0;
};

/**
 * Reads credentials line by line. When the input is the terminal, echo is
 * switched off while the password is typed.
 */
class TerminalPrompter : public CredentialPrompter
{
public:
    TerminalPrompter();
    TerminalPrompter(std::istream &in, std::ostream &out);

    RepositoryCredential prompt(const std::string &baseUrl) override;

private:
    std::string readLine(const std::string &label, bool hidden);

    std::istream &in_;
    std::ostream &out_;
};
