#include "credential_prompter.hpp"

#include <iostream>
#include <termios.h>
#include <unistd.h>

#include <fmt/core.h>

#include "errors.hpp"
#include "string_utils.hpp"

namespace
{
// Disables terminal echo for its lifetime
class EchoGuard
{
public:
    EchoGuard()
    {
        if (::isatty(STDIN_FILENO) && ::tcgetattr(STDIN_FILENO, &saved_) == 0)
        {
            termios silent = saved_;
            silent.c_lflag &= ~static_cast<tcflag_t>(ECHO);
            active_ = ::tcsetattr(STDIN_FILENO, TCSAFLUSH, &silent) == 0;
        }
    }

    ~EchoGuard()
    {
        if (active_)
        {
            ::tcsetattr(STDIN_FILENO, TCSAFLUSH, &saved_);
        }
    }

    EchoGuard(const EchoGuard &) = delete;
    EchoGuard &operator=(const EchoGuard &) = delete;

    bool active() const { return active_; }

private:
    termios saved_{};
    bool active_ = false;
};
} // namespace

TerminalPrompter::TerminalPrompter() : TerminalPrompter(std::cin, std::cout)
{
}

TerminalPrompter::TerminalPrompter(std::istream &in, std::ostream &out) : in_(in), out_(out)
{
}

RepositoryCredential TerminalPrompter::prompt(const std::string &baseUrl)
{
    RepositoryCredential credential;
    credential.baseUrl = trim(baseUrl);
    credential.username = readLine("Enter username: ", false);
    credential.password = readLine("Enter password: ", true);
    return credential;
}

std::string TerminalPrompter::readLine(const std::string &label, bool hidden)
{
    out_ << label << std::flush;

    std::string line;
    bool ok = false;
    if (hidden && &in_ == &std::cin)
    {
        EchoGuard guard;
        ok = static_cast<bool>(std::getline(in_, line));
        if (guard.active())
        {
            out_ << '\n'; // The user's Enter was not echoed
        }
    }
    else
    {
        ok = static_cast<bool>(std::getline(in_, line));
    }

    if (!ok)
    {
        throw IoError(fmt::format("Input closed while reading '{}'", trim(label)), "<stdin>");
    }
    return trim(line);
}
