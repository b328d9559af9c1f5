#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>

/**
 * Root of every error raised by armory-downloader.
 * main() catches this (and std::exception) and exits with code 1.
 */
class ArmoryError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/**
 * Network-level failure: DNS, connect, TLS, connection reset, timeout.
 */
class TransportError : public ArmoryError
{
public:
    using ArmoryError::ArmoryError;
};

/**
 * Failure while exchanging credentials for an access token.
 */
class AuthError : public ArmoryError
{
public:
    enum class Kind
    {
        TransportFailure,    // Login endpoint unreachable
        RejectedCredentials, // Login endpoint answered with a non-success status
        MalformedResponse    // Success body unparseable or token empty
    };

    AuthError(Kind kind, const std::string &message, long status = 0, std::string body = {})
        : ArmoryError(message), kind_(kind), status_(status), body_(std::move(body))
    {
    }

    Kind kind() const { return kind_; }
    long status() const { return status_; }
    const std::string &body() const { return body_; }

private:
    Kind kind_;
    long status_;
    std::string body_;
};

/**
 * The transfer itself failed. The partial file (if any) is left in place.
 */
class DownloadError : public ArmoryError
{
public:
    explicit DownloadError(const std::string &message, long status = 0)
        : ArmoryError(message), status_(status)
    {
    }

    // HTTP status that caused the failure, 0 when not status related
    long status() const { return status_; }

private:
    long status_;
};

/**
 * Local filesystem operation failed (mkdir, open, rename).
 */
class IoError : public ArmoryError
{
public:
    IoError(const std::string &message, std::filesystem::path path)
        : ArmoryError(message), path_(std::move(path))
    {
    }

    const std::filesystem::path &path() const { return path_; }

private:
    std::filesystem::path path_;
};

/**
 * Credential file problems.
 */
class ConfigError : public ArmoryError
{
public:
    enum class Kind
    {
        NotFound,   // No file, or no entry for the requested repository
        Malformed,  // File exists but is not the expected JSON shape
        Unavailable // Config location cannot be determined
    };

    ConfigError(Kind kind, const std::string &message)
        : ArmoryError(message), kind_(kind)
    {
    }

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};
