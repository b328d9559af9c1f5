#include <gtest/gtest.h>

#include <filesystem>
#include <sstream>

#include <nlohmann/json.hpp>

#include "credential_prompter.hpp"
#include "credential_store.hpp"
#include "errors.hpp"
#include "test_helpers.hpp"

using namespace testing_support;
namespace fs = std::filesystem;

namespace
{
ConfigError::Kind loadFailureKind(const CredentialStore &store, const std::string &url)
{
    try
    {
        store.load(url);
    }
    catch (const ConfigError &e)
    {
        return e.kind();
    }
    ADD_FAILURE() << "load did not throw";
    return ConfigError::Kind::Unavailable;
}
} // namespace

TEST(CredentialStore, RoundTrip)
{
    TempDir dir;
    CredentialStore store(dir.path() / ".amr" / "config.json");
    RepositoryCredential credential{"https://a", "u", "p"};

    store.save(credential);

    EXPECT_EQ(store.load("https://a"), credential);
}

TEST(CredentialStore, SaveReplacesSameUrl)
{
    TempDir dir;
    CredentialStore store(dir.path() / "config.json");

    store.save({"https://a", "u", "p"});
    store.save({"https://b", "v", "q"});
    store.save({"https://a", "u2", "p2"});

    auto all = store.loadAll();
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0], (RepositoryCredential{"https://a", "u2", "p2"}));
    EXPECT_EQ(all[1], (RepositoryCredential{"https://b", "v", "q"}));
}

TEST(CredentialStore, FileLayout)
{
    TempDir dir;
    fs::path path = dir.path() / "config.json";
    CredentialStore store(path);
    store.save({"https://a", "u", "p"});

    auto document = nlohmann::json::parse(readFile(path));
    ASSERT_TRUE(document.at("repositories").is_array());
    EXPECT_EQ(document["repositories"][0]["url"], "https://a");
    EXPECT_EQ(document["repositories"][0]["username"], "u");
    EXPECT_EQ(document["repositories"][0]["password"], "p");
    EXPECT_FALSE(fs::exists(dir.path() / "config.json.tmp"));
}

TEST(CredentialStore, OwnerOnlyPermissions)
{
    TempDir dir;
    fs::path path = dir.path() / "config.json";
    CredentialStore store(path);
    store.save({"https://a", "u", "p"});

    auto perms = fs::status(path).permissions();
    EXPECT_EQ(perms & (fs::perms::group_all | fs::perms::others_all), fs::perms::none);
    EXPECT_NE(perms & fs::perms::owner_read, fs::perms::none);
    EXPECT_NE(perms & fs::perms::owner_write, fs::perms::none);
}

TEST(CredentialStore, MissingFileIsNotFound)
{
    TempDir dir;
    CredentialStore store(dir.path() / "absent.json");
    EXPECT_EQ(loadFailureKind(store, "https://a"), ConfigError::Kind::NotFound);
    EXPECT_TRUE(store.loadAll().empty());
}

TEST(CredentialStore, MissingEntryIsNotFound)
{
    TempDir dir;
    CredentialStore store(dir.path() / "config.json");
    store.save({"https://a", "u", "p"});
    EXPECT_EQ(loadFailureKind(store, "https://b"), ConfigError::Kind::NotFound);
}

TEST(CredentialStore, MalformedFile)
{
    TempDir dir;
    fs::path path = dir.path() / "config.json";
    CredentialStore store(path);

    writeFile(path, "{ not json");
    EXPECT_EQ(loadFailureKind(store, "https://a"), ConfigError::Kind::Malformed);

    writeFile(path, "{\"repositories\": [{\"url\": \"https://a\"}]}");
    EXPECT_EQ(loadFailureKind(store, "https://a"), ConfigError::Kind::Malformed);

    writeFile(path, "[]");
    EXPECT_EQ(loadFailureKind(store, "https://a"), ConfigError::Kind::Malformed);
}

TEST(CredentialStore, MissingRepositoriesKeyIsEmpty)
{
    TempDir dir;
    fs::path path = dir.path() / "config.json";
    writeFile(path, "{}");
    CredentialStore store(path);

    EXPECT_EQ(loadFailureKind(store, "https://a"), ConfigError::Kind::NotFound);
    store.save({"https://a", "u", "p"});
    EXPECT_EQ(store.load("https://a").username, "u");
}

TEST(TerminalPrompter, ReadsAndTrims)
{
    std::istringstream in("  alice \n s3cret\r\n");
    std::ostringstream out;
    TerminalPrompter prompter(in, out);

    auto credential = prompter.prompt(" https://armory.example.com ");

    EXPECT_EQ(credential.baseUrl, "https://armory.example.com");
    EXPECT_EQ(credential.username, "alice");
    EXPECT_EQ(credential.password, "s3cret");
    EXPECT_NE(out.str().find("Enter username: "), std::string::npos);
    EXPECT_NE(out.str().find("Enter password: "), std::string::npos);
}

TEST(TerminalPrompter, ClosedInputIsIoError)
{
    std::istringstream in("alice\n");
    std::ostringstream out;
    TerminalPrompter prompter(in, out);

    EXPECT_THROW(prompter.prompt("https://a"), IoError);
}
