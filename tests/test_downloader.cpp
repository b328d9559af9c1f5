#include <gtest/gtest.h>

#include <filesystem>
#include <string>

#include "downloader.hpp"
#include "errors.hpp"
#include "test_helpers.hpp"

using namespace testing_support;
namespace fs = std::filesystem;

namespace
{
const std::string URL = "https://armory.example.com/files/report.csv?x=1";

class DownloaderTest : public ::testing::Test
{
protected:
    fs::path partOf(const std::string &name) const { return dir.path() / (name + ResumableDownloader::PART_SUFFIX); }

    TempDir dir;
    FakeTransport transport;
    RecordingProgress progress;
    ResumableDownloader downloader{transport, progress};
};
} // namespace

TEST_F(DownloaderTest, WritesChunksInDeliveryOrder)
{
    transport.enqueue(reply(200, {"alpha", "", "-", "beta", "", "gamma!"}));

    std::string name = downloader.download("tok", URL, dir.path(), std::string("out.bin"));

    EXPECT_EQ(name, "out.bin");
    EXPECT_EQ(readFile(dir.path() / "out.bin"), "alpha-betagamma!");
    EXPECT_FALSE(fs::exists(partOf("out.bin")));

    ASSERT_EQ(transport.requests.size(), 1u);
    EXPECT_EQ(requestHeader(transport.requests[0], "Cookie"), "USER_TOKEN=tok");
    EXPECT_FALSE(requestHeader(transport.requests[0], "Range"));

    EXPECT_EQ(progress.starts, 1);
    EXPECT_EQ(progress.total, 16u);
    EXPECT_EQ(progress.offset, 0u);
    EXPECT_EQ(progress.advanced, 16u);
    EXPECT_EQ(progress.chunkSizes.size(), 6u);
    EXPECT_EQ(progress.finishedWith, "out.bin");
}

TEST_F(DownloaderTest, ExtendedContentDispositionWins)
{
    transport.enqueue(reply(200, {}, {{"Content-Disposition", "attachment; filename=\"plain.bin\"; filename*=UTF-8''caf%C3%A9.bin"}}));
    transport.enqueue(reply(200, {"data"}));

    std::string name = downloader.download("tok", URL, dir.path());

    EXPECT_EQ(name, "caf\xC3\xA9.bin");
    EXPECT_EQ(readFile(dir.path() / name), "data");
    ASSERT_EQ(transport.requests.size(), 2u);
    EXPECT_EQ(requestHeader(transport.requests[0], "Cookie"), "USER_TOKEN=tok");
}

TEST_F(DownloaderTest, FallsBackToUrlSegment)
{
    transport.enqueue(reply(200, {}));
    transport.enqueue(reply(200, {"a,b\n1,2\n"}));

    EXPECT_EQ(downloader.download("tok", URL, dir.path()), "report.csv");
    EXPECT_EQ(readFile(dir.path() / "report.csv"), "a,b\n1,2\n");
}

TEST_F(DownloaderTest, FallsBackToDownloadWhenUrlHasNoName)
{
    transport.enqueue(reply(200, {}));
    transport.enqueue(reply(200, {"x"}));

    EXPECT_EQ(downloader.download("tok", "https://armory.example.com/", dir.path()), "download");
    EXPECT_TRUE(fs::exists(dir.path() / "download"));
}

TEST_F(DownloaderTest, ResumesFromPartialFile)
{
    writeFile(partOf("data.bin"), "0123");
    ScriptedResponse rest = reply(206, {"45", "6789"}, {{"Content-Range", "bytes 4-9/10"}});
    transport.enqueue(rest);

    downloader.download("tok", URL, dir.path(), std::string("data.bin"));

    EXPECT_EQ(readFile(dir.path() / "data.bin"), "0123456789");
    EXPECT_FALSE(fs::exists(partOf("data.bin")));
    ASSERT_EQ(transport.requests.size(), 1u);
    EXPECT_EQ(requestHeader(transport.requests[0], "Range"), "bytes=4-");
    EXPECT_EQ(progress.total, 10u);
    EXPECT_EQ(progress.offset, 4u);
    EXPECT_EQ(progress.advanced, 6u);
}

TEST_F(DownloaderTest, PartialContentWithoutTotalUsesContentLength)
{
    writeFile(partOf("data.bin"), "abc");
    transport.enqueue(reply(206, {"def"}, {{"Content-Range", "bytes 3-5/*"}}));

    downloader.download("", URL, dir.path(), std::string("data.bin"));

    EXPECT_EQ(readFile(dir.path() / "data.bin"), "abcdef");
    EXPECT_EQ(progress.total, 6u);
}

TEST_F(DownloaderTest, IgnoredRangeRestartsFromScratch)
{
    writeFile(partOf("data.bin"), "stale-bytes");
    transport.enqueue(reply(200, {"fresh ", "content"}));

    downloader.download("tok", URL, dir.path(), std::string("data.bin"));

    EXPECT_EQ(readFile(dir.path() / "data.bin"), "fresh content");
    EXPECT_EQ(requestHeader(transport.requests[0], "Range"), "bytes=11-");
    EXPECT_EQ(progress.offset, 0u);
    EXPECT_EQ(progress.total, 13u);
}

TEST_F(DownloaderTest, InterruptedTransferKeepsPartialFileAndResumes)
{
    ScriptedResponse dropped = reply(200, {"first-", "second"});
    dropped.failAfterChunks = 1;
    transport.enqueue(dropped);

    EXPECT_THROW(downloader.download("tok", URL, dir.path(), std::string("big.iso")), DownloadError);
    EXPECT_EQ(readFile(partOf("big.iso")), "first-");
    EXPECT_FALSE(fs::exists(dir.path() / "big.iso"));

    transport.enqueue(reply(206, {"second"}, {{"Content-Range", "bytes 6-11/12"}}));
    downloader.download("tok", URL, dir.path(), std::string("big.iso"));

    EXPECT_EQ(readFile(dir.path() / "big.iso"), "first-second");
    EXPECT_EQ(requestHeader(transport.requests[1], "Range"), "bytes=6-");
}

TEST_F(DownloaderTest, ConnectionFailureSurfacesDownloadError)
{
    ScriptedResponse refused;
    refused.refuseConnection = true;
    transport.enqueue(refused);

    EXPECT_THROW(downloader.download("tok", URL, dir.path(), std::string("x.bin")), DownloadError);
    EXPECT_FALSE(fs::exists(dir.path() / "x.bin"));
}

TEST_F(DownloaderTest, HttpErrorKeepsPartialFile)
{
    writeFile(partOf("data.bin"), "keep me");
    transport.enqueue(reply(404, {"not here"}));

    try
    {
        downloader.download("tok", URL, dir.path(), std::string("data.bin"));
        FAIL() << "expected DownloadError";
    }
    catch (const DownloadError &e)
    {
        EXPECT_EQ(e.status(), 404);
    }
    EXPECT_EQ(readFile(partOf("data.bin")), "keep me");
}

TEST_F(DownloaderTest, ProbeRejectionStopsBeforeTransfer)
{
    transport.enqueue(reply(401, {}));

    try
    {
        downloader.download("expired", URL, dir.path());
        FAIL() << "expected DownloadError";
    }
    catch (const DownloadError &e)
    {
        EXPECT_EQ(e.status(), 401);
    }
    EXPECT_EQ(transport.requests.size(), 1u);
}

TEST_F(DownloaderTest, CompletePartialFileIsPromotedOnRangeNotSatisfiable)
{
    writeFile(partOf("done.bin"), "all bytes");
    transport.enqueue(reply(416, {}, {{"Content-Range", "bytes */9"}}));

    EXPECT_EQ(downloader.download("tok", URL, dir.path(), std::string("done.bin")), "done.bin");

    EXPECT_EQ(readFile(dir.path() / "done.bin"), "all bytes");
    EXPECT_FALSE(fs::exists(partOf("done.bin")));
    EXPECT_EQ(transport.requests.size(), 1u);
}

TEST_F(DownloaderTest, OversizedPartialFileIsDiscardedOnRangeNotSatisfiable)
{
    writeFile(partOf("data.bin"), "too many bytes");
    transport.enqueue(reply(416, {}, {{"Content-Range", "bytes */4"}}));
    transport.enqueue(reply(200, {"good"}));

    downloader.download("tok", URL, dir.path(), std::string("data.bin"));

    EXPECT_EQ(readFile(dir.path() / "data.bin"), "good");
    ASSERT_EQ(transport.requests.size(), 2u);
    EXPECT_FALSE(requestHeader(transport.requests[1], "Range"));
}

TEST_F(DownloaderTest, MismatchedResumeOffsetIsRejected)
{
    writeFile(partOf("data.bin"), "0123");
    transport.enqueue(reply(206, {"23456789"}, {{"Content-Range", "bytes 2-9/10"}}));

    EXPECT_THROW(downloader.download("tok", URL, dir.path(), std::string("data.bin")), DownloadError);
    EXPECT_EQ(readFile(partOf("data.bin")), "0123");
}

TEST_F(DownloaderTest, ShortBodyIsNotPromoted)
{
    ScriptedResponse truncated = reply(200, {"12345"});
    truncated.contentLength = 10;
    transport.enqueue(truncated);

    EXPECT_THROW(downloader.download("tok", URL, dir.path(), std::string("data.bin")), DownloadError);
    EXPECT_EQ(readFile(partOf("data.bin")), "12345");
    EXPECT_FALSE(fs::exists(dir.path() / "data.bin"));
}

TEST_F(DownloaderTest, UnknownLengthStillCompletes)
{
    ScriptedResponse streamed = reply(200, {"no ", "length"});
    streamed.announceLength = false;
    transport.enqueue(streamed);

    downloader.download("tok", URL, dir.path(), std::string("data.bin"));

    EXPECT_EQ(progress.total, 0u);
    EXPECT_EQ(readFile(dir.path() / "data.bin"), "no length");
}

TEST_F(DownloaderTest, RepeatedDownloadReplacesCompletedFile)
{
    transport.enqueue(reply(200, {"same", " bytes"}));
    transport.enqueue(reply(200, {"same", " bytes"}));

    downloader.download("tok", URL, dir.path(), std::string("data.bin"));
    downloader.download("tok", URL, dir.path(), std::string("data.bin"));

    EXPECT_EQ(readFile(dir.path() / "data.bin"), "same bytes");
    EXPECT_FALSE(requestHeader(transport.requests[1], "Range"));
    EXPECT_EQ(transport.requests.size(), 2u);
}

TEST_F(DownloaderTest, CreatesMissingDirectories)
{
    transport.enqueue(reply(200, {"x"}));
    fs::path nested = dir.path() / "a" / "b" / "c";

    downloader.download("tok", URL, nested, std::string("x.bin"));

    EXPECT_EQ(readFile(nested / "x.bin"), "x");
}

TEST_F(DownloaderTest, DirectoryBlockedByFileIsIoError)
{
    writeFile(dir.path() / "blocker", "");

    EXPECT_THROW(downloader.download("tok", URL, dir.path() / "blocker" / "sub", std::string("x.bin")), IoError);
    EXPECT_TRUE(transport.requests.empty());
}

TEST_F(DownloaderTest, EmptyTokenSendsNoCookie)
{
    transport.enqueue(reply(200, {"x"}));

    downloader.download("", URL, dir.path(), std::string("x.bin"));

    EXPECT_FALSE(requestHeader(transport.requests[0], "Cookie"));
}

TEST_F(DownloaderTest, ServerSuppliedPathIsReducedToFileName)
{
    transport.enqueue(reply(200, {}, {{"Content-Disposition", "attachment; filename=\"../../etc/passwd\""}}));
    transport.enqueue(reply(200, {"x"}));

    EXPECT_EQ(downloader.download("tok", URL, dir.path()), "passwd");
    EXPECT_TRUE(fs::exists(dir.path() / "passwd"));
}

TEST_F(DownloaderTest, ControlBytesInServerNameFallBackToUrl)
{
    transport.enqueue(reply(200, {}, {{"Content-Disposition", "attachment; filename*=UTF-8''a%00b.bin"}}));
    transport.enqueue(reply(200, {"x"}));

    EXPECT_EQ(downloader.download("tok", URL, dir.path()), "report.csv");
    EXPECT_EQ(readFile(dir.path() / "report.csv"), "x");
    EXPECT_FALSE(fs::exists(dir.path() / "a"));
}

TEST_F(DownloaderTest, RenameFailureIsIoErrorAndKeepsPartFile)
{
    fs::create_directories(dir.path() / "x.bin");
    writeFile(dir.path() / "x.bin" / "occupied", "");
    transport.enqueue(reply(200, {"payload"}));

    try
    {
        downloader.download("tok", URL, dir.path(), std::string("x.bin"));
        FAIL() << "expected IoError";
    }
    catch (const IoError &e)
    {
        EXPECT_EQ(e.path(), partOf("x.bin"));
    }
    EXPECT_EQ(readFile(partOf("x.bin")), "payload");
    EXPECT_TRUE(fs::is_directory(dir.path() / "x.bin"));
    EXPECT_EQ(progress.finishes, 0);
}

TEST_F(DownloaderTest, WriteFailureIsDownloadErrorAndKeepsPartFile)
{
    if (!fs::exists("/dev/full"))
    {
        GTEST_SKIP() << "/dev/full is not available";
    }

    // Swap the .part file for a device that rejects every write once the size check is done
    ScriptedResponse response = reply(200, {std::string(1 << 20, 'z')});
    fs::path part = partOf("x.bin");
    response.beforeHead = [part] { fs::create_symlink("/dev/full", part); };
    transport.enqueue(response);

    EXPECT_THROW(downloader.download("tok", URL, dir.path(), std::string("x.bin")), DownloadError);
    EXPECT_TRUE(fs::is_symlink(part));
    EXPECT_FALSE(fs::exists(dir.path() / "x.bin"));
    EXPECT_EQ(progress.finishes, 0);
}
