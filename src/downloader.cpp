#include "downloader.hpp"

#include <fstream>
#include <system_error>

#include <fmt/core.h>

#include "content_headers.hpp"
#include "errors.hpp"
#include "url_utils.hpp"

namespace
{
// Only wants the response headers; stops before the body is read
class HeadProbe : public ResponseSink
{
public:
    bool onHead(const HttpResponseHead &head) override
    {
        head_ = head;
        return false;
    }

    void onChunk(const char *, std::size_t) override {}

    const HttpResponseHead &head() const { return head_; }

private:
    HttpResponseHead head_;
};

// Streams the response body onto the end of the .part file
class PartFileSink : public ResponseSink
{
public:
    PartFileSink(TransferState &state, ProgressReporter &progress)
        : state_(state), progress_(progress)
    {
    }

    bool onHead(const HttpResponseHead &head) override
    {
        head_ = head;

        if (state_.resumeOffset > 0 && head.status == 416)
        {
            rangeNotSatisfiable_ = true;
            return false;
        }

        if (!head.isSuccess())
        {
            throw DownloadError(fmt::format("HTTP error {}: {} ({} bytes kept in {})",
                                            head.status, httpStatusText(head.status),
                                            state_.resumeOffset, state_.temporaryPath.string()),
                                head.status);
        }

        std::optional<ContentRange> range;
        if (head.status == 206)
        {
            if (auto header = head.header("Content-Range"))
            {
                range = parseContentRange(*header);
            }
            if (range && range->first && *range->first != state_.resumeOffset)
            {
                throw DownloadError(fmt::format("Server resumed at byte {} but {} bytes are on disk",
                                                *range->first, state_.resumeOffset),
                                    head.status);
            }
        }

        // Server ignored our Range header and is sending the whole file:
        // appending would duplicate the first resumeOffset bytes
        std::ios::openmode fileMode = std::ios::binary | std::ios::app;
        if (state_.resumeOffset > 0 && head.status != 206)
        {
            fmt::print("Server doesn't support resume. Restarting download from beginning...\n");
            state_.resumeOffset = 0;
            fileMode = std::ios::binary | std::ios::trunc;
        }

        if (range && range->total)
        {
            state_.totalSize = *range->total;
        }
        else if (head.contentLength)
        {
            state_.totalSize = state_.resumeOffset + *head.contentLength;
        }
        else
        {
            state_.totalSize = 0;
        }

        out_.open(state_.temporaryPath, fileMode);
        if (!out_)
        {
            throw IoError(fmt::format("Cannot open file for writing: {}", state_.temporaryPath.string()),
                          state_.temporaryPath);
        }

        progress_.start(state_.filename, state_.totalSize, state_.resumeOffset);
        return true;
    }

    void onChunk(const char *data, std::size_t size) override
    {
        out_.write(data, static_cast<std::streamsize>(size));
        if (!out_.good())
        {
            throw DownloadError(fmt::format("Failed writing to {} after {} bytes",
                                            state_.temporaryPath.string(), state_.resumeOffset));
        }
        state_.resumeOffset += size;
        progress_.advance(size);
    }

    // Flush what we have; the .part file stays valid either way
    bool close()
    {
        if (!out_.is_open())
        {
            return true;
        }
        out_.close();
        return !out_.fail();
    }

    bool rangeNotSatisfiable() const { return rangeNotSatisfiable_; }
    const HttpResponseHead &head() const { return head_; }

private:
    TransferState &state_;
    ProgressReporter &progress_;
    std::ofstream out_;
    HttpResponseHead head_;
    bool rangeNotSatisfiable_ = false;
};
} // namespace

std::uint64_t existingFileSize(const std::filesystem::path &path)
{
    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
    {
        return 0;
    }
    auto size = std::filesystem::file_size(path, ec);
    if (ec)
    {
        throw IoError(fmt::format("Cannot read size of {}: {}", path.string(), ec.message()), path);
    }
    return static_cast<std::uint64_t>(size);
}

ResumableDownloader::ResumableDownloader(HttpTransport &transport, ProgressReporter &progress)
    : transport_(transport), progress_(progress)
{
}

std::string ResumableDownloader::download(const std::string &token,
                                          const std::string &sourceUrl,
                                          const std::filesystem::path &destinationDir,
                                          const std::optional<std::string> &explicitFilename)
{
    std::filesystem::path directory = destinationDir.empty() ? std::filesystem::path(".") : destinationDir;

    // 1. Ensure destination directory exists (like mkdir -p)
    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec)
    {
        throw IoError(fmt::format("Failed to create directory {}: {}", directory.string(), ec.message()),
                      directory);
    }

    // 2. Work out what the file is called
    std::string filename;
    if (explicitFilename)
    {
        filename = *explicitFilename;
        fmt::print("Using specified filename: {}\n", filename);
    }
    else
    {
        filename = resolveFilename(token, sourceUrl);
        fmt::print("filename: {}\n", filename);
    }

    TransferState state;
    state.sourceUrl = sourceUrl;
    state.filename = filename;
    state.finalPath = directory / filename;
    state.temporaryPath = state.finalPath;
    state.temporaryPath += PART_SUFFIX;

    // 3-6. Stream into the .part file; a rejected range gets one clean restart
    bool complete = transfer(token, state);
    if (!complete)
    {
        complete = transfer(token, state);
    }
    if (!complete)
    {
        throw DownloadError(fmt::format("Server rejected the byte range for {} twice", sourceUrl), 416);
    }

    // 7. Atomic completion
    promote(state);
    progress_.finish(filename);
    return filename;
}

HttpRequest ResumableDownloader::makeRequest(const std::string &token, const std::string &url) const
{
    HttpRequest request;
    request.method = "GET";
    request.url = url;
    request.timeoutSeconds = timeoutSeconds_;
    if (!token.empty())
    {
        request.headers.push_back(fmt::format("Cookie: USER_TOKEN={}", token));
    }
    return request;
}

std::string ResumableDownloader::resolveFilename(const std::string &token, const std::string &sourceUrl)
{
    // Full GET rather than HEAD: the armory API does not answer HEAD reliably.
    // The probe stops as soon as the headers are in.
    HeadProbe probe;
    try
    {
        transport_.perform(makeRequest(token, sourceUrl), probe);
    }
    catch (const TransportError &e)
    {
        throw DownloadError(fmt::format("Failed to query file name: {}", e.what()));
    }

    const auto &head = probe.head();
    if (head.status >= 400)
    {
        throw DownloadError(fmt::format("HTTP error {}: {}", head.status, httpStatusText(head.status)),
                            head.status);
    }

    if (auto disposition = head.header("Content-Disposition"))
    {
        if (auto name = parseContentDisposition(*disposition))
        {
            return *name;
        }
    }

    std::string urlName = fileNameFromUrl(sourceUrl);
    fmt::print("Falling back to URL filename: {}\n", urlName);
    return urlName;
}

bool ResumableDownloader::transfer(const std::string &token, TransferState &state)
{
    state.resumeOffset = existingFileSize(state.temporaryPath);
    state.totalSize = 0;

    HttpRequest request = makeRequest(token, state.sourceUrl);
    if (state.resumeOffset > 0)
    {
        fmt::print("Resuming download from byte: {}\n", state.resumeOffset);
        request.headers.push_back(fmt::format("Range: bytes={}-", state.resumeOffset));
    }

    PartFileSink sink(state, progress_);
    try
    {
        transport_.perform(request, sink);
    }
    catch (const TransportError &e)
    {
        bool flushed = sink.close();
        throw DownloadError(fmt::format("Download interrupted: {} ({} bytes kept in {}{})",
                                        e.what(), state.resumeOffset, state.temporaryPath.string(),
                                        flushed ? ", run again to resume" : ", flush failed"));
    }

    if (!sink.close())
    {
        throw DownloadError(fmt::format("Failed to flush {}", state.temporaryPath.string()));
    }

    if (sink.rangeNotSatisfiable())
    {
        std::optional<ContentRange> range;
        if (auto header = sink.head().header("Content-Range"))
        {
            range = parseContentRange(*header);
        }

        // Everything is already on disk, the previous run died before the rename
        if (range && range->total && *range->total == state.resumeOffset)
        {
            fmt::print("Partial download is already complete ({} bytes).\n", state.resumeOffset);
            state.totalSize = state.resumeOffset;
            return true;
        }

        fmt::print("Partial download does not match the server copy. Restarting download from beginning...\n");
        std::ofstream truncate(state.temporaryPath, std::ios::binary | std::ios::trunc);
        if (!truncate)
        {
            throw IoError(fmt::format("Cannot truncate {}", state.temporaryPath.string()), state.temporaryPath);
        }
        return false;
    }

    // Verify size when the server told us what to expect
    if (state.totalSize > 0)
    {
        std::uint64_t actual = existingFileSize(state.temporaryPath);
        if (actual != state.totalSize)
        {
            throw DownloadError(fmt::format("File size mismatch: expected {} bytes but got {} (kept in {})",
                                            state.totalSize, actual, state.temporaryPath.string()));
        }
    }
    return true;
}

void ResumableDownloader::promote(const TransferState &state)
{
    std::error_code ec;
    std::filesystem::rename(state.temporaryPath, state.finalPath, ec);
    if (ec)
    {
        throw IoError(fmt::format("Download succeeded but failed to rename {} to {}: {}",
                                  state.temporaryPath.string(), state.finalPath.string(), ec.message()),
                      state.temporaryPath);
    }
}
