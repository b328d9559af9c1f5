#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "http_transport.hpp"
#include "progress_reporter.hpp"

/**
 * Everything known about one transfer. temporaryPath is always finalPath plus
 * PART_SUFFIX, so a re-run against the same target finds earlier progress.
 */
struct TransferState
{
    std::string sourceUrl;
    std::string filename;
    std::filesystem::path finalPath;
    std::filesystem::path temporaryPath;
    std::uint64_t resumeOffset = 0; // Bytes already in temporaryPath
    std::uint64_t totalSize = 0;    // 0 = unknown
};

/**
 * Downloads a single armory file with resume support.
 *
 * Bytes are staged in "<name>.part" next to the final file and renamed into
 * place once the stream ends. An interrupted run leaves the .part file behind
 * and the next run continues from its length with a Range request.
 *
 * Two processes downloading to the same target at once will corrupt each
 * other's .part file; there is no locking.
 */
class ResumableDownloader
{
public:
    static constexpr const char *PART_SUFFIX = ".part";

    ResumableDownloader(HttpTransport &transport, ProgressReporter &progress);

    /**
     * Download sourceUrl into destinationDir.
     *
     * @param token Access token sent as the USER_TOKEN cookie (empty = no cookie)
     * @param sourceUrl File URL
     * @param destinationDir Directory to save into, created if missing
     * @param explicitFilename Save name; resolved from the server when absent
     * @return The file name the download was saved under
     * @throws IoError if the directory cannot be created or the final rename fails
     * @throws DownloadError on HTTP errors or mid-stream failures (partial file kept)
     */
    std::string download(const std::string &token,
                         const std::string &sourceUrl,
                         const std::filesystem::path &destinationDir,
                         const std::optional<std::string> &explicitFilename = std::nullopt);

    /**
     * Set an overall per-request timeout in seconds (0 = none).
     */
    void setTimeout(int timeoutSeconds) { timeoutSeconds_ = timeoutSeconds; }

private:
    HttpTransport &transport_;
    ProgressReporter &progress_;
    int timeoutSeconds_ = 0;

    HttpRequest makeRequest(const std::string &token, const std::string &url) const;

    /**
     * Probe the server for a Content-Disposition name, falling back to the URL.
     */
    std::string resolveFilename(const std::string &token, const std::string &sourceUrl);

    /**
     * One ranged GET streamed into the .part file.
     * @return false if the server rejected the range and the .part file was
     *         reset, so the caller should request again from offset 0
     */
    bool transfer(const std::string &token, TransferState &state);

    void promote(const TransferState &state);
};

/**
 * Size of the file at path, or 0 if it does not exist.
 * @throws IoError if the file exists but cannot be inspected
 */
std::uint64_t existingFileSize(const std::filesystem::path &path);
