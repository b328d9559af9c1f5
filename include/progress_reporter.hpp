#pragma once

#include <cstdint>
#include <string>

/**
 * Receives byte-count events from a transfer.
 * Injected into ResumableDownloader so the transfer logic never touches the terminal.
 */
class ProgressReporter
{
public:
    virtual ~ProgressReporter() = default;

    /**
     * A transfer is about to stream its body.
     *
     * @param filename Name the file will be saved under
     * @param knownTotal Total size in bytes, 0 if unknown
     * @param startOffset Bytes already on disk from a previous run
     */
    virtual void start(const std::string &filename, std::uint64_t knownTotal, std::uint64_t startOffset) = 0;

    // One chunk of byteCount bytes was written
    virtual void advance(std::uint64_t byteCount) = 0;

    virtual void finish(const std::string &filename) = 0;
};
