#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "progress_reporter.hpp"

/**
 * Progress bar on stdout.
 *
 * On a terminal the bar is redrawn in place (at most 5 times per second).
 * When stdout is redirected a plain line is printed at most once per second
 * or per percent, so logs stay readable.
 */
class TerminalProgress : public ProgressReporter
{
public:
    TerminalProgress();

    void start(const std::string &filename, std::uint64_t knownTotal, std::uint64_t startOffset) override;
    void advance(std::uint64_t byteCount) override;
    void finish(const std::string &filename) override;

private:
    void render(bool force);
    std::string renderCounter(double speed) const;
    std::string renderBar(double speed) const;

    bool isTerminalOutput_ = true;
    bool active_ = false;

    std::uint64_t total_ = 0;        // 0 = unknown, counter-only display
    std::uint64_t startOffset_ = 0;  // Bytes present before this session
    std::uint64_t downloaded_ = 0;   // Bytes including startOffset_

    std::chrono::steady_clock::time_point startTime_;
    std::chrono::steady_clock::time_point lastPrintedTime_;
    double lastPrintedPercentage_ = -1.0;
};

/**
 * Format bytes into human-readable string (e.g., "52.30 MB")
 */
std::string formatBytes(std::uint64_t bytes);

/**
 * Format duration into human-readable string (e.g., "2m 30s")
 */
std::string formatDuration(long seconds);
