#include "terminal_progress.hpp"

#include <cstdio>
#include <unistd.h>

#include <fmt/core.h>

namespace
{
constexpr int BAR_WIDTH = 50;
constexpr long TERMINAL_INTERVAL_MS = 200;
constexpr long PIPE_INTERVAL_MS = 1000;

std::string formatSpeed(double speed)
{
    if (speed >= 1024 * 1024)
    {
        return fmt::format("{:.2f} MB/s", speed / (1024.0 * 1024.0));
    }
    else if (speed >= 1024)
    {
        return fmt::format("{:.2f} KB/s", speed / 1024.0);
    }
    return fmt::format("{:.0f} B/s", speed);
}
} // namespace

TerminalProgress::TerminalProgress()
{
    // Detect if stdout is a terminal to decide how we render the progress bar
    isTerminalOutput_ = ::isatty(fileno(stdout));
}

void TerminalProgress::start(const std::string &filename, std::uint64_t knownTotal, std::uint64_t startOffset)
{
    total_ = knownTotal;
    startOffset_ = startOffset;
    downloaded_ = startOffset;
    startTime_ = std::chrono::steady_clock::now();
    lastPrintedTime_ = startTime_;
    lastPrintedPercentage_ = -1.0;
    active_ = true;

    fmt::print("Starting download: {}\n", filename);
    render(true);
}

void TerminalProgress::advance(std::uint64_t byteCount)
{
    downloaded_ += byteCount;
    render(false);
}

void TerminalProgress::finish(const std::string &filename)
{
    if (active_)
    {
        render(true);
        if (isTerminalOutput_)
        {
            fmt::print("\n");
        }
    }
    active_ = false;
    fmt::print("Downloaded {}\n", filename);
}

void TerminalProgress::render(bool force)
{
    auto now = std::chrono::steady_clock::now();
    auto sinceLastPrint = std::chrono::duration_cast<std::chrono::milliseconds>(now - lastPrintedTime_).count();
    bool isComplete = total_ > 0 && downloaded_ >= total_;
    double percentage = total_ > 0 ? (static_cast<double>(downloaded_) / total_) * 100.0 : 0.0;

    if (!force && !isComplete)
    {
        if (isTerminalOutput_ && sinceLastPrint < TERMINAL_INTERVAL_MS)
        {
            return;
        }
        if (!isTerminalOutput_ && sinceLastPrint < PIPE_INTERVAL_MS &&
            (total_ == 0 || percentage < lastPrintedPercentage_ + 1.0))
        {
            return;
        }
    }

    // Session speed: only bytes fetched by this run count
    auto elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(now - startTime_).count();
    double speed = elapsedMs > 0 ? static_cast<double>(downloaded_ - startOffset_) * 1000.0 / elapsedMs : 0.0;

    std::string line = total_ > 0 ? renderBar(speed) : renderCounter(speed);
    if (isTerminalOutput_)
    {
        fmt::print("\r{}\033[K", line);
        std::fflush(stdout);
    }
    else
    {
        fmt::print("{}\n", line);
    }

    lastPrintedTime_ = now;
    lastPrintedPercentage_ = percentage;
}

std::string TerminalProgress::renderCounter(double speed) const
{
    auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - startTime_).count();
    return fmt::format("Downloaded: {} | {} | Elapsed: {}",
                       formatBytes(downloaded_), formatSpeed(speed), formatDuration(static_cast<long>(elapsed)));
}

std::string TerminalProgress::renderBar(double speed) const
{
    double percentage = (static_cast<double>(downloaded_) / total_) * 100.0;
    if (percentage > 100.0)
    {
        percentage = 100.0;
    }

    std::uint64_t remaining = total_ > downloaded_ ? total_ - downloaded_ : 0;
    long eta = (speed > 0) ? static_cast<long>(remaining / speed) : -1;

    int filled = static_cast<int>((percentage / 100.0) * BAR_WIDTH);
    std::string bar = "[";
    for (int i = 0; i < BAR_WIDTH; ++i)
    {
        if (i < filled)
        {
            bar += "=";
        }
        else if (i == filled)
        {
            bar += ">";
        }
        else
        {
            bar += " ";
        }
    }
    bar += "]";

    return fmt::format("{} {:.1f}% | {} / {} | {} | ETA: {}",
                       bar, percentage, formatBytes(downloaded_), formatBytes(total_),
                       formatSpeed(speed), formatDuration(eta));
}

std::string formatBytes(std::uint64_t bytes)
{
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;

    if (bytes >= GB)
    {
        return fmt::format("{:.2f} GB", bytes / GB);
    }
    else if (bytes >= MB)
    {
        return fmt::format("{:.2f} MB", bytes / MB);
    }
    else if (bytes >= KB)
    {
        return fmt::format("{:.2f} KB", bytes / KB);
    }
    return fmt::format("{} B", bytes);
}

std::string formatDuration(long seconds)
{
    if (seconds < 0)
    {
        return "unknown";
    }
    else if (seconds < 60)
    {
        return fmt::format("{}s", seconds);
    }
    else if (seconds < 3600)
    {
        return fmt::format("{}m {}s", seconds / 60, seconds % 60);
    }
    return fmt::format("{}h {}m", seconds / 3600, (seconds % 3600) / 60);
}
