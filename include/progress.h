#ifndef ARGUS_PROGRESS_H
#define ARGUS_PROGRESS_H

#include <chrono>
#include <cstddef>
#include <ostream>
#include <string>

namespace argus {

/**
 * Observability context passed explicitly through the pipeline.
 * Stages report what happened; the implementation decides how (or whether) to show it.
 */
class Reporter {
public:
    virtual ~Reporter() = default;

    virtual void info(const std::string& message) = 0;
    virtual void warning(const std::string& message) = 0;

    /**
     * One more address processed
     * @param done Addresses finished so far
     * @param total Addresses in the batch
     * @param current Address just finished
     */
    virtual void progress(size_t done, size_t total, const std::string& current) = 0;

    /**
     * Batch complete; terminate any in-place display
     */
    virtual void finish() = 0;
};

/**
 * Discards every event
 */
class NullReporter : public Reporter {
public:
    void info(const std::string&) override {}
    void warning(const std::string&) override {}
    void progress(size_t, size_t, const std::string&) override {}
    void finish() override {}
};

/**
 * Plain console reporter: messages on their own lines, progress as a
 * redrawn bar with ETA. Progress is only drawn for batches of more than one.
 */
class ConsoleReporter : public Reporter {
public:
    /**
     * @param out Stream to write to (normally std::cerr)
     * @param show_progress Whether to draw the progress bar at all
     */
    ConsoleReporter(std::ostream& out, bool show_progress);

    void info(const std::string& message) override;
    void warning(const std::string& message) override;
    void progress(size_t done, size_t total, const std::string& current) override;
    void finish() override;

    /**
     * Format seconds as human-readable time string
     * @param seconds Number of seconds
     * @return Formatted string like "2m 15s" or "45s" or "< 1s"
     */
    static std::string format_time(size_t seconds);

private:
    void clear_bar();

    std::ostream& out_;
    bool show_progress_;
    bool bar_visible_;
    std::chrono::steady_clock::time_point start_time_;
    std::chrono::steady_clock::time_point last_display_time_;
};

} // namespace argus

#endif // ARGUS_PROGRESS_H
