#include "progress.h"
#include <iomanip>

namespace argus {

ConsoleReporter::ConsoleReporter(std::ostream& out, bool show_progress)
    : out_(out), show_progress_(show_progress), bar_visible_(false),
      start_time_(std::chrono::steady_clock::now()), last_display_time_() {
}

void ConsoleReporter::clear_bar() {
    if (bar_visible_) {
        out_ << "\n";
        bar_visible_ = false;
    }
}

void ConsoleReporter::info(const std::string& message) {
    clear_bar();
    out_ << message << "\n";
}

void ConsoleReporter::warning(const std::string& message) {
    clear_bar();
    out_ << "Warning: " << message << "\n";
}

void ConsoleReporter::progress(size_t done, size_t total, const std::string& current) {
    if (!show_progress_ || total <= 1) return;

    auto now = std::chrono::steady_clock::now();
    if (done == 1) {
        start_time_ = now;
    }

    // Redraw at most every 100ms, but always draw the final state
    auto since_last = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_display_time_).count();
    if (since_last < 100 && done < total) {
        return;
    }
    last_display_time_ = now;

    int bar_width = 30;
    float fraction = static_cast<float>(done) / total;
    int pos = static_cast<int>(bar_width * fraction);

    out_ << "\rLooking up IPs... [";
    for (int i = 0; i < bar_width; ++i) {
        if (i < pos) out_ << "=";
        else if (i == pos) out_ << ">";
        else out_ << " ";
    }
    out_ << "] " << std::setw(3) << static_cast<int>(fraction * 100) << "% ("
         << done << "/" << total << " IPs)";

    auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - start_time_).count();
    if (done < total && elapsed > 0) {
        double rate = static_cast<double>(done) / elapsed;
        size_t eta = static_cast<size_t>((total - done) / rate);
        out_ << " ETA " << format_time(eta);
    }

    // Pad so a shorter address fully overwrites a longer one
    out_ << " " << std::left << std::setw(15) << current << std::right;
    out_.flush();
    bar_visible_ = true;
}

void ConsoleReporter::finish() {
    clear_bar();
}

std::string ConsoleReporter::format_time(size_t seconds) {
    if (seconds == 0) return "< 1s";
    if (seconds < 60) return std::to_string(seconds) + "s";

    size_t minutes = seconds / 60;
    size_t secs = seconds % 60;

    if (minutes < 60) {
        return std::to_string(minutes) + "m " + std::to_string(secs) + "s";
    }

    size_t hours = minutes / 60;
    minutes = minutes % 60;

    return std::to_string(hours) + "h " + std::to_string(minutes) + "m";
}

} // namespace argus
