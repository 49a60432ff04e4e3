#include <snapfetch/cli/progress_indicator.h>

#include <unistd.h>

#include <cstdio>
#include <iomanip>
#include <sstream>

namespace snapfetch::cli {

namespace {

constexpr int kBarWidth = 30;

std::string progressBar(double fraction) {
    if (fraction < 0.0)
        fraction = 0.0;
    if (fraction > 1.0)
        fraction = 1.0;
    const int filled = static_cast<int>(fraction * kBarWidth);
    std::string bar = "[";
    for (int i = 0; i < kBarWidth; ++i) {
        if (i < filled)
            bar += '=';
        else if (i == filled)
            bar += '>';
        else
            bar += ' ';
    }
    bar += ']';
    return bar;
}

} // namespace

ProgressIndicator::ProgressIndicator(Style style, std::ostream& out)
    : style_(style), out_(out),
      isTty_(::isatty(&out == &std::cout ? STDOUT_FILENO : STDERR_FILENO) != 0) {
    if (!isTty_) {
        updateIntervalMs_ = 5000; // one line every few seconds in logs
    }
}

ProgressIndicator::~ProgressIndicator() {
    if (active_) {
        stop();
    }
}

void ProgressIndicator::start(const std::string& message) {
    if (active_)
        return;

    message_ = message;
    active_ = true;
    current_ = 0;
    total_ = 0;
    spinnerIndex_ = 0;
    lastUpdate_ = std::chrono::steady_clock::now();

    render();
}

void ProgressIndicator::update(std::uint64_t current, std::uint64_t total) {
    if (!active_)
        return;

    current_ = current;
    total_ = total;

    auto now = std::chrono::steady_clock::now();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - lastUpdate_).count();

    if (elapsed >= updateIntervalMs_) {
        spinnerIndex_ = (spinnerIndex_ + 1) % SPINNER_COUNT;
        lastUpdate_ = now;
        render();
    }
}

void ProgressIndicator::stop() {
    if (!active_)
        return;

    if (isTty_) {
        out_ << "\r\033[K" << std::flush;
    }
    active_ = false;
}

std::string ProgressIndicator::formatBytes(std::uint64_t bytes) {
    static const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    double value = static_cast<double>(bytes);
    int unit = 0;
    while (value >= 1024.0 && unit < 4) {
        value /= 1024.0;
        ++unit;
    }
    char buf[32];
    if (unit == 0) {
        std::snprintf(buf, sizeof(buf), "%llu B", static_cast<unsigned long long>(bytes));
    } else {
        std::snprintf(buf, sizeof(buf), "%.1f %s", value, units[unit]);
    }
    return buf;
}

std::string ProgressIndicator::formatCount(std::uint64_t value) const {
    return countAsBytes_ ? formatBytes(value) : std::to_string(value);
}

void ProgressIndicator::render() {
    if (!active_)
        return;

    std::ostringstream oss;
    // Non-terminal output gets no carriage-return redraws
    oss << (isTty_ ? "\r\033[K" : "");

    auto appendCount = [&]() {
        if (!showCount_ || current_ == 0)
            return;
        oss << " (" << formatCount(current_);
        if (total_ > 0) {
            oss << "/" << formatCount(total_);
        }
        oss << ")";
    };

    const bool determinate = total_ > 0;
    switch (style_) {
        case Style::Spinner:
            oss << SPINNER_CHARS[spinnerIndex_] << " " << message_;
            appendCount();
            break;

        case Style::Percentage:
            if (determinate) {
                int percent = static_cast<int>((current_ * 100) / total_);
                oss << "[" << std::setw(3) << percent << "%] " << message_;
            } else {
                oss << SPINNER_CHARS[spinnerIndex_] << " " << message_;
            }
            appendCount();
            break;

        case Style::Bar:
            if (determinate) {
                const double fraction =
                    static_cast<double>(current_) / static_cast<double>(total_);
                int percent = static_cast<int>((current_ * 100) / total_);
                oss << progressBar(fraction) << " " << std::setw(3) << percent << "% "
                    << message_;
            } else {
                oss << SPINNER_CHARS[spinnerIndex_] << " " << message_;
            }
            appendCount();
            break;
    }

    if (!isTty_) {
        oss << "\n";
    }
    out_ << oss.str() << std::flush;
}

} // namespace snapfetch::cli
