#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>

namespace snapfetch::cli {

/**
 * @brief Single-line terminal progress for long transfers
 *
 * Renders a spinner, a percentage or a bar on one line of the given stream
 * (stderr by default, so JSON results on stdout stay clean). Counts can be
 * shown as plain numbers or as byte sizes.
 */
class ProgressIndicator {
public:
    enum class Style {
        Spinner,    // | / - \ (dots when not a terminal)
        Percentage, // [ 45%]
        Bar         // [=========>          ]
    };

    explicit ProgressIndicator(Style style = Style::Bar, std::ostream& out = std::cerr);

    /**
     * @brief Destructor - automatically stops if still active
     */
    ~ProgressIndicator();

    ProgressIndicator(const ProgressIndicator&) = delete;
    ProgressIndicator& operator=(const ProgressIndicator&) = delete;
    ProgressIndicator(ProgressIndicator&&) = delete;
    ProgressIndicator& operator=(ProgressIndicator&&) = delete;

    /**
     * @brief Start showing progress with a message
     */
    void start(const std::string& message);

    /**
     * @brief Update progress
     * @param current Current progress value
     * @param total Total expected value (0 for indeterminate)
     */
    void update(std::uint64_t current, std::uint64_t total = 0);

    /**
     * @brief Stop and clear the indicator
     */
    void stop();

    void setShowCount(bool show) { showCount_ = show; }
    void setCountAsBytes(bool bytes) { countAsBytes_ = bytes; }
    void setUpdateInterval(int ms) { updateIntervalMs_ = ms; }

    bool isActive() const { return active_; }

    // Update the displayed message while active
    void setMessage(const std::string& message) {
        message_ = message;
        render();
    }

    // Human readable byte size, e.g. "1.5 GiB"
    static std::string formatBytes(std::uint64_t bytes);

private:
    void render();
    std::string formatCount(std::uint64_t value) const;

    Style style_;
    std::ostream& out_;
    bool isTty_{false};
    std::string message_;
    std::atomic<bool> active_{false};
    std::uint64_t current_ = 0;
    std::uint64_t total_ = 0;
    int spinnerIndex_ = 0;
    bool showCount_ = true;
    bool countAsBytes_ = false;
    int updateIntervalMs_ = 100;

    std::chrono::steady_clock::time_point lastUpdate_;

    static constexpr const char* SPINNER_CHARS[] = {"|", "/", "-", "\\"};
    static constexpr int SPINNER_COUNT = 4;
};

} // namespace snapfetch::cli
