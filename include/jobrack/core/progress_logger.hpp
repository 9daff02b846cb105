#pragma once

/**
 * @file progress_logger.hpp
 * @brief Consumer loop that triages progress envelopes
 */

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>

#include "jobrack/core/log.hpp"
#include "jobrack/core/progress.hpp"

namespace jobrack {

/**
 * @brief Callback invoked with every surfaced Error envelope
 *
 * It runs after the error has been logged and may terminate the process.
 */
using ProgressErrorFunc = std::function<void(const Error&)>;

/**
 * @brief Per-kind counts of envelopes a logger has handled
 */
struct ProgressLoggerStats {
    std::uint64_t errors{0};
    std::uint64_t messages{0};
    std::uint64_t updates{0};
    std::uint64_t estimates{0};
    std::uint64_t forwarded{0};
    std::uint64_t unrecognized{0};
};

/**
 * @brief Reads a progress channel until it is closed and routes each envelope
 *
 * - Error: always logged, then passed to the error callback if one is set
 * - Message: logged when log_messages is set
 * - Update / Estimate: logged when log_messages is set, and forwarded
 *   unchanged to the bar channel when one is set
 * - anything else: always logged in its generic form
 *
 * Forwarding blocks until the bar channel accepts the envelope. Whoever
 * supplies a bar channel must keep draining it.
 */
class ProgressLogger {
public:
    struct Config {
        bool log_messages{false};
        ProgressErrorFunc on_error;
        std::shared_ptr<ProgressChannel> bar;
    };

    explicit ProgressLogger(LogWriter& out)
        : out_(out) {}

    ProgressLogger(LogWriter& out, Config config)
        : out_(out)
        , config_(std::move(config)) {}

    // Non-copyable
    ProgressLogger(const ProgressLogger&) = delete;
    ProgressLogger& operator=(const ProgressLogger&) = delete;

    /**
     * @brief Consume @p source until it is closed and drained
     */
    void run(ProgressChannel& source);

    /**
     * @brief Route a single envelope
     */
    void handle(const Progress& progress);

    [[nodiscard]] ProgressLoggerStats stats() const noexcept;

private:
    LogWriter& out_;
    Config config_;

    std::atomic<std::uint64_t> errors_{0};
    std::atomic<std::uint64_t> messages_{0};
    std::atomic<std::uint64_t> updates_{0};
    std::atomic<std::uint64_t> estimates_{0};
    std::atomic<std::uint64_t> forwarded_{0};
    std::atomic<std::uint64_t> unrecognized_{0};
};

/**
 * @brief Run a ProgressLogger over @p source with the given settings
 *
 * Returns once @p source is closed and drained.
 */
void log_progress(
    LogWriter& out,
    bool log_messages,
    ProgressErrorFunc on_error,
    ProgressChannel& source,
    std::shared_ptr<ProgressChannel> bar = nullptr
);

} // namespace jobrack
