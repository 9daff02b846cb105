/**
 * @file progress_logger.cpp
 * @brief Progress logger implementation
 */

#include "jobrack/core/progress_logger.hpp"

namespace jobrack {

void ProgressLogger::run(ProgressChannel& source) {
    while (auto progress = source.pop()) {
        handle(*progress);
    }
}

void ProgressLogger::handle(const Progress& progress) {
    switch (progress.type()) {
        case ProgressType::Error: {
            errors_.fetch_add(1, std::memory_order_relaxed);

            // Errors are always printed
            auto err = *progress.as_error();
            out_.print("[PROGRESS] ERROR: ", err.message());

            if (config_.on_error) {
                config_.on_error(err);
            }
            break;
        }

        case ProgressType::Message:
            messages_.fetch_add(1, std::memory_order_relaxed);
            if (config_.log_messages) {
                out_.print("[PROGRESS] ", progress.payload_string());
            }
            break;

        case ProgressType::Update:
        case ProgressType::Estimate:
            if (progress.type() == ProgressType::Update) {
                updates_.fetch_add(1, std::memory_order_relaxed);
            } else {
                estimates_.fetch_add(1, std::memory_order_relaxed);
            }

            if (config_.log_messages) {
                out_.print("[PROGRESS] ", progress.to_string());
            }
            if (config_.bar && config_.bar->push(progress)) {
                forwarded_.fetch_add(1, std::memory_order_relaxed);
            }
            break;

        default:
            unrecognized_.fetch_add(1, std::memory_order_relaxed);
            out_.print("[PROGRESS] ??: ", progress.to_string());
            break;
    }
}

ProgressLoggerStats ProgressLogger::stats() const noexcept {
    ProgressLoggerStats s;
    s.errors = errors_.load(std::memory_order_relaxed);
    s.messages = messages_.load(std::memory_order_relaxed);
    s.updates = updates_.load(std::memory_order_relaxed);
    s.estimates = estimates_.load(std::memory_order_relaxed);
    s.forwarded = forwarded_.load(std::memory_order_relaxed);
    s.unrecognized = unrecognized_.load(std::memory_order_relaxed);
    return s;
}

void log_progress(
    LogWriter& out,
    bool log_messages,
    ProgressErrorFunc on_error,
    ProgressChannel& source,
    std::shared_ptr<ProgressChannel> bar
) {
    ProgressLogger::Config config;
    config.log_messages = log_messages;
    config.on_error = std::move(on_error);
    config.bar = std::move(bar);

    ProgressLogger logger(out, std::move(config));
    logger.run(source);
}

} // namespace jobrack
