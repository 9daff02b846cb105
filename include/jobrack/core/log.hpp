#pragma once

/**
 * @file log.hpp
 * @brief Line-oriented log writer over an output stream
 */

#include <mutex>
#include <ostream>
#include <sstream>
#include <string>

namespace jobrack {

/**
 * @brief Thread-safe writer of whole log lines
 *
 * Each print() call produces exactly one line, prefixed and newline
 * terminated, so lines from concurrent threads never interleave. A
 * default-constructed writer discards everything.
 */
class LogWriter {
public:
    LogWriter() = default;

    explicit LogWriter(std::ostream& out, std::string prefix = {})
        : out_(&out)
        , prefix_(std::move(prefix)) {}

    // Non-copyable (owns a mutex)
    LogWriter(const LogWriter&) = delete;
    LogWriter& operator=(const LogWriter&) = delete;

    /**
     * @brief Writer bound to std::cout
     */
    static LogWriter& console();

    /**
     * @brief Writer that drops every line
     */
    static LogWriter& discard();

    /**
     * @brief Stream all arguments into one line
     */
    template<typename... Args>
    void print(const Args&... args) {
        if (!out_) {
            return;
        }
        std::ostringstream oss;
        (oss << ... << args);
        write_line(oss.str());
    }

    /**
     * @brief Write a preformatted line (prefix and newline are added)
     */
    void write_line(const std::string& line);

private:
    std::ostream* out_{nullptr};
    std::string prefix_;
    std::mutex mutex_;
};

} // namespace jobrack
