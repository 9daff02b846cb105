/**
 * @file log.cpp
 * @brief Log writer implementation
 */

#include "jobrack/core/log.hpp"

#include <iostream>

namespace jobrack {

LogWriter& LogWriter::console() {
    static LogWriter writer(std::cout);
    return writer;
}

LogWriter& LogWriter::discard() {
    static LogWriter writer;
    return writer;
}

void LogWriter::write_line(const std::string& line) {
    if (!out_) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    *out_ << prefix_ << line;
    if (line.empty() || line.back() != '\n') {
        *out_ << '\n';
    }
    out_->flush();
}

} // namespace jobrack
