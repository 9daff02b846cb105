/**
 * @file progress.cpp
 * @brief Progress envelope rendering
 */

#include "jobrack/core/progress.hpp"

#include <type_traits>

namespace jobrack {

const char* to_string(ProgressType type) noexcept {
    switch (type) {
        case ProgressType::Error:
            return "ProgressError";
        case ProgressType::Update:
            return "ProgressUpdate";
        case ProgressType::Estimate:
            return "ProgressEstimate";
        case ProgressType::Message:
            return "ProgressMessage";
        case ProgressType::Other:
            return "ProgressOther";
    }
    return "";
}

std::ostream& operator<<(std::ostream& os, const Error& error) {
    return os << error.message();
}

std::optional<Error> Progress::as_error() const {
    if (type_ != ProgressType::Error) {
        return std::nullopt;
    }
    if (const auto* err = get_if<Error>()) {
        return *err;
    }
    // Error tag over some other payload: its text is the message
    return Error(payload_string());
}

std::string Progress::payload_string() const {
    return std::visit([](const auto& value) -> std::string {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return {};
        } else if constexpr (std::is_same_v<T, Error>) {
            return value.message();
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
            return std::to_string(value);
        } else if constexpr (std::is_same_v<T, std::string>) {
            return value;
        } else {
            // Opaque to us
            return "{}";
        }
    }, data_);
}

std::string Progress::to_string() const {
    std::string out = jobrack::to_string(type_);
    out += ": ";
    out += payload_string();
    return out;
}

std::ostream& operator<<(std::ostream& os, const Progress& progress) {
    return os << progress.to_string();
}

} // namespace jobrack
