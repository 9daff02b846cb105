#pragma once

/**
 * @file progress.hpp
 * @brief Typed progress envelopes emitted by workers
 */

#include <any>
#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <variant>

#include "jobrack/core/channel.hpp"

namespace jobrack {

/**
 * @brief Kind of a Progress envelope
 *
 * The underlying type is fixed, so values outside the named set are
 * still representable. They render with an empty name.
 */
enum class ProgressType : int {
    Error = 0,      // Data is an Error
    Update,         // Data is a signed delta of completed units
    Estimate,       // Data is a signed estimate of the total
    Message,        // Data is free text
    Other           // Data is only meaningful to the caller's own consumer
};

/**
 * @brief Name of a progress type, or "" for an unknown value
 */
[[nodiscard]] const char* to_string(ProgressType type) noexcept;

/**
 * @brief Error value carried by an Error envelope
 */
class Error {
public:
    explicit Error(std::string message)
        : message_(std::move(message)) {}

    static Error from_exception(const std::exception& e) {
        return Error(e.what());
    }

    [[nodiscard]] const std::string& message() const noexcept { return message_; }
    [[nodiscard]] const char* what() const noexcept { return message_.c_str(); }

    friend bool operator==(const Error& a, const Error& b) noexcept {
        return a.message_ == b.message_;
    }
    friend bool operator!=(const Error& a, const Error& b) noexcept {
        return !(a == b);
    }

private:
    std::string message_;
};

std::ostream& operator<<(std::ostream& os, const Error& error);

using ProgressData = std::variant<
    std::monostate,      // Empty payload
    Error,
    std::int64_t,        // Update / Estimate
    std::string,         // Message
    std::any             // Opaque payload
>;

namespace detail {

template<typename... Args>
std::string concat(const Args&... args) {
    std::ostringstream oss;
    (oss << ... << args);
    return oss.str();
}

} // namespace detail

/**
 * @brief A tagged progress report
 *
 * Workers send these over the progress channel. Use the static factories
 * for the well-known kinds; the two-argument constructor accepts any tag,
 * including ones this library does not know about.
 */
class Progress {
public:
    Progress() = default;

    Progress(ProgressType type, ProgressData data)
        : type_(type)
        , data_(std::move(data)) {}

    /**
     * @brief Error envelope; the arguments are streamed into the message
     */
    template<typename... Args>
    static Progress error(const Args&... args) {
        return Progress(ProgressType::Error, Error(detail::concat(args...)));
    }

    static Progress error(Error err) {
        return Progress(ProgressType::Error, std::move(err));
    }

    /**
     * @brief Message envelope; the arguments are streamed into the text
     */
    template<typename... Args>
    static Progress message(const Args&... args) {
        return Progress(ProgressType::Message, detail::concat(args...));
    }

    static Progress update(std::int64_t delta) {
        return Progress(ProgressType::Update, delta);
    }

    static Progress estimate(std::int64_t estimate) {
        return Progress(ProgressType::Estimate, estimate);
    }

    static Progress other(std::any payload) {
        return Progress(ProgressType::Other, std::move(payload));
    }

    [[nodiscard]] ProgressType type() const noexcept { return type_; }
    [[nodiscard]] const ProgressData& data() const noexcept { return data_; }

    template<typename T>
    [[nodiscard]] bool holds() const noexcept {
        return std::holds_alternative<T>(data_);
    }

    /**
     * @brief Get payload as specific type (throws if wrong type)
     */
    template<typename T>
    [[nodiscard]] const T& get() const {
        return std::get<T>(data_);
    }

    /**
     * @brief Get payload as specific type (returns nullptr if wrong type)
     */
    template<typename T>
    [[nodiscard]] const T* get_if() const noexcept {
        return std::get_if<T>(&data_);
    }

    /**
     * @brief The carried error for an Error envelope, nullopt otherwise
     *
     * An Error envelope whose payload is not an Error yields one built from
     * the payload text.
     */
    [[nodiscard]] std::optional<Error> as_error() const;

    /**
     * @brief "<TypeName>: <payload>"
     */
    [[nodiscard]] std::string to_string() const;

    /**
     * @brief Payload text alone
     */
    [[nodiscard]] std::string payload_string() const;

private:
    ProgressType type_{ProgressType::Other};
    ProgressData data_;
};

std::ostream& operator<<(std::ostream& os, const Progress& progress);

using ProgressChannel = Channel<Progress>;

/**
 * @brief Write-only handle onto a progress channel
 *
 * Handed to each worker invocation. It does not outlive the invocation.
 */
class ProgressWriter {
public:
    explicit ProgressWriter(std::shared_ptr<ProgressChannel> channel)
        : channel_(std::move(channel)) {}

    /**
     * @brief Send an envelope, blocking until the channel accepts it
     * @return false if the channel has been closed
     */
    bool emit(Progress progress) {
        return channel_->push(std::move(progress));
    }

    /**
     * @brief Send without blocking
     * @return false if the channel is full, closed or nobody is receiving
     */
    bool try_emit(Progress progress) {
        return channel_->try_push(std::move(progress));
    }

private:
    std::shared_ptr<ProgressChannel> channel_;
};

} // namespace jobrack
