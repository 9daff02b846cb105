#pragma once

/**
 * @file work.hpp
 * @brief Immutable parameter bag handed to a worker
 */

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>

namespace jobrack {

/**
 * @brief Dynamically typed parameter value
 *
 * std::monostate is the "nil" value.
 */
using Value = std::variant<
    std::monostate,      // Nil
    bool,
    std::int64_t,        // Integer
    double,              // Floating point
    std::string
>;

using Params = std::unordered_map<std::string, Value>;

/**
 * @brief Best-effort coercions used by the Work getters
 *
 * None of these report failures. A value that cannot be coerced yields the zero
 * value of the requested type.
 */
[[nodiscard]] std::string to_string(const Value& value);
[[nodiscard]] bool to_bool(const Value& value) noexcept;
[[nodiscard]] std::int64_t to_int64(const Value& value);

/**
 * @brief A unit of work: named parameters for one worker invocation
 *
 * Work is created once by the caller and never modified afterwards. A
 * worker should expect every parameter it needs to be present, but a
 * missing key is not an error: getters fall back to zero values.
 */
class Work {
public:
    Work() = default;

    explicit Work(Params params)
        : params_(std::move(params)) {}

    /**
     * @brief Raw value for @p key, or nullopt if the key is missing
     */
    [[nodiscard]] std::optional<Value> get(const std::string& key) const;

    [[nodiscard]] std::string get_string(const std::string& key) const;
    [[nodiscard]] bool get_bool(const std::string& key) const;
    [[nodiscard]] int get_int(const std::string& key) const;

    [[nodiscard]] bool contains(const std::string& key) const {
        return params_.find(key) != params_.end();
    }

    [[nodiscard]] std::size_t size() const noexcept { return params_.size(); }
    [[nodiscard]] bool empty() const noexcept { return params_.empty(); }

private:
    [[nodiscard]] const Value* find(const std::string& key) const;

    Params params_;
};

} // namespace jobrack
