/**
 * @file work.cpp
 * @brief Work parameter coercions
 */

#include "jobrack/core/work.hpp"

#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <string>
#include <type_traits>

namespace jobrack {

namespace {

// "42.000" -> "42"; anything with a non-zero fraction is left alone
std::string trim_zero_decimal(const std::string& s) {
    auto dot = s.find('.');
    if (dot == std::string::npos || dot + 1 == s.size()) {
        return s;
    }
    for (auto i = dot + 1; i < s.size(); i++) {
        if (s[i] != '0') {
            return s;
        }
    }
    return s.substr(0, dot);
}

std::int64_t parse_int64(const std::string& text) {
    auto s = trim_zero_decimal(text);
    if (s.empty()) {
        return 0;
    }

    errno = 0;
    char* end = nullptr;
    long long value = std::strtoll(s.c_str(), &end, 0);
    if (errno != 0 || end != s.c_str() + s.size()) {
        return 0;
    }
    return static_cast<std::int64_t>(value);
}

bool parse_bool(const std::string& s) {
    return s == "1" || s == "t" || s == "T" ||
           s == "TRUE" || s == "true" || s == "True";
}

std::string format_double(double value) {
    // Plain decimal digits, never an exponent; DBL_MAX needs 309 of them
    char buf[512];
    auto result = std::to_chars(buf, buf + sizeof(buf), value, std::chars_format::fixed);
    if (result.ec != std::errc{}) {
        return {};
    }
    return std::string(buf, result.ptr);
}

} // namespace

std::string to_string(const Value& value) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return {};
        } else if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            return format_double(v);
        } else {
            return v;
        }
    }, value);
}

bool to_bool(const Value& value) noexcept {
    return std::visit([](const auto& v) -> bool {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return false;
        } else if constexpr (std::is_same_v<T, bool>) {
            return v;
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
            return v != 0;
        } else if constexpr (std::is_same_v<T, double>) {
            return v != 0.0;
        } else {
            return parse_bool(v);
        }
    }, value);
}

std::int64_t to_int64(const Value& value) {
    return std::visit([](const auto& v) -> std::int64_t {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return 0;
        } else if constexpr (std::is_same_v<T, bool>) {
            return v ? 1 : 0;
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
            return v;
        } else if constexpr (std::is_same_v<T, double>) {
            if (!std::isfinite(v) ||
                v >= static_cast<double>(std::numeric_limits<std::int64_t>::max()) ||
                v < static_cast<double>(std::numeric_limits<std::int64_t>::min())) {
                return 0;
            }
            return static_cast<std::int64_t>(v);
        } else {
            return parse_int64(v);
        }
    }, value);
}

const Value* Work::find(const std::string& key) const {
    auto it = params_.find(key);
    return it != params_.end() ? &it->second : nullptr;
}

std::optional<Value> Work::get(const std::string& key) const {
    if (const auto* value = find(key)) {
        return *value;
    }
    return std::nullopt;
}

std::string Work::get_string(const std::string& key) const {
    const auto* value = find(key);
    return value ? to_string(*value) : std::string{};
}

bool Work::get_bool(const std::string& key) const {
    const auto* value = find(key);
    return value && to_bool(*value);
}

int Work::get_int(const std::string& key) const {
    const auto* value = find(key);
    if (!value) {
        return 0;
    }
    auto wide = to_int64(*value);
    if (wide > std::numeric_limits<int>::max() || wide < std::numeric_limits<int>::min()) {
        return 0;
    }
    return static_cast<int>(wide);
}

} // namespace jobrack
