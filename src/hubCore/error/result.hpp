#pragma once

#include <cstdint>

#include <etl/optional.h>
#include <etl/utility.h>

namespace hubCore {

// Error codes surfaced by the envelope layer
enum class error_code : int8_t {
    success = 0,
    invalid_parameter = -1,    // missing name/enumerated value or absent payload
    capacity_exceeded = -2,    // input does not fit a fixed-capacity buffer
    not_bound = -3,            // publish delegate has no target
    entropy_unavailable = -4   // platform random source failed
};

constexpr const char* to_string(error_code code) noexcept {
    switch (code) {
        case error_code::success:             return "success";
        case error_code::invalid_parameter:   return "invalid_parameter";
        case error_code::capacity_exceeded:   return "capacity_exceeded";
        case error_code::not_bound:           return "not_bound";
        case error_code::entropy_unavailable: return "entropy_unavailable";
    }
    return "unknown";
}

// Result type for error handling without exceptions
template<typename T, typename E = error_code>
class result {
private:
    etl::optional<T> value_;
    etl::optional<E> error_;

public:
    explicit result(const T& value) noexcept : value_(value) {}

    explicit result(T&& value) noexcept : value_(etl::move(value)) {}

    explicit result(const E& error) noexcept : error_(error) {}

    [[nodiscard]] bool is_ok() const noexcept { return value_.has_value(); }

    [[nodiscard]] bool is_error() const noexcept { return error_.has_value(); }

    const T& value() const noexcept { return value_.value(); }

    T& value() noexcept { return value_.value(); }

    const E& error() const noexcept { return error_.value(); }

    // Error code, or success when a value is held
    [[nodiscard]] E code() const noexcept {
        return error_.has_value() ? error_.value() : E{};
    }
};

// Specialization for void result type
template<typename E>
class result<void, E> {
private:
    etl::optional<E> error_;

public:
    result() noexcept : error_() {}

    explicit result(const E& error) noexcept : error_(error) {}

    [[nodiscard]] bool is_ok() const noexcept { return !error_.has_value(); }

    [[nodiscard]] bool is_error() const noexcept { return error_.has_value(); }

    const E& error() const noexcept { return error_.value(); }

    [[nodiscard]] E code() const noexcept {
        return error_.has_value() ? error_.value() : E{};
    }
};

// Helper function for creating successful void results
inline result<void, error_code> ok() noexcept {
    return {};
}

// Helper function for creating successful results with a value
template<typename T>
inline result<T, error_code> ok(const T& value) noexcept {
    return result<T, error_code>(value);
}

}  // namespace hubCore
