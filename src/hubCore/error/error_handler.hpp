#pragma once

#include "../core/config.hpp"
#include "../core/types.hpp"
#include "../platform/platform.hpp"
#include "result.hpp"

namespace hubCore {
namespace error {

/**
 * @brief Error event types for callbacks
 */
enum class error_event : u8 {
    missing_event_name,     // null or empty name
    missing_enum_name,      // enumerated value has no canonical string
    event_name_too_long,
    missing_event_data,     // data-bearing factory got an absent payload
    unbound_publisher,
    entropy_failure
};

constexpr const char* to_string(error_event event) noexcept {
    switch (event) {
        case error_event::missing_event_name:  return "missing_event_name";
        case error_event::missing_enum_name:   return "missing_enum_name";
        case error_event::event_name_too_long: return "event_name_too_long";
        case error_event::missing_event_data:  return "missing_event_data";
        case error_event::unbound_publisher:   return "unbound_publisher";
        case error_event::entropy_failure:     return "entropy_failure";
    }
    return "unknown";
}

/**
 * @brief Error severity levels
 */
enum class error_severity : u8 {
    info,       // Informational, no action needed
    warning,    // Warning, may need attention
    error,      // Error, caller must fix the call site
    critical,   // Critical, a platform guarantee was lost
    fatal
};

/**
 * @brief Error context information
 */
struct error_context {
    error_event event{error_event::missing_event_name};
    error_severity severity{error_severity::error};
    error_code code{error_code::invalid_parameter};
    timestamp_t timestamp{0};
    u32 detail{0};  // Event-specific value, e.g. the rejected name length

    error_context() noexcept = default;
};

/**
 * @brief Error handler callback type
 */
using error_handler_fn = void(*)(const error_context& ctx) noexcept;

/**
 * @brief Global error sink for the envelope layer
 *
 * Factories report every rejected construction here before returning the
 * error to the caller. Safe to call from concurrent constructions.
 */
class error_handler {
private:
    mutable platform::critical_section lock_;
    error_handler_fn callback_{nullptr};
    u32 error_count_{0};
    error_context last_error_;

public:
    error_handler() noexcept = default;
    error_handler(const error_handler&) = delete;
    error_handler& operator=(const error_handler&) = delete;

    /**
     * @brief Set error handler callback, nullptr to clear
     */
    void set_callback(error_handler_fn callback) noexcept {
        lock_.enter();
        callback_ = callback;
        lock_.exit();
    }

    /**
     * @brief Report an error
     */
    void report_error(const error_context& ctx) noexcept {
        lock_.enter();
        error_count_++;
        last_error_ = ctx;
        error_handler_fn callback = callback_;
        lock_.exit();

        if (callback != nullptr) {
            callback(ctx);
        }

        if (static_cast<u8>(ctx.severity) >= config::error_log_severity) {
            platform::logs("hubCore error: %s", to_string(ctx.event));
            platform::logs("hubCore error: code=%s", hubCore::to_string(ctx.code));
            platform::logf("hubCore error: severity=%u detail=%u",
                           static_cast<u32>(ctx.severity), ctx.detail);
        }
    }

    /**
     * @brief Create error context helper
     */
    static error_context make_context(
        error_event event,
        error_severity severity,
        error_code code,
        u32 detail = 0
    ) noexcept {
        error_context ctx;
        ctx.event = event;
        ctx.severity = severity;
        ctx.code = code;
        ctx.detail = detail;
        ctx.timestamp = platform::get_system_time_us();
        return ctx;
    }

    u32 get_error_count() const noexcept {
        lock_.enter();
        const u32 count = error_count_;
        lock_.exit();
        return count;
    }

    error_context get_last_error() const noexcept {
        lock_.enter();
        const error_context last = last_error_;
        lock_.exit();
        return last;
    }

    void reset() noexcept {
        lock_.enter();
        error_count_ = 0;
        last_error_ = error_context{};
        lock_.exit();
    }
};

/**
 * @brief Global error handler instance
 */
inline error_handler& get_global_error_handler() noexcept {
    static error_handler handler;
    return handler;
}

/**
 * @brief Convenience function to report errors
 */
inline void report_error(const error_context& ctx) noexcept {
    get_global_error_handler().report_error(ctx);
}

/**
 * @brief Report and build the failed result in one step
 */
template<typename T>
inline result<T, error_code> fail(error_event event, error_code code, u32 detail = 0) noexcept {
    report_error(error_handler::make_context(event, error_severity::error, code, detail));
    return result<T, error_code>(code);
}

} // namespace error
} // namespace hubCore
