#pragma once

#include <cstdio>

// Auto-detect platform if the build system did not provide one
#if !defined(HUBCORE_PLATFORM_POSIX) && \
    !defined(HUBCORE_PLATFORM_GENERIC)
  #if defined(__unix__) || defined(__APPLE__)
    #define HUBCORE_PLATFORM_POSIX
  #else
    #define HUBCORE_PLATFORM_GENERIC
  #endif
#endif

#include "platform_base.hpp"

#if defined(HUBCORE_PLATFORM_POSIX)
#  include "impl_posix.hpp"
   namespace hubCore::platform { namespace impl = hubCore::platform::impl_posix; }
#else
#  include "impl_generic.hpp"
   namespace hubCore::platform { namespace impl = hubCore::platform::impl_generic; }
#endif

namespace hubCore::platform {

// Re-export primitives and functions from selected impl
using critical_section = impl::critical_section;

inline timestamp_t get_system_time_us() noexcept { return impl::get_system_time_us(); }

// Builds with this set to 1 see every entropy request fail, which drives
// id generation through its fallback generator
#ifndef HUBCORE_FORCE_ENTROPY_FAILURE
#define HUBCORE_FORCE_ENTROPY_FAILURE 0 /* NOLINT(cppcoreguidelines-macro-usage) */
#endif

// Fills buffer with random bytes; false when the entropy source failed
[[nodiscard]] inline bool fill_random(u8* buffer, size_t length) noexcept {
#if HUBCORE_FORCE_ENTROPY_FAILURE
    (void)buffer; (void)length;
    return false;
#else
    return impl::fill_random(buffer, length);
#endif
}

constexpr platform_info get_platform_info() noexcept { return impl::get_platform_info(); }

// Centralized logging
#ifndef HUBCORE_ENABLE_LOGGING
#define HUBCORE_ENABLE_LOGGING 1 /* NOLINT(cppcoreguidelines-macro-usage) */
#endif

namespace detail {
inline void log_sink(const char* msg) noexcept {
#if defined(HUBCORE_PLATFORM_POSIX)
    if (msg) { std::puts(msg); }
#else
    (void)msg;
#endif
}
} // namespace detail

inline void log(const char* message) noexcept {
#if HUBCORE_ENABLE_LOGGING
    detail::log_sink(message);
#else
    (void)message;
#endif
}

inline void logs(const char* fmt, const char* arg1) noexcept {
#if HUBCORE_ENABLE_LOGGING
    char buffer[256]; std::snprintf(buffer, sizeof(buffer), fmt, arg1 != nullptr ? arg1 : "(null)"); /* NOLINT(cppcoreguidelines-pro-type-vararg,hicpp-vararg,cppcoreguidelines-pro-bounds-array-to-pointer-decay) */ log(buffer);
#else
    (void)fmt; (void)arg1;
#endif
}

inline void logf(const char* fmt, u32 arg1) noexcept {
#if HUBCORE_ENABLE_LOGGING
    char buffer[256]; std::snprintf(buffer, sizeof(buffer), fmt, arg1); /* NOLINT(cppcoreguidelines-pro-type-vararg,hicpp-vararg,cppcoreguidelines-pro-bounds-array-to-pointer-decay) */ log(buffer);
#else
    (void)fmt; (void)arg1;
#endif
}
inline void logf(const char* fmt, u32 arg1, u32 arg2) noexcept {
#if HUBCORE_ENABLE_LOGGING
    char buffer[256]; std::snprintf(buffer, sizeof(buffer), fmt, arg1, arg2); /* NOLINT(cppcoreguidelines-pro-type-vararg,hicpp-vararg,cppcoreguidelines-pro-bounds-array-to-pointer-decay) */ log(buffer);
#else
    (void)fmt; (void)arg1; (void)arg2;
#endif
}
inline void logf(const char* fmt, u32 arg1, u32 arg2, u32 arg3) noexcept {
#if HUBCORE_ENABLE_LOGGING
    char buffer[256]; std::snprintf(buffer, sizeof(buffer), fmt, arg1, arg2, arg3); /* NOLINT(cppcoreguidelines-pro-type-vararg,hicpp-vararg,cppcoreguidelines-pro-bounds-array-to-pointer-decay) */ log(buffer);
#else
    (void)fmt; (void)arg1; (void)arg2; (void)arg3;
#endif
}

} // namespace hubCore::platform
