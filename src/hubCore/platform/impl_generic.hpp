#pragma once

#include "platform_base.hpp"

#include <cstddef>
#include <exception>
#include <random>

namespace hubCore::platform::impl_generic {

struct critical_section {
    void enter() const noexcept {}
    void exit() const noexcept {}
};

inline timestamp_t get_system_time_us() noexcept {
    static timestamp_t counter = 0;
    return ++counter; // monotonic stub
}

// Per-thread engine seeded once from std::random_device, which may throw
// when no device is available
inline bool fill_random(u8* buffer, size_t length) noexcept {
    try {
        thread_local std::mt19937_64 engine{
            (static_cast<u64>(std::random_device{}()) << 32U) ^ static_cast<u64>(std::random_device{}())};
        size_t i = 0;
        while (i < length) {
            u64 word = engine();
            for (size_t b = 0; b < sizeof(word) && i < length; ++b, ++i) {
                buffer[i] = static_cast<u8>(word & 0xFFU);
                word >>= 8U;
            }
        }
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

/* logging provided centrally by platform.hpp */

inline constexpr platform_info get_platform_info() noexcept { return {"Generic", false}; }

} // namespace hubCore::platform::impl_generic
