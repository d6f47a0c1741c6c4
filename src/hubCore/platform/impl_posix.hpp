#pragma once

#include "platform_base.hpp"

#include <pthread.h>
#include <sys/random.h>
#include <time.h>
#include <unistd.h>
#include <cstddef>

namespace hubCore::platform::impl_posix {

struct critical_section {
    mutable pthread_mutex_t mtx = PTHREAD_MUTEX_INITIALIZER;
    void enter() const noexcept { (void)pthread_mutex_lock(&mtx); }
    void exit() const noexcept { (void)pthread_mutex_unlock(&mtx); }
};

inline timestamp_t get_system_time_us() noexcept {
    timespec ts{};
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return static_cast<timestamp_t>(ts.tv_sec) * 1000000ULL + static_cast<timestamp_t>(ts.tv_nsec / 1000);
}

// getentropy(3) serves at most 256 bytes per call (Linux glibc and macOS)
inline constexpr size_t entropy_chunk_size = 256;

// Kernel CSPRNG, requested in chunks
inline bool fill_random(u8* buffer, size_t length) noexcept {
    size_t filled = 0;
    while (filled < length) {
        const size_t chunk = (length - filled) < entropy_chunk_size ? (length - filled) : entropy_chunk_size;
        if (getentropy(buffer + filled, chunk) != 0) {
            return false;
        }
        filled += chunk;
    }
    return true;
}

/* logging provided centrally by platform.hpp */

inline constexpr platform_info get_platform_info() noexcept { return {"POSIX", true}; }

} // namespace hubCore::platform::impl_posix
