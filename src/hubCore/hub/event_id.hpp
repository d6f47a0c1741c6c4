#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>

#include "../core/config.hpp"
#include "../core/types.hpp"
#include "../error/error_handler.hpp"
#include "../error/result.hpp"
#include "../platform/platform.hpp"
#include <etl/array.h>
#include <etl/fnv_1.h>

namespace hubCore::hub {

/**
 * @brief 128-bit random (version 4) event identifier
 *
 * Generated per envelope from the platform entropy source. No counter or
 * registry is shared between generators, so concurrent calls need no locking.
 */
class event_id {
public:
    using bytes_t = etl::array<u8, config::event_id_size>;
    using string_t = etl::string<config::event_id_string_length>;

    constexpr event_id() noexcept : bytes_{} {}

    explicit event_id(const bytes_t& bytes) noexcept : bytes_(bytes) {}

    /**
     * @brief Draw a fresh RFC 4122 version 4 id
     *
     * Never fails. If the platform entropy source errors out the failure is
     * reported as critical and a per-thread fallback generator is used.
     */
    static event_id generate() noexcept {
        bytes_t bytes{};
        if (!platform::fill_random(bytes.data(), bytes.size())) {
            error::report_error(error::error_handler::make_context(
                error::error_event::entropy_failure, error::error_severity::critical,
                error_code::entropy_unavailable));
            fill_fallback(bytes);
        }
        bytes[6] = static_cast<u8>((bytes[6] & 0x0FU) | 0x40U);  // version 4
        bytes[8] = static_cast<u8>((bytes[8] & 0x3FU) | 0x80U);  // variant 10xx
        return event_id(bytes);
    }

    static constexpr event_id nil() noexcept { return event_id(); }

    /**
     * @brief Parse the canonical 8-4-4-4-12 form, either hex case
     */
    static result<event_id, error_code> parse(string_view text) noexcept {
        if (text.size() != config::event_id_string_length) {
            return result<event_id, error_code>(error_code::invalid_parameter);
        }
        bytes_t bytes{};
        size_t out = 0;
        for (size_t i = 0; i < text.size();) {
            if (is_hyphen_position(i)) {
                if (text[i] != '-') { return result<event_id, error_code>(error_code::invalid_parameter); }
                ++i;
                continue;
            }
            const int high = hex_value(text[i]);
            const int low = hex_value(text[i + 1]);
            if (high < 0 || low < 0) {
                return result<event_id, error_code>(error_code::invalid_parameter);
            }
            bytes[out++] = static_cast<u8>((high << 4) | low);
            i += 2;
        }
        return result<event_id, error_code>(event_id(bytes));
    }

    static result<event_id, error_code> parse(const char* text) noexcept {
        if (text == nullptr) {
            return result<event_id, error_code>(error_code::invalid_parameter);
        }
        return parse(string_view(text, std::strlen(text)));
    }

    [[nodiscard]] bool is_nil() const noexcept {
        for (const u8 byte : bytes_) {
            if (byte != 0U) { return false; }
        }
        return true;
    }

    [[nodiscard]] u8 version() const noexcept { return static_cast<u8>(bytes_[6] >> 4U); }

    // Top two bits of octet 8; 0b10 for RFC 4122 ids
    [[nodiscard]] u8 variant_bits() const noexcept { return static_cast<u8>(bytes_[8] >> 6U); }

    const bytes_t& bytes() const noexcept { return bytes_; }

    /**
     * @brief Canonical lowercase textual form
     */
    string_t to_string() const noexcept {
        static constexpr char digits[] = "0123456789abcdef";
        string_t text;
        for (size_t i = 0; i < bytes_.size(); ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) { text.push_back('-'); }
            text.push_back(digits[(bytes_[i] >> 4U) & 0x0FU]);
            text.push_back(digits[bytes_[i] & 0x0FU]);
        }
        return text;
    }

    [[nodiscard]] size_t hash_code() const noexcept {
        etl::fnv_1a_64 hasher(bytes_.begin(), bytes_.end());
        return static_cast<size_t>(hasher.value());
    }

    bool operator==(const event_id& other) const noexcept { return bytes_ == other.bytes_; }
    bool operator!=(const event_id& other) const noexcept { return !(*this == other); }
    bool operator<(const event_id& other) const noexcept {
        for (size_t i = 0; i < bytes_.size(); ++i) {
            if (bytes_[i] != other.bytes_[i]) { return bytes_[i] < other.bytes_[i]; }
        }
        return false;
    }

private:
    bytes_t bytes_;

    static constexpr bool is_hyphen_position(size_t pos) noexcept {
        return pos == 8 || pos == 13 || pos == 18 || pos == 23;
    }

    static constexpr int hex_value(char c) noexcept {
        if (c >= '0' && c <= '9') { return c - '0'; }
        if (c >= 'a' && c <= 'f') { return c - 'a' + 10; }
        if (c >= 'A' && c <= 'F') { return c - 'A' + 10; }
        return -1;
    }

    // splitmix64 seeded from the clock and this thread's stack/TLS addresses
    static void fill_fallback(bytes_t& bytes) noexcept {
        thread_local u64 state = 0;
        if (state == 0) {
            const u64 local_marker = 0;
            state = platform::get_system_time_us()
                    ^ (static_cast<u64>(reinterpret_cast<std::uintptr_t>(&local_marker)) << 16U)
                    ^ static_cast<u64>(reinterpret_cast<std::uintptr_t>(&state));
        }
        for (size_t i = 0; i < bytes.size(); i += 8) {
            state += 0x9E3779B97F4A7C15ULL;
            u64 word = state;
            word = (word ^ (word >> 30U)) * 0xBF58476D1CE4E5B9ULL;
            word = (word ^ (word >> 27U)) * 0x94D049BB133111EBULL;
            word ^= word >> 31U;
            for (size_t b = 0; b < 8; ++b) {
                bytes[i + b] = static_cast<u8>(word >> (8U * b));
            }
        }
    }
};

} // namespace hubCore::hub
