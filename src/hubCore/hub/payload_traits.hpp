#pragma once

#include <cstddef>
#include <type_traits>
#include <utility>

#include "../core/types.hpp"
#include "hub_types.hpp"
#include <etl/fnv_1.h>
#include <etl/hash.h>
#include <etl/optional.h>
#include <etl/string.h>
#include <etl/to_string.h>
#include <etl/type_traits.h>

// Customization points for payload types, all found by ADL:
//   void format_payload(etl::istring& out, const T& value)  -> string form
//   size_t hash_value(const T& value)                         -> hash
//   const char* to_string(E value)                            -> enum canonical name

namespace hubCore::hub::detail {

template<typename T, typename = void>
struct has_format_payload : etl::false_type {};

template<typename T>
struct has_format_payload<T, std::void_t<decltype(format_payload(std::declval<etl::istring&>(), std::declval<const T&>()))>>
    : etl::true_type {};

template<typename T, typename = void>
struct has_hash_value : etl::false_type {};

template<typename T>
struct has_hash_value<T, std::void_t<decltype(hash_value(std::declval<const T&>()))>>
    : etl::true_type {};

template<typename T>
inline constexpr bool is_etl_string_v = etl::is_base_of<etl::istring, T>::value;

// Payload absence. Plain values are always present; nullable payload types are
// checked at runtime.
template<typename T>
constexpr bool is_absent(const T&) noexcept { return false; }

template<typename T>
constexpr bool is_absent(T* const& pointer) noexcept { return pointer == nullptr; }

template<typename T>
bool is_absent(const etl::optional<T>& value) noexcept { return !value.has_value(); }

template<typename T>
bool payload_equal(const etl::optional<T>& lhs, const etl::optional<T>& rhs) noexcept {
    if (lhs.has_value() != rhs.has_value()) { return false; }
    if (!lhs.has_value()) { return true; }
    if constexpr (etl::is_same<T, no_data>::value) {
        return true;
    } else if constexpr (etl::is_floating_point<T>::value) {
        // NaN equals NaN so an event stays equal to its own copy
        const T& a = lhs.value();
        const T& b = rhs.value();
        return a == b || (a != a && b != b);
    } else {
        return lhs.value() == rhs.value();
    }
}

inline size_t hash_chars(const char* begin, const char* end) noexcept {
    etl::fnv_1a_64 hasher(begin, end);
    return static_cast<size_t>(hasher.value());
}

template<typename T>
size_t payload_hash(const T& value) noexcept {
    if constexpr (has_hash_value<T>::value) {
        return static_cast<size_t>(hash_value(value));
    } else if constexpr (is_etl_string_v<T>) {
        return hash_chars(value.data(), value.data() + value.size());
    } else if constexpr (etl::is_floating_point<T>::value) {
        // 0.0 and -0.0 compare equal, as do all NaNs
        if (value != value) { return 0x7FC00000U; }
        return value == T(0) ? 0U : etl::hash<T>()(value);
    } else if constexpr (etl::is_arithmetic<T>::value || etl::is_pointer<T>::value) {
        return etl::hash<T>()(value);
    } else if constexpr (etl::is_enum<T>::value) {
        using underlying = std::underlying_type_t<T>;
        return etl::hash<underlying>()(static_cast<underlying>(value));
    } else {
        // No hash known for the payload: equal payloads still hash equal
        return 0x2545F491U;
    }
}

template<typename T>
void append_payload(etl::istring& out, const T& value) noexcept {
    if constexpr (has_format_payload<T>::value) {
        format_payload(out, value);
    } else if constexpr (is_etl_string_v<T>) {
        out.append(value.begin(), value.end());
    } else if constexpr (etl::is_same<T, bool>::value) {
        out.append(value ? "true" : "false");
    } else if constexpr (etl::is_arithmetic<T>::value) {
        etl::to_string(value, out, true);
    } else if constexpr (has_canonical_name<T>::value) {
        const char* name = canonical_name(value);
        out.append(name != nullptr ? name : "null");
    } else {
        out.append("{...}");
    }
}

} // namespace hubCore::hub::detail
