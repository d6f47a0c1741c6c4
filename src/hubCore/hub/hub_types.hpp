#pragma once

#include <type_traits>
#include <utility>

#include "../core/config.hpp"
#include "../core/types.hpp"
#include <etl/monostate.h>
#include <etl/type_traits.h>

namespace hubCore::hub {

// Event name storage (fixed capacity, no allocation)
using event_name_t = etl::string<config::max_event_name_length>;

// Payload type of events that never carry data
using no_data = etl::monostate;

// Destination channels understood by the hub. Envelopes never interpret them.
enum class hub_channel : u8 {
    auth      = 0,
    storage   = 1,
    api       = 2,
    analytics = 3,
    datastore = 4,
    hub       = 5,
    custom    = 6,
};

constexpr const char* to_string(hub_channel channel) noexcept {
    switch (channel) {
        case hub_channel::auth:      return "auth";
        case hub_channel::storage:   return "storage";
        case hub_channel::api:       return "api";
        case hub_channel::analytics: return "analytics";
        case hub_channel::datastore: return "datastore";
        case hub_channel::hub:       return "hub";
        case hub_channel::custom:    return "custom";
    }
    return nullptr;
}

namespace detail {

// An enumerated event tag: an enum with `const char* to_string(E)` reachable by ADL
template<typename E, typename = void>
struct has_canonical_name : etl::false_type {};

template<typename E>
struct has_canonical_name<E, std::void_t<decltype(to_string(std::declval<const E&>()))>>
    : etl::integral_constant<bool,
          etl::is_enum<E>::value &&
          std::is_convertible<decltype(to_string(std::declval<const E&>())), const char*>::value> {};

template<typename E>
inline const char* canonical_name(E enumerated) noexcept {
    return to_string(enumerated);
}

} // namespace detail

template<typename E>
inline constexpr bool is_event_tag_v = detail::has_canonical_name<E>::value;

} // namespace hubCore::hub
