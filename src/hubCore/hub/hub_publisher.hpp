#pragma once

#include <type_traits>
#include <utility>

#include "hub_types.hpp"
#include <etl/delegate.h>
#include <etl/type_traits.h>

namespace hubCore::hub {

template<typename T>
class hub_event;

// Bound publish entry point of a hub, e.g.
//   publish_fn<T>::create<my_hub, &my_hub::publish>(hub_instance)
template<typename T>
using publish_fn = etl::delegate<void(hub_channel, const hub_event<T>&)>;

// True when `hub.publish(channel, event)` is well-formed
template<typename Hub, typename Channel, typename Event, typename = void>
struct is_hub_publisher : etl::false_type {};

template<typename Hub, typename Channel, typename Event>
struct is_hub_publisher<Hub, Channel, Event,
    std::void_t<decltype(std::declval<Hub&>().publish(std::declval<const Channel&>(), std::declval<const Event&>()))>>
    : etl::true_type {};

} // namespace hubCore::hub
