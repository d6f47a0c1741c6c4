#pragma once

#include <type_traits>
#include <utility>

#include "../error/result.hpp"
#include "hub_event.hpp"
#include <etl/type_traits.h>

// Payload types that know their own event name implement
//   result<hub_event<Self>> to_hub_event() const;
// Deriving from hub_data<Self> is optional and only adds publish_to().

namespace hubCore::hub {

template<typename T, typename = void>
struct is_hub_data : etl::false_type {};

template<typename T>
struct is_hub_data<T, std::void_t<decltype(std::declval<const T&>().to_hub_event())>>
    : etl::is_same<decltype(std::declval<const T&>().to_hub_event()), result<hub_event<T>, error_code>> {};

template<typename T>
inline constexpr bool is_hub_data_v = is_hub_data<T>::value;

/**
 * @brief Tag base for self-describing payloads (no virtuals, no RTTI)
 */
template<typename Derived>
struct hub_data {
    /**
     * @brief Wrap *this with Derived::to_hub_event() and publish it
     * @return the construction error if the event could not be built
     */
    template<typename Channel, typename Hub>
    result<void, error_code> publish_to(const Channel& channel, Hub& hub) const {
        static_assert(is_hub_data_v<Derived>, "Derived must implement to_hub_event()");
        auto event = static_cast<const Derived&>(*this).to_hub_event();
        if (event.is_error()) {
            return result<void, error_code>(event.error());
        }
        event.value().publish(channel, hub);
        return ok();
    }

protected:
    hub_data() = default;
};

/**
 * @brief Build the event a self-describing payload chose for itself
 */
template<typename T>
inline result<hub_event<T>, error_code> make_hub_event(const T& payload) {
    static_assert(is_hub_data_v<T>, "payload must implement to_hub_event()");
    return payload.to_hub_event();
}

} // namespace hubCore::hub
