#pragma once

#include <cstddef>
#include <cstring>
#include <functional>

#include "../core/config.hpp"
#include "../core/types.hpp"
#include "../error/error_handler.hpp"
#include "../error/result.hpp"
#include "event_id.hpp"
#include "hub_publisher.hpp"
#include "hub_types.hpp"
#include "payload_traits.hpp"
#include <etl/hash.h>
#include <etl/optional.h>
#include <etl/string.h>
#include <etl/type_traits.h>

namespace hubCore::hub {

/**
 * @brief Immutable envelope for everything published on the hub
 *
 * Holds a non-empty name (category tag such as "signIn" or
 * "Storage.downloadFile"), an optional payload of type T and an id drawn at
 * construction. Instances are only made through the create() factories, which
 * validate their arguments and return a result instead of throwing.
 *
 * Equality covers name, data and id. Since every construction draws a new id,
 * two separately created events never compare equal.
 *
 * @tparam T Payload type, no_data for events that never carry one
 */
template<typename T = no_data>
class hub_event {
public:
    using data_type = T;
    using string_t = etl::string<config::max_event_string_length>;
    using result_t = result<hub_event, error_code>;

    /**
     * @brief Event with a name and no data
     */
    static result_t create(const char* name) noexcept {
        return build(name, length_of(name), etl::optional<T>(), error::error_event::missing_event_name);
    }

    static result_t create(string_view name) noexcept {
        return build(name.data(), name.size(), etl::optional<T>(), error::error_event::missing_event_name);
    }

    static result_t create(const etl::istring& name) noexcept {
        return build(name.data(), name.size(), etl::optional<T>(), error::error_event::missing_event_name);
    }

    /**
     * @brief Event named by the canonical string of an enumerated value, no data
     */
    template<typename E, typename = etl::enable_if_t<etl::is_enum<E>::value>>
    static result_t create(E enumerated) noexcept {
        static_assert(is_event_tag_v<E>, "enum needs a `const char* to_string(E)` visible by ADL");
        const char* name = detail::canonical_name(enumerated);
        return build(name, length_of(name), etl::optional<T>(), error::error_event::missing_enum_name);
    }

    /**
     * @brief Event with a name and a payload
     *
     * Fails with invalid_parameter when the payload is a null pointer or an
     * empty optional.
     */
    static result_t create(const char* name, const T& data) noexcept {
        return build_with_data(name, length_of(name), data, error::error_event::missing_event_name);
    }

    static result_t create(string_view name, const T& data) noexcept {
        return build_with_data(name.data(), name.size(), data, error::error_event::missing_event_name);
    }

    static result_t create(const etl::istring& name, const T& data) noexcept {
        return build_with_data(name.data(), name.size(), data, error::error_event::missing_event_name);
    }

    template<typename E, typename = etl::enable_if_t<etl::is_enum<E>::value>>
    static result_t create(E enumerated, const T& data) noexcept {
        static_assert(is_event_tag_v<E>, "enum needs a `const char* to_string(E)` visible by ADL");
        const char* name = detail::canonical_name(enumerated);
        return build_with_data(name, length_of(name), data, error::error_event::missing_enum_name);
    }

    const event_name_t& get_name() const noexcept { return name_; }

    // Absent is a normal state, not an error
    const etl::optional<T>& get_data() const noexcept { return data_; }

    const event_id& get_id() const noexcept { return id_; }

    [[nodiscard]] bool has_data() const noexcept { return data_.has_value(); }

    /**
     * @brief Hand this event to a hub
     *
     * Calls hub.publish(channel, *this) exactly once. Whatever the hub does
     * with it, including failing, is up to the hub.
     */
    template<typename Channel, typename Hub,
             typename = etl::enable_if_t<is_hub_publisher<Hub, Channel, hub_event>::value>>
    void publish(const Channel& channel, Hub& hub) const {
        hub.publish(channel, *this);
    }

    /**
     * @brief Hand this event to a bound publish delegate
     * @return not_bound if the delegate has no target
     */
    result<void, error_code> publish(hub_channel channel, const publish_fn<T>& publisher) const noexcept {
        if (!publisher.is_valid()) {
            return error::fail<void>(error::error_event::unbound_publisher, error_code::not_bound);
        }
        publisher(channel, *this);
        return ok();
    }

    bool operator==(const hub_event& other) const noexcept {
        if (this == &other) { return true; }
        return name_ == other.name_
            && detail::payload_equal(data_, other.data_)
            && id_ == other.id_;
    }

    bool operator!=(const hub_event& other) const noexcept { return !(*this == other); }

    // Events carrying a different payload type are never equal
    template<typename U>
    bool operator==(const hub_event<U>&) const noexcept { return false; }

    template<typename U>
    bool operator!=(const hub_event<U>&) const noexcept { return true; }

    /**
     * @brief Equality against any value; false for anything but a hub_event<T>
     */
    template<typename U>
    bool equals(const U& other) const noexcept {
        if constexpr (etl::is_same<U, hub_event>::value) {
            return *this == other;
        } else {
            return false;
        }
    }

    [[nodiscard]] size_t hash_code() const noexcept {
        size_t value = detail::hash_chars(name_.data(), name_.data() + name_.size());
        value = 31U * value + (data_.has_value() ? detail::payload_hash(data_.value()) : 0U);
        value = 31U * value + id_.hash_code();
        return value;
    }

    /**
     * @brief Log/debug form: hub_event{name='signIn', data=none, id=...}
     *
     * Truncated at config::max_event_string_length.
     */
    string_t to_string() const noexcept {
        string_t text("hub_event{name='");
        text.append(name_.begin(), name_.end());
        text.append("', data=");
        if (data_.has_value()) {
            detail::append_payload(text, data_.value());
        } else {
            text.append("none");
        }
        text.append(", id=");
        const event_id::string_t id_text = id_.to_string();
        text.append(id_text.begin(), id_text.end());
        text.append("}");
        return text;
    }

private:
    event_name_t name_;
    etl::optional<T> data_;
    event_id id_;

    hub_event(const char* name, size_t length, etl::optional<T>&& data) noexcept
        : name_(name, length), data_(etl::move(data)), id_(event_id::generate()) {}

    static size_t length_of(const char* text) noexcept {
        return text != nullptr ? std::strlen(text) : 0U;
    }

    static result_t build(const char* name, size_t length, etl::optional<T>&& data,
                          error::error_event missing) noexcept {
        if (name == nullptr || length == 0U) {
            return error::fail<hub_event>(missing, error_code::invalid_parameter);
        }
        if (length > config::max_event_name_length) {
            return error::fail<hub_event>(error::error_event::event_name_too_long,
                                          error_code::capacity_exceeded, static_cast<u32>(length));
        }
        return result_t(hub_event(name, length, etl::move(data)));
    }

    static result_t build_with_data(const char* name, size_t length, const T& data,
                                    error::error_event missing) noexcept {
        static_assert(!etl::is_same<T, no_data>::value, "no_data events are created without a payload");
        if (name == nullptr || length == 0U) {
            return error::fail<hub_event>(missing, error_code::invalid_parameter);
        }
        if (detail::is_absent(data)) {
            return error::fail<hub_event>(error::error_event::missing_event_data, error_code::invalid_parameter);
        }
        etl::optional<T> payload;
        payload.emplace(data);
        return build(name, length, etl::move(payload), missing);
    }
};

/**
 * @brief Deducing shorthand for hub_event<T>::create(name, data)
 */
template<typename T>
inline result<hub_event<T>, error_code> make_event(const char* name, const T& data) noexcept {
    return hub_event<T>::create(name, data);
}

template<typename E, typename T, typename = etl::enable_if_t<etl::is_enum<E>::value>>
inline result<hub_event<T>, error_code> make_event(E enumerated, const T& data) noexcept {
    return hub_event<T>::create(enumerated, data);
}

} // namespace hubCore::hub

namespace std {
template<typename T>
struct hash<hubCore::hub::hub_event<T>> {
    size_t operator()(const hubCore::hub::hub_event<T>& event) const noexcept { return event.hash_code(); }
};
} // namespace std

namespace etl {
template<typename T>
struct hash<hubCore::hub::hub_event<T>> {
    size_t operator()(const hubCore::hub::hub_event<T>& event) const noexcept { return event.hash_code(); }
};
} // namespace etl
