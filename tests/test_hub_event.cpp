#include "hubCore/hubCore.hpp"
#include <cstring>
#include <limits>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace hubCore;
using namespace hubCore::hub;

int passed = 0, failed = 0;
#define TEST(name) \
    std::cout << "Testing " << name << "... "; \
    try {
#define PASS() \
        std::cout << "PASS" << std::endl; \
        ++passed; \
    } catch (const std::exception& e) { \
        std::cout << "FAIL: " << e.what() << std::endl; \
        ++failed; \
    }
#define ASSERT(cond) if (!(cond)) throw std::runtime_error(#cond)

namespace {

enum class auth_state { signed_in, signed_out, session_expired };

const char* to_string(auth_state state) noexcept {
    switch (state) {
        case auth_state::signed_in:       return "SIGNED_IN";
        case auth_state::signed_out:      return "SIGNED_OUT";
        case auth_state::session_expired: return "SESSION_EXPIRED";
    }
    return nullptr;
}

// Tag whose canonical string is missing
enum class unnamed_tag { nothing };

const char* to_string(unnamed_tag) noexcept { return nullptr; }

struct credentials {
    etl::string<32> username;
    etl::string<32> password;

    credentials(const char* user, const char* pass) : username(user), password(pass) {}

    bool operator==(const credentials& other) const noexcept {
        return username == other.username && password == other.password;
    }
};

void format_payload(etl::istring& out, const credentials& value) {
    out.append("credentials{user=");
    out.append(value.username.begin(), value.username.end());
    out.append("}");
}

using credentials_event = hub_event<credentials>;

// Hub stand-in remembering what it was handed
struct recording_hub {
    int calls = 0;
    hub_channel last_channel{hub_channel::custom};
    const void* last_event = nullptr;

    template<typename Event>
    void publish(hub_channel channel, const Event& event) {
        ++calls;
        last_channel = channel;
        last_event = &event;
    }
};

// Opaque channel token the envelope never looks into
struct topic {
    int number;
};

struct topic_hub {
    int calls = 0;
    int last_topic = -1;

    void publish(const topic& channel, const credentials_event& event) {
        ++calls;
        last_topic = channel.number;
        (void)event;
    }
};

struct delegate_hub {
    int calls = 0;
    hub_channel last_channel{hub_channel::custom};
    const credentials_event* last_event = nullptr;

    void publish(hub_channel channel, const credentials_event& event) {
        ++calls;
        last_channel = channel;
        last_event = &event;
    }
};

static_assert(is_hub_publisher<recording_hub, hub_channel, credentials_event>::value, "templated hub");
static_assert(is_hub_publisher<topic_hub, topic, credentials_event>::value, "opaque channel hub");
static_assert(!is_hub_publisher<topic_hub, hub_channel, credentials_event>::value, "wrong channel type");
static_assert(!is_hub_publisher<int, hub_channel, credentials_event>::value, "no publish member");
static_assert(!is_hub_publisher<publish_fn<credentials>, hub_channel, credentials_event>::value,
              "delegates take the delegate overload");

u32 callback_hits = 0;
error::error_event callback_event = error::error_event::entropy_failure;

void count_errors(const error::error_context& ctx) noexcept {
    ++callback_hits;
    callback_event = ctx.event;
}

std::string text_of(const etl::istring& text) {
    return std::string(text.c_str());
}

} // namespace

void testCreateNameOnly() {
    TEST("create(name) has no data")
        auto created = hub_event<>::create("signIn");
        ASSERT(created.is_ok());
        const auto& event = created.value();
        ASSERT(event.get_name() == "signIn");
        ASSERT(!event.get_data().has_value());
        ASSERT(!event.has_data());
        ASSERT(!event.get_id().is_nil());
        ASSERT(event.get_id().version() == 4);
    PASS()
}

void testCreateNameOnlyTypedPayload() {
    TEST("create(name) on a typed event leaves data absent")
        auto created = credentials_event::create("signOut");
        ASSERT(created.is_ok());
        ASSERT(!created.value().get_data().has_value());
    PASS()
}

void testCreateFromStringView() {
    TEST("create(string_view) and create(istring)")
        const char buffer[] = "Storage.downloadFile-trailing";
        auto from_view = hub_event<>::create(string_view(buffer, 20));
        ASSERT(from_view.is_ok());
        ASSERT(from_view.value().get_name() == "Storage.downloadFile");

        etl::string<16> name("hang_up");
        auto from_string = hub_event<int>::create(name, 7);
        ASSERT(from_string.is_ok());
        ASSERT(from_string.value().get_name() == "hang_up");
        ASSERT(from_string.value().get_data().value() == 7);
    PASS()
}

void testCreateWithData() {
    TEST("create(name, data) keeps the payload")
        credentials creds("alice", "secret");
        auto created = credentials_event::create("signIn", creds);
        ASSERT(created.is_ok());
        const auto& event = created.value();
        ASSERT(event.get_name() == "signIn");
        ASSERT(event.has_data());
        ASSERT(event.get_data().value() == creds);

        auto other = credentials_event::create("signIn", creds);
        ASSERT(other.is_ok());
        ASSERT(other.value().get_id() != event.get_id());
    PASS()
}

void testCreateFromEnum() {
    TEST("create(enum) uses the canonical string")
        auto created = hub_event<>::create(auth_state::signed_in);
        ASSERT(created.is_ok());
        ASSERT(created.value().get_name() == "SIGNED_IN");
        ASSERT(!created.value().has_data());

        auto expired = hub_event<>::create(auth_state::session_expired);
        ASSERT(expired.is_ok());
        ASSERT(expired.value().get_name() == to_string(auth_state::session_expired));
    PASS()
}

void testCreateFromEnumWithData() {
    TEST("create(enum, data)")
        credentials creds("bob", "hunter2");
        auto created = credentials_event::create(auth_state::signed_out, creds);
        ASSERT(created.is_ok());
        ASSERT(created.value().get_name() == "SIGNED_OUT");
        ASSERT(created.value().get_data().value() == creds);

        auto deduced = make_event(auth_state::signed_in, 3);
        ASSERT(deduced.is_ok());
        ASSERT(deduced.value().get_name() == "SIGNED_IN");
        ASSERT(deduced.value().get_data().value() == 3);
    PASS()
}

void testChannelEnumAsName() {
    TEST("hub_channel doubles as an event tag")
        auto created = hub_event<>::create(hub_channel::storage);
        ASSERT(created.is_ok());
        ASSERT(created.value().get_name() == "storage");
    PASS()
}

void testMissingNameFails() {
    TEST("null or empty name is rejected")
        error::get_global_error_handler().reset();
        const char* missing = nullptr;
        auto no_name = hub_event<>::create(missing);
        ASSERT(no_name.is_error());
        ASSERT(no_name.error() == error_code::invalid_parameter);

        auto empty_name = hub_event<>::create("");
        ASSERT(empty_name.is_error());
        ASSERT(empty_name.error() == error_code::invalid_parameter);

        auto empty_view = credentials_event::create(string_view(), credentials("a", "b"));
        ASSERT(empty_view.is_error());
        ASSERT(empty_view.error() == error_code::invalid_parameter);

        ASSERT(error::get_global_error_handler().get_error_count() == 3);
        ASSERT(error::get_global_error_handler().get_last_error().event == error::error_event::missing_event_name);
    PASS()
}

void testMissingEnumNameFails() {
    TEST("enum without canonical string is rejected")
        error::get_global_error_handler().reset();
        auto created = hub_event<>::create(unnamed_tag::nothing);
        ASSERT(created.is_error());
        ASSERT(created.error() == error_code::invalid_parameter);
        ASSERT(error::get_global_error_handler().get_last_error().event == error::error_event::missing_enum_name);

        auto with_data = hub_event<int>::create(unnamed_tag::nothing, 1);
        ASSERT(with_data.is_error());
        ASSERT(with_data.error() == error_code::invalid_parameter);
    PASS()
}

void testAbsentPayloadFails() {
    TEST("absent payload in a data form is rejected")
        error::get_global_error_handler().reset();
        const credentials* no_creds = nullptr;
        auto null_pointer = hub_event<const credentials*>::create("signIn", no_creds);
        ASSERT(null_pointer.is_error());
        ASSERT(null_pointer.error() == error_code::invalid_parameter);
        ASSERT(error::get_global_error_handler().get_last_error().event == error::error_event::missing_event_data);

        credentials creds("carol", "pw");
        auto real_pointer = hub_event<const credentials*>::create("signIn", &creds);
        ASSERT(real_pointer.is_ok());
        ASSERT(real_pointer.value().get_data().value() == &creds);

        auto empty_optional = hub_event<etl::optional<int>>::create("maybe", etl::optional<int>());
        ASSERT(empty_optional.is_error());
        ASSERT(empty_optional.error() == error_code::invalid_parameter);

        auto full_optional = hub_event<etl::optional<int>>::create("maybe", etl::optional<int>(5));
        ASSERT(full_optional.is_ok());
        ASSERT(full_optional.value().get_data().value().value() == 5);
    PASS()
}

void testNameCapacity() {
    TEST("names longer than the configured capacity are rejected")
        char name[config::max_event_name_length + 2];
        std::memset(name, 'n', sizeof(name));
        name[config::max_event_name_length] = '\0';
        auto at_limit = hub_event<>::create(name);
        ASSERT(at_limit.is_ok());
        ASSERT(at_limit.value().get_name().size() == config::max_event_name_length);

        name[config::max_event_name_length] = 'n';
        name[config::max_event_name_length + 1] = '\0';
        auto too_long = hub_event<>::create(name);
        ASSERT(too_long.is_error());
        ASSERT(too_long.error() == error_code::capacity_exceeded);
        ASSERT(error::get_global_error_handler().get_last_error().detail == config::max_event_name_length + 1);
    PASS()
}

void testErrorCallback() {
    TEST("construction failures reach the error callback")
        auto& handler = error::get_global_error_handler();
        handler.reset();
        callback_hits = 0;
        handler.set_callback(count_errors);
        auto failed_event = hub_event<int>::create("", 1);
        ASSERT(failed_event.is_error());
        ASSERT(callback_hits == 1);
        ASSERT(callback_event == error::error_event::missing_event_name);

        auto good_event = hub_event<int>::create("ok", 1);
        ASSERT(good_event.is_ok());
        ASSERT(callback_hits == 1);
        handler.set_callback(nullptr);
    PASS()
}

void testEquality() {
    TEST("equality is reflexive, symmetric and identity-bound")
        credentials creds("dave", "pw");
        auto first = credentials_event::create("signIn", creds).value();
        auto second = credentials_event::create("signIn", creds).value();
        ASSERT(first == first);
        ASSERT(!(first == second));
        ASSERT(!(second == first));
        ASSERT(first != second);

        credentials_event copy = first;
        ASSERT(copy == first);
        ASSERT(first == copy);
        ASSERT(copy.hash_code() == first.hash_code());
        ASSERT(std::hash<credentials_event>()(copy) == std::hash<credentials_event>()(first));
        ASSERT(etl::hash<credentials_event>()(copy) == etl::hash<credentials_event>()(first));
    PASS()
}

void testFloatingPayloadEquality() {
    TEST("NaN and signed zero payloads keep copies equal")
        const double nan = std::numeric_limits<double>::quiet_NaN();
        auto measured = hub_event<double>::create("reading", nan).value();
        const hub_event<double> copy = measured;
        ASSERT(copy == measured);
        ASSERT(measured == copy);
        ASSERT(measured.equals(copy));
        ASSERT(copy.hash_code() == measured.hash_code());

        auto other_nan = hub_event<float>::create("reading", std::numeric_limits<float>::quiet_NaN()).value();
        const hub_event<float> other_copy = other_nan;
        ASSERT(other_copy == other_nan);
        ASSERT(other_copy.hash_code() == other_nan.hash_code());

        auto zero = hub_event<double>::create("reading", -0.0).value();
        const hub_event<double> zero_copy = zero;
        ASSERT(zero_copy == zero);
        ASSERT(zero_copy.hash_code() == zero.hash_code());

        auto fresh = hub_event<double>::create("reading", nan).value();
        ASSERT(fresh != measured);
    PASS()
}

void testEqualityAcrossShapes() {
    TEST("comparison with other payload types or non-events is false")
        auto counted = hub_event<int>::create("count", 1).value();
        auto plain = hub_event<>::create("count").value();
        ASSERT(!(counted == plain));
        ASSERT(counted != plain);
        ASSERT(!counted.equals(plain));
        ASSERT(!counted.equals(1));
        ASSERT(!counted.equals(std::string("count")));
        ASSERT(counted.equals(counted));
    PASS()
}

void testToString() {
    TEST("to_string renders name, data and id")
        auto plain = hub_event<>::create("signIn").value();
        const std::string plain_expected =
            "hub_event{name='signIn', data=none, id=" + text_of(plain.get_id().to_string()) + "}";
        ASSERT(text_of(plain.to_string()) == plain_expected);

        auto counted = hub_event<int>::create("count", 42).value();
        const std::string counted_text = text_of(counted.to_string());
        ASSERT(counted_text.find("data=42,") != std::string::npos);

        auto flagged = hub_event<bool>::create("flag", true).value();
        ASSERT(text_of(flagged.to_string()).find("data=true,") != std::string::npos);

        auto tagged = hub_event<auth_state>::create("state", auth_state::signed_in).value();
        ASSERT(text_of(tagged.to_string()).find("data=SIGNED_IN,") != std::string::npos);

        auto named = hub_event<etl::string<16>>::create("greet", etl::string<16>("hello")).value();
        ASSERT(text_of(named.to_string()).find("data=hello,") != std::string::npos);

        auto signed_in = credentials_event::create("signIn", credentials("erin", "pw")).value();
        ASSERT(text_of(signed_in.to_string()).find("data=credentials{user=erin},") != std::string::npos);
    PASS()
}

void testPublishForwardsSelf() {
    TEST("publish hands (channel, self) to the hub once")
        recording_hub hub;
        auto event = credentials_event::create("signIn", credentials("fay", "pw")).value();
        event.publish(hub_channel::auth, hub);
        ASSERT(hub.calls == 1);
        ASSERT(hub.last_channel == hub_channel::auth);
        ASSERT(hub.last_event == &event);
    PASS()
}

void testPublishOpaqueChannel() {
    TEST("publish accepts any channel token")
        topic_hub hub;
        auto event = credentials_event::create("signIn", credentials("gus", "pw")).value();
        event.publish(topic{17}, hub);
        ASSERT(hub.calls == 1);
        ASSERT(hub.last_topic == 17);
    PASS()
}

void testPublishDelegate() {
    TEST("publish through a bound delegate")
        delegate_hub hub;
        auto publisher = publish_fn<credentials>::create<delegate_hub, &delegate_hub::publish>(hub);
        auto event = credentials_event::create("signIn", credentials("hal", "pw")).value();
        auto published = event.publish(hub_channel::datastore, publisher);
        ASSERT(published.is_ok());
        ASSERT(hub.calls == 1);
        ASSERT(hub.last_channel == hub_channel::datastore);
        ASSERT(hub.last_event == &event);
    PASS()
}

void testPublishUnboundDelegate() {
    TEST("publish through an unbound delegate fails")
        publish_fn<credentials> unbound;
        auto event = credentials_event::create("signIn", credentials("ivy", "pw")).value();
        error::get_global_error_handler().reset();
        auto published = event.publish(hub_channel::auth, unbound);
        ASSERT(published.is_error());
        ASSERT(published.error() == error_code::not_bound);
        ASSERT(published.error() != error_code::invalid_parameter);
        ASSERT(error::get_global_error_handler().get_error_count() == 1);
        ASSERT(error::get_global_error_handler().get_last_error().event == error::error_event::unbound_publisher);
    PASS()
}

int main() {
    std::cout << "\n=== Construction ===\n" << std::endl;

    testCreateNameOnly();
    testCreateNameOnlyTypedPayload();
    testCreateFromStringView();
    testCreateWithData();
    testCreateFromEnum();
    testCreateFromEnumWithData();
    testChannelEnumAsName();

    std::cout << "\n=== Validation ===\n" << std::endl;

    testMissingNameFails();
    testMissingEnumNameFails();
    testAbsentPayloadFails();
    testNameCapacity();
    testErrorCallback();

    std::cout << "\n=== Value semantics ===\n" << std::endl;

    testEquality();
    testFloatingPayloadEquality();
    testEqualityAcrossShapes();
    testToString();

    std::cout << "\n=== Publish ===\n" << std::endl;

    testPublishForwardsSelf();
    testPublishOpaqueChannel();
    testPublishDelegate();
    testPublishUnboundDelegate();

    std::cout << "\n=== Summary ===" << std::endl;
    std::cout << "Passed: " << passed << std::endl;
    std::cout << "Failed: " << failed << std::endl;

    return failed > 0 ? 1 : 0;
}
