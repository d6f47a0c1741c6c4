#include <hubCore/hubCore.hpp>

using namespace hubCore;
using namespace hubCore::hub;

// Example auth states, named the way the hub expects
enum class auth_state { signed_in, signed_out };

const char* to_string(auth_state state) noexcept {
    switch (state) {
        case auth_state::signed_in:  return "SIGNED_IN";
        case auth_state::signed_out: return "SIGNED_OUT";
    }
    return nullptr;
}

struct sign_in_result : hub_data<sign_in_result> {
    etl::string<32> user;
    bool success;

    sign_in_result(const char* name, bool ok_flag) : user(name), success(ok_flag) {}

    bool operator==(const sign_in_result& other) const noexcept {
        return user == other.user && success == other.success;
    }

    result<hub_event<sign_in_result>> to_hub_event() const noexcept {
        return hub_event<sign_in_result>::create(success ? auth_state::signed_in : auth_state::signed_out, *this);
    }
};

void format_payload(etl::istring& out, const sign_in_result& value) {
    out.append("sign_in_result{user=");
    out.append(value.user.begin(), value.user.end());
    out.append(value.success ? ", ok}" : ", failed}");
}

// Minimal hub: logs everything it is handed
struct logging_hub {
    template<typename Event>
    void publish(hub_channel channel, const Event& event) {
        platform::logs("[hub] channel=%s", to_string(channel));
        platform::log(event.to_string().c_str());
    }
};

int main() {
    logging_hub hub;
    platform::logs("hubCore %s", version());
    platform::logs("platform: %s", platform::get_platform_info().name);

    // Name only
    auto started = hub_event<>::create("app.started");
    if (started.is_error()) {
        return 1;
    }
    started.value().publish(hub_channel::hub, hub);

    // Name plus payload
    auto counted = hub_event<u32>::create("Storage.downloadFile", 2048U);
    if (counted.is_ok()) {
        counted.value().publish(hub_channel::storage, hub);
    }

    // Self-describing payload
    const sign_in_result attempt("alice", true);
    auto published = attempt.publish_to(hub_channel::auth, hub);
    if (published.is_error()) {
        platform::logs("sign in event refused: %s", to_string(published.error()));
        return 1;
    }

    // Rejected at the call site: no name
    auto rejected = hub_event<>::create("");
    platform::logs("empty name -> %s", to_string(rejected.code()));

    return rejected.is_error() ? 0 : 1;
}
