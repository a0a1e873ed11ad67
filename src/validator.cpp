#include "esmp/validator.hpp"

#include "esmp/address.hpp"
#include "esmp/canonical.hpp"
#include "esmp/error.hpp"
#include "esmp/timestamp.hpp"

namespace esmp::validator {

using json = nlohmann::json;

namespace {

    [[noreturn]] void violation(std::string_view field, std::string_view problem) {
        throw protocol_error{
                Error::SchemaViolation, std::string{field} + ": " + std::string{problem}};
    }

    // Returns the member if it is present and not null.
    const json* find(const json& msg, std::string_view field) {
        auto it = msg.find(std::string{field});
        if (it == msg.end() || it->is_null())
            return nullptr;
        return &*it;
    }

    std::optional<std::string> optional_string(const json& msg, std::string_view field) {
        auto* v = find(msg, field);
        if (!v)
            return std::nullopt;
        if (!v->is_string())
            violation(field, "expected a string");
        return v->get<std::string>();
    }

    std::string required_string(const json& msg, std::string_view field) {
        auto s = optional_string(msg, field);
        if (!s)
            violation(field, "required field is missing");
        return *std::move(s);
    }

    std::string address_field(std::string addr, std::string_view field) {
        if (!is_valid_address(addr))
            violation(field, "'" + addr + "' is not a localpart#domain address");
        return addr;
    }

    std::set<std::string> address_set(const json& msg, std::string_view field) {
        std::set<std::string> out;
        auto* v = find(msg, field);
        if (!v)
            return out;
        if (!v->is_array())
            violation(field, "expected an array of addresses");
        for (const auto& a : *v) {
            if (!a.is_string())
                violation(field, "expected an array of addresses");
            out.insert(address_field(a.get<std::string>(), field));
        }
        return out;
    }

    sys::action decode_action(SystemSubtype st, const json& msg) {
        auto target = [&] { return address_field(required_string(msg, "target"), "target"); };
        switch (st) {
            case SystemSubtype::group_created:
                return sys::group_created{
                        optional_string(msg, "new_name"),
                        optional_string(msg, "new_description"),
                        optional_string(msg, "new_dp_url")};
            case SystemSubtype::joined: return sys::joined{};
            case SystemSubtype::left: return sys::left{};
            case SystemSubtype::removed: return sys::removed{target()};
            case SystemSubtype::admin_assigned: return sys::admin_assigned{target()};
            case SystemSubtype::admin_revoked: return sys::admin_revoked{target()};
            case SystemSubtype::group_renamed:
                return sys::group_renamed{required_string(msg, "new_name")};
            case SystemSubtype::description_updated:
                return sys::description_updated{required_string(msg, "new_description")};
            case SystemSubtype::dp_updated:
                return sys::dp_updated{required_string(msg, "new_dp_url")};
            case SystemSubtype::profile_updated: {
                auto* changes = find(msg, "changes");
                if (!changes)
                    violation("changes", "required field is missing");
                if (!changes->is_object())
                    violation("changes", "expected an object");
                return sys::profile_updated{*changes};
            }
        }
        violation("subtype", "unsupported subtype");
    }

}  // namespace

sys_time timestamp(const json& msg) {
    auto* v = find(msg, "timestamp");
    if (!v)
        violation("timestamp", "required field is missing");
    if (v->is_string()) {
        if (auto t = parse_rfc3339(v->get_ref<const std::string&>()))
            return *t;
        violation("timestamp", "not an RFC 3339 date-time");
    }
    if (v->is_number_integer()) {
        // Unix seconds; checked before conversion so huge values cannot wrap.
        const bool in_range = v->is_number_unsigned()
                                    ? v->get<uint64_t>() < static_cast<uint64_t>(MAX_UNIX_SECONDS)
                                    : v->get<int64_t>() >= 0;
        if (in_range)
            if (auto t = from_unix(v->get<int64_t>()))
                return *t;
        violation("timestamp", "Unix seconds out of the supported range");
    }
    violation("timestamp", "expected an RFC 3339 string");
}

Envelope validate(const json& msg) {
    if (!msg.is_object())
        throw protocol_error{Error::MalformedInput, "message is not a JSON object"};

    Envelope env;
    env.raw = msg;

    auto pk = ed25519::parse_pubkey(required_string(msg, canonical::PUBKEY_FIELD));
    if (!pk)
        violation(canonical::PUBKEY_FIELD, "not a 32-byte Ed25519 key");
    env.sender_pubkey = *pk;
    auto sig = ed25519::parse_signature(required_string(msg, canonical::SIGNATURE_FIELD));
    if (!sig)
        violation(canonical::SIGNATURE_FIELD, "not a 64-byte Ed25519 signature");
    env.signature = *sig;

    env.to = address_set(msg, "to");
    env.cc = address_set(msg, "cc");
    env.group_id = optional_string(msg, "group_id");
    if (env.group_id && env.group_id->empty())
        violation("group_id", "must not be empty");
    if (auto from = optional_string(msg, "from"))
        env.from = address_field(*std::move(from), "from");

    auto type = required_string(msg, "type");
    if (type == "text") {
        if (env.to.empty() && !env.group_id)
            violation("to", "text message needs recipients or a group_id");
        auto* body = find(msg, "body");
        env.content = text_message{body ? *body : json{}};
    } else if (type == "system") {
        auto subtype_name = required_string(msg, "subtype");
        auto subtype = parse_subtype(subtype_name);
        if (!subtype)
            violation("subtype", "unknown subtype '" + subtype_name + "'");
        system_message sm;
        sm.actor = address_field(required_string(msg, "actor"), "actor");
        sm.timestamp = timestamp(msg);
        sm.action = decode_action(*subtype, msg);
        if (sm.affects_group() && !env.group_id)
            violation("group_id", "required for " + subtype_name);
        env.content = std::move(sm);
    } else {
        violation("type", "unknown type '" + type + "'");
    }

    return env;
}

}  // namespace esmp::validator
