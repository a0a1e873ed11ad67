#include "esmp/envelope.hpp"

namespace esmp {

namespace {
    constexpr std::pair<SystemSubtype, std::string_view> subtype_names[] = {
            {SystemSubtype::group_created, "group_created"},
            {SystemSubtype::joined, "joined"},
            {SystemSubtype::left, "left"},
            {SystemSubtype::removed, "removed"},
            {SystemSubtype::admin_assigned, "admin_assigned"},
            {SystemSubtype::admin_revoked, "admin_revoked"},
            {SystemSubtype::group_renamed, "group_renamed"},
            {SystemSubtype::description_updated, "description_updated"},
            {SystemSubtype::dp_updated, "dp_updated"},
            {SystemSubtype::profile_updated, "profile_updated"},
    };
}  // namespace

std::string_view to_string(SystemSubtype s) {
    for (const auto& [st, name] : subtype_names)
        if (st == s)
            return name;
    return "unknown";
}

std::optional<SystemSubtype> parse_subtype(std::string_view name) {
    for (const auto& [st, n] : subtype_names)
        if (n == name)
            return st;
    return std::nullopt;
}

SystemSubtype system_message::subtype() const {
    return std::visit([](const auto& a) { return std::decay_t<decltype(a)>::subtype; }, action);
}

const std::string* system_message::target() const {
    if (auto* r = std::get_if<sys::removed>(&action))
        return &r->target;
    if (auto* a = std::get_if<sys::admin_assigned>(&action))
        return &a->target;
    if (auto* a = std::get_if<sys::admin_revoked>(&action))
        return &a->target;
    return nullptr;
}

std::string Envelope::sender_id() const {
    if (from)
        return *from;
    return ed25519::pubkey_hex(sender_pubkey);
}

}  // namespace esmp
