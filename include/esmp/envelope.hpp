#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <variant>

#include "ed25519.hpp"
#include "types.hpp"

namespace esmp {

enum class SystemSubtype {
    group_created,
    joined,
    left,
    removed,
    admin_assigned,
    admin_revoked,
    group_renamed,
    description_updated,
    dp_updated,
    profile_updated,
};

/// Wire name of a subtype, e.g. "admin_assigned".
std::string_view to_string(SystemSubtype s);

/// Inverse of `to_string`; std::nullopt for an unknown name.
std::optional<SystemSubtype> parse_subtype(std::string_view name);

/// One struct per system subtype, each holding exactly the fields that subtype requires.
namespace sys {

    struct group_created {
        static constexpr auto subtype = SystemSubtype::group_created;
        // Optional initial metadata, taken from the same fields the update subtypes use.
        std::optional<std::string> name;
        std::optional<std::string> description;
        std::optional<std::string> dp_url;
    };
    struct joined {
        static constexpr auto subtype = SystemSubtype::joined;
    };
    struct left {
        static constexpr auto subtype = SystemSubtype::left;
    };
    struct removed {
        static constexpr auto subtype = SystemSubtype::removed;
        std::string target;
    };
    struct admin_assigned {
        static constexpr auto subtype = SystemSubtype::admin_assigned;
        std::string target;
    };
    struct admin_revoked {
        static constexpr auto subtype = SystemSubtype::admin_revoked;
        std::string target;
    };
    struct group_renamed {
        static constexpr auto subtype = SystemSubtype::group_renamed;
        std::string new_name;
    };
    struct description_updated {
        static constexpr auto subtype = SystemSubtype::description_updated;
        std::string new_description;
    };
    struct dp_updated {
        static constexpr auto subtype = SystemSubtype::dp_updated;
        std::string new_dp_url;
    };
    struct profile_updated {
        static constexpr auto subtype = SystemSubtype::profile_updated;
        // Same shape as the `fields` object of a profile PUT request.
        nlohmann::json changes;
    };

    using action = std::variant<
            group_created,
            joined,
            left,
            removed,
            admin_assigned,
            admin_revoked,
            group_renamed,
            description_updated,
            dp_updated,
            profile_updated>;

}  // namespace sys

struct text_message {
    // Opaque payload: transported, signed and persisted but never inspected.
    nlohmann::json body;
};

struct system_message {
    std::string actor;
    sys_time timestamp;
    sys::action action;

    SystemSubtype subtype() const;

    /// True for every subtype that mutates group state (all but `profile_updated`).
    bool affects_group() const { return subtype() != SystemSubtype::profile_updated; }

    /// The `target` address for the subtypes that carry one.
    const std::string* target() const;
};

/// A signature-verified, shape-validated envelope.  Instances are only produced by
/// `validator::validate` and are never modified afterwards.
struct Envelope {
    std::set<std::string> to;
    std::set<std::string> cc;
    std::optional<std::string> group_id;
    // Sender address used to name direct threads; when absent the sender is identified by the hex
    // of `sender_pubkey`.
    std::optional<std::string> from;
    std::variant<text_message, system_message> content;

    ed25519::pubkey_t sender_pubkey;
    ed25519::signature_t signature;

    // The envelope exactly as parsed from the wire; this is what thread logs persist.
    nlohmann::json raw;

    bool is_system() const { return std::holds_alternative<system_message>(content); }

    /// Returns the system message, or nullptr for text messages.
    const system_message* system() const { return std::get_if<system_message>(&content); }

    /// The name this envelope's sender has in direct threads.
    std::string sender_id() const;
};

}  // namespace esmp
