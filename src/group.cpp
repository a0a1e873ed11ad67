#include "esmp/group.hpp"

#include "esmp/canonical.hpp"
#include "esmp/error.hpp"
#include "esmp/signature.hpp"
#include "esmp/timestamp.hpp"
#include "esmp/util.hpp"
#include "esmp/validator.hpp"

namespace esmp {

namespace {

    template <typename... T>
    struct overloaded : T... {
        using T::operator()...;
    };
    template <typename... T>
    overloaded(T...) -> overloaded<T...>;

    [[noreturn]] void forbidden(const std::string& why) {
        throw protocol_error{Error::Forbidden, why};
    }

    nlohmann::json optional_json(const std::optional<std::string>& s) {
        return s ? nlohmann::json(*s) : nlohmann::json(nullptr);
    }

}  // namespace

bool GroupMetadata::may(const std::string& actor, SystemSubtype subtype) const {
    switch (subtype) {
        case SystemSubtype::group_created:
        case SystemSubtype::profile_updated: return false;
        case SystemSubtype::joined: return !is_member(actor);
        case SystemSubtype::left: return is_member(actor);
        case SystemSubtype::removed:
        case SystemSubtype::admin_assigned:
        case SystemSubtype::admin_revoked:
        case SystemSubtype::group_renamed:
        case SystemSubtype::description_updated:
        case SystemSubtype::dp_updated: return is_admin(actor);
    }
    return false;
}

nlohmann::json GroupMetadata::to_json() const {
    return {{"group_id", group_id},
            {"group_name", optional_json(group_name)},
            {"group_description", optional_json(group_description)},
            {"group_dp_url", optional_json(group_dp_url)},
            {"admins", admins},
            {"members", members},
            {"created_at", to_rfc3339(created_at)},
            {"updated_at", to_rfc3339(updated_at)}};
}

Groups::Groups(ThreadLog& log) : log_{log} {}

GroupMetadata Groups::transition(
        const std::optional<GroupMetadata>& current,
        const std::string& group_id,
        const system_message& msg) {
    const auto subtype = msg.subtype();
    const auto& actor = msg.actor;

    if (subtype == SystemSubtype::group_created) {
        if (current)
            throw protocol_error{
                    Error::DuplicateGroup, "group '" + group_id + "' already exists"};
        const auto& created = std::get<sys::group_created>(msg.action);
        GroupMetadata g;
        g.group_id = group_id;
        g.group_name = created.name;
        g.group_description = created.description;
        g.group_dp_url = created.dp_url;
        g.members.insert(actor);
        g.admins.insert(actor);
        g.created_at = g.updated_at = msg.timestamp;
        return g;
    }

    if (!current)
        throw protocol_error{Error::UnknownGroup, "group '" + group_id + "' does not exist"};
    if (msg.timestamp <= current->updated_at)
        throw protocol_error{
                Error::StaleMutation,
                "timestamp " + to_rfc3339(msg.timestamp) + " is not after the group's last update " +
                        to_rfc3339(current->updated_at)};

    if (!current->may(actor, subtype)) {
        if (subtype == SystemSubtype::joined)
            forbidden(actor + " is already a member");
        if (subtype == SystemSubtype::left)
            forbidden(actor + " is not a member");
        forbidden(actor + " is not an admin of '" + group_id + "'");
    }

    GroupMetadata g = *current;
    std::visit(
            overloaded{
                    [&](const sys::joined&) { g.members.insert(actor); },
                    [&](const sys::left&) {
                        g.members.erase(actor);
                        g.admins.erase(actor);
                    },
                    [&](const sys::removed& r) {
                        if (!g.is_member(r.target))
                            forbidden(r.target + " is not a member");
                        g.members.erase(r.target);
                        g.admins.erase(r.target);
                    },
                    [&](const sys::admin_assigned& a) {
                        if (!g.is_member(a.target))
                            forbidden(a.target + " is not a member");
                        g.admins.insert(a.target);
                    },
                    [&](const sys::admin_revoked& a) {
                        if (!g.is_admin(a.target))
                            forbidden(a.target + " is not an admin");
                        g.admins.erase(a.target);
                    },
                    [&](const sys::group_renamed& r) { g.group_name = r.new_name; },
                    [&](const sys::description_updated& d) {
                        g.group_description = d.new_description;
                    },
                    [&](const sys::dp_updated& d) { g.group_dp_url = d.new_dp_url; },
                    [](const sys::group_created&) {},
                    [](const sys::profile_updated&) {},
            },
            msg.action);
    g.updated_at = msg.timestamp;
    return g;
}

group_outcome Groups::apply(const Envelope& env) {
    const auto* msg = env.system();
    if (!msg || !msg->affects_group() || !env.group_id)
        throw std::invalid_argument{"Groups::apply requires a group system message"};
    const auto& group_id = *env.group_id;

    return groups_.modify(group_id, [&](std::optional<GroupMetadata>& current) {
        GroupMetadata next = transition(current, group_id, *msg);
        // Nothing is committed until the audit record is durable.
        seqno_t seqno = log_.append(group_thread_key(group_id), env.raw);
        current = next;

        group_outcome out{std::move(next), seqno, {}};
        out.recipients = out.metadata.members;
        if (msg->subtype() == SystemSubtype::left)
            out.recipients.insert(msg->actor);
        else if (msg->subtype() == SystemSubtype::removed)
            out.recipients.insert(*msg->target());

        log(LogLevel::info,
            "group " + group_id + ": applied " + std::string{to_string(msg->subtype())} + " by " +
                    msg->actor + " (seqno " + std::to_string(seqno) + ")");
        return out;
    });
}

group_outcome Groups::post(const Envelope& env) {
    if (!env.group_id)
        throw std::invalid_argument{"Groups::post requires a group_id"};
    const auto& group_id = *env.group_id;

    return groups_.modify(group_id, [&](std::optional<GroupMetadata>& current) {
        if (!current)
            throw protocol_error{Error::UnknownGroup, "group '" + group_id + "' does not exist"};
        seqno_t seqno = log_.append(group_thread_key(group_id), env.raw);
        log(LogLevel::debug, "group " + group_id + ": message seqno " + std::to_string(seqno));
        return group_outcome{*current, seqno, current->members};
    });
}

std::optional<GroupMetadata> Groups::get(const std::string& group_id) const {
    return groups_.get(group_id);
}

bool Groups::authorized(
        const std::string& group_id, const std::string& actor, SystemSubtype subtype) const {
    return groups_.read(group_id, [&](const std::optional<GroupMetadata>& g) {
        if (!g)
            return subtype == SystemSubtype::group_created;
        return g->may(actor, subtype);
    });
}

size_t Groups::replay(const ThreadLog& source) {
    for (const auto& key : source.threads()) {
        auto group_id = group_id_of(key);
        if (!group_id)
            continue;
        for (const auto& rec : source.read(key)) {
            try {
                auto canonical = canonical::canonicalize(rec.envelope);
                if (!signature::verify(
                            to_unsigned_sv(canonical),
                            rec.envelope.value(std::string{canonical::SIGNATURE_FIELD}, ""),
                            rec.envelope.value(std::string{canonical::PUBKEY_FIELD}, "")))
                    throw protocol_error{Error::SignatureInvalid, "stored signature is invalid"};
                auto env = validator::validate(rec.envelope);
                auto* msg = env.system();
                if (!msg || !msg->affects_group())
                    continue;
                if (env.group_id != group_id)
                    throw protocol_error{Error::SchemaViolation, "group_id does not match thread"};
                groups_.modify(*group_id, [&](std::optional<GroupMetadata>& current) {
                    current = transition(current, *group_id, *msg);
                });
            } catch (const protocol_error& e) {
                log(LogLevel::warning,
                    "replay of " + key + " seqno " + std::to_string(rec.seqno) + " skipped: " +
                            std::string{to_string(e.kind())} + ": " + e.what());
            } catch (const nlohmann::json::exception& e) {
                log(LogLevel::warning,
                    "replay of " + key + " seqno " + std::to_string(rec.seqno) +
                            " skipped: " + e.what());
            }
        }
    }
    auto count = groups_.keys().size();
    log(LogLevel::info, "replayed " + std::to_string(count) + " groups");
    return count;
}

}  // namespace esmp
