#include "esmp/engine.hpp"

#include "esmp/canonical.hpp"
#include "esmp/signature.hpp"
#include "esmp/util.hpp"
#include "esmp/validator.hpp"

namespace esmp {

using json = nlohmann::json;

json outcome::reply() const {
    if (!ok)
        return {{"ok", false},
                {"error", error ? to_string(*error) : std::string_view{"Internal"}},
                {"message", message}};
    auto threads = json::array();
    for (const auto& s : stored)
        threads.push_back({{"thread", s.thread}, {"seqno", s.seqno}});
    return {{"ok", true}, {"kind", kind}, {"seqno", seqno()}, {"threads", std::move(threads)}};
}

outcome outcome::rejected(Error e, std::string message) {
    outcome o;
    o.error = e;
    o.message = std::move(message);
    return o;
}

Engine::Engine(Groups& groups, ProfileStore& profiles, ThreadLog& log, size_t max_line_bytes) :
        groups_{groups}, profiles_{profiles}, log_{log}, max_line_bytes_{max_line_bytes} {}

outcome Engine::process(std::string_view line) {
    if (line.size() > max_line_bytes_)
        return outcome::rejected(
                Error::MalformedInput,
                "message of " + std::to_string(line.size()) + " bytes exceeds the " +
                        std::to_string(max_line_bytes_) + " byte limit");
    json msg;
    try {
        msg = json::parse(line);
    } catch (const json::parse_error& e) {
        return outcome::rejected(Error::MalformedInput, e.what());
    }
    return process_message(msg);
}

outcome Engine::process_message(const json& msg) {
    try {
        auto canonical = canonical::canonicalize(msg);

        auto encoded = [&msg](std::string_view field) -> std::string {
            auto it = msg.find(std::string{field});
            if (it == msg.end() || !it->is_string())
                return {};
            return it->get<std::string>();
        };
        auto sig = encoded(canonical::SIGNATURE_FIELD);
        if (!signature::verify(to_unsigned_sv(canonical), sig, encoded(canonical::PUBKEY_FIELD)))
            throw protocol_error{Error::SignatureInvalid, "signature verification failed"};

        auto env = validator::validate(msg);
        return route(env, canonical);
    } catch (const protocol_error& e) {
        log(LogLevel::debug, std::string{"rejected message: "} + std::string{to_string(e.kind())} +
                                     ": " + e.what());
        return outcome::rejected(e.kind(), e.what());
    }
}

outcome Engine::route(const Envelope& env, std::string_view canonical) {
    const auto* sm = env.system();

    if (sm && sm->affects_group()) {
        auto r = groups_.apply(env);
        outcome o;
        o.ok = true;
        o.kind = std::string{to_string(sm->subtype())};
        o.stored.push_back({group_thread_key(*env.group_id), r.seqno});
        o.recipients = std::move(r.recipients);
        return o;
    }

    if (sm) {
        // profile_updated: applies to the sender key's own profile.
        const auto& changes = std::get<sys::profile_updated>(sm->action).changes;
        auto update = profile_update::parse(changes, sm->timestamp);
        outcome o;
        o.ok = true;
        o.kind = std::string{to_string(sm->subtype())};
        // With recipients, the direct records and the profile are stored together: the profile
        // is persisted while the thread appends can still be rolled back.
        std::function<void(const std::function<void()>&)> persist;
        if (!env.to.empty() || !env.cc.empty())
            persist = [&](const std::function<void()>& store) {
                o = deliver_direct(env, o.kind, store);
            };
        profiles_.apply_update(
                env.sender_pubkey,
                update,
                canonical,
                env.raw.at(std::string{canonical::SIGNATURE_FIELD}).get<std::string>(),
                persist);
        return o;
    }

    if (env.group_id) {
        auto r = groups_.post(env);
        outcome o;
        o.ok = true;
        o.kind = "text";
        o.stored.push_back({group_thread_key(*env.group_id), r.seqno});
        o.recipients = std::move(r.recipients);
        return o;
    }

    return deliver_direct(env, "text");
}

outcome Engine::deliver_direct(
        const Envelope& env, std::string kind, const std::function<void()>& commit) {
    outcome o;
    o.kind = std::move(kind);
    o.recipients = env.to;
    o.recipients.insert(env.cc.begin(), env.cc.end());

    const auto sender = env.sender_id();
    std::set<std::string> keys;
    for (const auto& r : o.recipients)
        keys.insert(direct_thread_key(sender, r));
    auto seqnos = log_.append_all(keys, env.raw, commit);
    auto seqno = seqnos.begin();
    for (const auto& k : keys)
        o.stored.push_back({k, *seqno++});

    log(LogLevel::debug,
        "stored " + o.kind + " from " + sender + " in " + std::to_string(keys.size()) +
                " direct thread(s)");
    o.ok = true;
    return o;
}

}  // namespace esmp
