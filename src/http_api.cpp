#include "esmp/http_api.hpp"

#include <algorithm>
#include <charconv>

#include "esmp/canonical.hpp"
#include "esmp/error.hpp"
#include "esmp/util.hpp"
#include "esmp/validator.hpp"

namespace esmp {

using json = nlohmann::json;

namespace {

    http_response error_response(int status, std::string_view kind, std::string message) {
        return {status, {{"error", kind}, {"message", std::move(message)}}};
    }

    http_response error_response(const protocol_error& e) {
        int status = 400;
        switch (e.kind()) {
            case Error::Forbidden: status = 403; break;
            case Error::UnknownGroup: status = 404; break;
            default: break;
        }
        return error_response(status, to_string(e.kind()), e.what());
    }

    http_response not_found(std::string message) {
        return error_response(404, "NotFound", std::move(message));
    }

    int hex_digit(char c) {
        if (c >= '0' && c <= '9')
            return c - '0';
        if (c >= 'a' && c <= 'f')
            return c - 'a' + 10;
        if (c >= 'A' && c <= 'F')
            return c - 'A' + 10;
        return -1;
    }

    ed25519::pubkey_t path_pubkey(const std::string& encoded, const char* what) {
        auto pk = ed25519::parse_pubkey(encoded);
        if (!pk)
            throw protocol_error{
                    Error::MalformedInput, std::string{what} + " is not an Ed25519 public key"};
        return *pk;
    }

    template <typename Int>
    Int query_number(const http_target& t, const std::string& name, Int fallback) {
        auto it = t.query.find(name);
        if (it == t.query.end())
            return fallback;
        Int value;
        const auto& s = it->second;
        auto [end, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
        if (ec != std::errc{} || end != s.data() + s.size())
            throw protocol_error{Error::MalformedInput, name + " must be a non-negative integer"};
        return value;
    }

}  // namespace

std::string percent_decode(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); i++) {
        if (s[i] != '%') {
            out += s[i];
            continue;
        }
        int hi = i + 2 < s.size() ? hex_digit(s[i + 1]) : -1;
        int lo = i + 2 < s.size() ? hex_digit(s[i + 2]) : -1;
        if (hi < 0 || lo < 0)
            throw std::invalid_argument{"invalid percent escape in request target"};
        out += static_cast<char>(hi << 4 | lo);
        i += 2;
    }
    return out;
}

http_target http_target::parse(std::string_view target) {
    http_target t;
    std::string_view path = target, query;
    if (auto q = target.find('?'); q != std::string_view::npos) {
        path = target.substr(0, q);
        query = target.substr(q + 1);
    }
    for (auto seg : split(path, "/"))
        if (!seg.empty())
            t.path.push_back(percent_decode(seg));
    if (!query.empty())
        for (auto param : split(query, "&")) {
            if (param.empty())
                continue;
            auto eq = param.find('=');
            auto name = percent_decode(param.substr(0, eq));
            auto value = eq == std::string_view::npos ? std::string{}
                                                      : percent_decode(param.substr(eq + 1));
            t.query[std::move(name)] = std::move(value);
        }
    return t;
}

HttpApi::HttpApi(
        Engine& engine, ProfileStore& profiles, const Groups& groups, const ThreadLog& log) :
        engine_{engine}, profiles_{profiles}, groups_{groups}, log_{log} {}

http_response HttpApi::handle(
        std::string_view method, std::string_view target, std::string_view body) {
    try {
        auto t = http_target::parse(target);
        const auto& p = t.path;
        const bool get = method == "GET", put = method == "PUT";

        if (p.size() == 3 && p[0] == "users" && p[2] == "profile") {
            if (get)
                return get_profile(p[1], t);
            if (put)
                return put_profile(p[1], body);
            return error_response(405, "MethodNotAllowed", "use GET or PUT");
        }
        if (p.size() == 2 && p[0] == "groups") {
            if (get)
                return get_group(p[1]);
            if (put)
                return put_group(p[1], body);
            return error_response(405, "MethodNotAllowed", "use GET or PUT");
        }
        if (p.size() == 3 && p[0] == "groups" && p[2] == "messages") {
            if (!get)
                return error_response(405, "MethodNotAllowed", "use GET");
            return get_messages(p[1], t);
        }
        return not_found("no such resource: " + std::string{target});
    } catch (const protocol_error& e) {
        log(LogLevel::debug,
            std::string{method} + " " + std::string{target} + " rejected: " + e.what());
        return error_response(e);
    } catch (const std::invalid_argument& e) {
        return error_response(400, to_string(Error::MalformedInput), e.what());
    } catch (const storage_error& e) {
        log(LogLevel::error, std::string{"storage failure: "} + e.what());
        return error_response(500, "StorageError", e.what());
    } catch (const std::exception& e) {
        log(LogLevel::error,
            std::string{method} + " " + std::string{target} + " failed: " + e.what());
        return error_response(500, "Internal", e.what());
    }
}

http_response HttpApi::get_profile(const std::string& pubkey, const http_target& t) const {
    auto pk = path_pubkey(pubkey, "profile key");
    std::optional<ed25519::pubkey_t> requester;
    if (auto as = t.query.find("as"); as != t.query.end())
        requester = path_pubkey(as->second, "as");

    auto view = profiles_.get_profile(pk, requester);
    if (!view)
        return not_found("no profile for " + ed25519::pubkey_hex(pk));
    return {200, view->to_json()};
}

http_response HttpApi::put_profile(const std::string& pubkey, std::string_view body) {
    auto pk = path_pubkey(pubkey, "profile key");

    json req;
    try {
        req = json::parse(body);
    } catch (const json::parse_error& e) {
        throw protocol_error{Error::MalformedInput, e.what()};
    }
    auto canonical = canonical::canonicalize(req);

    auto sig = req.find(std::string{canonical::SIGNATURE_FIELD});
    if (sig == req.end() || !sig->is_string())
        throw protocol_error{Error::SchemaViolation, "signature: required field is missing"};
    auto fields = req.find("fields");
    if (fields == req.end() || !fields->is_object())
        throw protocol_error{Error::SchemaViolation, "fields: expected an object"};

    auto update = profile_update::parse(*fields, validator::timestamp(req));
    auto stored = profiles_.apply_update(pk, update, canonical, sig->get<std::string>());
    return {200, profiles_.owner_view(stored).to_json()};
}

http_response HttpApi::get_group(const std::string& group_id) const {
    auto g = groups_.get(group_id);
    if (!g)
        throw protocol_error{Error::UnknownGroup, "no group '" + group_id + "'"};
    return {200, g->to_json()};
}

http_response HttpApi::put_group(const std::string& group_id, std::string_view body) {
    json msg;
    try {
        msg = json::parse(body);
    } catch (const json::parse_error& e) {
        throw protocol_error{Error::MalformedInput, e.what()};
    }
    if (!msg.is_object())
        throw protocol_error{Error::MalformedInput, "request body must be a JSON object"};

    // Only metadata changes of this group are accepted here; membership goes over the wire.
    auto string_field = [&](const char* name) -> std::string {
        auto it = msg.find(name);
        return it != msg.end() && it->is_string() ? it->get<std::string>() : std::string{};
    };
    if (string_field("type") != "system")
        throw protocol_error{Error::SchemaViolation, "type: expected a system message"};
    auto subtype = string_field("subtype");
    if (subtype != "group_renamed" && subtype != "description_updated" &&
        subtype != "dp_updated")
        throw protocol_error{
                Error::SchemaViolation,
                "subtype: expected group_renamed, description_updated or dp_updated"};
    if (string_field("group_id") != group_id)
        throw protocol_error{
                Error::SchemaViolation, "group_id: does not match the group '" + group_id + "'"};

    auto o = engine_.process_message(msg);
    if (!o.ok)
        throw protocol_error{o.error.value_or(Error::MalformedInput), o.message};

    auto g = groups_.get(group_id);
    if (!g)
        throw protocol_error{Error::UnknownGroup, "no group '" + group_id + "'"};
    log(LogLevel::info, subtype + " applied to group " + group_id + " over HTTP");
    return {200, g->to_json()};
}

http_response HttpApi::get_messages(const std::string& group_id, const http_target& t) const {
    if (!groups_.get(group_id))
        throw protocol_error{Error::UnknownGroup, "no group '" + group_id + "'"};

    auto from = query_number<seqno_t>(t, "from", 1);
    auto limit = std::min(query_number<size_t>(t, "limit", DEFAULT_PAGE), MAX_PAGE);

    auto messages = json::array();
    for (auto& r : log_.read(group_thread_key(group_id), from, limit))
        messages.push_back({{"seqno", r.seqno}, {"envelope", std::move(r.envelope)}});
    return {200, {{"group_id", group_id}, {"messages", std::move(messages)}}};
}

}  // namespace esmp
