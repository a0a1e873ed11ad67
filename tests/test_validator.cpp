#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <limits>

#include "esmp/validator.hpp"
#include "utils.hpp"

using namespace esmp;
using json = nlohmann::json;
using Catch::Matchers::ContainsSubstring;

namespace {

test_key alice{0x0a};

std::string violation_of(const json& msg) {
    try {
        validator::validate(msg);
    } catch (const protocol_error& e) {
        if (e.kind() == Error::SchemaViolation)
            return e.what();
        return "wrong kind: " + std::string{to_string(e.kind())};
    }
    return "accepted";
}

}  // namespace

TEST_CASE("Text envelopes", "[validator]") {
    auto env = validator::validate(alice.sign(text_to({"bob#example.org"}, "hi")));
    CHECK_FALSE(env.is_system());
    CHECK(env.to == make_set("bob#example.org"s));
    CHECK(env.cc.empty());
    CHECK_FALSE(env.group_id);
    CHECK(std::get<text_message>(env.content).body == "hi");
    CHECK(env.sender_pubkey == alice.pubkey);
    CHECK(env.sender_id() == alice.hex());

    // Group text needs no recipients; the body may be any JSON value, or absent
    auto g = validator::validate(alice.sign({{"type", "text"}, {"group_id", "g1"}}));
    CHECK(g.group_id == "g1");
    CHECK(std::get<text_message>(g.content).body.is_null());

    auto msg = text_to({"bob#example.org"}, {{"nested", {1, 2, 3}}});
    msg["cc"] = {"carol#example.org"};
    msg["from"] = "alice#example.org";
    auto d = validator::validate(alice.sign(msg));
    CHECK(d.cc == make_set("carol#example.org"s));
    CHECK(d.sender_id() == "alice#example.org");
    CHECK(d.raw["body"]["nested"].size() == 3);
}

TEST_CASE("Text envelope schema violations", "[validator]") {
    CHECK_THAT(
            violation_of(alice.sign({{"type", "text"}, {"body", "hi"}})),
            ContainsSubstring("to"));
    CHECK_THAT(
            violation_of(alice.sign(text_to({"not-an-address"}, "hi"))), ContainsSubstring("to"));
    CHECK_THAT(violation_of(alice.sign({{"type", "text"}, {"to", "bob#x"}})), ContainsSubstring("to"));

    auto msg = text_to({"bob#example.org"}, "hi");
    msg["cc"] = {"carol example"};
    CHECK_THAT(violation_of(alice.sign(msg)), ContainsSubstring("cc"));

    msg = text_to({"bob#example.org"}, "hi");
    msg["from"] = "alice";
    CHECK_THAT(violation_of(alice.sign(msg)), ContainsSubstring("from"));

    msg = text_to({"bob#example.org"}, "hi");
    msg["type"] = "carrier-pigeon";
    CHECK_THAT(violation_of(alice.sign(msg)), ContainsSubstring("type"));

    msg = text_to({"bob#example.org"}, "hi");
    msg["group_id"] = "";
    CHECK_THAT(violation_of(alice.sign(msg)), ContainsSubstring("group_id"));

    // Signature fields must be present and decodable
    auto unsigned_msg = text_to({"bob#example.org"}, "hi");
    CHECK_THAT(violation_of(unsigned_msg), ContainsSubstring("sender_pubkey"));
    unsigned_msg["sender_pubkey"] = alice.hex();
    CHECK_THAT(violation_of(unsigned_msg), ContainsSubstring("signature"));
}

TEST_CASE("System envelopes", "[validator]") {
    auto env = validator::validate(alice.sign(sys_msg(
            "removed", "g1", "alice#example.org", "2024-01-01T00:00:05Z",
            {{"target", "bob#example.org"}})));
    REQUIRE(env.is_system());
    auto* sm = env.system();
    CHECK(sm->subtype() == SystemSubtype::removed);
    CHECK(sm->affects_group());
    CHECK(sm->actor == "alice#example.org");
    CHECK(sm->timestamp == ts("2024-01-01T00:00:05Z"));
    REQUIRE(sm->target());
    CHECK(*sm->target() == "bob#example.org");

    auto created = validator::validate(alice.sign(sys_msg(
            "group_created", "g1", "alice#example.org", "2024-01-01T00:00:00Z",
            {{"new_name", "Hikers"}})));
    const auto& gc = std::get<sys::group_created>(created.system()->action);
    CHECK(gc.name == "Hikers");
    CHECK_FALSE(gc.description);

    // Integer Unix seconds are accepted as timestamps
    auto numeric = sys_msg("joined", "g1", "bob#example.org", "");
    numeric["timestamp"] = 1704067200;
    CHECK(validator::validate(alice.sign(numeric)).system()->timestamp ==
          ts("2024-01-01T00:00:00Z"));

    // profile_updated needs no group
    auto profile = sys_msg(
            "profile_updated", "", "alice#example.org", "2024-01-01T00:00:00Z",
            {{"changes", {{"first_name", {{"value", "Alice"}}}}}});
    profile.erase("group_id");
    auto p = validator::validate(alice.sign(profile));
    CHECK_FALSE(p.system()->affects_group());
    CHECK(std::get<sys::profile_updated>(p.system()->action).changes.contains("first_name"));
}

TEST_CASE("System envelope schema violations", "[validator]") {
    auto base = [](std::string_view subtype, json extra = json::object()) {
        return sys_msg(subtype, "g1", "alice#example.org", "2024-01-01T00:00:00Z", extra);
    };

    for (auto st : {"removed", "admin_assigned", "admin_revoked"})
        CHECK_THAT(violation_of(alice.sign(base(st))), ContainsSubstring("target"));
    CHECK_THAT(violation_of(alice.sign(base("group_renamed"))), ContainsSubstring("new_name"));
    CHECK_THAT(
            violation_of(alice.sign(base("description_updated"))),
            ContainsSubstring("new_description"));
    CHECK_THAT(violation_of(alice.sign(base("dp_updated"))), ContainsSubstring("new_dp_url"));
    CHECK_THAT(violation_of(alice.sign(base("profile_updated"))), ContainsSubstring("changes"));
    CHECK_THAT(
            violation_of(alice.sign(base("profile_updated", {{"changes", "x"}}))),
            ContainsSubstring("changes"));
    CHECK_THAT(violation_of(alice.sign(base("exploded"))), ContainsSubstring("subtype"));
    CHECK_THAT(
            violation_of(alice.sign(base("removed", {{"target", "bob"}}))),
            ContainsSubstring("target"));

    auto no_group = base("joined");
    no_group.erase("group_id");
    CHECK_THAT(violation_of(alice.sign(no_group)), ContainsSubstring("group_id"));

    auto null_group = base("joined");
    null_group["group_id"] = nullptr;
    CHECK_THAT(violation_of(alice.sign(null_group)), ContainsSubstring("group_id"));

    auto no_actor = base("joined");
    no_actor.erase("actor");
    CHECK_THAT(violation_of(alice.sign(no_actor)), ContainsSubstring("actor"));

    auto bad_ts = base("joined");
    bad_ts["timestamp"] = "yesterday";
    CHECK_THAT(violation_of(alice.sign(bad_ts)), ContainsSubstring("timestamp"));
    bad_ts["timestamp"] = -5;
    CHECK_THAT(violation_of(alice.sign(bad_ts)), ContainsSubstring("timestamp"));
    bad_ts["timestamp"] = 1704067200.5;
    CHECK_THAT(violation_of(alice.sign(bad_ts)), ContainsSubstring("timestamp"));
}

TEST_CASE("Timestamps beyond the representable range", "[validator][timestamp]") {
    auto msg = sys_msg("joined", "g1", "bob#example.org", "2300-01-01T00:00:00Z");
    CHECK_THAT(violation_of(alice.sign(msg)), ContainsSubstring("timestamp"));
    msg["timestamp"] = "9999-12-31T23:59:59Z";
    CHECK_THAT(violation_of(alice.sign(msg)), ContainsSubstring("timestamp"));

    // Integer seconds that would overflow the clock, or wrap when read as signed
    msg["timestamp"] = 10'000'000'000'000ull;
    CHECK_THAT(violation_of(alice.sign(msg)), ContainsSubstring("timestamp"));
    msg["timestamp"] = std::numeric_limits<uint64_t>::max();
    CHECK_THAT(violation_of(alice.sign(msg)), ContainsSubstring("timestamp"));
    msg["timestamp"] = uint64_t{1} << 63;
    CHECK_THAT(violation_of(alice.sign(msg)), ContainsSubstring("timestamp"));

    // Parsed from the wire, the same way the engine sees it
    auto wire = json::parse(
            R"({"type":"system","subtype":"joined","group_id":"g1","actor":"bob#example.org",)"
            R"("timestamp":18446744073709551615})");
    CHECK_THAT(violation_of(alice.sign(wire)), ContainsSubstring("timestamp"));

    msg["timestamp"] = 9'000'000'000ull;  // year 2255
    CHECK(validator::timestamp(msg) > ts("2200-01-01T00:00:00Z"));
}

TEST_CASE("Non-object messages are malformed", "[validator]") {
    CHECK(error_kind([] { validator::validate(json::array()); }) == Error::MalformedInput);
}
